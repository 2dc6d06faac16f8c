#pragma once
#include "mscan/config.hpp"
#include "mscan/coordinate.hpp"
#include "mscan/log.hpp"
#include "mscan/status.hpp"
#include "mscan/types.hpp"

#include <cstdint>
#include <string>

namespace mscan
{
    // Hard-stop checks. Every failure is ErrorKind::SafetyViolation and ends the session.
    class SafetyGuard
    {
    public:
        explicit SafetyGuard(log::Logger &log) : log_(log) {}

        Status check_coordinate(const Coordinate &coord, const SafetyBounds &bounds) const;
        Status check_movement(const MovementPlan &plan, const SafetyBounds &bounds) const;

        // `what` names the failing stage, e.g. "extraction" -> "extraction failure limit exceeded"
        Status check_failures(int consecutive, const SafetyBounds &bounds, const std::string &what) const;
        Status check_elapsed(std::uint64_t elapsedMs, const SafetyBounds &bounds) const;
        // window found again after a capture failure must cover the same screen area
        Status check_window_region(const cv::Rect &expected, const cv::Rect &actual) const;

    private:
        Status violation(const std::string &msg) const;

        log::Logger &log_;
    };
}
