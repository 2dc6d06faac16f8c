#include "mscan/safety.hpp"

#include <cstdio>

namespace mscan
{
    Status SafetyGuard::violation(const std::string &msg) const
    {
        log_.w("safety: " + msg);
        return Status::fail(ErrorKind::SafetyViolation, msg);
    }

    Status SafetyGuard::check_coordinate(const Coordinate &c, const SafetyBounds &b) const
    {
        if (c.x() < b.min_x || c.x() > b.max_x || c.y() < b.min_y || c.y() > b.max_y)
        {
            return violation("coordinate " + c.to_string() + " outside allowed range x[" +
                             std::to_string(b.min_x) + "," + std::to_string(b.max_x) + "] y[" +
                             std::to_string(b.min_y) + "," + std::to_string(b.max_y) + "]");
        }
        return Status::ok();
    }

    Status SafetyGuard::check_movement(const MovementPlan &p, const SafetyBounds &b) const
    {
        const double mag = p.magnitude();
        if (mag > b.max_delta_per_move)
        {
            char buf[128];
            std::snprintf(buf, sizeof(buf), "movement (%d, %d) magnitude %.1f exceeds max %.1f",
                          p.dx, p.dy, mag, b.max_delta_per_move);
            return violation(buf);
        }
        return Status::ok();
    }

    Status SafetyGuard::check_failures(int consecutive, const SafetyBounds &b, const std::string &what) const
    {
        if (consecutive > b.max_consecutive_failures)
            return violation(what + " failure limit exceeded");
        return Status::ok();
    }

    Status SafetyGuard::check_elapsed(std::uint64_t elapsedMs, const SafetyBounds &b) const
    {
        if (elapsedMs > b.max_session_ms)
        {
            return violation("session time limit exceeded (" + std::to_string(elapsedMs) + " ms > " +
                             std::to_string(b.max_session_ms) + " ms)");
        }
        return Status::ok();
    }

    Status SafetyGuard::check_window_region(const cv::Rect &expected, const cv::Rect &actual) const
    {
        if (expected != actual)
        {
            return violation("window region changed from " + std::to_string(expected.x) + "," +
                             std::to_string(expected.y) + " " + std::to_string(expected.width) + "x" +
                             std::to_string(expected.height) + " to " + std::to_string(actual.x) + "," +
                             std::to_string(actual.y) + " " + std::to_string(actual.width) + "x" +
                             std::to_string(actual.height));
        }
        return Status::ok();
    }
}
