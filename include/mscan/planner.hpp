#pragma once
#include "mscan/config.hpp"
#include "mscan/coordinate.hpp"
#include "mscan/types.hpp"

namespace mscan
{
    struct PlanDecision
    {
        bool converged{false};
        MovementPlan plan; // meaningful only when !converged
    };

    // Coordinate delta -> bounded pointer drag.
    //  - |delta| <= epsilon                      : converged, nothing to do
    //  - pixel distance above coarse_threshold   : coarse step, capped by max_delta_per_move
    //  - otherwise                               : fine step, damped with distance
    // A non-zero delta never yields a zero vector (minimum one pixel nudge).
    class CorrectionPlanner
    {
    public:
        explicit CorrectionPlanner(const PlannerParams &params) : params_(params) {}

        PlanDecision plan(const Coordinate &current, const TargetCoordinate &target,
                          const SafetyBounds &bounds, int attempt) const;

    private:
        PlannerParams params_;
    };
}
