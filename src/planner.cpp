#include "mscan/planner.hpp"

#include <algorithm>
#include <cmath>

namespace mscan
{
    PlanDecision CorrectionPlanner::plan(const Coordinate &current, const TargetCoordinate &target,
                                         const SafetyBounds &bounds, int attempt) const
    {
        const PlannerParams &P = params_;
        PlanDecision d;

        const double ux = double(target.x) - double(current.x());
        const double uy = double(target.y) - double(current.y());
        const double dist = std::hypot(ux, uy);
        if (dist <= P.epsilon)
        {
            d.converged = true;
            return d;
        }

        // pointer vector in screen pixels
        const double sign = P.invert_drag ? -1.0 : 1.0;
        const double px = sign * ux * P.pixels_per_unit;
        const double py = sign * uy * P.pixels_per_unit;
        const double pixDist = std::hypot(px, py);

        double step = 0.0;
        if (pixDist > P.coarse_threshold)
        {
            d.plan.mode = MoveMode::Coarse;
            step = std::min({P.coarse_step, bounds.max_delta_per_move, pixDist});
        }
        else
        {
            d.plan.mode = MoveMode::Fine;
            const double damped = P.fine_step * (pixDist / P.coarse_threshold);
            step = std::min({damped, pixDist, bounds.max_delta_per_move});
        }

        // truncate toward zero: the integer vector is never longer than `step`
        const double k = (pixDist > 0.0) ? step / pixDist : 0.0;
        d.plan.dx = (int)std::trunc(px * k);
        d.plan.dy = (int)std::trunc(py * k);

        if (d.plan.dx == 0 && d.plan.dy == 0)
        {
            // sub-pixel correction: nudge one pixel along the dominant axis
            if (std::abs(px) >= std::abs(py))
                d.plan.dx = (px > 0) ? 1 : -1;
            else
                d.plan.dy = (py > 0) ? 1 : -1;
        }

        d.plan.attempt = attempt;
        return d;
    }
}
