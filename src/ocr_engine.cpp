#include "mscan/ocr_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <string>

namespace mscan
{
    std::vector<std::size_t> ranking_order(const OcrResult &result, double priorX, double priorY)
    {
        const cv::Rect &src = result.source_region;
        const double px = src.x + priorX * src.width;
        const double py = src.y + priorY * src.height;

        auto dist = [&](const OcrCandidate &c)
        {
            const double cx = c.bounds.x + 0.5 * c.bounds.width;
            const double cy = c.bounds.y + 0.5 * c.bounds.height;
            return std::hypot(cx - px, cy - py);
        };

        std::vector<std::size_t> idx(result.candidates.size());
        std::iota(idx.begin(), idx.end(), std::size_t(0));
        std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b)
                         {
            const OcrCandidate &ca = result.candidates[a];
            const OcrCandidate &cb = result.candidates[b];
            if (ca.confidence != cb.confidence)
                return ca.confidence > cb.confidence;
            return dist(ca) < dist(cb); });
        return idx;
    }

    Status OcrEngine::parse_coordinate(const OcrResult &result, std::optional<Coordinate> &out) const
    {
        out.reset();
        for (std::size_t i : ranking_order(result, params_.prior_x, params_.prior_y))
        {
            const OcrCandidate &c = result.candidates[i];
            std::optional<Coordinate> coord = Coordinate::from_text(c.text, c.confidence);
            if (!coord)
                continue;

            if (c.confidence < params_.min_confidence)
            {
                char buf[96];
                std::snprintf(buf, sizeof(buf), "'%s' at confidence %.2f < %.2f",
                              c.text.c_str(), c.confidence, params_.min_confidence);
                return Status::fail(ErrorKind::LowConfidence, buf);
            }
            out = coord;
            return Status::ok();
        }

        std::string seen;
        for (const auto &c : result.candidates)
        {
            if (!seen.empty())
                seen += " | ";
            seen += "'" + c.text + "'";
        }
        return Status::fail(ErrorKind::CoordinateParse,
                            result.candidates.empty() ? std::string("no text recognized")
                                                      : "no readout in " + seen);
    }
}
