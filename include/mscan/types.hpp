#pragma once
#include <opencv2/core.hpp>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace mscan
{
    // Captured pixels (BGR, CV_8UC3). Filled once by the capture collaborator and
    // only read afterwards; consumers take it by const reference.
    struct Frame
    {
        cv::Mat image;
        std::uint64_t captured_at_ms{0};

        int width() const { return image.cols; }
        int height() const { return image.rows; }
        bool empty() const { return image.empty(); }
    };

    // Binarized readout crop, dark text on white, ready for recognition.
    struct PreprocessedImage
    {
        cv::Mat gray;              // CV_8UC1
        cv::Rect source_region;    // crop rectangle in frame coordinates
        double scale{1.0};         // upscale factor applied after the crop
        int border{0};             // white padding added around the upscaled crop

        // maps a rectangle of `gray` back into frame coordinates
        cv::Rect to_frame(const cv::Rect &r) const
        {
            const double inv = 1.0 / scale;
            return cv::Rect(source_region.x + int((r.x - border) * inv),
                            source_region.y + int((r.y - border) * inv),
                            int(r.width * inv), int(r.height * inv));
        }
    };

    struct OcrCandidate
    {
        std::string text;
        double confidence{0.0}; // 0..1
        cv::Rect bounds;        // frame coordinates
    };

    // Candidates in the engine's own ranking order.
    struct OcrResult
    {
        std::vector<OcrCandidate> candidates;
        cv::Rect source_region;
    };

    enum class MoveMode
    {
        Coarse,
        Fine
    };

    inline const char *move_mode_name(MoveMode m)
    {
        return m == MoveMode::Coarse ? "coarse" : "fine";
    }

    // Relative pointer displacement in screen pixels.
    struct MovementPlan
    {
        int dx{0};
        int dy{0};
        MoveMode mode{MoveMode::Fine};
        int attempt{0};

        double magnitude() const { return std::hypot(double(dx), double(dy)); }
    };

    using WindowHandle = unsigned long;
}
