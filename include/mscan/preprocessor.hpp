#pragma once
#include "mscan/config.hpp"
#include "mscan/status.hpp"
#include "mscan/types.hpp"

#include <opencv2/core.hpp>

namespace mscan
{
    // Turns a captured frame into a binarized readout crop for OCR.
    // Stateless apart from its parameters: the same frame and region always give
    // byte-identical output.
    class ImagePreprocessor
    {
    public:
        explicit ImagePreprocessor(const PreprocessParams &params) : params_(params) {}

        // Fails with InvalidRegion if `region` is empty or not fully inside the frame.
        Status prepare(const Frame &frame, const cv::Rect &region,
                       ThresholdStrategy strategy, PreprocessedImage &out) const;

    private:
        cv::Mat to_gray(const cv::Mat &crop) const;
        cv::Mat threshold(const cv::Mat &gray, ThresholdStrategy strategy) const;
        cv::Mat upscale(const cv::Mat &bin, double &scale) const;

        PreprocessParams params_;
    };

    // Readout rectangle (fractions of the frame) in pixel coordinates.
    cv::Rect readout_rect(const ReadoutRegion &r, const cv::Size &frameSize);
}
