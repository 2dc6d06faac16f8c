#include "mscan/preprocessor.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace mscan
{
    cv::Rect readout_rect(const ReadoutRegion &r, const cv::Size &sz)
    {
        const int x = (int)std::lround(r.x * sz.width);
        const int y = (int)std::lround(r.y * sz.height);
        const int w = (int)std::lround(r.w * sz.width);
        const int h = (int)std::lround(r.h * sz.height);
        return cv::Rect(x, y, w, h) & cv::Rect(0, 0, sz.width, sz.height);
    }

    Status ImagePreprocessor::prepare(const Frame &frame, const cv::Rect &region,
                                      ThresholdStrategy strategy, PreprocessedImage &out) const
    {
        if (frame.empty())
            return Status::fail(ErrorKind::InvalidRegion, "empty frame");

        const cv::Rect bounds(0, 0, frame.width(), frame.height());
        if (region.width <= 0 || region.height <= 0 || (region & bounds) != region)
        {
            return Status::fail(ErrorKind::InvalidRegion,
                                "region " + std::to_string(region.x) + "," + std::to_string(region.y) + " " +
                                    std::to_string(region.width) + "x" + std::to_string(region.height) +
                                    " outside frame " + std::to_string(frame.width()) + "x" +
                                    std::to_string(frame.height()));
        }

        // crop (view) -> gray (new buffer) so the frame itself is never written
        cv::Mat big;
        double scale = 1.0;
        const int b = params_.border_px;
        try
        {
            const cv::Mat crop = frame.image(region);
            cv::Mat gray = to_gray(crop);
            cv::Mat bin = threshold(gray, strategy);

            // tesseract wants dark glyphs on a light page; readouts are usually light on dark
            if (cv::countNonZero(bin) * 2 < bin.rows * bin.cols)
                cv::bitwise_not(bin, bin);

            big = upscale(bin, scale);
            if (b > 0)
                cv::copyMakeBorder(big, big, b, b, b, b, cv::BORDER_CONSTANT, cv::Scalar(255));
        }
        catch (const cv::Exception &ex)
        {
            return Status::fail(ErrorKind::InvalidRegion,
                                std::string("image processing failed (") + strategy_name(strategy) + "): " + ex.what());
        }

        out.gray = big;
        out.source_region = region;
        out.scale = scale;
        out.border = b;
        return Status::ok();
    }

    cv::Mat ImagePreprocessor::to_gray(const cv::Mat &crop) const
    {
        cv::Mat gray;
        switch (crop.channels())
        {
        case 4:
            cv::cvtColor(crop, gray, cv::COLOR_BGRA2GRAY);
            break;
        case 3:
            cv::cvtColor(crop, gray, cv::COLOR_BGR2GRAY);
            break;
        default:
            gray = crop.clone();
            break;
        }
        if (gray.depth() != CV_8U)
            gray.convertTo(gray, CV_8U);
        return gray;
    }

    cv::Mat ImagePreprocessor::threshold(const cv::Mat &gray, ThresholdStrategy strategy) const
    {
        const PreprocessParams &P = params_;
        cv::Mat bin;

        switch (strategy)
        {
        case ThresholdStrategy::GameText:
        {
            cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(P.clahe_clip, cv::Size(P.clahe_tile, P.clahe_tile));
            cv::Mat eq, smooth;
            clahe->apply(gray, eq);
            cv::bilateralFilter(eq, smooth, P.bilateral_d, P.bilateral_sigma, P.bilateral_sigma);
            int blk = (P.adaptive_block % 2 == 0) ? P.adaptive_block + 1 : P.adaptive_block;
            blk = std::max(3, blk);
            cv::adaptiveThreshold(smooth, bin, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                                  cv::THRESH_BINARY, blk, P.adaptive_c);
            break;
        }
        case ThresholdStrategy::WhiteTextOutline:
        {
            cv::Mat eq, blurred;
            cv::equalizeHist(gray, eq);
            const int k = (P.blur_kernel % 2 == 0) ? P.blur_kernel + 1 : P.blur_kernel;
            cv::GaussianBlur(eq, blurred, cv::Size(k, k), 0);
            cv::threshold(blurred, bin, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
            break;
        }
        case ThresholdStrategy::HighContrast:
        {
            cv::Mat stretched;
            // gain around mid-grey: out = gain * (in - 128) + 128
            gray.convertTo(stretched, CV_8U, P.contrast_gain, 128.0 * (1.0 - P.contrast_gain));
            cv::threshold(stretched, bin, P.fixed_threshold, 255, cv::THRESH_BINARY);
            break;
        }
        }
        return bin;
    }

    cv::Mat ImagePreprocessor::upscale(const cv::Mat &bin, double &scale) const
    {
        scale = 1.0;
        if (params_.min_text_height <= 0 || bin.rows >= params_.min_text_height)
            return bin;

        scale = std::min(params_.max_upscale, double(params_.min_text_height) / double(bin.rows));
        if (scale <= 1.0)
        {
            scale = 1.0;
            return bin;
        }
        cv::Mat big;
        // nearest keeps the image binary
        cv::resize(bin, big, cv::Size(), scale, scale, cv::INTER_NEAREST);
        return big;
    }
}
