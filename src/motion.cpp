#include "mscan/motion.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <string>

namespace mscan
{
    namespace
    {
        constexpr int kCompareWidth = 320;

        cv::Mat small_gray(const cv::Mat &img)
        {
            cv::Mat gray;
            if (img.channels() == 4)
                cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY);
            else if (img.channels() == 3)
                cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
            else
                gray = img;

            if (gray.cols <= kCompareWidth)
                return gray;
            const double f = double(kCompareWidth) / gray.cols;
            cv::Mat small;
            cv::resize(gray, small, cv::Size(), f, f, cv::INTER_AREA);
            return small;
        }
    }

    Status frame_similarity(const Frame &before, const Frame &after, double &out)
    {
        if (before.empty() || after.empty())
            return Status::fail(ErrorKind::InvalidRegion, "empty frame");
        if (before.image.size() != after.image.size() || before.image.type() != after.image.type())
            return Status::fail(ErrorKind::InvalidRegion, "frames differ in size or type");

        try
        {
            const cv::Mat a = small_gray(before.image);
            const cv::Mat b = small_gray(after.image);
            cv::Mat result;
            // same size in and out: a single correlation value
            cv::matchTemplate(a, b, result, cv::TM_CCOEFF_NORMED);
            const float v = result.at<float>(0, 0);
            // flat pictures give NaN or 0; both read as "changed"
            out = (v == v) ? std::max(-1.0, std::min(1.0, double(v))) : 0.0;
        }
        catch (const cv::Exception &ex)
        {
            return Status::fail(ErrorKind::InvalidRegion, std::string("frame comparison failed: ") + ex.what());
        }
        return Status::ok();
    }
}
