#include "mscan/x11_platform.hpp"

#include <opencv2/imgproc.hpp>

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#undef Status

#include <memory>
#include <string>

namespace mscan::x11
{
    namespace
    {
        struct ImageDeleter
        {
            void operator()(XImage *img) const
            {
                if (img)
                    XDestroyImage(img);
            }
        };
        using ImagePtr = std::unique_ptr<XImage, ImageDeleter>;
    }

    X11ScreenCapture::X11ScreenCapture(log::Logger &log, const std::string &display)
        : log_(log), displayName_(display)
    {
    }

    Status X11ScreenCapture::capture(WindowHandle /*handle*/, const cv::Rect &region, Frame &out)
    {
        if (!display_)
        {
            display_ = open_display(displayName_);
            if (!display_)
                return Status::fail(ErrorKind::Capture, "cannot open X display '" + displayName_ + "'");
        }

        Display *d = display_.get();
        const Window root = DefaultRootWindow(d);
        XWindowAttributes rootAttrs;
        if (!XGetWindowAttributes(d, root, &rootAttrs))
            return Status::fail(ErrorKind::Capture, "cannot read root window size");

        // XGetImage fails with BadMatch if any part lies off-screen
        const cv::Rect screen(0, 0, rootAttrs.width, rootAttrs.height);
        if ((region & screen) != region || region.area() == 0)
            return Status::fail(ErrorKind::Capture, "capture region is not on screen");

        ImagePtr img(XGetImage(d, root, region.x, region.y, (unsigned)region.width, (unsigned)region.height,
                               AllPlanes, ZPixmap));
        if (!img)
            return Status::fail(ErrorKind::Capture, "XGetImage failed");
        if (img->bits_per_pixel != 32)
            return Status::fail(ErrorKind::Capture,
                                "unsupported visual: " + std::to_string(img->bits_per_pixel) + " bpp");

        cv::Mat bgra(region.height, region.width, CV_8UC4, img->data, (size_t)img->bytes_per_line);
        cv::Mat bgr;
        try
        {
            cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR); // copies out of the XImage
        }
        catch (const cv::Exception &ex)
        {
            return Status::fail(ErrorKind::Capture, std::string("pixel conversion failed: ") + ex.what());
        }

        out.image = bgr;
        out.captured_at_ms = clock_.now_ms();
        log_.d("captured " + std::to_string(bgr.cols) + "x" + std::to_string(bgr.rows));
        return Status::ok();
    }
}
