#pragma once
#include "mscan/config.hpp"
#include "mscan/log.hpp"
#include "mscan/platform.hpp"

#include <memory>
#include <string>

struct _XDisplay; // Xlib's Display, kept out of this header

namespace mscan::x11
{
    // RAII wrapper for the X11 Display connection
    struct DisplayDeleter
    {
        void operator()(_XDisplay *d) const;
    };
    using DisplayPtr = std::unique_ptr<_XDisplay, DisplayDeleter>;

    // Empty name means $DISPLAY. Also installs a non-fatal X error handler once.
    DisplayPtr open_display(const std::string &name);

    class X11WindowManager : public WindowManager
    {
    public:
        X11WindowManager(const WindowParams &params, log::Logger &log, const std::string &display = "");

        // Case-insensitive substring match on the window title, depth-first from the root.
        Status find_window(const std::string &titlePattern, WindowHandle &out) override;
        // Window rectangle in root coordinates minus the configured UI margins.
        Status get_region(WindowHandle handle, cv::Rect &out) override;
        bool is_valid(WindowHandle handle) override;

    private:
        Status ensure_display();

        WindowParams params_;
        log::Logger &log_;
        std::string displayName_;
        DisplayPtr display_;
    };

    class X11ScreenCapture : public ScreenCapture
    {
    public:
        explicit X11ScreenCapture(log::Logger &log, const std::string &display = "");

        Status capture(WindowHandle handle, const cv::Rect &region, Frame &out) override;

    private:
        log::Logger &log_;
        std::string displayName_;
        DisplayPtr display_;
        SteadyClock clock_;
    };

    // Drag-to-pan through XTest: press, move in small relative steps, release,
    // then bring the pointer back to where the drag started.
    class X11MouseController : public MouseController
    {
    public:
        X11MouseController(const DragParams &params, log::Logger &log, const std::string &display = "");

        Status move_by(int dx, int dy) override;

        // Absolute warp, used once before a session to park the pointer on the map.
        Status warp_to(int x, int y);

    private:
        Status ensure_display();
        Status relative_motion(int dx, int dy, int steps, int durationMs);

        DragParams params_;
        log::Logger &log_;
        std::string displayName_;
        DisplayPtr display_;
        SteadyClock clock_;
    };
}
