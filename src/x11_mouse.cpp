#include "mscan/x11_platform.hpp"

#include <X11/Xlib.h>
#include <X11/extensions/XTest.h>
#undef Status

#include <algorithm>
#include <cmath>
#include <string>

namespace mscan::x11
{
    X11MouseController::X11MouseController(const DragParams &params, log::Logger &log, const std::string &display)
        : params_(params), log_(log), displayName_(display)
    {
    }

    Status X11MouseController::ensure_display()
    {
        if (display_)
            return Status::ok();

        display_ = open_display(displayName_);
        if (!display_)
            return Status::fail(ErrorKind::Input, "cannot open X display '" + displayName_ + "'");

        int event_base, error_base, major, minor;
        if (!XTestQueryExtension(display_.get(), &event_base, &error_base, &major, &minor))
        {
            display_.reset();
            return Status::fail(ErrorKind::Input, "XTest extension not available");
        }
        return Status::ok();
    }

    Status X11MouseController::relative_motion(int dx, int dy, int steps, int durationMs)
    {
        Display *d = display_.get();
        steps = std::max(1, steps);
        const int pause = std::max(0, durationMs / steps);

        // cumulative rounding so the parts add up to exactly (dx, dy)
        int doneX = 0, doneY = 0;
        for (int i = 1; i <= steps; ++i)
        {
            const int wantX = (int)std::lround(double(dx) * i / steps);
            const int wantY = (int)std::lround(double(dy) * i / steps);
            if (!XTestFakeRelativeMotionEvent(d, wantX - doneX, wantY - doneY, CurrentTime))
                return Status::fail(ErrorKind::Input, "XTestFakeRelativeMotionEvent failed");
            doneX = wantX;
            doneY = wantY;
            XFlush(d);
            clock_.sleep_ms((std::uint64_t)pause);
        }
        return Status::ok();
    }

    Status X11MouseController::move_by(int dx, int dy)
    {
        Status st = ensure_display();
        if (!st)
            return st;
        if (dx == 0 && dy == 0)
            return Status::ok();

        Display *d = display_.get();

        if (!XTestFakeButtonEvent(d, Button1, True, CurrentTime))
            return Status::fail(ErrorKind::Input, "button press failed");
        XFlush(d);
        clock_.sleep_ms(30);

        st = relative_motion(dx, dy, params_.steps, params_.duration_ms);

        // always release, even when the motion failed half way
        const bool released = XTestFakeButtonEvent(d, Button1, False, CurrentTime) != 0;
        XFlush(d);
        if (!st)
            return st;
        if (!released)
            return Status::fail(ErrorKind::Input, "button release failed");

        // recentre without the button so the next drag starts from the same spot
        clock_.sleep_ms(50);
        st = relative_motion(-dx, -dy, 1, 0);
        if (!st)
            return st;

        log_.d("drag (" + std::to_string(dx) + ", " + std::to_string(dy) + ")");
        return Status::ok();
    }

    Status X11MouseController::warp_to(int x, int y)
    {
        Status st = ensure_display();
        if (!st)
            return st;
        Display *d = display_.get();
        XWarpPointer(d, None, DefaultRootWindow(d), 0, 0, 0, 0, x, y);
        XFlush(d);
        return Status::ok();
    }
}
