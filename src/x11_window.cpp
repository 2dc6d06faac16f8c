#include "mscan/x11_platform.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
// Xlib's `#define Status int` would shadow mscan::Status below
#undef Status

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <mutex>
#include <string>

namespace mscan::x11
{
    namespace
    {
        std::atomic<int> g_last_x_error{0};

        // The default handler exits the process on BadWindow; a vanished game
        // window must be an ordinary failure instead.
        int on_x_error(Display *, XErrorEvent *ev)
        {
            g_last_x_error.store(ev ? ev->error_code : -1);
            return 0;
        }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return (char)std::tolower(c); });
            return s;
        }

        std::string window_title(Display *d, Window w)
        {
            char *name = nullptr;
            std::string title;
            if (XFetchName(d, w, &name) && name)
            {
                title = name;
                XFree(name);
            }
            return title;
        }

        Window find_by_title(Display *d, Window start, const std::string &needle,
                             const WindowParams &p)
        {
            const std::string title = lower(window_title(d, start));
            if (!title.empty() && title.find(needle) != std::string::npos)
            {
                XWindowAttributes attrs;
                if (XGetWindowAttributes(d, start, &attrs) && attrs.map_state == IsViewable &&
                    attrs.width >= p.min_width && attrs.height >= p.min_height)
                    return start;
            }

            Window root_return, parent_return, *children = nullptr;
            unsigned int nchildren = 0;
            Window found = 0;
            if (XQueryTree(d, start, &root_return, &parent_return, &children, &nchildren))
            {
                for (unsigned int i = 0; i < nchildren && !found; i++)
                    found = find_by_title(d, children[i], needle, p);
                if (children)
                    XFree(children);
            }
            return found;
        }
    } // namespace

    void DisplayDeleter::operator()(_XDisplay *d) const
    {
        if (d)
            XCloseDisplay(d);
    }

    DisplayPtr open_display(const std::string &name)
    {
        static std::once_flag once;
        std::call_once(once, []
                       { XSetErrorHandler(on_x_error); });
        return DisplayPtr(XOpenDisplay(name.empty() ? nullptr : name.c_str()));
    }

    X11WindowManager::X11WindowManager(const WindowParams &params, log::Logger &log, const std::string &display)
        : params_(params), log_(log), displayName_(display)
    {
    }

    Status X11WindowManager::ensure_display()
    {
        if (display_)
            return Status::ok();
        display_ = open_display(displayName_);
        if (!display_)
            return Status::fail(ErrorKind::WindowNotFound, "cannot open X display '" + displayName_ + "'");
        return Status::ok();
    }

    Status X11WindowManager::find_window(const std::string &titlePattern, WindowHandle &out)
    {
        Status st = ensure_display();
        if (!st)
            return st;

        Display *d = display_.get();
        const Window w = find_by_title(d, DefaultRootWindow(d), lower(titlePattern), params_);
        if (!w)
            return Status::fail(ErrorKind::WindowNotFound, "no visible window matching '" + titlePattern + "'");

        log_.i("found window '" + window_title(d, w) + "' (id " + std::to_string(w) + ")");
        out = (WindowHandle)w;
        return Status::ok();
    }

    Status X11WindowManager::get_region(WindowHandle handle, cv::Rect &out)
    {
        Status st = ensure_display();
        if (!st)
            return st;

        Display *d = display_.get();
        const Window w = (Window)handle;
        XWindowAttributes attrs;
        if (!XGetWindowAttributes(d, w, &attrs))
            return Status::fail(ErrorKind::WindowNotFound, "cannot read window attributes");

        int rx = 0, ry = 0;
        Window child;
        if (!XTranslateCoordinates(d, w, DefaultRootWindow(d), 0, 0, &rx, &ry, &child))
            return Status::fail(ErrorKind::WindowNotFound, "failed to get window coordinates");

        // trim toolbars / chat panels so the region is map only
        const int left = (int)std::lround(params_.margin_left * attrs.width);
        const int right = (int)std::lround(params_.margin_right * attrs.width);
        const int top = (int)std::lround(params_.margin_top * attrs.height);
        const int bottom = (int)std::lround(params_.margin_bottom * attrs.height);

        out = cv::Rect(rx + left, ry + top, attrs.width - left - right, attrs.height - top - bottom);
        if (out.width <= 0 || out.height <= 0)
            return Status::fail(ErrorKind::WindowNotFound, "window area is empty after margins");
        return Status::ok();
    }

    bool X11WindowManager::is_valid(WindowHandle handle)
    {
        if (!ensure_display())
            return false;
        g_last_x_error.store(0);
        XWindowAttributes attrs;
        const bool ok = XGetWindowAttributes(display_.get(), (Window)handle, &attrs) != 0;
        XSync(display_.get(), False);
        return ok && g_last_x_error.load() == 0 && attrs.map_state == IsViewable;
    }
}
