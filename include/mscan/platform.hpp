#pragma once
#include "mscan/status.hpp"
#include "mscan/types.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>

namespace mscan
{
    // ---- collaborators the scanner talks to; X11 versions live in x11_platform.hpp ----

    class WindowManager
    {
    public:
        virtual ~WindowManager() = default;
        // WindowNotFound when no window title matches.
        virtual Status find_window(const std::string &titlePattern, WindowHandle &out) = 0;
        // Map area of the window in screen coordinates.
        virtual Status get_region(WindowHandle handle, cv::Rect &out) = 0;
        virtual bool is_valid(WindowHandle handle) = 0;
    };

    class ScreenCapture
    {
    public:
        virtual ~ScreenCapture() = default;
        // `region` is in screen coordinates. Capture on failure.
        virtual Status capture(WindowHandle handle, const cv::Rect &region, Frame &out) = 0;
    };

    class MouseController
    {
    public:
        virtual ~MouseController() = default;
        // Relative pointer drag in screen pixels. Input on failure.
        virtual Status move_by(int dx, int dy) = 0;
    };

    // Time source for the scan loop; tests swap in a fake that never sleeps.
    class Clock
    {
    public:
        virtual ~Clock() = default;
        virtual std::uint64_t now_ms() const = 0;
        virtual void sleep_ms(std::uint64_t ms) = 0;
    };

    class SteadyClock : public Clock
    {
    public:
        std::uint64_t now_ms() const override;
        void sleep_ms(std::uint64_t ms) override;
    };
}
