#pragma once
#include <iostream>

namespace mscan::ansi
{
    inline constexpr const char *reset = "\x1b[0m";
    inline constexpr const char *bold = "\x1b[1m";
    inline constexpr const char *dim = "\x1b[2m";

    inline constexpr const char *title = "\x1b[38;5;208m";
    inline constexpr const char *ok = "\x1b[38;5;82m";
    inline constexpr const char *warn = "\x1b[38;5;214m";
    inline constexpr const char *err = "\x1b[38;5;196m";
    inline constexpr const char *info = "\x1b[38;5;45m";
    inline constexpr const char *muted = "\x1b[90m";

    inline void clear_screen() { std::cout << "\x1b[2J\x1b[H"; }
}
