#pragma once
#include <string>

namespace app
{
    struct State;
}

namespace app::ui
{
    // ---- High-level UI ----
    void title(const std::string &t);
    void main_menu(const app::State &s);
    void help();
    void about();

    void wait_for_enter(const std::string &prompt = "Press Enter to continue...");

    // Returns -1 on anything that is not a number.
    int read_menu_choice();

    // ---- Input & validation ----
    std::string read_line(const std::string &prompt);

    // Accepts "x,y", "x y" or "(x, y)"; updates s.target on success.
    bool parse_target(app::State &s, const std::string &text);

    // Open the "Target" view
    void target(app::State &s);

    // Toggle debug/saveDebug, set config file and window title
    void settings(app::State &s);
}
