#include "mscan/ui.hpp"
#include "mscan/app.hpp"
#include "mscan/ansi.hpp"
#include "mscan/text.hpp"

#include <filesystem>
#include <iostream>
#include <limits>
#include <cctype>
#include <regex>

namespace fs = std::filesystem;

namespace app::ui
{
    using mscan::trim;

    static const char *kMenu = R"MENU(
Choose an option:

  1) Target: Set map coordinate to reach
  2) Settings: Debug / save-debug / config / window
  3) Help: How to use
  4) About
  5) Run: Scan until the readout matches the target
  0) Exit
)MENU";

    std::string read_line(const std::string &prompt)
    {
        std::cout << mscan::ansi::info << prompt << mscan::ansi::reset;
        std::string s;
        std::getline(std::cin, s);
        return s;
    }

    void title(const std::string &t)
    {
        mscan::ansi::clear_screen();
        std::cout << mscan::ansi::title << mscan::ansi::bold << t << mscan::ansi::reset << "\n";
        std::cout << mscan::ansi::muted << std::string(t.size(), '=') << mscan::ansi::reset << "\n\n";
    }

    void main_menu(const app::State &s)
    {
        title("Map Scanner (TUI)");
        std::cout << kMenu << "\n";
        std::cout << mscan::ansi::muted << "Target: "
                  << (s.hasTarget ? "(" + std::to_string(s.target.x) + ", " + std::to_string(s.target.y) + ")"
                                  : std::string("(none)"))
                  << mscan::ansi::reset << "\n";
        std::cout << mscan::ansi::muted
                  << "Config: " << (s.configPath.empty() ? std::string("(MSCAN_CONFIG or config/map_scanner.yml)") : s.configPath)
                  << ", Window: " << (s.windowTitle.empty() ? std::string("(from config)") : s.windowTitle)
                  << mscan::ansi::reset << "\n";
        std::cout << mscan::ansi::muted
                  << "Debug: " << (s.debug ? "ON" : "OFF")
                  << ", Save debug: " << (s.saveDebug ? "ON" : "OFF")
                  << mscan::ansi::reset << "\n\n";
    }

    void help()
    {
        title("Help");
        std::cout
            << "- Bring the game window up with its map visible.\n"
            << "- Set the coordinate to reach (option 1), e.g. 512,384.\n"
            << "- Run (option 5): the scanner reads the on-screen readout and drags\n"
            << "  the map until the readout matches. Ctrl-C stops a running scan.\n"
            << "- Limits (step size, attempts, session time) come from the config file.\n\n";
        wait_for_enter();
    }

    void about()
    {
        title("About");
        std::cout
            << "Closed-loop map navigation on top of the one-shot CLI.\n"
            << "Uses OpenCV for preprocessing, Tesseract for OCR and XTest for input.\n\n";
        wait_for_enter();
    }

    void wait_for_enter(const std::string &prompt)
    {
        std::cout << mscan::ansi::muted << prompt << mscan::ansi::reset;
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    int read_menu_choice()
    {
        std::cout << "Select (0-5): ";
        std::string line;
        std::getline(std::cin, line);
        line = trim(line);
        if (line.empty() || line.size() > 3)
            return -1;
        for (char ch : line)
            if (!std::isdigit((unsigned char)ch))
                return -1;
        return std::stoi(line);
    }

    bool parse_target(app::State &s, const std::string &text)
    {
        static const std::regex re(R"(^\(?\s*(-?\d{1,6})\s*[, ]\s*(-?\d{1,6})\s*\)?$)");
        std::smatch m;
        const std::string t = trim(text);
        if (!std::regex_match(t, m, re))
            return false;
        s.target.x = std::stoi(m[1].str());
        s.target.y = std::stoi(m[2].str());
        s.hasTarget = true;
        return true;
    }

    void target(app::State &s)
    {
        title("Target");
        std::cout << "Enter the map coordinate to navigate to.\n\n";
        std::cout << mscan::ansi::muted
                  << "Examples:\n"
                     "  512,384\n"
                     "  (120, 980)\n"
                  << mscan::ansi::reset << "\n";

        const std::string line = read_line("X,Y> ");
        if (!std::cin.good())
            return;

        if (parse_target(s, line))
            std::cout << mscan::ansi::ok << "[OK] Target: (" << s.target.x << ", " << s.target.y << ")"
                      << mscan::ansi::reset << "\n";
        else
            std::cout << mscan::ansi::err << "[X] Not a coordinate. Please try again." << mscan::ansi::reset << "\n";
        std::cout << "\n";
        wait_for_enter();
    }

    void settings(app::State &s)
    {
        title("Settings");
        std::cout
            << "Options (type number):\n"
            << "  1) Debug logs: " << (s.debug ? "ON" : "OFF") << "\n"
            << "  2) Save debug images: " << (s.saveDebug ? "ON" : "OFF") << "\n"
            << "  3) Config file: " << (s.configPath.empty() ? "(MSCAN_CONFIG or config/map_scanner.yml)" : s.configPath) << "\n"
            << "  4) Window title: " << (s.windowTitle.empty() ? "(from config)" : s.windowTitle) << "\n"
            << "  0) Back\n\n";
        std::cout << "Select: ";
        std::string line;
        std::getline(std::cin, line);
        line = trim(line);
        if (line == "1")
            s.debug = !s.debug;
        else if (line == "2")
            s.saveDebug = !s.saveDebug;
        else if (line == "3")
        {
            const std::string p = trim(read_line("Config path (empty for MSCAN_CONFIG / shipped file)> "));
            if (p.empty())
                s.configPath.clear();
            else if (fs::is_regular_file(p))
                s.configPath = fs::absolute(p).string();
            else
            {
                std::cout << mscan::ansi::err << "[X] No such file: " << p << mscan::ansi::reset << "\n";
                wait_for_enter();
            }
        }
        else if (line == "4")
            s.windowTitle = trim(read_line("Window title (empty for config value)> "));
    }

}
