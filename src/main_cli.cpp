#include <cctype>
#include <iostream>
#include <string>
#include <vector>
#include "mscan/app.hpp"
#include "mscan/progress.hpp"
#include "mscan/ui.hpp"

namespace
{
    void usage()
    {
        std::cerr << "Usage: map_scanner_cli [--debug] [--save-debug] [--config FILE] [--window TITLE]\n"
                     "                       [--log-file FILE] X Y\n";
    }
}

int main(int argc, char **argv)
{
    app::State state;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++)
    {
        std::string a = argv[i];
        const bool hasValue = i + 1 < argc;
        if (a == "--debug")
            state.debug = true;
        else if (a == "--save-debug")
            state.saveDebug = true;
        else if (a == "--config" && hasValue)
            state.configPath = argv[++i];
        else if (a == "--window" && hasValue)
            state.windowTitle = argv[++i];
        else if (a == "--log-file" && hasValue)
            state.logFile = argv[++i];
        else if (a == "-h" || a == "--help")
        {
            usage();
            return 0;
        }
        else if (a.size() > 1 && a[0] == '-' && !std::isdigit((unsigned char)a[1]))
        {
            std::cerr << "Unknown option: " << a << "\n";
            usage();
            return 1;
        }
        else
            positional.push_back(a);
    }

    if (positional.size() != 2 || !app::ui::parse_target(state, positional[0] + "," + positional[1]))
    {
        usage();
        return 1;
    }

    app::progress::install_signal_handlers();

    mscan::ScanResult result;
    if (!app::progress::run_and_report(state, result))
        return 1;
    return app::progress::exit_code(result);
}
