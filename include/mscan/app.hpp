#pragma once
#include "mscan/coordinate.hpp"

#include <string>

namespace app
{
    struct State
    {
        std::string configPath;  // empty: built-in defaults
        std::string windowTitle; // empty: title from config
        std::string logFile;     // empty: stderr only
        mscan::TargetCoordinate target;
        bool hasTarget{false};
        bool debug{false};
        bool saveDebug{false};
    };

    class Application
    {
    public:
        int run();

    private:
        State state_{};
        int main_loop();
    };
}
