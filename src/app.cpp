#include <iostream>
#include "mscan/app.hpp"
#include "mscan/ui.hpp"
#include "mscan/ansi.hpp"
#include "mscan/progress.hpp"

namespace app
{

    int Application::run()
    {
        progress::install_signal_handlers();
        return main_loop();
    }

    int Application::main_loop()
    {
        for (;;)
        {
            ui::main_menu(state_);
            const int choice = ui::read_menu_choice();
            if (!std::cin.good())
                return 0;

            switch (choice)
            {
            case 1:
                ui::target(state_);
                break;
            case 2:
                ui::settings(state_);
                break;
            case 3:
                ui::help();
                break;
            case 4:
                ui::about();
                break;
            case 5:
            {
                if (!state_.hasTarget)
                {
                    std::cout << mscan::ansi::warn << "Set a target first (option 1)." << mscan::ansi::reset << "\n";
                    ui::wait_for_enter();
                    break;
                }
                mscan::ScanResult result;
                progress::run_and_report(state_, result);
                ui::wait_for_enter();
                break;
            }
            case 0:
                mscan::ansi::clear_screen();
                std::cout << mscan::ansi::muted << "Bye! " << mscan::ansi::reset << "\n";
                return 0;

            default:
                std::cout << mscan::ansi::warn << "Invalid choice." << mscan::ansi::reset << "\n";
            }
        }
    }

}
