#include "mscan/progress.hpp"
#include "mscan/ansi.hpp"
#include "mscan/config.hpp"
#include "mscan/log.hpp"
#include "mscan/tesseract_engine.hpp"
#include "mscan/x11_platform.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace
{
    std::atomic<mscan::MapScanner *> g_active{nullptr};

    void on_signal(int sig)
    {
        mscan::MapScanner *s = g_active.load();
        if (s)
            s->request_cancel();
        else
            std::_Exit(128 + sig);
    }

    // Clears g_active however the scan ends.
    struct ActiveScan
    {
        explicit ActiveScan(mscan::MapScanner &s) { g_active.store(&s); }
        ~ActiveScan() { g_active.store(nullptr); }
    };

    fs::path resolve_output_root()
    {
        const char *env = std::getenv("MSCAN_OUTPUT_ROOT");
        if (env && *env)
            return fs::path(env);
        return fs::current_path() / "mscan_output";
    }

    std::string now_stamp()
    {
        using clock = std::chrono::system_clock;
        auto t = clock::to_time_t(clock::now());
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y%m%d-%H%M%S");
        return oss.str();
    }

    void ensure_dir(const fs::path &p)
    {
        std::error_code ec;
        fs::create_directories(p, ec);
    }

    std::string quoted(const std::string &s)
    {
        std::string out = "\"";
        for (char c : s)
        {
            if (c == '"')
                out += '"';
            out += c;
        }
        return out + "\"";
    }

    void coord_cells(std::ostream &os, const std::optional<mscan::Coordinate> &c)
    {
        if (c)
            os << c->x() << "," << c->y();
        else
            os << ",";
    }

    // Step lines for the console; Capturing/Extracting repeat too often to be useful.
    void print_step(const mscan::StepEvent &ev)
    {
        using mscan::ScanState;
        if (ev.to == ScanState::Validating)
            std::cout << mscan::ansi::muted << "  [" << ev.attempts << "] " << mscan::ansi::reset
                      << "readout " << ev.detail << "\n";
        else if (mscan::is_terminal(ev.to))
            std::cout << mscan::ansi::muted << "  -> " << mscan::state_name(ev.to) << ": " << ev.detail
                      << mscan::ansi::reset << "\n";
    }
}

namespace app::progress
{

    void install_signal_handlers()
    {
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
    }

    int exit_code(const mscan::ScanResult &r)
    {
        switch (r.outcome)
        {
        case mscan::ScanOutcome::Converged:
            return 0;
        case mscan::ScanOutcome::Exhausted:
            return 2;
        case mscan::ScanOutcome::Aborted:
            return 3;
        }
        return 3;
    }

    bool run_and_report(const app::State &state, mscan::ScanResult &out)
    {
        mscan::log::Logger log(state.debug);
        if (!state.logFile.empty() && !log.open_file(state.logFile))
            log.w("cannot open log file " + state.logFile);

        mscan::ScannerConfig cfg;
        std::string cfgPath;
        mscan::Status st = mscan::resolve_config_path(state.configPath, cfgPath);
        if (st)
            st = mscan::load_config(cfgPath, cfg);
        if (!st)
        {
            log.e(st.to_string());
            std::cout << mscan::ansi::err << "Config error: " << st.message << mscan::ansi::reset << "\n";
            return false;
        }
        log.i("config: " + cfgPath);
        if (!state.windowTitle.empty())
            cfg.window.title_pattern = state.windowTitle;

        const fs::path root = resolve_output_root();
        const std::string ts = now_stamp();
        const fs::path resultsDir = root / "results";
        const fs::path debugDir = root / "debug" / ts;

        ensure_dir(resultsDir);
        if (state.saveDebug)
            ensure_dir(debugDir);
        const fs::path csvPath = resultsDir / (ts + ".csv");

        std::cout << mscan::ansi::title << "Scanning to (" << state.target.x << ", " << state.target.y << ")"
                  << mscan::ansi::reset << "\n\n";
        std::cout << mscan::ansi::muted << "Window    : " << cfg.window.title_pattern << mscan::ansi::reset << "\n";
        std::cout << mscan::ansi::muted << "Results CSV: " << csvPath.string() << mscan::ansi::reset << "\n";
        if (state.saveDebug)
            std::cout << mscan::ansi::muted << "Debug dir : " << debugDir.string() << mscan::ansi::reset << "\n";
        std::cout << "\n";

        mscan::x11::X11WindowManager windows(cfg.window, log);
        mscan::x11::X11ScreenCapture capture(log);
        mscan::x11::X11MouseController mouse(cfg.drag, log);
        mscan::TesseractOcrEngine ocr(cfg.ocr, log);
        mscan::SteadyClock clock;

        // Park the pointer mid-map so the first drag grabs the map, not a panel.
        // A missing window is reported by the scan itself.
        mscan::WindowHandle handle = 0;
        cv::Rect region;
        if (windows.find_window(cfg.window.title_pattern, handle) && windows.get_region(handle, region))
        {
            st = mouse.warp_to(region.x + region.width / 2, region.y + region.height / 2);
            if (!st)
                log.w("pointer warp failed: " + st.to_string());
        }

        mscan::MapScanner scanner(cfg, log, windows, capture, mouse, ocr, clock);
        scanner.set_observer(print_step);
        if (state.saveDebug)
            scanner.set_debug_dir(debugDir.string());

        {
            ActiveScan active(scanner);
            out = scanner.run(state.target);
        }

        const char *color = out.outcome == mscan::ScanOutcome::Converged   ? mscan::ansi::ok
                            : out.outcome == mscan::ScanOutcome::Exhausted ? mscan::ansi::warn
                                                                           : mscan::ansi::err;
        std::cout << "\n"
                  << color << mscan::ansi::bold << mscan::outcome_name(out.outcome) << mscan::ansi::reset
                  << ": " << out.reason << "\n"
                  << mscan::ansi::muted
                  << "Moves: " << out.attempts
                  << ", capture failures: " << out.capture_failures
                  << ", extraction failures: " << out.extraction_failures
                  << ", stalled moves: " << out.stalled_moves
                  << ", " << std::fixed << std::setprecision(1) << out.elapsed_ms / 1000.0 << " s";
        if (out.best_coordinate)
            std::cout << ", best " << out.best_coordinate->to_string();
        std::cout << mscan::ansi::reset << "\n\n";

        std::ofstream csv(csvPath);
        if (!csv)
        {
            log.w("cannot write " + csvPath.string());
            return true;
        }
        csv << "target_x,target_y,outcome,reason,cause,final_x,final_y,best_x,best_y,"
               "attempts,capture_failures,extraction_failures,stalled_moves,elapsed_ms,debug_dir\n";
        csv << state.target.x << "," << state.target.y << ","
            << mscan::outcome_name(out.outcome) << ","
            << quoted(out.reason) << ","
            << mscan::error_kind_name(out.cause) << ",";
        coord_cells(csv, out.final_coordinate);
        csv << ",";
        coord_cells(csv, out.best_coordinate);
        csv << "," << out.attempts << ","
            << out.capture_failures << ","
            << out.extraction_failures << ","
            << out.stalled_moves << ","
            << out.elapsed_ms << ","
            << (state.saveDebug ? quoted(debugDir.string()) : std::string()) << "\n";
        return true;
    }

}
