#pragma once
#include "mscan/app.hpp"
#include "mscan/scanner.hpp"

namespace app::progress
{
    // Run one scan against the live desktop, print each step, and save outputs.
    // Root is ./mscan_output unless MSCAN_OUTPUT_ROOT is set.
    // - CSV:   <root>/results/<YYYYMMDD-HHMMSS>.csv
    // - Debug: <root>/debug/<YYYYMMDD-HHMMSS>/<iteration>_<strategy>.png
    // Returns false (and prints why) if the configuration could not be loaded;
    // `out` is filled otherwise.
    bool run_and_report(const app::State &state, mscan::ScanResult &out);

    // SIGINT/SIGTERM cancel the running scan instead of killing the process.
    void install_signal_handlers();

    // Process exit code for a finished scan: 0 converged, 2 exhausted, 3 aborted.
    int exit_code(const mscan::ScanResult &r);
}
