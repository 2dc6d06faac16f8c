#pragma once
#include "mscan/config.hpp"
#include "mscan/coordinate.hpp"
#include "mscan/log.hpp"
#include "mscan/ocr_engine.hpp"
#include "mscan/planner.hpp"
#include "mscan/platform.hpp"
#include "mscan/preprocessor.hpp"
#include "mscan/safety.hpp"
#include "mscan/status.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace mscan
{
    enum class ScanState
    {
        Idle,
        Capturing,
        Extracting,
        Validating,
        Correcting,
        Converged, // terminal
        Exhausted, // terminal
        Aborted    // terminal
    };

    const char *state_name(ScanState s);
    bool is_terminal(ScanState s);

    enum class ScanOutcome
    {
        Converged,
        Exhausted,
        Aborted
    };

    const char *outcome_name(ScanOutcome o);

    struct ScanResult
    {
        ScanOutcome outcome{ScanOutcome::Aborted};
        std::string reason;
        ErrorKind cause{ErrorKind::None};            // set for Aborted

        std::optional<Coordinate> final_coordinate;  // last readout that passed validation
        std::optional<Coordinate> last_readout;      // last parsed readout, even if rejected
        std::optional<Coordinate> best_coordinate;   // validated readout closest to the target

        int attempts{0};                             // movements issued
        int capture_failures{0};                     // totals over the session
        int extraction_failures{0};
        int stalled_moves{0};                        // drags the next frame showed no effect of
        std::uint64_t elapsed_ms{0};
    };

    struct StepEvent
    {
        ScanState from{ScanState::Idle};
        ScanState to{ScanState::Idle};
        int attempts{0};
        std::string detail;
    };

    using StepObserver = std::function<void(const StepEvent &)>;

    struct ScanSession; // per-run state, lives only inside run()

    // Capture -> OCR -> validate -> correct loop for one target at a time.
    // Single-threaded; request_cancel() may be called from another thread or a
    // signal handler and is honoured at the next state transition.
    class MapScanner
    {
    public:
        MapScanner(const ScannerConfig &cfg, log::Logger &log,
                   WindowManager &window, ScreenCapture &capture,
                   MouseController &mouse, OcrEngine &ocr, Clock &clock);

        ScanResult run(const TargetCoordinate &target);

        void request_cancel() { cancel_.store(true); }
        void set_observer(StepObserver obs) { observer_ = std::move(obs); }

        // Write every preprocessed readout image into `dir` (empty disables).
        void set_debug_dir(const std::string &dir) { debugDir_ = dir; }

    private:
        ScanState on_idle(ScanSession &s);
        ScanState on_capturing(ScanSession &s);
        ScanState on_extracting(ScanSession &s);
        ScanState on_validating(ScanSession &s);
        ScanState on_correcting(ScanSession &s);

        ScanState abort(ScanSession &s, const Status &why);
        Status recover_window(ScanSession &s);
        Status check_motion(ScanSession &s);
        void backoff(int failures);
        void save_debug(const ScanSession &s, ThresholdStrategy strategy, const PreprocessedImage &img) const;
        void notify(const ScanSession &s, ScanState from, ScanState to) const;

        const ScannerConfig &cfg_;
        log::Logger &log_;
        WindowManager &window_;
        ScreenCapture &capture_;
        MouseController &mouse_;
        OcrEngine &ocr_;
        Clock &clock_;

        ImagePreprocessor preprocessor_;
        CorrectionPlanner planner_;
        SafetyGuard guard_;

        std::atomic<bool> cancel_{false};
        StepObserver observer_;
        std::string debugDir_;
    };
}
