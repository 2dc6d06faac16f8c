#include "mscan/scanner.hpp"
#include "mscan/motion.hpp"

#include <opencv2/imgcodecs.hpp>

#include <exception>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace mscan
{
    // Mutable state of one run. Created by run(), gone when run() returns.
    struct ScanSession
    {
        TargetCoordinate target;
        ScanState state{ScanState::Idle};

        WindowHandle window{0};
        cv::Rect region; // map area in screen coordinates

        Frame frame;
        Frame beforeMove;  // frame the last checked drag started from
        bool pendingMotionCheck{false};
        std::optional<Coordinate> current;
        std::optional<Coordinate> validated;
        std::optional<Coordinate> best;

        int captureFailures{0};    // consecutive
        int extractionFailures{0}; // consecutive
        int stalledMoves{0};       // consecutive
        int captureTotal{0};
        int extractionTotal{0};
        int stalledTotal{0};
        int attempts{0};
        int iteration{0};

        std::uint64_t startedAt{0};
        std::uint64_t elapsed{0};

        std::string reason;
        ErrorKind cause{ErrorKind::None};
    };

    const char *state_name(ScanState s)
    {
        switch (s)
        {
        case ScanState::Idle:
            return "Idle";
        case ScanState::Capturing:
            return "Capturing";
        case ScanState::Extracting:
            return "Extracting";
        case ScanState::Validating:
            return "Validating";
        case ScanState::Correcting:
            return "Correcting";
        case ScanState::Converged:
            return "Converged";
        case ScanState::Exhausted:
            return "Exhausted";
        case ScanState::Aborted:
            return "Aborted";
        }
        return "?";
    }

    bool is_terminal(ScanState s)
    {
        return s == ScanState::Converged || s == ScanState::Exhausted || s == ScanState::Aborted;
    }

    const char *outcome_name(ScanOutcome o)
    {
        switch (o)
        {
        case ScanOutcome::Converged:
            return "converged";
        case ScanOutcome::Exhausted:
            return "exhausted";
        case ScanOutcome::Aborted:
            return "aborted";
        }
        return "?";
    }

    MapScanner::MapScanner(const ScannerConfig &cfg, log::Logger &log,
                           WindowManager &window, ScreenCapture &capture,
                           MouseController &mouse, OcrEngine &ocr, Clock &clock)
        : cfg_(cfg), log_(log), window_(window), capture_(capture), mouse_(mouse), ocr_(ocr), clock_(clock),
          preprocessor_(cfg.preprocess), planner_(cfg.planner), guard_(log)
    {
    }

    ScanResult MapScanner::run(const TargetCoordinate &target)
    {
        ScanSession s;
        s.target = target;
        s.startedAt = clock_.now_ms();

        log_.i("scan: target (" + std::to_string(target.x) + ", " + std::to_string(target.y) + ")");

        while (!is_terminal(s.state))
        {
            const ScanState from = s.state;
            ScanState to = from;
            if (cancel_.load())
            {
                s.state = abort(s, Status::fail(ErrorKind::Cancelled, "cancelled"));
                notify(s, from, s.state);
                break;
            }
            switch (from)
            {
            case ScanState::Idle:
                to = on_idle(s);
                break;
            case ScanState::Capturing:
                to = on_capturing(s);
                break;
            case ScanState::Extracting:
                to = on_extracting(s);
                break;
            case ScanState::Validating:
                to = on_validating(s);
                break;
            case ScanState::Correcting:
                to = on_correcting(s);
                break;
            default:
                break;
            }
            s.state = to;
            notify(s, from, to);
        }

        s.elapsed = clock_.now_ms() - s.startedAt;

        ScanResult r;
        r.outcome = (s.state == ScanState::Converged)   ? ScanOutcome::Converged
                    : (s.state == ScanState::Exhausted) ? ScanOutcome::Exhausted
                                                        : ScanOutcome::Aborted;
        r.reason = s.reason;
        r.cause = s.cause;
        r.final_coordinate = s.validated;
        r.last_readout = s.current;
        r.best_coordinate = s.best;
        r.attempts = s.attempts;
        r.capture_failures = s.captureTotal;
        r.extraction_failures = s.extractionTotal;
        r.stalled_moves = s.stalledTotal;
        r.elapsed_ms = s.elapsed;

        std::string msg = std::string("scan: ") + outcome_name(r.outcome) + " (" + r.reason + ") after " +
                          std::to_string(r.attempts) + " move(s), " + std::to_string(r.elapsed_ms) + " ms";
        if (r.best_coordinate)
            msg += ", best " + r.best_coordinate->to_string();
        if (r.outcome == ScanOutcome::Aborted)
            log_.w(msg);
        else
            log_.i(msg);
        return r;
    }

    // ============================== states ==============================

    ScanState MapScanner::on_idle(ScanSession &s)
    {
        Status st = validate_config(cfg_);
        if (!st)
            return abort(s, Status::fail(ErrorKind::Configuration, "configuration error: " + st.message));

        st = window_.find_window(cfg_.window.title_pattern, s.window);
        if (!st)
            return abort(s, st);

        st = window_.get_region(s.window, s.region);
        if (!st)
            return abort(s, st);

        log_.d("scan: window " + std::to_string(s.window) + " region " + std::to_string(s.region.width) + "x" +
               std::to_string(s.region.height) + " at " + std::to_string(s.region.x) + "," +
               std::to_string(s.region.y));
        return ScanState::Capturing;
    }

    ScanState MapScanner::on_capturing(ScanSession &s)
    {
        Status st = guard_.check_elapsed(clock_.now_ms() - s.startedAt, cfg_.bounds);
        if (!st)
            return abort(s, st);

        ++s.iteration;
        Frame frame;
        st = capture_.capture(s.window, s.region, frame);
        if (st && frame.empty())
            st = Status::fail(ErrorKind::Capture, "empty frame");

        if (st)
        {
            s.captureFailures = 0;
            s.frame = std::move(frame);
            st = check_motion(s);
            if (!st)
                return abort(s, st);
            return ScanState::Extracting;
        }

        ++s.captureFailures;
        ++s.captureTotal;
        log_.w("capture failed (" + std::to_string(s.captureFailures) + "): " + st.to_string());

        if (!window_.is_valid(s.window))
        {
            Status rs = recover_window(s);
            if (rs.kind == ErrorKind::SafetyViolation)
                return abort(s, rs);
            if (!rs)
                log_.w("window lookup failed: " + rs.to_string());
        }

        st = guard_.check_failures(s.captureFailures, cfg_.bounds, "capture");
        if (!st)
            return abort(s, st);

        backoff(s.captureFailures);
        return ScanState::Capturing;
    }

    ScanState MapScanner::on_extracting(ScanSession &s)
    {
        const cv::Rect roi = readout_rect(cfg_.readout, s.frame.image.size());

        // keep the most informative failure across strategies
        auto rank = [](ErrorKind k)
        {
            switch (k)
            {
            case ErrorKind::LowConfidence:
                return 4;
            case ErrorKind::CoordinateParse:
                return 3;
            case ErrorKind::InvalidRegion:
                return 2;
            case ErrorKind::RecognitionUnavailable:
                return 1;
            default:
                return 0;
            }
        };
        Status worst = Status::fail(ErrorKind::CoordinateParse, "no strategy produced a readout");
        bool haveFailure = false;

        for (ThresholdStrategy strategy : cfg_.ocr.strategies)
        {
            PreprocessedImage img;
            Status st = preprocessor_.prepare(s.frame, roi, strategy, img);
            if (st)
            {
                save_debug(s, strategy, img);
                OcrResult result;
                st = ocr_.recognize(img, result);
                if (st)
                {
                    std::optional<Coordinate> coord;
                    st = ocr_.parse_coordinate(result, coord);
                    if (st && coord)
                    {
                        log_.d(std::string("ocr[") + strategy_name(strategy) + "]: " + coord->to_string());
                        s.current = coord;
                        s.extractionFailures = 0;
                        return ScanState::Validating;
                    }
                }
            }

            log_.d(std::string("ocr[") + strategy_name(strategy) + "]: " + st.to_string());
            if (!haveFailure || rank(st.kind) > rank(worst.kind))
            {
                worst = st;
                haveFailure = true;
            }
            // other strategies will not bring the engine back
            if (st.kind == ErrorKind::RecognitionUnavailable)
                break;
        }

        ++s.extractionFailures;
        ++s.extractionTotal;
        log_.w("extraction failed (" + std::to_string(s.extractionFailures) + "): " + worst.to_string());

        Status st = guard_.check_failures(s.extractionFailures, cfg_.bounds, "extraction");
        if (!st)
            return abort(s, st);

        backoff(s.extractionFailures);
        return ScanState::Capturing;
    }

    ScanState MapScanner::on_validating(ScanSession &s)
    {
        Status st = guard_.check_coordinate(*s.current, cfg_.bounds);
        if (!st)
            return abort(s, st);

        s.validated = s.current;
        if (!s.best || distance(*s.current, s.target) < distance(*s.best, s.target))
            s.best = s.current;
        return ScanState::Correcting;
    }

    ScanState MapScanner::on_correcting(ScanSession &s)
    {
        const PlanDecision d = planner_.plan(*s.validated, s.target, cfg_.bounds, s.attempts + 1);
        if (d.converged)
        {
            s.reason = "converged at " + s.validated->to_string();
            return ScanState::Converged;
        }

        if (s.attempts >= cfg_.bounds.max_attempts)
        {
            s.reason = "attempt limit reached (" + std::to_string(s.attempts) + ")";
            return ScanState::Exhausted;
        }

        Status st = guard_.check_movement(d.plan, cfg_.bounds);
        if (!st)
            return abort(s, st);

        st = mouse_.move_by(d.plan.dx, d.plan.dy);
        if (!st)
            return abort(s, st);

        s.pendingMotionCheck = cfg_.motion.detect && d.plan.magnitude() >= cfg_.motion.min_drag_px;
        if (s.pendingMotionCheck)
            s.beforeMove = s.frame;

        s.attempts = d.plan.attempt;
        log_.d(std::string("move #") + std::to_string(d.plan.attempt) + " " + move_mode_name(d.plan.mode) + " (" +
               std::to_string(d.plan.dx) + ", " + std::to_string(d.plan.dy) + ") from " +
               s.validated->to_string());

        clock_.sleep_ms(cfg_.retry.settle_ms);
        return ScanState::Capturing;
    }

    // ============================== helpers ==============================

    ScanState MapScanner::abort(ScanSession &s, const Status &why)
    {
        s.reason = why.message;
        s.cause = why.kind;
        return ScanState::Aborted;
    }

    Status MapScanner::recover_window(ScanSession &s)
    {
        WindowHandle h = 0;
        Status st = window_.find_window(cfg_.window.title_pattern, h);
        if (!st)
            return st;

        cv::Rect r;
        st = window_.get_region(h, r);
        if (!st)
            return st;

        st = guard_.check_window_region(s.region, r);
        if (!st)
            return st;

        log_.i("window re-acquired: " + std::to_string(h));
        s.window = h;
        return Status::ok();
    }

    // Compares the fresh frame with the one the last drag started from. A picture
    // that did not change means the drag hit the map edge or grabbed a UI panel.
    Status MapScanner::check_motion(ScanSession &s)
    {
        if (!s.pendingMotionCheck)
            return Status::ok();
        s.pendingMotionCheck = false;

        double similarity = 0.0;
        Status st = frame_similarity(s.beforeMove, s.frame, similarity);
        s.beforeMove = Frame();
        if (!st)
        {
            log_.d("motion check skipped: " + st.to_string());
            return Status::ok();
        }

        if (similarity < cfg_.motion.similarity_threshold)
        {
            s.stalledMoves = 0;
            return Status::ok();
        }

        ++s.stalledMoves;
        ++s.stalledTotal;
        log_.w("drag had no visible effect (" + std::to_string(int(similarity * 100.0)) + "% similar, " +
               std::to_string(s.stalledMoves) + " in a row)");
        return guard_.check_failures(s.stalledMoves, cfg_.bounds, "movement");
    }

    void MapScanner::backoff(int failures)
    {
        const std::uint64_t ms = cfg_.retry.delay_for(failures);
        log_.d("backoff " + std::to_string(ms) + " ms");
        clock_.sleep_ms(ms);
    }

    void MapScanner::save_debug(const ScanSession &s, ThresholdStrategy strategy,
                                const PreprocessedImage &img) const
    {
        if (debugDir_.empty())
            return;
        const fs::path p = fs::path(debugDir_) /
                           (std::to_string(s.iteration) + "_" + strategy_name(strategy) + ".png");
        try
        {
            if (!cv::imwrite(p.string(), img.gray))
                log_.w("could not write " + p.string());
        }
        catch (const cv::Exception &ex)
        {
            log_.w("could not write " + p.string() + ": " + ex.what());
        }
    }

    void MapScanner::notify(const ScanSession &s, ScanState from, ScanState to) const
    {
        std::string detail;
        if (to == ScanState::Validating && s.current)
            detail = s.current->to_string();
        else if (is_terminal(to))
            detail = s.reason;

        log_.d(std::string("state ") + state_name(from) + " -> " + state_name(to) +
               (detail.empty() ? "" : " " + detail));

        if (observer_)
        {
            StepEvent ev;
            ev.from = from;
            ev.to = to;
            ev.attempts = s.attempts;
            ev.detail = detail;
            try
            {
                observer_(ev);
            }
            catch (const std::exception &ex)
            {
                // progress display only; the scan itself is unaffected
                log_.w(std::string("step observer failed: ") + ex.what());
            }
        }
    }
}
