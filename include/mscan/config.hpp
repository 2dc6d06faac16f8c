#pragma once
#include "mscan/status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mscan
{
    // Hard limits for one session. Every field is required in a config file.
    struct SafetyBounds
    {
        double max_delta_per_move = 120.0;       // screen px, Euclidean
        int max_consecutive_failures = 5;        // per failure kind (capture / extraction)
        int max_attempts = 60;                   // movements issued per session
        std::uint64_t max_session_ms = 120000;   // wall clock for one session
        int min_x = 0, max_x = 1000;             // allowed readout range
        int min_y = 0, max_y = 1000;
    };

    struct PlannerParams
    {
        double epsilon = 0.0;            // map units; |delta| <= epsilon is converged
        double coarse_threshold = 50.0;  // screen px; above it moves are coarse
        double coarse_step = 100.0;      // screen px, further capped by max_delta_per_move
        double fine_step = 10.0;         // screen px at the coarse threshold, damped below it
        double pixels_per_unit = 1.0;    // screen px per map unit
        bool invert_drag = true;         // dragging the map pans the camera the other way
    };

    enum class ThresholdStrategy
    {
        GameText,         // CLAHE + bilateral + adaptive gaussian
        WhiteTextOutline, // equalize + blur + Otsu
        HighContrast      // linear gain + fixed threshold
    };

    const char *strategy_name(ThresholdStrategy s);
    bool parse_strategy(const std::string &name, ThresholdStrategy &out);

    struct PreprocessParams
    {
        double clahe_clip = 3.0;
        int clahe_tile = 8;
        int bilateral_d = 9;
        double bilateral_sigma = 75.0;
        int adaptive_block = 15;
        int adaptive_c = 3;
        int blur_kernel = 3;
        double contrast_gain = 2.0;
        int fixed_threshold = 128;
        int min_text_height = 48; // upscale the crop until it is at least this tall
        double max_upscale = 4.0;
        int border_px = 10;
    };

    struct OcrParams
    {
        double min_confidence = 0.60; // 0..1
        std::string language = "eng";
        std::string datapath;         // empty: tesseract default
        int page_seg_mode = 7;        // single text line
        std::string whitelist = "0123456789-, ";
        double prior_x = 0.5;         // expected readout centre, fraction of the crop
        double prior_y = 0.5;
        std::vector<ThresholdStrategy> strategies{ThresholdStrategy::WhiteTextOutline,
                                                  ThresholdStrategy::GameText,
                                                  ThresholdStrategy::HighContrast};
    };

    enum class BackoffMode
    {
        Fixed,
        Exponential
    };

    struct RetryPolicy
    {
        BackoffMode mode = BackoffMode::Exponential;
        std::uint64_t base_ms = 200;
        double multiplier = 2.0;
        std::uint64_t max_ms = 2000;
        std::uint64_t settle_ms = 500; // wait after each movement before re-capturing

        // delay before retry number `failures` (1-based)
        std::uint64_t delay_for(int failures) const;
    };

    // Readout location inside the captured window region, as fractions.
    struct ReadoutRegion
    {
        double x = 0.40, y = 0.90, w = 0.20, h = 0.06;
    };

    struct WindowParams
    {
        std::string title_pattern = "Last War";
        int min_width = 500;
        int min_height = 300;
        // UI chrome trimmed from the window before it is used as the map area
        double margin_left = 0.0, margin_right = 0.0, margin_top = 0.0, margin_bottom = 0.0;
    };

    // Before/after frame comparison around each drag. A drag whose next frame is at
    // least this similar (normalized correlation) to the previous one had no effect.
    struct MotionParams
    {
        bool detect = true;
        double similarity_threshold = 0.98;
        double min_drag_px = 20.0; // shorter drags barely change the picture and are not checked
    };

    struct DragParams
    {
        int duration_ms = 300;
        int steps = 12;
    };

    struct ScannerConfig
    {
        SafetyBounds bounds;
        PlannerParams planner;
        PreprocessParams preprocess;
        OcrParams ocr;
        RetryPolicy retry;
        ReadoutRegion readout;
        WindowParams window;
        DragParams drag;
        MotionParams motion;
    };

    // Reads a YAML/JSON config through cv::FileStorage. The `safety` section must be
    // complete; other sections fall back to the defaults above.
    Status load_config(const std::string &path, ScannerConfig &out);

    Status validate_config(const ScannerConfig &cfg);

    // Picks the config file: `explicitPath` if given, else $MSCAN_CONFIG, else
    // ./config/map_scanner.yml, else the copy shipped in the source tree.
    // Configuration if the chosen file does not exist or nothing is found.
    Status resolve_config_path(const std::string &explicitPath, std::string &out);
}
