#include "mscan/config.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

namespace fs = std::filesystem;

namespace mscan
{
    namespace
    {
        // ---- optional readers: leave `v` untouched when the key is absent ----
        void read(const cv::FileNode &n, const char *key, double &v)
        {
            const cv::FileNode k = n[key];
            if (!k.empty() && k.isReal())
                v = (double)k;
            else if (!k.empty() && k.isInt())
                v = (double)(int)k;
        }
        void read(const cv::FileNode &n, const char *key, int &v)
        {
            const cv::FileNode k = n[key];
            if (!k.empty() && (k.isInt() || k.isReal()))
                v = (int)std::lround((double)k);
        }
        void read(const cv::FileNode &n, const char *key, std::uint64_t &v)
        {
            const cv::FileNode k = n[key];
            if (!k.empty() && (k.isInt() || k.isReal()))
                v = (std::uint64_t)std::max(0.0, (double)k);
        }
        void read(const cv::FileNode &n, const char *key, bool &v)
        {
            const cv::FileNode k = n[key];
            if (k.empty())
                return;
            if (k.isInt())
                v = (int)k != 0;
            else if (k.isString())
            {
                const std::string s = (std::string)k;
                v = (s == "true" || s == "yes" || s == "on" || s == "1");
            }
        }
        void read(const cv::FileNode &n, const char *key, std::string &v)
        {
            const cv::FileNode k = n[key];
            if (!k.empty() && k.isString())
                v = (std::string)k;
        }

        void append(std::string &list, const char *key)
        {
            if (!list.empty())
                list += ", ";
            list += key;
        }

        // ---- required reader: absent keys go to `missing`, fractional values for
        // integer fields go to `nonInteger` ----
        template <typename T>
        bool require(const cv::FileNode &n, const char *key, T &v, std::string &missing, std::string &nonInteger)
        {
            const cv::FileNode k = n[key];
            if (k.empty() || !(k.isInt() || k.isReal()))
            {
                append(missing, key);
                return false;
            }
            if constexpr (std::is_integral<T>::value)
            {
                const double d = (double)k;
                if (k.isReal() && d != std::floor(d))
                {
                    append(nonInteger, key);
                    return false;
                }
            }
            read(n, key, v);
            return true;
        }
    } // namespace

    const char *strategy_name(ThresholdStrategy s)
    {
        switch (s)
        {
        case ThresholdStrategy::GameText:
            return "game_text";
        case ThresholdStrategy::WhiteTextOutline:
            return "white_text_outline";
        case ThresholdStrategy::HighContrast:
            return "high_contrast";
        }
        return "unknown";
    }

    bool parse_strategy(const std::string &name, ThresholdStrategy &out)
    {
        for (ThresholdStrategy s : {ThresholdStrategy::GameText,
                                    ThresholdStrategy::WhiteTextOutline,
                                    ThresholdStrategy::HighContrast})
        {
            if (name == strategy_name(s))
            {
                out = s;
                return true;
            }
        }
        return false;
    }

    std::uint64_t RetryPolicy::delay_for(int failures) const
    {
        if (failures <= 0)
            return 0;
        if (mode == BackoffMode::Fixed)
            return std::min(base_ms, max_ms);
        const double d = double(base_ms) * std::pow(multiplier, double(failures - 1));
        if (d >= double(max_ms))
            return max_ms;
        return (std::uint64_t)std::llround(d);
    }

    Status load_config(const std::string &path, ScannerConfig &out)
    {
        cv::FileStorage fs;
        try
        {
            if (!fs.open(path, cv::FileStorage::READ))
                return Status::fail(ErrorKind::Configuration, "cannot open config file: " + path);
        }
        catch (const cv::Exception &ex)
        {
            return Status::fail(ErrorKind::Configuration, "cannot parse config file " + path + ": " + ex.what());
        }

        ScannerConfig cfg; // start from defaults

        // safety: every bound is required
        const cv::FileNode safety = fs["safety"];
        if (safety.empty() || !safety.isMap())
            return Status::fail(ErrorKind::Configuration, "missing 'safety' section in " + path);

        std::string missing, nonInteger;
        SafetyBounds &b = cfg.bounds;
        require(safety, "max_delta_per_move", b.max_delta_per_move, missing, nonInteger);
        require(safety, "max_consecutive_failures", b.max_consecutive_failures, missing, nonInteger);
        require(safety, "max_attempts", b.max_attempts, missing, nonInteger);
        require(safety, "max_session_ms", b.max_session_ms, missing, nonInteger);
        require(safety, "min_x", b.min_x, missing, nonInteger);
        require(safety, "max_x", b.max_x, missing, nonInteger);
        require(safety, "min_y", b.min_y, missing, nonInteger);
        require(safety, "max_y", b.max_y, missing, nonInteger);
        if (!missing.empty())
            return Status::fail(ErrorKind::Configuration, "missing safety keys: " + missing);
        if (!nonInteger.empty())
            return Status::fail(ErrorKind::Configuration, "safety keys must be whole numbers: " + nonInteger);

        // OCR confidence threshold and planner thresholds are also required inputs
        const cv::FileNode planner = fs["planner"];
        const cv::FileNode ocr = fs["ocr"];
        if (planner.empty() || ocr.empty())
            return Status::fail(ErrorKind::Configuration, "missing 'planner' or 'ocr' section in " + path);
        require(planner, "coarse_threshold", cfg.planner.coarse_threshold, missing, nonInteger);
        require(planner, "fine_step", cfg.planner.fine_step, missing, nonInteger);
        require(ocr, "min_confidence", cfg.ocr.min_confidence, missing, nonInteger);
        if (!missing.empty())
            return Status::fail(ErrorKind::Configuration, "missing keys: " + missing);

        read(planner, "epsilon", cfg.planner.epsilon);
        read(planner, "coarse_step", cfg.planner.coarse_step);
        read(planner, "pixels_per_unit", cfg.planner.pixels_per_unit);
        read(planner, "invert_drag", cfg.planner.invert_drag);

        read(ocr, "language", cfg.ocr.language);
        read(ocr, "datapath", cfg.ocr.datapath);
        read(ocr, "page_seg_mode", cfg.ocr.page_seg_mode);
        read(ocr, "whitelist", cfg.ocr.whitelist);
        read(ocr, "prior_x", cfg.ocr.prior_x);
        read(ocr, "prior_y", cfg.ocr.prior_y);
        const cv::FileNode strategies = ocr["strategies"];
        if (!strategies.empty())
        {
            if (!strategies.isSeq())
                return Status::fail(ErrorKind::Configuration, "ocr.strategies must be a list");
            cfg.ocr.strategies.clear();
            for (auto it = strategies.begin(); it != strategies.end(); ++it)
            {
                ThresholdStrategy s;
                const std::string name = (std::string)(*it);
                if (!parse_strategy(name, s))
                    return Status::fail(ErrorKind::Configuration, "unknown ocr strategy: " + name);
                cfg.ocr.strategies.push_back(s);
            }
        }

        const cv::FileNode pre = fs["preprocess"];
        if (!pre.empty())
        {
            PreprocessParams &p = cfg.preprocess;
            read(pre, "clahe_clip", p.clahe_clip);
            read(pre, "clahe_tile", p.clahe_tile);
            read(pre, "bilateral_d", p.bilateral_d);
            read(pre, "bilateral_sigma", p.bilateral_sigma);
            read(pre, "adaptive_block", p.adaptive_block);
            read(pre, "adaptive_c", p.adaptive_c);
            read(pre, "blur_kernel", p.blur_kernel);
            read(pre, "contrast_gain", p.contrast_gain);
            read(pre, "fixed_threshold", p.fixed_threshold);
            read(pre, "min_text_height", p.min_text_height);
            read(pre, "max_upscale", p.max_upscale);
            read(pre, "border_px", p.border_px);
        }

        const cv::FileNode retry = fs["retry"];
        if (!retry.empty())
        {
            std::string mode;
            read(retry, "mode", mode);
            if (mode == "fixed")
                cfg.retry.mode = BackoffMode::Fixed;
            else if (mode == "exponential")
                cfg.retry.mode = BackoffMode::Exponential;
            else if (!mode.empty())
                return Status::fail(ErrorKind::Configuration, "unknown retry.mode: " + mode);
            read(retry, "base_ms", cfg.retry.base_ms);
            read(retry, "multiplier", cfg.retry.multiplier);
            read(retry, "max_ms", cfg.retry.max_ms);
            read(retry, "settle_ms", cfg.retry.settle_ms);
        }

        const cv::FileNode readout = fs["readout"];
        if (!readout.empty())
        {
            read(readout, "x", cfg.readout.x);
            read(readout, "y", cfg.readout.y);
            read(readout, "w", cfg.readout.w);
            read(readout, "h", cfg.readout.h);
        }

        const cv::FileNode window = fs["window"];
        if (!window.empty())
        {
            WindowParams &w = cfg.window;
            read(window, "title_pattern", w.title_pattern);
            read(window, "min_width", w.min_width);
            read(window, "min_height", w.min_height);
            read(window, "margin_left", w.margin_left);
            read(window, "margin_right", w.margin_right);
            read(window, "margin_top", w.margin_top);
            read(window, "margin_bottom", w.margin_bottom);
        }

        const cv::FileNode drag = fs["drag"];
        if (!drag.empty())
        {
            read(drag, "duration_ms", cfg.drag.duration_ms);
            read(drag, "steps", cfg.drag.steps);
        }

        const cv::FileNode motion = fs["motion"];
        if (!motion.empty())
        {
            read(motion, "detect", cfg.motion.detect);
            read(motion, "similarity_threshold", cfg.motion.similarity_threshold);
            read(motion, "min_drag_px", cfg.motion.min_drag_px);
        }

        Status v = validate_config(cfg);
        if (!v)
            return v;
        out = cfg;
        return Status::ok();
    }

    Status validate_config(const ScannerConfig &cfg)
    {
        auto bad = [](const std::string &what)
        { return Status::fail(ErrorKind::Configuration, what); };

        const SafetyBounds &b = cfg.bounds;
        if (!(b.max_delta_per_move >= 1.0))
            return bad("safety.max_delta_per_move must be >= 1");
        if (b.max_consecutive_failures < 0)
            return bad("safety.max_consecutive_failures must be >= 0");
        if (b.max_attempts <= 0)
            return bad("safety.max_attempts must be > 0");
        if (b.max_session_ms == 0)
            return bad("safety.max_session_ms must be > 0");
        if (b.min_x > b.max_x || b.min_y > b.max_y)
            return bad("safety allowed range is empty (min > max)");

        const PlannerParams &p = cfg.planner;
        if (!(p.epsilon >= 0.0))
            return bad("planner.epsilon must be >= 0");
        if (!(p.coarse_threshold > 0.0))
            return bad("planner.coarse_threshold must be > 0");
        if (!(p.coarse_step >= 1.0) || !(p.fine_step >= 1.0))
            return bad("planner steps must be >= 1 px");
        if (p.fine_step > p.coarse_step)
            return bad("planner.fine_step must not exceed planner.coarse_step");
        if (!(p.pixels_per_unit > 0.0))
            return bad("planner.pixels_per_unit must be > 0");

        const OcrParams &o = cfg.ocr;
        if (!(o.min_confidence >= 0.0 && o.min_confidence <= 1.0))
            return bad("ocr.min_confidence must be within [0,1]");
        if (o.strategies.empty())
            return bad("ocr.strategies must not be empty");
        if (o.prior_x < 0.0 || o.prior_x > 1.0 || o.prior_y < 0.0 || o.prior_y > 1.0)
            return bad("ocr prior must be within [0,1]");

        const PreprocessParams &pp = cfg.preprocess;
        if (pp.clahe_tile <= 0 || pp.adaptive_block < 3 || pp.blur_kernel < 1)
            return bad("preprocess kernel sizes out of range");
        if (pp.min_text_height < 0 || pp.min_text_height > 512 || !(pp.max_upscale >= 1.0) ||
            pp.max_upscale > 16.0 || pp.border_px < 0 || pp.border_px > 256)
            return bad("preprocess scaling parameters out of range");

        const ReadoutRegion &r = cfg.readout;
        if (r.x < 0.0 || r.y < 0.0 || r.w <= 0.0 || r.h <= 0.0 || r.x + r.w > 1.0 || r.y + r.h > 1.0)
            return bad("readout region must be a non-empty fraction of the window");

        const WindowParams &w = cfg.window;
        if (w.margin_left < 0.0 || w.margin_right < 0.0 || w.margin_top < 0.0 || w.margin_bottom < 0.0 ||
            w.margin_left + w.margin_right >= 1.0 || w.margin_top + w.margin_bottom >= 1.0)
            return bad("window margins must leave a non-empty area");

        const RetryPolicy &rp = cfg.retry;
        if (rp.max_ms < rp.base_ms || !(rp.multiplier >= 1.0))
            return bad("retry policy out of range");

        if (cfg.drag.steps <= 0 || cfg.drag.duration_ms < 0)
            return bad("drag parameters out of range");

        if (!(cfg.motion.similarity_threshold > 0.0 && cfg.motion.similarity_threshold <= 1.0))
            return bad("motion.similarity_threshold must be within (0,1]");
        if (!(cfg.motion.min_drag_px >= 0.0))
            return bad("motion.min_drag_px must be >= 0");

        return Status::ok();
    }

    Status resolve_config_path(const std::string &explicitPath, std::string &out)
    {
        std::error_code ec;
        auto chosen = [&](const std::string &p, const char *origin)
        {
            if (!fs::is_regular_file(p, ec))
                return Status::fail(ErrorKind::Configuration, std::string(origin) + " config not found: " + p);
            out = p;
            return Status::ok();
        };

        if (!explicitPath.empty())
            return chosen(explicitPath, "requested");

        const char *env = std::getenv("MSCAN_CONFIG");
        if (env && *env)
            return chosen(env, "MSCAN_CONFIG");

        for (const std::string p : {std::string("config/map_scanner.yml"), std::string(MSCAN_DEFAULT_CONFIG)})
        {
            if (fs::is_regular_file(p, ec))
            {
                out = p;
                return Status::ok();
            }
        }
        return Status::fail(ErrorKind::Configuration,
                            "no config file: pass --config FILE or set MSCAN_CONFIG (safety limits have no defaults)");
    }
}
