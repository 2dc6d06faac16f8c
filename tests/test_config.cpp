#include <gtest/gtest.h>

#include "mscan/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using mscan::ErrorKind;

namespace
{
    const char *kSafety = R"(safety:
  max_delta_per_move: 80
  max_consecutive_failures: 3
  max_attempts: 20
  max_session_ms: 30000
  min_x: 0
  max_x: 2000
  min_y: -50
  max_y: 2000
)";

    const char *kRequiredRest = R"(planner:
  coarse_threshold: 40
  fine_step: 8
ocr:
  min_confidence: 0.75
)";

    class ConfigFile : public ::testing::Test
    {
    protected:
        void TearDown() override
        {
            std::error_code ec;
            fs::remove(path_, ec);
        }

        std::string write(const std::string &body)
        {
            path_ = fs::temp_directory_path() /
                    ("mscan_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                     ".yml");
            std::ofstream f(path_);
            f << "%YAML:1.0\n---\n"
              << body;
            return path_.string();
        }

        fs::path path_;
    };
}

TEST_F(ConfigFile, LoadsRequiredAndOptionalSections)
{
    const std::string p = write(std::string(kSafety) + kRequiredRest +
                                "retry:\n  mode: \"fixed\"\n  base_ms: 150\n  max_ms: 900\n  settle_ms: 100\n"
                                "window:\n  title_pattern: \"My Game\"\n  margin_left: 0.06\n");
    mscan::ScannerConfig cfg;
    auto st = mscan::load_config(p, cfg);
    ASSERT_TRUE(st) << st.to_string();

    EXPECT_DOUBLE_EQ(cfg.bounds.max_delta_per_move, 80.0);
    EXPECT_EQ(cfg.bounds.max_consecutive_failures, 3);
    EXPECT_EQ(cfg.bounds.max_attempts, 20);
    EXPECT_EQ(cfg.bounds.max_session_ms, 30000u);
    EXPECT_EQ(cfg.bounds.min_y, -50);
    EXPECT_DOUBLE_EQ(cfg.planner.coarse_threshold, 40.0);
    EXPECT_DOUBLE_EQ(cfg.planner.fine_step, 8.0);
    EXPECT_DOUBLE_EQ(cfg.ocr.min_confidence, 0.75);

    EXPECT_EQ(cfg.retry.mode, mscan::BackoffMode::Fixed);
    EXPECT_EQ(cfg.retry.base_ms, 150u);
    EXPECT_EQ(cfg.retry.settle_ms, 100u);
    EXPECT_EQ(cfg.window.title_pattern, "My Game");
    EXPECT_DOUBLE_EQ(cfg.window.margin_left, 0.06);

    // untouched sections keep their defaults
    EXPECT_DOUBLE_EQ(cfg.planner.coarse_step, mscan::PlannerParams{}.coarse_step);
    EXPECT_EQ(cfg.ocr.strategies.size(), 3u);
}

TEST_F(ConfigFile, StrategyListReplacesDefault)
{
    const std::string p = write(std::string(kSafety) +
                                "planner:\n  coarse_threshold: 40\n  fine_step: 8\n"
                                "ocr:\n  min_confidence: 0.6\n  strategies: [ \"high_contrast\" ]\n");
    mscan::ScannerConfig cfg;
    ASSERT_TRUE(mscan::load_config(p, cfg));
    ASSERT_EQ(cfg.ocr.strategies.size(), 1u);
    EXPECT_EQ(cfg.ocr.strategies[0], mscan::ThresholdStrategy::HighContrast);
}

TEST_F(ConfigFile, UnknownStrategyIsConfigurationError)
{
    const std::string p = write(std::string(kSafety) +
                                "planner:\n  coarse_threshold: 40\n  fine_step: 8\n"
                                "ocr:\n  min_confidence: 0.6\n  strategies: [ \"sharpen\" ]\n");
    mscan::ScannerConfig cfg;
    EXPECT_EQ(mscan::load_config(p, cfg).kind, ErrorKind::Configuration);
}

TEST_F(ConfigFile, MissingSafetyKeyIsConfigurationError)
{
    const std::string p = write(R"(safety:
  max_delta_per_move: 80
  max_attempts: 20
)" + std::string(kRequiredRest));
    mscan::ScannerConfig cfg;
    cfg.bounds.max_attempts = 7;
    auto st = mscan::load_config(p, cfg);
    EXPECT_EQ(st.kind, ErrorKind::Configuration);
    EXPECT_NE(st.message.find("max_consecutive_failures"), std::string::npos);
    EXPECT_EQ(cfg.bounds.max_attempts, 7); // output untouched on failure
}

TEST_F(ConfigFile, MissingConfidenceThresholdIsConfigurationError)
{
    const std::string p = write(std::string(kSafety) + "planner:\n  coarse_threshold: 40\n  fine_step: 8\nocr:\n  language: \"eng\"\n");
    mscan::ScannerConfig cfg;
    EXPECT_EQ(mscan::load_config(p, cfg).kind, ErrorKind::Configuration);
}

TEST_F(ConfigFile, MissingFileIsConfigurationError)
{
    mscan::ScannerConfig cfg;
    EXPECT_EQ(mscan::load_config("/nonexistent/mscan.yml", cfg).kind, ErrorKind::Configuration);
}

TEST_F(ConfigFile, FractionalSafetyValueIsConfigurationError)
{
    std::string safety(kSafety);
    safety.replace(safety.find("max_attempts: 20"), 16, "max_attempts: 2.7");
    const std::string p = write(safety + kRequiredRest);
    mscan::ScannerConfig cfg;
    auto st = mscan::load_config(p, cfg);
    EXPECT_EQ(st.kind, ErrorKind::Configuration);
    EXPECT_NE(st.message.find("whole numbers"), std::string::npos);
    EXPECT_NE(st.message.find("max_attempts"), std::string::npos);
}

TEST_F(ConfigFile, WholeRealSafetyValueIsAccepted)
{
    std::string safety(kSafety);
    safety.replace(safety.find("max_attempts: 20"), 16, "max_attempts: 20.0");
    const std::string p = write(safety + kRequiredRest);
    mscan::ScannerConfig cfg;
    auto st = mscan::load_config(p, cfg);
    ASSERT_TRUE(st) << st.to_string();
    EXPECT_EQ(cfg.bounds.max_attempts, 20);
}

TEST_F(ConfigFile, MotionSectionIsRead)
{
    const std::string p = write(std::string(kSafety) + kRequiredRest +
                                "motion:\n  detect: 0\n  similarity_threshold: 0.95\n  min_drag_px: 5\n");
    mscan::ScannerConfig cfg;
    ASSERT_TRUE(mscan::load_config(p, cfg));
    EXPECT_FALSE(cfg.motion.detect);
    EXPECT_DOUBLE_EQ(cfg.motion.similarity_threshold, 0.95);
    EXPECT_DOUBLE_EQ(cfg.motion.min_drag_px, 5.0);
}

// Restores MSCAN_CONFIG after each test.
class ConfigResolution : public ConfigFile
{
protected:
    void SetUp() override
    {
        const char *env = std::getenv("MSCAN_CONFIG");
        hadEnv_ = env != nullptr;
        if (hadEnv_)
            savedEnv_ = env;
        unsetenv("MSCAN_CONFIG");
    }
    void TearDown() override
    {
        if (hadEnv_)
            setenv("MSCAN_CONFIG", savedEnv_.c_str(), 1);
        else
            unsetenv("MSCAN_CONFIG");
        ConfigFile::TearDown();
    }

    bool hadEnv_{false};
    std::string savedEnv_;
};

TEST_F(ConfigResolution, ExplicitPathWins)
{
    const std::string p = write(std::string(kSafety) + kRequiredRest);
    setenv("MSCAN_CONFIG", "/nonexistent/env.yml", 1);
    std::string out;
    ASSERT_TRUE(mscan::resolve_config_path(p, out));
    EXPECT_EQ(out, p);
}

TEST_F(ConfigResolution, MissingExplicitPathIsConfigurationError)
{
    std::string out;
    auto st = mscan::resolve_config_path("/nonexistent/mscan.yml", out);
    EXPECT_EQ(st.kind, ErrorKind::Configuration);
    EXPECT_TRUE(out.empty());
}

TEST_F(ConfigResolution, EnvironmentPathIsUsedAndMustExist)
{
    const std::string p = write(std::string(kSafety) + kRequiredRest);
    setenv("MSCAN_CONFIG", p.c_str(), 1);
    std::string out;
    ASSERT_TRUE(mscan::resolve_config_path("", out));
    EXPECT_EQ(out, p);

    setenv("MSCAN_CONFIG", "/nonexistent/env.yml", 1);
    out.clear();
    EXPECT_EQ(mscan::resolve_config_path("", out).kind, ErrorKind::Configuration);
}

TEST_F(ConfigResolution, FallsBackToShippedConfigWithSafetyLimits)
{
    std::string out;
    auto st = mscan::resolve_config_path("", out);
    ASSERT_TRUE(st) << st.to_string();
    ASSERT_FALSE(out.empty());

    mscan::ScannerConfig cfg;
    st = mscan::load_config(out, cfg);
    ASSERT_TRUE(st) << st.to_string();
    EXPECT_EQ(cfg.bounds.max_attempts, 60);
}

TEST(Config, ShippedExampleLoads)
{
    mscan::ScannerConfig cfg;
    auto st = mscan::load_config(std::string(MSCAN_SOURCE_DIR) + "/config/map_scanner.yml", cfg);
    ASSERT_TRUE(st) << st.to_string();
    EXPECT_TRUE(cfg.planner.invert_drag);
    EXPECT_DOUBLE_EQ(cfg.window.margin_right, 0.12);
}

TEST(Config, DefaultsAreValid)
{
    EXPECT_TRUE(mscan::validate_config(mscan::ScannerConfig{}));
}

TEST(Config, ValidationRejectsBadValues)
{
    mscan::ScannerConfig cfg;
    cfg.bounds.min_x = 10;
    cfg.bounds.max_x = 5;
    EXPECT_EQ(mscan::validate_config(cfg).kind, ErrorKind::Configuration);

    cfg = mscan::ScannerConfig{};
    cfg.ocr.min_confidence = 1.5;
    EXPECT_EQ(mscan::validate_config(cfg).kind, ErrorKind::Configuration);

    cfg = mscan::ScannerConfig{};
    cfg.readout.x = 0.9;
    EXPECT_FALSE(mscan::validate_config(cfg));

    // upscaled crops must stay a sane size
    cfg = mscan::ScannerConfig{};
    cfg.preprocess.max_upscale = 100.0;
    EXPECT_EQ(mscan::validate_config(cfg).kind, ErrorKind::Configuration);

    cfg = mscan::ScannerConfig{};
    cfg.preprocess.min_text_height = 100000;
    EXPECT_EQ(mscan::validate_config(cfg).kind, ErrorKind::Configuration);

    cfg = mscan::ScannerConfig{};
    cfg.motion.similarity_threshold = 0.0;
    EXPECT_EQ(mscan::validate_config(cfg).kind, ErrorKind::Configuration);
}

TEST(RetryPolicy, ExponentialBackoffIsCapped)
{
    mscan::RetryPolicy r;
    r.mode = mscan::BackoffMode::Exponential;
    r.base_ms = 200;
    r.multiplier = 2.0;
    r.max_ms = 1000;
    EXPECT_EQ(r.delay_for(0), 0u);
    EXPECT_EQ(r.delay_for(1), 200u);
    EXPECT_EQ(r.delay_for(2), 400u);
    EXPECT_EQ(r.delay_for(3), 800u);
    EXPECT_EQ(r.delay_for(4), 1000u);
    EXPECT_EQ(r.delay_for(40), 1000u);
}

TEST(RetryPolicy, FixedBackoff)
{
    mscan::RetryPolicy r;
    r.mode = mscan::BackoffMode::Fixed;
    r.base_ms = 300;
    EXPECT_EQ(r.delay_for(1), 300u);
    EXPECT_EQ(r.delay_for(9), 300u);
}
