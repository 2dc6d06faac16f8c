#include <gtest/gtest.h>

#include "mscan/safety.hpp"

using mscan::ErrorKind;

namespace
{
    mscan::Coordinate at(int x, int y) { return *mscan::Coordinate::from_text(std::to_string(x) + "," + std::to_string(y), 1.0); }
}

class SafetyTest : public ::testing::Test
{
protected:
    mscan::log::Logger log;
    mscan::SafetyGuard guard{log};
    mscan::SafetyBounds bounds;
};

TEST_F(SafetyTest, CoordinateRange)
{
    bounds.min_x = 0;
    bounds.max_x = 2000;
    bounds.min_y = 0;
    bounds.max_y = 2000;
    EXPECT_TRUE(guard.check_coordinate(at(0, 2000), bounds));
    auto st = guard.check_coordinate(at(10000, 10000), bounds);
    EXPECT_EQ(st.kind, ErrorKind::SafetyViolation);
    EXPECT_NE(st.message.find("outside allowed range"), std::string::npos);
    EXPECT_FALSE(guard.check_coordinate(at(-1, 5), bounds));
}

TEST_F(SafetyTest, MovementMagnitude)
{
    bounds.max_delta_per_move = 100.0;
    mscan::MovementPlan p;
    p.dx = 60;
    p.dy = 80;
    EXPECT_TRUE(guard.check_movement(p, bounds));
    p.dy = 81;
    EXPECT_EQ(guard.check_movement(p, bounds).kind, ErrorKind::SafetyViolation);
}

TEST_F(SafetyTest, FailureLimitIsExclusive)
{
    bounds.max_consecutive_failures = 3;
    EXPECT_TRUE(guard.check_failures(3, bounds, "extraction"));
    auto st = guard.check_failures(4, bounds, "extraction");
    EXPECT_EQ(st.kind, ErrorKind::SafetyViolation);
    EXPECT_EQ(st.message, "extraction failure limit exceeded");
}

TEST_F(SafetyTest, SessionTime)
{
    bounds.max_session_ms = 1000;
    EXPECT_TRUE(guard.check_elapsed(1000, bounds));
    EXPECT_FALSE(guard.check_elapsed(1001, bounds));
}

TEST_F(SafetyTest, WindowRegionMustNotChange)
{
    EXPECT_TRUE(guard.check_window_region(cv::Rect(0, 0, 800, 600), cv::Rect(0, 0, 800, 600)));
    EXPECT_EQ(guard.check_window_region(cv::Rect(0, 0, 800, 600), cv::Rect(10, 0, 800, 600)).kind,
              ErrorKind::SafetyViolation);
}
