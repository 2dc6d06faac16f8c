#include <gtest/gtest.h>

#include "mscan/config.hpp"
#include "mscan/motion.hpp"

#include <opencv2/core.hpp>

using mscan::ErrorKind;

namespace
{
    // seeded noise so a shifted crop shares no structure with the original
    cv::Mat noise(int rows, int cols)
    {
        cv::Mat m(rows, cols, CV_8UC3);
        cv::RNG rng(77);
        rng.fill(m, cv::RNG::UNIFORM, 0, 256);
        return m;
    }

    mscan::Frame frame_of(const cv::Mat &m)
    {
        mscan::Frame f;
        f.image = m;
        return f;
    }
}

TEST(FrameSimilarity, IdenticalFramesAreSimilar)
{
    const cv::Mat big = noise(600, 800);
    double sim = 0.0;
    ASSERT_TRUE(mscan::frame_similarity(frame_of(big), frame_of(big.clone()), sim));
    EXPECT_GE(sim, 0.99);
}

TEST(FrameSimilarity, ShiftedPictureIsBelowDefaultThreshold)
{
    const cv::Mat big = noise(700, 900);
    const mscan::Frame before = frame_of(big(cv::Rect(0, 0, 800, 600)).clone());
    const mscan::Frame after = frame_of(big(cv::Rect(60, 40, 800, 600)).clone());
    double sim = 1.0;
    ASSERT_TRUE(mscan::frame_similarity(before, after, sim));
    EXPECT_LT(sim, mscan::MotionParams{}.similarity_threshold);
    EXPECT_LT(sim, 0.5);
}

TEST(FrameSimilarity, FlatPicturesCountAsChanged)
{
    const cv::Mat flat(600, 800, CV_8UC3, cv::Scalar(20, 20, 20));
    double sim = 1.0;
    ASSERT_TRUE(mscan::frame_similarity(frame_of(flat), frame_of(flat.clone()), sim));
    EXPECT_LT(sim, mscan::MotionParams{}.similarity_threshold);
}

TEST(FrameSimilarity, MismatchedOrEmptyFramesAreRejected)
{
    double sim = 0.0;
    EXPECT_EQ(mscan::frame_similarity(frame_of(noise(600, 800)), frame_of(noise(300, 400)), sim).kind,
              ErrorKind::InvalidRegion);
    EXPECT_EQ(mscan::frame_similarity(mscan::Frame{}, frame_of(noise(10, 10)), sim).kind,
              ErrorKind::InvalidRegion);
}
