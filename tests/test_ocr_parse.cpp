#include <gtest/gtest.h>

#include "fakes.hpp"

using fakes::candidate;
using mscan::ErrorKind;

namespace
{
    mscan::OcrResult result_of(std::vector<mscan::OcrCandidate> cands)
    {
        mscan::OcrResult r;
        r.source_region = cv::Rect(100, 100, 200, 40);
        r.candidates = std::move(cands);
        return r;
    }

    struct Engine : mscan::OcrEngine
    {
        Engine() : mscan::OcrEngine(mscan::OcrParams{}) {}
        mscan::Status recognize(const mscan::PreprocessedImage &, mscan::OcrResult &) override
        {
            return mscan::Status::ok();
        }
    };
}

TEST(OcrParse, HighestConfidenceMatchWins)
{
    Engine e;
    std::optional<mscan::Coordinate> c;
    auto st = e.parse_coordinate(result_of({candidate("10, 20", 0.70), candidate("30, 40", 0.90)}), c);
    ASSERT_TRUE(st) << st.to_string();
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->x(), 30);
    EXPECT_EQ(c->y(), 40);
}

TEST(OcrParse, NonMatchingCandidatesAreSkipped)
{
    Engine e;
    std::optional<mscan::Coordinate> c;
    auto st = e.parse_coordinate(result_of({candidate("Lv 30", 0.99), candidate("7, 8", 0.80)}), c);
    ASSERT_TRUE(st);
    EXPECT_EQ(c->x(), 7);
}

TEST(OcrParse, TieBrokenByDistanceToExpectedLocation)
{
    Engine e; // prior is the centre of the source region: (200, 120)
    std::optional<mscan::Coordinate> c;
    auto far = candidate("1, 1", 0.8, cv::Rect(100, 100, 10, 10));
    auto near = candidate("2, 2", 0.8, cv::Rect(190, 110, 20, 20));
    auto st = e.parse_coordinate(result_of({far, near}), c);
    ASSERT_TRUE(st);
    EXPECT_EQ(c->x(), 2);
}

TEST(OcrParse, LowConfidenceMatchIsRejected)
{
    Engine e;
    std::optional<mscan::Coordinate> c;
    auto st = e.parse_coordinate(result_of({candidate("500, 500", 0.30)}), c);
    EXPECT_EQ(st.kind, ErrorKind::LowConfidence);
    EXPECT_FALSE(c.has_value());
}

TEST(OcrParse, NothingMatchingIsParseFailure)
{
    Engine e;
    std::optional<mscan::Coordinate> c;
    auto st = e.parse_coordinate(result_of({candidate("abc", 0.99)}), c);
    EXPECT_EQ(st.kind, ErrorKind::CoordinateParse);
    EXPECT_NE(st.message.find("abc"), std::string::npos);

    st = e.parse_coordinate(result_of({}), c);
    EXPECT_EQ(st.kind, ErrorKind::CoordinateParse);
    EXPECT_EQ(st.message, "no text recognized");
}

TEST(OcrParse, RankingIsStableForEqualCandidates)
{
    auto r = result_of({candidate("a", 0.5), candidate("b", 0.5)});
    auto order = mscan::ranking_order(r, 0.5, 0.5);
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 0u);
    EXPECT_EQ(order[1], 1u);
}
