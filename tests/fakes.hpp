#pragma once
#include "mscan/ocr_engine.hpp"
#include "mscan/platform.hpp"

#include <opencv2/core.hpp>

#include <cstdio>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// In-memory collaborators for driving MapScanner without a display.
namespace fakes
{
    class FakeClock : public mscan::Clock
    {
    public:
        std::uint64_t now_ms() const override { return now; }
        void sleep_ms(std::uint64_t ms) override
        {
            now += ms;
            slept += ms;
        }

        std::uint64_t now{0};
        std::uint64_t slept{0};
    };

    class FakeWindowManager : public mscan::WindowManager
    {
    public:
        mscan::Status find_window(const std::string &, mscan::WindowHandle &out) override
        {
            ++findCalls;
            if (!present)
                return mscan::Status::fail(mscan::ErrorKind::WindowNotFound, "no window");
            out = handle;
            return mscan::Status::ok();
        }
        mscan::Status get_region(mscan::WindowHandle, cv::Rect &out) override
        {
            out = region;
            return mscan::Status::ok();
        }
        bool is_valid(mscan::WindowHandle) override { return valid; }

        bool present{true};
        bool valid{true};
        mscan::WindowHandle handle{42};
        cv::Rect region{0, 0, 800, 600};
        int findCalls{0};
    };

    // Camera over an unbounded map; the readout shows the camera position.
    struct SimulatedMap
    {
        int x{0};
        int y{0};
        int pixelsPerUnit{1};
        bool frozen{false}; // drags have no effect
    };

    // Plain black frame of the window size; `failures` leading captures fail.
    // With `map` set, the frame is a crop of a fixed noise texture that scrolls
    // with the simulated camera, so a drag changes the picture.
    class FakeCapture : public mscan::ScreenCapture
    {
    public:
        mscan::Status capture(mscan::WindowHandle, const cv::Rect &region, mscan::Frame &out) override
        {
            ++calls;
            if (alwaysFail || calls <= failures)
                return mscan::Status::fail(mscan::ErrorKind::Capture, "scripted capture failure");
            if (!map)
            {
                out.image = cv::Mat(region.height, region.width, CV_8UC3, cv::Scalar(0, 0, 0));
                return mscan::Status::ok();
            }
            if (texture_.rows != region.height + kPeriod || texture_.cols != region.width + kPeriod)
            {
                texture_.create(region.height + kPeriod, region.width + kPeriod, CV_8UC3);
                cv::RNG rng(1234);
                rng.fill(texture_, cv::RNG::UNIFORM, 0, 256);
            }
            const int ox = ((map->x % kPeriod) + kPeriod) % kPeriod;
            const int oy = ((map->y % kPeriod) + kPeriod) % kPeriod;
            out.image = texture_(cv::Rect(ox, oy, region.width, region.height)).clone();
            return mscan::Status::ok();
        }

        const SimulatedMap *map{nullptr};
        bool alwaysFail{false};
        int failures{0};
        int calls{0};

    private:
        static constexpr int kPeriod = 512; // wider than any allowed drag
        cv::Mat texture_;
    };

    class SimulatedMouse : public mscan::MouseController
    {
    public:
        explicit SimulatedMouse(SimulatedMap &map) : map_(map) {}

        mscan::Status move_by(int dx, int dy) override
        {
            moves.emplace_back(dx, dy);
            if (fail)
                return mscan::Status::fail(mscan::ErrorKind::Input, "scripted input failure");
            if (!map_.frozen)
            {
                map_.x += dx / map_.pixelsPerUnit;
                map_.y += dy / map_.pixelsPerUnit;
            }
            return mscan::Status::ok();
        }

        std::vector<std::pair<int, int>> moves;
        bool fail{false};

    private:
        SimulatedMap &map_;
    };

    // OCR whose candidates come from a callback; the call index is passed in.
    class FakeOcr : public mscan::OcrEngine
    {
    public:
        using Producer = std::function<std::vector<mscan::OcrCandidate>(int call)>;

        FakeOcr(const mscan::OcrParams &params, Producer producer)
            : mscan::OcrEngine(params), producer_(std::move(producer)) {}

        mscan::Status recognize(const mscan::PreprocessedImage &image, mscan::OcrResult &out) override
        {
            ++calls;
            if (unavailable)
                return mscan::Status::fail(mscan::ErrorKind::RecognitionUnavailable, "engine offline");
            out.source_region = image.source_region;
            out.candidates = producer_(calls);
            for (auto &c : out.candidates)
                if (c.bounds.area() == 0)
                    c.bounds = image.source_region;
            return mscan::Status::ok();
        }

        int calls{0};
        bool unavailable{false};

    private:
        Producer producer_;
    };

    inline mscan::OcrCandidate candidate(const std::string &text, double confidence,
                                         cv::Rect bounds = cv::Rect())
    {
        mscan::OcrCandidate c;
        c.text = text;
        c.confidence = confidence;
        c.bounds = bounds;
        return c;
    }

    // Readout of the simulated camera, as the game would print it.
    inline FakeOcr::Producer readout_of(const SimulatedMap &map, double confidence = 0.95)
    {
        return [&map, confidence](int)
        {
            char buf[48];
            std::snprintf(buf, sizeof(buf), "%d, %d", map.x, map.y);
            return std::vector<mscan::OcrCandidate>{candidate(buf, confidence)};
        };
    }

    inline FakeOcr::Producer constant_text(const std::string &text, double confidence)
    {
        return [text, confidence](int)
        { return std::vector<mscan::OcrCandidate>{candidate(text, confidence)}; };
    }
}
