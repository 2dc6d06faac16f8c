#pragma once
#include "mscan/config.hpp"
#include "mscan/coordinate.hpp"
#include "mscan/status.hpp"
#include "mscan/types.hpp"

#include <optional>

namespace mscan
{
    // Text recognition backend. Implementations are picked when the scanner is built.
    class OcrEngine
    {
    public:
        explicit OcrEngine(const OcrParams &params) : params_(params) {}
        virtual ~OcrEngine() = default;

        // RecognitionUnavailable if the backend cannot initialize or run.
        virtual Status recognize(const PreprocessedImage &image, OcrResult &out) = 0;

        // CoordinateParse if no candidate matches the readout grammar,
        // LowConfidence if the selected match is below params.min_confidence.
        virtual Status parse_coordinate(const OcrResult &result, std::optional<Coordinate> &out) const;

        const OcrParams &params() const { return params_; }

    protected:
        OcrParams params_;
    };

    // Index into result.candidates in parsing order: confidence descending, ties
    // broken by distance from the bounding-box centre to the expected readout location.
    std::vector<std::size_t> ranking_order(const OcrResult &result, double priorX, double priorY);
}
