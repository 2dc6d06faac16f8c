#pragma once
#include "mscan/log.hpp"
#include "mscan/ocr_engine.hpp"

#include <memory>

namespace tesseract
{
    class TessBaseAPI;
}

namespace mscan
{
    // Tesseract backend: single-line mode, digit/comma whitelist, one candidate per
    // recognized text line plus the whole-page string.
    class TesseractOcrEngine : public OcrEngine
    {
    public:
        TesseractOcrEngine(const OcrParams &params, log::Logger &log);
        ~TesseractOcrEngine() override;

        TesseractOcrEngine(const TesseractOcrEngine &) = delete;
        TesseractOcrEngine &operator=(const TesseractOcrEngine &) = delete;

        Status recognize(const PreprocessedImage &image, OcrResult &out) override;

    private:
        Status ensure_ready();

        log::Logger &log_;
        std::unique_ptr<tesseract::TessBaseAPI> api_;
        bool ready_{false};
    };
}
