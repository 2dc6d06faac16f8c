#include "mscan/tesseract_engine.hpp"
#include "mscan/text.hpp"

#include <tesseract/resultiterator.h>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>

namespace mscan
{
    namespace
    {
        struct TextDeleter
        {
            void operator()(char *p) const { delete[] p; }
        };
        using TextPtr = std::unique_ptr<char, TextDeleter>;
    } // namespace

    TesseractOcrEngine::TesseractOcrEngine(const OcrParams &params, log::Logger &log)
        : OcrEngine(params), log_(log), api_(std::make_unique<tesseract::TessBaseAPI>())
    {
    }

    TesseractOcrEngine::~TesseractOcrEngine()
    {
        if (api_ && ready_)
            api_->End();
    }

    Status TesseractOcrEngine::ensure_ready()
    {
        if (ready_)
            return Status::ok();

        const char *datapath = params_.datapath.empty() ? nullptr : params_.datapath.c_str();
        if (api_->Init(datapath, params_.language.c_str(), tesseract::OEM_LSTM_ONLY) != 0)
        {
            return Status::fail(ErrorKind::RecognitionUnavailable,
                                "could not initialize tesseract (language '" + params_.language + "')");
        }
        api_->SetPageSegMode(static_cast<tesseract::PageSegMode>(params_.page_seg_mode));
        if (!params_.whitelist.empty())
            api_->SetVariable("tessedit_char_whitelist", params_.whitelist.c_str());

        log_.i(std::string("Tesseract OCR version: ") + api_->Version());
        ready_ = true;
        return Status::ok();
    }

    Status TesseractOcrEngine::recognize(const PreprocessedImage &image, OcrResult &out)
    {
        out.candidates.clear();
        out.source_region = image.source_region;

        Status st = ensure_ready();
        if (!st)
            return st;

        if (image.gray.empty() || image.gray.type() != CV_8UC1)
            return Status::fail(ErrorKind::RecognitionUnavailable, "expected a non-empty 8-bit gray image");

        api_->SetImage(image.gray.data, image.gray.cols, image.gray.rows, 1, (int)image.gray.step);
        if (api_->Recognize(nullptr) != 0)
        {
            api_->Clear();
            return Status::fail(ErrorKind::RecognitionUnavailable, "tesseract recognition failed");
        }

        const tesseract::PageIteratorLevel level = tesseract::RIL_TEXTLINE;
        std::unique_ptr<tesseract::ResultIterator> it(api_->GetIterator());
        if (it)
        {
            do
            {
                TextPtr text(it->GetUTF8Text(level));
                const std::string t = trim(text ? text.get() : "");
                if (t.empty())
                    continue;

                int x1 = 0, y1 = 0, x2 = 0, y2 = 0;
                it->BoundingBox(level, &x1, &y1, &x2, &y2);

                OcrCandidate c;
                c.text = t;
                c.confidence = it->Confidence(level) / 100.0;
                c.bounds = image.to_frame(cv::Rect(x1, y1, x2 - x1, y2 - y1));
                out.candidates.push_back(c);
            } while (it->Next(level));
        }

        // whole-page string last; it only matters when the line split went wrong
        TextPtr all(api_->GetUTF8Text());
        const std::string whole = trim(all ? all.get() : "");
        if (!whole.empty() && (out.candidates.empty() || out.candidates.front().text != whole))
        {
            OcrCandidate c;
            c.text = whole;
            c.confidence = api_->MeanTextConf() / 100.0;
            c.bounds = image.source_region;
            out.candidates.push_back(c);
        }

        api_->Clear();
        log_.d("ocr: " + std::to_string(out.candidates.size()) + " candidate(s)");
        return Status::ok();
    }
}
