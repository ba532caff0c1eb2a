#include "ocr/tesseract_recognizer.hpp"

#include <format>
#include <print>
#include <tesseract/baseapi.h>
#include <tesseract/ocrclass.h>
#include <tesseract/resultiterator.h>

namespace {

struct CancelState {
    std::stop_token stop;
};

bool cancel_requested(void* cancel_this, int /*words*/) {
    return static_cast<CancelState*>(cancel_this)->stop.stop_requested();
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

std::expected<std::vector<std::string>, Failure>
select_lines(const std::vector<RecognizedLine>& lines, float min_confidence) {
    std::vector<std::string> kept;
    for (const auto& line : lines) {
        if (line.confidence < min_confidence) continue;
        auto text = trim(line.text);
        if (!text.empty()) kept.push_back(std::move(text));
    }
    if (kept.empty()) {
        return std::unexpected(Failure{ErrorKind::NoTextFound, "no legible text in screenshot"});
    }
    return kept;
}

TesseractRecognizer::TesseractRecognizer(std::string language, std::string datapath,
                                         float min_confidence)
    : language_(std::move(language))
    , datapath_(std::move(datapath))
    , min_confidence_(min_confidence) {}

TesseractRecognizer::~TesseractRecognizer() {
    if (api_) api_->End();
}

bool TesseractRecognizer::init() {
    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const char* datapath = datapath_.empty() ? nullptr : datapath_.c_str();
    if (api->Init(datapath, language_.c_str()) != 0) {
        std::println(stderr, "ocr: failed to load tesseract language '{}'", language_);
        return false;
    }
    api->SetPageSegMode(tesseract::PSM_AUTO);
    api_ = std::move(api);
    return true;
}

std::expected<std::vector<std::string>, Failure>
TesseractRecognizer::recognize(const Bitmap& image, std::stop_token stop) {
    if (!api_) {
        return std::unexpected(Failure{ErrorKind::Unsupported, "ocr engine not initialized"});
    }
    if (image.empty()) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "empty screenshot"});
    }

    auto pix = to_pix(image);
    if (!pix) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "could not convert screenshot"});
    }

    std::lock_guard lock(mutex_);
    api_->SetImage(pix.get());

    CancelState cancel{stop};
    ETEXT_DESC monitor;
    monitor.cancel = cancel_requested;
    monitor.cancel_this = &cancel;

    int rc = api_->Recognize(&monitor);
    if (stop.stop_requested()) {
        api_->Clear();
        return std::unexpected(Failure{ErrorKind::Cancelled, "ocr cancelled"});
    }
    if (rc != 0) {
        api_->Clear();
        return std::unexpected(Failure{ErrorKind::CaptureFailed,
                                       std::format("tesseract recognition failed ({})", rc)});
    }

    std::vector<RecognizedLine> lines;
    std::unique_ptr<tesseract::ResultIterator> it(api_->GetIterator());
    if (it) {
        constexpr auto level = tesseract::RIL_TEXTLINE;
        do {
            if (it->Empty(level)) continue;
            char* raw = it->GetUTF8Text(level);
            if (!raw) continue;
            lines.push_back({raw, it->Confidence(level)});
            delete[] raw;
        } while (it->Next(level));
    }
    it.reset();
    api_->Clear();

    return select_lines(lines, min_confidence_);
}
