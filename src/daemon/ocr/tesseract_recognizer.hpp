#pragma once

#include "ocr/text_recognizer.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace tesseract {
class TessBaseAPI;
}

class TesseractRecognizer : public TextRecognizer {
public:
    TesseractRecognizer(std::string language, std::string datapath, float min_confidence);
    ~TesseractRecognizer() override;

    TesseractRecognizer(const TesseractRecognizer&) = delete;
    TesseractRecognizer& operator=(const TesseractRecognizer&) = delete;

    // Loads the language data. Fails when traineddata for the language is missing.
    bool init();

    std::expected<std::vector<std::string>, Failure>
        recognize(const Bitmap& image, std::stop_token stop) override;

private:
    std::string language_;
    std::string datapath_;
    float min_confidence_;

    std::mutex mutex_;
    std::unique_ptr<tesseract::TessBaseAPI> api_;
};
