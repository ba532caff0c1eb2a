#pragma once

#include "capture/bitmap.hpp"
#include "failure.hpp"

#include <expected>
#include <stop_token>
#include <string>
#include <vector>

class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;
    // Ordered text lines; NoTextFound when nothing clears the confidence floor.
    virtual std::expected<std::vector<std::string>, Failure>
        recognize(const Bitmap& image, std::stop_token stop) = 0;
};

struct RecognizedLine {
    std::string text;
    float confidence = 0.0f; // 0..100
};

// Keeps lines at or above `min_confidence`, trimmed, in order. Blank lines
// are dropped. NoTextFound when nothing is left.
std::expected<std::vector<std::string>, Failure>
select_lines(const std::vector<RecognizedLine>& lines, float min_confidence);
