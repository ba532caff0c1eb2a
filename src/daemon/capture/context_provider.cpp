#include "capture/context_provider.hpp"

#include "capture/text_filter.hpp"
#include "utf8.hpp"

#include <format>

AccessibilityProvider::AccessibilityProvider(Accessibility& accessibility, size_t min_text_chars)
    : accessibility_(accessibility), min_text_chars_(min_text_chars) {}

std::expected<std::vector<std::string>, Failure>
AccessibilityProvider::capture(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) {
    auto raw = accessibility_.read_text(target, scope, stop);
    if (!raw) return raw;

    auto lines = filter_transcript(*raw);
    size_t chars = 0;
    for (auto& line : lines) chars += utf8::length(line);

    // Too little text usually means the tree only exposed chrome and labels.
    if (chars < min_text_chars_) {
        return std::unexpected(Failure{
            ErrorKind::Unsupported,
            std::format("only {} characters readable from {}", chars, target.process_name)});
    }
    return lines;
}

ScreenshotOcrProvider::ScreenshotOcrProvider(ScreenCapture& screen, TextRecognizer& ocr,
                                             std::chrono::milliseconds capture_timeout)
    : screen_(screen), ocr_(ocr), capture_timeout_(capture_timeout) {}

std::expected<std::vector<std::string>, Failure>
ScreenshotOcrProvider::capture(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) {
    auto region = target.capture_region(scope);
    if (region.empty()) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "focused window has no visible area"});
    }

    auto image = screen_.capture(region, capture_timeout_, stop);
    if (!image) return std::unexpected(image.error());

    if (stop.stop_requested()) {
        return std::unexpected(Failure{ErrorKind::Cancelled, "capture cancelled"});
    }

    auto lines = ocr_.recognize(*image, stop);
    if (!lines) return lines;

    auto kept = filter_transcript(*lines);
    if (kept.empty()) {
        return std::unexpected(Failure{ErrorKind::NoTextFound, "screenshot held only interface labels"});
    }
    return kept;
}
