#pragma once

#include "capture/conversation_context.hpp"
#include "failure.hpp"
#include "ocr/text_recognizer.hpp"
#include "platform/accessibility.hpp"
#include "platform/screen_capture.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

// One step of the extraction fallback chain.
class ContextProvider {
public:
    virtual ~ContextProvider() = default;
    virtual CaptureMethod method() const = 0;
    virtual std::string_view name() const = 0;
    virtual std::expected<std::vector<std::string>, Failure>
        capture(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) = 0;
};

class AccessibilityProvider : public ContextProvider {
public:
    AccessibilityProvider(Accessibility& accessibility, size_t min_text_chars);

    CaptureMethod method() const override { return CaptureMethod::Accessibility; }
    std::string_view name() const override { return "accessibility"; }
    std::expected<std::vector<std::string>, Failure>
        capture(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) override;

private:
    Accessibility& accessibility_;
    size_t min_text_chars_;
};

class ScreenshotOcrProvider : public ContextProvider {
public:
    ScreenshotOcrProvider(ScreenCapture& screen, TextRecognizer& ocr,
                          std::chrono::milliseconds capture_timeout);

    CaptureMethod method() const override { return CaptureMethod::Ocr; }
    std::string_view name() const override { return "screenshot+ocr"; }
    std::expected<std::vector<std::string>, Failure>
        capture(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) override;

private:
    ScreenCapture& screen_;
    TextRecognizer& ocr_;
    std::chrono::milliseconds capture_timeout_;
};
