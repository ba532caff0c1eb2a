#pragma once

#include "capture/focused_target.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

enum class CaptureMethod { Accessibility, Ocr };

inline std::string_view capture_method_name(CaptureMethod method) {
    return method == CaptureMethod::Ocr ? "ocr" : "accessibility";
}

struct TextFragment {
    std::string text;
    CaptureMethod source = CaptureMethod::Accessibility;
};

struct ConversationContext {
    std::vector<TextFragment> fragments;
    FocusedTarget target;
    CaptureMethod method = CaptureMethod::Accessibility;
    CaptureScope scope = CaptureScope::FocusedControl;
    std::chrono::milliseconds elapsed{0};

    std::string joined_text(std::string_view separator = "\n") const {
        std::string out;
        for (size_t i = 0; i < fragments.size(); i++) {
            if (i > 0) out += separator;
            out += fragments[i].text;
        }
        return out;
    }
};
