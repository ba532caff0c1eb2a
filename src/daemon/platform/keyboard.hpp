#pragma once

#include "capture/focused_target.hpp"

#include <expected>
#include <string>
#include <string_view>

enum class InjectionCapability { DirectTyping, PasteOnly };

enum class PasteShortcut { CtrlV, CtrlShiftV };

class Keyboard {
public:
    virtual ~Keyboard() = default;
    virtual InjectionCapability probe(const FocusedTarget& target) = 0;
    // `text` always holds whole UTF-8 code points.
    virtual std::expected<void, std::string> type_text(std::string_view text) = 0;
    virtual std::expected<void, std::string> paste(PasteShortcut shortcut) = 0;
};
