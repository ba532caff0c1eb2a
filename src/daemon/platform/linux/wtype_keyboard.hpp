#pragma once

#include "platform/keyboard.hpp"

#include <cstdint>

// Synthetic typing through the virtual-keyboard protocol (wtype).
class WtypeKeyboard : public Keyboard {
public:
    explicit WtypeKeyboard(uint32_t keystroke_delay_ms);

    InjectionCapability probe(const FocusedTarget& target) override;
    std::expected<void, std::string> type_text(std::string_view text) override;
    std::expected<void, std::string> paste(PasteShortcut shortcut) override;

private:
    uint32_t keystroke_delay_ms_;
    int have_wtype_ = -1; // unknown until the first probe
};
