#pragma once

#include "platform/keyboard.hpp"
#include "platform/linux/x11_display.hpp"

#include <cstdint>
#include <mutex>

// Synthetic key events through the XTEST extension. Each code point is
// bound to a spare keycode just before it is sent, so any Unicode character
// can be typed regardless of the active layout.
class XTestKeyboard : public Keyboard {
public:
    explicit XTestKeyboard(uint32_t keystroke_delay_ms);
    ~XTestKeyboard() override;

    bool connect();

    InjectionCapability probe(const FocusedTarget& target) override;
    std::expected<void, std::string> type_text(std::string_view text) override;
    std::expected<void, std::string> paste(PasteShortcut shortcut) override;

private:
    bool send_keysym(unsigned long keysym);
    void tap(unsigned int keycode);
    int find_scratch_keycode();

    uint32_t keystroke_delay_ms_;
    std::mutex mutex_;
    platform::x11::DisplayPtr display_;
    bool have_xtest_ = false;
    int scratch_keycode_ = 0;
};
