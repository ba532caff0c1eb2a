#include "platform/linux/xtest_keyboard.hpp"

#include "utf8.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/XTest.h>
#include <X11/keysym.h>
#include <chrono>
#include <format>
#include <print>
#include <thread>

namespace {

KeySym keysym_for(char32_t cp) {
    switch (cp) {
        case '\n': return XK_Return;
        case '\t': return XK_Tab;
        case '\b': return XK_BackSpace;
    }
    // Latin-1 keysyms coincide with their code points.
    if ((cp >= 0x20 && cp <= 0x7E) || (cp >= 0xA0 && cp <= 0xFF)) return cp;
    return 0x01000000 | cp;
}

} // namespace

XTestKeyboard::XTestKeyboard(uint32_t keystroke_delay_ms)
    : keystroke_delay_ms_(keystroke_delay_ms) {}

XTestKeyboard::~XTestKeyboard() {
    if (display_ && scratch_keycode_ != 0) {
        KeySym none = NoSymbol;
        XChangeKeyboardMapping(display_.get(), scratch_keycode_, 1, &none, 1);
        XSync(display_.get(), False);
    }
}

bool XTestKeyboard::connect() {
    display_ = platform::x11::open_display();
    if (!display_) return false;

    int event_base, error_base, major, minor;
    have_xtest_ = XTestQueryExtension(display_.get(), &event_base, &error_base, &major, &minor);
    if (!have_xtest_) {
        std::println(stderr, "x11: XTEST extension missing, replies will be pasted");
        return true;
    }
    scratch_keycode_ = find_scratch_keycode();
    return true;
}

int XTestKeyboard::find_scratch_keycode() {
    Display* dpy = display_.get();
    int min_code = 0;
    int max_code = 0;
    XDisplayKeycodes(dpy, &min_code, &max_code);

    int per_code = 0;
    KeySym* map = XGetKeyboardMapping(dpy, min_code, max_code - min_code + 1, &per_code);
    if (!map) return 0;

    int found = 0;
    for (int code = max_code; code >= min_code && found == 0; code--) {
        bool unused = true;
        for (int i = 0; i < per_code; i++) {
            if (map[(code - min_code) * per_code + i] != NoSymbol) {
                unused = false;
                break;
            }
        }
        if (unused) found = code;
    }
    XFree(map);
    return found;
}

InjectionCapability XTestKeyboard::probe(const FocusedTarget& /*target*/) {
    std::lock_guard lock(mutex_);
    if (!display_ || !have_xtest_ || scratch_keycode_ == 0) return InjectionCapability::PasteOnly;
    return InjectionCapability::DirectTyping;
}

void XTestKeyboard::tap(unsigned int keycode) {
    XTestFakeKeyEvent(display_.get(), keycode, True, CurrentTime);
    XTestFakeKeyEvent(display_.get(), keycode, False, CurrentTime);
    XSync(display_.get(), False);
}

bool XTestKeyboard::send_keysym(unsigned long keysym) {
    Display* dpy = display_.get();

    // Control keys keep their real keycodes so applications see them normally.
    if (keysym == XK_Return || keysym == XK_Tab || keysym == XK_BackSpace) {
        KeyCode code = XKeysymToKeycode(dpy, keysym);
        if (code == 0) return false;
        tap(code);
        return true;
    }

    KeySym sym = keysym;
    XChangeKeyboardMapping(dpy, scratch_keycode_, 1, &sym, 1);
    XSync(dpy, False);
    tap(static_cast<unsigned int>(scratch_keycode_));
    return true;
}

std::expected<void, std::string> XTestKeyboard::type_text(std::string_view text) {
    std::lock_guard lock(mutex_);
    if (!display_ || !have_xtest_ || scratch_keycode_ == 0) {
        return std::unexpected("XTEST typing unavailable");
    }

    auto delay = std::chrono::milliseconds(keystroke_delay_ms_);
    size_t pos = 0;
    while (pos < text.size()) {
        auto cp = utf8::next(text, pos);
        if (!send_keysym(keysym_for(cp.value))) {
            return std::unexpected("no keycode for U+" + std::format("{:04X}", static_cast<uint32_t>(cp.value)));
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
    }
    return {};
}

std::expected<void, std::string> XTestKeyboard::paste(PasteShortcut shortcut) {
    std::lock_guard lock(mutex_);
    if (!display_ || !have_xtest_) return std::unexpected("XTEST unavailable");

    Display* dpy = display_.get();
    KeyCode ctrl = XKeysymToKeycode(dpy, XK_Control_L);
    KeyCode shift = XKeysymToKeycode(dpy, XK_Shift_L);
    KeyCode v = XKeysymToKeycode(dpy, XK_v);
    if (ctrl == 0 || v == 0) return std::unexpected("no keycode for Ctrl+V");

    bool with_shift = shortcut == PasteShortcut::CtrlShiftV && shift != 0;
    XTestFakeKeyEvent(dpy, ctrl, True, CurrentTime);
    if (with_shift) XTestFakeKeyEvent(dpy, shift, True, CurrentTime);
    XTestFakeKeyEvent(dpy, v, True, CurrentTime);
    XTestFakeKeyEvent(dpy, v, False, CurrentTime);
    if (with_shift) XTestFakeKeyEvent(dpy, shift, False, CurrentTime);
    XTestFakeKeyEvent(dpy, ctrl, False, CurrentTime);
    XSync(dpy, False);
    return {};
}
