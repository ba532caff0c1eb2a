#include "platform/linux/x11_hotkeys.hpp"

#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <cctype>
#include <format>

namespace {

// NumLock (Mod2) and CapsLock must not stop a binding from firing.
constexpr unsigned int LOCK_VARIANTS[] = {0, LockMask, Mod2Mask, LockMask | Mod2Mask};

constexpr unsigned int RELEVANT_MODIFIERS = ShiftMask | ControlMask | Mod1Mask | Mod4Mask;

KeySym lookup_keysym(const std::string& key) {
    // Config names are lowercase; X keysym names are case-sensitive
    // ("r", "F12", "Return").
    KeySym sym = XStringToKeysym(key.c_str());
    if (sym != NoSymbol) return sym;

    std::string capitalized = key;
    capitalized[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(capitalized[0])));
    sym = XStringToKeysym(capitalized.c_str());
    if (sym != NoSymbol) return sym;

    std::string upper = key;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return XStringToKeysym(upper.c_str());
}

} // namespace

X11Hotkeys::~X11Hotkeys() {
    unregister_bindings();
}

bool X11Hotkeys::connect() {
    display_ = platform::x11::open_display();
    return display_ != nullptr;
}

int X11Hotkeys::event_fd() const {
    return display_ ? ConnectionNumber(display_.get()) : -1;
}

unsigned int X11Hotkeys::modifier_mask(const HotkeyBinding& binding) {
    unsigned int mask = 0;
    if (binding.modifiers & HotkeyBinding::Ctrl) mask |= ControlMask;
    if (binding.modifiers & HotkeyBinding::Shift) mask |= ShiftMask;
    if (binding.modifiers & HotkeyBinding::Alt) mask |= Mod1Mask;
    if (binding.modifiers & HotkeyBinding::Super) mask |= Mod4Mask;
    return mask;
}

std::expected<X11Hotkeys::Grab, std::string> X11Hotkeys::grab(const HotkeyBinding& binding,
                                                              HotkeyKind kind) {
    Display* dpy = display_.get();
    KeySym sym = lookup_keysym(binding.key);
    if (sym == NoSymbol) return std::unexpected(std::format("unknown key '{}'", binding.key));

    KeyCode code = XKeysymToKeycode(dpy, sym);
    if (code == 0) return std::unexpected(std::format("key '{}' is not on this keyboard", binding.key));

    Grab g{kind, code, modifier_mask(binding)};
    Window root = DefaultRootWindow(dpy);
    int err = platform::x11::trap_errors(dpy, [&] {
        for (unsigned int lock : LOCK_VARIANTS) {
            XGrabKey(dpy, g.keycode, g.modifiers | lock, root, False, GrabModeAsync, GrabModeAsync);
        }
    });
    if (err == BadAccess) {
        ungrab(g);
        return std::unexpected(std::format("{} is already grabbed by another application",
                                           binding.to_string()));
    }
    if (err != 0) {
        ungrab(g);
        return std::unexpected(std::format("XGrabKey failed for {} ({})", binding.to_string(), err));
    }
    return g;
}

void X11Hotkeys::ungrab(const Grab& g) {
    Display* dpy = display_.get();
    Window root = DefaultRootWindow(dpy);
    platform::x11::trap_errors(dpy, [&] {
        for (unsigned int lock : LOCK_VARIANTS) {
            XUngrabKey(dpy, g.keycode, g.modifiers | lock, root);
        }
    });
}

std::expected<void, std::string> X11Hotkeys::register_bindings(const HotkeyBindings& bindings) {
    if (!display_) return std::unexpected("no X display");

    for (auto [binding, kind] : {std::pair{&bindings.quick, HotkeyKind::Quick},
                                 std::pair{&bindings.deep, HotkeyKind::DeepScan}}) {
        auto g = grab(*binding, kind);
        if (!g) {
            unregister_bindings();
            return std::unexpected(g.error());
        }
        grabs_.push_back(*g);
    }
    XFlush(display_.get());
    return {};
}

void X11Hotkeys::unregister_bindings() {
    if (!display_) return;
    for (auto& g : grabs_) ungrab(g);
    grabs_.clear();
}

std::vector<HotkeyPress> X11Hotkeys::read_presses() {
    std::vector<HotkeyPress> presses;
    if (!display_) return presses;

    Display* dpy = display_.get();
    while (XPending(dpy) > 0) {
        XEvent ev;
        XNextEvent(dpy, &ev);
        if (ev.type != KeyPress) continue;

        unsigned int state = ev.xkey.state & RELEVANT_MODIFIERS;
        for (auto& g : grabs_) {
            if (g.keycode == ev.xkey.keycode && g.modifiers == state) {
                presses.push_back({g.kind, {}});
                break;
            }
        }
    }
    return presses;
}
