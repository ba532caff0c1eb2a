#pragma once

#include "hotkey/hotkey_binding.hpp"
#include "hotkey/hotkey_event.hpp"

#include <expected>
#include <string>
#include <vector>

struct HotkeyPress {
    HotkeyKind kind;
    std::string focused_window; // empty if the source cannot tell
};

class HotkeySource {
public:
    virtual ~HotkeySource() = default;
    virtual std::expected<void, std::string> register_bindings(const HotkeyBindings& bindings) = 0;
    virtual void unregister_bindings() = 0;
    // -1 when presses are delivered through the control socket instead.
    virtual int event_fd() const = 0;
    virtual std::vector<HotkeyPress> read_presses() = 0;
};
