#pragma once

#include "platform/hotkey_source.hpp"
#include "platform/linux/sway_ipc.hpp"

#include <memory>
#include <string>
#include <vector>

// Global shortcuts through sway bindings. Each binding runs the control
// client, so presses arrive over the control socket rather than an fd.
class SwayHotkeys : public HotkeySource {
public:
    SwayHotkeys(std::shared_ptr<SwayIpc> sway, std::string trigger_command);
    ~SwayHotkeys() override;

    std::expected<void, std::string> register_bindings(const HotkeyBindings& bindings) override;
    void unregister_bindings() override;
    int event_fd() const override { return -1; }
    std::vector<HotkeyPress> read_presses() override { return {}; }

    static std::string bind_command(const HotkeyBinding& binding, const std::string& trigger_command,
                                    HotkeyKind kind);

private:
    std::shared_ptr<SwayIpc> sway_;
    std::string trigger_command_;
    std::vector<std::string> bound_; // combos to unbind on shutdown
};
