#include "platform/linux/sway_hotkeys.hpp"

#include <format>
#include <print>

SwayHotkeys::SwayHotkeys(std::shared_ptr<SwayIpc> sway, std::string trigger_command)
    : sway_(std::move(sway)), trigger_command_(std::move(trigger_command)) {}

SwayHotkeys::~SwayHotkeys() {
    unregister_bindings();
}

std::string SwayHotkeys::bind_command(const HotkeyBinding& binding, const std::string& trigger_command,
                                      HotkeyKind kind) {
    return std::format("bindsym --no-repeat {} exec {} --hotkey {}",
                       binding.to_sway(), trigger_command, hotkey_kind_name(kind));
}

std::expected<void, std::string> SwayHotkeys::register_bindings(const HotkeyBindings& bindings) {
    for (auto [binding, kind] : {std::pair{&bindings.quick, HotkeyKind::Quick},
                                 std::pair{&bindings.deep, HotkeyKind::DeepScan}}) {
        auto res = sway_->run_command(bind_command(*binding, trigger_command_, kind));
        if (!res) {
            unregister_bindings();
            return std::unexpected(std::format("sway refused {}: {}", binding->to_string(), res.error()));
        }
        bound_.push_back(binding->to_sway());
    }
    return {};
}

void SwayHotkeys::unregister_bindings() {
    for (auto& combo : bound_) {
        auto res = sway_->run_command("unbindsym " + combo);
        if (!res) {
            std::println(stderr, "sway: unbindsym {} failed: {}", combo, res.error());
        }
    }
    bound_.clear();
}
