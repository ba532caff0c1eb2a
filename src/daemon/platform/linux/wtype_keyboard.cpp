#include "platform/linux/wtype_keyboard.hpp"

#include "platform/linux/subprocess.hpp"

#include <string>

namespace {

std::expected<void, std::string> run_wtype(const std::vector<std::string>& argv) {
    auto res = platform::run_process(argv);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code == 127) return std::unexpected("wtype is not installed");
    if (res->exit_code != 0) {
        return std::unexpected("wtype exited with code " + std::to_string(res->exit_code));
    }
    return {};
}

} // namespace

WtypeKeyboard::WtypeKeyboard(uint32_t keystroke_delay_ms)
    : keystroke_delay_ms_(keystroke_delay_ms) {}

InjectionCapability WtypeKeyboard::probe(const FocusedTarget& /*target*/) {
    // Pasting still needs wtype for the shortcut, but a missing binary is
    // reported by paste() with a clearer error than a failed first chunk.
    if (have_wtype_ < 0) have_wtype_ = platform::find_program("wtype") ? 1 : 0;
    return have_wtype_ ? InjectionCapability::DirectTyping : InjectionCapability::PasteOnly;
}

std::expected<void, std::string> WtypeKeyboard::type_text(std::string_view text) {
    return run_wtype({"wtype", "-d", std::to_string(keystroke_delay_ms_), "--", std::string(text)});
}

std::expected<void, std::string> WtypeKeyboard::paste(PasteShortcut shortcut) {
    if (shortcut == PasteShortcut::CtrlShiftV) {
        return run_wtype({"wtype", "-M", "ctrl", "-M", "shift", "-k", "v"});
    }
    return run_wtype({"wtype", "-M", "ctrl", "-k", "v"});
}
