#include "hotkey/hotkey_binding.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> split_plus(std::string_view text) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        auto pos = text.find('+', start);
        if (pos == std::string_view::npos) pos = text.size();
        auto part = text.substr(start, pos - start);
        auto b = part.find_first_not_of(" \t");
        auto e = part.find_last_not_of(" \t");
        parts.emplace_back(b == std::string_view::npos ? std::string_view{} : part.substr(b, e - b + 1));
        start = pos + 1;
    }
    return parts;
}

} // namespace

std::expected<HotkeyBinding, std::string> HotkeyBinding::parse(std::string_view text) {
    auto parts = split_plus(text);
    if (parts.empty() || parts.back().empty()) {
        return std::unexpected("hotkey '" + std::string(text) + "' has no key");
    }

    HotkeyBinding binding;
    for (size_t i = 0; i + 1 < parts.size(); i++) {
        auto mod = lower(parts[i]);
        if (mod == "ctrl" || mod == "control") {
            binding.modifiers |= Ctrl;
        } else if (mod == "shift") {
            binding.modifiers |= Shift;
        } else if (mod == "alt" || mod == "mod1" || mod == "option") {
            binding.modifiers |= Alt;
        } else if (mod == "super" || mod == "mod4" || mod == "cmd" || mod == "logo") {
            binding.modifiers |= Super;
        } else {
            return std::unexpected("hotkey '" + std::string(text) + "': unknown modifier '" + parts[i] + "'");
        }
    }

    binding.key = lower(parts.back());
    if (binding.modifiers == 0) {
        return std::unexpected("hotkey '" + std::string(text) + "' needs at least one modifier");
    }
    return binding;
}

std::string HotkeyBinding::to_sway() const {
    std::string out;
    if (modifiers & Super) out += "Mod4+";
    if (modifiers & Ctrl) out += "Ctrl+";
    if (modifiers & Alt) out += "Mod1+";
    if (modifiers & Shift) out += "Shift+";
    return out + key;
}

std::string HotkeyBinding::to_string() const {
    std::string out;
    if (modifiers & Super) out += "super+";
    if (modifiers & Ctrl) out += "ctrl+";
    if (modifiers & Alt) out += "alt+";
    if (modifiers & Shift) out += "shift+";
    return out + key;
}
