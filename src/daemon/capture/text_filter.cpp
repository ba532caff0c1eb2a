#include "capture/text_filter.hpp"

#include "utf8.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>
#include <unordered_set>

namespace {

constexpr std::string_view UI_NOISE[] = {
    "close", "minimize", "maximize", "restore", "zoom", "back", "forward",
    "send", "attach", "emoji", "search", "menu", "file", "edit", "view",
    "window", "help", "new", "open", "save", "cut", "copy", "paste",
    "undo", "redo", "select all", "find", "more", "×", "...", "⋮",
    "…",
};

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

bool is_ui_noise(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::ranges::find(UI_NOISE, std::string_view(lower)) != std::end(UI_NOISE);
}

std::vector<std::string> filter_transcript(const std::vector<std::string>& raw) {
    std::vector<std::string> lines;
    std::unordered_set<std::string> seen;

    for (auto& entry : raw) {
        auto text = trim(entry);
        if (utf8::length(text) < 2) continue;
        if (is_ui_noise(text)) continue;
        if (!seen.insert(text).second) continue;
        lines.push_back(std::move(text));
    }
    return lines;
}
