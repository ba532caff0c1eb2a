#pragma once

#include <string>
#include <vector>

// Turns raw accessibility strings into transcript lines: trims, drops UI
// labels, fragments shorter than two characters and exact duplicates.
// Order is preserved.
std::vector<std::string> filter_transcript(const std::vector<std::string>& raw);

bool is_ui_noise(const std::string& text);
