#pragma once

#include <expected>
#include <string>

class Clipboard {
public:
    virtual ~Clipboard() = default;
    virtual std::expected<void, std::string> set_text(const std::string& text) = 0;
};
