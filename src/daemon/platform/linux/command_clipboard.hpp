#pragma once

#include "platform/clipboard.hpp"

#include <string>
#include <vector>

// Clipboard owned by an external tool that reads the text from stdin:
// wl-copy on Wayland, xclip on X11.
class CommandClipboard : public Clipboard {
public:
    explicit CommandClipboard(std::vector<std::string> argv);

    std::expected<void, std::string> set_text(const std::string& text) override;

private:
    std::vector<std::string> argv_;
};
