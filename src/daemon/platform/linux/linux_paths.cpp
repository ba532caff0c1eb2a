#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>
#include <unistd.h>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/reply-anywhere";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/reply-anywhere";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/reply-anywhere.sock";
    // /tmp is shared; keep one socket per user.
    return std::format("/tmp/reply-anywhere-{}.sock", ::getuid());
}

} // namespace platform
