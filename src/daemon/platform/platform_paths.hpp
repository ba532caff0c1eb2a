#pragma once

#include <string>

namespace platform {

// Directory holding config.json; empty if it cannot be determined.
std::string config_dir();

// Control socket path: $XDG_RUNTIME_DIR, else a per-user name in /tmp.
std::string ipc_endpoint();

} // namespace platform
