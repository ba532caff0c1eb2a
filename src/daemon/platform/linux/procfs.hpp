#pragma once

#include <string>
#include <string_view>

namespace platform {

// Executable basename of `pid` (e.g. "gnome-terminal-server"), falling back
// to /proc/<pid>/comm, then to the lowercased window class.
std::string process_name(int pid, std::string_view window_class = {});

} // namespace platform
