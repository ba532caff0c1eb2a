#include "platform/linux/procfs.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace platform {

namespace {

std::string read_exe(int pid) {
    std::error_code ec;
    auto path = fs::read_symlink(std::format("/proc/{}/exe", pid), ec);
    if (ec) return {};
    return path.filename().string();
}

std::string read_comm(int pid) {
    std::ifstream f(std::format("/proc/{}/comm", pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

} // namespace

std::string process_name(int pid, std::string_view window_class) {
    if (pid > 0) {
        if (auto exe = read_exe(pid); !exe.empty()) return exe;
        if (auto comm = read_comm(pid); !comm.empty()) return comm;
    }

    std::string name(window_class);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

} // namespace platform
