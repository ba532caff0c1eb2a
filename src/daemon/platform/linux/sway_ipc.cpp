#include "platform/linux/sway_ipc.hpp"

#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayIpc::SwayIpc() = default;

SwayIpc::~SwayIpc() {
    if (fd_ >= 0) ::close(fd_);
}

bool SwayIpc::connect() {
    const char* sock = std::getenv("SWAYSOCK");
    if (!sock) {
        std::println(stderr, "sway: $SWAYSOCK not set");
        return false;
    }
    sway_sock_ = sock;

    std::lock_guard lock(mutex_);
    fd_ = connect_socket(sway_sock_);
    return fd_ >= 0;
}

std::expected<SwayWindow, std::string> SwayIpc::focused_window() {
    auto payload = request(MSG_GET_TREE);
    if (!payload) return std::unexpected(payload.error());

    try {
        auto tree = nlohmann::json::parse(*payload);
        auto window = find_focused(tree);
        if (!window) return std::unexpected("no focused window");
        return *window;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("bad GET_TREE reply: ") + e.what());
    }
}

std::expected<void, std::string> SwayIpc::run_command(const std::string& command) {
    auto payload = request(MSG_RUN_COMMAND, command);
    if (!payload) return std::unexpected(payload.error());
    return parse_command_reply(*payload);
}

std::expected<void, std::string> SwayIpc::parse_command_reply(const std::string& payload) {
    try {
        auto reply = nlohmann::json::parse(payload);
        if (!reply.is_array()) return std::unexpected("unexpected RUN_COMMAND reply");
        for (auto& r : reply) {
            if (!r.value("success", false)) {
                return std::unexpected(r.value("error", std::string("command failed")));
            }
        }
        return {};
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("bad RUN_COMMAND reply: ") + e.what());
    }
}

std::expected<std::string, std::string> SwayIpc::request(uint32_t type, const std::string& payload) {
    std::lock_guard lock(mutex_);

    // One reconnect: sway drops idle clients on reload.
    for (int attempt = 0; attempt < 2; attempt++) {
        if (fd_ < 0) {
            if (sway_sock_.empty()) return std::unexpected("sway: not connected");
            fd_ = connect_socket(sway_sock_);
            if (fd_ < 0) return std::unexpected("sway: connect failed");
        }

        uint32_t reply_type = 0;
        std::string reply;
        if (send_message(type, payload) && recv_message(reply_type, reply)) {
            return reply;
        }
        ::close(fd_);
        fd_ = -1;
    }
    return std::unexpected("sway: IPC request failed");
}

int SwayIpc::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

bool SwayIpc::send_message(uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd_, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(fd_, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayIpc::recv_message(uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd_, header + read_total, 14 - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd_, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}

std::optional<SwayWindow> SwayIpc::find_focused(const nlohmann::json& node) {
    if (node.value("focused", false)) {
        auto type = node.value("type", "");
        if (type != "con" && type != "floating_con") return std::nullopt;

        SwayWindow w;
        w.id = node.value("id", int64_t{0});
        if (node.contains("app_id") && node["app_id"].is_string()) {
            w.app_id = node["app_id"].get<std::string>();
        }
        if (node.contains("window_properties")) {
            w.window_class = node["window_properties"].value("class", "");
        }
        w.name = node.contains("name") && node["name"].is_string() ? node["name"].get<std::string>() : "";
        w.pid = node.value("pid", 0);
        if (node.contains("rect")) {
            auto& r = node["rect"];
            w.rect = {r.value("x", 0), r.value("y", 0), r.value("width", 0), r.value("height", 0)};
        }
        return w;
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (auto& child : node[key]) {
            if (auto w = find_focused(child)) return w;
        }
    }
    return std::nullopt;
}
