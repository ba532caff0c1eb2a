#pragma once

#include "capture/focused_target.hpp"

#include <cstdint>
#include <expected>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct SwayWindow {
    int64_t id = 0;
    std::string app_id;        // Wayland app_id (e.g. "kitty")
    std::string window_class;  // XWayland class (e.g. "TelegramDesktop")
    std::string name;          // window title
    int pid = 0;
    Rect rect;                 // absolute layout coordinates

    bool empty() const { return id == 0; }
};

// Blocking request/reply client for the sway (i3-ipc) socket. Safe to share
// between the event loop and the worker.
class SwayIpc {
public:
    SwayIpc();
    ~SwayIpc();

    SwayIpc(const SwayIpc&) = delete;
    SwayIpc& operator=(const SwayIpc&) = delete;

    // Returns false if $SWAYSOCK is not set or the connection fails.
    bool connect();

    std::expected<SwayWindow, std::string> focused_window();
    std::expected<void, std::string> run_command(const std::string& command);

    static std::optional<SwayWindow> find_focused(const nlohmann::json& node);
    // RUN_COMMAND replies with one {"success", "error"} object per command.
    static std::expected<void, std::string> parse_command_reply(const std::string& payload);

private:
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;

    std::expected<std::string, std::string> request(uint32_t type, const std::string& payload = "");
    bool send_message(uint32_t type, const std::string& payload);
    bool recv_message(uint32_t& type, std::string& payload);
    int connect_socket(const std::string& path);

    std::mutex mutex_;
    int fd_ = -1;
    std::string sway_sock_;
};
