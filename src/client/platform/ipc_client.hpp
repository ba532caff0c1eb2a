#pragma once

#include <chrono>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Control socket client. Commands go out one JSON object per line and each
// response comes back as one line; several responses may arrive in one read.
class IpcClient {
public:
    enum class RecvError { Timeout, Closed, Malformed };

    // Plain commands are answered immediately. A waited trigger is answered
    // once capture, the backend round trip and typing are done.
    static constexpr std::chrono::milliseconds COMMAND_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds WAIT_TIMEOUT{120000};

    virtual ~IpcClient() = default;
    // Error carries the OS reason, e.g. when the daemon is not running.
    virtual std::expected<void, std::string> connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    virtual std::expected<nlohmann::json, RecvError> recv(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;

    // Sends `cmd` and reads its response, allowing for `"wait": true`.
    std::expected<nlohmann::json, RecvError> request(const nlohmann::json& cmd) {
        if (!send(cmd)) return std::unexpected(RecvError::Closed);
        return recv(cmd.value("wait", false) ? WAIT_TIMEOUT : COMMAND_TIMEOUT);
    }
};

inline const char* recv_error_name(IpcClient::RecvError err) {
    switch (err) {
        case IpcClient::RecvError::Timeout: return "timed out";
        case IpcClient::RecvError::Closed: return "connection closed";
        case IpcClient::RecvError::Malformed: return "malformed response";
    }
    return "unknown";
}
