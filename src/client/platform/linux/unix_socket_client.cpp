#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::~UnixSocketClient() {
    close();
}

std::expected<void, std::string> UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        return std::unexpected("socket path too long");
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return std::unexpected(std::string("socket() failed: ") + std::strerror(errno));

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        return std::unexpected(reason);
    }
    return {};
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;
    std::string msg = cmd.dump() + "\n";
    ssize_t sent = ::send(fd_, msg.data(), msg.size(), MSG_NOSIGNAL);
    return sent == static_cast<ssize_t>(msg.size());
}

std::expected<nlohmann::json, IpcClient::RecvError>
UnixSocketClient::recv(std::chrono::milliseconds timeout) {
    if (fd_ < 0) return std::unexpected(RecvError::Closed);

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto pos = pending_.find('\n');
        if (pos != std::string::npos) {
            std::string line = pending_.substr(0, pos);
            pending_.erase(0, pos + 1);
            auto response = nlohmann::json::parse(line, nullptr, false);
            if (response.is_discarded()) return std::unexpected(RecvError::Malformed);
            return response;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return std::unexpected(RecvError::Timeout);

        int ret = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) return std::unexpected(RecvError::Closed);
        if (ret == 0) return std::unexpected(RecvError::Timeout);

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n <= 0) return std::unexpected(RecvError::Closed);
        pending_.append(tmp, static_cast<size_t>(n));
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}
