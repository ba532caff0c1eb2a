#pragma once

#include "platform/ipc_server.hpp"

#include <cstddef>
#include <string>
#include <sys/types.h>
#include <vector>

// Non-blocking AF_UNIX listener for the control protocol. Each connection
// keeps the bytes past its last newline until the rest of the line arrives.
class UnixSocketServer : public IpcServer {
public:
    // A client that sends this much without a newline is disconnected.
    static constexpr size_t MAX_LINE_BYTES = 64 * 1024;
    // Anyone who can talk to the socket can type into the focused window.
    static constexpr mode_t SOCKET_MODE = 0600;

    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadStatus read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    struct Connection {
        int fd;
        std::string partial;
    };

    Connection* find_connection(int fd);

    int server_fd_ = -1;
    std::string socket_path_;
    std::vector<Connection> connections_;
};
