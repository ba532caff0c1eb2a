#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "ocr/tesseract_recognizer.hpp"
#include "platform/linux/desktop_notifier.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/platform_services.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, PlatformServices platform, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();

private:
    void handle_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    PlatformServices platform_;
    TesseractRecognizer ocr_;
    DesktopNotifier notifier_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int hotkey_fd_ = -1;

    std::atomic<bool> running_{false};
};
