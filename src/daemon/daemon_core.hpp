#pragma once

#include "capture/context_extractor.hpp"
#include "config.hpp"
#include "hotkey/hotkey_listener.hpp"
#include "ocr/text_recognizer.hpp"
#include "output/input_injector.hpp"
#include "platform/ipc_server.hpp"
#include "platform/notifier.hpp"
#include "platform/platform_services.hpp"
#include "reply/backend.hpp"
#include "reply/reply_coordinator.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    // `backend` may be null, in which case init() builds the HTTP backend
    // from the config.
    DaemonCore(Config config, bool verbose,
               PlatformServices& platform, TextRecognizer& ocr,
               Notifier& notifier, IpcServer& ipc,
               NotifyCallback notify,
               std::unique_ptr<ReplyBackend> backend = nullptr);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // A response with status "pending" means the caller should park the
    // client with add_waiting_client() until that request finishes.
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Hotkey source fd, or -1 when hotkeys arrive through the control socket.
    int hotkey_fd() const;
    void on_hotkey_readable();

    // Loop thread: drains outcomes posted by the coordinator worker.
    void on_request_complete();

    void add_waiting_client(int fd, uint64_t seq);
    void remove_waiting_client(int fd);

    CoordinatorState state() const;

    void shutdown();

    static nlohmann::json outcome_json(const RequestOutcome& outcome);

private:
    nlohmann::json handle_trigger(HotkeyKind kind, const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);

    void post_event(HotkeyEvent event);
    void queue_outcome(const RequestOutcome& outcome);
    void notify_user(const RequestOutcome& outcome);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    PlatformServices& platform_;
    TextRecognizer& ocr_;
    Notifier& notifier_;
    IpcServer& ipc_;
    NotifyCallback notify_;

    std::unique_ptr<ReplyBackend> backend_;
    std::unique_ptr<ContextExtractor> extractor_;
    std::unique_ptr<InputInjector> injector_;
    std::unique_ptr<ReplyCoordinator> coordinator_;
    std::unique_ptr<HotkeyListener> listener_;

    uint64_t last_seq_ = 0;
    std::optional<nlohmann::json> last_outcome_;
    std::vector<std::pair<int, uint64_t>> waiting_clients_;
    std::set<std::string> permission_notices_;

    std::mutex outcomes_mutex_;
    std::deque<RequestOutcome> outcomes_;
};
