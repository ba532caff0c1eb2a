#include "daemon_core.hpp"

#include "reply/http_backend.hpp"

#include <cstdlib>
#include <format>
#include <print>

DaemonCore::DaemonCore(Config config, bool verbose,
                       PlatformServices& platform, TextRecognizer& ocr,
                       Notifier& notifier, IpcServer& ipc,
                       NotifyCallback notify,
                       std::unique_ptr<ReplyBackend> backend)
    : config_(std::move(config)), verbose_(verbose),
      platform_(platform), ocr_(ocr),
      notifier_(notifier), ipc_(ipc),
      notify_(std::move(notify)),
      backend_(std::move(backend)) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    auto quick = HotkeyBinding::parse(config_.hotkeys.quick);
    if (!quick) {
        std::println(stderr, "config: hotkeys.quick: {}", quick.error());
        return false;
    }
    auto deep = HotkeyBinding::parse(config_.hotkeys.deep);
    if (!deep) {
        std::println(stderr, "config: hotkeys.deep: {}", deep.error());
        return false;
    }

    if (!backend_) {
        std::string api_key;
        if (!config_.backend.api_key_env.empty()) {
            if (const char* key = std::getenv(config_.backend.api_key_env.c_str())) api_key = key;
        }
        backend_ = std::make_unique<HttpBackend>(
            config_.backend.url, config_.backend.endpoint, api_key,
            std::chrono::milliseconds(config_.backend.timeout_ms),
            std::chrono::milliseconds(config_.backend.connect_timeout_ms));
    }

    std::vector<std::unique_ptr<ContextProvider>> providers;
    providers.push_back(std::make_unique<AccessibilityProvider>(
        *platform_.accessibility, config_.capture.min_text_chars));
    providers.push_back(std::make_unique<ScreenshotOcrProvider>(
        *platform_.screen, ocr_, std::chrono::milliseconds(config_.capture.timeout_ms)));
    extractor_ = std::make_unique<ContextExtractor>(*platform_.accessibility, std::move(providers), verbose_);

    injector_ = std::make_unique<InputInjector>(*platform_.keyboard, *platform_.clipboard,
                                                config_.injection, verbose_);

    coordinator_ = std::make_unique<ReplyCoordinator>(
        *extractor_, *backend_, *injector_, *platform_.accessibility,
        std::chrono::milliseconds(config_.backend.timeout_ms),
        [this](const RequestOutcome& outcome) { queue_outcome(outcome); },
        verbose_);

    auto* accessibility = platform_.accessibility.get();
    listener_ = std::make_unique<HotkeyListener>(
        *platform_.hotkeys, HotkeyBindings{*quick, *deep},
        std::chrono::milliseconds(config_.hotkeys.debounce_ms),
        [this](HotkeyEvent event) { post_event(std::move(event)); },
        [accessibility] { return accessibility->focused_window_id(); });

    coordinator_->start();

    auto started = listener_->start();
    if (!started) {
        std::println(stderr, "hotkeys: {}", started.error());
        coordinator_->stop();
        return false;
    }

    log(std::format("hotkeys: quick={} deep={} ({})", quick->to_string(), deep->to_string(),
                    platform_.name));
    return true;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str, const nlohmann::json& cmd) {
    if (auto kind = parse_hotkey_kind(cmd_str)) return handle_trigger(*kind, cmd);
    if (cmd_str == "cancel") return handle_cancel(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_trigger(HotkeyKind kind, const nlohmann::json& cmd) {
    if (!listener_ || !coordinator_) {
        return {{"status", "error"}, {"message", "daemon not initialized"}};
    }

    // Sway bindings run the control client, so those presses count as hotkeys.
    auto source = cmd.value("source", "control") == "hotkey" ? TriggerSource::Hotkey
                                                             : TriggerSource::Control;
    auto event = listener_->on_press(kind, source, cmd.value("window", ""));
    if (!event) {
        return {{"status", "ignored"}, {"message", "debounced"}};
    }

    if (cmd.value("wait", false)) {
        return {{"status", "pending"}, {"seq", last_seq_}};
    }
    return {{"status", "ok"}, {"seq", last_seq_}, {"kind", std::string(hotkey_kind_name(kind))}};
}

nlohmann::json DaemonCore::handle_cancel(const nlohmann::json& /*cmd*/) {
    bool cancelled = coordinator_ && coordinator_->cancel();
    return {{"status", "ok"}, {"cancelled", cancelled}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {
        {"status", "ok"},
        {"state", coordinator_state_name(state())},
        {"platform", platform_.name},
    };
    if (last_outcome_) resp["last"] = *last_outcome_;
    return resp;
}

int DaemonCore::hotkey_fd() const {
    return listener_ ? listener_->event_fd() : -1;
}

void DaemonCore::on_hotkey_readable() {
    if (listener_) listener_->on_readable();
}

void DaemonCore::post_event(HotkeyEvent event) {
    log(std::format("{} requested ({})", hotkey_kind_name(event.kind),
                    event.source == TriggerSource::Hotkey ? "hotkey" : "control"));
    last_seq_ = coordinator_->submit(std::move(event));
}

void DaemonCore::queue_outcome(const RequestOutcome& outcome) {
    {
        std::lock_guard lock(outcomes_mutex_);
        outcomes_.push_back(outcome);
    }
    if (notify_) notify_();
}

void DaemonCore::on_request_complete() {
    std::deque<RequestOutcome> done;
    {
        std::lock_guard lock(outcomes_mutex_);
        done.swap(outcomes_);
    }

    for (auto& outcome : done) {
        auto response = outcome_json(outcome);
        last_outcome_ = response;

        for (auto it = waiting_clients_.begin(); it != waiting_clients_.end();) {
            if (it->second == outcome.seq) {
                ipc_.send_response(it->first, response);
                it = waiting_clients_.erase(it);
            } else {
                ++it;
            }
        }

        notify_user(outcome);
    }
}

void DaemonCore::notify_user(const RequestOutcome& outcome) {
    if (!config_.notifications.enabled || !outcome.failure) return;

    auto& failure = *outcome.failure;
    std::string summary;
    std::string body = failure.message;

    switch (failure.kind) {
        case ErrorKind::Cancelled:
            return;
        case ErrorKind::PermissionDenied:
            if (!permission_notices_.insert(failure.message).second) return;
            summary = "Permission needed";
            break;
        case ErrorKind::Unsupported:
        case ErrorKind::CaptureFailed:
        case ErrorKind::NoTextFound:
            summary = "Could not read the conversation";
            break;
        case ErrorKind::AiFailure:
            summary = "No reply generated";
            break;
        case ErrorKind::FocusChanged:
            summary = "Reply discarded";
            body = "Focus moved to another window: " + failure.message;
            break;
        case ErrorKind::InjectionFailed:
            summary = "Could not type the reply";
            if (outcome.reply_on_clipboard) body += "\nThe reply is on the clipboard.";
            break;
    }

    auto res = notifier_.notify(summary, body);
    if (!res) {
        std::println(stderr, "notify: {}", res.error());
    }
}

void DaemonCore::add_waiting_client(int fd, uint64_t seq) {
    waiting_clients_.emplace_back(fd, seq);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase_if(waiting_clients_, [fd](const auto& w) { return w.first == fd; });
}

CoordinatorState DaemonCore::state() const {
    return coordinator_ ? coordinator_->state() : CoordinatorState::Idle;
}

void DaemonCore::shutdown() {
    if (listener_) listener_->stop();
    if (coordinator_) coordinator_->stop();
    on_request_complete();
}

nlohmann::json DaemonCore::outcome_json(const RequestOutcome& outcome) {
    nlohmann::json j = {
        {"status", outcome.ok() ? "ok" : "error"},
        {"seq", outcome.seq},
        {"kind", std::string(hotkey_kind_name(outcome.kind))},
        {"state", coordinator_state_name(outcome.final_state)},
        {"reply_chars", outcome.reply_chars},
    };
    if (outcome.capture_method) j["method"] = std::string(capture_method_name(*outcome.capture_method));
    if (outcome.round_trip_s > 0.0) j["round_trip"] = outcome.round_trip_s;
    if (outcome.injection) {
        j["mechanism"] = injection_mechanism_name(outcome.injection->mechanism);
        j["code_points"] = outcome.injection->code_points;
    }
    if (outcome.failure) {
        j["error"] = std::string(error_kind_name(outcome.failure->kind));
        j["message"] = outcome.failure->message;
        if (outcome.reply_on_clipboard) j["clipboard"] = true;
    }
    return j;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[reply-anywhere] {}", msg);
    }
}
