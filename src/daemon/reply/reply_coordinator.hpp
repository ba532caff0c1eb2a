#pragma once

#include "capture/context_extractor.hpp"
#include "failure.hpp"
#include "hotkey/hotkey_event.hpp"
#include "hotkey/hotkey_queue.hpp"
#include "output/input_injector.hpp"
#include "platform/accessibility.hpp"
#include "reply/backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

enum class CoordinatorState { Idle, Capturing, AwaitingReply, Injecting, Cancelled };

const char* coordinator_state_name(CoordinatorState state);

struct RequestOutcome {
    uint64_t seq = 0;
    HotkeyKind kind = HotkeyKind::Quick;
    CoordinatorState final_state = CoordinatorState::Idle; // Idle or Cancelled
    std::optional<Failure> failure;
    std::optional<CaptureMethod> capture_method;
    std::optional<InjectionOutcome> injection;
    size_t reply_chars = 0;
    double round_trip_s = 0.0;
    bool reply_on_clipboard = false; // offered for manual paste after InjectionFailed

    bool ok() const { return !failure; }
};

// Single-writer state machine for reply requests. Hotkey events are posted
// with submit() from any thread; capture, the backend wait and injection run
// on one worker thread, one request at a time. A newer event cancels the
// request in flight.
class ReplyCoordinator {
public:
    using OutcomeCallback = std::function<void(const RequestOutcome&)>;

    ReplyCoordinator(ContextExtractor& extractor, ReplyBackend& backend,
                     InputInjector& injector, Accessibility& accessibility,
                     std::chrono::milliseconds reply_timeout,
                     OutcomeCallback on_outcome, bool verbose = false);
    ~ReplyCoordinator();

    ReplyCoordinator(const ReplyCoordinator&) = delete;
    ReplyCoordinator& operator=(const ReplyCoordinator&) = delete;

    void start();
    // Cancels everything and joins the worker and any abandoned backend calls.
    void stop();

    // Returns the sequence number the request will be reported under.
    uint64_t submit(HotkeyEvent event);

    // Returns true if a request was in flight or pending.
    bool cancel();

    CoordinatorState state() const { return state_.load(std::memory_order_acquire); }

private:
    struct PendingReply {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::optional<std::expected<std::string, Failure>> result;
    };

    struct AbandonedCall {
        std::jthread thread;
        std::shared_ptr<PendingReply> pending;
    };

    void run(std::stop_token worker_stop);
    RequestOutcome process(const QueuedEvent& queued, std::stop_token stop);
    std::expected<ReplyResult, Failure> await_reply(ReplyRequest request, std::stop_token stop);
    void reap_abandoned(bool wait);

    void report_superseded(std::vector<QueuedEvent> events);
    void set_state(CoordinatorState state);
    void log(const std::string& msg);

    ContextExtractor& extractor_;
    ReplyBackend& backend_;
    InputInjector& injector_;
    Accessibility& accessibility_;
    std::chrono::milliseconds reply_timeout_;
    OutcomeCallback on_outcome_;
    bool verbose_;

    HotkeyQueue queue_;
    std::atomic<CoordinatorState> state_{CoordinatorState::Idle};
    std::atomic<uint64_t> next_seq_{0};

    std::mutex current_mutex_;
    std::optional<std::stop_source> current_;

    std::mutex abandoned_mutex_;
    std::vector<AbandonedCall> abandoned_;

    std::jthread worker_;
};
