#include "reply/reply_coordinator.hpp"

#include "utf8.hpp"

#include <format>
#include <print>

const char* coordinator_state_name(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Idle: return "idle";
        case CoordinatorState::Capturing: return "capturing";
        case CoordinatorState::AwaitingReply: return "awaiting-reply";
        case CoordinatorState::Injecting: return "injecting";
        case CoordinatorState::Cancelled: return "cancelled";
    }
    return "unknown";
}

namespace {

Failure cancelled_failure(const char* where) {
    return {ErrorKind::Cancelled, std::format("cancelled during {}", where)};
}

} // namespace

ReplyCoordinator::ReplyCoordinator(ContextExtractor& extractor, ReplyBackend& backend,
                                   InputInjector& injector, Accessibility& accessibility,
                                   std::chrono::milliseconds reply_timeout,
                                   OutcomeCallback on_outcome, bool verbose)
    : extractor_(extractor)
    , backend_(backend)
    , injector_(injector)
    , accessibility_(accessibility)
    , reply_timeout_(reply_timeout)
    , on_outcome_(std::move(on_outcome))
    , verbose_(verbose) {}

ReplyCoordinator::~ReplyCoordinator() {
    stop();
}

void ReplyCoordinator::start() {
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

void ReplyCoordinator::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    report_superseded(queue_.drain());
    reap_abandoned(true);
    set_state(CoordinatorState::Idle);
}

uint64_t ReplyCoordinator::submit(HotkeyEvent event) {
    uint64_t seq = ++next_seq_;
    log(std::format("request #{} ({}) queued", seq, hotkey_kind_name(event.kind)));

    auto superseded = queue_.push({seq, std::move(event)});

    {
        std::lock_guard lock(current_mutex_);
        if (current_) current_->request_stop();
    }

    report_superseded(std::move(superseded));
    return seq;
}

bool ReplyCoordinator::cancel() {
    // Drain first: the worker publishes current_ in the same critical section
    // as its pop, so an event is either still queued or visible below.
    auto pending = queue_.drain();
    bool had_work = !pending.empty();
    {
        std::lock_guard lock(current_mutex_);
        if (current_ && !current_->stop_requested()) {
            current_->request_stop();
            had_work = true;
        }
    }
    report_superseded(std::move(pending));
    return had_work;
}

void ReplyCoordinator::run(std::stop_token worker_stop) {
    while (!worker_stop.stop_requested()) {
        std::stop_source request;
        auto next = queue_.wait_pop(worker_stop, [this, &request](const QueuedEvent&) {
            std::lock_guard lock(current_mutex_);
            current_ = request;
        });
        if (!next) break;

        std::stop_callback on_shutdown(worker_stop, [&request] { request.request_stop(); });

        auto outcome = process(*next, request.get_token());

        {
            std::lock_guard lock(current_mutex_);
            current_.reset();
        }

        if (outcome.final_state == CoordinatorState::Cancelled) {
            set_state(CoordinatorState::Cancelled);
        }
        set_state(CoordinatorState::Idle);

        if (outcome.ok()) {
            log(std::format("request #{} done: {} code points via {}", outcome.seq,
                            outcome.injection->code_points,
                            injection_mechanism_name(outcome.injection->mechanism)));
        } else {
            log(std::format("request #{} ended: {} ({})", outcome.seq,
                            error_kind_name(outcome.failure->kind), outcome.failure->message));
        }
        if (on_outcome_) on_outcome_(outcome);

        reap_abandoned(false);
    }
}

RequestOutcome ReplyCoordinator::process(const QueuedEvent& queued, std::stop_token stop) {
    RequestOutcome outcome;
    outcome.seq = queued.seq;
    outcome.kind = queued.event.kind;

    auto finish = [&](Failure failure) {
        if (failure.kind == ErrorKind::Cancelled) {
            outcome.final_state = CoordinatorState::Cancelled;
        }
        outcome.failure = std::move(failure);
        return outcome;
    };

    if (stop.stop_requested()) return finish(cancelled_failure("queue"));

    set_state(CoordinatorState::Capturing);
    auto context = extractor_.extract(queued.event.kind, stop);
    if (!context) return finish(context.error());
    outcome.capture_method = context->method;

    if (!queued.event.focused_window.empty() && queued.event.focused_window != context->target.handle) {
        log(std::format("focus moved from {} to {} before capture",
                        queued.event.focused_window, context->target.handle));
    }

    if (stop.stop_requested()) return finish(cancelled_failure("capture"));

    set_state(CoordinatorState::AwaitingReply);
    auto captured_target = context->target;
    auto reply = await_reply(ReplyRequest{std::move(*context), queued.event.kind}, stop);
    if (!reply) return finish(reply.error());
    outcome.reply_chars = utf8::length(reply->text);
    outcome.round_trip_s = reply->round_trip_s;

    if (stop.stop_requested()) return finish(cancelled_failure("reply"));

    set_state(CoordinatorState::Injecting);
    // Only the window handle matters here; the captured target still
    // describes the process being typed into.
    auto current = accessibility_.focused_window_id();
    if (current.empty()) {
        return finish({ErrorKind::FocusChanged, "could not confirm the focused window"});
    }
    if (current != captured_target.handle) {
        return finish({ErrorKind::FocusChanged,
                       std::format("focus moved from {} ({}) to {}", captured_target.process_name,
                                   captured_target.handle, current)});
    }

    // Last chance to back out: typed characters cannot be taken back.
    if (stop.stop_requested()) return finish(cancelled_failure("injection"));

    auto injected = injector_.inject(reply->text, captured_target);
    if (!injected) {
        outcome.reply_on_clipboard = injector_.offer_via_clipboard(reply->text).has_value();
        return finish(injected.error());
    }
    outcome.injection = *injected;
    return outcome;
}

std::expected<ReplyResult, Failure> ReplyCoordinator::await_reply(ReplyRequest request,
                                                                  std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + reply_timeout_;
    auto pending = std::make_shared<PendingReply>();

    std::jthread helper([this, pending, request = std::move(request)](std::stop_token helper_stop) {
        auto result = backend_.generate(request, helper_stop);
        {
            std::lock_guard lock(pending->mutex);
            pending->result = std::move(result);
        }
        pending->cv.notify_all();
    });

    std::unique_lock lock(pending->mutex);
    bool answered = pending->cv.wait_until(lock, stop, deadline,
                                           [&pending] { return pending->result.has_value(); });

    if (answered) {
        auto result = std::move(*pending->result);
        lock.unlock();
        helper.join();
        if (!result) return std::unexpected(result.error());

        ReplyResult reply;
        reply.text = std::move(*result);
        reply.status = ReplyStatus::Ok;
        reply.round_trip_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        return reply;
    }
    lock.unlock();

    // The backend may still answer; whatever it returns is dropped.
    helper.request_stop();
    {
        std::lock_guard guard(abandoned_mutex_);
        abandoned_.push_back({std::move(helper), pending});
    }

    if (stop.stop_requested()) return std::unexpected(cancelled_failure("reply"));
    return std::unexpected(Failure{
        ErrorKind::AiFailure,
        std::format("no reply within {} ms", reply_timeout_.count())});
}

void ReplyCoordinator::reap_abandoned(bool wait) {
    std::vector<AbandonedCall> finished;
    {
        std::lock_guard lock(abandoned_mutex_);
        for (auto it = abandoned_.begin(); it != abandoned_.end();) {
            bool done = false;
            {
                std::lock_guard pending_lock(it->pending->mutex);
                done = it->pending->result.has_value();
            }
            if (wait || done) {
                finished.push_back(std::move(*it));
                it = abandoned_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // jthread destructors join outside the lock.
    finished.clear();
}

void ReplyCoordinator::report_superseded(std::vector<QueuedEvent> events) {
    for (auto& queued : events) {
        RequestOutcome outcome;
        outcome.seq = queued.seq;
        outcome.kind = queued.event.kind;
        outcome.final_state = CoordinatorState::Cancelled;
        outcome.failure = Failure{ErrorKind::Cancelled, "superseded by a newer request"};
        log(std::format("request #{} superseded", queued.seq));
        if (on_outcome_) on_outcome_(outcome);
    }
}

void ReplyCoordinator::set_state(CoordinatorState state) {
    auto old = state_.exchange(state, std::memory_order_acq_rel);
    if (old != state) {
        log(std::format("state: {} -> {}", coordinator_state_name(old), coordinator_state_name(state)));
    }
}

void ReplyCoordinator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[reply-anywhere] {}", msg);
    }
}
