#pragma once

#include "platform/accessibility.hpp"
#include "platform/clipboard.hpp"
#include "platform/hotkey_source.hpp"
#include "platform/keyboard.hpp"
#include "platform/notifier.hpp"
#include "platform/screen_capture.hpp"
#include "ocr/text_recognizer.hpp"
#include "reply/backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// In-memory stand-ins for the platform services. All counters are atomic
// because the coordinator calls them from its worker thread.

inline FocusedTarget make_target(std::string handle, std::string process = "telegram-desktop") {
    FocusedTarget t;
    t.handle = std::move(handle);
    t.process_name = std::move(process);
    t.pid = 4242;
    t.window_bounds = {0, 0, 800, 600};
    t.control_bounds = {10, 40, 500, 400};
    return t;
}

class FakeAccessibility : public Accessibility {
public:
    std::expected<FocusedTarget, Failure> focused_target() override {
        std::lock_guard lock(mutex);
        focus_queries++;
        if (focus_error) return std::unexpected(*focus_error);
        return target;
    }

    std::string focused_window_id() override {
        std::lock_guard lock(mutex);
        window_id_queries++;
        if (focus_error) return {};
        return target.handle;
    }

    std::expected<std::vector<std::string>, Failure>
    read_text(const FocusedTarget&, CaptureScope scope, std::stop_token) override {
        int now = ++active_reads;
        int seen = max_active_reads.load();
        while (now > seen && !max_active_reads.compare_exchange_weak(seen, now)) {}
        if (read_delay.count() > 0) std::this_thread::sleep_for(read_delay);
        if (on_read) on_read();
        --active_reads;

        std::lock_guard lock(mutex);
        reads++;
        scopes.push_back(scope);
        if (read_error) return std::unexpected(*read_error);
        return scope == CaptureScope::Window ? window_text : control_text;
    }

    void set_focus(FocusedTarget t) {
        std::lock_guard lock(mutex);
        target = std::move(t);
    }

    std::mutex mutex;
    FocusedTarget target = make_target("win-1");
    std::optional<Failure> focus_error;
    std::optional<Failure> read_error;
    std::vector<std::string> control_text = {
        "Alice: are we still on for tomorrow?", "Bob: yes, 10am at the cafe"};
    std::vector<std::string> window_text = {
        "Project chat", "Alice: are we still on for tomorrow?", "Bob: yes, 10am at the cafe",
        "Carol: can someone bring the slides?"};
    std::vector<CaptureScope> scopes;
    std::chrono::milliseconds read_delay{0};
    std::function<void()> on_read;
    std::atomic<int> focus_queries{0};
    std::atomic<int> window_id_queries{0};
    std::atomic<int> reads{0};
    std::atomic<int> active_reads{0};
    std::atomic<int> max_active_reads{0};
};

class FakeScreenCapture : public ScreenCapture {
public:
    std::expected<Bitmap, Failure>
    capture(const Rect& region, std::chrono::milliseconds, std::stop_token) override {
        calls++;
        last_region = region;
        if (error) return std::unexpected(*error);
        Bitmap b;
        b.width = region.width;
        b.height = region.height;
        b.pixels.assign(static_cast<size_t>(b.stride()) * b.height, 0xff);
        return b;
    }

    std::optional<Failure> error;
    Rect last_region;
    std::atomic<int> calls{0};
};

class FakeRecognizer : public TextRecognizer {
public:
    std::expected<std::vector<std::string>, Failure>
    recognize(const Bitmap&, std::stop_token) override {
        calls++;
        if (error) return std::unexpected(*error);
        return lines;
    }

    std::optional<Failure> error;
    std::vector<std::string> lines = {"Dana: lunch at noon?", "Eve: sounds good"};
    std::atomic<int> calls{0};
};

class FakeKeyboard : public Keyboard {
public:
    InjectionCapability probe(const FocusedTarget&) override { return capability; }

    std::expected<void, std::string> type_text(std::string_view text) override {
        std::lock_guard lock(mutex);
        if (fail_after && chunks.size() >= *fail_after) return std::unexpected("virtual keyboard gone");
        chunks.emplace_back(text);
        typed += text;
        return {};
    }

    std::expected<void, std::string> paste(PasteShortcut shortcut) override {
        std::lock_guard lock(mutex);
        if (paste_fails) return std::unexpected("paste refused");
        pastes.push_back(shortcut);
        return {};
    }

    std::string typed_text() {
        std::lock_guard lock(mutex);
        return typed;
    }

    std::mutex mutex;
    InjectionCapability capability = InjectionCapability::DirectTyping;
    std::optional<size_t> fail_after; // refuse once this many chunks went through
    bool paste_fails = false;
    std::vector<std::string> chunks;
    std::string typed;
    std::vector<PasteShortcut> pastes;
};

class FakeClipboard : public Clipboard {
public:
    std::expected<void, std::string> set_text(const std::string& text) override {
        std::lock_guard lock(mutex);
        if (fails) return std::unexpected("no clipboard");
        contents = text;
        sets++;
        return {};
    }

    std::mutex mutex;
    bool fails = false;
    std::string contents;
    int sets = 0;
};

// Replies with a fixed text, optionally after a delay. A delayed call wakes
// early on stop unless `ignore_stop` is set, and never later than `delay`.
class FakeBackend : public ReplyBackend {
public:
    std::expected<std::string, Failure>
    generate(const ReplyRequest& request, std::stop_token stop) override {
        bool slow = calls++ < slow_calls;
        {
            std::lock_guard lock(mutex);
            requests.push_back(request);
        }
        if (on_call) on_call();
        if (slow && ignore_stop) {
            std::this_thread::sleep_for(delay);
        } else if (slow && delay.count() > 0) {
            std::mutex m;
            std::condition_variable_any cv;
            std::unique_lock lock(m);
            cv.wait_for(lock, stop, delay, [] { return false; });
        }
        if (error) return std::unexpected(*error);
        return reply;
    }

    std::mutex mutex;
    std::string reply = "Sounds good, see you there!";
    std::optional<Failure> error;
    std::chrono::milliseconds delay{0};
    bool ignore_stop = false;
    int slow_calls = 1000; // only the first slow_calls calls are delayed
    std::function<void()> on_call;
    std::vector<ReplyRequest> requests;
    std::atomic<int> calls{0};
};

class FakeHotkeySource : public HotkeySource {
public:
    std::expected<void, std::string> register_bindings(const HotkeyBindings& bindings) override {
        if (!fail_with.empty()) return std::unexpected(fail_with);
        registered = bindings;
        active = true;
        return {};
    }
    void unregister_bindings() override { active = false; }
    int event_fd() const override { return -1; }
    std::vector<HotkeyPress> read_presses() override {
        auto out = std::move(pending);
        pending.clear();
        return out;
    }

    std::string fail_with;
    std::optional<HotkeyBindings> registered;
    bool active = false;
    std::vector<HotkeyPress> pending;
};

class FakeNotifier : public Notifier {
public:
    std::expected<void, std::string> notify(const std::string& summary, const std::string& body) override {
        sent.emplace_back(summary, body);
        return {};
    }

    std::vector<std::pair<std::string, std::string>> sent;
};
