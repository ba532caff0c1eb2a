#pragma once

#include "hotkey/hotkey_binding.hpp"
#include "hotkey/hotkey_event.hpp"
#include "platform/hotkey_source.hpp"

#include <array>
#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>

// Turns platform hotkey presses (and control-socket triggers) into typed
// HotkeyEvents. Runs on the event loop thread and never does capture work.
class HotkeyListener {
public:
    using Clock = std::chrono::steady_clock;
    using EventSink = std::function<void(HotkeyEvent)>;
    using FocusProbe = std::function<std::string()>;

    HotkeyListener(HotkeySource& source, HotkeyBindings bindings,
                   std::chrono::milliseconds debounce, EventSink sink,
                   FocusProbe focus_probe = {});
    ~HotkeyListener();

    HotkeyListener(const HotkeyListener&) = delete;
    HotkeyListener& operator=(const HotkeyListener&) = delete;

    // Registration failure is a fatal configuration error for the caller.
    std::expected<void, std::string> start();
    void stop();
    bool running() const { return running_; }

    int event_fd() const { return source_.event_fd(); }

    // Call when event_fd() is readable.
    void on_readable();

    // Returns the event that was posted, or nullopt if the press was debounced.
    std::optional<HotkeyEvent> on_press(HotkeyKind kind, TriggerSource trigger,
                                        std::string focused_window = {},
                                        Clock::time_point now = Clock::now());

    const HotkeyBindings& bindings() const { return bindings_; }

private:
    static size_t index(HotkeyKind kind) { return kind == HotkeyKind::DeepScan ? 1 : 0; }

    HotkeySource& source_;
    HotkeyBindings bindings_;
    std::chrono::milliseconds debounce_;
    EventSink sink_;
    FocusProbe focus_probe_;
    bool running_ = false;
    std::array<std::optional<Clock::time_point>, 2> last_accepted_;
};
