#include "hotkey/hotkey_listener.hpp"

HotkeyListener::HotkeyListener(HotkeySource& source, HotkeyBindings bindings,
                               std::chrono::milliseconds debounce, EventSink sink,
                               FocusProbe focus_probe)
    : source_(source), bindings_(std::move(bindings)), debounce_(debounce),
      sink_(std::move(sink)), focus_probe_(std::move(focus_probe)) {}

HotkeyListener::~HotkeyListener() {
    stop();
}

std::expected<void, std::string> HotkeyListener::start() {
    if (running_) return {};

    if (bindings_.quick == bindings_.deep) {
        return std::unexpected("quick and deep hotkeys are both " + bindings_.quick.to_string());
    }

    auto res = source_.register_bindings(bindings_);
    if (!res) return res;

    last_accepted_ = {};
    running_ = true;
    return {};
}

void HotkeyListener::stop() {
    if (!running_) return;
    source_.unregister_bindings();
    running_ = false;
}

void HotkeyListener::on_readable() {
    for (auto& press : source_.read_presses()) {
        on_press(press.kind, TriggerSource::Hotkey, std::move(press.focused_window));
    }
}

std::optional<HotkeyEvent> HotkeyListener::on_press(HotkeyKind kind, TriggerSource trigger,
                                                    std::string focused_window,
                                                    Clock::time_point now) {
    auto& last = last_accepted_[index(kind)];
    if (last && now - *last < debounce_) {
        return std::nullopt;
    }
    last = now;

    if (focused_window.empty() && focus_probe_) {
        focused_window = focus_probe_();
    }

    HotkeyEvent event{
        .kind = kind,
        .pressed_at = now,
        .focused_window = std::move(focused_window),
        .source = trigger,
    };
    if (sink_) sink_(event);
    return event;
}
