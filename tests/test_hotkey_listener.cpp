#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "hotkey/hotkey_listener.hpp"

#include <vector>

using namespace std::chrono_literals;

namespace {

HotkeyBindings default_bindings() {
    return {*HotkeyBinding::parse("ctrl+shift+r"), *HotkeyBinding::parse("ctrl+shift+e")};
}

} // namespace

TEST_CASE("Hotkey listener", "[hotkey]") {
    FakeHotkeySource source;
    std::vector<HotkeyEvent> events;
    HotkeyListener listener(source, default_bindings(), 300ms,
                            [&](HotkeyEvent e) { events.push_back(std::move(e)); },
                            [] { return std::string("win-7"); });

    SECTION("StartRegistersBindings") {
        REQUIRE(listener.start());
        REQUIRE(source.active);
        REQUIRE(source.registered->quick.key == "r");
        listener.stop();
        REQUIRE_FALSE(source.active);
    }

    SECTION("RegistrationFailurePropagates") {
        source.fail_with = "ctrl+shift+r is already grabbed by another application";
        auto res = listener.start();
        REQUIRE_FALSE(res);
        REQUIRE(res.error() == source.fail_with);
        REQUIRE_FALSE(listener.running());
    }

    SECTION("DuplicateBindingsRejected") {
        HotkeyBindings same{*HotkeyBinding::parse("ctrl+r"), *HotkeyBinding::parse("control+R")};
        HotkeyListener dup(source, same, 300ms, {});
        REQUIRE_FALSE(dup.start());
        REQUIRE_FALSE(source.active);
    }

    SECTION("PressBecomesEvent") {
        REQUIRE(listener.start());
        auto t0 = HotkeyListener::Clock::now();
        auto ev = listener.on_press(HotkeyKind::DeepScan, TriggerSource::Hotkey, {}, t0);
        REQUIRE(ev);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].kind == HotkeyKind::DeepScan);
        REQUIRE(events[0].pressed_at == t0);
        // Window id filled in by the focus probe
        REQUIRE(events[0].focused_window == "win-7");
    }

    SECTION("RepeatWithinDebounceDropped") {
        REQUIRE(listener.start());
        auto t0 = HotkeyListener::Clock::now();
        REQUIRE(listener.on_press(HotkeyKind::Quick, TriggerSource::Hotkey, "a", t0));
        REQUIRE_FALSE(listener.on_press(HotkeyKind::Quick, TriggerSource::Hotkey, "a", t0 + 100ms));
        REQUIRE_FALSE(listener.on_press(HotkeyKind::Quick, TriggerSource::Hotkey, "a", t0 + 299ms));
        REQUIRE(listener.on_press(HotkeyKind::Quick, TriggerSource::Hotkey, "a", t0 + 300ms));
        REQUIRE(events.size() == 2);
    }

    SECTION("DebounceIsPerKind") {
        REQUIRE(listener.start());
        auto t0 = HotkeyListener::Clock::now();
        REQUIRE(listener.on_press(HotkeyKind::Quick, TriggerSource::Hotkey, "a", t0));
        REQUIRE(listener.on_press(HotkeyKind::DeepScan, TriggerSource::Hotkey, "a", t0 + 10ms));
        REQUIRE(events.size() == 2);
    }

    SECTION("ReadablePressesDispatched") {
        REQUIRE(listener.start());
        source.pending.push_back({HotkeyKind::Quick, "0x3a00007"});
        listener.on_readable();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].focused_window == "0x3a00007");
        REQUIRE(events[0].source == TriggerSource::Hotkey);
    }
}
