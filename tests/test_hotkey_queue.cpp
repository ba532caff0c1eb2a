#include <catch2/catch_test_macros.hpp>

#include "hotkey/hotkey_queue.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

using namespace std::chrono_literals;

namespace {

QueuedEvent queued(uint64_t seq, HotkeyKind kind = HotkeyKind::Quick) {
    return {seq, HotkeyEvent{.kind = kind, .pressed_at = std::chrono::steady_clock::now()}};
}

} // namespace

TEST_CASE("Hotkey queue", "[hotkey]") {
    HotkeyQueue queue;

    SECTION("NewestPressWins") {
        REQUIRE(queue.push(queued(1)).empty());
        auto dropped = queue.push(queued(2, HotkeyKind::DeepScan));
        REQUIRE(dropped.size() == 1);
        REQUIRE(dropped[0].seq == 1);

        auto next = queue.wait_pop(std::stop_token{}, [](const QueuedEvent&) {});
        REQUIRE(next);
        REQUIRE(next->seq == 2);
        REQUIRE(next->event.kind == HotkeyKind::DeepScan);
        REQUIRE(queue.drain().empty());
    }

    SECTION("StopWakesConsumer") {
        std::stop_source stop;
        std::optional<QueuedEvent> result = queued(99);
        std::jthread consumer([&] {
            result = queue.wait_pop(stop.get_token(), [](const QueuedEvent&) {});
        });
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
        consumer.join();
        REQUIRE_FALSE(result);
    }

    SECTION("DrainWaitsForPopCallback") {
        queue.push(queued(7));
        std::atomic<bool> entered{false};
        std::atomic<bool> published{false};

        std::jthread consumer([&] {
            queue.wait_pop(std::stop_token{}, [&](const QueuedEvent& event) {
                entered = true;
                std::this_thread::sleep_for(50ms);
                published = event.seq == 7;
            });
        });

        while (!entered.load()) std::this_thread::yield();
        auto drained = queue.drain();
        REQUIRE(drained.empty());
        REQUIRE(published.load());
    }
}
