#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "fakes.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

class FakeIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_command(int, json&) override { return ReadStatus::Incomplete; }
    bool send_response(int fd, const json& response) override {
        responses.emplace_back(fd, response);
        return true;
    }
    void close_client(int) override {}

    std::vector<std::pair<int, json>> responses;
};

struct Harness {
    FakeAccessibility* accessibility;
    FakeScreenCapture* screen;
    FakeKeyboard* keyboard;
    FakeClipboard* clipboard;
    FakeHotkeySource* hotkeys;
    FakeBackend* backend;

    PlatformServices platform;
    FakeRecognizer ocr;
    FakeNotifier notifier;
    FakeIpcServer ipc;
    std::atomic<int> wakeups{0};
    std::unique_ptr<DaemonCore> core;

    explicit Harness(Config config = test_config()) {
        auto a = std::make_unique<FakeAccessibility>();
        auto s = std::make_unique<FakeScreenCapture>();
        auto k = std::make_unique<FakeKeyboard>();
        auto c = std::make_unique<FakeClipboard>();
        auto h = std::make_unique<FakeHotkeySource>();
        auto b = std::make_unique<FakeBackend>();
        accessibility = a.get();
        screen = s.get();
        keyboard = k.get();
        clipboard = c.get();
        hotkeys = h.get();
        backend = b.get();

        platform.name = "test";
        platform.accessibility = std::move(a);
        platform.screen = std::move(s);
        platform.keyboard = std::move(k);
        platform.clipboard = std::move(c);
        platform.hotkeys = std::move(h);

        core = std::make_unique<DaemonCore>(std::move(config), false, platform, ocr, notifier, ipc,
                                            [this] { wakeups++; }, std::move(b));
    }

    ~Harness() { core.reset(); }

    static Config test_config() {
        Config cfg;
        cfg.hotkeys.debounce_ms = 0;
        cfg.injection.keystroke_delay_ms = 0;
        cfg.capture.min_text_chars = 10;
        return cfg;
    }

    // Waits for the worker to post `n` outcomes, then drains them the way
    // the event loop does.
    bool settle(int n) {
        for (int i = 0; i < 300 && wakeups.load() < n; i++) std::this_thread::sleep_for(10ms);
        core->on_request_complete();
        return wakeups.load() >= n;
    }
};

} // namespace

TEST_CASE("Daemon core commands", "[daemon]") {
    Harness h;
    REQUIRE(h.core->init());
    REQUIRE(h.hotkeys->active);

    SECTION("StatusWhenIdle") {
        auto resp = h.core->handle_command("status", {{"cmd", "status"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["state"] == "idle");
        REQUIRE(resp["platform"] == "test");
        REQUIRE_FALSE(resp.contains("last"));
    }

    SECTION("QuickRunsToCompletion") {
        auto resp = h.core->handle_command("quick", {{"cmd", "quick"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["seq"] == 1);
        REQUIRE(resp["kind"] == "quick");

        REQUIRE(h.settle(1));
        REQUIRE(h.keyboard->typed_text() == h.backend->reply);

        auto status = h.core->handle_command("status", {{"cmd", "status"}});
        REQUIRE(status["last"]["status"] == "ok");
        REQUIRE(status["last"]["seq"] == 1);
        REQUIRE(status["last"]["method"] == "accessibility");
        REQUIRE(status["last"]["mechanism"] == "simulated-typing");
        REQUIRE(h.notifier.sent.empty());
    }

    SECTION("WaitingClientGetsOutcome") {
        auto resp = h.core->handle_command("deep", {{"cmd", "deep"}, {"wait", true}});
        REQUIRE(resp["status"] == "pending");
        auto seq = resp["seq"].get<uint64_t>();
        h.core->add_waiting_client(7, seq);

        REQUIRE(h.settle(1));
        REQUIRE(h.ipc.responses.size() == 1);
        REQUIRE(h.ipc.responses[0].first == 7);
        REQUIRE(h.ipc.responses[0].second["seq"] == seq);
        REQUIRE(h.ipc.responses[0].second["kind"] == "deep");
        REQUIRE(h.ipc.responses[0].second["status"] == "ok");
    }

    SECTION("DisconnectedWaiterIsForgotten") {
        auto resp = h.core->handle_command("quick", {{"cmd", "quick"}, {"wait", true}});
        h.core->add_waiting_client(9, resp["seq"].get<uint64_t>());
        h.core->remove_waiting_client(9);
        REQUIRE(h.settle(1));
        REQUIRE(h.ipc.responses.empty());
    }

    SECTION("HotkeyTriggerAccepted") {
        auto resp = h.core->handle_command("quick", {{"cmd", "quick"}, {"source", "hotkey"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(h.settle(1));
    }

    SECTION("UnknownCommand") {
        auto resp = h.core->handle_command("reboot", {{"cmd", "reboot"}});
        REQUIRE(resp["status"] == "error");
    }

    SECTION("CancelWhenIdle") {
        auto resp = h.core->handle_command("cancel", {{"cmd", "cancel"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["cancelled"] == false);
    }
}

TEST_CASE("Daemon core notifications", "[daemon]") {

    SECTION("PermissionDeniedNotifiedOncePerSession") {
        Harness h;
        h.accessibility->read_error = Failure{ErrorKind::PermissionDenied, "enable accessibility"};
        h.screen->error = Failure{ErrorKind::CaptureFailed, "window minimized"};
        REQUIRE(h.core->init());

        h.core->handle_command("quick", {{"cmd", "quick"}});
        REQUIRE(h.settle(1));
        h.core->handle_command("quick", {{"cmd", "quick"}});
        REQUIRE(h.settle(2));

        REQUIRE(h.notifier.sent.size() == 1);
        REQUIRE(h.notifier.sent[0].first == "Permission needed");
        REQUIRE(h.notifier.sent[0].second == "enable accessibility");
    }

    SECTION("FailuresNotifyUser") {
        Harness h;
        h.backend->error = Failure{ErrorKind::AiFailure, "backend returned HTTP 503"};
        REQUIRE(h.core->init());

        h.core->handle_command("quick", {{"cmd", "quick"}});
        REQUIRE(h.settle(1));
        REQUIRE(h.notifier.sent.size() == 1);
        REQUIRE(h.notifier.sent[0].first == "No reply generated");
    }

    SECTION("InjectionFailureMentionsClipboard") {
        Harness h;
        h.keyboard->fail_after = 1;
        REQUIRE(h.core->init());

        h.core->handle_command("quick", {{"cmd", "quick"}});
        REQUIRE(h.settle(1));
        REQUIRE(h.notifier.sent.size() == 1);
        REQUIRE(h.notifier.sent[0].second.find("clipboard") != std::string::npos);
    }

    SECTION("CancellationIsSilent") {
        Harness h;
        h.backend->delay = 5s;
        REQUIRE(h.core->init());

        h.core->handle_command("quick", {{"cmd", "quick"}});
        for (int i = 0; i < 300 && h.backend->calls.load() == 0; i++) std::this_thread::sleep_for(10ms);
        auto resp = h.core->handle_command("cancel", {{"cmd", "cancel"}});
        REQUIRE(resp["cancelled"] == true);
        REQUIRE(h.settle(1));
        REQUIRE(h.notifier.sent.empty());
    }

    SECTION("DisabledNotifications") {
        auto cfg = Harness::test_config();
        cfg.notifications.enabled = false;
        Harness h(cfg);
        h.backend->error = Failure{ErrorKind::AiFailure, "boom"};
        REQUIRE(h.core->init());

        h.core->handle_command("quick", {{"cmd", "quick"}});
        REQUIRE(h.settle(1));
        REQUIRE(h.notifier.sent.empty());
    }
}

TEST_CASE("Daemon core startup", "[daemon]") {

    SECTION("BadHotkeyRejected") {
        auto cfg = Harness::test_config();
        cfg.hotkeys.quick = "hyper+r";
        Harness h(cfg);
        REQUIRE_FALSE(h.core->init());
    }

    SECTION("GrabFailureRejected") {
        Harness h;
        h.hotkeys->fail_with = "ctrl+shift+r is already grabbed by another application";
        REQUIRE_FALSE(h.core->init());
    }
}

TEST_CASE("Outcome JSON", "[daemon]") {

    SECTION("Success") {
        RequestOutcome o;
        o.seq = 4;
        o.kind = HotkeyKind::DeepScan;
        o.capture_method = CaptureMethod::Ocr;
        o.injection = InjectionOutcome{InjectionMechanism::ClipboardPaste, true, 12};
        o.reply_chars = 12;
        o.round_trip_s = 1.5;

        auto j = DaemonCore::outcome_json(o);
        REQUIRE(j["status"] == "ok");
        REQUIRE(j["seq"] == 4);
        REQUIRE(j["kind"] == "deep");
        REQUIRE(j["state"] == "idle");
        REQUIRE(j["method"] == "ocr");
        REQUIRE(j["mechanism"] == "clipboard-paste");
        REQUIRE(j["code_points"] == 12);
        REQUIRE(j["round_trip"] == 1.5);
        REQUIRE_FALSE(j.contains("error"));
    }

    SECTION("Failure") {
        RequestOutcome o;
        o.seq = 5;
        o.final_state = CoordinatorState::Cancelled;
        o.failure = Failure{ErrorKind::Cancelled, "superseded by a newer request"};

        auto j = DaemonCore::outcome_json(o);
        REQUIRE(j["status"] == "error");
        REQUIRE(j["state"] == "cancelled");
        REQUIRE(j["error"] == "cancelled");
        REQUIRE(j["message"] == "superseded by a newer request");
        REQUIRE_FALSE(j.contains("clipboard"));
    }
}
