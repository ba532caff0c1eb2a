#include <catch2/catch_test_macros.hpp>

#include "platform/linux/procfs.hpp"
#include "platform/linux/subprocess.hpp"

#include <chrono>
#include <cstdio>
#include <stop_token>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

TEST_CASE("Process names", "[procfs]") {

    SECTION("OwnExecutable") {
        auto name = platform::process_name(getpid());
        REQUIRE_FALSE(name.empty());
        REQUIRE(name.find('/') == std::string::npos);
    }

    SECTION("FallsBackToWindowClass") {
        REQUIRE(platform::process_name(0, "TelegramDesktop") == "telegramdesktop");
        REQUIRE(platform::process_name(-1, "").empty());
    }
}

TEST_CASE("Subprocess", "[process]") {

    SECTION("CapturesOutputAndFeedsInput") {
        platform::RunOptions opts;
        opts.input = "hello\nworld\n";
        opts.capture_output = true;
        opts.timeout = 5s;
        auto res = platform::run_process({"cat"}, opts);
        REQUIRE(res);
        REQUIRE(res->ok());
        REQUIRE(res->output == "hello\nworld\n");
    }

    SECTION("ExitCode") {
        auto res = platform::run_process({"sh", "-c", "exit 3"});
        REQUIRE(res);
        REQUIRE(res->exit_code == 3);
        REQUIRE_FALSE(res->ok());
    }

    SECTION("MissingProgramIs127") {
        auto res = platform::run_process({"ra-test-no-such-program"});
        REQUIRE(res);
        REQUIRE(res->exit_code == 127);
        REQUIRE_FALSE(platform::find_program("ra-test-no-such-program"));
        REQUIRE(platform::find_program("sh"));
    }

    SECTION("TimeoutKills") {
        platform::RunOptions opts;
        opts.timeout = 100ms;
        auto start = std::chrono::steady_clock::now();
        auto res = platform::run_process({"sleep", "10"}, opts);
        REQUIRE(res);
        REQUIRE(res->timed_out);
        REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    }

    SECTION("StopKills") {
        std::stop_source stop;
        platform::RunOptions opts;
        opts.stop = stop.get_token();
        std::jthread canceller([&stop] {
            std::this_thread::sleep_for(100ms);
            stop.request_stop();
        });
        auto res = platform::run_process({"sleep", "10"}, opts);
        REQUIRE(res);
        REQUIRE(res->cancelled);
    }
}
