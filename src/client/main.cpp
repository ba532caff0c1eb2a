#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  quick [--wait]   Reply using the focused conversation pane");
    std::println(stderr, "  deep [--wait]    Reply using the whole application window");
    std::println(stderr, "  cancel           Cancel the request in flight");
    std::println(stderr, "  status           Show daemon status");
    std::println(stderr, "Options:");
    std::println(stderr, "  --wait           Block until the reply has been delivered");
}

static void print_outcome(const json& outcome) {
    auto seq = outcome.value("seq", uint64_t{0});
    auto kind = outcome.value("kind", "");
    if (outcome.value("status", "") == "ok") {
        std::println("#{} {}: {} characters via {} ({}, {:.1f}s)", seq, kind,
                     outcome.value("code_points", 0), outcome.value("mechanism", "?"),
                     outcome.value("method", "?"), outcome.value("round_trip", 0.0));
    } else {
        std::println("#{} {}: {} ({})", seq, kind, outcome.value("error", "error"),
                     outcome.value("message", ""));
        if (outcome.value("clipboard", false)) {
            std::println("The reply was left on the clipboard.");
        }
    }
}

int main(int argc, char* argv[]) {
    std::string command;
    bool wait = false;
    bool from_hotkey = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--wait" || arg == "-w") {
            wait = true;
        } else if (arg == "--hotkey") {
            // Set by the sway bindings this daemon installs.
            from_hotkey = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        usage(argv[0]);
        return 1;
    }

    json cmd;
    if (command == "quick" || command == "deep") {
        cmd = {{"cmd", command}};
        if (wait) cmd["wait"] = true;
        if (from_hotkey) cmd["source"] = "hotkey";
    } else if (command == "cancel" || command == "status") {
        cmd = {{"cmd", command}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (auto connected = client.connect(sock_path); !connected) {
        std::println(stderr, "Failed to connect to daemon at {}: {}", sock_path, connected.error());
        std::println(stderr, "Is reply-anywhere running?");
        return 1;
    }

    auto reply = client.request(cmd);
    if (!reply) {
        std::println(stderr, "No response from daemon ({})", recv_error_name(reply.error()));
        return 1;
    }
    json& response = *reply;

    auto status = response.value("status", "");

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        std::println("Platform: {}", response.value("platform", "unknown"));
        if (response.contains("last")) {
            std::print("Last: ");
            print_outcome(response["last"]);
        }
    } else if (command == "cancel") {
        std::println("{}", response.value("cancelled", false) ? "Cancelled" : "Nothing to cancel");
    } else if (status == "ignored") {
        std::println("Ignored ({})", response.value("message", ""));
    } else if (status == "error" && !response.contains("seq")) {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    } else if (wait) {
        print_outcome(response);
        if (status != "ok") return response.value("error", "") == "cancelled" ? 2 : 1;
    } else if (status == "ok") {
        if (!from_hotkey) std::println("Queued {} request #{}", command, response.value("seq", uint64_t{0}));
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
