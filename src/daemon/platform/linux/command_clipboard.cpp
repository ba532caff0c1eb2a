#include "platform/linux/command_clipboard.hpp"

#include "platform/linux/subprocess.hpp"

#include <chrono>

CommandClipboard::CommandClipboard(std::vector<std::string> argv)
    : argv_(std::move(argv)) {}

std::expected<void, std::string> CommandClipboard::set_text(const std::string& text) {
    platform::RunOptions opts;
    opts.input = text;
    opts.timeout = std::chrono::seconds(5);

    auto res = platform::run_process(argv_, opts);
    if (!res) return std::unexpected(res.error());
    if (res->timed_out) return std::unexpected(argv_.front() + " timed out");
    if (res->exit_code == 127) return std::unexpected(argv_.front() + " is not installed");
    if (res->exit_code != 0) {
        return std::unexpected(argv_.front() + " exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
