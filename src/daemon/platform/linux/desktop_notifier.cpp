#include "platform/linux/desktop_notifier.hpp"

#include "platform/linux/subprocess.hpp"

#include <chrono>

std::expected<void, std::string> DesktopNotifier::notify(const std::string& summary,
                                                         const std::string& body) {
    platform::RunOptions opts;
    opts.timeout = std::chrono::seconds(2);

    auto res = platform::run_process(
        {"notify-send", "--app-name=reply-anywhere", "--", summary, body}, opts);
    if (!res) return std::unexpected(res.error());
    if (!res->ok()) {
        return std::unexpected("notify-send exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
