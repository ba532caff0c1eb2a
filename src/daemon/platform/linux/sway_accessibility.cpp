#include "platform/linux/sway_accessibility.hpp"

#include "platform/linux/procfs.hpp"

SwayAccessibility::SwayAccessibility(std::shared_ptr<SwayIpc> sway, std::unique_ptr<AtspiReader> atspi)
    : sway_(std::move(sway)), atspi_(std::move(atspi)) {}

std::expected<FocusedTarget, Failure> SwayAccessibility::focused_target() {
    auto window = sway_->focused_window();
    if (!window) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, window.error()});
    }

    FocusedTarget target;
    target.handle = std::to_string(window->id);
    target.pid = window->pid;
    target.process_name = platform::process_name(
        window->pid, window->app_id.empty() ? window->window_class : window->app_id);
    target.window_bounds = window->rect;
    target.control_bounds = atspi_->quick_region(window->pid, window->rect);
    return target;
}

std::string SwayAccessibility::focused_window_id() {
    auto window = sway_->focused_window();
    return window ? std::to_string(window->id) : std::string{};
}

std::expected<std::vector<std::string>, Failure>
SwayAccessibility::read_text(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) {
    if (target.pid <= 0) {
        return std::unexpected(Failure{ErrorKind::Unsupported, "window has no owning process"});
    }
    return atspi_->read_text(target.pid, scope, stop);
}
