#pragma once

#include "capture/focused_target.hpp"
#include "failure.hpp"

#include <expected>
#include <stop_token>
#include <string>
#include <vector>

class Accessibility {
public:
    virtual ~Accessibility() = default;

    // Resolves the window and control that currently own keyboard focus,
    // including their bounds. Always a fresh query.
    virtual std::expected<FocusedTarget, Failure> focused_target() = 0;

    // Window handle only; stamps hotkey events and re-checks focus before
    // typing. Empty on failure. Must not block on the accessibility bus: it
    // runs on the event loop thread while a capture may be in progress.
    virtual std::string focused_window_id() = 0;

    // Unsupported: nothing readable. PermissionDenied: accessibility bus off.
    virtual std::expected<std::vector<std::string>, Failure>
        read_text(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) = 0;
};
