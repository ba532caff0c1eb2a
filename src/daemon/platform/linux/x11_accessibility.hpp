#pragma once

#include "platform/accessibility.hpp"
#include "platform/linux/atspi_reader.hpp"
#include "platform/linux/x11_display.hpp"

#include <memory>
#include <mutex>

class X11Accessibility : public Accessibility {
public:
    explicit X11Accessibility(std::unique_ptr<AtspiReader> atspi);

    // False when no display can be opened.
    bool connect();

    std::expected<FocusedTarget, Failure> focused_target() override;
    std::string focused_window_id() override;
    std::expected<std::vector<std::string>, Failure>
        read_text(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) override;

private:
    // Xlib half of focused_target(): handle, pid, process and window bounds.
    std::expected<FocusedTarget, Failure> window_target();
    unsigned long active_window();
    unsigned long cardinal_property(unsigned long window, const char* name, unsigned long type);

    std::unique_ptr<AtspiReader> atspi_;
    std::mutex mutex_; // guards display_ only
    platform::x11::DisplayPtr display_;
};
