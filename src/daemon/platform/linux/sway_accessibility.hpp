#pragma once

#include "platform/accessibility.hpp"
#include "platform/linux/atspi_reader.hpp"
#include "platform/linux/sway_ipc.hpp"

#include <memory>

class SwayAccessibility : public Accessibility {
public:
    SwayAccessibility(std::shared_ptr<SwayIpc> sway, std::unique_ptr<AtspiReader> atspi);

    std::expected<FocusedTarget, Failure> focused_target() override;
    std::string focused_window_id() override;
    std::expected<std::vector<std::string>, Failure>
        read_text(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) override;

private:
    std::shared_ptr<SwayIpc> sway_;
    std::unique_ptr<AtspiReader> atspi_;
};
