#pragma once

#include "platform/notifier.hpp"

// Desktop notifications through notify-send.
class DesktopNotifier : public Notifier {
public:
    std::expected<void, std::string> notify(const std::string& summary,
                                            const std::string& body) override;
};
