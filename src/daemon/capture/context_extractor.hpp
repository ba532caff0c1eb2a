#pragma once

#include "capture/context_provider.hpp"
#include "capture/conversation_context.hpp"
#include "failure.hpp"
#include "hotkey/hotkey_event.hpp"
#include "platform/accessibility.hpp"

#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

// Runs the providers in order and returns the first non-empty capture.
// Only Unsupported and PermissionDenied move on to the next provider; when
// every provider fails, PermissionDenied wins over the last error because the
// user can act on it.
class ContextExtractor {
public:
    ContextExtractor(Accessibility& accessibility,
                     std::vector<std::unique_ptr<ContextProvider>> providers,
                     bool verbose = false);

    std::expected<ConversationContext, Failure> extract(HotkeyKind kind, std::stop_token stop);

private:
    void log(const std::string& msg);

    Accessibility& accessibility_;
    std::vector<std::unique_ptr<ContextProvider>> providers_;
    bool verbose_;
};
