#pragma once

#include "capture/conversation_context.hpp"
#include "failure.hpp"
#include "hotkey/hotkey_event.hpp"

#include <expected>
#include <stop_token>
#include <string>

struct ReplyRequest {
    ConversationContext context;
    HotkeyKind kind = HotkeyKind::Quick;
};

enum class ReplyStatus { Ok, AiFailure, Cancelled };

struct ReplyResult {
    std::string text;
    ReplyStatus status = ReplyStatus::Ok;
    double round_trip_s = 0.0;
};

// The external reply generator. Implementations should honour `stop` but
// callers must not rely on it: the coordinator enforces its own deadline.
class ReplyBackend {
public:
    virtual ~ReplyBackend() = default;
    virtual std::expected<std::string, Failure>
        generate(const ReplyRequest& request, std::stop_token stop) = 0;
};
