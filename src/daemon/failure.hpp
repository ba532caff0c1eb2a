#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    PermissionDenied,
    Unsupported,
    CaptureFailed,
    NoTextFound,
    AiFailure,
    FocusChanged,
    InjectionFailed,
    Cancelled,
};

struct Failure {
    ErrorKind kind;
    std::string message;
};

inline std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PermissionDenied: return "permission-denied";
        case ErrorKind::Unsupported: return "unsupported";
        case ErrorKind::CaptureFailed: return "capture-failed";
        case ErrorKind::NoTextFound: return "no-text-found";
        case ErrorKind::AiFailure: return "ai-failure";
        case ErrorKind::FocusChanged: return "focus-changed";
        case ErrorKind::InjectionFailed: return "injection-failed";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

// Whether the next stage of the capture fallback chain should be tried.
inline bool triggers_fallback(ErrorKind kind) {
    return kind == ErrorKind::Unsupported || kind == ErrorKind::PermissionDenied;
}
