#include "capture/context_extractor.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <print>

namespace {

Failure cancelled() {
    return {ErrorKind::Cancelled, "capture cancelled"};
}

} // namespace

ContextExtractor::ContextExtractor(Accessibility& accessibility,
                                   std::vector<std::unique_ptr<ContextProvider>> providers,
                                   bool verbose)
    : accessibility_(accessibility), providers_(std::move(providers)), verbose_(verbose) {}

std::expected<ConversationContext, Failure>
ContextExtractor::extract(HotkeyKind kind, std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();

    if (stop.stop_requested()) return std::unexpected(cancelled());

    auto target = accessibility_.focused_target();
    if (!target) return std::unexpected(target.error());

    auto scope = scope_for(kind);
    std::optional<Failure> permission_error;
    std::optional<Failure> last_error;

    for (auto& provider : providers_) {
        if (stop.stop_requested()) return std::unexpected(cancelled());

        auto lines = provider->capture(*target, scope, stop);
        if (lines && lines->empty()) {
            lines = std::unexpected(Failure{ErrorKind::Unsupported,
                                            std::string(provider->name()) + " returned no text"});
        }

        if (lines) {
            // A stage that finished after cancellation must not leak its result.
            if (stop.stop_requested()) return std::unexpected(cancelled());

            ConversationContext ctx;
            ctx.target = std::move(*target);
            ctx.method = provider->method();
            ctx.scope = scope;
            for (auto& line : *lines) {
                ctx.fragments.push_back({std::move(line), provider->method()});
            }
            ctx.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);

            log(std::format("captured {} fragments from {} via {} in {} ms",
                            ctx.fragments.size(), ctx.target.process_name,
                            provider->name(), ctx.elapsed.count()));
            return ctx;
        }

        auto& err = lines.error();
        if (err.kind == ErrorKind::Cancelled) return std::unexpected(err);

        log(std::format("{} failed ({}): {}", provider->name(), error_kind_name(err.kind), err.message));

        if (err.kind == ErrorKind::PermissionDenied) permission_error = err;
        last_error = err;

        if (!triggers_fallback(err.kind)) break;
    }

    if (permission_error) return std::unexpected(*permission_error);
    if (last_error) return std::unexpected(*last_error);
    return std::unexpected(Failure{ErrorKind::CaptureFailed, "no capture method configured"});
}

void ContextExtractor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[reply-anywhere] {}", msg);
    }
}
