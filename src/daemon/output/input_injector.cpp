#include "output/input_injector.hpp"

#include "utf8.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <print>
#include <thread>

InputInjector::InputInjector(Keyboard& keyboard, Clipboard& clipboard,
                             Config::Injection config, bool verbose)
    : keyboard_(keyboard)
    , clipboard_(clipboard)
    , config_(std::move(config))
    , verbose_(verbose) {
    if (config_.chunk_code_points == 0) config_.chunk_code_points = 1;
}

bool InputInjector::is_terminal(std::string_view process_name) const {
    std::string app(process_name);
    std::transform(app.begin(), app.end(), app.begin(), ::tolower);
    if (app.empty()) return false;

    return std::ranges::any_of(config_.terminal_apps, [&app](const std::string& term) {
        return !term.empty() && app.find(term) != std::string::npos;
    });
}

std::vector<std::string> InputInjector::chunk_text(std::string_view text, size_t per_chunk) {
    if (per_chunk == 0) per_chunk = 1;

    std::vector<std::string> chunks;
    std::string current;
    size_t in_current = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        auto cp = utf8::next(text, pos);
        if (cp.bytes.empty()) {
            current += utf8::encode(cp.value);
        } else {
            current += cp.bytes;
        }
        if (++in_current == per_chunk) {
            chunks.push_back(std::move(current));
            current.clear();
            in_current = 0;
        }
    }
    if (!current.empty()) chunks.push_back(std::move(current));
    return chunks;
}

InputInjector::Method InputInjector::choose_method(const FocusedTarget& target, size_t code_points) {
    if (config_.method == "paste") return Method::Paste;

    // Terminals and targets without a typing path only take pastes, whatever
    // the configured method says.
    if (is_terminal(target.process_name)) return Method::Paste;
    if (keyboard_.probe(target) == InjectionCapability::PasteOnly) return Method::Paste;

    if (config_.method == "type") return Method::Type;
    return code_points > config_.max_typed_chars ? Method::Paste : Method::Type;
}

std::expected<void, std::string> InputInjector::paste(const std::string& text, PasteShortcut shortcut) {
    auto copied = clipboard_.set_text(text);
    if (!copied) return copied;

    // Give the clipboard owner a moment to take the selection.
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    return keyboard_.paste(shortcut);
}

std::expected<InjectionOutcome, Failure> InputInjector::inject(const std::string& reply,
                                                               const FocusedTarget& target) {
    auto chunks = chunk_text(reply, config_.chunk_code_points);
    size_t code_points = utf8::length(reply);

    InjectionOutcome outcome;
    outcome.target_valid = !target.empty();
    outcome.code_points = code_points;

    if (chunks.empty()) {
        return std::unexpected(Failure{ErrorKind::InjectionFailed, "empty reply"});
    }

    // Rejoined chunks carry U+FFFD in place of invalid input.
    std::string normalized;
    for (auto& c : chunks) normalized += c;

    auto shortcut = is_terminal(target.process_name) ? PasteShortcut::CtrlShiftV : PasteShortcut::CtrlV;

    if (choose_method(target, code_points) == Method::Paste) {
        auto res = paste(normalized, shortcut);
        if (!res) {
            return std::unexpected(Failure{ErrorKind::InjectionFailed, "paste failed: " + res.error()});
        }
        outcome.mechanism = InjectionMechanism::ClipboardPaste;
        log(std::format("pasted {} code points into {}", code_points, target.process_name));
        return outcome;
    }

    auto delay = std::chrono::milliseconds(config_.keystroke_delay_ms);
    for (size_t i = 0; i < chunks.size(); i++) {
        if (i > 0 && delay.count() > 0) std::this_thread::sleep_for(delay);

        auto res = keyboard_.type_text(chunks[i]);
        if (res) continue;

        if (i == 0) {
            // Nothing reached the application yet, so pasting cannot duplicate text.
            log(std::format("typing refused ({}), falling back to paste", res.error()));
            auto pasted = paste(normalized, shortcut);
            if (!pasted) {
                return std::unexpected(Failure{
                    ErrorKind::InjectionFailed,
                    std::format("typing failed ({}), paste failed ({})", res.error(), pasted.error())});
            }
            outcome.mechanism = InjectionMechanism::ClipboardPaste;
            return outcome;
        }

        return std::unexpected(Failure{
            ErrorKind::InjectionFailed,
            std::format("typing stopped after {} of {} chunks: {}", i, chunks.size(), res.error())});
    }

    outcome.mechanism = InjectionMechanism::SimulatedTyping;
    log(std::format("typed {} code points into {}", code_points, target.process_name));
    return outcome;
}

std::expected<void, Failure> InputInjector::offer_via_clipboard(const std::string& reply) {
    auto res = clipboard_.set_text(reply);
    if (!res) {
        return std::unexpected(Failure{ErrorKind::InjectionFailed, "clipboard unavailable: " + res.error()});
    }
    return {};
}

void InputInjector::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[reply-anywhere] {}", msg);
    }
}
