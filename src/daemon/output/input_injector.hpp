#pragma once

#include "capture/focused_target.hpp"
#include "config.hpp"
#include "failure.hpp"
#include "platform/clipboard.hpp"
#include "platform/keyboard.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

enum class InjectionMechanism { SimulatedTyping, ClipboardPaste };

inline const char* injection_mechanism_name(InjectionMechanism m) {
    return m == InjectionMechanism::SimulatedTyping ? "simulated-typing" : "clipboard-paste";
}

struct InjectionOutcome {
    InjectionMechanism mechanism = InjectionMechanism::SimulatedTyping;
    bool target_valid = false;
    size_t code_points = 0;
};

class InputInjector {
public:
    InputInjector(Keyboard& keyboard, Clipboard& clipboard,
                  Config::Injection config, bool verbose = false);

    // Delivers `reply` to the focused control of `target`, which the caller
    // has just re-validated. Not interruptible once started.
    std::expected<InjectionOutcome, Failure> inject(const std::string& reply,
                                                    const FocusedTarget& target);

    // Leaves the reply on the clipboard for the user to paste by hand.
    std::expected<void, Failure> offer_via_clipboard(const std::string& reply);

    bool is_terminal(std::string_view process_name) const;

    // Groups whole code points into chunks of at most `per_chunk` code points.
    static std::vector<std::string> chunk_text(std::string_view text, size_t per_chunk);

private:
    enum class Method { Type, Paste };

    Method choose_method(const FocusedTarget& target, size_t code_points);
    std::expected<void, std::string> paste(const std::string& text, PasteShortcut shortcut);
    void log(const std::string& msg);

    Keyboard& keyboard_;
    Clipboard& clipboard_;
    Config::Injection config_;
    bool verbose_;
};
