#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "output/input_injector.hpp"

namespace {

Config::Injection fast_config() {
    Config::Injection cfg;
    cfg.keystroke_delay_ms = 0;
    cfg.chunk_code_points = 4;
    return cfg;
}

} // namespace

TEST_CASE("Chunking keeps code points whole", "[injector]") {

    SECTION("MultiByteNeverSplit") {
        // 2, 3 and 4 byte sequences mixed with ASCII
        std::string text = "h\xC3\xA9llo \xE4\xB8\x96\xE7\x95\x8C \xF0\x9F\x91\x8B!";
        auto chunks = InputInjector::chunk_text(text, 1);
        REQUIRE(chunks.size() == 11);
        REQUIRE(chunks[1] == "\xC3\xA9");
        REQUIRE(chunks[6] == "\xE4\xB8\x96");
        REQUIRE(chunks[9] == "\xF0\x9F\x91\x8B");

        std::string joined;
        for (auto& c : InputInjector::chunk_text(text, 3)) joined += c;
        REQUIRE(joined == text);
    }

    SECTION("InvalidBytesReplaced") {
        auto chunks = InputInjector::chunk_text("a\xFF" "b", 8);
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0] == "a\xEF\xBF\xBD" "b");
    }

    SECTION("TruncatedSequenceReplaced") {
        auto chunks = InputInjector::chunk_text("ok\xE2\x82", 1);
        REQUIRE(chunks.size() == 4);
        REQUIRE(chunks[2] == "\xEF\xBF\xBD");
        REQUIRE(chunks[3] == "\xEF\xBF\xBD");
    }

    SECTION("EmptyInput") {
        REQUIRE(InputInjector::chunk_text("", 4).empty());
    }
}

TEST_CASE("Input injector", "[injector]") {
    FakeKeyboard keyboard;
    FakeClipboard clipboard;
    auto target = make_target("win-1", "signal-desktop");

    SECTION("TypedTextRoundTrips") {
        InputInjector injector(keyboard, clipboard, fast_config());
        std::string reply = "Grüße aus Köln \xF0\x9F\x8E\x89 — 東京で会いましょう";
        auto res = injector.inject(reply, target);
        REQUIRE(res);
        REQUIRE(res->mechanism == InjectionMechanism::SimulatedTyping);
        REQUIRE(res->target_valid);
        REQUIRE(keyboard.typed_text() == reply);
        REQUIRE(keyboard.chunks.size() > 1);
        REQUIRE(keyboard.pastes.empty());
        REQUIRE(clipboard.sets == 0);
    }

    SECTION("FirstChunkFailureFallsBackToPaste") {
        keyboard.fail_after = 0;
        InputInjector injector(keyboard, clipboard, fast_config());
        auto res = injector.inject("hello there", target);
        REQUIRE(res);
        REQUIRE(res->mechanism == InjectionMechanism::ClipboardPaste);
        REQUIRE(clipboard.contents == "hello there");
        REQUIRE(keyboard.pastes == std::vector<PasteShortcut>{PasteShortcut::CtrlV});
    }

    SECTION("LaterChunkFailureIsNotRetried") {
        keyboard.fail_after = 1;
        InputInjector injector(keyboard, clipboard, fast_config());
        auto res = injector.inject("hello there", target);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::InjectionFailed);
        REQUIRE(keyboard.typed_text() == "hell");
        REQUIRE(keyboard.pastes.empty());
    }

    SECTION("PasteOnlyTargetsPaste") {
        keyboard.capability = InjectionCapability::PasteOnly;
        InputInjector injector(keyboard, clipboard, fast_config());
        auto res = injector.inject("hi", target);
        REQUIRE(res);
        REQUIRE(res->mechanism == InjectionMechanism::ClipboardPaste);
        REQUIRE(keyboard.chunks.empty());
    }

    SECTION("TerminalsPasteWithShift") {
        InputInjector injector(keyboard, clipboard, fast_config());
        auto res = injector.inject("ls -la", make_target("win-2", "Alacritty"));
        REQUIRE(res);
        REQUIRE(res->mechanism == InjectionMechanism::ClipboardPaste);
        REQUIRE(keyboard.pastes == std::vector<PasteShortcut>{PasteShortcut::CtrlShiftV});
    }

    SECTION("LongRepliesArePasted") {
        auto cfg = fast_config();
        cfg.max_typed_chars = 5;
        InputInjector injector(keyboard, clipboard, cfg);
        auto res = injector.inject("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9", target);
        REQUIRE(res);
        // Five code points is still within the limit even though it is ten bytes.
        REQUIRE(res->mechanism == InjectionMechanism::SimulatedTyping);

        res = injector.inject("abcdef", target);
        REQUIRE(res);
        REQUIRE(res->mechanism == InjectionMechanism::ClipboardPaste);
    }

    SECTION("ConfiguredMethods") {
        auto cfg = fast_config();
        cfg.method = "paste";
        InputInjector paster(keyboard, clipboard, cfg);
        REQUIRE(paster.inject("hi", target)->mechanism == InjectionMechanism::ClipboardPaste);

        cfg.method = "type";
        cfg.max_typed_chars = 1;
        InputInjector typist(keyboard, clipboard, cfg);
        REQUIRE(typist.inject("hello", target)->mechanism == InjectionMechanism::SimulatedTyping);
    }

    SECTION("PasteFailureReported") {
        keyboard.capability = InjectionCapability::PasteOnly;
        keyboard.paste_fails = true;
        InputInjector injector(keyboard, clipboard, fast_config());
        auto res = injector.inject("hi", target);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::InjectionFailed);
    }

    SECTION("EmptyReplyRejected") {
        InputInjector injector(keyboard, clipboard, fast_config());
        auto res = injector.inject("", target);
        REQUIRE_FALSE(res);
        REQUIRE(keyboard.chunks.empty());
    }

    SECTION("OfferViaClipboard") {
        InputInjector injector(keyboard, clipboard, fast_config());
        REQUIRE(injector.offer_via_clipboard("draft reply"));
        REQUIRE(clipboard.contents == "draft reply");

        clipboard.fails = true;
        auto res = injector.offer_via_clipboard("draft reply");
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::InjectionFailed);
    }

    SECTION("TerminalMatching") {
        InputInjector injector(keyboard, clipboard, fast_config());
        REQUIRE(injector.is_terminal("gnome-terminal-server"));
        REQUIRE(injector.is_terminal("KITTY"));
        REQUIRE_FALSE(injector.is_terminal("firefox"));
        REQUIRE_FALSE(injector.is_terminal(""));
    }
}
