#include <catch2/catch_test_macros.hpp>

#include "platform/linux/sway_hotkeys.hpp"
#include "platform/linux/sway_ipc.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Trimmed GET_TREE reply: one workspace with a tiled and a floating window.
json sample_tree(bool floating_focused) {
    return json::parse(R"({
        "id": 1, "type": "root", "focused": false,
        "nodes": [{
            "id": 2, "type": "output", "focused": false,
            "nodes": [{
                "id": 3, "type": "workspace", "focused": false,
                "nodes": [{
                    "id": 10, "type": "con", "focused": false,
                    "app_id": "kitty", "name": "~", "pid": 100,
                    "rect": {"x": 0, "y": 0, "width": 960, "height": 1080}
                }],
                "floating_nodes": [{
                    "id": 11, "type": "floating_con", "focused": false,
                    "app_id": null, "name": "Telegram", "pid": 200,
                    "window_properties": {"class": "TelegramDesktop"},
                    "rect": {"x": 100, "y": 50, "width": 800, "height": 600}
                }]
            }]
        }]
    })").patch(json::array({
        {{"op", "replace"},
         {"path", floating_focused ? "/nodes/0/nodes/0/floating_nodes/0/focused"
                                   : "/nodes/0/nodes/0/nodes/0/focused"},
         {"value", true}}}));
}

} // namespace

TEST_CASE("Sway tree", "[sway]") {

    SECTION("FindsTiledWindow") {
        auto w = SwayIpc::find_focused(sample_tree(false));
        REQUIRE(w);
        REQUIRE(w->id == 10);
        REQUIRE(w->app_id == "kitty");
        REQUIRE(w->pid == 100);
        REQUIRE(w->rect == Rect{0, 0, 960, 1080});
    }

    SECTION("FindsFloatingXwaylandWindow") {
        auto w = SwayIpc::find_focused(sample_tree(true));
        REQUIRE(w);
        REQUIRE(w->id == 11);
        REQUIRE(w->app_id.empty());
        REQUIRE(w->window_class == "TelegramDesktop");
        REQUIRE(w->rect == Rect{100, 50, 800, 600});
    }

    SECTION("FocusedWorkspaceIsNotAWindow") {
        auto tree = sample_tree(false);
        tree["nodes"][0]["nodes"][0]["nodes"][0]["focused"] = false;
        tree["nodes"][0]["nodes"][0]["focused"] = true;
        REQUIRE_FALSE(SwayIpc::find_focused(tree));
    }
}

TEST_CASE("Sway command replies", "[sway]") {
    REQUIRE(SwayIpc::parse_command_reply(R"([{"success": true}, {"success": true}])"));

    auto failed = SwayIpc::parse_command_reply(
        R"([{"success": false, "parse_error": true, "error": "Unknown/invalid command"}])");
    REQUIRE_FALSE(failed);
    REQUIRE(failed.error() == "Unknown/invalid command");

    REQUIRE_FALSE(SwayIpc::parse_command_reply(R"({"success": true})"));
    REQUIRE_FALSE(SwayIpc::parse_command_reply("garbage"));
}

TEST_CASE("Sway bindings", "[sway]") {
    auto binding = HotkeyBinding::parse("super+shift+r");
    REQUIRE(binding);
    REQUIRE(SwayHotkeys::bind_command(*binding, "reply-anywhere-ctl", HotkeyKind::Quick) ==
            "bindsym --no-repeat Mod4+Shift+r exec reply-anywhere-ctl --hotkey quick");
    REQUIRE(SwayHotkeys::bind_command(*binding, "/opt/bin/ctl", HotkeyKind::DeepScan) ==
            "bindsym --no-repeat Mod4+Shift+r exec /opt/bin/ctl --hotkey deep");
}
