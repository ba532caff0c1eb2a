#pragma once

#include "capture/focused_target.hpp"
#include "failure.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

typedef struct _AtspiAccessible AtspiAccessible;

// Reads text out of an application's AT-SPI tree. Shared by the sway and X11
// adapters; the window itself is always located through the window manager.
class AtspiReader {
public:
    // `window_relative`: component extents are reported relative to the
    // window (Wayland) rather than the screen (X11).
    AtspiReader(uint32_t quick_ancestor_levels, uint32_t max_tree_depth, bool window_relative);
    ~AtspiReader();

    AtspiReader(const AtspiReader&) = delete;
    AtspiReader& operator=(const AtspiReader&) = delete;

    // Bounds of the subtree a Quick capture reads: the focused control's
    // ancestor, in the same coordinates as `window`. Empty if unknown.
    Rect quick_region(int pid, const Rect& window);

    std::expected<std::vector<std::string>, Failure>
        read_text(int pid, CaptureScope scope, std::stop_token stop);

private:
    struct Unref {
        void operator()(AtspiAccessible* obj) const;
    };
    using AccessibleRef = std::unique_ptr<AtspiAccessible, Unref>;

    std::expected<void, Failure> ensure_connected();
    std::expected<AccessibleRef, Failure> find_window(int pid);
    AccessibleRef find_focused(AtspiAccessible* node, uint32_t depth);
    AccessibleRef quick_root(AtspiAccessible* window);
    std::optional<Rect> extents(AtspiAccessible* node, const Rect& window);
    void collect(AtspiAccessible* node, uint32_t depth, std::stop_token& stop,
                 std::vector<std::string>& out);

    uint32_t quick_ancestor_levels_;
    uint32_t max_tree_depth_;
    bool window_relative_;

    std::mutex mutex_;
    bool connected_ = false;
};
