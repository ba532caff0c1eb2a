#include "platform/linux/atspi_reader.hpp"

#include <atspi/atspi.h>
#include <format>
#include <print>

namespace {

constexpr size_t MAX_TEXT_PER_NODE = 8192;

void free_error(GError* error) {
    if (error) g_error_free(error);
}

void take_string(gchar* raw, std::vector<std::string>& out) {
    if (!raw) return;
    std::string s(raw);
    g_free(raw);
    if (s.size() > MAX_TEXT_PER_NODE) s.resize(MAX_TEXT_PER_NODE);
    if (!s.empty()) out.push_back(std::move(s));
}

bool has_state(AtspiAccessible* node, AtspiStateType state) {
    AtspiStateSet* states = atspi_accessible_get_state_set(node);
    if (!states) return false;
    bool result = atspi_state_set_contains(states, state);
    g_object_unref(states);
    return result;
}

Failure permission_failure() {
    return {ErrorKind::PermissionDenied,
            "The accessibility bus is off. Enable it with "
            "`gsettings set org.gnome.desktop.interface toolkit-accessibility true` and log in again."};
}

} // namespace

void AtspiReader::Unref::operator()(AtspiAccessible* obj) const {
    if (obj) g_object_unref(obj);
}

AtspiReader::AtspiReader(uint32_t quick_ancestor_levels, uint32_t max_tree_depth, bool window_relative)
    : quick_ancestor_levels_(quick_ancestor_levels)
    , max_tree_depth_(max_tree_depth)
    , window_relative_(window_relative) {}

AtspiReader::~AtspiReader() {
    if (connected_) atspi_exit();
}

std::expected<void, Failure> AtspiReader::ensure_connected() {
    if (connected_) return {};

    // 0: connected, 1: already initialized by someone else in this process.
    int rc = atspi_init();
    if (rc != 0 && rc != 1) {
        std::println(stderr, "atspi: init failed ({})", rc);
        return std::unexpected(permission_failure());
    }
    connected_ = true;
    return {};
}

std::expected<AtspiReader::AccessibleRef, Failure> AtspiReader::find_window(int pid) {
    auto connected = ensure_connected();
    if (!connected) return std::unexpected(connected.error());

    AccessibleRef desktop(atspi_get_desktop(0));
    if (!desktop) return std::unexpected(permission_failure());

    GError* error = nullptr;
    gint apps = atspi_accessible_get_child_count(desktop.get(), &error);
    if (error) {
        std::println(stderr, "atspi: {}", error->message);
        free_error(error);
        return std::unexpected(permission_failure());
    }

    for (gint i = 0; i < apps; i++) {
        AccessibleRef app(atspi_accessible_get_child_at_index(desktop.get(), i, nullptr));
        if (!app) continue;
        if (static_cast<int>(atspi_accessible_get_process_id(app.get(), nullptr)) != pid) continue;

        // Prefer the active top-level window; fall back to the first one.
        AccessibleRef first;
        gint windows = atspi_accessible_get_child_count(app.get(), nullptr);
        for (gint w = 0; w < windows; w++) {
            AccessibleRef window(atspi_accessible_get_child_at_index(app.get(), w, nullptr));
            if (!window) continue;
            if (has_state(window.get(), ATSPI_STATE_ACTIVE)) return window;
            if (!first) first = std::move(window);
        }
        if (first) return first;
        return app;
    }

    return std::unexpected(Failure{
        ErrorKind::Unsupported, std::format("pid {} exposes no accessibility tree", pid)});
}

AtspiReader::AccessibleRef AtspiReader::find_focused(AtspiAccessible* node, uint32_t depth) {
    if (depth > max_tree_depth_) return {};
    if (has_state(node, ATSPI_STATE_FOCUSED)) {
        return AccessibleRef(static_cast<AtspiAccessible*>(g_object_ref(node)));
    }

    gint count = atspi_accessible_get_child_count(node, nullptr);
    for (gint i = 0; i < count; i++) {
        AccessibleRef child(atspi_accessible_get_child_at_index(node, i, nullptr));
        if (!child) continue;
        if (auto found = find_focused(child.get(), depth + 1)) return found;
    }
    return {};
}

AtspiReader::AccessibleRef AtspiReader::quick_root(AtspiAccessible* window) {
    auto node = find_focused(window, 0);
    if (!node) return {};

    for (uint32_t level = 0; level < quick_ancestor_levels_; level++) {
        if (node.get() == window) break;
        AccessibleRef parent(atspi_accessible_get_parent(node.get(), nullptr));
        if (!parent) break;
        node = std::move(parent);
    }
    return node;
}

std::optional<Rect> AtspiReader::extents(AtspiAccessible* node, const Rect& window) {
    AtspiComponent* component = atspi_accessible_get_component_iface(node);
    if (!component) return std::nullopt;

    GError* error = nullptr;
    auto coords = window_relative_ ? ATSPI_COORD_TYPE_WINDOW : ATSPI_COORD_TYPE_SCREEN;
    AtspiRect* r = atspi_component_get_extents(component, coords, &error);
    g_object_unref(component);
    if (error || !r) {
        free_error(error);
        if (r) g_free(r);
        return std::nullopt;
    }

    Rect rect{r->x, r->y, r->width, r->height};
    g_free(r);
    if (window_relative_) {
        rect.x += window.x;
        rect.y += window.y;
    }
    return rect;
}

Rect AtspiReader::quick_region(int pid, const Rect& window) {
    std::lock_guard lock(mutex_);

    auto win = find_window(pid);
    if (!win) return {};
    auto root = quick_root(win->get());
    if (!root) return {};
    return extents(root.get(), window).value_or(Rect{});
}

void AtspiReader::collect(AtspiAccessible* node, uint32_t depth, std::stop_token& stop,
                          std::vector<std::string>& out) {
    if (depth > max_tree_depth_ || stop.stop_requested()) return;

    take_string(atspi_accessible_get_name(node, nullptr), out);

    if (AtspiText* text = atspi_accessible_get_text_iface(node)) {
        take_string(atspi_text_get_text(text, 0, -1, nullptr), out);
        g_object_unref(text);
    }

    take_string(atspi_accessible_get_description(node, nullptr), out);

    gint count = atspi_accessible_get_child_count(node, nullptr);
    for (gint i = 0; i < count; i++) {
        AccessibleRef child(atspi_accessible_get_child_at_index(node, i, nullptr));
        if (child) collect(child.get(), depth + 1, stop, out);
    }
}

std::expected<std::vector<std::string>, Failure>
AtspiReader::read_text(int pid, CaptureScope scope, std::stop_token stop) {
    std::lock_guard lock(mutex_);

    auto win = find_window(pid);
    if (!win) return std::unexpected(win.error());

    AccessibleRef root;
    if (scope == CaptureScope::FocusedControl) root = quick_root(win->get());
    AtspiAccessible* start = root ? root.get() : win->get();

    std::vector<std::string> lines;
    collect(start, 0, stop, lines);

    if (stop.stop_requested()) {
        return std::unexpected(Failure{ErrorKind::Cancelled, "accessibility read cancelled"});
    }
    if (lines.empty()) {
        return std::unexpected(Failure{ErrorKind::Unsupported, "no readable text in the accessibility tree"});
    }
    return lines;
}
