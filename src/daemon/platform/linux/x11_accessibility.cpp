#include "platform/linux/x11_accessibility.hpp"

#include "platform/linux/procfs.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <format>

X11Accessibility::X11Accessibility(std::unique_ptr<AtspiReader> atspi)
    : atspi_(std::move(atspi)) {}

bool X11Accessibility::connect() {
    display_ = platform::x11::open_display();
    return display_ != nullptr;
}

unsigned long X11Accessibility::cardinal_property(unsigned long window, const char* name,
                                                  unsigned long type) {
    Atom prop = XInternAtom(display_.get(), name, True);
    if (prop == None) return 0;

    Atom actual_type;
    int actual_format;
    unsigned long items = 0;
    unsigned long remaining = 0;
    unsigned char* data = nullptr;
    int rc = XGetWindowProperty(display_.get(), window, prop, 0, 1, False, type,
                                &actual_type, &actual_format, &items, &remaining, &data);
    unsigned long value = 0;
    if (rc == Success && data && items > 0 && actual_format == 32) {
        // Format-32 properties are stored as longs by Xlib.
        value = *reinterpret_cast<unsigned long*>(data);
    }
    if (data) XFree(data);
    return value;
}

unsigned long X11Accessibility::active_window() {
    return cardinal_property(DefaultRootWindow(display_.get()), "_NET_ACTIVE_WINDOW", XA_WINDOW);
}

std::expected<FocusedTarget, Failure> X11Accessibility::focused_target() {
    auto target = window_target();
    if (!target) return target;

    // The AT-SPI walk runs outside mutex_ so focused_window_id() never waits on it.
    target->control_bounds = atspi_->quick_region(target->pid, target->window_bounds);
    return target;
}

std::expected<FocusedTarget, Failure> X11Accessibility::window_target() {
    std::lock_guard lock(mutex_);
    if (!display_) return std::unexpected(Failure{ErrorKind::CaptureFailed, "no X display"});

    Window window = active_window();
    if (window == None) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "no active window (_NET_ACTIVE_WINDOW unset)"});
    }

    FocusedTarget target;
    target.handle = std::format("{:#x}", window);
    target.pid = static_cast<int>(cardinal_property(window, "_NET_WM_PID", XA_CARDINAL));

    std::string window_class;
    XClassHint hint{};
    if (XGetClassHint(display_.get(), window, &hint)) {
        if (hint.res_class) window_class = hint.res_class;
        if (hint.res_name) XFree(hint.res_name);
        if (hint.res_class) XFree(hint.res_class);
    }
    target.process_name = platform::process_name(target.pid, window_class);

    XWindowAttributes attrs{};
    int err = platform::x11::trap_errors(display_.get(), [&] {
        XGetWindowAttributes(display_.get(), window, &attrs);
    });
    if (err != 0) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "active window vanished"});
    }
    if (attrs.map_state == IsViewable) {
        int x = 0;
        int y = 0;
        Window child;
        XTranslateCoordinates(display_.get(), window, DefaultRootWindow(display_.get()),
                              0, 0, &x, &y, &child);
        target.window_bounds = {x, y, attrs.width, attrs.height};
    }
    return target;
}

std::string X11Accessibility::focused_window_id() {
    std::lock_guard lock(mutex_);
    if (!display_) return {};
    Window window = active_window();
    return window == None ? std::string{} : std::format("{:#x}", window);
}

std::expected<std::vector<std::string>, Failure>
X11Accessibility::read_text(const FocusedTarget& target, CaptureScope scope, std::stop_token stop) {
    if (target.pid <= 0) {
        return std::unexpected(Failure{ErrorKind::Unsupported, "window does not set _NET_WM_PID"});
    }
    return atspi_->read_text(target.pid, scope, stop);
}
