#include "platform/linux/x11_display.hpp"

#include <X11/Xlib.h>
#include <mutex>
#include <print>

namespace platform::x11 {

namespace {

std::mutex trap_mutex;
bool trapping = false;
int trapped_code = 0;

int on_x_error(Display* display, XErrorEvent* event) {
    if (trapping) {
        if (trapped_code == 0) trapped_code = event->error_code;
        return 0;
    }
    char text[128];
    XGetErrorText(display, event->error_code, text, sizeof(text));
    std::println(stderr, "x11: {} (request {})", text, static_cast<int>(event->request_code));
    return 0;
}

} // namespace

void DisplayCloser::operator()(Display* display) const {
    if (display) XCloseDisplay(display);
}

DisplayPtr open_display() {
    static std::once_flag init;
    std::call_once(init, [] {
        XInitThreads();
        XSetErrorHandler(on_x_error);
    });

    DisplayPtr display(XOpenDisplay(nullptr));
    if (!display) {
        std::println(stderr, "x11: cannot open display");
    }
    return display;
}

int trap_errors(Display* display, const std::function<void()>& fn) {
    std::lock_guard lock(trap_mutex);
    XSync(display, False);
    trapping = true;
    trapped_code = 0;
    fn();
    XSync(display, False);
    trapping = false;
    return trapped_code;
}

} // namespace platform::x11
