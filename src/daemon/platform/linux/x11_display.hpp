#pragma once

#include <functional>
#include <memory>

typedef struct _XDisplay Display;

namespace platform::x11 {

struct DisplayCloser {
    void operator()(Display* display) const;
};
using DisplayPtr = std::unique_ptr<Display, DisplayCloser>;

// Opens $DISPLAY. The first call also replaces Xlib's default error handler,
// which would otherwise exit the process on a stale window id.
DisplayPtr open_display();

// Runs `fn`, flushes the request queue and returns the first X error code
// raised in between (0 for none).
int trap_errors(Display* display, const std::function<void()>& fn);

} // namespace platform::x11
