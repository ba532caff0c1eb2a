#include "platform/linux/x11_capture.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <bit>
#include <format>

namespace {

uint8_t channel(unsigned long pixel, unsigned long mask) {
    if (mask == 0) return 0;
    int shift = std::countr_zero(mask);
    unsigned long value = (pixel & mask) >> shift;
    unsigned long max = mask >> shift;
    return static_cast<uint8_t>(max == 255 ? value : value * 255 / max);
}

} // namespace

bool X11Capture::connect() {
    display_ = platform::x11::open_display();
    return display_ != nullptr;
}

std::expected<Bitmap, Failure> X11Capture::capture(const Rect& region, std::chrono::milliseconds timeout,
                                                   std::stop_token stop) {
    std::lock_guard lock(mutex_);
    if (!display_) return std::unexpected(Failure{ErrorKind::CaptureFailed, "no X display"});

    auto start = std::chrono::steady_clock::now();
    Display* dpy = display_.get();
    Window root = DefaultRootWindow(dpy);

    XWindowAttributes root_attrs{};
    XGetWindowAttributes(dpy, root, &root_attrs);
    auto area = region.intersect({0, 0, root_attrs.width, root_attrs.height});
    if (area.empty()) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "capture region is off screen"});
    }

    XImage* image = nullptr;
    int err = platform::x11::trap_errors(dpy, [&] {
        image = XGetImage(dpy, root, area.x, area.y, static_cast<unsigned>(area.width),
                          static_cast<unsigned>(area.height), AllPlanes, ZPixmap);
    });
    if (err != 0 || !image) {
        if (image) XDestroyImage(image);
        return std::unexpected(Failure{ErrorKind::CaptureFailed, std::format("XGetImage failed ({})", err)});
    }

    Bitmap bitmap;
    bitmap.width = area.width;
    bitmap.height = area.height;
    bitmap.pixels.resize(static_cast<size_t>(bitmap.stride()) * bitmap.height);

    for (int y = 0; y < area.height; y++) {
        if (stop.stop_requested()) break;
        uint8_t* row = bitmap.pixels.data() + static_cast<size_t>(y) * bitmap.stride();
        for (int x = 0; x < area.width; x++) {
            unsigned long pixel = XGetPixel(image, x, y);
            row[x * 3 + 0] = channel(pixel, image->red_mask);
            row[x * 3 + 1] = channel(pixel, image->green_mask);
            row[x * 3 + 2] = channel(pixel, image->blue_mask);
        }
    }
    XDestroyImage(image);

    if (stop.stop_requested()) {
        return std::unexpected(Failure{ErrorKind::Cancelled, "screenshot cancelled"});
    }

    // XGetImage cannot be interrupted; an overrun is still reported as a failure.
    auto elapsed = std::chrono::steady_clock::now() - start;
    if (elapsed > timeout) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed,
                                       std::format("screenshot took longer than {} ms", timeout.count())});
    }
    return bitmap;
}
