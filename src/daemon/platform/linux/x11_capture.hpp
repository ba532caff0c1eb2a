#pragma once

#include "platform/linux/x11_display.hpp"
#include "platform/screen_capture.hpp"

#include <mutex>

class X11Capture : public ScreenCapture {
public:
    bool connect();

    std::expected<Bitmap, Failure> capture(const Rect& region, std::chrono::milliseconds timeout,
                                           std::stop_token stop) override;

private:
    std::mutex mutex_;
    platform::x11::DisplayPtr display_;
};
