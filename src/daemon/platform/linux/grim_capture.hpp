#pragma once

#include "platform/screen_capture.hpp"

class GrimCapture : public ScreenCapture {
public:
    std::expected<Bitmap, Failure> capture(const Rect& region, std::chrono::milliseconds timeout,
                                           std::stop_token stop) override;
};
