#pragma once

#include "capture/bitmap.hpp"
#include "capture/focused_target.hpp"
#include "failure.hpp"

#include <chrono>
#include <expected>
#include <stop_token>

class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;
    virtual std::expected<Bitmap, Failure>
        capture(const Rect& region, std::chrono::milliseconds timeout, std::stop_token stop) = 0;
};
