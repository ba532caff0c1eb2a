#include "platform/linux/grim_capture.hpp"

#include "platform/linux/subprocess.hpp"

#include <format>

std::expected<Bitmap, Failure> GrimCapture::capture(const Rect& region, std::chrono::milliseconds timeout,
                                                    std::stop_token stop) {
    if (region.empty()) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "zero-size capture region"});
    }

    auto geometry = std::format("{},{} {}x{}", region.x, region.y, region.width, region.height);
    platform::RunOptions opts;
    opts.timeout = timeout;
    opts.stop = stop;
    opts.capture_output = true;

    auto res = platform::run_process({"grim", "-t", "ppm", "-g", geometry, "-"}, opts);
    if (!res) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "grim: " + res.error()});
    }
    if (res->cancelled) {
        return std::unexpected(Failure{ErrorKind::Cancelled, "screenshot cancelled"});
    }
    if (res->timed_out) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed,
                                       std::format("screenshot took longer than {} ms", timeout.count())});
    }
    if (res->exit_code == 127) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "grim is not installed"});
    }
    if (res->exit_code != 0) {
        // grim exits non-zero when the compositor lacks or refuses screencopy.
        return std::unexpected(Failure{ErrorKind::PermissionDenied,
                                       std::format("screen capture refused (grim exited with {})",
                                                   res->exit_code)});
    }

    auto bitmap = Bitmap::decode({reinterpret_cast<const uint8_t*>(res->output.data()),
                                  res->output.size()});
    if (!bitmap) {
        return std::unexpected(Failure{ErrorKind::CaptureFailed, "grim: " + bitmap.error()});
    }
    return std::move(*bitmap);
}
