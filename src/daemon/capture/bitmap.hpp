#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

struct Pix;

// Packed 8-bit RGB image.
struct Bitmap {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    static constexpr int BYTES_PER_PIXEL = 3;

    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
    int stride() const { return width * BYTES_PER_PIXEL; }

    // Decodes any format leptonica reads from memory (grim writes PPM).
    static std::expected<Bitmap, std::string> decode(std::span<const uint8_t> data);
};

struct PixDeleter {
    void operator()(Pix* pix) const;
};
using PixPtr = std::unique_ptr<Pix, PixDeleter>;

// 32 bpp leptonica copy of `bitmap`, the form tesseract takes through SetImage.
PixPtr to_pix(const Bitmap& bitmap);
