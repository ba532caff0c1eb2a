#include "capture/bitmap.hpp"

#include <leptonica/allheaders.h>

void PixDeleter::operator()(Pix* pix) const {
    pixDestroy(&pix);
}

std::expected<Bitmap, std::string> Bitmap::decode(std::span<const uint8_t> data) {
    if (data.empty()) return std::unexpected("empty image data");

    PixPtr decoded(pixReadMem(data.data(), data.size()));
    if (!decoded) return std::unexpected("unreadable image data");

    PixPtr rgb(pixConvertTo32(decoded.get()));
    if (!rgb) return std::unexpected("unsupported image depth");

    int width = static_cast<int>(pixGetWidth(rgb.get()));
    int height = static_cast<int>(pixGetHeight(rgb.get()));
    if (width <= 0 || height <= 0) return std::unexpected("empty image");

    Bitmap bmp;
    bmp.width = width;
    bmp.height = height;
    bmp.pixels.resize(static_cast<size_t>(bmp.stride()) * static_cast<size_t>(height));

    l_uint32* words = pixGetData(rgb.get());
    int wpl = pixGetWpl(rgb.get());
    for (int y = 0; y < height; ++y) {
        const l_uint32* line = words + static_cast<std::ptrdiff_t>(y) * wpl;
        uint8_t* out = bmp.pixels.data() + static_cast<size_t>(y) * bmp.stride();
        for (int x = 0; x < width; ++x) {
            l_int32 r, g, b;
            extractRGBValues(line[x], &r, &g, &b);
            *out++ = static_cast<uint8_t>(r);
            *out++ = static_cast<uint8_t>(g);
            *out++ = static_cast<uint8_t>(b);
        }
    }
    return bmp;
}

PixPtr to_pix(const Bitmap& bitmap) {
    if (bitmap.empty()) return nullptr;
    PixPtr pix(pixCreate(bitmap.width, bitmap.height, 32));
    if (!pix) return nullptr;

    l_uint32* words = pixGetData(pix.get());
    int wpl = pixGetWpl(pix.get());
    for (int y = 0; y < bitmap.height; ++y) {
        l_uint32* line = words + static_cast<std::ptrdiff_t>(y) * wpl;
        const uint8_t* in = bitmap.pixels.data() + static_cast<size_t>(y) * bitmap.stride();
        for (int x = 0; x < bitmap.width; ++x, in += Bitmap::BYTES_PER_PIXEL) {
            composeRGBPixel(in[0], in[1], in[2], &line[x]);
        }
    }
    return pix;
}
