#include <catch2/catch_test_macros.hpp>

#include "capture/bitmap.hpp"

#include <leptonica/allheaders.h>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes(const std::string& header, std::vector<uint8_t> raster) {
    std::vector<uint8_t> out(header.begin(), header.end());
    out.insert(out.end(), raster.begin(), raster.end());
    return out;
}

} // namespace

TEST_CASE("Image decoding", "[bitmap]") {

    SECTION("DecodesGrimPpm") {
        auto data = bytes("P6\n2 1\n255\n", {0x10, 0x20, 0x30, 0xff, 0x80, 0x00});
        auto bmp = Bitmap::decode(data);
        REQUIRE(bmp);
        REQUIRE(bmp->width == 2);
        REQUIRE(bmp->height == 1);
        REQUIRE(bmp->stride() == 6);
        REQUIRE(bmp->pixels == std::vector<uint8_t>{0x10, 0x20, 0x30, 0xff, 0x80, 0x00});
        REQUIRE_FALSE(bmp->empty());
    }

    SECTION("ExpandsGrayscaleToRgb") {
        auto data = bytes("P5\n2 1\n255\n", {0x00, 0xc8});
        auto bmp = Bitmap::decode(data);
        REQUIRE(bmp);
        REQUIRE(bmp->pixels == std::vector<uint8_t>{0x00, 0x00, 0x00, 0xc8, 0xc8, 0xc8});
    }

    SECTION("RejectsGarbage") {
        std::string junk = "definitely not an image";
        REQUIRE_FALSE(Bitmap::decode({reinterpret_cast<const uint8_t*>(junk.data()), junk.size()}));
        REQUIRE_FALSE(Bitmap::decode({}));
    }
}

TEST_CASE("Leptonica conversion", "[bitmap]") {

    SECTION("KeepsPixelsForTesseract") {
        auto data = bytes("P6\n2 2\n255\n",
                          {1, 2, 3, 4, 5, 6, 7, 8, 9, 250, 251, 252});
        auto bmp = Bitmap::decode(data);
        REQUIRE(bmp);

        auto pix = to_pix(*bmp);
        REQUIRE(pix);
        REQUIRE(pixGetWidth(pix.get()) == 2);
        REQUIRE(pixGetHeight(pix.get()) == 2);
        REQUIRE(pixGetDepth(pix.get()) == 32);

        l_uint8* written = nullptr;
        size_t size = 0;
        REQUIRE(pixWriteMemPnm(&written, &size, pix.get()) == 0);
        auto reread = Bitmap::decode({written, size});
        lept_free(written);

        REQUIRE(reread);
        REQUIRE(reread->pixels == bmp->pixels);
    }

    SECTION("EmptyBitmapHasNoPix") {
        REQUIRE_FALSE(to_pix(Bitmap{}));
    }
}
