#include <catch2/catch_test_macros.hpp>

#include "ocr/tesseract_recognizer.hpp"

#include <stop_token>
#include <string>
#include <vector>

TEST_CASE("Tesseract recognizer", "[ocr]") {

    SECTION("UninitializedIsUnsupported") {
        TesseractRecognizer ocr("eng", "", 60.0f);
        Bitmap image;
        image.width = 4;
        image.height = 4;
        image.pixels.assign(static_cast<size_t>(image.stride()) * image.height, 0xff);

        auto lines = ocr.recognize(image, std::stop_token{});
        REQUIRE_FALSE(lines);
        REQUIRE(lines.error().kind == ErrorKind::Unsupported);
    }

    SECTION("MissingLanguageDataFailsInit") {
        TesseractRecognizer ocr("ra-test-no-such-language", "/nonexistent/tessdata", 60.0f);
        REQUIRE_FALSE(ocr.init());
    }
}

TEST_CASE("OCR line selection", "[ocr]") {

    SECTION("DropsLowConfidenceLines") {
        auto lines = select_lines({{"Dana: lunch at noon?", 91.5f},
                                   {"~;:.,", 12.0f},
                                   {"Eve: sounds good", 74.0f}},
                                  60.0f);
        REQUIRE(lines);
        REQUIRE(*lines == std::vector<std::string>{"Dana: lunch at noon?", "Eve: sounds good"});
    }

    SECTION("KeepsLineExactlyAtThreshold") {
        auto lines = select_lines({{"on the line", 60.0f}, {"just under", 59.9f}}, 60.0f);
        REQUIRE(lines);
        REQUIRE(*lines == std::vector<std::string>{"on the line"});
    }

    SECTION("TrimsAndSkipsBlankLines") {
        auto lines = select_lines({{"  hello there\n", 88.0f}, {" \t\n", 95.0f}}, 60.0f);
        REQUIRE(lines);
        REQUIRE(*lines == std::vector<std::string>{"hello there"});
    }

    SECTION("NothingAboveThresholdIsNoTextFound") {
        auto lines = select_lines({{"blurry", 30.0f}, {"smudge", 59.0f}}, 60.0f);
        REQUIRE_FALSE(lines);
        REQUIRE(lines.error().kind == ErrorKind::NoTextFound);
    }

    SECTION("EmptyPageIsNoTextFound") {
        auto lines = select_lines({}, 60.0f);
        REQUIRE_FALSE(lines);
        REQUIRE(lines.error().kind == ErrorKind::NoTextFound);
    }
}
