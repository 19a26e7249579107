#include <gtest/gtest.h>
#include "jobcore/utils/TextDecoder.hpp"
#include "jobcore/types/Error.hpp"

#include <string>

using namespace jobcore::utils;

namespace {
    std::string replacements(size_t count) {
        std::string out;
        for (size_t i = 0; i < count; ++i) {
            out += REPLACEMENT_CHARACTER;
        }
        return out;
    }
}

TEST(TextDecoderTest, ParsesEncodingAliases) {
    EXPECT_EQ(parseEncoding("utf-8"), TextEncoding::Utf8);
    EXPECT_EQ(parseEncoding("UTF8"), TextEncoding::Utf8);
    EXPECT_EQ(parseEncoding("ASCII"), TextEncoding::Ascii);
    EXPECT_EQ(parseEncoding("latin_1"), TextEncoding::Latin1);
    EXPECT_EQ(parseEncoding("ISO-8859-1"), TextEncoding::Latin1);
}

TEST(TextDecoderTest, UnknownEncodingThrows) {
    EXPECT_THROW(parseEncoding("shift-jis"), jobcore::types::UnsupportedEncodingException);
    EXPECT_THROW(parseEncoding(""), jobcore::types::UnsupportedEncodingException);
}

TEST(TextDecoderTest, EncodingNamesRoundTrip) {
    for (auto encoding: {TextEncoding::Utf8, TextEncoding::Ascii, TextEncoding::Latin1}) {
        EXPECT_EQ(parseEncoding(encodingToString(encoding)), encoding);
    }
}

TEST(TextDecoderTest, ValidUtf8PassesThrough) {
    const std::string text = "M117 \xC3\xA9t\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x94\xA5";
    EXPECT_EQ(decodeToUtf8(text, TextEncoding::Utf8), text);
}

TEST(TextDecoderTest, InvalidUtf8BytesAreReplaced) {
    EXPECT_EQ(decodeToUtf8("a\xFF" "b", TextEncoding::Utf8), "a" + replacements(1) + "b");
    EXPECT_EQ(decodeToUtf8("\x80\x80", TextEncoding::Utf8), replacements(2));
}

TEST(TextDecoderTest, TruncatedSequenceIsOneReplacement) {
    EXPECT_EQ(decodeToUtf8("x\xE2\x82", TextEncoding::Utf8), "x" + replacements(1));
    EXPECT_EQ(decodeToUtf8("\xE2\x82" "A", TextEncoding::Utf8), replacements(1) + "A");
}

TEST(TextDecoderTest, OverlongAndSurrogateFormsAreRejected) {
    EXPECT_EQ(decodeToUtf8("\xC0\xAF", TextEncoding::Utf8), replacements(2));
    EXPECT_EQ(decodeToUtf8("\xED\xA0\x80", TextEncoding::Utf8), replacements(3));
}

TEST(TextDecoderTest, AsciiReplacesHighBytes) {
    EXPECT_EQ(decodeToUtf8("G1\xE9", TextEncoding::Ascii), "G1" + replacements(1));
}

TEST(TextDecoderTest, Latin1MapsEveryByte) {
    EXPECT_EQ(decodeToUtf8("caf\xE9 \xFF", TextEncoding::Latin1), "caf\xC3\xA9 \xC3\xBF");
}
