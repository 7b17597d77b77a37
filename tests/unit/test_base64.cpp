/**
 * @file test_base64.cpp
 * @brief Unit tests for the base64 codecs
 */

#include <gtest/gtest.h>
#include <gatelink/utils/base64.hpp>

#include <string>
#include <vector>

using namespace gatelink::utils;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

TEST(Base64Test, EncodesRfc4648Vectors) {
    EXPECT_EQ(base64Encode(bytes("")), "");
    EXPECT_EQ(base64Encode(bytes("f")), "Zg==");
    EXPECT_EQ(base64Encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(bytes("foo")), "Zm9v");
    EXPECT_EQ(base64Encode(bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, DecodesRfc4648Vectors) {
    EXPECT_EQ(base64Decode("Zg=="), bytes("f"));
    EXPECT_EQ(base64Decode("Zm8="), bytes("fo"));
    EXPECT_EQ(base64Decode("Zm9vYmFy"), bytes("foobar"));
    EXPECT_EQ(base64Decode(""), bytes(""));
}

TEST(Base64Test, StandardDecodeRequiresPadding) {
    EXPECT_FALSE(base64Decode("Zg").has_value());
    EXPECT_FALSE(base64Decode("Zm8").has_value());
}

TEST(Base64Test, RejectsForeignCharacters) {
    EXPECT_FALSE(base64Decode("Zm9v!mFy").has_value());
    EXPECT_FALSE(base64Decode("Zm9v YmFy").has_value());
    EXPECT_FALSE(base64Decode("-_-_").has_value());
}

TEST(Base64Test, RejectsNonCanonicalTailBits) {
    // "Zh==" carries bits that "Zg==" leaves zero.
    EXPECT_FALSE(base64Decode("Zh==").has_value());
}

TEST(Base64Test, UrlAlphabetAndNoPadding) {
    const std::vector<uint8_t> data = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ(base64Encode(data), "+/+/");
    EXPECT_EQ(base64UrlEncode(data), "-_-_");

    EXPECT_EQ(base64UrlEncode(bytes("f")), "Zg");
    EXPECT_EQ(base64UrlEncode(bytes("fo")), "Zm8");
}

TEST(Base64Test, UrlDecodeAcceptsOptionalPadding) {
    EXPECT_EQ(base64UrlDecode("Zg"), bytes("f"));
    EXPECT_EQ(base64UrlDecode("Zg=="), bytes("f"));
    EXPECT_EQ(base64UrlDecode("-_-_"), (std::vector<uint8_t>{0xFB, 0xFF, 0xBF}));
    EXPECT_FALSE(base64UrlDecode("+/+/").has_value());
    EXPECT_FALSE(base64UrlDecode("Z").has_value());
}

TEST(Base64Test, BinaryRoundTrip) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<uint8_t>(i));
    }
    EXPECT_EQ(base64Decode(base64Encode(data)), data);
    EXPECT_EQ(base64UrlDecode(base64UrlEncode(data)), data);
}
