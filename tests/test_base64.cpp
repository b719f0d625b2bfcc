/**
 * @file test_base64.cpp
 * @brief Tests for base64 encode/decode
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rtv/utils/rtv_base64.h"

namespace {

std::string encode(const std::string& s) {
    return rtv::base64_encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

std::string decode(const std::string& s, bool* ok = nullptr) {
    std::vector<uint8_t> out;
    bool result = rtv::base64_decode(s, out);
    if (ok) *ok = result;
    return std::string(out.begin(), out.end());
}

}  // namespace

TEST(Base64, Rfc4648Vectors) {
    EXPECT_EQ(encode(""), "");
    EXPECT_EQ(encode("f"), "Zg==");
    EXPECT_EQ(encode("fo"), "Zm8=");
    EXPECT_EQ(encode("foo"), "Zm9v");
    EXPECT_EQ(encode("foob"), "Zm9vYg==");
    EXPECT_EQ(encode("fooba"), "Zm9vYmE=");
    EXPECT_EQ(encode("foobar"), "Zm9vYmFy");
}

TEST(Base64, DecodesPaddedAndUnpadded) {
    bool ok = false;
    EXPECT_EQ(decode("Zm9vYg==", &ok), "foob");
    EXPECT_TRUE(ok);
    EXPECT_EQ(decode("Zm9vYg", &ok), "foob");
    EXPECT_TRUE(ok);
}

TEST(Base64, SkipsWhitespace) {
    bool ok = false;
    EXPECT_EQ(decode("Zm9v\nYmFy ", &ok), "foobar");
    EXPECT_TRUE(ok);
}

TEST(Base64, RejectsForeignCharacters) {
    bool ok = true;
    decode("Zm9v*mFy", &ok);
    EXPECT_FALSE(ok);
}

TEST(Base64, RejectsDataAfterPadding) {
    bool ok = true;
    decode("Zg==Zg==", &ok);
    EXPECT_FALSE(ok);
}

TEST(Base64, RejectsDanglingCharacter) {
    bool ok = true;
    decode("Zm9vY", &ok);
    EXPECT_FALSE(ok);
}

TEST(Base64, BinaryBytes) {
    std::vector<uint8_t> bytes;
    for (int i = 0; i < 256; ++i) bytes.push_back(static_cast<uint8_t>(i));

    std::vector<uint8_t> out;
    ASSERT_TRUE(rtv::base64_decode(rtv::base64_encode(bytes.data(), bytes.size()), out));
    EXPECT_EQ(out, bytes);
}
