/**
 * @file encoding_test.cpp
 * @brief Unit tests for hex and Base64 codecs
 */

#include "utils/encoding.h"

#include <gtest/gtest.h>

#include <string>

using namespace memex::utils;

// ========== Hex ==========

TEST(HexTest, EncodeLowercase) {
  EXPECT_EQ(HexEncode(std::string("\x00\x7f\xab\xff", 4)), "007fabff");
  EXPECT_EQ(HexEncode(""), "");
}

TEST(HexTest, DecodeAcceptsBothCases) {
  auto decoded = HexDecode("ABcd01");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, std::string("\xab\xcd\x01", 3));
}

TEST(HexTest, DecodeRejectsMalformed) {
  EXPECT_FALSE(HexDecode("abc").has_value());  // odd length
  EXPECT_FALSE(HexDecode("zz").has_value());
}

TEST(HexTest, IsHexDigest) {
  EXPECT_TRUE(IsHexDigest(std::string(64, 'a')));
  EXPECT_TRUE(IsHexDigest(std::string(64, 'F')));
  EXPECT_FALSE(IsHexDigest(std::string(63, 'a')));
  EXPECT_FALSE(IsHexDigest(std::string(64, 'g')));
  EXPECT_FALSE(IsHexDigest("node-1"));
}

// ========== Base64 ==========

TEST(Base64Test, EncodeWithPadding) {
  EXPECT_EQ(Base64Encode(""), "");
  EXPECT_EQ(Base64Encode("f"), "Zg==");
  EXPECT_EQ(Base64Encode("fo"), "Zm8=");
  EXPECT_EQ(Base64Encode("foo"), "Zm9v");
  EXPECT_EQ(Base64Encode("foobar"), "Zm9vYmFy");
  EXPECT_EQ(Base64Encode("node1"), "bm9kZTE=");
}

TEST(Base64Test, DecodeBinary) {
  std::string binary;
  for (int i = 0; i < 256; ++i) {
    binary.push_back(static_cast<char>(i));
  }
  auto decoded = Base64Decode(Base64Encode(binary));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, binary);
}

TEST(Base64Test, DecodeRejectsMalformed) {
  EXPECT_FALSE(Base64Decode("Zg=").has_value());      // length not a multiple of 4
  EXPECT_FALSE(Base64Decode("Z!==").has_value());     // invalid character
  EXPECT_FALSE(Base64Decode("Zg==Zm8=").has_value());  // padding before the last group
  EXPECT_FALSE(Base64Decode("Z=g=").has_value());     // data after padding
}
