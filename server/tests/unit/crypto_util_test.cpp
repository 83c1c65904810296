#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "teamlink/crypto_util.hpp"

namespace {

std::string Hex(const std::string& raw) {
  std::vector<unsigned char> bytes(raw.begin(), raw.end());
  return teamlink::BytesToHex(bytes.data(), bytes.size());
}

}  // namespace

TEST(CryptoUtilTest, HmacSha256MatchesRfc4231Vector) {
  auto digest = teamlink::HmacSha256("Jefe", "what do ya want for nothing?");
  EXPECT_EQ(digest.size(), 32u);
  EXPECT_EQ(Hex(digest), "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CryptoUtilTest, Base64UrlHandlesHighBytes) {
  const std::string raw{'\xfb', '\xff'};
  EXPECT_EQ(teamlink::Base64UrlEncode(raw), "-_8");
  EXPECT_EQ(teamlink::Base64UrlDecode("-_8").value_or(""), raw);
  EXPECT_EQ(teamlink::Base64UrlEncode("hello"), "aGVsbG8");
  EXPECT_EQ(teamlink::Base64UrlDecode("aGVsbG8").value_or(""), "hello");
  EXPECT_FALSE(teamlink::Base64UrlDecode("a+b/").has_value());
  EXPECT_FALSE(teamlink::Base64UrlDecode("abcde").has_value());
}

TEST(CryptoUtilTest, ConstantTimeEqualsComparesWholeValue) {
  EXPECT_TRUE(teamlink::ConstantTimeEquals("abc", "abc"));
  EXPECT_FALSE(teamlink::ConstantTimeEquals("abc", "abd"));
  EXPECT_FALSE(teamlink::ConstantTimeEquals("abc", "abcd"));
}
