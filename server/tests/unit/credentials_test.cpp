#include <chrono>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "teamlink/credentials.hpp"
#include "teamlink/memory_stores.hpp"
#include "test_support.hpp"

TEST(PasswordHasherTest, VerifiesMatchingPasswordOnly) {
  teamlink::UserCredential credential;
  credential.user_id = "u-1";
  credential.salt_hex = teamlink::PasswordHasher::GenerateSalt();
  credential.hash_hex = teamlink::PasswordHasher::Hash("password123", credential.salt_hex);

  EXPECT_TRUE(teamlink::PasswordHasher::Verify("password123", credential));
  EXPECT_FALSE(teamlink::PasswordHasher::Verify("password124", credential));
  credential.salt_hex = "not-hex";
  EXPECT_FALSE(teamlink::PasswordHasher::Verify("password123", credential));
}

TEST(RateLimiterTest, BlocksAfterMaxAttemptsWithinWindow) {
  teamlink::RateLimiter limiter(2, std::chrono::seconds(60));
  auto now = std::chrono::system_clock::now();
  EXPECT_TRUE(limiter.Allow("1.1.1.1", now));
  EXPECT_TRUE(limiter.Allow("1.1.1.1", now));
  EXPECT_FALSE(limiter.Allow("1.1.1.1", now));
  EXPECT_TRUE(limiter.Allow("2.2.2.2", now));
  EXPECT_TRUE(limiter.Allow("1.1.1.1", now + std::chrono::seconds(61)));
}

TEST(RateLimiterTest, ForgetsKeysWhoseWindowHasPassed) {
  teamlink::RateLimiter limiter(1, std::chrono::seconds(60));
  auto start = std::chrono::system_clock::now();
  for (int i = 0; i < 100; ++i) {
    EXPECT_TRUE(limiter.Allow("10.0.0." + std::to_string(i), start));
  }
  EXPECT_EQ(limiter.TrackedKeys(), 100u);

  auto later = start + std::chrono::seconds(61);
  EXPECT_TRUE(limiter.Allow("10.0.1.1", later));
  EXPECT_EQ(limiter.TrackedKeys(), 1u);
  EXPECT_FALSE(limiter.Allow("10.0.1.1", later));
  EXPECT_TRUE(limiter.Allow("10.0.0.7", later));
  EXPECT_EQ(limiter.TrackedKeys(), 2u);
}

TEST(NormalizeEmailTest, TrimsAndLowercases) {
  EXPECT_EQ(teamlink::NormalizeEmail("  Coach@Example.COM \n"), "coach@example.com");
  EXPECT_EQ(teamlink::NormalizeEmail("   "), "");
}

namespace {

class LoginServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fx_.users->AddUser(fx_.alice, "password123");
    organizations_->AddOrganization({"org-1", "Team Liquid"});
  }

  teamlink::testing::AuthFixture fx_;
  std::shared_ptr<teamlink::InMemoryOrganizationStore> organizations_ =
      std::make_shared<teamlink::InMemoryOrganizationStore>();
  teamlink::LoginService login_{fx_.users, organizations_, fx_.sessions, teamlink::LoginConfig{}};
};

}  // namespace

TEST_F(LoginServiceTest, LoginReturnsUserOrganizationAndTokens) {
  std::string code;
  std::string message;
  auto result = login_.Login("ALICE@example.com ", "password123", "10.0.0.1", code, message);
  ASSERT_TRUE(result.has_value()) << code << " " << message;
  EXPECT_EQ(result->user.id, "u-alice");
  ASSERT_TRUE(result->organization.has_value());
  EXPECT_EQ(result->organization->name, "Team Liquid");
  EXPECT_EQ(result->tokens.token_type, "Bearer");

  teamlink::AuthError error;
  auto claims = fx_.sessions->Verify(result->tokens.access_token, error);
  ASSERT_TRUE(claims.has_value());
  EXPECT_EQ(claims->email, "alice@example.com");
}

TEST_F(LoginServiceTest, WrongPasswordAndUnknownEmailShareError) {
  std::string code;
  std::string message;
  EXPECT_FALSE(login_.Login("alice@example.com", "wrong", "10.0.0.1", code, message));
  EXPECT_EQ(code, "INVALID_CREDENTIALS");
  std::string unknown_message;
  EXPECT_FALSE(login_.Login("nobody@example.com", "password123", "10.0.0.2", code, unknown_message));
  EXPECT_EQ(code, "INVALID_CREDENTIALS");
  EXPECT_EQ(message, unknown_message);
}

TEST_F(LoginServiceTest, RateLimitedPerRemoteAddress) {
  std::string code;
  std::string message;
  for (int i = 0; i < 5; ++i) {
    login_.Login("alice@example.com", "wrong", "10.0.0.9", code, message);
  }
  EXPECT_FALSE(login_.Login("alice@example.com", "password123", "10.0.0.9", code, message));
  EXPECT_EQ(code, "rate_limited");
  EXPECT_TRUE(login_.Login("alice@example.com", "password123", "10.0.0.10", code, message));
}
