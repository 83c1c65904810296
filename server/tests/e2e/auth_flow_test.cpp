#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "e2e_support.hpp"

using teamlink::e2e::ExpectErrorEnvelope;
using teamlink::e2e::ExpectSuccessEnvelope;
using teamlink::e2e::ServerFixture;
namespace http = boost::beast::http;

TEST_F(ServerFixture, HealthEndpoint) {
  auto res = Get("/api/health");
  EXPECT_EQ(res.status, http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_EQ(res.body["data"]["status"], "ok");
  EXPECT_EQ(res.body["data"]["version"], "v1.0.0");
}

TEST_F(ServerFixture, LoginReturnsUserOrganizationAndTokens) {
  auto res = PostJson("/api/v1/auth/login", {{"email", "  Alice@Example.com "}, {"password", teamlink::e2e::kPassword}});
  EXPECT_EQ(res.status, http::status::ok);
  ExpectSuccessEnvelope(res.body);
  const auto& data = res.body["data"];
  EXPECT_EQ(data["user"]["id"], "u-alice");
  EXPECT_EQ(data["user"]["organization_id"], "org-1");
  EXPECT_EQ(data["organization"]["name"], "Blue Team");
  EXPECT_EQ(data["tokens"]["token_type"], "Bearer");
  EXPECT_EQ(data["tokens"]["expires_in"], 24 * 3600);
  EXPECT_TRUE(data["tokens"]["access_token"].is_string());
  EXPECT_TRUE(data["tokens"]["refresh_token"].is_string());
}

TEST_F(ServerFixture, LoginRejectsWrongPasswordAndUnknownEmailAlike) {
  auto wrong = PostJson("/api/v1/auth/login", {{"email", "alice@example.com"}, {"password", "wrong"}});
  EXPECT_EQ(wrong.status, http::status::unauthorized);
  ExpectErrorEnvelope(wrong.body, "INVALID_CREDENTIALS");

  auto unknown = PostJson("/api/v1/auth/login", {{"email", "nobody@example.com"}, {"password", "wrong"}});
  EXPECT_EQ(unknown.status, http::status::unauthorized);
  ExpectErrorEnvelope(unknown.body, "INVALID_CREDENTIALS");
  EXPECT_EQ(wrong.body["error"]["message"], unknown.body["error"]["message"]);

  auto missing = PostJson("/api/v1/auth/login", {{"email", "alice@example.com"}});
  EXPECT_EQ(missing.status, http::status::bad_request);
  ExpectErrorEnvelope(missing.body, "bad_request");
}

TEST_F(ServerFixture, LoginIsRateLimitedPerAddress) {
  bool limited = false;
  for (int i = 0; i < 25 && !limited; ++i) {
    auto res = PostJson("/api/v1/auth/login", {{"email", "alice@example.com"}, {"password", "wrong"}});
    if (res.status == http::status::too_many_requests) {
      ExpectErrorEnvelope(res.body, "rate_limited");
      limited = true;
    }
  }
  EXPECT_TRUE(limited);
}

TEST_F(ServerFixture, MeReflectsBoundTenant) {
  auto token = AccessToken("alice@example.com");
  auto res = Get("/api/v1/auth/me", token);
  EXPECT_EQ(res.status, http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_EQ(res.body["data"]["user_id"], "u-alice");
  EXPECT_EQ(res.body["data"]["organization_id"], "org-1");
  EXPECT_EQ(res.body["data"]["role"], "owner");
  EXPECT_EQ(res.body["data"]["organization"]["id"], "org-1");

  auto anonymous = Get("/api/v1/auth/me");
  EXPECT_EQ(anonymous.status, http::status::unauthorized);
  ExpectErrorEnvelope(anonymous.body, "unauthorized");
  EXPECT_EQ(anonymous.body["error"]["detail"], "token_invalid");
}

TEST_F(ServerFixture, MeRejectsUserWithoutOrganization) {
  auto token = AccessToken("drifter@example.com");
  auto res = Get("/api/v1/auth/me", token);
  EXPECT_EQ(res.status, http::status::unauthorized);
  ExpectErrorEnvelope(res.body, "unauthorized");
  EXPECT_EQ(res.body["error"]["detail"], "tenant_missing");
}

TEST_F(ServerFixture, RefreshTokenIsSingleUse) {
  auto tokens = Login("bob@example.com");
  auto refresh = tokens["refresh_token"].get<std::string>();

  auto first = PostJson("/api/v1/auth/refresh", {{"refresh_token", refresh}});
  EXPECT_EQ(first.status, http::status::ok);
  ExpectSuccessEnvelope(first.body);
  EXPECT_NE(first.body["data"]["refresh_token"], refresh);
  EXPECT_NE(first.body["data"]["access_token"], tokens["access_token"]);

  auto replay = PostJson("/api/v1/auth/refresh", {{"refresh_token", refresh}});
  EXPECT_EQ(replay.status, http::status::unauthorized);
  ExpectErrorEnvelope(replay.body, "INVALID_REFRESH_TOKEN");
  EXPECT_EQ(replay.body["error"]["detail"], "token_revoked");

  auto rotated = PostJson("/api/v1/auth/refresh", {{"refresh_token", first.body["data"]["refresh_token"]}});
  EXPECT_EQ(rotated.status, http::status::ok);
}

TEST_F(ServerFixture, RefreshRejectsAccessTokenAndMissingBody) {
  auto tokens = Login("bob@example.com");
  auto wrong_type = PostJson("/api/v1/auth/refresh", {{"refresh_token", tokens["access_token"]}});
  EXPECT_EQ(wrong_type.status, http::status::unauthorized);
  ExpectErrorEnvelope(wrong_type.body, "INVALID_REFRESH_TOKEN");
  EXPECT_EQ(wrong_type.body["error"]["detail"], "token_invalid");

  auto missing = PostJson("/api/v1/auth/refresh", nlohmann::json::object());
  EXPECT_EQ(missing.status, http::status::bad_request);
  ExpectErrorEnvelope(missing.body, "MISSING_REFRESH_TOKEN");
}

TEST_F(ServerFixture, LogoutRevokesAccessToken) {
  auto token = AccessToken("alice@example.com");
  auto logout = PostJson("/api/v1/auth/logout", nlohmann::json::object(), token);
  EXPECT_EQ(logout.status, http::status::ok);
  ExpectSuccessEnvelope(logout.body);

  auto me = Get("/api/v1/auth/me", token);
  EXPECT_EQ(me.status, http::status::unauthorized);
  EXPECT_EQ(me.body["error"]["detail"], "token_revoked");

  auto upgrade = TryUpgrade("/cable?token=" + token);
  EXPECT_EQ(upgrade.status, http::status::unauthorized);
  ExpectErrorEnvelope(upgrade.body, "token_revoked");

  auto again = PostJson("/api/v1/auth/logout", nlohmann::json::object(), token);
  EXPECT_EQ(again.status, http::status::unauthorized);
}

TEST_F(ServerFixture, DeletedUserLosesAccess) {
  auto token = AccessToken("bob@example.com");
  users_->RemoveUser("u-bob");
  auto me = Get("/api/v1/auth/me", token);
  EXPECT_EQ(me.status, http::status::unauthorized);
  EXPECT_EQ(me.body["error"]["detail"], "user_not_found");
}

TEST_F(ServerFixture, MetricsAndOpsStatus) {
  AccessToken("alice@example.com");
  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.status, http::status::ok);
  ExpectSuccessEnvelope(metrics.body);
  EXPECT_GE(metrics.body["data"]["requests"]["total"].get<int>(), 1);

  auto denied = Get("/ops/status");
  EXPECT_EQ(denied.status, http::status::unauthorized);
  ExpectErrorEnvelope(denied.body, "unauthorized");

  auto ops = Request(http::verb::get, "/ops/status", std::nullopt, "", "ops-e2e");
  EXPECT_EQ(ops.status, http::status::ok);
  EXPECT_EQ(ops.body["data"]["storeBackend"], "memory");
}

TEST_F(ServerFixture, UnknownRouteIsNotFound) {
  auto res = Get("/api/v1/unknown");
  EXPECT_EQ(res.status, http::status::not_found);
  ExpectErrorEnvelope(res.body, "not_found");
}
