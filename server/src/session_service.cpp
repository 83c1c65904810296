/*
 * 설명: 토큰 쌍 발급/검증/회전/폐기 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_service_test.cpp, server/tests/e2e/auth_flow_test.cpp
 */
#include "teamlink/session_service.hpp"

#include <utility>

namespace teamlink {

SessionService::SessionService(std::shared_ptr<TokenCodec> codec, std::shared_ptr<RevocationStore> revocations,
                               std::shared_ptr<UserStore> users, const SessionConfig& config,
                               std::shared_ptr<Observability> observability)
    : codec_(std::move(codec)), revocations_(std::move(revocations)), users_(std::move(users)), config_(config),
      observability_(std::move(observability)) {}

TokenPair SessionService::IssueTokenPair(const User& user) const {
  auto now = codec_->Now();

  TokenClaims access;
  access.user_id = user.id;
  access.organization_id = user.organization_id;
  access.role = user.role;
  access.email = user.email;
  access.type = TokenType::kAccess;

  TokenClaims refresh;
  refresh.user_id = user.id;
  refresh.organization_id = user.organization_id;
  refresh.type = TokenType::kRefresh;

  TokenPair pair;
  pair.access_token = codec_->Encode(access, now + config_.access_ttl.count());
  pair.refresh_token = codec_->Encode(refresh, now + config_.refresh_ttl.count());
  pair.expires_in = config_.access_ttl.count();
  return pair;
}

std::optional<TokenClaims> SessionService::Verify(const std::string& token, AuthError& error) const {
  auto claims = codec_->Decode(token, error);
  if (!claims) {
    return std::nullopt;
  }
  if (revocations_->IsRevoked(claims->token_id)) {
    error.Set(AuthErrorCode::kTokenRevoked, "Token has been revoked");
    return std::nullopt;
  }
  return claims;
}

std::optional<TokenPair> SessionService::Refresh(const std::string& refresh_token, AuthError& error) const {
  auto claims = Verify(refresh_token, error);
  if (!claims) {
    return std::nullopt;
  }
  if (claims->type != TokenType::kRefresh) {
    error.Set(AuthErrorCode::kTokenInvalid, "Invalid refresh token");
    return std::nullopt;
  }
  auto user = users_->FindById(claims->user_id);
  if (!user) {
    error.Set(AuthErrorCode::kUserNotFound, "User not found");
    return std::nullopt;
  }
  // 동시에 같은 refresh 토큰을 쓰면 폐기 레코드를 먼저 만든 쪽만 새 쌍을 받는다.
  if (!revocations_->Revoke(claims->token_id, claims->expires_at)) {
    error.Set(AuthErrorCode::kTokenRevoked, "Token has been revoked");
    return std::nullopt;
  }
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "token_refreshed", user->id, user->organization_id);
  }
  return IssueTokenPair(*user);
}

bool SessionService::RevokeToken(const std::string& token) const {
  AuthError error;
  auto claims = codec_->Decode(token, error);
  if (!claims) {
    if (observability_) {
      observability_->Event(LogLevel::kWarn, "token_revoke_skipped", std::nullopt, std::nullopt, error.message);
    }
    return false;
  }
  if (claims->token_id.empty()) {
    return false;
  }
  auto expires_at = claims->expires_at > 0 ? claims->expires_at : codec_->Now() + config_.access_ttl.count();
  bool created = revocations_->Revoke(claims->token_id, expires_at);
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "token_revoked", claims->user_id, claims->organization_id,
                          std::string(ToString(claims->type)));
  }
  return created;
}

}  // namespace teamlink
