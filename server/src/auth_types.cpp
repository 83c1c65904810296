/*
 * 설명: 토큰 유형/인증 실패 유형의 문자열 변환과 기본 시계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#include "teamlink/auth_types.hpp"

#include <chrono>

namespace teamlink {

std::string_view ToString(TokenType type) {
  switch (type) {
    case TokenType::kAccess:
      return "access";
    case TokenType::kRefresh:
      return "refresh";
  }
  return "access";
}

std::optional<TokenType> ParseTokenType(std::string_view value) {
  if (value == "access") {
    return TokenType::kAccess;
  }
  if (value == "refresh") {
    return TokenType::kRefresh;
  }
  return std::nullopt;
}

std::string_view ToWireCode(AuthErrorCode code) {
  switch (code) {
    case AuthErrorCode::kNone:
      return "none";
    case AuthErrorCode::kTokenExpired:
      return "token_expired";
    case AuthErrorCode::kTokenRevoked:
      return "token_revoked";
    case AuthErrorCode::kTokenInvalid:
      return "token_invalid";
    case AuthErrorCode::kUserNotFound:
      return "user_not_found";
    case AuthErrorCode::kTenantMissing:
      return "tenant_missing";
    case AuthErrorCode::kSubscriptionRejected:
      return "subscription_rejected";
    case AuthErrorCode::kContentRejected:
      return "content_rejected";
    case AuthErrorCode::kServiceUnavailable:
      return "service_unavailable";
  }
  return "none";
}

std::int64_t SystemEpochSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace teamlink
