/*
 * 설명: 세션 토큰 클레임, 인증된 Identity, 인증 실패 유형을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp, server/tests/unit/session_service_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace teamlink {

enum class TokenType { kAccess, kRefresh };

std::string_view ToString(TokenType type);
std::optional<TokenType> ParseTokenType(std::string_view value);

struct TokenClaims {
  std::string user_id;
  std::string organization_id;
  std::string role;
  // access 토큰에만 포함된다.
  std::string email;
  TokenType type{TokenType::kAccess};
  std::int64_t issued_at{0};
  std::int64_t expires_at{0};
  std::string token_id;
};

struct TokenPair {
  std::string access_token;
  std::string refresh_token;
  std::int64_t expires_in{0};
  std::string token_type{"Bearer"};
};

// 검증된 토큰과 현재 사용자 레코드에서 만들어지며 요청/연결 단위로만 소유된다.
struct Identity {
  std::string user_id;
  std::string organization_id;
  std::string role;
};

enum class AuthErrorCode {
  kNone,
  kTokenExpired,
  kTokenRevoked,
  kTokenInvalid,
  kUserNotFound,
  kTenantMissing,
  kSubscriptionRejected,
  kContentRejected,
  // 저장소 장애로 판정을 내리지 못했다. 클라이언트 잘못이 아니다.
  kServiceUnavailable,
};

struct AuthError {
  AuthErrorCode code{AuthErrorCode::kNone};
  std::string message;

  void Set(AuthErrorCode next_code, std::string next_message) {
    code = next_code;
    message = std::move(next_message);
  }
};

std::string_view ToWireCode(AuthErrorCode code);

using EpochClock = std::function<std::int64_t()>;

std::int64_t SystemEpochSeconds();

}  // namespace teamlink
