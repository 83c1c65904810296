/*
 * 설명: HS256 JWT 세션 토큰의 서명/검증을 담당하는 무상태 코덱이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "teamlink/auth_types.hpp"

namespace teamlink {

struct TokenCodecConfig {
  std::string secret;
  std::chrono::seconds default_ttl{std::chrono::hours(24)};
};

// 폐기 여부는 보지 않는다. 신뢰 판단은 SessionService::Verify를 거쳐야 한다.
class TokenCodec {
 public:
  explicit TokenCodec(TokenCodecConfig config, EpochClock clock = SystemEpochSeconds);

  // token_id가 비어 있으면 새로 발급하고 issued_at/expires_at을 채운 뒤 서명한다.
  std::string Encode(TokenClaims claims, std::optional<std::int64_t> expires_at = std::nullopt) const;

  // 형식/서명 오류는 kTokenInvalid, now >= exp 이면 kTokenExpired.
  std::optional<TokenClaims> Decode(const std::string& token, AuthError& error) const;

  std::int64_t Now() const { return clock_(); }
  std::chrono::seconds DefaultTtl() const { return config_.default_ttl; }

 private:
  std::string Sign(const std::string& signing_input) const;

  TokenCodecConfig config_;
  EpochClock clock_;
};

}  // namespace teamlink
