/*
 * 설명: access/refresh 토큰 쌍의 발급, 검증, 회전(refresh), 폐기를 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_service_test.cpp, server/tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "teamlink/auth_types.hpp"
#include "teamlink/observability.hpp"
#include "teamlink/revocation_store.hpp"
#include "teamlink/stores.hpp"
#include "teamlink/token_codec.hpp"

namespace teamlink {

struct SessionConfig {
  std::chrono::seconds access_ttl{std::chrono::hours(24)};
  std::chrono::seconds refresh_ttl{std::chrono::hours(24 * 7)};
};

// 토큰 의미(type, 만료, 클레임)를 아는 유일한 컴포넌트. 자체 가변 상태는 없다.
class SessionService {
 public:
  SessionService(std::shared_ptr<TokenCodec> codec, std::shared_ptr<RevocationStore> revocations,
                 std::shared_ptr<UserStore> users, const SessionConfig& config,
                 std::shared_ptr<Observability> observability = nullptr);

  TokenPair IssueTokenPair(const User& user) const;

  // 모든 신뢰 판단의 단일 진입점: 디코드 후 폐기 목록을 확인한다.
  std::optional<TokenClaims> Verify(const std::string& token, AuthError& error) const;

  // refresh 토큰은 1회용이다. 사용된 토큰은 새 쌍을 발급하기 전에 폐기된다.
  std::optional<TokenPair> Refresh(const std::string& refresh_token, AuthError& error) const;

  // 디코드할 수 없는 토큰은 무시한다. 새 폐기 레코드를 만들었을 때만 true.
  bool RevokeToken(const std::string& token) const;

  const SessionConfig& GetConfig() const { return config_; }

 private:
  std::shared_ptr<TokenCodec> codec_;
  std::shared_ptr<RevocationStore> revocations_;
  std::shared_ptr<UserStore> users_;
  SessionConfig config_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace teamlink
