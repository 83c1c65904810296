/*
 * 설명: 케이블(WebSocket) 업그레이드 요청의 토큰을 검증해 Identity를 만들거나 연결을 거절한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_authenticator_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "teamlink/auth_types.hpp"
#include "teamlink/observability.hpp"
#include "teamlink/session_service.hpp"
#include "teamlink/stores.hpp"

namespace teamlink {

enum class ConnectionState { kPending, kAuthenticated, kRejected };

std::string_view ToString(ConnectionState state);

struct ConnectionAuthResult {
  ConnectionState state{ConnectionState::kPending};
  std::optional<Identity> identity;
  AuthError error;

  bool Authenticated() const { return state == ConnectionState::kAuthenticated; }
};

class ConnectionAuthenticator {
 public:
  ConnectionAuthenticator(std::shared_ptr<SessionService> sessions, std::shared_ptr<UserStore> users,
                          std::shared_ptr<Observability> observability = nullptr);

  // 재시도하지 않는다. 결과는 kAuthenticated 또는 kRejected 중 하나다.
  ConnectionAuthResult Authenticate(const std::optional<std::string>& token) const;

 private:
  ConnectionAuthResult Reject(AuthErrorCode code, std::string message) const;

  std::shared_ptr<SessionService> sessions_;
  std::shared_ptr<UserStore> users_;
  std::shared_ptr<Observability> observability_;
};

// "/cable?token=..." 형태의 요청 대상에서 token 쿼리 값을 퍼센트 디코딩해 꺼낸다.
std::optional<std::string> ExtractCableToken(std::string_view target);

}  // namespace teamlink
