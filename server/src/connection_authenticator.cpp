/*
 * 설명: 케이블 핸드셰이크 인증 상태 머신과 쿼리 토큰 추출을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_authenticator_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#include "teamlink/connection_authenticator.hpp"

#include <exception>
#include <utility>

namespace teamlink {

namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::optional<std::string> PercentDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= value.size()) {
        return std::nullopt;
      }
      int hi = HexValue(value[i + 1]);
      int lo = HexValue(value[i + 2]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool IsBlank(const std::string& value) { return value.find_first_not_of(" \t\r\n") == std::string::npos; }
}  // namespace

std::string_view ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kPending:
      return "pending";
    case ConnectionState::kAuthenticated:
      return "authenticated";
    case ConnectionState::kRejected:
      return "rejected";
  }
  return "pending";
}

ConnectionAuthenticator::ConnectionAuthenticator(std::shared_ptr<SessionService> sessions,
                                                 std::shared_ptr<UserStore> users,
                                                 std::shared_ptr<Observability> observability)
    : sessions_(std::move(sessions)), users_(std::move(users)), observability_(std::move(observability)) {}

ConnectionAuthResult ConnectionAuthenticator::Authenticate(const std::optional<std::string>& token) const {
  if (!token || IsBlank(*token)) {
    return Reject(AuthErrorCode::kTokenInvalid, "token required");
  }

  AuthError error;
  std::optional<TokenClaims> claims;
  std::optional<User> user;
  try {
    claims = sessions_->Verify(*token, error);
    if (claims && claims->type == TokenType::kAccess) {
      user = users_->FindById(claims->user_id);
    }
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "identity_lookup_failed", std::nullopt, std::nullopt, ex.what());
    }
    return Reject(AuthErrorCode::kServiceUnavailable, "Authentication temporarily unavailable");
  }
  if (!claims) {
    return Reject(error.code, error.message);
  }
  if (claims->type != TokenType::kAccess) {
    return Reject(AuthErrorCode::kTokenInvalid, "Invalid token type");
  }
  if (!user) {
    return Reject(AuthErrorCode::kUserNotFound, "User not found");
  }
  if (user->organization_id.empty()) {
    return Reject(AuthErrorCode::kTenantMissing, "User has no organization");
  }

  // 토큰 클레임이 아니라 핸드셰이크 시점의 사용자 레코드에서 만든다.
  ConnectionAuthResult result;
  result.state = ConnectionState::kAuthenticated;
  result.identity = Identity{user->id, user->organization_id, user->role};
  if (observability_) {
    observability_->Event(LogLevel::kDebug, "identity_authenticated", user->id, user->organization_id,
                          std::string(ToString(result.state)));
  }
  return result;
}

ConnectionAuthResult ConnectionAuthenticator::Reject(AuthErrorCode code, std::string message) const {
  ConnectionAuthResult result;
  result.state = ConnectionState::kRejected;
  result.error.Set(code, std::move(message));
  if (observability_) {
    observability_->Event(LogLevel::kWarn, "identity_rejected", std::nullopt, std::nullopt,
                          std::string(ToWireCode(code)));
  }
  return result;
}

std::optional<std::string> ExtractCableToken(std::string_view target) {
  auto qpos = target.find('?');
  if (qpos == std::string_view::npos) {
    return std::nullopt;
  }
  auto query = target.substr(qpos + 1);
  std::size_t pos = 0;
  while (pos <= query.size()) {
    auto amp = query.find('&', pos);
    auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string_view::npos && pair.substr(0, eq) == "token") {
      return PercentDecode(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return std::nullopt;
}

}  // namespace teamlink
