/*
 * 설명: 팀/DM 채널의 스트림 키를 테넌트 범위로 유도하고 구독/전송을 인가한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_authorizer_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "teamlink/auth_types.hpp"
#include "teamlink/observability.hpp"
#include "teamlink/stores.hpp"

namespace teamlink {

struct TeamSubscription {};

struct DirectSubscription {
  std::string recipient_id;
};

using SubscriptionParams = std::variant<TeamSubscription, DirectSubscription>;

struct AuthorizedSend {
  std::string stream_key;
  std::string content;
  // DM일 때만 채워진다.
  std::optional<User> recipient;
};

constexpr std::size_t kMaxMessageLength = 2000;

std::string TeamStreamKey(const std::string& organization_id);
// 두 사용자 ID를 사전순으로 정렬하므로 양쪽 참여자가 같은 키를 얻는다.
std::string DirectStreamKey(const std::string& user_a, const std::string& user_b,
                            const std::string& organization_id);

// 앞뒤 ASCII 공백과 NUL을 제거한다.
std::string TrimContent(std::string_view content);
// UTF-8 코드 포인트 수. 연속 바이트(10xxxxxx)는 세지 않는다.
std::size_t CountCodePoints(std::string_view text);

// 무상태. 거절 시 기본 스트림으로 대체하지 않고 부분 상태도 남기지 않는다.
class ChannelAuthorizer {
 public:
  explicit ChannelAuthorizer(std::shared_ptr<UserStore> users,
                             std::shared_ptr<Observability> observability = nullptr);

  std::optional<std::string> AuthorizeSubscription(const Identity& identity, const SubscriptionParams& params,
                                                   AuthError& error) const;

  // DM 수신자는 전송마다 다시 조회한다.
  std::optional<AuthorizedSend> AuthorizeSend(const Identity& identity, const SubscriptionParams& params,
                                              std::string_view content, AuthError& error) const;

 private:
  std::optional<std::string> AuthorizeTeam(const Identity& identity, AuthError& error) const;
  std::optional<std::string> AuthorizeDirect(const Identity& identity, const DirectSubscription& params,
                                             std::optional<User>& recipient, AuthError& error) const;
  void LogRejection(const Identity& identity, const AuthError& error) const;

  std::shared_ptr<UserStore> users_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace teamlink
