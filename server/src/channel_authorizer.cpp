/*
 * 설명: 스트림 키 유도, 메시지 본문 정규화, 채널 구독/전송 인가를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_authorizer_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#include "teamlink/channel_authorizer.hpp"

#include <exception>
#include <utility>

namespace teamlink {

namespace {
bool IsTrimmable(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r' || c == '\0';
}
}  // namespace

std::string TeamStreamKey(const std::string& organization_id) { return "team:" + organization_id; }

std::string DirectStreamKey(const std::string& user_a, const std::string& user_b,
                            const std::string& organization_id) {
  const auto& low = user_a < user_b ? user_a : user_b;
  const auto& high = user_a < user_b ? user_b : user_a;
  return "dm:" + low + ":" + high + ":org:" + organization_id;
}

std::string TrimContent(std::string_view content) {
  std::size_t begin = 0;
  std::size_t end = content.size();
  while (begin < end && IsTrimmable(content[begin])) {
    ++begin;
  }
  while (end > begin && IsTrimmable(content[end - 1])) {
    --end;
  }
  return std::string(content.substr(begin, end - begin));
}

std::size_t CountCodePoints(std::string_view text) {
  std::size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

ChannelAuthorizer::ChannelAuthorizer(std::shared_ptr<UserStore> users, std::shared_ptr<Observability> observability)
    : users_(std::move(users)), observability_(std::move(observability)) {}

std::optional<std::string> ChannelAuthorizer::AuthorizeSubscription(const Identity& identity,
                                                                    const SubscriptionParams& params,
                                                                    AuthError& error) const {
  std::optional<std::string> key;
  if (std::holds_alternative<TeamSubscription>(params)) {
    key = AuthorizeTeam(identity, error);
  } else if (const auto* direct = std::get_if<DirectSubscription>(&params)) {
    std::optional<User> recipient;
    key = AuthorizeDirect(identity, *direct, recipient, error);
  }
  if (!key) {
    LogRejection(identity, error);
  }
  return key;
}

std::optional<AuthorizedSend> ChannelAuthorizer::AuthorizeSend(const Identity& identity,
                                                               const SubscriptionParams& params,
                                                               std::string_view content, AuthError& error) const {
  auto trimmed = TrimContent(content);
  if (trimmed.empty()) {
    error.Set(AuthErrorCode::kContentRejected, "Message content cannot be empty");
    LogRejection(identity, error);
    return std::nullopt;
  }
  if (CountCodePoints(trimmed) > kMaxMessageLength) {
    error.Set(AuthErrorCode::kContentRejected,
              "Message too long (max " + std::to_string(kMaxMessageLength) + " characters)");
    LogRejection(identity, error);
    return std::nullopt;
  }

  AuthorizedSend send;
  std::optional<std::string> key;
  if (std::holds_alternative<TeamSubscription>(params)) {
    key = AuthorizeTeam(identity, error);
  } else if (const auto* direct = std::get_if<DirectSubscription>(&params)) {
    key = AuthorizeDirect(identity, *direct, send.recipient, error);
  }
  if (!key) {
    LogRejection(identity, error);
    return std::nullopt;
  }
  send.stream_key = std::move(*key);
  send.content = std::move(trimmed);
  return send;
}

std::optional<std::string> ChannelAuthorizer::AuthorizeTeam(const Identity& identity, AuthError& error) const {
  if (identity.organization_id.empty()) {
    error.Set(AuthErrorCode::kSubscriptionRejected, "No organization for team channel");
    return std::nullopt;
  }
  return TeamStreamKey(identity.organization_id);
}

std::optional<std::string> ChannelAuthorizer::AuthorizeDirect(const Identity& identity,
                                                              const DirectSubscription& params,
                                                              std::optional<User>& recipient,
                                                              AuthError& error) const {
  if (identity.organization_id.empty()) {
    error.Set(AuthErrorCode::kSubscriptionRejected, "No organization for direct channel");
    return std::nullopt;
  }
  if (params.recipient_id.find_first_not_of(" \t\r\n") == std::string::npos) {
    error.Set(AuthErrorCode::kSubscriptionRejected, "recipient_id is required");
    return std::nullopt;
  }
  if (params.recipient_id == identity.user_id) {
    error.Set(AuthErrorCode::kSubscriptionRejected, "Cannot message yourself");
    return std::nullopt;
  }
  std::optional<User> user;
  try {
    user = users_->FindById(params.recipient_id);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "recipient_lookup_failed", identity.user_id, identity.organization_id,
                            ex.what());
    }
    error.Set(AuthErrorCode::kServiceUnavailable, "Recipient lookup failed");
    return std::nullopt;
  }
  // 다른 조직 사용자는 존재하지 않는 사용자와 구분하지 않는다.
  if (!user || user->organization_id != identity.organization_id) {
    error.Set(AuthErrorCode::kSubscriptionRejected, "Recipient not found");
    return std::nullopt;
  }
  auto key = DirectStreamKey(identity.user_id, user->id, identity.organization_id);
  recipient = std::move(*user);
  return key;
}

void ChannelAuthorizer::LogRejection(const Identity& identity, const AuthError& error) const {
  if (!observability_) {
    return;
  }
  observability_->Event(LogLevel::kWarn,
                        error.code == AuthErrorCode::kContentRejected ? "send_rejected" : "subscription_rejected",
                        identity.user_id, identity.organization_id, error.message);
}

}  // namespace teamlink
