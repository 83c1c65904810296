/*
 * 설명: 메시지 전송 인가, 저장, 방송 순서를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_dispatcher_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#include "teamlink/message_dispatcher.hpp"

#include <exception>
#include <utility>

#include "teamlink/api_response.hpp"

namespace teamlink {

MessageDispatcher::MessageDispatcher(std::shared_ptr<ChannelAuthorizer> authorizer,
                                     std::shared_ptr<MessageStore> messages, std::shared_ptr<StreamHub> hub,
                                     std::shared_ptr<Observability> observability)
    : authorizer_(std::move(authorizer)), messages_(std::move(messages)), hub_(std::move(hub)),
      observability_(std::move(observability)) {}

std::optional<StoredMessage> MessageDispatcher::Send(const Identity& identity, const TenantScope& scope,
                                                     const SubscriptionParams& params, std::string_view content,
                                                     AuthError& error) const {
  auto authorized = authorizer_->AuthorizeSend(identity, params, content, error);
  if (!authorized) {
    if (observability_) {
      observability_->IncrementMessageRejected();
    }
    return std::nullopt;
  }

  std::optional<std::string> recipient_id;
  if (authorized->recipient) {
    recipient_id = authorized->recipient->id;
  }

  StoredMessage stored;
  try {
    stored = messages_->Create(scope, authorized->content, identity.user_id, recipient_id, identity.organization_id);
  } catch (const std::exception& ex) {
    error.Set(AuthErrorCode::kContentRejected, "Failed to send message");
    if (observability_) {
      observability_->IncrementMessageRejected();
      observability_->Event(LogLevel::kError, "message_store_failed", identity.user_id, identity.organization_id,
                            ex.what());
    }
    return std::nullopt;
  }

  auto delivered = hub_->Broadcast(authorized->stream_key, MakeNewMessagePayload(stored, identity));
  if (observability_) {
    for (std::size_t i = 0; i < delivered; ++i) {
      observability_->IncrementMessageDelivered();
    }
    observability_->Event(LogLevel::kDebug, "message_broadcast", identity.user_id, identity.organization_id,
                          authorized->stream_key);
  }
  return stored;
}

}  // namespace teamlink
