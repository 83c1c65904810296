/*
 * 설명: 인가된 메시지를 저장하고 해당 대화 스트림으로 new_message를 방송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_dispatcher_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include "teamlink/auth_types.hpp"
#include "teamlink/channel_authorizer.hpp"
#include "teamlink/observability.hpp"
#include "teamlink/realtime.hpp"
#include "teamlink/stores.hpp"
#include "teamlink/tenant_context.hpp"

namespace teamlink {

class MessageDispatcher {
 public:
  MessageDispatcher(std::shared_ptr<ChannelAuthorizer> authorizer, std::shared_ptr<MessageStore> messages,
                    std::shared_ptr<StreamHub> hub, std::shared_ptr<Observability> observability = nullptr);

  // 저장 실패는 kContentRejected("Failed to send message")로 보고한다.
  std::optional<StoredMessage> Send(const Identity& identity, const TenantScope& scope,
                                    const SubscriptionParams& params, std::string_view content,
                                    AuthError& error) const;

 private:
  std::shared_ptr<ChannelAuthorizer> authorizer_;
  std::shared_ptr<MessageStore> messages_;
  std::shared_ptr<StreamHub> hub_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace teamlink
