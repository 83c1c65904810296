/*
 * 설명: 서버가 조립한 저장소/서비스 묶음을 HTTP/WS 세션에 전달하기 위한 구조체를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <memory>

#include "teamlink/channel_authorizer.hpp"
#include "teamlink/config.hpp"
#include "teamlink/connection_authenticator.hpp"
#include "teamlink/credentials.hpp"
#include "teamlink/message_dispatcher.hpp"
#include "teamlink/observability.hpp"
#include "teamlink/realtime.hpp"
#include "teamlink/revocation_store.hpp"
#include "teamlink/session_service.hpp"
#include "teamlink/stores.hpp"
#include "teamlink/token_codec.hpp"

namespace teamlink {

struct StoreBundle {
  std::shared_ptr<UserStore> users;
  std::shared_ptr<OrganizationStore> organizations;
  std::shared_ptr<MessageStore> messages;
  std::shared_ptr<RevocationStore> revocations;
};

struct ServerServices {
  AppConfig config;
  StoreBundle stores;
  std::shared_ptr<Observability> observability;
  std::shared_ptr<TokenCodec> codec;
  std::shared_ptr<SessionService> sessions;
  std::shared_ptr<LoginService> login;
  std::shared_ptr<ConnectionAuthenticator> authenticator;
  std::shared_ptr<ChannelAuthorizer> authorizer;
  std::shared_ptr<StreamHub> hub;
  std::shared_ptr<MessageDispatcher> dispatcher;
};

}  // namespace teamlink
