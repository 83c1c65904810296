/*
 * 설명: 인증된 케이블 연결의 구독/전송 명령 처리, 스트림 전달, 백프레셔를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/channel_flow_test.cpp
 */
#pragma once

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "teamlink/auth_types.hpp"
#include "teamlink/channel_authorizer.hpp"
#include "teamlink/realtime.hpp"
#include "teamlink/services.hpp"
#include "teamlink/tenant_context.hpp"

namespace teamlink {

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession>, public StreamSubscriber {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, const Identity& identity,
                   std::shared_ptr<const ServerServices> services);
  ~WebSocketSession() override;
  void Run();

  void Deliver(const std::string& stream_key, const nlohmann::json& payload) override;

 private:
  struct Subscription {
    nlohmann::json identifier;
    SubscriptionParams params;
    std::string stream_key;
  };

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleSubscribe(const nlohmann::json& identifier);
  void HandleUnsubscribe(const nlohmann::json& identifier);
  void HandleMessage(const nlohmann::json& identifier, const nlohmann::json& data);
  void DeliverOnStrand(const std::string& stream_key, const nlohmann::json& payload);
  void SendJson(const nlohmann::json& frame);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void Teardown();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  const Identity identity_;
  TenantScope scope_;
  std::shared_ptr<const ServerServices> services_;
  // identifier.dump() -> 구독
  std::map<std::string, Subscription> subscriptions_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool torn_down_{false};
};

// 케이블 identifier(객체 또는 JSON 문자열)를 구독 파라미터로 해석한다. 알 수 없는 채널이면 nullopt.
std::optional<SubscriptionParams> ParseChannelIdentifier(const nlohmann::json& identifier);

}  // namespace teamlink
