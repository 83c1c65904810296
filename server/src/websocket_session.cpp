/*
 * 설명: 케이블 명령(subscribe/unsubscribe/message)을 처리하고 스트림 메시지를 백프레셔 한도 안에서 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/channel_flow_test.cpp
 */
#include "teamlink/websocket_session.hpp"

#include <exception>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "teamlink/api_response.hpp"

namespace teamlink {
namespace {
std::optional<std::string> IdText(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  return std::nullopt;
}

// 문자열이 아닌 content도 텍스트로 바꿔 같은 검증을 거치게 한다.
std::string ContentText(const nlohmann::json& data) {
  auto it = data.find("content");
  if (it == data.end() || it->is_null()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}
}  // namespace

std::optional<SubscriptionParams> ParseChannelIdentifier(const nlohmann::json& identifier) {
  nlohmann::json parsed = identifier;
  if (identifier.is_string()) {
    parsed = nlohmann::json::parse(identifier.get<std::string>(), nullptr, false);
  }
  if (!parsed.is_object()) {
    return std::nullopt;
  }
  auto channel = parsed.find("channel");
  if (channel == parsed.end() || !channel->is_string()) {
    return std::nullopt;
  }
  if (*channel == "TeamChannel") {
    return SubscriptionParams{TeamSubscription{}};
  }
  if (*channel == "DirectMessageChannel") {
    DirectSubscription direct;
    auto recipient = parsed.find("recipient_id");
    if (recipient != parsed.end()) {
      direct.recipient_id = IdText(*recipient).value_or("");
    }
    return SubscriptionParams{direct};
  }
  return std::nullopt;
}

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   const Identity& identity, std::shared_ptr<const ServerServices> services)
    : ws_(std::move(ws)), identity_(identity), services_(std::move(services)) {}

WebSocketSession::~WebSocketSession() { Teardown(); }

void WebSocketSession::Run() {
  scope_.Bind(identity_);
  services_->observability->WebsocketOpened();
  services_->observability->Event(LogLevel::kInfo, "cable_connected", identity_.user_id,
                                  identity_.organization_id);
  SendJson(MakeWelcomeFrame(identity_));
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec || closing_) {
    Teardown();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  auto message = nlohmann::json::parse(data, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    SendJson(MakeProtocolErrorFrame("JSON 파싱 오류"));
    return DoRead();
  }
  auto command = message.find("command");
  auto identifier = message.find("identifier");
  if (command == message.end() || !command->is_string() || identifier == message.end()) {
    SendJson(MakeProtocolErrorFrame("command와 identifier가 필요합니다"));
    return DoRead();
  }

  // 명령 하나의 실패는 그 명령의 오류 프레임으로 끝나고 연결과 워커는 유지된다.
  try {
    if (*command == "subscribe") {
      HandleSubscribe(*identifier);
    } else if (*command == "unsubscribe") {
      HandleUnsubscribe(*identifier);
    } else if (*command == "message") {
      auto payload = message.find("data");
      if (payload != message.end() && payload->is_string()) {
        HandleMessage(*identifier, nlohmann::json::parse(payload->get<std::string>(), nullptr, false));
      } else if (payload != message.end() && payload->is_object()) {
        HandleMessage(*identifier, *payload);
      } else {
        HandleMessage(*identifier, nlohmann::json::object());
      }
    } else {
      SendJson(MakeProtocolErrorFrame("알 수 없는 command"));
    }
  } catch (const std::exception& ex) {
    services_->observability->Event(LogLevel::kError, "cable_command_failed", identity_.user_id,
                                    identity_.organization_id, ex.what());
    SendJson(MakeProtocolErrorFrame("명령을 처리하지 못했습니다"));
  }

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::HandleSubscribe(const nlohmann::json& identifier) {
  auto key = identifier.dump();
  auto existing = subscriptions_.find(key);
  if (existing != subscriptions_.end()) {
    SendJson(MakeConfirmSubscriptionFrame(identifier, existing->second.stream_key));
    return;
  }
  auto params = ParseChannelIdentifier(identifier);
  if (!params) {
    SendJson(MakeRejectSubscriptionFrame(identifier, AuthErrorCode::kSubscriptionRejected));
    return;
  }
  AuthError error;
  auto stream_key = services_->authorizer->AuthorizeSubscription(identity_, *params, error);
  if (!stream_key) {
    SendJson(MakeRejectSubscriptionFrame(identifier, error.code));
    return;
  }
  services_->hub->Subscribe(*stream_key, shared_from_this());
  subscriptions_.emplace(key, Subscription{identifier, *params, *stream_key});
  SendJson(MakeConfirmSubscriptionFrame(identifier, *stream_key));
}

void WebSocketSession::HandleUnsubscribe(const nlohmann::json& identifier) {
  auto it = subscriptions_.find(identifier.dump());
  if (it == subscriptions_.end()) {
    return;
  }
  auto stream_key = it->second.stream_key;
  subscriptions_.erase(it);
  for (const auto& [_, subscription] : subscriptions_) {
    if (subscription.stream_key == stream_key) {
      return;
    }
  }
  services_->hub->Unsubscribe(stream_key, this);
}

void WebSocketSession::HandleMessage(const nlohmann::json& identifier, const nlohmann::json& data) {
  auto it = subscriptions_.find(identifier.dump());
  if (it == subscriptions_.end()) {
    AuthError error;
    error.Set(AuthErrorCode::kSubscriptionRejected, "Not subscribed");
    SendJson(MakeChannelErrorFrame(identifier, error));
    return;
  }
  if (!data.is_object()) {
    SendJson(MakeProtocolErrorFrame("data가 올바르지 않습니다"));
    return;
  }

  auto params = it->second.params;
  if (auto* direct = std::get_if<DirectSubscription>(&params)) {
    auto recipient = data.find("recipient_id");
    if (recipient != data.end()) {
      direct->recipient_id = IdText(*recipient).value_or("");
    }
  }

  AuthError error;
  auto stored = services_->dispatcher->Send(identity_, scope_, params, ContentText(data), error);
  if (!stored) {
    SendJson(MakeChannelErrorFrame(identifier, error));
  }
}

void WebSocketSession::Deliver(const std::string& stream_key, const nlohmann::json& payload) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(),
                    [self, stream_key, payload]() { self->DeliverOnStrand(stream_key, payload); });
}

void WebSocketSession::DeliverOnStrand(const std::string& stream_key, const nlohmann::json& payload) {
  for (const auto& [_, subscription] : subscriptions_) {
    if (subscription.stream_key == stream_key) {
      SendJson(MakeChannelFrame(subscription.identifier, payload));
    }
  }
}

void WebSocketSession::SendJson(const nlohmann::json& frame) { EnqueueMessage(frame.dump()); }

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= services_->config.ws_queue_limit_messages ||
      queued_bytes_ + message_size > services_->config.ws_queue_limit_bytes) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  if (ec) {
    closing_ = true;
    Teardown();
    return;
  }
  writing_ = false;
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  services_->observability->Event(LogLevel::kWarn, "backpressure_close", identity_.user_id,
                                  identity_.organization_id);
  Teardown();
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::Teardown() {
  if (torn_down_) {
    return;
  }
  torn_down_ = true;
  services_->hub->UnsubscribeAll(this);
  subscriptions_.clear();
  scope_.Clear();
  services_->observability->WebsocketClosed();
  services_->observability->Event(LogLevel::kInfo, "cable_disconnected", identity_.user_id,
                                  identity_.organization_id);
}

}  // namespace teamlink
