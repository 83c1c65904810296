/*
 * 설명: HTTP 연결을 처리하고 인증 엔드포인트, 운영 엔드포인트, 케이블 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/auth_flow_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "teamlink/services.hpp"
#include "teamlink/tenant_context.hpp"

namespace teamlink {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServerServices> services);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleLogin(Response& res);
  void HandleRefresh(Response& res);
  void HandleLogout(Response& res);
  void HandleMe(Response& res);
  void HandleMetrics(Response& res);
  void HandleOpsStatus(Response& res);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();
  // Bearer 헤더를 인증하고 성공하면 요청 스코프에 묶는다. 실패 시 res에 401을 채운다.
  std::optional<Identity> AuthenticateBearer(Response& res);
  std::optional<std::string> BearerToken() const;
  std::string RemoteIp();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const ServerServices> services_;
  // 요청마다 새로 만들어지고 응답 직후 비워진다.
  std::unique_ptr<TenantScope> scope_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

void WriteJson(HttpSession::Response& res, boost::beast::http::status status, const nlohmann::json& body);

}  // namespace teamlink
