/*
 * 설명: HTTP 요청을 처리하고 로그인/리프레시/로그아웃/me, 메트릭, 케이블 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/auth_flow_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#include "teamlink/http_session.hpp"

#include <utility>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "teamlink/api_response.hpp"
#include "teamlink/websocket_session.hpp"

namespace teamlink {

namespace http = boost::beast::http;

namespace {
constexpr const char* kServerName = "teamlink";

std::string PathOf(const std::string& target) {
  auto qpos = target.find('?');
  return qpos == std::string::npos ? target : target.substr(0, qpos);
}

std::optional<std::string> StringField(const nlohmann::json& body, const char* key) {
  if (!body.is_object()) {
    return std::nullopt;
  }
  auto it = body.find(key);
  if (it == body.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

http::status RejectionStatus(AuthErrorCode code) {
  return code == AuthErrorCode::kServiceUnavailable ? http::status::service_unavailable : http::status::unauthorized;
}
}  // namespace

void WriteJson(HttpSession::Response& res, http::status status, const nlohmann::json& body) {
  res.result(status);
  res.body() = body.dump();
  res.content_length(res.body().size());
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServerServices> services)
    : stream_(std::move(socket)), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = services_->observability->NextTraceId();
  services_->observability->IncrementRequest();
  scope_ = std::make_unique<TenantScope>();

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  const auto path = PathOf(std::string(req_.target()));
  const auto method = req_.method();

  try {
    if (method == http::verb::get && path == "/api/health") {
      WriteJson(*res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
    } else if (method == http::verb::get && path == "/metrics") {
      HandleMetrics(*res);
    } else if (method == http::verb::get && path == "/ops/status") {
      HandleOpsStatus(*res);
    } else if (method == http::verb::post && path == "/api/v1/auth/login") {
      HandleLogin(*res);
    } else if (method == http::verb::post && path == "/api/v1/auth/refresh") {
      HandleRefresh(*res);
    } else if (method == http::verb::post && path == "/api/v1/auth/logout") {
      HandleLogout(*res);
    } else if (method == http::verb::get && path == "/api/v1/auth/me") {
      HandleMe(*res);
    } else {
      WriteJson(*res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
    }
  } catch (const std::exception& ex) {
    services_->observability->Event(LogLevel::kError, "request_failed", std::nullopt, std::nullopt, ex.what());
    WriteJson(*res, http::status::internal_server_error,
              MakeErrorEnvelope("internal_error", "요청을 처리하지 못했습니다"));
  }
  SendResponse(res);
}

void HttpSession::HandleLogin(Response& res) {
  auto body = nlohmann::json::parse(req_.body(), nullptr, false);
  auto email = StringField(body, "email");
  auto password = StringField(body, "password");
  if (!email || !password) {
    WriteJson(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "email과 password가 필요합니다"));
    return;
  }
  std::string error_code;
  std::string error_message;
  auto result = services_->login->Login(*email, *password, RemoteIp(), error_code, error_message);
  if (!result) {
    auto status = http::status::unauthorized;
    if (error_code == "rate_limited") {
      status = http::status::too_many_requests;
    } else if (error_code == "bad_request") {
      status = http::status::bad_request;
    }
    services_->observability->Event(LogLevel::kWarn, "login_failed", std::nullopt, std::nullopt, error_code);
    WriteJson(res, status, MakeErrorEnvelope(error_code, error_message));
    return;
  }
  nlohmann::json data{{"user", UserToJson(result->user)}, {"tokens", TokenPairToJson(result->tokens)}};
  data["organization"] = result->organization ? OrganizationToJson(*result->organization) : nlohmann::json(nullptr);
  services_->observability->Event(LogLevel::kInfo, "login_succeeded", result->user.id, result->user.organization_id);
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleRefresh(Response& res) {
  auto body = nlohmann::json::parse(req_.body(), nullptr, false);
  auto refresh_token = StringField(body, "refresh_token");
  if (!refresh_token || refresh_token->empty()) {
    WriteJson(res, http::status::bad_request,
              MakeErrorEnvelope("MISSING_REFRESH_TOKEN", "Refresh token is required"));
    return;
  }
  AuthError error;
  auto pair = services_->sessions->Refresh(*refresh_token, error);
  if (!pair) {
    services_->observability->Event(LogLevel::kWarn, "refresh_rejected", std::nullopt, std::nullopt,
                                    std::string(ToWireCode(error.code)));
    WriteJson(res, http::status::unauthorized,
              MakeErrorEnvelope("INVALID_REFRESH_TOKEN", error.message, std::string(ToWireCode(error.code))));
    return;
  }
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(TokenPairToJson(*pair)));
}

void HttpSession::HandleLogout(Response& res) {
  auto identity = AuthenticateBearer(res);
  if (!identity) {
    return;
  }
  auto token = BearerToken();
  if (token) {
    services_->sessions->RevokeToken(*token);
  }
  services_->observability->Event(LogLevel::kInfo, "logout", identity->user_id, identity->organization_id);
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json::object()));
}

void HttpSession::HandleMe(Response& res) {
  if (!AuthenticateBearer(res)) {
    return;
  }
  const auto& context = scope_->Require();
  nlohmann::json data{{"user_id", context.user_id},
                      {"organization_id", context.organization_id},
                      {"role", context.role}};
  auto organization = services_->stores.organizations->FindById(context.organization_id);
  data["organization"] = organization ? OrganizationToJson(*organization) : nlohmann::json(nullptr);
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleMetrics(Response& res) {
  auto snapshot = services_->observability->Snapshot(services_->stores.revocations->Size());
  nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                      {"connections",
                       {{"websocket", snapshot.websocket_active},
                        {"accepted", snapshot.connections_accepted},
                        {"rejected", snapshot.connections_rejected}}},
                      {"subscriptions", {{"active", snapshot.subscriptions_active}}},
                      {"messages",
                       {{"delivered", snapshot.messages_delivered}, {"rejected", snapshot.messages_rejected}}},
                      {"revocations", {{"records", snapshot.revocation_records}}}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleOpsStatus(Response& res) {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  if (services_->config.ops_token.empty() || header_token != services_->config.ops_token) {
    WriteJson(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    return;
  }
  auto snapshot = services_->observability->Snapshot(services_->stores.revocations->Size());
  nlohmann::json data{{"activeWebsocket", snapshot.websocket_active},
                      {"activeSubscriptions", snapshot.subscriptions_active},
                      {"revocationRecords", snapshot.revocation_records},
                      {"storeBackend", services_->config.store_backend},
                      {"errorCount", snapshot.request_errors}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    services_->observability->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.name = "http_request";
  ctx.latency_ms = static_cast<long>(latency);
  ctx.detail = std::string(req_.method_string()) + " " + PathOf(std::string(req_.target())) + " " +
               std::to_string(res->result_int());
  if (scope_ && scope_->IsBound()) {
    ctx.user_id = scope_->Current()->user_id;
    ctx.organization_id = scope_->Current()->organization_id;
  }
  services_->observability->Log(ctx);
  scope_.reset();

  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  auto path = PathOf(std::string(req_.target()));
  if (path != "/cable") {
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(http::field::content_type, "application/json; charset=utf-8");
    WriteJson(*res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
    return SendResponse(res);
  }

  auto result = services_->authenticator->Authenticate(ExtractCableToken(std::string(req_.target())));
  if (!result.Authenticated()) {
    services_->observability->IncrementConnectionRejected();
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(http::field::server, kServerName);
    res->set(http::field::content_type, "application/json; charset=utf-8");
    WriteJson(*res, RejectionStatus(result.error.code),
              MakeErrorEnvelope(ToWireCode(result.error.code), result.error.message));
    return SendResponse(res);
  }
  services_->observability->IncrementConnectionAccepted();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), *result.identity, services_)->Run();
  } catch (const std::exception& ex) {
    services_->observability->Event(LogLevel::kWarn, "cable_accept_failed", result.identity->user_id,
                                    result.identity->organization_id, ex.what());
  }
  scope_.reset();
}

std::optional<Identity> HttpSession::AuthenticateBearer(Response& res) {
  auto result = services_->authenticator->Authenticate(BearerToken());
  if (!result.Authenticated()) {
    const auto status = RejectionStatus(result.error.code);
    WriteJson(res, status,
              MakeErrorEnvelope(status == http::status::unauthorized ? "unauthorized" : "service_unavailable",
                                result.error.message, std::string(ToWireCode(result.error.code))));
    return std::nullopt;
  }
  scope_->Bind(*result.identity);
  return result.identity;
}

std::optional<std::string> HttpSession::BearerToken() const {
  auto auth_it = req_.find(http::field::authorization);
  if (auth_it == req_.end()) {
    return std::nullopt;
  }
  const std::string prefix = "Bearer ";
  std::string header_value = std::string(auth_it->value());
  if (header_value.size() <= prefix.size() || header_value.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  return header_value.substr(prefix.size());
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

}  // namespace teamlink
