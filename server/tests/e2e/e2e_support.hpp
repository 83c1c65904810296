#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "teamlink/app.hpp"
#include "teamlink/memory_stores.hpp"

namespace teamlink::e2e {

constexpr const char* kPassword = "password123";

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

inline void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
  EXPECT_TRUE(body["meta"]["timestamp"].is_string());
}

inline void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
  ASSERT_TRUE(body.contains("meta"));
}

// 케이블 클라이언트. 읽기는 시간 제한이 있고, 초과하면 연결을 닫고 nullopt를 돌려준다.
class CableClient {
 public:
  CableClient(unsigned short port, const std::string& token) : ws_(ioc_) {
    boost::asio::ip::tcp::resolver resolver{ioc_};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(port));
    boost::beast::get_lowest_layer(ws_).connect(results);
    ws_.handshake("127.0.0.1:" + std::to_string(port), "/cable?token=" + token);
  }

  ~CableClient() {
    boost::beast::error_code ec;
    if (ws_.is_open()) {
      ws_.close(boost::beast::websocket::close_code::normal, ec);
    }
  }

  void Send(const nlohmann::json& frame) { ws_.write(boost::asio::buffer(frame.dump())); }

  void Subscribe(const nlohmann::json& identifier) {
    Send({{"command", "subscribe"}, {"identifier", identifier}});
  }

  void Speak(const nlohmann::json& identifier, const nlohmann::json& data) {
    Send({{"command", "message"}, {"identifier", identifier}, {"data", data}});
  }

  std::optional<nlohmann::json> Read(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    boost::beast::flat_buffer buffer;
    bool done = false;
    boost::beast::error_code result;
    ws_.async_read(buffer, [&](boost::beast::error_code ec, std::size_t) {
      result = ec;
      done = true;
    });
    ioc_.restart();
    ioc_.run_for(timeout);
    if (!done) {
      boost::beast::get_lowest_layer(ws_).close();
      ioc_.restart();
      ioc_.run();
      return std::nullopt;
    }
    if (result) {
      return std::nullopt;
    }
    return nlohmann::json::parse(boost::beast::buffers_to_string(buffer.data()));
  }

 private:
  boost::asio::io_context ioc_;
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
};

// 저장소 장애를 흉내 낸다. SetFailing(true) 동안 모든 조회가 예외를 던진다.
class UserStoreGate : public UserStore {
 public:
  explicit UserStoreGate(std::shared_ptr<UserStore> inner) : inner_(std::move(inner)) {}

  void SetFailing(bool failing) { failing_ = failing; }

  std::optional<User> FindById(const std::string& id) override {
    ThrowIfFailing();
    return inner_->FindById(id);
  }
  std::optional<UserCredential> FindCredentialByEmail(const std::string& email) override {
    ThrowIfFailing();
    return inner_->FindCredentialByEmail(email);
  }

 private:
  void ThrowIfFailing() const {
    if (failing_) {
      throw std::runtime_error("user store unreachable");
    }
  }

  std::shared_ptr<UserStore> inner_;
  std::atomic<bool> failing_{false};
};

// 인메모리 저장소를 주입한 서버를 임의 포트로 띄운다.
// org-1: alice(owner), bob(player) / org-2: mallory(owner) / 조직 없음: drifter
class ServerFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    users_ = std::make_shared<InMemoryUserStore>();
    organizations_ = std::make_shared<InMemoryOrganizationStore>();
    messages_ = std::make_shared<InMemoryMessageStore>();
    organizations_->AddOrganization(Organization{"org-1", "Blue Team"});
    organizations_->AddOrganization(Organization{"org-2", "Red Team"});
    users_->AddUser(User{"u-alice", "org-1", "owner", "alice@example.com"}, kPassword);
    users_->AddUser(User{"u-bob", "org-1", "player", "bob@example.com"}, kPassword);
    users_->AddUser(User{"u-mallory", "org-2", "owner", "mallory@example.com"}, kPassword);
    users_->AddUser(User{"u-drifter", "", "player", "drifter@example.com"}, kPassword);

    AppConfig config;
    config.port = 0;
    config.jwt_secret_key = "e2e-secret";
    config.log_level = "error";
    config.ops_token = "ops-e2e";
    config.login_rate_limit_max = 20;
    Configure(config);
    StoreBundle stores;
    user_gate_ = std::make_shared<UserStoreGate>(users_);
    stores.users = user_gate_;
    stores.organizations = organizations_;
    stores.messages = messages_;
    app_ = std::make_unique<ServerApp>(config, stores);
    app_->Start();
    port_ = app_->BoundPort();
  }

  virtual void Configure(AppConfig& /*config*/) {}

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
  }

  SimpleHttpResponse Request(boost::beast::http::verb verb, const std::string& target,
                             const std::optional<nlohmann::json>& body, const std::string& token,
                             const std::string& ops_token = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port_)));

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "127.0.0.1");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (body) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body->dump();
    }
    if (!token.empty()) {
      req.set(boost::beast::http::field::authorization, "Bearer " + token);
    }
    if (!ops_token.empty()) {
      req.set("X-Ops-Token", ops_token);
    }
    req.prepare_payload();
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse PostJson(const std::string& target, const nlohmann::json& body, const std::string& token = "") {
    return Request(boost::beast::http::verb::post, target, body, token);
  }

  SimpleHttpResponse Get(const std::string& target, const std::string& token = "") {
    return Request(boost::beast::http::verb::get, target, std::nullopt, token);
  }

  // 성공한 로그인의 tokens 객체를 돌려준다.
  nlohmann::json Login(const std::string& email) {
    auto res = PostJson("/api/v1/auth/login", {{"email", email}, {"password", kPassword}});
    EXPECT_EQ(res.status, boost::beast::http::status::ok);
    return res.body["data"]["tokens"];
  }

  std::string AccessToken(const std::string& email) { return Login(email)["access_token"].get<std::string>(); }

  // 업그레이드를 시도하고 HTTP 응답 상태와 본문을 돌려준다. 101이면 본문은 null.
  SimpleHttpResponse TryUpgrade(const std::string& target) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws{ioc};
    boost::beast::get_lowest_layer(ws).connect(resolver.resolve("127.0.0.1", std::to_string(port_)));
    boost::beast::websocket::response_type res;
    boost::beast::error_code ec;
    ws.handshake(res, "127.0.0.1", target, ec);
    nlohmann::json body = res.body().empty() ? nlohmann::json(nullptr) : nlohmann::json::parse(res.body(), nullptr, false);
    if (!ec) {
      ws.close(boost::beast::websocket::close_code::normal, ec);
    }
    return SimpleHttpResponse{res.result(), body};
  }

  std::shared_ptr<InMemoryUserStore> users_;
  std::shared_ptr<UserStoreGate> user_gate_;
  std::shared_ptr<InMemoryOrganizationStore> organizations_;
  std::shared_ptr<InMemoryMessageStore> messages_;
  std::unique_ptr<ServerApp> app_;
  unsigned short port_{0};
};

}  // namespace teamlink::e2e
