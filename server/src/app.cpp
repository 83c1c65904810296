/*
 * 설명: 서비스 조립, 리스닝, 워커 스레드, 환경설정 로딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/auth_flow_test.cpp, server/tests/e2e/channel_flow_test.cpp,
 *         server/tests/unit/config_test.cpp
 */
#include "teamlink/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "teamlink/http_session.hpp"
#include "teamlink/mariadb_stores.hpp"
#include "teamlink/memory_stores.hpp"

namespace teamlink {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const ServerServices> services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), services_(std::move(services)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const ServerServices> services_;
};

ServerApp::ServerApp(const AppConfig& config) : ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  StoreBundle stores;
  if (config.store_backend == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    db_client_ = std::make_shared<MariaDbClient>(db_config);
    auto revocations = std::make_shared<MariaDbRevocationStore>(db_client_);
    revocations->EnsureSchema();
    stores.users = std::make_shared<MariaDbUserStore>(db_client_);
    stores.organizations = std::make_shared<MariaDbOrganizationStore>(db_client_);
    stores.messages = std::make_shared<MariaDbMessageStore>(db_client_);
    stores.revocations = revocations;
  } else if (config.store_backend != "memory") {
    throw std::invalid_argument("지원하지 않는 STORE_BACKEND: " + config.store_backend);
  }
  BuildServices(config, std::move(stores));
}

ServerApp::ServerApp(const AppConfig& config, StoreBundle stores)
    : ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  BuildServices(config, std::move(stores));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::BuildServices(const AppConfig& config, StoreBundle stores) {
  if (!stores.users) {
    stores.users = std::make_shared<InMemoryUserStore>();
  }
  if (!stores.organizations) {
    stores.organizations = std::make_shared<InMemoryOrganizationStore>();
  }
  if (!stores.messages) {
    stores.messages = std::make_shared<InMemoryMessageStore>();
  }
  if (!stores.revocations) {
    stores.revocations = std::make_shared<InMemoryRevocationStore>();
  }

  auto services = std::make_shared<ServerServices>();
  services->config = config;
  services->stores = stores;
  services->observability =
      std::make_shared<Observability>(ParseLogLevel(config.log_level).value_or(LogLevel::kInfo));

  SessionConfig session_config;
  session_config.access_ttl = std::chrono::hours(config.jwt_expiration_hours);
  session_config.refresh_ttl = std::chrono::hours(24 * config.jwt_refresh_expiration_days);
  services->codec = std::make_shared<TokenCodec>(TokenCodecConfig{config.jwt_secret_key, session_config.access_ttl});
  services->sessions = std::make_shared<SessionService>(services->codec, stores.revocations, stores.users,
                                                        session_config, services->observability);

  LoginConfig login_config;
  login_config.login_window = std::chrono::seconds(config.login_rate_window_seconds);
  login_config.login_max_attempts = config.login_rate_limit_max;
  services->login = std::make_shared<LoginService>(stores.users, stores.organizations, services->sessions,
                                                   login_config);

  services->authenticator =
      std::make_shared<ConnectionAuthenticator>(services->sessions, stores.users, services->observability);
  services->authorizer = std::make_shared<ChannelAuthorizer>(stores.users, services->observability);
  services->hub = std::make_shared<StreamHub>();
  services->hub->SetObservability(services->observability);
  services->dispatcher = std::make_shared<MessageDispatcher>(services->authorizer, stores.messages, services->hub,
                                                             services->observability);

  sweeper_ = std::make_shared<RevocationSweeper>(ioc_, stores.revocations,
                                                 std::chrono::seconds(config.revocation_sweep_seconds),
                                                 services->observability);
  services_ = std::move(services);
}

void ServerApp::Listen() {
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), services_->config.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, services_);
  bound_port_ = listener_->Port();
  listener_->Run();
  sweeper_->Start();
  services_->observability->Event(LogLevel::kInfo, "server_started", std::nullopt, std::nullopt,
                                  "port=" + std::to_string(bound_port_));
}

void ServerApp::Run() {
  running_ = true;
  Listen();
  boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
  signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    services_->observability->Event(LogLevel::kInfo, "server_stopping", std::nullopt, std::nullopt,
                                    "signal=" + std::to_string(signal_number));
    ioc_.stop();
  });
  const std::size_t thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  StartWorkers(thread_count - 1);
  RunLoop();
  Stop();
}

void ServerApp::Start() {
  running_ = true;
  Listen();
  StartWorkers(std::max(1u, std::thread::hardware_concurrency()));
}

void ServerApp::StartWorkers(std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { RunLoop(); });
  }
}

void ServerApp::RunLoop() {
  // 핸들러에서 빠져나온 예외는 기록만 하고 같은 스레드로 이벤트 루프를 이어 간다.
  for (;;) {
    try {
      ioc_.run();
      return;
    } catch (const std::exception& ex) {
      services_->observability->Event(LogLevel::kError, "handler_failed", std::nullopt, std::nullopt, ex.what());
    }
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  if (sweeper_) {
    sweeper_->Stop();
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&](const char* key, const char* def) -> std::size_t {
    auto value = get_env(key, def);
    try {
      std::size_t idx = 0;
      auto parsed = std::stoul(value, &idx);
      if (idx != value.size()) {
        throw std::invalid_argument(value);
      }
      return static_cast<std::size_t>(parsed);
    } catch (const std::logic_error&) {
      throw std::invalid_argument(std::string(key) + " 값이 올바르지 않습니다: " + value);
    }
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(get_size("SERVER_PORT", "8080"));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(get_size("DB_PORT", "3306"));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.store_backend = get_env("STORE_BACKEND", "memory");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.jwt_secret_key = get_env("JWT_SECRET_KEY", "");
  cfg.jwt_expiration_hours = get_size("JWT_EXPIRATION_HOURS", "24");
  cfg.jwt_refresh_expiration_days = get_size("JWT_REFRESH_EXPIRATION_DAYS", "7");
  cfg.login_rate_window_seconds = get_size("LOGIN_RATE_LIMIT_WINDOW", "60");
  cfg.login_rate_limit_max = get_size("LOGIN_RATE_LIMIT_MAX", "5");
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", "32");
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", "262144");
  cfg.revocation_sweep_seconds = get_size("REVOCATION_SWEEP_SECONDS", "300");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  if (cfg.jwt_secret_key.empty()) {
    throw std::invalid_argument("JWT_SECRET_KEY가 설정되지 않았습니다");
  }
  if (!ParseLogLevel(cfg.log_level)) {
    throw std::invalid_argument("LOG_LEVEL 값이 올바르지 않습니다: " + cfg.log_level);
  }
  return cfg;
}

}  // namespace teamlink
