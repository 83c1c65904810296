/*
 * 설명: 서버 전체 수명주기(서비스 조립, 리스너, 워커 스레드, 폐기 레코드 정리)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/auth_flow_test.cpp, server/tests/e2e/channel_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "teamlink/config.hpp"
#include "teamlink/db_client.hpp"
#include "teamlink/revocation_sweeper.hpp"
#include "teamlink/services.hpp"

namespace teamlink {

class Listener;

class ServerApp {
 public:
  // config.store_backend에 따라 저장소를 만든다.
  explicit ServerApp(const AppConfig& config);
  // 저장소를 외부에서 주입한다. 비어 있는 항목은 인메모리 구현으로 채운다.
  ServerApp(const AppConfig& config, StoreBundle stores);
  ~ServerApp();

  // SIGINT/SIGTERM까지 현재 스레드에서 실행한다.
  void Run();
  // 워커 스레드에서만 실행하고 바로 돌아온다.
  void Start();
  void Stop();

  unsigned short BoundPort() const { return bound_port_; }
  const AppConfig& GetConfig() const { return services_->config; }
  std::shared_ptr<const ServerServices> GetServices() const { return services_; }
  std::shared_ptr<Observability> GetObservability() const { return services_->observability; }

 private:
  void BuildServices(const AppConfig& config, StoreBundle stores);
  void Listen();
  void StartWorkers(std::size_t count);
  void RunLoop();

  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<const ServerServices> services_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<RevocationSweeper> sweeper_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  unsigned short bound_port_{0};
};

}  // namespace teamlink
