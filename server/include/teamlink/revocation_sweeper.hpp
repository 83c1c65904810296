/*
 * 설명: 자연 만료가 지난 토큰 폐기 레코드를 주기적으로 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/revocation_store_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "teamlink/auth_types.hpp"
#include "teamlink/observability.hpp"
#include "teamlink/revocation_store.hpp"

namespace teamlink {

class RevocationSweeper : public std::enable_shared_from_this<RevocationSweeper> {
 public:
  RevocationSweeper(boost::asio::io_context& ioc, std::shared_ptr<RevocationStore> store,
                    std::chrono::seconds interval, std::shared_ptr<Observability> observability,
                    EpochClock clock = SystemEpochSeconds);

  void Start();
  void Stop();
  // 타이머와 무관하게 한 번 정리한다. 제거한 레코드 수를 돌려준다.
  std::size_t SweepOnce();

 private:
  void Schedule();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::steady_timer timer_;
  std::shared_ptr<RevocationStore> store_;
  std::chrono::seconds interval_;
  std::shared_ptr<Observability> observability_;
  EpochClock clock_;
  bool active_{false};
};

}  // namespace teamlink
