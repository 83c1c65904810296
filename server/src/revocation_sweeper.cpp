/*
 * 설명: 폐기 레코드 정리 타이머를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/revocation_store_test.cpp
 */
#include "teamlink/revocation_sweeper.hpp"

#include <exception>
#include <string>
#include <utility>

namespace teamlink {

RevocationSweeper::RevocationSweeper(boost::asio::io_context& ioc, std::shared_ptr<RevocationStore> store,
                                     std::chrono::seconds interval, std::shared_ptr<Observability> observability,
                                     EpochClock clock)
    : timer_(ioc), store_(std::move(store)), interval_(interval), observability_(std::move(observability)),
      clock_(std::move(clock)) {}

void RevocationSweeper::Start() {
  if (active_ || interval_.count() <= 0) {
    return;
  }
  active_ = true;
  Schedule();
}

void RevocationSweeper::Stop() {
  active_ = false;
  timer_.cancel();
}

std::size_t RevocationSweeper::SweepOnce() {
  auto removed = store_->PurgeExpired(clock_());
  if (observability_ && removed > 0) {
    observability_->Event(LogLevel::kInfo, "revocations_purged", std::nullopt, std::nullopt,
                          std::to_string(removed));
  }
  return removed;
}

void RevocationSweeper::Schedule() {
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void RevocationSweeper::OnTick(const boost::system::error_code& ec) {
  if (ec || !active_) {
    return;
  }
  try {
    SweepOnce();
  } catch (const std::exception& ex) {
    // 다음 주기에 다시 시도한다.
    if (observability_) {
      observability_->Event(LogLevel::kError, "revocation_sweep_failed", std::nullopt, std::nullopt, ex.what());
    }
  }
  Schedule();
}

}  // namespace teamlink
