/*
 * 설명: 프로세스 내 토큰 폐기 목록을 뮤텍스로 보호하며 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/revocation_store_test.cpp
 */
#include "teamlink/revocation_store.hpp"

#include <utility>

namespace teamlink {

InMemoryRevocationStore::InMemoryRevocationStore(EpochClock clock) : clock_(std::move(clock)) {}

bool InMemoryRevocationStore::IsRevoked(const std::string& token_id) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(token_id);
  return it != records_.end() && it->second > now;
}

bool InMemoryRevocationStore::Revoke(const std::string& token_id, std::int64_t expires_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.emplace(token_id, expires_at).second;
}

std::size_t InMemoryRevocationStore::PurgeExpired(std::int64_t now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second <= now) {
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t InMemoryRevocationStore::Size() {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

}  // namespace teamlink
