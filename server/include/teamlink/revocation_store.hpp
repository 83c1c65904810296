/*
 * 설명: 폐기된 토큰 ID(jti)를 자연 만료 시점까지 보관하는 저장소를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/revocation_store_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "teamlink/auth_types.hpp"

namespace teamlink {

// 구현체는 호출자 측 잠금 없이 동시 Revoke/IsRevoked를 허용해야 한다.
class RevocationStore {
 public:
  virtual ~RevocationStore() = default;

  // 만료 시각이 지난 레코드는 정리 전이라도 폐기로 보지 않는다.
  virtual bool IsRevoked(const std::string& token_id) = 0;
  // 레코드를 새로 만든 호출만 true를 받는다. 이미 폐기된 ID는 변경 없이 false.
  virtual bool Revoke(const std::string& token_id, std::int64_t expires_at) = 0;
  virtual std::size_t PurgeExpired(std::int64_t now) = 0;
  virtual std::size_t Size() = 0;
};

class InMemoryRevocationStore : public RevocationStore {
 public:
  explicit InMemoryRevocationStore(EpochClock clock = SystemEpochSeconds);

  bool IsRevoked(const std::string& token_id) override;
  bool Revoke(const std::string& token_id, std::int64_t expires_at) override;
  std::size_t PurgeExpired(std::int64_t now) override;
  std::size_t Size() override;

 private:
  EpochClock clock_;
  std::unordered_map<std::string, std::int64_t> records_;
  std::mutex mutex_;
};

}  // namespace teamlink
