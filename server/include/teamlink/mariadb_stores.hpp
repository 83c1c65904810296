/*
 * 설명: MariaDB 기반 사용자/조직/메시지 저장소와 토큰 폐기 저장소를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "teamlink/db_client.hpp"
#include "teamlink/revocation_store.hpp"
#include "teamlink/stores.hpp"

namespace teamlink {

// users(id, organization_id, role, email, password_salt, password_hash)
class MariaDbUserStore : public UserStore {
 public:
  explicit MariaDbUserStore(std::shared_ptr<MariaDbClient> db_client);

  std::optional<User> FindById(const std::string& id) override;
  std::optional<UserCredential> FindCredentialByEmail(const std::string& email) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

class MariaDbOrganizationStore : public OrganizationStore {
 public:
  explicit MariaDbOrganizationStore(std::shared_ptr<MariaDbClient> db_client);

  std::optional<Organization> FindById(const std::string& id) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

class MariaDbMessageStore : public MessageStore {
 public:
  explicit MariaDbMessageStore(std::shared_ptr<MariaDbClient> db_client);

  // DbException은 StoreError로 바꿔 던진다.
  StoredMessage Create(const TenantScope& scope, const std::string& content, const std::string& sender_id,
                       const std::optional<std::string>& recipient_id, const std::string& organization_id) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

// token_revocations(jti PRIMARY KEY, expires_at). 중복 키 삽입은 이미 폐기된 것으로 본다.
class MariaDbRevocationStore : public RevocationStore {
 public:
  explicit MariaDbRevocationStore(std::shared_ptr<MariaDbClient> db_client, EpochClock clock = SystemEpochSeconds);

  void EnsureSchema();

  bool IsRevoked(const std::string& token_id) override;
  bool Revoke(const std::string& token_id, std::int64_t expires_at) override;
  std::size_t PurgeExpired(std::int64_t now) override;
  std::size_t Size() override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
  EpochClock clock_;
};

}  // namespace teamlink
