#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "teamlink/credentials.hpp"
#include "teamlink/mariadb_stores.hpp"
#include "teamlink/tenant_context.hpp"

namespace {

teamlink::DbConfig TestDbConfig() {
  teamlink::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

class MariaDbStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!std::getenv("DB_HOST")) {
      GTEST_SKIP() << "DB_HOST가 없어 MariaDB 통합 테스트를 건너뛴다";
    }
    db_client_ = std::make_shared<teamlink::MariaDbClient>(TestDbConfig());
    revocations_ = std::make_shared<teamlink::MariaDbRevocationStore>(db_client_, [this]() { return now_; });
    revocations_->EnsureSchema();
    db_client_->WithConnection([this](MYSQL* conn) {
      db_client_->Execute(conn,
                          "CREATE TABLE IF NOT EXISTS organizations(id VARCHAR(64) PRIMARY KEY, "
                          "name VARCHAR(255) NOT NULL);",
                          "organizations 생성");
      db_client_->Execute(conn,
                          "CREATE TABLE IF NOT EXISTS users(id VARCHAR(64) PRIMARY KEY, organization_id VARCHAR(64), "
                          "role VARCHAR(32) NOT NULL, email VARCHAR(255) NOT NULL UNIQUE, "
                          "password_salt VARCHAR(64) NOT NULL, password_hash VARCHAR(128) NOT NULL);",
                          "users 생성");
      db_client_->Execute(conn,
                          "CREATE TABLE IF NOT EXISTS messages(id BIGINT AUTO_INCREMENT PRIMARY KEY, "
                          "content TEXT NOT NULL, user_id VARCHAR(64) NOT NULL, recipient_id VARCHAR(64), "
                          "organization_id VARCHAR(64) NOT NULL, created_at DATETIME NOT NULL);",
                          "messages 생성");
      db_client_->Execute(conn, "DELETE FROM token_revocations;", "token_revocations 초기화");
      db_client_->Execute(conn, "DELETE FROM messages;", "messages 초기화");
      db_client_->Execute(conn, "DELETE FROM users;", "users 초기화");
      db_client_->Execute(conn, "DELETE FROM organizations;", "organizations 초기화");
    });
  }

  void SeedUser(const std::string& id, const std::string& organization_id, const std::string& email,
                const std::string& password) {
    auto salt = teamlink::PasswordHasher::GenerateSalt();
    auto hash = teamlink::PasswordHasher::Hash(password, salt);
    db_client_->WithConnection([&](MYSQL* conn) {
      std::string org_value = organization_id.empty() ? "NULL" : "'" + organization_id + "'";
      db_client_->Execute(conn,
                          "INSERT INTO users(id, organization_id, role, email, password_salt, password_hash) "
                          "VALUES('" + id + "', " + org_value + ", 'owner', '" + email + "', '" + salt + "', '" +
                              hash + "');",
                          "사용자 추가");
    });
  }

  std::shared_ptr<teamlink::MariaDbClient> db_client_;
  std::shared_ptr<teamlink::MariaDbRevocationStore> revocations_;
  std::int64_t now_{500};
};

}  // namespace

TEST_F(MariaDbStoreTest, RevokeIsFirstWriterWins) {
  std::atomic<int> created{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&]() {
      if (revocations_->Revoke("jti-race", 2'000'000'000)) {
        created.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(created.load(), 1);
  EXPECT_TRUE(revocations_->IsRevoked("jti-race"));
  EXPECT_FALSE(revocations_->IsRevoked("jti-other"));
  EXPECT_EQ(revocations_->Size(), 1u);
}

TEST_F(MariaDbStoreTest, PurgeRemovesOnlyExpiredRecords) {
  ASSERT_TRUE(revocations_->Revoke("jti-old", 1'000));
  ASSERT_TRUE(revocations_->Revoke("jti-edge", 2'000));
  ASSERT_TRUE(revocations_->Revoke("jti-live", 3'000));
  EXPECT_EQ(revocations_->PurgeExpired(2'000), 2u);
  EXPECT_FALSE(revocations_->IsRevoked("jti-old"));
  EXPECT_TRUE(revocations_->IsRevoked("jti-live"));
  EXPECT_EQ(revocations_->Size(), 1u);
}

TEST_F(MariaDbStoreTest, ExpiredRecordIsNotRevokedBeforePurge) {
  ASSERT_TRUE(revocations_->Revoke("jti-short", 600));
  EXPECT_TRUE(revocations_->IsRevoked("jti-short"));
  now_ = 600;
  EXPECT_FALSE(revocations_->IsRevoked("jti-short"));
  EXPECT_EQ(revocations_->Size(), 1u);
}

TEST_F(MariaDbStoreTest, UserAndOrganizationLookups) {
  db_client_->WithConnection([this](MYSQL* conn) {
    db_client_->Execute(conn, "INSERT INTO organizations(id, name) VALUES('org-1', 'Blue Team');", "조직 추가");
  });
  SeedUser("u-alice", "org-1", "alice@example.com", "password123");
  SeedUser("u-drifter", "", "drifter@example.com", "password123");

  teamlink::MariaDbUserStore users{db_client_};
  auto alice = users.FindById("u-alice");
  ASSERT_TRUE(alice.has_value());
  EXPECT_EQ(alice->organization_id, "org-1");
  EXPECT_EQ(alice->email, "alice@example.com");
  auto drifter = users.FindById("u-drifter");
  ASSERT_TRUE(drifter.has_value());
  EXPECT_TRUE(drifter->organization_id.empty());
  EXPECT_FALSE(users.FindById("u-ghost").has_value());

  auto credential = users.FindCredentialByEmail("alice@example.com");
  ASSERT_TRUE(credential.has_value());
  EXPECT_TRUE(teamlink::PasswordHasher::Verify("password123", *credential));
  EXPECT_FALSE(teamlink::PasswordHasher::Verify("wrong", *credential));

  teamlink::MariaDbOrganizationStore organizations{db_client_};
  auto organization = organizations.FindById("org-1");
  ASSERT_TRUE(organization.has_value());
  EXPECT_EQ(organization->name, "Blue Team");
  EXPECT_FALSE(organizations.FindById("org-9").has_value());
}

TEST_F(MariaDbStoreTest, MessageCreateIsTenantScoped) {
  teamlink::MariaDbMessageStore messages{db_client_};
  teamlink::TenantScope scope;
  scope.Bind(teamlink::Identity{"u-alice", "org-1", "owner"});

  auto stored = messages.Create(scope, "it's \"quoted\"", "u-alice", std::string("u-bob"), "org-1");
  EXPECT_FALSE(stored.id.empty());
  EXPECT_EQ(stored.content, "it's \"quoted\"");
  EXPECT_EQ(stored.recipient_id.value_or(""), "u-bob");
  EXPECT_GT(stored.created_at, 0);

  EXPECT_THROW(messages.Create(scope, "leak", "u-alice", std::nullopt, "org-2"), teamlink::StoreError);

  teamlink::TenantScope unbound;
  EXPECT_THROW(messages.Create(unbound, "nobody", "u-alice", std::nullopt, "org-1"), teamlink::StoreError);
}
