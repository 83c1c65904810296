/*
 * 설명: MariaDB 기반 저장소 조회/삽입과 토큰 폐기 레코드 관리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "teamlink/mariadb_stores.hpp"

#include <sstream>
#include <utility>

namespace teamlink {
namespace {
std::string ColumnText(const char* value) { return value ? std::string(value) : std::string(); }
std::int64_t ColumnInt64(const char* value) { return value ? std::stoll(value) : 0; }
}  // namespace

MariaDbUserStore::MariaDbUserStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::optional<User> MariaDbUserStore::FindById(const std::string& id) {
  std::optional<User> user;
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, organization_id, role, email FROM users WHERE id='" << db_client_->Escape(conn, id)
        << "' LIMIT 1;";
    user = db_client_->FetchOne<User>(conn, oss.str(), "사용자 조회 실패", [](MYSQL_ROW row) {
      return User{ColumnText(row[0]), ColumnText(row[1]), ColumnText(row[2]), ColumnText(row[3])};
    });
  });
  return user;
}

std::optional<UserCredential> MariaDbUserStore::FindCredentialByEmail(const std::string& email) {
  std::optional<UserCredential> credential;
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, password_salt, password_hash FROM users WHERE email='" << db_client_->Escape(conn, email)
        << "' LIMIT 1;";
    credential = db_client_->FetchOne<UserCredential>(conn, oss.str(), "자격 증명 조회 실패", [](MYSQL_ROW row) {
      return UserCredential{ColumnText(row[0]), ColumnText(row[1]), ColumnText(row[2])};
    });
  });
  return credential;
}

MariaDbOrganizationStore::MariaDbOrganizationStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::optional<Organization> MariaDbOrganizationStore::FindById(const std::string& id) {
  std::optional<Organization> organization;
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, name FROM organizations WHERE id='" << db_client_->Escape(conn, id) << "' LIMIT 1;";
    organization = db_client_->FetchOne<Organization>(conn, oss.str(), "조직 조회 실패", [](MYSQL_ROW row) {
      return Organization{ColumnText(row[0]), ColumnText(row[1])};
    });
  });
  return organization;
}

MariaDbMessageStore::MariaDbMessageStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

StoredMessage MariaDbMessageStore::Create(const TenantScope& scope, const std::string& content,
                                          const std::string& sender_id,
                                          const std::optional<std::string>& recipient_id,
                                          const std::string& organization_id) {
  if (!scope.Allows(organization_id)) {
    throw StoreError("테넌트 범위 밖의 조직에는 메시지를 쓸 수 없습니다");
  }
  StoredMessage message;
  message.content = content;
  message.sender_id = sender_id;
  message.recipient_id = recipient_id;
  message.organization_id = organization_id;
  try {
    db_client_->InTransaction([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "INSERT INTO messages(content, user_id, recipient_id, organization_id, created_at) VALUES('"
          << db_client_->Escape(conn, content) << "', '" << db_client_->Escape(conn, sender_id) << "', ";
      if (recipient_id) {
        oss << "'" << db_client_->Escape(conn, *recipient_id) << "'";
      } else {
        oss << "NULL";
      }
      oss << ", '" << db_client_->Escape(conn, organization_id) << "', NOW());";
      db_client_->Execute(conn, oss.str(), "메시지 저장 실패");

      auto inserted = db_client_->FetchOne<std::pair<std::string, std::int64_t>>(
          conn, "SELECT id, UNIX_TIMESTAMP(created_at) FROM messages WHERE id=LAST_INSERT_ID();", "메시지 재조회 실패",
          [](MYSQL_ROW row) { return std::make_pair(ColumnText(row[0]), ColumnInt64(row[1])); });
      if (!inserted) {
        throw DbException("저장한 메시지를 찾을 수 없습니다", 0, false);
      }
      message.id = inserted->first;
      message.created_at = inserted->second;
      return true;
    });
  } catch (const DbException& ex) {
    throw StoreError(ex.what());
  }
  return message;
}

MariaDbRevocationStore::MariaDbRevocationStore(std::shared_ptr<MariaDbClient> db_client, EpochClock clock)
    : db_client_(std::move(db_client)), clock_(std::move(clock)) {}

void MariaDbRevocationStore::EnsureSchema() {
  db_client_->WithConnection([&](MYSQL* conn) {
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS token_revocations("
                        "jti VARCHAR(64) NOT NULL PRIMARY KEY, "
                        "expires_at BIGINT NOT NULL, "
                        "created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6), "
                        "INDEX idx_token_revocations_expires_at (expires_at));",
                        "폐기 테이블 생성 실패");
  });
}

bool MariaDbRevocationStore::IsRevoked(const std::string& token_id) {
  bool revoked = false;
  const auto now = clock_();
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT 1 FROM token_revocations WHERE jti='" << db_client_->Escape(conn, token_id)
        << "' AND expires_at > " << now << " LIMIT 1;";
    revoked = db_client_->FetchOne<bool>(conn, oss.str(), "폐기 조회 실패", [](MYSQL_ROW) { return true; })
                  .has_value();
  });
  return revoked;
}

bool MariaDbRevocationStore::Revoke(const std::string& token_id, std::int64_t expires_at) {
  bool created = false;
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO token_revocations(jti, expires_at) VALUES('" << db_client_->Escape(conn, token_id) << "', "
        << expires_at << ");";
    created = db_client_->ExecuteInsert(conn, oss.str(), "토큰 폐기 실패");
  });
  return created;
}

std::size_t MariaDbRevocationStore::PurgeExpired(std::int64_t now) {
  std::size_t removed = 0;
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "DELETE FROM token_revocations WHERE expires_at <= " << now << ";";
    db_client_->Execute(conn, oss.str(), "만료 폐기 레코드 정리 실패");
    removed = static_cast<std::size_t>(mysql_affected_rows(conn));
  });
  return removed;
}

std::size_t MariaDbRevocationStore::Size() {
  std::size_t count = 0;
  db_client_->WithConnection([&](MYSQL* conn) {
    auto value = db_client_->FetchOne<std::size_t>(
        conn, "SELECT COUNT(*) FROM token_revocations;", "폐기 카운트 실패", [](MYSQL_ROW row) {
          return row[0] ? static_cast<std::size_t>(std::stoull(row[0])) : std::size_t{0};
        });
    count = value.value_or(0);
  });
  return count;
}

}  // namespace teamlink
