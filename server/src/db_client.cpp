/*
 * 설명: MariaDB 연결 열기, 재시도, 트랜잭션 경계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/db_client_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#include "teamlink/db_client.hpp"

#include <cstdint>
#include <random>
#include <thread>
#include <utility>

#include <mariadb/errmsg.h>

namespace teamlink {
namespace {
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

bool IsTransientDbError(unsigned int code) {
  switch (code) {
    case kDeadlock:
    case kLockWaitTimeout:
    case CR_SERVER_LOST:
    case CR_SERVER_GONE_ERROR:
    case CR_CONN_HOST_ERROR:
    case CR_SERVER_LOST_EXTENDED:
      return true;
    default:
      return false;
  }
}

std::chrono::milliseconds RetryDelay(std::size_t attempt, std::chrono::milliseconds base) {
  const auto shift = attempt > 1 ? attempt - 1 : 0;
  const auto exponential = base * (std::int64_t{1} << shift);
  thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<std::int64_t> jitter(0, base.count() / 2);
  return exponential + std::chrono::milliseconds(jitter(gen));
}

MariaDbClient::MariaDbClient(DbConfig config) : config_(std::move(config)) {}

MariaDbClient::Connection MariaDbClient::Open() const {
  Connection conn{mysql_init(nullptr)};
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout_seconds);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &config_.query_timeout_seconds);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &config_.query_timeout_seconds);
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  if (mysql_set_character_set(conn.get(), "utf8mb4") != 0) {
    RaiseError(conn.get(), "문자셋 설정 실패");
  }
  return conn;
}

void MariaDbClient::RunWithRetry(const std::function<void(MYSQL*)>& attempt) const {
  const std::size_t limit = config_.max_attempts > 0 ? config_.max_attempts : 1;
  for (std::size_t n = 1;; ++n) {
    try {
      auto conn = Open();
      attempt(conn.get());
      return;
    } catch (const DbException& ex) {
      if (!ex.retryable || n >= limit) {
        throw;
      }
    }
    std::this_thread::sleep_for(RetryDelay(n, config_.backoff_base));
  }
}

void MariaDbClient::WithConnection(const std::function<void(MYSQL*)>& work) const { RunWithRetry(work); }

bool MariaDbClient::InTransaction(const std::function<bool(MYSQL*)>& work) const {
  bool committed = false;
  RunWithRetry([&](MYSQL* conn) {
    mysql_autocommit(conn, 0);
    // 커밋 전에 빠져나가면 연결이 닫히면서 서버가 트랜잭션을 되돌린다.
    committed = work(conn);
    if (!committed) {
      mysql_rollback(conn);
      return;
    }
    if (mysql_commit(conn) != 0) {
      RaiseError(conn, "커밋 실패");
    }
  });
  return committed;
}

bool MariaDbClient::ExecuteInsert(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) == 0) {
    return true;
  }
  if (mysql_errno(conn) == kDuplicateEntry) {
    return false;
  }
  RaiseError(conn, ctx);
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped(value.size() * 2 + 1, '\0');
  escaped.resize(mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size()));
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  const unsigned int code = mysql_errno(conn);
  throw DbException(ctx + ": " + mysql_error(conn), code, IsTransientDbError(code));
}

}  // namespace teamlink
