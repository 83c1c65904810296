/*
 * 설명: MariaDB 연결 수명, 재시도 정책, 단일 행 조회를 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/db_client_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace teamlink {

struct DbConfig {
  std::string host;
  unsigned short port{3306};
  std::string user;
  std::string password;
  std::string database;
  unsigned int connect_timeout_seconds{2};
  unsigned int query_timeout_seconds{2};
  // 첫 시도를 포함한 횟수.
  std::size_t max_attempts{3};
  std::chrono::milliseconds backoff_base{50};
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

constexpr unsigned int kDuplicateEntry = 1062;

// 교착, 잠금 대기 초과, 연결 유실처럼 다시 실행하면 성공할 수 있는 오류인지 판정한다.
bool IsTransientDbError(unsigned int code);

// attempt번째 실패 뒤 기다릴 시간. base * 2^(attempt-1)에 base/2 이하의 지터를 더한다.
std::chrono::milliseconds RetryDelay(std::size_t attempt, std::chrono::milliseconds base);

class MariaDbClient {
 public:
  explicit MariaDbClient(DbConfig config);

  const DbConfig& Config() const { return config_; }

  // 연결 하나를 열어 work를 실행한다. 일시 오류면 새 연결로 다시 실행한다.
  void WithConnection(const std::function<void(MYSQL*)>& work) const;
  // autocommit을 끈 연결에서 work를 실행한다. true면 커밋, false면 롤백하고 그 값을 돌려준다.
  bool InTransaction(const std::function<bool(MYSQL*)>& work) const;

  // 중복 키(1062)면 false, 그 외 오류는 DbException.
  bool ExecuteInsert(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::string Escape(MYSQL* conn, const std::string& value) const;

  // 첫 행만 mapper로 변환한다. 행이 없으면 nullopt.
  template <typename T, typename RowMapper>
  std::optional<T> FetchOne(MYSQL* conn, const std::string& sql, const std::string& ctx, RowMapper mapper) const {
    Execute(conn, sql, ctx);
    ResultSet result{mysql_store_result(conn)};
    if (!result) {
      RaiseError(conn, ctx + " 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(result.get());
    if (!row) {
      return std::nullopt;
    }
    return mapper(row);
  }

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

 private:
  struct ConnectionCloser {
    void operator()(MYSQL* conn) const { mysql_close(conn); }
  };
  struct ResultFreer {
    void operator()(MYSQL_RES* result) const { mysql_free_result(result); }
  };
  using Connection = std::unique_ptr<MYSQL, ConnectionCloser>;
  using ResultSet = std::unique_ptr<MYSQL_RES, ResultFreer>;

  Connection Open() const;
  // 일시 오류는 max_attempts까지 다시 시도하고, 나머지 예외는 그대로 전파한다.
  void RunWithRetry(const std::function<void(MYSQL*)>& attempt) const;

  DbConfig config_;
};

}  // namespace teamlink
