/*
 * 설명: MariaDB 연결과 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_match_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace arbiter {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  std::size_t max_attempts{3};
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

struct MysqlResultDeleter {
  void operator()(MYSQL_RES* res) const {
    if (res) {
      mysql_free_result(res);
    }
  }
};

using MysqlResult = std::unique_ptr<MYSQL_RES, MysqlResultDeleter>;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work가 false를 반환하면 롤백한다. 재시도 가능한 오류는 지수 백오프 후 다시 실행한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  MysqlResult Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  struct ConnectionCloser {
    void operator()(MYSQL* conn) const {
      if (conn) {
        mysql_close(conn);
      }
    }
  };
  using Connection = std::unique_ptr<MYSQL, ConnectionCloser>;

  Connection Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace arbiter
