/*
 * 설명: MariaDB 연결과 단일 시도 트랜잭션 실행을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_repository_it_test.cpp
 */
#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace arena {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code) : std::runtime_error(message), code(code) {}
  unsigned int code;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work가 true를 반환하면 커밋, false면 롤백한다. 재시도하지 않는다.
  bool ExecuteTransaction(const std::function<bool(MYSQL*)>& work) const;
  void WithConnection(const std::function<void(MYSQL*)>& work) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
};

}  // namespace arena
