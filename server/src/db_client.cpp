/*
 * 설명: MariaDB 연결과 트랜잭션 실행을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_repository_it_test.cpp
 */
#include "arena/db_client.hpp"

namespace arena {

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    unsigned int code = mysql_errno(conn);
    std::string message = std::string("연결 실패: ") + mysql_error(conn);
    mysql_close(conn);
    throw DbException(message, code);
  }
  return conn;
}

bool MariaDbClient::ExecuteTransaction(const std::function<bool(MYSQL*)>& work) const {
  MYSQL* conn = Connect();
  try {
    mysql_autocommit(conn, 0);
    bool commit = work(conn);
    if (commit) {
      if (mysql_commit(conn) != 0) {
        RaiseError(conn, "커밋 실패");
      }
    } else {
      mysql_rollback(conn);
    }
    mysql_close(conn);
    return commit;
  } catch (...) {
    mysql_rollback(conn);
    mysql_close(conn);
    throw;
  }
}

void MariaDbClient::WithConnection(const std::function<void(MYSQL*)>& work) const {
  MYSQL* conn = Connect();
  try {
    work(conn);
    mysql_close(conn);
  } catch (...) {
    mysql_close(conn);
    throw;
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code);
}

}  // namespace arena
