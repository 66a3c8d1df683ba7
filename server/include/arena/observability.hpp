/*
 * 설명: 레벨별 구조화(JSON 한 줄) 로그와 매치/큐/연결 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace arena {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct MetricsSnapshot {
  std::uint64_t websocket_active{0};
  std::uint64_t matches_started{0};
  std::uint64_t matches_completed{0};
  std::uint64_t matches_cancelled{0};
  std::uint64_t forfeits{0};
  std::uint64_t persistence_failures{0};
  std::uint64_t active_matches{0};
  std::uint64_t queue_length{0};
};

nlohmann::json ToJson(const MetricsSnapshot& snapshot);

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo);
  Observability(LogLevel level, std::ostream& out);

  void Log(LogLevel level, std::string_view event, nlohmann::json fields = nlohmann::json::object()) const;
  void Debug(std::string_view event, nlohmann::json fields = nlohmann::json::object()) const {
    Log(LogLevel::kDebug, event, std::move(fields));
  }
  void Info(std::string_view event, nlohmann::json fields = nlohmann::json::object()) const {
    Log(LogLevel::kInfo, event, std::move(fields));
  }
  void Warn(std::string_view event, nlohmann::json fields = nlohmann::json::object()) const {
    Log(LogLevel::kWarn, event, std::move(fields));
  }
  void Error(std::string_view event, nlohmann::json fields = nlohmann::json::object()) const {
    Log(LogLevel::kError, event, std::move(fields));
  }

  void SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }
  void IncrementMatchStarted() { matches_started_.fetch_add(1); }
  void IncrementMatchCompleted() { matches_completed_.fetch_add(1); }
  void IncrementMatchCancelled() { matches_cancelled_.fetch_add(1); }
  void IncrementForfeit() { forfeits_.fetch_add(1); }
  void IncrementPersistenceFailure() { persistence_failures_.fetch_add(1); }

  MetricsSnapshot Snapshot(std::uint64_t active_matches, std::uint64_t queue_length) const;

 private:
  LogLevel level_;
  std::ostream& out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> matches_started_{0};
  std::atomic<std::uint64_t> matches_completed_{0};
  std::atomic<std::uint64_t> matches_cancelled_{0};
  std::atomic<std::uint64_t> forfeits_{0};
  std::atomic<std::uint64_t> persistence_failures_{0};
};

}  // namespace arena
