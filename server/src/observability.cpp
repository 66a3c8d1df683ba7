/*
 * 설명: 구조화 로그 출력과 메트릭 스냅샷을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "arena/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace arena {
namespace {
std::string NowIsoString() {
  auto now = std::chrono::system_clock::now();
  auto tt = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}
}  // namespace

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
  return nlohmann::json{{"connections", {{"websocket", snapshot.websocket_active}}},
                        {"matches",
                         {{"active", snapshot.active_matches},
                          {"started", snapshot.matches_started},
                          {"completed", snapshot.matches_completed},
                          {"cancelled", snapshot.matches_cancelled},
                          {"forfeits", snapshot.forfeits}}},
                        {"queue", {{"length", snapshot.queue_length}}},
                        {"persistence", {{"failures", snapshot.persistence_failures}}}};
}

Observability::Observability(LogLevel level) : Observability(level, std::cout) {}

Observability::Observability(LogLevel level, std::ostream& out) : level_(level), out_(out) {}

void Observability::Log(LogLevel level, std::string_view event, nlohmann::json fields) const {
  if (static_cast<int>(level) < static_cast<int>(level_)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? std::move(fields) : nlohmann::json{{"detail", std::move(fields)}};
  log_json["ts"] = NowIsoString();
  log_json["level"] = std::string(ToString(level));
  log_json["event"] = std::string(event);
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << log_json.dump() << std::endl;
}

MetricsSnapshot Observability::Snapshot(std::uint64_t active_matches, std::uint64_t queue_length) const {
  MetricsSnapshot snapshot;
  snapshot.websocket_active = websocket_active_.load();
  snapshot.matches_started = matches_started_.load();
  snapshot.matches_completed = matches_completed_.load();
  snapshot.matches_cancelled = matches_cancelled_.load();
  snapshot.forfeits = forfeits_.load();
  snapshot.persistence_failures = persistence_failures_.load();
  snapshot.active_matches = active_matches;
  snapshot.queue_length = queue_length;
  return snapshot;
}

}  // namespace arena
