/*
 * 설명: 환경변수에서 서버 설정을 읽고 하위 설정으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "arena/config.hpp"

#include <cstdlib>

namespace arena {

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "3001")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  auto db_enabled = get_env("DB_ENABLED", "false");
  cfg.db_enabled = db_enabled == "true" || db_enabled == "1";
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "arena");
  cfg.db_password = get_env("DB_PASSWORD", "arena_pass");
  cfg.db_name = get_env("DB_NAME", "arena_db");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "256")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.connection_rate_limit_max = static_cast<std::size_t>(std::stoul(get_env("CONNECTION_RATE_LIMIT_MAX", "100")));
  cfg.connection_rate_limit_window_seconds =
      static_cast<std::size_t>(std::stoul(get_env("CONNECTION_RATE_LIMIT_WINDOW", "60")));
  cfg.queue_timeout_seconds = static_cast<std::size_t>(std::stoul(get_env("QUEUE_TIMEOUT_SECONDS", "60")));
  cfg.queue_sweep_interval_seconds =
      static_cast<std::size_t>(std::stoul(get_env("QUEUE_SWEEP_INTERVAL_SECONDS", "1")));
  cfg.match_start_delay_ms = static_cast<std::size_t>(std::stoul(get_env("MATCH_START_DELAY_MS", "3000")));
  cfg.placement_games = std::stoi(get_env("PLACEMENT_GAMES", "10"));
  cfg.default_rating = std::stoi(get_env("DEFAULT_RATING", "1000"));
  return cfg;
}

QueueConfig ToQueueConfig(const AppConfig& config) {
  QueueConfig queue;
  queue.entry_timeout = std::chrono::seconds(config.queue_timeout_seconds);
  return queue;
}

RatingConfig ToRatingConfig(const AppConfig& config) {
  RatingConfig rating;
  rating.default_rating = config.default_rating;
  rating.placement_games = config.placement_games;
  return rating;
}

ArenaConfig ToArenaConfig(const AppConfig& config) {
  ArenaConfig arena;
  arena.match_start_delay = std::chrono::milliseconds(config.match_start_delay_ms);
  arena.sweep_interval = std::chrono::seconds(config.queue_sweep_interval_seconds);
  arena.rate_limit_max = config.connection_rate_limit_max;
  arena.rate_limit_window = std::chrono::seconds(config.connection_rate_limit_window_seconds);
  return arena;
}

DbConfig ToDbConfig(const AppConfig& config) {
  return DbConfig{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
}

}  // namespace arena
