/*
 * 설명: 서버 환경설정 로딩과 기본값, 컴포넌트별 하위 설정 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/arena_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "arena/arena_service.hpp"
#include "arena/db_client.hpp"
#include "arena/match_queue.hpp"
#include "arena/rating_engine.hpp"

namespace arena {

struct AppConfig {
  unsigned short port{3001};
  std::string log_level{"info"};
  bool db_enabled{false};
  std::string db_host{"mariadb"};
  unsigned short db_port{3306};
  std::string db_user{"arena"};
  std::string db_password{"arena_pass"};
  std::string db_name{"arena_db"};
  std::size_t ws_queue_limit_messages{256};
  std::size_t ws_queue_limit_bytes{1024 * 1024};
  std::size_t connection_rate_limit_max{100};
  std::size_t connection_rate_limit_window_seconds{60};
  std::size_t queue_timeout_seconds{60};
  std::size_t queue_sweep_interval_seconds{1};
  std::size_t match_start_delay_ms{3000};
  int placement_games{10};
  int default_rating{1000};
};

AppConfig LoadConfigFromEnv();

QueueConfig ToQueueConfig(const AppConfig& config);
RatingConfig ToRatingConfig(const AppConfig& config);
ArenaConfig ToArenaConfig(const AppConfig& config);
DbConfig ToDbConfig(const AppConfig& config);

}  // namespace arena
