/*
 * 설명: 연결별 고정 윈도 요청 수 제한을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/arena_service_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <unordered_map>

#include "arena/match_types.hpp"

namespace arena {

class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(std::size_t max_requests, std::chrono::seconds window);

  bool Allow(ConnectionId key, Clock::time_point now);
  void Forget(ConnectionId key);
  std::size_t Size() const;

 private:
  struct Bucket {
    std::size_t count{0};
    Clock::time_point window_start{};
  };
  std::unordered_map<ConnectionId, Bucket> buckets_;
  std::size_t max_requests_;
  std::chrono::seconds window_;
  mutable std::mutex mutex_;
};

}  // namespace arena
