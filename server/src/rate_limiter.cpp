/*
 * 설명: 연결별 고정 윈도 레이트리밋을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/arena_service_test.cpp
 */
#include "arena/rate_limiter.hpp"

namespace arena {

RateLimiter::RateLimiter(std::size_t max_requests, std::chrono::seconds window)
    : max_requests_(max_requests), window_(window) {}

bool RateLimiter::Allow(ConnectionId key, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(key);
  auto& bucket = it->second;
  if (inserted || now - bucket.window_start > window_) {
    bucket.window_start = now;
    bucket.count = 0;
  }
  if (bucket.count >= max_requests_) {
    return false;
  }
  ++bucket.count;
  return true;
}

void RateLimiter::Forget(ConnectionId key) {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.erase(key);
}

std::size_t RateLimiter::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_.size();
}

}  // namespace arena
