/*
 * 설명: 랭크/일반 매칭 대기열을 관리하며 레이팅 근접도 기반 페어링, 이탈, 타임아웃 만료를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_queue_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "arena/match_types.hpp"

namespace arena {

struct QueueConfig {
  int initial_radius{100};
  int radius_step{50};
  std::chrono::seconds radius_step_interval{10};
  int max_radius{500};
  std::chrono::seconds entry_timeout{60};
};

struct QueueEntry {
  ConnectionId connection_id{0};
  std::string identity;
  QueueClass queue_class{QueueClass::kUnranked};
  int rating{0};
  std::chrono::steady_clock::time_point enqueued_at;
  CosmeticLoadout cosmetics;
};

struct QueuePairing {
  QueueEntry waiting;  // 먼저 대기한 쪽
  QueueEntry joined;
};

struct QueueClassStats {
  QueueClass queue_class;
  std::size_t players{0};
  std::optional<int> average_rating;
};

class MatchmakingQueue {
 public:
  using Clock = std::chrono::steady_clock;

  explicit MatchmakingQueue(QueueConfig config = {});

  // 상대가 있으면 대기열에서 제거해 반환하고, 없으면 entry를 저장한 뒤 nullopt를 반환한다.
  // 같은 식별자의 다른 연결 항목은 밀려나며, replaced가 주어지면 그 항목을 담는다.
  std::optional<QueueEntry> Enqueue(const QueueEntry& entry, Clock::time_point now,
                                    std::optional<QueueEntry>* replaced = nullptr);
  bool Dequeue(ConnectionId connection_id);
  std::vector<QueueEntry> Expire(Clock::time_point now);
  // 대기 시간으로 반경이 넓어진 랭크 대기자끼리 다시 페어링한다.
  std::vector<QueuePairing> PairWaiting(Clock::time_point now);

  std::vector<QueueClassStats> Stats() const;
  std::chrono::milliseconds EstimatedWait(QueueClass queue_class, int rating) const;
  std::size_t Size() const;
  bool Contains(ConnectionId connection_id) const;

  int SearchRadius(Clock::duration waited) const;

 private:
  using Pool = std::list<QueueEntry>;

  Pool& PoolFor(QueueClass queue_class) { return queue_class == QueueClass::kRanked ? ranked_ : unranked_; }
  Pool::iterator FindRankedOpponent(const QueueEntry& entry, Clock::time_point now);
  Pool::iterator FindUnrankedOpponent(const QueueEntry& entry);
  void RemoveLocked(Pool::iterator it);
  std::optional<QueueEntry> RemoveIdentityLocked(const QueueEntry& entry);

  QueueConfig config_;
  Pool ranked_;
  Pool unranked_;
  std::unordered_map<ConnectionId, Pool::iterator> connection_index_;
  mutable std::mutex mutex_;
};

}  // namespace arena
