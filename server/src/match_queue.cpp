/*
 * 설명: 매칭 대기열 입장/이탈/만료와 레이팅 반경 확장 기반 페어링을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_queue_test.cpp
 */
#include "arena/match_queue.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <limits>

namespace arena {

MatchmakingQueue::MatchmakingQueue(QueueConfig config) : config_(config) {}

int MatchmakingQueue::SearchRadius(Clock::duration waited) const {
  if (waited.count() < 0) {
    waited = Clock::duration::zero();
  }
  auto steps = std::chrono::duration_cast<std::chrono::milliseconds>(waited).count() /
               std::chrono::duration_cast<std::chrono::milliseconds>(config_.radius_step_interval).count();
  long long radius = static_cast<long long>(config_.initial_radius) + steps * config_.radius_step;
  return static_cast<int>(std::min<long long>(radius, config_.max_radius));
}

std::optional<QueueEntry> MatchmakingQueue::Enqueue(const QueueEntry& entry, Clock::time_point now,
                                                    std::optional<QueueEntry>* replaced) {
  std::lock_guard<std::mutex> lock(mutex_);
  // 한 연결은 하나의 대기 항목만, 한 식별자는 등급별로 하나의 항목만 가진다.
  auto existing = connection_index_.find(entry.connection_id);
  if (existing != connection_index_.end()) {
    RemoveLocked(existing->second);
  }
  auto evicted = RemoveIdentityLocked(entry);
  if (replaced) {
    *replaced = std::move(evicted);
  }

  auto& pool = PoolFor(entry.queue_class);
  auto opponent = entry.queue_class == QueueClass::kRanked ? FindRankedOpponent(entry, now) : FindUnrankedOpponent(entry);
  if (opponent != pool.end()) {
    QueueEntry matched = *opponent;
    RemoveLocked(opponent);
    return matched;
  }

  pool.push_back(entry);
  connection_index_[entry.connection_id] = std::prev(pool.end());
  return std::nullopt;
}

MatchmakingQueue::Pool::iterator MatchmakingQueue::FindRankedOpponent(const QueueEntry& entry, Clock::time_point now) {
  int own_radius = SearchRadius(now - entry.enqueued_at);
  auto best = ranked_.end();
  int best_diff = std::numeric_limits<int>::max();
  for (auto it = ranked_.begin(); it != ranked_.end(); ++it) {
    if (&*it == &entry) {
      continue;
    }
    if (it->identity == entry.identity) {
      continue;
    }
    int diff = std::abs(it->rating - entry.rating);
    if (diff > own_radius) {
      continue;
    }
    // 상대의 대기 시간으로 확장된 반경도 만족해야 한다.
    int candidate_radius = SearchRadius(now - it->enqueued_at);
    if (diff <= candidate_radius && diff < best_diff) {
      best = it;
      best_diff = diff;
    }
  }
  return best;
}

MatchmakingQueue::Pool::iterator MatchmakingQueue::FindUnrankedOpponent(const QueueEntry& entry) {
  return std::find_if(unranked_.begin(), unranked_.end(),
                      [&entry](const QueueEntry& waiting) { return waiting.identity != entry.identity; });
}

bool MatchmakingQueue::Dequeue(ConnectionId connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connection_index_.find(connection_id);
  if (it == connection_index_.end()) {
    return false;
  }
  RemoveLocked(it->second);
  return true;
}

std::vector<QueueEntry> MatchmakingQueue::Expire(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<QueueEntry> expired;
  for (auto* pool : {&ranked_, &unranked_}) {
    auto it = pool->begin();
    while (it != pool->end()) {
      if (now - it->enqueued_at <= config_.entry_timeout) {
        ++it;
        continue;
      }
      expired.push_back(*it);
      connection_index_.erase(it->connection_id);
      it = pool->erase(it);
    }
  }
  return expired;
}

std::vector<QueuePairing> MatchmakingQueue::PairWaiting(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<QueuePairing> pairings;
  auto anchor = ranked_.begin();
  while (anchor != ranked_.end()) {
    auto opponent = FindRankedOpponent(*anchor, now);
    if (opponent == ranked_.end()) {
      ++anchor;
      continue;
    }
    QueuePairing pairing;
    pairing.waiting = *anchor;
    pairing.joined = *opponent;
    // 조건이 대칭이므로 앞서 짝이 없던 항목은 후보가 될 수 없고, 상대는 항상 anchor 뒤에 있다.
    auto next = std::next(anchor);
    if (next == opponent) {
      ++next;
    }
    RemoveLocked(opponent);
    RemoveLocked(anchor);
    pairings.push_back(std::move(pairing));
    anchor = next;
  }
  return pairings;
}

std::vector<QueueClassStats> MatchmakingQueue::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  QueueClassStats ranked{QueueClass::kRanked, ranked_.size(), std::nullopt};
  if (!ranked_.empty()) {
    double sum = 0.0;
    for (const auto& entry : ranked_) {
      sum += entry.rating;
    }
    ranked.average_rating = static_cast<int>(std::round(sum / static_cast<double>(ranked_.size())));
  }
  QueueClassStats unranked{QueueClass::kUnranked, unranked_.size(), std::nullopt};
  return {ranked, unranked};
}

std::chrono::milliseconds MatchmakingQueue::EstimatedWait(QueueClass queue_class, int rating) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_class == QueueClass::kUnranked) {
    return unranked_.empty() ? std::chrono::milliseconds(15000) : std::chrono::milliseconds(0);
  }
  auto within = [this, rating](int radius) {
    return std::any_of(ranked_.begin(), ranked_.end(),
                       [rating, radius](const QueueEntry& entry) { return std::abs(entry.rating - rating) <= radius; });
  };
  if (within(config_.initial_radius)) {
    return std::chrono::milliseconds(0);
  }
  if (within(config_.max_radius)) {
    return std::chrono::milliseconds(20000);
  }
  return std::chrono::milliseconds(45000);
}

std::size_t MatchmakingQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ranked_.size() + unranked_.size();
}

bool MatchmakingQueue::Contains(ConnectionId connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_index_.count(connection_id) > 0;
}

void MatchmakingQueue::RemoveLocked(Pool::iterator it) {
  connection_index_.erase(it->connection_id);
  PoolFor(it->queue_class).erase(it);
}

std::optional<QueueEntry> MatchmakingQueue::RemoveIdentityLocked(const QueueEntry& entry) {
  auto& pool = PoolFor(entry.queue_class);
  auto it = std::find_if(pool.begin(), pool.end(),
                         [&entry](const QueueEntry& waiting) { return waiting.identity == entry.identity; });
  if (it == pool.end()) {
    return std::nullopt;
  }
  QueueEntry evicted = *it;
  RemoveLocked(it);
  return evicted;
}

}  // namespace arena
