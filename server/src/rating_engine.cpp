/*
 * 설명: Elo 기반 레이팅 변화량과 티어/디비전 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rating_engine_test.cpp
 */
#include "arena/rating_engine.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace arena {
namespace {
constexpr std::array<RankTier, 6> kRankTiers{{
    {"Bronze", 0, 999, "#CD7F32"},
    {"Silver", 1000, 1299, "#C0C0C0"},
    {"Gold", 1300, 1599, "#FFD700"},
    {"Platinum", 1600, 1899, "#00CED1"},
    {"Diamond", 1900, 2199, "#B9F2FF"},
    {"Master", 2200, -1, "#9945FF"},
}};

constexpr std::array<const char*, 4> kDivisions{"IV", "III", "II", "I"};
}  // namespace

RatingEngine::RatingEngine(RatingConfig config) : config_(config) {}

double RatingEngine::ExpectedScore(int rating, int opponent_rating) {
  double exponent = static_cast<double>(opponent_rating - rating) / 400.0;
  return 1.0 / (1.0 + std::pow(10.0, exponent));
}

int RatingEngine::MultiplierFor(int placement_count) const {
  return placement_count < config_.placement_games ? config_.placement_multiplier : config_.standard_multiplier;
}

RatingDelta RatingEngine::ComputeDelta(int winner_rating, int loser_rating, int winner_placement,
                                       int loser_placement) const {
  double winner_expected = ExpectedScore(winner_rating, loser_rating);
  double loser_expected = ExpectedScore(loser_rating, winner_rating);

  int winner_change =
      static_cast<int>(std::round(static_cast<double>(MultiplierFor(winner_placement)) * (1.0 - winner_expected)));
  int loser_change =
      static_cast<int>(std::round(static_cast<double>(MultiplierFor(loser_placement)) * (0.0 - loser_expected)));

  // 승자는 최소 +1, 패자는 최소 -1
  return RatingDelta{std::max(winner_change, 1), std::min(loser_change, -1)};
}

RatingRecord RatingEngine::Apply(const RatingRecord& record, int change) const {
  RatingRecord next = record;
  next.rating = std::max(0, record.rating + change);
  if (next.placement_count < config_.placement_games) {
    ++next.placement_count;
  }
  return next;
}

const RankTier& TierFor(int rating) {
  for (const auto& tier : kRankTiers) {
    if (rating >= tier.min_rating && (tier.max_rating < 0 || rating <= tier.max_rating)) {
      return tier;
    }
  }
  return kRankTiers.front();
}

std::string RankWithDivision(int rating) {
  const auto& tier = TierFor(rating);
  if (tier.max_rating < 0) {
    return tier.name;
  }
  // 범위 밖(음수) 값은 Bronze 최하위 디비전으로 취급한다.
  int position = std::max(0, rating - tier.min_rating);
  double division_size = static_cast<double>(tier.max_rating - tier.min_rating + 1) / 4.0;
  auto index = static_cast<std::size_t>(std::min(3.0, std::floor(static_cast<double>(position) / division_size)));
  return std::string(tier.name) + " " + kDivisions[index];
}

}  // namespace arena
