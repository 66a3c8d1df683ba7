/*
 * 설명: Elo 기대 승률, 배치/일반 배수에 따른 레이팅 변화량과 티어/디비전 산정을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rating_engine_test.cpp
 */
#pragma once

#include <string>

namespace arena {

struct RatingConfig {
  int default_rating{1000};
  int placement_games{10};
  int placement_multiplier{64};
  int standard_multiplier{32};
};

struct RatingRecord {
  int rating{1000};
  int placement_count{0};
};

struct RatingDelta {
  int winner_change{0};
  int loser_change{0};
};

struct RankTier {
  const char* name;
  int min_rating;
  int max_rating;  // 상한이 없는 티어는 -1
  const char* color;
};

class RatingEngine {
 public:
  explicit RatingEngine(RatingConfig config = {});

  static double ExpectedScore(int rating, int opponent_rating);

  int MultiplierFor(int placement_count) const;
  RatingDelta ComputeDelta(int winner_rating, int loser_rating, int winner_placement, int loser_placement) const;
  RatingRecord Apply(const RatingRecord& record, int change) const;
  bool IsPlacement(const RatingRecord& record) const { return record.placement_count < config_.placement_games; }

  const RatingConfig& Config() const { return config_; }

 private:
  RatingConfig config_;
};

const RankTier& TierFor(int rating);
std::string RankWithDivision(int rating);

}  // namespace arena
