#include <gtest/gtest.h>

#include "arena/rating_engine.hpp"

namespace {

TEST(RatingEngineTest, ExpectedScoresAreComplementary) {
  for (int a : {0, 800, 1000, 1450, 2600}) {
    for (int b : {0, 950, 1000, 2200}) {
      EXPECT_NEAR(arena::RatingEngine::ExpectedScore(a, b) + arena::RatingEngine::ExpectedScore(b, a), 1.0, 1e-9);
    }
  }
  EXPECT_DOUBLE_EQ(arena::RatingEngine::ExpectedScore(1000, 1000), 0.5);
}

TEST(RatingEngineTest, PlacementGamesUseHigherMultiplier) {
  arena::RatingEngine engine;
  auto placement = engine.ComputeDelta(1000, 1000, 0, 0);
  EXPECT_EQ(placement.winner_change, 32);
  EXPECT_EQ(placement.loser_change, -32);

  auto standard = engine.ComputeDelta(1000, 1000, 10, 10);
  EXPECT_EQ(standard.winner_change, 16);
  EXPECT_EQ(standard.loser_change, -16);

  // 배수는 각자의 배치 횟수로 정해진다.
  auto mixed = engine.ComputeDelta(1000, 1000, 3, 12);
  EXPECT_EQ(mixed.winner_change, 32);
  EXPECT_EQ(mixed.loser_change, -16);
}

TEST(RatingEngineTest, UpsetMovesMorePoints) {
  arena::RatingEngine engine;
  auto delta = engine.ComputeDelta(1000, 1400, 10, 10);
  EXPECT_EQ(delta.winner_change, 29);
  EXPECT_EQ(delta.loser_change, -29);
}

TEST(RatingEngineTest, ChangesNeverRoundToZero) {
  arena::RatingEngine engine;
  auto delta = engine.ComputeDelta(2000, 1000, 10, 10);
  EXPECT_EQ(delta.winner_change, 1);
  EXPECT_EQ(delta.loser_change, -1);
}

TEST(RatingEngineTest, ApplyClampsAtZeroAndSaturatesPlacement) {
  arena::RatingEngine engine;
  auto low = engine.Apply(arena::RatingRecord{10, 3}, -32);
  EXPECT_EQ(low.rating, 0);
  EXPECT_EQ(low.placement_count, 4);

  auto veteran = engine.Apply(arena::RatingRecord{1500, 10}, 12);
  EXPECT_EQ(veteran.rating, 1512);
  EXPECT_EQ(veteran.placement_count, 10);
  EXPECT_FALSE(engine.IsPlacement(veteran));
  EXPECT_TRUE(engine.IsPlacement(arena::RatingRecord{1000, 9}));
}

TEST(RankTierTest, TierBandsAndDivisions) {
  EXPECT_STREQ(arena::TierFor(0).name, "Bronze");
  EXPECT_STREQ(arena::TierFor(1000).name, "Silver");
  EXPECT_STREQ(arena::TierFor(1599).name, "Gold");
  EXPECT_STREQ(arena::TierFor(1600).color, "#00CED1");
  EXPECT_STREQ(arena::TierFor(2199).name, "Diamond");
  EXPECT_STREQ(arena::TierFor(9000).name, "Master");
  EXPECT_STREQ(arena::TierFor(-20).name, "Bronze");

  EXPECT_EQ(arena::RankWithDivision(0), "Bronze IV");
  EXPECT_EQ(arena::RankWithDivision(999), "Bronze I");
  EXPECT_EQ(arena::RankWithDivision(1000), "Silver IV");
  EXPECT_EQ(arena::RankWithDivision(1299), "Silver I");
  EXPECT_EQ(arena::RankWithDivision(1450), "Gold II");
  EXPECT_EQ(arena::RankWithDivision(2200), "Master");
  EXPECT_EQ(arena::RankWithDivision(3100), "Master");
}

}  // namespace
