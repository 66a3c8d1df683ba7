#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "arena/arena_service.hpp"

namespace {

constexpr const char* kAlpha = "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v";
constexpr const char* kBravo = "So11111111111111111111111111111111111111112";
constexpr const char* kCharlie = "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin";

struct SentFrame {
  arena::ConnectionId connection_id;
  std::string name;
  nlohmann::json payload;
  bool error;
};

class RecordingSink : public arena::EventSink {
 public:
  void SendEvent(arena::ConnectionId connection_id, const std::string& event, const nlohmann::json& payload) override {
    std::lock_guard<std::mutex> lock(mutex_);
    frames.push_back({connection_id, event, payload, false});
  }
  void SendError(arena::ConnectionId connection_id, const std::string& code, const std::string& message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    frames.push_back({connection_id, code, {{"message", message}}, true});
  }

  std::vector<SentFrame> For(arena::ConnectionId connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SentFrame> out;
    for (const auto& frame : frames) {
      if (frame.connection_id == connection_id) {
        out.push_back(frame);
      }
    }
    return out;
  }

  // 단일 스레드 테스트는 frames를 직접 읽는다.
  std::vector<SentFrame> frames;

 private:
  mutable std::mutex mutex_;
};

class SeededRepository : public arena::MatchRepository {
 public:
  std::optional<arena::RatingRecord> LoadRating(const std::string& identity) override {
    auto it = ratings.find(identity);
    if (it == ratings.end()) {
      return std::nullopt;
    }
    return it->second;
  }
  void PersistOutcome(const arena::OutcomeSummary&, const std::vector<arena::PlayerRatingUpdate>&) override {}

  std::unordered_map<std::string, arena::RatingRecord> ratings;
};

class ArenaServiceTest : public ::testing::Test {
 protected:
  void SetUp() override { Build(100); }

  void Build(std::size_t rate_limit_max) {
    observability_ = std::make_shared<arena::Observability>(arena::LogLevel::kError, log_);
    repository_ = std::make_shared<SeededRepository>();
    ratings_ = std::make_shared<arena::RatingLedger>(arena::RatingEngine{}, repository_, observability_);
    queue_ = std::make_shared<arena::MatchmakingQueue>();
    coordinator_ = std::make_shared<arena::MatchLifecycleCoordinator>(ioc_, arena::CoordinatorConfig{}, ratings_,
                                                                      nullptr, observability_);
    sink_ = std::make_shared<RecordingSink>();
    arena::ArenaConfig config;
    config.match_start_delay = std::chrono::hours(1);
    config.rate_limit_max = rate_limit_max;
    service_ = std::make_shared<arena::ArenaService>(ioc_, config, queue_, coordinator_, ratings_, sink_,
                                                     observability_);
  }

  void Join(arena::ConnectionId id, const std::string& identity, arena::QueueClass queue_class) {
    service_->Dispatch(id, arena::JoinQueue{identity, queue_class, {}});
  }

  std::string MatchIdFor(arena::ConnectionId id) const { return coordinator_->MatchOf(id).value_or(""); }

  boost::asio::io_context ioc_;
  std::ostringstream log_;
  std::shared_ptr<arena::Observability> observability_;
  std::shared_ptr<SeededRepository> repository_;
  std::shared_ptr<arena::RatingLedger> ratings_;
  std::shared_ptr<arena::MatchmakingQueue> queue_;
  std::shared_ptr<arena::MatchLifecycleCoordinator> coordinator_;
  std::shared_ptr<RecordingSink> sink_;
  std::shared_ptr<arena::ArenaService> service_;
};

TEST_F(ArenaServiceTest, FirstJoinSearchesSecondJoinPairs) {
  Join(1, kAlpha, arena::QueueClass::kUnranked);
  auto first = sink_->For(1);
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].name, "searching");
  EXPECT_EQ(first[0].payload["queueClass"], "unranked");
  EXPECT_EQ(first[0].payload["rating"], 1000);

  Join(2, kBravo, arena::QueueClass::kUnranked);
  auto waiting = sink_->For(1);
  auto joined = sink_->For(2);
  ASSERT_EQ(waiting.size(), 2u);
  ASSERT_EQ(joined.size(), 1u);
  EXPECT_EQ(waiting[1].name, "match_found");
  EXPECT_EQ(waiting[1].payload["slot"], 1);
  EXPECT_EQ(waiting[1].payload["opponent"], kBravo);
  EXPECT_EQ(joined[0].name, "match_found");
  EXPECT_EQ(joined[0].payload["slot"], 2);
  EXPECT_EQ(joined[0].payload["opponent"], kAlpha);
  EXPECT_EQ(waiting[1].payload["matchId"], joined[0].payload["matchId"]);
  EXPECT_TRUE(arena::IsValidMatchId(joined[0].payload["matchId"].get<std::string>()));

  auto view = coordinator_->GetMatch(MatchIdFor(2));
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status, arena::MatchStatus::kActive);
  EXPECT_EQ(view->player1.identity, kAlpha);
  EXPECT_EQ(queue_->Size(), 0u);
}

TEST_F(ArenaServiceTest, JoinWhileInMatchIsRejected) {
  Join(1, kAlpha, arena::QueueClass::kUnranked);
  Join(2, kBravo, arena::QueueClass::kUnranked);
  sink_->frames.clear();

  Join(1, kAlpha, arena::QueueClass::kRanked);
  ASSERT_EQ(sink_->frames.size(), 1u);
  EXPECT_TRUE(sink_->frames[0].error);
  EXPECT_EQ(sink_->frames[0].name, "already_in_match");
  EXPECT_EQ(queue_->Size(), 0u);
}

TEST_F(ArenaServiceTest, LeaveQueueConfirmsOnlyWhenQueued) {
  Join(1, kAlpha, arena::QueueClass::kRanked);
  service_->Dispatch(1, arena::LeaveQueue{});
  service_->Dispatch(1, arena::LeaveQueue{});
  auto frames = sink_->For(1);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[1].name, "queue_left");
  EXPECT_EQ(queue_->Size(), 0u);
}

TEST_F(ArenaServiceTest, CancelRequiresParticipant) {
  Join(1, kAlpha, arena::QueueClass::kUnranked);
  Join(2, kBravo, arena::QueueClass::kUnranked);
  auto match_id = MatchIdFor(1);
  sink_->frames.clear();

  service_->Dispatch(3, arena::CancelMatch{match_id});
  ASSERT_EQ(sink_->frames.size(), 1u);
  EXPECT_EQ(sink_->frames[0].name, "not_authorized");

  sink_->frames.clear();
  service_->Dispatch(2, arena::CancelMatch{match_id});
  ASSERT_EQ(sink_->frames.size(), 2u);
  for (const auto& frame : sink_->frames) {
    EXPECT_EQ(frame.name, "match_cancelled");
    EXPECT_EQ(frame.payload["reason"], "Player left");
    EXPECT_EQ(frame.payload["matchId"], match_id);
  }
  EXPECT_FALSE(coordinator_->GetMatch(match_id));
}

TEST_F(ArenaServiceTest, DisconnectDuringRankedMatchForfeits) {
  Join(1, kAlpha, arena::QueueClass::kRanked);
  Join(2, kBravo, arena::QueueClass::kRanked);
  auto match_id = MatchIdFor(1);
  sink_->frames.clear();

  service_->Dispatch(1, arena::Disconnect{});
  auto frames = sink_->For(2);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].name, "opponent_disconnected");
  EXPECT_EQ(frames[0].payload["matchId"], match_id);
  EXPECT_EQ(frames[1].name, "match_ended");
  EXPECT_EQ(frames[1].payload["winner"], kBravo);
  EXPECT_EQ(frames[1].payload["forfeit"], true);
  EXPECT_EQ(frames[1].payload["ratingChange"], 32);
  EXPECT_EQ(frames[1].payload["newRating"], 1032);
  EXPECT_TRUE(sink_->For(1).empty());
  EXPECT_EQ(ratings_->Peek(kAlpha).rating, 968);

  service_->Dispatch(2, arena::Disconnect{});
  EXPECT_EQ(sink_->frames.size(), 2u);
}

TEST_F(ArenaServiceTest, DisconnectWhileQueuedLeavesSilently) {
  Join(1, kAlpha, arena::QueueClass::kRanked);
  sink_->frames.clear();
  service_->Dispatch(1, arena::Disconnect{});
  EXPECT_TRUE(sink_->frames.empty());
  EXPECT_FALSE(queue_->Contains(1));
}

TEST_F(ArenaServiceTest, SecondConnectionWithSameIdentityReplacesFirst) {
  Join(1, kAlpha, arena::QueueClass::kRanked);
  Join(2, kAlpha, arena::QueueClass::kRanked);

  auto evicted = sink_->For(1);
  ASSERT_EQ(evicted.size(), 2u);
  EXPECT_EQ(evicted[0].name, "searching");
  EXPECT_EQ(evicted[1].name, "queue_left");
  EXPECT_EQ(evicted[1].payload["reason"], "replaced");

  auto current = sink_->For(2);
  ASSERT_EQ(current.size(), 1u);
  EXPECT_EQ(current[0].name, "searching");
  EXPECT_FALSE(queue_->Contains(1));
  EXPECT_TRUE(queue_->Contains(2));
  EXPECT_EQ(queue_->Size(), 1u);
}

TEST_F(ArenaServiceTest, DisconnectRacingPairingNeverLeavesActiveMatch) {
  for (int i = 0; i < 200; ++i) {
    Build(100);
    Join(1, kAlpha, arena::QueueClass::kUnranked);

    std::thread joiner([this]() { Join(2, kBravo, arena::QueueClass::kUnranked); });
    service_->Dispatch(1, arena::Disconnect{});
    joiner.join();

    // 페어링이 먼저 끝났다면 남은 쪽은 몰수 승리를 통보받아야 한다.
    EXPECT_FALSE(coordinator_->MatchOf(1)) << "iteration " << i;
    EXPECT_FALSE(coordinator_->MatchOf(2)) << "iteration " << i;
    EXPECT_EQ(coordinator_->ActiveMatchCount(), 0u) << "iteration " << i;

    auto frames = sink_->For(2);
    ASSERT_FALSE(frames.empty()) << "iteration " << i;
    if (frames[0].name == "match_found") {
      ASSERT_EQ(frames.size(), 3u) << "iteration " << i;
      EXPECT_EQ(frames[1].name, "opponent_disconnected");
      EXPECT_EQ(frames[2].name, "match_ended");
      EXPECT_EQ(frames[2].payload["forfeit"], true);
      EXPECT_EQ(frames[2].payload["winner"], kBravo);
    } else {
      EXPECT_EQ(frames[0].name, "searching") << "iteration " << i;
      EXPECT_TRUE(queue_->Contains(2));
    }
    EXPECT_FALSE(queue_->Contains(1));
    service_->Dispatch(2, arena::Disconnect{});
    EXPECT_EQ(queue_->Size(), 0u);
  }
}

TEST_F(ArenaServiceTest, PlayerRatingReportsTier) {
  repository_->ratings[kCharlie] = arena::RatingRecord{1450, 12};
  service_->Dispatch(7, arena::GetRating{kCharlie});
  ASSERT_EQ(sink_->frames.size(), 1u);
  const auto& payload = sink_->frames[0].payload;
  EXPECT_EQ(sink_->frames[0].name, "player_rating");
  EXPECT_EQ(payload["rating"], 1450);
  EXPECT_EQ(payload["tier"], "Gold II");
  EXPECT_EQ(payload["isPlacement"], false);
}

TEST_F(ArenaServiceTest, RateLimitSkipsPaddleInput) {
  Build(2);
  service_->Dispatch(1, arena::GetRating{kAlpha});
  service_->Dispatch(1, arena::GetRating{kAlpha});
  service_->Dispatch(1, arena::GetRating{kAlpha});
  ASSERT_EQ(sink_->frames.size(), 3u);
  EXPECT_TRUE(sink_->frames[2].error);
  EXPECT_EQ(sink_->frames[2].name, "rate_limited");

  sink_->frames.clear();
  for (int i = 0; i < 10; ++i) {
    service_->Dispatch(1, arena::UpdatePaddle{"3f2a9c1e-8b4d-4e6f-9a1b-2c3d4e5f6a7b", 100.0});
  }
  EXPECT_TRUE(sink_->frames.empty());

  // 연결 종료로 창이 초기화된다.
  service_->Dispatch(1, arena::Disconnect{});
  service_->Dispatch(1, arena::GetRating{kAlpha});
  ASSERT_EQ(sink_->frames.size(), 1u);
  EXPECT_EQ(sink_->frames[0].name, "player_rating");
}

TEST_F(ArenaServiceTest, SweepExpiresStaleEntries) {
  Join(1, kAlpha, arena::QueueClass::kRanked);
  sink_->frames.clear();
  service_->Sweep(arena::ArenaService::Clock::now() + std::chrono::seconds(61));
  ASSERT_EQ(sink_->frames.size(), 1u);
  EXPECT_EQ(sink_->frames[0].name, "queue_timeout");
  EXPECT_EQ(sink_->frames[0].payload["queueClass"], "ranked");
  EXPECT_EQ(queue_->Size(), 0u);
}

TEST_F(ArenaServiceTest, SweepPairsWhenRadiusWidens) {
  repository_->ratings[kBravo] = arena::RatingRecord{1300, 10};
  Join(1, kAlpha, arena::QueueClass::kRanked);
  Join(2, kBravo, arena::QueueClass::kRanked);
  EXPECT_EQ(queue_->Size(), 2u);
  sink_->frames.clear();

  service_->Sweep(arena::ArenaService::Clock::now() + std::chrono::seconds(45));
  auto waiting = sink_->For(1);
  auto joined = sink_->For(2);
  ASSERT_EQ(waiting.size(), 1u);
  ASSERT_EQ(joined.size(), 1u);
  EXPECT_EQ(waiting[0].name, "match_found");
  EXPECT_EQ(waiting[0].payload["slot"], 1);
  EXPECT_EQ(waiting[0].payload["opponentRating"], 1300);
  EXPECT_EQ(joined[0].payload["slot"], 2);
  EXPECT_EQ(queue_->Size(), 0u);
}

TEST(RateLimiterTest, FixedWindowPerConnection) {
  arena::RateLimiter limiter(2, std::chrono::seconds(60));
  auto start = arena::RateLimiter::Clock::now();
  EXPECT_TRUE(limiter.Allow(1, start));
  EXPECT_TRUE(limiter.Allow(1, start));
  EXPECT_FALSE(limiter.Allow(1, start + std::chrono::seconds(30)));
  EXPECT_TRUE(limiter.Allow(2, start));
  EXPECT_TRUE(limiter.Allow(1, start + std::chrono::seconds(61)));
  EXPECT_EQ(limiter.Size(), 2u);
  limiter.Forget(1);
  EXPECT_EQ(limiter.Size(), 1u);
}

}  // namespace
