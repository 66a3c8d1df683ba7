/*
 * 설명: 한 매치의 권위 있는 물리 상태(공/패들/점수/카운트다운)를 고정 틱으로 진행하고 변경분(delta)을 산출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/simulation_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

#include <nlohmann/json.hpp>

#include "arena/match_types.hpp"

namespace arena {

struct SimulationState {
  double ball_x{0.0};
  double ball_y{0.0};
  double ball_vel_x{0.0};
  double ball_vel_y{0.0};
  double ball_speed{0.0};
  double player1_paddle_y{0.0};
  double player2_paddle_y{0.0};
  int player1_score{0};
  int player2_score{0};
  bool game_started{false};
  int countdown{0};
  bool is_counting_down{false};
  int countdown_ticks{0};  // 전송 대상 아님
};

nlohmann::json ToJson(const SimulationState& state);

// 이전 전송본과 비교해 바뀐 필드만 담는다.
struct StateDelta {
  std::optional<double> ball_x;
  std::optional<double> ball_y;
  std::optional<double> ball_vel_x;
  std::optional<double> ball_vel_y;
  std::optional<double> ball_speed;
  std::optional<double> player1_paddle_y;
  std::optional<double> player2_paddle_y;
  std::optional<int> player1_score;
  std::optional<int> player2_score;
  std::optional<bool> game_started;
  std::optional<int> countdown;
  std::optional<bool> is_counting_down;

  bool Empty() const;
};

nlohmann::json ToJson(const StateDelta& delta);

struct TickResult {
  std::optional<Slot> winner;
  std::optional<Slot> scorer;
};

class MatchSimulator {
 public:
  static constexpr double kCanvasWidth = 800.0;
  static constexpr double kCanvasHeight = 450.0;
  static constexpr double kBallSize = 12.0;
  static constexpr double kPaddleWidth = 10.0;
  static constexpr double kPaddleHeight = 80.0;
  static constexpr double kPaddleOffset = 30.0;
  static constexpr double kInitialSpeed = 3.0;
  static constexpr double kMaxSpeed = 12.0;
  static constexpr double kSpeedIncrease = 0.3;
  static constexpr int kScoreToWin = 11;
  static constexpr int kCountdownSeconds = 3;
  static constexpr int kTickRate = 60;
  static constexpr std::chrono::nanoseconds kTickInterval{std::chrono::nanoseconds(1'000'000'000 / kTickRate)};

  explicit MatchSimulator(std::uint32_t seed = std::random_device{}());
  MatchSimulator(const SimulationState& initial, std::uint32_t seed);

  TickResult Tick();
  void SetPaddle(Slot slot, double paddle_y);

  // 직전 전송본 대비 변경분을 돌려주고 현재 상태를 전송본으로 캐시한다. 첫 호출은 전체 상태다.
  StateDelta TakeDelta();
  void DropDeltaCache() { last_emitted_.reset(); }

  const SimulationState& State() const { return state_; }
  bool Finished() const { return finished_; }

 private:
  void AdvanceCountdown();
  void StepPhysics(TickResult& result);
  void ResetBall(bool serve_to_player1);
  double RandomServeAngle();

  SimulationState state_;
  std::optional<SimulationState> last_emitted_;
  std::mt19937 rng_;
  bool finished_{false};
};

}  // namespace arena
