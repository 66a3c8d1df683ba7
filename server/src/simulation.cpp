/*
 * 설명: 공/패들 물리, 득점과 카운트다운, 변경분 산출을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/simulation_test.cpp
 */
#include "arena/simulation.hpp"

#include <algorithm>
#include <cmath>

namespace arena {
namespace {
constexpr double kPi = 3.14159265358979323846;

double Round2(double value) { return std::round(value * 100.0) / 100.0; }

template <typename T>
void SetIfChanged(std::optional<T>& field, T current, T previous) {
  if (current != previous) {
    field = current;
  }
}

void SetIfMoved(std::optional<double>& field, double current, double previous) {
  if (Round2(current) != Round2(previous)) {
    field = current;
  }
}

SimulationState InitialState(double angle, double direction) {
  SimulationState state;
  state.ball_x = MatchSimulator::kCanvasWidth / 2;
  state.ball_y = MatchSimulator::kCanvasHeight / 2;
  state.ball_vel_x = std::cos(angle) * MatchSimulator::kInitialSpeed * direction;
  state.ball_vel_y = std::sin(angle) * MatchSimulator::kInitialSpeed;
  state.ball_speed = MatchSimulator::kInitialSpeed;
  state.player1_paddle_y = MatchSimulator::kCanvasHeight / 2 - MatchSimulator::kPaddleHeight / 2;
  state.player2_paddle_y = MatchSimulator::kCanvasHeight / 2 - MatchSimulator::kPaddleHeight / 2;
  state.game_started = false;
  state.countdown = MatchSimulator::kCountdownSeconds;
  state.is_counting_down = true;
  return state;
}
}  // namespace

nlohmann::json ToJson(const SimulationState& state) {
  return nlohmann::json{{"ballX", state.ball_x},
                        {"ballY", state.ball_y},
                        {"ballVelX", state.ball_vel_x},
                        {"ballVelY", state.ball_vel_y},
                        {"ballSpeed", state.ball_speed},
                        {"player1PaddleY", state.player1_paddle_y},
                        {"player2PaddleY", state.player2_paddle_y},
                        {"player1Score", state.player1_score},
                        {"player2Score", state.player2_score},
                        {"gameStarted", state.game_started},
                        {"countdown", state.countdown},
                        {"isCountingDown", state.is_counting_down}};
}

bool StateDelta::Empty() const {
  return !ball_x && !ball_y && !ball_vel_x && !ball_vel_y && !ball_speed && !player1_paddle_y &&
         !player2_paddle_y && !player1_score && !player2_score && !game_started && !countdown && !is_counting_down;
}

nlohmann::json ToJson(const StateDelta& delta) {
  nlohmann::json j = nlohmann::json::object();
  auto put = [&j](const char* key, const auto& field) {
    if (field) {
      j[key] = *field;
    }
  };
  put("ballX", delta.ball_x);
  put("ballY", delta.ball_y);
  put("ballVelX", delta.ball_vel_x);
  put("ballVelY", delta.ball_vel_y);
  put("ballSpeed", delta.ball_speed);
  put("player1PaddleY", delta.player1_paddle_y);
  put("player2PaddleY", delta.player2_paddle_y);
  put("player1Score", delta.player1_score);
  put("player2Score", delta.player2_score);
  put("gameStarted", delta.game_started);
  put("countdown", delta.countdown);
  put("isCountingDown", delta.is_counting_down);
  return j;
}

MatchSimulator::MatchSimulator(std::uint32_t seed) : rng_(seed) {
  std::bernoulli_distribution coin(0.5);
  double angle = RandomServeAngle();
  state_ = InitialState(angle, coin(rng_) ? 1.0 : -1.0);
}

MatchSimulator::MatchSimulator(const SimulationState& initial, std::uint32_t seed) : state_(initial), rng_(seed) {}

double MatchSimulator::RandomServeAngle() {
  // 수평 기준 ±22.5도
  std::uniform_real_distribution<double> dist(-0.5, 0.5);
  return dist(rng_) * (kPi / 4);
}

TickResult MatchSimulator::Tick() {
  TickResult result;
  if (finished_) {
    return result;
  }
  if (state_.is_counting_down && !state_.game_started) {
    AdvanceCountdown();
    return result;
  }
  if (!state_.game_started) {
    return result;
  }

  StepPhysics(result);

  if (state_.player1_score >= kScoreToWin) {
    finished_ = true;
    result.winner = Slot::kPlayer1;
  } else if (state_.player2_score >= kScoreToWin) {
    finished_ = true;
    result.winner = Slot::kPlayer2;
  }
  return result;
}

void MatchSimulator::AdvanceCountdown() {
  ++state_.countdown_ticks;
  if (state_.countdown_ticks < kTickRate) {
    return;
  }
  state_.countdown_ticks = 0;
  --state_.countdown;
  if (state_.countdown <= 0) {
    state_.game_started = true;
    state_.is_counting_down = false;
  }
}

void MatchSimulator::StepPhysics(TickResult& result) {
  auto& s = state_;
  s.ball_x += s.ball_vel_x;
  s.ball_y += s.ball_vel_y;

  if (s.ball_y < 0 || s.ball_y + kBallSize > kCanvasHeight) {
    s.ball_vel_y = -s.ball_vel_y;
    s.ball_y = s.ball_y < 0 ? 0 : kCanvasHeight - kBallSize;
  }

  // 왼쪽 패들: 공이 왼쪽으로 이동 중이고 패들 x/y 구간과 겹칠 때만
  if (s.ball_vel_x < 0 && s.ball_x <= kPaddleOffset + kPaddleWidth && s.ball_x + kBallSize >= kPaddleOffset &&
      s.ball_y + kBallSize >= s.player1_paddle_y && s.ball_y <= s.player1_paddle_y + kPaddleHeight) {
    double hit = (s.ball_y + kBallSize / 2 - s.player1_paddle_y) / kPaddleHeight;
    double angle = (hit - 0.5) * (kPi / 3);
    s.ball_speed = std::min(s.ball_speed + kSpeedIncrease, kMaxSpeed);
    s.ball_vel_x = std::abs(std::cos(angle) * s.ball_speed);
    s.ball_vel_y = std::sin(angle) * s.ball_speed;
    s.ball_x = kPaddleOffset + kPaddleWidth;
  }

  if (s.ball_vel_x > 0 && s.ball_x + kBallSize >= kCanvasWidth - kPaddleOffset - kPaddleWidth &&
      s.ball_x <= kCanvasWidth - kPaddleOffset && s.ball_y + kBallSize >= s.player2_paddle_y &&
      s.ball_y <= s.player2_paddle_y + kPaddleHeight) {
    double hit = (s.ball_y + kBallSize / 2 - s.player2_paddle_y) / kPaddleHeight;
    double angle = (hit - 0.5) * (kPi / 3);
    s.ball_speed = std::min(s.ball_speed + kSpeedIncrease, kMaxSpeed);
    s.ball_vel_x = -std::abs(std::cos(angle) * s.ball_speed);
    s.ball_vel_y = std::sin(angle) * s.ball_speed;
    s.ball_x = kCanvasWidth - kPaddleOffset - kPaddleWidth - kBallSize;
  }

  if (s.ball_x < 0) {
    ++s.player2_score;
    result.scorer = Slot::kPlayer2;
    ResetBall(true);
  } else if (s.ball_x > kCanvasWidth) {
    ++s.player1_score;
    result.scorer = Slot::kPlayer1;
    ResetBall(false);
  }
}

void MatchSimulator::ResetBall(bool serve_to_player1) {
  double angle = RandomServeAngle();
  auto& s = state_;
  s.ball_x = kCanvasWidth / 2;
  s.ball_y = kCanvasHeight / 2;
  s.ball_vel_x = std::cos(angle) * kInitialSpeed * (serve_to_player1 ? -1.0 : 1.0);
  s.ball_vel_y = std::sin(angle) * kInitialSpeed;
  s.ball_speed = kInitialSpeed;
  s.game_started = false;
  s.is_counting_down = true;
  s.countdown = kCountdownSeconds;
  s.countdown_ticks = 0;
}

void MatchSimulator::SetPaddle(Slot slot, double paddle_y) {
  double clamped = std::clamp(paddle_y, 0.0, kCanvasHeight - kPaddleHeight);
  if (slot == Slot::kPlayer1) {
    state_.player1_paddle_y = clamped;
  } else {
    state_.player2_paddle_y = clamped;
  }
}

StateDelta MatchSimulator::TakeDelta() {
  const auto& cur = state_;
  StateDelta delta;
  if (!last_emitted_) {
    delta.ball_x = cur.ball_x;
    delta.ball_y = cur.ball_y;
    delta.ball_vel_x = cur.ball_vel_x;
    delta.ball_vel_y = cur.ball_vel_y;
    delta.ball_speed = cur.ball_speed;
    delta.player1_paddle_y = cur.player1_paddle_y;
    delta.player2_paddle_y = cur.player2_paddle_y;
    delta.player1_score = cur.player1_score;
    delta.player2_score = cur.player2_score;
    delta.game_started = cur.game_started;
    delta.countdown = cur.countdown;
    delta.is_counting_down = cur.is_counting_down;
  } else {
    const auto& prev = *last_emitted_;
    SetIfMoved(delta.ball_x, cur.ball_x, prev.ball_x);
    SetIfMoved(delta.ball_y, cur.ball_y, prev.ball_y);
    SetIfMoved(delta.ball_vel_x, cur.ball_vel_x, prev.ball_vel_x);
    SetIfMoved(delta.ball_vel_y, cur.ball_vel_y, prev.ball_vel_y);
    SetIfMoved(delta.ball_speed, cur.ball_speed, prev.ball_speed);
    SetIfMoved(delta.player1_paddle_y, cur.player1_paddle_y, prev.player1_paddle_y);
    SetIfMoved(delta.player2_paddle_y, cur.player2_paddle_y, prev.player2_paddle_y);
    SetIfChanged(delta.player1_score, cur.player1_score, prev.player1_score);
    SetIfChanged(delta.player2_score, cur.player2_score, prev.player2_score);
    SetIfChanged(delta.game_started, cur.game_started, prev.game_started);
    SetIfChanged(delta.countdown, cur.countdown, prev.countdown);
    SetIfChanged(delta.is_counting_down, cur.is_counting_down, prev.is_counting_down);
  }
  last_emitted_ = state_;
  return delta;
}

}  // namespace arena
