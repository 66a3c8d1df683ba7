/*
 * 설명: 클라이언트 명령 처리, 매치 시작/종료 이벤트 전달, 대기열 스윕을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/arena_service_test.cpp, server/tests/e2e/arena_flow_test.cpp
 */
#include "arena/arena_service.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace arena {

namespace {
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr const char* kCancelReason = "Player left";
}  // namespace

ArenaService::ArenaService(boost::asio::io_context& ioc, ArenaConfig config, std::shared_ptr<MatchmakingQueue> queue,
                           std::shared_ptr<MatchLifecycleCoordinator> coordinator,
                           std::shared_ptr<RatingLedger> ratings, std::shared_ptr<EventSink> sink,
                           std::shared_ptr<Observability> observability)
    : sweep_strand_(boost::asio::make_strand(ioc)), sweep_timer_(sweep_strand_), config_(config),
      queue_(std::move(queue)), coordinator_(std::move(coordinator)), ratings_(std::move(ratings)),
      sink_(std::move(sink)), observability_(std::move(observability)),
      rate_limiter_(config.rate_limit_max, config.rate_limit_window) {}

void ArenaService::Start() {
  if (running_.exchange(true)) {
    return;
  }
  boost::asio::post(sweep_strand_, [self = shared_from_this()]() { self->ScheduleSweep(); });
}

void ArenaService::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::asio::post(sweep_strand_, [self = shared_from_this()]() { self->sweep_timer_.cancel(); });
}

void ArenaService::Dispatch(ConnectionId connection_id, const ClientCommand& command) {
  bool limited = std::holds_alternative<JoinQueue>(command) || std::holds_alternative<LeaveQueue>(command) ||
                 std::holds_alternative<CancelMatch>(command) || std::holds_alternative<GetRating>(command);
  if (limited && !rate_limiter_.Allow(connection_id, Clock::now())) {
    observability_->Warn("rate_limited", {{"connectionId", connection_id}});
    sink_->SendError(connection_id, "rate_limited", "요청 한도를 초과했습니다");
    return;
  }

  std::visit(Overloaded{
                 [&](const JoinQueue& c) { HandleJoin(connection_id, c); },
                 [&](const LeaveQueue&) { HandleLeave(connection_id); },
                 [&](const UpdatePaddle& c) { HandlePaddle(connection_id, c); },
                 [&](const CancelMatch& c) { HandleCancel(connection_id, c); },
                 [&](const GetRating& c) { HandleGetRating(connection_id, c); },
                 [&](const Disconnect&) { HandleDisconnect(connection_id); },
             },
             command);
}

void ArenaService::HandleJoin(ConnectionId connection_id, const JoinQueue& command) {
  if (coordinator_->MatchOf(connection_id)) {
    sink_->SendError(connection_id, "already_in_match", "이미 진행 중인 매치가 있습니다");
    return;
  }

  // 저장소 조회는 페어링 락 밖에서 끝낸다.
  auto record = ratings_->Resolve(command.identity);
  std::lock_guard<std::mutex> lock(pairing_mutex_);
  auto now = Clock::now();
  auto estimated_wait = queue_->EstimatedWait(command.queue_class, record.rating);
  QueueEntry entry{connection_id, command.identity, command.queue_class, record.rating, now, command.cosmetics};
  std::optional<QueueEntry> replaced;
  auto opponent = queue_->Enqueue(entry, now, &replaced);
  if (replaced) {
    observability_->Info("queue_replaced", {{"identity", replaced->identity},
                                            {"connectionId", replaced->connection_id},
                                            {"byConnectionId", connection_id}});
    sink_->SendEvent(replaced->connection_id, event::kQueueLeft, {{"reason", "replaced"}});
  }
  if (opponent) {
    StartMatch(*opponent, entry);
    return;
  }

  observability_->Info("queue_joined", {{"identity", command.identity},
                                        {"queueClass", std::string(ToString(command.queue_class))},
                                        {"rating", record.rating}});
  sink_->SendEvent(connection_id, event::kSearching,
                   MakeSearchingPayload(command.queue_class, record.rating, estimated_wait));
}

void ArenaService::HandleLeave(ConnectionId connection_id) {
  std::lock_guard<std::mutex> lock(pairing_mutex_);
  if (!queue_->Dequeue(connection_id)) {
    return;
  }
  observability_->Info("queue_left", {{"connectionId", connection_id}});
  sink_->SendEvent(connection_id, event::kQueueLeft, nlohmann::json::object());
}

void ArenaService::HandlePaddle(ConnectionId connection_id, const UpdatePaddle& command) {
  // 참가자가 아니면 조용히 버린다.
  coordinator_->ApplyPaddleInput(command.match_id, connection_id, command.paddle_y);
}

void ArenaService::HandleCancel(ConnectionId connection_id, const CancelMatch& command) {
  if (!coordinator_->SlotOf(command.match_id, connection_id)) {
    sink_->SendError(connection_id, "not_authorized", "이 매치를 취소할 권한이 없습니다");
    return;
  }
  auto view = coordinator_->Cancel(command.match_id);
  if (!view) {
    return;
  }
  auto payload = MakeMatchCancelledPayload(view->id, kCancelReason);
  sink_->SendEvent(view->player1.connection_id, event::kMatchCancelled, payload);
  if (view->player2) {
    sink_->SendEvent(view->player2->connection_id, event::kMatchCancelled, payload);
  }
}

void ArenaService::HandleGetRating(ConnectionId connection_id, const GetRating& command) {
  auto record = ratings_->Resolve(command.identity);
  sink_->SendEvent(connection_id, event::kPlayerRating,
                   MakePlayerRatingPayload(command.identity, record, ratings_->Engine()));
}

void ArenaService::HandleDisconnect(ConnectionId connection_id) {
  rate_limiter_.Forget(connection_id);
  // 페어링과 같은 락 아래에서 처리하므로 대기열에서 꺼낸 항목은 이미 매치에 색인되어 있다.
  std::lock_guard<std::mutex> lock(pairing_mutex_);
  if (queue_->Dequeue(connection_id)) {
    observability_->Info("queue_left", {{"connectionId", connection_id}, {"reason", "disconnect"}});
  }

  auto resolution = coordinator_->ResolveDisconnect(connection_id);
  if (!resolution || !resolution->forfeit || !resolution->remaining) {
    return;
  }
  const auto& result = *resolution->forfeit;
  auto remaining_id = resolution->remaining->connection_id;
  Slot remaining_slot =
      result.player1.player.connection_id == remaining_id ? Slot::kPlayer1 : Slot::kPlayer2;
  sink_->SendEvent(remaining_id, event::kOpponentDisconnected, MakeOpponentDisconnectedPayload(result.match_id));
  sink_->SendEvent(remaining_id, event::kMatchEnded, MakeMatchEndedPayload(result, remaining_slot));
}

void ArenaService::Sweep(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(pairing_mutex_);
  for (const auto& expired : queue_->Expire(now)) {
    observability_->Info("queue_timeout", {{"identity", expired.identity},
                                           {"queueClass", std::string(ToString(expired.queue_class))}});
    sink_->SendEvent(expired.connection_id, event::kQueueTimeout,
                     {{"queueClass", std::string(ToString(expired.queue_class))}});
  }
  for (const auto& pairing : queue_->PairWaiting(now)) {
    StartMatch(pairing.waiting, pairing.joined);
  }
}

void ArenaService::StartMatch(const QueueEntry& waiting, const QueueEntry& joined) {
  auto match_id = NewMatchId();
  PlayerHandle player1{waiting.connection_id, waiting.identity, waiting.rating, waiting.cosmetics};
  PlayerHandle player2{joined.connection_id, joined.identity, joined.rating, joined.cosmetics};

  if (!coordinator_->CreateWaitingMatch(match_id, waiting.queue_class, player1) ||
      !coordinator_->JoinMatch(match_id, player2)) {
    observability_->Error("match_create_failed", {{"matchId", match_id}});
    coordinator_->Cancel(match_id);
    return;
  }

  observability_->Info("match_found", {{"matchId", match_id},
                                       {"queueClass", std::string(ToString(waiting.queue_class))},
                                       {"player1", player1.identity},
                                       {"player1Rating", player1.rating},
                                       {"player2", player2.identity},
                                       {"player2Rating", player2.rating}});
  sink_->SendEvent(player1.connection_id, event::kMatchFound,
                   MakeMatchFoundPayload(match_id, Slot::kPlayer1, waiting.queue_class, player2));
  sink_->SendEvent(player2.connection_id, event::kMatchFound,
                   MakeMatchFoundPayload(match_id, Slot::kPlayer2, waiting.queue_class, player1));

  std::weak_ptr<ArenaService> weak = shared_from_this();
  coordinator_->StartSimulation(
      match_id,
      [weak, first = player1.connection_id, second = player2.connection_id](const std::string&,
                                                                               const StateDelta& delta) {
        if (auto self = weak.lock()) {
          self->BroadcastDelta(first, second, delta);
        }
      },
      [weak](const MatchResult& result) {
        if (auto self = weak.lock()) {
          self->BroadcastEnded(result);
        }
      },
      config_.match_start_delay);
}

void ArenaService::BroadcastDelta(ConnectionId player1, ConnectionId player2, const StateDelta& delta) {
  if (delta.Empty()) {
    return;
  }
  auto payload = ToJson(delta);
  sink_->SendEvent(player1, event::kGameStateUpdate, payload);
  sink_->SendEvent(player2, event::kGameStateUpdate, payload);
}

void ArenaService::BroadcastEnded(const MatchResult& result) {
  sink_->SendEvent(result.player1.player.connection_id, event::kMatchEnded,
                   MakeMatchEndedPayload(result, Slot::kPlayer1));
  sink_->SendEvent(result.player2.player.connection_id, event::kMatchEnded,
                   MakeMatchEndedPayload(result, Slot::kPlayer2));
}

void ArenaService::ScheduleSweep() {
  if (!running_) {
    return;
  }
  sweep_timer_.expires_after(config_.sweep_interval);
  auto self = shared_from_this();
  sweep_timer_.async_wait(boost::asio::bind_executor(sweep_strand_, [self](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    self->Sweep(Clock::now());
    self->ScheduleSweep();
  }));
}

std::string ArenaService::NewMatchId() {
  // random_generator는 스레드 안전하지 않으므로 호출마다 만든다.
  boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

}  // namespace arena
