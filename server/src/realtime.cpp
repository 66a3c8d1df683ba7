/*
 * 설명: 연결 ID별 WebSocket 세션 등록/해제와 이벤트 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#include "arena/realtime.hpp"

#include "arena/websocket_session.hpp"

namespace arena {

RealtimeCoordinator::RealtimeCoordinator(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

void RealtimeCoordinator::Register(ConnectionId connection_id, const std::shared_ptr<WebSocketSession>& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[connection_id] = Entry{session, session.get()};
  observability_->SetWebsocketActive(connections_.size());
}

void RealtimeCoordinator::Unregister(ConnectionId connection_id, const WebSocketSession* session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return;
  }
  if (it->second.raw == session) {
    connections_.erase(it);
    observability_->SetWebsocketActive(connections_.size());
  }
}

std::shared_ptr<WebSocketSession> RealtimeCoordinator::Lookup(ConnectionId connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second.session.lock();
}

void RealtimeCoordinator::SendEvent(ConnectionId connection_id, const std::string& event,
                                    const nlohmann::json& payload) {
  // 끊긴 연결로의 전송은 버린다.
  if (auto session = Lookup(connection_id)) {
    session->SendServerEvent(event, payload);
  }
}

void RealtimeCoordinator::SendError(ConnectionId connection_id, const std::string& code, const std::string& message) {
  if (auto session = Lookup(connection_id)) {
    session->SendServerError(code, message);
  }
}

std::size_t RealtimeCoordinator::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

}  // namespace arena
