/*
 * 설명: 연결 ID별 WebSocket 세션을 관리하고 서버 이벤트 전달(EventSink)을 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "arena/events.hpp"
#include "arena/observability.hpp"

namespace arena {

class WebSocketSession;

class RealtimeCoordinator : public EventSink, public std::enable_shared_from_this<RealtimeCoordinator> {
 public:
  explicit RealtimeCoordinator(std::shared_ptr<Observability> observability);

  void Register(ConnectionId connection_id, const std::shared_ptr<WebSocketSession>& session);
  void Unregister(ConnectionId connection_id, const WebSocketSession* session);
  void SendEvent(ConnectionId connection_id, const std::string& event, const nlohmann::json& payload) override;
  void SendError(ConnectionId connection_id, const std::string& code, const std::string& message) override;
  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<WebSocketSession> session;
    const WebSocketSession* raw{nullptr};
  };

  std::shared_ptr<WebSocketSession> Lookup(ConnectionId connection_id) const;

  std::unordered_map<ConnectionId, Entry> connections_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace arena
