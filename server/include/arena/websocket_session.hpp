/*
 * 설명: WebSocket 연결의 메시지 파싱/명령 전달, 송신 큐 백프레셔, 종료 시 이탈 처리를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "arena/api_response.hpp"
#include "arena/arena_service.hpp"
#include "arena/observability.hpp"
#include "arena/realtime.hpp"

namespace arena {

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, ConnectionId connection_id,
                   std::shared_ptr<ArenaService> arena, std::shared_ptr<RealtimeCoordinator> coordinator,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession();
  void Run();

  // 어느 스레드에서든 호출할 수 있다. 실제 송신은 스트림 strand에서 수행한다.
  void SendServerEvent(const std::string& event, const nlohmann::json& payload);
  void SendServerError(const std::string& code, const std::string& message);

  ConnectionId Id() const { return connection_id_; }

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleMessage(const std::string& data);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void NotifyDisconnect();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  ConnectionId connection_id_;
  std::shared_ptr<ArenaService> arena_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool disconnected_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace arena
