/*
 * 설명: WebSocket 메시지를 읽어 클라이언트 명령으로 전달하고 서버 이벤트를 백프레셔 한도 안에서 송신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#include "arena/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "arena/client_command.hpp"

namespace arena {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   ConnectionId connection_id, std::shared_ptr<ArenaService> arena,
                                   std::shared_ptr<RealtimeCoordinator> coordinator,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), connection_id_(connection_id), arena_(std::move(arena)),
      coordinator_(std::move(coordinator)), observability_(std::move(observability)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() {
  coordinator_->Unregister(connection_id_, this);
  NotifyDisconnect();
}

void WebSocketSession::Run() {
  coordinator_->Register(connection_id_, shared_from_this());
  observability_->Debug("ws_connected", {{"connectionId", connection_id_}});
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    // 정상 종료든 오류든 연결 이탈로 처리한다.
    closing_ = true;
    coordinator_->Unregister(connection_id_, this);
    NotifyDisconnect();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  HandleMessage(data);

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::HandleMessage(const std::string& data) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(data);
  } catch (const nlohmann::json::parse_error&) {
    SendError("bad_request", "JSON 파싱 오류", 0);
    return;
  }

  std::uint64_t seq = 0;
  if (message.is_object()) {
    auto seq_it = message.find("seq");
    if (seq_it != message.end() && seq_it->is_number_unsigned()) {
      seq = seq_it->get<std::uint64_t>();
    }
  }

  std::string error_code;
  std::string error_message;
  auto command = ParseClientCommand(message, error_code, error_message);
  if (!command) {
    if (!error_code.empty()) {
      SendError(error_code, error_message, seq);
    }
    return;
  }
  arena_->Dispatch(connection_id_, *command);
}

void WebSocketSession::NotifyDisconnect() {
  if (disconnected_) {
    return;
  }
  disconnected_ = true;
  observability_->Debug("ws_disconnected", {{"connectionId", connection_id_}});
  arena_->Dispatch(connection_id_, Disconnect{});
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  EnqueueMessage(ToWsJson(MakeErrorFrame(code, message, seq)).dump());
}

void WebSocketSession::SendServerEvent(const std::string& event, const nlohmann::json& payload) {
  auto text = ToWsJson(MakeEventEnvelope(event, payload)).dump();
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), text = std::move(text)]() mutable {
                      self->EnqueueMessage(std::move(text));
                    });
}

void WebSocketSession::SendServerError(const std::string& code, const std::string& message) {
  auto text = ToWsJson(MakeErrorFrame(code, message)).dump();
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), text = std::move(text)]() mutable {
                      self->EnqueueMessage(std::move(text));
                    });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  if (ec) {
    closing_ = true;
    return;
  }
  writing_ = false;
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  observability_->Warn("ws_backpressure_close", {{"connectionId", connection_id_}});
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

}  // namespace arena
