/*
 * 설명: HTTP 요청을 처리하고 상태/플레이어/메트릭 조회와 WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#include "arena/http_session.hpp"

#include <boost/beast/http.hpp>

#include "arena/api_response.hpp"
#include "arena/client_command.hpp"
#include "arena/events.hpp"
#include "arena/websocket_session.hpp"

namespace arena {

namespace {
constexpr const char* kServerName = "arena-server";
constexpr const char* kPlayerPrefix = "/api/player/";

nlohmann::json StatsToJson(const std::vector<QueueClassStats>& stats) {
  nlohmann::json queues = nlohmann::json::object();
  for (const auto& entry : stats) {
    nlohmann::json item{{"players", entry.players}};
    if (entry.average_rating) {
      item["averageRating"] = *entry.average_rating;
    }
    queues[std::string(ToString(entry.queue_class))] = item;
  }
  return queues;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<ArenaService> arena, std::shared_ptr<RealtimeCoordinator> coordinator,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), arena_(std::move(arena)), coordinator_(std::move(coordinator)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) { self->OnRead(ec, bytes_transferred); });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() != http::verb::get) {
    return Reply(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }

  if (path == "/api/health") {
    auto queue = arena_->Queue();
    nlohmann::json payload{{"status", "ok"},
                           {"version", "v1.0.0"},
                           {"activeMatches", arena_->Coordinator()->ActiveMatchCount()},
                           {"queues", StatsToJson(queue->Stats())}};
    return Reply(http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (path == "/metrics") {
    auto snapshot = observability_->Snapshot(arena_->Coordinator()->ActiveMatchCount(), arena_->Queue()->Size());
    return Reply(http::status::ok, MakeSuccessEnvelope(ToJson(snapshot)));
  }

  if (path.rfind(kPlayerPrefix, 0) == 0) {
    auto identity = path.substr(std::string(kPlayerPrefix).size());
    if (!IsValidIdentity(identity)) {
      return Reply(http::status::bad_request, MakeErrorEnvelope("invalid_identity", "식별자 형식이 올바르지 않습니다"));
    }
    auto record = arena_->LookupRating(identity);
    return Reply(http::status::ok, MakeSuccessEnvelope(MakePlayerRatingPayload(identity, record, arena_->Engine())));
  }

  Reply(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::Reply(boost::beast::http::status status, const nlohmann::json& body) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Debug("http_request", {{"path", std::string(req_.target())},
                                         {"status", res->result_int()},
                                         {"latencyMs", latency}});
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  std::string target_str = std::string(req_.target());
  if (target_str.substr(0, target_str.find('?')) != "/ws") {
    request_start_ = std::chrono::steady_clock::now();
    return Reply(boost::beast::http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  // async_accept 전에 stream 타임아웃을 해제하고 WS 권장 타임아웃을 쓴다.
  boost::beast::get_lowest_layer(ws).expires_never();
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), arena_->NextConnectionId(), arena_, coordinator_,
                                       observability_, config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const boost::beast::system_error& ex) {
    observability_->Warn("ws_accept_failed", {{"error", ex.what()}});
  }
}

}  // namespace arena
