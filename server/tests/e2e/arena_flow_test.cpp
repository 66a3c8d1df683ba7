#include <chrono>
#include <cstdlib>
#include <memory>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arena/app.hpp"

namespace {

constexpr const char* kAlpha = "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v";
constexpr const char* kBravo = "So11111111111111111111111111111111111111112";

unsigned short ResolvePort() {
  const char* env_port = std::getenv("E2E_ARENA_PORT");
  return env_port ? static_cast<unsigned short>(std::stoi(env_port)) : 39001;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectWsEventEnvelope(const nlohmann::json& msg, const std::string& event_name) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["t"], "event");
  ASSERT_TRUE(msg.contains("seq"));
  EXPECT_EQ(msg["event"], event_name);
  ASSERT_TRUE(msg.contains("p"));
  EXPECT_TRUE(msg["p"].is_object());
}

class ArenaFlowFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    arena::AppConfig config;
    config.port = ResolvePort();
    config.log_level = "error";
    config.db_enabled = false;
    // 틱 브로드캐스트가 이벤트 순서를 흐리지 않도록 시작을 늦춘다.
    config.match_start_delay_ms = 60000;
    port_ = config.port;
    app_ = std::make_unique<arena::ServerApp>(config);
    server_thread_ = std::thread([this]() { app_->Run(); });
    WaitForReady();
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
    app_.reset();
  }

  SimpleHttpResponse Get(const std::string& target) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, target, 11};
    req.set(boost::beast::http::field::host, host_);
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  std::unique_ptr<WebSocket> ConnectWs() {
    auto ws = std::make_unique<WebSocket>(ioc_);
    boost::asio::ip::tcp::resolver resolver{ioc_};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    ws->next_layer().connect(results);
    ws->handshake(host_, "/ws");
    return ws;
  }

  void SendEvent(WebSocket& ws, std::uint64_t seq, const std::string& event, const nlohmann::json& payload) {
    nlohmann::json msg{{"t", "event"}, {"seq", seq}, {"event", event}, {"p", payload}};
    ws.write(boost::asio::buffer(msg.dump()));
  }

  nlohmann::json ReadWs(WebSocket& ws, boost::beast::flat_buffer& buffer) {
    buffer.consume(buffer.size());
    ws.read(buffer);
    auto raw = boost::beast::buffers_to_string(buffer.cdata());
    return nlohmann::json::parse(raw);
  }

  void WaitForReady() {
    for (int i = 0; i < 50; ++i) {
      try {
        auto res = Get("/api/health");
        if (res.status == boost::beast::http::status::ok) {
          return;
        }
      } catch (const std::exception&) {
        // 리스너가 아직 열리지 않았다.
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    FAIL() << "server did not become ready";
  }

  std::string host_{"127.0.0.1"};
  unsigned short port_{0};
  std::unique_ptr<arena::ServerApp> app_;
  std::thread server_thread_;
  boost::asio::io_context ioc_;
};

}  // namespace

TEST_F(ArenaFlowFixture, HealthAndPlayerRoutes) {
  auto health = Get("/api/health");
  EXPECT_EQ(health.status, boost::beast::http::status::ok);
  EXPECT_TRUE(health.body["success"].get<bool>());
  EXPECT_EQ(health.body["data"]["status"], "ok");
  EXPECT_EQ(health.body["data"]["activeMatches"], 0);
  EXPECT_TRUE(health.body["data"]["queues"].contains("ranked"));

  auto player = Get(std::string("/api/player/") + kAlpha);
  EXPECT_EQ(player.status, boost::beast::http::status::ok);
  EXPECT_EQ(player.body["data"]["rating"], 1000);
  EXPECT_EQ(player.body["data"]["isPlacement"], true);

  auto invalid = Get("/api/player/not-an-identity");
  EXPECT_EQ(invalid.status, boost::beast::http::status::bad_request);
  EXPECT_EQ(invalid.body["error"]["code"], "invalid_identity");

  auto missing = Get("/api/unknown");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);

  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.status, boost::beast::http::status::ok);
  EXPECT_TRUE(metrics.body["data"].contains("matches"));
}

TEST_F(ArenaFlowFixture, InvalidCommandEchoesSeq) {
  auto ws = ConnectWs();
  boost::beast::flat_buffer buffer;
  SendEvent(*ws, 9, "join_queue", {{"identity", "bad"}, {"queueClass", "ranked"}});
  auto msg = ReadWs(*ws, buffer);
  EXPECT_EQ(msg["t"], "error");
  EXPECT_EQ(msg["seq"], 9);
  EXPECT_EQ(msg["p"]["code"], "invalid_identity");

  ws->write(boost::asio::buffer(std::string("not json")));
  auto bad = ReadWs(*ws, buffer);
  EXPECT_EQ(bad["t"], "error");
  EXPECT_EQ(bad["p"]["code"], "bad_request");
  ws->close(boost::beast::websocket::close_code::normal);
}

TEST_F(ArenaFlowFixture, MatchThenDisconnectForfeits) {
  auto ws_a = ConnectWs();
  auto ws_b = ConnectWs();
  boost::beast::flat_buffer buf_a;
  boost::beast::flat_buffer buf_b;

  SendEvent(*ws_a, 1, "join_queue", {{"identity", kAlpha}, {"queueClass", "unranked"}});
  auto searching = ReadWs(*ws_a, buf_a);
  ExpectWsEventEnvelope(searching, "searching");
  EXPECT_EQ(searching["p"]["queueClass"], "unranked");

  SendEvent(*ws_b, 1, "join_queue",
            {{"identity", kBravo}, {"queueClass", "unranked"}, {"cosmetics", {{"paddle", "neon"}}}});
  auto found_a = ReadWs(*ws_a, buf_a);
  auto found_b = ReadWs(*ws_b, buf_b);
  ExpectWsEventEnvelope(found_a, "match_found");
  ExpectWsEventEnvelope(found_b, "match_found");
  EXPECT_EQ(found_a["p"]["slot"], 1);
  EXPECT_EQ(found_a["p"]["opponent"], kBravo);
  EXPECT_EQ(found_a["p"]["opponentCosmetics"]["paddle"], "neon");
  EXPECT_EQ(found_b["p"]["slot"], 2);
  auto match_id = found_a["p"]["matchId"].get<std::string>();
  EXPECT_EQ(found_b["p"]["matchId"], match_id);

  ws_a->close(boost::beast::websocket::close_code::normal);

  auto disconnected = ReadWs(*ws_b, buf_b);
  ExpectWsEventEnvelope(disconnected, "opponent_disconnected");
  EXPECT_EQ(disconnected["p"]["matchId"], match_id);
  auto ended = ReadWs(*ws_b, buf_b);
  ExpectWsEventEnvelope(ended, "match_ended");
  EXPECT_EQ(ended["p"]["winner"], kBravo);
  EXPECT_EQ(ended["p"]["forfeit"], true);
  EXPECT_EQ(ended["p"]["ratingChange"], 0);

  ws_b->close(boost::beast::websocket::close_code::normal);
}
