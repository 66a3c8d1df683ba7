/*
 * 설명: 서버 컴포넌트를 조립하고 리스닝/워커 스레드 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#include "arena/app.hpp"

#include <algorithm>
#include <chrono>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "arena/http_session.hpp"
#include "arena/mariadb_repository.hpp"

namespace arena {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<ArenaService> arena, std::shared_ptr<RealtimeCoordinator> realtime,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), arena_(std::move(arena)),
        realtime_(std::move(realtime)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->arena_, self->realtime_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<ArenaService> arena_;
  std::shared_ptr<RealtimeCoordinator> realtime_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<MatchRepository> repository,
                     std::shared_ptr<SettlementService> settlement)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)),
      repository_(std::move(repository)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  if (!repository_ && config.db_enabled) {
    repository_ = std::make_shared<MariaDbMatchRepository>(std::make_shared<MariaDbClient>(ToDbConfig(config)));
  }
  publisher_ = std::make_shared<OutcomePublisher>(repository_, std::move(settlement), observability_);
  ratings_ = std::make_shared<RatingLedger>(RatingEngine(ToRatingConfig(config)), repository_, observability_);
  queue_ = std::make_shared<MatchmakingQueue>(ToQueueConfig(config));
  coordinator_ =
      std::make_shared<MatchLifecycleCoordinator>(ioc_, CoordinatorConfig{}, ratings_, publisher_, observability_);
  realtime_ = std::make_shared<RealtimeCoordinator>(observability_);
  arena_ = std::make_shared<ArenaService>(ioc_, ToArenaConfig(config), queue_, coordinator_, ratings_, realtime_,
                                          observability_);
}

ServerApp::~ServerApp() {
  Stop();
  publisher_->Drain();
}

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, arena_, realtime_, observability_);
    listener_->Run();
    arena_->Start();
    observability_->Info("server_started", {{"port", config_.port}, {"dbEnabled", config_.db_enabled}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Error("server_failed", {{"error", ex.what()}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  arena_->Stop();
  coordinator_->Shutdown();
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  observability_->Info("server_stopped");
}

}  // namespace arena
