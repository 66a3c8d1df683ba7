/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행하고 종료 시그널을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#include <boost/asio/signal_set.hpp>

#include "arena/app.hpp"

int main() {
  using namespace arena;
  AppConfig config = LoadConfigFromEnv();
  ServerApp app(config);

  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int) {
    if (!ec) {
      app.GetObservability()->Info("shutdown_signal");
      // 워커 스레드에서 호출될 수 있으므로 여기서는 루프만 멈추고 정리는 Run 이후에 한다.
      app.GetContext().stop();
    }
  });

  app.Run();
  app.Stop();
  return 0;
}
