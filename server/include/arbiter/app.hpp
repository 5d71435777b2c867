/*
 * 설명: 저장소/세션 관리자/도구 서비스를 조립하고 HTTP 리스너 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/tool_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "arbiter/config.hpp"
#include "arbiter/match_store.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/session_manager.hpp"
#include "arbiter/tool_service.hpp"

namespace arbiter {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  // 저장소를 주입한다. 테스트에서 메모리 저장소를 쓰기 위한 경로다.
  ServerApp(const AppConfig& config, std::shared_ptr<MatchStore> store);
  ~ServerApp();

  // 리스너를 바인딩하고 워커 스레드를 띄운 뒤 실제 포트를 반환한다. config.port가 0이면 임의 포트.
  unsigned short Start();
  // 현재 스레드도 io_context 실행에 참여한다. Stop 또는 시그널까지 반환하지 않는다.
  void Serve();
  // Start + Serve. SIGINT/SIGTERM을 받으면 정리 후 반환한다.
  void Run();
  void Stop();

  unsigned short BoundPort() const { return bound_port_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionManager> GetSessionManager() { return session_manager_; }
  std::shared_ptr<ToolService> GetToolService() { return tool_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void Assemble(std::shared_ptr<MatchStore> store);
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MatchStore> store_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<ToolService> tool_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  unsigned short bound_port_{0};
};

}  // namespace arbiter
