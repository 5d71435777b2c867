/*
 * 설명: 서버 수명주기, 저장소 선택, 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/tool_flow_test.cpp
 */
#include "arbiter/app.hpp"

#include <algorithm>
#include <csignal>
#include <iostream>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "arbiter/db_client.hpp"
#include "arbiter/http_session.hpp"
#include "arbiter/mariadb_match_store.hpp"
#include "arbiter/memory_match_store.hpp"

namespace arbiter {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<SessionManager> session_manager, std::shared_ptr<ToolService> tool_service,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), session_manager_(std::move(session_manager)),
        tool_service_(std::move(tool_service)), observability_(std::move(observability)) {
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
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const { return acceptor_.local_endpoint().port(); }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->session_manager_, self->tool_service_,
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
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<ToolService> tool_service_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(config.log_level);
  std::shared_ptr<MatchStore> store;
  if (config.storage_backend == StorageBackend::kMariaDb) {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    auto db_client = std::make_shared<MariaDbClient>(db_config);
    auto mariadb_store = std::make_shared<MariaDbMatchStore>(db_client, observability_);
    mariadb_store->EnsureSchema();
    store = mariadb_store;
  } else {
    store = std::make_shared<MemoryMatchStore>();
  }
  Assemble(std::move(store));
}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<MatchStore> store)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(config.log_level);
  Assemble(std::move(store));
}

void ServerApp::Assemble(std::shared_ptr<MatchStore> store) {
  store_ = std::move(store);
  session_manager_ = std::make_shared<SessionManager>(store_, config_.max_active_matches, observability_);
  tool_service_ = std::make_shared<ToolService>(session_manager_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

unsigned short ServerApp::Start() {
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, session_manager_, tool_service_, observability_);
  bound_port_ = listener_->Port();
  listener_->Run();
  running_ = true;
  RunWorkers();

  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = "server.started";
  ctx.message = "서버 시작: 포트 " + std::to_string(bound_port_);
  observability_->Log(ctx);
  return bound_port_;
}

void ServerApp::Serve() { ioc_.run(); }

void ServerApp::Run() {
  try {
    Start();
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::beast::error_code& ec, int /*signal*/) {
      if (ec) {
        return;
      }
      listener_->Stop();
      ioc_.stop();
    });
    Serve();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
  Stop();
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  for (unsigned int i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
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
  workers_.clear();
  session_manager_->Close();
}

}  // namespace arbiter
