/*
 * 설명: HTTP 요청을 헬스/도구 목록/도구 호출/메트릭으로 분기하고 응답을 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/tool_flow_test.cpp
 */
#include "arbiter/http_session.hpp"

#include <chrono>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "arbiter/api_response.hpp"
#include "arbiter/db_client.hpp"

namespace arbiter {

namespace {
constexpr std::string_view kToolPrefix = "/api/tools/";
}  // namespace

boost::beast::http::status StatusForErrorCode(std::string_view code) {
  using boost::beast::http::status;
  if (code == "not_found" || code == "unknown_tool") {
    return status::not_found;
  }
  if (code == "illegal_state") {
    return status::conflict;
  }
  if (code == "invalid_move") {
    return status::unprocessable_entity;
  }
  if (code == "capacity_exceeded") {
    return status::too_many_requests;
  }
  if (code == "bad_request" || code == "invalid_argument") {
    return status::bad_request;
  }
  if (code == "storage_error") {
    return status::service_unavailable;
  }
  return status::internal_server_error;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<SessionManager> session_manager,
                         std::shared_ptr<ToolService> tool_service, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)),
      session_manager_(std::move(session_manager)),
      tool_service_(std::move(tool_service)),
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
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "arbiter");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    bool storage_ok = false;
    try {
      storage_ok = session_manager_->HealthCheck();
    } catch (const DbException& ex) {
      LogContext ctx{trace_id_, "health.storage", 0, LogLevel::kWarn};
      ctx.error_code = "storage_error";
      ctx.message = ex.what();
      observability_->Log(ctx);
    }
    nlohmann::json payload{{"status", storage_ok ? "ok" : "degraded"},
                           {"storage", storage_ok},
                           {"maxActiveMatches", session_manager_->MaxActiveMatches()},
                           {"version", "v1.0.0"}};
    return Reply(res, storage_ok ? http::status::ok : http::status::service_unavailable,
                 MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    std::uint64_t active = 0;
    std::uint64_t total = 0;
    try {
      active = session_manager_->CountActive();
      total = session_manager_->ListAll().size();
    } catch (const DbException& ex) {
      return Reply(res, http::status::service_unavailable,
                   MakeErrorEnvelope("storage_error", ex.what(), {{"dbCode", ex.code}, {"retryable", ex.retryable}}));
    }
    auto snapshot = observability_->Snapshot(active, total);
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"matches", {{"active", snapshot.active_matches}, {"total", snapshot.total_matches}}}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/api/tools") {
    return Reply(res, http::status::ok, MakeSuccessEnvelope({{"tools", tool_service_->Catalog()}}));
  }

  if (req_.method() == http::verb::post && path.compare(0, kToolPrefix.size(), kToolPrefix) == 0 &&
      path.size() > kToolPrefix.size()) {
    return HandleToolCall(path.substr(kToolPrefix.size()), res);
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleToolCall(const std::string& tool_name, std::shared_ptr<Response> res) {
  nlohmann::json params = nlohmann::json::object();
  if (!req_.body().empty()) {
    params = nlohmann::json::parse(req_.body(), nullptr, false);
    if (params.is_discarded()) {
      return Reply(res, boost::beast::http::status::bad_request,
                   MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
    }
  }
  ToolResponse response = tool_service_->Execute(tool_name, params);
  auto status = response.success ? boost::beast::http::status::ok : StatusForErrorCode(response.error_code);
  Reply(res, status, response.envelope);
}

void HttpSession::Reply(std::shared_ptr<Response> res, boost::beast::http::status status,
                        const nlohmann::json& envelope) {
  res->result(status);
  res->body() = envelope.dump();
  res->content_length(res->body().size());
  SendResponse(std::move(res));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = std::string(req_.method_string()) + " " + std::string(req_.target());
    ctx.latency_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
            .count());
    ctx.level = LogLevel::kDebug;
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace arbiter
