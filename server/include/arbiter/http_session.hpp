/*
 * 설명: HTTP 연결을 처리하고 헬스/도구 목록/도구 호출/메트릭 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/tool_flow_test.cpp, server/tests/unit/tool_service_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "arbiter/observability.hpp"
#include "arbiter/session_manager.hpp"
#include "arbiter/tool_service.hpp"

namespace arbiter {

// 엔벨로프 오류 코드를 HTTP 상태로 변환한다.
boost::beast::http::status StatusForErrorCode(std::string_view code);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<SessionManager> session_manager,
              std::shared_ptr<ToolService> tool_service, std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleToolCall(const std::string& tool_name, std::shared_ptr<Response> res);
  void Reply(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& envelope);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<ToolService> tool_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace arbiter
