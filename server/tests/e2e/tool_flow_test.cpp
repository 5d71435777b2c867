#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arbiter/app.hpp"
#include "arbiter/memory_match_store.hpp"

namespace {

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  ASSERT_TRUE(body.contains("success"));
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
  EXPECT_TRUE(body["meta"]["timestamp"].is_string());
}

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
  EXPECT_TRUE(body["error"]["message"].is_string());
}

class ToolFlowFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    arbiter::AppConfig config;
    config.port = 0;
    config.log_level = arbiter::LogLevel::kError;
    config.max_active_matches = 2;
    app_ = std::make_unique<arbiter::ServerApp>(config, std::make_shared<arbiter::MemoryMatchStore>());
    port_ = app_->Start();
  }

  void TearDown() override { app_->Stop(); }

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target, const std::string& body) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, host_);
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (verb == boost::beast::http::verb::post) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body;
      req.prepare_payload();
    }

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse PostJson(const std::string& target, const nlohmann::json& body) {
    return Send(boost::beast::http::verb::post, target, body.dump());
  }

  SimpleHttpResponse Get(const std::string& target) { return Send(boost::beast::http::verb::get, target, ""); }

  std::string CreateGame(const std::string& white, const std::string& black) {
    auto res = PostJson("/api/tools/create_game", {{"whitePlayerId", white}, {"blackPlayerId", black}});
    EXPECT_EQ(res.status, boost::beast::http::status::ok);
    ExpectSuccessEnvelope(res.body);
    return res.body["data"]["gameId"].get<std::string>();
  }

  std::unique_ptr<arbiter::ServerApp> app_;
  std::string host_{"127.0.0.1"};
  unsigned short port_{0};
};

}  // namespace

TEST_F(ToolFlowFixture, HealthAndToolCatalog) {
  auto health = Get("/api/health");
  EXPECT_EQ(health.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(health.body);
  EXPECT_EQ(health.body["data"]["status"], "ok");
  EXPECT_EQ(health.body["data"]["maxActiveMatches"], 2);

  auto tools = Get("/api/tools");
  EXPECT_EQ(tools.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(tools.body);
  EXPECT_EQ(tools.body["data"]["tools"].size(), 18u);

  auto missing = Get("/api/unknown");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(missing.body, "not_found");
}

TEST_F(ToolFlowFixture, PlayAndResignOverHttp) {
  const std::string id = CreateGame("alice", "bob");

  auto moved = PostJson("/api/tools/make_move", {{"gameId", id}, {"move", "e4"}, {"playerId", "alice"}});
  EXPECT_EQ(moved.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(moved.body);
  EXPECT_EQ(moved.body["data"]["currentTurn"], "black");

  auto reply = PostJson("/api/tools/make_move", {{"gameId", id}, {"move", "c5"}, {"playerId", "bob"}});
  ExpectSuccessEnvelope(reply.body);

  auto resigned = PostJson("/api/tools/resign_game", {{"gameId", id}, {"playerId", "bob"}});
  EXPECT_EQ(resigned.status, boost::beast::http::status::ok);
  EXPECT_EQ(resigned.body["data"]["result"], "1-0");
  EXPECT_EQ(resigned.body["data"]["status"], "completed");

  auto exported = PostJson("/api/tools/export_game", {{"gameId", id}});
  ExpectSuccessEnvelope(exported.body);
  EXPECT_NE(exported.body["data"]["content"].get<std::string>().find("1. e4 c5 1-0"), std::string::npos);
}

TEST_F(ToolFlowFixture, ErrorCodesMapToHttpStatus) {
  const std::string id = CreateGame("alice", "bob");

  auto unknown = PostJson("/api/tools/summon_dragon", nlohmann::json::object());
  EXPECT_EQ(unknown.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(unknown.body, "unknown_tool");

  auto not_found = PostJson("/api/tools/get_game_status", {{"gameId", "missing"}});
  EXPECT_EQ(not_found.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(not_found.body, "not_found");

  auto wrong_turn = PostJson("/api/tools/make_move", {{"gameId", id}, {"move", "e5"}, {"playerId", "bob"}});
  EXPECT_EQ(wrong_turn.status, boost::beast::http::status::conflict);
  ExpectErrorEnvelope(wrong_turn.body, "illegal_state");

  auto illegal = PostJson("/api/tools/make_move", {{"gameId", id}, {"move", "e5"}, {"playerId", "alice"}});
  EXPECT_EQ(illegal.status, boost::beast::http::status::unprocessable_entity);
  ExpectErrorEnvelope(illegal.body, "invalid_move");

  auto bad_json = Send(boost::beast::http::verb::post, "/api/tools/create_game", "{not json");
  EXPECT_EQ(bad_json.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(bad_json.body, "bad_request");

  auto missing_param = PostJson("/api/tools/create_game", {{"whitePlayerId", "carol"}});
  EXPECT_EQ(missing_param.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(missing_param.body, "bad_request");

  CreateGame("carol", "dave");
  auto full = PostJson("/api/tools/create_game", {{"whitePlayerId", "erin"}, {"blackPlayerId", "frank"}});
  EXPECT_EQ(full.status, boost::beast::http::status::too_many_requests);
  ExpectErrorEnvelope(full.body, "capacity_exceeded");
}

TEST_F(ToolFlowFixture, MetricsReflectTraffic) {
  CreateGame("alice", "bob");
  PostJson("/api/tools/get_game_status", {{"gameId", "missing"}});

  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(metrics.body);
  EXPECT_GE(metrics.body["data"]["requests"]["total"].get<std::uint64_t>(), 3u);
  EXPECT_GE(metrics.body["data"]["requests"]["errors"].get<std::uint64_t>(), 1u);
  EXPECT_EQ(metrics.body["data"]["matches"]["active"], 1);
  EXPECT_EQ(metrics.body["data"]["matches"]["total"], 1);
}
