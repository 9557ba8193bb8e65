#include <thread>
#include <chrono>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "http_utils.h"
#include "server_io.h"

using nlohmann::json;

class ServerIOTest : public testing::Test {
 protected:
  httplib::Server server;
  std::thread thread;
  int port;

  void SetUp() override {
    SetupRoutes(server);
    port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    thread = std::thread([this] { server.listen_after_bind(); });
    for (int i = 0; i < 200 && !server.is_running(); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(server.is_running());
  }
  void TearDown() override {
    server.stop();
    if (thread.joinable()) thread.join();
  }

  httplib::Result Get(const std::string& path) {
    httplib::Client cli("127.0.0.1", port);
    return HTTPRequest<HTTPGet>(cli, path);
  }
  httplib::Result Execute(const std::string& body) {
    httplib::Client cli("127.0.0.1", port);
    return HTTPRequest<HTTPPost>(cli, "/api/execute-python", body, "application/json");
  }
};

TEST_F(ServerIOTest, Health) {
  auto res = Get("/api/health");
  ASSERT_TRUE(IsSuccess(res));
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
  EXPECT_EQ(json::parse(res->body), json({{"status", "healthy"}, {"message", "Python executor is running"}}));
}

TEST_F(ServerIOTest, Preflight) {
  httplib::Client cli("127.0.0.1", port);
  auto res = HTTPRequest<HTTPOptions>(cli, "/api/execute-python");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Headers"), "Content-Type");
}

TEST_F(ServerIOTest, Success) {
  auto res = Execute(R"({"code": "print('hi')"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
  EXPECT_EQ(json::parse(res->body), json::parse(R"({"success": true, "output": "hi\n", "stderr": null})"));
}

TEST_F(ServerIOTest, ResponsesAreAsciiEscaped) {
  auto res = Execute(R"({"code": "print('é')"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_NE(res->body.find("\\u00e9"), std::string::npos) << res->body;
  EXPECT_EQ(json::parse(res->body)["output"], "\xc3\xa9\n");
}

TEST_F(ServerIOTest, Rejections) {
  auto res = Execute(R"({"code": "import subprocess"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body), json({{"error", "Import of subprocess is not allowed for security reasons"}}));
  for (const char* body : {R"({"code": ""})", R"({})", R"({"code": "   "})"}) {
    res = Execute(body);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400) << body;
    EXPECT_EQ(json::parse(res->body), json({{"error", "No code provided"}})) << body;
  }
}

TEST_F(ServerIOTest, RuntimeFailure) {
  auto res = Execute(R"({"code": "print('a')\nprint(1/0)"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  json body = json::parse(res->body);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["error"], "division by zero");
  EXPECT_EQ(body["output"], "a\n");
  EXPECT_EQ(body["stderr"], "");
  EXPECT_NE(body["traceback"].get<std::string>().find("ZeroDivisionError: division by zero"), std::string::npos);
}

TEST_F(ServerIOTest, MalformedRequests) {
  for (const char* body : {"not json", "[1, 2]", R"({"code": 5})", R"({"code": null})"}) {
    auto res = Execute(body);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500) << body;
    json ret = json::parse(res->body);
    EXPECT_EQ(ret["success"], false) << body;
    EXPECT_EQ(ret["error"].get<std::string>().rfind("Server error: ", 0), 0u) << body;
  }
}

TEST_F(ServerIOTest, UnknownRoute) {
  auto res = Get("/api/nothing");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_FALSE(http_utils::IsSuccess(res->status));
}
