#include "server_io.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "http_utils.h"
#include "execbox/engine.h"

std::string kHost = "0.0.0.0";
int kPort = 5000;
int kMaxParallel = 4;

namespace {

const char kJSONType[] = "application/json";

void SendJSON(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  // responses are ASCII-escaped
  res.set_content(body.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace), kJSONType);
}

ExecutionOutcome DecodeAndExecute(const std::string& body) {
  using nlohmann::json;
  ExecutionRequest request;
  try {
    json data = json::parse(body);
    if (!data.is_object()) return ServerFault{"request body must be a JSON object"};
    request.code = data.value("code", std::string());
  } catch (json::exception& err) {
    spdlog::warn("Request decoding error: {}", err.what());
    return ServerFault{err.what()};
  }
  return Execute(request);
}

} // namespace

void SetupRoutes(httplib::Server& server) {
  using namespace httplib;
  server.set_default_headers({{"Access-Control-Allow-Origin", "*"}});
  server.set_logger(http_utils::LogRequest);

  server.Options(R"(/api/.*)", [](const Request&, Response& res) {
    res.status = 204;
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
  });
  server.Get("/api/health", [](const Request&, Response& res) {
    SendJSON(res, 200, {{"status", "healthy"}, {"message", "Python executor is running"}});
  });
  server.Post("/api/execute-python", [](const Request& req, Response& res) {
    ExecutionOutcome outcome = DecodeAndExecute(req.body);
    SendJSON(res, HttpStatus(outcome), OutcomeToJSON(outcome));
  });
}

bool ServerWorkLoop() {
  httplib::Server server;
  server.new_task_queue = [] { return new httplib::ThreadPool(kMaxParallel); };
  SetupRoutes(server);
  spdlog::info("Listening on {}:{} with {} workers", kHost, kPort, kMaxParallel);
  if (!server.listen(kHost, kPort)) {
    spdlog::error("Failed to listen on {}:{}", kHost, kPort);
    return false;
  }
  return true;
}
