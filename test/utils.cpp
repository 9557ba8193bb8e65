#include "utils.h"

ExecutionOutcome RunCode(const std::string& code, const ExecutionLimits& limits) {
  ExecutionRequest request;
  request.code = code;
  return Execute(request, limits);
}

std::string OutputOf(const std::string& code) {
  ExecutionOutcome outcome = RunCode(code);
  if (auto success = std::get_if<Success>(&outcome)) return success->output;
  if (auto failure = std::get_if<RuntimeFailure>(&outcome)) {
    ADD_FAILURE() << "unexpected failure:\n" << failure->traceback;
  } else {
    ADD_FAILURE() << "unexpected outcome " << OutcomeKindName(KindOf(outcome));
  }
  return "";
}

RuntimeFailure FailureOf(const std::string& code, const ExecutionLimits& limits) {
  ExecutionOutcome outcome = RunCode(code, limits);
  if (auto failure = std::get_if<RuntimeFailure>(&outcome)) return *failure;
  ADD_FAILURE() << "expected a runtime failure, got " << OutcomeKindName(KindOf(outcome));
  return RuntimeFailure{};
}

std::string LastLine(const RuntimeFailure& failure) {
  std::string trace = failure.traceback;
  while (!trace.empty() && trace.back() == '\n') trace.pop_back();
  size_t pos = trace.rfind('\n');
  return pos == std::string::npos ? trace : trace.substr(pos + 1);
}
