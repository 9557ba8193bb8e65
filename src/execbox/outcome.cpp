#include "execbox/outcome.h"

#include <nlohmann/json.hpp>

namespace {

const char* kOutcomeKindNameTable[] = {
#define X(name, status, desc) desc,
  ENUM_OUTCOME_KIND_
#undef X
};

const int kOutcomeStatusTable[] = {
#define X(name, status, desc) status,
  ENUM_OUTCOME_KIND_
#undef X
};

nlohmann::json NullIfEmpty(const std::string& str) {
  if (str.empty()) return nullptr;
  return str;
}

} // namespace

const char* OutcomeKindName(OutcomeKind kind) {
  return kOutcomeKindNameTable[(int)kind];
}

int HttpStatus(const ExecutionOutcome& outcome) {
  return kOutcomeStatusTable[(int)KindOf(outcome)];
}

nlohmann::json OutcomeToJSON(const ExecutionOutcome& outcome) {
  using nlohmann::json;
  switch (KindOf(outcome)) {
    case OutcomeKind::SUCCESS: {
      auto& res = std::get<Success>(outcome);
      return json{{"success", true}, {"output", res.output}, {"stderr", NullIfEmpty(res.error_output)}};
    }
    case OutcomeKind::RUNTIME_FAILURE: {
      auto& res = std::get<RuntimeFailure>(outcome);
      return json{
        {"success", false},
        {"error", res.message},
        {"traceback", res.traceback},
        {"output", res.output},
        {"stderr", res.error_output},
      };
    }
    case OutcomeKind::POLICY_REJECTED:
      return json{{"error", std::get<PolicyRejected>(outcome).reason}};
    case OutcomeKind::INPUT_INVALID:
      return json{{"error", std::get<InputInvalid>(outcome).reason}};
    case OutcomeKind::SERVER_FAULT:
      return json{{"success", false}, {"error", "Server error: " + std::get<ServerFault>(outcome).message}};
  }
  __builtin_unreachable();
}
