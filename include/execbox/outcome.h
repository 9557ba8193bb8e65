#ifndef INCLUDE_EXECBOX_OUTCOME_H_
#define INCLUDE_EXECBOX_OUTCOME_H_

#include <string>
#include <variant>

#include <nlohmann/json_fwd.hpp>

// the order must match the alternatives of ExecutionOutcome
#define ENUM_OUTCOME_KIND_ \
  X(SUCCESS, 200, "Success") \
  X(RUNTIME_FAILURE, 500, "Runtime Failure") \
  X(POLICY_REJECTED, 400, "Policy Rejected") \
  X(INPUT_INVALID, 400, "Input Invalid") \
  X(SERVER_FAULT, 500, "Server Fault")
enum class OutcomeKind {
#define X(name, status, desc) name,
  ENUM_OUTCOME_KIND_
#undef X
};

struct ExecutionRequest {
  std::string code;
};

struct Success {
  std::string output;
  std::string error_output; // reported as null when empty
};

struct RuntimeFailure {
  std::string message; // str() of the exception
  std::string traceback;
  // whatever was written before the fault
  std::string output;
  std::string error_output;
};

struct PolicyRejected {
  std::string module;
  std::string reason;
};

struct InputInvalid {
  std::string reason;
};

struct ServerFault {
  std::string message;
};

using ExecutionOutcome = std::variant<Success, RuntimeFailure, PolicyRejected, InputInvalid, ServerFault>;

inline OutcomeKind KindOf(const ExecutionOutcome& outcome) {
  return (OutcomeKind)outcome.index();
}

const char* OutcomeKindName(OutcomeKind);
int HttpStatus(const ExecutionOutcome&);
// the response body of POST /api/execute-python
nlohmann::json OutcomeToJSON(const ExecutionOutcome&);

#endif  // INCLUDE_EXECBOX_OUTCOME_H_
