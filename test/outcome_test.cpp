#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <execbox/outcome.h>

using nlohmann::json;

TEST(OutcomeTest, Success) {
  ExecutionOutcome outcome = Success{"hi\n", ""};
  EXPECT_EQ(KindOf(outcome), OutcomeKind::SUCCESS);
  EXPECT_EQ(HttpStatus(outcome), 200);
  EXPECT_EQ(OutcomeToJSON(outcome), json::parse(R"({"success": true, "output": "hi\n", "stderr": null})"));
  outcome = Success{"", "warn\n"};
  EXPECT_EQ(OutcomeToJSON(outcome)["stderr"], "warn\n");
}

TEST(OutcomeTest, RuntimeFailure) {
  ExecutionOutcome outcome = RuntimeFailure{"division by zero", "Traceback\n", "partial", ""};
  EXPECT_EQ(HttpStatus(outcome), 500);
  json body = OutcomeToJSON(outcome);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["error"], "division by zero");
  EXPECT_EQ(body["traceback"], "Traceback\n");
  EXPECT_EQ(body["output"], "partial");
  EXPECT_EQ(body["stderr"], "");
}

TEST(OutcomeTest, Rejections) {
  ExecutionOutcome outcome = PolicyRejected{"os", "Import of os is not allowed for security reasons"};
  EXPECT_EQ(HttpStatus(outcome), 400);
  EXPECT_EQ(OutcomeToJSON(outcome), json({{"error", "Import of os is not allowed for security reasons"}}));
  outcome = InputInvalid{"No code provided"};
  EXPECT_EQ(HttpStatus(outcome), 400);
  EXPECT_EQ(OutcomeToJSON(outcome), json({{"error", "No code provided"}}));
}

TEST(OutcomeTest, ServerFault) {
  ExecutionOutcome outcome = ServerFault{"out of memory"};
  EXPECT_EQ(HttpStatus(outcome), 500);
  EXPECT_EQ(OutcomeToJSON(outcome), json({{"success", false}, {"error", "Server error: out of memory"}}));
  EXPECT_STREQ(OutcomeKindName(KindOf(outcome)), "Server Fault");
}
