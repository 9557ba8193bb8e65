#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <gtest/gtest.h>
#include <execbox/engine.h>

// Runs the whole pipeline with the default limits unless given.
ExecutionOutcome RunCode(const std::string& code, const ExecutionLimits& limits = ExecutionLimits());

// stdout of a snippet expected to succeed; records a failure otherwise
std::string OutputOf(const std::string& code);

// the failure of a snippet expected to raise; records a failure otherwise
RuntimeFailure FailureOf(const std::string& code, const ExecutionLimits& limits = ExecutionLimits());

// "<Type>: <message>", the last line of the traceback
std::string LastLine(const RuntimeFailure& failure);

#define EXPECT_OUTPUT(code, expected) EXPECT_EQ(OutputOf(code), expected) << "code: " << code
#define EXPECT_RAISES(code, expected) EXPECT_EQ(LastLine(FailureOf(code)), expected) << "code: " << code

#endif // TEST_UTILS_H_
