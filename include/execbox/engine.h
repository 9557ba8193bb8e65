#ifndef INCLUDE_EXECBOX_ENGINE_H_
#define INCLUDE_EXECBOX_ENGINE_H_

#include <string>

#include "capture.h"
#include "outcome.h"

// configured defaults of ExecutionLimits
extern long kTimeLimit; // ms; 0 = unlimited
extern long kMaxOutput; // KiB per channel; 0 = unlimited
extern int kMaxDepth; // nested calls
extern long kMaxObjects; // live heap objects per run; 0 = unlimited
extern long kMaxMemory; // MiB of strings, ints and containers per run; 0 = unlimited

struct ExecutionLimits {
  long time_limit; // ms
  size_t max_output; // bytes
  int max_depth;
  size_t max_objects;
  size_t max_memory; // bytes
  size_t max_sequence; // elements of one list/tuple, bytes of one string

  ExecutionLimits();
};

// Parses and runs one snippet against a fresh restricted environment, on a
// dedicated thread with a stack deep enough for max_depth nested calls.
// Output goes to the given channels only; nothing process-wide is redirected.
ExecutionOutcome RunSnippet(const std::string& code, OutputChannels& channels,
                            const ExecutionLimits& limits = ExecutionLimits());

// The whole pipeline: input validation -> policy filter -> RunSnippet.
// Never throws; anything unexpected becomes ServerFault.
ExecutionOutcome Execute(const ExecutionRequest& request, OutputChannels& channels,
                         const ExecutionLimits& limits = ExecutionLimits());
ExecutionOutcome Execute(const ExecutionRequest& request,
                         const ExecutionLimits& limits = ExecutionLimits());

#endif  // INCLUDE_EXECBOX_ENGINE_H_
