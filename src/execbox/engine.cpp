#include "execbox/engine.h"

#include <pthread.h>

#include <chrono>
#include <exception>
#include <new>
#include <system_error>

#include <spdlog/spdlog.h>

#include "execbox/policy.h"
#include "environment.h"
#include "interpreter.h"
#include "parser.h"

long kTimeLimit = 5000;
long kMaxOutput = 1024;
int kMaxDepth = 1000;
long kMaxObjects = 1000000;
long kMaxMemory = 256;

namespace {

// elements of one list or tuple, bytes of one string
constexpr size_t kMaxSequence = 10000000;
// the tree walker recurses on the native stack once per nested call and expression
constexpr size_t kRunStackSize = 512 << 20;

ExecutionOutcome Dispatch(const ExecutionRequest& request, OutputChannels& channels,
                          const ExecutionLimits& limits) {
  if (IsBlankInput(request.code)) return InputInvalid{"No code provided"};
  if (auto violation = CheckPolicy(request.code)) {
    spdlog::info("Rejected snippet importing {}", violation->module);
    return PolicyRejected{violation->module, violation->Reason()};
  }
  try {
    return RunSnippet(request.code, channels, limits);
  } catch (const std::bad_alloc&) {
    spdlog::error("Out of memory while running a snippet of {} bytes", request.code.size());
    channels.out.Release();
    channels.err.Release();
    return ServerFault{"out of memory"};
  } catch (const std::exception& err) {
    spdlog::error("Unexpected error while running a snippet: {}", err.what());
    channels.out.Release();
    channels.err.Release();
    return ServerFault{err.what()};
  }
}

ExecutionOutcome RunOnStack(const std::string& code, OutputChannels& channels,
                            const ExecutionLimits& limits) {
  channels.out.SetLimit(limits.max_output);
  channels.err.SetLimit(limits.max_output);
  // the heap outlives the interpreter and the environment that point into it
  interp::Heap heap(limits.max_objects, limits.max_memory);
  try {
    interp::Module module = interp::Parse(code);
    interp::RestrictedEnvironment env(heap);
    interp::Interpreter interpreter(heap, env, channels, limits);
    interpreter.Run(module);
  } catch (const interp::ScriptError& err) {
    spdlog::debug("Snippet raised {}: {}", interp::ExcTypeName(err.type), err.message);
    return RuntimeFailure{err.message, err.FormatTraceback(), channels.out.Release(), channels.err.Release()};
  }
  return Success{channels.out.Release(), channels.err.Release()};
}

struct RunTask {
  const std::string& code;
  OutputChannels& channels;
  const ExecutionLimits& limits;
  ExecutionOutcome outcome;
  std::exception_ptr error;
};

void* RunThread(void* arg) {
  auto task = static_cast<RunTask*>(arg);
  try {
    task->outcome = RunOnStack(task->code, task->channels, task->limits);
  } catch (...) {
    task->error = std::current_exception();
  }
  return nullptr;
}

} // namespace

ExecutionLimits::ExecutionLimits() :
    time_limit(kTimeLimit), max_output(kMaxOutput * 1024), max_depth(kMaxDepth),
    max_objects(kMaxObjects), max_memory((size_t)kMaxMemory << 20), max_sequence(kMaxSequence) {}

ExecutionOutcome RunSnippet(const std::string& code, OutputChannels& channels,
                            const ExecutionLimits& limits) {
  RunTask task{code, channels, limits, ServerFault{}, nullptr};
  pthread_attr_t attr;
  if (int err = pthread_attr_init(&attr)) throw std::system_error(err, std::generic_category(), "pthread_attr_init");
  int err = pthread_attr_setstacksize(&attr, kRunStackSize);
  pthread_t thread;
  if (!err) err = pthread_create(&thread, &attr, RunThread, &task);
  pthread_attr_destroy(&attr);
  if (err) throw std::system_error(err, std::generic_category(), "pthread_create");
  pthread_join(thread, nullptr);
  if (task.error) std::rethrow_exception(task.error);
  return std::move(task.outcome);
}

ExecutionOutcome Execute(const ExecutionRequest& request, OutputChannels& channels,
                         const ExecutionLimits& limits) {
  auto start = std::chrono::steady_clock::now();
  ExecutionOutcome outcome = Dispatch(request, channels, limits);
  auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
  spdlog::debug("Executed {} bytes of code: {} in {:.1f} ms",
                request.code.size(), OutcomeKindName(KindOf(outcome)), elapsed.count());
  return outcome;
}

ExecutionOutcome Execute(const ExecutionRequest& request, const ExecutionLimits& limits) {
  OutputChannels channels;
  return Execute(request, channels, limits);
}
