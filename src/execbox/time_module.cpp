#include <chrono>
#include <cmath>
#include <ctime>
#include <thread>

#include <fmt/core.h>

#include "builtins.h"
#include "modules.h"

namespace interp {

namespace {

Value TimeTime(Interpreter&, CallArgs& args) {
  CheckArity("time", args, 0, 0);
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return Value::Float(std::chrono::duration<double>(now).count());
}

Value TimeTimeNs(Interpreter&, CallArgs& args) {
  CheckArity("time_ns", args, 0, 0);
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return Value::Int(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

Value TimeMonotonic(Interpreter&, CallArgs& args) {
  CheckArity("monotonic", args, 0, 0);
  auto now = std::chrono::steady_clock::now().time_since_epoch();
  return Value::Float(std::chrono::duration<double>(now).count());
}

Value TimePerfCounter(Interpreter&, CallArgs& args) {
  CheckArity("perf_counter", args, 0, 0);
  auto now = std::chrono::steady_clock::now().time_since_epoch();
  return Value::Float(std::chrono::duration<double>(now).count());
}

// Never sleeps past the run deadline: the run times out at the deadline instead.
Value TimeSleep(Interpreter& interp, CallArgs& args) {
  CheckArity("sleep", args, 1, 1);
  const Value& arg = args.args[0];
  if (!arg.IsNumber()) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("'{}' object cannot be interpreted as an integer", TypeName(arg)));
  }
  double seconds = arg.AsFloat();
  if (std::isnan(seconds)) throw ScriptError(ExcType::VALUE_ERROR, "Invalid value NaN (not a number)");
  if (seconds < 0) throw ScriptError(ExcType::VALUE_ERROR, "sleep length must be non-negative");
  auto now = std::chrono::steady_clock::now();
  if (interp.has_deadline()) {
    auto remaining = interp.deadline() - now;
    if (std::chrono::duration<double>(remaining).count() <= seconds) {
      std::this_thread::sleep_until(interp.deadline());
      interp.CheckDeadline();
    }
  }
  if (std::isinf(seconds)) throw ScriptError(ExcType::OVERFLOW_ERROR, "sleep length is too large");
  std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
  return Value();
}

Value TimeStrftime(Interpreter&, CallArgs& args) {
  CheckArity("strftime", args, 1, 1);
  const std::string& format = AsString(args.args[0], "strftime() argument 1");
  time_t now = time(nullptr);
  std::tm tm;
  localtime_r(&now, &tm);
  return Value::Str(FormatTime(format, tm, 0));
}

Value Builtin(Heap& heap, const std::string& name, NativeFn fn) {
  return Value::Obj(heap.Make<BuiltinObject>(name, fn));
}

} // namespace

ModuleObject* MakeTimeModule(Heap& heap) {
  auto module = heap.Make<ModuleObject>("time");
  module->members = {
    {"time", Builtin(heap, "time", TimeTime)},
    {"time_ns", Builtin(heap, "time_ns", TimeTimeNs)},
    {"sleep", Builtin(heap, "sleep", TimeSleep)},
    {"monotonic", Builtin(heap, "monotonic", TimeMonotonic)},
    {"perf_counter", Builtin(heap, "perf_counter", TimePerfCounter)},
    {"strftime", Builtin(heap, "strftime", TimeStrftime)},
  };
  return module;
}

} // namespace interp
