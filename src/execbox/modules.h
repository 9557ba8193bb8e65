#ifndef EXECBOX_MODULES_H_
#define EXECBOX_MODULES_H_

#include <ctime>
#include <optional>
#include <string>

#include "interpreter.h"

namespace interp {

ModuleObject* MakeJsonModule(Heap&);
ModuleObject* MakeDatetimeModule(Heap&);
ModuleObject* MakeTimeModule(Heap&);

// datetime.datetime, datetime.date and datetime.timedelta values
std::string TemporalRepr(const Object*);
std::string TemporalStr(const Object*);
// strftime; %f expands to microseconds
std::string TemporalStrftime(const Object*, const std::string& format);
// nullopt when the operation does not apply to these operands
std::optional<Value> TemporalBinary(Interpreter&, BinaryOp op, const Value& a, const Value& b);
// C strftime on a broken-down time, with %f, %z and %Z handled first
std::string FormatTime(const std::string& format, const std::tm& tm, int64_t microsecond);
MethodFn TemporalMethod(ObjectKind kind, const std::string& name);
// data attributes such as year or days; raises AttributeError when missing
Value TemporalGetAttr(Interpreter&, const Value& self, const std::string& name);

} // namespace interp

#endif  // EXECBOX_MODULES_H_
