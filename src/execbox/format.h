#ifndef EXECBOX_FORMAT_H_
#define EXECBOX_FORMAT_H_

#include <string>

#include "value.h"

namespace interp {

class Interpreter;

// shortest round-tripping form, e.g. 0.1, 1e+16, inf
std::string FloatRepr(double);
std::string QuoteString(const std::string&);

// str() and repr(); nesting deeper than kMaxReprDepth raises RecursionError
extern const int kMaxReprDepth;
std::string ToStr(const Value&);
// str(int) and int(str) refuse longer decimal ints
extern const size_t kMaxIntDigits;
std::string ToRepr(const Value&);
// ascii(): repr with non-ASCII escaped
std::string AsciiRepr(const Value&);
std::string ExceptionStr(const ExceptionObject*);

// format(value, spec)
std::string FormatValue(const Value&, const std::string& spec);
// str % args
std::string PercentFormat(const std::string& format, const Value& args);
// str.format(*args, **kwargs)
std::string StrFormat(Interpreter&, const std::string& format, const CallArgs& args);

} // namespace interp

#endif  // EXECBOX_FORMAT_H_
