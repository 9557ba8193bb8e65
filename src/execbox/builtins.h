#ifndef EXECBOX_BUILTINS_H_
#define EXECBOX_BUILTINS_H_

#include <optional>
#include <string>

#include "interpreter.h"

namespace interp {

// argument helpers shared by builtins, methods and modules

// positional count check; keyword arguments must have been taken already
void CheckArity(const std::string& fn, const CallArgs& args, size_t min, size_t max);
void CheckNoKwargs(const std::string& fn, const CallArgs& args);
// removes and returns the keyword argument
std::optional<Value> TakeKwarg(CallArgs& args, const char* name);
// positional-or-keyword parameter
std::optional<Value> Arg(const std::string& fn, CallArgs& args, size_t index, const char* name);

int64_t AsIndex(const Value&);
double AsReal(const Value&);
const std::string& AsString(const Value&, const std::string& what);

// int(str, base) parsing; nullopt when malformed
std::optional<Value> ParseInt(const std::string& text, int base);
// float(str) parsing; nullopt when malformed
std::optional<double> ParseFloat(const std::string& text);

// builtin callables, bound by RestrictedEnvironment
Value BuiltinPrint(Interpreter&, CallArgs&);
Value BuiltinLen(Interpreter&, CallArgs&);
Value BuiltinStr(Interpreter&, CallArgs&);
Value BuiltinInt(Interpreter&, CallArgs&);
Value BuiltinFloat(Interpreter&, CallArgs&);
Value BuiltinBool(Interpreter&, CallArgs&);
Value BuiltinList(Interpreter&, CallArgs&);
Value BuiltinTuple(Interpreter&, CallArgs&);
Value BuiltinSet(Interpreter&, CallArgs&);
Value BuiltinDict(Interpreter&, CallArgs&);
Value BuiltinRange(Interpreter&, CallArgs&);
Value BuiltinEnumerate(Interpreter&, CallArgs&);
Value BuiltinSum(Interpreter&, CallArgs&);
Value BuiltinMax(Interpreter&, CallArgs&);
Value BuiltinMin(Interpreter&, CallArgs&);
Value BuiltinAbs(Interpreter&, CallArgs&);
Value BuiltinRound(Interpreter&, CallArgs&);
Value BuiltinSorted(Interpreter&, CallArgs&);
Value BuiltinReversed(Interpreter&, CallArgs&);
Value BuiltinZip(Interpreter&, CallArgs&);
Value BuiltinAny(Interpreter&, CallArgs&);
Value BuiltinAll(Interpreter&, CallArgs&);
Value BuiltinMap(Interpreter&, CallArgs&);
Value BuiltinFilter(Interpreter&, CallArgs&);
// dict.fromkeys
Value DictFromKeys(Interpreter&, CallArgs&);

// list.sort and sorted()
void SortValues(Interpreter&, std::vector<Value>& items, const Value& key, bool reverse);
// dict(x) and dict.update(x): a dict or an iterable of pairs
void UpdateDict(Interpreter&, DictObject* dict, const Value& source);

} // namespace interp

#endif  // EXECBOX_BUILTINS_H_
