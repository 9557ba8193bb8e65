#ifndef EXECBOX_ENVIRONMENT_H_
#define EXECBOX_ENVIRONMENT_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "value.h"

namespace interp {

// Everything a snippet can name without defining it itself
#define ENUM_CAPABILITY_ \
  X(PRINT, "print") \
  X(LEN, "len") \
  X(STR, "str") \
  X(INT, "int") \
  X(FLOAT, "float") \
  X(LIST, "list") \
  X(DICT, "dict") \
  X(RANGE, "range") \
  X(ENUMERATE, "enumerate") \
  X(SUM, "sum") \
  X(MAX, "max") \
  X(MIN, "min") \
  X(ABS, "abs") \
  X(ROUND, "round") \
  X(SORTED, "sorted") \
  X(REVERSED, "reversed") \
  X(ZIP, "zip") \
  X(TRUE_LITERAL, "True") \
  X(FALSE_LITERAL, "False") \
  X(NONE_LITERAL, "None") \
  X(BOOL, "bool") \
  X(TUPLE, "tuple") \
  X(SET, "set") \
  X(ANY, "any") \
  X(ALL, "all") \
  X(MAP, "map") \
  X(FILTER, "filter") \
  X(EXCEPTIONS, "exceptions") \
  X(JSON, "json") \
  X(DATETIME, "datetime") \
  X(TIME, "time")
enum class Capability {
#define X(name, pyname) name,
  ENUM_CAPABILITY_
#undef X
};

const char* CapabilityName(Capability);

// the full allow-list
extern const std::vector<Capability> kDefaultAllowList;

// The builtin namespace of one run. Built fresh per run, so nothing a snippet
// does to it can leak into the next one.
class RestrictedEnvironment {
  std::unordered_map<std::string, Value> names_;
  std::unordered_map<std::string, ModuleObject*> modules_;

  void Add(Heap& heap, Capability capability);
  void AddBuiltin(Heap& heap, const std::string& name, NativeFn fn);
 public:
  RestrictedEnvironment(Heap& heap, const std::vector<Capability>& allow_list = kDefaultAllowList);

  const Value* Lookup(const std::string& name) const;
  // importable modules
  ModuleObject* Module(const std::string& name) const;
  size_t Size() const { return names_.size(); }
};

} // namespace interp

#endif  // EXECBOX_ENVIRONMENT_H_
