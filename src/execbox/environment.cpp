#include "environment.h"

#include "builtins.h"
#include "modules.h"

namespace interp {

namespace {

const char* kCapabilityNameTable[] = {
#define X(name, pyname) pyname,
  ENUM_CAPABILITY_
#undef X
};

} // namespace

const char* CapabilityName(Capability capability) {
  return kCapabilityNameTable[(int)capability];
}

const std::vector<Capability> kDefaultAllowList = {
#define X(name, pyname) Capability::name,
  ENUM_CAPABILITY_
#undef X
};

RestrictedEnvironment::RestrictedEnvironment(Heap& heap, const std::vector<Capability>& allow_list) {
  for (Capability capability : allow_list) Add(heap, capability);
}

void RestrictedEnvironment::AddBuiltin(Heap& heap, const std::string& name, NativeFn fn) {
  names_[name] = Value::Obj(heap.Make<BuiltinObject>(name, fn));
}

void RestrictedEnvironment::Add(Heap& heap, Capability capability) {
  // builtin types carry the method table of their instances
  auto add_type = [&](const std::string& name, NativeFn fn, bool has_methods) {
    auto type = heap.Make<BuiltinObject>(name, fn);
    type->is_type = true;
    if (has_methods) type->instance_type = name;
    names_[name] = Value::Obj(type);
    return type;
  };
  auto add_module = [&](ModuleObject* module) {
    modules_[module->name] = module;
    names_[module->name] = Value::Obj(module);
  };
  switch (capability) {
    case Capability::PRINT: AddBuiltin(heap, "print", BuiltinPrint); break;
    case Capability::LEN: AddBuiltin(heap, "len", BuiltinLen); break;
    case Capability::STR: add_type("str", BuiltinStr, true); break;
    case Capability::INT: add_type("int", BuiltinInt, true); break;
    case Capability::FLOAT: add_type("float", BuiltinFloat, true); break;
    case Capability::LIST: add_type("list", BuiltinList, true); break;
    case Capability::DICT: {
      auto dict = add_type("dict", BuiltinDict, true);
      dict->attrs.emplace_back("fromkeys", Value::Obj(heap.Make<BuiltinObject>("fromkeys", DictFromKeys)));
      break;
    }
    case Capability::RANGE: add_type("range", BuiltinRange, true); break;
    case Capability::ENUMERATE: add_type("enumerate", BuiltinEnumerate, false); break;
    case Capability::SUM: AddBuiltin(heap, "sum", BuiltinSum); break;
    case Capability::MAX: AddBuiltin(heap, "max", BuiltinMax); break;
    case Capability::MIN: AddBuiltin(heap, "min", BuiltinMin); break;
    case Capability::ABS: AddBuiltin(heap, "abs", BuiltinAbs); break;
    case Capability::ROUND: AddBuiltin(heap, "round", BuiltinRound); break;
    case Capability::SORTED: AddBuiltin(heap, "sorted", BuiltinSorted); break;
    case Capability::REVERSED: add_type("reversed", BuiltinReversed, false); break;
    case Capability::ZIP: add_type("zip", BuiltinZip, false); break;
    // keywords; the parser turns them into constants
    case Capability::TRUE_LITERAL:
    case Capability::FALSE_LITERAL:
    case Capability::NONE_LITERAL:
      break;
    case Capability::BOOL: add_type("bool", BuiltinBool, true); break;
    case Capability::TUPLE: add_type("tuple", BuiltinTuple, true); break;
    case Capability::SET: add_type("set", BuiltinSet, true); break;
    case Capability::ANY: AddBuiltin(heap, "any", BuiltinAny); break;
    case Capability::ALL: AddBuiltin(heap, "all", BuiltinAll); break;
    case Capability::MAP: add_type("map", BuiltinMap, false); break;
    case Capability::FILTER: add_type("filter", BuiltinFilter, false); break;
    case Capability::EXCEPTIONS:
      for (int i = 0; i <= (int)ExcType::JSON_DECODE_ERROR; i++) {
        ExcType type = (ExcType)i;
        if (ExcTypeIsBuiltin(type)) names_[ExcTypeName(type)] = Value::Obj(heap.Make<ExceptionTypeObject>(type));
      }
      break;
    case Capability::JSON: add_module(MakeJsonModule(heap)); break;
    case Capability::DATETIME: add_module(MakeDatetimeModule(heap)); break;
    case Capability::TIME: add_module(MakeTimeModule(heap)); break;
  }
}

const Value* RestrictedEnvironment::Lookup(const std::string& name) const {
  auto it = names_.find(name);
  return it == names_.end() ? nullptr : &it->second;
}

ModuleObject* RestrictedEnvironment::Module(const std::string& name) const {
  auto it = modules_.find(name);
  return it == modules_.end() ? nullptr : it->second;
}

} // namespace interp
