#include "builtins.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

#include <fmt/core.h>

#include "format.h"

namespace interp {

namespace {

const char kWhitespace[] = " \t\n\r\v\f";

std::string Strip(const std::string& str) {
  size_t begin = str.find_first_not_of(kWhitespace);
  if (begin == std::string::npos) return "";
  size_t end = str.find_last_not_of(kWhitespace);
  return str.substr(begin, end - begin + 1);
}

// removes '_' between digits; false if an underscore is misplaced
bool RemoveUnderscores(const std::string& text, std::string& out) {
  out.clear();
  for (size_t i = 0; i < text.size(); i++) {
    if (text[i] != '_') {
      out += text[i];
      continue;
    }
    if (i == 0 || i + 1 == text.size() || !isxdigit((unsigned char)text[i - 1]) ||
        !isxdigit((unsigned char)text[i + 1])) {
      return false;
    }
  }
  return true;
}

int DigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'z') return c - 'a' + 10;
  if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
  return 99;
}

Value FloatToInt(double x) {
  if (std::isinf(x)) throw ScriptError(ExcType::OVERFLOW_ERROR, "cannot convert float infinity to integer");
  if (std::isnan(x)) throw ScriptError(ExcType::VALUE_ERROR, "cannot convert float NaN to integer");
  double t = std::trunc(x);
  if (t >= 9223372036854775808.0 || t < -9223372036854775808.0) return Value::Big(mpz_class(t));
  return Value::Int((int64_t)t);
}

class EnumerateIter : public Iter {
  std::unique_ptr<Iter> iter_;
  int64_t count_;
  Interpreter& interp_;
 public:
  EnumerateIter(std::unique_ptr<Iter> iter, int64_t start, Interpreter& interp) :
      iter_(std::move(iter)), count_(start), interp_(interp) {}
  bool Next(Value& out) override {
    Value item;
    if (!iter_->Next(item)) return false;
    out = interp_.NewTuple({Value::Int(count_++), std::move(item)});
    return true;
  }
  void Traverse(const Visitor& visit) const override { iter_->Traverse(visit); }
};

class ReverseIter : public Iter {
  std::vector<Value> items_;
 public:
  explicit ReverseIter(std::vector<Value> items) : items_(std::move(items)) {}
  bool Next(Value& out) override {
    if (items_.empty()) return false;
    out = std::move(items_.back());
    items_.pop_back();
    return true;
  }
  void Traverse(const Visitor& visit) const override { for (auto& item : items_) visit(item); }
};

class ZipIter : public Iter {
  std::vector<std::unique_ptr<Iter>> iters_;
  bool strict_;
  bool done_ = false;
  Interpreter& interp_;
 public:
  ZipIter(std::vector<std::unique_ptr<Iter>> iters, bool strict, Interpreter& interp) :
      iters_(std::move(iters)), strict_(strict), interp_(interp) {}
  bool Next(Value& out) override {
    if (done_ || iters_.empty()) return false;
    std::vector<Value> items(iters_.size());
    for (size_t i = 0; i < iters_.size(); i++) {
      if (iters_[i]->Next(items[i])) continue;
      done_ = true;
      if (!strict_) return false;
      if (i > 0) {
        throw ScriptError(ExcType::VALUE_ERROR,
            fmt::format("zip() argument {} is shorter than argument{} {}", i + 1, i == 1 ? "" : "s",
                        i == 1 ? std::string("1") : fmt::format("1-{}", i)));
      }
      Value extra;
      for (size_t j = 1; j < iters_.size(); j++) {
        if (iters_[j]->Next(extra)) {
          throw ScriptError(ExcType::VALUE_ERROR,
              fmt::format("zip() argument {} is longer than argument{} {}", j + 1, j == 1 ? "" : "s",
                          j == 1 ? std::string("1") : fmt::format("1-{}", j)));
        }
      }
      return false;
    }
    out = interp_.NewTuple(std::move(items));
    return true;
  }
  void Traverse(const Visitor& visit) const override { for (auto& iter : iters_) iter->Traverse(visit); }
};

class MapIter : public Iter {
  Value fn_;
  std::vector<std::unique_ptr<Iter>> iters_;
  Interpreter& interp_;
 public:
  MapIter(Value fn, std::vector<std::unique_ptr<Iter>> iters, Interpreter& interp) :
      fn_(std::move(fn)), iters_(std::move(iters)), interp_(interp) {}
  bool Next(Value& out) override {
    std::vector<Value> args(iters_.size());
    for (size_t i = 0; i < iters_.size(); i++) {
      if (!iters_[i]->Next(args[i])) return false;
    }
    out = interp_.Call(fn_, std::move(args));
    return true;
  }
  void Traverse(const Visitor& visit) const override {
    visit(fn_);
    for (auto& iter : iters_) iter->Traverse(visit);
  }
};

class FilterIter : public Iter {
  Value fn_;
  std::unique_ptr<Iter> iter_;
  Interpreter& interp_;
 public:
  FilterIter(Value fn, std::unique_ptr<Iter> iter, Interpreter& interp) :
      fn_(std::move(fn)), iter_(std::move(iter)), interp_(interp) {}
  bool Next(Value& out) override {
    Value item;
    while (iter_->Next(item)) {
      interp_.Tick();
      bool keep = fn_.IsNone() ? Truthy(item) : Truthy(interp_.Call(fn_, {item}));
      if (keep) {
        out = std::move(item);
        return true;
      }
    }
    return false;
  }
  void Traverse(const Visitor& visit) const override {
    visit(fn_);
    iter_->Traverse(visit);
  }
};

Value MinMax(Interpreter& interp, CallArgs& args, bool is_max) {
  const char* name = is_max ? "max" : "min";
  auto key = TakeKwarg(args, "key");
  auto fallback = TakeKwarg(args, "default");
  CheckNoKwargs(name, args);
  if (args.args.empty()) {
    throw ScriptError(ExcType::TYPE_ERROR, fmt::format("{} expected at least 1 argument, got 0", name));
  }
  std::vector<Value> items;
  if (args.args.size() == 1) {
    items = interp.Collect(args.args[0]);
  } else {
    if (fallback) {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("Cannot specify a default for {}() with multiple positional arguments", name));
    }
    items = args.args;
  }
  if (items.empty()) {
    if (fallback) return *fallback;
    throw ScriptError(ExcType::VALUE_ERROR, fmt::format("{}() arg is an empty sequence", name));
  }
  bool use_key = key && !key->IsNone();
  size_t best = 0;
  Value best_key = use_key ? interp.Call(*key, {items[0]}) : items[0];
  for (size_t i = 1; i < items.size(); i++) {
    Value k = use_key ? interp.Call(*key, {items[i]}) : items[i];
    if (RichCompare(k, best_key, is_max ? ">" : "<")) {
      best = i;
      best_key = std::move(k);
    }
  }
  return items[best];
}

} // namespace

// --- argument helpers ---

void CheckNoKwargs(const std::string& fn, const CallArgs& args) {
  if (!args.kwargs.empty()) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("{}() got an unexpected keyword argument '{}'", fn, args.kwargs[0].first));
  }
}

void CheckArity(const std::string& fn, const CallArgs& args, size_t min, size_t max) {
  CheckNoKwargs(fn, args);
  size_t n = args.args.size();
  if (n >= min && n <= max) return;
  std::string message;
  if (min == max) {
    if (min == 0) {
      message = fmt::format("{}() takes no arguments ({} given)", fn, n);
    } else if (min == 1) {
      message = fmt::format("{}() takes exactly one argument ({} given)", fn, n);
    } else {
      message = fmt::format("{}() takes exactly {} arguments ({} given)", fn, min, n);
    }
  } else if (n < min) {
    message = fmt::format("{}() takes at least {} argument{} ({} given)", fn, min, min == 1 ? "" : "s", n);
  } else {
    message = fmt::format("{}() takes at most {} argument{} ({} given)", fn, max, max == 1 ? "" : "s", n);
  }
  throw ScriptError(ExcType::TYPE_ERROR, message);
}

std::optional<Value> TakeKwarg(CallArgs& args, const char* name) {
  for (auto it = args.kwargs.begin(); it != args.kwargs.end(); ++it) {
    if (it->first == name) {
      Value ret = std::move(it->second);
      args.kwargs.erase(it);
      return ret;
    }
  }
  return std::nullopt;
}

std::optional<Value> Arg(const std::string& fn, CallArgs& args, size_t index, const char* name) {
  auto kwarg = TakeKwarg(args, name);
  if (index < args.args.size()) {
    if (kwarg) {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("argument for {}() given by name ('{}') and position ({})", fn, name, index + 1));
    }
    return args.args[index];
  }
  return kwarg;
}

int64_t AsIndex(const Value& v) {
  if (!v.IsIntLike()) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("'{}' object cannot be interpreted as an integer", TypeName(v)));
  }
  return v.AsInt();
}

double AsReal(const Value& v) {
  if (!v.IsNumber()) {
    throw ScriptError(ExcType::TYPE_ERROR, fmt::format("must be real number, not {}", TypeName(v)));
  }
  return v.AsFloat();
}

const std::string& AsString(const Value& v, const std::string& what) {
  if (!v.IsStr()) {
    throw ScriptError(ExcType::TYPE_ERROR, fmt::format("{} must be str, not {}", what, TypeName(v)));
  }
  return v.AsStr();
}

std::optional<Value> ParseInt(const std::string& input, int base) {
  std::string text = Strip(input);
  bool negative = false;
  size_t pos = 0;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) negative = text[pos++] == '-';
  std::string body = text.substr(pos);
  if (body.size() >= 2 && body[0] == '0') {
    char p = tolower(body[1]);
    int prefixed = p == 'x' ? 16 : p == 'o' ? 8 : p == 'b' ? 2 : 0;
    if (prefixed && (base == 0 || base == prefixed)) {
      base = prefixed;
      body = body.substr(2);
      if (!body.empty() && body[0] == '_') body = body.substr(1);
    }
  }
  if (base == 0) {
    // decimal literals may not have leading zeros
    if (body.size() > 1 && body[0] == '0' && body.find_first_not_of("0_") != std::string::npos) {
      return std::nullopt;
    }
    base = 10;
  }
  std::string digits;
  if (body.empty() || !RemoveUnderscores(body, digits) || digits.empty()) return std::nullopt;
  for (char c : digits) {
    if (DigitValue(c) >= base) return std::nullopt;
  }
  // quadratic in the digit count unless the base is a power of two
  if ((base & (base - 1)) != 0 && digits.size() > kMaxIntDigits) {
    throw ScriptError(ExcType::VALUE_ERROR,
        fmt::format("Exceeds the limit ({} digits) for integer string conversion: value has {} digits; "
                    "use sys.set_int_max_str_digits() to increase the limit", kMaxIntDigits, digits.size()));
  }
  mpz_class value;
  if (value.set_str(digits, base) != 0) return std::nullopt;
  if (negative) value = -value;
  return Value::Big(std::move(value));
}

std::optional<double> ParseFloat(const std::string& input) {
  std::string text = Strip(input);
  bool negative = false;
  size_t pos = 0;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) negative = text[pos++] == '-';
  std::string body = text.substr(pos);
  std::string lower;
  for (char c : body) lower += tolower(c);
  double value;
  if (lower == "inf" || lower == "infinity") {
    value = std::numeric_limits<double>::infinity();
  } else if (lower == "nan") {
    value = std::numeric_limits<double>::quiet_NaN();
  } else {
    std::string digits;
    if (body.empty() || !RemoveUnderscores(body, digits)) return std::nullopt;
    if (digits.find_first_not_of("0123456789.eE+-") != std::string::npos) return std::nullopt;
    if (digits[0] == '+' || digits[0] == '-') return std::nullopt;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (res.ec == std::errc::invalid_argument || res.ptr != digits.data() + digits.size()) return std::nullopt;
    if (res.ec == std::errc::result_out_of_range) {
      // overflow is inf, underflow is 0 in Python
      bool tiny = digits.find_first_of("eE") != std::string::npos &&
                  digits[digits.find_first_of("eE") + 1] == '-';
      value = tiny ? 0.0 : std::numeric_limits<double>::infinity();
    }
  }
  return negative ? -value : value;
}

void SortValues(Interpreter& interp, std::vector<Value>& items, const Value& key, bool reverse) {
  auto less = [&](const Value& a, const Value& b) {
    interp.Tick();
    return reverse ? LessThan(b, a) : LessThan(a, b);
  };
  if (key.IsNone()) {
    std::stable_sort(items.begin(), items.end(), less);
    return;
  }
  std::vector<std::pair<Value, Value>> decorated;
  decorated.reserve(items.size());
  for (auto& item : items) decorated.emplace_back(interp.Call(key, {item}), item);
  std::stable_sort(decorated.begin(), decorated.end(),
                   [&](const auto& a, const auto& b) { return less(a.first, b.first); });
  for (size_t i = 0; i < items.size(); i++) items[i] = std::move(decorated[i].second);
}

void UpdateDict(Interpreter& interp, DictObject* dict, const Value& source) {
  if (source.Is(ObjectKind::DICT)) {
    for (auto& [key, value] : source.As<DictObject>()->table.Entries()) dict->table.Set(key, value);
    return;
  }
  auto iter = interp.GetIter(source);
  Value item;
  for (size_t index = 0; iter->Next(item); index++) {
    interp.Tick();
    if (!IsIterable(item)) {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("cannot convert dictionary update sequence element #{} to a sequence", index));
    }
    std::vector<Value> pair = interp.Collect(item);
    if (pair.size() != 2) {
      throw ScriptError(ExcType::VALUE_ERROR,
          fmt::format("dictionary update sequence element #{} has length {}; 2 is required",
                      index, pair.size()));
    }
    dict->table.Set(pair[0], std::move(pair[1]));
    interp.CheckLength(dict->table.Size());
  }
}

// --- builtins ---

Value BuiltinPrint(Interpreter& interp, CallArgs& args) {
  auto sep = TakeKwarg(args, "sep");
  auto end = TakeKwarg(args, "end");
  auto file = TakeKwarg(args, "file");
  TakeKwarg(args, "flush"); // writes are unbuffered
  CheckNoKwargs("print", args);
  if (sep && !sep->IsNone() && !sep->IsStr()) {
    throw ScriptError(ExcType::TYPE_ERROR, fmt::format("sep must be None or a string, not {}", TypeName(*sep)));
  }
  if (end && !end->IsNone() && !end->IsStr()) {
    throw ScriptError(ExcType::TYPE_ERROR, fmt::format("end must be None or a string, not {}", TypeName(*end)));
  }
  // no stream objects are reachable, so the only valid file is the default
  if (file && !file->IsNone()) {
    throw ScriptError(ExcType::ATTRIBUTE_ERROR,
        fmt::format("'{}' object has no attribute 'write'", TypeName(*file)));
  }
  std::string separator = sep && sep->IsStr() ? sep->AsStr() : " ";
  std::string text;
  for (size_t i = 0; i < args.args.size(); i++) {
    if (i) text += separator;
    text += ToStr(args.args[i]);
    interp.CheckLength(text.size());
  }
  text += end && end->IsStr() ? end->AsStr() : "\n";
  interp.WriteOut(text);
  return Value();
}

Value BuiltinLen(Interpreter&, CallArgs& args) {
  CheckArity("len", args, 1, 1);
  const Value& v = args.args[0];
  if (v.IsStr()) return Value::Int(CodePointCount(v.AsStr()));
  if (v.IsObject()) {
    Object* obj = v.AsObject();
    switch (obj->kind) {
      case ObjectKind::LIST: return Value::Int(static_cast<ListObject*>(obj)->items.size());
      case ObjectKind::TUPLE: return Value::Int(static_cast<TupleObject*>(obj)->items.size());
      case ObjectKind::DICT: return Value::Int(static_cast<DictObject*>(obj)->table.Size());
      case ObjectKind::SET: return Value::Int(static_cast<SetObject*>(obj)->table.Size());
      case ObjectKind::RANGE: return Value::Int(static_cast<RangeObject*>(obj)->Length());
      case ObjectKind::DICT_VIEW: return Value::Int(static_cast<DictViewObject*>(obj)->dict->table.Size());
      default: break;
    }
  }
  throw ScriptError(ExcType::TYPE_ERROR, fmt::format("object of type '{}' has no len()", TypeName(v)));
}

Value BuiltinStr(Interpreter& interp, CallArgs& args) {
  auto object = Arg("str", args, 0, "object");
  CheckArity("str", args, 0, 1);
  if (!object) return Value::Str("");
  std::string ret = ToStr(*object);
  interp.CheckLength(ret.size());
  return Value::Str(std::move(ret));
}

Value BuiltinInt(Interpreter&, CallArgs& args) {
  auto base_arg = Arg("int", args, 1, "base");
  if (args.args.size() > 2) CheckArity("int", args, 0, 2);
  CheckNoKwargs("int", args);
  if (args.args.empty()) {
    if (base_arg) throw ScriptError(ExcType::TYPE_ERROR, "int() missing string argument");
    return Value::Int(0);
  }
  const Value& v = args.args[0];
  if (base_arg) {
    int64_t base = AsIndex(*base_arg);
    if (base != 0 && (base < 2 || base > 36)) {
      throw ScriptError(ExcType::VALUE_ERROR, "int() base must be >= 2 and <= 36, or 0");
    }
    if (!v.IsStr()) throw ScriptError(ExcType::TYPE_ERROR, "int() can't convert non-string with explicit base");
    auto parsed = ParseInt(v.AsStr(), base);
    if (!parsed) {
      throw ScriptError(ExcType::VALUE_ERROR,
          fmt::format("invalid literal for int() with base {}: {}", base, QuoteString(v.AsStr())));
    }
    return *parsed;
  }
  if (v.IsBig()) return v;
  if (v.IsIntLike()) return Value::Int(v.AsInt());
  if (v.IsFloat()) return FloatToInt(v.AsFloat());
  if (v.IsStr()) {
    auto parsed = ParseInt(v.AsStr(), 10);
    if (!parsed) {
      throw ScriptError(ExcType::VALUE_ERROR,
          fmt::format("invalid literal for int() with base 10: {}", QuoteString(v.AsStr())));
    }
    return *parsed;
  }
  throw ScriptError(ExcType::TYPE_ERROR,
      fmt::format("int() argument must be a string, a bytes-like object or a real number, not '{}'",
                  TypeName(v)));
}

Value BuiltinFloat(Interpreter&, CallArgs& args) {
  CheckArity("float", args, 0, 1);
  if (args.args.empty()) return Value::Float(0.0);
  const Value& v = args.args[0];
  if (v.IsNumber()) return Value::Float(v.AsFloat());
  if (v.IsStr()) {
    auto parsed = ParseFloat(v.AsStr());
    if (!parsed) {
      throw ScriptError(ExcType::VALUE_ERROR,
          fmt::format("could not convert string to float: {}", QuoteString(v.AsStr())));
    }
    return Value::Float(*parsed);
  }
  throw ScriptError(ExcType::TYPE_ERROR,
      fmt::format("float() argument must be a string or a real number, not '{}'", TypeName(v)));
}

Value BuiltinBool(Interpreter&, CallArgs& args) {
  CheckArity("bool", args, 0, 1);
  return Value::Bool(!args.args.empty() && Truthy(args.args[0]));
}

Value BuiltinList(Interpreter& interp, CallArgs& args) {
  CheckArity("list", args, 0, 1);
  if (args.args.empty()) return interp.NewList();
  return interp.NewList(interp.Collect(args.args[0]));
}

Value BuiltinTuple(Interpreter& interp, CallArgs& args) {
  CheckArity("tuple", args, 0, 1);
  if (args.args.empty()) return interp.NewTuple();
  if (args.args[0].Is(ObjectKind::TUPLE)) return args.args[0];
  return interp.NewTuple(interp.Collect(args.args[0]));
}

Value BuiltinSet(Interpreter& interp, CallArgs& args) {
  CheckArity("set", args, 0, 1);
  Value ret = Value::Obj(interp.heap().Make<SetObject>());
  auto set = ret.As<SetObject>();
  if (!args.args.empty()) {
    auto iter = interp.GetIter(args.args[0]);
    Value item;
    while (iter->Next(item)) {
      interp.Tick();
      set->table.Set(item, Value());
      interp.CheckLength(set->table.Size());
    }
  }
  interp.heap().Track(set);
  return ret;
}

Value BuiltinDict(Interpreter& interp, CallArgs& args) {
  if (args.args.size() > 1) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("dict expected at most 1 argument, got {}", args.args.size()));
  }
  Value ret = Value::Obj(interp.heap().Make<DictObject>());
  auto dict = ret.As<DictObject>();
  if (!args.args.empty()) UpdateDict(interp, dict, args.args[0]);
  for (auto& [name, value] : args.kwargs) dict->table.Set(Value::Str(name), value);
  interp.heap().Track(dict);
  return ret;
}

Value DictFromKeys(Interpreter& interp, CallArgs& args) {
  CheckArity("fromkeys", args, 1, 2);
  Value fill = args.args.size() > 1 ? args.args[1] : Value();
  std::vector<Value> keys = interp.Collect(args.args[0]);
  Value ret = Value::Obj(interp.heap().Make<DictObject>());
  auto dict = ret.As<DictObject>();
  for (auto& key : keys) dict->table.Set(key, fill);
  interp.heap().Track(dict);
  return ret;
}

Value BuiltinRange(Interpreter& interp, CallArgs& args) {
  CheckNoKwargs("range", args);
  size_t n = args.args.size();
  if (n == 0) throw ScriptError(ExcType::TYPE_ERROR, "range expected at least 1 argument, got 0");
  if (n > 3) throw ScriptError(ExcType::TYPE_ERROR, fmt::format("range expected at most 3 arguments, got {}", n));
  int64_t start = 0, stop, step = 1;
  if (n == 1) {
    stop = AsIndex(args.args[0]);
  } else {
    start = AsIndex(args.args[0]);
    stop = AsIndex(args.args[1]);
    if (n == 3) step = AsIndex(args.args[2]);
  }
  if (step == 0) throw ScriptError(ExcType::VALUE_ERROR, "range() arg 3 must not be zero");
  return Value::Obj(interp.heap().Make<RangeObject>(start, stop, step));
}

Value BuiltinEnumerate(Interpreter& interp, CallArgs& args) {
  auto iterable = Arg("enumerate", args, 0, "iterable");
  auto start = Arg("enumerate", args, 1, "start");
  CheckNoKwargs("enumerate", args);
  if (!iterable) throw ScriptError(ExcType::TYPE_ERROR, "enumerate() missing required argument 'iterable' (pos 1)");
  if (args.args.size() > 2) CheckArity("enumerate", args, 1, 2);
  return interp.NewIterator(
      std::make_unique<EnumerateIter>(interp.GetIter(*iterable), start ? AsIndex(*start) : 0, interp),
      "enumerate");
}

Value BuiltinSum(Interpreter& interp, CallArgs& args) {
  auto start = TakeKwarg(args, "start");
  CheckNoKwargs("sum", args);
  if (args.args.empty()) throw ScriptError(ExcType::TYPE_ERROR, "sum() takes at least 1 positional argument (0 given)");
  if (args.args.size() > 2 || (args.args.size() == 2 && start)) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("sum() takes at most 2 arguments ({} given)", args.args.size() + (start ? 1 : 0)));
  }
  if (args.args.size() == 2) start = args.args[1];
  Value total = start ? *start : Value::Int(0);
  if (total.IsStr()) {
    throw ScriptError(ExcType::TYPE_ERROR, "sum() can't sum strings [use ''.join(seq) instead]");
  }
  auto iter = interp.GetIter(args.args[0]);
  Value item;
  while (iter->Next(item)) {
    interp.Tick();
    total = interp.BinaryOperation(BinaryOp::ADD, total, item);
  }
  return total;
}

Value BuiltinMax(Interpreter& interp, CallArgs& args) {
  return MinMax(interp, args, true);
}

Value BuiltinMin(Interpreter& interp, CallArgs& args) {
  return MinMax(interp, args, false);
}

Value BuiltinAbs(Interpreter& interp, CallArgs& args) {
  CheckArity("abs", args, 1, 1);
  const Value& v = args.args[0];
  if (v.IsBig() || (v.IsIntLike() && v.AsInt() == std::numeric_limits<int64_t>::min())) {
    return Value::Big(abs(v.ToMpz()));
  }
  if (v.IsIntLike()) return Value::Int(std::abs(v.AsInt()));
  if (v.IsFloat()) return Value::Float(std::fabs(v.AsFloat()));
  if (v.Is(ObjectKind::TIMEDELTA)) {
    return Value::Obj(interp.heap().Make<TimeDeltaObject>(std::abs(v.As<TimeDeltaObject>()->micros)));
  }
  throw ScriptError(ExcType::TYPE_ERROR, fmt::format("bad operand type for abs(): '{}'", TypeName(v)));
}

Value BuiltinRound(Interpreter&, CallArgs& args) {
  auto number = Arg("round", args, 0, "number");
  auto ndigits = Arg("round", args, 1, "ndigits");
  CheckNoKwargs("round", args);
  if (args.args.size() > 2) CheckArity("round", args, 1, 2);
  if (!number) throw ScriptError(ExcType::TYPE_ERROR, "round() missing required argument 'number' (pos 1)");
  const Value& v = *number;
  bool has_digits = ndigits && !ndigits->IsNone();
  int64_t digits = has_digits ? AsIndex(*ndigits) : 0;
  if (v.IsIntLike()) {
    if (!has_digits || digits >= 0) return v.IsBool() ? Value::Int(v.AsInt()) : v;
    mpz_class x = v.ToMpz();
    // sizeinbase may overstate the digit count by one
    if (digits < -(int64_t)mpz_sizeinbase(x.get_mpz_t(), 10) - 1) return Value::Int(0);
    mpz_class scale;
    mpz_ui_pow_ui(scale.get_mpz_t(), 10, (unsigned long)-digits);
    mpz_class q, r;
    mpz_fdiv_qr(q.get_mpz_t(), r.get_mpz_t(), x.get_mpz_t(), scale.get_mpz_t());
    // half to even
    mpz_class twice = 2 * r;
    int half = cmp(twice, scale);
    if (half > 0 || (half == 0 && mpz_odd_p(q.get_mpz_t()))) q += 1;
    return Value::Big(q * scale);
  }
  if (!v.IsFloat()) {
    throw ScriptError(ExcType::TYPE_ERROR, fmt::format("type {} doesn't define __round__ method", TypeName(v)));
  }
  double x = v.AsFloat();
  if (!has_digits) return FloatToInt(std::nearbyint(x));
  if (!std::isfinite(x) || digits > 323) return Value::Float(x);
  if (digits >= 0) {
    // correctly rounded through the decimal representation
    std::string text = fmt::format("{:.{}f}", x, digits);
    return Value::Float(std::strtod(text.c_str(), nullptr));
  }
  if (digits < -308) return Value::Float(std::copysign(0.0, x));
  double scale = std::pow(10.0, (double)-digits);
  double y = std::nearbyint(x / scale) * scale;
  if (std::isinf(y)) throw ScriptError(ExcType::OVERFLOW_ERROR, "rounded value too large to represent");
  return Value::Float(y);
}

Value BuiltinSorted(Interpreter& interp, CallArgs& args) {
  auto key = TakeKwarg(args, "key");
  auto reverse = TakeKwarg(args, "reverse");
  CheckNoKwargs("sorted", args);
  if (args.args.size() != 1) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("sorted expected 1 argument, got {}", args.args.size()));
  }
  std::vector<Value> items = interp.Collect(args.args[0]);
  SortValues(interp, items, key ? *key : Value(), reverse && Truthy(*reverse));
  return interp.NewList(std::move(items));
}

Value BuiltinReversed(Interpreter& interp, CallArgs& args) {
  CheckArity("reversed", args, 1, 1);
  const Value& v = args.args[0];
  std::string type_name = "reversed";
  if (v.Is(ObjectKind::LIST)) {
    type_name = "list_reverseiterator";
  } else if (v.Is(ObjectKind::RANGE)) {
    type_name = "range_iterator";
  } else if (v.Is(ObjectKind::DICT) || v.Is(ObjectKind::DICT_VIEW)) {
    type_name = "dict_reversekeyiterator";
  } else if (!v.IsStr() && !v.Is(ObjectKind::TUPLE)) {
    throw ScriptError(ExcType::TYPE_ERROR, fmt::format("'{}' object is not reversible", TypeName(v)));
  }
  return interp.NewIterator(std::make_unique<ReverseIter>(interp.Collect(v)), type_name);
}

Value BuiltinZip(Interpreter& interp, CallArgs& args) {
  auto strict = TakeKwarg(args, "strict");
  CheckNoKwargs("zip", args);
  std::vector<std::unique_ptr<Iter>> iters;
  for (auto& arg : args.args) iters.push_back(interp.GetIter(arg));
  return interp.NewIterator(
      std::make_unique<ZipIter>(std::move(iters), strict && Truthy(*strict), interp), "zip");
}

Value BuiltinAny(Interpreter& interp, CallArgs& args) {
  CheckArity("any", args, 1, 1);
  auto iter = interp.GetIter(args.args[0]);
  Value item;
  while (iter->Next(item)) {
    interp.Tick();
    if (Truthy(item)) return Value::Bool(true);
  }
  return Value::Bool(false);
}

Value BuiltinAll(Interpreter& interp, CallArgs& args) {
  CheckArity("all", args, 1, 1);
  auto iter = interp.GetIter(args.args[0]);
  Value item;
  while (iter->Next(item)) {
    interp.Tick();
    if (!Truthy(item)) return Value::Bool(false);
  }
  return Value::Bool(true);
}

Value BuiltinMap(Interpreter& interp, CallArgs& args) {
  CheckNoKwargs("map", args);
  if (args.args.size() < 2) throw ScriptError(ExcType::TYPE_ERROR, "map() must have at least two arguments.");
  std::vector<std::unique_ptr<Iter>> iters;
  for (size_t i = 1; i < args.args.size(); i++) iters.push_back(interp.GetIter(args.args[i]));
  return interp.NewIterator(std::make_unique<MapIter>(args.args[0], std::move(iters), interp), "map");
}

Value BuiltinFilter(Interpreter& interp, CallArgs& args) {
  CheckNoKwargs("filter", args);
  if (args.args.size() != 2) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("filter expected 2 arguments, got {}", args.args.size()));
  }
  return interp.NewIterator(
      std::make_unique<FilterIter>(args.args[0], interp.GetIter(args.args[1]), interp), "filter");
}

} // namespace interp
