#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "builtins.h"
#include "format.h"
#include "modules.h"

namespace interp {

namespace {

class JsonEncoder {
  Interpreter& interp_;
  bool skip_keys_;
  bool ensure_ascii_;
  bool allow_nan_;
  bool sort_keys_;
  std::optional<std::string> indent_;
  std::string item_separator_;
  std::string key_separator_;
  Value default_;
  std::vector<const Object*> active_;
  std::string out_;

  void Newline(int level) {
    if (!indent_) return;
    out_ += '\n';
    for (int i = 0; i < level; i++) out_ += *indent_;
  }

  void EncodeString(const std::string& str) {
    out_ += nlohmann::json(str).dump(-1, ' ', ensure_ascii_, nlohmann::json::error_handler_t::replace);
  }

  std::string FloatText(double x) {
    if (std::isfinite(x)) return FloatRepr(x);
    if (!allow_nan_) {
      throw ScriptError(ExcType::VALUE_ERROR,
          fmt::format("Out of range float values are not JSON compliant: {}", FloatRepr(x)));
    }
    if (std::isnan(x)) return "NaN";
    return x > 0 ? "Infinity" : "-Infinity";
  }

  // nullopt when the key is skipped
  std::optional<std::string> KeyText(const Value& key) {
    if (key.IsStr()) return key.AsStr();
    if (key.IsBool()) return std::string(key.AsBool() ? "true" : "false");
    if (key.IsInt()) return std::to_string(key.AsInt());
    if (key.IsBig()) return ToRepr(key);
    if (key.IsFloat()) return FloatText(key.AsFloat());
    if (key.IsNone()) return std::string("null");
    if (skip_keys_) return std::nullopt;
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("keys must be str, int, float, bool or None, not {}", TypeName(key)));
  }

  void Enter(const Object* obj, int level) {
    if (std::find(active_.begin(), active_.end(), obj) != active_.end()) {
      throw ScriptError(ExcType::VALUE_ERROR, "Circular reference detected");
    }
    if (level >= kMaxReprDepth) {
      throw ScriptError(ExcType::RECURSION_ERROR, "maximum recursion depth exceeded while encoding a JSON object");
    }
    active_.push_back(obj);
  }

  void EncodeSequence(const Object* obj, const std::vector<Value>& items, int level) {
    if (items.empty()) {
      out_ += "[]";
      return;
    }
    Enter(obj, level);
    out_ += '[';
    Newline(level + 1);
    for (size_t i = 0; i < items.size(); i++) {
      if (i) {
        out_ += item_separator_;
        Newline(level + 1);
      }
      Encode(items[i], level + 1);
    }
    Newline(level);
    out_ += ']';
    active_.pop_back();
  }

  void EncodeDict(const DictObject* dict, int level) {
    if (!dict->table.Size()) {
      out_ += "{}";
      return;
    }
    Enter(dict, level);
    std::vector<std::pair<Value, Value>> entries = dict->table.Entries();
    if (sort_keys_) {
      std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return LessThan(a.first, b.first);
      });
    }
    out_ += '{';
    Newline(level + 1);
    bool first = true;
    for (auto& [key, value] : entries) {
      auto text = KeyText(key);
      if (!text) continue;
      if (!first) {
        out_ += item_separator_;
        Newline(level + 1);
      }
      first = false;
      EncodeString(*text);
      out_ += key_separator_;
      Encode(value, level + 1);
    }
    Newline(level);
    out_ += '}';
    active_.pop_back();
  }

  void Encode(const Value& v, int level) {
    interp_.Tick();
    if (v.IsNone()) {
      out_ += "null";
    } else if (v.IsBool()) {
      out_ += v.AsBool() ? "true" : "false";
    } else if (v.IsInt()) {
      out_ += std::to_string(v.AsInt());
    } else if (v.IsBig()) {
      out_ += ToRepr(v);
    } else if (v.IsFloat()) {
      out_ += FloatText(v.AsFloat());
    } else if (v.IsStr()) {
      EncodeString(v.AsStr());
    } else if (v.Is(ObjectKind::LIST)) {
      EncodeSequence(v.AsObject(), v.As<ListObject>()->items, level);
    } else if (v.Is(ObjectKind::TUPLE)) {
      EncodeSequence(v.AsObject(), v.As<TupleObject>()->items, level);
    } else if (v.Is(ObjectKind::DICT)) {
      EncodeDict(v.As<DictObject>(), level);
    } else if (!default_.IsNone()) {
      Enter(v.AsObject(), level);
      Encode(interp_.Call(default_, std::vector<Value>{v}), level + 1);
      active_.pop_back();
    } else {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("Object of type {} is not JSON serializable", TypeName(v)));
    }
    interp_.CheckLength(out_.size());
  }

 public:
  explicit JsonEncoder(Interpreter& interp) :
      interp_(interp), skip_keys_(false), ensure_ascii_(true), allow_nan_(true), sort_keys_(false),
      item_separator_(", "), key_separator_(": ") {}

  void Configure(CallArgs& args) {
    if (auto v = TakeKwarg(args, "skipkeys")) skip_keys_ = Truthy(*v);
    if (auto v = TakeKwarg(args, "ensure_ascii")) ensure_ascii_ = Truthy(*v);
    if (auto v = TakeKwarg(args, "allow_nan")) allow_nan_ = Truthy(*v);
    if (auto v = TakeKwarg(args, "sort_keys")) sort_keys_ = Truthy(*v);
    if (auto v = TakeKwarg(args, "default")) default_ = *v;
    TakeKwarg(args, "check_circular"); // always checked
    if (auto v = TakeKwarg(args, "indent"); v && !v->IsNone()) {
      if (v->IsIntLike()) {
        indent_ = std::string(std::max<int64_t>(v->AsInt(), 0), ' ');
      } else if (v->IsStr()) {
        indent_ = v->AsStr();
      } else {
        throw ScriptError(ExcType::TYPE_ERROR,
            fmt::format("indent must be None, int or str, not {}", TypeName(*v)));
      }
      item_separator_ = ",";
    }
    if (auto v = TakeKwarg(args, "separators"); v && !v->IsNone()) {
      std::vector<Value> parts = interp_.Collect(*v);
      if (parts.size() != 2) {
        throw ScriptError(ExcType::VALUE_ERROR,
            fmt::format("too many values to unpack (expected 2, got {})", parts.size()));
      }
      item_separator_ = AsString(parts[0], "item separator");
      key_separator_ = AsString(parts[1], "key separator");
    }
  }

  std::string Run(const Value& v) {
    Encode(v, 0);
    return std::move(out_);
  }
};

// Builds script values straight from the parser events
class ValueBuilder : public nlohmann::json_sax<nlohmann::json> {
  Interpreter& interp_;
  std::vector<Value> containers_;
  std::vector<Value> keys_;
  Value result_;

 public:
  std::string error;
  size_t error_position;
  std::string error_token;

  explicit ValueBuilder(Interpreter& interp) : interp_(interp), error_position(0) {}

  const Value& result() const { return result_; }

  bool Add(Value v) {
    if (containers_.empty()) {
      result_ = std::move(v);
      return true;
    }
    const Value& top = containers_.back();
    if (top.Is(ObjectKind::LIST)) {
      auto& items = top.As<ListObject>()->items;
      interp_.CheckLength(items.size() + 1);
      items.push_back(std::move(v));
    } else {
      top.As<DictObject>()->table.Set(keys_.back(), std::move(v));
    }
    return true;
  }

  bool null() override { return Add(Value()); }
  bool boolean(bool v) override { return Add(Value::Bool(v)); }
  bool number_integer(number_integer_t v) override { return Add(Value::Int(v)); }
  bool number_unsigned(number_unsigned_t v) override {
    if (v > (number_unsigned_t)std::numeric_limits<int64_t>::max()) {
      return Add(Value::Big(mpz_class((unsigned long)v)));
    }
    return Add(Value::Int((int64_t)v));
  }
  // integers beyond 64 bits arrive here with their source text
  bool number_float(number_float_t v, const string_t& text) override {
    if (text.find_first_of(".eE") == string_t::npos) {
      if (auto number = ParseInt(text, 10)) return Add(std::move(*number));
    }
    return Add(Value::Float(v));
  }
  bool string(string_t& v) override {
    interp_.CheckLength(v.size());
    return Add(Value::Str(std::move(v)));
  }
  bool binary(binary_t&) override { return false; }

  bool start_object(std::size_t) override {
    Value dict = Value::Obj(interp_.heap().Make<DictObject>());
    Add(dict);
    containers_.push_back(dict);
    keys_.emplace_back();
    return true;
  }
  bool key(string_t& v) override {
    keys_.back() = Value::Str(std::move(v));
    return true;
  }
  bool end_object() override {
    interp_.heap().Track(containers_.back().AsObject());
    containers_.pop_back();
    keys_.pop_back();
    return true;
  }
  bool start_array(std::size_t) override {
    Value list = interp_.NewList();
    Add(list);
    containers_.push_back(list);
    keys_.emplace_back();
    return true;
  }
  bool end_array() override {
    interp_.heap().Track(containers_.back().AsObject());
    containers_.pop_back();
    keys_.pop_back();
    return true;
  }

  bool parse_error(std::size_t position, const std::string& last_token,
                   const nlohmann::detail::exception& ex) override {
    error = ex.what();
    error_position = position;
    error_token = last_token;
    return false;
  }
};

std::string DecodeErrorMessage(const std::string& what, const std::string& token) {
  if (!token.empty() && token[0] == '"') {
    if (what.find("control character") != std::string::npos) return "Invalid control character at";
    if (what.find("escape") != std::string::npos) return "Invalid \\escape";
    return "Unterminated string starting at";
  }
  if (what.find("expected end of input") != std::string::npos) return "Extra data";
  if (what.find("object key") != std::string::npos) return "Expecting property name enclosed in double quotes";
  if (what.find("object separator") != std::string::npos) return "Expecting ':' delimiter";
  if (what.find("expected ']'") != std::string::npos || what.find("expected '}'") != std::string::npos) {
    return "Expecting ',' delimiter";
  }
  return "Expecting value";
}

[[noreturn]] void RaiseDecodeError(const std::string& text, const ValueBuilder& builder) {
  size_t start = builder.error_position >= builder.error_token.size() ?
      builder.error_position - builder.error_token.size() : 0;
  start = std::min(start, text.size());
  std::string before = text.substr(0, start);
  size_t line = 1 + std::count(before.begin(), before.end(), '\n');
  size_t line_start = before.rfind('\n');
  size_t column = CodePointCount(line_start == std::string::npos ? before : before.substr(line_start + 1)) + 1;
  throw ScriptError(ExcType::JSON_DECODE_ERROR,
      fmt::format("{}: line {} column {} (char {})", DecodeErrorMessage(builder.error, builder.error_token),
                  line, column, CodePointCount(before)));
}

Value JsonDumps(Interpreter& interp, CallArgs& args) {
  JsonEncoder encoder(interp);
  encoder.Configure(args);
  auto obj = Arg("dumps", args, 0, "obj");
  CheckArity("dumps", args, 0, 1);
  if (!obj) throw ScriptError(ExcType::TYPE_ERROR, "dumps() missing 1 required positional argument: 'obj'");
  return Value::Str(encoder.Run(*obj));
}

Value JsonLoads(Interpreter& interp, CallArgs& args) {
  auto s = Arg("loads", args, 0, "s");
  CheckArity("loads", args, 0, 1);
  if (!s) throw ScriptError(ExcType::TYPE_ERROR, "loads() missing 1 required positional argument: 's'");
  if (!s->IsStr()) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("the JSON object must be str, bytes or bytearray, not {}", TypeName(*s)));
  }
  const std::string& text = s->AsStr();
  ValueBuilder builder(interp);
  if (!nlohmann::json::sax_parse(text, &builder)) RaiseDecodeError(text, builder);
  return builder.result();
}

} // namespace

ModuleObject* MakeJsonModule(Heap& heap) {
  auto module = heap.Make<ModuleObject>("json");
  module->members = {
    {"dumps", Value::Obj(heap.Make<BuiltinObject>("dumps", JsonDumps))},
    {"loads", Value::Obj(heap.Make<BuiltinObject>("loads", JsonLoads))},
    {"JSONDecodeError", Value::Obj(heap.Make<ExceptionTypeObject>(ExcType::JSON_DECODE_ERROR))},
  };
  return module;
}

} // namespace interp
