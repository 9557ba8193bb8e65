#include "format.h"

#include <charconv>
#include <cmath>
#include <functional>

#include <fmt/core.h>
#include <fmt/format.h>

#include "builtins.h"
#include "interpreter.h"
#include "modules.h"

namespace interp {

const int kMaxReprDepth = 500;
const size_t kMaxIntDigits = 4300;

namespace {

struct FormatSpec {
  std::string fill = " ";
  char align = 0;
  char sign = '-';
  bool alternate = false;
  bool zero = false;
  size_t width = 0;
  char grouping = 0;
  int precision = -1;
  char type = 0;
};

bool IsAlign(char c) {
  return c == '<' || c == '>' || c == '^' || c == '=';
}

[[noreturn]] void InvalidSpec(const std::string& spec, const Value& v) {
  throw ScriptError(ExcType::VALUE_ERROR,
      fmt::format("Invalid format specifier '{}' for object of type '{}'", spec, TypeName(v)));
}

FormatSpec ParseSpec(const std::string& spec, const Value& v) {
  FormatSpec ret;
  size_t pos = 0;
  if (!spec.empty()) {
    size_t after = 0;
    DecodeUtf8(spec, after);
    if (after < spec.size() && IsAlign(spec[after])) {
      ret.fill = spec.substr(0, after);
      ret.align = spec[after];
      pos = after + 1;
    } else if (IsAlign(spec[0])) {
      ret.align = spec[0];
      pos = 1;
    }
  }
  if (pos < spec.size() && (spec[pos] == '+' || spec[pos] == '-' || spec[pos] == ' ')) ret.sign = spec[pos++];
  if (pos < spec.size() && spec[pos] == '#') {
    ret.alternate = true;
    pos++;
  }
  if (pos < spec.size() && spec[pos] == '0') {
    ret.zero = true;
    pos++;
  }
  while (pos < spec.size() && isdigit((unsigned char)spec[pos])) {
    ret.width = ret.width * 10 + (spec[pos++] - '0');
    if (ret.width > 100000) throw ScriptError(ExcType::VALUE_ERROR, "Too many decimal digits in format string");
  }
  if (pos < spec.size() && (spec[pos] == ',' || spec[pos] == '_')) ret.grouping = spec[pos++];
  if (pos < spec.size() && spec[pos] == '.') {
    pos++;
    if (pos >= spec.size() || !isdigit((unsigned char)spec[pos])) {
      throw ScriptError(ExcType::VALUE_ERROR, "Format specifier missing precision");
    }
    ret.precision = 0;
    while (pos < spec.size() && isdigit((unsigned char)spec[pos])) {
      ret.precision = ret.precision * 10 + (spec[pos++] - '0');
      if (ret.precision > 100000) throw ScriptError(ExcType::VALUE_ERROR, "Too many decimal digits in format string");
    }
  }
  if (pos < spec.size()) ret.type = spec[pos++];
  if (pos != spec.size()) InvalidSpec(spec, v);
  if (ret.zero && !ret.align) {
    ret.fill = "0";
    ret.align = '=';
  }
  return ret;
}

// sign is placed before the '=' padding
std::string Pad(const std::string& sign, const std::string& body, const FormatSpec& spec, char default_align) {
  size_t length = CodePointCount(sign) + CodePointCount(body);
  if (spec.width <= length) return sign + body;
  size_t padding = spec.width - length;
  auto fill = [&](size_t n) {
    std::string ret;
    for (size_t i = 0; i < n; i++) ret += spec.fill;
    return ret;
  };
  switch (spec.align ? spec.align : default_align) {
    case '<': return sign + body + fill(padding);
    case '^': return fill(padding / 2) + sign + body + fill(padding - padding / 2);
    case '=': return sign + fill(padding) + body;
    default: return fill(padding) + sign + body;
  }
}

std::string Group(const std::string& digits, char separator, size_t interval) {
  std::string ret;
  size_t count = 0;
  for (size_t i = digits.size(); i-- > 0;) {
    if (count && count % interval == 0) ret += separator;
    ret += digits[i];
    count++;
  }
  return std::string(ret.rbegin(), ret.rend());
}

std::string SignOf(bool negative, char sign) {
  if (negative) return "-";
  if (sign == '+') return "+";
  if (sign == ' ') return " ";
  return "";
}

std::string FormatFloatBody(double x, FormatSpec& spec) {
  // x is non-negative here
  char type = spec.type;
  int precision = spec.precision;
  std::string body;
  bool upper = type == 'F' || type == 'E' || type == 'G';
  if (std::isinf(x) || std::isnan(x)) {
    body = std::isinf(x) ? "inf" : "nan";
  } else if (type == 0 && precision < 0) {
    body = FloatRepr(x);
  } else {
    if (precision < 0) precision = 6;
    switch (type) {
      case 'f': case 'F':
        body = fmt::format("{:.{}f}", x, precision);
        break;
      case 'e': case 'E':
        body = fmt::format("{:.{}e}", x, precision);
        break;
      case '%':
        body = fmt::format("{:.{}f}", x * 100, precision) + "%";
        break;
      case 0:
      case 'g': case 'G': case 'n':
        if (spec.alternate) {
          body = fmt::format("{:#.{}g}", x, precision ? precision : 1);
        } else {
          body = fmt::format("{:.{}g}", x, precision ? precision : 1);
        }
        if (type == 0 && body.find_first_of(".e") == std::string::npos) body += ".0";
        break;
      default:
        break;
    }
  }
  if (upper) {
    for (auto& c : body) c = toupper(c);
  }
  if (spec.grouping) {
    size_t end = body.find_first_not_of("0123456789");
    if (end == std::string::npos) end = body.size();
    body = Group(body.substr(0, end), spec.grouping, 3) + body.substr(end);
  }
  return body;
}

std::string FormatFloat(double x, FormatSpec& spec) {
  bool negative = std::signbit(x) && !std::isnan(x);
  return Pad(SignOf(negative, spec.sign), FormatFloatBody(std::fabs(x), spec), spec, '>');
}

[[noreturn]] void DigitLimit() {
  throw ScriptError(ExcType::VALUE_ERROR,
      fmt::format("Exceeds the limit ({} digits) for integer string conversion; "
                  "use sys.set_int_max_str_digits() to increase the limit", kMaxIntDigits));
}

// sizeinbase may overstate the digit count by one
std::string DecimalDigits(const mpz_class& x) {
  if (mpz_sizeinbase(x.get_mpz_t(), 10) > kMaxIntDigits + 1) DigitLimit();
  std::string ret = x.get_str();
  if (ret.size() - (ret[0] == '-') > kMaxIntDigits) DigitLimit();
  return ret;
}

std::string FormatInt(const mpz_class& x, FormatSpec& spec, const Value& v) {
  switch (spec.type) {
    case 'e': case 'E': case 'f': case 'F': case 'g': case 'G': case '%':
      return FormatFloat(Value::Big(x).AsFloat(), spec);
    default:
      break;
  }
  if (spec.precision >= 0) {
    throw ScriptError(ExcType::VALUE_ERROR, "Precision not allowed in integer format specifier");
  }
  if (spec.type == 'c') {
    if (x < 0 || x > 0x10FFFF) throw ScriptError(ExcType::OVERFLOW_ERROR, "%c arg not in range(0x110000)");
    std::string body;
    AppendUtf8(body, (uint32_t)x.get_ui());
    return Pad("", body, spec, '>');
  }
  mpz_class magnitude = abs(x);
  std::string digits, prefix;
  size_t interval = 3;
  switch (spec.type) {
    case 0: case 'd': case 'n':
      digits = DecimalDigits(magnitude);
      break;
    case 'b':
      digits = magnitude.get_str(2);
      prefix = "0b";
      interval = 4;
      break;
    case 'o':
      digits = magnitude.get_str(8);
      prefix = "0o";
      interval = 4;
      break;
    case 'x':
      digits = magnitude.get_str(16);
      prefix = "0x";
      interval = 4;
      break;
    case 'X':
      digits = magnitude.get_str(-16);
      prefix = "0X";
      interval = 4;
      break;
    default:
      throw ScriptError(ExcType::VALUE_ERROR,
          fmt::format("Unknown format code '{}' for object of type '{}'", spec.type, TypeName(v)));
  }
  if (spec.grouping) digits = Group(digits, spec.grouping, interval);
  std::string sign = SignOf(x < 0, spec.sign);
  if (spec.alternate) sign += prefix;
  return Pad(sign, digits, spec, '>');
}

std::string FormatStr(const std::string& str, FormatSpec& spec, const Value& v) {
  if (spec.type && spec.type != 's') {
    throw ScriptError(ExcType::VALUE_ERROR,
        fmt::format("Unknown format code '{}' for object of type '{}'", spec.type, TypeName(v)));
  }
  if (spec.sign != '-') throw ScriptError(ExcType::VALUE_ERROR, "Sign not allowed in string format specifier");
  if (spec.align == '=') {
    throw ScriptError(ExcType::VALUE_ERROR, "'=' alignment not allowed in string format specifier");
  }
  std::string body = str;
  if (spec.precision >= 0 && CodePointCount(body) > (size_t)spec.precision) {
    auto chars = SplitCodePoints(body);
    body.clear();
    for (int i = 0; i < spec.precision; i++) body += chars[i];
  }
  return Pad("", body, spec, '<');
}

std::string EscapeNonAscii(const std::string& str) {
  std::string ret;
  size_t pos = 0;
  while (pos < str.size()) {
    uint32_t cp = DecodeUtf8(str, pos);
    if (cp < 0x80) {
      ret += (char)cp;
    } else if (cp <= 0xff) {
      ret += fmt::format("\\x{:02x}", cp);
    } else if (cp <= 0xffff) {
      ret += fmt::format("\\u{:04x}", cp);
    } else {
      ret += fmt::format("\\U{:08x}", cp);
    }
  }
  return ret;
}

std::string ReprImpl(const Value& v, std::vector<const Object*>& active);

std::string JoinRepr(const std::vector<Value>& items, std::vector<const Object*>& active) {
  std::string ret;
  for (size_t i = 0; i < items.size(); i++) {
    if (i) ret += ", ";
    ret += ReprImpl(items[i], active);
  }
  return ret;
}

std::string ContainerRepr(const Object* obj, std::vector<const Object*>& active) {
  switch (obj->kind) {
    case ObjectKind::LIST:
      return "[" + JoinRepr(static_cast<const ListObject*>(obj)->items, active) + "]";
    case ObjectKind::TUPLE: {
      auto& items = static_cast<const TupleObject*>(obj)->items;
      if (items.size() == 1) return "(" + ReprImpl(items[0], active) + ",)";
      return "(" + JoinRepr(items, active) + ")";
    }
    case ObjectKind::DICT: {
      std::string ret = "{";
      bool first = true;
      for (auto& [key, value] : static_cast<const DictObject*>(obj)->table.Entries()) {
        if (!first) ret += ", ";
        first = false;
        ret += ReprImpl(key, active) + ": " + ReprImpl(value, active);
      }
      return ret + "}";
    }
    case ObjectKind::SET: {
      auto& table = static_cast<const SetObject*>(obj)->table;
      if (!table.Size()) return "set()";
      std::string ret = "{";
      bool first = true;
      for (auto& entry : table.Entries()) {
        if (!first) ret += ", ";
        first = false;
        ret += ReprImpl(entry.first, active);
      }
      return ret + "}";
    }
    case ObjectKind::DICT_VIEW: {
      auto view = static_cast<const DictViewObject*>(obj);
      std::string ret;
      bool first = true;
      for (auto& [key, value] : view->dict->table.Entries()) {
        if (!first) ret += ", ";
        first = false;
        switch (view->view) {
          case ViewKind::KEYS: ret += ReprImpl(key, active); break;
          case ViewKind::VALUES: ret += ReprImpl(value, active); break;
          case ViewKind::ITEMS: ret += "(" + ReprImpl(key, active) + ", " + ReprImpl(value, active) + ")"; break;
        }
      }
      return TypeName(Value::Obj(const_cast<Object*>(obj))) + "([" + ret + "])";
    }
    case ObjectKind::EXCEPTION: {
      auto exc = static_cast<const ExceptionObject*>(obj);
      return std::string(ExcTypeName(exc->type)) + "(" + JoinRepr(exc->args, active) + ")";
    }
    default:
      break;
  }
  __builtin_unreachable();
}

std::string ReprImpl(const Value& v, std::vector<const Object*>& active) {
  if (v.IsNone()) return "None";
  if (v.IsBool()) return v.AsBool() ? "True" : "False";
  if (v.IsInt()) return std::to_string(v.AsInt());
  if (v.IsBig()) return DecimalDigits(v.AsBig());
  if (v.IsFloat()) return FloatRepr(v.AsFloat());
  if (v.IsStr()) return QuoteString(v.AsStr());
  const Object* obj = v.AsObject();
  switch (obj->kind) {
    case ObjectKind::LIST:
    case ObjectKind::TUPLE:
    case ObjectKind::DICT:
    case ObjectKind::SET:
    case ObjectKind::DICT_VIEW:
    case ObjectKind::EXCEPTION: {
      for (auto seen : active) {
        if (seen == obj) {
          return obj->kind == ObjectKind::LIST ? "[...]" : obj->kind == ObjectKind::DICT ? "{...}" : "...";
        }
      }
      if ((int)active.size() >= kMaxReprDepth) {
        throw ScriptError(ExcType::RECURSION_ERROR,
            "maximum recursion depth exceeded while getting the repr of an object");
      }
      active.push_back(obj);
      std::string ret = ContainerRepr(obj, active);
      active.pop_back();
      return ret;
    }
    case ObjectKind::RANGE: {
      auto range = static_cast<const RangeObject*>(obj);
      if (range->step == 1) return fmt::format("range({}, {})", range->start, range->stop);
      return fmt::format("range({}, {}, {})", range->start, range->stop, range->step);
    }
    case ObjectKind::ITERATOR:
      return fmt::format("<{} object at {}>", static_cast<const IteratorObject*>(obj)->type_name, fmt::ptr(obj));
    case ObjectKind::FUNCTION:
      return fmt::format("<function {} at {}>", static_cast<const FunctionObject*>(obj)->def->name, fmt::ptr(obj));
    case ObjectKind::BUILTIN: {
      auto builtin = static_cast<const BuiltinObject*>(obj);
      if (builtin->is_type) return fmt::format("<class '{}'>", builtin->name);
      if (builtin->method) return fmt::format("<method '{}' objects>", builtin->name);
      return fmt::format("<built-in function {}>", builtin->name);
    }
    case ObjectKind::BOUND_METHOD: {
      auto method = static_cast<const BoundMethodObject*>(obj);
      return fmt::format("<built-in method {} of {} object at {}>", method->name, TypeName(method->self),
                         fmt::ptr(method->self.IsObject() ? method->self.AsObject() : obj));
    }
    case ObjectKind::MODULE:
      return fmt::format("<module '{}' (built-in)>", static_cast<const ModuleObject*>(obj)->name);
    case ObjectKind::EXCEPTION_TYPE: {
      ExcType type = static_cast<const ExceptionTypeObject*>(obj)->type;
      if (type == ExcType::JSON_DECODE_ERROR) return "<class 'json.decoder.JSONDecodeError'>";
      return fmt::format("<class '{}'>", ExcTypeName(type));
    }
    case ObjectKind::DATETIME:
    case ObjectKind::DATE:
    case ObjectKind::TIMEDELTA:
      return TemporalRepr(obj);
    case ObjectKind::SCOPE:
      return fmt::format("<scope object at {}>", fmt::ptr(obj));
  }
  __builtin_unreachable();
}

} // namespace

std::string FloatRepr(double x) {
  if (std::isnan(x)) return "nan";
  if (std::isinf(x)) return x > 0 ? "inf" : "-inf";
  char buf[64];
  auto res = std::to_chars(buf, buf + sizeof(buf), x, std::chars_format::scientific);
  std::string str(buf, res.ptr);
  bool negative = str[0] == '-';
  if (negative) str.erase(0, 1);
  size_t e = str.find('e');
  int exp = std::stoi(str.substr(e + 1));
  std::string digits;
  for (size_t i = 0; i < e; i++) {
    if (str[i] != '.') digits += str[i];
  }
  std::string ret;
  if (exp >= -4 && exp < 16) {
    if (exp >= 0) {
      size_t int_length = exp + 1;
      if (digits.size() <= int_length) {
        ret = digits + std::string(int_length - digits.size(), '0') + ".0";
      } else {
        ret = digits.substr(0, int_length) + "." + digits.substr(int_length);
      }
    } else {
      ret = "0." + std::string(-exp - 1, '0') + digits;
    }
  } else {
    ret = digits.substr(0, 1);
    if (digits.size() > 1) ret += "." + digits.substr(1);
    ret += fmt::format("e{}{:02d}", exp < 0 ? '-' : '+', std::abs(exp));
  }
  return negative ? "-" + ret : ret;
}

std::string QuoteString(const std::string& str) {
  char quote = str.find('\'') != std::string::npos && str.find('"') == std::string::npos ? '"' : '\'';
  std::string ret(1, quote);
  size_t pos = 0;
  while (pos < str.size()) {
    size_t start = pos;
    uint32_t cp = DecodeUtf8(str, pos);
    switch (cp) {
      case '\\': ret += "\\\\"; continue;
      case '\n': ret += "\\n"; continue;
      case '\r': ret += "\\r"; continue;
      case '\t': ret += "\\t"; continue;
      default: break;
    }
    if (cp == (uint32_t)quote) {
      ret += '\\';
      ret += quote;
    } else if (cp < 0x20 || cp == 0x7f || (cp >= 0x80 && cp < 0xa0)) {
      ret += fmt::format("\\x{:02x}", cp);
    } else {
      ret += str.substr(start, pos - start);
    }
  }
  return ret + quote;
}

std::string ToRepr(const Value& v) {
  std::vector<const Object*> active;
  return ReprImpl(v, active);
}

std::string AsciiRepr(const Value& v) {
  return EscapeNonAscii(ToRepr(v));
}

std::string ToStr(const Value& v) {
  if (v.IsStr()) return v.AsStr();
  if (v.Is(ObjectKind::EXCEPTION)) return ExceptionStr(v.As<ExceptionObject>());
  if (v.Is(ObjectKind::DATETIME) || v.Is(ObjectKind::DATE) || v.Is(ObjectKind::TIMEDELTA)) {
    return TemporalStr(v.AsObject());
  }
  return ToRepr(v);
}

std::string ExceptionStr(const ExceptionObject* exc) {
  if (exc->args.empty()) return "";
  if (exc->args.size() == 1) {
    return exc->type == ExcType::KEY_ERROR ? ToRepr(exc->args[0]) : ToStr(exc->args[0]);
  }
  std::vector<const Object*> active;
  return "(" + JoinRepr(exc->args, active) + ")";
}

std::string FormatValue(const Value& v, const std::string& spec_text) {
  if (v.Is(ObjectKind::DATETIME) || v.Is(ObjectKind::DATE)) {
    if (spec_text.empty()) return ToStr(v);
    return TemporalStrftime(v.AsObject(), spec_text);
  }
  if (spec_text.empty()) return ToStr(v);
  FormatSpec spec = ParseSpec(spec_text, v);
  if (v.IsIntLike()) return FormatInt(v.ToMpz(), spec, v);
  if (v.IsFloat()) {
    switch (spec.type) {
      case 0: case 'e': case 'E': case 'f': case 'F': case 'g': case 'G': case 'n': case '%':
        break;
      default:
        throw ScriptError(ExcType::VALUE_ERROR,
            fmt::format("Unknown format code '{}' for object of type 'float'", spec.type));
    }
    return FormatFloat(v.AsFloat(), spec);
  }
  if (v.IsStr()) return FormatStr(v.AsStr(), spec, v);
  if (v.Is(ObjectKind::TIMEDELTA)) return FormatStr(ToStr(v), spec, v);
  throw ScriptError(ExcType::TYPE_ERROR,
      fmt::format("unsupported format string passed to {}.__format__", TypeName(v)));
}

std::string PercentFormat(const std::string& format, const Value& args) {
  std::vector<Value> values;
  const DictObject* mapping = nullptr;
  if (args.Is(ObjectKind::TUPLE)) {
    values = args.As<TupleObject>()->items;
  } else {
    if (args.Is(ObjectKind::DICT)) mapping = args.As<DictObject>();
    values.push_back(args);
  }
  size_t next = 0;
  std::string ret;
  size_t pos = 0;
  while (pos < format.size()) {
    size_t percent = format.find('%', pos);
    if (percent == std::string::npos) {
      ret += format.substr(pos);
      break;
    }
    ret += format.substr(pos, percent - pos);
    pos = percent + 1;
    if (pos >= format.size()) throw ScriptError(ExcType::VALUE_ERROR, "incomplete format");
    const Value* arg = nullptr;
    if (format[pos] == '(') {
      size_t close = format.find(')', pos);
      if (close == std::string::npos) throw ScriptError(ExcType::VALUE_ERROR, "incomplete format key");
      if (!mapping) throw ScriptError(ExcType::TYPE_ERROR, "format requires a mapping");
      Value key = Value::Str(format.substr(pos + 1, close - pos - 1));
      arg = mapping->table.Find(key);
      if (!arg) throw ScriptError(ExcType::KEY_ERROR, ToRepr(key));
      pos = close + 1;
    }
    FormatSpec spec;
    for (; pos < format.size(); pos++) {
      char c = format[pos];
      if (c == '-') spec.align = '<';
      else if (c == '+') spec.sign = '+';
      else if (c == ' ') { if (spec.sign != '+') spec.sign = ' '; }
      else if (c == '#') spec.alternate = true;
      else if (c == '0') spec.zero = true;
      else break;
    }
    while (pos < format.size() && isdigit((unsigned char)format[pos])) {
      spec.width = spec.width * 10 + (format[pos++] - '0');
    }
    if (pos < format.size() && format[pos] == '.') {
      pos++;
      spec.precision = 0;
      while (pos < format.size() && isdigit((unsigned char)format[pos])) {
        spec.precision = spec.precision * 10 + (format[pos++] - '0');
      }
    }
    if (pos >= format.size()) throw ScriptError(ExcType::VALUE_ERROR, "incomplete format");
    char type = format[pos++];
    if (type == '%') {
      ret += '%';
      continue;
    }
    if (!arg) {
      if (next >= values.size()) throw ScriptError(ExcType::TYPE_ERROR, "not enough arguments for format string");
      arg = &values[next++];
    }
    if (spec.zero && spec.align != '<') {
      spec.fill = "0";
      spec.align = '=';
    }
    switch (type) {
      case 's': case 'r': case 'a': {
        std::string text = type == 's' ? ToStr(*arg) : type == 'r' ? ToRepr(*arg) : AsciiRepr(*arg);
        if (spec.align == '=') spec.align = '>';
        spec.fill = " ";
        spec.sign = '-';
        ret += FormatStr(text, spec, Value::Str(text));
        break;
      }
      case 'd': case 'i': case 'u': {
        mpz_class x;
        if (arg->IsIntLike()) {
          x = arg->ToMpz();
        } else if (arg->IsFloat() && std::isfinite(arg->AsFloat())) {
          x = mpz_class(std::trunc(arg->AsFloat()));
        } else {
          throw ScriptError(ExcType::TYPE_ERROR,
              fmt::format("%{} format: a real number is required, not {}", type, TypeName(*arg)));
        }
        spec.precision = -1;
        ret += FormatInt(x, spec, *arg);
        break;
      }
      case 'x': case 'X': case 'o': {
        if (!arg->IsIntLike()) {
          throw ScriptError(ExcType::TYPE_ERROR,
              fmt::format("%{} format: an integer is required, not {}", type, TypeName(*arg)));
        }
        spec.type = type;
        spec.precision = -1;
        ret += FormatInt(arg->ToMpz(), spec, *arg);
        break;
      }
      case 'e': case 'E': case 'f': case 'F': case 'g': case 'G': {
        if (!arg->IsNumber()) {
          throw ScriptError(ExcType::TYPE_ERROR,
              fmt::format("must be real number, not {}", TypeName(*arg)));
        }
        spec.type = type;
        if (spec.precision < 0) spec.precision = 6;
        ret += FormatFloat(arg->AsFloat(), spec);
        break;
      }
      case 'c': {
        std::string body;
        if (arg->IsIntLike()) {
          if (arg->IsBig() || arg->AsInt() < 0 || arg->AsInt() > 0x10FFFF) {
            throw ScriptError(ExcType::OVERFLOW_ERROR, "%c arg not in range(0x110000)");
          }
          AppendUtf8(body, (uint32_t)arg->AsInt());
        } else if (arg->IsStr() && CodePointCount(arg->AsStr()) == 1) {
          body = arg->AsStr();
        } else {
          throw ScriptError(ExcType::TYPE_ERROR, "%c requires int or char");
        }
        spec.fill = " ";
        if (spec.align == '=') spec.align = '>';
        ret += Pad("", body, spec, '>');
        break;
      }
      default:
        throw ScriptError(ExcType::VALUE_ERROR,
            fmt::format("unsupported format character '{}' (0x{:x}) at index {}",
                        type, (unsigned char)type, pos - 1));
    }
  }
  if (!mapping && next < values.size()) {
    throw ScriptError(ExcType::TYPE_ERROR, "not all arguments converted during string formatting");
  }
  return ret;
}

std::string StrFormat(Interpreter& interp, const std::string& format, const CallArgs& args) {
  std::string ret;
  size_t next = 0;
  bool automatic = false, manual = false;

  auto resolve = [&](const std::string& field) -> Value {
    size_t end = field.find_first_of(".[");
    std::string head = field.substr(0, end);
    Value value;
    if (head.empty() || isdigit((unsigned char)head[0])) {
      size_t index;
      if (head.empty()) {
        if (manual) {
          throw ScriptError(ExcType::VALUE_ERROR,
              "cannot switch from manual field specification to automatic field numbering");
        }
        automatic = true;
        index = next++;
      } else {
        if (automatic) {
          throw ScriptError(ExcType::VALUE_ERROR,
              "cannot switch from automatic field numbering to manual field specification");
        }
        manual = true;
        auto res = std::from_chars(head.data(), head.data() + head.size(), index);
        if (res.ec != std::errc() || res.ptr != head.data() + head.size()) {
          throw ScriptError(ExcType::VALUE_ERROR, "Too many decimal digits in format string");
        }
      }
      if (index >= args.args.size()) {
        throw ScriptError(ExcType::INDEX_ERROR,
            fmt::format("Replacement index {} out of range for positional args tuple", index));
      }
      value = args.args[index];
    } else {
      const Value* found = nullptr;
      for (auto& [name, kwarg] : args.kwargs) {
        if (name == head) found = &kwarg;
      }
      if (!found) interp.RaiseKeyError(Value::Str(head));
      value = *found;
    }
    while (end != std::string::npos && end < field.size()) {
      if (field[end] == '.') {
        size_t stop = field.find_first_of(".[", end + 1);
        value = interp.GetAttr(value, field.substr(end + 1, stop == std::string::npos ? std::string::npos : stop - end - 1));
        end = stop;
      } else {
        size_t close = field.find(']', end);
        if (close == std::string::npos) throw ScriptError(ExcType::VALUE_ERROR, "Missing ']' in format string");
        std::string key = field.substr(end + 1, close - end - 1);
        bool numeric = !key.empty() && key.find_first_not_of("0123456789") == std::string::npos;
        int64_t subscript = 0;
        if (numeric) {
          auto res = std::from_chars(key.data(), key.data() + key.size(), subscript);
          if (res.ec != std::errc()) {
            throw ScriptError(ExcType::VALUE_ERROR, "Too many decimal digits in format string");
          }
        }
        value = interp.GetItem(value, numeric ? Value::Int(subscript) : Value::Str(key));
        end = close + 1;
        if (end < field.size() && field[end] != '.' && field[end] != '[') {
          throw ScriptError(ExcType::VALUE_ERROR, "Only '.' or '[' may follow ']' in format field specifier");
        }
      }
    }
    return value;
  };

  std::function<std::string(const std::string&, int)> render = [&](const std::string& text, int depth) {
    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
      char c = text[pos];
      if (c == '}') {
        if (pos + 1 < text.size() && text[pos + 1] == '}') {
          out += '}';
          pos += 2;
          continue;
        }
        throw ScriptError(ExcType::VALUE_ERROR, "Single '}' encountered in format string");
      }
      if (c != '{') {
        out += c;
        pos++;
        continue;
      }
      if (pos + 1 < text.size() && text[pos + 1] == '{') {
        out += '{';
        pos += 2;
        continue;
      }
      // find the matching close brace
      size_t level = 1, end = pos + 1;
      for (; end < text.size() && level; end++) {
        if (text[end] == '{') level++;
        else if (text[end] == '}') level--;
      }
      if (level) throw ScriptError(ExcType::VALUE_ERROR, "expected '}' before end of string");
      std::string field = text.substr(pos + 1, end - pos - 2);
      pos = end;
      std::string spec;
      char conversion = 0;
      size_t colon = std::string::npos;
      size_t bracket = 0;
      for (size_t i = 0; i < field.size(); i++) {
        if (field[i] == '[') bracket++;
        else if (field[i] == ']' && bracket) bracket--;
        else if (!bracket && (field[i] == ':' || field[i] == '!')) {
          colon = i;
          break;
        }
      }
      std::string name = field.substr(0, colon);
      if (colon != std::string::npos) {
        std::string rest = field.substr(colon);
        if (rest[0] == '!') {
          if (rest.size() < 2 || (rest.size() > 2 && rest[2] != ':')) {
            throw ScriptError(ExcType::VALUE_ERROR, "expected ':' after conversion specifier");
          }
          conversion = rest[1];
          rest = rest.substr(2);
        }
        if (!rest.empty()) spec = rest.substr(1);
      }
      if (depth > 1) throw ScriptError(ExcType::VALUE_ERROR, "Max string recursion exceeded");
      Value value = resolve(name);
      switch (conversion) {
        case 0: break;
        case 'r': value = Value::Str(ToRepr(value)); break;
        case 's': value = Value::Str(ToStr(value)); break;
        case 'a': value = Value::Str(AsciiRepr(value)); break;
        default:
          throw ScriptError(ExcType::VALUE_ERROR,
              fmt::format("Unknown conversion specifier {}", conversion));
      }
      if (spec.find('{') != std::string::npos) spec = render(spec, depth + 1);
      out += FormatValue(value, spec);
      interp.CheckLength(out.size());
    }
    return out;
  };
  return render(format, 0);
}

} // namespace interp
