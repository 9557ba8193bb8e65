#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <unordered_map>

#include <fmt/core.h>

#include "builtins.h"
#include "format.h"
#include "interpreter.h"
#include "modules.h"

namespace interp {

namespace {

using MethodTable = std::unordered_map<std::string, MethodFn>;

bool IsSpace(char c) {
  return c == ' ' || (c >= '\t' && c <= '\r') || (c >= '\x1c' && c <= '\x1f');
}

std::optional<int64_t> OptIndex(const CallArgs& args, size_t i) {
  if (i >= args.args.size() || args.args[i].IsNone()) return std::nullopt;
  const Value& v = args.args[i];
  if (v.IsBig()) return v.AsBig() < 0 ? std::numeric_limits<int64_t>::min() : std::numeric_limits<int64_t>::max();
  return AsIndex(v);
}

size_t ByteOffset(const std::string& str, int64_t index) {
  size_t pos = 0;
  for (int64_t i = 0; i < index && pos < str.size(); i++) {
    pos++;
    while (pos < str.size() && ((unsigned char)str[pos] & 0xC0) == 0x80) pos++;
  }
  return pos;
}

// the byte range of str[start:end] with Python's clamping
void ByteRange(const std::string& str, const CallArgs& args, size_t first, size_t& begin, size_t& end,
               int64_t& start_index) {
  SliceBounds bounds{OptIndex(args, first), OptIndex(args, first + 1), std::nullopt};
  int64_t start, stop, step;
  AdjustSlice(CodePointCount(str), bounds, start, stop, step);
  start_index = start;
  begin = ByteOffset(str, start);
  end = std::max(begin, ByteOffset(str, stop));
}

// --- str ---

Value StrUpper(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("upper", args, 0, 0);
  std::string ret = self.AsStr();
  for (auto& c : ret) c = toupper((unsigned char)c);
  return Value::Str(std::move(ret));
}

Value StrLower(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("lower", args, 0, 0);
  std::string ret = self.AsStr();
  for (auto& c : ret) c = tolower((unsigned char)c);
  return Value::Str(std::move(ret));
}

Value StrCasefold(Interpreter& interp, const Value& self, CallArgs& args) {
  return StrLower(interp, self, args);
}

Value StrSwapcase(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("swapcase", args, 0, 0);
  std::string ret = self.AsStr();
  for (auto& c : ret) c = isupper((unsigned char)c) ? tolower((unsigned char)c) : toupper((unsigned char)c);
  return Value::Str(std::move(ret));
}

Value StrCapitalize(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("capitalize", args, 0, 0);
  std::string ret = self.AsStr();
  for (size_t i = 0; i < ret.size(); i++) ret[i] = i ? tolower((unsigned char)ret[i]) : toupper((unsigned char)ret[i]);
  return Value::Str(std::move(ret));
}

Value StrTitle(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("title", args, 0, 0);
  std::string ret = self.AsStr();
  bool previous_cased = false;
  for (auto& c : ret) {
    unsigned char u = c;
    if (isalpha(u)) {
      c = previous_cased ? tolower(u) : toupper(u);
      previous_cased = true;
    } else {
      previous_cased = false;
    }
  }
  return Value::Str(std::move(ret));
}

std::string StripImpl(const std::string& str, const CallArgs& args, const char* name, bool left, bool right) {
  CheckArity(name, args, 0, 1);
  if (args.args.empty() || args.args[0].IsNone()) {
    size_t begin = 0, end = str.size();
    if (left) while (begin < end && IsSpace(str[begin])) begin++;
    if (right) while (end > begin && IsSpace(str[end - 1])) end--;
    return str.substr(begin, end - begin);
  }
  auto chars = SplitCodePoints(AsString(args.args[0], fmt::format("{} arg", name)));
  auto str_chars = SplitCodePoints(str);
  auto in_set = [&](const std::string& c) { return std::find(chars.begin(), chars.end(), c) != chars.end(); };
  size_t begin = 0, end = str_chars.size();
  if (left) while (begin < end && in_set(str_chars[begin])) begin++;
  if (right) while (end > begin && in_set(str_chars[end - 1])) end--;
  std::string ret;
  for (size_t i = begin; i < end; i++) ret += str_chars[i];
  return ret;
}

Value StrStrip(Interpreter&, const Value& self, CallArgs& args) {
  return Value::Str(StripImpl(self.AsStr(), args, "strip", true, true));
}

Value StrLstrip(Interpreter&, const Value& self, CallArgs& args) {
  return Value::Str(StripImpl(self.AsStr(), args, "lstrip", true, false));
}

Value StrRstrip(Interpreter&, const Value& self, CallArgs& args) {
  return Value::Str(StripImpl(self.AsStr(), args, "rstrip", false, true));
}

std::vector<Value> SplitWhitespace(const std::string& str, int64_t maxsplit, bool reverse) {
  std::vector<std::string> parts;
  if (!reverse) {
    size_t pos = 0;
    while (true) {
      while (pos < str.size() && IsSpace(str[pos])) pos++;
      if (pos >= str.size()) break;
      if (maxsplit >= 0 && (int64_t)parts.size() == maxsplit) {
        size_t end = str.size();
        while (end > pos && IsSpace(str[end - 1])) end--;
        parts.push_back(str.substr(pos, end - pos));
        break;
      }
      size_t start = pos;
      while (pos < str.size() && !IsSpace(str[pos])) pos++;
      parts.push_back(str.substr(start, pos - start));
    }
  } else {
    size_t pos = str.size();
    while (true) {
      while (pos > 0 && IsSpace(str[pos - 1])) pos--;
      if (pos == 0) break;
      if (maxsplit >= 0 && (int64_t)parts.size() == maxsplit) {
        size_t begin = 0;
        while (begin < pos && IsSpace(str[begin])) begin++;
        parts.push_back(str.substr(begin, pos - begin));
        break;
      }
      size_t end = pos;
      while (pos > 0 && !IsSpace(str[pos - 1])) pos--;
      parts.push_back(str.substr(pos, end - pos));
    }
    std::reverse(parts.begin(), parts.end());
  }
  std::vector<Value> ret;
  for (auto& part : parts) ret.push_back(Value::Str(std::move(part)));
  return ret;
}

Value SplitImpl(Interpreter& interp, const Value& self, CallArgs& args, const char* name, bool reverse) {
  auto sep = Arg(name, args, 0, "sep");
  auto maxsplit_arg = Arg(name, args, 1, "maxsplit");
  CheckNoKwargs(name, args);
  if (args.args.size() > 2) CheckArity(name, args, 0, 2);
  int64_t maxsplit = maxsplit_arg ? AsIndex(*maxsplit_arg) : -1;
  const std::string& str = self.AsStr();
  if (!sep || sep->IsNone()) return interp.NewList(SplitWhitespace(str, maxsplit, reverse));
  if (!sep->IsStr()) {
    throw ScriptError(ExcType::TYPE_ERROR, fmt::format("must be str or None, not {}", TypeName(*sep)));
  }
  const std::string& separator = sep->AsStr();
  if (separator.empty()) throw ScriptError(ExcType::VALUE_ERROR, "empty separator");
  std::vector<std::string> parts;
  if (!reverse) {
    size_t pos = 0;
    while (true) {
      size_t found = (maxsplit >= 0 && (int64_t)parts.size() == maxsplit) ?
          std::string::npos : str.find(separator, pos);
      if (found == std::string::npos) {
        parts.push_back(str.substr(pos));
        break;
      }
      parts.push_back(str.substr(pos, found - pos));
      pos = found + separator.size();
    }
  } else {
    size_t end = str.size();
    while (true) {
      size_t found = std::string::npos;
      if ((maxsplit < 0 || (int64_t)parts.size() < maxsplit) && end >= separator.size()) {
        found = str.rfind(separator, end - separator.size());
      }
      if (found == std::string::npos) {
        parts.push_back(str.substr(0, end));
        break;
      }
      parts.push_back(str.substr(found + separator.size(), end - found - separator.size()));
      end = found;
    }
    std::reverse(parts.begin(), parts.end());
  }
  std::vector<Value> ret;
  for (auto& part : parts) ret.push_back(Value::Str(std::move(part)));
  return interp.NewList(std::move(ret));
}

Value StrSplit(Interpreter& interp, const Value& self, CallArgs& args) {
  return SplitImpl(interp, self, args, "split", false);
}

Value StrRsplit(Interpreter& interp, const Value& self, CallArgs& args) {
  return SplitImpl(interp, self, args, "rsplit", true);
}

Value StrSplitlines(Interpreter& interp, const Value& self, CallArgs& args) {
  auto keepends = Arg("splitlines", args, 0, "keepends");
  CheckNoKwargs("splitlines", args);
  bool keep = keepends && Truthy(*keepends);
  const std::string& str = self.AsStr();
  std::vector<Value> ret;
  size_t start = 0, pos = 0;
  while (pos < str.size()) {
    char c = str[pos];
    bool is_break = c == '\n' || c == '\r' || c == '\v' || c == '\f' || (c >= '\x1c' && c <= '\x1e');
    if (!is_break) {
      pos++;
      continue;
    }
    size_t eol = pos + ((c == '\r' && pos + 1 < str.size() && str[pos + 1] == '\n') ? 2 : 1);
    ret.push_back(Value::Str(str.substr(start, (keep ? eol : pos) - start)));
    start = pos = eol;
  }
  if (start < str.size()) ret.push_back(Value::Str(str.substr(start)));
  return interp.NewList(std::move(ret));
}

Value StrJoin(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("join", args, 1, 1);
  std::vector<Value> items = interp.Collect(args.args[0]);
  std::string ret;
  for (size_t i = 0; i < items.size(); i++) {
    if (!items[i].IsStr()) {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("sequence item {}: expected str instance, {} found", i, TypeName(items[i])));
    }
    if (i) ret += self.AsStr();
    ret += items[i].AsStr();
    interp.CheckLength(ret.size());
  }
  return Value::Str(std::move(ret));
}

Value StrReplace(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("replace", args, 2, 3);
  const std::string& old = AsString(args.args[0], "replace() argument 1");
  const std::string& repl = AsString(args.args[1], "replace() argument 2");
  int64_t count = args.args.size() > 2 ? AsIndex(args.args[2]) : -1;
  const std::string& str = self.AsStr();
  std::string ret;
  if (old.empty()) {
    auto chars = SplitCodePoints(str);
    int64_t done = 0;
    for (size_t i = 0; i <= chars.size(); i++) {
      if (count < 0 || done < count) {
        ret += repl;
        done++;
      }
      if (i < chars.size()) ret += chars[i];
      interp.CheckLength(ret.size());
    }
    return Value::Str(std::move(ret));
  }
  size_t pos = 0;
  int64_t done = 0;
  while (count < 0 || done < count) {
    size_t found = str.find(old, pos);
    if (found == std::string::npos) break;
    ret += str.substr(pos, found - pos);
    ret += repl;
    interp.CheckLength(ret.size());
    pos = found + old.size();
    done++;
  }
  ret += str.substr(pos);
  interp.CheckLength(ret.size());
  return Value::Str(std::move(ret));
}

int64_t FindImpl(const Value& self, CallArgs& args, const char* name, bool reverse) {
  CheckArity(name, args, 1, 3);
  const std::string& sub = AsString(args.args[0], fmt::format("{}() argument 1", name));
  const std::string& str = self.AsStr();
  size_t begin, end;
  int64_t start_index;
  if (args.args.size() > 1) {
    auto start = OptIndex(args, 1);
    int64_t length = CodePointCount(str);
    if (start && *start > length) return -1;
  }
  ByteRange(str, args, 1, begin, end, start_index);
  std::string window = str.substr(begin, end - begin);
  size_t found = reverse ? window.rfind(sub) : window.find(sub);
  if (found == std::string::npos) return -1;
  return start_index + CodePointCount(window.substr(0, found));
}

Value StrFind(Interpreter&, const Value& self, CallArgs& args) {
  return Value::Int(FindImpl(self, args, "find", false));
}

Value StrRfind(Interpreter&, const Value& self, CallArgs& args) {
  return Value::Int(FindImpl(self, args, "rfind", true));
}

Value StrIndex(Interpreter&, const Value& self, CallArgs& args) {
  int64_t ret = FindImpl(self, args, "index", false);
  if (ret < 0) throw ScriptError(ExcType::VALUE_ERROR, "substring not found");
  return Value::Int(ret);
}

Value StrRindex(Interpreter&, const Value& self, CallArgs& args) {
  int64_t ret = FindImpl(self, args, "rindex", true);
  if (ret < 0) throw ScriptError(ExcType::VALUE_ERROR, "substring not found");
  return Value::Int(ret);
}

Value StrCount(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("count", args, 1, 3);
  const std::string& sub = AsString(args.args[0], "count() argument 1");
  const std::string& str = self.AsStr();
  size_t begin, end;
  int64_t start_index;
  ByteRange(str, args, 1, begin, end, start_index);
  std::string window = str.substr(begin, end - begin);
  if (sub.empty()) return Value::Int(CodePointCount(window) + 1);
  int64_t count = 0;
  for (size_t pos = window.find(sub); pos != std::string::npos; pos = window.find(sub, pos + sub.size())) count++;
  return Value::Int(count);
}

Value AffixImpl(const Value& self, CallArgs& args, const char* name, bool suffix) {
  CheckArity(name, args, 1, 3);
  const std::string& str = self.AsStr();
  size_t begin, end;
  int64_t start_index;
  ByteRange(str, args, 1, begin, end, start_index);
  std::string window = str.substr(begin, end - begin);
  std::vector<Value> candidates;
  if (args.args[0].Is(ObjectKind::TUPLE)) {
    candidates = args.args[0].As<TupleObject>()->items;
  } else {
    candidates.push_back(args.args[0]);
  }
  for (auto& candidate : candidates) {
    if (!candidate.IsStr()) {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("{} first arg must be str or a tuple of str, not {}", name, TypeName(candidate)));
    }
    const std::string& affix = candidate.AsStr();
    if (affix.size() > window.size()) continue;
    if (suffix ? window.compare(window.size() - affix.size(), affix.size(), affix) == 0 :
                 window.compare(0, affix.size(), affix) == 0) {
      return Value::Bool(true);
    }
  }
  return Value::Bool(false);
}

Value StrStartswith(Interpreter&, const Value& self, CallArgs& args) {
  return AffixImpl(self, args, "startswith", false);
}

Value StrEndswith(Interpreter&, const Value& self, CallArgs& args) {
  return AffixImpl(self, args, "endswith", true);
}

template <int (*Pred)(int)>
Value StrIs(const Value& self, CallArgs& args, const char* name) {
  CheckArity(name, args, 0, 0);
  const std::string& str = self.AsStr();
  if (str.empty()) return Value::Bool(false);
  for (unsigned char c : str) {
    if (!Pred(c)) return Value::Bool(false);
  }
  return Value::Bool(true);
}

int IsDigitChar(int c) { return isdigit(c); }
int IsAlphaChar(int c) { return c >= 0x80 || isalpha(c); }
int IsAlnumChar(int c) { return c >= 0x80 || isalnum(c); }
int IsSpaceChar(int c) { return IsSpace((char)c); }

Value StrIsdigit(Interpreter&, const Value& self, CallArgs& args) {
  return StrIs<IsDigitChar>(self, args, "isdigit");
}

Value StrIsdecimal(Interpreter&, const Value& self, CallArgs& args) {
  return StrIs<IsDigitChar>(self, args, "isdecimal");
}

Value StrIsnumeric(Interpreter&, const Value& self, CallArgs& args) {
  return StrIs<IsDigitChar>(self, args, "isnumeric");
}

Value StrIsalpha(Interpreter&, const Value& self, CallArgs& args) {
  return StrIs<IsAlphaChar>(self, args, "isalpha");
}

Value StrIsalnum(Interpreter&, const Value& self, CallArgs& args) {
  return StrIs<IsAlnumChar>(self, args, "isalnum");
}

Value StrIsspace(Interpreter&, const Value& self, CallArgs& args) {
  return StrIs<IsSpaceChar>(self, args, "isspace");
}

Value CaseCheck(const Value& self, CallArgs& args, const char* name, bool upper) {
  CheckArity(name, args, 0, 0);
  bool cased = false;
  for (unsigned char c : self.AsStr()) {
    if (upper ? islower(c) : isupper(c)) return Value::Bool(false);
    if (isalpha(c)) cased = true;
  }
  return Value::Bool(cased);
}

Value StrIsupper(Interpreter&, const Value& self, CallArgs& args) {
  return CaseCheck(self, args, "isupper", true);
}

Value StrIslower(Interpreter&, const Value& self, CallArgs& args) {
  return CaseCheck(self, args, "islower", false);
}

Value StrIstitle(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("istitle", args, 0, 0);
  const std::string& str = self.AsStr();
  return Value::Bool(str.find_first_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ") != std::string::npos &&
                     StrTitle(interp, self, args).AsStr() == str);
}

Value StrIsidentifier(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("isidentifier", args, 0, 0);
  const std::string& str = self.AsStr();
  if (str.empty() || isdigit((unsigned char)str[0])) return Value::Bool(false);
  for (unsigned char c : str) {
    if (c < 0x80 && !isalnum(c) && c != '_') return Value::Bool(false);
  }
  return Value::Bool(true);
}

std::string FillChar(const CallArgs& args, const char* name) {
  if (args.args.size() < 2) return " ";
  const std::string& fill = AsString(args.args[1], fmt::format("{}() argument 2", name));
  if (CodePointCount(fill) != 1) {
    throw ScriptError(ExcType::TYPE_ERROR, "The fill character must be exactly one character long");
  }
  return fill;
}

Value JustifyImpl(Interpreter& interp, const Value& self, CallArgs& args, const char* name, char align) {
  CheckArity(name, args, 1, 2);
  int64_t width = AsIndex(args.args[0]);
  std::string fill = FillChar(args, name);
  const std::string& str = self.AsStr();
  int64_t length = CodePointCount(str);
  if (width <= length) return self;
  interp.CheckLength(width);
  size_t padding = width - length;
  size_t left = align == '<' ? 0 : align == '>' ? padding : padding / 2 + (padding & width & 1);
  std::string ret;
  for (size_t i = 0; i < left; i++) ret += fill;
  ret += str;
  for (size_t i = left; i < padding; i++) ret += fill;
  return Value::Str(std::move(ret));
}

Value StrCenter(Interpreter& interp, const Value& self, CallArgs& args) {
  return JustifyImpl(interp, self, args, "center", '^');
}

Value StrLjust(Interpreter& interp, const Value& self, CallArgs& args) {
  return JustifyImpl(interp, self, args, "ljust", '<');
}

Value StrRjust(Interpreter& interp, const Value& self, CallArgs& args) {
  return JustifyImpl(interp, self, args, "rjust", '>');
}

Value StrZfill(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("zfill", args, 1, 1);
  int64_t width = AsIndex(args.args[0]);
  const std::string& str = self.AsStr();
  int64_t length = CodePointCount(str);
  if (width <= length) return self;
  interp.CheckLength(width);
  size_t sign = !str.empty() && (str[0] == '+' || str[0] == '-') ? 1 : 0;
  return Value::Str(str.substr(0, sign) + std::string(width - length, '0') + str.substr(sign));
}

Value StrFormatMethod(Interpreter& interp, const Value& self, CallArgs& args) {
  return Value::Str(StrFormat(interp, self.AsStr(), args));
}

Value PartitionImpl(Interpreter& interp, const Value& self, CallArgs& args, const char* name, bool reverse) {
  CheckArity(name, args, 1, 1);
  if (!args.args[0].IsStr()) {
    throw ScriptError(ExcType::TYPE_ERROR, fmt::format("must be str, not {}", TypeName(args.args[0])));
  }
  const std::string& sep = args.args[0].AsStr();
  if (sep.empty()) throw ScriptError(ExcType::VALUE_ERROR, "empty separator");
  const std::string& str = self.AsStr();
  size_t found = reverse ? str.rfind(sep) : str.find(sep);
  if (found == std::string::npos) {
    if (reverse) return interp.NewTuple({Value::Str(""), Value::Str(""), self});
    return interp.NewTuple({self, Value::Str(""), Value::Str("")});
  }
  return interp.NewTuple({Value::Str(str.substr(0, found)), Value::Str(sep),
                          Value::Str(str.substr(found + sep.size()))});
}

Value StrPartition(Interpreter& interp, const Value& self, CallArgs& args) {
  return PartitionImpl(interp, self, args, "partition", false);
}

Value StrRpartition(Interpreter& interp, const Value& self, CallArgs& args) {
  return PartitionImpl(interp, self, args, "rpartition", true);
}

Value StrRemoveprefix(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("removeprefix", args, 1, 1);
  const std::string& prefix = AsString(args.args[0], "removeprefix() argument");
  const std::string& str = self.AsStr();
  if (str.compare(0, prefix.size(), prefix) == 0) return Value::Str(str.substr(prefix.size()));
  return self;
}

Value StrRemovesuffix(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("removesuffix", args, 1, 1);
  const std::string& suffix = AsString(args.args[0], "removesuffix() argument");
  const std::string& str = self.AsStr();
  if (!suffix.empty() && str.size() >= suffix.size() &&
      str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0) {
    return Value::Str(str.substr(0, str.size() - suffix.size()));
  }
  return self;
}

Value StrExpandtabs(Interpreter& interp, const Value& self, CallArgs& args) {
  auto tabsize_arg = Arg("expandtabs", args, 0, "tabsize");
  CheckNoKwargs("expandtabs", args);
  int64_t tabsize = tabsize_arg ? AsIndex(*tabsize_arg) : 8;
  std::string ret;
  int64_t column = 0;
  for (auto& c : SplitCodePoints(self.AsStr())) {
    if (c == "\t") {
      if (tabsize > 0) {
        int64_t spaces = tabsize - column % tabsize;
        ret.append(spaces, ' ');
        column += spaces;
      }
    } else {
      ret += c;
      column = (c == "\n" || c == "\r") ? 0 : column + 1;
    }
    interp.CheckLength(ret.size());
  }
  return Value::Str(std::move(ret));
}

const MethodTable kStrMethods = {
  {"upper", StrUpper}, {"lower", StrLower}, {"casefold", StrCasefold}, {"swapcase", StrSwapcase},
  {"capitalize", StrCapitalize}, {"title", StrTitle},
  {"strip", StrStrip}, {"lstrip", StrLstrip}, {"rstrip", StrRstrip},
  {"split", StrSplit}, {"rsplit", StrRsplit}, {"splitlines", StrSplitlines}, {"join", StrJoin},
  {"replace", StrReplace}, {"find", StrFind}, {"rfind", StrRfind}, {"index", StrIndex},
  {"rindex", StrRindex}, {"count", StrCount}, {"startswith", StrStartswith}, {"endswith", StrEndswith},
  {"isdigit", StrIsdigit}, {"isdecimal", StrIsdecimal}, {"isnumeric", StrIsnumeric},
  {"isalpha", StrIsalpha}, {"isalnum", StrIsalnum}, {"isspace", StrIsspace},
  {"isupper", StrIsupper}, {"islower", StrIslower}, {"istitle", StrIstitle},
  {"isidentifier", StrIsidentifier},
  {"center", StrCenter}, {"ljust", StrLjust}, {"rjust", StrRjust}, {"zfill", StrZfill},
  {"format", StrFormatMethod}, {"partition", StrPartition}, {"rpartition", StrRpartition},
  {"removeprefix", StrRemoveprefix}, {"removesuffix", StrRemovesuffix}, {"expandtabs", StrExpandtabs},
};

// --- list & tuple ---

std::vector<Value>& Items(const Value& self) {
  return self.Is(ObjectKind::LIST) ? self.As<ListObject>()->items : self.As<TupleObject>()->items;
}

Value ListAppend(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("append", args, 1, 1);
  auto& items = Items(self);
  interp.CheckLength(items.size() + 1);
  items.push_back(args.args[0]);
  interp.heap().Track(self.AsObject());
  return Value();
}

Value ListExtend(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("extend", args, 1, 1);
  std::vector<Value> extra = interp.Collect(args.args[0]);
  auto& items = Items(self);
  interp.CheckLength(items.size() + extra.size());
  items.insert(items.end(), extra.begin(), extra.end());
  interp.heap().Track(self.AsObject());
  return Value();
}

Value ListInsert(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("insert", args, 2, 2);
  auto& items = Items(self);
  int64_t index = AsIndex(args.args[0]);
  int64_t length = items.size();
  if (index < 0) index = std::max<int64_t>(index + length, 0);
  index = std::min(index, length);
  interp.CheckLength(items.size() + 1);
  items.insert(items.begin() + index, args.args[1]);
  interp.heap().Track(self.AsObject());
  return Value();
}

Value ListPop(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("pop", args, 0, 1);
  auto& items = Items(self);
  if (items.empty()) throw ScriptError(ExcType::INDEX_ERROR, "pop from empty list");
  int64_t index = args.args.empty() ? -1 : AsIndex(args.args[0]);
  if (index < 0) index += items.size();
  if (index < 0 || index >= (int64_t)items.size()) throw ScriptError(ExcType::INDEX_ERROR, "pop index out of range");
  Value ret = std::move(items[index]);
  items.erase(items.begin() + index);
  return ret;
}

Value ListRemove(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("remove", args, 1, 1);
  auto& items = Items(self);
  for (size_t i = 0; i < items.size(); i++) {
    if (items[i].Identical(args.args[0]) || Equals(items[i], args.args[0])) {
      items.erase(items.begin() + i);
      return Value();
    }
  }
  throw ScriptError(ExcType::VALUE_ERROR, "list.remove(x): x not in list");
}

Value ListClear(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("clear", args, 0, 0);
  Items(self).clear();
  return Value();
}

Value SequenceIndexOf(const Value& self, CallArgs& args) {
  CheckArity("index", args, 1, 3);
  auto& items = Items(self);
  SliceBounds bounds{OptIndex(args, 1), OptIndex(args, 2), std::nullopt};
  int64_t start, stop, step;
  AdjustSlice(items.size(), bounds, start, stop, step);
  for (int64_t i = start; i < stop; i++) {
    if (items[i].Identical(args.args[0]) || Equals(items[i], args.args[0])) return Value::Int(i);
  }
  if (self.Is(ObjectKind::TUPLE)) throw ScriptError(ExcType::VALUE_ERROR, "tuple.index(x): x not in tuple");
  throw ScriptError(ExcType::VALUE_ERROR, fmt::format("{} is not in list", ToRepr(args.args[0])));
}

Value ListIndex(Interpreter&, const Value& self, CallArgs& args) {
  return SequenceIndexOf(self, args);
}

Value ListCount(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("count", args, 1, 1);
  int64_t count = 0;
  for (auto& item : Items(self)) {
    if (item.Identical(args.args[0]) || Equals(item, args.args[0])) count++;
  }
  return Value::Int(count);
}

Value ListSort(Interpreter& interp, const Value& self, CallArgs& args) {
  auto key = TakeKwarg(args, "key");
  auto reverse = TakeKwarg(args, "reverse");
  CheckArity("sort", args, 0, 0);
  // the list reads as empty while sorting; anything added meanwhile is a modification
  std::vector<Value> items = std::move(Items(self));
  Items(self).clear();
  try {
    SortValues(interp, items, key ? *key : Value(), reverse && Truthy(*reverse));
  } catch (...) {
    Items(self) = std::move(items);
    throw;
  }
  bool modified = !Items(self).empty();
  Items(self) = std::move(items);
  if (modified) throw ScriptError(ExcType::VALUE_ERROR, "list modified during sort");
  return Value();
}

Value ListReverse(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("reverse", args, 0, 0);
  std::reverse(Items(self).begin(), Items(self).end());
  return Value();
}

Value ListCopy(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("copy", args, 0, 0);
  return interp.NewList(Items(self));
}

const MethodTable kListMethods = {
  {"append", ListAppend}, {"extend", ListExtend}, {"insert", ListInsert}, {"pop", ListPop},
  {"remove", ListRemove}, {"clear", ListClear}, {"index", ListIndex}, {"count", ListCount},
  {"sort", ListSort}, {"reverse", ListReverse}, {"copy", ListCopy},
};

const MethodTable kTupleMethods = {
  {"index", ListIndex}, {"count", ListCount},
};

// --- dict ---

ValueTable& Table(const Value& self) {
  return self.Is(ObjectKind::DICT) ? self.As<DictObject>()->table : self.As<SetObject>()->table;
}

Value DictView(Interpreter& interp, const Value& self, CallArgs& args, const char* name, ViewKind view) {
  CheckArity(name, args, 0, 0);
  return Value::Obj(interp.heap().Make<DictViewObject>(self, view));
}

Value DictKeys(Interpreter& interp, const Value& self, CallArgs& args) {
  return DictView(interp, self, args, "keys", ViewKind::KEYS);
}

Value DictValues(Interpreter& interp, const Value& self, CallArgs& args) {
  return DictView(interp, self, args, "values", ViewKind::VALUES);
}

Value DictItems(Interpreter& interp, const Value& self, CallArgs& args) {
  return DictView(interp, self, args, "items", ViewKind::ITEMS);
}

Value DictGet(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("get", args, 1, 2);
  const Value* value = Table(self).Find(args.args[0]);
  if (value) return *value;
  return args.args.size() > 1 ? args.args[1] : Value();
}

Value DictPop(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("pop", args, 1, 2);
  auto& table = Table(self);
  const Value* value = table.Find(args.args[0]);
  if (!value) {
    if (args.args.size() > 1) return args.args[1];
    interp.RaiseKeyError(args.args[0]);
  }
  Value ret = *value;
  table.Erase(args.args[0]);
  return ret;
}

Value DictPopitem(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("popitem", args, 0, 0);
  auto& table = Table(self);
  if (!table.Size()) throw ScriptError(ExcType::KEY_ERROR, "'popitem(): dictionary is empty'");
  auto entry = table.PopLast();
  return interp.NewTuple({entry.first, entry.second});
}

Value DictSetdefault(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("setdefault", args, 1, 2);
  auto& table = Table(self);
  if (const Value* value = table.Find(args.args[0])) return *value;
  Value fallback = args.args.size() > 1 ? args.args[1] : Value();
  table.Set(args.args[0], fallback);
  interp.heap().Track(self.AsObject());
  return fallback;
}

Value DictUpdate(Interpreter& interp, const Value& self, CallArgs& args) {
  if (args.args.size() > 1) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("update expected at most 1 argument, got {}", args.args.size()));
  }
  if (!args.args.empty()) UpdateDict(interp, self.As<DictObject>(), args.args[0]);
  for (auto& [name, value] : args.kwargs) Table(self).Set(Value::Str(name), value);
  interp.heap().Track(self.AsObject());
  return Value();
}

Value DictClear(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("clear", args, 0, 0);
  Table(self).Clear();
  return Value();
}

Value DictCopy(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("copy", args, 0, 0);
  Value dict = Value::Obj(interp.heap().Make<DictObject>());
  dict.As<DictObject>()->table = Table(self);
  interp.heap().Track(dict.AsObject());
  return dict;
}

const MethodTable kDictMethods = {
  {"keys", DictKeys}, {"values", DictValues}, {"items", DictItems}, {"get", DictGet},
  {"pop", DictPop}, {"popitem", DictPopitem}, {"setdefault", DictSetdefault},
  {"update", DictUpdate}, {"clear", DictClear}, {"copy", DictCopy},
};

// --- set ---

ValueTable CollectTable(Interpreter& interp, const Value& iterable) {
  if (iterable.Is(ObjectKind::SET)) return iterable.As<SetObject>()->table;
  ValueTable ret;
  for (auto& item : interp.Collect(iterable)) ret.Set(item, Value());
  return ret;
}

Value NewSet(Interpreter& interp, ValueTable table) {
  Value set = Value::Obj(interp.heap().Make<SetObject>());
  set.As<SetObject>()->table = std::move(table);
  interp.heap().Track(set.AsObject());
  return set;
}

Value SetAdd(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("add", args, 1, 1);
  Table(self).Set(args.args[0], Value());
  interp.CheckLength(Table(self).Size());
  interp.heap().Track(self.AsObject());
  return Value();
}

Value SetRemove(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("remove", args, 1, 1);
  if (!Table(self).Erase(args.args[0])) interp.RaiseKeyError(args.args[0]);
  return Value();
}

Value SetDiscard(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("discard", args, 1, 1);
  Table(self).Erase(args.args[0]);
  return Value();
}

Value SetPop(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("pop", args, 0, 0);
  auto& table = Table(self);
  if (!table.Size()) throw ScriptError(ExcType::KEY_ERROR, "'pop from an empty set'");
  Value ret = table.Entries().front().first;
  table.Erase(ret);
  return ret;
}

Value SetCopy(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("copy", args, 0, 0);
  return NewSet(interp, Table(self));
}

ValueTable Combine(Interpreter& interp, const ValueTable& base, CallArgs& args, const char* name, BinaryOp op) {
  CheckNoKwargs(name, args);
  ValueTable ret = base;
  for (auto& other_value : args.args) {
    ValueTable other = CollectTable(interp, other_value);
    ValueTable next;
    switch (op) {
      case BinaryOp::BIT_OR:
        next = ret;
        for (auto& entry : other.Entries()) next.Set(entry.first, Value());
        break;
      case BinaryOp::BIT_AND:
        for (auto& entry : ret.Entries()) {
          if (other.Contains(entry.first)) next.Set(entry.first, Value());
        }
        break;
      case BinaryOp::SUB:
        for (auto& entry : ret.Entries()) {
          if (!other.Contains(entry.first)) next.Set(entry.first, Value());
        }
        break;
      default:
        for (auto& entry : ret.Entries()) {
          if (!other.Contains(entry.first)) next.Set(entry.first, Value());
        }
        for (auto& entry : other.Entries()) {
          if (!ret.Contains(entry.first)) next.Set(entry.first, Value());
        }
        break;
    }
    ret = std::move(next);
    interp.CheckLength(ret.Size());
  }
  return ret;
}

Value SetUnion(Interpreter& interp, const Value& self, CallArgs& args) {
  return NewSet(interp, Combine(interp, Table(self), args, "union", BinaryOp::BIT_OR));
}

Value SetIntersection(Interpreter& interp, const Value& self, CallArgs& args) {
  return NewSet(interp, Combine(interp, Table(self), args, "intersection", BinaryOp::BIT_AND));
}

Value SetDifference(Interpreter& interp, const Value& self, CallArgs& args) {
  return NewSet(interp, Combine(interp, Table(self), args, "difference", BinaryOp::SUB));
}

Value SetSymmetricDifference(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("symmetric_difference", args, 1, 1);
  return NewSet(interp, Combine(interp, Table(self), args, "symmetric_difference", BinaryOp::BIT_XOR));
}

Value SetUpdate(Interpreter& interp, const Value& self, CallArgs& args) {
  Table(self) = Combine(interp, Table(self), args, "update", BinaryOp::BIT_OR);
  interp.heap().Track(self.AsObject());
  return Value();
}

Value SetIntersectionUpdate(Interpreter& interp, const Value& self, CallArgs& args) {
  Table(self) = Combine(interp, Table(self), args, "intersection_update", BinaryOp::BIT_AND);
  return Value();
}

Value SetDifferenceUpdate(Interpreter& interp, const Value& self, CallArgs& args) {
  Table(self) = Combine(interp, Table(self), args, "difference_update", BinaryOp::SUB);
  return Value();
}

Value SetSymmetricDifferenceUpdate(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("symmetric_difference_update", args, 1, 1);
  Table(self) = Combine(interp, Table(self), args, "symmetric_difference_update", BinaryOp::BIT_XOR);
  return Value();
}

Value SetIssubset(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("issubset", args, 1, 1);
  ValueTable other = CollectTable(interp, args.args[0]);
  for (auto& entry : Table(self).Entries()) {
    if (!other.Contains(entry.first)) return Value::Bool(false);
  }
  return Value::Bool(true);
}

Value SetIssuperset(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("issuperset", args, 1, 1);
  for (auto& item : interp.Collect(args.args[0])) {
    if (!Table(self).Contains(item)) return Value::Bool(false);
  }
  return Value::Bool(true);
}

Value SetIsdisjoint(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("isdisjoint", args, 1, 1);
  for (auto& item : interp.Collect(args.args[0])) {
    if (Table(self).Contains(item)) return Value::Bool(false);
  }
  return Value::Bool(true);
}

const MethodTable kSetMethods = {
  {"add", SetAdd}, {"remove", SetRemove}, {"discard", SetDiscard}, {"pop", SetPop},
  {"clear", DictClear}, {"copy", SetCopy}, {"union", SetUnion}, {"intersection", SetIntersection},
  {"difference", SetDifference}, {"symmetric_difference", SetSymmetricDifference},
  {"update", SetUpdate}, {"intersection_update", SetIntersectionUpdate},
  {"difference_update", SetDifferenceUpdate},
  {"symmetric_difference_update", SetSymmetricDifferenceUpdate},
  {"issubset", SetIssubset}, {"issuperset", SetIssuperset}, {"isdisjoint", SetIsdisjoint},
};

// --- range & numbers ---

Value RangeCount(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("count", args, 1, 1);
  return Value::Int(interp.Contains(self, args.args[0]) ? 1 : 0);
}

Value RangeIndex(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("index", args, 1, 1);
  auto range = self.As<RangeObject>();
  if (!args.args[0].IsIntLike() || !interp.Contains(self, args.args[0])) {
    throw ScriptError(ExcType::VALUE_ERROR, fmt::format("{} is not in range", ToRepr(args.args[0])));
  }
  return Value::Int((args.args[0].AsInt() - range->start) / range->step);
}

const MethodTable kRangeMethods = {
  {"count", RangeCount}, {"index", RangeIndex},
};

Value IntBitLength(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("bit_length", args, 0, 0);
  if (self.IsBig()) return Value::Int(mpz_sizeinbase(self.AsBig().get_mpz_t(), 2));
  uint64_t x = self.AsInt() < 0 ? (uint64_t)0 - (uint64_t)self.AsInt() : (uint64_t)self.AsInt();
  return Value::Int(x ? 64 - __builtin_clzll(x) : 0);
}

Value FloatIsInteger(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("is_integer", args, 0, 0);
  double x = self.AsFloat();
  return Value::Bool(std::isfinite(x) && std::floor(x) == x);
}

const MethodTable kIntMethods = {
  {"bit_length", IntBitLength},
};

const MethodTable kFloatMethods = {
  {"is_integer", FloatIsInteger},
};

const MethodTable* TableFor(const std::string& type_name) {
  if (type_name == "str") return &kStrMethods;
  if (type_name == "list") return &kListMethods;
  if (type_name == "tuple") return &kTupleMethods;
  if (type_name == "dict") return &kDictMethods;
  if (type_name == "set") return &kSetMethods;
  if (type_name == "range") return &kRangeMethods;
  if (type_name == "int" || type_name == "bool") return &kIntMethods;
  if (type_name == "float") return &kFloatMethods;
  return nullptr;
}

MethodFn FindIn(const MethodTable* table, const std::string& name) {
  if (!table) return nullptr;
  auto it = table->find(name);
  return it == table->end() ? nullptr : it->second;
}

[[noreturn]] void NoAttribute(const Value& obj, const std::string& name) {
  if (obj.Is(ObjectKind::MODULE)) {
    throw ScriptError(ExcType::ATTRIBUTE_ERROR,
        fmt::format("module '{}' has no attribute '{}'", obj.As<ModuleObject>()->name, name));
  }
  if (obj.Is(ObjectKind::BUILTIN) && obj.As<BuiltinObject>()->is_type) {
    throw ScriptError(ExcType::ATTRIBUTE_ERROR,
        fmt::format("type object '{}' has no attribute '{}'", obj.As<BuiltinObject>()->name, name));
  }
  throw ScriptError(ExcType::ATTRIBUTE_ERROR,
      fmt::format("'{}' object has no attribute '{}'", TypeName(obj), name));
}

} // namespace

MethodFn FindTypeMethod(const std::string& type_name, const std::string& name) {
  if (name.empty() || name[0] == '_') return nullptr;
  if (type_name == "datetime.datetime") return TemporalMethod(ObjectKind::DATETIME, name);
  if (type_name == "datetime.date") return TemporalMethod(ObjectKind::DATE, name);
  if (type_name == "datetime.timedelta") return TemporalMethod(ObjectKind::TIMEDELTA, name);
  return FindIn(TableFor(type_name), name);
}

MethodFn FindMethod(const Value& self, const std::string& name) {
  if (name.empty() || name[0] == '_') return nullptr;
  if (self.IsObject()) {
    switch (self.AsObject()->kind) {
      case ObjectKind::LIST: return FindIn(&kListMethods, name);
      case ObjectKind::TUPLE: return FindIn(&kTupleMethods, name);
      case ObjectKind::DICT: return FindIn(&kDictMethods, name);
      case ObjectKind::SET: return FindIn(&kSetMethods, name);
      case ObjectKind::RANGE: return FindIn(&kRangeMethods, name);
      case ObjectKind::DATETIME:
      case ObjectKind::DATE:
      case ObjectKind::TIMEDELTA:
        return TemporalMethod(self.AsObject()->kind, name);
      default: return nullptr;
    }
  }
  if (self.IsStr()) return FindIn(&kStrMethods, name);
  if (self.IsIntLike()) return FindIn(&kIntMethods, name);
  if (self.IsFloat()) return FindIn(&kFloatMethods, name);
  return nullptr;
}

Value Interpreter::GetAttr(const Value& obj, const std::string& name) {
  // no introspection surface
  if (name.empty() || name[0] == '_') NoAttribute(obj, name);
  if (MethodFn method = FindMethod(obj, name)) {
    return Value::Obj(heap_.Make<BoundMethodObject>(obj, name, method));
  }
  if (obj.IsObject()) {
    Object* o = obj.AsObject();
    switch (o->kind) {
      case ObjectKind::MODULE:
        if (const Value* member = static_cast<ModuleObject*>(o)->Find(name)) return *member;
        break;
      case ObjectKind::BUILTIN: {
        auto builtin = static_cast<BuiltinObject*>(o);
        if (const Value* attr = builtin->FindAttr(name)) return *attr;
        if (!builtin->instance_type.empty()) {
          if (MethodFn method = FindTypeMethod(builtin->instance_type, name)) {
            auto unbound = heap_.Make<BuiltinObject>(builtin->name + "." + name, method);
            unbound->instance_type = builtin->instance_type;
            return Value::Obj(unbound);
          }
        }
        break;
      }
      case ObjectKind::EXCEPTION:
        if (name == "args") return NewTuple(static_cast<ExceptionObject*>(o)->args);
        break;
      case ObjectKind::RANGE: {
        auto range = static_cast<RangeObject*>(o);
        if (name == "start") return Value::Int(range->start);
        if (name == "stop") return Value::Int(range->stop);
        if (name == "step") return Value::Int(range->step);
        break;
      }
      case ObjectKind::DATETIME:
      case ObjectKind::DATE:
      case ObjectKind::TIMEDELTA:
        return TemporalGetAttr(*this, obj, name);
      default:
        break;
    }
  } else if (obj.IsNumber()) {
    if (name == "real") return obj.IsFloat() || obj.IsBig() ? obj : Value::Int(obj.AsInt());
    if (name == "imag") return obj.IsFloat() ? Value::Float(0.0) : Value::Int(0);
  }
  NoAttribute(obj, name);
}

void Interpreter::SetAttr(const Value& obj, const std::string& name) {
  if (obj.Is(ObjectKind::MODULE)) {
    throw ScriptError(ExcType::ATTRIBUTE_ERROR,
        fmt::format("module '{}' attributes are read-only", obj.As<ModuleObject>()->name));
  }
  if (obj.Is(ObjectKind::BUILTIN) && obj.As<BuiltinObject>()->is_type) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("cannot set '{}' attribute of immutable type '{}'", name, obj.As<BuiltinObject>()->name));
  }
  throw ScriptError(ExcType::ATTRIBUTE_ERROR,
      fmt::format("'{}' object has no attribute '{}'", TypeName(obj), name));
}

} // namespace interp
