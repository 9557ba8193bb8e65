#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

#include "builtins.h"
#include "format.h"
#include "modules.h"

namespace interp {

namespace {

constexpr int64_t kMicrosPerSecond = 1000000;
constexpr int64_t kMicrosPerDay = 86400 * kMicrosPerSecond;
constexpr int kMinYear = 1;
constexpr int kMaxYear = 9999;
// the largest |days| a timedelta can hold in 64-bit microseconds
constexpr int64_t kMaxDeltaDays = 99999999;

const char* const kMonthNames[] = {
  "January", "February", "March", "April", "May", "June",
  "July", "August", "September", "October", "November", "December",
};
const char* const kDayNames[] = {
  "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday",
};

int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

int64_t FloorMod(int64_t a, int64_t b) {
  return a - FloorDiv(a, b) * b;
}

// proleptic Gregorian calendar, days relative to 1970-01-01
int64_t DaysFromCivil(int64_t y, int m, int d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

void CivilFromDays(int64_t z, int64_t& year, int64_t& month, int64_t& day) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  day = doy - (153 * mp + 2) / 5 + 1;
  month = mp < 10 ? mp + 3 : mp - 9;
  year = yoe + era * 400 + (month <= 2);
}

bool IsLeap(int64_t year) {
  return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

int DaysInMonth(int64_t year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return month == 2 && IsLeap(year) ? 29 : kDays[month - 1];
}

const int64_t kMinDays = DaysFromCivil(kMinYear, 1, 1);
const int64_t kMaxDays = DaysFromCivil(kMaxYear, 12, 31);

struct Civil {
  int64_t year, month, day;
  int64_t hour, minute, second, microsecond;
};

Civil ToCivil(int64_t micros) {
  Civil ret;
  int64_t days = FloorDiv(micros, kMicrosPerDay);
  int64_t rem = micros - days * kMicrosPerDay;
  CivilFromDays(days, ret.year, ret.month, ret.day);
  ret.microsecond = rem % kMicrosPerSecond;
  int64_t seconds = rem / kMicrosPerSecond;
  ret.hour = seconds / 3600;
  ret.minute = seconds / 60 % 60;
  ret.second = seconds % 60;
  return ret;
}

// Monday == 0
int Weekday(int64_t days) {
  return FloorMod(days + 3, 7);
}

void CheckDate(int64_t year, int64_t month, int64_t day) {
  if (year < kMinYear || year > kMaxYear) {
    throw ScriptError(ExcType::VALUE_ERROR, fmt::format("year {} is out of range", year));
  }
  if (month < 1 || month > 12) throw ScriptError(ExcType::VALUE_ERROR, "month must be in 1..12");
  if (day < 1 || day > DaysInMonth(year, month)) {
    throw ScriptError(ExcType::VALUE_ERROR, "day is out of range for month");
  }
}

void CheckTime(int64_t hour, int64_t minute, int64_t second, int64_t microsecond) {
  if (hour < 0 || hour > 23) throw ScriptError(ExcType::VALUE_ERROR, "hour must be in 0..23");
  if (minute < 0 || minute > 59) throw ScriptError(ExcType::VALUE_ERROR, "minute must be in 0..59");
  if (second < 0 || second > 59) throw ScriptError(ExcType::VALUE_ERROR, "second must be in 0..59");
  if (microsecond < 0 || microsecond > 999999) {
    throw ScriptError(ExcType::VALUE_ERROR, "microsecond must be in 0..999999");
  }
}

int64_t MicrosFromFields(const Civil& c) {
  CheckDate(c.year, c.month, c.day);
  CheckTime(c.hour, c.minute, c.second, c.microsecond);
  return DaysFromCivil(c.year, c.month, c.day) * kMicrosPerDay +
         ((int64_t)c.hour * 3600 + c.minute * 60 + c.second) * kMicrosPerSecond + c.microsecond;
}

Value NewDateTime(Heap& heap, __int128 micros) {
  if (micros < (__int128)kMinDays * kMicrosPerDay || micros >= (__int128)(kMaxDays + 1) * kMicrosPerDay) {
    throw ScriptError(ExcType::OVERFLOW_ERROR, "date value out of range");
  }
  return Value::Obj(heap.Make<DateTimeObject>((int64_t)micros));
}

Value NewDate(Heap& heap, int64_t days) {
  if (days < kMinDays || days > kMaxDays) throw ScriptError(ExcType::OVERFLOW_ERROR, "date value out of range");
  return Value::Obj(heap.Make<DateObject>(days));
}

[[noreturn]] void DeltaOverflow(long double days) {
  days = std::max<long double>(std::min<long double>(days, INT64_MAX), INT64_MIN);
  throw ScriptError(ExcType::OVERFLOW_ERROR,
      fmt::format("days={}; must have magnitude <= {}", (int64_t)days, kMaxDeltaDays));
}

Value NewDelta(Heap& heap, __int128 micros) {
  __int128 days = micros >= 0 ? micros / kMicrosPerDay : -((-micros + kMicrosPerDay - 1) / kMicrosPerDay);
  if (days > kMaxDeltaDays || days < -kMaxDeltaDays) DeltaOverflow((long double)days);
  return Value::Obj(heap.Make<TimeDeltaObject>((int64_t)micros));
}

Value NewDeltaFromReal(Heap& heap, long double micros) {
  if (!std::isfinite(micros)) {
    throw ScriptError(std::isnan(micros) ? ExcType::VALUE_ERROR : ExcType::OVERFLOW_ERROR,
                      "cannot convert float to timedelta");
  }
  long double bound = (long double)(kMaxDeltaDays + 1) * kMicrosPerDay;
  if (micros >= bound || micros <= -bound) DeltaOverflow(std::floor(micros / kMicrosPerDay));
  // round half to even, as timedelta does
  return NewDelta(heap, (int64_t)std::nearbyint(micros));
}

void DeltaParts(int64_t micros, int64_t& days, int64_t& seconds, int64_t& microseconds) {
  days = FloorDiv(micros, kMicrosPerDay);
  int64_t rem = micros - days * kMicrosPerDay;
  seconds = rem / kMicrosPerSecond;
  microseconds = rem % kMicrosPerSecond;
}

std::tm ToTm(int64_t days, const Civil& c) {
  std::tm tm = {};
  tm.tm_year = c.year - 1900;
  tm.tm_mon = c.month - 1;
  tm.tm_mday = c.day;
  tm.tm_hour = c.hour;
  tm.tm_min = c.minute;
  tm.tm_sec = c.second;
  tm.tm_wday = (Weekday(days) + 1) % 7;
  tm.tm_yday = days - DaysFromCivil(c.year, 1, 1);
  tm.tm_isdst = -1;
  return tm;
}

int64_t MicrosFromTm(const std::tm& tm, int64_t microsecond) {
  return DaysFromCivil(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday) * kMicrosPerDay +
         ((int64_t)tm.tm_hour * 3600 + tm.tm_min * 60 + std::min(tm.tm_sec, 59)) * kMicrosPerSecond +
         microsecond;
}

// seconds since the epoch to naive local (or UTC) microseconds
int64_t FromTimestamp(double timestamp, bool utc) {
  if (!std::isfinite(timestamp)) throw ScriptError(ExcType::VALUE_ERROR, "Invalid value NaN (not a number)");
  double seconds = std::floor(timestamp);
  int64_t microsecond = std::nearbyint((timestamp - seconds) * 1e6);
  if (microsecond >= kMicrosPerSecond) {
    seconds += 1;
    microsecond -= kMicrosPerSecond;
  }
  if (seconds < -62135596800.0 || seconds > 253402300799.0) {
    throw ScriptError(ExcType::VALUE_ERROR, "year is out of range");
  }
  time_t t = (time_t)seconds;
  if (utc) return (int64_t)t * kMicrosPerSecond + microsecond;
  std::tm tm;
  if (!localtime_r(&t, &tm)) throw ScriptError(ExcType::OVERFLOW_ERROR, "timestamp out of range for platform time_t");
  return MicrosFromTm(tm, microsecond);
}

int64_t Now(bool utc) {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  int64_t microsecond = ts.tv_nsec / 1000;
  if (utc) return (int64_t)ts.tv_sec * kMicrosPerSecond + microsecond;
  std::tm tm;
  localtime_r(&ts.tv_sec, &tm);
  return MicrosFromTm(tm, microsecond);
}

int64_t DateTimeArg(const char* fn, CallArgs& args, size_t index, const char* name,
                    std::optional<int64_t> fallback) {
  auto v = Arg(fn, args, index, name);
  if (!v) {
    if (!fallback) {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("function missing required argument '{}' (pos {})", name, index + 1));
    }
    return *fallback;
  }
  return AsIndex(*v);
}

void RejectExtra(CallArgs& args, size_t max_positional) {
  if (!args.kwargs.empty()) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("'{}' is an invalid keyword argument for this function", args.kwargs[0].first));
  }
  if (args.args.size() > max_positional) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("function takes at most {} arguments ({} given)", max_positional, args.args.size()));
  }
}

// reads 1 to max_digits digits
bool ReadNumber(const std::string& str, size_t& pos, size_t min_digits, size_t max_digits, int64_t& out) {
  size_t start = pos;
  out = 0;
  while (pos < str.size() && pos - start < max_digits && isdigit((unsigned char)str[pos])) {
    out = out * 10 + (str[pos++] - '0');
  }
  return pos - start >= min_digits;
}

[[noreturn]] void InvalidIsoformat(const std::string& text) {
  throw ScriptError(ExcType::VALUE_ERROR, fmt::format("Invalid isoformat string: {}", QuoteString(text)));
}

// YYYY-MM-DD or YYYYMMDD; advances pos
bool ParseIsoDate(const std::string& text, size_t& pos, Civil& c) {
  int64_t year, month, day;
  if (!ReadNumber(text, pos, 4, 4, year)) return false;
  bool extended = pos < text.size() && text[pos] == '-';
  if (extended) pos++;
  if (!ReadNumber(text, pos, 2, 2, month)) return false;
  if (extended) {
    if (pos >= text.size() || text[pos] != '-') return false;
    pos++;
  }
  if (!ReadNumber(text, pos, 2, 2, day)) return false;
  c.year = year;
  c.month = month;
  c.day = day;
  return true;
}

// HH[:MM[:SS[.f+]]]
bool ParseIsoTime(const std::string& text, size_t pos, Civil& c) {
  int64_t hour, minute = 0, second = 0, microsecond = 0;
  if (!ReadNumber(text, pos, 2, 2, hour)) return false;
  if (pos < text.size()) {
    if (text[pos++] != ':' || !ReadNumber(text, pos, 2, 2, minute)) return false;
  }
  if (pos < text.size()) {
    if (text[pos++] != ':' || !ReadNumber(text, pos, 2, 2, second)) return false;
  }
  if (pos < text.size()) {
    if (text[pos] != '.' && text[pos] != ',') return false;
    size_t start = ++pos;
    while (pos < text.size() && isdigit((unsigned char)text[pos])) pos++;
    if (pos == start) return false;
    std::string digits = text.substr(start, std::min<size_t>(pos - start, 6));
    digits.resize(6, '0');
    microsecond = std::stoll(digits);
  }
  if (pos != text.size()) return false;
  c.hour = hour;
  c.minute = minute;
  c.second = second;
  c.microsecond = microsecond;
  return true;
}

int64_t DateTimeFromIso(const std::string& text) {
  Civil c = {};
  size_t pos = 0;
  if (!ParseIsoDate(text, pos, c)) InvalidIsoformat(text);
  if (pos < text.size()) {
    // any single separator character
    size_t sep = pos;
    DecodeUtf8(text, pos);
    if (pos == sep || !ParseIsoTime(text, pos, c)) InvalidIsoformat(text);
  }
  return MicrosFromFields(c);
}

int64_t DateFromIso(const std::string& text) {
  Civil c = {};
  size_t pos = 0;
  if (!ParseIsoDate(text, pos, c) || pos != text.size()) InvalidIsoformat(text);
  CheckDate(c.year, c.month, c.day);
  return DaysFromCivil(c.year, c.month, c.day);
}

bool MatchName(const std::string& str, size_t& pos, const char* const* names, int count, int& index) {
  // full names first so "March" is not read as "Mar"
  for (int full = 1; full >= 0; full--) {
    for (int i = 0; i < count; i++) {
      std::string name = full ? names[i] : std::string(names[i], 3);
      if (str.size() - pos < name.size()) continue;
      bool match = true;
      for (size_t j = 0; j < name.size() && match; j++) {
        match = tolower((unsigned char)str[pos + j]) == tolower((unsigned char)name[j]);
      }
      if (match) {
        pos += name.size();
        index = i;
        return true;
      }
    }
  }
  return false;
}

int64_t Strptime(const std::string& text, const std::string& format) {
  auto mismatch = [&]() {
    return ScriptError(ExcType::VALUE_ERROR,
        fmt::format("time data {} does not match format {}", QuoteString(text), QuoteString(format)));
  };
  int64_t year = 1900, month = 1, day = 1, hour = 0, minute = 0, second = 0, microsecond = 0;
  int64_t yday = -1, hour12 = -1;
  int pm = -1;
  bool has_date = false;
  size_t pos = 0;
  for (size_t i = 0; i < format.size(); i++) {
    char f = format[i];
    if (isspace((unsigned char)f)) {
      while (i + 1 < format.size() && isspace((unsigned char)format[i + 1])) i++;
      size_t start = pos;
      while (pos < text.size() && isspace((unsigned char)text[pos])) pos++;
      if (pos == start) throw mismatch();
      continue;
    }
    if (f != '%') {
      if (pos >= text.size() || tolower((unsigned char)text[pos]) != tolower((unsigned char)f)) throw mismatch();
      pos++;
      continue;
    }
    if (++i >= format.size()) throw ScriptError(ExcType::VALUE_ERROR, "stray % in format '%'");
    char d = format[i];
    int64_t value;
    int index;
    switch (d) {
      case 'Y':
        if (!ReadNumber(text, pos, 4, 4, year)) throw mismatch();
        has_date = true;
        break;
      case 'y':
        if (!ReadNumber(text, pos, 2, 2, value)) throw mismatch();
        year = value < 69 ? 2000 + value : 1900 + value;
        has_date = true;
        break;
      case 'm':
        if (!ReadNumber(text, pos, 1, 2, month) || month < 1 || month > 12) throw mismatch();
        has_date = true;
        break;
      case 'd':
        if (!ReadNumber(text, pos, 1, 2, day) || day < 1 || day > 31) throw mismatch();
        has_date = true;
        break;
      case 'j':
        if (!ReadNumber(text, pos, 1, 3, yday) || yday < 1 || yday > 366) throw mismatch();
        break;
      case 'H':
        if (!ReadNumber(text, pos, 1, 2, hour) || hour > 23) throw mismatch();
        break;
      case 'I':
        if (!ReadNumber(text, pos, 1, 2, hour12) || hour12 < 1 || hour12 > 12) throw mismatch();
        break;
      case 'M':
        if (!ReadNumber(text, pos, 1, 2, minute) || minute > 59) throw mismatch();
        break;
      case 'S':
        if (!ReadNumber(text, pos, 1, 2, second) || second > 61) throw mismatch();
        second = std::min<int64_t>(second, 59);
        break;
      case 'f': {
        size_t start = pos;
        if (!ReadNumber(text, pos, 1, 6, value)) throw mismatch();
        for (size_t n = pos - start; n < 6; n++) value *= 10;
        microsecond = value;
        break;
      }
      case 'p':
        if (text.size() - pos >= 2 && tolower((unsigned char)text[pos + 1]) == 'm' &&
            (tolower((unsigned char)text[pos]) == 'a' || tolower((unsigned char)text[pos]) == 'p')) {
          pm = tolower((unsigned char)text[pos]) == 'p';
          pos += 2;
        } else {
          throw mismatch();
        }
        break;
      case 'b':
      case 'B':
      case 'h':
        if (!MatchName(text, pos, kMonthNames, 12, index)) throw mismatch();
        month = index + 1;
        has_date = true;
        break;
      case 'a':
      case 'A':
        if (!MatchName(text, pos, kDayNames, 7, index)) throw mismatch();
        break;
      case '%':
        if (pos >= text.size() || text[pos] != '%') throw mismatch();
        pos++;
        break;
      default:
        throw ScriptError(ExcType::VALUE_ERROR,
            fmt::format("'{}' is a bad directive in format '{}'", d, format));
    }
  }
  if (pos != text.size()) {
    throw ScriptError(ExcType::VALUE_ERROR, fmt::format("unconverted data remains: {}", text.substr(pos)));
  }
  if (hour12 >= 0) hour = hour12 % 12 + (pm == 1 ? 12 : 0);
  Civil c = {year, month, day, hour, minute, second, microsecond};
  if (yday >= 0 && !has_date) {
    int64_t days = DaysFromCivil(year, 1, 1) + yday - 1;
    CivilFromDays(days, c.year, c.month, c.day);
  }
  return MicrosFromFields(c);
}

std::string IsoDate(const Civil& c) {
  return fmt::format("{:04}-{:02}-{:02}", c.year, c.month, c.day);
}

std::string IsoDateTime(const Civil& c, const std::string& sep) {
  std::string ret = fmt::format("{}{}{:02}:{:02}:{:02}", IsoDate(c), sep, c.hour, c.minute, c.second);
  if (c.microsecond) ret += fmt::format(".{:06}", c.microsecond);
  return ret;
}

int64_t DateTimeMicros(const Value& v) { return v.As<DateTimeObject>()->micros; }
int64_t DateDays(const Value& v) { return v.As<DateObject>()->days; }
int64_t DeltaMicros(const Value& v) { return v.As<TimeDeltaObject>()->micros; }

std::string StrftimeArg(CallArgs& args) {
  auto format = Arg("strftime", args, 0, "format");
  CheckArity("strftime", args, 0, 1);
  if (!format) throw ScriptError(ExcType::TYPE_ERROR, "strftime() missing required argument 'format' (pos 1)");
  return AsString(*format, "strftime() argument 1");
}

// --- datetime.datetime ---

Value DateTimeNew(Interpreter& interp, CallArgs& args) {
  const char* fn = "datetime";
  Civil c;
  c.year = DateTimeArg(fn, args, 0, "year", std::nullopt);
  c.month = DateTimeArg(fn, args, 1, "month", std::nullopt);
  c.day = DateTimeArg(fn, args, 2, "day", std::nullopt);
  c.hour = DateTimeArg(fn, args, 3, "hour", 0);
  c.minute = DateTimeArg(fn, args, 4, "minute", 0);
  c.second = DateTimeArg(fn, args, 5, "second", 0);
  c.microsecond = DateTimeArg(fn, args, 6, "microsecond", 0);
  auto tzinfo = Arg(fn, args, 7, "tzinfo");
  if (tzinfo && !tzinfo->IsNone()) {
    throw ScriptError(ExcType::TYPE_ERROR, "tzinfo argument must be None");
  }
  RejectExtra(args, 8);
  return NewDateTime(interp.heap(), MicrosFromFields(c));
}

Value DateTimeNow(Interpreter& interp, CallArgs& args) {
  auto tz = Arg("now", args, 0, "tz");
  CheckArity("now", args, 0, 1);
  if (tz && !tz->IsNone()) throw ScriptError(ExcType::TYPE_ERROR, "tzinfo argument must be None");
  return NewDateTime(interp.heap(), Now(false));
}

Value DateTimeUtcnow(Interpreter& interp, CallArgs& args) {
  CheckArity("utcnow", args, 0, 0);
  return NewDateTime(interp.heap(), Now(true));
}

Value DateTimeToday(Interpreter& interp, CallArgs& args) {
  CheckArity("today", args, 0, 0);
  return NewDateTime(interp.heap(), Now(false));
}

Value DateTimeFromtimestamp(Interpreter& interp, CallArgs& args) {
  CheckArity("fromtimestamp", args, 1, 1);
  return NewDateTime(interp.heap(), FromTimestamp(AsReal(args.args[0]), false));
}

Value DateTimeUtcfromtimestamp(Interpreter& interp, CallArgs& args) {
  CheckArity("utcfromtimestamp", args, 1, 1);
  return NewDateTime(interp.heap(), FromTimestamp(AsReal(args.args[0]), true));
}

Value DateTimeFromisoformat(Interpreter& interp, CallArgs& args) {
  CheckArity("fromisoformat", args, 1, 1);
  const std::string& text = AsString(args.args[0], "fromisoformat: argument");
  return NewDateTime(interp.heap(), DateTimeFromIso(text));
}

Value DateTimeStrptime(Interpreter& interp, CallArgs& args) {
  CheckArity("strptime", args, 2, 2);
  const std::string& text = AsString(args.args[0], "strptime() argument 1");
  const std::string& format = AsString(args.args[1], "strptime() argument 2");
  return NewDateTime(interp.heap(), Strptime(text, format));
}

Value DateTimeStrftime(Interpreter&, const Value& self, CallArgs& args) {
  return Value::Str(TemporalStrftime(self.AsObject(), StrftimeArg(args)));
}

Value DateTimeIsoformat(Interpreter&, const Value& self, CallArgs& args) {
  auto sep = Arg("isoformat", args, 0, "sep");
  CheckArity("isoformat", args, 0, 1);
  std::string separator = "T";
  if (sep) {
    separator = AsString(*sep, "isoformat() argument 1");
    if (CodePointCount(separator) != 1) {
      throw ScriptError(ExcType::TYPE_ERROR, "isoformat() argument 1 must be a unicode character");
    }
  }
  return Value::Str(IsoDateTime(ToCivil(DateTimeMicros(self)), separator));
}

Value DateTimeTimestamp(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("timestamp", args, 0, 0);
  int64_t micros = DateTimeMicros(self);
  Civil c = ToCivil(micros);
  std::tm tm = ToTm(FloorDiv(micros, kMicrosPerDay), c);
  errno = 0;
  time_t t = mktime(&tm);
  if (t == (time_t)-1 && errno) {
    throw ScriptError(ExcType::OVERFLOW_ERROR, "timestamp out of range for platform time_t");
  }
  return Value::Float((double)t + c.microsecond / 1e6);
}

Value DateTimeDate(Interpreter& interp, const Value& self, CallArgs& args) {
  CheckArity("date", args, 0, 0);
  return NewDate(interp.heap(), FloorDiv(DateTimeMicros(self), kMicrosPerDay));
}

int64_t DaysOf(const Value& self) {
  return self.Is(ObjectKind::DATE) ? DateDays(self) : FloorDiv(DateTimeMicros(self), kMicrosPerDay);
}

Value TemporalWeekday(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("weekday", args, 0, 0);
  return Value::Int(Weekday(DaysOf(self)));
}

Value TemporalIsoweekday(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("isoweekday", args, 0, 0);
  return Value::Int(Weekday(DaysOf(self)) + 1);
}

Value TemporalToordinal(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("toordinal", args, 0, 0);
  return Value::Int(DaysOf(self) - kMinDays + 1);
}

Value DateTimeReplace(Interpreter& interp, const Value& self, CallArgs& args) {
  const char* fn = "replace";
  Civil c = ToCivil(DateTimeMicros(self));
  c.year = DateTimeArg(fn, args, 0, "year", c.year);
  c.month = DateTimeArg(fn, args, 1, "month", c.month);
  c.day = DateTimeArg(fn, args, 2, "day", c.day);
  c.hour = DateTimeArg(fn, args, 3, "hour", c.hour);
  c.minute = DateTimeArg(fn, args, 4, "minute", c.minute);
  c.second = DateTimeArg(fn, args, 5, "second", c.second);
  c.microsecond = DateTimeArg(fn, args, 6, "microsecond", c.microsecond);
  RejectExtra(args, 7);
  return NewDateTime(interp.heap(), MicrosFromFields(c));
}

const std::unordered_map<std::string, MethodFn> kDateTimeMethods = {
  {"strftime", DateTimeStrftime}, {"isoformat", DateTimeIsoformat}, {"timestamp", DateTimeTimestamp},
  {"date", DateTimeDate}, {"weekday", TemporalWeekday}, {"isoweekday", TemporalIsoweekday},
  {"replace", DateTimeReplace}, {"toordinal", TemporalToordinal},
};

// --- datetime.date ---

Value DateNew(Interpreter& interp, CallArgs& args) {
  const char* fn = "date";
  int64_t year = DateTimeArg(fn, args, 0, "year", std::nullopt);
  int64_t month = DateTimeArg(fn, args, 1, "month", std::nullopt);
  int64_t day = DateTimeArg(fn, args, 2, "day", std::nullopt);
  RejectExtra(args, 3);
  CheckDate(year, month, day);
  return NewDate(interp.heap(), DaysFromCivil(year, month, day));
}

Value DateToday(Interpreter& interp, CallArgs& args) {
  CheckArity("today", args, 0, 0);
  return NewDate(interp.heap(), FloorDiv(Now(false), kMicrosPerDay));
}

Value DateFromtimestamp(Interpreter& interp, CallArgs& args) {
  CheckArity("fromtimestamp", args, 1, 1);
  return NewDate(interp.heap(), FloorDiv(FromTimestamp(AsReal(args.args[0]), false), kMicrosPerDay));
}

Value DateFromisoformat(Interpreter& interp, CallArgs& args) {
  CheckArity("fromisoformat", args, 1, 1);
  const std::string& text = AsString(args.args[0], "fromisoformat: argument");
  return NewDate(interp.heap(), DateFromIso(text));
}

Value DateIsoformat(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("isoformat", args, 0, 0);
  return Value::Str(IsoDate(ToCivil(DateDays(self) * kMicrosPerDay)));
}

Value DateReplace(Interpreter& interp, const Value& self, CallArgs& args) {
  const char* fn = "replace";
  Civil c = ToCivil(DateDays(self) * kMicrosPerDay);
  int64_t year = DateTimeArg(fn, args, 0, "year", c.year);
  int64_t month = DateTimeArg(fn, args, 1, "month", c.month);
  int64_t day = DateTimeArg(fn, args, 2, "day", c.day);
  RejectExtra(args, 3);
  CheckDate(year, month, day);
  return NewDate(interp.heap(), DaysFromCivil(year, month, day));
}

const std::unordered_map<std::string, MethodFn> kDateMethods = {
  {"strftime", DateTimeStrftime}, {"isoformat", DateIsoformat}, {"weekday", TemporalWeekday},
  {"isoweekday", TemporalIsoweekday}, {"replace", DateReplace}, {"toordinal", TemporalToordinal},
};

// --- datetime.timedelta ---

Value DeltaNew(Interpreter& interp, CallArgs& args) {
  static const std::pair<const char*, long double> kUnits[] = {
    {"days", (long double)kMicrosPerDay}, {"seconds", 1e6L}, {"microseconds", 1.0L},
    {"milliseconds", 1e3L}, {"minutes", 6e7L}, {"hours", 3.6e9L}, {"weeks", 7.0L * kMicrosPerDay},
  };
  // integral units stay exact; floats go through long double
  __int128 exact = 0;
  long double inexact = 0;
  bool has_float = false;
  for (size_t i = 0; i < 7; i++) {
    auto v = Arg("timedelta", args, i, kUnits[i].first);
    if (!v) continue;
    if (v->IsIntLike()) {
      exact += (__int128)v->AsInt() * (int64_t)kUnits[i].second;
    } else if (v->IsFloat()) {
      inexact += v->AsFloat() * kUnits[i].second;
      has_float = true;
    } else {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("unsupported type for timedelta {} component: {}", kUnits[i].first, TypeName(*v)));
    }
  }
  RejectExtra(args, 7);
  if (has_float) return NewDeltaFromReal(interp.heap(), (long double)exact + inexact);
  return NewDelta(interp.heap(), exact);
}

Value DeltaTotalSeconds(Interpreter&, const Value& self, CallArgs& args) {
  CheckArity("total_seconds", args, 0, 0);
  return Value::Float(DeltaMicros(self) / 1e6);
}

const std::unordered_map<std::string, MethodFn> kDeltaMethods = {
  {"total_seconds", DeltaTotalSeconds},
};

Value Builtin(Heap& heap, const std::string& name, NativeFn fn) {
  return Value::Obj(heap.Make<BuiltinObject>(name, fn));
}

BuiltinObject* MakeType(Heap& heap, const std::string& name, NativeFn fn) {
  auto type = heap.Make<BuiltinObject>(name, fn);
  type->is_type = true;
  type->instance_type = name;
  return type;
}

std::string DeltaRepr(int64_t micros) {
  int64_t days, seconds, microseconds;
  DeltaParts(micros, days, seconds, microseconds);
  std::vector<std::string> parts;
  if (days) parts.push_back(fmt::format("days={}", days));
  if (seconds) parts.push_back(fmt::format("seconds={}", seconds));
  if (microseconds) parts.push_back(fmt::format("microseconds={}", microseconds));
  if (parts.empty()) return "datetime.timedelta(0)";
  std::string ret = "datetime.timedelta(";
  for (size_t i = 0; i < parts.size(); i++) ret += (i ? ", " : "") + parts[i];
  return ret + ")";
}

std::string DeltaStr(int64_t micros) {
  int64_t days, seconds, microseconds;
  DeltaParts(micros, days, seconds, microseconds);
  std::string ret;
  if (days) ret = fmt::format("{} day{}, ", days, days == 1 || days == -1 ? "" : "s");
  ret += fmt::format("{}:{:02}:{:02}", seconds / 3600, seconds / 60 % 60, seconds % 60);
  if (microseconds) ret += fmt::format(".{:06}", microseconds);
  return ret;
}

} // namespace

std::string FormatTime(const std::string& format, const std::tm& tm, int64_t microsecond) {
  if (format.find('\0') != std::string::npos) throw ScriptError(ExcType::VALUE_ERROR, "embedded null character");
  std::string expanded;
  for (size_t i = 0; i < format.size(); i++) {
    if (format[i] != '%' || i + 1 == format.size()) {
      expanded += format[i];
      continue;
    }
    char d = format[++i];
    if (d == 'f') {
      expanded += fmt::format("{:06}", microsecond);
    } else if (d == 'z' || d == 'Z') {
      // naive values carry no zone
    } else {
      expanded += '%';
      expanded += d;
    }
  }
  // a trailing marker tells an empty result from a failure
  expanded += '|';
  std::vector<char> buffer(expanded.size() * 4 + 64);
  while (true) {
    size_t n = std::strftime(buffer.data(), buffer.size(), expanded.c_str(), &tm);
    if (n) return std::string(buffer.data(), n - 1);
    if (buffer.size() > (1 << 20)) throw ScriptError(ExcType::MEMORY_ERROR, "sequence length limit exceeded");
    buffer.resize(buffer.size() * 2);
  }
}

std::string TemporalStrftime(const Object* obj, const std::string& format) {
  int64_t micros = obj->kind == ObjectKind::DATE ?
      static_cast<const DateObject*>(obj)->days * kMicrosPerDay :
      static_cast<const DateTimeObject*>(obj)->micros;
  Civil c = ToCivil(micros);
  return FormatTime(format, ToTm(FloorDiv(micros, kMicrosPerDay), c), c.microsecond);
}

std::string TemporalRepr(const Object* obj) {
  switch (obj->kind) {
    case ObjectKind::DATETIME: {
      Civil c = ToCivil(static_cast<const DateTimeObject*>(obj)->micros);
      std::string ret = fmt::format("datetime.datetime({}, {}, {}, {}, {}", c.year, c.month, c.day, c.hour, c.minute);
      if (c.second || c.microsecond) ret += fmt::format(", {}", c.second);
      if (c.microsecond) ret += fmt::format(", {}", c.microsecond);
      return ret + ")";
    }
    case ObjectKind::DATE: {
      Civil c = ToCivil(static_cast<const DateObject*>(obj)->days * kMicrosPerDay);
      return fmt::format("datetime.date({}, {}, {})", c.year, c.month, c.day);
    }
    case ObjectKind::TIMEDELTA:
      return DeltaRepr(static_cast<const TimeDeltaObject*>(obj)->micros);
    default:
      break;
  }
  __builtin_unreachable();
}

std::string TemporalStr(const Object* obj) {
  switch (obj->kind) {
    case ObjectKind::DATETIME:
      return IsoDateTime(ToCivil(static_cast<const DateTimeObject*>(obj)->micros), " ");
    case ObjectKind::DATE:
      return IsoDate(ToCivil(static_cast<const DateObject*>(obj)->days * kMicrosPerDay));
    case ObjectKind::TIMEDELTA:
      return DeltaStr(static_cast<const TimeDeltaObject*>(obj)->micros);
    default:
      break;
  }
  __builtin_unreachable();
}

std::optional<Value> TemporalBinary(Interpreter& interp, BinaryOp op, const Value& a, const Value& b) {
  Heap& heap = interp.heap();
  bool a_delta = a.Is(ObjectKind::TIMEDELTA), b_delta = b.Is(ObjectKind::TIMEDELTA);
  switch (op) {
    case BinaryOp::ADD:
      if (a_delta && b_delta) return NewDelta(heap, (__int128)DeltaMicros(a) + DeltaMicros(b));
      if (a.Is(ObjectKind::DATETIME) && b_delta) return NewDateTime(heap, (__int128)DateTimeMicros(a) + DeltaMicros(b));
      if (a_delta && b.Is(ObjectKind::DATETIME)) return NewDateTime(heap, (__int128)DateTimeMicros(b) + DeltaMicros(a));
      // date arithmetic uses whole days only
      if (a.Is(ObjectKind::DATE) && b_delta) return NewDate(heap, DateDays(a) + FloorDiv(DeltaMicros(b), kMicrosPerDay));
      if (a_delta && b.Is(ObjectKind::DATE)) return NewDate(heap, DateDays(b) + FloorDiv(DeltaMicros(a), kMicrosPerDay));
      break;
    case BinaryOp::SUB:
      if (a_delta && b_delta) return NewDelta(heap, (__int128)DeltaMicros(a) - DeltaMicros(b));
      if (a.Is(ObjectKind::DATETIME) && b_delta) return NewDateTime(heap, (__int128)DateTimeMicros(a) - DeltaMicros(b));
      if (a.Is(ObjectKind::DATETIME) && b.Is(ObjectKind::DATETIME)) {
        return NewDelta(heap, (__int128)DateTimeMicros(a) - DateTimeMicros(b));
      }
      if (a.Is(ObjectKind::DATE) && b_delta) return NewDate(heap, DateDays(a) - FloorDiv(DeltaMicros(b), kMicrosPerDay));
      if (a.Is(ObjectKind::DATE) && b.Is(ObjectKind::DATE)) {
        return NewDelta(heap, (__int128)(DateDays(a) - DateDays(b)) * kMicrosPerDay);
      }
      break;
    case BinaryOp::MUL: {
      const Value& delta = a_delta ? a : b;
      const Value& factor = a_delta ? b : a;
      if (a_delta == b_delta) break;
      if (factor.IsIntLike()) return NewDelta(heap, (__int128)DeltaMicros(delta) * factor.AsInt());
      if (factor.IsFloat()) return NewDeltaFromReal(heap, (long double)DeltaMicros(delta) * factor.AsFloat());
      break;
    }
    case BinaryOp::DIV:
      if (!a_delta) break;
      if (b_delta) {
        if (!DeltaMicros(b)) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "division by zero");
        return Value::Float((double)DeltaMicros(a) / DeltaMicros(b));
      }
      if (b.IsNumber()) {
        if (b.AsFloat() == 0) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "division by zero");
        return NewDeltaFromReal(heap, (long double)DeltaMicros(a) / b.AsFloat());
      }
      break;
    case BinaryOp::FLOOR_DIV:
      if (!a_delta) break;
      if (b_delta) {
        if (!DeltaMicros(b)) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "integer division or modulo by zero");
        return Value::Int(FloorDiv(DeltaMicros(a), DeltaMicros(b)));
      }
      if (b.IsIntLike()) {
        if (!b.AsInt()) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "integer division or modulo by zero");
        return NewDelta(heap, FloorDiv(DeltaMicros(a), b.AsInt()));
      }
      break;
    case BinaryOp::MOD:
      if (a_delta && b_delta) {
        if (!DeltaMicros(b)) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "integer division or modulo by zero");
        return NewDelta(heap, FloorMod(DeltaMicros(a), DeltaMicros(b)));
      }
      break;
    default:
      break;
  }
  return std::nullopt;
}

MethodFn TemporalMethod(ObjectKind kind, const std::string& name) {
  const std::unordered_map<std::string, MethodFn>* table;
  switch (kind) {
    case ObjectKind::DATETIME: table = &kDateTimeMethods; break;
    case ObjectKind::DATE: table = &kDateMethods; break;
    case ObjectKind::TIMEDELTA: table = &kDeltaMethods; break;
    default: return nullptr;
  }
  auto it = table->find(name);
  return it == table->end() ? nullptr : it->second;
}

Value TemporalGetAttr(Interpreter&, const Value& self, const std::string& name) {
  if (self.Is(ObjectKind::TIMEDELTA)) {
    int64_t days, seconds, microseconds;
    DeltaParts(DeltaMicros(self), days, seconds, microseconds);
    if (name == "days") return Value::Int(days);
    if (name == "seconds") return Value::Int(seconds);
    if (name == "microseconds") return Value::Int(microseconds);
  } else {
    bool is_date = self.Is(ObjectKind::DATE);
    Civil c = ToCivil(is_date ? DateDays(self) * kMicrosPerDay : DateTimeMicros(self));
    if (name == "year") return Value::Int(c.year);
    if (name == "month") return Value::Int(c.month);
    if (name == "day") return Value::Int(c.day);
    if (!is_date) {
      if (name == "hour") return Value::Int(c.hour);
      if (name == "minute") return Value::Int(c.minute);
      if (name == "second") return Value::Int(c.second);
      if (name == "microsecond") return Value::Int(c.microsecond);
      if (name == "tzinfo") return Value();
    }
  }
  throw ScriptError(ExcType::ATTRIBUTE_ERROR,
      fmt::format("'{}' object has no attribute '{}'", TypeName(self), name));
}

ModuleObject* MakeDatetimeModule(Heap& heap) {
  auto module = heap.Make<ModuleObject>("datetime");

  auto datetime = MakeType(heap, "datetime.datetime", DateTimeNew);
  datetime->attrs = {
    {"now", Builtin(heap, "now", DateTimeNow)},
    {"utcnow", Builtin(heap, "utcnow", DateTimeUtcnow)},
    {"today", Builtin(heap, "today", DateTimeToday)},
    {"fromtimestamp", Builtin(heap, "fromtimestamp", DateTimeFromtimestamp)},
    {"utcfromtimestamp", Builtin(heap, "utcfromtimestamp", DateTimeUtcfromtimestamp)},
    {"fromisoformat", Builtin(heap, "fromisoformat", DateTimeFromisoformat)},
    {"strptime", Builtin(heap, "strptime", DateTimeStrptime)},
    {"min", Value::Obj(heap.Make<DateTimeObject>(kMinDays * kMicrosPerDay))},
    {"max", Value::Obj(heap.Make<DateTimeObject>((kMaxDays + 1) * kMicrosPerDay - 1))},
  };

  auto date = MakeType(heap, "datetime.date", DateNew);
  date->attrs = {
    {"today", Builtin(heap, "today", DateToday)},
    {"fromtimestamp", Builtin(heap, "fromtimestamp", DateFromtimestamp)},
    {"fromisoformat", Builtin(heap, "fromisoformat", DateFromisoformat)},
    {"min", Value::Obj(heap.Make<DateObject>(kMinDays))},
    {"max", Value::Obj(heap.Make<DateObject>(kMaxDays))},
  };

  auto timedelta = MakeType(heap, "datetime.timedelta", DeltaNew);
  timedelta->attrs = {
    {"resolution", Value::Obj(heap.Make<TimeDeltaObject>(1))},
  };

  module->members = {
    {"datetime", Value::Obj(datetime)},
    {"date", Value::Obj(date)},
    {"timedelta", Value::Obj(timedelta)},
    {"MINYEAR", Value::Int(kMinYear)},
    {"MAXYEAR", Value::Int(kMaxYear)},
  };
  return module;
}

} // namespace interp
