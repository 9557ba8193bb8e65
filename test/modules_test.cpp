#include <chrono>

#include "utils.h"

TEST(JsonModuleTest, Dumps) {
  EXPECT_OUTPUT("import json\nprint(json.dumps({'a': [1, 2.5, None, True], 'b': 'x'}))",
                "{\"a\": [1, 2.5, null, true], \"b\": \"x\"}\n");
  EXPECT_OUTPUT("print(json.dumps({'b': 1, 'a': 2}, sort_keys=True), json.dumps({1: 'x', None: 0}))",
                "{\"a\": 2, \"b\": 1} {\"1\": \"x\", \"null\": 0}\n");
  EXPECT_OUTPUT("print(json.dumps([1, [2]], indent=2))", "[\n  1,\n  [\n    2\n  ]\n]\n");
  EXPECT_OUTPUT("print(json.dumps({'a': 1, 'b': []}, separators=(',', ':')))", "{\"a\":1,\"b\":[]}\n");
  EXPECT_OUTPUT("print(json.dumps('\\u00e9\\n'), json.dumps('\\u00e9', ensure_ascii=False))",
                "\"\\u00e9\\n\" \"\xc3\xa9\"\n");
  EXPECT_OUTPUT("print(json.dumps(float('nan')), json.dumps((1, 2)), json.dumps(1e100))", "NaN [1, 2] 1e+100\n");
  EXPECT_OUTPUT("print(json.dumps({}, indent=4), json.dumps([]))", "{} []\n");
  EXPECT_RAISES("json.dumps({1, 2})", "TypeError: Object of type set is not JSON serializable");
  EXPECT_RAISES("json.dumps({(1, 2): 0})", "TypeError: keys must be str, int, float, bool or None, not tuple");
  EXPECT_RAISES("l = []\nl.append(l)\njson.dumps(l)", "ValueError: Circular reference detected");
  EXPECT_RAISES("json.dumps(float('inf'), allow_nan=False)",
                "ValueError: Out of range float values are not JSON compliant: inf");
}

TEST(JsonModuleTest, DumpsDefault) {
  EXPECT_OUTPUT("import datetime\nprint(json.dumps({'d': datetime.date(2024, 1, 2)}, default=str))",
                "{\"d\": \"2024-01-02\"}\n");
}

TEST(JsonModuleTest, Loads) {
  EXPECT_OUTPUT("print(json.loads('{\"a\": [1, 2.0, \"s\", null, false]}'))",
                "{'a': [1, 2.0, 's', None, False]}\n");
  EXPECT_OUTPUT("print(json.loads(' \"\\\\u00e9\" ') == '\\u00e9', json.loads('-5'), json.loads('1e3'))",
                "True -5 1000.0\n");
  EXPECT_OUTPUT("d = json.loads('{\"k\": 1, \"k\": 2}')\nprint(d)", "{'k': 2}\n");
  EXPECT_OUTPUT("print(json.loads('123456789012345678901234567890') + 1, json.loads('18446744073709551615'))",
                "123456789012345678901234567891 18446744073709551615\n");
  EXPECT_OUTPUT("print(json.dumps([2 ** 70, -2 ** 64]), json.dumps({2 ** 64: 0}))",
                "[1180591620717411303424, -18446744073709551616] {\"18446744073709551616\": 0}\n");
  EXPECT_RAISES("json.loads('')", "json.decoder.JSONDecodeError: Expecting value: line 1 column 1 (char 0)");
  EXPECT_RAISES("json.loads(5)", "TypeError: the JSON object must be str, bytes or bytearray, not int");
}

TEST(JsonModuleTest, DecodeErrorIsValueError) {
  EXPECT_OUTPUT(R"(
import json
for text in ['{bad', '[1,', '[1] x', '{"a" 1}']:
    try:
        json.loads(text)
    except json.JSONDecodeError:
        print('decode', end=' ')
    try:
        json.loads(text)
    except ValueError as e:
        print('value', end=' ')
print()
)", "decode value decode value decode value decode value \n");
  std::string last = LastLine(FailureOf("json.loads('[1] x')"));
  EXPECT_EQ(last.rfind("json.decoder.JSONDecodeError: Extra data: line 1 column ", 0), 0u) << last;
}

TEST(DatetimeModuleTest, Construct) {
  EXPECT_OUTPUT(R"(
from datetime import datetime, date, timedelta
dt = datetime(2024, 1, 15, 10, 30)
print(dt)
print(repr(dt), repr(date(2024, 2, 29)))
print(dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second, dt.microsecond)
print(datetime(2024, 1, 15, 10, 30, 0, 500).isoformat(), dt.isoformat(' '))
print(dt.date(), dt.replace(year=2025, minute=0))
)", "2024-01-15 10:30:00\n"
    "datetime.datetime(2024, 1, 15, 10, 30) datetime.date(2024, 2, 29)\n"
    "2024 1 15 10 30 0 0\n"
    "2024-01-15T10:30:00.000500 2024-01-15 10:30:00\n"
    "2024-01-15 2025-01-15 10:00:00\n");
  EXPECT_RAISES("import datetime\ndatetime.datetime(2024, 13, 1)", "ValueError: month must be in 1..12");
  EXPECT_RAISES("import datetime\ndatetime.date(2023, 2, 29)", "ValueError: day is out of range for month");
  EXPECT_RAISES("import datetime\ndatetime.date(0, 1, 1)", "ValueError: year 0 is out of range");
}

TEST(DatetimeModuleTest, Methods) {
  EXPECT_OUTPUT(R"(
from datetime import datetime, date
dt = datetime(2024, 1, 15, 10, 30)
print(dt.strftime('%Y/%m/%d %H:%M:%S %A %B %j'))
print(f'{dt:%d.%m.%y}', date(2024, 2, 29).weekday(), date(2024, 2, 29).isoweekday())
print(repr(datetime.fromisoformat('2024-01-15T10:30:05')), date.fromisoformat('2024-03-01'))
print(repr(datetime.strptime('15/01/2024 10:30', '%d/%m/%Y %H:%M')))
print(repr(datetime.utcfromtimestamp(0)))
print(datetime(2024, 1, 1) < datetime(2024, 1, 2), date(2024, 1, 1) == date(2024, 1, 1))
)", "2024/01/15 10:30:00 Monday January 015\n"
    "15.01.24 3 4\n"
    "datetime.datetime(2024, 1, 15, 10, 30, 5) 2024-03-01\n"
    "datetime.datetime(2024, 1, 15, 10, 30)\n"
    "datetime.datetime(1970, 1, 1, 0, 0)\n"
    "True True\n");
  EXPECT_RAISES("from datetime import datetime\ndatetime.strptime('2024', '%Y-%m')",
                "ValueError: time data '2024' does not match format '%Y-%m'");
  std::string last = LastLine(FailureOf("import datetime\ndatetime.date.fromisoformat('2024-13-01')"));
  EXPECT_EQ(last.rfind("ValueError: ", 0), 0u) << last;
}

TEST(DatetimeModuleTest, Now) {
  EXPECT_OUTPUT(R"(
from datetime import datetime, date, timedelta
now = datetime.now()
print(now.year >= 2024, date.today().year >= 2024, abs(datetime.now() - now) < timedelta(minutes=1))
print(datetime.today() >= now, abs(datetime.utcnow() - now) <= timedelta(hours=15))
)", "True True True\nTrue True\n");
}

TEST(DatetimeModuleTest, Timedelta) {
  EXPECT_OUTPUT(R"(
from datetime import datetime, date, timedelta
print(timedelta(days=1, hours=2, minutes=3, seconds=4.5))
print(timedelta(seconds=-1), repr(timedelta(seconds=-1)))
print(timedelta(weeks=1, milliseconds=1).total_seconds(), timedelta(minutes=1.5).total_seconds())
d = timedelta(days=2, seconds=10, microseconds=7)
print(d.days, d.seconds, d.microseconds, repr(timedelta()))
print(datetime(2024, 1, 15, 10, 30) + timedelta(days=20), date(2024, 3, 1) - timedelta(days=1))
print((datetime(2024, 3, 1) - datetime(2024, 2, 1)).days, date(2024, 1, 1) - date(2023, 1, 1))
print(timedelta(hours=1) / timedelta(minutes=15), timedelta(hours=1) // timedelta(minutes=7))
print(timedelta(hours=1) * 2, timedelta(hours=1) / 4, -timedelta(hours=1), abs(timedelta(hours=-1)))
print(timedelta(hours=1) % timedelta(minutes=7), timedelta(1) > timedelta(hours=23))
)", "1 day, 2:03:04.500000\n"
    "-1 day, 23:59:59 datetime.timedelta(days=-1, seconds=86399)\n"
    "604800.001 90.0\n"
    "2 10 7 datetime.timedelta(0)\n"
    "2024-02-04 10:30:00 2024-02-29\n"
    "29 365 days, 0:00:00\n"
    "4.0 8\n"
    "2:00:00 0:15:00 -1 day, 23:00:00 1:00:00\n"
    "0:04:00 True\n");
  EXPECT_RAISES("from datetime import timedelta\ntimedelta(days=1000000000)",
                "OverflowError: days=1000000000; must have magnitude <= 99999999");
}

TEST(TimeModuleTest, Clocks) {
  EXPECT_OUTPUT(R"(
import time
t = time.time()
start = time.monotonic()
p = time.perf_counter()
time.sleep(0.01)
print(t > 1.6e9, time.time_ns() // 10 ** 9 >= int(t), time.monotonic() - start >= 0.01, time.perf_counter() > p)
print(len(time.strftime('%Y')), time.strftime('%%'))
)", "True True True True\n4 %\n");
  EXPECT_RAISES("import time\ntime.sleep(-1)", "ValueError: sleep length must be non-negative");
  EXPECT_RAISES("import time\ntime.sleep('1')", "TypeError: 'str' object cannot be interpreted as an integer");
}

TEST(TimeModuleTest, SleepStopsAtDeadline) {
  ExecutionLimits limits;
  limits.time_limit = 300;
  auto start = std::chrono::steady_clock::now();
  RuntimeFailure failure = FailureOf("import time\nprint('zz')\ntime.sleep(60)\nprint('never')", limits);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::seconds(10));
  EXPECT_EQ(failure.output, "zz\n");
  EXPECT_EQ(LastLine(failure).rfind("TimeoutError: ", 0), 0u) << failure.traceback;
}
