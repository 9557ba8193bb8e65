#include "utils.h"

TEST(InterpreterTest, Arithmetic) {
  EXPECT_OUTPUT("print(7 // 2, -7 // 2, 7 % -3, -7 % 3)", "3 -4 -2 2\n");
  EXPECT_OUTPUT("print(7 / 2, 2 ** 10, 2 ** -1)", "3.5 1024 0.5\n");
  EXPECT_OUTPUT("print(0.1 + 0.2, 1e16, 1.5e-5, 3.0)", "0.30000000000000004 1e+16 1.5e-05 3.0\n");
  EXPECT_OUTPUT("print(6 & 3, 6 | 3, 6 ^ 3, ~6, 1 << 4, -16 >> 2)", "2 7 5 -7 16 -4\n");
  EXPECT_OUTPUT("print(True + True, -True, 3 * False)", "2 -1 0\n");
  EXPECT_OUTPUT("print(0x1f, 0o17, 0b101, 1_000_000)", "31 15 5 1000000\n");
  EXPECT_RAISES("1 % 0", "ZeroDivisionError: integer modulo by zero");
  EXPECT_RAISES("1.0 / 0", "ZeroDivisionError: float division by zero");
  EXPECT_RAISES("1 + 'a'", "TypeError: unsupported operand type(s) for +: 'int' and 'str'");
}

TEST(InterpreterTest, BigIntegers) {
  EXPECT_OUTPUT("print(2 ** 64, 1 << 70)", "18446744073709551616 1180591620717411303424\n");
  EXPECT_OUTPUT("print(-2 ** 63, -(2 ** 63) - 1, -9223372036854775808)",
                "-9223372036854775808 -9223372036854775809 -9223372036854775808\n");
  EXPECT_OUTPUT("print((-10 ** 20) // 7, (-10 ** 20) % 7)", "-14285714285714285715 5\n");
  EXPECT_OUTPUT("print(2 ** 100 // 2 ** 98, 2 ** 100 / 2 ** 98, (2 ** 64 - 1) & 0xff, ~(2 ** 64))",
                "4 4.0 255 -18446744073709551617\n");
  EXPECT_OUTPUT("print(0xffffffffffffffffff, int('9' * 30) + 1)",
                "4722366482869645213695 1000000000000000000000000000000\n");
  EXPECT_OUTPUT("print(len(str(7 ** 1000)), (3 ** 200).bit_length())", "846 317\n");
  EXPECT_OUTPUT("print(2 ** 53 + 1 > 2.0 ** 53, 2 ** 53 + 1 == 2.0 ** 53, 10 ** 400 > 1e308)",
                "True False True\n");
  EXPECT_OUTPUT("print(hash(2 ** 64) == hash(float(2 ** 64)), {2 ** 64: 'a'}[18446744073709551616.0])",
                "True a\n");
  EXPECT_OUTPUT("x = 10 ** 20\nprint([1, 2, 3][:x], -x, 2 ** 64 in range(10))",
                "[1, 2, 3] -100000000000000000000 False\n");
  EXPECT_RAISES("str(10 ** 5000)",
                "ValueError: Exceeds the limit (4300 digits) for integer string conversion; "
                "use sys.set_int_max_str_digits() to increase the limit");
  EXPECT_RAISES("[1][2 ** 64]", "IndexError: cannot fit 'int' into an index-sized integer");
  EXPECT_RAISES("float(2 ** 1100)", "OverflowError: int too large to convert to float");
  EXPECT_RAISES("2 ** 1100 / 3", "OverflowError: integer division result too large for a float");
  EXPECT_RAISES("2 ** 70 // 0", "ZeroDivisionError: integer division or modulo by zero");
}

TEST(InterpreterTest, Comparisons) {
  EXPECT_OUTPUT("print(1 < 2 < 3, 1 < 3 < 2, 1 == 1.0, 'a' < 'b')", "True False True True\n");
  EXPECT_OUTPUT("print([1, 2] < [1, 3], (1, 2) == (1, 2), None is None, 1 is not None)",
                "True True True True\n");
  EXPECT_OUTPUT("print(2 in [1, 2], 'b' in 'abc', 3 not in {1: 2}, 'k' in {'k': 1})",
                "True True True True\n");
  EXPECT_RAISES("1 < 'a'", "TypeError: '<' not supported between instances of 'int' and 'str'");
}

TEST(InterpreterTest, BoolOps) {
  EXPECT_OUTPUT("print(0 or 'x', 1 and [], not 0, None or 0)", "x [] True 0\n");
  EXPECT_OUTPUT("print('yes' if [] else 'no')", "no\n");
}

TEST(InterpreterTest, Strings) {
  EXPECT_OUTPUT("print('ab' 'cd', 'x' * 3, r'\\n', len('h\\u00e9llo'))", "abcd xxx \\n 5\n");
  EXPECT_OUTPUT("s = 'h\\u00e9llo'\nprint(s[1], s[-1], s[1:3], s[::-1])", "\xc3\xa9 o \xc3\xa9l oll\xc3\xa9h\n");
  EXPECT_OUTPUT("print('''a\nb''')", "a\nb\n");
  EXPECT_OUTPUT("print(repr('it\\'s'), repr(\"a\\nb\"))", "\"it's\" 'a\\nb'\n");
}

TEST(InterpreterTest, FStrings) {
  EXPECT_OUTPUT("x = 3\nprint(f'{x} {x!r:>4} {x * 2:03d} {{}}')", "3    3 006 {}\n");
  EXPECT_OUTPUT("name = 'bob'\nprint(f'{name=}', f'{name!r}')", "name='bob' 'bob'\n");
  EXPECT_OUTPUT("w = 8\nprint(f'{3.14159:{w}.2f}|')", "    3.14|\n");
  EXPECT_OUTPUT("d = {'a': 1}\nprint(f\"{d['a']}\")", "1\n");
}

TEST(InterpreterTest, Assignment) {
  EXPECT_OUTPUT("a, b = 1, 2\na, b = b, a\nprint(a, b)", "2 1\n");
  EXPECT_OUTPUT("first, *rest = [1, 2, 3]\nprint(first, rest)", "1 [2, 3]\n");
  EXPECT_OUTPUT("*init, last = 'abc'\nprint(init, last)", "['a', 'b'] c\n");
  EXPECT_OUTPUT("x = y = [0]\nx.append(1)\nprint(y)", "[0, 1]\n");
  EXPECT_OUTPUT("l = [1, 2, 3]\nl[1:2] = [7, 8]\nl[0] += 10\nprint(l)", "[11, 7, 8, 3]\n");
  EXPECT_OUTPUT("n: int = 5\nn -= 2\nn **= 2\nprint(n)", "9\n");
  EXPECT_OUTPUT("if (n := 10) > 5:\n    print(n)", "10\n");
  EXPECT_RAISES("a, b = [1, 2, 3]", "ValueError: too many values to unpack (expected 2)");
  EXPECT_RAISES("a, b, c = [1, 2]", "ValueError: not enough values to unpack (expected 3, got 2)");
}

TEST(InterpreterTest, ControlFlow) {
  EXPECT_OUTPUT(R"(
for i in range(10):
    if i % 2:
        continue
    if i > 6:
        break
    print(i, end=' ')
else:
    print('no break')
print()
)", "0 2 4 6 \n");
  EXPECT_OUTPUT(R"(
n = 0
while n < 3:
    n += 1
else:
    print('done', n)
)", "done 3\n");
  EXPECT_OUTPUT(R"(
x = 5
if x < 3:
    print('small')
elif x < 10:
    print('medium')
else:
    print('large')
)", "medium\n");
}

TEST(InterpreterTest, Functions) {
  EXPECT_OUTPUT(R"(
def f(a, b=2, *args, c, d=4, **kwargs):
    return a, b, args, c, d, kwargs
print(f(1, c=3))
print(f(1, 5, 6, 7, c=3, e=9))
print(f(*[1, 2], **{'c': 0}))
)", "(1, 2, (), 3, 4, {})\n(1, 5, (6, 7), 3, 4, {'e': 9})\n(1, 2, (), 0, 4, {})\n");
  EXPECT_OUTPUT("sq = lambda x: x * x\nprint(list(map(sq, [1, 2, 3])))", "[1, 4, 9]\n");
  EXPECT_OUTPUT(R"(
def deco(fn):
    def wrapper(*args):
        return fn(*args) + 1
    return wrapper

@deco
def g(x):
    return x * 2
print(g(5))
)", "11\n");
  EXPECT_RAISES("def f(a):\n    pass\nf()", "TypeError: f() missing 1 required positional argument: 'a'");
  EXPECT_RAISES("def f():\n    pass\nf(1)", "TypeError: f() takes 0 positional arguments but 1 was given");
  EXPECT_RAISES("def f(a):\n    pass\nf(b=1)", "TypeError: f() got an unexpected keyword argument 'b'");
}

TEST(InterpreterTest, Scoping) {
  EXPECT_OUTPUT(R"(
def counter():
    n = 0
    def inc():
        nonlocal n
        n += 1
        return n
    return inc
c = counter()
c()
print(c(), c())
)", "2 3\n");
  EXPECT_OUTPUT(R"(
total = 0
def add(x):
    global total
    total += x
add(3)
add(4)
print(total)
)", "7\n");
  EXPECT_OUTPUT(R"(
fns = [lambda: i for i in range(3)]
print([f() for f in fns])
)", "[2, 2, 2]\n");
  EXPECT_RAISES(R"(
x = 1
def f():
    print(x)
    x = 2
f()
)", "UnboundLocalError: cannot access local variable 'x' where it is not associated with a value");
}

TEST(InterpreterTest, Comprehensions) {
  EXPECT_OUTPUT("print([x * y for x in range(3) for y in range(3) if x != y])", "[0, 0, 2, 0, 2, 2]\n");
  EXPECT_OUTPUT("print({k: v for k, v in zip('ab', [1, 2])})", "{'a': 1, 'b': 2}\n");
  EXPECT_OUTPUT("print(sorted({x % 3 for x in range(10)}))", "[0, 1, 2]\n");
  EXPECT_OUTPUT("print(sum(x * x for x in range(4)))", "14\n");
  EXPECT_OUTPUT("x = 'outer'\n[x for x in range(3)]\nprint(x)", "outer\n");
}

TEST(InterpreterTest, Displays) {
  EXPECT_OUTPUT("a = [1, 2]\nprint([0, *a, 3], (*a,), {*a, 5})", "[0, 1, 2, 3] (1, 2) {1, 2, 5}\n");
  EXPECT_OUTPUT("d = {'x': 1}\nprint({**d, 'y': 2})", "{'x': 1, 'y': 2}\n");
  EXPECT_OUTPUT("print((), (1,), [], {}, set())", "() (1,) [] {} set()\n");
}

TEST(InterpreterTest, Exceptions) {
  EXPECT_OUTPUT(R"(
try:
    {}['missing']
except KeyError as e:
    print('key', e)
else:
    print('else')
finally:
    print('finally')
)", "key 'missing'\nfinally\n");
  EXPECT_OUTPUT(R"(
try:
    raise ValueError('bad', 2)
except (TypeError, ValueError) as e:
    print(e.args)
)", "('bad', 2)\n");
  EXPECT_OUTPUT(R"(
def f():
    try:
        return 'try'
    finally:
        print('cleanup')
print(f())
)", "cleanup\ntry\n");
  EXPECT_OUTPUT(R"(
try:
    try:
        1 / 0
    except ZeroDivisionError:
        raise
except ArithmeticError as e:
    print('outer', e)
)", "outer division by zero\n");
  EXPECT_RAISES("raise ValueError('boom')", "ValueError: boom");
  EXPECT_RAISES("raise RuntimeError", "RuntimeError");
  EXPECT_RAISES("assert 1 == 2, 'mismatch'", "AssertionError: mismatch");
  EXPECT_RAISES("try:\n    1/0\nexcept ZeroDivisionError as e:\n    raise TypeError('t') from e",
                "TypeError: t");
}

TEST(InterpreterTest, Delete) {
  EXPECT_OUTPUT("l = [1, 2, 3, 4]\ndel l[0], l[1:]\nprint(l)", "[2]\n");
  EXPECT_OUTPUT("d = {'a': 1, 'b': 2}\ndel d['a']\nprint(d)", "{'b': 2}\n");
  EXPECT_RAISES("x = 1\ndel x\nprint(x)", "NameError: name 'x' is not defined");
}

TEST(InterpreterTest, Imports) {
  EXPECT_OUTPUT("import json as j\nprint(j.dumps([1]))", "[1]\n");
  EXPECT_OUTPUT("from datetime import timedelta as td\nprint(td(hours=1))", "1:00:00\n");
  EXPECT_OUTPUT("print(json.loads('2'))", "2\n");
  EXPECT_RAISES("from json import nothing", "ImportError: cannot import name 'nothing' from 'json'");
}

TEST(InterpreterTest, UnsupportedSyntax) {
  for (const char* code : {"with x:\n    pass", "def f():\n    yield 1", "x = b'bytes'", "x = 1j"}) {
    std::string last = LastLine(FailureOf(code));
    EXPECT_EQ(last.rfind("SyntaxError: ", 0), 0u) << code << " -> " << last;
  }
}

TEST(InterpreterTest, IndentationError) {
  std::string last = LastLine(FailureOf("if True:\nprint(1)"));
  EXPECT_EQ(last, "IndentationError: expected an indented block after 'if' statement on line 1");
}
