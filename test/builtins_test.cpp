#include "utils.h"

TEST(BuiltinsTest, Print) {
  EXPECT_OUTPUT("print()", "\n");
  EXPECT_OUTPUT("print(1, 'a', None, True, 2.5, [1, 'b'])", "1 a None True 2.5 [1, 'b']\n");
  EXPECT_OUTPUT("print(1, 2, sep='', end='')\nprint(3, sep=None, end=None)", "123\n");
  EXPECT_RAISES("print(1, sep=3)", "TypeError: sep must be None or a string, not int");
  EXPECT_RAISES("print(1, stream=3)", "TypeError: print() got an unexpected keyword argument 'stream'");
}

TEST(BuiltinsTest, Conversions) {
  EXPECT_OUTPUT("print(int('  42 '), int(-3.9), int('ff', 16), int('0x10', 0), int(True))", "42 -3 255 16 1\n");
  EXPECT_OUTPUT("print(float('1.5'), float(' -inf '), float(3), float())", "1.5 -inf 3.0 0.0\n");
  EXPECT_OUTPUT("print(str(1.0), str(None), str([None]), str())", "1.0 None [None] \n");
  EXPECT_OUTPUT("print(bool(0), bool('0'), bool([]), bool({0: 0}))", "False True False True\n");
  EXPECT_OUTPUT("print(list('ab'), tuple([1]), set([1, 1]), dict([('a', 1)], b=2))",
                "['a', 'b'] (1,) {1} {'a': 1, 'b': 2}\n");
  EXPECT_RAISES("int('x')", "ValueError: invalid literal for int() with base 10: 'x'");
  EXPECT_RAISES("float('nope')", "ValueError: could not convert string to float: 'nope'");
  EXPECT_RAISES("int([])", "TypeError: int() argument must be a string, a bytes-like object or a real number, not 'list'");
}

TEST(BuiltinsTest, Len) {
  EXPECT_OUTPUT("print(len([1, 2]), len('\\u00e9'), len({}), len(range(0, 10, 3)))", "2 1 0 4\n");
  EXPECT_RAISES("len(5)", "TypeError: object of type 'int' has no len()");
}

TEST(BuiltinsTest, Range) {
  EXPECT_OUTPUT("print(list(range(3)), list(range(5, 0, -2)), range(1, 4))", "[0, 1, 2] [5, 3, 1] range(1, 4)\n");
  EXPECT_OUTPUT("r = range(0, 20, 5)\nprint(r[1], r[-1], 15 in r, 7 in r, len(r))", "5 15 True False 4\n");
  EXPECT_RAISES("range(1, 2, 0)", "ValueError: range() arg 3 must not be zero");
}

TEST(BuiltinsTest, Aggregates) {
  EXPECT_OUTPUT("print(sum([1, 2, 3], 10), sum([0.5, 0.25]), sum([]))", "16 0.75 0\n");
  EXPECT_OUTPUT("print(max(3, 1, 2), min([4, 2, 8]), max('abc'), min([], default=-1))", "3 2 c -1\n");
  EXPECT_OUTPUT("print(max(['aa', 'b', 'ccc'], key=len), min([3, -4], key=abs))", "ccc 3\n");
  EXPECT_OUTPUT("print(any([0, '', 1]), all([]), all([1, 0]), any([]))", "True True False False\n");
  EXPECT_RAISES("max([])", "ValueError: max() arg is an empty sequence");
  EXPECT_RAISES("sum(['a'], '')", "TypeError: sum() can't sum strings [use ''.join(seq) instead]");
}

TEST(BuiltinsTest, Numbers) {
  EXPECT_OUTPUT("print(abs(-3), abs(-2.5), abs(True))", "3 2.5 1\n");
  EXPECT_OUTPUT("print(round(2.5), round(3.5), round(-0.5), round(2.675, 2), round(1234, -2))", "2 4 0 2.67 1200\n");
  EXPECT_OUTPUT("print(round(1.5, None), round(7))", "2 7\n");
  EXPECT_OUTPUT("print(abs(-2 ** 70), round(12345678901234567890123, -5), round(-(2 ** 63), -1))",
                "1180591620717411303424 12345678901234567900000 -9223372036854775810\n");
  EXPECT_OUTPUT("print(int(1e20), int('-123456789012345678901234567890'))",
                "100000000000000000000 -123456789012345678901234567890\n");
  EXPECT_RAISES("abs('x')", "TypeError: bad operand type for abs(): 'str'");
}

TEST(BuiltinsTest, Iteration) {
  EXPECT_OUTPUT("print(list(enumerate('ab', 1)))", "[(1, 'a'), (2, 'b')]\n");
  EXPECT_OUTPUT("print(list(zip([1, 2, 3], 'ab')))", "[(1, 'a'), (2, 'b')]\n");
  EXPECT_OUTPUT("print(list(reversed([1, 2, 3])), list(reversed(range(3))))", "[3, 2, 1] [2, 1, 0]\n");
  EXPECT_OUTPUT("print(list(map(lambda a, b: a + b, [1, 2], [10, 20])))", "[11, 22]\n");
  EXPECT_OUTPUT("print(list(filter(None, [0, 1, '', 'x'])), list(filter(lambda x: x > 1, [1, 2, 3])))",
                "[1, 'x'] [2, 3]\n");
  EXPECT_OUTPUT("it = map(str, [1, 2])\nprint(list(it), list(it))", "['1', '2'] []\n");
}

TEST(BuiltinsTest, Sorted) {
  EXPECT_OUTPUT("print(sorted([3, 1, 2]), sorted('cab', reverse=True))", "[1, 2, 3] ['c', 'b', 'a']\n");
  EXPECT_OUTPUT("print(sorted([('b', 2), ('a', 2), ('c', 1)], key=lambda p: p[1]))",
                "[('c', 1), ('b', 2), ('a', 2)]\n");
  std::string last = LastLine(FailureOf("sorted([1, 'a'])"));
  EXPECT_EQ(last.rfind("TypeError: '<' not supported between instances of ", 0), 0u) << last;
}

TEST(BuiltinsTest, ExceptionTypes) {
  EXPECT_OUTPUT("e = ValueError('x')\nprint(e, repr(e), e.args)", "x ValueError('x') ('x',)\n");
  EXPECT_OUTPUT("try:\n    raise KeyError('k')\nexcept LookupError as e:\n    print(repr(e))", "KeyError('k')\n");
}

TEST(BuiltinsTest, AddressedRepr) {
  EXPECT_OUTPUT("def f():\n    pass\nprint(repr(f).startswith('<function f at 0x'), str(f) == repr(f))",
                "True True\n");
  EXPECT_OUTPUT("print(repr(reversed([])).startswith('<list_reverseiterator object at 0x'))", "True\n");
}
