#include "utils.h"

TEST(StrMethodsTest, Case) {
  EXPECT_OUTPUT("s = 'hello World'\nprint(s.upper(), s.lower(), s.title(), s.capitalize(), s.swapcase())",
                "HELLO WORLD hello world Hello World Hello world HELLO wORLD\n");
  EXPECT_OUTPUT("print('abc'.isalpha(), '123'.isdigit(), 'a1'.isalnum(), ' '.isspace(), 'x_1'.isidentifier())",
                "True True True True True\n");
}

TEST(StrMethodsTest, SplitJoin) {
  EXPECT_OUTPUT("print('a b  c'.split(), 'a,b,,c'.split(','), 'a,b,c'.split(',', 1), 'a,b,c'.rsplit(',', 1))",
                "['a', 'b', 'c'] ['a', 'b', '', 'c'] ['a', 'b,c'] ['a,b', 'c']\n");
  EXPECT_OUTPUT("print('-'.join(['x', 'y', 'z']), 'l1\\nl2\\r\\n'.splitlines())", "x-y-z ['l1', 'l2']\n");
  EXPECT_OUTPUT("print('k=v=w'.partition('='), 'k=v=w'.rpartition('='))",
                "('k', '=', 'v=w') ('k=v', '=', 'w')\n");
  EXPECT_RAISES("''.split('')", "ValueError: empty separator");
  EXPECT_RAISES("','.join([1])", "TypeError: sequence item 0: expected str instance, int found");
}

TEST(StrMethodsTest, Search) {
  EXPECT_OUTPUT("s = 'banana'\nprint(s.find('an'), s.rfind('an'), s.find('x'), s.count('a'), s.index('n'))",
                "1 3 -1 3 2\n");
  EXPECT_OUTPUT("print('file.py'.endswith(('.py', '.txt')), 'abc'.startswith('b', 1))", "True True\n");
  EXPECT_OUTPUT("print('aaa'.replace('a', 'b', 2), 'prefix_x'.removeprefix('prefix_'))", "bba x\n");
  EXPECT_RAISES("'abc'.index('z')", "ValueError: substring not found");
}

TEST(StrMethodsTest, Padding) {
  EXPECT_OUTPUT("print('[' + '  x '.strip() + ']', 'xxhixx'.strip('x'), '  a'.lstrip(), 'a  '.rstrip() + '|')",
                "[x] hi a a|\n");
  EXPECT_OUTPUT("print('ab'.center(6, '*'), 'ab'.ljust(4) + '|', 'ab'.rjust(4), '-42'.zfill(5))",
                "**ab** ab  |   ab -0042\n");
}

TEST(StrMethodsTest, Format) {
  EXPECT_OUTPUT("print('{} + {} = {}'.format(1, 2, 3), '{1}{0}'.format('a', 'b'), '{x}!'.format(x=5))",
                "1 + 2 = 3 ba 5!\n");
  EXPECT_OUTPUT("print('{:>6}|{:<4}|{:^5}|'.format('r', 'l', 'c'))", "     r|l   |  c  |\n");
  EXPECT_OUTPUT("print('{:,} {:08.3f} {:x} {:#b} {:.1%} {:+d}'.format(1234567, 3.14159, 255, 5, 0.256, 7))",
                "1,234,567 0003.142 ff 0b101 25.6% +7\n");
  EXPECT_OUTPUT("print('{:.3e} {:g} {!r}'.format(12345.678, 0.0001, 'q'))", "1.235e+04 0.0001 'q'\n");
  EXPECT_OUTPUT("print('{0[1]} {0[k]}'.format({1: 'one', 'k': 'kay'}))", "one kay\n");
}

TEST(StrMethodsTest, PercentFormat) {
  EXPECT_OUTPUT("print('%d items at %.2f each, %s %r %x %%' % (3, 1.5, 'ok', 'ok', 255))",
                "3 items at 1.50 each, ok 'ok' ff %\n");
  EXPECT_OUTPUT("print('%5s|%-5s|%05d' % ('a', 'b', 42))", "    a|b    |00042\n");
  EXPECT_OUTPUT("print('%(name)s is %(age)d' % {'name': 'Ann', 'age': 30})", "Ann is 30\n");
  EXPECT_RAISES("'%d %d' % (1,)", "TypeError: not enough arguments for format string");
}

TEST(ListMethodsTest, Mutation) {
  EXPECT_OUTPUT(R"(
l = [3, 1, 2]
l.append(4)
l.extend((5, 6))
l.insert(0, 0)
print(l.pop(), l.pop(0), l)
l.remove(1)
l.sort(reverse=True)
print(l, l.index(3), l.count(2))
l.reverse()
c = l.copy()
c.clear()
print(l, c)
)", "6 0 [3, 1, 2, 4, 5]\n[5, 4, 3, 2] 2 1\n[2, 3, 4, 5] []\n");
  EXPECT_OUTPUT("l = ['bb', 'a', 'ccc']\nl.sort(key=len)\nprint(l)", "['a', 'bb', 'ccc']\n");
  EXPECT_RAISES("[].pop()", "IndexError: pop from empty list");
  EXPECT_RAISES("[1].remove(2)", "ValueError: list.remove(x): x not in list");
  EXPECT_RAISES("[1].index(2)", "ValueError: 2 is not in list");
}

TEST(ListMethodsTest, SortWithMutatingKey) {
  EXPECT_RAISES("l = [3, 1, 2]\ndef k(x):\n    l.append(x)\n    return x\nl.sort(key=k)\n",
                "ValueError: list modified during sort");
  EXPECT_OUTPUT("l = [3, 1, 2]\nseen = []\nl.sort(key=lambda x: seen.append(len(l)) or x)\nprint(l, seen)\n",
                "[1, 2, 3] [0, 0, 0]\n");
  // a failed sort leaves the items in place
  EXPECT_OUTPUT("l = [2, 'a', 1]\ntry:\n    l.sort()\nexcept TypeError:\n    pass\nprint(len(l))\n", "3\n");
}

TEST(ListMethodsTest, Operators) {
  EXPECT_OUTPUT("print([1] + [2], [0] * 3, (1, 2) + (3,), [1, 2, 3][::2], [1, 2, 3][-2:])",
                "[1, 2] [0, 0, 0] (1, 2, 3) [1, 3] [2, 3]\n");
  EXPECT_OUTPUT("l = [1]\nl += [2]\nl *= 2\nprint(l)", "[1, 2, 1, 2]\n");
  EXPECT_OUTPUT("t = (1, 2, 2)\nprint(t.count(2), t.index(2))", "2 1\n");
}

TEST(DictMethodsTest, Access) {
  EXPECT_OUTPUT(R"(
d = {'a': 1, 'b': 2}
print(d.get('a'), d.get('z'), d.get('z', 0), d['b'])
print(list(d.keys()), list(d.values()), list(d.items()))
print(d.setdefault('c', 3), d.pop('a'), d.pop('z', None), d)
d.update({'b': 20}, e=5)
print(d, d.popitem(), len(d))
print(dict.fromkeys('xy', 0), {1: 2}.copy())
)", "1 None 0 2\n['a', 'b'] [1, 2] [('a', 1), ('b', 2)]\n3 1 None {'b': 2, 'c': 3}\n"
    "{'b': 20, 'c': 3} ('e', 5) 2\n{'x': 0, 'y': 0} {1: 2}\n");
  EXPECT_OUTPUT("d = {'x': 1}\nprint(d.keys(), d.items())", "dict_keys(['x']) dict_items([('x', 1)])\n");
  EXPECT_OUTPUT("d = {1: 'a', True: 'b', 1.0: 'c'}\nprint(d)", "{1: 'c'}\n");
  EXPECT_RAISES("{}['k']", "KeyError: 'k'");
  EXPECT_RAISES("{}.popitem()", "KeyError: 'popitem(): dictionary is empty'");
  EXPECT_RAISES("{[1]: 2}", "TypeError: unhashable type: 'list'");
}

TEST(DictMethodsTest, Iteration) {
  EXPECT_OUTPUT("d = {'b': 1, 'a': 2}\nfor k in d:\n    print(k, d[k])", "b 1\na 2\n");
  EXPECT_RAISES("d = {1: 1}\nfor k in d:\n    d[k + 1] = 0",
                "RuntimeError: dictionary changed size during iteration");
}

TEST(SetMethodsTest, Algebra) {
  EXPECT_OUTPUT(R"(
a = {1, 2, 3}
b = {2, 3, 4}
print(sorted(a | b), sorted(a & b), sorted(a - b), sorted(a ^ b))
print(sorted(a.union([9])), sorted(a.intersection(b)), a.issubset({1, 2, 3, 4}), a.isdisjoint({7}))
a.add(10)
a.discard(1)
a.remove(2)
print(sorted(a), 3 in a)
)", "[1, 2, 3, 4] [2, 3] [1] [1, 4]\n[1, 2, 3, 9] [2, 3] True True\n[3, 10] True\n");
  EXPECT_RAISES("set().remove(1)", "KeyError: 1");
  EXPECT_RAISES("set().pop()", "KeyError: 'pop from an empty set'");
}

TEST(NumberMethodsTest, Methods) {
  EXPECT_OUTPUT("print((255).bit_length(), (2.0).is_integer(), (2.5).is_integer())", "8 True False\n");
  EXPECT_OUTPUT("print((3).real, (2.5).imag)", "3 0.0\n");
}

TEST(TypeObjectsTest, UnboundMethods) {
  EXPECT_OUTPUT("print(str.upper('x'), list(map(str.strip, [' a ', 'b '])))", "X ['a', 'b']\n");
  EXPECT_RAISES("str.nothing", "AttributeError: type object 'str' has no attribute 'nothing'");
  EXPECT_RAISES("'x'.nothing", "AttributeError: 'str' object has no attribute 'nothing'");
  EXPECT_RAISES("(1).x = 2", "AttributeError: 'int' object has no attribute 'x'");
}
