#include <cmath>
#include <limits>

#include <fmt/core.h>

#include "format.h"
#include "interpreter.h"
#include "modules.h"

namespace interp {

namespace {

[[noreturn]] void Unsupported(BinaryOp op, const Value& a, const Value& b) {
  throw ScriptError(ExcType::TYPE_ERROR,
      fmt::format("unsupported operand type(s) for {}: '{}' and '{}'",
                  op == BinaryOp::POW ? "** or pow()" : BinaryOpSymbol(op), TypeName(a), TypeName(b)));
}

// false on overflow
bool IntPow(int64_t base, int64_t exp, int64_t& result) {
  result = 1;
  while (exp) {
    if (exp & 1) {
      if (__builtin_mul_overflow(result, base, &result)) return false;
    }
    exp >>= 1;
    if (exp && __builtin_mul_overflow(base, base, &base)) return false;
  }
  return true;
}

Value BigOperation(Interpreter& interp, BinaryOp op, const Value& a, const Value& b) {
  mpz_class x = a.ToMpz(), y = b.ToMpz(), r;
  switch (op) {
    case BinaryOp::ADD:
      return Value::Big(x + y);
    case BinaryOp::SUB:
      return Value::Big(x - y);
    case BinaryOp::MUL:
      interp.CheckIntSize(mpz_sizeinbase(x.get_mpz_t(), 2) + mpz_sizeinbase(y.get_mpz_t(), 2));
      return Value::Big(x * y);
    case BinaryOp::DIV: {
      if (y == 0) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "division by zero");
      // |x / y| >= 2 ** (bits(x) - bits(y) - 1)
      double d = HUGE_VAL;
      if ((long)mpz_sizeinbase(x.get_mpz_t(), 2) - (long)mpz_sizeinbase(y.get_mpz_t(), 2) <= 1024) {
        mpq_class q(x, y);
        q.canonicalize();
        d = q.get_d();
      }
      if (std::isinf(d)) throw ScriptError(ExcType::OVERFLOW_ERROR, "integer division result too large for a float");
      return Value::Float(d);
    }
    case BinaryOp::FLOOR_DIV:
      if (y == 0) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "integer division or modulo by zero");
      mpz_fdiv_q(r.get_mpz_t(), x.get_mpz_t(), y.get_mpz_t());
      return Value::Big(std::move(r));
    case BinaryOp::MOD:
      if (y == 0) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "integer modulo by zero");
      mpz_fdiv_r(r.get_mpz_t(), x.get_mpz_t(), y.get_mpz_t());
      return Value::Big(std::move(r));
    case BinaryOp::POW: {
      if (y < 0) {
        if (x == 0) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "0.0 cannot be raised to a negative power");
        return Value::Float(std::pow(a.AsFloat(), b.AsFloat()));
      }
      if (x == 0 || x == 1) return Value::Big(std::move(x));
      if (x == -1) return Value::Int(mpz_odd_p(y.get_mpz_t()) ? -1 : 1);
      if (!y.fits_ulong_p()) interp.CheckIntSize(std::numeric_limits<size_t>::max());
      unsigned long exp = y.get_ui();
      unsigned __int128 bits = (unsigned __int128)mpz_sizeinbase(x.get_mpz_t(), 2) * exp;
      interp.CheckIntSize(bits > std::numeric_limits<size_t>::max() ? std::numeric_limits<size_t>::max() : (size_t)bits);
      mpz_pow_ui(r.get_mpz_t(), x.get_mpz_t(), exp);
      return Value::Big(std::move(r));
    }
    case BinaryOp::LSHIFT:
      if (y < 0) throw ScriptError(ExcType::VALUE_ERROR, "negative shift count");
      if (x == 0) return Value::Int(0);
      if (!y.fits_ulong_p()) interp.CheckIntSize(std::numeric_limits<size_t>::max());
      interp.CheckIntSize(mpz_sizeinbase(x.get_mpz_t(), 2) + y.get_ui());
      mpz_mul_2exp(r.get_mpz_t(), x.get_mpz_t(), y.get_ui());
      return Value::Big(std::move(r));
    case BinaryOp::RSHIFT:
      if (y < 0) throw ScriptError(ExcType::VALUE_ERROR, "negative shift count");
      if (!y.fits_ulong_p()) return Value::Int(x < 0 ? -1 : 0);
      mpz_fdiv_q_2exp(r.get_mpz_t(), x.get_mpz_t(), y.get_ui());
      return Value::Big(std::move(r));
    case BinaryOp::BIT_AND:
      return Value::Big(x & y);
    case BinaryOp::BIT_OR:
      return Value::Big(x | y);
    case BinaryOp::BIT_XOR:
      return Value::Big(x ^ y);
    case BinaryOp::MAT_MUL:
      break;
  }
  Unsupported(op, a, b);
}

// 64-bit fast paths; results that do not fit continue in BigOperation
Value IntOperation(Interpreter& interp, BinaryOp op, const Value& a, const Value& b) {
  if (a.IsBig() || b.IsBig()) return BigOperation(interp, op, a, b);
  int64_t x = a.AsInt(), y = b.AsInt(), r;
  switch (op) {
    case BinaryOp::ADD:
      if (__builtin_add_overflow(x, y, &r)) break;
      return Value::Int(r);
    case BinaryOp::SUB:
      if (__builtin_sub_overflow(x, y, &r)) break;
      return Value::Int(r);
    case BinaryOp::MUL:
      if (__builtin_mul_overflow(x, y, &r)) break;
      return Value::Int(r);
    case BinaryOp::DIV:
      if (y == 0) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "division by zero");
      return Value::Float((double)x / (double)y);
    case BinaryOp::FLOOR_DIV: {
      if (y == 0) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "integer division or modulo by zero");
      if (x == std::numeric_limits<int64_t>::min() && y == -1) break;
      int64_t q = x / y;
      if (x % y != 0 && ((x < 0) != (y < 0))) q--;
      return Value::Int(q);
    }
    case BinaryOp::MOD: {
      if (y == 0) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "integer modulo by zero");
      if (y == -1) return Value::Int(0);
      int64_t m = x % y;
      if (m != 0 && ((m < 0) != (y < 0))) m += y;
      return Value::Int(m);
    }
    case BinaryOp::POW:
      if (y < 0) {
        if (x == 0) {
          throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "0.0 cannot be raised to a negative power");
        }
        return Value::Float(std::pow((double)x, (double)y));
      }
      if (!IntPow(x, y, r)) break;
      return Value::Int(r);
    case BinaryOp::LSHIFT:
      if (y < 0) throw ScriptError(ExcType::VALUE_ERROR, "negative shift count");
      if (x == 0) return Value::Int(0);
      if (y >= 63) break;
      r = (int64_t)((uint64_t)x << y);
      if ((r >> y) != x) break;
      return Value::Int(r);
    case BinaryOp::RSHIFT:
      if (y < 0) throw ScriptError(ExcType::VALUE_ERROR, "negative shift count");
      if (y >= 64) return Value::Int(x < 0 ? -1 : 0);
      return Value::Int(x >> y);
    case BinaryOp::BIT_AND:
      if (a.IsBool() && b.IsBool()) return Value::Bool(x & y);
      return Value::Int(x & y);
    case BinaryOp::BIT_OR:
      if (a.IsBool() && b.IsBool()) return Value::Bool(x | y);
      return Value::Int(x | y);
    case BinaryOp::BIT_XOR:
      if (a.IsBool() && b.IsBool()) return Value::Bool(x ^ y);
      return Value::Int(x ^ y);
    case BinaryOp::MAT_MUL:
      Unsupported(op, a, b);
  }
  return BigOperation(interp, op, a, b);
}

Value FloatOperation(BinaryOp op, const Value& a, const Value& b) {
  double x = a.AsFloat(), y = b.AsFloat();
  switch (op) {
    case BinaryOp::ADD: return Value::Float(x + y);
    case BinaryOp::SUB: return Value::Float(x - y);
    case BinaryOp::MUL: return Value::Float(x * y);
    case BinaryOp::DIV:
      if (y == 0) throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "float division by zero");
      return Value::Float(x / y);
    case BinaryOp::FLOOR_DIV:
    case BinaryOp::MOD: {
      if (y == 0) {
        throw ScriptError(ExcType::ZERO_DIVISION_ERROR,
            op == BinaryOp::MOD ? "float modulo" : "float floor division by zero");
      }
      double mod = std::fmod(x, y);
      double div = (x - mod) / y;
      if (mod != 0) {
        if ((y < 0) != (mod < 0)) {
          mod += y;
          div -= 1.0;
        }
      } else {
        mod = std::copysign(0.0, y);
      }
      if (op == BinaryOp::MOD) return Value::Float(mod);
      double floordiv;
      if (div != 0) {
        floordiv = std::floor(div);
        if (div - floordiv > 0.5) floordiv += 1.0;
      } else {
        floordiv = std::copysign(0.0, x / y);
      }
      return Value::Float(floordiv);
    }
    case BinaryOp::POW: {
      if (x == 0 && y < 0) {
        throw ScriptError(ExcType::ZERO_DIVISION_ERROR, "0.0 cannot be raised to a negative power");
      }
      if (x < 0 && std::isfinite(y) && std::floor(y) != y) {
        throw ScriptError(ExcType::VALUE_ERROR, "negative number cannot be raised to a fractional power");
      }
      double r = std::pow(x, y);
      if (std::isinf(r) && std::isfinite(x) && std::isfinite(y)) {
        throw ScriptError(ExcType::OVERFLOW_ERROR, "(34, 'Numerical result out of range')");
      }
      return Value::Float(r);
    }
    default:
      break;
  }
  Unsupported(op, a, b);
}

Value SetOperation(Heap& heap, BinaryOp op, const ValueTable& x, const ValueTable& y) {
  Value set = Value::Obj(heap.Make<SetObject>());
  auto ret = set.As<SetObject>();
  switch (op) {
    case BinaryOp::BIT_OR:
      ret->table = x;
      for (auto& entry : y.Entries()) ret->table.Set(entry.first, Value());
      break;
    case BinaryOp::BIT_AND:
      for (auto& entry : x.Entries()) {
        if (y.Contains(entry.first)) ret->table.Set(entry.first, Value());
      }
      break;
    case BinaryOp::SUB:
      for (auto& entry : x.Entries()) {
        if (!y.Contains(entry.first)) ret->table.Set(entry.first, Value());
      }
      break;
    case BinaryOp::BIT_XOR:
      for (auto& entry : x.Entries()) {
        if (!y.Contains(entry.first)) ret->table.Set(entry.first, Value());
      }
      for (auto& entry : y.Entries()) {
        if (!x.Contains(entry.first)) ret->table.Set(entry.first, Value());
      }
      break;
    default:
      break;
  }
  heap.Track(ret);
  return set;
}

bool IsSetOperator(BinaryOp op) {
  return op == BinaryOp::BIT_OR || op == BinaryOp::BIT_AND ||
         op == BinaryOp::SUB || op == BinaryOp::BIT_XOR;
}

bool IsTemporal(const Value& v) {
  return v.Is(ObjectKind::DATETIME) || v.Is(ObjectKind::DATE) || v.Is(ObjectKind::TIMEDELTA);
}

bool IsAscii(const std::string& str) {
  for (unsigned char c : str) {
    if (c >= 0x80) return false;
  }
  return true;
}

// normalizes a possibly negative index; false when out of range
bool NormalizeIndex(int64_t& index, int64_t length) {
  if (index < 0) index += length;
  return index >= 0 && index < length;
}

int64_t SequenceIndex(const Value& index, const char* type) {
  if (!index.IsIntLike()) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("{} indices must be integers or slices, not {}", type, TypeName(index)));
  }
  if (index.IsBig()) throw ScriptError(ExcType::INDEX_ERROR, "cannot fit 'int' into an index-sized integer");
  return index.AsInt();
}

std::vector<Value> SliceVector(const std::vector<Value>& items, const SliceBounds& bounds) {
  int64_t start, stop, step;
  int64_t length = AdjustSlice(items.size(), bounds, start, stop, step);
  std::vector<Value> ret;
  ret.reserve(length);
  for (int64_t i = 0, pos = start; i < length; i++, pos += step) ret.push_back(items[pos]);
  return ret;
}

} // namespace

int64_t AdjustSlice(int64_t length, const SliceBounds& bounds, int64_t& start, int64_t& stop, int64_t& step) {
  step = bounds.step.value_or(1);
  if (step < -std::numeric_limits<int64_t>::max()) step = -std::numeric_limits<int64_t>::max();
  auto clamp = [&](std::optional<int64_t> bound, int64_t fallback) {
    if (!bound) return fallback;
    int64_t v = *bound;
    if (v < 0) {
      v += length;
      if (v < 0) v = step < 0 ? -1 : 0;
    } else if (v >= length) {
      v = step < 0 ? length - 1 : length;
    }
    return v;
  };
  start = clamp(bounds.lower, step < 0 ? length - 1 : 0);
  stop = clamp(bounds.upper, step < 0 ? -1 : length);
  if (step < 0) return stop < start ? (start - stop - 1) / -step + 1 : 0;
  return start < stop ? (stop - start - 1) / step + 1 : 0;
}

Value Interpreter::BinaryOperation(BinaryOp op, const Value& a, const Value& b) {
  if (a.IsNumber() && b.IsNumber()) {
    if (a.IsFloat() || b.IsFloat()) return FloatOperation(op, a, b);
    return IntOperation(*this, op, a, b);
  }
  if (a.IsStr()) {
    if (op == BinaryOp::ADD) {
      if (!b.IsStr()) {
        throw ScriptError(ExcType::TYPE_ERROR,
            fmt::format("can only concatenate str (not \"{}\") to str", TypeName(b)));
      }
      CheckLength(a.AsStr().size() + b.AsStr().size());
      return Value::Str(a.AsStr() + b.AsStr());
    }
    if (op == BinaryOp::MOD) {
      std::string ret = PercentFormat(a.AsStr(), b);
      CheckLength(ret.size());
      return Value::Str(std::move(ret));
    }
  }
  if (op == BinaryOp::MUL) {
    const Value* seq = &a;
    const Value* count = &b;
    if (b.IsStr() || b.Is(ObjectKind::LIST) || b.Is(ObjectKind::TUPLE)) std::swap(seq, count);
    if (seq->IsStr() || seq->Is(ObjectKind::LIST) || seq->Is(ObjectKind::TUPLE)) {
      if (!count->IsIntLike()) {
        throw ScriptError(ExcType::TYPE_ERROR,
            fmt::format("can't multiply sequence by non-int of type '{}'", TypeName(*count)));
      }
      int64_t times = std::max<int64_t>(count->AsInt(), 0);
      if (seq->IsStr()) {
        CheckRepeat(seq->AsStr().size(), times);
        heap_.Reserve(seq->AsStr().size() * times);
        std::string ret;
        ret.reserve(seq->AsStr().size() * times);
        for (int64_t i = 0; i < times; i++) ret += seq->AsStr();
        return Value::Str(std::move(ret));
      }
      auto& items = seq->Is(ObjectKind::LIST) ? seq->As<ListObject>()->items : seq->As<TupleObject>()->items;
      CheckRepeat(items.size(), times);
      heap_.Reserve(items.size() * times * sizeof(Value));
      std::vector<Value> ret;
      ret.reserve(items.size() * times);
      for (int64_t i = 0; i < times; i++) ret.insert(ret.end(), items.begin(), items.end());
      return seq->Is(ObjectKind::LIST) ? NewList(std::move(ret)) : NewTuple(std::move(ret));
    }
  }
  if (op == BinaryOp::ADD && (a.Is(ObjectKind::LIST) || a.Is(ObjectKind::TUPLE))) {
    bool is_list = a.Is(ObjectKind::LIST);
    if (b.IsObject() && b.AsObject()->kind == a.AsObject()->kind) {
      auto& x = is_list ? a.As<ListObject>()->items : a.As<TupleObject>()->items;
      auto& y = is_list ? b.As<ListObject>()->items : b.As<TupleObject>()->items;
      CheckLength(x.size() + y.size());
      std::vector<Value> ret(x);
      ret.insert(ret.end(), y.begin(), y.end());
      return is_list ? NewList(std::move(ret)) : NewTuple(std::move(ret));
    }
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("can only concatenate {} (not \"{}\") to {}", TypeName(a), TypeName(b), TypeName(a)));
  }
  if (a.Is(ObjectKind::SET) && b.Is(ObjectKind::SET) && IsSetOperator(op)) {
    return SetOperation(heap_, op, a.As<SetObject>()->table, b.As<SetObject>()->table);
  }
  if (a.Is(ObjectKind::DICT) && b.Is(ObjectKind::DICT) && op == BinaryOp::BIT_OR) {
    Value dict = Value::Obj(heap_.Make<DictObject>());
    auto ret = dict.As<DictObject>();
    ret->table = a.As<DictObject>()->table;
    for (auto& [key, value] : b.As<DictObject>()->table.Entries()) ret->table.Set(key, value);
    heap_.Track(ret);
    return dict;
  }
  if (IsTemporal(a) || IsTemporal(b)) {
    if (auto ret = TemporalBinary(*this, op, a, b)) return *ret;
  }
  Unsupported(op, a, b);
}

Value Interpreter::UnaryOperation(UnaryOp op, const Value& v) {
  const char* symbol = "-";
  switch (op) {
    case UnaryOp::NOT:
      return Value::Bool(!Truthy(v));
    case UnaryOp::NEG:
      if (v.IsBig() || (v.IsIntLike() && v.AsInt() == std::numeric_limits<int64_t>::min())) {
        return Value::Big(-v.ToMpz());
      }
      if (v.IsIntLike()) return Value::Int(-v.AsInt());
      if (v.IsFloat()) return Value::Float(-v.AsFloat());
      if (v.Is(ObjectKind::TIMEDELTA)) {
        return Value::Obj(heap_.Make<TimeDeltaObject>(-v.As<TimeDeltaObject>()->micros));
      }
      break;
    case UnaryOp::POS:
      symbol = "+";
      if (v.IsBig() || v.IsFloat() || v.Is(ObjectKind::TIMEDELTA)) return v;
      if (v.IsIntLike()) return Value::Int(v.AsInt());
      break;
    case UnaryOp::INVERT:
      symbol = "~";
      if (v.IsBig()) return Value::Big(~v.AsBig());
      if (v.IsIntLike()) return Value::Int(~v.AsInt());
      break;
  }
  throw ScriptError(ExcType::TYPE_ERROR,
      fmt::format("bad operand type for unary {}: '{}'", symbol, TypeName(v)));
}

bool Interpreter::Compare(CompareOp op, const Value& a, const Value& b) {
  switch (op) {
    case CompareOp::EQ: return Equals(a, b);
    case CompareOp::NE: return !Equals(a, b);
    case CompareOp::LT: return RichCompare(a, b, "<");
    case CompareOp::LE: return RichCompare(a, b, "<=");
    case CompareOp::GT: return RichCompare(a, b, ">");
    case CompareOp::GE: return RichCompare(a, b, ">=");
    case CompareOp::IN: return Contains(b, a);
    case CompareOp::NOT_IN: return !Contains(b, a);
    case CompareOp::IS: return a.Identical(b);
    case CompareOp::IS_NOT: return !a.Identical(b);
  }
  __builtin_unreachable();
}

bool Interpreter::Contains(const Value& container, const Value& item) {
  if (container.IsStr()) {
    if (!item.IsStr()) {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("'in <string>' requires string as left operand, not {}", TypeName(item)));
    }
    return container.AsStr().find(item.AsStr()) != std::string::npos;
  }
  if (container.IsObject()) {
    Object* obj = container.AsObject();
    switch (obj->kind) {
      case ObjectKind::LIST:
      case ObjectKind::TUPLE: {
        auto& items = obj->kind == ObjectKind::LIST ?
            static_cast<ListObject*>(obj)->items : static_cast<TupleObject*>(obj)->items;
        for (auto& x : items) {
          if (x.Identical(item) || Equals(x, item)) return true;
        }
        return false;
      }
      case ObjectKind::DICT:
        return static_cast<DictObject*>(obj)->table.Contains(item);
      case ObjectKind::SET:
        return static_cast<SetObject*>(obj)->table.Contains(item);
      case ObjectKind::RANGE: {
        auto range = static_cast<RangeObject*>(obj);
        int64_t x;
        if (item.IsBig()) {
          return false;
        } else if (item.IsIntLike()) {
          x = item.AsInt();
        } else if (item.IsFloat() && std::floor(item.AsFloat()) == item.AsFloat() &&
                   std::fabs(item.AsFloat()) < 9.2e18) {
          x = (int64_t)item.AsFloat();
        } else {
          return false;
        }
        if (range->step > 0 ? (x < range->start || x >= range->stop) :
                              (x > range->start || x <= range->stop)) {
          return false;
        }
        return ((__int128)x - range->start) % range->step == 0;
      }
      case ObjectKind::DICT_VIEW: {
        auto view = static_cast<DictViewObject*>(obj);
        auto& table = view->dict->table;
        switch (view->view) {
          case ViewKind::KEYS:
            return table.Contains(item);
          case ViewKind::VALUES:
            for (auto& entry : table.Entries()) {
              if (entry.second.Identical(item) || Equals(entry.second, item)) return true;
            }
            return false;
          case ViewKind::ITEMS: {
            if (!item.Is(ObjectKind::TUPLE) || item.As<TupleObject>()->items.size() != 2) return false;
            auto& pair = item.As<TupleObject>()->items;
            const Value* value = table.Find(pair[0]);
            return value && (value->Identical(pair[1]) || Equals(*value, pair[1]));
          }
        }
        break;
      }
      case ObjectKind::ITERATOR: {
        auto& iter = static_cast<IteratorObject*>(obj)->iter;
        Value x;
        while (iter->Next(x)) {
          Tick();
          if (x.Identical(item) || Equals(x, item)) return true;
        }
        return false;
      }
      default:
        break;
    }
  }
  throw ScriptError(ExcType::TYPE_ERROR,
      fmt::format("argument of type '{}' is not iterable", TypeName(container)));
}

Value Interpreter::GetItem(const Value& obj, const Value& index) {
  if (obj.IsStr()) {
    if (!index.IsIntLike()) {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("string indices must be integers, not '{}'", TypeName(index)));
    }
    const std::string& str = obj.AsStr();
    if (index.IsBig()) throw ScriptError(ExcType::INDEX_ERROR, "cannot fit 'int' into an index-sized integer");
    int64_t i = index.AsInt();
    if (IsAscii(str)) {
      if (!NormalizeIndex(i, str.size())) throw ScriptError(ExcType::INDEX_ERROR, "string index out of range");
      return Value::Str(std::string(1, str[i]));
    }
    auto chars = SplitCodePoints(str);
    if (!NormalizeIndex(i, chars.size())) throw ScriptError(ExcType::INDEX_ERROR, "string index out of range");
    return Value::Str(std::move(chars[i]));
  }
  if (obj.IsObject()) {
    Object* o = obj.AsObject();
    switch (o->kind) {
      case ObjectKind::LIST:
      case ObjectKind::TUPLE: {
        bool is_list = o->kind == ObjectKind::LIST;
        auto& items = is_list ? static_cast<ListObject*>(o)->items : static_cast<TupleObject*>(o)->items;
        int64_t i = SequenceIndex(index, is_list ? "list" : "tuple");
        if (!NormalizeIndex(i, items.size())) {
          throw ScriptError(ExcType::INDEX_ERROR, is_list ? "list index out of range" : "tuple index out of range");
        }
        return items[i];
      }
      case ObjectKind::DICT: {
        const Value* value = static_cast<DictObject*>(o)->table.Find(index);
        if (!value) RaiseKeyError(index);
        return *value;
      }
      case ObjectKind::RANGE: {
        auto range = static_cast<RangeObject*>(o);
        int64_t i = SequenceIndex(index, "range");
        if (!NormalizeIndex(i, range->Length())) {
          throw ScriptError(ExcType::INDEX_ERROR, "range object index out of range");
        }
        return Value::Int(range->At(i));
      }
      default:
        break;
    }
  }
  throw ScriptError(ExcType::TYPE_ERROR, fmt::format("'{}' object is not subscriptable", TypeName(obj)));
}

Value Interpreter::GetSlice(const Value& obj, const SliceBounds& bounds) {
  int64_t start, stop, step;
  if (obj.IsStr()) {
    const std::string& str = obj.AsStr();
    std::string ret;
    if (IsAscii(str)) {
      int64_t length = AdjustSlice(str.size(), bounds, start, stop, step);
      if (step == 1) return Value::Str(str.substr(start, length));
      for (int64_t i = 0, pos = start; i < length; i++, pos += step) ret += str[pos];
    } else {
      auto chars = SplitCodePoints(str);
      int64_t length = AdjustSlice(chars.size(), bounds, start, stop, step);
      for (int64_t i = 0, pos = start; i < length; i++, pos += step) ret += chars[pos];
    }
    return Value::Str(std::move(ret));
  }
  if (obj.Is(ObjectKind::LIST)) return NewList(SliceVector(obj.As<ListObject>()->items, bounds));
  if (obj.Is(ObjectKind::TUPLE)) return NewTuple(SliceVector(obj.As<TupleObject>()->items, bounds));
  if (obj.Is(ObjectKind::RANGE)) {
    auto range = obj.As<RangeObject>();
    AdjustSlice(range->Length(), bounds, start, stop, step);
    return Value::Obj(heap_.Make<RangeObject>(range->At(start), range->At(stop), range->step * step));
  }
  throw ScriptError(ExcType::TYPE_ERROR, fmt::format("'{}' object is not subscriptable", TypeName(obj)));
}

void Interpreter::SetItem(const Value& obj, const Value& index, Value value) {
  if (obj.Is(ObjectKind::LIST)) {
    auto& items = obj.As<ListObject>()->items;
    int64_t i = SequenceIndex(index, "list");
    if (!NormalizeIndex(i, items.size())) {
      throw ScriptError(ExcType::INDEX_ERROR, "list assignment index out of range");
    }
    items[i] = std::move(value);
    return;
  }
  if (obj.Is(ObjectKind::DICT)) {
    auto& table = obj.As<DictObject>()->table;
    table.Set(index, std::move(value));
    CheckLength(table.Size());
    heap_.Track(obj.AsObject());
    return;
  }
  throw ScriptError(ExcType::TYPE_ERROR,
      fmt::format("'{}' object does not support item assignment", TypeName(obj)));
}

void Interpreter::SetSlice(const Value& obj, const SliceBounds& bounds, const Value& value) {
  if (!obj.Is(ObjectKind::LIST)) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("'{}' object does not support item assignment", TypeName(obj)));
  }
  auto& items = obj.As<ListObject>()->items;
  if (!IsIterable(value)) {
    throw ScriptError(ExcType::TYPE_ERROR, "must assign iterable to extended slice");
  }
  std::vector<Value> replacement = Collect(value);
  int64_t start, stop, step;
  int64_t length = AdjustSlice(items.size(), bounds, start, stop, step);
  if (step == 1) {
    if (stop < start) stop = start;
    CheckLength(items.size() - (stop - start) + replacement.size());
    items.erase(items.begin() + start, items.begin() + stop);
    items.insert(items.begin() + start, replacement.begin(), replacement.end());
    heap_.Track(obj.AsObject());
    return;
  }
  if ((int64_t)replacement.size() != length) {
    throw ScriptError(ExcType::VALUE_ERROR,
        fmt::format("attempt to assign sequence of size {} to extended slice of size {}",
                    replacement.size(), length));
  }
  for (int64_t i = 0, pos = start; i < length; i++, pos += step) items[pos] = replacement[i];
}

void Interpreter::DelItem(const Value& obj, const Value& index) {
  if (obj.Is(ObjectKind::LIST)) {
    auto& items = obj.As<ListObject>()->items;
    int64_t i = SequenceIndex(index, "list");
    if (!NormalizeIndex(i, items.size())) {
      throw ScriptError(ExcType::INDEX_ERROR, "list assignment index out of range");
    }
    items.erase(items.begin() + i);
    return;
  }
  if (obj.Is(ObjectKind::DICT)) {
    if (!obj.As<DictObject>()->table.Erase(index)) RaiseKeyError(index);
    return;
  }
  throw ScriptError(ExcType::TYPE_ERROR,
      fmt::format("'{}' object doesn't support item deletion", TypeName(obj)));
}

void Interpreter::DelSlice(const Value& obj, const SliceBounds& bounds) {
  if (!obj.Is(ObjectKind::LIST)) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("'{}' object doesn't support item deletion", TypeName(obj)));
  }
  auto& items = obj.As<ListObject>()->items;
  int64_t start, stop, step;
  int64_t length = AdjustSlice(items.size(), bounds, start, stop, step);
  if (length == 0) return;
  if (step < 0) {
    start += step * (length - 1);
    step = -step;
  }
  std::vector<Value> kept;
  kept.reserve(items.size() - length);
  for (int64_t i = 0; i < (int64_t)items.size(); i++) {
    bool removed = i >= start && (i - start) % step == 0 && (i - start) / step < length;
    if (!removed) kept.push_back(std::move(items[i]));
  }
  items = std::move(kept);
}

} // namespace interp
