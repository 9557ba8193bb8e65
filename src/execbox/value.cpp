#include "value.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <functional>
#include <limits>

#include <fmt/core.h>

namespace interp {

namespace {

constexpr int kMaxCompareNesting = 500;
// first automatic collection; later ones run when the live count doubles
constexpr size_t kMinCollect = 10000;
// charged per object on top of its Footprint()
constexpr size_t kObjectOverhead = 64;

thread_local Heap* current_heap = nullptr;

const char* kObjectKindNameTable[] = {
#define X(name, pyname) pyname,
  ENUM_OBJECT_KIND_
#undef X
};

constexpr double kTwoPow63 = 9223372036854775808.0;

// -1, 0 or 1; d is not NaN
int CompareIntFloat(const Value& a, double d) {
  if (std::isinf(d)) return d > 0 ? -1 : 1;
  if (a.IsBig()) {
    int c = cmp(a.AsBig(), d);
    return (c > 0) - (c < 0);
  }
  int64_t i = a.AsInt();
  if (d >= kTwoPow63) return -1;
  if (d < -kTwoPow63) return 1;
  double fl = std::floor(d);
  int64_t whole = (int64_t)fl;
  if (i != whole) return i < whole ? -1 : 1;
  return fl == d ? 0 : -1;
}

size_t HashCombine(size_t seed, size_t value) {
  return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

size_t HashValue(const Value& v, int depth) {
  if (depth > kMaxCompareNesting) {
    throw ScriptError(ExcType::RECURSION_ERROR, "maximum recursion depth exceeded while hashing");
  }
  if (v.IsNone()) return 0x5bd1e995;
  if (v.IsBig()) {
    // equal floats must hash alike
    const mpz_class& n = v.AsBig();
    double d = n.get_d();
    if (std::isfinite(d) && cmp(n, d) == 0) return std::hash<double>()(d);
    return std::hash<std::string>()(n.get_str(16));
  }
  if (v.IsIntLike()) return std::hash<int64_t>()(v.AsInt());
  if (v.IsFloat()) {
    double d = v.AsFloat();
    if (d == std::floor(d) && d >= -kTwoPow63 && d < kTwoPow63) {
      return std::hash<int64_t>()((int64_t)d);
    }
    return std::hash<double>()(d);
  }
  if (v.IsStr()) return std::hash<std::string>()(v.AsStr());
  Object* obj = v.AsObject();
  switch (obj->kind) {
    case ObjectKind::LIST:
    case ObjectKind::DICT:
    case ObjectKind::SET:
    case ObjectKind::DICT_VIEW:
      throw ScriptError(ExcType::TYPE_ERROR, fmt::format("unhashable type: '{}'", TypeName(v)));
    case ObjectKind::TUPLE: {
      size_t seed = 0x345678;
      for (auto& item : static_cast<TupleObject*>(obj)->items) {
        seed = HashCombine(seed, HashValue(item, depth + 1));
      }
      return seed;
    }
    case ObjectKind::RANGE: {
      auto range = static_cast<RangeObject*>(obj);
      return HashCombine(HashCombine(std::hash<int64_t>()(range->start), range->stop), range->step);
    }
    case ObjectKind::DATETIME:
      return HashCombine(1, std::hash<int64_t>()(static_cast<DateTimeObject*>(obj)->micros));
    case ObjectKind::DATE:
      return HashCombine(2, std::hash<int64_t>()(static_cast<DateObject*>(obj)->days));
    case ObjectKind::TIMEDELTA:
      return HashCombine(3, std::hash<int64_t>()(static_cast<TimeDeltaObject*>(obj)->micros));
    case ObjectKind::EXCEPTION_TYPE:
      return HashCombine(4, (size_t)static_cast<ExceptionTypeObject*>(obj)->type);
    default:
      return std::hash<Object*>()(obj);
  }
}

bool SequenceEquals(const std::vector<Value>& a, const std::vector<Value>& b, int depth);

bool EqualsImpl(const Value& a, const Value& b, int depth) {
  if (depth > kMaxCompareNesting) {
    throw ScriptError(ExcType::RECURSION_ERROR, "maximum recursion depth exceeded in comparison");
  }
  if (a.IsNumber() && b.IsNumber()) {
    if (a.IsIntLike() && b.IsIntLike()) {
      if (a.IsBig() || b.IsBig()) return a.ToMpz() == b.ToMpz();
      return a.AsInt() == b.AsInt();
    }
    if (a.IsFloat() && b.IsFloat()) return a.AsFloat() == b.AsFloat();
    const Value& i = a.IsFloat() ? b : a;
    double d = a.IsFloat() ? a.AsFloat() : b.AsFloat();
    return !std::isnan(d) && CompareIntFloat(i, d) == 0;
  }
  if (a.IsStr() && b.IsStr()) return a.AsStr() == b.AsStr();
  if (a.IsNone() || b.IsNone()) return a.IsNone() && b.IsNone();
  if (!a.IsObject() || !b.IsObject()) return false;
  Object* x = a.AsObject();
  Object* y = b.AsObject();
  if (x == y) return true;
  if (x->kind != y->kind) return false;
  switch (x->kind) {
    case ObjectKind::LIST:
      return SequenceEquals(static_cast<ListObject*>(x)->items, static_cast<ListObject*>(y)->items, depth);
    case ObjectKind::TUPLE:
      return SequenceEquals(static_cast<TupleObject*>(x)->items, static_cast<TupleObject*>(y)->items, depth);
    case ObjectKind::DICT: {
      auto& tx = static_cast<DictObject*>(x)->table;
      auto& ty = static_cast<DictObject*>(y)->table;
      if (tx.Size() != ty.Size()) return false;
      for (auto& [key, value] : tx.Entries()) {
        const Value* other = ty.Find(key);
        if (!other || !EqualsImpl(value, *other, depth + 1)) return false;
      }
      return true;
    }
    case ObjectKind::SET: {
      auto& tx = static_cast<SetObject*>(x)->table;
      auto& ty = static_cast<SetObject*>(y)->table;
      if (tx.Size() != ty.Size()) return false;
      for (auto& entry : tx.Entries()) {
        if (!ty.Contains(entry.first)) return false;
      }
      return true;
    }
    case ObjectKind::RANGE: {
      auto rx = static_cast<RangeObject*>(x);
      auto ry = static_cast<RangeObject*>(y);
      int64_t len = rx->Length();
      if (len != ry->Length()) return false;
      if (len == 0) return true;
      if (rx->start != ry->start) return false;
      return len == 1 || rx->step == ry->step;
    }
    case ObjectKind::DATETIME:
      return static_cast<DateTimeObject*>(x)->micros == static_cast<DateTimeObject*>(y)->micros;
    case ObjectKind::DATE:
      return static_cast<DateObject*>(x)->days == static_cast<DateObject*>(y)->days;
    case ObjectKind::TIMEDELTA:
      return static_cast<TimeDeltaObject*>(x)->micros == static_cast<TimeDeltaObject*>(y)->micros;
    case ObjectKind::EXCEPTION_TYPE:
      return static_cast<ExceptionTypeObject*>(x)->type == static_cast<ExceptionTypeObject*>(y)->type;
    default:
      return false;
  }
}

bool SequenceEquals(const std::vector<Value>& a, const std::vector<Value>& b, int depth) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); i++) {
    if (!a[i].Identical(b[i]) && !EqualsImpl(a[i], b[i], depth + 1)) return false;
  }
  return true;
}

enum class Order { LT, LE, GT, GE };

template <class T> bool ApplyOrder(const T& x, const T& y, Order op) {
  switch (op) {
    case Order::LT: return x < y;
    case Order::LE: return x <= y;
    case Order::GT: return x > y;
    case Order::GE: return x >= y;
  }
  __builtin_unreachable();
}

const char* OrderSymbol(Order op) {
  switch (op) {
    case Order::LT: return "<";
    case Order::LE: return "<=";
    case Order::GT: return ">";
    case Order::GE: return ">=";
  }
  __builtin_unreachable();
}

bool SetIsSubset(const ValueTable& a, const ValueTable& b) {
  if (a.Size() > b.Size()) return false;
  for (auto& entry : a.Entries()) {
    if (!b.Contains(entry.first)) return false;
  }
  return true;
}

bool OrderImpl(const Value& a, const Value& b, Order op, int depth);

bool SequenceOrder(const std::vector<Value>& a, const std::vector<Value>& b, Order op, int depth) {
  size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; i++) {
    if (a[i].Identical(b[i]) || EqualsImpl(a[i], b[i], depth + 1)) continue;
    return OrderImpl(a[i], b[i], op, depth + 1);
  }
  return ApplyOrder(a.size(), b.size(), op);
}

bool OrderImpl(const Value& a, const Value& b, Order op, int depth) {
  if (depth > kMaxCompareNesting) {
    throw ScriptError(ExcType::RECURSION_ERROR, "maximum recursion depth exceeded in comparison");
  }
  if (a.IsNumber() && b.IsNumber()) {
    if (a.IsIntLike() && b.IsIntLike()) {
      if (a.IsBig() || b.IsBig()) return ApplyOrder(cmp(a.ToMpz(), b.ToMpz()), 0, op);
      return ApplyOrder(a.AsInt(), b.AsInt(), op);
    }
    if (a.IsFloat() && b.IsFloat()) return ApplyOrder(a.AsFloat(), b.AsFloat(), op);
    double d = a.IsFloat() ? a.AsFloat() : b.AsFloat();
    if (std::isnan(d)) return false;
    int c = a.IsFloat() ? -CompareIntFloat(b, d) : CompareIntFloat(a, d);
    return ApplyOrder(c, 0, op);
  }
  if (a.IsStr() && b.IsStr()) return ApplyOrder(a.AsStr(), b.AsStr(), op);
  if (a.IsObject() && b.IsObject() && a.AsObject()->kind == b.AsObject()->kind) {
    Object* x = a.AsObject();
    Object* y = b.AsObject();
    switch (x->kind) {
      case ObjectKind::LIST:
        return SequenceOrder(static_cast<ListObject*>(x)->items, static_cast<ListObject*>(y)->items, op, depth);
      case ObjectKind::TUPLE:
        return SequenceOrder(static_cast<TupleObject*>(x)->items, static_cast<TupleObject*>(y)->items, op, depth);
      case ObjectKind::SET: {
        auto& tx = static_cast<SetObject*>(x)->table;
        auto& ty = static_cast<SetObject*>(y)->table;
        switch (op) {
          case Order::LT: return tx.Size() < ty.Size() && SetIsSubset(tx, ty);
          case Order::LE: return SetIsSubset(tx, ty);
          case Order::GT: return ty.Size() < tx.Size() && SetIsSubset(ty, tx);
          case Order::GE: return SetIsSubset(ty, tx);
        }
        break;
      }
      case ObjectKind::DATETIME:
        return ApplyOrder(static_cast<DateTimeObject*>(x)->micros, static_cast<DateTimeObject*>(y)->micros, op);
      case ObjectKind::DATE:
        return ApplyOrder(static_cast<DateObject*>(x)->days, static_cast<DateObject*>(y)->days, op);
      case ObjectKind::TIMEDELTA:
        return ApplyOrder(static_cast<TimeDeltaObject*>(x)->micros, static_cast<TimeDeltaObject*>(y)->micros, op);
      default:
        break;
    }
  }
  throw ScriptError(ExcType::TYPE_ERROR,
      fmt::format("'{}' not supported between instances of '{}' and '{}'",
                  OrderSymbol(op), TypeName(a), TypeName(b)));
}

} // namespace

const char* ObjectKindName(ObjectKind kind) {
  return kObjectKindNameTable[(int)kind];
}

void ReleasePayload(Payload* payload) {
  if (payload->heap) payload->heap->Uncharge(payload->bytes);
  delete payload;
}

Value Value::Str(std::string v) {
  Heap* heap = Heap::Current();
  size_t bytes = sizeof(StrPayload) + v.size();
  if (heap) heap->Charge(bytes);
  auto payload = new StrPayload(std::move(v));
  payload->bytes = bytes;
  payload->heap = heap;
  Value r;
  r.data_ = payload;
  return r;
}

Value Value::Big(mpz_class v) {
  if (v.fits_slong_p()) return Int(v.get_si());
  Heap* heap = Heap::Current();
  size_t bytes = sizeof(BigPayload) + mpz_size(v.get_mpz_t()) * sizeof(mp_limb_t);
  if (heap) heap->Charge(bytes);
  auto payload = new BigPayload(std::move(v));
  payload->bytes = bytes;
  payload->heap = heap;
  Value r;
  r.data_ = payload;
  return r;
}

mpz_class Value::ToMpz() const {
  if (IsBig()) return AsBig();
  return mpz_class((long)AsInt());
}

void Value::IndexOverflow() const {
  throw ScriptError(ExcType::OVERFLOW_ERROR, "cannot fit 'int' into an index-sized integer");
}

double Value::BigToFloat() const {
  const mpz_class& n = AsBig();
  if (mpz_sizeinbase(n.get_mpz_t(), 2) > (size_t)std::numeric_limits<double>::max_exponent) {
    throw ScriptError(ExcType::OVERFLOW_ERROR, "int too large to convert to float");
  }
  return n.get_d();
}

bool Value::Is(ObjectKind kind) const {
  return IsObject() && AsObject()->kind == kind;
}

bool Value::Identical(const Value& other) const {
  if (data_.index() != other.data_.index()) return false;
  switch (data_.index()) {
    case 0: return true;
    case 1: return AsBool() == other.AsBool();
    case 2: return AsInt() == other.AsInt();
    case 3: {
      double x = AsFloat(), y = other.AsFloat();
      return std::memcmp(&x, &y, sizeof(double)) == 0;
    }
    case 4: return AsStr() == other.AsStr();
    case 6: return AsBig() == other.AsBig();
    default: return AsObject() == other.AsObject();
  }
}

size_t ValueHash::operator()(const Value& v) const {
  return HashValue(v, 0);
}

bool ValueKeyEqual::operator()(const Value& a, const Value& b) const {
  return a.Identical(b) || Equals(a, b);
}

void CheckHashable(const Value& v) {
  HashValue(v, 0);
}

void ValueTable::Reindex() {
  index_.clear();
  for (size_t i = 0; i < entries_.size(); i++) index_.emplace(entries_[i].first, i);
}

const Value* ValueTable::Find(const Value& key) const {
  auto it = index_.find(key);
  if (it == index_.end()) return nullptr;
  return &entries_[it->second].second;
}

Value* ValueTable::Find(const Value& key) {
  auto it = index_.find(key);
  if (it == index_.end()) return nullptr;
  return &entries_[it->second].second;
}

void ValueTable::Set(const Value& key, Value value) {
  auto it = index_.find(key);
  if (it != index_.end()) {
    entries_[it->second].second = std::move(value);
    return;
  }
  index_.emplace(key, entries_.size());
  entries_.emplace_back(key, std::move(value));
}

bool ValueTable::Erase(const Value& key) {
  auto it = index_.find(key);
  if (it == index_.end()) return false;
  size_t pos = it->second;
  entries_.erase(entries_.begin() + pos);
  if (pos == entries_.size()) {
    index_.erase(it);
  } else {
    Reindex();
  }
  return true;
}

void ValueTable::Clear() {
  entries_.clear();
  index_.clear();
}

std::pair<Value, Value> ValueTable::PopLast() {
  auto ret = std::move(entries_.back());
  entries_.pop_back();
  index_.erase(ret.first);
  return ret;
}

void ValueTable::Traverse(const Visitor& visit) const {
  for (auto& [key, value] : entries_) {
    visit(key);
    visit(value);
  }
  for (auto& entry : index_) visit(entry.first);
}

size_t ValueTable::Footprint() const {
  return entries_.capacity() * sizeof(entries_[0]) + index_.bucket_count() * sizeof(void*) +
      index_.size() * (sizeof(Value) + 2 * sizeof(size_t) + sizeof(void*));
}

int64_t RangeObject::Length() const {
  __int128 len = 0;
  if (step > 0 && start < stop) {
    len = ((__int128)stop - start - 1) / step + 1;
  } else if (step < 0 && start > stop) {
    len = ((__int128)start - stop - 1) / -(__int128)step + 1;
  }
  return (int64_t)len;
}

const Value* BuiltinObject::FindAttr(const std::string& attr) const {
  for (auto& [name, value] : attrs) {
    if (name == attr) return &value;
  }
  return nullptr;
}

void IteratorObject::Clear() {
  iter.reset();
}

const Value* ModuleObject::Find(const std::string& member) const {
  for (auto& [name, value] : members) {
    if (name == member) return &value;
  }
  return nullptr;
}

void ExceptionRef::Reset(ExceptionObject* obj) {
  if (obj) static_cast<Object*>(obj)->refs_++;
  ExceptionObject* old = obj_;
  obj_ = obj;
  if (old) {
    Object* prev = old;
    if (--prev->refs_ == 0) prev->heap_->Free(prev);
  }
}

ExceptionRef::ExceptionRef(const ExceptionRef& other) : obj_(nullptr) {
  Reset(other.obj_);
}

ExceptionRef& ExceptionRef::operator=(const ExceptionRef& other) {
  Reset(other.obj_);
  return *this;
}

ExceptionRef::~ExceptionRef() {
  Reset(nullptr);
}

namespace {

[[noreturn]] void MemoryLimit(const char* message) {
  ScriptError err(ExcType::MEMORY_ERROR, message);
  err.fatal = true;
  throw err;
}

} // namespace

Heap::Heap(size_t max_objects, size_t max_memory) :
    head_(nullptr), live_(0), max_objects_(max_objects), max_memory_(max_memory), bytes_(0),
    next_collect_(kMinCollect), collecting_(false), draining_(false), previous_(current_heap) {
  current_heap = this;
}

Heap::~Heap() {
  // clear first so that no destructor releases an object already deleted
  collecting_ = true;
  for (Object* obj = head_; obj; obj = obj->next_) obj->refs_++;
  for (Object* obj = head_; obj; obj = obj->next_) obj->Clear();
  while (head_) {
    Object* obj = head_;
    head_ = obj->next_;
    delete obj;
  }
  current_heap = previous_;
}

Heap* Heap::Current() {
  return current_heap;
}

void Heap::Link(Object* obj) {
  obj->prev_ = nullptr;
  obj->next_ = head_;
  if (head_) head_->prev_ = obj;
  head_ = obj;
  live_++;
}

void Heap::Unlink(Object* obj) {
  if (obj->prev_) {
    obj->prev_->next_ = obj->next_;
  } else {
    head_ = obj->next_;
  }
  if (obj->next_) obj->next_->prev_ = obj->prev_;
  live_--;
}

void Heap::Adopt(Object* obj) {
  size_t footprint = obj->Footprint();
  Charge(kObjectOverhead + footprint);
  obj->charged_ = footprint;
  obj->heap_ = this;
  Link(obj);
}

void Heap::Destroy(Object* obj) {
  Unlink(obj);
  Uncharge(kObjectOverhead + obj->charged_);
  delete obj;
}

void Heap::CheckObjectLimit() {
  if (max_objects_ && live_ >= max_objects_) {
    Collect();
    if (live_ >= max_objects_) MemoryLimit("object limit exceeded");
  } else if (live_ >= next_collect_) {
    Collect();
  }
}

void Heap::Charge(size_t bytes) {
  if (max_memory_ && bytes_ + bytes > max_memory_) {
    Collect();
    if (bytes_ + bytes > max_memory_) MemoryLimit("memory limit exceeded");
  }
  bytes_ += bytes;
}

void Heap::Reserve(size_t bytes) {
  if (max_memory_ && bytes_ + bytes > max_memory_) {
    Collect();
    if (bytes_ + bytes > max_memory_) MemoryLimit("memory limit exceeded");
  }
}

void Heap::Track(Object* obj) {
  size_t footprint = obj->Footprint();
  if (footprint > obj->charged_) {
    Charge(footprint - obj->charged_);
  } else {
    Uncharge(obj->charged_ - footprint);
  }
  obj->charged_ = footprint;
}

void Heap::Free(Object* obj) {
  pending_.push_back(obj);
  if (!draining_ && !collecting_) Drain();
}

// iterative, so freeing a long chain of objects does not recurse
void Heap::Drain() {
  draining_ = true;
  while (!pending_.empty()) {
    Object* obj = pending_.back();
    pending_.pop_back();
    Destroy(obj);
  }
  draining_ = false;
}

size_t Heap::Collect() {
  if (collecting_ || draining_) return 0;
  for (Object* obj = head_; obj; obj = obj->next_) {
    obj->gc_refs_ = (ptrdiff_t)obj->refs_;
    obj->reachable_ = false;
  }
  auto internal = [this](const Value& v) {
    if (v.IsObject() && v.AsObject()->heap_ == this) v.AsObject()->gc_refs_--;
  };
  for (Object* obj = head_; obj; obj = obj->next_) obj->Traverse(internal);

  // whatever is referenced from outside the heap is alive, and so is all it reaches;
  // objects not yet wrapped in a Value count as referenced
  std::vector<Object*> stack;
  for (Object* obj = head_; obj; obj = obj->next_) {
    if (obj->gc_refs_ > 0 || obj->refs_ == 0) {
      obj->reachable_ = true;
      stack.push_back(obj);
    }
  }
  auto mark = [this, &stack](const Value& v) {
    if (!v.IsObject()) return;
    Object* child = v.AsObject();
    if (child->heap_ == this && !child->reachable_) {
      child->reachable_ = true;
      stack.push_back(child);
    }
  };
  while (!stack.empty()) {
    Object* obj = stack.back();
    stack.pop_back();
    obj->Traverse(mark);
  }

  std::vector<Object*> garbage;
  for (Object* obj = head_; obj; obj = obj->next_) {
    if (!obj->reachable_) garbage.push_back(obj);
  }
  if (garbage.empty()) {
    next_collect_ = std::max(kMinCollect, 2 * live_);
    return 0;
  }
  collecting_ = true;
  for (Object* obj : garbage) obj->refs_++;
  for (Object* obj : garbage) obj->Clear();
  for (Object* obj : garbage) {
    if (--obj->refs_ == 0) pending_.push_back(obj);
  }
  collecting_ = false;
  Drain();
  next_collect_ = std::max(kMinCollect, 2 * live_);
  return garbage.size();
}

bool Truthy(const Value& v) {
  if (v.IsNone()) return false;
  if (v.IsBool()) return v.AsBool();
  if (v.IsInt()) return v.AsInt() != 0;
  if (v.IsBig()) return true;
  if (v.IsFloat()) return v.AsFloat() != 0.0;
  if (v.IsStr()) return !v.AsStr().empty();
  Object* obj = v.AsObject();
  switch (obj->kind) {
    case ObjectKind::LIST: return !static_cast<ListObject*>(obj)->items.empty();
    case ObjectKind::TUPLE: return !static_cast<TupleObject*>(obj)->items.empty();
    case ObjectKind::DICT: return static_cast<DictObject*>(obj)->table.Size() != 0;
    case ObjectKind::SET: return static_cast<SetObject*>(obj)->table.Size() != 0;
    case ObjectKind::RANGE: return static_cast<RangeObject*>(obj)->Length() != 0;
    case ObjectKind::DICT_VIEW: return static_cast<DictViewObject*>(obj)->dict->table.Size() != 0;
    case ObjectKind::TIMEDELTA: return static_cast<TimeDeltaObject*>(obj)->micros != 0;
    default: return true;
  }
}

bool Equals(const Value& a, const Value& b) {
  return EqualsImpl(a, b, 0);
}

bool LessThan(const Value& a, const Value& b) {
  return OrderImpl(a, b, Order::LT, 0);
}

bool RichCompare(const Value& a, const Value& b, const std::string& op) {
  Order order = op == "<" ? Order::LT : op == "<=" ? Order::LE : op == ">" ? Order::GT : Order::GE;
  return OrderImpl(a, b, order, 0);
}

std::string TypeName(const Value& v) {
  if (v.IsNone()) return "NoneType";
  if (v.IsBool()) return "bool";
  if (v.IsInt() || v.IsBig()) return "int";
  if (v.IsFloat()) return "float";
  if (v.IsStr()) return "str";
  Object* obj = v.AsObject();
  switch (obj->kind) {
    case ObjectKind::ITERATOR: return static_cast<IteratorObject*>(obj)->type_name;
    case ObjectKind::EXCEPTION: return ExcTypeName(static_cast<ExceptionObject*>(obj)->type);
    case ObjectKind::BUILTIN:
      return static_cast<BuiltinObject*>(obj)->is_type ? "type" : "builtin_function_or_method";
    case ObjectKind::DICT_VIEW:
      switch (static_cast<DictViewObject*>(obj)->view) {
        case ViewKind::KEYS: return "dict_keys";
        case ViewKind::VALUES: return "dict_values";
        case ViewKind::ITEMS: return "dict_items";
      }
      break;
    default:
      break;
  }
  return ObjectKindName(obj->kind);
}

size_t CodePointCount(const std::string& str) {
  size_t count = 0;
  for (unsigned char c : str) {
    if ((c & 0xC0) != 0x80) count++;
  }
  return count;
}

uint32_t DecodeUtf8(const std::string& str, size_t& pos) {
  unsigned char c = str[pos];
  int len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
  if (len == 0 || pos + len > str.size()) {
    pos++;
    return 0xFFFD;
  }
  uint32_t cp = len == 1 ? c : len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
  for (int i = 1; i < len; i++) {
    unsigned char cc = str[pos + i];
    if ((cc & 0xC0) != 0x80) {
      pos++;
      return 0xFFFD;
    }
    cp = (cp << 6) | (cc & 0x3F);
  }
  pos += len;
  return cp;
}

std::vector<std::string> SplitCodePoints(const std::string& str) {
  std::vector<std::string> ret;
  size_t pos = 0;
  while (pos < str.size()) {
    size_t start = pos;
    pos++;
    while (pos < str.size() && ((unsigned char)str[pos] & 0xC0) == 0x80) pos++;
    ret.push_back(str.substr(start, pos - start));
  }
  return ret;
}

void AppendUtf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out += (char)cp;
  } else if (cp < 0x800) {
    out += (char)(0xC0 | (cp >> 6));
    out += (char)(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += (char)(0xE0 | (cp >> 12));
    out += (char)(0x80 | ((cp >> 6) & 0x3F));
    out += (char)(0x80 | (cp & 0x3F));
  } else {
    out += (char)(0xF0 | (cp >> 18));
    out += (char)(0x80 | ((cp >> 12) & 0x3F));
    out += (char)(0x80 | ((cp >> 6) & 0x3F));
    out += (char)(0x80 | (cp & 0x3F));
  }
}

} // namespace interp
