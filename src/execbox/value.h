#ifndef EXECBOX_VALUE_H_
#define EXECBOX_VALUE_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <gmpxx.h>

#include "errors.h"

namespace interp {

class Object;
class Heap;
class Interpreter;
class Scope;
class Value;
struct FunctionDef;

#define ENUM_OBJECT_KIND_ \
  X(LIST, "list") \
  X(TUPLE, "tuple") \
  X(DICT, "dict") \
  X(SET, "set") \
  X(RANGE, "range") \
  X(DICT_VIEW, "dict_view") \
  X(ITERATOR, "iterator") \
  X(FUNCTION, "function") \
  X(BUILTIN, "builtin_function_or_method") \
  X(BOUND_METHOD, "builtin_function_or_method") \
  X(MODULE, "module") \
  X(EXCEPTION_TYPE, "type") \
  X(EXCEPTION, "exception") \
  X(DATETIME, "datetime.datetime") \
  X(DATE, "datetime.date") \
  X(TIMEDELTA, "datetime.timedelta") \
  X(SCOPE, "scope")
enum class ObjectKind {
#define X(name, pyname) name,
  ENUM_OBJECT_KIND_
#undef X
};

const char* ObjectKindName(ObjectKind);

using Visitor = std::function<void(const Value&)>;

// Immutable storage shared by the copies of a str or of an int beyond 64 bits,
// charged to the heap that was current when it was made.
struct Payload {
  size_t refs;
  size_t bytes;
  Heap* heap;
  Payload() : refs(1), bytes(0), heap(nullptr) {}
  virtual ~Payload() = default;
};

struct StrPayload : Payload {
  std::string text;
  explicit StrPayload(std::string text) : text(std::move(text)) {}
};

struct BigPayload : Payload {
  mpz_class number;
  explicit BigPayload(mpz_class number) : number(std::move(number)) {}
};

void ReleasePayload(Payload*);

// Base of every heap object. Values count references to it; the heap frees it
// when the count drops to zero, or when it is only reachable from a cycle.
class Object {
  size_t refs_;
  Heap* heap_;
  Object* prev_;
  Object* next_;
  size_t charged_; // bytes last charged for Footprint()
  ptrdiff_t gc_refs_;
  bool reachable_;

  friend class Value;
  friend class Heap;
  friend class ExceptionRef;
 public:
  const ObjectKind kind;
  explicit Object(ObjectKind kind) :
      refs_(0), heap_(nullptr), prev_(nullptr), next_(nullptr), charged_(0), gc_refs_(0),
      reachable_(false), kind(kind) {}
  Object(const Object&) = delete;
  Object& operator=(const Object&) = delete;
  virtual ~Object() = default;

  // Reports held references. Leaving one out only keeps its cycle alive;
  // reporting one that is not held frees live objects.
  virtual void Traverse(const Visitor&) const {}
  // drops every held reference
  virtual void Clear() {}
  // bytes owned besides the object itself and its payloads
  virtual size_t Footprint() const { return 0; }
};

class Value {
  std::variant<std::monostate, bool, int64_t, double, StrPayload*, Object*, BigPayload*> data_;

  void Retain() const;
  void Release();
  [[noreturn]] void IndexOverflow() const;
  double BigToFloat() const;
 public:
  Value() = default;
  Value(const Value& other) : data_(other.data_) { Retain(); }
  Value(Value&& other) noexcept : data_(other.data_) { other.data_ = std::monostate(); }
  // the old value is released last, as it may own the new one
  Value& operator=(const Value& other) {
    Value copy(other);
    std::swap(data_, copy.data_);
    return *this;
  }
  Value& operator=(Value&& other) noexcept {
    Value moved(std::move(other));
    std::swap(data_, moved.data_);
    return *this;
  }
  ~Value() { Release(); }

  static Value Bool(bool v) { Value r; r.data_ = v; return r; }
  static Value Int(int64_t v) { Value r; r.data_ = v; return r; }
  static Value Float(double v) { Value r; r.data_ = v; return r; }
  // charged to the current heap; throws MemoryError past its limit
  static Value Str(std::string v);
  // an int of any size; Int when it fits in 64 bits
  static Value Big(mpz_class v);
  static Value Obj(Object* v) { Value r; r.data_ = v; r.Retain(); return r; }

  bool IsNone() const { return data_.index() == 0; }
  bool IsBool() const { return data_.index() == 1; }
  bool IsInt() const { return data_.index() == 2; }
  bool IsFloat() const { return data_.index() == 3; }
  bool IsStr() const { return data_.index() == 4; }
  bool IsObject() const { return data_.index() == 5; }
  bool IsBig() const { return data_.index() == 6; }
  // bool is a subclass of int
  bool IsIntLike() const { return IsInt() || IsBool() || IsBig(); }
  bool IsNumber() const { return IsIntLike() || IsFloat(); }
  bool Is(ObjectKind kind) const;

  bool AsBool() const { return std::get<bool>(data_); }
  // OverflowError for ints beyond 64 bits
  int64_t AsInt() const {
    if (IsBool()) return std::get<bool>(data_);
    if (IsBig()) IndexOverflow();
    return std::get<int64_t>(data_);
  }
  // OverflowError for ints beyond the double range
  double AsFloat() const {
    if (IsFloat()) return std::get<double>(data_);
    if (IsBig()) return BigToFloat();
    return (double)AsInt();
  }
  const std::string& AsStr() const { return std::get<StrPayload*>(data_)->text; }
  const mpz_class& AsBig() const { return std::get<BigPayload*>(data_)->number; }
  // any int-like value
  mpz_class ToMpz() const;
  Object* AsObject() const { return std::get<Object*>(data_); }
  template <class T> T* As() const { return static_cast<T*>(std::get<Object*>(data_)); }

  // identity as seen by `is`
  bool Identical(const Value& other) const;
};

inline void Value::Retain() const {
  switch (data_.index()) {
    case 4: std::get<StrPayload*>(data_)->refs++; break;
    case 5: std::get<Object*>(data_)->refs_++; break;
    case 6: std::get<BigPayload*>(data_)->refs++; break;
    default: break;
  }
}

struct CallArgs {
  std::vector<Value> args;
  std::vector<std::pair<std::string, Value>> kwargs;
};

using NativeFn = Value (*)(Interpreter&, CallArgs&);
using MethodFn = Value (*)(Interpreter&, const Value& self, CallArgs&);

// Python's hashing and equality for dict keys and set members (1 == 1.0 == True).
// Both throw TypeError for unhashable values.
struct ValueHash {
  size_t operator()(const Value&) const;
};
struct ValueKeyEqual {
  bool operator()(const Value&, const Value&) const;
};

void CheckHashable(const Value&);

// Insertion-ordered hash table backing dict and set
class ValueTable {
  std::vector<std::pair<Value, Value>> entries_;
  std::unordered_map<Value, size_t, ValueHash, ValueKeyEqual> index_;

  void Reindex();
 public:
  const Value* Find(const Value& key) const;
  Value* Find(const Value& key);
  bool Contains(const Value& key) const { return Find(key) != nullptr; }
  // keeps the original key and position when the key exists
  void Set(const Value& key, Value value);
  bool Erase(const Value& key);
  void Clear();
  std::pair<Value, Value> PopLast();
  size_t Size() const { return entries_.size(); }
  const std::vector<std::pair<Value, Value>>& Entries() const { return entries_; }
  void Traverse(const Visitor&) const;
  size_t Footprint() const;
};

class ListObject : public Object {
 public:
  std::vector<Value> items;
  ListObject() : Object(ObjectKind::LIST) {}
  explicit ListObject(std::vector<Value> items) : Object(ObjectKind::LIST), items(std::move(items)) {}
  void Traverse(const Visitor& visit) const override { for (auto& item : items) visit(item); }
  void Clear() override { std::vector<Value>().swap(items); }
  size_t Footprint() const override { return items.capacity() * sizeof(Value); }
};

class TupleObject : public Object {
 public:
  std::vector<Value> items;
  TupleObject() : Object(ObjectKind::TUPLE) {}
  explicit TupleObject(std::vector<Value> items) : Object(ObjectKind::TUPLE), items(std::move(items)) {}
  void Traverse(const Visitor& visit) const override { for (auto& item : items) visit(item); }
  void Clear() override { std::vector<Value>().swap(items); }
  size_t Footprint() const override { return items.capacity() * sizeof(Value); }
};

class DictObject : public Object {
 public:
  ValueTable table;
  DictObject() : Object(ObjectKind::DICT) {}
  void Traverse(const Visitor& visit) const override { table.Traverse(visit); }
  void Clear() override { table.Clear(); }
  size_t Footprint() const override { return table.Footprint(); }
};

class SetObject : public Object {
 public:
  ValueTable table; // values unused
  SetObject() : Object(ObjectKind::SET) {}
  void Traverse(const Visitor& visit) const override { table.Traverse(visit); }
  void Clear() override { table.Clear(); }
  size_t Footprint() const override { return table.Footprint(); }
};

class RangeObject : public Object {
 public:
  int64_t start, stop, step;
  RangeObject(int64_t start, int64_t stop, int64_t step) :
      Object(ObjectKind::RANGE), start(start), stop(stop), step(step) {}
  int64_t Length() const;
  int64_t At(int64_t i) const { return start + i * step; }
};

enum class ViewKind { KEYS, VALUES, ITEMS };

class DictViewObject : public Object {
  Value owner_;
 public:
  DictObject* dict;
  ViewKind view;
  DictViewObject(const Value& owner, ViewKind view) :
      Object(ObjectKind::DICT_VIEW), owner_(owner), dict(owner.As<DictObject>()), view(view) {}
  const Value& owner() const { return owner_; }
  void Traverse(const Visitor& visit) const override { visit(owner_); }
  void Clear() override { owner_ = Value(); }
};

class Iter {
 public:
  virtual ~Iter() = default;
  // false once exhausted
  virtual bool Next(Value& out) = 0;
  virtual void Traverse(const Visitor&) const {}
};

class IteratorObject : public Object {
 public:
  std::unique_ptr<Iter> iter;
  std::string type_name;
  IteratorObject(std::unique_ptr<Iter> iter, std::string type_name) :
      Object(ObjectKind::ITERATOR), iter(std::move(iter)), type_name(std::move(type_name)) {}
  void Traverse(const Visitor& visit) const override {
    if (iter) iter->Traverse(visit);
  }
  void Clear() override;
};

class FunctionObject : public Object {
  Value closure_;
 public:
  const FunctionDef* def;
  std::vector<std::optional<Value>> defaults; // one per parameter
  FunctionObject(const FunctionDef* def, Scope* closure);
  Scope* closure() const;
  void Traverse(const Visitor& visit) const override;
  void Clear() override;
};

// A native callable. Types such as str or datetime.datetime are builtins too:
// they carry class attributes and the method table of their instances.
class BuiltinObject : public Object {
 public:
  std::string name;
  NativeFn fn;
  MethodFn method; // unbound method: args[0] is self
  bool is_type;
  std::string instance_type; // method table of instances, for str.upper and friends
  std::vector<std::pair<std::string, Value>> attrs;
  BuiltinObject(std::string name, NativeFn fn) :
      Object(ObjectKind::BUILTIN), name(std::move(name)), fn(fn), method(nullptr), is_type(false) {}
  BuiltinObject(std::string name, MethodFn method) :
      Object(ObjectKind::BUILTIN), name(std::move(name)), fn(nullptr), method(method), is_type(false) {}
  const Value* FindAttr(const std::string& attr) const;
  void Traverse(const Visitor& visit) const override {
    for (auto& attr : attrs) visit(attr.second);
  }
  void Clear() override { attrs.clear(); }
};

class BoundMethodObject : public Object {
 public:
  Value self;
  std::string name;
  MethodFn fn;
  BoundMethodObject(Value self, std::string name, MethodFn fn) :
      Object(ObjectKind::BOUND_METHOD), self(std::move(self)), name(std::move(name)), fn(fn) {}
  void Traverse(const Visitor& visit) const override { visit(self); }
  void Clear() override { self = Value(); }
};

class ModuleObject : public Object {
 public:
  std::string name;
  std::vector<std::pair<std::string, Value>> members;
  explicit ModuleObject(std::string name) : Object(ObjectKind::MODULE), name(std::move(name)) {}
  const Value* Find(const std::string& member) const;
  void Traverse(const Visitor& visit) const override {
    for (auto& member : members) visit(member.second);
  }
  void Clear() override { members.clear(); }
};

class ExceptionTypeObject : public Object {
 public:
  ExcType type;
  explicit ExceptionTypeObject(ExcType type) : Object(ObjectKind::EXCEPTION_TYPE), type(type) {}
};

class ExceptionObject : public Object {
 public:
  ExcType type;
  std::vector<Value> args;
  ExceptionObject(ExcType type, std::vector<Value> args) :
      Object(ObjectKind::EXCEPTION), type(type), args(std::move(args)) {}
  void Traverse(const Visitor& visit) const override { for (auto& arg : args) visit(arg); }
  void Clear() override { args.clear(); }
};

// naive local time, microseconds since 1970-01-01T00:00:00
class DateTimeObject : public Object {
 public:
  int64_t micros;
  explicit DateTimeObject(int64_t micros) : Object(ObjectKind::DATETIME), micros(micros) {}
};

// days since 1970-01-01
class DateObject : public Object {
 public:
  int64_t days;
  explicit DateObject(int64_t days) : Object(ObjectKind::DATE), days(days) {}
};

class TimeDeltaObject : public Object {
 public:
  int64_t micros;
  explicit TimeDeltaObject(int64_t micros) : Object(ObjectKind::TIMEDELTA), micros(micros) {}
};

// Owns the objects of one run and accounts for its memory. Objects are freed
// when their last reference goes; reference cycles are found by Collect(),
// which runs as the live count grows and before a limit is reported.
// Nothing outlives the heap: it frees whatever is left when destroyed.
class Heap {
  Object* head_;
  size_t live_;
  size_t max_objects_;
  size_t max_memory_;
  size_t bytes_;
  size_t next_collect_;
  bool collecting_;
  bool draining_;
  std::vector<Object*> pending_; // reached zero references
  Heap* previous_;

  void Link(Object*);
  void Unlink(Object*);
  void Destroy(Object*);
  void Drain();
  void Adopt(Object*);
  void CheckObjectLimit();
 public:
  explicit Heap(size_t max_objects = 0, size_t max_memory = 0);
  Heap(const Heap&) = delete;
  Heap& operator=(const Heap&) = delete;
  ~Heap();

  // the heap of the run on this thread; nullptr outside a run
  static Heap* Current();

  // The new object has no references yet and is never freed until it gets
  // one, so wrap it in a Value before anything can throw.
  template <class T, class... Args> T* Make(Args&&... args) {
    CheckObjectLimit();
    std::unique_ptr<T> obj(new T(std::forward<Args>(args)...));
    Adopt(obj.get());
    return obj.release();
  }
  // recharges an object whose Footprint() changed
  void Track(Object*);
  // both throw MemoryError past the memory limit
  void Charge(size_t bytes);
  void Reserve(size_t bytes);
  void Uncharge(size_t bytes) { bytes_ -= bytes; }
  // called when the last reference goes
  void Free(Object*);
  // frees objects reachable only from reference cycles; returns how many
  size_t Collect();

  size_t Size() const { return live_; }
  size_t Bytes() const { return bytes_; }
};

inline void Value::Release() {
  switch (data_.index()) {
    case 4: {
      auto payload = std::get<StrPayload*>(data_);
      if (--payload->refs == 0) ReleasePayload(payload);
      break;
    }
    case 5: {
      Object* obj = std::get<Object*>(data_);
      if (--obj->refs_ == 0) obj->heap_->Free(obj);
      break;
    }
    case 6: {
      auto payload = std::get<BigPayload*>(data_);
      if (--payload->refs == 0) ReleasePayload(payload);
      break;
    }
    default:
      break;
  }
}

bool Truthy(const Value&);
// == semantics; containers compare element-wise
bool Equals(const Value& a, const Value& b);
// < semantics; throws TypeError for unordered operands
bool LessThan(const Value& a, const Value& b);
// op is one of "<", "<=", ">", ">="
bool RichCompare(const Value& a, const Value& b, const std::string& op);
std::string TypeName(const Value&);

// str is UTF-8 and indexed by code point
size_t CodePointCount(const std::string&);
std::vector<std::string> SplitCodePoints(const std::string&);
void AppendUtf8(std::string& out, uint32_t code_point);
// decodes one code point starting at pos, advancing pos; invalid bytes map to U+FFFD
uint32_t DecodeUtf8(const std::string& str, size_t& pos);

} // namespace interp

#endif  // EXECBOX_VALUE_H_
