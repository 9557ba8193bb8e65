#include "interpreter.h"

#include <limits>

#include <fmt/core.h>

#include "environment.h"
#include "format.h"

namespace interp {

namespace {

constexpr uint64_t kDeadlineCheckInterval = 256;
constexpr int kMaxEvalDepth = 10000;
// bound on a single int result, also without a memory budget
constexpr size_t kMaxIntBits = (size_t)1 << 32;

class StrIter : public Iter {
  std::vector<std::string> chars_;
  size_t pos_ = 0;
 public:
  explicit StrIter(const std::string& str) : chars_(SplitCodePoints(str)) {}
  bool Next(Value& out) override {
    if (pos_ >= chars_.size()) return false;
    out = Value::Str(std::move(chars_[pos_++]));
    return true;
  }
};

// reads the live list, so appends during iteration are seen
class ListIter : public Iter {
  Value owner_;
  ListObject* list_;
  size_t pos_ = 0;
 public:
  explicit ListIter(const Value& list) : owner_(list), list_(list.As<ListObject>()) {}
  bool Next(Value& out) override {
    if (pos_ >= list_->items.size()) return false;
    out = list_->items[pos_++];
    return true;
  }
  void Traverse(const Visitor& visit) const override { visit(owner_); }
};

class TupleIter : public Iter {
  Value owner_;
  TupleObject* tuple_;
  size_t pos_ = 0;
 public:
  explicit TupleIter(const Value& tuple) : owner_(tuple), tuple_(tuple.As<TupleObject>()) {}
  bool Next(Value& out) override {
    if (pos_ >= tuple_->items.size()) return false;
    out = tuple_->items[pos_++];
    return true;
  }
  void Traverse(const Visitor& visit) const override { visit(owner_); }
};

class RangeIter : public Iter {
  int64_t next_, step_, remaining_;
 public:
  explicit RangeIter(const RangeObject* range) :
      next_(range->start), step_(range->step), remaining_(range->Length()) {}
  bool Next(Value& out) override {
    if (remaining_ <= 0) return false;
    out = Value::Int(next_);
    if (--remaining_ > 0) next_ += step_;
    return true;
  }
};

class TableIter : public Iter {
  Interpreter& interp_;
  Value owner_; // the dict, set or view
  const ValueTable& table_;
  ViewKind view_;
  size_t pos_ = 0;
  size_t expected_size_;
  const char* what_;
 public:
  TableIter(Interpreter& interp, const Value& owner, const ValueTable& table, ViewKind view,
            const char* what) :
      interp_(interp), owner_(owner), table_(table), view_(view), expected_size_(table.Size()),
      what_(what) {}
  bool Next(Value& out) override {
    if (table_.Size() != expected_size_) {
      throw ScriptError(ExcType::RUNTIME_ERROR, fmt::format("{} changed size during iteration", what_));
    }
    if (pos_ >= table_.Size()) return false;
    auto& entry = table_.Entries()[pos_++];
    switch (view_) {
      case ViewKind::KEYS: out = entry.first; break;
      case ViewKind::VALUES: out = entry.second; break;
      case ViewKind::ITEMS: out = interp_.NewTuple({entry.first, entry.second}); break;
    }
    return true;
  }
  void Traverse(const Visitor& visit) const override { visit(owner_); }
};

class ProxyIter : public Iter {
  Value owner_;
  IteratorObject* iterator_;
 public:
  explicit ProxyIter(const Value& iterator) :
      owner_(iterator), iterator_(iterator.As<IteratorObject>()) {}
  bool Next(Value& out) override {
    if (!iterator_->iter) return false;
    return iterator_->iter->Next(out);
  }
  void Traverse(const Visitor& visit) const override { visit(owner_); }
};

class VectorIter : public Iter {
  std::vector<Value> items_;
  size_t pos_ = 0;
 public:
  explicit VectorIter(std::vector<Value> items) : items_(std::move(items)) {}
  bool Next(Value& out) override {
    if (pos_ >= items_.size()) return false;
    out = std::move(items_[pos_++]);
    return true;
  }
  void Traverse(const Visitor& visit) const override {
    for (size_t i = pos_; i < items_.size(); i++) visit(items_[i]);
  }
};

class DepthGuard {
  int& depth_;
 public:
  explicit DepthGuard(int& depth) : depth_(depth) { depth_++; }
  ~DepthGuard() { depth_--; }
};

class HandlingGuard {
  std::vector<ScriptError>& stack_;
 public:
  HandlingGuard(std::vector<ScriptError>& stack, const ScriptError& err) : stack_(stack) {
    stack_.push_back(err);
  }
  ~HandlingGuard() { stack_.pop_back(); }
};

std::string JoinNames(const std::vector<std::string>& names) {
  std::string ret;
  for (size_t i = 0; i < names.size(); i++) {
    if (i) ret += names.size() == 2 ? " and " : i + 1 == names.size() ? ", and " : ", ";
    ret += "'" + names[i] + "'";
  }
  return ret;
}

} // namespace

bool IsIterable(const Value& v) {
  if (v.IsStr()) return true;
  if (!v.IsObject()) return false;
  switch (v.AsObject()->kind) {
    case ObjectKind::LIST:
    case ObjectKind::TUPLE:
    case ObjectKind::DICT:
    case ObjectKind::SET:
    case ObjectKind::RANGE:
    case ObjectKind::DICT_VIEW:
    case ObjectKind::ITERATOR:
      return true;
    default:
      return false;
  }
}

FunctionObject::FunctionObject(const FunctionDef* def, Scope* closure) :
    Object(ObjectKind::FUNCTION), closure_(Value::Obj(closure)), def(def) {}

Scope* FunctionObject::closure() const {
  return closure_.As<Scope>();
}

void FunctionObject::Traverse(const Visitor& visit) const {
  visit(closure_);
  for (auto& value : defaults) {
    if (value) visit(*value);
  }
}

void FunctionObject::Clear() {
  closure_ = Value();
  defaults.clear();
}

class FrameGuard {
  Interpreter& interp_;
 public:
  FrameGuard(Interpreter& interp, const std::string& function, int line) : interp_(interp) {
    interp_.frames_.push_back({function, line});
    interp_.call_depth_++;
  }
  ~FrameGuard() {
    interp_.frames_.pop_back();
    interp_.call_depth_--;
  }
};

Interpreter::Interpreter(Heap& heap, const RestrictedEnvironment& env, OutputChannels& channels,
                         const ExecutionLimits& limits) :
    heap_(heap), env_(env), channels_(channels), limits_(limits),
    has_deadline_(limits.time_limit > 0), steps_(0), call_depth_(0), eval_depth_(0),
    module_scope_(nullptr) {
  deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(limits.time_limit);
}

Interpreter::~Interpreter() = default;

void Interpreter::Run(const Module& module) {
  module_ref_ = NewScope(ScopeKind::MODULE, nullptr, nullptr);
  module_scope_ = module_ref_.As<Scope>();
  frames_.push_back({"<module>", 1});
  ExecBlock(module.body, module_scope_);
}

// --- limits & output ---

void Interpreter::Tick() {
  if (++steps_ % kDeadlineCheckInterval == 0) CheckDeadline();
}

void Interpreter::CheckDeadline() {
  if (has_deadline_ && std::chrono::steady_clock::now() >= deadline_) {
    RaiseLimit(ExcType::TIMEOUT_ERROR,
               fmt::format("execution exceeded the time limit of {} ms", limits_.time_limit));
  }
}

void Interpreter::CheckLength(size_t length) {
  if (limits_.max_sequence && length > limits_.max_sequence) {
    RaiseLimit(ExcType::MEMORY_ERROR, "sequence length limit exceeded");
  }
}

void Interpreter::CheckRepeat(size_t length, int64_t times) {
  if (times > 0 && limits_.max_sequence &&
      (unsigned __int128)length * (uint64_t)times > limits_.max_sequence) {
    RaiseLimit(ExcType::MEMORY_ERROR, "sequence length limit exceeded");
  }
}

void Interpreter::CheckIntSize(size_t bits) {
  if (bits > kMaxIntBits) RaiseLimit(ExcType::MEMORY_ERROR, "memory limit exceeded");
  if (limits_.max_memory) heap_.Reserve(bits / 8);
}

void Interpreter::RaiseLimit(ExcType type, const std::string& message) {
  ScriptError err(type, message);
  err.fatal = true;
  throw err;
}

void Interpreter::WriteOut(std::string_view text) {
  if (!channels_.out.Append(text)) RaiseLimit(ExcType::RUNTIME_ERROR, "output limit exceeded");
}

void Interpreter::WriteErr(std::string_view text) {
  if (!channels_.err.Append(text)) RaiseLimit(ExcType::RUNTIME_ERROR, "output limit exceeded");
}

// --- object helpers ---

Value Interpreter::NewList(std::vector<Value> items) {
  CheckLength(items.size());
  return Value::Obj(heap_.Make<ListObject>(std::move(items)));
}

Value Interpreter::NewTuple(std::vector<Value> items) {
  CheckLength(items.size());
  return Value::Obj(heap_.Make<TupleObject>(std::move(items)));
}

Value Interpreter::NewIterator(std::unique_ptr<Iter> iter, std::string type_name) {
  return Value::Obj(heap_.Make<IteratorObject>(std::move(iter), std::move(type_name)));
}

void Interpreter::Raise(ExcType type, std::vector<Value> args) {
  Value obj = Value::Obj(heap_.Make<ExceptionObject>(type, std::move(args)));
  ScriptError err(type, ExceptionStr(obj.As<ExceptionObject>()));
  err.value.Reset(obj.As<ExceptionObject>());
  throw err;
}

void Interpreter::RaiseKeyError(const Value& key) {
  Raise(ExcType::KEY_ERROR, {key});
}

ExceptionObject* Interpreter::Materialize(ScriptError& err) {
  if (!err.value.get()) {
    std::vector<Value> args;
    if (!err.message.empty()) args.push_back(Value::Str(err.message));
    err.value.Reset(heap_.Make<ExceptionObject>(err.type, std::move(args)));
  }
  return err.value.get();
}

std::unique_ptr<Iter> Interpreter::GetIter(const Value& v) {
  if (v.IsStr()) return std::make_unique<StrIter>(v.AsStr());
  if (v.IsObject()) {
    Object* obj = v.AsObject();
    switch (obj->kind) {
      case ObjectKind::LIST:
        return std::make_unique<ListIter>(v);
      case ObjectKind::TUPLE:
        return std::make_unique<TupleIter>(v);
      case ObjectKind::DICT:
        return std::make_unique<TableIter>(*this, v, static_cast<DictObject*>(obj)->table,
                                           ViewKind::KEYS, "dictionary");
      case ObjectKind::SET:
        return std::make_unique<TableIter>(*this, v, static_cast<SetObject*>(obj)->table,
                                           ViewKind::KEYS, "Set");
      case ObjectKind::RANGE:
        return std::make_unique<RangeIter>(static_cast<RangeObject*>(obj));
      case ObjectKind::DICT_VIEW: {
        auto view = static_cast<DictViewObject*>(obj);
        return std::make_unique<TableIter>(*this, v, view->dict->table, view->view, "dictionary");
      }
      case ObjectKind::ITERATOR:
        return std::make_unique<ProxyIter>(v);
      default:
        break;
    }
  }
  throw ScriptError(ExcType::TYPE_ERROR, fmt::format("'{}' object is not iterable", TypeName(v)));
}

std::vector<Value> Interpreter::Collect(const Value& iterable) {
  if (iterable.Is(ObjectKind::LIST)) return iterable.As<ListObject>()->items;
  if (iterable.Is(ObjectKind::TUPLE)) return iterable.As<TupleObject>()->items;
  std::vector<Value> ret;
  auto iter = GetIter(iterable);
  Value item;
  while (iter->Next(item)) {
    Tick();
    ret.push_back(std::move(item));
    CheckLength(ret.size());
  }
  return ret;
}

// --- calls ---

Value Interpreter::Call(const Value& callee, std::vector<Value> args) {
  CallArgs call_args;
  call_args.args = std::move(args);
  return Call(callee, std::move(call_args));
}

Value Interpreter::Call(const Value& callee, CallArgs args) {
  Tick();
  if (callee.IsObject()) {
    Object* obj = callee.AsObject();
    switch (obj->kind) {
      case ObjectKind::FUNCTION:
        return CallFunction(static_cast<FunctionObject*>(obj), args);
      case ObjectKind::BUILTIN: {
        auto builtin = static_cast<BuiltinObject*>(obj);
        if (builtin->fn) return builtin->fn(*this, args);
        if (args.args.empty()) {
          throw ScriptError(ExcType::TYPE_ERROR,
              fmt::format("unbound method {}() needs an argument", builtin->name));
        }
        Value self = args.args.front();
        if (!builtin->instance_type.empty() && TypeName(self) != builtin->instance_type) {
          throw ScriptError(ExcType::TYPE_ERROR,
              fmt::format("descriptor '{}' for '{}' objects doesn't apply to a '{}' object",
                          builtin->name.substr(builtin->name.rfind('.') + 1),
                          builtin->instance_type, TypeName(self)));
        }
        args.args.erase(args.args.begin());
        return builtin->method(*this, self, args);
      }
      case ObjectKind::BOUND_METHOD: {
        auto method = static_cast<BoundMethodObject*>(obj);
        return method->fn(*this, method->self, args);
      }
      case ObjectKind::EXCEPTION_TYPE: {
        ExcType type = static_cast<ExceptionTypeObject*>(obj)->type;
        if (!args.kwargs.empty()) {
          throw ScriptError(ExcType::TYPE_ERROR,
              fmt::format("{}() takes no keyword arguments", ExcTypeName(type)));
        }
        return Value::Obj(heap_.Make<ExceptionObject>(type, std::move(args.args)));
      }
      default:
        break;
    }
  }
  throw ScriptError(ExcType::TYPE_ERROR, fmt::format("'{}' object is not callable", TypeName(callee)));
}

Value Interpreter::CallFunction(FunctionObject* fn, CallArgs& args) {
  const FunctionDef& def = *fn->def;
  if (call_depth_ >= limits_.max_depth) {
    throw ScriptError(ExcType::RECURSION_ERROR, "maximum recursion depth exceeded");
  }
  Value scope = NewScope(ScopeKind::FUNCTION, fn->closure(), &def);
  BindArguments(fn, args, scope.As<Scope>());
  FrameGuard frame(*this, def.name, def.line);
  Flow flow = ExecBlock(def.body, scope.As<Scope>());
  if (flow != Flow::RETURN) return Value();
  Value ret = std::move(return_value_);
  return_value_ = Value();
  return ret;
}

void Interpreter::BindArguments(FunctionObject* fn, CallArgs& args, Scope* scope) {
  const FunctionDef& def = *fn->def;
  auto& vars = scope->vars;
  size_t positional = 0, with_default = 0;
  const Param* var_positional = nullptr;
  const Param* var_keyword = nullptr;
  for (size_t i = 0; i < def.params.size(); i++) {
    auto& param = def.params[i];
    if (param.kind == ParamKind::POSITIONAL) {
      positional++;
      if (fn->defaults[i]) with_default++;
    } else if (param.kind == ParamKind::VAR_POSITIONAL) {
      var_positional = &param;
    } else if (param.kind == ParamKind::VAR_KEYWORD) {
      var_keyword = &param;
    }
  }
  size_t given = args.args.size();
  for (size_t i = 0; i < positional && i < given; i++) vars[def.params[i].name] = args.args[i];
  if (given > positional) {
    if (!var_positional) {
      std::string expected = with_default ?
          fmt::format("from {} to {}", positional - with_default, positional) :
          std::to_string(positional);
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("{}() takes {} positional argument{} but {} {} given", def.name, expected,
                      positional == 1 && !with_default ? "" : "s", given, given == 1 ? "was" : "were"));
    }
    vars[var_positional->name] = NewTuple(std::vector<Value>(args.args.begin() + positional, args.args.end()));
  } else if (var_positional) {
    vars[var_positional->name] = NewTuple();
  }
  Value extra_ref;
  DictObject* extra = nullptr;
  if (var_keyword) {
    extra_ref = Value::Obj(heap_.Make<DictObject>());
    extra = extra_ref.As<DictObject>();
  }
  for (auto& [name, value] : args.kwargs) {
    const Param* target = nullptr;
    for (auto& param : def.params) {
      if ((param.kind == ParamKind::POSITIONAL || param.kind == ParamKind::KEYWORD_ONLY) &&
          param.name == name) {
        target = &param;
        break;
      }
    }
    if (target) {
      if (vars.count(name)) {
        throw ScriptError(ExcType::TYPE_ERROR,
            fmt::format("{}() got multiple values for argument '{}'", def.name, name));
      }
      vars[name] = value;
    } else if (extra) {
      extra->table.Set(Value::Str(name), value);
    } else {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("{}() got an unexpected keyword argument '{}'", def.name, name));
    }
  }
  if (extra) {
    heap_.Track(extra);
    vars[var_keyword->name] = std::move(extra_ref);
  }
  std::vector<std::string> missing_positional, missing_keyword;
  for (size_t i = 0; i < def.params.size(); i++) {
    auto& param = def.params[i];
    if (param.kind != ParamKind::POSITIONAL && param.kind != ParamKind::KEYWORD_ONLY) continue;
    if (vars.count(param.name)) continue;
    if (fn->defaults[i]) {
      vars[param.name] = *fn->defaults[i];
    } else if (param.kind == ParamKind::POSITIONAL) {
      missing_positional.push_back(param.name);
    } else {
      missing_keyword.push_back(param.name);
    }
  }
  auto missing = [&](const std::vector<std::string>& names, const char* what) {
    throw ScriptError(ExcType::TYPE_ERROR,
        fmt::format("{}() missing {} required {} argument{}: {}", def.name, names.size(), what,
                    names.size() == 1 ? "" : "s", JoinNames(names)));
  };
  if (!missing_positional.empty()) missing(missing_positional, "positional");
  if (!missing_keyword.empty()) missing(missing_keyword, "keyword-only");
}

Value Interpreter::MakeFunction(const FunctionDef& def, Scope* scope) {
  Value ret = Value::Obj(heap_.Make<FunctionObject>(&def, scope));
  auto fn = ret.As<FunctionObject>();
  fn->defaults.resize(def.params.size());
  for (size_t i = 0; i < def.params.size(); i++) {
    if (def.params[i].default_value) fn->defaults[i] = Eval(*def.params[i].default_value, scope);
  }
  return ret;
}

Value Interpreter::NewScope(ScopeKind kind, Scope* parent, const FunctionDef* def) {
  return Value::Obj(heap_.Make<Scope>(kind, parent, def));
}

// --- names ---

Value Interpreter::LoadGlobal(const std::string& name) {
  if (Value* v = module_scope_->Find(name)) return *v;
  if (const Value* v = env_.Lookup(name)) return *v;
  throw ScriptError(ExcType::NAME_ERROR, fmt::format("name '{}' is not defined", name));
}

Value Interpreter::LoadName(const std::string& name, Scope* scope) {
  Scope* s = scope;
  while (s->scope_kind == ScopeKind::COMPREHENSION) {
    if (Value* v = s->Find(name)) return *v;
    s = s->parent;
  }
  if (s->scope_kind == ScopeKind::MODULE) return LoadGlobal(name);
  const FunctionDef* def = s->def;
  if (def->globals.count(name)) return LoadGlobal(name);
  if (def->locals.count(name)) {
    if (Value* v = s->Find(name)) return *v;
    throw ScriptError(ExcType::UNBOUND_LOCAL_ERROR,
        fmt::format("cannot access local variable '{}' where it is not associated with a value", name));
  }
  for (Scope* p = s->parent; p && p->scope_kind != ScopeKind::MODULE; p = p->parent) {
    if (p->scope_kind == ScopeKind::COMPREHENSION) {
      if (Value* v = p->Find(name)) return *v;
      continue;
    }
    if (p->def->globals.count(name)) break;
    if (p->def->locals.count(name)) {
      if (Value* v = p->Find(name)) return *v;
      throw ScriptError(ExcType::NAME_ERROR,
          fmt::format("cannot access free variable '{}' where it is not associated with a value "
                      "in enclosing scope", name));
    }
  }
  return LoadGlobal(name);
}

Scope* Interpreter::FindNonlocal(const std::string& name, Scope* scope) {
  for (Scope* p = scope->parent; p && p->scope_kind != ScopeKind::MODULE; p = p->parent) {
    if (p->scope_kind == ScopeKind::FUNCTION && p->def->locals.count(name)) return p;
  }
  throw ScriptError(ExcType::SYNTAX_ERROR, fmt::format("no binding for nonlocal '{}' found", name));
}

void Interpreter::StoreName(const std::string& name, Value value, Scope* scope) {
  if (scope->scope_kind == ScopeKind::FUNCTION) {
    if (scope->def->globals.count(name)) {
      module_scope_->vars[name] = std::move(value);
      return;
    }
    if (scope->def->nonlocals.count(name)) {
      FindNonlocal(name, scope)->vars[name] = std::move(value);
      return;
    }
  }
  scope->vars[name] = std::move(value);
}

void Interpreter::StoreNamed(const std::string& name, Value value, Scope* scope) {
  while (scope->scope_kind == ScopeKind::COMPREHENSION) scope = scope->parent;
  StoreName(name, std::move(value), scope);
}

void Interpreter::DeleteName(const std::string& name, Scope* scope) {
  Scope* target = scope;
  if (scope->scope_kind == ScopeKind::FUNCTION) {
    if (scope->def->globals.count(name)) {
      target = module_scope_;
    } else if (scope->def->nonlocals.count(name)) {
      target = FindNonlocal(name, scope);
    }
  }
  if (!target->vars.erase(name)) {
    throw ScriptError(ExcType::NAME_ERROR, fmt::format("name '{}' is not defined", name));
  }
}

void Interpreter::AssignTarget(const Expr& target, Value value, Scope* scope) {
  switch (target.kind) {
    case ExprKind::NAME:
      StoreName(static_cast<const NameExpr&>(target).id, std::move(value), scope);
      return;
    case ExprKind::ATTRIBUTE: {
      auto& attr = static_cast<const AttributeExpr&>(target);
      SetAttr(Eval(*attr.value, scope), attr.attr);
    }
    case ExprKind::SUBSCRIPT: {
      auto& sub = static_cast<const SubscriptExpr&>(target);
      Value obj = Eval(*sub.value, scope);
      if (sub.index->kind == ExprKind::SLICE) {
        SetSlice(obj, EvalSlice(static_cast<const SliceExpr&>(*sub.index), scope), value);
      } else {
        SetItem(obj, Eval(*sub.index, scope), std::move(value));
      }
      return;
    }
    case ExprKind::TUPLE:
    case ExprKind::LIST: {
      auto& elts = static_cast<const SequenceExpr&>(target).elts;
      if (!IsIterable(value)) {
        throw ScriptError(ExcType::TYPE_ERROR,
            fmt::format("cannot unpack non-iterable {} object", TypeName(value)));
      }
      std::vector<Value> items = Collect(value);
      size_t star = elts.size();
      for (size_t i = 0; i < elts.size(); i++) {
        if (elts[i]->kind == ExprKind::STARRED) star = i;
      }
      if (star == elts.size()) {
        if (items.size() > elts.size()) {
          throw ScriptError(ExcType::VALUE_ERROR,
              fmt::format("too many values to unpack (expected {})", elts.size()));
        }
        if (items.size() < elts.size()) {
          throw ScriptError(ExcType::VALUE_ERROR,
              fmt::format("not enough values to unpack (expected {}, got {})", elts.size(), items.size()));
        }
        for (size_t i = 0; i < elts.size(); i++) AssignTarget(*elts[i], std::move(items[i]), scope);
        return;
      }
      size_t after = elts.size() - star - 1;
      if (items.size() < star + after) {
        throw ScriptError(ExcType::VALUE_ERROR,
            fmt::format("not enough values to unpack (expected at least {}, got {})",
                        star + after, items.size()));
      }
      for (size_t i = 0; i < star; i++) AssignTarget(*elts[i], items[i], scope);
      std::vector<Value> middle(items.begin() + star, items.end() - after);
      AssignTarget(*static_cast<const StarredExpr&>(*elts[star]).value, NewList(std::move(middle)), scope);
      for (size_t i = 0; i < after; i++) {
        AssignTarget(*elts[star + 1 + i], items[items.size() - after + i], scope);
      }
      return;
    }
    default:
      throw ScriptError(ExcType::SYNTAX_ERROR, "cannot assign to expression");
  }
}

// --- statements ---

Flow Interpreter::ExecBlock(const StmtList& body, Scope* scope) {
  for (auto& stmt : body) {
    Flow flow = Exec(*stmt, scope);
    if (flow != Flow::NORMAL) return flow;
  }
  return Flow::NORMAL;
}

Flow Interpreter::Exec(const Stmt& stmt, Scope* scope) {
  frames_.back().line = stmt.line;
  try {
    Tick();
    return ExecStatement(stmt, scope);
  } catch (ScriptError& err) {
    if (!err.traceback_set) {
      err.traceback = frames_;
      err.traceback_set = true;
    }
    throw;
  }
}

Flow Interpreter::ExecStatement(const Stmt& stmt, Scope* scope) {
  switch (stmt.kind) {
    case StmtKind::EXPR:
      Eval(*static_cast<const ExprStmt&>(stmt).value, scope);
      return Flow::NORMAL;
    case StmtKind::ASSIGN: {
      auto& s = static_cast<const AssignStmt&>(stmt);
      Value value = Eval(*s.value, scope);
      for (auto& target : s.targets) AssignTarget(*target, value, scope);
      return Flow::NORMAL;
    }
    case StmtKind::AUG_ASSIGN:
      ExecAugAssign(static_cast<const AugAssignStmt&>(stmt), scope);
      return Flow::NORMAL;
    case StmtKind::IF: {
      auto& s = static_cast<const ConditionalStmt&>(stmt);
      if (Truthy(Eval(*s.test, scope))) return ExecBlock(s.body, scope);
      return ExecBlock(s.orelse, scope);
    }
    case StmtKind::WHILE:
      return ExecWhile(static_cast<const ConditionalStmt&>(stmt), scope);
    case StmtKind::FOR:
      return ExecFor(static_cast<const ForStmt&>(stmt), scope);
    case StmtKind::BREAK:
      return Flow::BREAK;
    case StmtKind::CONTINUE:
      return Flow::CONTINUE;
    case StmtKind::PASS:
      return Flow::NORMAL;
    case StmtKind::FUNCTION_DEF:
      ExecFunctionDef(static_cast<const FunctionDefStmt&>(stmt), scope);
      return Flow::NORMAL;
    case StmtKind::CLASS_DEF:
      throw ScriptError(ExcType::NAME_ERROR, "__build_class__ not found");
    case StmtKind::RETURN: {
      auto& s = static_cast<const ReturnStmt&>(stmt);
      return_value_ = s.value ? Eval(*s.value, scope) : Value();
      return Flow::RETURN;
    }
    case StmtKind::GLOBAL:
      return Flow::NORMAL;
    case StmtKind::NONLOCAL:
      for (auto& name : static_cast<const NamesStmt&>(stmt).names) FindNonlocal(name, scope);
      return Flow::NORMAL;
    case StmtKind::TRY:
      return ExecTry(static_cast<const TryStmt&>(stmt), scope);
    case StmtKind::RAISE:
      ExecRaise(static_cast<const RaiseStmt&>(stmt), scope);
      return Flow::NORMAL;
    case StmtKind::ASSERT: {
      auto& s = static_cast<const AssertStmt&>(stmt);
      if (!Truthy(Eval(*s.test, scope))) {
        std::vector<Value> args;
        if (s.msg) args.push_back(Eval(*s.msg, scope));
        Raise(ExcType::ASSERTION_ERROR, std::move(args));
      }
      return Flow::NORMAL;
    }
    case StmtKind::DELETE:
      for (auto& target : static_cast<const DeleteStmt&>(stmt).targets) ExecDelete(*target, scope);
      return Flow::NORMAL;
    case StmtKind::IMPORT:
    case StmtKind::IMPORT_FROM:
      ExecImport(static_cast<const ImportStmt&>(stmt), scope);
      return Flow::NORMAL;
  }
  __builtin_unreachable();
}

Flow Interpreter::ExecWhile(const ConditionalStmt& stmt, Scope* scope) {
  while (true) {
    Tick();
    if (!Truthy(Eval(*stmt.test, scope))) break;
    Flow flow = ExecBlock(stmt.body, scope);
    if (flow == Flow::BREAK) return Flow::NORMAL;
    if (flow == Flow::RETURN) return flow;
  }
  return ExecBlock(stmt.orelse, scope);
}

Flow Interpreter::ExecFor(const ForStmt& stmt, Scope* scope) {
  auto iter = GetIter(Eval(*stmt.iter, scope));
  Value item;
  while (iter->Next(item)) {
    Tick();
    AssignTarget(*stmt.target, std::move(item), scope);
    Flow flow = ExecBlock(stmt.body, scope);
    if (flow == Flow::BREAK) return Flow::NORMAL;
    if (flow == Flow::RETURN) return flow;
  }
  return ExecBlock(stmt.orelse, scope);
}

bool Interpreter::HandlerMatches(const Value& handler_type, ExcType type) {
  if (handler_type.Is(ObjectKind::EXCEPTION_TYPE)) {
    return IsSubtype(type, handler_type.As<ExceptionTypeObject>()->type);
  }
  if (handler_type.Is(ObjectKind::TUPLE)) {
    for (auto& item : handler_type.As<TupleObject>()->items) {
      if (HandlerMatches(item, type)) return true;
    }
    return false;
  }
  throw ScriptError(ExcType::TYPE_ERROR,
      "catching classes that do not inherit from BaseException is not allowed");
}

Flow Interpreter::ExecTry(const TryStmt& stmt, Scope* scope) {
  Flow flow = Flow::NORMAL;
  try {
    bool handled = false;
    try {
      flow = ExecBlock(stmt.body, scope);
    } catch (ScriptError& err) {
      if (err.fatal) throw;
      const ExceptHandler* match = nullptr;
      for (auto& handler : stmt.handlers) {
        if (!handler.type || HandlerMatches(Eval(*handler.type, scope), err.type)) {
          match = &handler;
          break;
        }
      }
      if (!match) throw;
      handled = true;
      if (!match->name.empty()) StoreName(match->name, Value::Obj(Materialize(err)), scope);
      HandlingGuard guard(handling_, err);
      flow = ExecBlock(match->body, scope);
      if (!match->name.empty()) {
        Scope* target = scope;
        if (scope->scope_kind == ScopeKind::FUNCTION && scope->def->globals.count(match->name)) {
          target = module_scope_;
        }
        target->vars.erase(match->name);
      }
    }
    if (!handled && flow == Flow::NORMAL) flow = ExecBlock(stmt.orelse, scope);
  } catch (ScriptError& err) {
    if (stmt.finalbody.empty()) throw;
    Flow final_flow = ExecBlock(stmt.finalbody, scope);
    // return/break/continue in finally discards the exception
    if (final_flow != Flow::NORMAL && !err.fatal) return final_flow;
    throw;
  }
  if (!stmt.finalbody.empty()) {
    Value saved = return_value_;
    Flow final_flow = ExecBlock(stmt.finalbody, scope);
    if (final_flow != Flow::NORMAL) return final_flow;
    return_value_ = std::move(saved);
  }
  return flow;
}

void Interpreter::ExecFunctionDef(const FunctionDefStmt& stmt, Scope* scope) {
  std::vector<Value> decorators;
  for (auto& decorator : stmt.decorators) decorators.push_back(Eval(*decorator, scope));
  Value fn = MakeFunction(*stmt.def, scope);
  for (auto it = decorators.rbegin(); it != decorators.rend(); ++it) fn = Call(*it, {fn});
  StoreName(stmt.def->name, std::move(fn), scope);
}

Value Interpreter::InplaceOperation(BinaryOp op, const Value& a, const Value& b) {
  if (a.Is(ObjectKind::LIST)) {
    auto& items = a.As<ListObject>()->items;
    if (op == BinaryOp::ADD) {
      std::vector<Value> extra = Collect(b);
      CheckLength(items.size() + extra.size());
      items.insert(items.end(), extra.begin(), extra.end());
      heap_.Track(a.AsObject());
      return a;
    }
    if (op == BinaryOp::MUL && b.IsIntLike()) {
      int64_t times = b.AsInt();
      if (times <= 0 || items.empty()) {
        items.clear();
        return a;
      }
      CheckRepeat(items.size(), times);
      heap_.Reserve((size_t)times * items.size() * sizeof(Value));
      std::vector<Value> copy = items;
      for (int64_t i = 1; i < times; i++) items.insert(items.end(), copy.begin(), copy.end());
      heap_.Track(a.AsObject());
      return a;
    }
  }
  if (a.Is(ObjectKind::SET) && b.Is(ObjectKind::SET)) {
    auto& table = a.As<SetObject>()->table;
    auto& other = b.As<SetObject>()->table;
    switch (op) {
      case BinaryOp::BIT_OR:
        for (auto& entry : std::vector<std::pair<Value, Value>>(other.Entries())) table.Set(entry.first, Value());
        heap_.Track(a.AsObject());
        return a;
      case BinaryOp::SUB:
        for (auto& entry : std::vector<std::pair<Value, Value>>(other.Entries())) table.Erase(entry.first);
        return a;
      case BinaryOp::BIT_AND:
      case BinaryOp::BIT_XOR: {
        Value result = BinaryOperation(op, a, b);
        table = result.As<SetObject>()->table;
        heap_.Track(a.AsObject());
        return a;
      }
      default:
        break;
    }
  }
  if (a.Is(ObjectKind::DICT) && b.Is(ObjectKind::DICT) && op == BinaryOp::BIT_OR) {
    auto& table = a.As<DictObject>()->table;
    for (auto& [key, value] : std::vector<std::pair<Value, Value>>(b.As<DictObject>()->table.Entries())) {
      table.Set(key, value);
    }
    heap_.Track(a.AsObject());
    return a;
  }
  return BinaryOperation(op, a, b);
}

void Interpreter::ExecAugAssign(const AugAssignStmt& stmt, Scope* scope) {
  switch (stmt.target->kind) {
    case ExprKind::NAME: {
      auto& name = static_cast<const NameExpr&>(*stmt.target).id;
      Value current = LoadName(name, scope);
      Value rhs = Eval(*stmt.value, scope);
      StoreName(name, InplaceOperation(stmt.op, current, rhs), scope);
      return;
    }
    case ExprKind::SUBSCRIPT: {
      auto& sub = static_cast<const SubscriptExpr&>(*stmt.target);
      Value obj = Eval(*sub.value, scope);
      if (sub.index->kind == ExprKind::SLICE) {
        SliceBounds bounds = EvalSlice(static_cast<const SliceExpr&>(*sub.index), scope);
        Value current = GetSlice(obj, bounds);
        Value rhs = Eval(*stmt.value, scope);
        SetSlice(obj, bounds, InplaceOperation(stmt.op, current, rhs));
        return;
      }
      Value index = Eval(*sub.index, scope);
      Value current = GetItem(obj, index);
      Value rhs = Eval(*stmt.value, scope);
      SetItem(obj, index, InplaceOperation(stmt.op, current, rhs));
      return;
    }
    case ExprKind::ATTRIBUTE: {
      auto& attr = static_cast<const AttributeExpr&>(*stmt.target);
      Value obj = Eval(*attr.value, scope);
      GetAttr(obj, attr.attr);
      SetAttr(obj, attr.attr);
    }
    default:
      throw ScriptError(ExcType::SYNTAX_ERROR, "illegal expression for augmented assignment");
  }
}

void Interpreter::ExecRaise(const RaiseStmt& stmt, Scope* scope) {
  if (!stmt.exc) {
    if (handling_.empty()) throw ScriptError(ExcType::RUNTIME_ERROR, "No active exception to reraise");
    throw handling_.back();
  }
  Value exc = Eval(*stmt.exc, scope);
  if (stmt.cause) {
    Value cause = Eval(*stmt.cause, scope);
    if (!cause.IsNone() && !cause.Is(ObjectKind::EXCEPTION) && !cause.Is(ObjectKind::EXCEPTION_TYPE)) {
      throw ScriptError(ExcType::TYPE_ERROR, "exception causes must derive from BaseException");
    }
  }
  if (exc.Is(ObjectKind::EXCEPTION_TYPE)) {
    exc = Value::Obj(heap_.Make<ExceptionObject>(exc.As<ExceptionTypeObject>()->type, std::vector<Value>()));
  } else if (!exc.Is(ObjectKind::EXCEPTION)) {
    throw ScriptError(ExcType::TYPE_ERROR, "exceptions must derive from BaseException");
  }
  auto obj = exc.As<ExceptionObject>();
  ScriptError err(obj->type, ExceptionStr(obj));
  err.value.Reset(obj);
  throw err;
}

void Interpreter::ExecDelete(const Expr& target, Scope* scope) {
  switch (target.kind) {
    case ExprKind::NAME:
      DeleteName(static_cast<const NameExpr&>(target).id, scope);
      return;
    case ExprKind::SUBSCRIPT: {
      auto& sub = static_cast<const SubscriptExpr&>(target);
      Value obj = Eval(*sub.value, scope);
      if (sub.index->kind == ExprKind::SLICE) {
        DelSlice(obj, EvalSlice(static_cast<const SliceExpr&>(*sub.index), scope));
      } else {
        DelItem(obj, Eval(*sub.index, scope));
      }
      return;
    }
    case ExprKind::ATTRIBUTE: {
      auto& attr = static_cast<const AttributeExpr&>(target);
      SetAttr(Eval(*attr.value, scope), attr.attr);
    }
    case ExprKind::TUPLE:
    case ExprKind::LIST:
      for (auto& elt : static_cast<const SequenceExpr&>(target).elts) ExecDelete(*elt, scope);
      return;
    default:
      throw ScriptError(ExcType::SYNTAX_ERROR, "cannot delete expression");
  }
}

void Interpreter::ExecImport(const ImportStmt& stmt, Scope* scope) {
  if (stmt.kind == StmtKind::IMPORT) {
    for (auto& alias : stmt.names) {
      ModuleObject* module = env_.Module(alias.name);
      if (!module) {
        throw ScriptError(ExcType::IMPORT_ERROR, fmt::format("import of '{}' is not allowed", alias.name));
      }
      StoreName(alias.asname.empty() ? alias.name : alias.asname, Value::Obj(module), scope);
    }
    return;
  }
  ModuleObject* module = env_.Module(stmt.module);
  if (!module) {
    throw ScriptError(ExcType::IMPORT_ERROR, fmt::format("import of '{}' is not allowed", stmt.module));
  }
  for (auto& alias : stmt.names) {
    if (alias.name == "*") {
      for (auto& [name, value] : module->members) StoreName(name, value, scope);
      continue;
    }
    const Value* member = alias.name[0] == '_' ? nullptr : module->Find(alias.name);
    if (!member) {
      throw ScriptError(ExcType::IMPORT_ERROR,
          fmt::format("cannot import name '{}' from '{}'", alias.name, stmt.module));
    }
    StoreName(alias.asname.empty() ? alias.name : alias.asname, *member, scope);
  }
}

// --- expressions ---

Value Interpreter::Eval(const Expr& expr, Scope* scope) {
  DepthGuard guard(eval_depth_);
  if (eval_depth_ > kMaxEvalDepth) {
    throw ScriptError(ExcType::RECURSION_ERROR, "maximum recursion depth exceeded");
  }
  return EvalExpr(expr, scope);
}

Value Interpreter::EvalExpr(const Expr& expr, Scope* scope) {
  switch (expr.kind) {
    case ExprKind::CONSTANT:
      return static_cast<const ConstantExpr&>(expr).value;
    case ExprKind::NAME:
      return LoadName(static_cast<const NameExpr&>(expr).id, scope);
    case ExprKind::FSTRING:
      return EvalFString(static_cast<const FStringExpr&>(expr), scope);
    case ExprKind::BINARY: {
      auto& e = static_cast<const BinaryExpr&>(expr);
      Value left = Eval(*e.left, scope);
      Value right = Eval(*e.right, scope);
      return BinaryOperation(e.op, left, right);
    }
    case ExprKind::UNARY: {
      auto& e = static_cast<const UnaryExpr&>(expr);
      return UnaryOperation(e.op, Eval(*e.operand, scope));
    }
    case ExprKind::BOOL_OP: {
      auto& e = static_cast<const BoolOpExpr&>(expr);
      Value v;
      for (auto& operand : e.values) {
        v = Eval(*operand, scope);
        if (Truthy(v) != e.is_and) return v;
      }
      return v;
    }
    case ExprKind::COMPARE: {
      auto& e = static_cast<const CompareExpr&>(expr);
      Value left = Eval(*e.left, scope);
      for (size_t i = 0; i < e.ops.size(); i++) {
        Value right = Eval(*e.comparators[i], scope);
        if (!Compare(e.ops[i], left, right)) return Value::Bool(false);
        left = std::move(right);
      }
      return Value::Bool(true);
    }
    case ExprKind::IF_EXP: {
      auto& e = static_cast<const IfExpExpr&>(expr);
      return Truthy(Eval(*e.test, scope)) ? Eval(*e.body, scope) : Eval(*e.orelse, scope);
    }
    case ExprKind::LAMBDA:
      return MakeFunction(*static_cast<const LambdaExpr&>(expr).def, scope);
    case ExprKind::CALL:
      return EvalCall(static_cast<const CallExpr&>(expr), scope);
    case ExprKind::ATTRIBUTE: {
      auto& e = static_cast<const AttributeExpr&>(expr);
      return GetAttr(Eval(*e.value, scope), e.attr);
    }
    case ExprKind::SUBSCRIPT:
      return EvalSubscript(static_cast<const SubscriptExpr&>(expr), scope);
    case ExprKind::SLICE:
      throw ScriptError(ExcType::TYPE_ERROR, "slices are only supported as subscripts");
    case ExprKind::LIST:
      return NewList(EvalElements(static_cast<const SequenceExpr&>(expr).elts, scope));
    case ExprKind::TUPLE:
      return NewTuple(EvalElements(static_cast<const SequenceExpr&>(expr).elts, scope));
    case ExprKind::SET: {
      std::vector<Value> items = EvalElements(static_cast<const SequenceExpr&>(expr).elts, scope);
      Value ret = Value::Obj(heap_.Make<SetObject>());
      auto set = ret.As<SetObject>();
      for (auto& item : items) set->table.Set(item, Value());
      heap_.Track(set);
      return ret;
    }
    case ExprKind::DICT: {
      auto& e = static_cast<const DictExpr&>(expr);
      Value ret = Value::Obj(heap_.Make<DictObject>());
      auto dict = ret.As<DictObject>();
      for (size_t i = 0; i < e.keys.size(); i++) {
        if (!e.keys[i]) {
          Value other = Eval(*e.values[i], scope);
          if (!other.Is(ObjectKind::DICT)) {
            throw ScriptError(ExcType::TYPE_ERROR,
                fmt::format("'{}' object is not a mapping", TypeName(other)));
          }
          for (auto& [key, value] : other.As<DictObject>()->table.Entries()) dict->table.Set(key, value);
          continue;
        }
        Value key = Eval(*e.keys[i], scope);
        Value value = Eval(*e.values[i], scope);
        dict->table.Set(key, std::move(value));
      }
      CheckLength(dict->table.Size());
      heap_.Track(dict);
      return ret;
    }
    case ExprKind::COMPREHENSION:
      return EvalComprehension(static_cast<const ComprehensionExpr&>(expr), scope);
    case ExprKind::STARRED:
      throw ScriptError(ExcType::SYNTAX_ERROR, "can't use starred expression here");
    case ExprKind::NAMED: {
      auto& e = static_cast<const NamedExpr&>(expr);
      Value value = Eval(*e.value, scope);
      StoreNamed(e.target, value, scope);
      return value;
    }
  }
  __builtin_unreachable();
}

std::vector<Value> Interpreter::EvalElements(const std::vector<ExprPtr>& elts, Scope* scope) {
  std::vector<Value> ret;
  ret.reserve(elts.size());
  for (auto& elt : elts) {
    if (elt->kind == ExprKind::STARRED) {
      std::vector<Value> items = Collect(Eval(*static_cast<const StarredExpr&>(*elt).value, scope));
      CheckLength(ret.size() + items.size());
      ret.insert(ret.end(), items.begin(), items.end());
    } else {
      ret.push_back(Eval(*elt, scope));
    }
  }
  return ret;
}

Value Interpreter::EvalCall(const CallExpr& expr, Scope* scope) {
  // obj.method(...) calls native methods without a bound method object
  Value self, func;
  MethodFn method = nullptr;
  if (expr.func->kind == ExprKind::ATTRIBUTE) {
    auto& attr = static_cast<const AttributeExpr&>(*expr.func);
    self = Eval(*attr.value, scope);
    method = FindMethod(self, attr.attr);
    if (!method) func = GetAttr(self, attr.attr);
  } else {
    func = Eval(*expr.func, scope);
  }
  CallArgs args;
  args.args = EvalElements(expr.args, scope);
  for (auto& keyword : expr.keywords) {
    Value value = Eval(*keyword.value, scope);
    if (!keyword.name.empty()) {
      args.kwargs.emplace_back(keyword.name, std::move(value));
      continue;
    }
    if (!value.Is(ObjectKind::DICT)) {
      throw ScriptError(ExcType::TYPE_ERROR,
          fmt::format("argument after ** must be a mapping, not {}", TypeName(value)));
    }
    for (auto& [key, item] : value.As<DictObject>()->table.Entries()) {
      if (!key.IsStr()) throw ScriptError(ExcType::TYPE_ERROR, "keywords must be strings");
      for (auto& existing : args.kwargs) {
        if (existing.first == key.AsStr()) {
          throw ScriptError(ExcType::TYPE_ERROR,
              fmt::format("got multiple values for keyword argument '{}'", key.AsStr()));
        }
      }
      args.kwargs.emplace_back(key.AsStr(), item);
    }
  }
  frames_.back().line = expr.line;
  if (method) {
    Tick();
    return method(*this, self, args);
  }
  return Call(func, std::move(args));
}

SliceBounds Interpreter::EvalSlice(const SliceExpr& expr, Scope* scope) {
  SliceBounds bounds;
  auto bound = [&](const ExprPtr& e) -> std::optional<int64_t> {
    if (!e) return std::nullopt;
    Value v = Eval(*e, scope);
    if (v.IsNone()) return std::nullopt;
    if (!v.IsIntLike()) {
      throw ScriptError(ExcType::TYPE_ERROR,
          "slice indices must be integers or None or have an __index__ method");
    }
    if (v.IsBig()) {
      return v.AsBig() < 0 ? std::numeric_limits<int64_t>::min() : std::numeric_limits<int64_t>::max();
    }
    return v.AsInt();
  };
  bounds.lower = bound(expr.lower);
  bounds.upper = bound(expr.upper);
  bounds.step = bound(expr.step);
  if (bounds.step && *bounds.step == 0) throw ScriptError(ExcType::VALUE_ERROR, "slice step cannot be zero");
  return bounds;
}

Value Interpreter::EvalSubscript(const SubscriptExpr& expr, Scope* scope) {
  Value obj = Eval(*expr.value, scope);
  if (expr.index->kind == ExprKind::SLICE) {
    return GetSlice(obj, EvalSlice(static_cast<const SliceExpr&>(*expr.index), scope));
  }
  return GetItem(obj, Eval(*expr.index, scope));
}

Value Interpreter::EvalFString(const FStringExpr& expr, Scope* scope) {
  std::string out;
  for (auto& part : expr.parts) {
    if (!part.expr) {
      out += part.literal;
      continue;
    }
    Value value = Eval(*part.expr, scope);
    switch (part.conversion) {
      case 'r': value = Value::Str(ToRepr(value)); break;
      case 's': value = Value::Str(ToStr(value)); break;
      case 'a': value = Value::Str(AsciiRepr(value)); break;
      default: break;
    }
    std::string spec;
    if (part.spec) spec = EvalFString(static_cast<const FStringExpr&>(*part.spec), scope).AsStr();
    out += FormatValue(value, spec);
    CheckLength(out.size());
  }
  return Value::Str(std::move(out));
}

Value Interpreter::EvalComprehension(const ComprehensionExpr& expr, Scope* scope) {
  // the outermost iterable belongs to the enclosing scope
  auto first = GetIter(Eval(*expr.clauses[0].iter, scope));
  Value inner = NewScope(ScopeKind::COMPREHENSION, scope, nullptr);
  std::vector<Value> items;
  Value dict;
  if (expr.comp == ComprehensionKind::DICT) dict = Value::Obj(heap_.Make<DictObject>());
  ComprehensionLoop(expr, 0, inner.As<Scope>(), std::move(first), items,
                    dict.IsNone() ? nullptr : dict.As<DictObject>());
  switch (expr.comp) {
    case ComprehensionKind::LIST:
      return NewList(std::move(items));
    case ComprehensionKind::SET: {
      Value ret = Value::Obj(heap_.Make<SetObject>());
      auto set = ret.As<SetObject>();
      for (auto& item : items) set->table.Set(item, Value());
      heap_.Track(set);
      return ret;
    }
    case ComprehensionKind::DICT:
      heap_.Track(dict.AsObject());
      return dict;
    case ComprehensionKind::GENERATOR:
      return NewIterator(std::make_unique<VectorIter>(std::move(items)), "generator");
  }
  __builtin_unreachable();
}

void Interpreter::ComprehensionLoop(const ComprehensionExpr& expr, size_t clause, Scope* scope,
                                    std::unique_ptr<Iter> first, std::vector<Value>& out,
                                    DictObject* dict) {
  auto& current = expr.clauses[clause];
  std::unique_ptr<Iter> iter = first ? std::move(first) : GetIter(Eval(*current.iter, scope));
  Value item;
  while (iter->Next(item)) {
    Tick();
    AssignTarget(*current.target, std::move(item), scope);
    bool keep = true;
    for (auto& cond : current.ifs) {
      if (!Truthy(Eval(*cond, scope))) {
        keep = false;
        break;
      }
    }
    if (!keep) continue;
    if (clause + 1 < expr.clauses.size()) {
      ComprehensionLoop(expr, clause + 1, scope, nullptr, out, dict);
    } else if (dict) {
      Value key = Eval(*expr.elt, scope);
      Value value = Eval(*expr.value, scope);
      dict->table.Set(key, std::move(value));
      CheckLength(dict->table.Size());
      if ((dict->table.Size() & 1023) == 0) heap_.Track(dict);
    } else {
      out.push_back(Eval(*expr.elt, scope));
      CheckLength(out.size());
    }
  }
}

} // namespace interp
