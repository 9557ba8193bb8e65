#ifndef EXECBOX_INTERPRETER_H_
#define EXECBOX_INTERPRETER_H_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "execbox/capture.h"
#include "execbox/engine.h"
#include "ast.h"
#include "value.h"

namespace interp {

class RestrictedEnvironment;

enum class ScopeKind { MODULE, FUNCTION, COMPREHENSION };

// Variables of a module, a call or a comprehension. Scopes live on the heap:
// closures keep their defining scope alive after the call returns.
class Scope : public Object {
  Value parent_ref_;
 public:
  ScopeKind scope_kind;
  Scope* parent;
  const FunctionDef* def; // FUNCTION only
  std::unordered_map<std::string, Value> vars;

  Scope(ScopeKind kind, Scope* parent, const FunctionDef* def) :
      Object(ObjectKind::SCOPE), parent_ref_(parent ? Value::Obj(parent) : Value()),
      scope_kind(kind), parent(parent), def(def) {}

  Value* Find(const std::string& name) {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : &it->second;
  }
  void Traverse(const Visitor& visit) const override {
    visit(parent_ref_);
    for (auto& var : vars) visit(var.second);
  }
  void Clear() override {
    vars.clear();
    parent_ref_ = Value();
  }
};

enum class Flow { NORMAL, BREAK, CONTINUE, RETURN };

struct SliceBounds {
  std::optional<int64_t> lower, upper, step;
};

// Tree-walking evaluator for one run. Not thread-safe; every run owns one.
class Interpreter {
  Heap& heap_;
  const RestrictedEnvironment& env_;
  OutputChannels& channels_;
  const ExecutionLimits& limits_;
  std::chrono::steady_clock::time_point deadline_;
  bool has_deadline_;
  uint64_t steps_;
  int call_depth_;
  int eval_depth_;
  std::vector<Frame> frames_;
  Value module_ref_;
  Scope* module_scope_;
  std::vector<ScriptError> handling_; // exceptions whose handler is running
  Value return_value_;

  friend class FrameGuard;

  // statements
  Flow ExecBlock(const StmtList& body, Scope* scope);
  Flow Exec(const Stmt& stmt, Scope* scope);
  Flow ExecStatement(const Stmt& stmt, Scope* scope);
  Flow ExecWhile(const ConditionalStmt& stmt, Scope* scope);
  Flow ExecFor(const ForStmt& stmt, Scope* scope);
  Flow ExecTry(const TryStmt& stmt, Scope* scope);
  void ExecFunctionDef(const FunctionDefStmt& stmt, Scope* scope);
  void ExecAugAssign(const AugAssignStmt& stmt, Scope* scope);
  void ExecRaise(const RaiseStmt& stmt, Scope* scope);
  void ExecDelete(const Expr& target, Scope* scope);
  void ExecImport(const ImportStmt& stmt, Scope* scope);
  bool HandlerMatches(const Value& handler_type, ExcType type);

  // expressions
  Value Eval(const Expr& expr, Scope* scope);
  Value EvalExpr(const Expr& expr, Scope* scope);
  Value EvalCall(const CallExpr& expr, Scope* scope);
  Value EvalSubscript(const SubscriptExpr& expr, Scope* scope);
  SliceBounds EvalSlice(const SliceExpr& expr, Scope* scope);
  Value EvalFString(const FStringExpr& expr, Scope* scope);
  Value EvalComprehension(const ComprehensionExpr& expr, Scope* scope);
  void ComprehensionLoop(const ComprehensionExpr& expr, size_t clause, Scope* scope,
                         std::unique_ptr<Iter> first, std::vector<Value>& out,
                         DictObject* dict);
  std::vector<Value> EvalElements(const std::vector<ExprPtr>& elts, Scope* scope);
  Value MakeFunction(const FunctionDef& def, Scope* scope);
  Value NewScope(ScopeKind kind, Scope* parent, const FunctionDef* def);

  // names
  Value LoadName(const std::string& name, Scope* scope);
  Value LoadGlobal(const std::string& name);
  void StoreName(const std::string& name, Value value, Scope* scope);
  void StoreNamed(const std::string& name, Value value, Scope* scope);
  void DeleteName(const std::string& name, Scope* scope);
  Scope* FindNonlocal(const std::string& name, Scope* scope);
  void AssignTarget(const Expr& target, Value value, Scope* scope);

  Value CallFunction(FunctionObject* fn, CallArgs& args);
  void BindArguments(FunctionObject* fn, CallArgs& args, Scope* scope);
  Value InplaceOperation(BinaryOp op, const Value& a, const Value& b);
 public:
  Interpreter(Heap& heap, const RestrictedEnvironment& env, OutputChannels& channels,
              const ExecutionLimits& limits);
  ~Interpreter();

  // throws ScriptError when the snippet raises or exceeds a limit
  void Run(const Module& module);

  Heap& heap() { return heap_; }
  const RestrictedEnvironment& env() const { return env_; }
  const ExecutionLimits& limits() const { return limits_; }
  bool has_deadline() const { return has_deadline_; }
  std::chrono::steady_clock::time_point deadline() const { return deadline_; }

  // cooperative limit checks
  void Tick();
  void CheckDeadline();
  void CheckLength(size_t length);
  // length * times, for sequence repetition
  void CheckRepeat(size_t length, int64_t times);
  // before computing an int of about this many bits
  void CheckIntSize(size_t bits);
  [[noreturn]] void RaiseLimit(ExcType type, const std::string& message);

  void WriteOut(std::string_view text);
  void WriteErr(std::string_view text);

  Value Call(const Value& callee, CallArgs args);
  Value Call(const Value& callee, std::vector<Value> args);
  std::unique_ptr<Iter> GetIter(const Value& iterable);
  std::vector<Value> Collect(const Value& iterable);

  Value NewList(std::vector<Value> items = {});
  Value NewTuple(std::vector<Value> items = {});
  Value NewIterator(std::unique_ptr<Iter> iter, std::string type_name);
  [[noreturn]] void RaiseKeyError(const Value& key);
  [[noreturn]] void Raise(ExcType type, std::vector<Value> args);
  ExceptionObject* Materialize(ScriptError& err);

  // operators.cpp
  Value BinaryOperation(BinaryOp op, const Value& a, const Value& b);
  Value UnaryOperation(UnaryOp op, const Value& v);
  bool Compare(CompareOp op, const Value& a, const Value& b);
  bool Contains(const Value& container, const Value& item);
  Value GetItem(const Value& obj, const Value& index);
  Value GetSlice(const Value& obj, const SliceBounds& bounds);
  void SetItem(const Value& obj, const Value& index, Value value);
  void SetSlice(const Value& obj, const SliceBounds& bounds, const Value& value);
  void DelItem(const Value& obj, const Value& index);
  void DelSlice(const Value& obj, const SliceBounds& bounds);

  // methods.cpp
  Value GetAttr(const Value& obj, const std::string& name);
  [[noreturn]] void SetAttr(const Value& obj, const std::string& name);
};

bool IsIterable(const Value&);
// native method of a value, by its type; nullptr if none (methods.cpp)
MethodFn FindMethod(const Value& self, const std::string& name);
MethodFn FindTypeMethod(const std::string& type_name, const std::string& name);

// Python's slice index normalization; returns the slice length
int64_t AdjustSlice(int64_t length, const SliceBounds& bounds, int64_t& start, int64_t& stop, int64_t& step);

} // namespace interp

#endif  // EXECBOX_INTERPRETER_H_
