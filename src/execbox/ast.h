#ifndef EXECBOX_AST_H_
#define EXECBOX_AST_H_

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "value.h"

namespace interp {

#define ENUM_BINARY_OP_ \
  X(ADD, "+") \
  X(SUB, "-") \
  X(MUL, "*") \
  X(DIV, "/") \
  X(FLOOR_DIV, "//") \
  X(MOD, "%") \
  X(POW, "**") \
  X(MAT_MUL, "@") \
  X(LSHIFT, "<<") \
  X(RSHIFT, ">>") \
  X(BIT_AND, "&") \
  X(BIT_OR, "|") \
  X(BIT_XOR, "^")
enum class BinaryOp {
#define X(name, symbol) name,
  ENUM_BINARY_OP_
#undef X
};

#define ENUM_COMPARE_OP_ \
  X(EQ, "==") \
  X(NE, "!=") \
  X(LT, "<") \
  X(LE, "<=") \
  X(GT, ">") \
  X(GE, ">=") \
  X(IN, "in") \
  X(NOT_IN, "not in") \
  X(IS, "is") \
  X(IS_NOT, "is not")
enum class CompareOp {
#define X(name, symbol) name,
  ENUM_COMPARE_OP_
#undef X
};

enum class UnaryOp { NEG, POS, NOT, INVERT };

const char* BinaryOpSymbol(BinaryOp);

struct Expr;
struct Stmt;
struct FunctionDef;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

enum class ExprKind {
  CONSTANT, NAME, FSTRING, BINARY, UNARY, BOOL_OP, COMPARE, IF_EXP, LAMBDA, CALL,
  ATTRIBUTE, SUBSCRIPT, SLICE, LIST, TUPLE, SET, DICT, COMPREHENSION, STARRED, NAMED,
};

struct Expr {
  ExprKind kind;
  int line;
  Expr(ExprKind kind, int line) : kind(kind), line(line) {}
  virtual ~Expr() = default;
};

struct ConstantExpr : Expr {
  Value value;
  ConstantExpr(int line, Value value) : Expr(ExprKind::CONSTANT, line), value(std::move(value)) {}
};

struct NameExpr : Expr {
  std::string id;
  NameExpr(int line, std::string id) : Expr(ExprKind::NAME, line), id(std::move(id)) {}
};

// literal text when expr is null
struct FStringPart {
  std::string literal;
  ExprPtr expr;
  char conversion = 0; // 'r', 's', 'a'
  ExprPtr spec; // an FStringExpr
};

struct FStringExpr : Expr {
  std::vector<FStringPart> parts;
  explicit FStringExpr(int line) : Expr(ExprKind::FSTRING, line) {}
};

struct BinaryExpr : Expr {
  BinaryOp op;
  ExprPtr left, right;
  BinaryExpr(int line, BinaryOp op, ExprPtr left, ExprPtr right) :
      Expr(ExprKind::BINARY, line), op(op), left(std::move(left)), right(std::move(right)) {}
};

struct UnaryExpr : Expr {
  UnaryOp op;
  ExprPtr operand;
  UnaryExpr(int line, UnaryOp op, ExprPtr operand) :
      Expr(ExprKind::UNARY, line), op(op), operand(std::move(operand)) {}
};

struct BoolOpExpr : Expr {
  bool is_and;
  std::vector<ExprPtr> values;
  BoolOpExpr(int line, bool is_and) : Expr(ExprKind::BOOL_OP, line), is_and(is_and) {}
};

struct CompareExpr : Expr {
  ExprPtr left;
  std::vector<CompareOp> ops;
  std::vector<ExprPtr> comparators;
  CompareExpr(int line, ExprPtr left) : Expr(ExprKind::COMPARE, line), left(std::move(left)) {}
};

struct IfExpExpr : Expr {
  ExprPtr test, body, orelse;
  explicit IfExpExpr(int line) : Expr(ExprKind::IF_EXP, line) {}
};

struct LambdaExpr : Expr {
  std::unique_ptr<FunctionDef> def;
  explicit LambdaExpr(int line) : Expr(ExprKind::LAMBDA, line) {}
};

// name is empty for **value
struct Keyword {
  std::string name;
  ExprPtr value;
};

struct CallExpr : Expr {
  ExprPtr func;
  std::vector<ExprPtr> args; // StarredExpr for *value
  std::vector<Keyword> keywords;
  CallExpr(int line, ExprPtr func) : Expr(ExprKind::CALL, line), func(std::move(func)) {}
};

struct AttributeExpr : Expr {
  ExprPtr value;
  std::string attr;
  AttributeExpr(int line, ExprPtr value, std::string attr) :
      Expr(ExprKind::ATTRIBUTE, line), value(std::move(value)), attr(std::move(attr)) {}
};

struct SubscriptExpr : Expr {
  ExprPtr value, index;
  SubscriptExpr(int line, ExprPtr value, ExprPtr index) :
      Expr(ExprKind::SUBSCRIPT, line), value(std::move(value)), index(std::move(index)) {}
};

struct SliceExpr : Expr {
  ExprPtr lower, upper, step;
  explicit SliceExpr(int line) : Expr(ExprKind::SLICE, line) {}
};

// LIST, TUPLE or SET display
struct SequenceExpr : Expr {
  std::vector<ExprPtr> elts;
  SequenceExpr(ExprKind kind, int line) : Expr(kind, line) {}
};

struct DictExpr : Expr {
  std::vector<ExprPtr> keys; // null key: **value
  std::vector<ExprPtr> values;
  explicit DictExpr(int line) : Expr(ExprKind::DICT, line) {}
};

struct ComprehensionClause {
  ExprPtr target, iter;
  std::vector<ExprPtr> ifs;
};

enum class ComprehensionKind { LIST, SET, DICT, GENERATOR };

struct ComprehensionExpr : Expr {
  ComprehensionKind comp;
  ExprPtr elt;
  ExprPtr value; // dict comprehensions
  std::vector<ComprehensionClause> clauses;
  ComprehensionExpr(int line, ComprehensionKind comp) : Expr(ExprKind::COMPREHENSION, line), comp(comp) {}
};

struct StarredExpr : Expr {
  ExprPtr value;
  StarredExpr(int line, ExprPtr value) : Expr(ExprKind::STARRED, line), value(std::move(value)) {}
};

struct NamedExpr : Expr {
  std::string target;
  ExprPtr value;
  NamedExpr(int line, std::string target, ExprPtr value) :
      Expr(ExprKind::NAMED, line), target(std::move(target)), value(std::move(value)) {}
};

enum class StmtKind {
  EXPR, ASSIGN, AUG_ASSIGN, IF, WHILE, FOR, BREAK, CONTINUE, PASS, FUNCTION_DEF,
  CLASS_DEF, RETURN, GLOBAL, NONLOCAL, TRY, RAISE, ASSERT, DELETE, IMPORT, IMPORT_FROM,
};

struct Stmt {
  StmtKind kind;
  int line;
  Stmt(StmtKind kind, int line) : kind(kind), line(line) {}
  virtual ~Stmt() = default;
};

struct ExprStmt : Stmt {
  ExprPtr value;
  ExprStmt(int line, ExprPtr value) : Stmt(StmtKind::EXPR, line), value(std::move(value)) {}
};

// a = b = value
struct AssignStmt : Stmt {
  std::vector<ExprPtr> targets;
  ExprPtr value;
  explicit AssignStmt(int line) : Stmt(StmtKind::ASSIGN, line) {}
};

struct AugAssignStmt : Stmt {
  ExprPtr target;
  BinaryOp op;
  ExprPtr value;
  AugAssignStmt(int line, ExprPtr target, BinaryOp op, ExprPtr value) :
      Stmt(StmtKind::AUG_ASSIGN, line), target(std::move(target)), op(op), value(std::move(value)) {}
};

// IF or WHILE
struct ConditionalStmt : Stmt {
  ExprPtr test;
  StmtList body, orelse;
  ConditionalStmt(StmtKind kind, int line) : Stmt(kind, line) {}
};

struct ForStmt : Stmt {
  ExprPtr target, iter;
  StmtList body, orelse;
  explicit ForStmt(int line) : Stmt(StmtKind::FOR, line) {}
};

// BREAK, CONTINUE or PASS
struct SimpleStmt : Stmt {
  SimpleStmt(StmtKind kind, int line) : Stmt(kind, line) {}
};

enum class ParamKind { POSITIONAL, VAR_POSITIONAL, KEYWORD_ONLY, VAR_KEYWORD };

struct Param {
  std::string name;
  ParamKind kind;
  ExprPtr default_value;
};

struct FunctionDef {
  std::string name; // "<lambda>" for lambdas
  int line = 0;
  std::vector<Param> params;
  StmtList body;
  // filled by scope analysis
  std::unordered_set<std::string> locals, globals, nonlocals;
};

struct FunctionDefStmt : Stmt {
  std::unique_ptr<FunctionDef> def;
  std::vector<ExprPtr> decorators;
  explicit FunctionDefStmt(int line) : Stmt(StmtKind::FUNCTION_DEF, line) {}
};

struct ClassDefStmt : Stmt {
  std::string name;
  StmtList body;
  ClassDefStmt(int line, std::string name) : Stmt(StmtKind::CLASS_DEF, line), name(std::move(name)) {}
};

struct ReturnStmt : Stmt {
  ExprPtr value;
  ReturnStmt(int line, ExprPtr value) : Stmt(StmtKind::RETURN, line), value(std::move(value)) {}
};

// GLOBAL or NONLOCAL
struct NamesStmt : Stmt {
  std::vector<std::string> names;
  NamesStmt(StmtKind kind, int line) : Stmt(kind, line) {}
};

struct ExceptHandler {
  ExprPtr type; // null: bare except
  std::string name;
  StmtList body;
  int line = 0;
};

struct TryStmt : Stmt {
  StmtList body;
  std::vector<ExceptHandler> handlers;
  StmtList orelse, finalbody;
  explicit TryStmt(int line) : Stmt(StmtKind::TRY, line) {}
};

struct RaiseStmt : Stmt {
  ExprPtr exc, cause;
  explicit RaiseStmt(int line) : Stmt(StmtKind::RAISE, line) {}
};

struct AssertStmt : Stmt {
  ExprPtr test, msg;
  explicit AssertStmt(int line) : Stmt(StmtKind::ASSERT, line) {}
};

struct DeleteStmt : Stmt {
  std::vector<ExprPtr> targets;
  explicit DeleteStmt(int line) : Stmt(StmtKind::DELETE, line) {}
};

struct ImportAlias {
  std::string name;
  std::string asname; // empty: bind under name
};

// IMPORT or IMPORT_FROM; names of IMPORT_FROM may be "*"
struct ImportStmt : Stmt {
  std::string module;
  std::vector<ImportAlias> names;
  ImportStmt(StmtKind kind, int line) : Stmt(kind, line) {}
};

struct Module {
  StmtList body;
};

} // namespace interp

#endif  // EXECBOX_AST_H_
