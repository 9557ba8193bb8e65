#include "parser.h"

#include <cstring>

#include <fmt/core.h>

#include "errors.h"

namespace interp {

namespace {

constexpr int kMaxExpressionDepth = 1000;
constexpr int kMaxBlockDepth = 100;

const char* kKeywords[] = {
  "False", "None", "True", "and", "as", "assert", "async", "await", "break",
  "class", "continue", "def", "del", "elif", "else", "except", "finally", "for",
  "from", "global", "if", "import", "in", "is", "lambda", "nonlocal", "not",
  "or", "pass", "raise", "return", "try", "while", "with", "yield",
};

bool IsKeywordText(const std::string& text) {
  for (const char* kw : kKeywords) {
    if (text == kw) return true;
  }
  return false;
}

const struct {
  const char* symbol;
  BinaryOp op;
} kAugmentedOps[] = {
  {"+=", BinaryOp::ADD}, {"-=", BinaryOp::SUB}, {"*=", BinaryOp::MUL},
  {"/=", BinaryOp::DIV}, {"//=", BinaryOp::FLOOR_DIV}, {"%=", BinaryOp::MOD},
  {"**=", BinaryOp::POW}, {"@=", BinaryOp::MAT_MUL}, {"<<=", BinaryOp::LSHIFT},
  {">>=", BinaryOp::RSHIFT}, {"&=", BinaryOp::BIT_AND}, {"|=", BinaryOp::BIT_OR},
  {"^=", BinaryOp::BIT_XOR},
};

// restores the nesting counter on scope exit
class NestingGuard {
  int& depth_;
  int saved_;
 public:
  explicit NestingGuard(int& depth) : depth_(depth), saved_(depth) {}
  ~NestingGuard() { depth_ = saved_; }
};

std::string Strip(const std::string& str) {
  size_t start = str.find_first_not_of(" \t\n\r\f\v");
  if (start == std::string::npos) return "";
  size_t end = str.find_last_not_of(" \t\n\r\f\v");
  return str.substr(start, end - start + 1);
}

void AppendLiteral(FStringExpr& out, const std::string& text) {
  if (text.empty()) return;
  if (!out.parts.empty() && !out.parts.back().expr) {
    out.parts.back().literal += text;
    return;
  }
  FStringPart part;
  part.literal = text;
  out.parts.push_back(std::move(part));
}

// --- scope analysis ---

struct ScopeNames {
  std::unordered_set<std::string> assigned, globals, nonlocals;
};

void CollectWalrus(const Expr* expr, ScopeNames& names);

void CollectTargets(const Expr* target, ScopeNames& names) {
  if (!target) return;
  switch (target->kind) {
    case ExprKind::NAME:
      names.assigned.insert(static_cast<const NameExpr*>(target)->id);
      break;
    case ExprKind::TUPLE:
    case ExprKind::LIST:
      for (auto& elt : static_cast<const SequenceExpr*>(target)->elts) CollectTargets(elt.get(), names);
      break;
    case ExprKind::STARRED:
      CollectTargets(static_cast<const StarredExpr*>(target)->value.get(), names);
      break;
    default:
      CollectWalrus(target, names);
  }
}

void CollectWalrus(const Expr* expr, ScopeNames& names) {
  if (!expr) return;
  switch (expr->kind) {
    case ExprKind::CONSTANT:
    case ExprKind::NAME:
    case ExprKind::LAMBDA:
      break;
    case ExprKind::NAMED: {
      auto e = static_cast<const NamedExpr*>(expr);
      names.assigned.insert(e->target);
      CollectWalrus(e->value.get(), names);
      break;
    }
    case ExprKind::FSTRING:
      for (auto& part : static_cast<const FStringExpr*>(expr)->parts) {
        CollectWalrus(part.expr.get(), names);
        CollectWalrus(part.spec.get(), names);
      }
      break;
    case ExprKind::BINARY: {
      auto e = static_cast<const BinaryExpr*>(expr);
      CollectWalrus(e->left.get(), names);
      CollectWalrus(e->right.get(), names);
      break;
    }
    case ExprKind::UNARY:
      CollectWalrus(static_cast<const UnaryExpr*>(expr)->operand.get(), names);
      break;
    case ExprKind::BOOL_OP:
      for (auto& v : static_cast<const BoolOpExpr*>(expr)->values) CollectWalrus(v.get(), names);
      break;
    case ExprKind::COMPARE: {
      auto e = static_cast<const CompareExpr*>(expr);
      CollectWalrus(e->left.get(), names);
      for (auto& c : e->comparators) CollectWalrus(c.get(), names);
      break;
    }
    case ExprKind::IF_EXP: {
      auto e = static_cast<const IfExpExpr*>(expr);
      CollectWalrus(e->test.get(), names);
      CollectWalrus(e->body.get(), names);
      CollectWalrus(e->orelse.get(), names);
      break;
    }
    case ExprKind::CALL: {
      auto e = static_cast<const CallExpr*>(expr);
      CollectWalrus(e->func.get(), names);
      for (auto& a : e->args) CollectWalrus(a.get(), names);
      for (auto& k : e->keywords) CollectWalrus(k.value.get(), names);
      break;
    }
    case ExprKind::ATTRIBUTE:
      CollectWalrus(static_cast<const AttributeExpr*>(expr)->value.get(), names);
      break;
    case ExprKind::SUBSCRIPT: {
      auto e = static_cast<const SubscriptExpr*>(expr);
      CollectWalrus(e->value.get(), names);
      CollectWalrus(e->index.get(), names);
      break;
    }
    case ExprKind::SLICE: {
      auto e = static_cast<const SliceExpr*>(expr);
      CollectWalrus(e->lower.get(), names);
      CollectWalrus(e->upper.get(), names);
      CollectWalrus(e->step.get(), names);
      break;
    }
    case ExprKind::LIST:
    case ExprKind::TUPLE:
    case ExprKind::SET:
      for (auto& elt : static_cast<const SequenceExpr*>(expr)->elts) CollectWalrus(elt.get(), names);
      break;
    case ExprKind::DICT: {
      auto e = static_cast<const DictExpr*>(expr);
      for (auto& k : e->keys) CollectWalrus(k.get(), names);
      for (auto& v : e->values) CollectWalrus(v.get(), names);
      break;
    }
    case ExprKind::COMPREHENSION: {
      // := inside a comprehension binds in the enclosing function
      auto e = static_cast<const ComprehensionExpr*>(expr);
      CollectWalrus(e->elt.get(), names);
      CollectWalrus(e->value.get(), names);
      for (auto& clause : e->clauses) {
        CollectWalrus(clause.iter.get(), names);
        for (auto& cond : clause.ifs) CollectWalrus(cond.get(), names);
      }
      break;
    }
    case ExprKind::STARRED:
      CollectWalrus(static_cast<const StarredExpr*>(expr)->value.get(), names);
      break;
  }
}

void CollectBlock(const StmtList& body, ScopeNames& names) {
  for (auto& stmt : body) {
    switch (stmt->kind) {
      case StmtKind::EXPR:
        CollectWalrus(static_cast<const ExprStmt*>(stmt.get())->value.get(), names);
        break;
      case StmtKind::ASSIGN: {
        auto s = static_cast<const AssignStmt*>(stmt.get());
        for (auto& target : s->targets) CollectTargets(target.get(), names);
        CollectWalrus(s->value.get(), names);
        break;
      }
      case StmtKind::AUG_ASSIGN: {
        auto s = static_cast<const AugAssignStmt*>(stmt.get());
        CollectTargets(s->target.get(), names);
        CollectWalrus(s->value.get(), names);
        break;
      }
      case StmtKind::IF:
      case StmtKind::WHILE: {
        auto s = static_cast<const ConditionalStmt*>(stmt.get());
        CollectWalrus(s->test.get(), names);
        CollectBlock(s->body, names);
        CollectBlock(s->orelse, names);
        break;
      }
      case StmtKind::FOR: {
        auto s = static_cast<const ForStmt*>(stmt.get());
        CollectTargets(s->target.get(), names);
        CollectWalrus(s->iter.get(), names);
        CollectBlock(s->body, names);
        CollectBlock(s->orelse, names);
        break;
      }
      case StmtKind::FUNCTION_DEF: {
        auto s = static_cast<const FunctionDefStmt*>(stmt.get());
        names.assigned.insert(s->def->name);
        for (auto& d : s->decorators) CollectWalrus(d.get(), names);
        break;
      }
      case StmtKind::CLASS_DEF:
        names.assigned.insert(static_cast<const ClassDefStmt*>(stmt.get())->name);
        break;
      case StmtKind::RETURN:
        CollectWalrus(static_cast<const ReturnStmt*>(stmt.get())->value.get(), names);
        break;
      case StmtKind::GLOBAL:
        for (auto& name : static_cast<const NamesStmt*>(stmt.get())->names) names.globals.insert(name);
        break;
      case StmtKind::NONLOCAL:
        for (auto& name : static_cast<const NamesStmt*>(stmt.get())->names) names.nonlocals.insert(name);
        break;
      case StmtKind::TRY: {
        auto s = static_cast<const TryStmt*>(stmt.get());
        CollectBlock(s->body, names);
        for (auto& handler : s->handlers) {
          if (!handler.name.empty()) names.assigned.insert(handler.name);
          CollectBlock(handler.body, names);
        }
        CollectBlock(s->orelse, names);
        CollectBlock(s->finalbody, names);
        break;
      }
      case StmtKind::RAISE: {
        auto s = static_cast<const RaiseStmt*>(stmt.get());
        CollectWalrus(s->exc.get(), names);
        CollectWalrus(s->cause.get(), names);
        break;
      }
      case StmtKind::ASSERT: {
        auto s = static_cast<const AssertStmt*>(stmt.get());
        CollectWalrus(s->test.get(), names);
        CollectWalrus(s->msg.get(), names);
        break;
      }
      case StmtKind::DELETE:
        for (auto& target : static_cast<const DeleteStmt*>(stmt.get())->targets) {
          CollectTargets(target.get(), names);
        }
        break;
      case StmtKind::IMPORT:
        for (auto& alias : static_cast<const ImportStmt*>(stmt.get())->names) {
          names.assigned.insert(alias.asname.empty() ? alias.name.substr(0, alias.name.find('.')) : alias.asname);
        }
        break;
      case StmtKind::IMPORT_FROM:
        for (auto& alias : static_cast<const ImportStmt*>(stmt.get())->names) {
          if (alias.name == "*") continue;
          names.assigned.insert(alias.asname.empty() ? alias.name : alias.asname);
        }
        break;
      case StmtKind::BREAK:
      case StmtKind::CONTINUE:
      case StmtKind::PASS:
        break;
    }
  }
}

void AnalyzeScope(FunctionDef& def) {
  ScopeNames names;
  for (auto& param : def.params) names.assigned.insert(param.name);
  CollectBlock(def.body, names);
  for (auto& name : names.assigned) {
    if (!names.globals.count(name) && !names.nonlocals.count(name)) def.locals.insert(name);
  }
  def.globals = std::move(names.globals);
  def.nonlocals = std::move(names.nonlocals);
}

} // namespace

Parser::Parser(const std::string& source, std::vector<Token> tokens) :
    source_(source), tokens_(std::move(tokens)), pos_(0), depth_(0),
    block_depth_(0), function_depth_(0), loop_depth_(0) {}

bool Parser::IsOp(const char* op) const {
  return Cur().type == TokenType::OP && Cur().text == op;
}

bool Parser::IsKeyword(const char* keyword) const {
  return Cur().type == TokenType::NAME && Cur().text == keyword;
}

bool Parser::AcceptOp(const char* op) {
  if (!IsOp(op)) return false;
  pos_++;
  return true;
}

bool Parser::AcceptKeyword(const char* keyword) {
  if (!IsKeyword(keyword)) return false;
  pos_++;
  return true;
}

void Parser::ExpectOp(const char* op) {
  if (!AcceptOp(op)) Fail(fmt::format("expected '{}'", op));
}

void Parser::ExpectKeyword(const char* keyword) {
  if (!AcceptKeyword(keyword)) Fail(fmt::format("expected '{}'", keyword));
}

std::string Parser::ExpectName() {
  if (Cur().type != TokenType::NAME || IsKeywordText(Cur().text)) Fail("invalid syntax");
  return tokens_[pos_++].text;
}

bool Parser::AtStatementEnd() const {
  return Cur().type == TokenType::NEWLINE || Cur().type == TokenType::END || IsOp(";");
}

bool Parser::CanStartExpression() const {
  const Token& tok = Cur();
  switch (tok.type) {
    case TokenType::NAME:
      return !IsKeywordText(tok.text) || tok.text == "None" || tok.text == "True" ||
             tok.text == "False" || tok.text == "not" || tok.text == "lambda";
    case TokenType::INT:
    case TokenType::FLOAT:
    case TokenType::STRING:
    case TokenType::FSTRING:
      return true;
    case TokenType::OP:
      return tok.text == "(" || tok.text == "[" || tok.text == "{" || tok.text == "-" ||
             tok.text == "+" || tok.text == "~" || tok.text == "*" || tok.text == "...";
    default:
      return false;
  }
}

void Parser::Fail(const std::string& detail, const Token& at, ExcType type) const {
  throw SyntaxError(detail, at.line, at.column, SourceLine(source_, at.line), type);
}

void Parser::Enter() {
  if (++depth_ > kMaxExpressionDepth) Fail("expression is too deeply nested");
}

Module Parser::ParseModule() {
  Module module;
  while (Cur().type != TokenType::END) {
    if (Cur().type == TokenType::NEWLINE) {
      pos_++;
      continue;
    }
    ParseStatement(module.body);
  }
  return module;
}

// --- statements ---

void Parser::ParseStatement(StmtList& out) {
  const Token& tok = Cur();
  if (tok.type == TokenType::INDENT) Fail("unexpected indent", tok, ExcType::INDENTATION_ERROR);
  if (tok.type == TokenType::OP && tok.text == "@") {
    std::vector<ExprPtr> decorators;
    while (AcceptOp("@")) {
      decorators.push_back(ParseNamedExprTest());
      if (Cur().type != TokenType::NEWLINE) Fail("invalid syntax");
      pos_++;
    }
    if (!IsKeyword("def")) Fail("invalid syntax");
    out.push_back(ParseFunctionDef(std::move(decorators)));
    return;
  }
  if (tok.type == TokenType::NAME) {
    if (tok.text == "if") return out.push_back(ParseIf());
    if (tok.text == "while") return out.push_back(ParseWhile());
    if (tok.text == "for") return out.push_back(ParseFor());
    if (tok.text == "try") return out.push_back(ParseTry());
    if (tok.text == "def") return out.push_back(ParseFunctionDef({}));
    if (tok.text == "class") return out.push_back(ParseClassDef());
    if (tok.text == "with") Fail("'with' statements are not supported");
    if (tok.text == "async") Fail("'async' is not supported");
  }
  ParseSimpleStatements(out);
}

void Parser::ParseSimpleStatements(StmtList& out) {
  while (true) {
    out.push_back(ParseSmallStatement());
    if (!AcceptOp(";")) break;
    if (Cur().type == TokenType::NEWLINE || Cur().type == TokenType::END) break;
  }
  if (Cur().type == TokenType::NEWLINE) {
    pos_++;
  } else if (Cur().type != TokenType::END) {
    Fail("invalid syntax");
  }
}

StmtList Parser::ParseBlock(const std::string& what, int header_line) {
  ExpectOp(":");
  StmtList body;
  if (Cur().type != TokenType::NEWLINE) {
    ParseSimpleStatements(body);
    return body;
  }
  pos_++;
  if (Cur().type != TokenType::INDENT) {
    Fail(fmt::format("expected an indented block after {} on line {}", what, header_line),
         Cur(), ExcType::INDENTATION_ERROR);
  }
  if (++block_depth_ > kMaxBlockDepth) {
    Fail("too many levels of indentation", Cur(), ExcType::INDENTATION_ERROR);
  }
  pos_++;
  while (Cur().type != TokenType::DEDENT && Cur().type != TokenType::END) {
    if (Cur().type == TokenType::NEWLINE) {
      pos_++;
      continue;
    }
    ParseStatement(body);
  }
  if (Cur().type == TokenType::DEDENT) pos_++;
  block_depth_--;
  return body;
}

StmtPtr Parser::ParseIf() {
  int line = Cur().line;
  std::string keyword = Cur().text;
  pos_++;
  auto stmt = std::make_unique<ConditionalStmt>(StmtKind::IF, line);
  stmt->test = ParseNamedExprTest();
  stmt->body = ParseBlock(fmt::format("'{}' statement", keyword), line);
  if (IsKeyword("elif")) {
    stmt->orelse.push_back(ParseIf());
  } else if (IsKeyword("else")) {
    int else_line = Cur().line;
    pos_++;
    stmt->orelse = ParseBlock("'else' statement", else_line);
  }
  return stmt;
}

StmtPtr Parser::ParseWhile() {
  int line = Cur().line;
  pos_++;
  auto stmt = std::make_unique<ConditionalStmt>(StmtKind::WHILE, line);
  stmt->test = ParseNamedExprTest();
  loop_depth_++;
  stmt->body = ParseBlock("'while' statement", line);
  loop_depth_--;
  if (IsKeyword("else")) {
    int else_line = Cur().line;
    pos_++;
    stmt->orelse = ParseBlock("'else' statement", else_line);
  }
  return stmt;
}

StmtPtr Parser::ParseFor() {
  int line = Cur().line;
  pos_++;
  auto stmt = std::make_unique<ForStmt>(line);
  stmt->target = ParseTargetList();
  ExpectKeyword("in");
  stmt->iter = ParseTestListStarExpr();
  loop_depth_++;
  stmt->body = ParseBlock("'for' statement", line);
  loop_depth_--;
  if (IsKeyword("else")) {
    int else_line = Cur().line;
    pos_++;
    stmt->orelse = ParseBlock("'else' statement", else_line);
  }
  return stmt;
}

StmtPtr Parser::ParseTry() {
  int line = Cur().line;
  pos_++;
  auto stmt = std::make_unique<TryStmt>(line);
  stmt->body = ParseBlock("'try' statement", line);
  while (IsKeyword("except")) {
    const Token& except_tok = Cur();
    if (!stmt->handlers.empty() && !stmt->handlers.back().type) {
      Fail("default 'except:' must be last", except_tok);
    }
    ExceptHandler handler;
    handler.line = except_tok.line;
    pos_++;
    if (!IsOp(":")) {
      handler.type = ParseTest();
      if (IsOp(",")) Fail("multiple exception types must be parenthesized");
      if (AcceptKeyword("as")) handler.name = ExpectName();
    }
    handler.body = ParseBlock("'except' statement", handler.line);
    stmt->handlers.push_back(std::move(handler));
  }
  if (IsKeyword("else")) {
    if (stmt->handlers.empty()) Fail("invalid syntax");
    int else_line = Cur().line;
    pos_++;
    stmt->orelse = ParseBlock("'else' statement", else_line);
  }
  if (IsKeyword("finally")) {
    int finally_line = Cur().line;
    pos_++;
    stmt->finalbody = ParseBlock("'finally' statement", finally_line);
  }
  if (stmt->handlers.empty() && stmt->finalbody.empty()) Fail("expected 'except' or 'finally' block");
  return stmt;
}

void Parser::ParseParams(const char* closer, bool annotations, std::vector<Param>& params) {
  bool seen_star = false, seen_default = false, seen_var_keyword = false;
  std::unordered_set<std::string> seen;
  auto add = [&](const Token& at, std::string name, ParamKind kind, ExprPtr default_value) {
    if (!seen.insert(name).second) {
      Fail(fmt::format("duplicate argument '{}' in function definition", name), at);
    }
    params.push_back({std::move(name), kind, std::move(default_value)});
  };
  auto skip_annotation = [&]() {
    if (annotations && AcceptOp(":")) ParseTest();
  };
  while (!IsOp(closer)) {
    const Token& at = Cur();
    if (seen_var_keyword) Fail("arguments cannot follow var-keyword argument");
    if (AcceptOp("/")) {
      if (seen_star || params.empty()) Fail("invalid syntax", at);
    } else if (AcceptOp("**")) {
      std::string name = ExpectName();
      skip_annotation();
      add(at, std::move(name), ParamKind::VAR_KEYWORD, nullptr);
      seen_var_keyword = true;
    } else if (AcceptOp("*")) {
      if (seen_star) Fail("* argument may appear only once", at);
      seen_star = true;
      if (Cur().type == TokenType::NAME) {
        std::string name = ExpectName();
        skip_annotation();
        add(at, std::move(name), ParamKind::VAR_POSITIONAL, nullptr);
      } else if (IsOp(closer) || (IsOp(",") && Next().type == TokenType::OP && Next().text == closer)) {
        Fail("named arguments must follow bare *", at);
      }
    } else {
      std::string name = ExpectName();
      skip_annotation();
      ExprPtr default_value;
      if (AcceptOp("=")) {
        default_value = ParseTest();
        seen_default = true;
      } else if (seen_default && !seen_star) {
        Fail("parameter without a default follows parameter with a default", at);
      }
      add(at, std::move(name), seen_star ? ParamKind::KEYWORD_ONLY : ParamKind::POSITIONAL,
          std::move(default_value));
    }
    if (!AcceptOp(",")) break;
  }
}

StmtPtr Parser::ParseFunctionDef(std::vector<ExprPtr> decorators) {
  int line = Cur().line;
  pos_++;
  auto stmt = std::make_unique<FunctionDefStmt>(line);
  stmt->decorators = std::move(decorators);
  stmt->def = std::make_unique<FunctionDef>();
  FunctionDef& def = *stmt->def;
  def.line = line;
  def.name = ExpectName();
  ExpectOp("(");
  ParseParams(")", true, def.params);
  ExpectOp(")");
  if (AcceptOp("->")) ParseTest();
  int saved_loop_depth = loop_depth_;
  loop_depth_ = 0;
  function_depth_++;
  def.body = ParseBlock("function definition", line);
  function_depth_--;
  loop_depth_ = saved_loop_depth;
  AnalyzeScope(def);
  return stmt;
}

StmtPtr Parser::ParseClassDef() {
  int line = Cur().line;
  pos_++;
  auto stmt = std::make_unique<ClassDefStmt>(line, ExpectName());
  if (IsOp("(")) {
    // bases are never evaluated
    CallExpr bases(line, nullptr);
    ParseCallArgs(bases);
  }
  int saved_loop_depth = loop_depth_;
  loop_depth_ = 0;
  stmt->body = ParseBlock("class definition", line);
  loop_depth_ = saved_loop_depth;
  return stmt;
}

StmtPtr Parser::ParseImport() {
  int line = Cur().line;
  pos_++;
  auto stmt = std::make_unique<ImportStmt>(StmtKind::IMPORT, line);
  do {
    ImportAlias alias;
    alias.name = ExpectName();
    while (AcceptOp(".")) alias.name += "." + ExpectName();
    if (AcceptKeyword("as")) alias.asname = ExpectName();
    stmt->names.push_back(std::move(alias));
  } while (AcceptOp(","));
  return stmt;
}

StmtPtr Parser::ParseImportFrom() {
  int line = Cur().line;
  pos_++;
  auto stmt = std::make_unique<ImportStmt>(StmtKind::IMPORT_FROM, line);
  while (IsOp(".") || IsOp("...")) stmt->module += tokens_[pos_++].text;
  if (!IsKeyword("import")) {
    stmt->module += ExpectName();
    while (AcceptOp(".")) stmt->module += "." + ExpectName();
  }
  ExpectKeyword("import");
  if (AcceptOp("*")) {
    stmt->names.push_back({"*", ""});
    return stmt;
  }
  bool parenthesized = AcceptOp("(");
  do {
    if (parenthesized && IsOp(")")) break;
    ImportAlias alias;
    alias.name = ExpectName();
    if (AcceptKeyword("as")) alias.asname = ExpectName();
    stmt->names.push_back(std::move(alias));
  } while (AcceptOp(","));
  if (parenthesized) ExpectOp(")");
  if (stmt->names.empty()) Fail("invalid syntax");
  return stmt;
}

StmtPtr Parser::ParseSmallStatement() {
  const Token& tok = Cur();
  int line = tok.line;
  if (tok.type == TokenType::NAME) {
    const std::string& kw = tok.text;
    if (kw == "pass") {
      pos_++;
      return std::make_unique<SimpleStmt>(StmtKind::PASS, line);
    }
    if (kw == "break" || kw == "continue") {
      if (!loop_depth_) {
        Fail(kw == "break" ? "'break' outside loop" : "'continue' not properly in loop");
      }
      pos_++;
      return std::make_unique<SimpleStmt>(kw == "break" ? StmtKind::BREAK : StmtKind::CONTINUE, line);
    }
    if (kw == "return") {
      if (!function_depth_) Fail("'return' outside function");
      pos_++;
      ExprPtr value;
      if (!AtStatementEnd()) value = ParseTestListStarExpr();
      return std::make_unique<ReturnStmt>(line, std::move(value));
    }
    if (kw == "global" || kw == "nonlocal") {
      if (kw == "nonlocal" && !function_depth_) {
        Fail("nonlocal declaration not allowed at module level");
      }
      pos_++;
      auto stmt = std::make_unique<NamesStmt>(kw == "global" ? StmtKind::GLOBAL : StmtKind::NONLOCAL, line);
      do {
        stmt->names.push_back(ExpectName());
      } while (AcceptOp(","));
      return stmt;
    }
    if (kw == "raise") {
      pos_++;
      auto stmt = std::make_unique<RaiseStmt>(line);
      if (!AtStatementEnd()) {
        stmt->exc = ParseTest();
        if (AcceptKeyword("from")) stmt->cause = ParseTest();
      }
      return stmt;
    }
    if (kw == "assert") {
      pos_++;
      auto stmt = std::make_unique<AssertStmt>(line);
      stmt->test = ParseTest();
      if (AcceptOp(",")) stmt->msg = ParseTest();
      return stmt;
    }
    if (kw == "del") {
      pos_++;
      auto stmt = std::make_unique<DeleteStmt>(line);
      do {
        if (AtStatementEnd()) break;
        ExprPtr target = ParseBitOr();
        CheckTarget(target.get(), true);
        stmt->targets.push_back(std::move(target));
      } while (AcceptOp(","));
      if (stmt->targets.empty()) Fail("invalid syntax");
      return stmt;
    }
    if (kw == "import") return ParseImport();
    if (kw == "from") return ParseImportFrom();
    if (kw == "yield") Fail("'yield' is not supported");
    if (kw == "await") Fail("'await' is not supported");
  }
  return ParseExpressionStatement();
}

StmtPtr Parser::ParseExpressionStatement() {
  const Token& start = Cur();
  int line = start.line;
  ExprPtr first = ParseTestListStarExpr();
  if (IsOp("=")) {
    auto stmt = std::make_unique<AssignStmt>(line);
    while (AcceptOp("=")) {
      CheckTarget(first.get(), false);
      stmt->targets.push_back(std::move(first));
      if (IsKeyword("yield")) Fail("'yield' is not supported");
      first = ParseTestListStarExpr();
    }
    stmt->value = std::move(first);
    return stmt;
  }
  if (Cur().type == TokenType::OP) {
    for (auto& aug : kAugmentedOps) {
      if (Cur().text != aug.symbol) continue;
      if (first->kind != ExprKind::NAME && first->kind != ExprKind::ATTRIBUTE &&
          first->kind != ExprKind::SUBSCRIPT) {
        Fail("illegal expression for augmented assignment", start);
      }
      pos_++;
      ExprPtr value = ParseTestListStarExpr();
      return std::make_unique<AugAssignStmt>(line, std::move(first), aug.op, std::move(value));
    }
  }
  if (IsOp(":")) {
    if (first->kind != ExprKind::NAME && first->kind != ExprKind::ATTRIBUTE &&
        first->kind != ExprKind::SUBSCRIPT) {
      Fail("illegal target for annotation", start);
    }
    pos_++;
    ParseTest();
    if (!AcceptOp("=")) return std::make_unique<SimpleStmt>(StmtKind::PASS, line);
    auto stmt = std::make_unique<AssignStmt>(line);
    stmt->targets.push_back(std::move(first));
    stmt->value = ParseTestListStarExpr();
    return stmt;
  }
  if (first->kind == ExprKind::STARRED) Fail("can't use starred expression here", start);
  return std::make_unique<ExprStmt>(line, std::move(first));
}

void Parser::CheckTarget(const Expr* target, bool del) const {
  const char* what = "expression";
  switch (target->kind) {
    case ExprKind::NAME:
    case ExprKind::ATTRIBUTE:
    case ExprKind::SUBSCRIPT:
      return;
    case ExprKind::TUPLE:
    case ExprKind::LIST: {
      int starred = 0;
      for (auto& elt : static_cast<const SequenceExpr*>(target)->elts) {
        if (elt->kind != ExprKind::STARRED || del) {
          CheckTarget(elt.get(), del);
          continue;
        }
        if (++starred > 1) {
          throw SyntaxError("multiple starred expressions in assignment", elt->line, 1,
                            SourceLine(source_, elt->line));
        }
        CheckTarget(static_cast<const StarredExpr*>(elt.get())->value.get(), del);
      }
      return;
    }
    case ExprKind::CONSTANT:
    case ExprKind::FSTRING:
      what = "literal";
      break;
    case ExprKind::CALL:
      what = "function call";
      break;
    case ExprKind::STARRED:
      what = "starred";
      break;
    default:
      break;
  }
  throw SyntaxError(fmt::format("cannot {} {}", del ? "delete" : "assign to", what),
                    target->line, 1, SourceLine(source_, target->line));
}

// --- expressions ---

ExprPtr Parser::ParseTestListStarExpr() {
  int line = Cur().line;
  ExprPtr first = ParseStarOrTest();
  if (!IsOp(",")) return first;
  auto tuple = std::make_unique<SequenceExpr>(ExprKind::TUPLE, line);
  tuple->elts.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (!CanStartExpression()) break;
    tuple->elts.push_back(ParseStarOrTest());
  }
  return tuple;
}

ExprPtr Parser::ParseStarOrTest() {
  int line = Cur().line;
  if (AcceptOp("*")) return std::make_unique<StarredExpr>(line, ParseBitOr());
  return ParseTest();
}

ExprPtr Parser::ParseNamedExprTest() {
  if (Cur().type == TokenType::NAME && Next().type == TokenType::OP && Next().text == ":=") {
    int line = Cur().line;
    std::string name = ExpectName();
    pos_++;
    return std::make_unique<NamedExpr>(line, std::move(name), ParseTest());
  }
  return ParseTest();
}

ExprPtr Parser::ParseTest() {
  NestingGuard guard(depth_);
  Enter();
  if (IsKeyword("lambda")) return ParseLambda();
  int line = Cur().line;
  ExprPtr body = ParseOrTest();
  if (!IsKeyword("if")) return body;
  pos_++;
  auto expr = std::make_unique<IfExpExpr>(line);
  expr->body = std::move(body);
  expr->test = ParseOrTest();
  ExpectKeyword("else");
  expr->orelse = ParseTest();
  return expr;
}

ExprPtr Parser::ParseLambda() {
  int line = Cur().line;
  pos_++;
  auto expr = std::make_unique<LambdaExpr>(line);
  expr->def = std::make_unique<FunctionDef>();
  FunctionDef& def = *expr->def;
  def.name = "<lambda>";
  def.line = line;
  ParseParams(":", false, def.params);
  ExpectOp(":");
  int saved_loop_depth = loop_depth_;
  loop_depth_ = 0;
  function_depth_++;
  ExprPtr body = ParseTest();
  function_depth_--;
  loop_depth_ = saved_loop_depth;
  def.body.push_back(std::make_unique<ReturnStmt>(line, std::move(body)));
  AnalyzeScope(def);
  return expr;
}

ExprPtr Parser::ParseOrTest() {
  int line = Cur().line;
  ExprPtr first = ParseAndTest();
  if (!IsKeyword("or")) return first;
  auto expr = std::make_unique<BoolOpExpr>(line, false);
  expr->values.push_back(std::move(first));
  while (AcceptKeyword("or")) expr->values.push_back(ParseAndTest());
  return expr;
}

ExprPtr Parser::ParseAndTest() {
  int line = Cur().line;
  ExprPtr first = ParseNotTest();
  if (!IsKeyword("and")) return first;
  auto expr = std::make_unique<BoolOpExpr>(line, true);
  expr->values.push_back(std::move(first));
  while (AcceptKeyword("and")) expr->values.push_back(ParseNotTest());
  return expr;
}

ExprPtr Parser::ParseNotTest() {
  int line = Cur().line;
  if (AcceptKeyword("not")) {
    NestingGuard guard(depth_);
    Enter();
    return std::make_unique<UnaryExpr>(line, UnaryOp::NOT, ParseNotTest());
  }
  return ParseComparison();
}

ExprPtr Parser::ParseComparison() {
  int line = Cur().line;
  ExprPtr left = ParseBitOr();
  std::unique_ptr<CompareExpr> expr;
  while (true) {
    CompareOp op;
    const Token& tok = Cur();
    if (tok.type == TokenType::OP) {
      if (tok.text == "==") op = CompareOp::EQ;
      else if (tok.text == "!=") op = CompareOp::NE;
      else if (tok.text == "<") op = CompareOp::LT;
      else if (tok.text == "<=") op = CompareOp::LE;
      else if (tok.text == ">") op = CompareOp::GT;
      else if (tok.text == ">=") op = CompareOp::GE;
      else break;
      pos_++;
    } else if (IsKeyword("in")) {
      op = CompareOp::IN;
      pos_++;
    } else if (IsKeyword("not") && Next().type == TokenType::NAME && Next().text == "in") {
      op = CompareOp::NOT_IN;
      pos_ += 2;
    } else if (IsKeyword("is")) {
      pos_++;
      op = AcceptKeyword("not") ? CompareOp::IS_NOT : CompareOp::IS;
    } else {
      break;
    }
    if (!expr) expr = std::make_unique<CompareExpr>(line, std::move(left));
    expr->ops.push_back(op);
    expr->comparators.push_back(ParseBitOr());
  }
  if (!expr) return left;
  return expr;
}

#define BINARY_LEVEL(NAME, NEXT, ...) \
  ExprPtr Parser::NAME() { \
    NestingGuard guard(depth_); \
    ExprPtr left = NEXT(); \
    while (Cur().type == TokenType::OP) { \
      const struct { const char* symbol; BinaryOp op; } ops[] = {__VA_ARGS__}; \
      bool matched = false; \
      for (auto& entry : ops) { \
        if (Cur().text != entry.symbol) continue; \
        int line = Cur().line; \
        pos_++; \
        Enter(); \
        left = std::make_unique<BinaryExpr>(line, entry.op, std::move(left), NEXT()); \
        matched = true; \
        break; \
      } \
      if (!matched) break; \
    } \
    return left; \
  }

BINARY_LEVEL(ParseBitOr, ParseBitXor, {"|", BinaryOp::BIT_OR})
BINARY_LEVEL(ParseBitXor, ParseBitAnd, {"^", BinaryOp::BIT_XOR})
BINARY_LEVEL(ParseBitAnd, ParseShift, {"&", BinaryOp::BIT_AND})
BINARY_LEVEL(ParseShift, ParseArith, {"<<", BinaryOp::LSHIFT}, {">>", BinaryOp::RSHIFT})
BINARY_LEVEL(ParseArith, ParseTerm, {"+", BinaryOp::ADD}, {"-", BinaryOp::SUB})
BINARY_LEVEL(ParseTerm, ParseFactor, {"*", BinaryOp::MUL}, {"/", BinaryOp::DIV},
             {"//", BinaryOp::FLOOR_DIV}, {"%", BinaryOp::MOD}, {"@", BinaryOp::MAT_MUL})

#undef BINARY_LEVEL

ExprPtr Parser::ParseFactor() {
  const Token& tok = Cur();
  if (tok.type == TokenType::OP && (tok.text == "-" || tok.text == "+" || tok.text == "~")) {
    NestingGuard guard(depth_);
    Enter();
    int line = tok.line;
    UnaryOp op = tok.text == "-" ? UnaryOp::NEG : tok.text == "+" ? UnaryOp::POS : UnaryOp::INVERT;
    pos_++;
    ExprPtr operand = ParseFactor();
    if (op == UnaryOp::NEG && operand->kind == ExprKind::CONSTANT) {
      auto& value = static_cast<ConstantExpr*>(operand.get())->value;
      if (value.IsInt() || value.IsBig()) return std::make_unique<ConstantExpr>(line, Value::Big(-value.ToMpz()));
      if (value.IsFloat()) return std::make_unique<ConstantExpr>(line, Value::Float(-value.AsFloat()));
    }
    return std::make_unique<UnaryExpr>(line, op, std::move(operand));
  }
  return ParsePower();
}

ExprPtr Parser::ParsePower() {
  ExprPtr base = ParsePrimary();
  if (IsOp("**")) {
    int line = Cur().line;
    pos_++;
    NestingGuard guard(depth_);
    Enter();
    return std::make_unique<BinaryExpr>(line, BinaryOp::POW, std::move(base), ParseFactor());
  }
  return base;
}

ExprPtr Parser::ParsePrimary() {
  if (IsKeyword("await")) Fail("'await' is not supported");
  NestingGuard guard(depth_);
  ExprPtr expr = ParseAtom();
  while (true) {
    int line = Cur().line;
    if (IsOp("(")) {
      Enter();
      auto call = std::make_unique<CallExpr>(line, std::move(expr));
      ParseCallArgs(*call);
      expr = std::move(call);
    } else if (IsOp("[")) {
      Enter();
      pos_++;
      ExprPtr index = ParseSubscript();
      ExpectOp("]");
      expr = std::make_unique<SubscriptExpr>(line, std::move(expr), std::move(index));
    } else if (IsOp(".")) {
      Enter();
      pos_++;
      expr = std::make_unique<AttributeExpr>(line, std::move(expr), ExpectName());
    } else {
      break;
    }
  }
  return expr;
}

void Parser::ParseCallArgs(CallExpr& call) {
  ExpectOp("(");
  std::unordered_set<std::string> seen_keywords;
  bool seen_keyword_unpack = false;
  while (!IsOp(")")) {
    const Token& at = Cur();
    int line = at.line;
    if (AcceptOp("*")) {
      if (seen_keyword_unpack) Fail("iterable argument unpacking follows keyword argument unpacking", at);
      call.args.push_back(std::make_unique<StarredExpr>(line, ParseTest()));
    } else if (AcceptOp("**")) {
      seen_keyword_unpack = true;
      call.keywords.push_back({"", ParseTest()});
    } else if (at.type == TokenType::NAME && Next().type == TokenType::OP && Next().text == "=") {
      std::string name = ExpectName();
      pos_++;
      if (!seen_keywords.insert(name).second) Fail(fmt::format("keyword argument repeated: {}", name), at);
      call.keywords.push_back({std::move(name), ParseTest()});
    } else {
      ExprPtr arg = ParseNamedExprTest();
      if (IsKeyword("for")) {
        auto comp = std::make_unique<ComprehensionExpr>(line, ComprehensionKind::GENERATOR);
        comp->elt = std::move(arg);
        ParseComprehensionClauses(*comp);
        arg = std::move(comp);
        bool trailing_comma = IsOp(",") && Next().type == TokenType::OP && Next().text == ")";
        if (!call.args.empty() || !call.keywords.empty() || (IsOp(",") && !trailing_comma)) {
          Fail("Generator expression must be parenthesized", at);
        }
      }
      if (!call.keywords.empty()) {
        Fail(seen_keyword_unpack ? "positional argument follows keyword argument unpacking"
                                 : "positional argument follows keyword argument", at);
      }
      call.args.push_back(std::move(arg));
    }
    if (!AcceptOp(",")) break;
  }
  ExpectOp(")");
}

ExprPtr Parser::ParseSubscript() {
  int line = Cur().line;
  ExprPtr first = ParseSliceItem();
  if (!IsOp(",")) return first;
  auto tuple = std::make_unique<SequenceExpr>(ExprKind::TUPLE, line);
  tuple->elts.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (IsOp("]")) break;
    tuple->elts.push_back(ParseSliceItem());
  }
  return tuple;
}

ExprPtr Parser::ParseSliceItem() {
  int line = Cur().line;
  ExprPtr lower;
  if (!IsOp(":")) {
    lower = ParseNamedExprTest();
    if (!IsOp(":")) return lower;
  }
  pos_++;
  auto slice = std::make_unique<SliceExpr>(line);
  slice->lower = std::move(lower);
  if (!IsOp(":") && !IsOp("]") && !IsOp(",")) slice->upper = ParseTest();
  if (AcceptOp(":")) {
    if (!IsOp("]") && !IsOp(",")) slice->step = ParseTest();
  }
  return slice;
}

ExprPtr Parser::ParseTargetList() {
  int line = Cur().line;
  auto parse_one = [&]() -> ExprPtr {
    int elt_line = Cur().line;
    if (AcceptOp("*")) return std::make_unique<StarredExpr>(elt_line, ParseBitOr());
    return ParseBitOr();
  };
  ExprPtr first = parse_one();
  ExprPtr target;
  if (IsOp(",")) {
    auto tuple = std::make_unique<SequenceExpr>(ExprKind::TUPLE, line);
    tuple->elts.push_back(std::move(first));
    while (AcceptOp(",")) {
      if (IsKeyword("in") || IsOp("=")) break;
      tuple->elts.push_back(parse_one());
    }
    target = std::move(tuple);
  } else {
    if (first->kind == ExprKind::STARRED) Fail("starred assignment target must be in a list or tuple");
    target = std::move(first);
  }
  CheckTarget(target.get(), false);
  return target;
}

void Parser::ParseComprehensionClauses(ComprehensionExpr& comp) {
  while (IsKeyword("for") || IsKeyword("async")) {
    if (IsKeyword("async")) Fail("'async' is not supported");
    pos_++;
    ComprehensionClause clause;
    clause.target = ParseTargetList();
    ExpectKeyword("in");
    clause.iter = ParseOrTest();
    while (AcceptKeyword("if")) clause.ifs.push_back(ParseOrTest());
    comp.clauses.push_back(std::move(clause));
  }
}

ExprPtr Parser::ParseAtom() {
  const Token& tok = Cur();
  int line = tok.line;
  switch (tok.type) {
    case TokenType::NAME:
      if (tok.text == "None") {
        pos_++;
        return std::make_unique<ConstantExpr>(line, Value());
      }
      if (tok.text == "True" || tok.text == "False") {
        pos_++;
        return std::make_unique<ConstantExpr>(line, Value::Bool(tok.text == "True"));
      }
      if (tok.text == "yield") Fail("'yield' is not supported");
      return std::make_unique<NameExpr>(line, ExpectName());
    case TokenType::INT:
      pos_++;
      if (tok.int_base) return std::make_unique<ConstantExpr>(line, Value::Big(mpz_class(tok.text, tok.int_base)));
      return std::make_unique<ConstantExpr>(line, Value::Int(tok.int_value));
    case TokenType::FLOAT:
      pos_++;
      return std::make_unique<ConstantExpr>(line, Value::Float(tok.float_value));
    case TokenType::STRING:
    case TokenType::FSTRING:
      return ParseStrings();
    case TokenType::OP:
      if (tok.text == "(") return ParseParenthesized();
      if (tok.text == "[") return ParseListDisplay();
      if (tok.text == "{") return ParseBraceDisplay();
      if (tok.text == "...") {
        // Ellipsis only appears as a placeholder body
        pos_++;
        return std::make_unique<ConstantExpr>(line, Value());
      }
      break;
    case TokenType::INDENT:
      Fail("unexpected indent", tok, ExcType::INDENTATION_ERROR);
    default:
      break;
  }
  Fail("invalid syntax");
}

ExprPtr Parser::ParseParenthesized() {
  int line = Cur().line;
  pos_++;
  NestingGuard guard(depth_);
  Enter();
  if (AcceptOp(")")) return std::make_unique<SequenceExpr>(ExprKind::TUPLE, line);
  if (IsKeyword("yield")) Fail("'yield' is not supported");
  const Token& first_tok = Cur();
  ExprPtr first = IsOp("*") ? ParseStarOrTest() : ParseNamedExprTest();
  if (IsKeyword("for")) {
    auto comp = std::make_unique<ComprehensionExpr>(line, ComprehensionKind::GENERATOR);
    comp->elt = std::move(first);
    ParseComprehensionClauses(*comp);
    ExpectOp(")");
    return comp;
  }
  if (!IsOp(",")) {
    ExpectOp(")");
    if (first->kind == ExprKind::STARRED) Fail("cannot use starred expression here", first_tok);
    return first;
  }
  auto tuple = std::make_unique<SequenceExpr>(ExprKind::TUPLE, line);
  tuple->elts.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (IsOp(")")) break;
    tuple->elts.push_back(ParseStarOrTest());
  }
  ExpectOp(")");
  return tuple;
}

ExprPtr Parser::ParseListDisplay() {
  int line = Cur().line;
  pos_++;
  NestingGuard guard(depth_);
  Enter();
  auto list = std::make_unique<SequenceExpr>(ExprKind::LIST, line);
  if (AcceptOp("]")) return list;
  ExprPtr first = IsOp("*") ? ParseStarOrTest() : ParseNamedExprTest();
  if (IsKeyword("for")) {
    auto comp = std::make_unique<ComprehensionExpr>(line, ComprehensionKind::LIST);
    comp->elt = std::move(first);
    ParseComprehensionClauses(*comp);
    ExpectOp("]");
    return comp;
  }
  list->elts.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (IsOp("]")) break;
    list->elts.push_back(IsOp("*") ? ParseStarOrTest() : ParseNamedExprTest());
  }
  ExpectOp("]");
  return list;
}

ExprPtr Parser::ParseBraceDisplay() {
  int line = Cur().line;
  pos_++;
  NestingGuard guard(depth_);
  Enter();
  if (AcceptOp("}")) return std::make_unique<DictExpr>(line);
  bool is_dict;
  ExprPtr first_key, first_value;
  if (AcceptOp("**")) {
    is_dict = true;
    first_value = ParseBitOr();
  } else {
    first_key = IsOp("*") ? ParseStarOrTest() : ParseNamedExprTest();
    is_dict = AcceptOp(":");
    if (is_dict) first_value = ParseTest();
  }
  if (is_dict) {
    if (first_key && IsKeyword("for")) {
      auto comp = std::make_unique<ComprehensionExpr>(line, ComprehensionKind::DICT);
      comp->elt = std::move(first_key);
      comp->value = std::move(first_value);
      ParseComprehensionClauses(*comp);
      ExpectOp("}");
      return comp;
    }
    auto dict = std::make_unique<DictExpr>(line);
    dict->keys.push_back(std::move(first_key));
    dict->values.push_back(std::move(first_value));
    while (AcceptOp(",")) {
      if (IsOp("}")) break;
      if (AcceptOp("**")) {
        dict->keys.push_back(nullptr);
        dict->values.push_back(ParseBitOr());
        continue;
      }
      dict->keys.push_back(ParseTest());
      ExpectOp(":");
      dict->values.push_back(ParseTest());
    }
    ExpectOp("}");
    return dict;
  }
  if (IsKeyword("for")) {
    auto comp = std::make_unique<ComprehensionExpr>(line, ComprehensionKind::SET);
    comp->elt = std::move(first_key);
    ParseComprehensionClauses(*comp);
    ExpectOp("}");
    return comp;
  }
  auto set = std::make_unique<SequenceExpr>(ExprKind::SET, line);
  set->elts.push_back(std::move(first_key));
  while (AcceptOp(",")) {
    if (IsOp("}")) break;
    set->elts.push_back(IsOp("*") ? ParseStarOrTest() : ParseNamedExprTest());
  }
  ExpectOp("}");
  return set;
}

ExprPtr Parser::ParseStrings() {
  int line = Cur().line;
  bool formatted = false;
  for (size_t i = pos_; tokens_[i].type == TokenType::STRING || tokens_[i].type == TokenType::FSTRING; i++) {
    if (tokens_[i].type == TokenType::FSTRING) formatted = true;
  }
  if (!formatted) {
    std::string value;
    while (Cur().type == TokenType::STRING) value += tokens_[pos_++].text;
    return std::make_unique<ConstantExpr>(line, Value::Str(std::move(value)));
  }
  auto expr = std::make_unique<FStringExpr>(line);
  while (Cur().type == TokenType::STRING || Cur().type == TokenType::FSTRING) {
    const Token& tok = tokens_[pos_++];
    if (tok.type == TokenType::STRING) {
      AppendLiteral(*expr, tok.text);
    } else {
      ParseFStringText(tok.text, tok.raw, tok, *expr);
    }
  }
  return expr;
}

void Parser::ParseFStringText(const std::string& body, bool raw, const Token& at, FStringExpr& out) {
  std::string literal;
  auto flush = [&]() {
    if (literal.empty()) return;
    if (raw) {
      AppendLiteral(out, literal);
    } else {
      auto decoded = DecodeEscapes(literal);
      if (!decoded) Fail("(unicode error) malformed \\x, \\u, \\U or \\N escape", at);
      AppendLiteral(out, *decoded);
    }
    literal.clear();
  };
  size_t n = body.size();
  for (size_t i = 0; i < n;) {
    char c = body[i];
    if (c == '}') {
      if (i + 1 < n && body[i + 1] == '}') {
        literal += '}';
        i += 2;
        continue;
      }
      Fail("f-string: single '}' is not allowed", at);
    }
    if (c != '{') {
      if (c == '\\' && !raw && i + 1 < n) {
        literal += body.substr(i, 2);
        i += 2;
      } else {
        literal += c;
        i++;
      }
      continue;
    }
    if (i + 1 < n && body[i + 1] == '{') {
      literal += '{';
      i += 2;
      continue;
    }
    flush();
    // find where the expression ends
    size_t j = i + 1;
    int nesting = 0;
    char quote = 0;
    for (; j < n; j++) {
      char d = body[j];
      if (quote) {
        if (d == '\\') {
          j++;
        } else if (d == quote) {
          quote = 0;
        }
        continue;
      }
      if (d == '\'' || d == '"') {
        quote = d;
      } else if (d == '(' || d == '[' || d == '{') {
        nesting++;
      } else if (d == ')' || d == ']' || d == '}') {
        if (nesting == 0) break;
        nesting--;
      } else if (nesting == 0 && d == '!' && j + 1 < n && body[j + 1] == '=') {
        j++;
      } else if (nesting == 0 && (d == '!' || d == ':')) {
        break;
      }
    }
    if (j >= n) Fail("f-string: expecting '}'", at);
    std::string text = body.substr(i + 1, j - i - 1);
    FStringPart part;
    bool debug = false;
    std::string trimmed = text;
    while (!trimmed.empty() && std::strchr(" \t\n\r", trimmed.back())) trimmed.pop_back();
    if (!trimmed.empty() && trimmed.back() == '=') {
      char prev = trimmed.size() > 1 ? trimmed[trimmed.size() - 2] : 0;
      if (prev != '=' && prev != '!' && prev != '<' && prev != '>') {
        debug = true;
        AppendLiteral(out, text);
        text = trimmed.substr(0, trimmed.size() - 1);
      }
    }
    if (Strip(text).empty()) Fail("f-string: valid expression required before '}'", at);
    part.expr = ParseFStringReplacement(text, at);
    if (body[j] == '!') {
      if (j + 1 >= n || !std::strchr("rsa", body[j + 1]) || body[j + 1] == '\0') {
        Fail("f-string: invalid conversion character: expected 's', 'r', or 'a'", at);
      }
      part.conversion = body[j + 1];
      j += 2;
    }
    if (j < n && body[j] == ':') {
      size_t k = j + 1;
      int spec_nesting = 0;
      for (; k < n; k++) {
        if (body[k] == '{') {
          spec_nesting++;
        } else if (body[k] == '}') {
          if (spec_nesting == 0) break;
          spec_nesting--;
        }
      }
      if (k >= n) Fail("f-string: expecting '}'", at);
      auto spec = std::make_unique<FStringExpr>(at.line);
      ParseFStringText(body.substr(j + 1, k - j - 1), raw, at, *spec);
      part.spec = std::move(spec);
      j = k;
    }
    if (j >= n || body[j] != '}') Fail("f-string: expecting '}'", at);
    if (debug && !part.conversion && !part.spec) part.conversion = 'r';
    out.parts.push_back(std::move(part));
    i = j + 1;
  }
  flush();
}

ExprPtr Parser::ParseFStringReplacement(const std::string& text, const Token& at) {
  std::string source = "(" + text + ")";
  Lexer lexer(source);
  std::vector<Token> tokens = lexer.Tokenize();
  for (auto& tok : tokens) {
    tok.line = at.line;
    tok.column = at.column;
  }
  Parser sub(source_, std::move(tokens));
  sub.depth_ = depth_;
  sub.function_depth_ = function_depth_;
  ExprPtr expr = sub.ParseTestListStarExpr();
  if (sub.Cur().type != TokenType::NEWLINE) sub.Fail("f-string: invalid syntax");
  return expr;
}

Module Parse(const std::string& source) {
  Lexer lexer(source);
  Parser parser(source, lexer.Tokenize());
  return parser.ParseModule();
}

} // namespace interp
