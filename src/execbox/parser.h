#ifndef EXECBOX_PARSER_H_
#define EXECBOX_PARSER_H_

#include <string>
#include <vector>

#include "ast.h"
#include "lexer.h"

namespace interp {

// Recursive descent parser producing the AST of one snippet, including
// the static scope analysis of every function body.
class Parser {
  const std::string& source_;
  std::vector<Token> tokens_;
  size_t pos_;
  int depth_; // expression nesting
  int block_depth_;
  int function_depth_;
  int loop_depth_;

  const Token& Cur() const { return tokens_[pos_]; }
  const Token& Next() const { return tokens_[pos_ + 1 < tokens_.size() ? pos_ + 1 : pos_]; }
  bool IsOp(const char* op) const;
  bool IsKeyword(const char* keyword) const;
  bool AcceptOp(const char* op);
  bool AcceptKeyword(const char* keyword);
  void ExpectOp(const char* op);
  void ExpectKeyword(const char* keyword);
  std::string ExpectName();
  bool AtStatementEnd() const;
  bool CanStartExpression() const;
  [[noreturn]] void Fail(const std::string& detail, const Token& at,
                         ExcType type = ExcType::SYNTAX_ERROR) const;
  [[noreturn]] void Fail(const std::string& detail) const { Fail(detail, Cur()); }
  void Enter();

  // statements
  void ParseStatement(StmtList& out);
  void ParseSimpleStatements(StmtList& out);
  StmtPtr ParseSmallStatement();
  StmtPtr ParseExpressionStatement();
  StmtList ParseBlock(const std::string& what, int header_line);
  StmtPtr ParseIf();
  StmtPtr ParseWhile();
  StmtPtr ParseFor();
  StmtPtr ParseTry();
  StmtPtr ParseFunctionDef(std::vector<ExprPtr> decorators);
  StmtPtr ParseClassDef();
  StmtPtr ParseImport();
  StmtPtr ParseImportFrom();
  void ParseParams(const char* closer, bool annotations, std::vector<Param>& params);
  void CheckTarget(const Expr* target, bool del) const;

  // expressions, loosest binding first
  ExprPtr ParseTestListStarExpr();
  ExprPtr ParseStarOrTest();
  ExprPtr ParseNamedExprTest();
  ExprPtr ParseTest();
  ExprPtr ParseLambda();
  ExprPtr ParseOrTest();
  ExprPtr ParseAndTest();
  ExprPtr ParseNotTest();
  ExprPtr ParseComparison();
  ExprPtr ParseBitOr();
  ExprPtr ParseBitXor();
  ExprPtr ParseBitAnd();
  ExprPtr ParseShift();
  ExprPtr ParseArith();
  ExprPtr ParseTerm();
  ExprPtr ParseFactor();
  ExprPtr ParsePower();
  ExprPtr ParsePrimary();
  ExprPtr ParseAtom();
  ExprPtr ParseParenthesized();
  ExprPtr ParseListDisplay();
  ExprPtr ParseBraceDisplay();
  ExprPtr ParseStrings();
  ExprPtr ParseSubscript();
  ExprPtr ParseSliceItem();
  ExprPtr ParseTargetList();
  void ParseCallArgs(CallExpr& call);
  void ParseComprehensionClauses(ComprehensionExpr& comp);
  void ParseFStringText(const std::string& body, bool raw, const Token& at, FStringExpr& out);
  ExprPtr ParseFStringReplacement(const std::string& text, const Token& at);
 public:
  Parser(const std::string& source, std::vector<Token> tokens);
  Module ParseModule();
};

// throws ScriptError (SyntaxError, IndentationError)
Module Parse(const std::string& source);

} // namespace interp

#endif  // EXECBOX_PARSER_H_
