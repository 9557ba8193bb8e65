#ifndef EXECBOX_LEXER_H_
#define EXECBOX_LEXER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace interp {

enum class TokenType { NAME, INT, FLOAT, STRING, FSTRING, OP, NEWLINE, INDENT, DEDENT, END };

struct Token {
  TokenType type;
  // NAME/OP: the text; STRING: the decoded value; FSTRING: the undecoded body
  std::string text;
  int64_t int_value = 0;
  int int_base = 0; // INT beyond int64_t: the digits are in text
  double float_value = 0;
  bool raw = false; // FSTRING only
  int line = 0;
  int column = 0; // 1-based
};

class Lexer {
  const std::string& source_;
  size_t pos_;
  int line_;
  size_t line_start_;
  bool at_line_start_;
  std::vector<int> indents_;
  struct Bracket {
    char ch;
    int line, column;
  };
  std::vector<Bracket> brackets_;
  std::vector<Token> tokens_;

  char Peek(size_t off = 0) const {
    return pos_ + off < source_.size() ? source_[pos_ + off] : '\0';
  }
  bool AtEnd() const { return pos_ >= source_.size(); }
  int Column() const { return pos_ - line_start_ + 1; }
  void NewLine();
  void Push(TokenType type, std::string text, int column);
  [[noreturn]] void Fail(const std::string& detail, int line, int column) const;

  bool HandleIndentation();
  void ReadName();
  void ReadNumber();
  // int_value, or int_base when the digits exceed int64_t
  static void SetIntValue(Token& tok, int base);
  void ReadString(const std::string& prefix, int column);
  void ReadOperator();
 public:
  explicit Lexer(const std::string& source);
  // throws ScriptError (SyntaxError, IndentationError)
  std::vector<Token> Tokenize();
};

// 1-based; empty if out of range
std::string SourceLine(const std::string& source, int line);

// Processes backslash escapes of a non-raw literal. nullopt on a malformed escape.
std::optional<std::string> DecodeEscapes(const std::string& body);

} // namespace interp

#endif  // EXECBOX_LEXER_H_
