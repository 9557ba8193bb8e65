#include "lexer.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

#include <fmt/core.h>

#include "errors.h"
#include "format.h"
#include "value.h"

namespace interp {

namespace {

const char* kOperators3[] = {"**=", "//=", ">>=", "<<=", "..."};
const char* kOperators2[] = {
  "**", "//", "==", "!=", "<=", ">=", "<<", ">>", "+=", "-=", "*=", "/=",
  "%=", "&=", "|=", "^=", "->", ":=", "@=",
};
const char kOperators1[] = "+-*/%<>=()[]{},:.;@&|^~";

bool IsNameChar(char c) {
  return std::isalnum((unsigned char)c) || c == '_' || (unsigned char)c >= 0x80;
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string SourceLine(const std::string& source, int line) {
  size_t start = 0;
  for (int i = 1; i < line; i++) {
    start = source.find('\n', start);
    if (start == std::string::npos) return "";
    start++;
  }
  size_t end = source.find('\n', start);
  if (end == std::string::npos) end = source.size();
  return source.substr(start, end - start);
}

std::optional<std::string> DecodeEscapes(const std::string& body) {
  std::string out;
  out.reserve(body.size());
  size_t n = body.size();
  for (size_t i = 0; i < n;) {
    char c = body[i];
    if (c != '\\') {
      out += c;
      i++;
      continue;
    }
    if (i + 1 >= n) {
      out += '\\';
      break;
    }
    char e = body[i + 1];
    i += 2;
    switch (e) {
      case '\n': break;
      case '\\': out += '\\'; break;
      case '\'': out += '\''; break;
      case '"': out += '"'; break;
      case 'a': out += '\a'; break;
      case 'b': out += '\b'; break;
      case 'f': out += '\f'; break;
      case 'n': out += '\n'; break;
      case 'r': out += '\r'; break;
      case 't': out += '\t'; break;
      case 'v': out += '\v'; break;
      case '0': case '1': case '2': case '3':
      case '4': case '5': case '6': case '7': {
        uint32_t cp = e - '0';
        for (int k = 0; k < 2 && i < n && body[i] >= '0' && body[i] <= '7'; k++, i++) {
          cp = cp * 8 + (body[i] - '0');
        }
        AppendUtf8(out, cp);
        break;
      }
      case 'x': case 'u': case 'U': {
        int digits = e == 'x' ? 2 : e == 'u' ? 4 : 8;
        uint32_t cp = 0;
        for (int k = 0; k < digits; k++, i++) {
          int d = i < n ? HexDigit(body[i]) : -1;
          if (d < 0) return std::nullopt;
          cp = cp * 16 + d;
        }
        if (cp > 0x10FFFF) return std::nullopt;
        AppendUtf8(out, cp);
        break;
      }
      case 'N':
        return std::nullopt;
      default:
        out += '\\';
        out += e;
    }
  }
  return out;
}

Lexer::Lexer(const std::string& source) :
    source_(source), pos_(0), line_(1), line_start_(0), at_line_start_(true), indents_{0} {}

void Lexer::NewLine() {
  if (Peek() == '\r' && Peek(1) == '\n') {
    pos_ += 2;
  } else {
    pos_++;
  }
  line_++;
  line_start_ = pos_;
}

void Lexer::Push(TokenType type, std::string text, int column) {
  Token token;
  token.type = type;
  token.text = std::move(text);
  token.line = line_;
  token.column = column;
  tokens_.push_back(std::move(token));
}

void Lexer::Fail(const std::string& detail, int line, int column) const {
  throw SyntaxError(detail, line, column, SourceLine(source_, line));
}

bool Lexer::HandleIndentation() {
  int col = 0;
  size_t p = pos_;
  for (; p < source_.size(); p++) {
    char ch = source_[p];
    if (ch == ' ') {
      col++;
    } else if (ch == '\t') {
      col = (col / 8 + 1) * 8;
    } else if (ch == '\f') {
      col = 0;
    } else {
      break;
    }
  }
  pos_ = p;
  if (AtEnd()) return false;
  char ch = Peek();
  if (ch == '#' || ch == '\n' || ch == '\r') {
    // blank line: no tokens at all
    while (!AtEnd() && Peek() != '\n' && Peek() != '\r') pos_++;
    if (!AtEnd()) NewLine();
    return true;
  }
  if (col > indents_.back()) {
    indents_.push_back(col);
    Push(TokenType::INDENT, "", Column());
  } else {
    while (col < indents_.back()) {
      indents_.pop_back();
      Push(TokenType::DEDENT, "", Column());
    }
    if (col != indents_.back()) {
      throw SyntaxError("unindent does not match any outer indentation level",
                        line_, Column(), SourceLine(source_, line_), ExcType::INDENTATION_ERROR);
    }
  }
  at_line_start_ = false;
  return true;
}

void Lexer::ReadName() {
  int col = Column();
  size_t start = pos_;
  while (!AtEnd() && IsNameChar(Peek())) pos_++;
  std::string name = source_.substr(start, pos_ - start);
  if ((Peek() == '\'' || Peek() == '"') && name.size() <= 2) {
    std::string lower;
    for (char c : name) lower += std::tolower((unsigned char)c);
    if (lower == "r" || lower == "u" || lower == "f" || lower == "rf" || lower == "fr") {
      ReadString(lower, col);
      return;
    }
    if (lower == "b" || lower == "br" || lower == "rb") {
      Fail("bytes literals are not supported", line_, col);
    }
  }
  Push(TokenType::NAME, std::move(name), col);
}

void Lexer::SetIntValue(Token& tok, int base) {
  unsigned __int128 value = 0;
  for (char c : tok.text) {
    value = value * base + HexDigit(c);
    if (value > INT64_MAX) {
      tok.int_base = base;
      return;
    }
  }
  tok.int_value = (int64_t)value;
}

void Lexer::ReadNumber() {
  int col = Column();
  char base_char = Peek(1);
  if (Peek() == '0' && std::strchr("xXoObB", base_char) && base_char) {
    int base = (base_char == 'x' || base_char == 'X') ? 16 : (base_char == 'o' || base_char == 'O') ? 8 : 2;
    pos_ += 2;
    std::string digits;
    while (!AtEnd() && (std::isalnum((unsigned char)Peek()) || Peek() == '_')) {
      char c = Peek();
      pos_++;
      if (c == '_') continue;
      int d = HexDigit(c);
      if (d < 0 || d >= base) {
        Fail(fmt::format("invalid digit '{}' in {} literal", c,
                         base == 16 ? "hexadecimal" : base == 8 ? "octal" : "binary"), line_, Column() - 1);
      }
      digits += c;
    }
    if (digits.empty()) Fail("invalid syntax", line_, col);
    Push(TokenType::INT, digits, col);
    SetIntValue(tokens_.back(), base);
    return;
  }
  size_t start = pos_;
  bool is_float = false;
  auto read_digits = [&]() {
    while (!AtEnd() && (std::isdigit((unsigned char)Peek()) || Peek() == '_')) pos_++;
  };
  read_digits();
  if (Peek() == '.') {
    is_float = true;
    pos_++;
    read_digits();
  }
  if ((Peek() == 'e' || Peek() == 'E') &&
      (std::isdigit((unsigned char)Peek(1)) ||
       ((Peek(1) == '+' || Peek(1) == '-') && std::isdigit((unsigned char)Peek(2))))) {
    is_float = true;
    pos_ += 2;
    read_digits();
  }
  if (Peek() == 'j' || Peek() == 'J') Fail("complex literals are not supported", line_, col);
  if (IsNameChar(Peek())) Fail("invalid decimal literal", line_, Column());
  std::string text;
  for (size_t i = start; i < pos_; i++) {
    if (source_[i] != '_') text += source_[i];
  }
  Push(is_float ? TokenType::FLOAT : TokenType::INT, text, col);
  if (is_float) {
    tokens_.back().float_value = std::strtod(text.c_str(), nullptr);
    return;
  }
  if (text.size() > 1 && text[0] == '0' && text.find_first_not_of('0') != std::string::npos) {
    Fail("leading zeros in decimal integer literals are not permitted; "
         "use an 0o prefix for octal integers", line_, col);
  }
  if (text.size() > kMaxIntDigits) {
    Fail(fmt::format("Exceeds the limit ({} digits) for integer string conversion: value has {} digits; "
                     "use sys.set_int_max_str_digits() to increase the limit - "
                     "Consider hexadecimal for huge integer literals to avoid decimal conversion limits.",
                     kMaxIntDigits, text.size()), line_, col);
  }
  SetIntValue(tokens_.back(), 10);
}

void Lexer::ReadString(const std::string& prefix, int column) {
  bool raw = prefix.find('r') != std::string::npos;
  bool fstring = prefix.find('f') != std::string::npos;
  char quote = Peek();
  bool triple = Peek(1) == quote && Peek(2) == quote;
  int start_line = line_;
  pos_ += triple ? 3 : 1;
  std::string body;
  while (true) {
    if (AtEnd()) {
      Fail(fmt::format("unterminated {}string literal (detected at line {})",
                       triple ? "triple-quoted " : "", line_), start_line, column);
    }
    char c = Peek();
    if (c == quote) {
      if (!triple) {
        pos_++;
        break;
      }
      if (Peek(1) == quote && Peek(2) == quote) {
        pos_ += 3;
        break;
      }
      body += c;
      pos_++;
    } else if (c == '\\') {
      char next = Peek(1);
      if (next == '\n' || next == '\r') {
        body += "\\\n";
        pos_++;
        NewLine();
      } else if (next == '\0' && pos_ + 1 >= source_.size()) {
        pos_++;
      } else {
        body += c;
        body += next;
        pos_ += 2;
      }
    } else if (c == '\n' || c == '\r') {
      if (!triple) {
        Fail(fmt::format("unterminated string literal (detected at line {})", line_),
             start_line, column);
      }
      body += '\n';
      NewLine();
    } else {
      body += c;
      pos_++;
    }
  }
  int end_line = line_;
  line_ = start_line;
  if (fstring) {
    Push(TokenType::FSTRING, std::move(body), column);
    tokens_.back().raw = raw;
  } else if (raw) {
    Push(TokenType::STRING, std::move(body), column);
  } else {
    auto decoded = DecodeEscapes(body);
    if (!decoded) Fail("(unicode error) malformed \\x, \\u, \\U or \\N escape", start_line, column);
    Push(TokenType::STRING, std::move(*decoded), column);
  }
  line_ = end_line;
}

void Lexer::ReadOperator() {
  int col = Column();
  for (const char* op : kOperators3) {
    if (source_.compare(pos_, 3, op) == 0) {
      pos_ += 3;
      Push(TokenType::OP, op, col);
      return;
    }
  }
  for (const char* op : kOperators2) {
    if (source_.compare(pos_, 2, op) == 0) {
      pos_ += 2;
      Push(TokenType::OP, op, col);
      return;
    }
  }
  char c = Peek();
  if (!std::strchr(kOperators1, c)) {
    if (c == '!') Fail("invalid syntax", line_, col);
    size_t p = pos_;
    uint32_t cp = DecodeUtf8(source_, p);
    Fail(fmt::format("invalid character '{}' (U+{:04X})", source_.substr(pos_, p - pos_), cp), line_, col);
  }
  if (c == '(' || c == '[' || c == '{') {
    brackets_.push_back({c, line_, col});
  } else if (c == ')' || c == ']' || c == '}') {
    if (brackets_.empty()) Fail(fmt::format("unmatched '{}'", c), line_, col);
    char open = brackets_.back().ch;
    char expect = open == '(' ? ')' : open == '[' ? ']' : '}';
    if (c != expect) {
      Fail(fmt::format("closing parenthesis '{}' does not match opening parenthesis '{}'", c, open), line_, col);
    }
    brackets_.pop_back();
  }
  pos_++;
  Push(TokenType::OP, std::string(1, c), col);
}

std::vector<Token> Lexer::Tokenize() {
  while (true) {
    if (at_line_start_ && brackets_.empty()) {
      if (!HandleIndentation()) break;
      continue;
    }
    if (AtEnd()) break;
    char c = Peek();
    if (c == ' ' || c == '\t' || c == '\f') {
      pos_++;
    } else if (c == '#') {
      while (!AtEnd() && Peek() != '\n' && Peek() != '\r') pos_++;
    } else if (c == '\\') {
      if (Peek(1) != '\n' && Peek(1) != '\r') {
        Fail("unexpected character after line continuation character", line_, Column());
      }
      pos_++;
      NewLine();
    } else if (c == '\n' || c == '\r') {
      if (brackets_.empty()) {
        Push(TokenType::NEWLINE, "", Column());
        at_line_start_ = true;
      }
      NewLine();
    } else if (std::isdigit((unsigned char)c) || (c == '.' && std::isdigit((unsigned char)Peek(1)))) {
      ReadNumber();
    } else if (IsNameChar(c)) {
      ReadName();
    } else if (c == '\'' || c == '"') {
      ReadString("", Column());
    } else {
      ReadOperator();
    }
  }
  if (!brackets_.empty()) {
    auto& open = brackets_.back();
    Fail(fmt::format("'{}' was never closed", open.ch), open.line, open.column);
  }
  if (!tokens_.empty() && tokens_.back().type != TokenType::NEWLINE &&
      tokens_.back().type != TokenType::DEDENT) {
    Push(TokenType::NEWLINE, "", Column());
  }
  while (indents_.size() > 1) {
    indents_.pop_back();
    Push(TokenType::DEDENT, "", 1);
  }
  Push(TokenType::END, "", 1);
  return std::move(tokens_);
}

} // namespace interp
