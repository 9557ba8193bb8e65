#ifndef EXECBOX_ERRORS_H_
#define EXECBOX_ERRORS_H_

#include <string>
#include <vector>
#include <exception>

namespace interp {

class ExceptionObject;

// name, Python name, base class, bound as a builtin name
#define ENUM_EXC_TYPE_ \
  X(BASE_EXCEPTION, "BaseException", BASE_EXCEPTION, true) \
  X(EXCEPTION, "Exception", BASE_EXCEPTION, true) \
  X(ARITHMETIC_ERROR, "ArithmeticError", EXCEPTION, true) \
  X(ZERO_DIVISION_ERROR, "ZeroDivisionError", ARITHMETIC_ERROR, true) \
  X(OVERFLOW_ERROR, "OverflowError", ARITHMETIC_ERROR, true) \
  X(ASSERTION_ERROR, "AssertionError", EXCEPTION, true) \
  X(ATTRIBUTE_ERROR, "AttributeError", EXCEPTION, true) \
  X(IMPORT_ERROR, "ImportError", EXCEPTION, true) \
  X(MODULE_NOT_FOUND_ERROR, "ModuleNotFoundError", IMPORT_ERROR, true) \
  X(LOOKUP_ERROR, "LookupError", EXCEPTION, true) \
  X(INDEX_ERROR, "IndexError", LOOKUP_ERROR, true) \
  X(KEY_ERROR, "KeyError", LOOKUP_ERROR, true) \
  X(MEMORY_ERROR, "MemoryError", EXCEPTION, true) \
  X(NAME_ERROR, "NameError", EXCEPTION, true) \
  X(UNBOUND_LOCAL_ERROR, "UnboundLocalError", NAME_ERROR, true) \
  X(OS_ERROR, "OSError", EXCEPTION, true) \
  X(TIMEOUT_ERROR, "TimeoutError", OS_ERROR, true) \
  X(RUNTIME_ERROR, "RuntimeError", EXCEPTION, true) \
  X(NOT_IMPLEMENTED_ERROR, "NotImplementedError", RUNTIME_ERROR, true) \
  X(RECURSION_ERROR, "RecursionError", RUNTIME_ERROR, true) \
  X(STOP_ITERATION, "StopIteration", EXCEPTION, true) \
  X(SYNTAX_ERROR, "SyntaxError", EXCEPTION, true) \
  X(INDENTATION_ERROR, "IndentationError", SYNTAX_ERROR, true) \
  X(TYPE_ERROR, "TypeError", EXCEPTION, true) \
  X(VALUE_ERROR, "ValueError", EXCEPTION, true) \
  X(UNICODE_ERROR, "UnicodeError", VALUE_ERROR, true) \
  X(JSON_DECODE_ERROR, "JSONDecodeError", VALUE_ERROR, false)
enum class ExcType {
#define X(name, pyname, base, builtin) name,
  ENUM_EXC_TYPE_
#undef X
};

const char* ExcTypeName(ExcType);
ExcType ExcTypeBase(ExcType);
bool ExcTypeIsBuiltin(ExcType);
bool IsSubtype(ExcType type, ExcType base);

// identical consecutive frames printed before collapsing the rest
extern const size_t kTracebackRepeats;

// Counted reference to the instance a ScriptError carries (value.cpp)
class ExceptionRef {
  ExceptionObject* obj_;
 public:
  ExceptionRef() : obj_(nullptr) {}
  ExceptionRef(const ExceptionRef& other);
  ExceptionRef& operator=(const ExceptionRef& other);
  ~ExceptionRef();

  void Reset(ExceptionObject* obj);
  ExceptionObject* get() const { return obj_; }
};

struct Frame {
  std::string function;
  int line;
};

// A Python-level exception unwinding through the interpreter.
class ScriptError : public std::exception {
 public:
  ExcType type;
  std::string message; // str(exc)
  ExceptionRef value; // the instance seen by `except ... as e`, created on demand
  std::vector<Frame> traceback;
  bool traceback_set;
  // resource limits; `except` clauses never match these
  bool fatal;

  // syntax errors only
  int line;
  int column;
  std::string source_line;
  std::string detail;

  ScriptError(ExcType type, std::string message) :
      type(type), message(std::move(message)),
      traceback_set(false), fatal(false), line(0), column(0) {}

  const char* what() const noexcept override { return message.c_str(); }

  std::string FormatTraceback() const;
};

// line and column are 1-based
ScriptError SyntaxError(const std::string& detail, int line, int column,
                        const std::string& source_line,
                        ExcType type = ExcType::SYNTAX_ERROR);

} // namespace interp

#endif  // EXECBOX_ERRORS_H_
