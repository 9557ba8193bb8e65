#include "errors.h"

#include <fmt/core.h>

namespace interp {

namespace {

const char* kExcTypeNameTable[] = {
#define X(name, pyname, base, builtin) pyname,
  ENUM_EXC_TYPE_
#undef X
};

const ExcType kExcTypeBaseTable[] = {
#define X(name, pyname, base, builtin) ExcType::base,
  ENUM_EXC_TYPE_
#undef X
};

const bool kExcTypeBuiltinTable[] = {
#define X(name, pyname, base, builtin) builtin,
  ENUM_EXC_TYPE_
#undef X
};

// as a traceback prints it
const char* QualifiedName(ExcType type) {
  if (type == ExcType::JSON_DECODE_ERROR) return "json.decoder.JSONDecodeError";
  return kExcTypeNameTable[(int)type];
}

} // namespace

const size_t kTracebackRepeats = 3;

const char* ExcTypeName(ExcType type) {
  return kExcTypeNameTable[(int)type];
}

ExcType ExcTypeBase(ExcType type) {
  return kExcTypeBaseTable[(int)type];
}

bool ExcTypeIsBuiltin(ExcType type) {
  return kExcTypeBuiltinTable[(int)type];
}

bool IsSubtype(ExcType type, ExcType base) {
  while (true) {
    if (type == base) return true;
    if (type == ExcType::BASE_EXCEPTION) return false;
    type = ExcTypeBase(type);
  }
}

std::string ScriptError::FormatTraceback() const {
  std::string ret = "Traceback (most recent call last):\n";
  // runs of the same frame show three times, then a count of the rest
  size_t repeated = 0;
  auto flush = [&]() {
    if (repeated > kTracebackRepeats) {
      size_t more = repeated - kTracebackRepeats;
      ret += fmt::format("  [Previous line repeated {} more time{}]\n", more, more > 1 ? "s" : "");
    }
    repeated = 0;
  };
  for (size_t i = 0; i < traceback.size(); i++) {
    auto& frame = traceback[i];
    if (i && (frame.line != traceback[i - 1].line || frame.function != traceback[i - 1].function)) flush();
    if (++repeated <= kTracebackRepeats) {
      ret += fmt::format("  File \"<string>\", line {}, in {}\n", frame.line, frame.function);
    }
  }
  flush();
  if (IsSubtype(type, ExcType::SYNTAX_ERROR) && line > 0) {
    ret += fmt::format("  File \"<string>\", line {}\n", line);
    // strip leading whitespace from the echoed line, moving the caret along
    size_t start = source_line.find_first_not_of(" \t\f");
    if (start != std::string::npos) {
      std::string shown = source_line.substr(start);
      while (!shown.empty() && (shown.back() == '\n' || shown.back() == '\r')) shown.pop_back();
      int caret = column - 1 - (int)start;
      if (caret < 0) caret = 0;
      if (caret > (int)shown.size()) caret = shown.size();
      ret += "    " + shown + "\n";
      ret += "    " + std::string(caret, ' ') + "^\n";
    }
    ret += fmt::format("{}: {}\n", ExcTypeName(type), detail);
    return ret;
  }
  if (message.empty()) {
    ret += fmt::format("{}\n", QualifiedName(type));
  } else {
    ret += fmt::format("{}: {}\n", QualifiedName(type), message);
  }
  return ret;
}

ScriptError SyntaxError(const std::string& detail, int line, int column,
                        const std::string& source_line, ExcType type) {
  ScriptError err(type, fmt::format("{} (<string>, line {})", detail, line));
  err.detail = detail;
  err.line = line;
  err.column = column;
  err.source_line = source_line;
  return err;
}

} // namespace interp
