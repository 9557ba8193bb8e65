#include "execbox/policy.h"

#include <cstring>

#include <fmt/core.h>

const std::vector<std::string> kDeniedModules = {"os", "subprocess", "sys", "shutil", "glob"};

std::string PolicyViolation::Reason() const {
  return fmt::format("Import of {} is not allowed for security reasons", module);
}

namespace {

// str.isspace() beyond ASCII, as UTF-8
const char* kUnicodeSpaces[] = {
  "\xc2\x85", "\xc2\xa0", "\xe1\x9a\x80", "\xe2\x80\x80", "\xe2\x80\x81", "\xe2\x80\x82",
  "\xe2\x80\x83", "\xe2\x80\x84", "\xe2\x80\x85", "\xe2\x80\x86", "\xe2\x80\x87", "\xe2\x80\x88",
  "\xe2\x80\x89", "\xe2\x80\x8a", "\xe2\x80\xa8", "\xe2\x80\xa9", "\xe2\x80\xaf", "\xe2\x81\x9f",
  "\xe3\x80\x80",
};

size_t SpaceLength(const std::string& code, size_t pos) {
  unsigned char c = code[pos];
  if (c == ' ' || (c >= '\t' && c <= '\r') || (c >= 0x1c && c <= 0x1f)) return 1;
  for (const char* space : kUnicodeSpaces) {
    if (code.compare(pos, strlen(space), space) == 0) return strlen(space);
  }
  return 0;
}

} // namespace

bool IsBlankInput(const std::string& code) {
  size_t pos = 0;
  while (pos < code.size()) {
    size_t length = SpaceLength(code, pos);
    if (!length) return false;
    pos += length;
  }
  return true;
}

std::optional<PolicyViolation> CheckPolicy(const std::string& code) {
  for (auto& module : kDeniedModules) {
    if (code.find("import " + module) != std::string::npos ||
        code.find("from " + module) != std::string::npos) {
      return PolicyViolation{module};
    }
  }
  return std::nullopt;
}
