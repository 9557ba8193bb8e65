#ifndef INCLUDE_EXECBOX_POLICY_H_
#define INCLUDE_EXECBOX_POLICY_H_

#include <string>
#include <vector>
#include <optional>

// Checked in this order; the first match is reported
extern const std::vector<std::string> kDeniedModules;

struct PolicyViolation {
  std::string module;

  std::string Reason() const;
};

// Empty or whitespace-only snippets (anything str.strip() empties) are
// invalid input, not policy violations
bool IsBlankInput(const std::string& code);

// Textual fast-reject of "import X" / "from X" for denylisted X.
// This is not the containment boundary: aliasing or string tricks get past it,
// and it also rejects harmless text such as "import osmosis".
std::optional<PolicyViolation> CheckPolicy(const std::string& code);

#endif  // INCLUDE_EXECBOX_POLICY_H_
