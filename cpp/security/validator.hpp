#ifndef SECURITY_VALIDATOR_HPP
#define SECURITY_VALIDATOR_HPP

#include <string>
#include <vector>

#include "security/parser.hpp"
#include "security/policy.hpp"
#include "security/tier.hpp"

namespace security {

enum class Severity { NONE, LOW, MEDIUM, HIGH, CRITICAL };

enum class ViolationKind {
  DENIED_PATTERN,
  RESTRICTED_IMPORT,
  UNKNOWN_IMPORT,
  SYNTAX_ERROR,
  NETWORK_NOT_ALLOWED,
  UNSUPPORTED_LANGUAGE,
};

const char* SeverityName(Severity severity);
const char* ViolationKindName(ViolationKind kind);

struct Violation {
  ViolationKind kind;
  // Module or pattern name the violation is about.
  std::string subject;
  std::string description;
  // 1-based, 0 when unknown.
  int line = 0;
};

struct SecurityCheckResult {
  bool passed = true;
  std::vector<Violation> violations;
  Severity severity = Severity::NONE;
  std::string remediation;
};

// Static analysis of untrusted programs. Pure: no side effects, and the same
// input always yields the same result. Thread safe.
class Validator {
 public:
  explicit Validator(const Parser* parser,
                     const Policy* policy = &Policy::Default())
      : parser_(*parser), policy_(*policy) {}

  SecurityCheckResult Validate(const std::string& code,
                               const std::string& language, Tier tier,
                               bool network_requested = false) const;
  SecurityCheckResult Validate(const std::string& code, Tier tier) const {
    return Validate(code, "python", tier);
  }

  static const constexpr char* kLanguage = "python";
  // More than this many violations raise the severity to medium.
  static const constexpr size_t kMediumThreshold = 3;

 private:
  void ScanPatterns(const std::string& code,
                    std::vector<Violation>* violations) const;
  void CheckImports(const ParseResult& parsed, Tier tier,
                    std::vector<Violation>* violations) const;
  void CheckWriteOpens(const ParseResult& parsed,
                       std::vector<Violation>* violations) const;

  const Parser& parser_;
  const Policy& policy_;
};

}  // namespace security

#endif
