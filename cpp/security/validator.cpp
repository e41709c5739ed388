#include "security/validator.hpp"

#include <set>
#include <sstream>

#include <kj/debug.h>

#include "util/misc.hpp"

namespace security {
namespace {

bool IsRestrictedClass(ViolationKind kind) {
  return kind == ViolationKind::RESTRICTED_IMPORT ||
         kind == ViolationKind::NETWORK_NOT_ALLOWED ||
         kind == ViolationKind::UNSUPPORTED_LANGUAGE;
}

Severity ComputeSeverity(const std::vector<Violation>& violations) {
  bool critical = false;
  bool restricted = false;
  for (const Violation& v : violations) {
    if (v.kind == ViolationKind::DENIED_PATTERN) critical = true;
    if (IsRestrictedClass(v.kind)) restricted = true;
  }
  if (critical) return Severity::CRITICAL;
  if (restricted) return Severity::HIGH;
  if (violations.size() > Validator::kMediumThreshold) return Severity::MEDIUM;
  if (!violations.empty()) return Severity::LOW;
  return Severity::NONE;
}

// Names of the modules or patterns involved in violations of a kind, in
// first-seen order.
std::vector<std::string> Subjects(const std::vector<Violation>& violations,
                                  ViolationKind kind) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (const Violation& v : violations) {
    if (v.kind != kind) continue;
    if (seen.insert(v.subject).second) out.push_back(v.subject);
  }
  return out;
}

std::string Remediation(const std::vector<Violation>& violations) {
  std::vector<std::string> parts;
  auto denied = Subjects(violations, ViolationKind::DENIED_PATTERN);
  if (!denied.empty()) {
    parts.push_back("Remove the forbidden operations (" +
                    util::join(denied, ", ") +
                    "); they are never permitted inside the sandbox.");
  }
  auto restricted =
      Subjects(violations, ViolationKind::RESTRICTED_IMPORT);
  if (!restricted.empty()) {
    parts.push_back("Modules " + util::join(restricted, ", ") +
                    " need Head of Council authorization; use allow-listed "
                    "modules such as json, math, numpy or pandas instead.");
  }
  auto unknown = Subjects(violations, ViolationKind::UNKNOWN_IMPORT);
  if (!unknown.empty()) {
    parts.push_back("Modules " + util::join(unknown, ", ") +
                    " are not on the allow-list; replace them or ask for "
                    "them to be reviewed.");
  }
  for (size_t i = 0; i < violations.size(); i++) {
    if (violations[i].kind == ViolationKind::SYNTAX_ERROR) {
      parts.push_back("Fix the syntax error" +
                      (violations[i].line
                           ? " at line " + std::to_string(violations[i].line)
                           : std::string()) +
                      ".");
    }
  }
  if (!Subjects(violations, ViolationKind::NETWORK_NOT_ALLOWED).empty()) {
    parts.push_back(
        "Network access needs Council tier or above; run without network "
        "and pass the data as input instead.");
  }
  if (!Subjects(violations, ViolationKind::UNSUPPORTED_LANGUAGE).empty()) {
    parts.push_back("Submit the program as Python.");
  }
  return util::join(parts, " ");
}

}  // namespace

const char* SeverityName(Severity severity) {
  switch (severity) {
    case Severity::NONE:
      return "none";
    case Severity::LOW:
      return "low";
    case Severity::MEDIUM:
      return "medium";
    case Severity::HIGH:
      return "high";
    case Severity::CRITICAL:
      return "critical";
  }
  return "critical";
}

const char* ViolationKindName(ViolationKind kind) {
  switch (kind) {
    case ViolationKind::DENIED_PATTERN:
      return "denied_pattern";
    case ViolationKind::RESTRICTED_IMPORT:
      return "restricted_import";
    case ViolationKind::UNKNOWN_IMPORT:
      return "unknown_import";
    case ViolationKind::SYNTAX_ERROR:
      return "syntax_error";
    case ViolationKind::NETWORK_NOT_ALLOWED:
      return "network_not_allowed";
    case ViolationKind::UNSUPPORTED_LANGUAGE:
      return "unsupported_language";
  }
  return "unknown";
}

void Validator::ScanPatterns(const std::string& code,
                             std::vector<Violation>* violations) const {
  for (const DenyPattern& pattern : policy_.DenyPatterns()) {
    std::istringstream lines(code);
    std::string line;
    int lineno = 0;
    while (std::getline(lines, line)) {
      lineno++;
      if (std::regex_search(line, pattern.regex)) {
        violations->push_back({ViolationKind::DENIED_PATTERN, pattern.name,
                               "Forbidden pattern " + pattern.name + ": " +
                                   pattern.description,
                               lineno});
        break;
      }
    }
  }
}

void Validator::CheckImports(const ParseResult& parsed, Tier tier,
                             std::vector<Violation>* violations) const {
  std::set<std::string> reported;
  for (const ImportRef& ref : parsed.imports) {
    std::string justification;
    ModuleClass cls =
        ref.relative ? ModuleClass::UNKNOWN
                     : policy_.Classify(ref.module, &justification);
    if (cls == ModuleClass::ALLOWED) continue;
    if (cls == ModuleClass::RESTRICTED && tier == Tier::HEAD_OF_COUNCIL) {
      continue;
    }
    if (!reported.insert(ref.module).second) continue;
    if (cls == ModuleClass::RESTRICTED) {
      violations->push_back(
          {ViolationKind::RESTRICTED_IMPORT, ref.module,
           "Restricted import " + ref.module + ": " + justification,
           ref.line});
    } else if (ref.relative) {
      violations->push_back({ViolationKind::UNKNOWN_IMPORT, ref.module,
                             "Relative import " + ref.module +
                                 " is not allowed",
                             ref.line});
    } else {
      violations->push_back({ViolationKind::UNKNOWN_IMPORT, ref.module,
                             "Import " + ref.module +
                                 " is not on the allow-list",
                             ref.line});
    }
  }
}

// The line scan misses calls split across lines or with a computed path, so
// open calls are also checked on the syntax tree.
void Validator::CheckWriteOpens(const ParseResult& parsed,
                                std::vector<Violation>* violations) const {
  if (parsed.write_opens.empty()) return;
  for (const Violation& v : *violations) {
    if (v.kind == ViolationKind::DENIED_PATTERN &&
        v.subject == kWriteOpenPattern) {
      return;
    }
  }
  const WriteOpenRef& ref = parsed.write_opens.front();
  violations->push_back(
      {ViolationKind::DENIED_PATTERN, kWriteOpenPattern,
       std::string("Forbidden pattern ") + kWriteOpenPattern + ": " + ref.call +
           " may open a file for writing",
       ref.line});
}

SecurityCheckResult Validator::Validate(const std::string& code,
                                        const std::string& language, Tier tier,
                                        bool network_requested) const {
  SecurityCheckResult result;
  if (language != kLanguage) {
    result.violations.push_back({ViolationKind::UNSUPPORTED_LANGUAGE, language,
                                 "Unsupported language " + language, 0});
  }
  ScanPatterns(code, &result.violations);
  if (language == kLanguage) {
    ParseResult parsed = parser_.Parse(code);
    CheckImports(parsed, tier, &result.violations);
    CheckWriteOpens(parsed, &result.violations);
    if (!parsed.ok) {
      result.violations.push_back({ViolationKind::SYNTAX_ERROR, "syntax",
                                   "Syntax error: " + parsed.error,
                                   parsed.error_line});
    }
  }
  if (network_requested && !AtLeast(tier, Tier::COUNCIL)) {
    result.violations.push_back(
        {ViolationKind::NETWORK_NOT_ALLOWED, "network",
         std::string("Network access is not allowed for tier ") +
             TierName(tier),
         0});
  }

  result.passed = result.violations.empty();
  result.severity = ComputeSeverity(result.violations);
  result.remediation = Remediation(result.violations);
  if (!result.passed) {
    KJ_LOG(INFO, "Program rejected", SeverityName(result.severity),
           result.violations.size());
  }
  return result;
}

}  // namespace security
