#ifndef SECURITY_POLICY_HPP
#define SECURITY_POLICY_HPP

#include <map>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace security {

// A textual pattern that is never allowed, whatever the caller's tier.
struct DenyPattern {
  std::string name;
  std::regex regex;
  std::string description;
};

// Name of the rule against opening files for writing. The validator also
// enforces it on the syntax tree.
static const constexpr char* kWriteOpenPattern = "write_open";

enum class ModuleClass { ALLOWED, RESTRICTED, UNKNOWN };

// Static rules used by the validator. Classification is done on the top-level
// package of a dotted module name.
class Policy {
 public:
  // The built-in rule set. Constructed once, immutable afterwards.
  static const Policy& Default();

  const std::vector<DenyPattern>& DenyPatterns() const { return patterns_; }

  // Returns the class of the module; sets justification for restricted ones.
  ModuleClass Classify(const std::string& module,
                       std::string* justification) const;

  void AddPattern(const std::string& name, const std::string& regex,
                  const std::string& description);
  void Allow(const std::string& module);
  void Restrict(const std::string& module, const std::string& justification);

 private:
  std::vector<DenyPattern> patterns_;
  std::set<std::string> allowed_;
  std::map<std::string, std::string> restricted_;
};

}  // namespace security

#endif
