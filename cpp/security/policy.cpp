#include "security/policy.hpp"

#include <memory>

namespace security {
namespace {

struct PatternSpec {
  const char* name;
  const char* regex;
  const char* description;
};

// Patterns are matched one line at a time. Repetitions are bounded to keep
// matching linear on long lines.
const PatternSpec kPatterns[] = {
    {"rm_rf", R"(\brm\s+-[a-zA-Z]{0,8}([rR][a-zA-Z]{0,8}[fF]|[fF][a-zA-Z]{0,8}[rR]))",
     "recursive forced deletion (rm -rf)"},
    {"rmtree", R"(\bshutil\s*\.\s*rmtree\b)", "recursive directory deletion"},
    {"mkfs", R"(\bmkfs(\.[a-z0-9]+)?\b)", "filesystem formatting"},
    {"dd", R"(\bdd\s+if=)", "raw device copy (dd)"},
    {"fork_bomb", R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)",
     "fork bomb"},
    {"os_process",
     R"(\bos\s*\.\s*(system|popen|spawn[a-z]{0,3}|exec[a-z]{0,3}|fork|forkpty|kill|killpg)\s*\()",
     "process execution or signalling through os"},
    {"os_delete", R"(\bos\s*\.\s*(remove|unlink|rmdir|removedirs)\s*\()",
     "file deletion through os"},
    {"subprocess", R"(\bsubprocess\s*\.)", "process spawning through subprocess"},
    {"dynamic_eval", R"((^|[^\w.])(eval|exec|compile)\s*\()",
     "dynamic code evaluation"},
    {"dunder_import", R"(\b__import__\s*\()", "dynamic import"},
    {"import_module", R"(\bimportlib\s*\.\s*import_module\b)", "dynamic import"},
    {"write_open",
     R"(\bopen\s*\([^)]{0,256},\s*(mode\s*=\s*)?[rbu]{0,2}['"][rbt]{0,2}[wax+])",
     "opening a file for writing"},
    {"interpreter_internals",
     R"(__(subclasses|globals|builtins|code|closure)__)",
     "access to interpreter internals"},
};

const char* kAllowed[] = {
    "__future__", "abc",        "array",      "base64",      "binascii",
    "bisect",     "calendar",   "cmath",      "collections", "contextlib",
    "copy",       "csv",        "dataclasses", "datetime",   "decimal",
    "difflib",    "enum",       "fractions",  "functools",   "hashlib",
    "heapq",      "hmac",       "itertools",  "json",        "math",
    "networkx",   "numbers",    "numpy",      "operator",    "pandas",
    "pprint",     "random",     "re",         "scipy",       "sklearn",
    "statistics", "statsmodels", "string",    "struct",      "sympy",
    "textwrap",   "time",       "typing",     "unicodedata", "uuid",
    "warnings",   "zoneinfo",
};

const std::pair<const char*, const char*> kRestricted[] = {
    {"os", "process and filesystem control"},
    {"sys", "interpreter internals and process exit"},
    {"pathlib", "filesystem access"},
    {"shutil", "filesystem mutation"},
    {"glob", "filesystem enumeration"},
    {"tempfile", "filesystem writes"},
    {"io", "raw file handles"},
    {"socket", "raw network access"},
    {"ssl", "network encryption layer"},
    {"requests", "outbound HTTP"},
    {"urllib", "outbound HTTP"},
    {"urllib3", "outbound HTTP"},
    {"http", "outbound HTTP"},
    {"httpx", "outbound HTTP"},
    {"aiohttp", "outbound HTTP"},
    {"ftplib", "outbound FTP"},
    {"smtplib", "outbound mail"},
    {"ctypes", "native memory access"},
    {"cffi", "native memory access"},
    {"mmap", "memory-mapped files"},
    {"pickle", "arbitrary code execution on load"},
    {"marshal", "arbitrary code objects"},
    {"shelve", "pickle-backed files"},
    {"multiprocessing", "process spawning"},
    {"threading", "unbounded concurrency"},
    {"concurrent", "process and thread pools"},
    {"asyncio", "event loop with network primitives"},
    {"subprocess", "process spawning"},
    {"signal", "signal handlers"},
    {"resource", "resource limit changes"},
    {"pty", "pseudo terminals"},
    {"fcntl", "file descriptor control"},
    {"importlib", "dynamic imports"},
    {"builtins", "interpreter builtins"},
    {"inspect", "interpreter introspection"},
    {"gc", "interpreter introspection"},
    {"code", "interactive interpreter"},
    {"sqlite3", "database files on disk"},
};

std::string TopLevel(const std::string& module) {
  return module.substr(0, module.find('.'));
}

}  // namespace

const Policy& Policy::Default() {
  static const auto policy = []() {
    auto p = std::make_unique<Policy>();
    for (const auto& spec : kPatterns) {
      p->AddPattern(spec.name, spec.regex, spec.description);
    }
    for (const char* module : kAllowed) p->Allow(module);
    for (const auto& r : kRestricted) p->Restrict(r.first, r.second);
    return p;
  }();
  return *policy;
}

ModuleClass Policy::Classify(const std::string& module,
                             std::string* justification) const {
  if (module.empty() || module[0] == '.') return ModuleClass::UNKNOWN;
  std::string top = TopLevel(module);
  if (allowed_.count(top)) return ModuleClass::ALLOWED;
  auto it = restricted_.find(top);
  if (it != restricted_.end()) {
    *justification = it->second;
    return ModuleClass::RESTRICTED;
  }
  return ModuleClass::UNKNOWN;
}

void Policy::AddPattern(const std::string& name, const std::string& regex,
                        const std::string& description) {
  patterns_.push_back({name, std::regex(regex, std::regex::ECMAScript),
                       description});
}

void Policy::Allow(const std::string& module) {
  restricted_.erase(module);
  allowed_.insert(module);
}

void Policy::Restrict(const std::string& module,
                      const std::string& justification) {
  allowed_.erase(module);
  restricted_[module] = justification;
}

}  // namespace security
