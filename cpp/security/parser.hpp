#ifndef SECURITY_PARSER_HPP
#define SECURITY_PARSER_HPP

#include <string>
#include <vector>

namespace security {

struct ImportRef {
  // Dotted module name as written; relative imports keep their leading dots.
  std::string module;
  int line = 0;
  bool relative = false;
};

// A call that opens a file for writing, or whose mode cannot be told from
// the source.
struct WriteOpenRef {
  // Callee as written, e.g. "open" or "io.open".
  std::string call;
  int line = 0;
};

struct ParseResult {
  bool ok = true;
  std::string error;
  int error_line = 0;
  // Sorted by line.
  std::vector<ImportRef> imports;
  // Sorted by line.
  std::vector<WriteOpenRef> write_opens;
};

// Turns program text into the facts the validator needs. Implementations
// must be thread safe.
class Parser {
 public:
  virtual ~Parser() = default;
  virtual ParseResult Parse(const std::string& code) const = 0;
};

// Uses the ast module of the embedded interpreter. Nothing is executed.
class PythonParser : public Parser {
 public:
  PythonParser();
  ParseResult Parse(const std::string& code) const override;
};

}  // namespace security

#endif
