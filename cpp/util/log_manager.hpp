#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>
#include <string>
#include "backward.hpp"

namespace util {

// Formats KJ log lines (date, severity, tag, file:line, text) and prints a
// stack trace for exceptions when verbose. kj::ExceptionCallback is per
// thread, so every execution thread creates its own LogManager tagged with
// the execution id. All instances share the same output stream.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext& context);
  explicit LogManager(std::string tag);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  std::string tag_;
};

// Installs the process-wide signal handlers that print a stack trace on
// crashes. Call once from main.
void InstallCrashHandler();

}  // namespace util

#endif
