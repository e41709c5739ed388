#include "util/log_manager.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

#include <unistd.h>

#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {
namespace {
std::ostream& ChooseOut() {
  if (Flags::log_file.empty()) return std::cerr;
  static std::ofstream of(Flags::log_file, std::ios::app);
  return of;
}

// Escape sequences only go to a terminal.
bool UseColors() {
  static const bool colors = Flags::log_file.empty() && isatty(STDERR_FILENO);
  return colors;
}

const char* Color(const char* code) { return UseColors() ? code : ""; }

std::mutex& OutMutex() {
  static std::mutex out_mutex;
  return out_mutex;
}

static const constexpr char* log_msg[] = {"INFO", "WARNING", "ERROR", "FATAL",
                                          "DBG"};
static const constexpr char* colors[] = {"\e[0;32m", "\e[0;33m", "\e[0;31m",
                                         "\e[7;31m", "\e[0;35m"};
const constexpr char* reset_color = "\e[m";
const constexpr char* file_color = "\e[0;34m";
const constexpr char* date_color = "\e[0;36m";

constexpr bool strings_equal(char const* a, char const* b) {
  return *a == *b && (*a == '\0' || strings_equal(a + 1, b + 1));
}

#define CHECK_MSG(lvl)                                                   \
  static_assert(strings_equal(#lvl, log_msg[(int)kj::LogSeverity::lvl]), \
                #lvl " has a wrong log message!");

CHECK_MSG(INFO);
CHECK_MSG(WARNING);
CHECK_MSG(ERROR);
CHECK_MSG(FATAL);
CHECK_MSG(DBG);

}  // namespace

void InstallCrashHandler() {
  static backward::SignalHandling sh;  // Override kj's signal handling.
}

void LogManager::PrintStackTrace() {
  if (!::kj::_::Debug::shouldLog(kj::LogSeverity::INFO)) return;
  backward::StackTrace s;
  s.load_here();
  backward::Printer p;
  p.color_mode =
      UseColors() ? backward::ColorMode::always : backward::ColorMode::never;
  std::lock_guard<std::mutex> lck(OutMutex());
  p.print(s, out);
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

LogManager::LogManager(kj::ProcessContext& context) : out(ChooseOut()) {
  if (!out) {
    context.exitError("Invalid log file provided!");
  }
  if (Flags::verbose) {
    ::kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  }
}

LogManager::LogManager(std::string tag)
    : out(ChooseOut()), tag_(std::move(tag)) {}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int contextDepth, kj::String&& text) {
  auto t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::string where = util::File::BaseName(file) + ":" + std::to_string(line);
  std::lock_guard<std::mutex> lck(OutMutex());
  out << Color(date_color) << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
      << Color(reset_color) << " " << Color(colors[(int)severity])
      << log_msg[(int)severity][0] << Color(reset_color) << " ";
  if (!tag_.empty()) out << "[" << tag_ << "] ";
  out << Color(file_color) << std::left << std::setw(28) << where
      << Color(reset_color) << " " << text.cStr() << std::endl;
}
}  // namespace util
