#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static bool daemon;
  static bool verbose;
  static std::string pidfile;
  static std::string log_file;
  static std::string temp_directory;
  static int32_t port;
  static int32_t max_output_kb;

  // Server-only flags
  static std::string listen_address;
  static int32_t max_running;
  static std::string docker;
  static std::string docker_host;
  static std::string image;
  static std::string box_command;
  static int32_t grace_millis;
  static int32_t install_timeout;
  static int32_t max_procs;
  static std::string audit_log;

  // Box-only flags
  static std::string run_program;
  static std::string wheelhouse;
  static std::string python;

  // Client-only flags
  static std::string server;
  static std::string caller_id;
};

#endif
