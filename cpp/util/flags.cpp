#include "util/flags.hpp"

bool Flags::daemon = false;
bool Flags::verbose = false;
std::string Flags::pidfile;
std::string Flags::log_file;
std::string Flags::temp_directory = "/tmp/rexec";
int32_t Flags::port = 7171;
int32_t Flags::max_output_kb = 1024;

std::string Flags::listen_address = "127.0.0.1";
int32_t Flags::max_running = 8;
std::string Flags::docker = "docker";
std::string Flags::docker_host;
std::string Flags::image = "rexec-box:latest";
std::string Flags::box_command = "/usr/local/bin/rexec";
int32_t Flags::grace_millis = 5000;
int32_t Flags::install_timeout = 120;
int32_t Flags::max_procs = 64;
std::string Flags::audit_log;

std::string Flags::run_program;
std::string Flags::wheelhouse = "/opt/wheelhouse";
std::string Flags::python = "python3";

std::string Flags::server = "127.0.0.1";
std::string Flags::caller_id = "30000";
