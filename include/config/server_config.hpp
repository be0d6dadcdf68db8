#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include "logger/logger.hpp"

namespace archiver {
namespace config {

struct ServerConfig {
  // ---- NETWORK ----
  std::string address{"0.0.0.0"};
  // 0 binds an ephemeral port
  uint16_t port{8080};
  std::size_t threads{default_thread_count()};

  // ---- TRANSFER ----
  std::filesystem::path archive_dir{"./archive"};
  std::uint64_t max_body_bytes{20ULL * 1024 * 1024 * 1024};  // 20 GiB
  std::size_t chunk_size{64 * 1024};

  // ---- LOGGING ----
  logger::severity_level log_level{boost::log::trivial::info};
  std::string log_file;

  static std::size_t default_thread_count();
};

struct ProgramOptions {
  ServerConfig config;
  bool help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out);

// Errors and usage are written to err. valid is false when the arguments are rejected.
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace config
} // namespace archiver
