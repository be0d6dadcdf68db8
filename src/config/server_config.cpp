#include "config/server_config.hpp"
#include <algorithm>
#include <functional>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <thread>
#include <unordered_map>

namespace archiver {
namespace config {

namespace {

std::uint64_t parse_unsigned(const std::string& value, std::uint64_t min, std::uint64_t max) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("not a number");
  }
  std::uint64_t parsed = std::stoull(value);
  if (parsed < min || parsed > max) {
    throw std::out_of_range("out of range");
  }
  return parsed;
}

} // namespace

std::size_t ServerConfig::default_thread_count() {
  return std::max<std::size_t>(2, std::thread::hardware_concurrency());
}

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -a, --address <addr>     Listen address (default 0.0.0.0)\n"
      << "  -p, --port <port>        Listen port (default 8080)\n"
      << "  -d, --archive-dir <dir>  Storage directory (default ./archive)\n"
      << "  -t, --threads <n>        Worker threads (default max(2, cores))\n"
      << "      --max-body <bytes>   Request body limit (default 21474836480)\n"
      << "      --chunk-size <bytes> Stream chunk size (default 65536)\n"
      << "      --log-level <level>  trace|debug|info|warning|error|fatal (default info)\n"
      << "      --log-file <path>    Also log to this file\n"
      << "      --help               Show this message\n"
      << "Example: " << program_name << " -p 8080 -d ./archive\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  ServerConfig& config = options.config;
  const std::string program_name = argc > 0 ? argv[0] : "video_archiver";

  using Setter = std::function<void(const std::string&)>;
  const Setter set_port = [&config](const std::string& value) {
    config.port = static_cast<uint16_t>(parse_unsigned(value, 1, std::numeric_limits<uint16_t>::max()));
  };
  const Setter set_address = [&config](const std::string& value) { config.address = value; };
  const Setter set_archive_dir = [&config](const std::string& value) {
    if (value.empty()) {
      throw std::invalid_argument("empty path");
    }
    config.archive_dir = value;
  };
  const Setter set_threads = [&config](const std::string& value) {
    config.threads = static_cast<std::size_t>(parse_unsigned(value, 1, 1024));
  };

  const std::unordered_map<std::string, Setter> flag_map = {
    {"-a", set_address},
    {"--address", set_address},
    {"-p", set_port},
    {"--port", set_port},
    {"-d", set_archive_dir},
    {"--archive-dir", set_archive_dir},
    {"-t", set_threads},
    {"--threads", set_threads},
    {"--max-body", [&config](const std::string& value) {
      config.max_body_bytes = parse_unsigned(value, 1, std::numeric_limits<std::uint64_t>::max());
    }},
    {"--chunk-size", [&config](const std::string& value) {
      config.chunk_size = static_cast<std::size_t>(parse_unsigned(value, 1, 16 * 1024 * 1024));
    }},
    {"--log-level", [&config](const std::string& value) {
      auto level = logger::parse_severity(value);
      if (!level) {
        throw std::invalid_argument("unknown level");
      }
      config.log_level = *level;
    }},
    {"--log-file", [&config](const std::string& value) { config.log_file = value; }}
  };

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-h" || flag == "--help") {
      options.help = true;
      print_usage(program_name, err);
      return options;
    }

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    const std::string value(argv[++i]);
    try {
      it->second(value);
    } catch (const std::exception& e) {
      err << "Error: Invalid value '" << value << "' for " << flag << " (" << e.what() << ")\n";
      print_usage(program_name, err);
      return options;
    }
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace archiver
