#include "config/server_config.hpp"
#include "http/http_server.hpp"
#include "logger/logger.hpp"
#include <csignal>
#include <iostream>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>

bool run_server(const archiver::config::ServerConfig& config) {
  archiver::http::HttpServer server(config);
  if (!server.start()) {
    std::cerr << "Error: Failed to start server on " << config.address << ":" << config.port << '\n';
    return false;
  }

  // Block until SIGINT or SIGTERM, the workers serve requests meanwhile
  boost::asio::io_context signal_context;
  boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
  signals.async_wait([&server](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number << ", shutting down";
    }
    server.shutdown();
  });
  signal_context.run();
  return true;
}

int main(int argc, char* argv[]) {
  const auto options = archiver::config::parse_command_line(argc, argv, std::cerr);
  if (options.help) {
    return 0;
  }
  if (!options.valid) {
    return 1;
  }

  try {
    archiver::logger::init_logging(options.config.log_level, options.config.log_file);
    if (!run_server(options.config)) {
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
