#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "config/server_config.hpp"
#include "http/router.hpp"
#include "store/store.hpp"

namespace archiver {
namespace http {

class HttpServer {
public:
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit HttpServer(const config::ServerConfig& config);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the listener and starts the worker threads
  bool start();
  // Stops accepting, abandons in-flight sessions and joins the workers
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Actual listening port, useful when the configured port is 0
  uint16_t bound_port() const { return bound_port_; }

private:
  // ---- PARAMETERS ----
  config::ServerConfig config_;
  std::atomic<bool> is_running_{false};
  uint16_t bound_port_{0};

  // Shared with every session
  std::shared_ptr<const store::Store> store_;
  std::shared_ptr<const Router> router_;

  // Connection handling
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::vector<std::thread> workers_;


  // ---- CONNECTION ACCEPTANCE ----
  void start_accept();
  void run_worker();
};

} // namespace http
} // namespace archiver
