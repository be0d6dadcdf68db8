#include "http/http_server.hpp"
#include "http/http_session.hpp"
#include <boost/log/trivial.hpp>

namespace archiver {
namespace http {

using tcp = boost::asio::ip::tcp;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const config::ServerConfig& config)
  : config_(config)
  , store_(std::make_shared<store::Store>(config.archive_dir, config.chunk_size))
  , router_(std::make_shared<Router>()) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << config_.address << ":"
                          << config_.port << " with " << config_.threads << " worker threads";
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(config_.address), config_.port);

    io_context_.restart();
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }

  is_running_ = true;
  work_guard_.emplace(boost::asio::make_work_guard(io_context_));
  start_accept();

  const std::size_t thread_count = config_.threads > 0 ? config_.threads : 1;
  for (std::size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back(&HttpServer::run_worker, this);
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server started on http://" << config_.address << ":"
                          << bound_port_ << ", storing files in " << config_.archive_dir.string();
  return true;
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";
  is_running_ = false;

  work_guard_.reset();
  io_context_.stop();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  // No worker is running any more, the acceptor can be closed from here
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}


//==============================================
// CONNECTION ACCEPTANCE
//==============================================

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each connection gets its own strand
  acceptor_->async_accept(
    boost::asio::make_strand(io_context_),
    [this](const boost::system::error_code& error, tcp::socket socket) {
      if (!is_running_) {
        return;
      }
      if (!error) {
        boost::system::error_code endpoint_ec;
        auto remote = socket.remote_endpoint(endpoint_ec);
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accepted connection from "
                                 << (endpoint_ec ? std::string("unknown") : remote.address().to_string());
        std::make_shared<HttpSession>(std::move(socket), store_, router_,
                                      config_.max_body_bytes)->start();
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::run_worker() {
  try {
    io_context_.run();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
  }
}

} // namespace http
} // namespace archiver
