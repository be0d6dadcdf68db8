#ifndef ARCHIVER_HTTP_SESSION_HPP
#define ARCHIVER_HTTP_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "handlers/upload_handler.hpp"
#include "http/responses.hpp"
#include "http/router.hpp"
#include "store/chunked_reader.hpp"
#include "store/store.hpp"

namespace archiver {
namespace http {

/**
 * One HTTP/1.1 connection.
 *
 * Reads requests one at a time on the connection's strand. Upload bodies are read
 * chunk by chunk into a fixed buffer and handed to an UploadRequest; stream bodies
 * are written chunk by chunk from a ChunkedReader. Neither is ever held whole.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(boost::asio::ip::tcp::socket&& socket,
              std::shared_ptr<const store::Store> store,
              std::shared_ptr<const Router> router,
              std::uint64_t max_body_bytes);

  // ---- STARTUP ----
  void start();

private:
  using BufferRequestParser = boost::beast::http::request_parser<boost::beast::http::buffer_body>;
  using BufferResponse = boost::beast::http::response<boost::beast::http::buffer_body>;
  using BufferSerializer = boost::beast::http::response_serializer<boost::beast::http::buffer_body>;

  // ---- PARAMETERS ----
  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<BufferRequestParser> parser_;
  // Upload and stream chunks pass through here, one at a time
  std::vector<char> chunk_buffer_;

  std::shared_ptr<const store::Store> store_;
  std::shared_ptr<const Router> router_;
  std::uint64_t max_body_bytes_;

  // Current request
  RouteMatch route_;
  std::string request_method_;
  std::string request_target_;
  unsigned request_version_{11};
  bool request_keep_alive_{true};
  std::chrono::steady_clock::time_point request_start_{};

  // Transfer state
  std::unique_ptr<handlers::UploadRequest> upload_;
  std::unique_ptr<store::ChunkedReader> reader_;
  std::unique_ptr<BufferResponse> stream_response_;
  std::unique_ptr<BufferSerializer> stream_serializer_;

  // Set when a response goes out before the request body was fully read
  bool linger_on_close_{false};
  std::uint64_t lingered_bytes_{0};


  // ---- REQUEST HEADER ----
  void do_read_header();
  void on_read_header(boost::beast::error_code ec, std::size_t bytes_transferred);
  void handle_request();

  // ---- BODIES WITHOUT A CONSUMER ----
  void do_discard_body();
  void on_discard_body(boost::beast::error_code ec, std::size_t bytes_transferred);

  // ---- UPLOAD ----
  void start_upload();
  void send_continue();
  void do_read_upload_chunk();
  void on_upload_chunk(boost::beast::error_code ec, std::size_t bytes_transferred);
  void finish_upload();

  // ---- STREAM ----
  void start_stream(std::unique_ptr<store::ChunkedReader> reader);
  void on_stream_header(boost::beast::error_code ec, std::size_t bytes_transferred);
  void do_write_stream_chunk();
  void on_stream_chunk(boost::beast::error_code ec, std::size_t bytes_transferred);
  void finish_stream();

  // ---- RESPONSES ----
  void send(StringResponse&& response);
  void on_write(bool close, std::shared_ptr<StringResponse> response,
                boost::beast::error_code ec, std::size_t bytes_transferred);
  void log_response(unsigned status) const;

  // ---- TEARDOWN ----
  void do_close();
  // Half-closes, then reads and drops what the client still sends, bounded in time
  // and size, so the client can read the response before the connection is reset
  void do_linger();
  void on_linger(boost::beast::error_code ec, std::size_t bytes_transferred);
  // Drops the connection without a graceful end of message
  void do_abort();
};

} // namespace http
} // namespace archiver

#endif // ARCHIVER_HTTP_SESSION_HPP
