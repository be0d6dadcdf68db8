#include "http/http_session.hpp"
#include "handlers/archive_handlers.hpp"
#include <boost/log/trivial.hpp>

namespace archiver {
namespace http {

namespace beast = boost::beast;
namespace beast_http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr std::chrono::seconds LINGER_TIMEOUT{5};
constexpr std::uint64_t LINGER_MAX_BYTES = 64 * 1024 * 1024;

std::string to_std_string(beast::string_view value) {
  return std::string(value.data(), value.size());
}

bool iequals(beast::string_view lhs, const std::string& rhs) {
  return beast::iequals(lhs, beast::string_view(rhs.data(), rhs.size()));
}

} // namespace

//==============================================
// CONSTRUCTOR AND STARTUP
//==============================================

HttpSession::HttpSession(tcp::socket&& socket,
                         std::shared_ptr<const store::Store> store,
                         std::shared_ptr<const Router> router,
                         std::uint64_t max_body_bytes)
  : stream_(std::move(socket))
  , chunk_buffer_(store->chunk_size())
  , store_(std::move(store))
  , router_(std::move(router))
  , max_body_bytes_(max_body_bytes) {
}

void HttpSession::start() {
  // Run on the socket's strand so handlers of this session never overlap
  boost::asio::dispatch(stream_.get_executor(),
                        beast::bind_front_handler(&HttpSession::do_read_header, shared_from_this()));
}


//==============================================
// REQUEST HEADER
//==============================================

void HttpSession::do_read_header() {
  linger_on_close_ = false;
  parser_.emplace();
  parser_->body_limit(max_body_bytes_);
  beast_http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&HttpSession::on_read_header,
                                                          shared_from_this()));
}

void HttpSession::on_read_header(beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == beast_http::error::end_of_stream) {
    return do_close();
  }
  if (ec == beast_http::error::body_limit) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Declared body exceeds limit of " << max_body_bytes_ << " bytes";
    auto response = make_empty_response(beast_http::status::payload_too_large, 11);
    response.keep_alive(false);
    linger_on_close_ = true;
    return send(std::move(response));
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Read header failed: " << ec.message();
    return;
  }

  const auto& request = parser_->get();
  request_start_ = std::chrono::steady_clock::now();
  request_method_ = to_std_string(request.method_string());
  request_target_ = to_std_string(request.target());
  request_version_ = request.version();
  request_keep_alive_ = parser_->keep_alive();

  route_ = router_->match(request.method(), request_target_);
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: " << request_method_ << " " << request_target_;

  if (route_.route == RouteId::UPLOAD) {
    return start_upload();
  }

  // Other routes take no body, whatever arrives is read and dropped
  if (!parser_->is_done()) {
    return do_discard_body();
  }
  handle_request();
}

void HttpSession::handle_request() {
  try {
    switch (route_.route) {
      case RouteId::LIST_ARCHIVE: {
        auto result = handlers::list_archive(*store_);
        if (!result.ok()) {
          return send(make_error_response(result.error(), request_version_));
        }
        return send(make_json_response(beast_http::status::ok, request_version_,
                                       handlers::to_json(result.value())));
      }

      case RouteId::STREAM_FILE: {
        auto result = handlers::stream_file(*store_, route_.file_name);
        if (!result.ok()) {
          return send(make_error_response(result.error(), request_version_));
        }
        return start_stream(std::move(result.value()));
      }

      case RouteId::DELETE_FILE: {
        auto result = handlers::delete_file(*store_, route_.file_name);
        if (!result.ok()) {
          return send(make_error_response(result.error(), request_version_));
        }
        return send(make_text_response(beast_http::status::ok, request_version_, result.value()));
      }

      case RouteId::PREFLIGHT:
        return send(make_preflight_response(request_version_));

      case RouteId::METHOD_NOT_ALLOWED:
        return send(make_method_not_allowed_response(route_.allow, request_version_));

      case RouteId::UPLOAD:
      case RouteId::NOT_FOUND:
        break;
    }
    send(make_not_found_response(request_version_));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Unexpected failure handling " << request_method_
                             << " " << request_target_ << ": " << e.what();
    auto response = make_text_response(beast_http::status::internal_server_error, request_version_,
                                       INTERNAL_ERROR_MESSAGE);
    response.keep_alive(false);
    send(std::move(response));
  }
}


//==============================================
// BODIES WITHOUT A CONSUMER
//==============================================

void HttpSession::do_discard_body() {
  parser_->get().body().data = chunk_buffer_.data();
  parser_->get().body().size = chunk_buffer_.size();
  beast_http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpSession::on_discard_body,
                                                   shared_from_this()));
}

void HttpSession::on_discard_body(beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec && ec != beast_http::error::need_buffer) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Read body failed: " << ec.message();
    return;
  }
  if (parser_->is_done()) {
    return handle_request();
  }
  do_discard_body();
}


//==============================================
// UPLOAD
//==============================================

void HttpSession::start_upload() {
  const auto& request = parser_->get();
  upload_ = std::make_unique<handlers::UploadRequest>(
    *store_, to_std_string(request[beast_http::field::content_type]));

  if (upload_->failed()) {
    // The body is left unread, the connection cannot be reused
    upload_.reset();
    auto response = make_text_response(beast_http::status::internal_server_error,
                                       request_version_, INTERNAL_ERROR_MESSAGE);
    response.keep_alive(false);
    linger_on_close_ = !parser_->is_done();
    return send(std::move(response));
  }

  if (parser_->is_done()) {
    return finish_upload();
  }

  if (iequals(request[beast_http::field::expect], "100-continue")) {
    return send_continue();
  }
  do_read_upload_chunk();
}

void HttpSession::send_continue() {
  auto response = std::make_shared<beast_http::response<beast_http::empty_body>>(
    beast_http::status::continue_, request_version_);
  beast_http::async_write(stream_, *response,
    [self = shared_from_this(), response](beast::error_code ec, std::size_t) {
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "HTTP session: Failed to send 100-continue: " << ec.message();
        return;
      }
      self->do_read_upload_chunk();
    });
}

void HttpSession::do_read_upload_chunk() {
  parser_->get().body().data = chunk_buffer_.data();
  parser_->get().body().size = chunk_buffer_.size();
  beast_http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpSession::on_upload_chunk,
                                                   shared_from_this()));
}

void HttpSession::on_upload_chunk(beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == beast_http::error::need_buffer) {
    ec = {};
  }
  if (ec) {
    // Client gone or body over the limit: the upload is abandoned, its partial file stays
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Upload read failed: " << ec.message();
    upload_.reset();
    if (ec == beast_http::error::body_limit) {
      auto response = make_empty_response(beast_http::status::payload_too_large, request_version_);
      response.keep_alive(false);
      linger_on_close_ = true;
      send(std::move(response));
    }
    return;
  }

  const std::size_t bytes = chunk_buffer_.size() - parser_->get().body().size;
  if (bytes > 0 && !upload_->feed(chunk_buffer_.data(), bytes)) {
    auto result = upload_->finish();
    upload_.reset();
    auto response = make_error_response(result.error(), request_version_);
    response.keep_alive(false);
    linger_on_close_ = !parser_->is_done();
    return send(std::move(response));
  }

  if (parser_->is_done()) {
    return finish_upload();
  }
  do_read_upload_chunk();
}

void HttpSession::finish_upload() {
  auto result = upload_->finish();
  upload_.reset();

  if (!result.ok()) {
    return send(make_error_response(result.error(), request_version_));
  }
  send(make_text_response(beast_http::status::ok, request_version_, result.value()));
}


//==============================================
// STREAM
//==============================================

void HttpSession::start_stream(std::unique_ptr<store::ChunkedReader> reader) {
  reader_ = std::move(reader);

  stream_response_ = std::make_unique<BufferResponse>(beast_http::status::ok, request_version_);
  stream_response_->set(beast_http::field::content_type, STREAM_CONTENT_TYPE);
  stream_response_->set(beast_http::field::accept_ranges, "bytes");
  apply_cors_headers(*stream_response_);
  stream_response_->keep_alive(request_keep_alive_);
  stream_response_->chunked(true);
  stream_response_->body().data = nullptr;
  stream_response_->body().more = true;

  stream_serializer_ = std::make_unique<BufferSerializer>(*stream_response_);
  beast_http::async_write_header(stream_, *stream_serializer_,
                                 beast::bind_front_handler(&HttpSession::on_stream_header,
                                                           shared_from_this()));
}

void HttpSession::on_stream_header(beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Stream header write failed: " << ec.message();
    return finish_stream();
  }
  do_write_stream_chunk();
}

void HttpSession::do_write_stream_chunk() {
  std::size_t bytes = 0;
  try {
    bytes = reader_->read_chunk(chunk_buffer_.data(), chunk_buffer_.size());
  } catch (const store::StoreError& e) {
    // Headers are already out, the only signal left is an incomplete body
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Stream of " << request_target_
                             << " terminated: " << e.what();
    finish_stream();
    return do_abort();
  }

  auto& body = stream_response_->body();
  if (bytes == 0) {
    body.data = nullptr;
    body.size = 0;
    body.more = false;
  } else {
    body.data = chunk_buffer_.data();
    body.size = bytes;
    body.more = true;
  }

  beast_http::async_write(stream_, *stream_serializer_,
                          beast::bind_front_handler(&HttpSession::on_stream_chunk,
                                                    shared_from_this()));
}

void HttpSession::on_stream_chunk(beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == beast_http::error::need_buffer) {
    ec = {};
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Stream of " << request_target_
                               << " abandoned after " << reader_->bytes_read() << " bytes: "
                               << ec.message();
    return finish_stream();
  }

  if (!stream_serializer_->is_done()) {
    return do_write_stream_chunk();
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP session: Streamed " << reader_->bytes_read() << " bytes in "
                          << reader_->chunks_read() << " chunks";
  log_response(static_cast<unsigned>(beast_http::status::ok));
  const bool keep_alive = stream_response_->keep_alive();
  finish_stream();

  if (!keep_alive) {
    return do_close();
  }
  do_read_header();
}

void HttpSession::finish_stream() {
  stream_serializer_.reset();
  stream_response_.reset();
  reader_.reset();
}


//==============================================
// RESPONSES
//==============================================

void HttpSession::send(StringResponse&& response) {
  apply_cors_headers(response);
  if (!request_keep_alive_) {
    response.keep_alive(false);
  }
  log_response(response.result_int());

  auto sp = std::make_shared<StringResponse>(std::move(response));
  beast_http::async_write(stream_, *sp,
                          beast::bind_front_handler(&HttpSession::on_write, shared_from_this(),
                                                    sp->need_eof(), sp));
}

void HttpSession::on_write(bool close, std::shared_ptr<StringResponse> /*response*/,
                           beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Write failed: " << ec.message();
    return;
  }
  if (close) {
    return linger_on_close_ ? do_linger() : do_close();
  }
  do_read_header();
}

void HttpSession::log_response(unsigned status) const {
  const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - request_start_).count();
  BOOST_LOG_TRIVIAL(info) << "HTTP session: " << request_method_ << " " << request_target_
                          << " -> " << status << " (Time: " << latency << "ms)";
}


//==============================================
// TEARDOWN
//==============================================

void HttpSession::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Shutdown failed: " << ec.message();
  }
}

void HttpSession::do_linger() {
  do_close();
  lingered_bytes_ = 0;
  stream_.expires_after(LINGER_TIMEOUT);
  stream_.async_read_some(boost::asio::buffer(chunk_buffer_),
                          beast::bind_front_handler(&HttpSession::on_linger, shared_from_this()));
}

void HttpSession::on_linger(beast::error_code ec, std::size_t bytes_transferred) {
  lingered_bytes_ += bytes_transferred;
  if (ec || lingered_bytes_ >= LINGER_MAX_BYTES) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Dropped " << lingered_bytes_
                             << " unread request bytes before closing";
    return do_abort();
  }
  stream_.async_read_some(boost::asio::buffer(chunk_buffer_),
                          beast::bind_front_handler(&HttpSession::on_linger, shared_from_this()));
}

void HttpSession::do_abort() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
  stream_.close();
}

} // namespace http
} // namespace archiver
