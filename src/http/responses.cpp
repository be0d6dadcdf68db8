#include "http/responses.hpp"
#include "handlers/response_models.hpp"

namespace archiver {
namespace http {

namespace beast_http = boost::beast::http;

namespace {

StringResponse make_response(beast_http::status status, unsigned version,
                             const std::string& content_type, const std::string& body) {
  StringResponse response{status, version};
  if (!content_type.empty()) {
    response.set(beast_http::field::content_type, content_type);
  }
  response.body() = body;
  response.prepare_payload();
  return response;
}

} // namespace

beast_http::status status_for(store::ArchiveError kind) {
  switch (kind) {
    case store::ArchiveError::NOT_FOUND: return beast_http::status::not_found;
    case store::ArchiveError::IO_ERROR: return beast_http::status::internal_server_error;
    case store::ArchiveError::BAD_REQUEST: return beast_http::status::internal_server_error;
    default: return beast_http::status::internal_server_error;
  }
}

StringResponse make_text_response(beast_http::status status, unsigned version,
                                  const std::string& body) {
  return make_response(status, version, "text/plain; charset=utf-8", body);
}

StringResponse make_json_response(beast_http::status status, unsigned version,
                                  const std::string& body) {
  return make_response(status, version, "application/json", body);
}

StringResponse make_empty_response(beast_http::status status, unsigned version) {
  return make_response(status, version, "", "");
}

StringResponse make_error_response(const handlers::HandlerError& error, unsigned version) {
  const auto status = status_for(error.kind);
  if (status == beast_http::status::not_found) {
    return make_empty_response(status, version);
  }
  return make_text_response(status, version, INTERNAL_ERROR_MESSAGE);
}

StringResponse make_not_found_response(unsigned version) {
  handlers::ResponseError payload{"", "page not found"};
  return make_json_response(beast_http::status::not_found, version, handlers::to_json(payload));
}

StringResponse make_method_not_allowed_response(const std::string& allow, unsigned version) {
  auto response = make_empty_response(beast_http::status::method_not_allowed, version);
  response.set(beast_http::field::allow, allow);
  return response;
}

StringResponse make_preflight_response(unsigned version) {
  auto response = make_empty_response(beast_http::status::ok, version);
  response.set(beast_http::field::access_control_allow_methods, CORS_ALLOWED_METHODS);
  response.set(beast_http::field::access_control_allow_headers, "*");
  return response;
}

} // namespace http
} // namespace archiver
