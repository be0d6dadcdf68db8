#ifndef ARCHIVER_HTTP_RESPONSES_HPP
#define ARCHIVER_HTTP_RESPONSES_HPP

#include <string>
#include <boost/beast/http.hpp>
#include "handlers/handler_result.hpp"

namespace archiver {
namespace http {

using StringResponse = boost::beast::http::response<boost::beast::http::string_body>;

inline constexpr const char* INTERNAL_ERROR_MESSAGE = "Internal server error";
inline constexpr const char* STREAM_CONTENT_TYPE = "video/mp4";
inline constexpr const char* CORS_ALLOWED_METHODS = "POST, GET, DELETE";

// NOT_FOUND maps to 404, every other kind to 500
boost::beast::http::status status_for(store::ArchiveError kind);

StringResponse make_text_response(boost::beast::http::status status, unsigned version,
                                  const std::string& body);
StringResponse make_json_response(boost::beast::http::status status, unsigned version,
                                  const std::string& body);
StringResponse make_empty_response(boost::beast::http::status status, unsigned version);

// 404 with an empty body, or 500 with a short plain-text message. Internal details
// stay in the log.
StringResponse make_error_response(const handlers::HandlerError& error, unsigned version);

// 404 {"message":"","error":"page not found"}
StringResponse make_not_found_response(unsigned version);

// 405 with the Allow header listing the accepted methods
StringResponse make_method_not_allowed_response(const std::string& allow, unsigned version);

// 200 answer to a CORS preflight
StringResponse make_preflight_response(unsigned version);

// Headers every response carries
template <typename Fields>
void apply_cors_headers(Fields& fields) {
  fields.set(boost::beast::http::field::access_control_allow_origin, "*");
}

} // namespace http
} // namespace archiver

#endif // ARCHIVER_HTTP_RESPONSES_HPP
