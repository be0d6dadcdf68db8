#ifndef ARCHIVER_HTTP_ROUTER_HPP
#define ARCHIVER_HTTP_ROUTER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/beast/http/verb.hpp>

namespace archiver {
namespace http {

enum class RouteId {
  UPLOAD,
  LIST_ARCHIVE,
  STREAM_FILE,
  DELETE_FILE,
  PREFLIGHT,
  METHOD_NOT_ALLOWED,
  NOT_FOUND
};

struct RouteMatch {
  RouteId route{RouteId::NOT_FOUND};
  // Percent-decoded {file_name} segment for the stream and delete routes
  std::string file_name;
  // Methods accepted on the path, set for METHOD_NOT_ALLOWED
  std::string allow;
};

class Router {
public:
  Router();

  // Query strings are ignored. OPTIONS on any path is a CORS preflight.
  RouteMatch match(boost::beast::http::verb method, std::string_view target) const;

  // Decodes %XX escapes, nullopt on a malformed escape
  static std::optional<std::string> percent_decode(std::string_view value);

private:
  struct Route {
    boost::beast::http::verb method;
    std::vector<std::string> segments;
    RouteId id;
  };

  std::vector<Route> routes_;

  void add(boost::beast::http::verb method, std::string_view pattern, RouteId id);
  static std::vector<std::string> split_path(std::string_view path);
  // Returns the decoded parameter on match ("" for patterns without one)
  static std::optional<std::string> match_segments(const std::vector<std::string>& pattern,
                                                   const std::vector<std::string>& path);
};

} // namespace http
} // namespace archiver

#endif // ARCHIVER_HTTP_ROUTER_HPP
