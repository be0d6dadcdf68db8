#include "http/router.hpp"
#include <boost/log/trivial.hpp>

namespace archiver {
namespace http {

namespace beast_http = boost::beast::http;

namespace {

const std::string PARAMETER_SEGMENT = "{file_name}";

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

Router::Router() {
  add(beast_http::verb::post, "/upload", RouteId::UPLOAD);
  add(beast_http::verb::get, "/archive", RouteId::LIST_ARCHIVE);
  add(beast_http::verb::get, "/stream/{file_name}", RouteId::STREAM_FILE);
  add(beast_http::verb::delete_, "/delete/{file_name}", RouteId::DELETE_FILE);
}

void Router::add(beast_http::verb method, std::string_view pattern, RouteId id) {
  routes_.push_back(Route{method, split_path(pattern), id});
}

RouteMatch Router::match(beast_http::verb method, std::string_view target) const {
  RouteMatch result;

  if (method == beast_http::verb::options) {
    result.route = RouteId::PREFLIGHT;
    return result;
  }

  auto query = target.find('?');
  const auto path = split_path(target.substr(0, query));

  std::string allow;
  for (const auto& route : routes_) {
    auto parameter = match_segments(route.segments, path);
    if (!parameter) {
      continue;
    }

    if (route.method == method) {
      result.route = route.id;
      result.file_name = std::move(*parameter);
      return result;
    }

    if (!allow.empty()) {
      allow += ", ";
    }
    const auto name = beast_http::to_string(route.method);
    allow.append(name.data(), name.size());
  }

  if (!allow.empty()) {
    result.route = RouteId::METHOD_NOT_ALLOWED;
    result.allow = allow;
  }
  const auto method_name = beast_http::to_string(method);
  BOOST_LOG_TRIVIAL(debug) << "Router: No route for " << std::string(method_name.data(), method_name.size())
                           << " " << std::string(target);
  return result;
}

std::optional<std::string> Router::percent_decode(std::string_view value) {
  std::string decoded;
  decoded.reserve(value.size());

  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '%') {
      decoded += value[i];
      continue;
    }
    if (i + 2 >= value.size()) {
      return std::nullopt;
    }
    int high = hex_value(value[i + 1]);
    int low = hex_value(value[i + 2]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    decoded += static_cast<char>(high * 16 + low);
    i += 2;
  }
  return decoded;
}

std::vector<std::string> Router::split_path(std::string_view path) {
  std::vector<std::string> segments;
  if (!path.empty() && path.front() == '/') {
    path.remove_prefix(1);
  }

  std::size_t start = 0;
  while (true) {
    auto slash = path.find('/', start);
    if (slash == std::string_view::npos) {
      segments.emplace_back(path.substr(start));
      break;
    }
    segments.emplace_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return segments;
}

std::optional<std::string> Router::match_segments(const std::vector<std::string>& pattern,
                                                  const std::vector<std::string>& path) {
  if (pattern.size() != path.size()) {
    return std::nullopt;
  }

  std::string parameter;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] == PARAMETER_SEGMENT) {
      if (path[i].empty()) {
        return std::nullopt;
      }
      auto decoded = percent_decode(path[i]);
      if (!decoded) {
        return std::nullopt;
      }
      parameter = std::move(*decoded);
    } else if (pattern[i] != path[i]) {
      return std::nullopt;
    }
  }
  return parameter;
}

} // namespace http
} // namespace archiver
