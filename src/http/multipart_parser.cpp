#include "http/multipart_parser.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace archiver {
namespace http {

namespace {

constexpr std::size_t MAX_BOUNDARY_LENGTH = 70;

std::string to_lower(std::string_view value) {
  std::string result(value);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

std::string_view trim(std::string_view value) {
  const auto is_space = [](char c) { return c == ' ' || c == '\t'; };
  while (!value.empty() && is_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_space(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

// Splits "type; key=value; key="quoted; value"" into the leading token and its
// parameters. Parameter keys are lower-cased, quoted values unescaped.
std::pair<std::string, std::vector<std::pair<std::string, std::string>>>
split_header_value(std::string_view header) {
  std::vector<std::string> segments;
  std::string current;
  bool in_quotes = false;
  bool escaped = false;

  for (char c : header) {
    if (escaped) {
      current += c;
      escaped = false;
    } else if (in_quotes && c == '\\') {
      current += c;
      escaped = true;
    } else if (c == '"') {
      current += c;
      in_quotes = !in_quotes;
    } else if (c == ';' && !in_quotes) {
      segments.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  segments.push_back(current);

  std::vector<std::pair<std::string, std::string>> params;
  for (std::size_t i = 1; i < segments.size(); ++i) {
    std::string_view segment = trim(segments[i]);
    auto eq = segment.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }

    std::string key = to_lower(trim(segment.substr(0, eq)));
    std::string_view raw = trim(segment.substr(eq + 1));
    std::string value;
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
      raw = raw.substr(1, raw.size() - 2);
      for (std::size_t j = 0; j < raw.size(); ++j) {
        if (raw[j] == '\\' && j + 1 < raw.size()) {
          ++j;
        }
        value += raw[j];
      }
    } else {
      value = std::string(raw);
    }
    params.emplace_back(std::move(key), std::move(value));
  }

  return {std::string(trim(segments.front())), std::move(params)};
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MultipartParser::MultipartParser(const std::string& boundary,
                                 PartBeginHandler on_part_begin,
                                 PartDataHandler on_part_data,
                                 PartEndHandler on_part_end)
  : delimiter_("\r\n--" + boundary)
  // The first delimiter may open the body without a preceding CRLF, seeding the
  // buffer with one lets every delimiter be matched the same way
  , buffer_("\r\n")
  , state_(State::PREAMBLE)
  , parts_seen_(0)
  , on_part_begin_(std::move(on_part_begin))
  , on_part_data_(std::move(on_part_data))
  , on_part_end_(std::move(on_part_end)) {
  if (boundary.empty() || boundary.size() > MAX_BOUNDARY_LENGTH) {
    throw MultipartError("Multipart parser: Invalid boundary length");
  }
  BOOST_LOG_TRIVIAL(debug) << "Multipart parser: Created with boundary: " << boundary;
}


//==============================================
// BODY PROCESSING
//==============================================

void MultipartParser::feed(const char* data, std::size_t size) {
  if (state_ == State::EPILOGUE) {
    return;
  }

  buffer_.append(data, size);

  bool progressed = true;
  while (progressed && state_ != State::EPILOGUE) {
    switch (state_) {
      case State::PREAMBLE:        progressed = process_preamble(); break;
      case State::AFTER_DELIMITER: progressed = process_after_delimiter(); break;
      case State::HEADERS:         progressed = process_headers(); break;
      case State::BODY:            progressed = process_body(); break;
      case State::EPILOGUE:        progressed = false; break;
    }
  }

  if (state_ == State::EPILOGUE) {
    buffer_.clear();
  }
}

void MultipartParser::finish() const {
  if (state_ != State::EPILOGUE) {
    BOOST_LOG_TRIVIAL(warning) << "Multipart parser: Body ended before the closing delimiter";
    throw MultipartError("Multipart parser: Unexpected end of body");
  }
}

bool MultipartParser::process_preamble() {
  auto pos = buffer_.find(delimiter_);
  if (pos == std::string::npos) {
    // Preamble is discarded, only a possible delimiter prefix is kept
    const std::size_t keep = delimiter_.size() - 1;
    if (buffer_.size() > keep) {
      buffer_.erase(0, buffer_.size() - keep);
    }
    return false;
  }

  buffer_.erase(0, pos + delimiter_.size());
  state_ = State::AFTER_DELIMITER;
  return true;
}

bool MultipartParser::process_after_delimiter() {
  // Transport padding may follow a delimiter
  std::size_t padding = 0;
  while (padding < buffer_.size() && (buffer_[padding] == ' ' || buffer_[padding] == '\t')) {
    ++padding;
  }
  buffer_.erase(0, padding);

  if (buffer_.size() < 2) {
    return false;
  }

  if (buffer_.compare(0, 2, "--") == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Multipart parser: Closing delimiter after " << parts_seen_ << " parts";
    state_ = State::EPILOGUE;
    return true;
  }

  if (buffer_.compare(0, 2, "\r\n") == 0) {
    buffer_.erase(0, 2);
    state_ = State::HEADERS;
    return true;
  }

  throw MultipartError("Multipart parser: Malformed delimiter line");
}

bool MultipartParser::process_headers() {
  if (buffer_.size() < 2) {
    return false;
  }

  MultipartPart part;
  if (buffer_.compare(0, 2, "\r\n") == 0) {
    buffer_.erase(0, 2);
  } else {
    auto end = buffer_.find("\r\n\r\n");
    if (end == std::string::npos) {
      if (buffer_.size() > MAX_HEADER_BYTES) {
        throw MultipartError("Multipart parser: Part headers too large");
      }
      return false;
    }
    part = parse_part_headers(std::string_view(buffer_).substr(0, end));
    buffer_.erase(0, end + 4);
  }

  ++parts_seen_;
  BOOST_LOG_TRIVIAL(debug) << "Multipart parser: Part " << parts_seen_ << " name='" << part.name
                           << "' filename='" << part.filename.value_or("<none>") << "'";
  on_part_begin_(part);
  state_ = State::BODY;
  return true;
}

bool MultipartParser::process_body() {
  auto pos = buffer_.find(delimiter_);
  if (pos != std::string::npos) {
    if (pos > 0) {
      on_part_data_(buffer_.data(), pos);
    }
    buffer_.erase(0, pos + delimiter_.size());
    on_part_end_();
    state_ = State::AFTER_DELIMITER;
    return true;
  }

  const std::size_t keep = delimiter_.size() - 1;
  if (buffer_.size() > keep) {
    const std::size_t ready = buffer_.size() - keep;
    on_part_data_(buffer_.data(), ready);
    buffer_.erase(0, ready);
  }
  return false;
}

MultipartPart MultipartParser::parse_part_headers(std::string_view block) const {
  MultipartPart part;

  std::size_t start = 0;
  while (start <= block.size()) {
    auto end = block.find("\r\n", start);
    if (end == std::string_view::npos) {
      end = block.size();
    }
    std::string_view line = block.substr(start, end - start);
    start = end + 2;

    if (line.empty()) {
      continue;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      throw MultipartError("Multipart parser: Malformed part header");
    }

    const std::string name = to_lower(trim(line.substr(0, colon)));
    const std::string_view value = trim(line.substr(colon + 1));

    if (name == "content-disposition") {
      auto [disposition, params] = split_header_value(value);
      for (auto& [key, param] : params) {
        if (key == "name") {
          part.name = param;
        } else if (key == "filename") {
          part.filename = param;
        }
      }
    } else if (name == "content-type") {
      part.content_type = std::string(value);
    }
  }

  return part;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::optional<std::string> MultipartParser::extract_boundary(std::string_view content_type) {
  auto [media_type, params] = split_header_value(content_type);
  if (to_lower(media_type) != "multipart/form-data") {
    return std::nullopt;
  }

  for (const auto& [key, value] : params) {
    if (key == "boundary" && !value.empty() && value.size() <= MAX_BOUNDARY_LENGTH) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace http
} // namespace archiver
