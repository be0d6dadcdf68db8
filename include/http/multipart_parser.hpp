#ifndef ARCHIVER_HTTP_MULTIPART_PARSER_HPP
#define ARCHIVER_HTTP_MULTIPART_PARSER_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace archiver {
namespace http {

class MultipartError : public std::runtime_error {
public:
  explicit MultipartError(const std::string& message) : std::runtime_error(message) {}
};

// Headers of one multipart/form-data part
struct MultipartPart {
  std::string name;
  // Absent when the Content-Disposition carries no filename parameter
  std::optional<std::string> filename;
  std::string content_type;
};

/**
 * Incremental multipart/form-data decoder.
 *
 * The body may be fed in fragments of any size. Part content is handed to the data
 * callback as soon as it cannot be the start of a delimiter, so at most one delimiter
 * length of content is held back between feeds. Callbacks run synchronously inside
 * feed() and any exception they throw propagates out of it.
 */
class MultipartParser {
public:
  using PartBeginHandler = std::function<void(const MultipartPart&)>;
  using PartDataHandler = std::function<void(const char*, std::size_t)>;
  using PartEndHandler = std::function<void()>;

  static constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MultipartParser(const std::string& boundary,
                  PartBeginHandler on_part_begin,
                  PartDataHandler on_part_data,
                  PartEndHandler on_part_end);


  // ---- BODY PROCESSING ----
  // Consumes the next body fragment, throws MultipartError on malformed input
  void feed(const char* data, std::size_t size);
  // Verifies the closing delimiter has been seen
  void finish() const;
  bool done() const { return state_ == State::EPILOGUE; }


  // ---- QUERY OPERATIONS ----
  // Boundary parameter of a multipart/form-data Content-Type, if any
  static std::optional<std::string> extract_boundary(std::string_view content_type);
  std::size_t parts_seen() const { return parts_seen_; }

private:
  enum class State {
    PREAMBLE,
    AFTER_DELIMITER,
    HEADERS,
    BODY,
    EPILOGUE
  };

  // ---- PARAMETERS ----
  // "\r\n--" + boundary
  std::string delimiter_;
  std::string buffer_;
  State state_;
  std::size_t parts_seen_;

  PartBeginHandler on_part_begin_;
  PartDataHandler on_part_data_;
  PartEndHandler on_part_end_;


  // ---- STATE HANDLERS ----
  // Each returns false when more input is needed
  bool process_preamble();
  bool process_after_delimiter();
  bool process_headers();
  bool process_body();

  MultipartPart parse_part_headers(std::string_view block) const;
};

} // namespace http
} // namespace archiver

#endif // ARCHIVER_HTTP_MULTIPART_PARSER_HPP
