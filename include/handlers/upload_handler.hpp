#ifndef ARCHIVER_HANDLERS_UPLOAD_HANDLER_HPP
#define ARCHIVER_HANDLERS_UPLOAD_HANDLER_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "handlers/handler_result.hpp"
#include "http/multipart_parser.hpp"
#include "store/chunked_writer.hpp"
#include "store/store.hpp"

namespace archiver {
namespace handlers {

/**
 * Writes the fields of one upload, one chunk at a time.
 *
 * Fields are processed strictly in order and the first failure aborts the upload.
 * Fields completed before the failure stay on disk, as does the partial file of the
 * failing field.
 */
class UploadOperation {
public:
  using SinkFactory = std::function<std::unique_ptr<store::ChunkSink>(const std::string&)>;

  explicit UploadOperation(SinkFactory sink_factory);

  // ---- FIELD EVENTS ----
  // Throw StoreError: BAD_REQUEST for a missing/invalid filename, IO_ERROR for writes
  void begin_field(const std::optional<std::string>& file_name);
  void append(const char* data, std::size_t size);
  void end_field();

  // Completes the upload, returns the success body
  std::string finish();

  std::size_t fields_completed() const { return fields_completed_; }

private:
  SinkFactory sink_factory_;
  std::unique_ptr<store::ChunkSink> sink_;
  std::string current_name_;
  std::size_t fields_completed_{0};
};

/**
 * Adapts a multipart/form-data request body to an UploadOperation.
 *
 * The transport feeds body fragments as they arrive. Once a fragment fails, the
 * request is marked failed and further input is ignored.
 */
class UploadRequest {
public:
  // Writes into the given store
  UploadRequest(const store::Store& store, const std::string& content_type);
  // Writes into sinks produced by the factory
  UploadRequest(const std::string& content_type, UploadOperation::SinkFactory sink_factory);

  UploadRequest(const UploadRequest&) = delete;
  UploadRequest& operator=(const UploadRequest&) = delete;

  // Returns false once the request has failed
  bool feed(const char* data, std::size_t size);
  // Call after the last fragment
  Result<std::string> finish();

  bool failed() const { return error_.has_value(); }
  std::size_t fields_completed() const { return operation_.fields_completed(); }

private:
  UploadOperation operation_;
  std::unique_ptr<http::MultipartParser> parser_;
  std::optional<HandlerError> error_;

  void fail(store::ArchiveError kind, const std::string& message);
};

} // namespace handlers
} // namespace archiver

#endif // ARCHIVER_HANDLERS_UPLOAD_HANDLER_HPP
