#include "handlers/upload_handler.hpp"
#include "handlers/archive_handlers.hpp"
#include <boost/log/trivial.hpp>

namespace archiver {
namespace handlers {

//==============================================
// UPLOAD OPERATION
//==============================================

UploadOperation::UploadOperation(SinkFactory sink_factory)
  : sink_factory_(std::move(sink_factory)) {
  if (!sink_factory_) {
    throw std::invalid_argument("Upload: Sink factory must be set");
  }
}

void UploadOperation::begin_field(const std::optional<std::string>& file_name) {
  if (sink_) {
    throw store::StoreError(store::ArchiveError::IO_ERROR, "Upload: Previous field still open");
  }

  if (!file_name || file_name->empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Upload: Field " << fields_completed_ + 1 << " has no file name";
    throw store::StoreError(store::ArchiveError::BAD_REQUEST, "Upload: Missing file name");
  }

  current_name_ = *file_name;
  BOOST_LOG_TRIVIAL(info) << "Upload: Uploading file: " << current_name_;
  sink_ = sink_factory_(current_name_);
}

void UploadOperation::append(const char* data, std::size_t size) {
  if (!sink_) {
    throw store::StoreError(store::ArchiveError::IO_ERROR, "Upload: No field open");
  }
  sink_->write(data, size);
}

void UploadOperation::end_field() {
  if (!sink_) {
    throw store::StoreError(store::ArchiveError::IO_ERROR, "Upload: No field open");
  }

  sink_->close();
  sink_.reset();
  ++fields_completed_;
  BOOST_LOG_TRIVIAL(info) << "Upload: File " << current_name_ << " uploaded successfully";
}

std::string UploadOperation::finish() {
  if (sink_) {
    throw store::StoreError(store::ArchiveError::IO_ERROR,
                            "Upload: Field " + current_name_ + " was not completed");
  }
  BOOST_LOG_TRIVIAL(debug) << "Upload: Completed " << fields_completed_ << " fields";
  return UPLOAD_SUCCESS_MESSAGE;
}


//==============================================
// UPLOAD REQUEST
//==============================================

UploadRequest::UploadRequest(const store::Store& store, const std::string& content_type)
  : UploadRequest(content_type, [&store](const std::string& name) {
      return store.create_writer(name);
    }) {
}

UploadRequest::UploadRequest(const std::string& content_type,
                             UploadOperation::SinkFactory sink_factory)
  : operation_(std::move(sink_factory)) {
  auto boundary = http::MultipartParser::extract_boundary(content_type);
  if (!boundary) {
    fail(store::ArchiveError::BAD_REQUEST,
         "Upload: Expected multipart/form-data with a boundary, got '" + content_type + "'");
    return;
  }

  try {
    parser_ = std::make_unique<http::MultipartParser>(
      *boundary,
      [this](const http::MultipartPart& part) { operation_.begin_field(part.filename); },
      [this](const char* data, std::size_t size) { operation_.append(data, size); },
      [this]() { operation_.end_field(); });
  } catch (const http::MultipartError& e) {
    fail(store::ArchiveError::BAD_REQUEST, e.what());
  }
}

bool UploadRequest::feed(const char* data, std::size_t size) {
  if (failed()) {
    return false;
  }

  try {
    parser_->feed(data, size);
  } catch (const store::StoreError& e) {
    fail(e.kind(), e.what());
  } catch (const http::MultipartError& e) {
    fail(store::ArchiveError::BAD_REQUEST, e.what());
  }
  return !failed();
}

Result<std::string> UploadRequest::finish() {
  if (!failed()) {
    try {
      parser_->finish();
      return Result<std::string>::success(operation_.finish());
    } catch (const store::StoreError& e) {
      fail(e.kind(), e.what());
    } catch (const http::MultipartError& e) {
      fail(store::ArchiveError::BAD_REQUEST, e.what());
    }
  }
  return Result<std::string>::failure(*error_);
}

void UploadRequest::fail(store::ArchiveError kind, const std::string& message) {
  if (error_) {
    return;
  }
  BOOST_LOG_TRIVIAL(error) << "Upload: Aborted after " << operation_.fields_completed()
                           << " completed fields (" << store::archive_error_to_string(kind)
                           << "): " << message;
  error_ = HandlerError{kind, message};
}

} // namespace handlers
} // namespace archiver
