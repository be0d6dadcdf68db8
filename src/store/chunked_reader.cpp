#include "store/chunked_reader.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace archiver {
namespace store {

ChunkedReader::ChunkedReader(const std::filesystem::path& source, std::size_t chunk_size)
  : source_(source)
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("Chunked reader: Chunk size must be greater than zero");
  }

  file_.open(source_, std::ios::binary | std::ios::in);
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Chunked reader: Failed to open file: " << source_.string();
    throw StoreError(ArchiveError::IO_ERROR, "Chunked reader: Failed to open file");
  }

  std::error_code ec;
  file_size_ = std::filesystem::file_size(source_, ec);
  if (ec) {
    // Size is only informational
    BOOST_LOG_TRIVIAL(warning) << "Chunked reader: Could not stat " << source_.string()
                               << ": " << ec.message();
    file_size_ = 0;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunked reader: Opened " << source_.string() << " ("
                           << file_size_ << " bytes)";
}

ChunkedReader::~ChunkedReader() {
  if (!finished_) {
    BOOST_LOG_TRIVIAL(debug) << "Chunked reader: Released " << source_.string() << " after "
                             << bytes_read_ << " bytes";
  }
}

std::size_t ChunkedReader::read_chunk(char* buffer, std::size_t capacity) {
  if (finished_ || capacity == 0) {
    return 0;
  }

  const std::size_t wanted = std::min(capacity, chunk_size_);
  file_.read(buffer, static_cast<std::streamsize>(wanted));
  const auto got = static_cast<std::size_t>(file_.gcount());

  if (file_.bad() || (file_.fail() && !file_.eof())) {
    BOOST_LOG_TRIVIAL(error) << "Chunked reader: Read failed on " << source_.string()
                             << " after " << bytes_read_ << " bytes";
    throw StoreError(ArchiveError::IO_ERROR, "Chunked reader: Failed to read chunk");
  }

  if (file_.eof()) {
    finished_ = true;
    file_.close();
    BOOST_LOG_TRIVIAL(debug) << "Chunked reader: Finished " << source_.string() << " ("
                             << bytes_read_ + got << " bytes)";
  }

  if (got > 0) {
    bytes_read_ += got;
    ++chunks_read_;
  }
  return got;
}

} // namespace store
} // namespace archiver
