#include "store/chunked_writer.hpp"
#include <boost/log/trivial.hpp>

namespace archiver {
namespace store {

ChunkedWriter::ChunkedWriter(const std::filesystem::path& destination)
  : destination_(destination) {
  // Open in binary mode and truncate, re-uploading a name overwrites it
  file_.open(destination_, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Chunked writer: Failed to create file: " << destination_.string();
    throw StoreError(ArchiveError::IO_ERROR, "Chunked writer: Failed to create file");
  }
  BOOST_LOG_TRIVIAL(debug) << "Chunked writer: Opened " << destination_.string();
}

ChunkedWriter::~ChunkedWriter() {
  if (file_.is_open()) {
    file_.close();
    BOOST_LOG_TRIVIAL(warning) << "Chunked writer: " << destination_.string()
                               << " abandoned after " << bytes_written_ << " bytes";
  }
}

void ChunkedWriter::write(const char* data, std::size_t size) {
  if (!file_.is_open()) {
    throw StoreError(ArchiveError::IO_ERROR, "Chunked writer: Write after close");
  }

  file_.write(data, static_cast<std::streamsize>(size));
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Chunked writer: Failed to write " << size << " bytes to "
                             << destination_.string() << " after " << bytes_written_ << " bytes";
    throw StoreError(ArchiveError::IO_ERROR, "Chunked writer: Failed to write chunk");
  }

  bytes_written_ += size;
  ++chunks_written_;
  BOOST_LOG_TRIVIAL(trace) << "Chunked writer: Wrote chunk of " << size << " bytes";
}

void ChunkedWriter::close() {
  if (!file_.is_open()) {
    return;
  }

  file_.flush();
  bool flushed = file_.good();
  file_.close();
  if (!flushed || file_.fail()) {
    BOOST_LOG_TRIVIAL(error) << "Chunked writer: Failed to flush " << destination_.string();
    throw StoreError(ArchiveError::IO_ERROR, "Chunked writer: Failed to flush file");
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunked writer: Closed " << destination_.string() << " ("
                           << bytes_written_ << " bytes in " << chunks_written_ << " chunks)";
}

} // namespace store
} // namespace archiver
