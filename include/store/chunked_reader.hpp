#ifndef ARCHIVER_STORE_CHUNKED_READER_HPP
#define ARCHIVER_STORE_CHUNKED_READER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include "store/store_error.hpp"

namespace archiver {
namespace store {

// Forward-only chunk source over one stored file. The read handle lives as long as
// the reader does.
class ChunkedReader {
public:
    ChunkedReader(const ChunkedReader&) = delete;
    ChunkedReader& operator=(const ChunkedReader&) = delete;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    // Throws IO_ERROR if the file cannot be opened
    ChunkedReader(const std::filesystem::path& source, std::size_t chunk_size);
    ~ChunkedReader();

    // ---- CHUNK OPERATIONS ----
    // Reads at most min(capacity, chunk_size) bytes into buffer.
    // Returns 0 once the end of the file is reached, throws IO_ERROR on read failure.
    std::size_t read_chunk(char* buffer, std::size_t capacity);
    bool finished() const { return finished_; }

    // ---- GETTERS ----
    std::uintmax_t file_size() const { return file_size_; }
    std::uintmax_t bytes_read() const { return bytes_read_; }
    std::size_t chunks_read() const { return chunks_read_; }
    std::size_t chunk_size() const { return chunk_size_; }

private:
    std::filesystem::path source_;
    std::ifstream file_;
    std::size_t chunk_size_;
    std::uintmax_t file_size_{0};
    std::uintmax_t bytes_read_{0};
    std::size_t chunks_read_{0};
    bool finished_{false};
};

} // namespace store
} // namespace archiver

#endif // ARCHIVER_STORE_CHUNKED_READER_HPP
