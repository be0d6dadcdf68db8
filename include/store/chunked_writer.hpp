#ifndef ARCHIVER_STORE_CHUNKED_WRITER_HPP
#define ARCHIVER_STORE_CHUNKED_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include "store/store_error.hpp"

namespace archiver {
namespace store {

// Destination for the ordered chunks of one upload field
class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    virtual void write(const char* data, std::size_t size) = 0;
    // Flushes and releases the destination, must be called once all chunks are written
    virtual void close() = 0;

protected:
    ChunkSink() = default;
};

// Writes chunks straight to a file, holding nothing but the stream buffer in memory.
// A failed or abandoned writer leaves its partial file on disk.
class ChunkedWriter : public ChunkSink {
public:
    ChunkedWriter(const ChunkedWriter&) = delete;
    ChunkedWriter& operator=(const ChunkedWriter&) = delete;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    // Creates or truncates the destination, throws IO_ERROR if it cannot be opened
    explicit ChunkedWriter(const std::filesystem::path& destination);
    ~ChunkedWriter() override;

    // ---- CHUNK OPERATIONS ----
    void write(const char* data, std::size_t size) override;
    void close() override;

    // ---- GETTERS ----
    std::uintmax_t bytes_written() const { return bytes_written_; }
    std::size_t chunks_written() const { return chunks_written_; }

private:
    std::filesystem::path destination_;
    std::ofstream file_;
    std::uintmax_t bytes_written_{0};
    std::size_t chunks_written_{0};
};

} // namespace store
} // namespace archiver

#endif // ARCHIVER_STORE_CHUNKED_WRITER_HPP
