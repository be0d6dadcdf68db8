#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "store/store_error.hpp"

namespace archiver {
namespace store {

class ChunkedReader;
class ChunkSink;

class Store {
public:
  static constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Does not touch the filesystem, the directory is created lazily
  explicit Store(const std::filesystem::path& base_path,
                 std::size_t chunk_size = DEFAULT_CHUNK_SIZE);


  // ---- CORE STORAGE OPERATIONS ----
  // Creates/truncates the named file and returns a sink for its chunks
  std::unique_ptr<ChunkSink> create_writer(const std::string& name) const;
  // Checks existence, then opens the named file for chunked reading
  std::unique_ptr<ChunkedReader> open_reader(const std::string& name) const;
  // Removes the named file, NOT_FOUND if it is absent at check time, IO_ERROR if the
  // entry is not a regular file
  void remove(const std::string& name) const;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& name) const;
  // Names of all entries in filesystem enumeration order
  std::vector<std::string> list() const;
  std::uintmax_t get_file_size(const std::string& name) const;


  // ---- GETTERS ----
  const std::filesystem::path& base_path() const { return base_path_; }
  std::size_t chunk_size() const { return chunk_size_; }

  // A stored name must be exactly one plain path component
  static bool is_valid_name(const std::string& name);

  // Creates the storage directory if it does not exist yet
  void ensure_directory() const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  std::size_t chunk_size_;

  // Resolves a name inside base_path_, throws BAD_REQUEST for invalid names
  std::filesystem::path resolve_name(const std::string& name) const;
};

} // namespace store
} // namespace archiver
