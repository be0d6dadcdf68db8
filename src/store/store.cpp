#include "store/store.hpp"
#include "store/chunked_reader.hpp"
#include "store/chunked_writer.hpp"
#include <boost/log/trivial.hpp>
#include <system_error>

namespace archiver {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Store(const std::filesystem::path& base_path, std::size_t chunk_size)
  : base_path_(base_path)
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("Store: Chunk size must be greater than zero");
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path_.string()
                          << " (chunk size " << chunk_size_ << " bytes)";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::unique_ptr<ChunkSink> Store::create_writer(const std::string& name) const {
  std::filesystem::path file_path = resolve_name(name);
  ensure_directory();

  BOOST_LOG_TRIVIAL(debug) << "Store: Opening writer for: " << file_path.string();
  return std::make_unique<ChunkedWriter>(file_path);
}

std::unique_ptr<ChunkedReader> Store::open_reader(const std::string& name) const {
  // Invalid names are never stored, so they report NOT_FOUND like any absent file
  if (!has(name)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: File not found: " << name;
    throw StoreError(ArchiveError::NOT_FOUND, "Store: File not found: " + name);
  }
  std::filesystem::path file_path = resolve_name(name);

  // The file may vanish between the check above and this open, ChunkedReader then
  // reports IO_ERROR
  return std::make_unique<ChunkedReader>(file_path, chunk_size_);
}

void Store::remove(const std::string& name) const {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing file: " << name;

  if (!has(name)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: File not found: " << name;
    throw StoreError(ArchiveError::NOT_FOUND, "Store: File not found: " + name);
  }
  std::filesystem::path file_path = resolve_name(name);

  // Only stored files are removable, a directory entry in the archive is left alone
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Refusing to remove " << file_path.string()
                             << (ec ? ": " + ec.message() : std::string(": not a regular file"));
    throw StoreError(ArchiveError::IO_ERROR, "Store: Not a regular file: " + name);
  }

  if (!std::filesystem::remove(file_path, ec) || ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove file " << file_path.string()
                             << (ec ? ": " + ec.message() : std::string(": vanished before removal"));
    throw StoreError(ArchiveError::IO_ERROR, "Store: Failed to remove file: " + name);
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed file: " << name;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& name) const {
  if (!is_valid_name(name)) {
    return false;
  }

  std::error_code ec;
  bool exists = std::filesystem::exists(base_path_ / name, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Existence check failed for " << name << ": " << ec.message();
    throw StoreError(ArchiveError::IO_ERROR, "Store: Existence check failed: " + name);
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: " << name << (exists ? " exists" : " not found");
  return exists;
}

std::vector<std::string> Store::list() const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Listing contents of " << base_path_.string();
  ensure_directory();

  std::vector<std::string> names;
  std::error_code ec;
  std::filesystem::directory_iterator it(base_path_, ec);
  const std::filesystem::directory_iterator end;

  while (!ec && it != end) {
    names.push_back(it->path().filename().string());
    it.increment(ec);
  }

  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to read directory " << base_path_.string()
                             << ": " << ec.message();
    throw StoreError(ArchiveError::IO_ERROR, "Store: Failed to read storage directory");
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Listed " << names.size() << " entries";
  return names;
}

std::uintmax_t Store::get_file_size(const std::string& name) const {
  if (!has(name)) {
    throw StoreError(ArchiveError::NOT_FOUND, "Store: File not found: " + name);
  }
  std::filesystem::path file_path = resolve_name(name);

  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw StoreError(ArchiveError::IO_ERROR, "Store: Failed to stat file: " + name);
  }
  return size;
}


//==============================================
// UTILITY METHODS
//==============================================

bool Store::is_valid_name(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

void Store::ensure_directory() const {
  std::error_code ec;
  if (std::filesystem::is_directory(base_path_, ec)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Creating storage directory: " << base_path_.string();
  std::filesystem::create_directories(base_path_, ec);
  if (ec || !std::filesystem::is_directory(base_path_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create storage directory " << base_path_.string()
                             << (ec ? ": " + ec.message() : std::string());
    throw StoreError(ArchiveError::IO_ERROR, "Store: Failed to create storage directory");
  }
}

std::filesystem::path Store::resolve_name(const std::string& name) const {
  if (!is_valid_name(name)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Rejected file name: '" << name << "'";
    throw StoreError(ArchiveError::BAD_REQUEST, "Store: Invalid file name");
  }
  return base_path_ / name;
}

} // namespace store
} // namespace archiver
