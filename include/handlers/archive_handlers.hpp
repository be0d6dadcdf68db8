#pragma once

#include <memory>
#include <string>
#include "handlers/handler_result.hpp"
#include "handlers/response_models.hpp"
#include "store/chunked_reader.hpp"
#include "store/store.hpp"

namespace archiver {
namespace handlers {

// Success bodies shared with the HTTP adapter
inline constexpr const char* UPLOAD_SUCCESS_MESSAGE = "Video uploaded successfully";
inline constexpr const char* DELETE_SUCCESS_MESSAGE = "File deleted successfully";

// ---- REQUEST OPERATIONS ----
// Each operation is stateless: everything it knows comes from the store it is given.

// Re-scans the storage directory, creating it first if needed
Result<ArchiveListing> list_archive(const store::Store& store);

// Existence check then open. The returned reader yields the file lazily.
Result<std::unique_ptr<store::ChunkedReader>> stream_file(const store::Store& store,
                                                          const std::string& file_name);

Result<std::string> delete_file(const store::Store& store, const std::string& file_name);

} // namespace handlers
} // namespace archiver
