#pragma once

#include <string>
#include <vector>

namespace archiver {
namespace handlers {

// Error payload of failed requests: {"message": ..., "error": ...}
struct ResponseError {
  std::string message;
  std::string error;
};

// Point-in-time listing of the storage directory: {"files": [...]}
struct ArchiveListing {
  std::vector<std::string> files;
};

std::string to_json(const ResponseError& response);
std::string to_json(const ArchiveListing& listing);

} // namespace handlers
} // namespace archiver
