#ifndef ARCHIVER_STORE_ERROR_HPP
#define ARCHIVER_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace archiver {
namespace store {

enum class ArchiveError {
    NOT_FOUND,
    IO_ERROR,
    BAD_REQUEST
};

inline const char* archive_error_to_string(ArchiveError error) {
    switch (error) {
        case ArchiveError::NOT_FOUND: return "Not found";
        case ArchiveError::IO_ERROR: return "I/O error";
        case ArchiveError::BAD_REQUEST: return "Bad request";
        default: return "Undefined error";
    }
}

class StoreError : public std::runtime_error {
public:
    StoreError(ArchiveError kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ArchiveError kind() const { return kind_; }

private:
    ArchiveError kind_;
};

} // namespace store
} // namespace archiver

#endif // ARCHIVER_STORE_ERROR_HPP
