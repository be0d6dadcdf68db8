#include "handlers/archive_handlers.hpp"
#include <boost/log/trivial.hpp>

namespace archiver {
namespace handlers {

Result<ArchiveListing> list_archive(const store::Store& store) {
  try {
    ArchiveListing listing;
    listing.files = store.list();
    BOOST_LOG_TRIVIAL(debug) << "Handlers: Listing returned " << listing.files.size() << " files";
    return Result<ArchiveListing>::success(std::move(listing));
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Handlers: List failed: " << e.what();
    return Result<ArchiveListing>::failure(e.kind(), e.what());
  }
}

Result<std::unique_ptr<store::ChunkedReader>> stream_file(const store::Store& store,
                                                          const std::string& file_name) {
  using StreamResult = Result<std::unique_ptr<store::ChunkedReader>>;
  try {
    auto reader = store.open_reader(file_name);
    BOOST_LOG_TRIVIAL(info) << "Handlers: Streaming file: " << file_name << " ("
                            << reader->file_size() << " bytes)";
    return StreamResult::success(std::move(reader));
  } catch (const store::StoreError& e) {
    return StreamResult::failure(e.kind(), e.what());
  }
}

Result<std::string> delete_file(const store::Store& store, const std::string& file_name) {
  try {
    store.remove(file_name);
    BOOST_LOG_TRIVIAL(info) << "Handlers: File " << file_name << " deleted successfully";
    return Result<std::string>::success(DELETE_SUCCESS_MESSAGE);
  } catch (const store::StoreError& e) {
    return Result<std::string>::failure(e.kind(), e.what());
  }
}

} // namespace handlers
} // namespace archiver
