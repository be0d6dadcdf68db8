#include "handlers/response_models.hpp"
#include <json/json.h>

namespace archiver {
namespace handlers {

namespace {

std::string write_compact(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

} // namespace

std::string to_json(const ResponseError& response) {
  Json::Value root;
  root["message"] = response.message;
  root["error"] = response.error;
  return write_compact(root);
}

std::string to_json(const ArchiveListing& listing) {
  Json::Value root;
  root["files"] = Json::Value(Json::arrayValue);
  for (const auto& name : listing.files) {
    root["files"].append(name);
  }
  return write_compact(root);
}

} // namespace handlers
} // namespace archiver
