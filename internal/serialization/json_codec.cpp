#include "json_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::serialization {

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::InvalidFormat("Invalid " + message->GetTypeName() + " JSON: " + std::string(status.message()));
  }
}

void ParseJsonFromFile(const std::filesystem::path& path, google::protobuf::Message* message) {
  std::string json;
  try {
    json = storage::common::ReadFileToString(path);
  } catch (const std::runtime_error& e) {
    throw util::PersistenceError("Cannot read " + path.string(), e);
  }
  FromJson(json, message);
}

} // namespace flowstore::serialization
