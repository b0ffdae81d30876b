#pragma once

#include <filesystem>
#include <string>

#include <google/protobuf/message.h>

namespace flowstore::serialization {

/*
  Protobuf <-> JSON bridge used for project.json and *.flow files.

  Field names are written as declared in the .proto (snake_case).
  Unknown fields are ignored on read so older binaries can load newer files.
*/

std::string ToJson(const google::protobuf::Message& message, bool pretty = true);

// Throws util::InvalidFormat.
void FromJson(const std::string& json, google::protobuf::Message* message);

// Throws util::PersistenceError if unreadable, util::InvalidFormat if malformed.
void ParseJsonFromFile(const std::filesystem::path& path, google::protobuf::Message* message);

} // namespace flowstore::serialization
