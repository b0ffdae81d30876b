#pragma once

#include <filesystem>
#include <string>

#include "flowstore/v1.hpp"

namespace flowstore::props {

/*
  Java-style .properties reader.

    key=value | key: value | key value
    # or ! starts a comment line
    trailing '\' joins the next line
    \= \: \<space> \\ \t \n \r \f \uXXXX escapes in keys and values

  Later keys override earlier ones. Unlike java.util.Properties, trailing
  blanks of a value are dropped. A malformed \uXXXX throws
  util::InvalidFormat.
*/
flowstore::v1::Properties ParseProperties(const std::string& text, const std::string& source);

// Throws util::PersistenceError when the file cannot be read, util::InvalidFormat when malformed.
flowstore::v1::Properties ParsePropertiesFile(const std::filesystem::path& path);

} // namespace flowstore::props
