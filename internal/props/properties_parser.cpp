#include "properties_parser.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::props {

namespace {

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\f");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\f");
  return s.substr(begin, end - begin + 1);
}

// An odd number of trailing backslashes means the line continues.
bool ContinuesOnNextLine(const std::string& line) {
  std::size_t count = 0;
  for (auto it = line.rbegin(); it != line.rend() && *it == '\\'; ++it) ++count;
  return count % 2 == 1;
}

void AppendUtf8(uint32_t code_point, std::string* out) {
  if (code_point < 0x80) {
    *out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    *out += static_cast<char>(0xC0 | (code_point >> 6));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    *out += static_cast<char>(0xE0 | (code_point >> 12));
    *out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    *out += static_cast<char>(0xF0 | (code_point >> 18));
    *out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    *out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

// Four hex digits of a \uXXXX escape starting at `pos`.
uint32_t ParseHex4(const std::string& s, std::size_t pos) {
  if (pos + 4 > s.size()) {
    throw util::InvalidFormat("Malformed \\uxxxx encoding in: " + s);
  }
  uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char c = s[i];
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      throw util::InvalidFormat("Malformed \\uxxxx encoding in: " + s);
    }
  }
  return value;
}

// \t \n \r \f \uXXXX; any other escaped character stands for itself.
std::string Unescape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\') {
      out += s[i];
      continue;
    }
    if (++i == s.size()) break;

    switch (s[i]) {
      case 't':
        out += '\t';
        break;
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 'f':
        out += '\f';
        break;
      case 'u': {
        uint32_t code_point = ParseHex4(s, i + 1);
        i += 4;
        // surrogate pair written as two escapes
        if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < s.size() && s[i + 1] == '\\' && s[i + 2] == 'u') {
          const uint32_t low = ParseHex4(s, i + 3);
          if (low >= 0xDC00 && low <= 0xDFFF) {
            code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
            i += 6;
          }
        }
        AppendUtf8(code_point, &out);
        break;
      }
      default:
        out += s[i];
        break;
    }
  }
  return out;
}

bool IsKeyTerminator(char c) {
  return c == '=' || c == ':' || c == ' ' || c == '\t' || c == '\f';
}

void AddEntry(const std::string& logical_line, flowstore::v1::Properties* props) {
  const auto line = Trim(logical_line);
  if (line.empty() || line.front() == '#' || line.front() == '!') return;

  // key ends at the first unescaped separator or blank
  std::size_t sep = 0;
  while (sep < line.size() && !IsKeyTerminator(line[sep])) {
    sep += line[sep] == '\\' ? 2 : 1;
  }
  sep = std::min(sep, line.size());

  const auto key = Unescape(line.substr(0, sep));
  if (sep == line.size()) {
    (*props->mutable_entries())[key] = "";
    return;
  }

  // "key = value" and "key : value": one '=' or ':' after leading blanks
  auto value_start = line.find_first_not_of(" \t\f", sep);
  if (value_start != std::string::npos && (line[value_start] == '=' || line[value_start] == ':')) {
    value_start = line.find_first_not_of(" \t\f", value_start + 1);
  }

  const auto value = value_start == std::string::npos ? std::string() : line.substr(value_start);
  (*props->mutable_entries())[key] = Unescape(value);
}

} // namespace

flowstore::v1::Properties ParseProperties(const std::string& text, const std::string& source) {
  flowstore::v1::Properties props;
  props.set_source(source);

  std::istringstream in(text);
  std::string        line;
  std::string        logical;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (!logical.empty()) {
      const auto start = line.find_first_not_of(" \t");
      line             = start == std::string::npos ? std::string() : line.substr(start);
    } else {
      const auto trimmed = Trim(line);
      if (!trimmed.empty() && (trimmed.front() == '#' || trimmed.front() == '!')) continue;
    }

    if (ContinuesOnNextLine(line)) {
      logical += line.substr(0, line.size() - 1);
      continue;
    }

    logical += line;
    AddEntry(logical, &props);
    logical.clear();
  }

  if (!logical.empty()) {
    AddEntry(logical, &props);
  }

  return props;
}

flowstore::v1::Properties ParsePropertiesFile(const std::filesystem::path& path) {
  std::string text;
  try {
    text = storage::common::ReadFileToString(path);
  } catch (const std::runtime_error& e) {
    throw util::PersistenceError("Cannot read properties file " + path.string(), e);
  }
  return ParseProperties(text, path.string());
}

} // namespace flowstore::props
