// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <exception>

namespace lansync {
namespace util {

namespace {

// Parses a signed integer; rejects empty input, leading whitespace and
// trailing characters.
std::optional<long> ParseWholeLong(const std::string& str) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    // std::invalid_argument or std::out_of_range
    return std::nullopt;
  }
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = ParseWholeLong(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = ParseWholeLong(str);
  if (!value || *value < 1 || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::vector<std::string> SplitCommaList(const std::string& str) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.length()) {
    size_t comma = str.find(',', pos);
    if (comma == std::string::npos) {
      comma = str.length();
    }
    if (comma > pos) {
      items.push_back(str.substr(pos, comma - pos));
    }
    pos = comma + 1;
  }
  return items;
}

} // namespace util
} // namespace lansync
