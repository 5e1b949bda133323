// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <charconv>

namespace devicelink {
namespace util {

namespace {

template <typename T>
std::optional<T> ParseBounded(const std::string& str, T min, T max) {
  // from_chars rejects leading whitespace and '+' on its own
  if (str.empty()) {
    return std::nullopt;
  }

  T value{};
  const char* first = str.data();
  const char* last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }

  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  return ParseBounded<int>(str, min, max);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  return ParseBounded<int64_t>(str, min, max);
}

} // namespace util
} // namespace devicelink
