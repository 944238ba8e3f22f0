#include "calsched/common/text.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace calsched::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string fold_identifier(const std::string &value, std::string_view ignored) {
  std::string folded;
  folded.reserve(value.size());
  for (const char ch : value) {
    if (ignored.find(ch) != std::string_view::npos) {
      continue;
    }
    folded.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return folded;
}

std::vector<std::string> split_trimmed(const std::string &value, const char separator) {
  std::vector<std::string> parts;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, separator)) {
    parts.push_back(trim(part));
  }
  return parts;
}

Result<int> parse_int(const std::string &value) {
  const std::string normalized = trim(value);
  const char *first = normalized.data();
  const char *last = first + normalized.size();
  // from_chars rejects a leading '+', TOML and hand-written values may carry one
  if (first != last && *first == '+') {
    ++first;
    if (first != last && *first == '-') {
      return Result<int>::failure("invalid integer: " + value);
    }
  }
  int parsed = 0;
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (normalized.empty() || ec != std::errc() || ptr != last) {
    return Result<int>::failure("invalid integer: " + value);
  }
  return Result<int>::success(parsed);
}

} // namespace calsched::common
