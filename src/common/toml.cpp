#include "calsched/common/toml.hpp"

#include "calsched/common/text.hpp"

#include <cctype>
#include <set>
#include <sstream>

namespace calsched::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

bool is_bare_key(const std::string &key) {
  if (key.empty()) {
    return false;
  }
  for (const char ch : key) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_' || ch == '-' || ch == '.')) {
      return false;
    }
  }
  return key.front() != '.' && key.back() != '.' && key.find("..") == std::string::npos;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote_toml_string(it->second);
}

std::vector<std::string> TomlDocument::child_names(const std::string &prefix) const {
  const std::string lead = prefix + ".";
  std::set<std::string> names;
  for (const auto &[key, value] : values) {
    if (!starts_with(key, lead)) {
      continue;
    }
    const std::string rest = key.substr(lead.size());
    const auto dot = rest.find('.');
    if (dot == std::string::npos) {
      continue;
    }
    names.insert(rest.substr(0, dot));
  }
  return {names.begin(), names.end()};
}

std::vector<std::string> TomlDocument::keys_in(const std::string &section) const {
  const std::string lead = section + ".";
  std::vector<std::string> keys;
  for (const auto &[key, value] : values) {
    if (starts_with(key, lead)) {
      keys.push_back(key.substr(lead.size()));
    }
  }
  return keys;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (!is_bare_key(current_section)) {
        return Result<TomlDocument>::failure("Invalid section name at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }
    if (!is_bare_key(key)) {
      return Result<TomlDocument>::failure("Invalid key '" + key + "' at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure("Duplicate key '" + full_key + "' at line " +
                                           std::to_string(line_number));
    }
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string unquote_toml_string(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  bool escaped = false;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
        continue;
      }
      out.push_back(ch);
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

} // namespace calsched::common
