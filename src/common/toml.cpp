#include "scenecast/common/toml.hpp"

#include "scenecast/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace scenecast::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_basic = false;
  bool in_literal = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_basic) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        in_basic = false;
      }
      continue;
    }
    if (in_literal) {
      if (c == '\'') {
        in_literal = false;
      }
      continue;
    }
    if (c == '"') {
      in_basic = true;
    } else if (c == '\'') {
      in_literal = true;
    } else if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

int bracket_balance(const std::string &value) {
  int depth = 0;
  bool in_string = false;
  char quote = '\0';
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    if (in_string) {
      if (c == '\\' && quote == '"') {
        ++i;
      } else if (c == quote) {
        in_string = false;
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      in_string = true;
      quote = c;
    } else if (c == '[') {
      ++depth;
    } else if (c == ']') {
      --depth;
    }
  }
  return depth;
}

std::string unquote_key(const std::string &raw) {
  const std::string key = trim(raw);
  if (key.size() >= 2 && (key.front() == '"' || key.front() == '\'') && key.back() == key.front()) {
    return key.substr(1, key.size() - 2);
  }
  return key;
}

std::string unquote_string(const std::string &raw) {
  if (raw.size() < 2) {
    return raw;
  }
  if (raw.front() == '\'' && raw.back() == '\'') {
    return raw.substr(1, raw.size() - 2);
  }
  if (raw.front() != '"' || raw.back() != '"') {
    return raw;
  }
  std::string out;
  const std::string body = raw.substr(1, raw.size() - 2);
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    const char next = body[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
    }
  }
  return out;
}

std::vector<std::string> split_array_items(const std::string &raw) {
  std::vector<std::string> items;
  std::string inner = trim(raw);
  if (inner.size() < 2 || inner.front() != '[' || inner.back() != ']') {
    return items;
  }
  inner = inner.substr(1, inner.size() - 2);
  std::string current;
  bool in_string = false;
  char quote = '\0';
  for (std::size_t i = 0; i < inner.size(); ++i) {
    const char c = inner[i];
    if (in_string) {
      current.push_back(c);
      if (c == '\\' && quote == '"' && i + 1 < inner.size()) {
        current.push_back(inner[++i]);
      } else if (c == quote) {
        in_string = false;
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      in_string = true;
      quote = c;
      current.push_back(c);
    } else if (c == ',') {
      if (!trim(current).empty()) {
        items.push_back(trim(current));
      }
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!trim(current).empty()) {
    items.push_back(trim(current));
  }
  return items;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote_string(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  if (it->second == "true") {
    return true;
  }
  if (it->second == "false") {
    return false;
  }
  return fallback;
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  try {
    std::size_t consumed = 0;
    const double value = std::stod(it->second, &consumed);
    return consumed == it->second.size() ? value : fallback;
  } catch (const std::exception &) {
    return fallback;
  }
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  std::uint64_t value = 0;
  const auto *begin = it->second.data();
  const auto *end = begin + it->second.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return fallback;
  }
  return value;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &item : split_array_items(it->second)) {
    out.push_back(unquote_string(item));
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &text) {
  TomlDocument doc;
  std::istringstream stream(text);
  std::string line;
  std::string section;
  std::size_t line_no = 0;

  while (std::getline(stream, line)) {
    ++line_no;
    std::string content = trim(strip_comment(line));
    if (content.empty()) {
      continue;
    }

    if (starts_with(content, "[[")) {
      return Result<TomlDocument>::failure("line " + std::to_string(line_no) +
                                           ": arrays of tables are not supported");
    }
    if (content.front() == '[') {
      if (content.back() != ']') {
        return Result<TomlDocument>::failure("line " + std::to_string(line_no) +
                                             ": unterminated table header");
      }
      section = trim(content.substr(1, content.size() - 2));
      continue;
    }

    const auto eq = content.find('=');
    if (eq == std::string::npos) {
      return Result<TomlDocument>::failure("line " + std::to_string(line_no) +
                                           ": expected key = value");
    }

    std::string key;
    std::stringstream key_parts(content.substr(0, eq));
    std::string part;
    while (std::getline(key_parts, part, '.')) {
      if (!key.empty()) {
        key += '.';
      }
      key += unquote_key(part);
    }
    if (key.empty()) {
      return Result<TomlDocument>::failure("line " + std::to_string(line_no) + ": empty key");
    }

    std::string value = trim(content.substr(eq + 1));
    while (bracket_balance(value) > 0 && std::getline(stream, line)) {
      ++line_no;
      value += " " + trim(strip_comment(line));
    }
    if (bracket_balance(value) != 0) {
      return Result<TomlDocument>::failure("line " + std::to_string(line_no) +
                                           ": unbalanced array");
    }

    doc.values[section.empty() ? key : section + "." + key] = value;
  }

  return Result<TomlDocument>::success(std::move(doc));
}

} // namespace scenecast::common
