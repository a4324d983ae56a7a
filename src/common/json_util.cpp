#include "scenecast/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace scenecast::common {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_hex4(const std::string &value, std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > value.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char c = value[i];
    out <<= 4;
    if (c >= '0' && c <= '9') {
      out |= static_cast<std::uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      out |= static_cast<std::uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      out |= static_cast<std::uint32_t>(c - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

// End index (inclusive) of the value starting at `pos`, or npos.
std::size_t value_end(const std::string &json, std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char c = json[pos];
  if (c == '"') {
    return json_find_string_end(json, pos);
  }
  if (c == '{') {
    return json_find_matching_token(json, pos, '{', '}');
  }
  if (c == '[') {
    return json_find_matching_token(json, pos, '[', ']');
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end > pos ? end - 1 : std::string::npos;
}

struct MemberSpan {
  std::size_t start = std::string::npos;
  std::size_t end = std::string::npos;
};

MemberSpan find_member(const std::string &json, const std::string &key) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return {};
  }
  ++pos;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string member = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    const auto end = value_end(json, pos);
    if (end == std::string::npos) {
      break;
    }
    if (member == key) {
      return {pos, end};
    }
    pos = end + 1;
  }
  return {};
}

} // namespace

std::string json_escape(const std::string &value) {
  std::ostringstream out;
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(static_cast<unsigned char>(ch)) << std::dec;
      } else {
        out << ch;
      }
    }
  }
  return out.str();
}

std::string json_unescape(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 1 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!parse_hex4(value, i + 1, cp)) {
        out.push_back('u');
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < value.size() && value[i + 1] == '\\' &&
          value[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(value, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &json, std::size_t pos) {
  while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t pos) {
  if (pos >= json.size() || json[pos] != '"') {
    return std::string::npos;
  }
  for (std::size_t i = pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
      continue;
    }
    if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t pos, char open,
                                     char close) {
  if (pos >= json.size() || json[pos] != open) {
    return std::string::npos;
  }
  int depth = 0;
  for (std::size_t i = pos; i < json.size(); ++i) {
    const char c = json[i];
    if (c == '"') {
      i = json_find_string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
      continue;
    }
    if (c == open) {
      ++depth;
    } else if (c == close) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &key) {
  const auto span = find_member(json, key);
  if (span.start == std::string::npos) {
    return "";
  }
  if (json[span.start] == '"') {
    return json_unescape(json.substr(span.start + 1, span.end - span.start - 1));
  }
  if (json[span.start] == '{' || json[span.start] == '[') {
    return "";
  }
  const std::string literal = json.substr(span.start, span.end - span.start + 1);
  return literal == "null" ? "" : literal;
}

std::string json_get_number(const std::string &json, const std::string &key) {
  const auto span = find_member(json, key);
  if (span.start == std::string::npos) {
    return "";
  }
  const char c = json[span.start];
  if (c != '-' && std::isdigit(static_cast<unsigned char>(c)) == 0) {
    return "";
  }
  return json.substr(span.start, span.end - span.start + 1);
}

std::string json_get_object(const std::string &json, const std::string &key) {
  const auto span = find_member(json, key);
  if (span.start == std::string::npos || json[span.start] != '{') {
    return "";
  }
  return json.substr(span.start, span.end - span.start + 1);
}

std::string json_get_array(const std::string &json, const std::string &key) {
  const auto span = find_member(json, key);
  if (span.start == std::string::npos || json[span.start] != '[') {
    return "";
  }
  return json.substr(span.start, span.end - span.start + 1);
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &key) {
  std::vector<std::string> out;
  const std::string array = json_get_array(json, key);
  if (array.empty()) {
    return out;
  }
  std::size_t pos = 1;
  while (pos < array.size()) {
    pos = json_skip_ws(array, pos);
    if (pos >= array.size() || array[pos] == ']') {
      break;
    }
    if (array[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = value_end(array, pos);
    if (end == std::string::npos) {
      break;
    }
    if (array[pos] == '"') {
      out.push_back(json_unescape(array.substr(pos + 1, end - pos - 1)));
    }
    pos = end + 1;
  }
  return out;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = value_end(array_json, pos);
    if (end == std::string::npos) {
      break;
    }
    if (array_json[pos] == '{') {
      out.push_back(array_json.substr(pos, end - pos + 1));
    }
    pos = end + 1;
  }
  return out;
}

std::unordered_map<std::string, std::string> json_parse_flat(const std::string &object_json) {
  std::unordered_map<std::string, std::string> out;
  std::size_t pos = json_skip_ws(object_json, 0);
  if (pos >= object_json.size() || object_json[pos] != '{') {
    return out;
  }
  ++pos;
  while (pos < object_json.size()) {
    pos = json_skip_ws(object_json, pos);
    if (pos >= object_json.size() || object_json[pos] == '}') {
      break;
    }
    if (object_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (object_json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(object_json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(object_json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(object_json, key_end + 1);
    if (pos >= object_json.size() || object_json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(object_json, pos + 1);
    const auto end = value_end(object_json, pos);
    if (end == std::string::npos) {
      break;
    }
    if (object_json[pos] == '"') {
      out[key] = json_unescape(object_json.substr(pos + 1, end - pos - 1));
    } else {
      out[key] = object_json.substr(pos, end - pos + 1);
    }
    pos = end + 1;
  }
  return out;
}

} // namespace scenecast::common
