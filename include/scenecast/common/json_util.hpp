#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace scenecast::common {

[[nodiscard]] std::string json_escape(const std::string &value);
[[nodiscard]] std::string json_unescape(const std::string &value);

[[nodiscard]] std::size_t json_skip_ws(const std::string &json, std::size_t pos);
// Returns the index of the closing quote for the string opening at `pos`.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t pos);
// Returns the index of the token closing the container opening at `pos`.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t pos,
                                                   char open, char close);

// Top-level member accessors. Non-string scalars are returned as their literal text.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &key);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &key);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &key);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &key);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                             const std::string &key);

[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

// Flattens one object level: strings are unescaped, everything else is kept as raw JSON.
[[nodiscard]] std::unordered_map<std::string, std::string>
json_parse_flat(const std::string &object_json);

} // namespace scenecast::common
