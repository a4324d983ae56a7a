#pragma once

#include "scenecast/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace scenecast::common {

// Flat view of a TOML file: every leaf is stored under its dotted key with raw value text.
struct TomlDocument {
  std::map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &text);

} // namespace scenecast::common
