#pragma once

#include "scenecast/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace scenecast::common {

[[nodiscard]] std::string trim(std::string_view value);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] bool ends_with(std::string_view value, std::string_view suffix);
// Splits UTF-8 text into whole code points; a truncated tail is kept as-is.
[[nodiscard]] std::vector<std::string> utf8_characters(std::string_view text);

[[nodiscard]] std::string expand_path(const std::string &path);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Status write_file(const std::filesystem::path &path, const std::string &content);

} // namespace scenecast::common
