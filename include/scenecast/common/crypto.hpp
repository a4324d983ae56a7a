#pragma once

#include "scenecast/common/result.hpp"

#include <string>

namespace scenecast::common {

[[nodiscard]] std::string sha256_hex(const std::string &data);
[[nodiscard]] std::string sha1_digest(const std::string &data);

[[nodiscard]] std::string base64_encode(const std::string &data);
[[nodiscard]] Result<std::string> base64_decode(const std::string &encoded);

[[nodiscard]] std::string random_bytes(std::size_t count);

} // namespace scenecast::common
