#pragma once

#include "scenecast/session/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace scenecast::session {

/// HH:MM:SS.mmm, truncating toward zero. Negative offsets clamp to zero.
[[nodiscard]] std::string format_vtt_time(std::int64_t ms);

[[nodiscard]] std::string generate_webvtt(const std::vector<StepRecord> &steps);

} // namespace scenecast::session
