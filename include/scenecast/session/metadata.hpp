#pragma once

#include "scenecast/config/config.hpp"
#include "scenecast/narration/audio_event.hpp"
#include "scenecast/session/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::session {

struct RunMetadata {
  config::RunMode mode = config::RunMode::Human;
  config::RecordMode record_mode = config::RecordMode::None;
  std::string base_url;
  std::int64_t duration_ms = 0;
  std::vector<StepRecord> steps;
  std::optional<std::filesystem::path> video;
  std::optional<std::filesystem::path> thumbnail;
  std::filesystem::path subtitles;
  std::vector<PaneSummary> panes;
  std::vector<narration::AudioEvent> audio_events;
  std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/// UTC, millisecond precision: 2024-01-02T03:04:05.678Z
[[nodiscard]] std::string iso8601_utc(std::chrono::system_clock::time_point when);

/// Pretty-printed run.json. Empty optional sections are omitted.
[[nodiscard]] std::string render_metadata_json(const RunMetadata &metadata);

} // namespace scenecast::session
