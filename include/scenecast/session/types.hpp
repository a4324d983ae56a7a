#pragma once

#include "scenecast/config/config.hpp"
#include "scenecast/narration/audio_event.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::session {

struct StepRecord {
  int index = 0;
  std::string caption;
  std::int64_t start_ms = 0;
  std::int64_t end_ms = 0;
  // Pane id for session steps, actor role for collaborative ones.
  std::string tag;
};

enum class PaneKind { Browser, Terminal };

[[nodiscard]] inline const char *pane_kind_name(PaneKind kind) {
  return kind == PaneKind::Browser ? "browser" : "terminal";
}

struct PaneSummary {
  std::string id;
  PaneKind kind = PaneKind::Browser;
  std::string label;
};

struct SessionResult {
  config::RunMode mode = config::RunMode::Human;
  config::RecordMode record_mode = config::RecordMode::None;
  std::optional<std::filesystem::path> video;
  // First pane's final frame, also embedded as the video's poster frame.
  std::optional<std::filesystem::path> thumbnail;
  std::filesystem::path subtitles;
  std::filesystem::path metadata;
  std::filesystem::path artifact_dir;
  std::int64_t duration_ms = 0;
  std::vector<StepRecord> steps;
  std::vector<narration::AudioEvent> audio_events;
};

} // namespace scenecast::session
