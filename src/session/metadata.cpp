#include "scenecast/session/metadata.hpp"

#include "scenecast/common/json_util.hpp"

#include <cstdio>
#include <ctime>
#include <sstream>

namespace scenecast::session {

namespace {

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

void write_steps(std::ostringstream &out, const std::vector<StepRecord> &steps) {
  out << "  \"steps\": [";
  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto &step = steps[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "    {\"index\": " << step.index << ", \"caption\": " << quoted(step.caption)
        << ", \"startMs\": " << step.start_ms << ", \"endMs\": " << step.end_ms;
    if (!step.tag.empty()) {
      out << ", \"tag\": " << quoted(step.tag);
    }
    out << "}";
  }
  out << (steps.empty() ? "],\n" : "\n  ],\n");
}

void write_panes(std::ostringstream &out, const std::vector<PaneSummary> &panes) {
  out << "  \"panes\": [";
  for (std::size_t i = 0; i < panes.size(); ++i) {
    out << (i == 0 ? "\n" : ",\n");
    out << "    {\"id\": " << quoted(panes[i].id)
        << ", \"type\": " << quoted(pane_kind_name(panes[i].kind))
        << ", \"label\": " << quoted(panes[i].label) << "}";
  }
  out << (panes.empty() ? "]" : "\n  ]");
}

void write_audio_events(std::ostringstream &out, const std::vector<narration::AudioEvent> &events) {
  out << "  \"audioEvents\": [";
  for (std::size_t i = 0; i < events.size(); ++i) {
    const auto &event = events[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "    {\"type\": " << quoted(narration::audio_event_kind_name(event.kind))
        << ", \"startMs\": " << event.start_ms << ", \"durationMs\": " << event.duration_ms
        << ", \"label\": " << quoted(event.label) << "}";
  }
  out << "\n  ]";
}

} // namespace

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                utc.tm_sec, static_cast<int>(millis));
  return buffer;
}

std::string render_metadata_json(const RunMetadata &metadata) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"mode\": " << quoted(config::run_mode_name(metadata.mode)) << ",\n";
  if (!metadata.base_url.empty()) {
    out << "  \"baseURL\": " << quoted(metadata.base_url) << ",\n";
  }
  out << "  \"durationMs\": " << metadata.duration_ms << ",\n";
  write_steps(out, metadata.steps);
  if (metadata.video.has_value()) {
    out << "  \"videoPath\": " << quoted(metadata.video->string()) << ",\n";
  }
  if (metadata.thumbnail.has_value()) {
    out << "  \"thumbnailPath\": " << quoted(metadata.thumbnail->string()) << ",\n";
  }
  out << "  \"subtitlesPath\": " << quoted(metadata.subtitles.string()) << ",\n";
  out << "  \"recordMode\": " << quoted(config::record_mode_name(metadata.record_mode)) << ",\n";
  write_panes(out, metadata.panes);
  out << ",\n";
  if (!metadata.audio_events.empty()) {
    write_audio_events(out, metadata.audio_events);
    out << ",\n";
  }
  out << "  \"timestamp\": " << quoted(iso8601_utc(metadata.timestamp)) << "\n";
  out << "}\n";
  return out.str();
}

} // namespace scenecast::session
