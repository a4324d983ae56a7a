#include "scenecast/session/subtitles.hpp"

#include <cstdio>
#include <sstream>

namespace scenecast::session {

std::string format_vtt_time(std::int64_t ms) {
  if (ms < 0) {
    ms = 0;
  }
  const std::int64_t hours = ms / 3600000;
  const std::int64_t minutes = (ms % 3600000) / 60000;
  const std::int64_t seconds = (ms % 60000) / 1000;
  const std::int64_t millis = ms % 1000;
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld.%03lld",
                static_cast<long long>(hours), static_cast<long long>(minutes),
                static_cast<long long>(seconds), static_cast<long long>(millis));
  return buffer;
}

std::string generate_webvtt(const std::vector<StepRecord> &steps) {
  std::ostringstream out;
  out << "WEBVTT\n\n";
  for (const auto &step : steps) {
    out << format_vtt_time(step.start_ms) << " --> " << format_vtt_time(step.end_ms) << "\n";
    out << "Step " << step.index << ": " << step.caption << "\n\n";
  }
  return out.str();
}

} // namespace scenecast::session
