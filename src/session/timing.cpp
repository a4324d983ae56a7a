#include "scenecast/session/timing.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>

namespace scenecast::session {

std::optional<std::string> timing_drift_message(double expected_sec, double probed_sec,
                                                 std::int64_t frames) {
  const double from_frames = static_cast<double>(frames) / TIMING_REFERENCE_FPS;
  const double worst =
      std::max(std::abs(probed_sec - expected_sec), std::abs(from_frames - expected_sec));
  if (worst <= TIMING_TOLERANCE_SEC) {
    return std::nullopt;
  }
  char buffer[200];
  std::snprintf(buffer, sizeof(buffer),
                "video timing drift: expected=%.2fs, probed=%.2fs, frames/60=%.2fs (frames=%lld)",
                expected_sec, probed_sec, from_frames, static_cast<long long>(frames));
  return std::string(buffer);
}

common::Status check_video_timing(capture::IMediaProbe &probe, const std::filesystem::path &video,
                                  std::int64_t duration_ms, bool ci) {
  const auto duration = probe.duration_seconds(video);
  const auto frames = probe.frame_count(video);
  if (!duration.has_value() || !frames.has_value() || *duration <= 0.0 || *frames <= 0) {
    return common::Status::success();
  }
  const auto drift =
      timing_drift_message(static_cast<double>(duration_ms) / 1000.0, *duration, *frames);
  if (!drift.has_value()) {
    return common::Status::success();
  }
  if (ci) {
    return common::Status::error(*drift);
  }
  std::cerr << "[session] warning: " << *drift << "\n";
  return common::Status::success();
}

} // namespace scenecast::session
