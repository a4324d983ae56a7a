#pragma once

#include "scenecast/capture/probe.hpp"
#include "scenecast/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace scenecast::session {

inline constexpr double TIMING_TOLERANCE_SEC = 0.75;
inline constexpr double TIMING_REFERENCE_FPS = 60.0;

/// Warning text when either the container duration or frames/60 drifts from the
/// wall-clock duration by more than the tolerance; nullopt otherwise.
[[nodiscard]] std::optional<std::string> timing_drift_message(double expected_sec,
                                                              double probed_sec,
                                                              std::int64_t frames);

/// Probes the produced video. Drift is logged, and only fails the run when `ci` is set.
[[nodiscard]] common::Status check_video_timing(capture::IMediaProbe &probe,
                                                const std::filesystem::path &video,
                                                std::int64_t duration_ms, bool ci);

} // namespace scenecast::session
