#pragma once

#include "scenecast/common/process.hpp"
#include "scenecast/narration/audio_event.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace scenecast::narration {

/// `<stem>.narrated.mp4` next to the video.
[[nodiscard]] std::filesystem::path narrated_output_path(const std::filesystem::path &video);

[[nodiscard]] std::string build_mix_filter(const std::vector<AudioEvent> &events);

[[nodiscard]] std::vector<std::string> build_mix_args(const std::string &ffmpeg_path,
                                                      const std::filesystem::path &video,
                                                      const std::vector<AudioEvent> &events,
                                                      const std::filesystem::path &output);

/// Mixes the clips into the video in place. Always returns the video path; with no events
/// nothing is run, and a failed mix leaves the original untouched.
[[nodiscard]] std::filesystem::path mix_audio_into_video(common::IProcessRunner &runner,
                                                         const std::string &ffmpeg_path,
                                                         const std::filesystem::path &video,
                                                         const std::vector<AudioEvent> &events);

} // namespace scenecast::narration
