#pragma once

#include "scenecast/capture/probe.hpp"
#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::capture {

enum class Platform { Linux, MacOS, Windows };

[[nodiscard]] Platform current_platform();

struct ScreenCaptureOptions {
  std::string ffmpeg_path = "ffmpeg";
  std::filesystem::path output;
  int fps = 30;
  std::optional<int> screen_index;
  std::string display;
  std::string display_size;
  // Only applied by the macOS grabber; x11grab crops at composition time.
  std::optional<CropRect> crop;
  Platform platform = current_platform();
};

/// Full ffmpeg argv (argv[0] is the binary) for a whole-display recording.
[[nodiscard]] common::Result<std::vector<std::string>>
build_screen_capture_args(const ScreenCaptureOptions &options);

/// Error text for a capture that produced no frames, with a per-platform remedy.
[[nodiscard]] std::string zero_frame_message(Platform platform, const std::string &ffmpeg_logs);

class ScreenCapture {
public:
  ScreenCapture(ScreenCaptureOptions options, IMediaProbe &probe);
  ~ScreenCapture();

  ScreenCapture(const ScreenCapture &) = delete;
  ScreenCapture &operator=(const ScreenCapture &) = delete;

  [[nodiscard]] common::Status start();
  /// Asks ffmpeg to quit, escalates to SIGINT, then checks that frames were written.
  [[nodiscard]] common::Status stop();

  [[nodiscard]] const std::filesystem::path &output() const { return options_.output; }

private:
  ScreenCaptureOptions options_;
  IMediaProbe &probe_;
  std::unique_ptr<common::Subprocess> recorder_;
};

} // namespace scenecast::capture
