#pragma once

#include "scenecast/common/process.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::capture {

struct VideoSize {
  int width = 0;
  int height = 0;
};

/// Pixel rectangle inside a captured frame.
struct CropRect {
  int x = 0;
  int y = 0;
  int w = 0;
  int h = 0;
};

// Parsers over ffmpeg's diagnostic output.
[[nodiscard]] std::optional<double> parse_container_duration(const std::string &diagnostics);
[[nodiscard]] std::optional<double> parse_last_progress_time(const std::string &diagnostics);
[[nodiscard]] std::optional<std::int64_t> parse_last_frame_count(const std::string &diagnostics);
[[nodiscard]] std::optional<VideoSize> parse_video_size(const std::string &diagnostics);

/// True when ffmpeg's output says it does not know -fps_mode.
[[nodiscard]] bool fps_mode_unsupported(const std::string &ffmpeg_output);

/// Same argv with `-fps_mode cfr` replaced by `-vsync cfr` right after `-r N`.
[[nodiscard]] std::vector<std::string> with_vsync_fallback(const std::vector<std::string> &args);

/// "1920x1080" style sizes; nullopt unless both sides are positive.
[[nodiscard]] std::optional<VideoSize> try_parse_display_size(const std::string &size);

class IMediaProbe {
public:
  virtual ~IMediaProbe() = default;

  [[nodiscard]] virtual std::optional<double> duration_seconds(const std::filesystem::path &path) = 0;
  [[nodiscard]] virtual std::optional<std::int64_t> frame_count(const std::filesystem::path &path) = 0;
  [[nodiscard]] virtual std::optional<VideoSize> video_size(const std::filesystem::path &path) = 0;
};

class FfmpegProbe final : public IMediaProbe {
public:
  FfmpegProbe(common::IProcessRunner &runner, std::string ffmpeg_path);

  [[nodiscard]] std::optional<double> duration_seconds(const std::filesystem::path &path) override;
  [[nodiscard]] std::optional<std::int64_t> frame_count(const std::filesystem::path &path) override;
  [[nodiscard]] std::optional<VideoSize> video_size(const std::filesystem::path &path) override;

private:
  [[nodiscard]] std::string inspect(const std::filesystem::path &path);
  [[nodiscard]] std::string null_decode(const std::filesystem::path &path);

  common::IProcessRunner &runner_;
  std::string ffmpeg_path_;
};

} // namespace scenecast::capture
