#pragma once

#include "scenecast/capture/probe.hpp"
#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"
#include "scenecast/compose/filter_graph.hpp"
#include "scenecast/compose/layout.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::compose {

struct ComposeOptions {
  std::vector<std::filesystem::path> inputs;
  std::filesystem::path output;
  LayoutSpec layout;
  // Measured wall-clock duration of the scenario.
  std::optional<double> target_duration_sec;
  // In CSS pixels of a `css_viewport_width` wide viewport.
  std::optional<capture::CropRect> css_crop;
  int css_viewport_width = 1280;
  // Per input, how long after the earliest pane it was opened. Missing entries are 0.
  std::vector<std::int64_t> start_offsets_ms;
  bool delete_inputs = true;
};

/// Merges raw per-pane captures into one constant-framerate H.264 file.
class Compositor {
public:
  Compositor(common::IProcessRunner &runner, capture::IMediaProbe &probe, std::string ffmpeg_path);

  /// Returns the written path. A failed multi-stream composite degrades to re-encoding
  /// the first input; raw inputs are only removed once an output exists.
  [[nodiscard]] common::Result<std::filesystem::path> compose(const ComposeOptions &options);

private:
  [[nodiscard]] common::Status run_encoder(const std::vector<std::string> &args);
  [[nodiscard]] common::Result<std::string>
  template_graph(const ComposeOptions &options, const std::vector<TemplateCell> &cells,
                 const std::vector<StreamTiming> &timings,
                 const std::optional<capture::CropRect> &crop);
  void remove_inputs(const ComposeOptions &options);

  common::IProcessRunner &runner_;
  capture::IMediaProbe &probe_;
  std::string ffmpeg_path_;
};

/// Embeds `image` as the poster frame of `video` in place. On failure the video is untouched.
[[nodiscard]] common::Status attach_poster_frame(common::IProcessRunner &runner,
                                                 const std::string &ffmpeg_path,
                                                 const std::filesystem::path &video,
                                                 const std::filesystem::path &image);

} // namespace scenecast::compose
