#pragma once

#include "scenecast/capture/probe.hpp"
#include "scenecast/compose/layout.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::compose {

inline constexpr int OUTPUT_FPS = 60;
inline constexpr double MIN_WARP_FACTOR = 0.25;
inline constexpr double MAX_WARP_FACTOR = 4.0;

/// What the probes learned about one raw stream.
struct StreamTiming {
  std::optional<std::int64_t> frames;
  std::optional<double> raw_duration_sec;
  // How long after the earliest stream this one started. The stream is stretched over the
  // remainder of the target and padded at the head with its first frame.
  std::int64_t start_offset_ms = 0;
};

/// setpts expression for one stream. With a known target duration every stream is stretched
/// to span it exactly: by frame index when the frame count is known, otherwise by warping the
/// raw timestamps.
[[nodiscard]] std::string timestamp_expression(const std::optional<double> &target_duration_sec,
                                               const StreamTiming &timing);

/// round(probed width / logical width), or 1 when the probe failed.
[[nodiscard]] int crop_scale_factor(const std::optional<capture::VideoSize> &probed,
                                    int logical_width);
[[nodiscard]] capture::CropRect scale_crop(const capture::CropRect &css_crop, int factor);

/// xstack layout cells: x sums the widths of earlier cells in the row, y sums the heights of
/// earlier rows' first cells.
[[nodiscard]] std::string xstack_layout(std::size_t count, int cols);

[[nodiscard]] std::string build_filter_graph(const ResolvedLayout &layout,
                                             const std::vector<StreamTiming> &timings,
                                             const std::optional<double> &target_duration_sec,
                                             const std::optional<capture::CropRect> &crop);

/// Where one pane lands in a grid template, in cells.
struct TemplateCell {
  std::size_t pane = 0;
  int col = 0;
  int row = 0;
  int col_span = 1;
  int row_span = 1;
};

/// Bounding box of every pane index in `grid`, ordered by pane index. Indices without a
/// captured input are dropped.
[[nodiscard]] std::vector<TemplateCell> template_cells(const GridTemplate &grid,
                                                       std::size_t input_count);

/// Graph over inputs passed in the order of `cells`, with `timings` in the same order.
/// Panes are placed at absolute pixel offsets and spanning panes scaled to cover their cells.
[[nodiscard]] std::string build_template_filter_graph(
    const std::vector<TemplateCell> &cells, const std::vector<StreamTiming> &timings,
    const std::optional<double> &target_duration_sec,
    const std::optional<capture::CropRect> &crop, const capture::VideoSize &cell_size);

[[nodiscard]] std::vector<std::string>
build_compose_args(const std::string &ffmpeg_path, const std::vector<std::filesystem::path> &inputs,
                   const std::string &filter_graph, const std::filesystem::path &output);

[[nodiscard]] std::vector<std::string> build_reencode_args(const std::string &ffmpeg_path,
                                                           const std::filesystem::path &input,
                                                           const std::filesystem::path &output);

/// Stream copy of `video` with `image` attached as its cover art.
[[nodiscard]] std::vector<std::string> build_poster_frame_args(const std::string &ffmpeg_path,
                                                               const std::filesystem::path &video,
                                                               const std::filesystem::path &image,
                                                               const std::filesystem::path &output);

} // namespace scenecast::compose
