#include "scenecast/compose/compositor.hpp"

#include "scenecast/common/fs.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace scenecast::compose {

namespace {

std::string last_lines(const std::string &output, std::size_t max_chars) {
  const std::string trimmed = common::trim(output);
  if (trimmed.size() <= max_chars) {
    return trimmed;
  }
  return trimmed.substr(trimmed.size() - max_chars);
}

} // namespace

Compositor::Compositor(common::IProcessRunner &runner, capture::IMediaProbe &probe,
                       std::string ffmpeg_path)
    : runner_(runner), probe_(probe), ffmpeg_path_(std::move(ffmpeg_path)) {}

common::Status Compositor::run_encoder(const std::vector<std::string> &args) {
  auto out = runner_.run(args);
  if (!out.ok()) {
    return common::Status::error(out.error());
  }
  if (out.value().exit_code == 0) {
    return common::Status::success();
  }
  if (!capture::fps_mode_unsupported(out.value().output)) {
    return common::Status::error("ffmpeg exited with code " +
                                 std::to_string(out.value().exit_code) + ": " +
                                 last_lines(out.value().output, 2000));
  }

  std::cerr << "[compose] ffmpeg does not support -fps_mode, retrying with -vsync\n";
  auto retry = runner_.run(capture::with_vsync_fallback(args));
  if (!retry.ok()) {
    return common::Status::error(retry.error());
  }
  if (retry.value().exit_code != 0) {
    return common::Status::error("ffmpeg exited with code " +
                                 std::to_string(retry.value().exit_code) + ": " +
                                 last_lines(retry.value().output, 2000));
  }
  return common::Status::success();
}

common::Result<std::string>
Compositor::template_graph(const ComposeOptions &options, const std::vector<TemplateCell> &cells,
                           const std::vector<StreamTiming> &timings,
                           const std::optional<capture::CropRect> &crop) {
  if (cells.empty()) {
    return common::Result<std::string>::failure("layout template places none of the " +
                                                std::to_string(options.inputs.size()) +
                                                " captured panes");
  }
  capture::VideoSize cell_size;
  if (crop.has_value()) {
    cell_size = capture::VideoSize{crop->w, crop->h};
  } else if (const auto probed = probe_.video_size(options.inputs[cells.front().pane]);
             probed.has_value()) {
    cell_size = *probed;
  }
  if (cell_size.width <= 0 || cell_size.height <= 0) {
    return common::Result<std::string>::failure("could not read input dimensions");
  }
  return common::Result<std::string>::success(build_template_filter_graph(
      cells, timings, options.target_duration_sec, crop, cell_size));
}

void Compositor::remove_inputs(const ComposeOptions &options) {
  if (!options.delete_inputs) {
    return;
  }
  for (const auto &input : options.inputs) {
    std::error_code ec;
    std::filesystem::remove(input, ec);
    if (ec) {
      std::cerr << "[compose] could not remove " << input << ": " << ec.message() << "\n";
    }
  }
}

common::Result<std::filesystem::path> Compositor::compose(const ComposeOptions &options) {
  using PathResult = common::Result<std::filesystem::path>;
  if (options.inputs.empty()) {
    return PathResult::failure("compose: no inputs");
  }
  if (options.output.has_parent_path()) {
    auto dir = common::ensure_dir(options.output.parent_path());
    if (!dir.ok()) {
      return PathResult::failure(dir.error());
    }
  }

  const bool templated = options.layout.kind == LayoutKind::Template;
  const auto layout = resolve_layout(options.layout, options.inputs.size());
  if (!templated && !layout.has_value()) {
    auto encoded =
        run_encoder(build_reencode_args(ffmpeg_path_, options.inputs.front(), options.output));
    if (!encoded.ok()) {
      return PathResult::failure("re-encode failed: " + encoded.error());
    }
    remove_inputs(options);
    return PathResult::success(options.output);
  }

  // Templates feed only the panes they place, in pane order.
  std::vector<TemplateCell> cells;
  std::vector<std::size_t> order;
  if (templated) {
    cells = template_cells(options.layout.grid_template, options.inputs.size());
    for (const auto &cell : cells) {
      order.push_back(cell.pane);
    }
  } else {
    for (std::size_t i = 0; i < options.inputs.size(); ++i) {
      order.push_back(i);
    }
  }

  std::vector<std::filesystem::path> inputs;
  std::vector<StreamTiming> timings;
  for (const std::size_t index : order) {
    const auto &input = options.inputs[index];
    StreamTiming timing;
    if (options.target_duration_sec.has_value()) {
      timing.frames = probe_.frame_count(input);
      if (!timing.frames.has_value() || *timing.frames <= 0) {
        timing.raw_duration_sec = probe_.duration_seconds(input);
      }
    }
    if (index < options.start_offsets_ms.size()) {
      timing.start_offset_ms = options.start_offsets_ms[index];
    }
    inputs.push_back(input);
    timings.push_back(timing);
  }

  std::optional<capture::CropRect> crop;
  if (options.css_crop.has_value() && !inputs.empty()) {
    const auto probed = probe_.video_size(inputs.front());
    const int factor = crop_scale_factor(probed, options.css_viewport_width);
    crop = scale_crop(*options.css_crop, factor);
    if (factor != 1) {
      std::cerr << "[compose] video scale " << factor << "x (" << probed->width << "px actual vs "
                << options.css_viewport_width << "px CSS)\n";
    }
  }

  common::Status composed = common::Status::success();
  if (templated) {
    auto graph = template_graph(options, cells, timings, crop);
    composed = graph.ok() ? run_encoder(build_compose_args(ffmpeg_path_, inputs, graph.value(),
                                                           options.output))
                          : common::Status::error(graph.error());
  } else {
    const std::string graph =
        build_filter_graph(*layout, timings, options.target_duration_sec, crop);
    composed = run_encoder(build_compose_args(ffmpeg_path_, inputs, graph, options.output));
  }
  if (!composed.ok()) {
    std::cerr << "[compose] composite failed, falling back to the first stream: "
              << composed.error() << "\n";
    auto fallback =
        run_encoder(build_reencode_args(ffmpeg_path_, options.inputs.front(), options.output));
    if (!fallback.ok()) {
      return PathResult::failure("composition failed: " + composed.error() +
                                 "; fallback failed: " + fallback.error());
    }
  }

  if (const auto duration = probe_.duration_seconds(options.output);
      duration.has_value() && *duration > 0.0) {
    std::ostringstream line;
    line << "[compose] output duration " << std::fixed << std::setprecision(2) << *duration
         << "s\n";
    std::cerr << line.str();
  }
  remove_inputs(options);
  return PathResult::success(options.output);
}

common::Status attach_poster_frame(common::IProcessRunner &runner, const std::string &ffmpeg_path,
                                   const std::filesystem::path &video,
                                   const std::filesystem::path &image) {
  const auto staged = video.parent_path() / (video.stem().string() + ".tmp.mp4");
  auto out = runner.run(build_poster_frame_args(ffmpeg_path, video, image, staged));
  std::error_code ec;
  if (!out.ok()) {
    std::filesystem::remove(staged, ec);
    return common::Status::error(out.error());
  }
  if (out.value().exit_code != 0) {
    std::filesystem::remove(staged, ec);
    return common::Status::error("ffmpeg exited with code " +
                                 std::to_string(out.value().exit_code) + ": " +
                                 last_lines(out.value().output, 500));
  }
  std::filesystem::rename(staged, video, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(staged, ec);
    return common::Status::error("could not replace " + video.string() + ": " + reason);
  }
  return common::Status::success();
}

} // namespace scenecast::compose
