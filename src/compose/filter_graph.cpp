#include "scenecast/compose/filter_graph.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace scenecast::compose {

namespace {

std::string fixed(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

void append_encoder_args(std::vector<std::string> &args, const std::filesystem::path &output) {
  args.insert(args.end(), {"-r", std::to_string(OUTPUT_FPS), "-fps_mode", "cfr", "-c:v",
                           "libx264", "-preset", "veryfast", "-crf", "18", "-pix_fmt", "yuv420p",
                           "-movflags", "+faststart", output.string()});
}

std::string crop_filter(const std::optional<capture::CropRect> &crop) {
  if (!crop.has_value()) {
    return "";
  }
  return ",crop=" + std::to_string(crop->w) + ":" + std::to_string(crop->h) + ":" +
         std::to_string(crop->x) + ":" + std::to_string(crop->y);
}

// Retiming, frame rate conversion and start padding for input `index`, without a label.
std::string stream_chain(std::size_t index, const StreamTiming &timing,
                         const std::optional<double> &target_duration_sec) {
  const std::int64_t offset_ms = std::max<std::int64_t>(0, timing.start_offset_ms);
  std::optional<double> span = target_duration_sec;
  if (span.has_value() && offset_ms > 0) {
    span = std::max(0.0, *span - static_cast<double>(offset_ms) / 1000.0);
  }
  std::string chain = "[" + std::to_string(index) + ":v]" + timestamp_expression(span, timing) +
                      ",fps=" + std::to_string(OUTPUT_FPS);
  if (offset_ms > 0) {
    chain += ",tpad=start_duration=" + std::to_string(offset_ms) + "ms:start_mode=clone";
  }
  return chain;
}

} // namespace

std::string timestamp_expression(const std::optional<double> &target_duration_sec,
                                 const StreamTiming &timing) {
  if (target_duration_sec.has_value() && *target_duration_sec > 0.0) {
    if (timing.frames.has_value() && *timing.frames > 0) {
      const double spacing = *target_duration_sec / static_cast<double>(*timing.frames);
      return "setpts=N*" + fixed(spacing, 9) + "/TB";
    }
    if (timing.raw_duration_sec.has_value() && *timing.raw_duration_sec > 0.0) {
      const double factor = std::clamp(*target_duration_sec / *timing.raw_duration_sec,
                                        MIN_WARP_FACTOR, MAX_WARP_FACTOR);
      return "setpts=(PTS-STARTPTS)*" + fixed(factor, 6);
    }
  }
  return "setpts=PTS-STARTPTS";
}

int crop_scale_factor(const std::optional<capture::VideoSize> &probed, int logical_width) {
  if (!probed.has_value() || probed->width <= 0 || logical_width <= 0) {
    return 1;
  }
  const int factor = static_cast<int>(
      std::lround(static_cast<double>(probed->width) / static_cast<double>(logical_width)));
  return std::max(1, factor);
}

capture::CropRect scale_crop(const capture::CropRect &css_crop, int factor) {
  return {css_crop.x * factor, css_crop.y * factor, css_crop.w * factor, css_crop.h * factor};
}

std::string xstack_layout(std::size_t count, int cols) {
  const std::size_t columns = static_cast<std::size_t>(std::max(1, cols));
  std::string layout;
  for (std::size_t i = 0; i < count; ++i) {
    const std::size_t row = i / columns;
    const std::size_t col = i % columns;

    std::string x = "0";
    if (col > 0) {
      x.clear();
      for (std::size_t k = 0; k < col; ++k) {
        x += (k == 0 ? "" : "+") + std::string("w") + std::to_string(row * columns + k);
      }
    }
    std::string y = "0";
    if (row > 0) {
      y.clear();
      for (std::size_t r = 0; r < row; ++r) {
        y += (r == 0 ? "" : "+") + std::string("h") + std::to_string(r * columns);
      }
    }
    if (!layout.empty()) {
      layout += "|";
    }
    layout += x + "_" + y;
  }
  return layout;
}

std::string build_filter_graph(const ResolvedLayout &layout,
                               const std::vector<StreamTiming> &timings,
                               const std::optional<double> &target_duration_sec,
                               const std::optional<capture::CropRect> &crop) {
  const std::string cropping = crop_filter(crop);

  std::ostringstream graph;
  std::string labels;
  for (std::size_t i = 0; i < timings.size(); ++i) {
    const std::string label = "[s" + std::to_string(i) + "]";
    graph << stream_chain(i, timings[i], target_duration_sec) << cropping << label << ";";
    labels += label;
  }

  const std::size_t n = timings.size();
  switch (layout.kind) {
  case LayoutKind::Row:
    graph << labels << "hstack=inputs=" << n << ":shortest=1[v]";
    break;
  case LayoutKind::Column:
    graph << labels << "vstack=inputs=" << n << ":shortest=1[v]";
    break;
  case LayoutKind::Grid:
  case LayoutKind::Auto:
  case LayoutKind::Template:
    graph << labels << "xstack=inputs=" << n << ":layout=" << xstack_layout(n, layout.cols)
          << ":shortest=1[v]";
    break;
  }
  return graph.str();
}

std::vector<TemplateCell> template_cells(const GridTemplate &grid, std::size_t input_count) {
  struct Bounds {
    int min_row;
    int max_row;
    int min_col;
    int max_col;
  };
  std::map<int, Bounds> bounds;
  for (std::size_t r = 0; r < grid.size(); ++r) {
    for (std::size_t c = 0; c < grid[r].size(); ++c) {
      const int pane = grid[r][c];
      const int row = static_cast<int>(r);
      const int col = static_cast<int>(c);
      auto [it, inserted] = bounds.try_emplace(pane, Bounds{row, row, col, col});
      if (!inserted) {
        it->second.min_row = std::min(it->second.min_row, row);
        it->second.max_row = std::max(it->second.max_row, row);
        it->second.min_col = std::min(it->second.min_col, col);
        it->second.max_col = std::max(it->second.max_col, col);
      }
    }
  }

  std::vector<TemplateCell> cells;
  for (const auto &[pane, box] : bounds) {
    if (pane < 0 || static_cast<std::size_t>(pane) >= input_count) {
      continue;
    }
    cells.push_back(TemplateCell{static_cast<std::size_t>(pane), box.min_col, box.min_row,
                                 box.max_col - box.min_col + 1, box.max_row - box.min_row + 1});
  }
  return cells;
}

std::string build_template_filter_graph(const std::vector<TemplateCell> &cells,
                                        const std::vector<StreamTiming> &timings,
                                        const std::optional<double> &target_duration_sec,
                                        const std::optional<capture::CropRect> &crop,
                                        const capture::VideoSize &cell_size) {
  const std::string cropping = crop_filter(crop);

  std::ostringstream graph;
  std::string labels;
  std::string layout;
  for (std::size_t i = 0; i < cells.size(); ++i) {
    const auto &cell = cells[i];
    const StreamTiming timing = i < timings.size() ? timings[i] : StreamTiming{};
    const std::string label = "[s" + std::to_string(i) + "]";
    graph << stream_chain(i, timing, target_duration_sec) << cropping;
    if (cell.col_span > 1 || cell.row_span > 1) {
      graph << ",scale=" << cell.col_span * cell_size.width << ":"
            << cell.row_span * cell_size.height;
    }
    graph << label << ";";
    labels += label;

    if (!layout.empty()) {
      layout += "|";
    }
    layout += std::to_string(cell.col * cell_size.width) + "_" +
              std::to_string(cell.row * cell_size.height);
  }

  if (cells.size() == 1) {
    graph << labels << "null[v]";
  } else {
    graph << labels << "xstack=inputs=" << cells.size() << ":layout=" << layout
          << ":fill=black:shortest=1[v]";
  }
  return graph.str();
}

std::vector<std::string> build_compose_args(const std::string &ffmpeg_path,
                                            const std::vector<std::filesystem::path> &inputs,
                                            const std::string &filter_graph,
                                            const std::filesystem::path &output) {
  std::vector<std::string> args{ffmpeg_path, "-y"};
  for (const auto &input : inputs) {
    args.push_back("-i");
    args.push_back(input.string());
  }
  args.insert(args.end(), {"-filter_complex", filter_graph, "-map", "[v]"});
  append_encoder_args(args, output);
  return args;
}

std::vector<std::string> build_reencode_args(const std::string &ffmpeg_path,
                                             const std::filesystem::path &input,
                                             const std::filesystem::path &output) {
  std::vector<std::string> args{ffmpeg_path, "-y", "-i", input.string(), "-vf",
                                "fps=60,format=yuv420p"};
  append_encoder_args(args, output);
  return args;
}

std::vector<std::string> build_poster_frame_args(const std::string &ffmpeg_path,
                                                 const std::filesystem::path &video,
                                                 const std::filesystem::path &image,
                                                 const std::filesystem::path &output) {
  return {ffmpeg_path, "-y",   "-i", video.string(), "-i", image.string(), "-map", "0", "-map",
          "1",         "-c",   "copy", "-disposition:v:1", "attached_pic", output.string()};
}

} // namespace scenecast::compose
