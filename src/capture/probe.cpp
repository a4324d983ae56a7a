#include "scenecast/capture/probe.hpp"

#include "scenecast/common/fs.hpp"

#include <iostream>
#include <regex>

namespace scenecast::capture {

namespace {

double hms_seconds(const std::smatch &match) {
  const double hours = std::stod(match[1].str());
  const double minutes = std::stod(match[2].str());
  const double seconds = std::stod(match[3].str());
  const std::string frac_raw = match[4].str();
  double frac = 0.0;
  double scale = 1.0;
  for (const char c : frac_raw) {
    scale /= 10.0;
    frac += (c - '0') * scale;
  }
  return hours * 3600.0 + minutes * 60.0 + seconds + frac;
}

} // namespace

std::optional<double> parse_container_duration(const std::string &diagnostics) {
  static const std::regex pattern(R"(Duration:\s*(\d{2}):(\d{2}):(\d{2})\.(\d+))");
  std::smatch match;
  if (!std::regex_search(diagnostics, match, pattern)) {
    return std::nullopt;
  }
  return hms_seconds(match);
}

std::optional<double> parse_last_progress_time(const std::string &diagnostics) {
  static const std::regex pattern(R"(time=(\d{2}):(\d{2}):(\d{2})\.(\d+))");
  std::optional<double> last;
  for (auto it = std::sregex_iterator(diagnostics.begin(), diagnostics.end(), pattern);
       it != std::sregex_iterator(); ++it) {
    last = hms_seconds(*it);
  }
  return last;
}

std::optional<std::int64_t> parse_last_frame_count(const std::string &diagnostics) {
  static const std::regex pattern(R"(frame=\s*([0-9]+))");
  std::optional<std::int64_t> last;
  for (auto it = std::sregex_iterator(diagnostics.begin(), diagnostics.end(), pattern);
       it != std::sregex_iterator(); ++it) {
    last = std::stoll((*it)[1].str());
  }
  return last;
}

std::optional<VideoSize> parse_video_size(const std::string &diagnostics) {
  static const std::regex pattern(R"(Stream.*Video:.* (\d{3,5})x(\d{3,5}))");
  std::smatch match;
  if (!std::regex_search(diagnostics, match, pattern)) {
    return std::nullopt;
  }
  return VideoSize{std::stoi(match[1].str()), std::stoi(match[2].str())};
}

std::optional<VideoSize> try_parse_display_size(const std::string &size) {
  static const std::regex pattern(R"(^(\d+)\s*x\s*(\d+)$)", std::regex::icase);
  const std::string trimmed = common::trim(size);
  std::smatch match;
  if (!std::regex_match(trimmed, match, pattern)) {
    return std::nullopt;
  }
  try {
    const int w = std::stoi(match[1].str());
    const int h = std::stoi(match[2].str());
    if (w <= 0 || h <= 0) {
      return std::nullopt;
    }
    return VideoSize{w, h};
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

FfmpegProbe::FfmpegProbe(common::IProcessRunner &runner, std::string ffmpeg_path)
    : runner_(runner), ffmpeg_path_(std::move(ffmpeg_path)) {}

std::string FfmpegProbe::inspect(const std::filesystem::path &path) {
  // ffmpeg exits non-zero without an output file; the header dump is still printed.
  auto out = runner_.run({ffmpeg_path_, "-hide_banner", "-i", path.string()});
  if (!out.ok()) {
    std::cerr << "[capture] probe failed for " << path << ": " << out.error() << "\n";
    return "";
  }
  return out.value().output;
}

std::string FfmpegProbe::null_decode(const std::filesystem::path &path) {
  auto out = runner_.run(
      {ffmpeg_path_, "-hide_banner", "-i", path.string(), "-map", "0:v:0", "-f", "null", "-"});
  if (!out.ok()) {
    std::cerr << "[capture] decode probe failed for " << path << ": " << out.error() << "\n";
    return "";
  }
  return out.value().output;
}

std::optional<double> FfmpegProbe::duration_seconds(const std::filesystem::path &path) {
  if (auto duration = parse_container_duration(inspect(path)); duration.has_value()) {
    return duration;
  }
  return parse_last_progress_time(null_decode(path));
}

std::optional<std::int64_t> FfmpegProbe::frame_count(const std::filesystem::path &path) {
  return parse_last_frame_count(null_decode(path));
}

std::optional<VideoSize> FfmpegProbe::video_size(const std::filesystem::path &path) {
  return parse_video_size(inspect(path));
}

bool fps_mode_unsupported(const std::string &ffmpeg_output) {
  return ffmpeg_output.find("fps_mode") != std::string::npos &&
         (ffmpeg_output.find("Unrecognized option") != std::string::npos ||
          ffmpeg_output.find("Option not found") != std::string::npos);
}

std::vector<std::string> with_vsync_fallback(const std::vector<std::string> &args) {
  std::vector<std::string> out;
  out.reserve(args.size());
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "-fps_mode" && i + 1 < args.size()) {
      ++i;
      continue;
    }
    out.push_back(args[i]);
    if (args[i] == "-r" && i + 1 < args.size()) {
      out.push_back(args[++i]);
      out.push_back("-vsync");
      out.push_back("cfr");
    }
  }
  return out;
}

} // namespace scenecast::capture
