#include "scenecast/capture/screen.hpp"

#include "scenecast/common/fs.hpp"

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace scenecast::capture {

namespace {

constexpr auto QUIT_GRACE = std::chrono::milliseconds(2500);
constexpr auto INTERRUPT_GRACE = std::chrono::seconds(10);
constexpr const char *DEFAULT_DISPLAY_SIZE = "1920x1080";
// H.264 level 4.2 macroblock throughput limit.
constexpr long LEVEL_42_MAX_MB_PER_SEC = 522240;

bool fits_level_42(const std::string &display_size, int fps) {
  const auto size = try_parse_display_size(display_size);
  if (!size.has_value()) {
    return false;
  }
  const long mb_w = (size->width + 15) / 16;
  const long mb_h = (size->height + 15) / 16;
  return mb_w * mb_h * fps <= LEVEL_42_MAX_MB_PER_SEC;
}

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

Platform current_platform() {
#if defined(__APPLE__)
  return Platform::MacOS;
#elif defined(_WIN32)
  return Platform::Windows;
#else
  return Platform::Linux;
#endif
}

common::Result<std::vector<std::string>>
build_screen_capture_args(const ScreenCaptureOptions &options) {
  const std::string fps = std::to_string(options.fps);
  const std::string size =
      options.display_size.empty() ? DEFAULT_DISPLAY_SIZE : options.display_size;
  std::vector<std::string> args{options.ffmpeg_path, "-y"};

  switch (options.platform) {
  case Platform::MacOS:
    if (!options.screen_index.has_value()) {
      return common::Result<std::vector<std::string>>::failure(
          "screen recording on macOS requires a screen index. "
          "Run: ffmpeg -f avfoundation -list_devices true -i \"\"");
    }
    args.insert(args.end(), {"-f", "avfoundation", "-framerate", fps, "-i",
                             std::to_string(*options.screen_index) + ":none"});
    break;
  case Platform::Windows:
    args.insert(args.end(), {"-thread_queue_size", "1024", "-rtbufsize", "512M",
                             "-use_wallclock_as_timestamps", "1", "-f", "gdigrab", "-video_size",
                             size, "-framerate", fps, "-i", "desktop"});
    break;
  case Platform::Linux:
    if (options.display.empty()) {
      return common::Result<std::vector<std::string>>::failure(
          "screen recording on Linux requires DISPLAY (e.g. run via xvfb-run)");
    }
    args.insert(args.end(), {"-thread_queue_size", "1024", "-rtbufsize", "512M",
                             "-use_wallclock_as_timestamps", "1", "-f", "x11grab", "-video_size",
                             size, "-framerate", fps, "-i", options.display + ".0"});
    break;
  }

  std::string filters;
  if (options.platform == Platform::MacOS) {
    if (options.crop.has_value()) {
      const auto &c = *options.crop;
      filters += "crop=" + std::to_string(c.w) + ":" + std::to_string(c.h) + ":" +
                 std::to_string(c.x) + ":" + std::to_string(c.y) + ",";
    }
    filters += "fps=" + fps + ",";
  }
  filters += "format=yuv420p";

  if (options.platform == Platform::MacOS) {
    args.insert(args.end(), {"-vf", filters, "-c:v", "h264_videotoolbox", "-r", fps, "-vsync",
                             "cfr", "-b:v", "10M", "-maxrate", "12M", "-bufsize", "20M",
                             "-pix_fmt", "yuv420p", "-movflags", "+faststart",
                             options.output.string()});
  } else {
    args.insert(args.end(), {"-vf", filters, "-c:v", "libx264", "-preset", "ultrafast", "-tune",
                             "zerolatency", "-r", fps, "-vsync", "cfr", "-crf", "18",
                             "-profile:v", "baseline"});
    if (fits_level_42(options.display_size, options.fps)) {
      args.insert(args.end(), {"-level", "4.2"});
    }
    args.insert(args.end(),
                {"-pix_fmt", "yuv420p", "-movflags", "+faststart", options.output.string()});
  }
  return common::Result<std::vector<std::string>>::success(std::move(args));
}

std::string zero_frame_message(Platform platform, const std::string &ffmpeg_logs) {
  const std::string hint =
      platform == Platform::MacOS
          ? "On macOS you must grant Screen Recording permission to the app launching ffmpeg "
            "in System Settings > Privacy & Security > Screen Recording."
          : "On Linux you must run under Xvfb and set DISPLAY (e.g. via xvfb-run).";
  std::string message =
      "ffmpeg screen capture produced no frames (output has no video stream). " + hint;
  if (!ffmpeg_logs.empty()) {
    message += "\nLast ffmpeg logs:\n" + ffmpeg_logs;
  }
  return message;
}

ScreenCapture::ScreenCapture(ScreenCaptureOptions options, IMediaProbe &probe)
    : options_(std::move(options)), probe_(probe) {}

ScreenCapture::~ScreenCapture() {
  if (recorder_ != nullptr) {
    recorder_->stop();
  }
}

common::Status ScreenCapture::start() {
  auto argv = build_screen_capture_args(options_);
  if (!argv.ok()) {
    return common::Status::error(argv.error());
  }
  const auto started_at = std::chrono::steady_clock::now();

  common::ProcessSpec spec;
  spec.command = argv.value().front();
  spec.args.assign(argv.value().begin() + 1, argv.value().end());
  spec.keep_output_bytes = 32 * 1024;
  auto recorder = std::make_unique<common::Subprocess>(std::move(spec));
  auto started = recorder->start();
  if (!started.ok()) {
    return started;
  }
  if (!recorder->is_running()) {
    return common::Status::error("ffmpeg screen recorder exited immediately");
  }
  recorder_ = std::move(recorder);

  std::ostringstream line;
  line << "  Screen recording started (" << std::fixed << std::setprecision(1)
       << seconds_since(started_at) << "s)";
  std::cout << line.str() << "\n";
  return common::Status::success();
}

common::Status ScreenCapture::stop() {
  if (recorder_ == nullptr) {
    return common::Status::success();
  }
  const auto stopping_at = std::chrono::steady_clock::now();
  auto recorder = std::move(recorder_);

  auto quit = recorder->write_stdin("q");
  if (!quit.ok()) {
    std::cerr << "[capture] " << quit.error() << "\n";
  }
  recorder->close_stdin();
  if (!recorder->wait_for_exit(QUIT_GRACE)) {
    recorder->send_signal(SIGINT);
    if (!recorder->wait_for_exit(INTERRUPT_GRACE)) {
      std::cerr << "[capture] screen recorder ignored SIGINT, terminating\n";
    }
  }
  recorder->stop();

  std::ostringstream line;
  line << "  Screen recording stopped (" << std::fixed << std::setprecision(1)
       << seconds_since(stopping_at) << "s)";
  std::cout << line.str() << "\n";

  const auto frames = probe_.frame_count(options_.output);
  if (!frames.has_value() || *frames <= 0) {
    return common::Status::error(
        zero_frame_message(options_.platform, common::trim(recorder->output_tail())));
  }
  return common::Status::success();
}

} // namespace scenecast::capture
