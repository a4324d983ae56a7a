#include "scenecast/capture/screencast.hpp"

#include "scenecast/capture/probe.hpp"

#include <iostream>

namespace scenecast::capture {

namespace {

constexpr auto ENCODER_FINALIZE_TIMEOUT = std::chrono::seconds(15);
// An encoder that rejects its arguments exits well within this window.
constexpr auto ENCODER_STARTUP_GRACE = std::chrono::milliseconds(250);

} // namespace

std::vector<std::string> build_screencast_encoder_args(const std::string &ffmpeg_path,
                                                       const std::filesystem::path &output) {
  return {ffmpeg_path,
          "-y",
          "-hide_banner",
          "-loglevel",
          "error",
          "-use_wallclock_as_timestamps",
          "1",
          "-f",
          "image2pipe",
          "-c:v",
          "mjpeg",
          "-i",
          "-",
          "-c:v",
          "libvpx",
          "-deadline",
          "realtime",
          "-cpu-used",
          "8",
          "-b:v",
          "4M",
          "-pix_fmt",
          "yuv420p",
          "-r",
          std::to_string(RAW_CAPTURE_FPS),
          "-fps_mode",
          "cfr",
          output.string()};
}

ScreencastRecorder::ScreencastRecorder(browser::IPageDriver &page, std::filesystem::path output,
                                       std::string ffmpeg_path,
                                       browser::ScreencastOptions options)
    : page_(page), output_(std::move(output)), ffmpeg_path_(std::move(ffmpeg_path)),
      options_(options) {}

ScreencastRecorder::~ScreencastRecorder() {
  if (encoder_ != nullptr) {
    auto stopped = stop();
    if (!stopped.ok()) {
      std::cerr << "[capture] " << stopped.error() << "\n";
    }
  }
}

common::Status ScreencastRecorder::spawn_encoder(const std::vector<std::string> &argv) {
  common::ProcessSpec spec;
  spec.command = argv.front();
  spec.args.assign(argv.begin() + 1, argv.end());

  auto encoder = std::make_unique<common::Subprocess>(std::move(spec));
  auto started = encoder->start([this](const std::string &line) {
    std::cerr << "[capture] " << output_.filename().string() << ": " << line << "\n";
  });
  if (!started.ok()) {
    return started;
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  encoder_ = std::move(encoder);
  return common::Status::success();
}

common::Status ScreencastRecorder::start() {
  if (encoder_ != nullptr) {
    return common::Status::error("screencast already started for " + output_.string());
  }
  const auto argv = build_screencast_encoder_args(ffmpeg_path_, output_);
  auto spawned = spawn_encoder(argv);
  if (!spawned.ok()) {
    return spawned;
  }

  if (encoder_->wait_for_exit(ENCODER_STARTUP_GRACE)) {
    encoder_->stop();
    if (fps_mode_unsupported(encoder_->output_tail())) {
      std::cerr << "[capture] ffmpeg does not support -fps_mode, retrying with -vsync\n";
      encoder_.reset();
      spawned = spawn_encoder(with_vsync_fallback(argv));
      if (!spawned.ok()) {
        return spawned;
      }
    }
  }

  auto streaming = page_.start_screencast(
      options_, [this](const browser::ScreencastFrame &frame) { on_frame(frame); });
  if (!streaming.ok()) {
    encoder_->stop();
    encoder_.reset();
    return common::Status::error("screencast start failed: " + streaming.error());
  }
  return common::Status::success();
}

void ScreencastRecorder::on_frame(const browser::ScreencastFrame &frame) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (encoder_ == nullptr || write_failed_) {
    return;
  }
  auto written = encoder_->write_stdin(frame.jpeg);
  if (!written.ok()) {
    write_failed_ = true;
    std::cerr << "[capture] " << written.error() << "\n";
    return;
  }
  ++frames_written_;
}

common::Status ScreencastRecorder::stop() {
  if (encoder_ == nullptr) {
    return common::Status::success();
  }
  auto stopped = page_.stop_screencast();
  if (!stopped.ok()) {
    std::cerr << "[capture] stop screencast: " << stopped.error() << "\n";
  }

  std::unique_ptr<common::Subprocess> encoder;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    encoder = std::move(encoder_);
  }
  encoder->close_stdin();
  const bool exited = encoder->wait_for_exit(ENCODER_FINALIZE_TIMEOUT);
  encoder->stop();
  if (!exited) {
    return common::Status::error("screencast encoder did not finish " + output_.string());
  }
  if (const auto code = encoder->exit_code(); code.has_value() && *code != 0) {
    return common::Status::error("screencast encoder exited with code " + std::to_string(*code) +
                                 ": " + encoder->output_tail());
  }
  std::cout << "  Captured " << frames_written_.load() << " frames -> " << output_.string()
            << "\n";
  return common::Status::success();
}

} // namespace scenecast::capture
