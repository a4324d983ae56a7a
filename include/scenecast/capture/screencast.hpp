#pragma once

#include "scenecast/browser/page_driver.hpp"
#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scenecast::capture {

/// Frame rate of the raw pane recordings. Idle stretches are filled with repeated frames.
constexpr int RAW_CAPTURE_FPS = 25;

/// ffmpeg argv that reads wall-clock stamped JPEG frames on stdin and writes a constant
/// frame rate VP8 webm.
[[nodiscard]] std::vector<std::string>
build_screencast_encoder_args(const std::string &ffmpeg_path, const std::filesystem::path &output);

/// Records one page by piping CDP screencast frames into an ffmpeg encoder.
class ScreencastRecorder {
public:
  ScreencastRecorder(browser::IPageDriver &page, std::filesystem::path output,
                     std::string ffmpeg_path, browser::ScreencastOptions options = {});
  ~ScreencastRecorder();

  ScreencastRecorder(const ScreencastRecorder &) = delete;
  ScreencastRecorder &operator=(const ScreencastRecorder &) = delete;

  [[nodiscard]] common::Status start();
  /// Stops the screencast and waits for the encoder to finalize the file.
  [[nodiscard]] common::Status stop();

  [[nodiscard]] const std::filesystem::path &output() const { return output_; }
  [[nodiscard]] std::uint64_t frames_written() const { return frames_written_.load(); }
  [[nodiscard]] bool running() const { return encoder_ != nullptr; }

private:
  [[nodiscard]] common::Status spawn_encoder(const std::vector<std::string> &argv);
  void on_frame(const browser::ScreencastFrame &frame);

  browser::IPageDriver &page_;
  std::filesystem::path output_;
  std::string ffmpeg_path_;
  browser::ScreencastOptions options_;
  std::unique_ptr<common::Subprocess> encoder_;
  std::mutex write_mutex_;
  std::atomic<std::uint64_t> frames_written_{0};
  bool write_failed_ = false;
};

} // namespace scenecast::capture
