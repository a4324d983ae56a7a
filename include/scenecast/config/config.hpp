#pragma once

#include "scenecast/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::config {

enum class RunMode { Human, Fast };
enum class RecordMode { Screencast, Screen, None };

struct SessionConfig {
  RunMode mode = RunMode::Human;
  bool record = true;
  RecordMode record_mode = RecordMode::Screencast;
  std::optional<bool> headed;
  std::string layout = "auto";
  std::string ffmpeg_path = "ffmpeg";
  std::string ffprobe_path = "ffprobe";
  std::string artifact_dir = "artifacts";
  std::uint64_t tail_ms = 300;
};

struct BrowserConfig {
  std::string executable;
  // 0 picks a free port at launch.
  std::uint16_t devtools_port = 0;
  std::vector<std::string> extra_args;
  std::uint64_t launch_timeout_ms = 15000;
};

struct CaptureConfig {
  std::string display;
  std::string display_size;
  int screen_index = -1;
  std::uint32_t fps = 30;
};

struct NarrationConfig {
  bool enabled = false;
  std::string api_key;
  std::string model = "tts-1";
  std::string voice = "ash";
  double speed = 1.0;
  std::string language;
  std::string cache_dir = ".cache/tts";
  std::string sfx_dir = "assets/sfx";
  bool realtime = false;
};

struct Config {
  SessionConfig session;
  BrowserConfig browser;
  CaptureConfig capture;
  NarrationConfig narration;
  bool ci = false;
};

[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

void apply_env_overrides(Config &config);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

[[nodiscard]] common::Result<RunMode> parse_run_mode(const std::string &value);
[[nodiscard]] common::Result<RecordMode> parse_record_mode(const std::string &value);
[[nodiscard]] std::string run_mode_name(RunMode mode);
[[nodiscard]] std::string record_mode_name(RecordMode mode);

} // namespace scenecast::config
