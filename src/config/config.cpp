#include "scenecast/config/config.hpp"

#include "scenecast/common/fs.hpp"
#include "scenecast/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace scenecast::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".scenecast";
constexpr const char *CONFIG_FILENAME = "scenecast.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("SCENECAST_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

bool parse_flag(const std::string &value, bool fallback) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  return fallback;
}

common::Status load_session_config(Config &config, const common::TomlDocument &doc) {
  if (doc.has("session.mode")) {
    auto mode = parse_run_mode(doc.get_string("session.mode"));
    if (!mode.ok()) {
      return common::Status::error(mode.error());
    }
    config.session.mode = mode.value();
  }
  config.session.record = doc.get_bool("session.record", config.session.record);
  if (doc.has("session.record_mode")) {
    auto record_mode = parse_record_mode(doc.get_string("session.record_mode"));
    if (!record_mode.ok()) {
      return common::Status::error(record_mode.error());
    }
    config.session.record_mode = record_mode.value();
  }
  if (doc.has("session.headed")) {
    config.session.headed = doc.get_bool("session.headed", false);
  }
  config.session.layout = doc.get_string("session.layout", config.session.layout);
  config.session.ffmpeg_path = doc.get_string("session.ffmpeg_path", config.session.ffmpeg_path);
  config.session.ffprobe_path =
      doc.get_string("session.ffprobe_path", config.session.ffprobe_path);
  config.session.artifact_dir = common::expand_path(
      doc.get_string("session.artifact_dir", config.session.artifact_dir));
  config.session.tail_ms = doc.get_u64("session.tail_ms", config.session.tail_ms);
  return common::Status::success();
}

void load_browser_config(Config &config, const common::TomlDocument &doc) {
  config.browser.executable =
      common::expand_path(doc.get_string("browser.executable", config.browser.executable));
  config.browser.devtools_port = static_cast<std::uint16_t>(
      doc.get_u64("browser.devtools_port", config.browser.devtools_port));
  config.browser.extra_args =
      doc.get_string_array("browser.extra_args", config.browser.extra_args);
  config.browser.launch_timeout_ms =
      doc.get_u64("browser.launch_timeout_ms", config.browser.launch_timeout_ms);
}

void load_capture_config(Config &config, const common::TomlDocument &doc) {
  config.capture.display = doc.get_string("capture.display", config.capture.display);
  config.capture.display_size =
      doc.get_string("capture.display_size", config.capture.display_size);
  if (doc.has("capture.screen_index")) {
    config.capture.screen_index =
        static_cast<int>(doc.get_u64("capture.screen_index", 0));
  }
  config.capture.fps =
      static_cast<std::uint32_t>(doc.get_u64("capture.fps", config.capture.fps));
}

void load_narration_config(Config &config, const common::TomlDocument &doc) {
  config.narration.enabled = doc.get_bool("narration.enabled", config.narration.enabled);
  config.narration.api_key = doc.get_string("narration.api_key", config.narration.api_key);
  config.narration.model = doc.get_string("narration.model", config.narration.model);
  config.narration.voice = doc.get_string("narration.voice", config.narration.voice);
  config.narration.speed = doc.get_double("narration.speed", config.narration.speed);
  config.narration.language = doc.get_string("narration.language", config.narration.language);
  config.narration.cache_dir =
      common::expand_path(doc.get_string("narration.cache_dir", config.narration.cache_dir));
  config.narration.sfx_dir =
      common::expand_path(doc.get_string("narration.sfx_dir", config.narration.sfx_dir));
  config.narration.realtime = doc.get_bool("narration.realtime", config.narration.realtime);
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const auto mode = env_value("SCENECAST_MODE"); mode.has_value()) {
    auto parsed = parse_run_mode(*mode);
    if (parsed.ok()) {
      config.session.mode = parsed.value();
    } else {
      std::cerr << "[config] ignoring SCENECAST_MODE: " << parsed.error() << "\n";
    }
  }
  if (const auto record = env_value("SCENECAST_RECORD"); record.has_value()) {
    config.session.record = parse_flag(*record, config.session.record);
  }
  if (const auto record_mode = env_value("SCENECAST_RECORD_MODE"); record_mode.has_value()) {
    auto parsed = parse_record_mode(*record_mode);
    if (parsed.ok()) {
      config.session.record_mode = parsed.value();
    } else {
      std::cerr << "[config] ignoring SCENECAST_RECORD_MODE: " << parsed.error() << "\n";
    }
  }
  if (config.narration.api_key.empty()) {
    if (const auto key = env_value("OPENAI_API_KEY"); key.has_value()) {
      config.narration.api_key = *key;
    }
  }
  if (config.capture.display.empty()) {
    if (const auto display = env_value("DISPLAY"); display.has_value()) {
      config.capture.display = *display;
    }
  }
  if (const auto ci = env_value("CI"); ci.has_value()) {
    config.ci = parse_flag(*ci, true);
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  auto doc = common::parse_toml(toml_text);
  if (!doc.ok()) {
    return common::Result<Config>::failure("invalid config: " + doc.error());
  }

  Config config;
  auto session = load_session_config(config, doc.value());
  if (!session.ok()) {
    return common::Result<Config>::failure(session.error());
  }
  load_browser_config(config, doc.value());
  load_capture_config(config, doc.value());
  load_narration_config(config, doc.value());
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }

  Config config;
  if (std::filesystem::exists(path.value())) {
    auto text = common::read_file(path.value());
    if (!text.ok()) {
      return common::Result<Config>::failure(text.error());
    }
    auto parsed = parse_config(text.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.value().string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<RunMode> parse_run_mode(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered == "human") {
    return common::Result<RunMode>::success(RunMode::Human);
  }
  if (lowered == "fast") {
    return common::Result<RunMode>::success(RunMode::Fast);
  }
  return common::Result<RunMode>::failure("unknown mode '" + value + "' (expected human|fast)");
}

common::Result<RecordMode> parse_record_mode(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered == "screencast") {
    return common::Result<RecordMode>::success(RecordMode::Screencast);
  }
  if (lowered == "screen") {
    return common::Result<RecordMode>::success(RecordMode::Screen);
  }
  if (lowered == "none") {
    return common::Result<RecordMode>::success(RecordMode::None);
  }
  return common::Result<RecordMode>::failure("unknown record mode '" + value +
                                             "' (expected screencast|screen|none)");
}

std::string run_mode_name(RunMode mode) { return mode == RunMode::Human ? "human" : "fast"; }

std::string record_mode_name(RecordMode mode) {
  switch (mode) {
  case RecordMode::Screencast:
    return "screencast";
  case RecordMode::Screen:
    return "screen";
  case RecordMode::None:
    return "none";
  }
  return "none";
}

} // namespace scenecast::config
