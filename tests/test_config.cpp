#include "test_framework.hpp"

#include "scenecast/common/fs.hpp"
#include "scenecast/config/config.hpp"
#include "scenecast/session/session.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace {

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = scenecast::config::config_path_override();
    if (next.has_value()) {
      scenecast::config::set_config_path_override(*next);
    } else {
      scenecast::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      scenecast::config::set_config_path_override(*old_override);
    } else {
      scenecast::config::clear_config_path_override();
    }
  }
};

struct EnvGuard {
  std::string name;
  std::optional<std::string> previous;

  EnvGuard(std::string key, const std::optional<std::string> &value) : name(std::move(key)) {
    if (const char *old = std::getenv(name.c_str()); old != nullptr) {
      previous = old;
    }
    if (value.has_value()) {
      setenv(name.c_str(), value->c_str(), 1);
    } else {
      unsetenv(name.c_str());
    }
  }

  ~EnvGuard() {
    if (previous.has_value()) {
      setenv(name.c_str(), previous->c_str(), 1);
    } else {
      unsetenv(name.c_str());
    }
  }
};

} // namespace

void register_config_tests(std::vector<scenecast::tests::TestCase> &tests) {
  using scenecast::tests::require;
  namespace cfg = scenecast::config;

  tests.push_back({"config_defaults_without_file", [] {
                     const auto dir =
                         std::filesystem::temp_directory_path() / "scenecast-config-empty";
                     std::filesystem::remove_all(dir);
                     std::filesystem::create_directories(dir);
                     ConfigOverrideGuard guard(dir);
                     EnvGuard mode("SCENECAST_MODE", std::nullopt);
                     EnvGuard record("SCENECAST_RECORD", std::nullopt);
                     EnvGuard record_mode("SCENECAST_RECORD_MODE", std::nullopt);
                     EnvGuard ci("CI", std::nullopt);

                     auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == dir / "scenecast.toml",
                             "directory override should resolve to scenecast.toml");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().session.mode == cfg::RunMode::Human, "default mode");
                     require(loaded.value().session.record, "recording defaults on");
                     require(loaded.value().session.record_mode == cfg::RecordMode::Screencast,
                             "default record mode");
                     require(loaded.value().session.tail_ms == 300, "default tail");
                     require(!loaded.value().ci, "ci defaults off");
                   }});

  tests.push_back({"config_load_from_file", [] {
                     const auto dir =
                         std::filesystem::temp_directory_path() / "scenecast-config-file";
                     std::filesystem::remove_all(dir);
                     std::filesystem::create_directories(dir);
                     auto written = scenecast::common::write_file(dir / "scenecast.toml", R"(
[session]
mode = "fast"
record_mode = "screen"
headed = false
layout = "cols:2"
artifact_dir = "/tmp/scenecast-out"

[browser]
devtools_port = 9333
extra_args = ["--mute-audio"]

[capture]
display = ":99"
display_size = "2560x720"
screen_index = 1
fps = 25

[narration]
enabled = true
voice = "nova"
speed = 1.25
language = "fr"
)");
                     require(written.ok(), written.error());
                     ConfigOverrideGuard guard(dir);
                     EnvGuard mode("SCENECAST_MODE", std::nullopt);
                     EnvGuard record_mode("SCENECAST_RECORD_MODE", std::nullopt);

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.session.mode == cfg::RunMode::Fast, "mode from file");
                     require(config.session.record_mode == cfg::RecordMode::Screen,
                             "record mode from file");
                     require(config.session.headed.has_value() && !*config.session.headed,
                             "headed from file");
                     require(config.browser.devtools_port == 9333, "devtools port");
                     require(config.browser.extra_args.size() == 1, "extra args");
                     require(config.capture.display == ":99", "display");
                     require(config.capture.screen_index == 1, "screen index");
                     require(config.capture.fps == 25, "fps");
                     require(config.narration.enabled && config.narration.voice == "nova",
                             "narration voice");
                     require(config.narration.speed == 1.25, "narration speed");

                     auto options = scenecast::session::session_options_from_config(config);
                     require(options.ok(), options.error());
                     require(!options.value().headed, "explicit headed wins");
                     require(options.value().layout.cols.value_or(0) == 2, "layout parsed");
                     require(options.value().screen_index.value_or(-1) == 1,
                             "screen index carried");
                     require(options.value().artifact_dir == "/tmp/scenecast-out",
                             "artifact dir carried");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     ConfigOverrideGuard guard(std::filesystem::temp_directory_path() /
                                               "scenecast-config-missing" / "none.toml");
                     EnvGuard mode("SCENECAST_MODE", std::string("fast"));
                     EnvGuard record("SCENECAST_RECORD", std::string("0"));
                     EnvGuard record_mode("SCENECAST_RECORD_MODE", std::string("none"));
                     EnvGuard key("OPENAI_API_KEY", std::string("sk-test"));
                     EnvGuard display("DISPLAY", std::string(":42"));
                     EnvGuard ci("CI", std::string("true"));

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().session.mode == cfg::RunMode::Fast, "env mode");
                     require(!loaded.value().session.record, "env record flag");
                     require(loaded.value().session.record_mode == cfg::RecordMode::None,
                             "env record mode");
                     require(loaded.value().narration.api_key == "sk-test", "env api key");
                     require(loaded.value().capture.display == ":42", "env display");
                     require(loaded.value().ci, "env ci");
                   }});

  tests.push_back({"config_invalid_env_mode_is_ignored", [] {
                     cfg::Config config;
                     EnvGuard mode("SCENECAST_MODE", std::string("turbo"));
                     cfg::apply_env_overrides(config);
                     require(config.session.mode == cfg::RunMode::Human,
                             "unknown mode should be ignored");
                   }});

  tests.push_back({"config_rejects_unknown_modes", [] {
                     require(!cfg::parse_run_mode("slow").ok(), "unknown run mode");
                     require(!cfg::parse_record_mode("video").ok(), "unknown record mode");
                     require(cfg::parse_record_mode(" Screen ").ok(), "case insensitive");
                     auto parsed = cfg::parse_config("[session]\nmode = \"warp\"\n");
                     require(!parsed.ok(), "invalid mode in file should fail");
                     require(cfg::record_mode_name(cfg::RecordMode::Screencast) == "screencast",
                             "record mode name");
                   }});

  tests.push_back({"config_headed_defaults_to_human_mode", [] {
                     cfg::Config config;
                     config.session.mode = cfg::RunMode::Human;
                     auto human = scenecast::session::session_options_from_config(config);
                     require(human.ok() && human.value().headed, "human runs headed");
                     config.session.mode = cfg::RunMode::Fast;
                     auto fast = scenecast::session::session_options_from_config(config);
                     require(fast.ok() && !fast.value().headed, "fast runs headless");
                     config.session.layout = "diagonal";
                     require(!scenecast::session::session_options_from_config(config).ok(),
                             "bad layout should fail");
                   }});
}
