#pragma once

#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"
#include "scenecast/config/config.hpp"
#include "scenecast/narration/audio_event.hpp"
#include "scenecast/narration/tts.hpp"
#include "scenecast/net/http_client.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::narration {

/// Narration surface handed to scenarios. The no-op variant keeps call sites branch-free.
class IAudioDirector {
public:
  virtual ~IAudioDirector() = default;

  /// Records a speech clip at the current offset and blocks until it has been spoken.
  [[nodiscard]] virtual common::Status speak(const std::string &text,
                                             const SpeakOptions &options = {}) = 0;
  [[nodiscard]] virtual common::Status effect(const std::string &name,
                                              const EffectOptions &options = {}) = 0;
  [[nodiscard]] virtual common::Status warmup(const std::string &text,
                                              const SpeakOptions &options = {}) = 0;

  [[nodiscard]] virtual std::vector<AudioEvent> events() const = 0;
  [[nodiscard]] virtual bool active() const = 0;
};

class NoopAudioDirector final : public IAudioDirector {
public:
  [[nodiscard]] common::Status speak(const std::string &, const SpeakOptions &) override {
    return common::Status::success();
  }
  [[nodiscard]] common::Status effect(const std::string &, const EffectOptions &) override {
    return common::Status::success();
  }
  [[nodiscard]] common::Status warmup(const std::string &, const SpeakOptions &) override {
    return common::Status::success();
  }
  [[nodiscard]] std::vector<AudioEvent> events() const override { return {}; }
  [[nodiscard]] bool active() const override { return false; }
};

struct AudioDirectorOptions {
  std::chrono::steady_clock::time_point video_start = std::chrono::steady_clock::now();
  std::filesystem::path sfx_dir = "assets/sfx";
  bool realtime = false;
  std::string ffplay_path = "ffplay";
  // Defaults to std::this_thread::sleep_for.
  std::function<void(std::chrono::milliseconds)> sleeper;
};

/// Resolves `<sfx_dir>/<name>.wav`, then `.mp3`, then `name` as a path.
[[nodiscard]] std::optional<std::filesystem::path>
resolve_effect_path(const std::filesystem::path &sfx_dir, const std::string &name);

class AudioDirector final : public IAudioDirector {
public:
  AudioDirector(std::unique_ptr<TtsEngine> tts, AudioDurationProbe &durations,
                AudioDirectorOptions options);
  ~AudioDirector() override;

  [[nodiscard]] common::Status speak(const std::string &text,
                                     const SpeakOptions &options = {}) override;
  [[nodiscard]] common::Status effect(const std::string &name,
                                      const EffectOptions &options = {}) override;
  [[nodiscard]] common::Status warmup(const std::string &text,
                                      const SpeakOptions &options = {}) override;

  [[nodiscard]] std::vector<AudioEvent> events() const override;
  [[nodiscard]] bool active() const override { return true; }
  /// Realtime playback processes started so far.
  [[nodiscard]] std::size_t player_count() const;

private:
  [[nodiscard]] std::int64_t elapsed_ms() const;
  void play(const std::filesystem::path &clip);

  std::unique_ptr<TtsEngine> tts_;
  AudioDurationProbe &durations_;
  AudioDirectorOptions options_;
  mutable std::mutex events_mutex_;
  std::vector<AudioEvent> events_;
  mutable std::mutex players_mutex_;
  std::vector<std::unique_ptr<common::Subprocess>> players_;
};

/// Everything a director needs beyond configuration.
struct AudioDirectorDeps {
  std::shared_ptr<net::HttpClient> http;
  AudioDurationProbe *durations = nullptr;
  std::chrono::steady_clock::time_point video_start = std::chrono::steady_clock::now();
  std::function<void(std::chrono::milliseconds)> sleeper;
};

/// Real director when narration is enabled and an API key is present, no-op otherwise.
[[nodiscard]] std::unique_ptr<IAudioDirector>
make_audio_director(const config::NarrationConfig &config, AudioDirectorDeps deps);

} // namespace scenecast::narration
