#include "scenecast/narration/director.hpp"

#include <iostream>
#include <thread>

namespace scenecast::narration {

namespace {

constexpr std::int64_t SPEECH_TAIL_MS = 50;

} // namespace

std::optional<std::filesystem::path> resolve_effect_path(const std::filesystem::path &sfx_dir,
                                                         const std::string &name) {
  for (const char *extension : {".wav", ".mp3"}) {
    const auto candidate = sfx_dir / (name + extension);
    if (std::filesystem::exists(candidate)) {
      return candidate;
    }
  }
  if (std::filesystem::exists(name)) {
    return std::filesystem::path(name);
  }
  return std::nullopt;
}

AudioDirector::AudioDirector(std::unique_ptr<TtsEngine> tts, AudioDurationProbe &durations,
                             AudioDirectorOptions options)
    : tts_(std::move(tts)), durations_(durations), options_(std::move(options)) {
  if (!options_.sleeper) {
    options_.sleeper = [](std::chrono::milliseconds duration) {
      std::this_thread::sleep_for(duration);
    };
  }
}

AudioDirector::~AudioDirector() {
  std::lock_guard<std::mutex> lock(players_mutex_);
  for (auto &player : players_) {
    player->stop();
  }
}

std::int64_t AudioDirector::elapsed_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               options_.video_start)
      .count();
}

void AudioDirector::play(const std::filesystem::path &clip) {
  common::ProcessSpec spec;
  spec.command = options_.ffplay_path;
  spec.args = {"-nodisp", "-autoexit", "-loglevel", "quiet", clip.string()};
  spec.pipe_stdin = false;
  auto player = std::make_unique<common::Subprocess>(std::move(spec));
  auto started = player->start();
  if (!started.ok()) {
    std::cerr << "[narration] realtime playback unavailable: " << started.error() << "\n";
    return;
  }
  std::lock_guard<std::mutex> lock(players_mutex_);
  players_.push_back(std::move(player));
}

common::Status AudioDirector::warmup(const std::string &text, const SpeakOptions &options) {
  auto clip = tts_->synthesize(text, options);
  if (!clip.ok()) {
    return common::Status::error(clip.error());
  }
  return common::Status::success();
}

common::Status AudioDirector::speak(const std::string &text, const SpeakOptions &options) {
  const std::int64_t start_ms = elapsed_ms();
  auto clip = tts_->synthesize(text, options);
  if (!clip.ok()) {
    return common::Status::error(clip.error());
  }

  {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(AudioEvent{AudioEventKind::Speak, start_ms, clip.value().duration_ms,
                                 clip.value().audio_path, text, 1.0});
  }
  if (options_.realtime) {
    play(clip.value().audio_path);
  }
  options_.sleeper(std::chrono::milliseconds(clip.value().duration_ms + SPEECH_TAIL_MS));
  return common::Status::success();
}

common::Status AudioDirector::effect(const std::string &name, const EffectOptions &options) {
  const auto path = resolve_effect_path(options_.sfx_dir, name);
  if (!path.has_value()) {
    std::cerr << "[narration] unknown effect \"" << name << "\"\n";
    return common::Status::success();
  }
  const std::int64_t start_ms = elapsed_ms();
  const std::int64_t duration_ms = durations_.duration_ms(*path);
  {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(
        AudioEvent{AudioEventKind::Effect, start_ms, duration_ms, *path, name, options.volume});
  }
  if (options_.realtime) {
    play(*path);
  }
  return common::Status::success();
}

std::vector<AudioEvent> AudioDirector::events() const {
  std::lock_guard<std::mutex> lock(events_mutex_);
  return events_;
}

std::size_t AudioDirector::player_count() const {
  std::lock_guard<std::mutex> lock(players_mutex_);
  return players_.size();
}

std::unique_ptr<IAudioDirector> make_audio_director(const config::NarrationConfig &config,
                                                    AudioDirectorDeps deps) {
  if (!config.enabled) {
    return std::make_unique<NoopAudioDirector>();
  }
  if (config.api_key.empty()) {
    std::cerr << "[narration] no OpenAI API key found; set OPENAI_API_KEY or narration.api_key\n";
    std::cerr << "[narration] falling back to silent mode\n";
    return std::make_unique<NoopAudioDirector>();
  }
  if (deps.http == nullptr || deps.durations == nullptr) {
    std::cerr << "[narration] missing HTTP client or duration probe, narration disabled\n";
    return std::make_unique<NoopAudioDirector>();
  }

  TtsOptions tts;
  tts.api_key = config.api_key;
  tts.model = config.model;
  tts.voice = config.voice;
  tts.speed = config.speed;
  tts.language = config.language;
  tts.cache_dir = config.cache_dir;

  AudioDirectorOptions options;
  options.video_start = deps.video_start;
  options.sfx_dir = config.sfx_dir;
  options.realtime = config.realtime;
  options.sleeper = std::move(deps.sleeper);

  return std::make_unique<AudioDirector>(
      std::make_unique<TtsEngine>(std::move(tts), std::move(deps.http), *deps.durations),
      *deps.durations, std::move(options));
}

} // namespace scenecast::narration
