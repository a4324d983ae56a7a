#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace scenecast::narration {

enum class AudioEventKind { Speak, Effect };

struct AudioEvent {
  AudioEventKind kind = AudioEventKind::Speak;
  // Offset from the start of the recording.
  std::int64_t start_ms = 0;
  std::int64_t duration_ms = 0;
  std::filesystem::path audio_path;
  std::string label;
  double volume = 1.0;
};

struct SpeakOptions {
  std::optional<std::string> voice;
  std::optional<double> speed;
};

struct EffectOptions {
  double volume = 0.5;
};

[[nodiscard]] inline std::string audio_event_kind_name(AudioEventKind kind) {
  return kind == AudioEventKind::Speak ? "speak" : "effect";
}

} // namespace scenecast::narration
