#pragma once

#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"
#include "scenecast/narration/audio_event.hpp"
#include "scenecast/net/http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

namespace scenecast::narration {

inline constexpr const char *SPEECH_ENDPOINT = "https://api.openai.com/v1/audio/speech";
inline constexpr const char *CHAT_ENDPOINT = "https://api.openai.com/v1/chat/completions";
inline constexpr const char *TRANSLATION_MODEL = "gpt-4o-mini";

/// Shortest decimal text for a speed value, e.g. 1 or 1.25.
[[nodiscard]] std::string format_speed(double speed);

/// First 16 hex chars of sha256("model:voice:speed[:language]:text").
[[nodiscard]] std::string tts_cache_key(const std::string &model, const std::string &voice,
                                        double speed, const std::string &language,
                                        const std::string &text);

/// Reads clip durations with ffprobe, estimating from size at 128 kbps when that fails.
class AudioDurationProbe {
public:
  AudioDurationProbe(common::IProcessRunner &runner, std::string ffprobe_path);

  [[nodiscard]] std::int64_t duration_ms(const std::filesystem::path &path);

private:
  common::IProcessRunner &runner_;
  std::string ffprobe_path_;
};

struct TtsOptions {
  std::string api_key;
  std::string model = "tts-1";
  std::string voice = "ash";
  double speed = 1.0;
  // Empty disables translation.
  std::string language;
  std::filesystem::path cache_dir = ".cache/tts";
  std::uint64_t timeout_ms = 60000;
};

struct SynthesizedClip {
  std::filesystem::path audio_path;
  std::int64_t duration_ms = 0;
  bool cached = false;
};

class TtsEngine {
public:
  TtsEngine(TtsOptions options, std::shared_ptr<net::HttpClient> http, AudioDurationProbe &durations);

  /// Synthesized MP3 for `text`, served from the content-addressed cache when present.
  [[nodiscard]] common::Result<SynthesizedClip> synthesize(const std::string &text,
                                                           const SpeakOptions &options = {});
  /// Text in the configured language; the original text when translation fails.
  [[nodiscard]] std::string translate(const std::string &text);

  [[nodiscard]] const TtsOptions &options() const { return options_; }

private:
  [[nodiscard]] std::unordered_map<std::string, std::string> auth_headers() const;

  TtsOptions options_;
  std::shared_ptr<net::HttpClient> http_;
  AudioDurationProbe &durations_;
};

} // namespace scenecast::narration
