#include "scenecast/narration/tts.hpp"

#include "scenecast/common/crypto.hpp"
#include "scenecast/common/fs.hpp"
#include "scenecast/common/json_util.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace scenecast::narration {

namespace {

constexpr double FALLBACK_BITRATE = 128000.0;
constexpr std::size_t LOG_PREVIEW_CHARS = 60;

std::string preview(const std::string &text) {
  if (text.size() <= LOG_PREVIEW_CHARS) {
    return text;
  }
  return text.substr(0, LOG_PREVIEW_CHARS) + "...";
}

std::string chat_content(const std::string &response_json) {
  const auto choices = common::json_split_top_level_objects(
      common::json_get_array(response_json, "choices"));
  if (choices.empty()) {
    return "";
  }
  const std::string message = common::json_get_object(choices.front(), "message");
  return common::trim(common::json_get_string(message, "content"));
}

} // namespace

std::string format_speed(double speed) {
  std::ostringstream out;
  out << std::setprecision(15) << speed;
  return out.str();
}

std::string tts_cache_key(const std::string &model, const std::string &voice, double speed,
                          const std::string &language, const std::string &text) {
  std::string material = model + ":" + voice + ":" + format_speed(speed);
  if (!language.empty()) {
    material += ":" + language;
  }
  material += ":" + text;
  return common::sha256_hex(material).substr(0, 16);
}

AudioDurationProbe::AudioDurationProbe(common::IProcessRunner &runner, std::string ffprobe_path)
    : runner_(runner), ffprobe_path_(std::move(ffprobe_path)) {}

std::int64_t AudioDurationProbe::duration_ms(const std::filesystem::path &path) {
  auto out = runner_.run({ffprobe_path_, "-v", "error", "-show_entries", "format=duration", "-of",
                          "csv=p=0", path.string()});
  if (out.ok() && out.value().exit_code == 0) {
    try {
      const double seconds = std::stod(common::trim(out.value().output));
      if (std::isfinite(seconds)) {
        return static_cast<std::int64_t>(std::llround(seconds * 1000.0));
      }
    } catch (const std::exception &) {
      std::cerr << "[narration] unreadable ffprobe duration for " << path << "\n";
    }
  }

  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return 0;
  }
  return static_cast<std::int64_t>(
      std::llround(static_cast<double>(size) * 8.0 / FALLBACK_BITRATE * 1000.0));
}

TtsEngine::TtsEngine(TtsOptions options, std::shared_ptr<net::HttpClient> http,
                     AudioDurationProbe &durations)
    : options_(std::move(options)), http_(std::move(http)), durations_(durations) {}

std::unordered_map<std::string, std::string> TtsEngine::auth_headers() const {
  return {{"Authorization", "Bearer " + options_.api_key},
          {"Content-Type", "application/json"}};
}

std::string TtsEngine::translate(const std::string &text) {
  if (options_.language.empty()) {
    return text;
  }
  const auto cache_file = options_.cache_dir /
                          ("tr_" + common::sha256_hex(options_.language + ":" + text).substr(0, 16) +
                           ".txt");
  if (std::filesystem::exists(cache_file)) {
    auto cached = common::read_file(cache_file);
    if (cached.ok()) {
      return cached.value();
    }
  }

  std::cerr << "[narration] translating to " << options_.language << ": \"" << preview(text)
            << "\"\n";
  std::ostringstream body;
  body << R"({"model":")" << TRANSLATION_MODEL << R"(","messages":[)"
       << R"({"role":"system","content":"Translate the following text to )"
       << common::json_escape(options_.language)
       << R"(. Respond with ONLY the translation, no explanations or extra text."},)"
       << R"({"role":"user","content":")" << common::json_escape(text) << R"("}],)"
       << R"("temperature":0.3})";

  const auto response = http_->post_json(CHAT_ENDPOINT, auth_headers(), body.str(),
                                         options_.timeout_ms);
  if (response.network_error || response.status < 200 || response.status >= 300) {
    std::cerr << "[narration] translation failed ("
              << (response.network_error ? response.network_error_message
                                         : std::to_string(response.status))
              << "), using original text\n";
    return text;
  }
  const std::string translated = chat_content(response.body);
  if (translated.empty()) {
    return text;
  }
  auto written = common::write_file(cache_file, translated);
  if (!written.ok()) {
    std::cerr << "[narration] " << written.error() << "\n";
  }
  return translated;
}

common::Result<SynthesizedClip> TtsEngine::synthesize(const std::string &text,
                                                      const SpeakOptions &options) {
  const std::string voice = options.voice.value_or(options_.voice);
  const double speed = options.speed.value_or(options_.speed);

  auto dir = common::ensure_dir(options_.cache_dir);
  if (!dir.ok()) {
    return common::Result<SynthesizedClip>::failure(dir.error());
  }

  const std::string key = tts_cache_key(options_.model, voice, speed, options_.language, text);
  SynthesizedClip clip;
  clip.audio_path = options_.cache_dir / (key + ".mp3");
  if (std::filesystem::exists(clip.audio_path)) {
    clip.duration_ms = durations_.duration_ms(clip.audio_path);
    clip.cached = true;
    return common::Result<SynthesizedClip>::success(std::move(clip));
  }

  const std::string spoken = translate(text);
  std::cerr << "[narration] generating: \"" << preview(spoken) << "\"\n";
  std::ostringstream body;
  body << R"({"model":")" << common::json_escape(options_.model) << R"(","voice":")"
       << common::json_escape(voice) << R"(","input":")" << common::json_escape(spoken)
       << R"(","speed":)" << format_speed(speed) << R"(,"response_format":"mp3"})";

  const auto response =
      http_->post_json(SPEECH_ENDPOINT, auth_headers(), body.str(), options_.timeout_ms);
  if (response.network_error) {
    return common::Result<SynthesizedClip>::failure("TTS request failed: " +
                                                    response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<SynthesizedClip>::failure(
        "OpenAI TTS API error " + std::to_string(response.status) + ": " + response.body);
  }

  auto written = common::write_file(clip.audio_path, response.body);
  if (!written.ok()) {
    return common::Result<SynthesizedClip>::failure(written.error());
  }
  clip.duration_ms = durations_.duration_ms(clip.audio_path);

  std::ostringstream line;
  line << "[narration] generated " << std::fixed << std::setprecision(1)
       << static_cast<double>(clip.duration_ms) / 1000.0 << "s audio\n";
  std::cerr << line.str();
  return common::Result<SynthesizedClip>::success(std::move(clip));
}

} // namespace scenecast::narration
