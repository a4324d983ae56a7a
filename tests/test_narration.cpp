#include "test_framework.hpp"
#include "fakes.hpp"

#include "scenecast/common/fs.hpp"
#include "scenecast/narration/director.hpp"
#include "scenecast/narration/mixer.hpp"
#include "scenecast/narration/tts.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using scenecast::common::ProcessOutput;
using scenecast::common::Result;

// ffprobe stand-in that reports a fixed clip length.
std::unique_ptr<scenecast::tests::RecordingProcessRunner> ffprobe_reporting(const std::string &seconds) {
  auto runner = std::make_unique<scenecast::tests::RecordingProcessRunner>();
  runner->handler = [seconds](const std::vector<std::string> &) {
    return Result<ProcessOutput>::success(ProcessOutput{0, seconds + "\n"});
  };
  return runner;
}

} // namespace

void register_narration_tests(std::vector<scenecast::tests::TestCase> &tests) {
  using scenecast::tests::require;
  namespace n = scenecast::narration;
  namespace t = scenecast::tests;

  tests.push_back({"narration_cache_key", [] {
                     require(n::tts_cache_key("tts-1", "ash", 1.0, "", "Hello world") ==
                                 "69080094b207e360",
                             "cache key without language");
                     require(n::tts_cache_key("tts-1", "nova", 1.25, "fr", "Hello world") ==
                                 "d7605680e1cb22bd",
                             "cache key with language");
                     require(n::tts_cache_key("tts-1", "ash", 1.0, "", "Hello world!") !=
                                 n::tts_cache_key("tts-1", "ash", 1.0, "", "Hello world"),
                             "text changes the key");
                     require(n::format_speed(1.0) == "1", "integral speed");
                     require(n::format_speed(1.25) == "1.25", "fractional speed");
                     require(n::format_speed(0.9) == "0.9", "short decimal");
                   }});

  tests.push_back({"narration_duration_probe", [] {
                     auto runner = ffprobe_reporting("2.345");
                     n::AudioDurationProbe probe(*runner, "/usr/bin/ffprobe");
                     require(probe.duration_ms("/tmp/clip.mp3") == 2345, "ffprobe duration");
                     require(runner->calls[0][0] == "/usr/bin/ffprobe", "configured ffprobe");

                     const auto dir = t::make_temp_dir("narration-probe");
                     const auto clip = dir / "clip.mp3";
                     require(scenecast::common::write_file(clip, std::string(16000, 'x')).ok(),
                             "write clip");
                     t::RecordingProcessRunner failing;
                     failing.handler = [](const std::vector<std::string> &) {
                       return Result<ProcessOutput>::failure("ffprobe not found");
                     };
                     n::AudioDurationProbe fallback(failing, "ffprobe");
                     require(fallback.duration_ms(clip) == 1000, "size estimate at 128 kbps");
                     require(fallback.duration_ms(dir / "missing.mp3") == 0, "missing clip");
                   }});

  tests.push_back({"narration_synthesize_cache_miss_then_hit", [] {
                     const auto dir = t::make_temp_dir("narration-tts");
                     auto runner = ffprobe_reporting("1.5");
                     n::AudioDurationProbe durations(*runner, "ffprobe");
                     auto http = std::make_shared<t::FakeHttpClient>();
                     http->responses.push_back({200, "ID3-audio", false, ""});

                     n::TtsOptions options;
                     options.api_key = "sk-test";
                     options.cache_dir = dir;
                     n::TtsEngine engine(options, http, durations);

                     auto first = engine.synthesize("Hello world");
                     require(first.ok(), first.error());
                     require(!first.value().cached, "first call synthesizes");
                     require(first.value().audio_path == dir / "69080094b207e360.mp3",
                             "content addressed file");
                     require(first.value().duration_ms == 1500, "duration from probe");
                     require(http->requests.size() == 1, "one API request");
                     require(http->requests[0].url == n::SPEECH_ENDPOINT, "speech endpoint");
                     require(http->requests[0].body.find(R"("voice":"ash")") != std::string::npos,
                             "voice in body");
                     require(http->requests[0].body.find(R"("speed":1,)") != std::string::npos,
                             "speed in body");

                     auto second = engine.synthesize("Hello world");
                     require(second.ok(), second.error());
                     require(second.value().cached, "second call is cached");
                     require(http->requests.size() == 1, "cache hit makes no request");

                     n::SpeakOptions other;
                     other.voice = "nova";
                     auto third = engine.synthesize("Hello world", other);
                     require(third.ok() && !third.value().cached, "voice override misses cache");
                     require(http->requests.size() == 2, "second request");
                   }});

  tests.push_back({"narration_synthesize_api_error", [] {
                     const auto dir = t::make_temp_dir("narration-error");
                     auto runner = ffprobe_reporting("1");
                     n::AudioDurationProbe durations(*runner, "ffprobe");
                     auto http = std::make_shared<t::FakeHttpClient>();
                     http->responses.push_back({401, R"({"error":"bad key"})", false, ""});
                     http->responses.push_back({0, "", true, "connection refused"});

                     n::TtsOptions options;
                     options.api_key = "sk-bad";
                     options.cache_dir = dir;
                     n::TtsEngine engine(options, http, durations);
                     auto rejected = engine.synthesize("Hi");
                     require(!rejected.ok(), "401 should fail");
                     require(rejected.error() == R"(OpenAI TTS API error 401: {"error":"bad key"})",
                             rejected.error());
                     auto offline = engine.synthesize("Hi");
                     require(!offline.ok(), "network error should fail");
                     require(offline.error() == "TTS request failed: connection refused",
                             offline.error());
                     require(std::filesystem::is_empty(dir), "nothing cached on failure");
                   }});

  tests.push_back({"narration_translation_is_cached", [] {
                     const auto dir = t::make_temp_dir("narration-translate");
                     auto runner = ffprobe_reporting("1");
                     n::AudioDurationProbe durations(*runner, "ffprobe");
                     auto http = std::make_shared<t::FakeHttpClient>();
                     http->responses.push_back(
                         {200, R"({"choices":[{"message":{"role":"assistant","content":" Bonjour "}}]})",
                          false, ""});
                     http->responses.push_back({200, "ID3", false, ""});

                     n::TtsOptions options;
                     options.api_key = "sk-test";
                     options.language = "fr";
                     options.cache_dir = dir;
                     n::TtsEngine engine(options, http, durations);
                     auto clip = engine.synthesize("Hello");
                     require(clip.ok(), clip.error());
                     require(http->requests.size() == 2, "translation then speech");
                     require(http->requests[0].url == n::CHAT_ENDPOINT, "chat endpoint");
                     require(http->requests[1].body.find(R"("input":"Bonjour")") != std::string::npos,
                             "translated text spoken");

                     require(engine.translate("Hello") == "Bonjour", "translation cache hit");
                     require(http->requests.size() == 2, "cached translation makes no request");
                   }});

  tests.push_back({"narration_translation_failure_keeps_text", [] {
                     const auto dir = t::make_temp_dir("narration-translate-fail");
                     auto runner = ffprobe_reporting("1");
                     n::AudioDurationProbe durations(*runner, "ffprobe");
                     auto http = std::make_shared<t::FakeHttpClient>();
                     http->responses.push_back({500, "oops", false, ""});
                     n::TtsOptions options;
                     options.language = "de";
                     options.cache_dir = dir;
                     n::TtsEngine engine(options, http, durations);
                     require(engine.translate("Good morning") == "Good morning",
                             "original text on failure");
                   }});

  tests.push_back({"narration_mix_filter", [] {
                     std::vector<n::AudioEvent> events;
                     events.push_back({n::AudioEventKind::Speak, 1200, 900, "/c/a.mp3", "Hi", 1.0});
                     events.push_back({n::AudioEventKind::Effect, -5, 200, "/s/click.wav", "click", 0.5});
                     require(n::build_mix_filter(events) ==
                                 "[1:a]adelay=1200|1200,apad[a0];"
                                 "[2:a]adelay=0|0,volume=0.50,apad[a1];"
                                 "[a0][a1]amix=inputs=2:normalize=0[mixed]",
                             n::build_mix_filter(events));

                     const auto args = n::build_mix_args("ffmpeg", "/v/run.mp4", events,
                                                         "/v/run.narrated.mp4");
                     require(args[3] == "/v/run.mp4", "video is input 0");
                     require(args[5] == "/c/a.mp3" && args[7] == "/s/click.wav", "clips follow");
                     require(args.back() == "/v/run.narrated.mp4", "output last");
                     require(n::narrated_output_path("/v/run.mp4") == "/v/run.narrated.mp4",
                             "narrated path");
                     require(n::audio_event_kind_name(n::AudioEventKind::Effect) == "effect",
                             "kind name");
                   }});

  tests.push_back({"narration_mix_without_events_is_a_noop", [] {
                     t::RecordingProcessRunner runner;
                     const auto out = n::mix_audio_into_video(runner, "ffmpeg", "/v/run.mp4", {});
                     require(out == "/v/run.mp4", "video returned");
                     require(runner.calls.empty(), "ffmpeg not run");
                   }});

  tests.push_back({"narration_mix_replaces_video", [] {
                     const auto dir = t::make_temp_dir("narration-mix");
                     const auto video = dir / "run.mp4";
                     require(scenecast::common::write_file(video, "silent").ok(), "write video");
                     t::RecordingProcessRunner runner;
                     runner.handler = [](const std::vector<std::string> &argv) {
                       (void)scenecast::common::write_file(argv.back(), "narrated");
                       return Result<ProcessOutput>::success(ProcessOutput{0, ""});
                     };
                     const std::vector<n::AudioEvent> events{
                         {n::AudioEventKind::Speak, 0, 500, dir / "a.mp3", "Hi", 1.0}};
                     const auto out = n::mix_audio_into_video(runner, "ffmpeg", video, events);
                     require(out == video, "same path returned");
                     auto content = scenecast::common::read_file(video);
                     require(content.ok() && content.value() == "narrated", "video replaced");
                     require(!std::filesystem::exists(dir / "run.narrated.mp4"),
                             "temporary output renamed");
                   }});

  tests.push_back({"narration_failed_mix_keeps_original", [] {
                     const auto dir = t::make_temp_dir("narration-mix-fail");
                     const auto video = dir / "run.mp4";
                     require(scenecast::common::write_file(video, "silent").ok(), "write video");
                     t::RecordingProcessRunner runner;
                     runner.handler = [](const std::vector<std::string> &argv) {
                       (void)scenecast::common::write_file(argv.back(), "partial");
                       return Result<ProcessOutput>::success(ProcessOutput{1, "amix error"});
                     };
                     const std::vector<n::AudioEvent> events{
                         {n::AudioEventKind::Speak, 0, 500, dir / "a.mp3", "Hi", 1.0}};
                     const auto out = n::mix_audio_into_video(runner, "ffmpeg", video, events);
                     require(out == video, "original path returned");
                     auto content = scenecast::common::read_file(video);
                     require(content.ok() && content.value() == "silent", "original untouched");
                     require(!std::filesystem::exists(dir / "run.narrated.mp4"),
                             "partial output removed");
                   }});

  tests.push_back({"narration_director_is_silent_without_key", [] {
                     scenecast::config::NarrationConfig config;
                     auto disabled = n::make_audio_director(config, {});
                     require(!disabled->active(), "disabled narration is a no-op");

                     config.enabled = true;
                     auto keyless = n::make_audio_director(config, {});
                     require(!keyless->active(), "missing key falls back to silence");
                     require(keyless->speak("hello").ok(), "no-op speak succeeds");
                     require(keyless->events().empty(), "no-op records nothing");

                     config.api_key = "sk-test";
                     auto no_deps = n::make_audio_director(config, {});
                     require(!no_deps->active(), "missing dependencies fall back to silence");
                   }});

  tests.push_back({"narration_director_speak_blocks_for_clip", [] {
                     const auto dir = t::make_temp_dir("narration-director");
                     auto runner = ffprobe_reporting("1.2");
                     n::AudioDurationProbe durations(*runner, "ffprobe");
                     auto http = std::make_shared<t::FakeHttpClient>();
                     auto pauses = std::make_shared<std::vector<std::int64_t>>();

                     scenecast::config::NarrationConfig config;
                     config.enabled = true;
                     config.api_key = "sk-test";
                     config.cache_dir = dir.string();
                     config.sfx_dir = (dir / "sfx").string();
                     n::AudioDirectorDeps deps;
                     deps.http = http;
                     deps.durations = &durations;
                     deps.sleeper = t::recording_sleeper(pauses);
                     auto director = n::make_audio_director(config, std::move(deps));
                     require(director->active(), "real director expected");

                     auto spoken = director->speak("Welcome to the demo");
                     require(spoken.ok(), spoken.error());
                     require(pauses->size() == 1 && pauses->front() == 1250,
                             "sleeps for the clip plus tail");
                     const auto events = director->events();
                     require(events.size() == 1, "one event");
                     require(events[0].kind == n::AudioEventKind::Speak, "speech event");
                     require(events[0].duration_ms == 1200, "clip duration");
                     require(events[0].label == "Welcome to the demo", "label is the text");
                     require(events[0].start_ms >= 0, "offset from video start");

                     require(director->effect("missing-sound").ok(), "unknown effect is ignored");
                     require(director->events().size() == 1, "unknown effect not recorded");

                     std::filesystem::create_directories(dir / "sfx");
                     require(scenecast::common::write_file(dir / "sfx" / "click.wav", "RIFF").ok(),
                             "write effect");
                     require(director->effect("click", {0.3}).ok(), "known effect");
                     const auto after = director->events();
                     require(after.size() == 2 && after[1].kind == n::AudioEventKind::Effect,
                             "effect recorded");
                     require(after[1].volume == 0.3, "effect volume kept");
                     require(after[1].audio_path == dir / "sfx" / "click.wav", "wav resolved first");
                   }});
  tests.push_back({"narration_director_concurrent_speak_and_effect", [] {
                     const auto dir = t::make_temp_dir("narration-concurrent");
                     auto runner = ffprobe_reporting("0.1");
                     n::AudioDurationProbe durations(*runner, "ffprobe");
                     auto http = std::make_shared<t::FakeHttpClient>();
                     http->responses.push_back({200, "ID3-audio", false, ""});
                     std::filesystem::create_directories(dir / "sfx");
                     require(scenecast::common::write_file(dir / "sfx" / "click.wav", "RIFF").ok(),
                             "write effect");

                     n::TtsOptions tts;
                     tts.api_key = "sk-test";
                     tts.cache_dir = dir / "cache";
                     n::AudioDirectorOptions options;
                     options.sfx_dir = dir / "sfx";
                     options.realtime = true;
                     options.ffplay_path = "true";
                     options.sleeper = [](std::chrono::milliseconds) {};
                     n::AudioDirector director(
                         std::make_unique<n::TtsEngine>(std::move(tts), http, durations),
                         durations, std::move(options));
                     require(director.warmup("Same line every time").ok(), "warm the cache");

                     constexpr int kRounds = 40;
                     bool speech_ok = true;
                     std::thread speaker([&] {
                       for (int i = 0; i < kRounds; ++i) {
                         speech_ok = director.speak("Same line every time").ok() && speech_ok;
                       }
                     });
                     bool effects_ok = true;
                     for (int i = 0; i < kRounds; ++i) {
                       effects_ok = director.effect("click").ok() && effects_ok;
                     }
                     speaker.join();

                     require(speech_ok, "every speak succeeds");
                     require(effects_ok, "every effect succeeds");
                     const auto events = director.events();
                     require(events.size() == 2 * kRounds, "all events recorded");
                     std::size_t speech = 0;
                     for (const auto &event : events) {
                       if (event.kind == n::AudioEventKind::Speak) {
                         ++speech;
                       }
                     }
                     require(speech == kRounds, "speech and effect counts match");
                     require(director.player_count() == 2 * kRounds, "one player per event");
                   }});
}
