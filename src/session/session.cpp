#include "scenecast/session/session.hpp"

#include "scenecast/actor/scripts.hpp"
#include "scenecast/browser/window_layout.hpp"
#include "scenecast/common/fs.hpp"
#include "scenecast/compose/compositor.hpp"
#include "scenecast/narration/mixer.hpp"
#include "scenecast/session/metadata.hpp"
#include "scenecast/session/subtitles.hpp"
#include "scenecast/session/timing.hpp"

#include <algorithm>
#include <cstdio>
#include <future>
#include <iostream>
#include <thread>

namespace scenecast::session {

namespace {

constexpr int DEFAULT_SCREEN_WIDTH = 1920;
constexpr int DEFAULT_SCREEN_HEIGHT = 1080;
constexpr int SCREENCAST_QUALITY = 80;
// Two frames of the raw capture.
constexpr std::int64_t THUMBNAIL_FLUSH_MS = 80;

std::string seconds_text(std::int64_t ms) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1fs", static_cast<double>(ms) / 1000.0);
  return buffer;
}

std::string join_errors(const std::vector<std::string> &errors) {
  std::string out;
  for (const auto &error : errors) {
    if (!out.empty()) {
      out += "; ";
    }
    out += error;
  }
  return out;
}

} // namespace

common::Result<SessionOptions> session_options_from_config(const config::Config &config) {
  auto layout = compose::parse_layout(config.session.layout);
  if (!layout.ok()) {
    return common::Result<SessionOptions>::failure(layout.error());
  }

  SessionOptions options;
  options.mode = config.session.mode;
  options.record = config.session.record;
  options.record_mode = config.session.record_mode;
  options.headed = config.session.headed.value_or(config.session.mode == config::RunMode::Human);
  options.layout = layout.value();
  options.ffmpeg_path = config.session.ffmpeg_path;
  options.artifact_dir = config.session.artifact_dir;
  options.tail = std::chrono::milliseconds(config.session.tail_ms);
  options.ci = config.ci;
  options.display = config.capture.display;
  options.display_size = config.capture.display_size;
  if (config.capture.screen_index >= 0) {
    options.screen_index = config.capture.screen_index;
  }
  options.capture_fps = static_cast<int>(config.capture.fps);
  return common::Result<SessionOptions>::success(std::move(options));
}

std::shared_ptr<browser::IBrowserHost> make_browser_host(const config::Config &config, bool headed,
                                                         std::shared_ptr<net::HttpClient> http) {
  browser::ChromeHostOptions host;
  host.launch.executable = config.browser.executable;
  host.launch.devtools_port = config.browser.devtools_port;
  host.launch.headless = !headed;
  host.launch.extra_args = config.browser.extra_args;
  host.launch.launch_timeout = std::chrono::milliseconds(config.browser.launch_timeout_ms);
  return std::make_shared<browser::ChromeBrowserHost>(std::move(host), std::move(http));
}

Session::Session(SessionOptions options, SessionDeps deps)
    : options_(std::move(options)), deps_(std::move(deps)) {
  if (deps_.runner == nullptr) {
    deps_.runner = std::make_shared<common::SystemProcessRunner>();
  }
  if (deps_.probe == nullptr) {
    deps_.probe = std::make_shared<capture::FfmpegProbe>(*deps_.runner, options_.ffmpeg_path);
  }
}

Session::~Session() {
  if (state_ == SessionState::Initialized || state_ == SessionState::Running) {
    std::vector<std::string> ignored;
    stop_captures(ignored);
    close_panes();
  }
}

common::Status Session::init() {
  if (state_ != SessionState::Created) {
    return common::Status::error("session already initialized");
  }
  if (deps_.browser == nullptr) {
    return common::Status::error("session has no browser host");
  }
  auto dir = common::ensure_dir(options_.artifact_dir);
  if (!dir.ok()) {
    return common::Status::error(dir.error());
  }
  auto launched = deps_.browser->launch();
  if (!launched.ok()) {
    return launched;
  }
  browser_open_ = true;

  if (options_.headed) {
    placer_ = deps_.browser->window_placer();
  }
  if (placer_ == nullptr) {
    placer_ = std::make_unique<browser::NoopWindowPlacer>();
  }

  start_ = std::chrono::steady_clock::now();
  if (deps_.audio) {
    audio_ = deps_.audio(start_);
  }
  if (audio_ == nullptr) {
    audio_ = std::make_unique<narration::NoopAudioDirector>();
  }

  const auto record_mode = effective_record_mode();
  if (options_.record && options_.record_mode == config::RecordMode::Screen &&
      record_mode != config::RecordMode::Screen) {
    std::cerr << "[session] screen recording needs a headed browser, using screencast\n";
  }
  if (record_mode == config::RecordMode::Screen) {
    capture::ScreenCaptureOptions screen;
    screen.ffmpeg_path = options_.ffmpeg_path;
    screen.output = video_path();
    screen.fps = options_.capture_fps;
    screen.screen_index = options_.screen_index;
    screen.display = options_.display;
    screen.display_size = options_.display_size;
    screen_capture_ = std::make_unique<capture::ScreenCapture>(std::move(screen), *deps_.probe);
    auto started = screen_capture_->start();
    if (!started.ok()) {
      std::cerr << "[capture] screen recording failed to start: " << started.error() << "\n";
      screen_capture_.reset();
    }
  }

  std::cout << "\n  Mode:      " << config::run_mode_name(options_.mode) << "\n";
  std::cout << "  Record:    " << config::record_mode_name(record_mode) << "\n";
  std::cout << "  Headed:    " << (options_.headed ? "true" : "false") << "\n";
  std::cout << "  Artifacts: " << options_.artifact_dir.string() << "\n\n";

  state_ = SessionState::Initialized;
  return common::Status::success();
}

common::Result<OpenedPage> Session::open_page(const PageOptions &options) {
  auto open = require_open("open_page");
  if (!open.ok()) {
    return common::Result<OpenedPage>::failure(open.error());
  }
  auto driver = deps_.browser->open_page(options.viewport);
  if (!driver.ok()) {
    return common::Result<OpenedPage>::failure(driver.error());
  }

  auto pane = std::make_unique<Pane>();
  pane->id = next_pane_id();
  pane->label = options.label.empty() ? pane->id : options.label;
  pane->page = std::move(driver.value());

  const bool human = options_.mode == config::RunMode::Human;
  auto scripted = pane->page->add_init_script(human ? actor::HIDE_CURSOR_INIT_SCRIPT
                                                    : actor::FAST_MODE_INIT_SCRIPT);
  if (!scripted.ok()) {
    return common::Result<OpenedPage>::failure(scripted.error());
  }

  actor::ActorOptions actor_options;
  actor_options.delays = options_.delays;
  actor_options.seed = options_.actor_seed + static_cast<std::uint32_t>(panes_.size());
  actor_options.sleeper = deps_.sleeper;
  auto created = std::make_unique<actor::Actor>(*pane->page, options_.mode, std::move(actor_options));
  actor::Actor *actor_ptr = created.get();
  pane->content = BrowserPaneContent{std::move(created)};

  auto started = start_screencast(*pane);
  if (!started.ok()) {
    std::cerr << "[capture] " << pane->id << ": " << started.error() << "\n";
  }

  Pane &added = *panes_.emplace_back(std::move(pane));
  retile();
  if (!options.url.empty()) {
    auto navigated = actor_ptr->goto_url(options.url);
    if (!navigated.ok()) {
      return common::Result<OpenedPage>::failure(navigated.error());
    }
  } else if (!options.html.empty()) {
    auto loaded = added.page->set_content(options.html);
    if (!loaded.ok()) {
      return common::Result<OpenedPage>::failure(loaded.error());
    }
    auto injected = actor_ptr->inject_cursor();
    if (!injected.ok()) {
      return common::Result<OpenedPage>::failure(injected.error());
    }
  }

  return common::Result<OpenedPage>::success(OpenedPage{added.id, actor_ptr, added.page.get()});
}

common::Result<OpenedTerminal> Session::open_terminal(const TerminalOptions &options) {
  auto open = require_open("open_terminal");
  if (!open.ok()) {
    return common::Result<OpenedTerminal>::failure(open.error());
  }
  auto driver = deps_.browser->open_page(options.viewport);
  if (!driver.ok()) {
    return common::Result<OpenedTerminal>::failure(driver.error());
  }

  auto pane = std::make_unique<Pane>();
  pane->id = next_pane_id();
  pane->label = options.label.empty() ? pane->id : options.label;
  pane->page = std::move(driver.value());
  auto terminal = std::make_unique<TerminalPane>(
      *pane->page, options_.artifact_dir / (pane->id + ".log"), options_.mode,
      actor::merge_delays(options_.mode, options_.delays), deps_.sleeper);
  TerminalPane *terminal_ptr = terminal.get();
  pane->content = TerminalPaneContent{std::move(terminal)};

  auto started = start_screencast(*pane);
  if (!started.ok()) {
    std::cerr << "[capture] " << pane->id << ": " << started.error() << "\n";
  }

  Pane &added = *panes_.emplace_back(std::move(pane));
  retile();
  auto rendered = terminal_ptr->render(added.label);
  if (!rendered.ok()) {
    return common::Result<OpenedTerminal>::failure(rendered.error());
  }
  if (!options.command.empty()) {
    auto spawned = terminal_ptr->start(options.command);
    if (!spawned.ok()) {
      return common::Result<OpenedTerminal>::failure(spawned.error());
    }
  }
  return common::Result<OpenedTerminal>::success(
      OpenedTerminal{added.id, terminal_ptr, added.page.get()});
}

common::Status Session::step(const std::string &caption, const StepFn &fn) {
  return tagged_step("", caption, fn);
}

common::Status Session::step(const std::string &caption, const std::string &narration,
                             const StepFn &fn) {
  return tagged_step("", caption, fn, narration);
}

common::Status Session::tagged_step(const std::string &tag, const std::string &caption,
                                    const StepFn &fn, const std::optional<std::string> &narration) {
  if (state_ != SessionState::Initialized && state_ != SessionState::Running) {
    return common::Status::error("step \"" + caption + "\" outside an active session");
  }
  state_ = SessionState::Running;

  const int index = ++step_index_;
  const std::int64_t start_ms = elapsed_ms();
  std::cout << "  [Step " << index << "] " << caption << "\n";

  common::Status status = common::Status::success();
  if (narration.has_value() && options_.mode == config::RunMode::Human && audio_->active()) {
    auto warmed = audio_->warmup(*narration);
    if (!warmed.ok()) {
      std::cerr << "[narration] warmup failed: " << warmed.error() << "\n";
    }
    auto speech = std::async(std::launch::async,
                             [this, text = *narration]() { return audio_->speak(text); });
    status = fn();
    auto spoken = speech.get();
    if (!spoken.ok()) {
      std::cerr << "[narration] " << spoken.error() << "\n";
    }
  } else {
    status = fn();
  }
  if (!status.ok()) {
    return status;
  }

  if (auto *first = first_actor(); first != nullptr) {
    first->breathe();
  }
  steps_.push_back(StepRecord{index, caption, start_ms, elapsed_ms(), tag});
  return common::Status::success();
}

common::Result<SessionResult> Session::run(const Scenario &scenario) {
  auto status = scenario(*this);
  if (!status.ok()) {
    std::cerr << "[session] scenario failed: " << status.error() << "\n";
    save_failure_screenshots();
  }
  auto finished = finish();
  if (!status.ok()) {
    return common::Result<SessionResult>::failure(status.error());
  }
  return finished;
}

common::Result<SessionResult> Session::finish() {
  if (state_ == SessionState::Finishing || state_ == SessionState::Finished) {
    return common::Result<SessionResult>::failure("session already finished");
  }
  if (state_ == SessionState::Created) {
    return common::Result<SessionResult>::failure("session not initialized");
  }
  state_ = SessionState::Finishing;

  const auto record_mode = effective_record_mode();
  if (record_mode != config::RecordMode::None && options_.mode == config::RunMode::Human) {
    sleep_ms(options_.tail.count());
  }
  const std::int64_t duration_ms = elapsed_ms();

  std::optional<std::filesystem::path> thumbnail;
  if (record_mode != config::RecordMode::None) {
    thumbnail = save_thumbnail();
  }

  std::vector<std::string> errors;
  stop_captures(errors);
  close_panes();

  SessionResult result;
  result.mode = options_.mode;
  result.record_mode = record_mode;
  result.artifact_dir = options_.artifact_dir;
  result.duration_ms = duration_ms;
  result.steps = steps_;
  result.video = produce_video(duration_ms);

  if (result.video.has_value()) {
    auto timing = check_video_timing(*deps_.probe, *result.video, duration_ms, options_.ci);
    if (!timing.ok()) {
      errors.push_back(timing.error());
    }
  }

  result.audio_events = audio_->events();
  std::error_code ec;
  if (!result.audio_events.empty() && result.video.has_value() &&
      std::filesystem::exists(*result.video, ec)) {
    result.video = narration::mix_audio_into_video(*deps_.runner, options_.ffmpeg_path,
                                                   *result.video, result.audio_events);
  }

  result.thumbnail = thumbnail;
  if (thumbnail.has_value() && result.video.has_value() &&
      std::filesystem::exists(*result.video, ec) && std::filesystem::exists(*thumbnail, ec)) {
    auto poster = compose::attach_poster_frame(*deps_.runner, options_.ffmpeg_path,
                                               *result.video, *thumbnail);
    if (!poster.ok()) {
      std::cerr << "[session] poster frame not embedded: " << poster.error() << "\n";
    }
  }

  result.subtitles = options_.artifact_dir / "captions.vtt";
  auto subtitles = common::write_file(result.subtitles, generate_webvtt(steps_));
  if (!subtitles.ok()) {
    errors.push_back(subtitles.error());
  } else {
    std::cout << "  Subtitles:  " << result.subtitles.string() << "\n";
  }

  RunMetadata metadata;
  metadata.mode = options_.mode;
  metadata.record_mode = record_mode;
  metadata.base_url = options_.base_url;
  metadata.duration_ms = duration_ms;
  metadata.steps = steps_;
  metadata.video = result.video;
  metadata.thumbnail = result.thumbnail;
  metadata.subtitles = result.subtitles;
  metadata.panes = panes();
  metadata.audio_events = result.audio_events;
  result.metadata = options_.artifact_dir / "run.json";
  auto written = common::write_file(result.metadata, render_metadata_json(metadata));
  if (!written.ok()) {
    errors.push_back(written.error());
  } else {
    std::cout << "  Metadata:   " << result.metadata.string() << "\n";
  }
  std::cout << "  Duration:   " << seconds_text(duration_ms) << "\n\n";

  for (auto &cleanup : cleanups_) {
    cleanup();
  }
  cleanups_.clear();
  state_ = SessionState::Finished;

  if (!errors.empty()) {
    return common::Result<SessionResult>::failure(join_errors(errors));
  }
  return common::Result<SessionResult>::success(std::move(result));
}

common::Result<actor::Actor *> Session::actor(const std::string &pane_id) {
  auto pane = find_pane(pane_id);
  if (!pane.ok()) {
    return common::Result<actor::Actor *>::failure(pane.error());
  }
  auto *content = std::get_if<BrowserPaneContent>(&pane.value()->content);
  if (content == nullptr) {
    return common::Result<actor::Actor *>::failure("pane " + pane_id + " is not a browser pane");
  }
  return common::Result<actor::Actor *>::success(content->actor.get());
}

common::Result<TerminalPane *> Session::terminal(const std::string &pane_id) {
  auto pane = find_pane(pane_id);
  if (!pane.ok()) {
    return common::Result<TerminalPane *>::failure(pane.error());
  }
  auto *content = std::get_if<TerminalPaneContent>(&pane.value()->content);
  if (content == nullptr) {
    return common::Result<TerminalPane *>::failure("pane " + pane_id + " is not a terminal pane");
  }
  return common::Result<TerminalPane *>::success(content->terminal.get());
}

common::Result<browser::IPageDriver *> Session::page(const std::string &pane_id) {
  auto pane = find_pane(pane_id);
  if (!pane.ok()) {
    return common::Result<browser::IPageDriver *>::failure(pane.error());
  }
  return common::Result<browser::IPageDriver *>::success(pane.value()->page.get());
}

common::Status Session::tile_windows(int tile_width, int tile_height, int left, int top) {
  if (placer_ == nullptr || !placer_->supported() || panes_.empty()) {
    return common::Status::success();
  }
  const int count = static_cast<int>(panes_.size());
  const auto bounds = browser::tile_horizontally(count, tile_width * count, tile_height, left, top);
  for (std::size_t i = 0; i < panes_.size() && i < bounds.size(); ++i) {
    auto placed = placer_->place(panes_[i]->page->target_id(), bounds[i]);
    if (!placed.ok()) {
      return placed;
    }
  }
  return common::Status::success();
}

std::optional<std::filesystem::path> Session::save_thumbnail() {
  const auto path = options_.artifact_dir / "thumbnail.png";
  for (const auto &pane : panes_) {
    if (pane->page == nullptr) {
      continue;
    }
    auto saved = pane->page->screenshot(path);
    if (saved.ok()) {
      // Lets the screencast pick up the frame the screenshot flushed.
      sleep_ms(THUMBNAIL_FLUSH_MS);
      return path;
    }
    std::cerr << "[session] thumbnail from " << pane->id << " failed: " << saved.error() << "\n";
  }
  return std::nullopt;
}

void Session::save_failure_screenshots() {
  for (const auto &pane : panes_) {
    if (pane->kind() != PaneKind::Browser) {
      continue;
    }
    const auto path = options_.artifact_dir / (pane->id + "-failure.png");
    auto saved = pane->page->screenshot(path);
    if (saved.ok()) {
      std::cout << "  Failure screenshot: " << path.string() << "\n";
    } else {
      std::cerr << "[session] screenshot of " << pane->id << " failed: " << saved.error() << "\n";
    }
  }
}

void Session::add_cleanup(std::function<void()> cleanup) { cleanups_.push_back(std::move(cleanup)); }

narration::IAudioDirector &Session::audio() {
  if (audio_ == nullptr) {
    audio_ = std::make_unique<narration::NoopAudioDirector>();
  }
  return *audio_;
}

std::vector<PaneSummary> Session::panes() const {
  std::vector<PaneSummary> out;
  out.reserve(panes_.size());
  for (const auto &pane : panes_) {
    out.push_back(PaneSummary{pane->id, pane->kind(), pane->label});
  }
  return out;
}

config::RecordMode Session::effective_record_mode() const {
  if (!options_.record) {
    return config::RecordMode::None;
  }
  if (options_.record_mode == config::RecordMode::Screen && !options_.headed) {
    return config::RecordMode::Screencast;
  }
  return options_.record_mode;
}

std::filesystem::path Session::video_path() const { return options_.artifact_dir / "run.mp4"; }

std::int64_t Session::elapsed_ms() const {
  if (state_ == SessionState::Created) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start_)
      .count();
}

common::Status Session::require_open(const char *operation) const {
  if (state_ == SessionState::Created) {
    return common::Status::error(std::string(operation) + ": session not initialized");
  }
  if (state_ == SessionState::Finishing || state_ == SessionState::Finished) {
    return common::Status::error(std::string(operation) + ": session already finished");
  }
  return common::Status::success();
}

common::Result<Pane *> Session::find_pane(const std::string &pane_id) {
  for (auto &pane : panes_) {
    if (pane->id == pane_id) {
      return common::Result<Pane *>::success(pane.get());
    }
  }
  return common::Result<Pane *>::failure("unknown pane id: " + pane_id);
}

actor::Actor *Session::first_actor() {
  for (auto &pane : panes_) {
    if (auto *content = std::get_if<BrowserPaneContent>(&pane->content); content != nullptr) {
      return content->actor.get();
    }
  }
  return nullptr;
}

std::string Session::next_pane_id() const { return "pane-" + std::to_string(panes_.size()); }

common::Status Session::start_screencast(Pane &pane) {
  if (effective_record_mode() != config::RecordMode::Screencast) {
    return common::Status::success();
  }
  const auto raw = options_.artifact_dir / (pane.id + ".raw.webm");
  const auto viewport = pane.page->viewport();
  browser::ScreencastOptions screencast;
  screencast.max_width = viewport.width;
  screencast.max_height = viewport.height;
  screencast.quality = SCREENCAST_QUALITY;
  pane.recorder = std::make_unique<capture::ScreencastRecorder>(*pane.page, raw,
                                                                options_.ffmpeg_path, screencast);
  auto started = pane.recorder->start();
  if (!started.ok()) {
    pane.recorder.reset();
    return started;
  }
  pane.raw_capture = raw;
  pane.capture_started_ms = elapsed_ms();
  return common::Status::success();
}

void Session::retile() {
  if (!options_.headed || panes_.empty()) {
    return;
  }
  const auto size = capture::try_parse_display_size(options_.display_size);
  const int screen_width = size.has_value() ? size->width : DEFAULT_SCREEN_WIDTH;
  const int screen_height = size.has_value() ? size->height : DEFAULT_SCREEN_HEIGHT;
  const int count = static_cast<int>(panes_.size());
  auto tiled = tile_windows(screen_width / count, screen_height);
  if (!tiled.ok()) {
    std::cerr << "[session] window tiling failed: " << tiled.error() << "\n";
  }
}

void Session::sleep_ms(std::int64_t ms) {
  if (ms <= 0) {
    return;
  }
  if (deps_.sleeper) {
    deps_.sleeper(std::chrono::milliseconds(ms));
  } else {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
}

void Session::stop_captures(std::vector<std::string> &errors) {
  for (auto &pane : panes_) {
    if (pane->recorder == nullptr) {
      continue;
    }
    auto stopped = pane->recorder->stop();
    if (!stopped.ok()) {
      std::cerr << "[capture] " << pane->id << ": " << stopped.error() << "\n";
    }
    pane->recorder.reset();
  }
  if (screen_capture_ != nullptr) {
    auto stopped = screen_capture_->stop();
    if (!stopped.ok()) {
      errors.push_back(stopped.error());
    }
  }
}

void Session::close_panes() {
  for (auto &pane : panes_) {
    if (auto *content = std::get_if<TerminalPaneContent>(&pane->content); content != nullptr) {
      content->terminal->detach();
    }
  }
  for (auto &pane : panes_) {
    pane->page->close();
  }
  if (browser_open_) {
    deps_.browser->close();
    browser_open_ = false;
  }
  for (auto &pane : panes_) {
    if (auto *content = std::get_if<TerminalPaneContent>(&pane->content); content != nullptr) {
      content->terminal->stop();
    }
  }
}

std::optional<std::filesystem::path> Session::produce_video(std::int64_t duration_ms) {
  std::error_code ec;
  switch (effective_record_mode()) {
  case config::RecordMode::None:
    return std::nullopt;
  case config::RecordMode::Screen:
    if (screen_capture_ != nullptr && std::filesystem::exists(screen_capture_->output(), ec)) {
      std::cout << "  Video saved: " << screen_capture_->output().string() << "\n";
      return screen_capture_->output();
    }
    return std::nullopt;
  case config::RecordMode::Screencast:
    break;
  }

  compose::ComposeOptions request;
  std::vector<std::int64_t> started_ms;
  for (const auto &pane : panes_) {
    if (pane->raw_capture.has_value() && std::filesystem::exists(*pane->raw_capture, ec)) {
      request.inputs.push_back(*pane->raw_capture);
      started_ms.push_back(pane->capture_started_ms);
    }
  }
  if (request.inputs.empty()) {
    return std::nullopt;
  }
  // The composite starts with the earliest capture; later panes are padded to their open time.
  const std::int64_t earliest_ms = *std::min_element(started_ms.begin(), started_ms.end());
  for (const auto started : started_ms) {
    request.start_offsets_ms.push_back(started - earliest_ms);
  }
  request.output = video_path();
  request.layout = options_.layout;
  request.target_duration_sec =
      static_cast<double>(std::max<std::int64_t>(0, duration_ms - earliest_ms)) / 1000.0;
  request.css_crop = options_.css_crop;
  request.css_viewport_width = options_.css_viewport_width;

  std::cout << "  Compositing " << request.inputs.size() << " pane(s)...\n";
  compose::Compositor compositor(*deps_.runner, *deps_.probe, options_.ffmpeg_path);
  auto composed = compositor.compose(request);
  if (!composed.ok()) {
    std::cerr << "[compose] " << composed.error() << "\n";
    return std::nullopt;
  }
  std::cout << "  Video saved: " << composed.value().string() << "\n";
  return composed.value();
}

} // namespace scenecast::session
