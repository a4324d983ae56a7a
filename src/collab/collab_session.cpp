#include "scenecast/collab/collab_session.hpp"

#include "scenecast/common/fs.hpp"
#include "scenecast/common/json_util.hpp"
#include "scenecast/session/subtitles.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <thread>

namespace scenecast::collab {

namespace {

constexpr int MIN_SCREEN_TILE_WIDTH = 520;
constexpr int MAX_SCREEN_VIEWPORT_WIDTH = 960;
constexpr int VIEWPORT_HEIGHT = 720;
constexpr int DEFAULT_DISPLAY_WIDTH = 2560;
constexpr int DEFAULT_DISPLAY_HEIGHT = 720;
constexpr int HASH_POLL_MS = 100;
constexpr int REVIEWER_SETTLE_MS = 300;

int round_even(double value) { return static_cast<int>(std::floor(value / 2.0 + 0.5)) * 2; }

std::string form_encode(const std::string &value) {
  static const char *HEX = "0123456789ABCDEF";
  std::string out;
  for (const char ch : value) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) != 0 || ch == '*' || ch == '-' || ch == '.' || ch == '_') {
      out.push_back(ch);
    } else if (ch == ' ') {
      out.push_back('+');
    } else {
      out.push_back('%');
      out.push_back(HEX[c >> 4]);
      out.push_back(HEX[c & 0x0F]);
    }
  }
  return out;
}

std::string bounding_box_script(const std::string &selector) {
  return "(() => { const el = document.querySelector(" + browser::js_string_literal(selector) +
         "); if (!el) return 'null'; const r = el.getBoundingClientRect();"
         " return JSON.stringify({x: r.x, y: r.y, width: r.width, height: r.height}); })()";
}

} // namespace

ActorPair default_actor_pair() {
  return {CollabActorSpec{"boss", "Boss", "/notes?role=boss"},
          CollabActorSpec{"worker", "Worker", "/notes?role=worker"}};
}

common::Status validate_actor_pair(const ActorPair &actors) {
  if (actors[0].id.empty() || actors[1].id.empty()) {
    return common::Status::error("collaboration requires exactly 2 actors with stable ids");
  }
  if (actors[0].id == actors[1].id) {
    return common::Status::error("collaboration requires 2 distinct actor ids (got \"" +
                                 actors[0].id + "\")");
  }
  if (actors[0].id == BOTH_ROLE || actors[1].id == BOTH_ROLE) {
    return common::Status::error("actor id \"both\" is reserved");
  }
  return common::Status::success();
}

config::RecordMode resolve_collab_record_mode(std::optional<config::RecordMode> requested,
                                              bool headless, capture::Platform platform,
                                              const std::string &display) {
  const config::RecordMode automatic =
      !headless && platform == capture::Platform::Linux && !display.empty()
          ? config::RecordMode::Screen
          : config::RecordMode::Screencast;
  const config::RecordMode mode = requested.value_or(automatic);
  if (headless && mode == config::RecordMode::Screen) {
    return config::RecordMode::Screencast;
  }
  return mode;
}

CollabGeometry collab_geometry(config::RecordMode record_mode, const std::string &display_size) {
  CollabGeometry geometry;
  if (record_mode != config::RecordMode::Screen) {
    return geometry;
  }
  const auto size = capture::try_parse_display_size(display_size)
                        .value_or(capture::VideoSize{DEFAULT_DISPLAY_WIDTH, DEFAULT_DISPLAY_HEIGHT});
  geometry.tile_width = std::max(MIN_SCREEN_TILE_WIDTH, size.width / 3);
  geometry.tile_height = size.height;
  geometry.viewport = {std::min(MAX_SCREEN_VIEWPORT_WIDTH, geometry.tile_width), VIEWPORT_HEIGHT};
  return geometry;
}

capture::CropRect compute_capture_crop(const browser::Box &box, int padding, int viewport_width,
                                       int viewport_height) {
  const int css_x = round_even(std::max(0.0, std::floor(box.x - padding)));
  const int css_w = round_even(std::min(static_cast<double>(viewport_width - css_x),
                                        std::ceil(box.width + padding * 2.0)));
  return capture::CropRect{css_x, 0, css_w, viewport_height};
}

std::string with_query_param(const std::string &url, const std::string &key,
                             const std::string &value) {
  const auto hash = url.find('#');
  const std::string base = hash == std::string::npos ? url : url.substr(0, hash);
  const std::string fragment = hash == std::string::npos ? "" : url.substr(hash);
  const char separator = base.find('?') == std::string::npos ? '?' : '&';
  return base + separator + form_encode(key) + "=" + form_encode(value) + fragment;
}

std::string with_fragment(const std::string &url, const std::string &hash) {
  const std::string base = url.substr(0, url.find('#'));
  if (hash.empty() || hash == "#") {
    return base;
  }
  return base + (hash.front() == '#' ? hash : "#" + hash);
}

CollabSession::CollabSession(CollabOptions options, CollabDeps deps)
    : options_(std::move(options)), deps_(std::move(deps)) {}

CollabSession::~CollabSession() {
  stop_relay();
  stop_reviewer();
}

common::Result<CollabResult> CollabSession::run(const Scenario &scenario) {
  auto ready = setup();
  if (!ready.ok()) {
    std::cerr << "[collab] setup failed: " << ready.error() << "\n";
    stop_relay();
    stop_reviewer();
    session_.reset();
    return common::Result<CollabResult>::failure(ready.error());
  }

  auto status = scenario(*this);
  if (!status.ok()) {
    std::cerr << "[collab] scenario failed: " << status.error() << "\n";
    save_failure_screenshots();
    return finish(status.error());
  }
  return finish(std::nullopt);
}

common::Status CollabSession::step(const std::string &role, const std::string &caption,
                                   const session::Session::StepFn &fn) {
  if (role != options_.actors[0].id && role != options_.actors[1].id && role != BOTH_ROLE) {
    return common::Status::error("unknown role: " + role);
  }
  if (session_ == nullptr) {
    return common::Status::error("collaboration session is not running");
  }
  return session_->tagged_step(role, caption, fn);
}

common::Result<actor::Actor *> CollabSession::actor(const std::string &actor_id) {
  auto index = actor_index(actor_id);
  if (!index.ok()) {
    return common::Result<actor::Actor *>::failure(index.error());
  }
  return session_->actor(pane_ids_[index.value()]);
}

common::Result<browser::IPageDriver *> CollabSession::page(const std::string &actor_id) {
  auto index = actor_index(actor_id);
  if (!index.ok()) {
    return common::Result<browser::IPageDriver *>::failure(index.error());
  }
  return session_->page(pane_ids_[index.value()]);
}

common::Status CollabSession::reviewer_command(const std::string &command) {
  if (reviewer_ == nullptr) {
    return common::Status::error("reviewer process is not running");
  }
  return reviewer_->send(command);
}

narration::IAudioDirector &CollabSession::audio() {
  if (session_ == nullptr) {
    static narration::NoopAudioDirector silent;
    return silent;
  }
  return session_->audio();
}

std::string CollabSession::ws_url() const { return relay_ == nullptr ? "" : relay_->ws_url(); }

common::Status CollabSession::setup() {
  auto valid = validate_actor_pair(options_.actors);
  if (!valid.ok()) {
    return valid;
  }

  const bool requested_headless = !options_.session.headed;
  record_mode_ = options_.session.record
                     ? resolve_collab_record_mode(options_.record_mode, requested_headless,
                                                  options_.platform, options_.session.display)
                     : config::RecordMode::None;
  geometry_ = collab_geometry(record_mode_, options_.session.display_size);

  auto relay = start_relay();
  if (!relay.ok()) {
    return relay;
  }

  session::SessionOptions session_options = options_.session;
  session_options.record = record_mode_ != config::RecordMode::None;
  if (session_options.record) {
    session_options.record_mode = record_mode_;
  }
  session_options.headed = options_.session.headed || record_mode_ == config::RecordMode::Screen;
  session_options.base_url = options_.base_url;
  session_options.css_crop.reset();
  session_options.css_viewport_width = geometry_.viewport.width;
  session_ = std::make_unique<session::Session>(std::move(session_options), deps_.session);

  auto initialized = session_->init();
  if (!initialized.ok()) {
    return initialized;
  }
  std::cout << "  Base URL:  " << (options_.base_url.empty() ? "(external)" : options_.base_url)
            << "\n";
  std::cout << "  Layout:    tiles (" << options_.actors[0].name << " | "
            << options_.actors[1].name << " | Reviewer)\n\n";

  for (std::size_t i = 0; i < options_.actors.size(); ++i) {
    session::PageOptions page_options;
    page_options.label = options_.actors[i].name;
    page_options.viewport = geometry_.viewport;
    auto opened = session_->open_page(page_options);
    if (!opened.ok()) {
      return common::Status::error(options_.actors[i].id + ": " + opened.error());
    }
    pane_ids_[i] = opened.value().pane_id;
  }
  auto tiled = session_->tile_windows(geometry_.tile_width, geometry_.tile_height);
  if (!tiled.ok()) {
    std::cerr << "[collab] window tiling failed: " << tiled.error() << "\n";
  }

  if (!options_.base_url.empty()) {
    auto bootstrapped = bootstrap_document();
    if (!bootstrapped.ok()) {
      return bootstrapped;
    }
  }
  measure_crop();
  return common::Status::success();
}

common::Status CollabSession::start_relay() {
  if (!options_.ws_url.empty()) {
    relay_ = std::make_unique<ExternalRelay>(options_.ws_url);
    return common::Status::success();
  }
  if (deps_.relay) {
    auto created = deps_.relay();
    if (!created.ok()) {
      return common::Status::error(created.error());
    }
    relay_ = std::move(created.value());
    return common::Status::success();
  }
  RelayCommand command = options_.relay;
  if (command.data_dir.empty()) {
    command.data_dir = options_.session.artifact_dir / "sync-data";
  }
  auto relay = std::make_unique<CommandRelay>(std::move(command));
  auto started = relay->start();
  if (!started.ok()) {
    return started;
  }
  relay_ = std::move(relay);
  return common::Status::success();
}

common::Status CollabSession::bootstrap_document() {
  const auto &first = options_.actors[0];
  const auto &second = options_.actors[1];
  auto first_actor = session_->actor(pane_ids_[0]);
  auto second_actor = session_->actor(pane_ids_[1]);
  if (!first_actor.ok() || !second_actor.ok()) {
    return common::Status::error("collaboration panes are missing their actors");
  }
  const std::string relay_url = ws_url();

  std::string first_url = options_.base_url + first.path;
  if (!relay_url.empty()) {
    first_url = with_query_param(first_url, "ws", relay_url);
  }
  auto opened = first_actor.value()->goto_url(first_url);
  if (!opened.ok()) {
    return common::Status::error(first.id + ": " + opened.error());
  }

  auto hash = wait_for_doc_hash(first_actor.value()->page());
  if (!hash.ok()) {
    return common::Status::error(first.id + ": " + hash.error());
  }
  std::cout << "  " << first.name << " doc hash: " << hash.value() << "\n";

  if (!options_.reviewer_command.empty()) {
    const std::string doc_url =
        hash.value().front() == '#' ? hash.value().substr(1) : hash.value();
    auto reviewer = start_reviewer(doc_url);
    if (!reviewer.ok()) {
      return reviewer;
    }
  }

  std::string second_url = options_.base_url + second.path;
  if (!relay_url.empty()) {
    second_url = with_query_param(second_url, "ws", relay_url);
  }
  second_url = with_fragment(second_url, hash.value());
  auto joined = second_actor.value()->goto_url(second_url);
  if (!joined.ok()) {
    return common::Status::error(second.id + ": " + joined.error());
  }

  sleep_ms(options_.sync_settle.count());
  for (auto *actor : {first_actor.value(), second_actor.value()}) {
    auto injected = actor->inject_cursor();
    if (!injected.ok()) {
      return injected;
    }
  }
  return common::Status::success();
}

common::Result<std::string> CollabSession::wait_for_doc_hash(browser::IPageDriver &page) {
  const auto attempts = std::max<std::int64_t>(1, options_.doc_hash_timeout.count() / HASH_POLL_MS);
  std::string last_error;
  for (std::int64_t i = 0; i < attempts; ++i) {
    auto hash = page.evaluate("document.location.hash");
    if (hash.ok() && hash.value().size() > 1) {
      return hash;
    }
    if (!hash.ok()) {
      last_error = hash.error();
    }
    sleep_ms(HASH_POLL_MS);
  }
  std::string message = "no document hash after " +
                        std::to_string(options_.doc_hash_timeout.count()) + "ms";
  if (!last_error.empty()) {
    message += " (" + last_error + ")";
  }
  return common::Result<std::string>::failure(message);
}

common::Status CollabSession::start_reviewer(const std::string &doc_url) {
  ReviewerLaunch launch;
  launch.command = options_.reviewer_command;
  launch.args = options_.reviewer_args;
  launch.ws_url = ws_url();
  launch.doc_url = doc_url;
  launch.log_path = options_.session.artifact_dir / "reviewer.log";

  if (deps_.reviewer) {
    auto created = deps_.reviewer(launch);
    if (!created.ok()) {
      return common::Status::error(created.error());
    }
    reviewer_ = std::move(created.value());
  } else {
    auto process = std::make_unique<ReviewerProcess>(std::move(launch));
    auto started = process->start();
    if (!started.ok()) {
      return started;
    }
    reviewer_ = std::move(process);
  }
  sleep_ms(REVIEWER_SETTLE_MS);
  return common::Status::success();
}

void CollabSession::measure_crop() {
  if (record_mode_ != config::RecordMode::Screencast || options_.capture_selector.empty()) {
    return;
  }
  auto page = session_->page(pane_ids_[0]);
  if (!page.ok()) {
    return;
  }
  auto measured = page.value()->evaluate(bounding_box_script(options_.capture_selector));
  if (!measured.ok() || measured.value() == "null") {
    std::cerr << "[collab] warning: capture selector \"" << options_.capture_selector
              << "\" not found, recording full viewport\n";
    return;
  }
  browser::Box box;
  const std::string x = common::json_get_number(measured.value(), "x");
  const std::string width = common::json_get_number(measured.value(), "width");
  if (x.empty() || width.empty()) {
    std::cerr << "[collab] warning: unreadable bounds for \"" << options_.capture_selector
              << "\"\n";
    return;
  }
  box.x = std::strtod(x.c_str(), nullptr);
  box.width = std::strtod(width.c_str(), nullptr);

  const auto crop = compute_capture_crop(box, options_.capture_padding, geometry_.viewport.width,
                                         geometry_.viewport.height);
  session_->set_capture_crop(crop);
  std::cout << "  Capture crop (CSS): " << crop.w << "x" << crop.h << " @ (" << crop.x << ",0)  ["
            << options_.capture_selector << "]\n";
}

common::Result<std::size_t> CollabSession::actor_index(const std::string &actor_id) const {
  if (session_ == nullptr) {
    return common::Result<std::size_t>::failure("collaboration session is not running");
  }
  for (std::size_t i = 0; i < options_.actors.size(); ++i) {
    if (options_.actors[i].id == actor_id) {
      return common::Result<std::size_t>::success(i);
    }
  }
  return common::Result<std::size_t>::failure("unknown actor id: " + actor_id);
}

void CollabSession::save_failure_screenshots() {
  if (session_ == nullptr) {
    return;
  }
  for (std::size_t i = 0; i < options_.actors.size(); ++i) {
    auto page = session_->page(pane_ids_[i]);
    if (!page.ok()) {
      continue;
    }
    const auto path = options_.session.artifact_dir / (options_.actors[i].id + "-failure.png");
    auto saved = page.value()->screenshot(path);
    if (!saved.ok()) {
      std::cerr << "[collab] screenshot of " << options_.actors[i].id
                << " failed: " << saved.error() << "\n";
    }
  }
  std::cout << "  Failure screenshots saved.\n";
}

void CollabSession::stop_relay() {
  if (relay_ == nullptr) {
    return;
  }
  auto stopped = relay_->stop();
  if (!stopped.ok()) {
    std::cerr << "[collab] relay stop: " << stopped.error() << "\n";
  }
  relay_.reset();
}

void CollabSession::stop_reviewer() {
  if (reviewer_ != nullptr) {
    reviewer_->stop();
    reviewer_.reset();
  }
}

common::Result<CollabResult> CollabSession::finish(std::optional<std::string> scenario_error) {
  stop_relay();
  stop_reviewer();
  auto finished = session_->finish();

  CollabResult result;
  if (finished.ok()) {
    result.session = std::move(finished.value());
  }
  const auto &steps = session_->steps();
  for (std::size_t i = 0; i < options_.actors.size(); ++i) {
    const auto &id = options_.actors[i].id;
    std::vector<session::StepRecord> own;
    std::copy_if(steps.begin(), steps.end(), std::back_inserter(own),
                 [&](const session::StepRecord &s) { return s.tag == id || s.tag == BOTH_ROLE; });
    result.actor_subtitles[i] = options_.session.artifact_dir / (id + "-captions.vtt");
    auto written = common::write_file(result.actor_subtitles[i], session::generate_webvtt(own));
    if (!written.ok()) {
      std::cerr << "[collab] " << written.error() << "\n";
    } else {
      std::cout << "  " << options_.actors[i].name
                << " subs:  " << result.actor_subtitles[i].string() << "\n";
    }
  }

  result.sync = audit_sync(steps, options_.actors[0].id, options_.actors[1].id);
  if (!result.sync.measurements.empty()) {
    std::cout << "\n  Sync check:\n";
    const auto lines =
        format_sync_report(result.sync, options_.actors[0].name, options_.actors[1].name);
    for (std::size_t i = 0; i < lines.size(); ++i) {
      std::cout << (i < result.sync.measurements.size() ? "    " : "  ") << lines[i] << "\n";
    }
  }

  if (scenario_error.has_value()) {
    return common::Result<CollabResult>::failure(*scenario_error);
  }
  if (!finished.ok()) {
    return common::Result<CollabResult>::failure(finished.error());
  }
  return common::Result<CollabResult>::success(std::move(result));
}

void CollabSession::sleep_ms(std::int64_t ms) {
  if (ms <= 0) {
    return;
  }
  if (deps_.session.sleeper) {
    deps_.session.sleeper(std::chrono::milliseconds(ms));
  } else {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
}

} // namespace scenecast::collab
