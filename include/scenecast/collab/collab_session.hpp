#pragma once

#include "scenecast/actor/actor.hpp"
#include "scenecast/browser/page_driver.hpp"
#include "scenecast/capture/probe.hpp"
#include "scenecast/capture/screen.hpp"
#include "scenecast/collab/relay.hpp"
#include "scenecast/collab/reviewer.hpp"
#include "scenecast/collab/sync_audit.hpp"
#include "scenecast/common/result.hpp"
#include "scenecast/config/config.hpp"
#include "scenecast/session/session.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::collab {

inline constexpr const char *BOTH_ROLE = "both";

struct CollabActorSpec {
  // Stable id used as the step role and in artifact names.
  std::string id;
  std::string name;
  // Appended to the base URL.
  std::string path = "/";
};

using ActorPair = std::array<CollabActorSpec, 2>;

[[nodiscard]] ActorPair default_actor_pair();
[[nodiscard]] common::Status validate_actor_pair(const ActorPair &actors);

/// Auto selection prefers one whole-display capture on a headed Linux desktop.
[[nodiscard]] config::RecordMode resolve_collab_record_mode(
    std::optional<config::RecordMode> requested, bool headless, capture::Platform platform,
    const std::string &display);

struct CollabGeometry {
  int tile_width = 960;
  int tile_height = 800;
  browser::Viewport viewport{1280, 720};
};

[[nodiscard]] CollabGeometry collab_geometry(config::RecordMode record_mode,
                                             const std::string &display_size);

/// Full-height column around `box`, widened by `padding`, even-aligned, in CSS pixels.
[[nodiscard]] capture::CropRect compute_capture_crop(const browser::Box &box, int padding,
                                                     int viewport_width, int viewport_height);

/// Appends `key=value` to the query string, ahead of any fragment.
[[nodiscard]] std::string with_query_param(const std::string &url, const std::string &key,
                                           const std::string &value);
/// Replaces the fragment. `hash` may start with '#'.
[[nodiscard]] std::string with_fragment(const std::string &url, const std::string &hash);

struct CollabOptions {
  // mode, headed, ffmpeg path, artifact dir, delays and capture settings.
  session::SessionOptions session;
  std::string base_url;
  ActorPair actors = default_actor_pair();
  // nullopt selects automatically.
  std::optional<config::RecordMode> record_mode;
  std::string capture_selector;
  int capture_padding = 16;

  // An existing relay; when empty `relay` is started.
  std::string ws_url;
  RelayCommand relay;
  // Reviewer command; no reviewer when empty.
  std::string reviewer_command;
  std::vector<std::string> reviewer_args;

  std::chrono::milliseconds doc_hash_timeout{10000};
  std::chrono::milliseconds sync_settle{800};
  capture::Platform platform = capture::current_platform();
};

using RelayFactory = std::function<common::Result<std::unique_ptr<IDocumentRelay>>()>;
using ReviewerFactory =
    std::function<common::Result<std::unique_ptr<IReviewer>>(const ReviewerLaunch &launch)>;

struct CollabDeps {
  session::SessionDeps session;
  // Default to CommandRelay and ReviewerProcess.
  RelayFactory relay;
  ReviewerFactory reviewer;
};

struct CollabResult {
  session::SessionResult session;
  std::array<std::filesystem::path, 2> actor_subtitles;
  SyncReport sync;
};

/// Two actors editing one shared document, plus an optional command-line reviewer.
class CollabSession {
public:
  using Scenario = std::function<common::Status(CollabSession &)>;

  CollabSession(CollabOptions options, CollabDeps deps);
  ~CollabSession();

  CollabSession(const CollabSession &) = delete;
  CollabSession &operator=(const CollabSession &) = delete;

  /// Sets up both pages, runs the scenario and produces every artifact. A failing
  /// scenario saves screenshots, then the relay, reviewer and session are torn down.
  [[nodiscard]] common::Result<CollabResult> run(const Scenario &scenario);

  /// `role` is one of the actor ids or BOTH_ROLE.
  [[nodiscard]] common::Status step(const std::string &role, const std::string &caption,
                                    const session::Session::StepFn &fn);
  [[nodiscard]] common::Result<actor::Actor *> actor(const std::string &actor_id);
  [[nodiscard]] common::Result<browser::IPageDriver *> page(const std::string &actor_id);
  [[nodiscard]] common::Status reviewer_command(const std::string &command);
  [[nodiscard]] narration::IAudioDirector &audio();

  [[nodiscard]] const ActorPair &actors() const { return options_.actors; }
  [[nodiscard]] const std::string &base_url() const { return options_.base_url; }
  [[nodiscard]] config::RecordMode record_mode() const { return record_mode_; }
  [[nodiscard]] const CollabGeometry &geometry() const { return geometry_; }
  [[nodiscard]] std::string ws_url() const;

private:
  [[nodiscard]] common::Status setup();
  [[nodiscard]] common::Status start_relay();
  [[nodiscard]] common::Status bootstrap_document();
  [[nodiscard]] common::Result<std::string> wait_for_doc_hash(browser::IPageDriver &page);
  [[nodiscard]] common::Status start_reviewer(const std::string &doc_url);
  void measure_crop();
  [[nodiscard]] common::Result<std::size_t> actor_index(const std::string &actor_id) const;
  void save_failure_screenshots();
  void stop_relay();
  void stop_reviewer();
  [[nodiscard]] common::Result<CollabResult> finish(std::optional<std::string> scenario_error);
  void sleep_ms(std::int64_t ms);

  CollabOptions options_;
  CollabDeps deps_;
  config::RecordMode record_mode_ = config::RecordMode::Screencast;
  CollabGeometry geometry_;
  std::unique_ptr<IDocumentRelay> relay_;
  std::unique_ptr<IReviewer> reviewer_;
  std::unique_ptr<session::Session> session_;
  std::array<std::string, 2> pane_ids_;
};

} // namespace scenecast::collab
