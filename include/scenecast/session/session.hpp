#pragma once

#include "scenecast/actor/actor.hpp"
#include "scenecast/actor/delays.hpp"
#include "scenecast/browser/browser.hpp"
#include "scenecast/browser/page_driver.hpp"
#include "scenecast/capture/probe.hpp"
#include "scenecast/capture/screen.hpp"
#include "scenecast/capture/screencast.hpp"
#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"
#include "scenecast/compose/layout.hpp"
#include "scenecast/config/config.hpp"
#include "scenecast/narration/director.hpp"
#include "scenecast/net/http_client.hpp"
#include "scenecast/session/terminal.hpp"
#include "scenecast/session/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scenecast::session {

struct SessionOptions {
  config::RunMode mode = config::RunMode::Human;
  bool record = true;
  config::RecordMode record_mode = config::RecordMode::Screencast;
  bool headed = true;
  compose::LayoutSpec layout;
  std::string ffmpeg_path = "ffmpeg";
  std::filesystem::path artifact_dir = "artifacts";
  std::chrono::milliseconds tail{300};
  actor::DelayOverrides delays;
  std::uint32_t actor_seed = 0x5CA57u;
  bool ci = false;

  // Whole-display capture and window tiling.
  std::string display;
  std::string display_size;
  std::optional<int> screen_index;
  int capture_fps = 30;

  // Recorded in run.json when set.
  std::string base_url;
  // Applied to every stream at composition time, in CSS pixels.
  std::optional<capture::CropRect> css_crop;
  int css_viewport_width = 1280;
};

/// Maps the loaded configuration onto session options. headed defaults to human mode.
[[nodiscard]] common::Result<SessionOptions> session_options_from_config(const config::Config &config);

/// Chrome host configured from `[browser]`, headless unless `headed`.
[[nodiscard]] std::shared_ptr<browser::IBrowserHost>
make_browser_host(const config::Config &config, bool headed,
                  std::shared_ptr<net::HttpClient> http);

using AudioDirectorFactory = std::function<std::unique_ptr<narration::IAudioDirector>(
    std::chrono::steady_clock::time_point video_start)>;

struct SessionDeps {
  std::shared_ptr<browser::IBrowserHost> browser;
  std::shared_ptr<common::IProcessRunner> runner;
  std::shared_ptr<capture::IMediaProbe> probe;
  // Called once at init. Narration is silent when unset.
  AudioDirectorFactory audio;
  actor::Sleeper sleeper;
};

enum class SessionState { Created, Initialized, Running, Finishing, Finished };

struct PageOptions {
  std::string url;
  // Used when url is empty.
  std::string html;
  std::string label;
  browser::Viewport viewport{1280, 720};
};

struct TerminalOptions {
  // Without a command the pane only shows its title.
  std::string command;
  std::string label;
  browser::Viewport viewport{800, 600};
};

struct OpenedPage {
  std::string pane_id;
  actor::Actor *actor = nullptr;
  browser::IPageDriver *page = nullptr;
};

struct OpenedTerminal {
  std::string pane_id;
  TerminalPane *terminal = nullptr;
  browser::IPageDriver *page = nullptr;
};

struct BrowserPaneContent {
  std::unique_ptr<actor::Actor> actor;
};

struct TerminalPaneContent {
  std::unique_ptr<TerminalPane> terminal;
};

using PaneContent = std::variant<BrowserPaneContent, TerminalPaneContent>;

// Members are destroyed bottom-up, so the actor and recorder go before their page.
struct Pane {
  std::string id;
  std::string label;
  std::unique_ptr<browser::IPageDriver> page;
  std::optional<std::filesystem::path> raw_capture;
  // Session clock when the raw capture started.
  std::int64_t capture_started_ms = 0;
  std::unique_ptr<capture::ScreencastRecorder> recorder;
  PaneContent content;

  [[nodiscard]] PaneKind kind() const {
    return std::holds_alternative<BrowserPaneContent>(content) ? PaneKind::Browser
                                                               : PaneKind::Terminal;
  }
};

class Session {
public:
  using StepFn = std::function<common::Status()>;
  using Scenario = std::function<common::Status(Session &)>;

  Session(SessionOptions options, SessionDeps deps);
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /// Launches the browser and starts the recording clock.
  [[nodiscard]] common::Status init();

  [[nodiscard]] common::Result<OpenedPage> open_page(const PageOptions &options = {});
  [[nodiscard]] common::Result<OpenedTerminal> open_terminal(const TerminalOptions &options = {});

  /// Records a numbered step around `fn`. A failing fn leaves no record behind.
  [[nodiscard]] common::Status step(const std::string &caption, const StepFn &fn);
  /// Same, speaking `narration` while fn runs (human mode only).
  [[nodiscard]] common::Status step(const std::string &caption, const std::string &narration,
                                    const StepFn &fn);
  /// Step whose record carries `tag` (a pane id or a role).
  [[nodiscard]] common::Status tagged_step(const std::string &tag, const std::string &caption,
                                           const StepFn &fn,
                                           const std::optional<std::string> &narration = std::nullopt);

  /// Runs the scenario, saving failure screenshots if it fails, and always finishes.
  /// The scenario's error wins over a finish error.
  [[nodiscard]] common::Result<SessionResult> run(const Scenario &scenario);
  [[nodiscard]] common::Result<SessionResult> finish();

  [[nodiscard]] common::Result<actor::Actor *> actor(const std::string &pane_id);
  [[nodiscard]] common::Result<TerminalPane *> terminal(const std::string &pane_id);
  [[nodiscard]] common::Result<browser::IPageDriver *> page(const std::string &pane_id);

  /// Tiles headed browser windows left to right. No-op when headless.
  [[nodiscard]] common::Status tile_windows(int tile_width, int tile_height, int left = 0,
                                            int top = 0);
  void save_failure_screenshots();
  // Screenshot of the first pane that answers, as artifact_dir/thumbnail.png.
  [[nodiscard]] std::optional<std::filesystem::path> save_thumbnail();
  /// Runs after the artifacts are written, in registration order.
  void add_cleanup(std::function<void()> cleanup);
  /// Crop applied to every stream when the captures are composed.
  void set_capture_crop(std::optional<capture::CropRect> css_crop) {
    options_.css_crop = css_crop;
  }

  [[nodiscard]] narration::IAudioDirector &audio();
  [[nodiscard]] const std::vector<StepRecord> &steps() const { return steps_; }
  [[nodiscard]] std::vector<PaneSummary> panes() const;
  [[nodiscard]] SessionState state() const { return state_; }
  [[nodiscard]] const SessionOptions &options() const { return options_; }
  [[nodiscard]] config::RecordMode effective_record_mode() const;
  [[nodiscard]] std::filesystem::path video_path() const;
  /// Milliseconds since init().
  [[nodiscard]] std::int64_t elapsed_ms() const;

private:
  [[nodiscard]] common::Status require_open(const char *operation) const;
  [[nodiscard]] common::Result<Pane *> find_pane(const std::string &pane_id);
  [[nodiscard]] actor::Actor *first_actor();
  [[nodiscard]] std::string next_pane_id() const;
  [[nodiscard]] common::Status start_screencast(Pane &pane);
  void retile();
  void sleep_ms(std::int64_t ms);

  void stop_captures(std::vector<std::string> &errors);
  void close_panes();
  [[nodiscard]] std::optional<std::filesystem::path> produce_video(std::int64_t duration_ms);

  SessionOptions options_;
  SessionDeps deps_;
  SessionState state_ = SessionState::Created;
  std::chrono::steady_clock::time_point start_;
  std::vector<std::unique_ptr<Pane>> panes_;
  std::vector<StepRecord> steps_;
  int step_index_ = 0;
  std::unique_ptr<narration::IAudioDirector> audio_;
  std::unique_ptr<browser::IWindowPlacer> placer_;
  std::unique_ptr<capture::ScreenCapture> screen_capture_;
  std::vector<std::function<void()>> cleanups_;
  bool browser_open_ = false;
};

} // namespace scenecast::session
