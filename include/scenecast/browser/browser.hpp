#pragma once

#include "scenecast/browser/cdp.hpp"
#include "scenecast/browser/chrome.hpp"
#include "scenecast/browser/page_driver.hpp"
#include "scenecast/browser/window_layout.hpp"
#include "scenecast/common/result.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace scenecast::browser {

/// Source of isolated pages. A host is owned by exactly one session.
class IBrowserHost {
public:
  virtual ~IBrowserHost() = default;
  [[nodiscard]] virtual common::Status launch() = 0;
  /// Each page lives in its own browser context.
  [[nodiscard]] virtual common::Result<std::unique_ptr<IPageDriver>>
  open_page(const Viewport &viewport) = 0;
  [[nodiscard]] virtual std::unique_ptr<IWindowPlacer> window_placer() = 0;
  virtual void close() = 0;
};

class CdpPage final : public IPageDriver {
public:
  CdpPage(CDPClient &client, std::string context_id, std::string target_id,
          std::string session_id, Viewport viewport);
  ~CdpPage() override;

  CdpPage(const CdpPage &) = delete;
  CdpPage &operator=(const CdpPage &) = delete;

  [[nodiscard]] common::Status initialize();

  [[nodiscard]] common::Status navigate(const std::string &url,
                                        std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Status set_content(const std::string &html) override;
  [[nodiscard]] common::Result<std::string> evaluate(const std::string &expression) override;
  [[nodiscard]] common::Result<Box> wait_for_visible(const std::string &selector,
                                                     std::chrono::milliseconds timeout) override;

  [[nodiscard]] common::Status mouse_move(double x, double y) override;
  [[nodiscard]] common::Status mouse_down() override;
  [[nodiscard]] common::Status mouse_up() override;
  [[nodiscard]] common::Status press_key(const std::string &key) override;
  [[nodiscard]] common::Status type_character(const std::string &character) override;
  [[nodiscard]] common::Status insert_text(const std::string &text) override;

  [[nodiscard]] common::Status add_init_script(const std::string &source) override;
  [[nodiscard]] common::Status screenshot(const std::filesystem::path &path) override;
  [[nodiscard]] common::Status start_screencast(const ScreencastOptions &options,
                                                FrameHandler handler) override;
  [[nodiscard]] common::Status stop_screencast() override;

  [[nodiscard]] Viewport viewport() const override { return viewport_; }
  [[nodiscard]] std::string target_id() const override { return target_id_; }
  void close() override;

private:
  [[nodiscard]] common::Result<JsonMap> command(const std::string &method,
                                                const JsonMap &params = {});
  [[nodiscard]] common::Status dispatch_mouse(const std::string &type);

  CDPClient &client_;
  std::string context_id_;
  std::string target_id_;
  std::string session_id_;
  Viewport viewport_;
  double mouse_x_ = 0.0;
  double mouse_y_ = 0.0;
  bool mouse_pressed_ = false;
  int screencast_listener_ = 0;
  std::mutex screencast_mutex_;
  FrameHandler screencast_handler_;
  bool closed_ = false;
};

struct ChromeHostOptions {
  ChromeLaunchOptions launch;
  /// Connect to an already running browser instead of launching one.
  std::string existing_ws_url;
};

class ChromeBrowserHost final : public IBrowserHost {
public:
  ChromeBrowserHost(ChromeHostOptions options, std::shared_ptr<net::HttpClient> http);
  ~ChromeBrowserHost() override;

  [[nodiscard]] common::Status launch() override;
  [[nodiscard]] common::Result<std::unique_ptr<IPageDriver>>
  open_page(const Viewport &viewport) override;
  [[nodiscard]] std::unique_ptr<IWindowPlacer> window_placer() override;
  void close() override;

private:
  ChromeHostOptions options_;
  ChromeProcess process_;
  std::unique_ptr<CDPClient> client_;
};

} // namespace scenecast::browser
