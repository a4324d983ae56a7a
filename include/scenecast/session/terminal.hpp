#pragma once

#include "scenecast/actor/actor.hpp"
#include "scenecast/actor/delays.hpp"
#include "scenecast/browser/page_driver.hpp"
#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"
#include "scenecast/config/config.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace scenecast::session {

/// Static page that renders terminal output. Exposes window.__sc_appendOutput(text),
/// window.__sc_typeEcho(text) and window.__sc_setTitle(text).
[[nodiscard]] const std::string &terminal_page_html();

/// A shell command rendered into a browser page. Output from the child is appended to
/// `<pane id>.log` and mirrored into the page by the process pump thread.
class TerminalPane {
public:
  TerminalPane(browser::IPageDriver &page, std::filesystem::path log_path, config::RunMode mode,
               actor::ActorDelays delays, actor::Sleeper sleeper = {});
  ~TerminalPane();

  TerminalPane(const TerminalPane &) = delete;
  TerminalPane &operator=(const TerminalPane &) = delete;

  /// Loads the terminal view and titles it.
  [[nodiscard]] common::Status render(const std::string &title);
  /// Spawns `sh -c command`. Without a call to start, send() is a no-op.
  [[nodiscard]] common::Status start(const std::string &command);
  /// Writes one line to the child's stdin. In human mode the line is echoed
  /// keystroke by keystroke first.
  [[nodiscard]] common::Status send(const std::string &line);

  /// Stops mirroring output into the page. Called before the page closes.
  void detach();
  void stop();

  [[nodiscard]] bool running() const;
  [[nodiscard]] const std::filesystem::path &log_path() const { return log_path_; }
  [[nodiscard]] browser::IPageDriver &page() { return page_; }

private:
  void on_output(const std::string &line);
  void sleep_ms(int ms);
  [[nodiscard]] bool attached();

  browser::IPageDriver &page_;
  std::filesystem::path log_path_;
  config::RunMode mode_;
  actor::ActorDelays delays_;
  actor::Sleeper sleeper_;
  std::unique_ptr<common::Subprocess> process_;
  std::mutex log_mutex_;
  std::ofstream log_;
  // Guards page access from the pump thread against detach().
  std::mutex page_mutex_;
  bool attached_ = true;
};

} // namespace scenecast::session
