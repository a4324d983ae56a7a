#pragma once

#include "scenecast/actor/delays.hpp"
#include "scenecast/actor/motion.hpp"
#include "scenecast/browser/page_driver.hpp"
#include "scenecast/common/result.hpp"
#include "scenecast/config/config.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace scenecast::actor {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline constexpr std::chrono::milliseconds DEFAULT_WAIT_TIMEOUT{3000};

struct ActorOptions {
  DelayOverrides delays;
  std::uint32_t seed = 0x5CA57u;
  // Defaults to std::this_thread::sleep_for.
  Sleeper sleeper;
};

/// Drives one page with cursor and keyboard input that looks like a person.
/// In fast mode every movement jumps and every delay is zero.
class Actor {
public:
  Actor(browser::IPageDriver &page, config::RunMode mode, ActorOptions options = {});

  [[nodiscard]] common::Status goto_url(const std::string &url);
  [[nodiscard]] common::Result<browser::Box>
  wait_for(const std::string &selector, std::chrono::milliseconds timeout = DEFAULT_WAIT_TIMEOUT);

  [[nodiscard]] common::Status hover(const std::string &selector);
  [[nodiscard]] common::Status click(const std::string &selector);
  [[nodiscard]] common::Status click_at(double x, double y);
  [[nodiscard]] common::Status move_cursor_to(double x, double y);
  [[nodiscard]] common::Status type(const std::string &selector, const std::string &text);
  [[nodiscard]] common::Status press_key(const std::string &key);
  [[nodiscard]] common::Status select_option(const std::string &trigger_selector,
                                             const std::string &option_text);

  /// Scrolls the best scrollable match for `selector`, or the window when empty.
  [[nodiscard]] common::Status scroll(const std::optional<std::string> &selector, double delta_y);

  [[nodiscard]] common::Status drag(const std::string &from_selector,
                                    const std::string &to_selector);
  [[nodiscard]] common::Status drag_by_offset(const std::string &selector, double dx, double dy);
  [[nodiscard]] common::Status drag_coords(const Point &from, const Point &to);
  [[nodiscard]] common::Status select_text(const std::string &from_selector,
                                           const std::optional<std::string> &to_selector = {});

  /// Points are normalized to the canvas box, (0,0) top-left and (1,1) bottom-right.
  /// A stroke needs at least two points.
  [[nodiscard]] common::Status draw(const std::string &canvas_selector,
                                    const std::vector<Point> &normalized_points);
  [[nodiscard]] common::Status circle_around(const std::string &selector,
                                             std::optional<int> duration_ms = std::nullopt);

  void breathe();

  /// Re-applies the cursor overlay after a navigation. No-op in fast mode.
  [[nodiscard]] common::Status inject_cursor();

  [[nodiscard]] Point cursor() const { return cursor_; }
  [[nodiscard]] config::RunMode mode() const { return mode_; }
  [[nodiscard]] const ActorDelays &delays() const { return delays_; }
  [[nodiscard]] browser::IPageDriver &page() { return page_; }

private:
  [[nodiscard]] bool human() const { return mode_ == config::RunMode::Human; }
  void sleep_ms(int ms);
  void pause(const DelayRange &range) { sleep_ms(pick_ms(range)); }

  [[nodiscard]] common::Result<Point> move_to(const std::string &selector);
  [[nodiscard]] common::Status follow_path(const std::vector<Point> &points, double factor);
  [[nodiscard]] common::Status wind_to(const Point &target);
  [[nodiscard]] common::Status show_cursor(const Point &point);
  [[nodiscard]] common::Status press_at(const Point &point);
  [[nodiscard]] common::Status type_into_terminal(const std::string &selector,
                                                  const std::string &text);
  [[nodiscard]] common::Result<browser::Box> scroll_into_view(const std::string &selector);

  browser::IPageDriver &page_;
  config::RunMode mode_;
  ActorDelays delays_;
  Sleeper sleeper_;
  std::mt19937 rng_;
  Point cursor_{0.0, 0.0};
};

} // namespace scenecast::actor
