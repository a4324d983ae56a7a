#pragma once

#include "scenecast/config/config.hpp"

#include <optional>

namespace scenecast::actor {

struct DelayRange {
  int min_ms = 0;
  int max_ms = 0;
};

struct ActorDelays {
  DelayRange breathe;
  DelayRange after_scroll;
  DelayRange mouse_move_step;
  DelayRange click_effect;
  DelayRange click_hold;
  DelayRange after_click;
  DelayRange before_type;
  DelayRange key_delay;
  DelayRange key_boundary_pause;
  DelayRange select_open;
  DelayRange select_option;
  DelayRange after_drag;
};

/// Partial profile; set fields replace the mode default.
struct DelayOverrides {
  std::optional<DelayRange> breathe;
  std::optional<DelayRange> after_scroll;
  std::optional<DelayRange> mouse_move_step;
  std::optional<DelayRange> click_effect;
  std::optional<DelayRange> click_hold;
  std::optional<DelayRange> after_click;
  std::optional<DelayRange> before_type;
  std::optional<DelayRange> key_delay;
  std::optional<DelayRange> key_boundary_pause;
  std::optional<DelayRange> select_open;
  std::optional<DelayRange> select_option;
  std::optional<DelayRange> after_drag;
};

[[nodiscard]] ActorDelays default_delays(config::RunMode mode);
[[nodiscard]] ActorDelays merge_delays(config::RunMode mode, const DelayOverrides &overrides);

/// Deterministic midpoint of a range; `min` when the range is empty or inverted.
[[nodiscard]] int pick_ms(const DelayRange &range);

} // namespace scenecast::actor
