#include "scenecast/actor/delays.hpp"

#include <cmath>

namespace scenecast::actor {

ActorDelays default_delays(config::RunMode mode) {
  if (mode == config::RunMode::Fast) {
    return ActorDelays{};
  }
  ActorDelays delays;
  delays.breathe = {300, 300};
  delays.after_scroll = {350, 350};
  delays.mouse_move_step = {3, 3};
  delays.click_effect = {25, 25};
  delays.click_hold = {90, 90};
  delays.after_click = {70, 70};
  delays.before_type = {55, 55};
  delays.key_delay = {35, 35};
  delays.key_boundary_pause = {30, 30};
  delays.select_open = {120, 120};
  delays.select_option = {70, 70};
  delays.after_drag = {120, 120};
  return delays;
}

ActorDelays merge_delays(config::RunMode mode, const DelayOverrides &overrides) {
  ActorDelays delays = default_delays(mode);
  const auto apply = [](DelayRange &target, const std::optional<DelayRange> &value) {
    if (value.has_value()) {
      target = *value;
    }
  };
  apply(delays.breathe, overrides.breathe);
  apply(delays.after_scroll, overrides.after_scroll);
  apply(delays.mouse_move_step, overrides.mouse_move_step);
  apply(delays.click_effect, overrides.click_effect);
  apply(delays.click_hold, overrides.click_hold);
  apply(delays.after_click, overrides.after_click);
  apply(delays.before_type, overrides.before_type);
  apply(delays.key_delay, overrides.key_delay);
  apply(delays.key_boundary_pause, overrides.key_boundary_pause);
  apply(delays.select_open, overrides.select_open);
  apply(delays.select_option, overrides.select_option);
  apply(delays.after_drag, overrides.after_drag);
  return delays;
}

int pick_ms(const DelayRange &range) {
  if (range.max_ms <= range.min_ms) {
    return range.min_ms;
  }
  return static_cast<int>(std::lround((range.min_ms + range.max_ms) / 2.0));
}

} // namespace scenecast::actor
