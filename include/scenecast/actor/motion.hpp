#pragma once

#include <random>
#include <vector>

namespace scenecast::actor {

struct Point {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Point &other) const { return x == other.x && y == other.y; }
};

struct WindMouseParams {
  double gravity = 9.0;
  double wind = 3.0;
  double max_step = 18.0;
  // Below this distance the wind damps and the step cap shrinks.
  double target_area = 15.0;
  int max_iterations = 2000;
};

/// Gravity plus wind particle path from `from` to `to`. Points are integer pixels,
/// pixel-distinct, and the last one is always the rounded target.
[[nodiscard]] std::vector<Point> wind_mouse(const Point &from, const Point &to, std::mt19937 &rng,
                                            const WindMouseParams &params = {});

/// steps + 1 smoothstep-eased points from `from` to `to`, rounded to pixels.
[[nodiscard]] std::vector<Point> linear_path(const Point &from, const Point &to, int steps);

/// 1 + amplitude * cos(2*pi*t) with t = i / (n - 1); 1 when n <= 1.
[[nodiscard]] double step_ease_multiplier(int index, int count, double amplitude = 0.4);

[[nodiscard]] int eased_step_ms(int base_ms, int index, int count, double factor = 1.0);

} // namespace scenecast::actor
