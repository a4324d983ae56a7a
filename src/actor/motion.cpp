#include "scenecast/actor/motion.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace scenecast::actor {

std::vector<Point> wind_mouse(const Point &from, const Point &to, std::mt19937 &rng,
                              const WindMouseParams &params) {
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  const double sqrt3 = std::sqrt(3.0);
  const double sqrt5 = std::sqrt(5.0);

  std::vector<Point> points;
  double sx = from.x;
  double sy = from.y;
  double vx = 0.0;
  double vy = 0.0;
  double wx = 0.0;
  double wy = 0.0;
  double m0 = params.max_step;

  for (int i = 0; i < params.max_iterations; ++i) {
    const double dist = std::hypot(to.x - sx, to.y - sy);
    if (dist < 1.0) {
      break;
    }

    const double w_mag = std::min(params.wind, dist);
    if (dist >= params.target_area) {
      wx = wx / sqrt3 + (unit(rng) * 2.0 - 1.0) * w_mag / sqrt5;
      wy = wy / sqrt3 + (unit(rng) * 2.0 - 1.0) * w_mag / sqrt5;
    } else {
      wx /= sqrt3;
      wy /= sqrt3;
      if (m0 < 3.0) {
        m0 = unit(rng) * 3.0 + 3.0;
      } else {
        m0 /= sqrt5;
      }
    }

    vx += wx + params.gravity * (to.x - sx) / dist;
    vy += wy + params.gravity * (to.y - sy) / dist;

    const double v_mag = std::hypot(vx, vy);
    if (v_mag > m0) {
      const double clip = m0 / 2.0 + unit(rng) * m0 / 2.0;
      vx = (vx / v_mag) * clip;
      vy = (vy / v_mag) * clip;
    }

    sx += vx;
    sy += vy;

    const Point rounded{std::round(sx), std::round(sy)};
    if (points.empty() || !(points.back() == rounded)) {
      points.push_back(rounded);
    }
  }

  const Point target{std::round(to.x), std::round(to.y)};
  if (points.empty() || !(points.back() == target)) {
    points.push_back(target);
  }
  return points;
}

std::vector<Point> linear_path(const Point &from, const Point &to, int steps) {
  std::vector<Point> points;
  if (steps <= 0) {
    points.push_back({std::round(to.x), std::round(to.y)});
    return points;
  }
  points.reserve(static_cast<std::size_t>(steps) + 1);
  for (int i = 0; i <= steps; ++i) {
    const double t = static_cast<double>(i) / steps;
    const double ease = t * t * (3.0 - 2.0 * t);
    points.push_back({std::round(from.x + (to.x - from.x) * ease),
                      std::round(from.y + (to.y - from.y) * ease)});
  }
  return points;
}

double step_ease_multiplier(int index, int count, double amplitude) {
  if (count <= 1) {
    return 1.0;
  }
  const double t = std::clamp(static_cast<double>(index) / (count - 1), 0.0, 1.0);
  return 1.0 + amplitude * std::cos(2.0 * std::numbers::pi * t);
}

int eased_step_ms(int base_ms, int index, int count, double factor) {
  const double ms = base_ms * factor * step_ease_multiplier(index, count);
  return std::max(0, static_cast<int>(std::lround(ms)));
}

} // namespace scenecast::actor
