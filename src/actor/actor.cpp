#include "scenecast/actor/actor.hpp"

#include "scenecast/actor/scripts.hpp"
#include "scenecast/common/fs.hpp"
#include "scenecast/common/json_util.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace scenecast::actor {

namespace {

constexpr int HUMAN_DRAG_STEPS = 25;
constexpr int FAST_DRAG_STEPS = 5;
constexpr int HUMAN_DRAW_SEGMENT_STEPS = 12;
constexpr int FAST_DRAW_SEGMENT_STEPS = 1;
constexpr double DRAW_PACING_FACTOR = 2.0;
constexpr int HUMAN_SCROLL_PAUSE_MS = 600;
constexpr int FAST_SCROLL_PAUSE_MS = 50;
constexpr int SELECT_TEXT_INSET = 2;

std::string px(double value) { return std::to_string(static_cast<long long>(std::lround(value))); }

Point center_of(const browser::Box &box) {
  return {std::round(box.x + box.width / 2.0), std::round(box.y + box.height / 2.0)};
}

Point rounded(double x, double y) { return {std::round(x), std::round(y)}; }

common::Result<browser::Box> parse_box(const std::string &json) {
  browser::Box box;
  try {
    box.x = std::stod(common::json_get_number(json, "x"));
    box.y = std::stod(common::json_get_number(json, "y"));
    box.width = std::stod(common::json_get_number(json, "width"));
    box.height = std::stod(common::json_get_number(json, "height"));
  } catch (const std::exception &) {
    return common::Result<browser::Box>::failure("invalid bounding box: " + json);
  }
  return common::Result<browser::Box>::success(box);
}

std::string scroll_script(const std::string &selector, double delta_y, const char *behavior) {
  std::ostringstream js;
  js << "(() => {"
     << "const root = document.querySelector(" << browser::js_string_literal(selector) << ");"
     << "if (!root) return;"
     << "const scrollable = (el) => { const s = getComputedStyle(el).overflowY;"
     << " return el.scrollHeight > el.clientHeight + 1 &&"
     << " (s === 'auto' || s === 'scroll' || s === 'overlay'); };"
     << "const direct = root instanceof HTMLElement && scrollable(root) ? root : null;"
     << "const viewport = root.querySelector('[data-slot=\"scroll-area-viewport\"]');"
     << "const inner = Array.from(root.querySelectorAll('*'))"
     << ".find((n) => n instanceof HTMLElement && scrollable(n));"
     << "const target = direct || viewport || inner || root;"
     << "target.scrollBy({ top: " << delta_y << ", behavior: '" << behavior << "' });"
     << "})()";
  return js.str();
}

std::string find_option_script(const std::string &option_text) {
  std::ostringstream js;
  js << "(() => {"
     << "const want = " << browser::js_string_literal(option_text) << ";"
     << "for (const el of document.querySelectorAll('[role=\"option\"]')) {"
     << " if ((el.textContent || '').trim() === want) {"
     << "  const r = el.getBoundingClientRect();"
     << "  return JSON.stringify({ x: r.x, y: r.y, width: r.width, height: r.height });"
     << " }"
     << "}"
     << "return '';"
     << "})()";
  return js.str();
}

} // namespace

Actor::Actor(browser::IPageDriver &page, config::RunMode mode, ActorOptions options)
    : page_(page), mode_(mode), delays_(merge_delays(mode, options.delays)),
      sleeper_(std::move(options.sleeper)), rng_(options.seed) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
  }
}

void Actor::sleep_ms(int ms) {
  if (ms > 0) {
    sleeper_(std::chrono::milliseconds(ms));
  }
}

void Actor::breathe() { pause(delays_.breathe); }

common::Status Actor::inject_cursor() {
  if (!human()) {
    return common::Status::success();
  }
  auto injected = page_.evaluate(CURSOR_OVERLAY_SCRIPT);
  if (!injected.ok()) {
    return common::Status::error("cursor overlay: " + injected.error());
  }
  return show_cursor(cursor_);
}

common::Status Actor::goto_url(const std::string &url) {
  auto navigated = page_.navigate(url, std::chrono::seconds(30));
  if (!navigated.ok()) {
    return navigated;
  }
  return inject_cursor();
}

common::Result<browser::Box> Actor::wait_for(const std::string &selector,
                                             std::chrono::milliseconds timeout) {
  return page_.wait_for_visible(selector, timeout);
}

common::Result<browser::Box> Actor::scroll_into_view(const std::string &selector) {
  auto box = wait_for(selector);
  if (!box.ok()) {
    return box;
  }
  const std::string js = "document.querySelector(" + browser::js_string_literal(selector) +
                         ")?.scrollIntoView({ block: 'center', behavior: '" +
                         (human() ? "smooth" : "auto") + "' })";
  auto scrolled = page_.evaluate(js);
  if (!scrolled.ok()) {
    return common::Result<browser::Box>::failure(scrolled.error());
  }
  pause(delays_.after_scroll);
  return wait_for(selector);
}

common::Status Actor::show_cursor(const Point &point) {
  auto moved =
      page_.evaluate("window.__sc_moveCursor?.(" + px(point.x) + ", " + px(point.y) + ")");
  return moved.ok() ? common::Status::success() : common::Status::error(moved.error());
}

common::Status Actor::follow_path(const std::vector<Point> &points, double factor) {
  const int count = static_cast<int>(points.size());
  const int base = pick_ms(delays_.mouse_move_step);
  for (int i = 0; i < count; ++i) {
    const Point &p = points[static_cast<std::size_t>(i)];
    auto moved = page_.mouse_move(p.x, p.y);
    if (!moved.ok()) {
      return moved;
    }
    if (human()) {
      auto shown = show_cursor(p);
      if (!shown.ok()) {
        return shown;
      }
      sleep_ms(eased_step_ms(base, i, count, factor));
    }
  }
  return common::Status::success();
}

common::Status Actor::wind_to(const Point &target) {
  if (!human()) {
    return page_.mouse_move(target.x, target.y);
  }
  return follow_path(wind_mouse(cursor_, target, rng_), 1.0);
}

common::Result<Point> Actor::move_to(const std::string &selector) {
  auto box = scroll_into_view(selector);
  if (!box.ok()) {
    return common::Result<Point>::failure(box.error());
  }
  const Point target = center_of(box.value());
  auto moved = wind_to(target);
  if (!moved.ok()) {
    return common::Result<Point>::failure(moved.error());
  }
  cursor_ = target;
  return common::Result<Point>::success(target);
}

common::Status Actor::press_at(const Point &point) {
  if (human()) {
    auto effect =
        page_.evaluate("window.__sc_clickEffect?.(" + px(point.x) + ", " + px(point.y) + ")");
    if (!effect.ok()) {
      return common::Status::error(effect.error());
    }
    pause(delays_.click_effect);
  }
  auto down = page_.mouse_down();
  if (!down.ok()) {
    return down;
  }
  if (human()) {
    pause(delays_.click_hold);
  }
  auto up = page_.mouse_up();
  if (!up.ok()) {
    return up;
  }
  if (human()) {
    pause(delays_.after_click);
  }
  return common::Status::success();
}

common::Status Actor::hover(const std::string &selector) {
  auto moved = move_to(selector);
  return moved.ok() ? common::Status::success() : common::Status::error(moved.error());
}

common::Status Actor::click(const std::string &selector) {
  auto target = move_to(selector);
  if (!target.ok()) {
    return common::Status::error(target.error());
  }
  return press_at(target.value());
}

common::Status Actor::move_cursor_to(double x, double y) {
  const Point target = rounded(x, y);
  auto moved = wind_to(target);
  if (!moved.ok()) {
    return moved;
  }
  cursor_ = target;
  return common::Status::success();
}

common::Status Actor::click_at(double x, double y) {
  auto moved = move_cursor_to(x, y);
  if (!moved.ok()) {
    return moved;
  }
  return press_at(cursor_);
}

common::Status Actor::type_into_terminal(const std::string &selector, const std::string &text) {
  const std::string textarea = selector + " .xterm-helper-textarea";
  auto focused =
      page_.evaluate("document.querySelector(" + browser::js_string_literal(textarea) +
                     ")?.focus()");
  if (!focused.ok()) {
    return common::Status::error(focused.error());
  }
  const int char_delay = human() ? pick_ms(delays_.key_delay) : 0;
  for (const auto &ch : common::utf8_characters(text)) {
    auto sent = ch == "\n" ? page_.press_key("Enter") : page_.type_character(ch);
    if (!sent.ok()) {
      return sent;
    }
    sleep_ms(char_delay);
  }
  return common::Status::success();
}

common::Status Actor::type(const std::string &selector, const std::string &text) {
  auto is_terminal = page_.evaluate("!!document.querySelector(" +
                                    browser::js_string_literal(selector +
                                                               " .xterm-helper-textarea") +
                                    ")");
  if (!is_terminal.ok()) {
    return common::Status::error(is_terminal.error());
  }
  if (is_terminal.value() == "true") {
    return type_into_terminal(selector, text);
  }

  auto clicked = click(selector);
  if (!clicked.ok()) {
    return clicked;
  }
  pause(delays_.before_type);

  if (!human()) {
    return page_.insert_text(text);
  }

  const int key_delay = pick_ms(delays_.key_delay);
  for (const auto &ch : common::utf8_characters(text)) {
    auto sent = ch == "\n" ? page_.press_key("Enter") : page_.type_character(ch);
    if (!sent.ok()) {
      return sent;
    }
    sleep_ms(key_delay);
    if (ch == " " || ch == "@" || ch == ".") {
      pause(delays_.key_boundary_pause);
    }
  }
  return common::Status::success();
}

common::Status Actor::press_key(const std::string &key) {
  auto pressed = page_.press_key(key);
  if (!pressed.ok()) {
    return pressed;
  }
  if (human()) {
    breathe();
  }
  return common::Status::success();
}

common::Status Actor::select_option(const std::string &trigger_selector,
                                    const std::string &option_text) {
  auto opened = click(trigger_selector);
  if (!opened.ok()) {
    return opened;
  }
  pause(delays_.select_open);

  auto listed = wait_for("[role=\"option\"]");
  if (!listed.ok()) {
    return common::Status::error(listed.error());
  }
  pause(delays_.select_option);

  auto found = page_.evaluate(find_option_script(option_text));
  if (!found.ok()) {
    return common::Status::error(found.error());
  }
  if (common::trim(found.value()).empty()) {
    return common::Status::error("Option \"" + option_text + "\" not found");
  }
  auto box = parse_box(found.value());
  if (!box.ok()) {
    return common::Status::error(box.error());
  }

  const Point target = center_of(box.value());
  if (human()) {
    auto moved = follow_path(wind_mouse(cursor_, target, rng_), 1.0);
    if (!moved.ok()) {
      return moved;
    }
    auto effect = page_.evaluate("window.__sc_clickEffect?.(" + px(target.x) + ", " +
                                 px(target.y) + ")");
    if (!effect.ok()) {
      return common::Status::error(effect.error());
    }
  }
  auto moved = page_.mouse_move(target.x, target.y);
  if (!moved.ok()) {
    return moved;
  }
  auto down = page_.mouse_down();
  if (!down.ok()) {
    return down;
  }
  auto up = page_.mouse_up();
  if (!up.ok()) {
    return up;
  }
  pause(delays_.after_click);
  cursor_ = target;
  return common::Status::success();
}

common::Status Actor::scroll(const std::optional<std::string> &selector, double delta_y) {
  const char *behavior = human() ? "smooth" : "auto";
  common::Result<std::string> scrolled = common::Result<std::string>::failure("");
  if (selector.has_value() && !selector->empty()) {
    auto hovered = move_to(*selector);
    if (!hovered.ok()) {
      return common::Status::error(hovered.error());
    }
    scrolled = page_.evaluate(scroll_script(*selector, delta_y, behavior));
  } else {
    std::ostringstream js;
    js << "window.scrollBy({ top: " << delta_y << ", behavior: '" << behavior << "' })";
    scrolled = page_.evaluate(js.str());
  }
  if (!scrolled.ok()) {
    return common::Status::error(scrolled.error());
  }
  sleep_ms(human() ? HUMAN_SCROLL_PAUSE_MS : FAST_SCROLL_PAUSE_MS);
  return common::Status::success();
}

common::Status Actor::drag_coords(const Point &from, const Point &to) {
  const Point start = rounded(from.x, from.y);
  const Point end = rounded(to.x, to.y);

  auto approached = wind_to(start);
  if (!approached.ok()) {
    return approached;
  }
  auto positioned = page_.mouse_move(start.x, start.y);
  if (!positioned.ok()) {
    return positioned;
  }
  auto down = page_.mouse_down();
  if (!down.ok()) {
    return down;
  }
  pause(delays_.click_hold);

  auto dragged =
      follow_path(linear_path(start, end, human() ? HUMAN_DRAG_STEPS : FAST_DRAG_STEPS), 1.0);
  if (!dragged.ok()) {
    return dragged;
  }
  pause(delays_.after_click);
  auto up = page_.mouse_up();
  if (!up.ok()) {
    return up;
  }
  cursor_ = end;
  pause(delays_.after_drag);
  return common::Status::success();
}

common::Status Actor::drag(const std::string &from_selector, const std::string &to_selector) {
  auto from = scroll_into_view(from_selector);
  if (!from.ok()) {
    return common::Status::error(from.error());
  }
  auto to = wait_for(to_selector);
  if (!to.ok()) {
    return common::Status::error(to.error());
  }
  return drag_coords(center_of(from.value()), center_of(to.value()));
}

common::Status Actor::drag_by_offset(const std::string &selector, double dx, double dy) {
  auto box = scroll_into_view(selector);
  if (!box.ok()) {
    return common::Status::error(box.error());
  }
  const Point from = center_of(box.value());
  return drag_coords(from, {from.x + dx, from.y + dy});
}

common::Status Actor::select_text(const std::string &from_selector,
                                  const std::optional<std::string> &to_selector) {
  auto from_box = wait_for(from_selector);
  if (!from_box.ok()) {
    return common::Status::error(from_box.error());
  }
  browser::Box end_box = from_box.value();
  if (to_selector.has_value()) {
    auto to_box = wait_for(*to_selector);
    if (!to_box.ok()) {
      return common::Status::error(to_box.error());
    }
    end_box = to_box.value();
  }
  const Point from{from_box.value().x + SELECT_TEXT_INSET, from_box.value().y + SELECT_TEXT_INSET};
  const Point to{end_box.x + end_box.width - SELECT_TEXT_INSET,
                 end_box.y + end_box.height - SELECT_TEXT_INSET};
  return drag_coords(from, to);
}

common::Status Actor::draw(const std::string &canvas_selector,
                           const std::vector<Point> &normalized_points) {
  if (normalized_points.size() < 2) {
    return common::Status::error("draw needs at least 2 points, got " +
                                 std::to_string(normalized_points.size()));
  }
  auto box = wait_for(canvas_selector);
  if (!box.ok()) {
    return common::Status::error(box.error());
  }
  const browser::Box &canvas = box.value();
  std::vector<Point> points;
  points.reserve(normalized_points.size());
  for (const auto &p : normalized_points) {
    points.push_back(rounded(canvas.x + p.x * canvas.width, canvas.y + p.y * canvas.height));
  }

  auto approached = wind_to(points.front());
  if (!approached.ok()) {
    return approached;
  }
  auto down = page_.mouse_down();
  if (!down.ok()) {
    return down;
  }

  const int segment_steps = human() ? HUMAN_DRAW_SEGMENT_STEPS : FAST_DRAW_SEGMENT_STEPS;
  for (std::size_t i = 1; i < points.size(); ++i) {
    auto segment = linear_path(points[i - 1], points[i], segment_steps);
    segment.erase(segment.begin());
    auto stroked = follow_path(segment, DRAW_PACING_FACTOR);
    if (!stroked.ok()) {
      return stroked;
    }
  }

  auto up = page_.mouse_up();
  if (!up.ok()) {
    return up;
  }
  cursor_ = points.back();
  pause(delays_.after_drag);
  return common::Status::success();
}

common::Status Actor::circle_around(const std::string &selector, std::optional<int> duration_ms) {
  if (!human()) {
    return common::Status::success();
  }
  auto box = scroll_into_view(selector);
  if (!box.ok()) {
    return common::Status::error(box.error());
  }

  const double cx = box.value().x + box.value().width / 2.0;
  const double cy = box.value().y + box.value().height / 2.0;
  const double base_rx = box.value().width / 2.0 + 18.0;
  const double base_ry = box.value().height / 2.0 + 14.0;
  const double total_angle = 3.0 * std::numbers::pi;
  constexpr double r_start = 0.7;
  constexpr double r_end = 1.0;

  const Point start = rounded(cx + base_rx * r_start, cy);
  auto approached = wind_to(start);
  if (!approached.ok()) {
    return approached;
  }

  const double avg_radius = (base_rx + base_ry) / 2.0;
  const double path_length = 1.5 * 2.0 * std::numbers::pi * avg_radius * ((r_start + r_end) / 2.0);
  const int auto_duration =
      std::clamp(static_cast<int>(std::lround(path_length / 400.0 * 1000.0)), 800, 1500);
  const int duration = duration_ms.value_or(auto_duration);
  const int total_steps = std::max(40, duration / 20);
  const int step_delay = static_cast<int>(std::lround(static_cast<double>(duration) / total_steps));

  std::uniform_real_distribution<double> jitter(-0.5, 0.5);
  Point previous = start;
  for (int i = 1; i <= total_steps; ++i) {
    const double t = static_cast<double>(i) / total_steps;
    const double angle = t * total_angle;
    const double r_factor = r_start + (r_end - r_start) * t;
    const double noise = 3.0 * (1.0 - t * 0.4);
    const Point p = rounded(cx + base_rx * r_factor * std::cos(angle) + jitter(rng_) * noise,
                            cy + base_ry * r_factor * std::sin(angle) + jitter(rng_) * noise);
    if (!(p == previous)) {
      auto moved = page_.mouse_move(p.x, p.y);
      if (!moved.ok()) {
        return moved;
      }
      auto shown = show_cursor(p);
      if (!shown.ok()) {
        return shown;
      }
      previous = p;
    }
    sleep_ms(step_delay);
  }
  cursor_ = previous;
  return common::Status::success();
}

} // namespace scenecast::actor
