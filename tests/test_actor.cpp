#include "test_framework.hpp"
#include "fakes.hpp"

#include "scenecast/actor/actor.hpp"
#include "scenecast/actor/delays.hpp"
#include "scenecast/actor/motion.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace {

using scenecast::actor::Point;

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

std::size_t count_value(const std::vector<std::int64_t> &values, std::int64_t wanted) {
  return static_cast<std::size_t>(std::count(values.begin(), values.end(), wanted));
}

bool has_call(scenecast::tests::PageLog &log, const std::string &call) {
  return std::find(log.calls.begin(), log.calls.end(), call) != log.calls.end();
}

} // namespace

void register_actor_tests(std::vector<scenecast::tests::TestCase> &tests) {
  using scenecast::tests::require;
  namespace a = scenecast::actor;
  namespace t = scenecast::tests;
  using scenecast::config::RunMode;

  tests.push_back({"actor_wind_mouse_ends_on_target", [] {
                     for (std::uint32_t seed : {1u, 7u, 0x5CA57u}) {
                       std::mt19937 rng(seed);
                       const auto path = a::wind_mouse({0, 0}, {500.4, 300.6}, rng);
                       require(!path.empty(), "path should not be empty");
                       require(path.back() == Point{500, 301}, "path must end on rounded target");
                       require(path.size() <= 2001, "path must terminate");
                       for (std::size_t i = 1; i < path.size(); ++i) {
                         require(!(path[i] == path[i - 1]), "consecutive points must differ");
                         require(path[i].x == std::round(path[i].x) &&
                                     path[i].y == std::round(path[i].y),
                                 "points must be whole pixels");
                       }
                     }
                   }});

  tests.push_back({"actor_wind_mouse_same_point", [] {
                     std::mt19937 rng(3);
                     const auto path = a::wind_mouse({40, 40}, {40, 40}, rng);
                     require(path.size() == 1 && path[0] == Point{40, 40},
                             "zero distance yields the target only");
                   }});

  tests.push_back({"actor_wind_mouse_is_seeded", [] {
                     std::mt19937 first(11);
                     std::mt19937 second(11);
                     const auto a_path = a::wind_mouse({0, 0}, {300, 200}, first);
                     const auto b_path = a::wind_mouse({0, 0}, {300, 200}, second);
                     require(a_path == b_path, "same seed should give the same path");
                   }});

  tests.push_back({"actor_linear_path_smoothstep", [] {
                     const auto path = a::linear_path({0, 0}, {100, 0}, 4);
                     require(path.size() == 5, "steps + 1 points");
                     require(path.front() == Point{0, 0}, "starts at origin");
                     require(path[1] == Point{16, 0}, "eased quarter point");
                     require(path[2] == Point{50, 0}, "midpoint");
                     require(path.back() == Point{100, 0}, "ends at target");
                     require(a::linear_path({0, 0}, {9.6, 3.2}, 0).front() == Point{10, 3},
                             "zero steps jumps to target");
                   }});

  tests.push_back({"actor_step_easing", [] {
                     require(near(a::step_ease_multiplier(0, 5), 1.4), "start is slow");
                     require(near(a::step_ease_multiplier(2, 5), 0.6), "middle is fast");
                     require(near(a::step_ease_multiplier(4, 5), 1.4), "end is slow");
                     require(near(a::step_ease_multiplier(0, 1), 1.0), "single step");
                     require(a::eased_step_ms(10, 0, 5) == 14, "eased first step");
                     require(a::eased_step_ms(10, 2, 5, 2.0) == 12, "pacing factor");
                     require(a::eased_step_ms(0, 2, 5) == 0, "zero base");
                   }});

  tests.push_back({"actor_delay_profiles", [] {
                     const auto human = a::default_delays(RunMode::Human);
                     require(human.breathe.min_ms == 300 && human.breathe.max_ms == 300,
                             "human breathe");
                     require(human.click_hold.min_ms == 90, "human click hold");
                     require(human.key_delay.min_ms == 35, "human key delay");

                     const auto fast = a::default_delays(RunMode::Fast);
                     require(fast.breathe.max_ms == 0 && fast.after_drag.max_ms == 0,
                             "fast delays are zero");

                     a::DelayOverrides overrides;
                     overrides.key_delay = a::DelayRange{10, 20};
                     const auto merged = a::merge_delays(RunMode::Human, overrides);
                     require(a::pick_ms(merged.key_delay) == 15, "override midpoint");
                     require(merged.after_click.min_ms == 70, "untouched fields keep defaults");
                     require(a::pick_ms({50, 40}) == 50, "inverted range picks min");
                   }});

  tests.push_back({"actor_fast_click_jumps_to_center", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_box("#go", {100, 200, 80, 40});
                     auto pauses = std::make_shared<std::vector<std::int64_t>>();
                     a::Actor actor(page, RunMode::Fast, {{}, 1, t::recording_sleeper(pauses)});

                     auto clicked = actor.click("#go");
                     require(clicked.ok(), clicked.error());
                     require(log->mouse_moves.size() == 1, "fast mode moves once");
                     require(log->mouse_moves[0] == Point{140, 220}, "center of the box");
                     require(actor.cursor() == Point{140, 220}, "cursor tracks target");
                     require(has_call(*log, "mouse_down") && has_call(*log, "mouse_up"),
                             "press and release");
                     require(pauses->empty(), "fast mode never sleeps");
                   }});

  tests.push_back({"actor_human_click_paths_and_pauses", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_box("#go", {100, 200, 80, 40});
                     auto pauses = std::make_shared<std::vector<std::int64_t>>();
                     a::Actor actor(page, RunMode::Human, {{}, 1, t::recording_sleeper(pauses)});

                     auto clicked = actor.click("#go");
                     require(clicked.ok(), clicked.error());
                     require(log->mouse_moves.size() > 3, "human mode follows a path");
                     require(log->mouse_moves.back() == Point{140, 220}, "path ends on center");
                     require(count_value(*pauses, 350) == 1, "after scroll pause");
                     require(count_value(*pauses, 90) == 1, "click hold pause");
                     require(count_value(*pauses, 70) == 1, "after click pause");
                     const auto effect = std::find(log->evaluations.begin(), log->evaluations.end(),
                                                   "window.__sc_clickEffect?.(140, 220)");
                     require(effect != log->evaluations.end(), "click ripple expected");
                   }});

  tests.push_back({"actor_missing_element_fails", [] {
                     t::FakePage page;
                     a::Actor actor(page, RunMode::Fast);
                     auto clicked = actor.click("#nope");
                     require(!clicked.ok(), "missing element should fail");
                     require(clicked.error().rfind("element not found: #nope", 0) == 0,
                             clicked.error());
                   }});

  tests.push_back({"actor_fast_type_inserts_text", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_box("#email", {0, 0, 200, 30});
                     a::Actor actor(page, RunMode::Fast);
                     auto typed = actor.type("#email", "ada@example.com");
                     require(typed.ok(), typed.error());
                     require(has_call(*log, "insert_text ada@example.com"), "insert_text expected");
                     require(log->typed.empty(), "no per-key typing in fast mode");
                   }});

  tests.push_back({"actor_human_type_keys_and_boundaries", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_box("#name", {0, 0, 200, 30});
                     auto pauses = std::make_shared<std::vector<std::int64_t>>();
                     a::Actor actor(page, RunMode::Human, {{}, 5, t::recording_sleeper(pauses)});
                     auto typed = actor.type("#name", "a b");
                     require(typed.ok(), typed.error());
                     require(log->typed == "a b", "characters typed one by one");
                     require(count_value(*pauses, 35) == 3, "key delay per character");
                     require(count_value(*pauses, 30) == 1, "boundary pause after space");
                     require(count_value(*pauses, 55) == 1, "pause before typing");
                   }});

  tests.push_back({"actor_type_into_terminal", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_evaluator([](const std::string &expression) -> std::optional<std::string> {
                       if (expression.rfind("!!document.querySelector(", 0) == 0) {
                         return std::string("true");
                       }
                       return std::nullopt;
                     });
                     a::Actor actor(page, RunMode::Fast);
                     auto typed = actor.type("#term", "ls\n");
                     require(typed.ok(), typed.error());
                     require(log->typed == "ls", "terminal characters typed");
                     require(has_call(*log, "press_key Enter"), "newline becomes Enter");
                     require(log->mouse_moves.empty(), "terminal typing does not click");
                   }});

  tests.push_back({"actor_select_option", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_box("#lang", {0, 0, 100, 30});
                     page.set_box("[role=\"option\"]", {0, 40, 100, 20});
                     bool offer = false;
                     page.set_evaluator([&offer](const std::string &expression) -> std::optional<std::string> {
                       if (offer && expression.find("const want = ") != std::string::npos) {
                         return std::string(R"({"x":10,"y":200,"width":100,"height":20})");
                       }
                       return std::nullopt;
                     });
                     a::Actor actor(page, RunMode::Fast);

                     auto missing = actor.select_option("#lang", "Klingon");
                     require(!missing.ok(), "absent option should fail");
                     require(missing.error() == "Option \"Klingon\" not found", missing.error());

                     offer = true;
                     auto chosen = actor.select_option("#lang", "French");
                     require(chosen.ok(), chosen.error());
                     require(actor.cursor() == Point{60, 210}, "cursor on option center");
                   }});

  tests.push_back({"actor_scroll_pauses_by_mode", [] {
                     t::FakePage page;
                     auto fast_pauses = std::make_shared<std::vector<std::int64_t>>();
                     a::Actor fast(page, RunMode::Fast, {{}, 1, t::recording_sleeper(fast_pauses)});
                     require(fast.scroll(std::nullopt, 400).ok(), "window scroll");
                     require(*fast_pauses == std::vector<std::int64_t>{50}, "fast scroll pause");

                     auto human_pauses = std::make_shared<std::vector<std::int64_t>>();
                     a::Actor human(page, RunMode::Human, {{}, 1, t::recording_sleeper(human_pauses)});
                     require(human.scroll(std::nullopt, -200).ok(), "window scroll");
                     require(*human_pauses == std::vector<std::int64_t>{600}, "human scroll pause");
                   }});

  tests.push_back({"actor_drag_coords", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     a::Actor actor(page, RunMode::Fast);
                     auto dragged = actor.drag_coords({10, 10}, {110.4, 59.6});
                     require(dragged.ok(), dragged.error());
                     require(log->mouse_moves.front() == Point{10, 10}, "drag starts at origin");
                     require(log->mouse_moves.back() == Point{110, 60}, "drag ends on target");
                     require(log->mouse_moves.size() == 8, "approach, press point and 6 steps");
                     require(actor.cursor() == Point{110, 60}, "cursor at drop point");
                   }});

  tests.push_back({"actor_drag_by_offset", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_box("#card", {0, 0, 100, 50});
                     a::Actor actor(page, RunMode::Fast);
                     auto dragged = actor.drag_by_offset("#card", 200, 0);
                     require(dragged.ok(), dragged.error());
                     require(actor.cursor() == Point{250, 25}, "offset from center");
                   }});

  tests.push_back({"actor_draw_normalized_points", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_box("canvas", {0, 0, 200, 100});
                     a::Actor actor(page, RunMode::Fast);
                     auto drawn = actor.draw("canvas", {{0, 0}, {1, 1}});
                     require(drawn.ok(), drawn.error());
                     require(log->mouse_moves.size() == 2, "one move per point in fast mode");
                     require(log->mouse_moves.back() == Point{200, 100}, "scaled to canvas box");
                     require(has_call(*log, "mouse_down") && has_call(*log, "mouse_up"),
                             "stroke pressed");
                     const auto moves = log->mouse_moves.size();
                     auto dot = actor.draw("canvas", {Point{0.5, 0.5}});
                     require(!dot.ok() && dot.error() == "draw needs at least 2 points, got 1",
                             dot.ok() ? "single point accepted" : dot.error());
                     auto empty = actor.draw("canvas", {});
                     require(!empty.ok() && empty.error() == "draw needs at least 2 points, got 0",
                             empty.ok() ? "empty path accepted" : empty.error());
                     require(log->mouse_moves.size() == moves, "rejected paths never move");
                   }});

  tests.push_back({"actor_fast_mode_skips_cosmetics", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_box("#x", {0, 0, 10, 10});
                     a::Actor actor(page, RunMode::Fast);
                     require(actor.inject_cursor().ok(), "inject cursor");
                     require(actor.circle_around("#x").ok(), "circle around");
                     require(log->evaluations.empty(), "no overlay scripts in fast mode");
                     require(log->mouse_moves.empty(), "no circling in fast mode");
                   }});

  tests.push_back({"actor_hover_click_at_and_select_text", [] {
                     auto log = std::make_shared<t::PageLog>();
                     t::FakePage page(log);
                     page.set_box("#menu", {10, 20, 100, 40});
                     page.set_box("#para", {0, 0, 100, 20});
                     a::Actor actor(page, RunMode::Fast);

                     require(actor.hover("#menu").ok(), "hover");
                     require(actor.cursor() == Point{60, 40}, "hover rests on the center");
                     require(!has_call(*log, "mouse_down"), "hover never presses");

                     require(actor.click_at(300.4, 200.6).ok(), "click_at");
                     require(log->mouse_moves.back() == Point{300, 201}, "rounded target");
                     require(has_call(*log, "mouse_down") && has_call(*log, "mouse_up"), "pressed");

                     require(actor.select_text("#para").ok(), "select text");
                     require(log->mouse_moves.back() == Point{98, 18}, "drag ends inside the box");
                     require(actor.cursor() == Point{98, 18}, "cursor follows the drag");
                     require(!actor.select_text("#para", std::string("#gone")).ok(),
                             "missing end element");
                   }});
}
