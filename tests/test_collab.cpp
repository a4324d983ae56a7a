#include "test_framework.hpp"
#include "fakes.hpp"

#include "scenecast/collab/collab_session.hpp"
#include "scenecast/collab/reviewer.hpp"
#include "scenecast/collab/sync_audit.hpp"
#include "scenecast/common/fs.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace co = scenecast::collab;
namespace s = scenecast::session;
namespace t = scenecast::tests;

constexpr const char *kRelayUrl = "ws://127.0.0.1:4444";

struct CollabHarness {
  std::shared_ptr<t::Journal> journal = std::make_shared<t::Journal>();
  std::shared_ptr<t::FakeBrowserHost> browser = std::make_shared<t::FakeBrowserHost>(journal);
  std::shared_ptr<std::vector<std::string>> reviewer_sent =
      std::make_shared<std::vector<std::string>>();
  std::shared_ptr<co::ReviewerLaunch> launch = std::make_shared<co::ReviewerLaunch>();
  std::shared_ptr<std::vector<std::int64_t>> pauses = std::make_shared<std::vector<std::int64_t>>();

  CollabHarness() {
    browser->on_open = [](t::FakePage &page, std::size_t index) {
      if (index == 0) {
        page.set_hash("#doc-42");
      }
    };
  }

  co::CollabDeps deps() const {
    co::CollabDeps out;
    out.session.browser = browser;
    out.session.runner = std::make_shared<t::RecordingProcessRunner>();
    out.session.probe = std::make_shared<t::FakeMediaProbe>();
    out.session.sleeper = t::recording_sleeper(pauses);
    auto journal_ref = journal;
    out.relay = [journal_ref]() {
      return scenecast::common::Result<std::unique_ptr<co::IDocumentRelay>>::success(
          std::make_unique<t::FakeRelay>(kRelayUrl, journal_ref));
    };
    auto sent = reviewer_sent;
    auto launched = launch;
    out.reviewer = [journal_ref, sent, launched](const co::ReviewerLaunch &request) {
      *launched = request;
      return scenecast::common::Result<std::unique_ptr<co::IReviewer>>::success(
          std::make_unique<t::FakeReviewer>(sent, journal_ref));
    };
    return out;
  }
};

co::CollabOptions collab_options(const std::string &name) {
  co::CollabOptions options;
  options.session.mode = scenecast::config::RunMode::Fast;
  options.session.record = false;
  options.session.headed = false;
  options.session.artifact_dir = t::make_temp_dir(name);
  options.base_url = "http://app.test";
  options.reviewer_command = "notes-cli";
  options.doc_hash_timeout = std::chrono::milliseconds(300);
  return options;
}

s::StepRecord record(const std::string &tag, const std::string &caption, std::int64_t end_ms) {
  return s::StepRecord{0, caption, end_ms - 100, end_ms, tag};
}

} // namespace

void register_collab_tests(std::vector<scenecast::tests::TestCase> &tests) {
  using scenecast::tests::require;
  namespace c = scenecast::common;

  tests.push_back({"collab_actor_pair_validation", [] {
                     require(co::validate_actor_pair(co::default_actor_pair()).ok(), "defaults");
                     co::ActorPair blank{co::CollabActorSpec{"a", "A"}, co::CollabActorSpec{"", "B"}};
                     require(co::validate_actor_pair(blank).error() ==
                                 "collaboration requires exactly 2 actors with stable ids",
                             "blank id");
                     co::ActorPair twins{co::CollabActorSpec{"a", "A"}, co::CollabActorSpec{"a", "B"}};
                     require(co::validate_actor_pair(twins).error() ==
                                 "collaboration requires 2 distinct actor ids (got \"a\")",
                             "duplicate ids");
                     co::ActorPair reserved{co::CollabActorSpec{"both", "A"},
                                            co::CollabActorSpec{"b", "B"}};
                     require(!co::validate_actor_pair(reserved).ok(), "reserved id");
                   }});

  tests.push_back({"collab_record_mode_resolution", [] {
                     using scenecast::capture::Platform;
                     using scenecast::config::RecordMode;
                     require(co::resolve_collab_record_mode(std::nullopt, false, Platform::Linux, ":99") ==
                                 RecordMode::Screen,
                             "headed linux desktop prefers screen");
                     require(co::resolve_collab_record_mode(std::nullopt, true, Platform::Linux, ":99") ==
                                 RecordMode::Screencast,
                             "headless uses screencast");
                     require(co::resolve_collab_record_mode(std::nullopt, false, Platform::Linux, "") ==
                                 RecordMode::Screencast,
                             "no display");
                     require(co::resolve_collab_record_mode(std::nullopt, false, Platform::MacOS, "") ==
                                 RecordMode::Screencast,
                             "macOS auto");
                     require(co::resolve_collab_record_mode(RecordMode::Screen, true, Platform::Linux,
                                                            ":99") == RecordMode::Screencast,
                             "screen downgraded when headless");
                     require(co::resolve_collab_record_mode(RecordMode::None, false, Platform::Linux,
                                                            ":99") == RecordMode::None,
                             "explicit none kept");
                   }});

  tests.push_back({"collab_geometry", [] {
                     using scenecast::config::RecordMode;
                     const auto wide = co::collab_geometry(RecordMode::Screen, "2560x720");
                     require(wide.tile_width == 853 && wide.tile_height == 720, "thirds of the display");
                     require(wide.viewport.width == 853 && wide.viewport.height == 720, "viewport");
                     const auto narrow = co::collab_geometry(RecordMode::Screen, "1200x800");
                     require(narrow.tile_width == 520 && narrow.viewport.width == 520,
                             "minimum tile width");
                     const auto fallback = co::collab_geometry(RecordMode::Screen, "bogus");
                     require(fallback.tile_width == 853, "default display size");
                     const auto screencast = co::collab_geometry(RecordMode::Screencast, "2560x720");
                     require(screencast.tile_width == 960 && screencast.viewport.width == 1280,
                             "screencast keeps defaults");
                   }});

  tests.push_back({"collab_capture_crop", [] {
                     scenecast::browser::Box box;
                     box.x = 101;
                     box.width = 300;
                     const auto crop = co::compute_capture_crop(box, 16, 1280, 720);
                     require(crop.x == 86 && crop.y == 0 && crop.w == 332 && crop.h == 720,
                             "padded even column");
                     box.x = 5;
                     box.width = 1300;
                     const auto clamped = co::compute_capture_crop(box, 16, 1280, 720);
                     require(clamped.x == 0 && clamped.w == 1280, "clamped to viewport");
                   }});

  tests.push_back({"collab_url_helpers", [] {
                     require(co::with_query_param("http://h/p", "k", "v") == "http://h/p?k=v",
                             "first param");
                     require(co::with_query_param("http://h/p?role=boss#frag", "ws", "ws://a b") ==
                                 "http://h/p?role=boss&ws=ws%3A%2F%2Fa+b#frag",
                             "encoded before fragment");
                     require(co::with_fragment("http://h/p#old", "#new") == "http://h/p#new",
                             "fragment replaced");
                     require(co::with_fragment("http://h/p", "abc") == "http://h/p#abc",
                             "hash prefix added");
                     require(co::with_fragment("http://h/p#x", "") == "http://h/p", "fragment cleared");
                   }});

  tests.push_back({"collab_sync_audit", [] {
                     const std::vector<s::StepRecord> steps = {
                         record("boss", "Boss adds task: \"A\"", 1000),
                         record("worker", "Worker sees \"A\"", 1500),
                         record("boss", "Boss adds task: \"B\"", 2000),
                         record("worker", "Worker sees \"B\"", 1800),
                         record("boss", "Boss adds task: \"C\"", 2500),
                         record("boss", "Boss sees \"C\"", 2600),
                     };
                     const auto report = co::audit_sync(steps, "boss", "worker");
                     require(report.measurements.size() == 2, "unseen items are skipped");
                     require(report.measurements[0].item == "A" && report.measurements[0].ok(),
                             "positive delta");
                     require(!report.measurements[1].ok(), "negative delta fails");
                     require(report.summary.has_value() && report.summary->negatives == 1,
                             "negatives counted");

                     const auto lines = co::format_sync_report(report, "Boss", "Worker");
                     require(lines.size() == 4, "measurements plus summary and drift");
                     require(lines[0] == "\"A\": Boss added @ 1.0s, Worker saw @ 1.5s  (+0.5s) OK",
                             lines[0]);
                     require(lines[1] == "\"B\": Boss added @ 2.0s, Worker saw @ 1.8s  (-0.2s) FAIL",
                             lines[1]);
                     require(lines[2] ==
                                 "Sync summary: n=2, min=-0.20s, avg=0.15s, max=0.50s, negatives=1 (FAIL)",
                             lines[2]);
                     require(lines[3] ==
                                 "Sync drift (last5 - first5): +0.00s (first5=0.15s, last5=0.15s)",
                             lines[3]);

                     require(!co::audit_sync({}, "boss", "worker").summary.has_value(), "empty audit");
                     require(co::first_quoted("say \"hi\" and \"bye\"").value_or("") == "hi",
                             "first quoted");
                     require(!co::first_quoted("say \"\"").has_value(), "empty quotes");
                   }});

  tests.push_back({"collab_reviewer_command_format", [] {
                     require(co::format_reviewer_command("ADD", {"say \"hi\"", "a\\b", "two\nlines"}) ==
                                 "ADD \"say \\\"hi\\\"\" \"a\\\\b\" \"two lines\"",
                             "quoted and escaped");
                     require(co::format_reviewer_command("LIST", {}) == "LIST", "bare verb");

                     co::ReviewerLaunch launch;
                     launch.args = {"--quiet"};
                     launch.ws_url = kRelayUrl;
                     launch.doc_url = "doc-42";
                     launch.log_path = "/tmp/reviewer.log";
                     const auto args = co::build_reviewer_args(launch);
                     const std::vector<std::string> expected = {"--quiet", "--ws", kRelayUrl, "--doc",
                                                                "doc-42", "--log", "/tmp/reviewer.log"};
                     require(args == expected, "reviewer argv");
                   }});

  tests.push_back({"collab_session_run", [] {
                     CollabHarness harness;
                     auto options = collab_options("collab-e2e");
                     const auto dir = options.session.artifact_dir;
                     co::CollabSession collab(options, harness.deps());
                     auto result = collab.run([](co::CollabSession &active) {
                       auto added = active.step("boss", "Boss adds task: \"Milk\"",
                                                [] { return c::Status::success(); });
                       if (!added.ok()) {
                         return added;
                       }
                       auto seen = active.step("worker", "Worker sees \"Milk\"",
                                               [] { return c::Status::success(); });
                       if (!seen.ok()) {
                         return seen;
                       }
                       auto both = active.step(co::BOTH_ROLE, "Both wave",
                                               [] { return c::Status::success(); });
                       if (!both.ok()) {
                         return both;
                       }
                       auto unknown = active.step("nobody", "ghost", [] { return c::Status::success(); });
                       if (unknown.ok() || unknown.error() != "unknown role: nobody") {
                         return c::Status::error("unknown role accepted");
                       }
                       if (active.actor("ghost").ok() || !active.page("worker").ok()) {
                         return c::Status::error("actor lookup mismatch");
                       }
                       return active.reviewer_command(
                           co::format_reviewer_command("ADD", {"Bread"}));
                     });
                     require(result.ok(), result.error());

                     const auto &boss_calls = harness.browser->pages[0]->calls;
                     const auto &worker_calls = harness.browser->pages[1]->calls;
                     const std::string ws = "ws=ws%3A%2F%2F127.0.0.1%3A4444";
                     require(std::find(boss_calls.begin(), boss_calls.end(),
                                       "navigate http://app.test/notes?role=boss&" + ws) !=
                                 boss_calls.end(),
                             "first actor opens with the relay");
                     require(std::find(worker_calls.begin(), worker_calls.end(),
                                       "navigate http://app.test/notes?role=worker&" + ws + "#doc-42") !=
                                 worker_calls.end(),
                             "second actor joins the same document");

                     require(harness.launch->doc_url == "doc-42", "reviewer doc without hash");
                     require(harness.launch->ws_url == kRelayUrl, "reviewer relay");
                     require(harness.launch->log_path == dir / "reviewer.log", "reviewer log");
                     require(harness.reviewer_sent->size() == 1 &&
                                 harness.reviewer_sent->front() == "ADD \"Bread\"",
                             "reviewer command sent");

                     const auto &collab_result = result.value();
                     require(collab_result.session.steps.size() == 3, "three recorded steps");
                     require(collab_result.session.steps[0].tag == "boss", "role tag");
                     require(collab_result.sync.measurements.size() == 1 &&
                                 collab_result.sync.measurements[0].item == "Milk",
                             "sync measured");

                     auto boss_vtt = c::read_file(dir / "boss-captions.vtt");
                     require(boss_vtt.ok(), boss_vtt.error());
                     require(boss_vtt.value().find("Milk") != std::string::npos, "own step");
                     require(boss_vtt.value().find("Both wave") != std::string::npos, "shared step");
                     require(boss_vtt.value().find("Worker sees") == std::string::npos,
                             "other actor's step excluded");
                     auto worker_vtt = c::read_file(dir / "worker-captions.vtt");
                     require(worker_vtt.ok() &&
                                 worker_vtt.value().find("Worker sees") != std::string::npos,
                             "worker captions");
                     require(std::filesystem::exists(dir / "captions.vtt"), "combined captions");

                     require(harness.journal->index_of("relay.stop") <
                                 harness.journal->index_of("browser.close"),
                             "relay stops before the browser closes");
                   }});

  tests.push_back({"collab_failure_teardown_order", [] {
                     CollabHarness harness;
                     co::CollabSession collab(collab_options("collab-failure"), harness.deps());
                     auto result = collab.run([](co::CollabSession &) {
                       return c::Status::error("card never appeared");
                     });
                     require(!result.ok() && result.error() == "card never appeared", "scenario error wins");

                     const auto &journal = *harness.journal;
                     const int boss_shot = journal.index_of("screenshot boss-failure.png");
                     const int worker_shot = journal.index_of("screenshot worker-failure.png");
                     const int relay = journal.index_of("relay.stop");
                     const int reviewer = journal.index_of("reviewer.stop");
                     const int browser = journal.index_of("browser.close");
                     require(boss_shot >= 0 && worker_shot >= 0, "both actors captured");
                     require(worker_shot < relay, "screenshots before the relay stops");
                     require(relay < reviewer, "relay before reviewer");
                     require(reviewer < browser, "reviewer before the browser closes");
                   }});

  tests.push_back({"collab_setup_failure_tears_down", [] {
                     CollabHarness harness;
                     harness.browser->on_open = nullptr;
                     co::CollabSession collab(collab_options("collab-no-hash"), harness.deps());
                     bool ran = false;
                     auto result = collab.run([&ran](co::CollabSession &) {
                       ran = true;
                       return c::Status::success();
                     });
                     require(!ran, "scenario skipped");
                     require(!result.ok() && result.error() == "boss: no document hash after 300ms",
                             result.ok() ? "setup should fail" : result.error());
                     require(harness.reviewer_sent->empty() &&
                                 harness.journal->index_of("reviewer.stop") < 0,
                             "reviewer never started");
                     const int relay = harness.journal->index_of("relay.stop");
                     require(relay >= 0 && relay < harness.journal->index_of("browser.close"),
                             "relay stopped and browser closed");
                     require(!collab.reviewer_command("LIST").ok(), "no reviewer after teardown");
                   }});
}
