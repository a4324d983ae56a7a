#pragma once

#include "scenecast/actor/actor.hpp"
#include "scenecast/browser/browser.hpp"
#include "scenecast/browser/page_driver.hpp"
#include "scenecast/browser/window_layout.hpp"
#include "scenecast/capture/probe.hpp"
#include "scenecast/collab/relay.hpp"
#include "scenecast/collab/reviewer.hpp"
#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"
#include "scenecast/net/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scenecast::tests {

inline std::filesystem::path make_temp_dir(const std::string &name) {
  const auto dir = std::filesystem::temp_directory_path() / ("scenecast-test-" + name);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

// Ordered record of side effects shared by the fakes of one test.
class Journal {
public:
  void add(std::string entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
  }

  [[nodiscard]] std::vector<std::string> entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

  // Index of the first entry starting with `prefix`, or -1.
  [[nodiscard]] int index_of(const std::string &prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
      if (entries_[i].rfind(prefix, 0) == 0) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> entries_;
};

struct PageLog {
  std::string target_id;
  browser::Viewport viewport;
  std::vector<std::string> calls;
  std::vector<actor::Point> mouse_moves;
  std::vector<std::string> evaluations;
  std::vector<std::string> init_scripts;
  std::string typed;
  std::string content;
  bool closed = false;
  std::mutex mutex;
};

class FakePage final : public browser::IPageDriver {
public:
  using Evaluator = std::function<std::optional<std::string>(const std::string &expression)>;

  explicit FakePage(std::shared_ptr<PageLog> log = std::make_shared<PageLog>(),
                    std::shared_ptr<Journal> journal = nullptr)
      : log_(std::move(log)), journal_(std::move(journal)) {}

  void set_box(const std::string &selector, browser::Box box) { boxes_[selector] = box; }
  void set_hash(std::string hash) { hash_ = std::move(hash); }
  void set_evaluator(Evaluator evaluator) { evaluator_ = std::move(evaluator); }
  [[nodiscard]] PageLog &log() { return *log_; }

  [[nodiscard]] common::Status navigate(const std::string &url,
                                        std::chrono::milliseconds) override {
    record("navigate " + url);
    return common::Status::success();
  }

  [[nodiscard]] common::Status set_content(const std::string &html) override {
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->calls.push_back("set_content");
    log_->content = html;
    return common::Status::success();
  }

  [[nodiscard]] common::Result<std::string> evaluate(const std::string &expression) override {
    {
      std::lock_guard<std::mutex> lock(log_->mutex);
      log_->evaluations.push_back(expression);
    }
    if (evaluator_) {
      if (auto value = evaluator_(expression); value.has_value()) {
        return common::Result<std::string>::success(*value);
      }
    }
    if (expression == "document.readyState") {
      return common::Result<std::string>::success("complete");
    }
    if (expression == "document.location.hash") {
      return common::Result<std::string>::success(hash_);
    }
    if (expression.rfind("!!document.querySelector(", 0) == 0) {
      return common::Result<std::string>::success("false");
    }
    return common::Result<std::string>::success("");
  }

  [[nodiscard]] common::Result<browser::Box>
  wait_for_visible(const std::string &selector, std::chrono::milliseconds timeout) override {
    const auto found = boxes_.find(selector);
    if (found == boxes_.end()) {
      return common::Result<browser::Box>::failure("element not found: " + selector + " (waited " +
                                                   std::to_string(timeout.count()) + "ms)");
    }
    return common::Result<browser::Box>::success(found->second);
  }

  [[nodiscard]] common::Status mouse_move(double x, double y) override {
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->mouse_moves.push_back({x, y});
    return common::Status::success();
  }

  [[nodiscard]] common::Status mouse_down() override {
    record("mouse_down");
    return common::Status::success();
  }

  [[nodiscard]] common::Status mouse_up() override {
    record("mouse_up");
    return common::Status::success();
  }

  [[nodiscard]] common::Status press_key(const std::string &key) override {
    record("press_key " + key);
    return common::Status::success();
  }

  [[nodiscard]] common::Status type_character(const std::string &character) override {
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->typed += character;
    return common::Status::success();
  }

  [[nodiscard]] common::Status insert_text(const std::string &text) override {
    record("insert_text " + text);
    return common::Status::success();
  }

  [[nodiscard]] common::Status add_init_script(const std::string &source) override {
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->init_scripts.push_back(source);
    return common::Status::success();
  }

  [[nodiscard]] common::Status screenshot(const std::filesystem::path &path) override {
    record("screenshot " + path.filename().string());
    if (journal_ != nullptr) {
      journal_->add("screenshot " + path.filename().string());
    }
    return common::Status::success();
  }

  [[nodiscard]] common::Status start_screencast(const browser::ScreencastOptions &,
                                                browser::FrameHandler) override {
    record("start_screencast");
    return common::Status::success();
  }

  [[nodiscard]] common::Status stop_screencast() override {
    record("stop_screencast");
    return common::Status::success();
  }

  [[nodiscard]] browser::Viewport viewport() const override { return log_->viewport; }
  [[nodiscard]] std::string target_id() const override { return log_->target_id; }

  void close() override {
    {
      std::lock_guard<std::mutex> lock(log_->mutex);
      log_->closed = true;
    }
    if (journal_ != nullptr) {
      journal_->add("page.close " + log_->target_id);
    }
  }

private:
  void record(std::string call) {
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->calls.push_back(std::move(call));
  }

  std::shared_ptr<PageLog> log_;
  std::shared_ptr<Journal> journal_;
  std::unordered_map<std::string, browser::Box> boxes_;
  std::string hash_;
  Evaluator evaluator_;
};

using Placement = std::pair<std::string, browser::WindowBounds>;

class RecordingWindowPlacer final : public browser::IWindowPlacer {
public:
  explicit RecordingWindowPlacer(std::shared_ptr<std::vector<Placement>> placements)
      : placements_(std::move(placements)) {}

  [[nodiscard]] common::Status place(const std::string &target_id,
                                     const browser::WindowBounds &bounds) override {
    placements_->push_back({target_id, bounds});
    return common::Status::success();
  }
  [[nodiscard]] bool supported() const override { return true; }

private:
  std::shared_ptr<std::vector<Placement>> placements_;
};

class FakeBrowserHost final : public browser::IBrowserHost {
public:
  using PageHook = std::function<void(FakePage &page, std::size_t index)>;

  explicit FakeBrowserHost(std::shared_ptr<Journal> journal = std::make_shared<Journal>())
      : journal(std::move(journal)) {}

  [[nodiscard]] common::Status launch() override {
    ++launches;
    journal->add("browser.launch");
    return common::Status::success();
  }

  [[nodiscard]] common::Result<std::unique_ptr<browser::IPageDriver>>
  open_page(const browser::Viewport &viewport) override {
    auto log = std::make_shared<PageLog>();
    log->target_id = "target-" + std::to_string(pages.size());
    log->viewport = viewport;
    pages.push_back(log);
    auto page = std::make_unique<FakePage>(log, journal);
    if (on_open) {
      on_open(*page, pages.size() - 1);
    }
    return common::Result<std::unique_ptr<browser::IPageDriver>>::success(std::move(page));
  }

  [[nodiscard]] std::unique_ptr<browser::IWindowPlacer> window_placer() override {
    if (!placer_supported) {
      return nullptr;
    }
    return std::make_unique<RecordingWindowPlacer>(placements);
  }

  void close() override {
    ++closes;
    journal->add("browser.close");
  }

  std::shared_ptr<Journal> journal;
  int launches = 0;
  int closes = 0;
  bool placer_supported = false;
  std::vector<std::shared_ptr<PageLog>> pages;
  std::shared_ptr<std::vector<Placement>> placements = std::make_shared<std::vector<Placement>>();
  PageHook on_open;
};

class RecordingProcessRunner final : public common::IProcessRunner {
public:
  using Handler =
      std::function<common::Result<common::ProcessOutput>(const std::vector<std::string> &argv)>;

  [[nodiscard]] common::Result<common::ProcessOutput>
  run(const std::vector<std::string> &argv) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls.push_back(argv);
    }
    if (handler) {
      return handler(argv);
    }
    return common::Result<common::ProcessOutput>::success(common::ProcessOutput{0, ""});
  }

  std::vector<std::vector<std::string>> calls;
  Handler handler;

private:
  std::mutex mutex_;
};

class FakeMediaProbe final : public capture::IMediaProbe {
public:
  [[nodiscard]] std::optional<double> duration_seconds(const std::filesystem::path &) override {
    return duration;
  }

  [[nodiscard]] std::optional<std::int64_t> frame_count(const std::filesystem::path &path) override {
    const auto found = frames_by_file.find(path.filename().string());
    if (found != frames_by_file.end()) {
      return found->second;
    }
    return frames;
  }

  [[nodiscard]] std::optional<capture::VideoSize> video_size(const std::filesystem::path &) override {
    return size;
  }

  std::optional<double> duration;
  std::optional<std::int64_t> frames;
  std::unordered_map<std::string, std::int64_t> frames_by_file;
  std::optional<capture::VideoSize> size;
};

class FakeHttpClient final : public net::HttpClient {
public:
  struct Request {
    std::string url;
    std::string body;
  };

  [[nodiscard]] net::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &,
            const std::string &body, std::uint64_t) override {
    requests.push_back({url, body});
    return next();
  }

  [[nodiscard]] net::HttpResponse get(const std::string &url,
                                      const std::unordered_map<std::string, std::string> &,
                                      std::uint64_t) override {
    requests.push_back({url, ""});
    return next();
  }

  std::vector<Request> requests;
  std::deque<net::HttpResponse> responses;

private:
  net::HttpResponse next() {
    if (responses.empty()) {
      return net::HttpResponse{200, "", false, ""};
    }
    auto response = responses.front();
    responses.pop_front();
    return response;
  }
};

class FakeRelay final : public collab::IDocumentRelay {
public:
  FakeRelay(std::string url, std::shared_ptr<Journal> journal)
      : url_(std::move(url)), journal_(std::move(journal)) {}

  [[nodiscard]] std::string ws_url() const override { return url_; }
  [[nodiscard]] common::Status stop() override {
    journal_->add("relay.stop");
    return common::Status::success();
  }

private:
  std::string url_;
  std::shared_ptr<Journal> journal_;
};

class FakeReviewer final : public collab::IReviewer {
public:
  FakeReviewer(std::shared_ptr<std::vector<std::string>> sent, std::shared_ptr<Journal> journal)
      : sent_(std::move(sent)), journal_(std::move(journal)) {}

  [[nodiscard]] common::Status send(const std::string &command) override {
    sent_->push_back(command);
    return common::Status::success();
  }
  void stop() override { journal_->add("reviewer.stop"); }

private:
  std::shared_ptr<std::vector<std::string>> sent_;
  std::shared_ptr<Journal> journal_;
};

// Sleeper that only records the requested pauses.
inline actor::Sleeper recording_sleeper(std::shared_ptr<std::vector<std::int64_t>> pauses) {
  return [pauses](std::chrono::milliseconds duration) { pauses->push_back(duration.count()); };
}

} // namespace scenecast::tests
