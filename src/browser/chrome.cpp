#include "scenecast/browser/chrome.hpp"

#include "scenecast/common/fs.hpp"
#include "scenecast/common/json_util.hpp"
#include "scenecast/net/ports.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <thread>

#include <unistd.h>

namespace scenecast::browser {

namespace {

constexpr const char *kChromeCandidates[] = {
    "google-chrome", "google-chrome-stable", "chromium", "chromium-browser", "chrome",
};

bool is_executable(const std::filesystem::path &path) {
  return access(path.c_str(), X_OK) == 0 && !std::filesystem::is_directory(path);
}

} // namespace

common::Result<std::vector<std::string>>
build_chrome_launch_args(const ChromeLaunchOptions &options) {
  if (options.executable.empty()) {
    return common::Result<std::vector<std::string>>::failure("browser executable is required");
  }
  if (options.devtools_port == 0) {
    return common::Result<std::vector<std::string>>::failure("devtools port is required");
  }

  std::vector<std::string> args;
  args.push_back(options.executable);
  args.push_back("--remote-debugging-port=" + std::to_string(options.devtools_port));
  if (!options.user_data_dir.empty()) {
    args.push_back("--user-data-dir=" + options.user_data_dir.string());
  }
  args.push_back("--no-first-run");
  args.push_back("--no-default-browser-check");
  args.push_back("--disable-background-timer-throttling");
  args.push_back("--disable-backgrounding-occluded-windows");
  args.push_back("--disable-renderer-backgrounding");
  args.push_back("--autoplay-policy=no-user-gesture-required");
  args.push_back("--hide-scrollbars");
  if (options.headless) {
    args.push_back("--headless=new");
    args.push_back("--disable-gpu");
  }
  for (const auto &extra : options.extra_args) {
    args.push_back(extra);
  }
  args.push_back("about:blank");
  return common::Result<std::vector<std::string>>::success(std::move(args));
}

common::Result<std::string> build_devtools_ws_url(std::uint16_t port, const std::string &path) {
  if (port == 0) {
    return common::Result<std::string>::failure("invalid devtools port");
  }
  const std::string normalized = common::starts_with(path, "/") ? path : "/" + path;
  return common::Result<std::string>::success("ws://127.0.0.1:" + std::to_string(port) +
                                              normalized);
}

common::Result<std::string> find_chrome_executable() {
  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return common::Result<std::string>::failure("PATH is not set");
  }
  for (const char *candidate : kChromeCandidates) {
    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
      if (dir.empty()) {
        continue;
      }
      const auto full = std::filesystem::path(dir) / candidate;
      if (is_executable(full)) {
        return common::Result<std::string>::success(full.string());
      }
    }
  }
  return common::Result<std::string>::failure(
      "no Chrome or Chromium executable found on PATH (set browser.executable)");
}

ChromeProcess::ChromeProcess(std::shared_ptr<net::HttpClient> http) : http_(std::move(http)) {}

ChromeProcess::~ChromeProcess() { stop(); }

common::Status ChromeProcess::launch(ChromeLaunchOptions options) {
  if (process_ != nullptr) {
    return common::Status::error("browser already launched");
  }
  if (options.executable.empty()) {
    auto found = find_chrome_executable();
    if (!found.ok()) {
      return common::Status::error(found.error());
    }
    options.executable = found.value();
  }
  if (options.devtools_port == 0) {
    auto port = net::find_free_port();
    if (!port.ok()) {
      return common::Status::error(port.error());
    }
    options.devtools_port = port.value();
  }
  if (options.user_data_dir.empty()) {
    temp_profile_dir_ = std::filesystem::temp_directory_path() /
                        ("scenecast-profile-" + std::to_string(getpid()) + "-" +
                         std::to_string(options.devtools_port));
    options.user_data_dir = temp_profile_dir_;
  }

  auto args = build_chrome_launch_args(options);
  if (!args.ok()) {
    return common::Status::error(args.error());
  }

  common::ProcessSpec spec;
  spec.command = args.value().front();
  spec.args.assign(args.value().begin() + 1, args.value().end());
  spec.pipe_stdin = false;
  process_ = std::make_unique<common::Subprocess>(std::move(spec));
  auto started = process_->start();
  if (!started.ok()) {
    process_.reset();
    return started;
  }

  auto ws = poll_ws_url(options.devtools_port, options.launch_timeout);
  if (!ws.ok()) {
    const std::string tail = process_->output_tail();
    stop();
    return common::Status::error(ws.error() + (tail.empty() ? "" : "\n" + tail));
  }
  ws_url_ = ws.value();
  return common::Status::success();
}

common::Result<std::string> ChromeProcess::poll_ws_url(std::uint16_t port,
                                                       std::chrono::milliseconds timeout) {
  const std::string version_url = "http://127.0.0.1:" + std::to_string(port) + "/json/version";
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!process_->is_running()) {
      return common::Result<std::string>::failure("browser exited during startup");
    }
    const auto response = http_->get(version_url, {}, 1000);
    if (!response.network_error && response.status == 200) {
      const std::string ws = common::json_get_string(response.body, "webSocketDebuggerUrl");
      if (!ws.empty()) {
        return common::Result<std::string>::success(ws);
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return common::Result<std::string>::failure("timed out waiting for the DevTools endpoint");
}

void ChromeProcess::stop() {
  if (process_ != nullptr) {
    process_->stop();
    process_.reset();
  }
  if (!temp_profile_dir_.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(temp_profile_dir_, ec);
    temp_profile_dir_.clear();
  }
  ws_url_.clear();
}

bool ChromeProcess::is_running() const { return process_ != nullptr && process_->is_running(); }

} // namespace scenecast::browser
