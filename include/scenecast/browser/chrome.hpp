#pragma once

#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"
#include "scenecast/net/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace scenecast::browser {

struct ChromeLaunchOptions {
  std::string executable;
  std::uint16_t devtools_port = 0;
  std::filesystem::path user_data_dir;
  bool headless = true;
  std::vector<std::string> extra_args;
  std::chrono::milliseconds launch_timeout{15000};
};

[[nodiscard]] common::Result<std::vector<std::string>>
build_chrome_launch_args(const ChromeLaunchOptions &options);

[[nodiscard]] common::Result<std::string> build_devtools_ws_url(std::uint16_t port,
                                                                const std::string &path);

/// First Chrome/Chromium binary found on PATH.
[[nodiscard]] common::Result<std::string> find_chrome_executable();

/// Owns one Chrome process started with remote debugging enabled.
class ChromeProcess {
public:
  explicit ChromeProcess(std::shared_ptr<net::HttpClient> http);
  ~ChromeProcess();

  ChromeProcess(const ChromeProcess &) = delete;
  ChromeProcess &operator=(const ChromeProcess &) = delete;

  [[nodiscard]] common::Status launch(ChromeLaunchOptions options);
  void stop();

  [[nodiscard]] bool is_running() const;
  [[nodiscard]] const std::string &browser_ws_url() const { return ws_url_; }

private:
  [[nodiscard]] common::Result<std::string> poll_ws_url(std::uint16_t port,
                                                        std::chrono::milliseconds timeout);

  std::shared_ptr<net::HttpClient> http_;
  std::unique_ptr<common::Subprocess> process_;
  std::string ws_url_;
  std::filesystem::path temp_profile_dir_;
};

} // namespace scenecast::browser
