#pragma once

#include "scenecast/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace scenecast::browser {

struct Viewport {
  int width = 1280;
  int height = 720;
};

struct Box {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
};

struct ScreencastOptions {
  int max_width = 1280;
  int max_height = 720;
  int quality = 80;
};

struct ScreencastFrame {
  std::string jpeg;
  double timestamp = 0.0;
};

using FrameHandler = std::function<void(const ScreencastFrame &frame)>;

/// Everything the runtime needs from one page. Coordinates are CSS pixels.
class IPageDriver {
public:
  virtual ~IPageDriver() = default;

  [[nodiscard]] virtual common::Status navigate(const std::string &url,
                                                std::chrono::milliseconds timeout) = 0;
  [[nodiscard]] virtual common::Status set_content(const std::string &html) = 0;
  /// String results come back unquoted; other values as JSON text.
  [[nodiscard]] virtual common::Result<std::string> evaluate(const std::string &expression) = 0;
  [[nodiscard]] virtual common::Result<Box>
  wait_for_visible(const std::string &selector, std::chrono::milliseconds timeout) = 0;

  [[nodiscard]] virtual common::Status mouse_move(double x, double y) = 0;
  [[nodiscard]] virtual common::Status mouse_down() = 0;
  [[nodiscard]] virtual common::Status mouse_up() = 0;
  [[nodiscard]] virtual common::Status press_key(const std::string &key) = 0;
  [[nodiscard]] virtual common::Status type_character(const std::string &character) = 0;
  [[nodiscard]] virtual common::Status insert_text(const std::string &text) = 0;

  [[nodiscard]] virtual common::Status add_init_script(const std::string &source) = 0;
  [[nodiscard]] virtual common::Status screenshot(const std::filesystem::path &path) = 0;
  [[nodiscard]] virtual common::Status start_screencast(const ScreencastOptions &options,
                                                        FrameHandler handler) = 0;
  [[nodiscard]] virtual common::Status stop_screencast() = 0;

  [[nodiscard]] virtual Viewport viewport() const = 0;
  [[nodiscard]] virtual std::string target_id() const = 0;
  virtual void close() = 0;
};

[[nodiscard]] std::string js_string_literal(const std::string &value);

} // namespace scenecast::browser
