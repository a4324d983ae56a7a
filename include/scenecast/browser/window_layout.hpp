#pragma once

#include "scenecast/common/result.hpp"

#include <string>
#include <vector>

namespace scenecast::browser {

class CDPClient;

struct WindowBounds {
  int left = 0;
  int top = 0;
  int width = 0;
  int height = 0;
};

/// Places top-level browser windows. Selected once; callers never branch on support.
class IWindowPlacer {
public:
  virtual ~IWindowPlacer() = default;
  [[nodiscard]] virtual common::Status place(const std::string &target_id,
                                             const WindowBounds &bounds) = 0;
  [[nodiscard]] virtual bool supported() const = 0;
};

class CdpWindowPlacer final : public IWindowPlacer {
public:
  explicit CdpWindowPlacer(CDPClient &client);

  [[nodiscard]] common::Status place(const std::string &target_id,
                                     const WindowBounds &bounds) override;
  [[nodiscard]] bool supported() const override { return true; }

private:
  CDPClient &client_;
};

class NoopWindowPlacer final : public IWindowPlacer {
public:
  [[nodiscard]] common::Status place(const std::string &, const WindowBounds &) override {
    return common::Status::success();
  }
  [[nodiscard]] bool supported() const override { return false; }
};

/// Side-by-side columns of equal width filling `screen_width`.
[[nodiscard]] std::vector<WindowBounds> tile_horizontally(int count, int screen_width,
                                                          int screen_height, int left = 0,
                                                          int top = 0);

} // namespace scenecast::browser
