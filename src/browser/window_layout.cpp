#include "scenecast/browser/window_layout.hpp"

#include "scenecast/browser/cdp.hpp"
#include "scenecast/common/json_util.hpp"

#include <sstream>

namespace scenecast::browser {

CdpWindowPlacer::CdpWindowPlacer(CDPClient &client) : client_(client) {}

common::Status CdpWindowPlacer::place(const std::string &target_id, const WindowBounds &bounds) {
  auto window = client_.send_command("Browser.getWindowForTarget", {{"targetId", target_id}});
  if (!window.ok()) {
    return common::Status::error(window.error());
  }
  const auto id = window.value().find("windowId");
  if (id == window.value().end()) {
    return common::Status::error("Browser.getWindowForTarget returned no windowId");
  }

  // A maximized or minimized window ignores explicit bounds.
  (void)client_.send_command_json("Browser.setWindowBounds",
                                  R"({"windowId":)" + id->second +
                                      R"(,"bounds":{"windowState":"normal"}})");

  std::ostringstream params;
  params << R"({"windowId":)" << id->second << R"(,"bounds":{"left":)" << bounds.left
         << R"(,"top":)" << bounds.top << R"(,"width":)" << bounds.width << R"(,"height":)"
         << bounds.height << R"(,"windowState":"normal"}})";
  auto placed = client_.send_command_json("Browser.setWindowBounds", params.str());
  if (!placed.ok()) {
    return common::Status::error(placed.error());
  }
  return common::Status::success();
}

std::vector<WindowBounds> tile_horizontally(int count, int screen_width, int screen_height,
                                            int left, int top) {
  std::vector<WindowBounds> out;
  if (count <= 0 || screen_width <= 0 || screen_height <= 0) {
    return out;
  }
  const int width = screen_width / count;
  for (int i = 0; i < count; ++i) {
    out.push_back({left + i * width, top, width, screen_height});
  }
  return out;
}

} // namespace scenecast::browser
