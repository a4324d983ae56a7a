#include "scenecast/browser/browser.hpp"

#include "scenecast/common/crypto.hpp"
#include "scenecast/common/fs.hpp"
#include "scenecast/common/json_util.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <thread>

namespace scenecast::browser {

namespace {

struct KeyDefinition {
  const char *key;
  const char *code;
  int key_code;
  const char *text;
};

constexpr KeyDefinition kSpecialKeys[] = {
    {"Enter", "Enter", 13, "\r"},
    {"Tab", "Tab", 9, ""},
    {"Backspace", "Backspace", 8, ""},
    {"Delete", "Delete", 46, ""},
    {"Escape", "Escape", 27, ""},
    {"ArrowLeft", "ArrowLeft", 37, ""},
    {"ArrowUp", "ArrowUp", 38, ""},
    {"ArrowRight", "ArrowRight", 39, ""},
    {"ArrowDown", "ArrowDown", 40, ""},
    {"Home", "Home", 36, ""},
    {"End", "End", 35, ""},
    {"PageUp", "PageUp", 33, ""},
    {"PageDown", "PageDown", 34, ""},
    {"Space", "Space", 32, " "},
};

int modifier_bit(const std::string &name) {
  if (name == "Alt") return 1;
  if (name == "Control" || name == "Ctrl") return 2;
  if (name == "Meta" || name == "Command") return 4;
  if (name == "Shift") return 8;
  return 0;
}

std::string key_event_json(const std::string &type, const std::string &key,
                           const std::string &code, int key_code, const std::string &text,
                           int modifiers) {
  std::ostringstream out;
  out << R"({"type":")" << type << R"(","key":")" << common::json_escape(key) << '"';
  if (!code.empty()) {
    out << R"(,"code":")" << common::json_escape(code) << '"';
  }
  if (key_code != 0) {
    out << R"(,"windowsVirtualKeyCode":)" << key_code;
  }
  if (!text.empty()) {
    out << R"(,"text":")" << common::json_escape(text) << '"';
  }
  if (modifiers != 0) {
    out << R"(,"modifiers":)" << modifiers;
  }
  out << '}';
  return out.str();
}

std::string format_number(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

} // namespace

std::string js_string_literal(const std::string &value) {
  return "\"" + common::json_escape(value) + "\"";
}

CdpPage::CdpPage(CDPClient &client, std::string context_id, std::string target_id,
                 std::string session_id, Viewport viewport)
    : client_(client), context_id_(std::move(context_id)), target_id_(std::move(target_id)),
      session_id_(std::move(session_id)), viewport_(viewport) {}

CdpPage::~CdpPage() { close(); }

common::Result<JsonMap> CdpPage::command(const std::string &method, const JsonMap &params) {
  if (closed_) {
    return common::Result<JsonMap>::failure(method + ": page is closed");
  }
  return client_.send_command(method, params, session_id_);
}

common::Status CdpPage::initialize() {
  for (const char *domain : {"Page.enable", "Runtime.enable"}) {
    auto enabled = command(domain);
    if (!enabled.ok()) {
      return common::Status::error(enabled.error());
    }
  }
  auto metrics = command("Emulation.setDeviceMetricsOverride",
                         {{"width", std::to_string(viewport_.width)},
                          {"height", std::to_string(viewport_.height)},
                          {"deviceScaleFactor", "1"},
                          {"mobile", "false"}});
  if (!metrics.ok()) {
    return common::Status::error(metrics.error());
  }
  return common::Status::success();
}

common::Status CdpPage::navigate(const std::string &url, std::chrono::milliseconds timeout) {
  auto response = command("Page.navigate", {{"url", url}});
  if (!response.ok()) {
    return common::Status::error(response.error());
  }
  const auto error_text = response.value().find("errorText");
  if (error_text != response.value().end() && !error_text->second.empty()) {
    return common::Status::error("navigation to " + url + " failed: " + error_text->second);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    auto state = evaluate("document.readyState");
    if (state.ok() && state.value() == "complete") {
      return common::Status::success();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return common::Status::error("timed out waiting for " + url + " to load");
}

common::Status CdpPage::set_content(const std::string &html) {
  auto tree = command("Page.getFrameTree");
  if (!tree.ok()) {
    return common::Status::error(tree.error());
  }
  const auto frame_tree = tree.value().find("frameTree");
  if (frame_tree == tree.value().end()) {
    return common::Status::error("Page.getFrameTree returned no frameTree");
  }
  const std::string frame_id =
      common::json_get_string(common::json_get_object(frame_tree->second, "frame"), "id");
  auto set = client_.send_command_json("Page.setDocumentContent",
                                       R"({"frameId":")" + common::json_escape(frame_id) +
                                           R"(","html":")" + common::json_escape(html) + "\"}",
                                       session_id_);
  if (!set.ok()) {
    return common::Status::error(set.error());
  }
  return common::Status::success();
}

common::Result<std::string> CdpPage::evaluate(const std::string &expression) {
  if (closed_) {
    return common::Result<std::string>::failure("page is closed");
  }
  auto response = client_.evaluate_js(expression, session_id_);
  if (!response.ok()) {
    return common::Result<std::string>::failure(response.error());
  }
  const auto result = response.value().find("result");
  if (result == response.value().end()) {
    return common::Result<std::string>::success("");
  }
  const std::string &object = result->second;
  const std::string type = common::json_get_string(object, "type");
  if (type == "undefined") {
    return common::Result<std::string>::success("");
  }
  if (type == "object") {
    std::string value = common::json_get_object(object, "value");
    if (value.empty()) {
      value = common::json_get_array(object, "value");
    }
    return common::Result<std::string>::success(value);
  }
  return common::Result<std::string>::success(common::json_get_string(object, "value"));
}

common::Result<Box> CdpPage::wait_for_visible(const std::string &selector,
                                              std::chrono::milliseconds timeout) {
  const std::string probe =
      "(() => { const el = document.querySelector(" + js_string_literal(selector) +
      "); if (!el) return ''; const s = getComputedStyle(el);"
      " if (s.visibility === 'hidden' || s.display === 'none') return '';"
      " const r = el.getBoundingClientRect(); if (r.width === 0 && r.height === 0) return '';"
      " return JSON.stringify({x: r.x, y: r.y, width: r.width, height: r.height}); })()";

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string last_error;
  do {
    auto found = evaluate(probe);
    if (found.ok() && !found.value().empty()) {
      const std::string &json = found.value();
      try {
        Box box;
        box.x = std::stod(common::json_get_number(json, "x"));
        box.y = std::stod(common::json_get_number(json, "y"));
        box.width = std::stod(common::json_get_number(json, "width"));
        box.height = std::stod(common::json_get_number(json, "height"));
        return common::Result<Box>::success(box);
      } catch (const std::exception &) {
        last_error = "malformed bounding box";
      }
    } else if (!found.ok()) {
      last_error = found.error();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  } while (std::chrono::steady_clock::now() < deadline);

  return common::Result<Box>::failure("element not found: " + selector + " (waited " +
                                      std::to_string(timeout.count()) + "ms" +
                                      (last_error.empty() ? "" : ", " + last_error) + ")");
}

common::Status CdpPage::dispatch_mouse(const std::string &type) {
  std::ostringstream params;
  params << R"({"type":")" << type << R"(","x":)" << format_number(mouse_x_) << R"(,"y":)"
         << format_number(mouse_y_) << R"(,"button":")"
         << (type == "mouseMoved" && !mouse_pressed_ ? "none" : "left") << R"(","buttons":)"
         << (mouse_pressed_ ? 1 : 0);
  if (type != "mouseMoved") {
    params << R"(,"clickCount":1)";
  }
  params << '}';
  auto response = client_.send_command_json("Input.dispatchMouseEvent", params.str(), session_id_);
  if (!response.ok()) {
    return common::Status::error(response.error());
  }
  return common::Status::success();
}

common::Status CdpPage::mouse_move(double x, double y) {
  mouse_x_ = x;
  mouse_y_ = y;
  return dispatch_mouse("mouseMoved");
}

common::Status CdpPage::mouse_down() {
  mouse_pressed_ = true;
  return dispatch_mouse("mousePressed");
}

common::Status CdpPage::mouse_up() {
  mouse_pressed_ = false;
  return dispatch_mouse("mouseReleased");
}

common::Status CdpPage::press_key(const std::string &key) {
  int modifiers = 0;
  std::string base = key;
  std::size_t plus = 0;
  while (base.size() > 1 && (plus = base.find('+')) != std::string::npos && plus + 1 < base.size()) {
    const int bit = modifier_bit(base.substr(0, plus));
    if (bit == 0) {
      break;
    }
    modifiers |= bit;
    base = base.substr(plus + 1);
  }

  std::string code;
  int key_code = 0;
  std::string text;
  bool known = false;
  for (const auto &definition : kSpecialKeys) {
    if (base == definition.key) {
      code = definition.code;
      key_code = definition.key_code;
      text = definition.text;
      known = true;
      break;
    }
  }
  if (!known) {
    if (base.size() != 1) {
      return common::Status::error("unknown key: " + key);
    }
    const char c = base[0];
    if (std::isalpha(static_cast<unsigned char>(c)) != 0) {
      code = std::string("Key") + static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      key_code = std::toupper(static_cast<unsigned char>(c));
    } else if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      code = std::string("Digit") + c;
      key_code = c;
    }
    // Ctrl/Meta chords must not insert text.
    if ((modifiers & (2 | 4)) == 0) {
      text = base;
    }
  }

  auto down = client_.send_command_json(
      "Input.dispatchKeyEvent",
      key_event_json(text.empty() ? "rawKeyDown" : "keyDown", base, code, key_code, text,
                     modifiers),
      session_id_);
  if (!down.ok()) {
    return common::Status::error(down.error());
  }
  auto up = client_.send_command_json("Input.dispatchKeyEvent",
                                      key_event_json("keyUp", base, code, key_code, "", modifiers),
                                      session_id_);
  if (!up.ok()) {
    return common::Status::error(up.error());
  }
  return common::Status::success();
}

common::Status CdpPage::type_character(const std::string &character) {
  if (character == "\n" || character == "\r") {
    return press_key("Enter");
  }
  auto down = client_.send_command_json(
      "Input.dispatchKeyEvent", key_event_json("keyDown", character, "", 0, character, 0),
      session_id_);
  if (!down.ok()) {
    return common::Status::error(down.error());
  }
  auto up = client_.send_command_json("Input.dispatchKeyEvent",
                                      key_event_json("keyUp", character, "", 0, "", 0),
                                      session_id_);
  if (!up.ok()) {
    return common::Status::error(up.error());
  }
  return common::Status::success();
}

common::Status CdpPage::insert_text(const std::string &text) {
  auto response = client_.send_command_json(
      "Input.insertText", R"({"text":")" + common::json_escape(text) + "\"}", session_id_);
  if (!response.ok()) {
    return common::Status::error(response.error());
  }
  return common::Status::success();
}

common::Status CdpPage::add_init_script(const std::string &source) {
  auto response = client_.send_command_json(
      "Page.addScriptToEvaluateOnNewDocument",
      R"({"source":")" + common::json_escape(source) + "\"}", session_id_);
  if (!response.ok()) {
    return common::Status::error(response.error());
  }
  return common::Status::success();
}

common::Status CdpPage::screenshot(const std::filesystem::path &path) {
  auto data = client_.capture_screenshot(session_id_);
  if (!data.ok()) {
    return common::Status::error(data.error());
  }
  auto png = common::base64_decode(data.value());
  if (!png.ok()) {
    return common::Status::error("screenshot decode failed: " + png.error());
  }
  return common::write_file(path, png.value());
}

common::Status CdpPage::start_screencast(const ScreencastOptions &options, FrameHandler handler) {
  {
    std::lock_guard<std::mutex> lock(screencast_mutex_);
    screencast_handler_ = std::move(handler);
  }
  if (screencast_listener_ == 0) {
    screencast_listener_ = client_.on_event(
        "Page.screencastFrame", [this](const std::string &session_id, const JsonMap &params) {
          if (session_id != session_id_) {
            return;
          }
          const auto frame_session = params.find("sessionId");
          if (frame_session != params.end()) {
            (void)client_.send_command("Page.screencastFrameAck",
                                       {{"sessionId", frame_session->second}}, session_id_);
          }
          const auto data = params.find("data");
          if (data == params.end()) {
            return;
          }
          auto jpeg = common::base64_decode(data->second);
          if (!jpeg.ok()) {
            return;
          }
          ScreencastFrame frame;
          frame.jpeg = std::move(jpeg.value());
          const auto metadata = params.find("metadata");
          if (metadata != params.end()) {
            const std::string ts = common::json_get_number(metadata->second, "timestamp");
            try {
              frame.timestamp = ts.empty() ? 0.0 : std::stod(ts);
            } catch (const std::exception &) {
              frame.timestamp = 0.0;
            }
          }
          std::lock_guard<std::mutex> lock(screencast_mutex_);
          if (screencast_handler_) {
            screencast_handler_(frame);
          }
        });
  }

  auto started = command("Page.startScreencast", {{"format", "jpeg"},
                                                  {"quality", std::to_string(options.quality)},
                                                  {"maxWidth", std::to_string(options.max_width)},
                                                  {"maxHeight", std::to_string(options.max_height)},
                                                  {"everyNthFrame", "1"}});
  if (!started.ok()) {
    return common::Status::error(started.error());
  }
  return common::Status::success();
}

common::Status CdpPage::stop_screencast() {
  auto stopped = command("Page.stopScreencast");
  if (screencast_listener_ != 0) {
    client_.remove_event_listener(screencast_listener_);
    screencast_listener_ = 0;
  }
  {
    std::lock_guard<std::mutex> lock(screencast_mutex_);
    screencast_handler_ = nullptr;
  }
  if (!stopped.ok()) {
    return common::Status::error(stopped.error());
  }
  return common::Status::success();
}

void CdpPage::close() {
  if (closed_) {
    return;
  }
  if (screencast_listener_ != 0) {
    client_.remove_event_listener(screencast_listener_);
    screencast_listener_ = 0;
  }
  closed_ = true;
  if (!client_.is_connected()) {
    return;
  }
  (void)client_.send_command("Target.closeTarget", {{"targetId", target_id_}});
  if (!context_id_.empty()) {
    (void)client_.send_command("Target.disposeBrowserContext",
                               {{"browserContextId", context_id_}});
  }
}

ChromeBrowserHost::ChromeBrowserHost(ChromeHostOptions options,
                                     std::shared_ptr<net::HttpClient> http)
    : options_(std::move(options)), process_(std::move(http)) {}

ChromeBrowserHost::~ChromeBrowserHost() { close(); }

common::Status ChromeBrowserHost::launch() {
  if (client_ != nullptr) {
    return common::Status::error("browser already launched");
  }
  std::string ws_url = options_.existing_ws_url;
  if (ws_url.empty()) {
    auto launched = process_.launch(options_.launch);
    if (!launched.ok()) {
      return launched;
    }
    ws_url = process_.browser_ws_url();
  }

  client_ = std::make_unique<CDPClient>(std::make_unique<WebSocketTransport>());
  auto connected = client_->connect(ws_url);
  if (!connected.ok()) {
    client_.reset();
    process_.stop();
    return common::Status::error("failed to connect to browser: " + connected.error());
  }
  return common::Status::success();
}

common::Result<std::unique_ptr<IPageDriver>> ChromeBrowserHost::open_page(const Viewport &viewport) {
  using PageResult = common::Result<std::unique_ptr<IPageDriver>>;
  if (client_ == nullptr) {
    return PageResult::failure("browser is not launched");
  }

  auto context = client_->send_command("Target.createBrowserContext", {{"disposeOnDetach", "true"}});
  if (!context.ok()) {
    return PageResult::failure(context.error());
  }
  const std::string context_id = context.value()["browserContextId"];

  auto target = client_->send_command("Target.createTarget",
                                      {{"url", "about:blank"},
                                       {"browserContextId", context_id},
                                       {"newWindow", "true"},
                                       {"width", std::to_string(viewport.width)},
                                       {"height", std::to_string(viewport.height)}});
  if (!target.ok()) {
    return PageResult::failure(target.error());
  }
  const std::string target_id = target.value()["targetId"];

  auto attached = client_->send_command("Target.attachToTarget",
                                        {{"targetId", target_id}, {"flatten", "true"}});
  if (!attached.ok()) {
    return PageResult::failure(attached.error());
  }

  auto page = std::make_unique<CdpPage>(*client_, context_id, target_id,
                                        attached.value()["sessionId"], viewport);
  auto initialized = page->initialize();
  if (!initialized.ok()) {
    page->close();
    return PageResult::failure(initialized.error());
  }
  return PageResult::success(std::move(page));
}

std::unique_ptr<IWindowPlacer> ChromeBrowserHost::window_placer() {
  if (client_ == nullptr || options_.launch.headless) {
    return std::make_unique<NoopWindowPlacer>();
  }
  return std::make_unique<CdpWindowPlacer>(*client_);
}

void ChromeBrowserHost::close() {
  if (client_ != nullptr) {
    if (options_.existing_ws_url.empty()) {
      (void)client_->send_command("Browser.close", {}, "", std::chrono::seconds(5));
    }
    client_->disconnect();
    client_.reset();
  }
  process_.stop();
}

} // namespace scenecast::browser
