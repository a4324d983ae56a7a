#include "scenecast/session/terminal.hpp"

#include "scenecast/common/fs.hpp"

#include <iostream>
#include <thread>

namespace scenecast::session {

namespace {

constexpr int PROCESS_SETTLE_MS = 300;
constexpr int AFTER_SEND_MS = 300;
constexpr int AFTER_ECHO_MS = 50;

} // namespace

const std::string &terminal_page_html() {
  static const std::string html = R"HTML(<!doctype html>
<html>
<head>
<meta charset="utf-8">
<style>
  html, body { margin: 0; height: 100%; background: #0d1117; }
  body { display: flex; flex-direction: column; font: 13px/1.45 ui-monospace, Menlo, Consolas, monospace; }
  #__sc_title { padding: 6px 12px; color: #8b949e; background: #161b22; border-bottom: 1px solid #30363d; }
  #__sc_term { flex: 1; margin: 0; padding: 10px 12px; color: #c9d1d9; white-space: pre-wrap; overflow-y: auto; }
  #__sc_term .echo { color: #7ee787; }
</style>
</head>
<body>
<div id="__sc_title"></div>
<pre id="__sc_term"></pre>
<script>
  (function () {
    var term = document.getElementById('__sc_term');
    var echo = null;
    window.__sc_appendOutput = function (text) {
      echo = null;
      term.appendChild(document.createTextNode(text));
      term.scrollTop = term.scrollHeight;
    };
    window.__sc_typeEcho = function (text) {
      if (!echo) {
        echo = document.createElement('span');
        echo.className = 'echo';
        echo.textContent = '$ ';
        term.appendChild(echo);
      }
      echo.textContent += text;
      if (text === '\n') echo = null;
      term.scrollTop = term.scrollHeight;
    };
    window.__sc_setTitle = function (text) {
      document.getElementById('__sc_title').textContent = text;
    };
  })();
</script>
</body>
</html>
)HTML";
  return html;
}

TerminalPane::TerminalPane(browser::IPageDriver &page, std::filesystem::path log_path,
                           config::RunMode mode, actor::ActorDelays delays, actor::Sleeper sleeper)
    : page_(page), log_path_(std::move(log_path)), mode_(mode), delays_(delays),
      sleeper_(std::move(sleeper)) {}

TerminalPane::~TerminalPane() { stop(); }

common::Status TerminalPane::render(const std::string &title) {
  auto loaded = page_.set_content(terminal_page_html());
  if (!loaded.ok()) {
    return loaded;
  }
  auto titled = page_.evaluate("window.__sc_setTitle(" + browser::js_string_literal(title) + ")");
  if (!titled.ok()) {
    return common::Status::error("terminal title: " + titled.error());
  }
  return common::Status::success();
}

common::Status TerminalPane::start(const std::string &command) {
  if (process_ != nullptr) {
    return common::Status::error("terminal already started");
  }
  {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_.open(log_path_, std::ios::out | std::ios::trunc);
    if (!log_) {
      return common::Status::error("failed to open terminal log: " + log_path_.string());
    }
  }

  common::ProcessSpec spec;
  spec.command = "sh";
  spec.args = {"-c", command};
  process_ = std::make_unique<common::Subprocess>(std::move(spec));
  auto started = process_->start([this](const std::string &line) { on_output(line); });
  if (!started.ok()) {
    process_.reset();
    return started;
  }
  sleep_ms(PROCESS_SETTLE_MS);
  return common::Status::success();
}

common::Status TerminalPane::send(const std::string &line) {
  if (process_ == nullptr) {
    return common::Status::success();
  }
  const std::string text = common::ends_with(line, "\n") ? line.substr(0, line.size() - 1) : line;

  if (mode_ == config::RunMode::Human && attached()) {
    const int key_delay = actor::pick_ms(delays_.key_delay);
    for (const auto &ch : common::utf8_characters(text)) {
      auto echoed = page_.evaluate("window.__sc_typeEcho(" + browser::js_string_literal(ch) + ")");
      if (!echoed.ok()) {
        return common::Status::error("terminal echo: " + echoed.error());
      }
      sleep_ms(key_delay);
    }
    auto newline = page_.evaluate("window.__sc_typeEcho('\\n')");
    if (!newline.ok()) {
      return common::Status::error("terminal echo: " + newline.error());
    }
    sleep_ms(AFTER_ECHO_MS);
  }

  auto written = process_->write_stdin(text + "\n");
  if (!written.ok()) {
    return written;
  }
  sleep_ms(AFTER_SEND_MS);
  return common::Status::success();
}

void TerminalPane::detach() {
  std::lock_guard<std::mutex> lock(page_mutex_);
  attached_ = false;
}

void TerminalPane::stop() {
  detach();
  if (process_ != nullptr) {
    process_->stop();
    process_.reset();
  }
  std::lock_guard<std::mutex> lock(log_mutex_);
  if (log_.is_open()) {
    log_.close();
  }
}

bool TerminalPane::attached() {
  std::lock_guard<std::mutex> lock(page_mutex_);
  return attached_;
}

bool TerminalPane::running() const { return process_ != nullptr && process_->is_running(); }

void TerminalPane::on_output(const std::string &line) {
  {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_.is_open()) {
      log_ << line << '\n';
      log_.flush();
    }
  }
  std::lock_guard<std::mutex> lock(page_mutex_);
  if (!attached_) {
    return;
  }
  auto shown =
      page_.evaluate("window.__sc_appendOutput(" + browser::js_string_literal(line + "\n") + ")");
  if (!shown.ok()) {
    std::cerr << "[terminal] " << shown.error() << "\n";
  }
}

void TerminalPane::sleep_ms(int ms) {
  if (ms <= 0) {
    return;
  }
  if (sleeper_) {
    sleeper_(std::chrono::milliseconds(ms));
  } else {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
}

} // namespace scenecast::session
