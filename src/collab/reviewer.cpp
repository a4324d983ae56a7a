#include "scenecast/collab/reviewer.hpp"

#include "scenecast/common/fs.hpp"

#include <csignal>
#include <iostream>

namespace scenecast::collab {

std::vector<std::string> build_reviewer_args(const ReviewerLaunch &launch) {
  std::vector<std::string> args = launch.args;
  args.insert(args.end(), {"--ws", launch.ws_url, "--doc", launch.doc_url, "--log",
                           launch.log_path.string()});
  return args;
}

std::string format_reviewer_command(const std::string &verb, const std::vector<std::string> &args) {
  std::string out = verb;
  for (const auto &arg : args) {
    out += " \"";
    for (const char ch : arg) {
      if (ch == '"' || ch == '\\') {
        out.push_back('\\');
      }
      out.push_back(ch == '\n' ? ' ' : ch);
    }
    out.push_back('"');
  }
  return out;
}

ReviewerProcess::ReviewerProcess(ReviewerLaunch launch) : launch_(std::move(launch)) {}

ReviewerProcess::~ReviewerProcess() { stop(); }

common::Status ReviewerProcess::start() {
  if (process_ != nullptr) {
    return common::Status::error("reviewer already started");
  }
  if (launch_.command.empty()) {
    return common::Status::error("reviewer command is empty");
  }
  auto log = common::write_file(launch_.log_path, "");
  if (!log.ok()) {
    return log;
  }

  common::ProcessSpec spec;
  spec.command = launch_.command;
  spec.args = build_reviewer_args(launch_);
  process_ = std::make_unique<common::Subprocess>(std::move(spec));
  auto started = process_->start(
      [](const std::string &line) { std::cerr << "[collab] reviewer: " << line << "\n"; });
  if (!started.ok()) {
    process_.reset();
    return started;
  }
  return common::Status::success();
}

common::Status ReviewerProcess::send(const std::string &command) {
  if (process_ == nullptr || !process_->is_running()) {
    return common::Status::error("reviewer process is not running");
  }
  return process_->write_stdin(common::ends_with(command, "\n") ? command : command + "\n");
}

void ReviewerProcess::stop() {
  if (process_ == nullptr) {
    return;
  }
  process_->stop();
  const auto code = process_->exit_code();
  if (code.has_value() && *code != 0 && *code != 128 + SIGTERM) {
    std::cerr << "[collab] reviewer exited with code " << *code << "\n";
  }
  process_.reset();
}

} // namespace scenecast::collab
