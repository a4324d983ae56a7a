#include "scenecast/collab/relay.hpp"

#include "scenecast/common/fs.hpp"
#include "scenecast/net/ports.hpp"

#include <csignal>
#include <iostream>

namespace scenecast::collab {

namespace {

constexpr const char *RELAY_HOST = "127.0.0.1";
constexpr auto RELAY_EXIT_WAIT = std::chrono::seconds(5);

} // namespace

CommandRelay::CommandRelay(RelayCommand command) : command_(std::move(command)) {}

CommandRelay::~CommandRelay() {
  if (process_ != nullptr) {
    process_->stop();
  }
}

common::Status CommandRelay::start() {
  if (process_ != nullptr) {
    return common::Status::error("relay already started");
  }
  if (command_.command.empty()) {
    return common::Status::error("relay command is empty");
  }
  auto port = net::find_free_port();
  if (!port.ok()) {
    return common::Status::error(port.error());
  }
  port_ = port.value();

  common::ProcessSpec spec;
  spec.command = command_.command;
  spec.args = command_.args;
  spec.pipe_stdin = false;
  spec.env["PORT"] = std::to_string(port_);
  if (!command_.data_dir.empty()) {
    auto dir = common::ensure_dir(command_.data_dir);
    if (!dir.ok()) {
      return common::Status::error(dir.error());
    }
    spec.env["DATA_DIR"] = command_.data_dir.string();
  }

  process_ = std::make_unique<common::Subprocess>(std::move(spec));
  auto started = process_->start();
  if (!started.ok()) {
    process_.reset();
    return started;
  }

  auto listening = net::wait_for_port(RELAY_HOST, port_, command_.startup_timeout);
  if (!listening.ok()) {
    const std::string tail = process_->output_tail();
    process_->stop();
    process_.reset();
    std::string message = "relay did not open port " + std::string(RELAY_HOST) + ":" +
                          std::to_string(port_) + " within " +
                          std::to_string(command_.startup_timeout.count()) + "ms";
    if (!tail.empty()) {
      message += ": " + common::trim(tail);
    }
    return common::Status::error(message);
  }
  std::cout << "  Sync relay: " << ws_url() << "\n";
  return common::Status::success();
}

std::string CommandRelay::ws_url() const {
  return "ws://" + std::string(RELAY_HOST) + ":" + std::to_string(port_);
}

common::Status CommandRelay::stop() {
  if (process_ == nullptr) {
    return common::Status::success();
  }
  process_->send_signal(SIGINT);
  if (!process_->wait_for_exit(RELAY_EXIT_WAIT)) {
    std::cerr << "[collab] relay ignored SIGINT, terminating\n";
  }
  process_->stop();
  const auto code = process_->exit_code();
  const std::string tail = process_->output_tail();
  process_.reset();
  // Dying from our own signal is a clean shutdown.
  if (code.has_value() && *code != 0 && *code != 128 + SIGINT && *code != 128 + SIGTERM) {
    std::cerr << "[collab] relay exited with code " << *code << "\n";
    if (!common::trim(tail).empty()) {
      std::cerr << "[collab] relay output:\n" << common::trim(tail) << "\n";
    }
  }
  return common::Status::success();
}

} // namespace scenecast::collab
