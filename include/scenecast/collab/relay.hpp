#pragma once

#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace scenecast::collab {

/// WebSocket endpoint both collaborating pages sync their document through.
class IDocumentRelay {
public:
  virtual ~IDocumentRelay() = default;
  [[nodiscard]] virtual std::string ws_url() const = 0;
  [[nodiscard]] virtual common::Status stop() = 0;
};

/// A relay someone else runs.
class ExternalRelay final : public IDocumentRelay {
public:
  explicit ExternalRelay(std::string ws_url) : ws_url_(std::move(ws_url)) {}

  [[nodiscard]] std::string ws_url() const override { return ws_url_; }
  [[nodiscard]] common::Status stop() override { return common::Status::success(); }

private:
  std::string ws_url_;
};

struct RelayCommand {
  std::string command;
  std::vector<std::string> args;
  // Exported to the child as DATA_DIR.
  std::filesystem::path data_dir;
  std::chrono::milliseconds startup_timeout{8000};
};

/// Runs a relay server on a free loopback port, passed to it as PORT.
class CommandRelay final : public IDocumentRelay {
public:
  explicit CommandRelay(RelayCommand command);
  ~CommandRelay() override;

  CommandRelay(const CommandRelay &) = delete;
  CommandRelay &operator=(const CommandRelay &) = delete;

  /// Returns once the port accepts connections.
  [[nodiscard]] common::Status start();

  [[nodiscard]] std::string ws_url() const override;
  [[nodiscard]] common::Status stop() override;

private:
  RelayCommand command_;
  std::uint16_t port_ = 0;
  std::unique_ptr<common::Subprocess> process_;
};

} // namespace scenecast::collab
