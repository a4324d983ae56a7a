#pragma once

#include "scenecast/common/process.hpp"
#include "scenecast/common/result.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace scenecast::collab {

struct ReviewerLaunch {
  std::string command;
  // Placed before the generated --ws/--doc/--log flags.
  std::vector<std::string> args;
  std::string ws_url;
  // Without the leading '#'.
  std::string doc_url;
  std::filesystem::path log_path;
};

[[nodiscard]] std::vector<std::string> build_reviewer_args(const ReviewerLaunch &launch);

/// `VERB "arg" "arg"`, with embedded quotes and backslashes escaped.
[[nodiscard]] std::string format_reviewer_command(const std::string &verb,
                                                  const std::vector<std::string> &args);

/// Third collaborator that edits the shared document from a command line.
class IReviewer {
public:
  virtual ~IReviewer() = default;
  /// Sends one command line.
  [[nodiscard]] virtual common::Status send(const std::string &command) = 0;
  virtual void stop() = 0;
};

class ReviewerProcess final : public IReviewer {
public:
  explicit ReviewerProcess(ReviewerLaunch launch);
  ~ReviewerProcess() override;

  ReviewerProcess(const ReviewerProcess &) = delete;
  ReviewerProcess &operator=(const ReviewerProcess &) = delete;

  [[nodiscard]] common::Status start();
  [[nodiscard]] common::Status send(const std::string &command) override;
  void stop() override;

private:
  ReviewerLaunch launch_;
  std::unique_ptr<common::Subprocess> process_;
};

} // namespace scenecast::collab
