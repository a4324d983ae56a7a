#pragma once

#include "scenecast/common/result.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace scenecast::common {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> args;
  std::unordered_map<std::string, std::string> env;
  std::optional<std::filesystem::path> working_dir;
  bool pipe_stdin = true;
  std::size_t keep_output_bytes = 32 * 1024;
};

// A supervised child process. stdout and stderr are merged into one pipe that a single
// pump thread drains line by line.
class Subprocess {
public:
  using LineHandler = std::function<void(const std::string &line)>;

  explicit Subprocess(ProcessSpec spec);
  ~Subprocess();

  Subprocess(const Subprocess &) = delete;
  Subprocess &operator=(const Subprocess &) = delete;

  [[nodiscard]] Status start(LineHandler on_line = {});
  [[nodiscard]] Status write_stdin(const std::string &data);
  void close_stdin();

  // Returns true once the child has exited; the exit code is kept for exit_code().
  [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
  void send_signal(int signal_number);
  // SIGTERM, short grace period, then SIGKILL.
  void stop();

  [[nodiscard]] bool is_running() const;
  [[nodiscard]] pid_t pid() const { return pid_; }
  [[nodiscard]] std::optional<int> exit_code() const;
  [[nodiscard]] std::string output_tail() const;
  [[nodiscard]] const ProcessSpec &spec() const { return spec_; }

private:
  void pump_output();
  void keep_output(const char *data, std::size_t size);
  bool reap(bool block);

  ProcessSpec spec_;
  LineHandler on_line_;
  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  std::atomic<bool> stopping_{false};
  std::thread pump_thread_;
  mutable std::mutex state_mutex_;
  std::optional<int> exit_code_;
  std::string output_tail_;
};

struct ProcessOutput {
  int exit_code = -1;
  std::string output;
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;
  // Runs argv[0] with the remaining arguments to completion and collects merged output.
  [[nodiscard]] virtual Result<ProcessOutput> run(const std::vector<std::string> &argv) = 0;
};

class SystemProcessRunner final : public IProcessRunner {
public:
  explicit SystemProcessRunner(std::chrono::milliseconds timeout = std::chrono::minutes(10));

  [[nodiscard]] Result<ProcessOutput> run(const std::vector<std::string> &argv) override;

private:
  std::chrono::milliseconds timeout_;
};

// Children still registered when the program exits are sent SIGTERM.
void register_child_process(pid_t pid);
void unregister_child_process(pid_t pid);

} // namespace scenecast::common
