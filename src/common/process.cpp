#include "scenecast/common/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <set>
#include <sys/wait.h>
#include <unistd.h>

namespace scenecast::common {

namespace {

constexpr int POLL_TICK_MS = 100;
constexpr auto STOP_GRACE = std::chrono::milliseconds(1500);

std::mutex g_children_mutex;
std::set<pid_t> g_children;
std::once_flag g_reaper_once;
std::once_flag g_sigpipe_once;

void terminate_registered_children() {
  std::lock_guard<std::mutex> lock(g_children_mutex);
  for (const pid_t pid : g_children) {
    kill(-pid, SIGTERM);
    kill(pid, SIGTERM);
  }
  g_children.clear();
}

} // namespace

void register_child_process(pid_t pid) {
  std::call_once(g_reaper_once, [] { std::atexit(terminate_registered_children); });
  std::lock_guard<std::mutex> lock(g_children_mutex);
  g_children.insert(pid);
}

void unregister_child_process(pid_t pid) {
  std::lock_guard<std::mutex> lock(g_children_mutex);
  g_children.erase(pid);
}

Subprocess::Subprocess(ProcessSpec spec) : spec_(std::move(spec)) {}

Subprocess::~Subprocess() { stop(); }

Status Subprocess::start(LineHandler on_line) {
  if (pid_ != -1) {
    return Status::error("process already running: " + spec_.command);
  }
  if (spec_.command.empty()) {
    return Status::error("empty command");
  }
  std::call_once(g_sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

  int to_child[2] = {-1, -1};
  int from_child[2] = {-1, -1};
  if ((spec_.pipe_stdin && pipe(to_child) != 0) || pipe(from_child) != 0) {
    return Status::error("failed to create pipes: " + std::string(strerror(errno)));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    for (int fd : {to_child[0], to_child[1], from_child[0], from_child[1]}) {
      if (fd != -1) {
        close(fd);
      }
    }
    return Status::error("failed to fork: " + std::string(strerror(errno)));
  }

  if (pid == 0) {
    setpgid(0, 0);
    if (spec_.pipe_stdin) {
      close(to_child[1]);
      dup2(to_child[0], STDIN_FILENO);
      close(to_child[0]);
    } else {
      const int devnull = open("/dev/null", O_RDONLY);
      if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
      }
    }
    close(from_child[0]);
    dup2(from_child[1], STDOUT_FILENO);
    dup2(from_child[1], STDERR_FILENO);
    close(from_child[1]);

    for (const auto &[key, val] : spec_.env) {
      setenv(key.c_str(), val.c_str(), 1);
    }
    if (spec_.working_dir.has_value() && chdir(spec_.working_dir->c_str()) != 0) {
      _exit(126);
    }

    std::vector<const char *> argv;
    argv.push_back(spec_.command.c_str());
    for (const auto &arg : spec_.args) {
      argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    execvp(spec_.command.c_str(), const_cast<char *const *>(argv.data()));
    _exit(127);
  }

  if (spec_.pipe_stdin) {
    close(to_child[0]);
    stdin_fd_ = to_child[1];
  }
  close(from_child[1]);
  pid_ = pid;
  stdout_fd_ = from_child[0];
  stopping_ = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    exit_code_.reset();
    output_tail_.clear();
  }
  register_child_process(pid_);

  const int flags = fcntl(stdout_fd_, F_GETFL, 0);
  fcntl(stdout_fd_, F_SETFL, flags | O_NONBLOCK);

  on_line_ = std::move(on_line);
  pump_thread_ = std::thread([this] { pump_output(); });
  return Status::success();
}

void Subprocess::keep_output(const char *data, std::size_t size) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  output_tail_.append(data, size);
  if (output_tail_.size() > spec_.keep_output_bytes) {
    output_tail_.erase(0, output_tail_.size() - spec_.keep_output_bytes);
  }
}

void Subprocess::pump_output() {
  std::string line_buffer;
  std::array<char, 4096> chunk{};

  while (!stopping_) {
    struct pollfd pfd {};
    pfd.fd = stdout_fd_;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, POLL_TICK_MS);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = read(stdout_fd_, chunk.data(), chunk.size());
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }

    keep_output(chunk.data(), static_cast<std::size_t>(n));

    line_buffer.append(chunk.data(), static_cast<std::size_t>(n));
    std::size_t newline = 0;
    while ((newline = line_buffer.find_first_of("\r\n")) != std::string::npos) {
      std::string line = line_buffer.substr(0, newline);
      line_buffer.erase(0, newline + 1);
      if (on_line_ && !line.empty()) {
        on_line_(line);
      }
    }
  }

  // Drain whatever the child wrote before it exited.
  while (true) {
    const ssize_t n = read(stdout_fd_, chunk.data(), chunk.size());
    if (n <= 0) {
      break;
    }
    keep_output(chunk.data(), static_cast<std::size_t>(n));
    line_buffer.append(chunk.data(), static_cast<std::size_t>(n));
  }

  std::size_t newline = 0;
  while ((newline = line_buffer.find_first_of("\r\n")) != std::string::npos) {
    std::string line = line_buffer.substr(0, newline);
    line_buffer.erase(0, newline + 1);
    if (on_line_ && !line.empty()) {
      on_line_(line);
    }
  }
  if (on_line_ && !line_buffer.empty()) {
    on_line_(line_buffer);
  }
}

Status Subprocess::write_stdin(const std::string &data) {
  if (stdin_fd_ == -1) {
    return Status::error("stdin is not open for " + spec_.command);
  }
  std::size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t written = write(stdin_fd_, data.data() + offset, data.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Status::error("failed to write to " + spec_.command +
                           " stdin: " + std::string(strerror(errno)));
    }
    offset += static_cast<std::size_t>(written);
  }
  return Status::success();
}

void Subprocess::close_stdin() {
  if (stdin_fd_ != -1) {
    close(stdin_fd_);
    stdin_fd_ = -1;
  }
}

bool Subprocess::reap(bool block) {
  if (pid_ == -1) {
    return true;
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exit_code_.has_value()) {
      return true;
    }
  }
  int status = 0;
  const pid_t result = waitpid(pid_, &status, block ? 0 : WNOHANG);
  if (result == 0) {
    return false;
  }
  int code = -1;
  if (result == pid_) {
    if (WIFEXITED(status)) {
      code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      code = 128 + WTERMSIG(status);
    }
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  exit_code_ = code;
  unregister_child_process(pid_);
  return true;
}

bool Subprocess::wait_for_exit(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (reap(false)) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

void Subprocess::send_signal(int signal_number) {
  if (pid_ != -1 && !exit_code().has_value()) {
    kill(pid_, signal_number);
  }
}

void Subprocess::stop() {
  if (pid_ != -1 && !reap(false)) {
    kill(-pid_, SIGTERM);
    kill(pid_, SIGTERM);
    if (!wait_for_exit(STOP_GRACE)) {
      kill(-pid_, SIGKILL);
      kill(pid_, SIGKILL);
      (void)reap(true);
    }
  }
  close_stdin();
  stopping_ = true;
  if (pump_thread_.joinable()) {
    pump_thread_.join();
  }
  if (stdout_fd_ != -1) {
    close(stdout_fd_);
    stdout_fd_ = -1;
  }
}

bool Subprocess::is_running() const {
  if (pid_ == -1) {
    return false;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  return !exit_code_.has_value();
}

std::optional<int> Subprocess::exit_code() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return exit_code_;
}

std::string Subprocess::output_tail() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return output_tail_;
}

SystemProcessRunner::SystemProcessRunner(std::chrono::milliseconds timeout) : timeout_(timeout) {}

Result<ProcessOutput> SystemProcessRunner::run(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    return Result<ProcessOutput>::failure("empty command line");
  }
  ProcessSpec spec;
  spec.command = argv.front();
  spec.args.assign(argv.begin() + 1, argv.end());
  spec.pipe_stdin = false;
  spec.keep_output_bytes = 4 * 1024 * 1024;

  Subprocess process(std::move(spec));
  auto started = process.start();
  if (!started.ok()) {
    return Result<ProcessOutput>::failure(started.error());
  }
  if (!process.wait_for_exit(timeout_)) {
    process.stop();
    return Result<ProcessOutput>::failure(argv.front() + " timed out");
  }
  process.stop();

  ProcessOutput out;
  out.exit_code = process.exit_code().value_or(-1);
  out.output = process.output_tail();
  if (out.exit_code == 127) {
    return Result<ProcessOutput>::failure(argv.front() + " not found");
  }
  return Result<ProcessOutput>::success(std::move(out));
}

} // namespace scenecast::common
