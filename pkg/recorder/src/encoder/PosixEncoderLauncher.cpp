// Repository: Segcast-recorder
// Component: Encoder Process
// Purpose: fork/execvp launcher with stdin pipe, stderr drain thread and exec-status pipe.
// Copyright (c) 2025 Segcast

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

#include "segcast/encoder/EncoderProcess.hpp"
#include "segcast/encoder/PipeEncoderInput.hpp"
#include "segcast/util/Logger.hpp"

namespace segcast::encoder {

namespace {

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void SetError(std::string* error, const std::string& text) {
  if (error) *error = text;
}

class PosixEncoderProcess : public IEncoderProcess {
 public:
  PosixEncoderProcess(pid_t pid, std::string label, int stdin_fd, int stderr_fd)
      : pid_(pid),
        label_(std::move(label)),
        input_(std::make_unique<PipeEncoderInput>(stdin_fd, label_)),
        stderr_fd_(stderr_fd) {
    stderr_thread_ = std::thread(&PosixEncoderProcess::DrainStderr, this);
  }

  ~PosixEncoderProcess() override {
    Terminate();
    if (stderr_thread_.joinable()) {
      stderr_thread_.join();
    }
    CloseFd(stderr_fd_);
  }

  std::unique_ptr<IEncoderInput> TakeInput() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::move(input_);
  }

  bool WaitForExit(std::chrono::milliseconds timeout) override {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
      if (TryReap()) return true;
      if (std::chrono::steady_clock::now() >= deadline) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  void Terminate() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) return;
    ::kill(pid_, SIGKILL);
    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    reaped_ = true;
    util::Logger::Info("[EncoderProcess:" + label_ + "] killed pid=" + std::to_string(pid_));
  }

  std::string Label() const override { return label_; }

 private:
  bool TryReap() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) return true;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
      reaped_ = true;
      if (r == pid_) {
        if (WIFEXITED(status)) {
          util::Logger::Info("[EncoderProcess:" + label_ + "] exited code=" +
                             std::to_string(WEXITSTATUS(status)));
        } else if (WIFSIGNALED(status)) {
          util::Logger::Info("[EncoderProcess:" + label_ + "] terminated signal=" +
                             std::to_string(WTERMSIG(status)));
        }
      }
      return true;
    }
    return false;
  }

  void DrainStderr() {
    std::string pending;
    char buf[4096];
    while (true) {
      ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR) continue;
        break;
      }
      if (n == 0) break;
      pending.append(buf, static_cast<size_t>(n));
      size_t pos;
      // ffmpeg progress lines end in '\r'; treat it as a line break too.
      while ((pos = pending.find_first_of("\r\n")) != std::string::npos) {
        if (pos > 0) {
          util::Logger::Debug("[EncoderProcess:" + label_ + "] " + pending.substr(0, pos));
        }
        pending.erase(0, pos + 1);
      }
    }
    if (!pending.empty()) {
      util::Logger::Debug("[EncoderProcess:" + label_ + "] " + pending);
    }
  }

  const pid_t pid_;
  const std::string label_;
  std::mutex mutex_;
  std::unique_ptr<IEncoderInput> input_;
  int stderr_fd_;
  bool reaped_ = false;
  std::thread stderr_thread_;
};

}  // namespace

PosixEncoderLauncher::PosixEncoderLauncher() { ::signal(SIGPIPE, SIG_IGN); }

std::unique_ptr<IEncoderProcess> PosixEncoderLauncher::Launch(const EncoderInvocation& invocation,
                                                              std::string* error) {
  const std::string label = StreamKindName(invocation.Kind());

  // argv is built before fork; the child only calls async-signal-safe functions.
  std::vector<std::string> args = invocation.BuildArgs();
  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(invocation.Binary().c_str()));
  for (auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int stdin_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (::pipe2(stdin_pipe, O_CLOEXEC) != 0 || ::pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(status_pipe, O_CLOEXEC) != 0) {
    SetError(error, label + ": pipe creation failed: " + std::strerror(errno));
    for (int* p : {stdin_pipe, stderr_pipe, status_pipe}) {
      CloseFd(p[0]);
      CloseFd(p[1]);
    }
    return nullptr;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    SetError(error, label + ": fork failed: " + std::strerror(errno));
    for (int* p : {stdin_pipe, stderr_pipe, status_pipe}) {
      CloseFd(p[0]);
      CloseFd(p[1]);
    }
    return nullptr;
  }

  if (pid == 0) {
    ::dup2(stdin_pipe[0], STDIN_FILENO);
    ::dup2(stderr_pipe[1], STDERR_FILENO);
    int devnull = ::open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDOUT_FILENO);
    }
    ::signal(SIGPIPE, SIG_DFL);
    ::execvp(argv[0], argv.data());
    int err = errno;
    ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  CloseFd(stdin_pipe[0]);
  CloseFd(stderr_pipe[1]);
  CloseFd(status_pipe[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(status_pipe[0]);

  if (n > 0) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    CloseFd(stdin_pipe[1]);
    CloseFd(stderr_pipe[0]);
    SetError(error, label + ": exec '" + invocation.Binary() + "' failed: " +
                        std::strerror(exec_errno));
    return nullptr;
  }

  int flags = ::fcntl(stdin_pipe[1], F_GETFL, 0);
  if (flags < 0 || ::fcntl(stdin_pipe[1], F_SETFL, flags | O_NONBLOCK) < 0) {
    util::Logger::Warn("[EncoderProcess:" + label + "] could not set O_NONBLOCK on stdin: " +
                       std::strerror(errno));
  }

  util::Logger::Info("[EncoderProcess:" + label + "] spawned pid=" + std::to_string(pid) +
                     " cmd=" + invocation.CommandLine());
  return std::make_unique<PosixEncoderProcess>(pid, label, stdin_pipe[1], stderr_pipe[0]);
}

}  // namespace segcast::encoder
