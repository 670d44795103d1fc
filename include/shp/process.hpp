/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file process.hpp
 * @brief Linux process primitives: spawn, signal, reap, /proc introspection.
 *
 * Uses /proc for discovery and POSIX signals for control. Linux-only
 * (requires /proc, kill(2), pipe2(2)).
 *
 * Features:
 *   - Subprocess: spawn with argv, working directory, environment block and
 *     a merged stdout+stderr pipe; each child leads its own session so the
 *     whole process tree can be signalled through the process group.
 *   - Spawn failures (chdir, exec) are reported synchronously to the parent
 *     through a close-on-exec error pipe, carrying the child's errno.
 *   - Non-blocking reads with explicit EOF, poll(2)-based readiness wait,
 *     non-blocking reap (TryReap) and bounded Wait.
 *   - Process discovery: ForEachProcess (comm, argv[0] basename, CPU ticks,
 *     RSS).
 *   - Process control: Freeze/Resume/Kill/Renice by PID.
 */

#ifndef SHP_PROCESS_HPP_
#define SHP_PROCESS_HPP_

#include "shp/platform.hpp"

#if defined(SHP_PLATFORM_LINUX)

#include "shp/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <dirent.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace shp {

// ============================================================================
// ProcStatus
// ============================================================================

enum class ProcStatus : int8_t {
  kSuccess = 0,
  kNotFound = -1,   ///< Process not found by name / pid
  kFailed = -2,     ///< Spawn, signal delivery or state change failed
  kWaitError = -3,  ///< waitpid(2) error
  kTimedOut = -4,   ///< Bounded operation ran out of time
};

namespace detail {

// ============================================================================
// DirGuard - RAII wrapper for DIR*
// ============================================================================

class DirGuard {
 public:
  explicit DirGuard(DIR* dir) : dir_(dir) {}
  ~DirGuard() {
    if (dir_) {
      closedir(dir_);
    }
  }
  DIR* get() const { return dir_; }

  DirGuard(const DirGuard&) = delete;
  DirGuard& operator=(const DirGuard&) = delete;

 private:
  DIR* dir_;
};

// ============================================================================
// Helper functions
// ============================================================================

/// @brief Sleep for @p ms milliseconds (nanosleep, not deprecated usleep).
inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  nanosleep(&ts, nullptr);
}

/// @brief Check if string consists entirely of ASCII digits.
inline bool IsDigitString(const char* s) {
  if (*s == '\0')
    return false;
  for (; *s != '\0'; ++s) {
    if (*s < '0' || *s > '9')
      return false;
  }
  return true;
}

/// @brief Extract basename from a path (e.g., "/usr/bin/foo" -> "foo").
inline const char* Basename(const char* path) {
  const char* last_slash = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/')
      last_slash = p;
  }
  return last_slash ? (last_slash + 1) : path;
}

/// @brief Read content of a /proc file into @p buf (up to buf_size-1 bytes).
/// @return Number of bytes read, or -1 on error.
inline int ReadProcFile(const char* path, char* buf, size_t buf_size) {
  int fd = open(path, O_RDONLY | O_CLOEXEC);  // NOLINT
  if (fd < 0)
    return -1;
  ssize_t n = read(fd, buf, buf_size - 1);
  close(fd);  // NOLINT
  if (n < 0)
    return -1;
  buf[static_cast<size_t>(n)] = '\0';
  return static_cast<int>(n);
}

/// @brief Set a file descriptor to non-blocking mode.
inline bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0)
    return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

/// @brief write(2) the whole buffer, retrying on EINTR. Async-signal-safe.
inline void WriteAll(int fd, const void* data, size_t len) {
  const char* p = static_cast<const char*>(data);
  while (len > 0) {
    ssize_t n = write(fd, p, len);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return;
    }
    p += n;
    len -= static_cast<size_t>(n);
  }
}

// ============================================================================
// PipeGuard - RAII wrapper for pipe file descriptors
// ============================================================================

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  /// @brief Create a pipe with the given pipe2(2) flags.
  bool Create(int flags = 0) { return pipe2(fd_, flags) == 0; }

  int ReadEnd() const { return fd_[0]; }
  int WriteEnd() const { return fd_[1]; }

  void CloseRead() {
    if (fd_[0] >= 0) {
      close(fd_[0]);
      fd_[0] = -1;
    }  // NOLINT
  }
  void CloseWrite() {
    if (fd_[1] >= 0) {
      close(fd_[1]);
      fd_[1] = -1;
    }  // NOLINT
  }
  void CloseAll() {
    CloseRead();
    CloseWrite();
  }

  /// @brief Release read-end ownership (caller takes responsibility).
  int ReleaseRead() {
    int r = fd_[0];
    fd_[0] = -1;
    return r;
  }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

 private:
  int fd_[2];
};

}  // namespace detail

// ============================================================================
// Process query functions
// ============================================================================

/**
 * @brief Read single-char process state from /proc/[pid]/status.
 * @param pid Process ID.
 * @return State character ('R','S','D','T','Z','X','I') or '\0' on error.
 */
inline char ReadProcessState(pid_t pid) {
  char path[64];
  snprintf(path, sizeof(path), "/proc/%d/status", static_cast<int>(pid));

  char buf[1024];
  if (detail::ReadProcFile(path, buf, sizeof(buf)) < 0) {
    return '\0';
  }

  const char* state_line = strstr(buf, "State:");
  if (!state_line)
    return '\0';

  const char* p = state_line + 6;
  while (*p == ' ' || *p == '\t')
    ++p;
  return *p;
}

/// @brief Check if a process is in stopped (T) state.
inline bool IsProcessStopped(pid_t pid) {
  return ReadProcessState(pid) == 'T';
}

/**
 * @brief Check if a process is alive (exists, can receive signals, and is
 *        not a zombie waiting to be reaped).
 */
inline bool IsProcessAlive(pid_t pid) {
  if (pid <= 0 || kill(pid, 0) != 0)
    return false;
  return ReadProcessState(pid) != 'Z';
}

// ============================================================================
// ProcessEntry / ForEachProcess - /proc enumeration
// ============================================================================

/// @brief One /proc/[pid] record.
struct ProcessEntry {
  pid_t pid = -1;
  pid_t pgid = -1;
  char state = '\0';
  FixedString<15> comm;       ///< Kernel comm (max 15 chars)
  FixedString<63> exe_name;   ///< argv[0] basename from cmdline (may be empty)
  uint64_t cpu_ticks = 0;     ///< utime + stime, in clock ticks
  uint64_t rss_kb = 0;        ///< Resident set size (kB)
};

/**
 * @brief Parse /proc/[pid]/stat and /proc/[pid]/cmdline into @p out.
 * @return false if the process vanished or the record is malformed.
 */
inline bool ReadProcessEntry(pid_t pid, ProcessEntry& out) {
  char path[64];
  char buf[1024];
  snprintf(path, sizeof(path), "/proc/%d/stat", static_cast<int>(pid));
  if (detail::ReadProcFile(path, buf, sizeof(buf)) <= 0)
    return false;

  // Format: "pid (comm) state ppid pgrp ..."; comm may contain spaces and
  // parentheses, so locate the last ')'.
  const char* open_paren = strchr(buf, '(');
  const char* close_paren = strrchr(buf, ')');
  if (open_paren == nullptr || close_paren == nullptr || close_paren < open_paren)
    return false;

  out.pid = pid;
  out.comm.assign(TruncateToCapacity, open_paren + 1, static_cast<uint32_t>(close_paren - open_paren - 1));

  // Fields after ')': 3=state 4=ppid 5=pgrp ... 14=utime 15=stime ... 24=rss
  char state = '\0';
  int ppid = 0;
  int pgrp = 0;
  unsigned long long utime = 0;
  unsigned long long stime = 0;
  long long rss_pages = 0;
  const int parsed = sscanf(close_paren + 1,
                            " %c %d %d %*d %*d %*d %*u %*u %*u %*u %*u %llu %llu %*d %*d %*d %*d %*d %*d %*u %*u %lld",
                            &state, &ppid, &pgrp, &utime, &stime, &rss_pages);
  if (parsed < 5)
    return false;

  out.state = state;
  out.pgid = static_cast<pid_t>(pgrp);
  out.cpu_ticks = static_cast<uint64_t>(utime + stime);
  const long page_kb = sysconf(_SC_PAGESIZE) / 1024;
  out.rss_kb = (rss_pages > 0 && page_kb > 0) ? static_cast<uint64_t>(rss_pages) * static_cast<uint64_t>(page_kb) : 0;

  snprintf(path, sizeof(path), "/proc/%d/cmdline", static_cast<int>(pid));
  const int n = detail::ReadProcFile(path, buf, 256);
  if (n > 0) {
    // cmdline is NUL-separated; first segment is argv[0]. Windows-style
    // paths handed to a compatibility layer may use backslashes.
    const char* base = detail::Basename(buf);
    const char* bslash = strrchr(base, '\\');
    out.exe_name.assign(TruncateToCapacity, (bslash != nullptr) ? bslash + 1 : base);
  } else {
    out.exe_name.clear();
  }
  return true;
}

/**
 * @brief Invoke @p fn(const ProcessEntry&) for every readable /proc entry.
 * @return Number of entries visited, or -1 if /proc could not be opened.
 *
 * @note TOCTOU: entries are a snapshot; a process may exit (and its PID be
 *       reused) between enumeration and any action taken on it.
 */
template <typename Fn>
inline int32_t ForEachProcess(Fn&& fn) {
  detail::DirGuard dir(opendir("/proc"));
  if (!dir.get()) {
    return -1;
  }

  int32_t visited = 0;
  struct dirent* entry;
  while ((entry = readdir(dir.get())) != nullptr) {
    if (entry->d_type != DT_DIR)
      continue;
    if (!detail::IsDigitString(entry->d_name))
      continue;

    ProcessEntry pe;
    if (!ReadProcessEntry(static_cast<pid_t>(atoi(entry->d_name)), pe))
      continue;
    ++visited;
    fn(static_cast<const ProcessEntry&>(pe));
  }
  return visited;
}

// ============================================================================
// Process control functions
// ============================================================================

/**
 * @brief Freeze (SIGSTOP) a process by PID.
 * @return kSuccess if frozen, kFailed if signal delivery or state check fails.
 */
inline ProcStatus FreezeProcess(pid_t pid) {
  if (kill(pid, SIGSTOP) != 0) {
    return ProcStatus::kFailed;
  }
  detail::SleepMs(1);
  return IsProcessStopped(pid) ? ProcStatus::kSuccess : ProcStatus::kFailed;
}

/**
 * @brief Resume (SIGCONT) a stopped process by PID with retry.
 * @param attempts Maximum retry count (default 3).
 */
inline ProcStatus ResumeProcess(pid_t pid, uint32_t attempts = 3) {
  for (uint32_t i = 0; i < attempts; ++i) {
    if (kill(pid, SIGCONT) == 0) {
      detail::SleepMs(1);
      if (!IsProcessStopped(pid)) {
        return ProcStatus::kSuccess;
      }
      detail::SleepMs(100);
    }
  }
  return ProcStatus::kFailed;
}

/// @brief Send @p signo to a PID without waiting. For non-child processes.
inline ProcStatus SignalProcess(pid_t pid, int signo) {
  if (pid <= 0)
    return ProcStatus::kFailed;
  if (kill(pid, signo) == 0)
    return ProcStatus::kSuccess;
  return (errno == ESRCH) ? ProcStatus::kNotFound : ProcStatus::kFailed;
}

/// @brief Send SIGKILL without waitpid. For non-child processes.
inline ProcStatus KillProcess(pid_t pid) {
  return SignalProcess(pid, SIGKILL);
}

/**
 * @brief Lower a process's scheduling priority by @p increment nice steps
 *        (clamped to 19).
 */
inline ProcStatus ReniceProcess(pid_t pid, int increment) {
  errno = 0;
  const int current = getpriority(PRIO_PROCESS, static_cast<id_t>(pid));
  if (current == -1 && errno != 0) {
    return (errno == ESRCH) ? ProcStatus::kNotFound : ProcStatus::kFailed;
  }
  int target = current + increment;
  if (target > 19)
    target = 19;
  if (setpriority(PRIO_PROCESS, static_cast<id_t>(pid), target) != 0) {
    return (errno == ESRCH) ? ProcStatus::kNotFound : ProcStatus::kFailed;
  }
  return ProcStatus::kSuccess;
}

// ============================================================================
// Subprocess - spawn child process with merged output capture
// ============================================================================

/// @brief Subprocess configuration.
struct SubprocessConfig {
  const char* const* argv;  ///< NULL-terminated argument array
  const char* const* envp;  ///< NULL-terminated "K=V" array (nullptr = inherit)
  const char* working_dir;  ///< chdir before exec (nullptr = inherit)
  bool capture_output;      ///< Redirect child stdout+stderr into one pipe
  bool new_session;         ///< setsid() so the child leads its own group

  SubprocessConfig()
      : argv(nullptr), envp(nullptr), working_dir(nullptr), capture_output(false), new_session(true) {}
};

/// @brief Wait result from Wait / TryReap.
struct WaitResult {
  bool exited;      ///< true if child exited normally
  int exit_code;    ///< Exit code (valid if exited==true)
  bool signaled;    ///< true if child was killed by signal
  int term_signal;  ///< Signal number (valid if signaled==true)
  bool timed_out;   ///< true if wait timed out

  WaitResult() : exited(false), exit_code(-1), signaled(false), term_signal(0), timed_out(false) {}

  /// Shell-style code: exit status, or 128+signal when signalled.
  int ShellCode() const { return exited ? exit_code : (signaled ? 128 + term_signal : -1); }
};

/// @brief Result of one non-blocking read.
struct ReadChunk {
  int32_t bytes = 0;   ///< >0 bytes copied into the caller's buffer
  bool eof = false;    ///< Writer side closed (all descriptors released)
  bool error = false;  ///< read(2) failed with something other than EAGAIN
};

/**
 * @brief Child process handle.
 *
 * RAII: the destructor kills the child's process group if it was never
 * reaped and closes the output pipe.
 *
 * Usage:
 * @code
 *   const char* argv[] = {"/bin/echo", "hi", nullptr};
 *   shp::SubprocessConfig cfg;
 *   cfg.argv = argv;
 *   cfg.capture_output = true;
 *
 *   shp::Subprocess proc;
 *   if (proc.Start(cfg) == shp::ProcStatus::kSuccess) {
 *     char buf[256];
 *     auto chunk = proc.ReadOutput(buf, sizeof(buf));
 *     auto wr = proc.Wait();
 *   }
 * @endcode
 */
class Subprocess {
 public:
  Subprocess() : pid_(-1), out_fd_(-1), start_errno_(0), group_(false) {}

  ~Subprocess() { Release(); }

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  Subprocess(Subprocess&& other) noexcept
      : pid_(other.pid_), out_fd_(other.out_fd_), start_errno_(other.start_errno_), group_(other.group_) {
    other.pid_ = -1;
    other.out_fd_ = -1;
  }

  Subprocess& operator=(Subprocess&& other) noexcept {
    if (this != &other) {
      Release();
      pid_ = other.pid_;
      out_fd_ = other.out_fd_;
      start_errno_ = other.start_errno_;
      group_ = other.group_;
      other.pid_ = -1;
      other.out_fd_ = -1;
    }
    return *this;
  }

  /**
   * @brief Spawn a child process.
   *
   * Returns only after the child has either exec'd successfully or failed;
   * on failure the child is reaped and StartErrno() holds its errno.
   *
   * @return kSuccess on success, kFailed on pipe/fork/chdir/exec error.
   */
  ProcStatus Start(const SubprocessConfig& cfg) {
    start_errno_ = 0;
    if (!cfg.argv || !cfg.argv[0]) {
      start_errno_ = EINVAL;
      return ProcStatus::kFailed;
    }
    if (pid_ > 0) {
      start_errno_ = EBUSY;
      return ProcStatus::kFailed;
    }

    detail::PipeGuard out_pipe;
    detail::PipeGuard err_pipe;
    if (cfg.capture_output && !out_pipe.Create(O_CLOEXEC)) {
      start_errno_ = errno;
      return ProcStatus::kFailed;
    }
    if (!err_pipe.Create(O_CLOEXEC)) {
      start_errno_ = errno;
      return ProcStatus::kFailed;
    }

    pid_t child = fork();
    if (child < 0) {
      start_errno_ = errno;
      return ProcStatus::kFailed;
    }

    if (child == 0) {
      // -- Child process: async-signal-safe calls only --
      if (cfg.new_session) {
        setsid();
      }

      // Reset all signal dispositions to default (SIG_IGN survives exec)
      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);  // ignore errors for uncatchable
      }
      sigset_t empty;
      sigemptyset(&empty);
      sigprocmask(SIG_SETMASK, &empty, nullptr);

      if (cfg.working_dir && chdir(cfg.working_dir) != 0) {
        const int e = errno;
        detail::WriteAll(err_pipe.WriteEnd(), &e, sizeof(e));
        _exit(127);
      }

      if (cfg.capture_output) {
        dup2(out_pipe.WriteEnd(), STDOUT_FILENO);
        dup2(out_pipe.WriteEnd(), STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);  // NOLINT
        if (devnull >= 0) {
          dup2(devnull, STDIN_FILENO);
        }
      }

      // argv[0] with a slash is used verbatim; bare names search PATH.
      if (std::strchr(cfg.argv[0], '/') != nullptr) {
        if (cfg.envp) {
          execve(cfg.argv[0], const_cast<char* const*>(cfg.argv), const_cast<char* const*>(cfg.envp));
        } else {
          execv(cfg.argv[0], const_cast<char* const*>(cfg.argv));
        }
      } else if (cfg.envp) {
        execvpe(cfg.argv[0], const_cast<char* const*>(cfg.argv), const_cast<char* const*>(cfg.envp));
      } else {
        execvp(cfg.argv[0], const_cast<char* const*>(cfg.argv));
      }
      const int e = errno;
      detail::WriteAll(err_pipe.WriteEnd(), &e, sizeof(e));
      _exit(127);
    }

    // -- Parent process --
    err_pipe.CloseWrite();
    int child_errno = 0;
    ssize_t n;
    do {
      n = read(err_pipe.ReadEnd(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
      // exec (or chdir) failed in the child; collect it.
      int status;
      while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
      }
      start_errno_ = child_errno;
      return ProcStatus::kFailed;
    }

    pid_ = child;
    group_ = cfg.new_session;

    if (cfg.capture_output) {
      out_pipe.CloseWrite();
      out_fd_ = out_pipe.ReleaseRead();
      detail::SetNonBlocking(out_fd_);
    }

    return ProcStatus::kSuccess;
  }

  /// @brief errno from the last failed Start() (0 if none).
  int StartErrno() const { return start_errno_; }

  /**
   * @brief Non-blocking read from the merged output pipe.
   */
  ReadChunk ReadOutput(char* buf, size_t buf_size) {
    ReadChunk rc;
    if (out_fd_ < 0 || buf_size == 0) {
      rc.eof = true;
      return rc;
    }
    ssize_t n;
    do {
      n = read(out_fd_, buf, buf_size);
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
      rc.bytes = static_cast<int32_t>(n);
    } else if (n == 0) {
      rc.eof = true;
    } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
      rc.error = true;
    }
    return rc;
  }

  /**
   * @brief Block up to @p timeout_ms until the output pipe is readable
   *        (data or EOF).
   * @return true if a read will not block.
   */
  bool WaitReadable(uint32_t timeout_ms) const {
    if (out_fd_ < 0)
      return false;
    struct pollfd pfd;
    pfd.fd = out_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int r;
    do {
      r = poll(&pfd, 1, static_cast<int>(timeout_ms));
    } while (r < 0 && errno == EINTR);
    return r > 0;
  }

  /// @brief Close the read end of the output pipe.
  void CloseOutput() {
    if (out_fd_ >= 0) {
      close(out_fd_);  // NOLINT
      out_fd_ = -1;
    }
  }

  /**
   * @brief Reap the child if it has exited (WNOHANG).
   * @return true if reaped (@p out filled, handle no longer owns a PID).
   */
  bool TryReap(WaitResult& out) {
    if (pid_ <= 0)
      return false;
    int status;
    pid_t w;
    do {
      w = waitpid(pid_, &status, WNOHANG);
    } while (w < 0 && errno == EINTR);
    if (w == pid_) {
      FillWaitResult(status, out);
      pid_ = -1;
      return true;
    }
    if (w < 0) {
      // ECHILD: somebody else reaped it; report as unknown exit.
      out = WaitResult();
      pid_ = -1;
      return true;
    }
    return false;
  }

  /**
   * @brief Wait for child process to exit.
   * @param timeout_ms Timeout in milliseconds (0 = wait forever).
   */
  WaitResult Wait(uint32_t timeout_ms = 0) {
    WaitResult wr;
    if (pid_ <= 0) {
      wr.exited = true;
      wr.exit_code = -1;
      return wr;
    }

    if (timeout_ms == 0) {
      int status;
      pid_t w;
      do {
        w = waitpid(pid_, &status, 0);
      } while (w < 0 && errno == EINTR);
      if (w > 0) {
        FillWaitResult(status, wr);
      }
      pid_ = -1;
      return wr;
    }

    const uint64_t deadline = SteadyNowMs() + timeout_ms;
    constexpr uint32_t kPollIntervalMs = 5;
    while (SteadyNowMs() < deadline) {
      if (TryReap(wr)) {
        return wr;
      }
      detail::SleepMs(kPollIntervalMs);
    }

    wr.timed_out = true;
    return wr;
  }

  /**
   * @brief Send a signal to the child (its whole process group when the
   *        child leads a session).
   */
  ProcStatus Signal(int signo) {
    if (pid_ <= 0)
      return ProcStatus::kNotFound;
    const pid_t target = group_ ? -pid_ : pid_;
    if (kill(target, signo) == 0)
      return ProcStatus::kSuccess;
    if (errno == ESRCH && group_ && kill(pid_, signo) == 0)
      return ProcStatus::kSuccess;
    return (errno == ESRCH) ? ProcStatus::kNotFound : ProcStatus::kFailed;
  }

  /// @brief Child PID (-1 if not started or already reaped).
  pid_t GetPid() const { return pid_; }

  /// @brief Check if child is still running.
  bool IsRunning() const { return pid_ > 0 && IsProcessAlive(pid_); }

  bool HasOutput() const { return out_fd_ >= 0; }

 private:
  pid_t pid_;
  int out_fd_;
  int start_errno_;
  bool group_;

  void Release() {
    CloseOutput();
    if (pid_ > 0) {
      (void)Signal(SIGKILL);
      int status;
      while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
      pid_ = -1;
    }
  }

  static void FillWaitResult(int status, WaitResult& wr) {
    if (WIFEXITED(status)) {
      wr.exited = true;
      wr.exit_code = WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      wr.signaled = true;
      wr.term_signal = WTERMSIG(status);
    }
  }
};

// ============================================================================
// Convenience: run a command with a bounded wait and capture output
// ============================================================================

/**
 * @brief Run a command and capture its merged stdout+stderr.
 *
 * @param argv        NULL-terminated argument array.
 * @param[out] output Captured output (at most @p max_bytes retained).
 * @param[out] exit_code Child exit code (-1 if not exited normally).
 * @param timeout_ms  Upper bound on the whole run (0 = unbounded). On
 *                    expiry the child's group is killed.
 * @return kSuccess if the child ran to completion, kTimedOut on expiry,
 *         kFailed on spawn error.
 */
inline ProcStatus RunCommand(const char* const* argv, std::string& output, int& exit_code, uint32_t timeout_ms = 0,
                             size_t max_bytes = 64U * 1024U) {
  SubprocessConfig cfg;
  cfg.argv = argv;
  cfg.capture_output = true;

  exit_code = -1;
  output.clear();

  Subprocess proc;
  ProcStatus r = proc.Start(cfg);
  if (r != ProcStatus::kSuccess)
    return r;

  const uint64_t deadline = (timeout_ms == 0) ? UINT64_MAX : SteadyNowMs() + timeout_ms;
  char buf[4096];
  bool eof = false;
  while (!eof) {
    const uint64_t now = SteadyNowMs();
    if (now >= deadline) {
      (void)proc.Signal(SIGKILL);
      (void)proc.Wait();
      return ProcStatus::kTimedOut;
    }
    const uint64_t remaining = deadline - now;
    (void)proc.WaitReadable(static_cast<uint32_t>(remaining > 100U ? 100U : remaining));
    for (;;) {
      ReadChunk rc = proc.ReadOutput(buf, sizeof(buf));
      if (rc.bytes > 0) {
        const size_t room = (output.size() < max_bytes) ? max_bytes - output.size() : 0;
        output.append(buf, static_cast<size_t>(rc.bytes) < room ? static_cast<size_t>(rc.bytes) : room);
        continue;
      }
      eof = rc.eof || rc.error;
      break;
    }
  }

  const uint64_t now = SteadyNowMs();
  const uint32_t left =
      (deadline == UINT64_MAX) ? 0U : static_cast<uint32_t>(deadline > now ? (deadline - now) : 1U);
  WaitResult wr = proc.Wait(left);
  if (wr.timed_out) {
    (void)proc.Signal(SIGKILL);
    (void)proc.Wait();
    return ProcStatus::kTimedOut;
  }
  exit_code = wr.exited ? wr.exit_code : -1;
  return ProcStatus::kSuccess;
}

}  // namespace shp

#endif  // defined(SHP_PLATFORM_LINUX)

#endif  // SHP_PROCESS_HPP_
