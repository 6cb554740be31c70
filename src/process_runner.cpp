#include "process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace pcli2mcp {
namespace {

constexpr int kPollSliceMs = 50;
constexpr auto kDrainGrace = std::chrono::milliseconds(500);
constexpr size_t kReadChunk = 64 * 1024;

class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { Reset(); }
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int Get() const { return fd_; }
  bool Valid() const { return fd_ >= 0; }
  void Reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }
  int Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

 private:
  int fd_ = -1;
};

// Owns a spawned child until it has been reaped. The group is only ever
// signalled while the leader is unreaped (running or a zombie), so its pgid
// cannot belong to another request's child.
class ChildGuard {
 public:
  explicit ChildGuard(pid_t pid) : pid_(pid) {}
  ~ChildGuard() {
    if (pid_ <= 0 || reaped_) return;
    KillGroup();
    int status = 0;
    Reap(&status);
  }
  ChildGuard(const ChildGuard&) = delete;
  ChildGuard& operator=(const ChildGuard&) = delete;

  bool Reaped() const { return reaped_; }

  void KillGroup() {
    if (reaped_) return;
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
  }

  // Returns true once the child has exited; *status is filled on that call.
  // Whatever the leader left running in its group is killed before the
  // zombie is collected.
  bool TryReap(int* status) {
    if (reaped_) return true;
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (::waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) != 0 || info.si_pid != pid_) return false;
    KillGroup();
    Reap(status);
    return true;
  }

  void Reap(int* status) {
    if (reaped_) return;
    while (::waitpid(pid_, status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
  }

 private:
  pid_t pid_;
  bool reaped_ = false;
};

struct StreamCapture {
  UniqueFd fd;
  std::string* data = nullptr;
  bool* truncated = nullptr;
};

static bool MakePipe(UniqueFd* read_end, UniqueFd* write_end, std::string* err) {
  // Close-on-exec atomically, so children forked by concurrent requests
  // never inherit these ends.
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    if (err) *err = std::string("pipe: ") + std::strerror(errno);
    return false;
  }
  read_end->Reset(fds[0]);
  write_end->Reset(fds[1]);
  return true;
}

static void SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Reads what is available; closes the stream on EOF or a hard error.
static void DrainStream(StreamCapture* s, size_t cap) {
  char buf[kReadChunk];
  while (s->fd.Valid()) {
    const ssize_t n = ::read(s->fd.Get(), buf, sizeof(buf));
    if (n > 0) {
      const size_t room = cap > s->data->size() ? cap - s->data->size() : 0;
      const size_t take = std::min(room, static_cast<size_t>(n));
      s->data->append(buf, take);
      if (take < static_cast<size_t>(n)) *s->truncated = true;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    s->fd.Reset();
  }
}

static void DecodeStatus(int status, ExecutionResult* out) {
  if (WIFEXITED(status)) {
    out->exit_code = WEXITSTATUS(status);
    out->term_signal = 0;
  } else if (WIFSIGNALED(status)) {
    out->exit_code = kExitTerminated;
    out->term_signal = WTERMSIG(status);
  }
}

}  // namespace

std::optional<ExecutionResult> RunProcess(const std::vector<std::string>& argv,
                                          const ProcessLimits& limits,
                                          std::string* err) {
  if (argv.empty() || argv[0].empty()) {
    if (err) *err = "empty command";
    return std::nullopt;
  }

  UniqueFd out_r, out_w, err_r, err_w, exec_r, exec_w;
  if (!MakePipe(&out_r, &out_w, err) || !MakePipe(&err_r, &err_w, err) || !MakePipe(&exec_r, &exec_w, err)) {
    return std::nullopt;
  }
  UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (!dev_null.Valid()) {
    if (err) *err = std::string("open /dev/null: ") + std::strerror(errno);
    return std::nullopt;
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  const auto start = std::chrono::steady_clock::now();
  const pid_t pid = ::fork();
  if (pid < 0) {
    if (err) *err = std::string("fork: ") + std::strerror(errno);
    return std::nullopt;
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only until exec.
    ::setpgid(0, 0);
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_DFL;
    ::sigaction(SIGPIPE, &sa, nullptr);
    ::dup2(dev_null.Get(), STDIN_FILENO);
    ::dup2(out_w.Get(), STDOUT_FILENO);
    ::dup2(err_w.Get(), STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());
    const int e = errno;
    ssize_t ignored = ::write(exec_w.Get(), &e, sizeof(e));
    (void)ignored;
    ::_exit(127);
  }

  ChildGuard child(pid);
  ::setpgid(pid, pid);
  out_w.Reset();
  err_w.Reset();
  exec_w.Reset();
  dev_null.Reset();

  // The exec pipe closes on a successful exec; otherwise it carries errno.
  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(exec_r.Get(), &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    child.Reap(&status);
    if (err) *err = "failed to execute " + argv[0] + ": " + std::strerror(exec_errno);
    return std::nullopt;
  }
  exec_r.Reset();

  ExecutionResult result;
  result.pid = pid;
  StreamCapture streams[2];
  streams[0].fd.Reset(out_r.Release());
  streams[0].data = &result.stdout_data;
  streams[0].truncated = &result.stdout_truncated;
  streams[1].fd.Reset(err_r.Release());
  streams[1].data = &result.stderr_data;
  streams[1].truncated = &result.stderr_truncated;
  for (auto& s : streams) SetNonBlocking(s.fd.Get());

  const auto deadline = start + limits.wall_clock;
  auto drain_deadline = deadline;
  int status = 0;

  while (true) {
    if (!child.Reaped() && child.TryReap(&status)) {
      drain_deadline = std::chrono::steady_clock::now() + kDrainGrace;
    }
    const bool streams_open = streams[0].fd.Valid() || streams[1].fd.Valid();
    if (child.Reaped() && !streams_open) break;

    const auto now = std::chrono::steady_clock::now();
    if (!child.Reaped() && now >= deadline) {
      result.timed_out = true;
      child.KillGroup();
      child.Reap(&status);
      drain_deadline = now + kDrainGrace;
      continue;
    }
    if (child.Reaped() && now >= drain_deadline) break;

    const auto limit = child.Reaped() ? drain_deadline : deadline;
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now).count();
    const int wait_ms = static_cast<int>(std::max<long long>(1, std::min<long long>(remaining, kPollSliceMs)));

    struct pollfd pfds[2];
    StreamCapture* polled[2];
    nfds_t n = 0;
    for (auto& s : streams) {
      if (!s.fd.Valid()) continue;
      pfds[n].fd = s.fd.Get();
      pfds[n].events = POLLIN;
      pfds[n].revents = 0;
      polled[n] = &s;
      n++;
    }
    const int ready = ::poll(n ? pfds : nullptr, n, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      if (err) *err = std::string("poll: ") + std::strerror(errno);
      break;
    }
    for (nfds_t i = 0; i < n; i++) {
      if (pfds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) DrainStream(polled[i], limits.max_output_bytes);
    }
  }

  if (!child.Reaped()) {
    child.KillGroup();
    child.Reap(&status);
  }
  DecodeStatus(status, &result);
  result.elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  return result;
}

}  // namespace pcli2mcp
