#include <geobeam/process.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <geobeam/errors.hpp>
#include <geobeam/logging.hpp>

namespace geobeam {

namespace {

std::string errno_text(int err) { return std::strerror(err); }

void close_fd(int& fd) {
  if (fd >= 0) { ::close(fd); fd = -1; }
}

class PosixChildProcess : public ChildProcessHandle {
public:
  PosixChildProcess(pid_t pid, int stdin_fd) : pid_(pid), stdin_fd_(stdin_fd) {}

  ~PosixChildProcess() override {
    close_fd(stdin_fd_);
    if (!poll()) {
      // Never leave a zombie or an orphaned broadcaster behind.
      ::kill(pid_, SIGKILL);
      int status = 0;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
  }

  PosixChildProcess(const PosixChildProcess&) = delete;
  PosixChildProcess& operator=(const PosixChildProcess&) = delete;

  void signal_quit() override {
    if (stdin_fd_ < 0) return;
    const char q = 'q';
    ssize_t n;
    do { n = ::write(stdin_fd_, &q, 1); } while (n < 0 && errno == EINTR);
    if (n < 0) log()->debug("quit write to pid {} failed: {}", pid_, errno_text(errno));
    close_fd(stdin_fd_);
  }

  void terminate() override {
    if (!exited_) ::kill(pid_, SIGTERM);
  }

  void kill() override {
    if (!exited_) ::kill(pid_, SIGKILL);
  }

  bool poll() override {
    if (exited_) return true;
    int status = 0;
    pid_t r;
    do { r = ::waitpid(pid_, &status, WNOHANG); } while (r < 0 && errno == EINTR);
    if (r == pid_) {
      exited_ = true;
      if (WIFEXITED(status)) {
        log()->debug("pid {} exited with code {}", pid_, WEXITSTATUS(status));
      } else if (WIFSIGNALED(status)) {
        log()->debug("pid {} killed by signal {}", pid_, WTERMSIG(status));
      }
    } else if (r < 0) {
      // ECHILD: already reaped elsewhere; treat as gone.
      exited_ = true;
    }
    return exited_;
  }

  pid_t pid() const override { return pid_; }

private:
  pid_t pid_;
  int stdin_fd_;
  bool exited_{false};
};

void ignore_sigpipe_once() {
  static const bool done = [] {
    struct sigaction sa{};
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGPIPE, &sa, nullptr);
    return true;
  }();
  (void)done;
}

} // namespace

std::unique_ptr<ChildProcessHandle> PosixProcessLauncher::launch(const std::vector<std::string>& argv,
                                                                 const std::string& working_dir) {
  if (argv.empty()) throw LaunchError("empty command line");
  ignore_sigpipe_once();

  int in_pipe[2];
  if (::pipe(in_pipe) != 0) {
    throw LaunchError("pipe() failed: " + errno_text(errno));
  }
  // Reports exec failure back to the parent; closes itself on success.
  int status_pipe[2];
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    ::close(in_pipe[0]); ::close(in_pipe[1]);
    throw LaunchError("pipe2() failed: " + errno_text(err));
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    ::close(in_pipe[0]); ::close(in_pipe[1]);
    ::close(status_pipe[0]); ::close(status_pipe[1]);
    throw LaunchError("fork() failed: " + errno_text(err));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    ::close(in_pipe[1]);
    ::close(status_pipe[0]);
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::close(in_pipe[0]);
    int err = 0;
    if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
      err = errno;
    } else {
      ::execvp(cargv[0], cargv.data());
      err = errno;
    }
    ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  ::close(in_pipe[0]);
  ::close(status_pipe[1]);

  int child_err = 0;
  ssize_t n;
  do { n = ::read(status_pipe[0], &child_err, sizeof(child_err)); } while (n < 0 && errno == EINTR);
  ::close(status_pipe[0]);

  if (n > 0) {
    ::close(in_pipe[1]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    throw LaunchError("cannot start '" + argv[0] + "' in '" + working_dir + "': " + errno_text(child_err));
  }

  log()->debug("launched '{}' as pid {}", argv[0], pid);
  return std::make_unique<PosixChildProcess>(pid, in_pipe[1]);
}

} // namespace geobeam
