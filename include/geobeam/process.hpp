#pragma once
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

namespace geobeam {

// Handle on a launched broadcaster process.
class ChildProcessHandle {
public:
  virtual ~ChildProcessHandle() = default;

  // Ask the broadcaster to quit by writing "q" to its stdin, then close it.
  virtual void signal_quit() = 0;
  virtual void terminate() = 0;  // SIGTERM
  virtual void kill() = 0;       // SIGKILL
  // Non-blocking; true once the process has exited (and been reaped).
  virtual bool poll() = 0;
  virtual pid_t pid() const = 0;
};

class ProcessLauncher {
public:
  virtual ~ProcessLauncher() = default;
  // argv[0] is the program. Throws LaunchError.
  virtual std::unique_ptr<ChildProcessHandle> launch(const std::vector<std::string>& argv,
                                                     const std::string& working_dir) = 0;
};

// fork/exec with a pipe on the child's stdin.
class PosixProcessLauncher : public ProcessLauncher {
public:
  std::unique_ptr<ChildProcessHandle> launch(const std::vector<std::string>& argv,
                                             const std::string& working_dir) override;
};

} // namespace geobeam
