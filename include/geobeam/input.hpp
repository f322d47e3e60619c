#pragma once
#include <csignal>
#include <functional>
#include <termios.h>

namespace geobeam {

enum class Command { None, Next, Prev, Quit };

// n/N -> Next, p/P -> Prev, q/Q -> Quit, anything else (or -1) -> None.
Command command_from_key(int key);

const char* command_name(Command c);

// Yields at most one pending command per call; never blocks.
using InputSource = std::function<Command()>;

// Puts the terminal in non-canonical, no-echo, non-blocking mode for its
// lifetime and restores the previous settings on destruction.
class TerminalKeyReader {
public:
  TerminalKeyReader();
  ~TerminalKeyReader();
  TerminalKeyReader(const TerminalKeyReader&) = delete;
  TerminalKeyReader& operator=(const TerminalKeyReader&) = delete;

  // Next pending key, or -1.
  int get_key();

  // The reader must outlive the returned source.
  InputSource as_input_source();

private:
  termios old_settings_{};
  int old_flags_{0};
  bool initialized_{false};
};

// SIGINT/SIGTERM raise a stop request instead of killing the process, so
// the current run is shut down and logged and the terminal is restored.
// Previous handlers are put back on destruction.
class StopSignalGuard {
public:
  StopSignalGuard();
  ~StopSignalGuard();
  StopSignalGuard(const StopSignalGuard&) = delete;
  StopSignalGuard& operator=(const StopSignalGuard&) = delete;

private:
  struct sigaction old_int_{};
  struct sigaction old_term_{};
};

// Process-wide stop flag; async-signal-safe to set.
void request_stop();
bool stop_requested();
void clear_stop_request();

// Yields Quit once a stop has been requested, otherwise defers to inner.
InputSource quit_on_stop(InputSource inner);

} // namespace geobeam
