#include <geobeam/input.hpp>
#include <atomic>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

namespace geobeam {

Command command_from_key(int key) {
  switch (key) {
    case 'n': case 'N': return Command::Next;
    case 'p': case 'P': return Command::Prev;
    case 'q': case 'Q': return Command::Quit;
    default: return Command::None;
  }
}

const char* command_name(Command c) {
  switch (c) {
    case Command::Next: return "next";
    case Command::Prev: return "prev";
    case Command::Quit: return "quit";
    default: return "none";
  }
}

TerminalKeyReader::TerminalKeyReader() {
  if (!::isatty(STDIN_FILENO)) return;
  if (::tcgetattr(STDIN_FILENO, &old_settings_) != 0) return;

  termios raw = old_settings_;
  raw.c_lflag &= ~(ICANON | ECHO);
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) return;

  old_flags_ = ::fcntl(STDIN_FILENO, F_GETFL, 0);
  ::fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
  initialized_ = true;
}

TerminalKeyReader::~TerminalKeyReader() {
  if (!initialized_) return;
  ::fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  ::tcsetattr(STDIN_FILENO, TCSANOW, &old_settings_);
}

int TerminalKeyReader::get_key() {
  if (!initialized_) return -1;
  char c;
  if (::read(STDIN_FILENO, &c, 1) > 0) return static_cast<unsigned char>(c);
  return -1;
}

InputSource TerminalKeyReader::as_input_source() {
  return [this]{ return command_from_key(get_key()); };
}

static std::atomic<bool> g_stop_requested{false};

static void on_stop_signal(int) {
  g_stop_requested.store(true);
}

StopSignalGuard::StopSignalGuard() {
  struct sigaction sa{};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  ::sigaction(SIGINT, &sa, &old_int_);
  ::sigaction(SIGTERM, &sa, &old_term_);
}

StopSignalGuard::~StopSignalGuard() {
  ::sigaction(SIGINT, &old_int_, nullptr);
  ::sigaction(SIGTERM, &old_term_, nullptr);
}

void request_stop() { g_stop_requested.store(true); }
bool stop_requested() { return g_stop_requested.load(); }
void clear_stop_request() { g_stop_requested.store(false); }

InputSource quit_on_stop(InputSource inner) {
  return [inner = std::move(inner)]() {
    if (stop_requested()) return Command::Quit;
    return inner ? inner() : Command::None;
  };
}

} // namespace geobeam
