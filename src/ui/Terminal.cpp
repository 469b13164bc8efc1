#include "ui/Terminal.hpp"
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace tessera::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};
std::atomic<bool> g_resized{false};

namespace {

int env_positive(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !*v) return 0;
  int out = 0;
  auto [ptr, ec] = std::from_chars(v, v + std::strlen(v), out);
  if (ec != std::errc{} || out <= 0) return 0;
  return out;
}

std::atomic<bool> g_handlers_installed{false};

void install_handlers() {
  if (g_handlers_installed.exchange(true)) return;
  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);
  std::signal(SIGWINCH, on_sigwinch);
  std::atexit(on_atexit_restore);
}

} // namespace

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* ignore */ }
}

bool write_all(int fd, std::string_view bytes) {
  const char* p = bytes.data();
  size_t left = bytes.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n > 0) {
      p += n;
      left -= static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      struct pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
      ::poll(&pfd, 1, 100);
      continue;
    }
    return false;
  }
  return true;
}

void restore_terminal_minimal() {
  // Async-signal-safe restoration: exit alt screen first, then show cursor, reset SGR
  const char* alt_off = "\x1B[?1049l";
  const char* show_cur = "\x1B[?25h";
  const char* reset = "\x1B[0m";
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, alt_off, std::char_traits<char>::length(alt_off));
  best_effort_write(STDOUT_FILENO, show_cur, std::char_traits<char>::length(show_cur));
  best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
}

void on_sigint(int) { g_stop.store(true); }

void on_sigwinch(int) { g_resized.store(true); }

void on_atexit_restore() {
  // Ensure all buffered output is written, then restore terminal state
  std::fflush(stdout);
  if (!g_alt_in_use.load()) return;
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) {
    // best-effort drain (not signal-safe; fine here)
    tcdrain(STDOUT_FILENO);
  }
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  if (int c = env_positive("COLUMNS")) return c;
  return 80;
}

int term_rows() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
    return ws.ws_row;
  if (int r = env_positive("LINES")) return r;
  return 24;
}

// RAII guards for terminal state
RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~(ICANON | ECHO);
      neo.c_iflag &= ~(IXON | ICRNL);
      neo.c_cc[VMIN] = 0;
      neo.c_cc[VTIME] = 0;
      tcsetattr(STDIN_FILENO, TCSANOW, &neo);
      old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
      fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
      active_ = true;
    }
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  }
}

CursorGuard::CursorGuard() {
  if (tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (enable && tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049h\x1B[2J", 12);
    active_ = true;
    g_alt_in_use.store(true);
  }
}

AltScreenGuard::~AltScreenGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[0m\x1B[?1049l", 12);
    g_alt_in_use.store(false);
  }
}

// ---- PosixTerminal ----

PosixTerminal::PosixTerminal(PosixTerminalOptions options) : options_(options) {}

PosixTerminal::~PosixTerminal() { restore(); }

TerminalSize PosixTerminal::size() const { return TerminalSize{term_rows(), term_cols()}; }

void PosixTerminal::setup() {
  if (active_) return;
  install_handlers();
  g_stop.store(false);
  g_resized.store(false);
  raw_ = std::make_unique<RawTermGuard>();
  if (options_.hide_cursor) cursor_ = std::make_unique<CursorGuard>();
  alt_ = std::make_unique<AltScreenGuard>(options_.alt_screen);
  active_ = true;
}

void PosixTerminal::restore() {
  if (!active_) return;
  // Reverse of setup()
  alt_.reset();
  cursor_.reset();
  raw_.reset();
  active_ = false;
}

void PosixTerminal::write(std::string_view bytes) {
  if (!write_all(options_.out_fd, bytes)) {
    throw std::runtime_error(std::string("terminal write failed: ") + std::strerror(errno));
  }
}

std::vector<KeyEvent> PosixTerminal::read_keys(int timeout_ms) {
  if (input_eof_) {
    // Nothing left to read; keep the caller's pacing.
    ::poll(nullptr, 0, std::clamp(timeout_ms, 0, 1000));
    return {};
  }
  if (!has_input_available(options_.in_fd, timeout_ms)) return {};
  std::string bytes;
  char buf[256];
  for (;;) {
    ssize_t n = ::read(options_.in_fd, buf, sizeof(buf));
    if (n > 0) {
      bytes.append(buf, static_cast<size_t>(n));
      if (static_cast<size_t>(n) < sizeof(buf)) break;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n == 0 && bytes.empty()) input_eof_ = true;
    break;
  }
  return decode_keys(bytes);
}

bool PosixTerminal::consume_resize() { return g_resized.exchange(false); }

bool PosixTerminal::interrupted() const { return g_stop.load(); }

} // namespace tessera::ui
