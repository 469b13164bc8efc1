#pragma once

#include "ui/Input.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <termios.h>
#include <unistd.h>

namespace tessera::ui {

// Terminal state management
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;
extern std::atomic<bool> g_resized;

void restore_terminal_minimal();
void on_sigint(int);
void on_sigwinch(int);
void on_atexit_restore();

[[nodiscard]] bool tty_stdout();
[[nodiscard]] int term_cols();
[[nodiscard]] int term_rows();

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);
// Writes everything, waiting out EAGAIN on non-blocking descriptors.
// False on a hard error.
bool write_all(int fd, std::string_view bytes);

struct TerminalSize {
  int rows{0};
  int cols{0};
  friend constexpr bool operator==(const TerminalSize&, const TerminalSize&) = default;
};

// What the engine needs from a terminal.
class TerminalAdapter {
public:
  virtual ~TerminalAdapter() = default;
  [[nodiscard]] virtual TerminalSize size() const = 0;
  virtual void setup() = 0;
  virtual void restore() = 0;
  virtual void write(std::string_view bytes) = 0;
  [[nodiscard]] virtual std::vector<KeyEvent> read_keys(int timeout_ms) = 0;
  // True once after the terminal was resized.
  virtual bool consume_resize() { return false; }
  // An external stop request (SIGINT, SIGTERM).
  [[nodiscard]] virtual bool interrupted() const { return false; }
};

// RAII guards for terminal state
class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
  AltScreenGuard(const AltScreenGuard&) = delete;
  AltScreenGuard& operator=(const AltScreenGuard&) = delete;
};

struct PosixTerminalOptions {
  bool alt_screen{true};
  bool hide_cursor{true};
  int in_fd{STDIN_FILENO};
  int out_fd{STDOUT_FILENO};
};

// stdin/stdout terminal. setup() enters raw mode, hides the cursor and
// switches to the alternate screen; restore() undoes it in reverse order.
class PosixTerminal : public TerminalAdapter {
public:
  explicit PosixTerminal(PosixTerminalOptions options = {});
  ~PosixTerminal() override;
  PosixTerminal(const PosixTerminal&) = delete;
  PosixTerminal& operator=(const PosixTerminal&) = delete;

  [[nodiscard]] TerminalSize size() const override;
  void setup() override;
  void restore() override;
  void write(std::string_view bytes) override;
  [[nodiscard]] std::vector<KeyEvent> read_keys(int timeout_ms) override;
  bool consume_resize() override;
  [[nodiscard]] bool interrupted() const override;

private:
  PosixTerminalOptions options_;
  std::unique_ptr<RawTermGuard> raw_;
  std::unique_ptr<CursorGuard> cursor_;
  std::unique_ptr<AltScreenGuard> alt_;
  bool active_{false};
  bool input_eof_{false};
};

} // namespace tessera::ui
