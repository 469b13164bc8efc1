#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tessera::ui {

// Normalized key: `name` is a symbolic name ("up", "pagedown", "f1",
// "return", "escape", "space") or the typed character itself ("a", "A",
// "+", "é"); `sequence` is the raw bytes.
struct KeyEvent {
  std::string name;
  std::string sequence;
  bool ctrl{false};
  bool meta{false};
  bool shift{false};

  friend bool operator==(const KeyEvent&, const KeyEvent&) = default;
};

// Splits a chunk read from the terminal into key events. A trailing ESC,
// or an ESC followed by an unterminated sequence, decodes as "escape".
[[nodiscard]] std::vector<KeyEvent> decode_keys(std::string_view bytes);

// Waits up to timeout_ms for input on fd.
[[nodiscard]] bool has_input_available(int fd, int timeout_ms);

} // namespace tessera::ui
