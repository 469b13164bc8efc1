#pragma once

#include <string>
#include <string_view>

namespace tessera::util {

// Remove CSI / OSC / two-byte ESC sequences.
[[nodiscard]] std::string strip_ansi(std::string_view s);

// Remove C0 controls except \t \n \r, and DEL.
[[nodiscard]] std::string strip_control(std::string_view s);

[[nodiscard]] std::string sanitize_text(std::string_view s);
[[nodiscard]] bool is_safe_text(std::string_view s);

} // namespace tessera::util
