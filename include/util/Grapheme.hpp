#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tessera::util {

// UTF-8 codec
int u8_len(unsigned char c);
[[nodiscard]] std::vector<char32_t> decode_utf8(std::string_view s);
void append_utf8(std::string& out, char32_t cp);

// Code point classes (approximate East-Asian width / combining tables)
[[nodiscard]] bool is_control(char32_t cp);
[[nodiscard]] bool is_combining(char32_t cp);
[[nodiscard]] bool is_wide(char32_t cp);
[[nodiscard]] bool is_regional_indicator(char32_t cp);

// Grapheme clusters
[[nodiscard]] std::vector<std::string> segment_graphemes(std::string_view text);
[[nodiscard]] int grapheme_width(std::string_view cluster);

// Width-aware text helpers; none of them split a cluster.
[[nodiscard]] int text_width(std::string_view text);
[[nodiscard]] std::string truncate_text_width(std::string_view text, int max_width,
                                              std::string_view ellipsis = "…");
[[nodiscard]] std::vector<std::string> wrap_text_width(std::string_view text, int max_width);

} // namespace tessera::util
