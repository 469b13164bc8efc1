#include "util/Grapheme.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace tessera::util {

namespace {

struct Range { char32_t lo; char32_t hi; };

// Mn/Me ranges plus joiners and variation selectors. Checked before the
// wide table, which overlaps it in a few CJK blocks.
constexpr Range kCombining[] = {
  {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x05BF, 0x05BF},
  {0x05C1, 0x05C2}, {0x05C4, 0x05C5}, {0x05C7, 0x05C7}, {0x0610, 0x061A},
  {0x064B, 0x065F}, {0x0670, 0x0670}, {0x06D6, 0x06DC}, {0x06DF, 0x06E4},
  {0x06E7, 0x06E8}, {0x06EA, 0x06ED}, {0x0711, 0x0711}, {0x0730, 0x074A},
  {0x07A6, 0x07B0}, {0x07EB, 0x07F3}, {0x0816, 0x0819}, {0x081B, 0x0823},
  {0x0825, 0x0827}, {0x0829, 0x082D}, {0x0859, 0x085B}, {0x08D3, 0x08E1},
  {0x08E3, 0x0903}, {0x093A, 0x093C}, {0x093E, 0x094F}, {0x0951, 0x0957},
  {0x0962, 0x0963}, {0x0981, 0x0983}, {0x09BC, 0x09BC}, {0x09BE, 0x09CD},
  {0x0A01, 0x0A03}, {0x0A3C, 0x0A51}, {0x0E31, 0x0E31}, {0x0E34, 0x0E3A},
  {0x0E47, 0x0E4E}, {0x0EB1, 0x0EB1}, {0x0EB4, 0x0EBC}, {0x0EC8, 0x0ECD},
  {0x1160, 0x11FF}, {0x135D, 0x135F}, {0x1712, 0x1714}, {0x17B4, 0x17D3},
  {0x180B, 0x180D}, {0x1AB0, 0x1AFF}, {0x1B00, 0x1B04}, {0x1DC0, 0x1DFF},
  {0x200C, 0x200D}, {0x20D0, 0x20FF}, {0x302A, 0x302F}, {0x3099, 0x309A},
  {0xA66F, 0xA672}, {0xA674, 0xA67D}, {0xA69E, 0xA69F}, {0xFE00, 0xFE0F},
  {0xFE20, 0xFE2F}, {0xE0020, 0xE007F}, {0xE0100, 0xE01EF},
};

constexpr Range kWide[] = {
  {0x1100, 0x115F}, {0x231A, 0x231B}, {0x2329, 0x232A}, {0x23E9, 0x23EC},
  {0x23F0, 0x23F0}, {0x23F3, 0x23F3}, {0x25FD, 0x25FE}, {0x2614, 0x2615},
  {0x2648, 0x2653}, {0x267F, 0x267F}, {0x2693, 0x2693}, {0x26A1, 0x26A1},
  {0x26AA, 0x26AB}, {0x26BD, 0x26BE}, {0x26C4, 0x26C5}, {0x26CE, 0x26CE},
  {0x26D4, 0x26D4}, {0x26EA, 0x26EA}, {0x26F2, 0x26F3}, {0x26F5, 0x26F5},
  {0x26FA, 0x26FA}, {0x26FD, 0x26FD}, {0x2705, 0x2705}, {0x270A, 0x270B},
  {0x2728, 0x2728}, {0x274C, 0x274C}, {0x274E, 0x274E}, {0x2753, 0x2755},
  {0x2757, 0x2757}, {0x2795, 0x2797}, {0x27B0, 0x27B0}, {0x27BF, 0x27BF},
  {0x2B1B, 0x2B1C}, {0x2B50, 0x2B50}, {0x2B55, 0x2B55}, {0x2E80, 0x303E},
  {0x3041, 0x33FF}, {0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xA000, 0xA4CF},
  {0xA960, 0xA97F}, {0xAC00, 0xD7A3}, {0xF900, 0xFAFF}, {0xFE10, 0xFE19},
  {0xFE30, 0xFE6F}, {0xFF00, 0xFF60}, {0xFFE0, 0xFFE6}, {0x16FE0, 0x16FE4},
  {0x17000, 0x18AFF}, {0x1B000, 0x1B2FF}, {0x1F004, 0x1F004}, {0x1F0CF, 0x1F0CF},
  {0x1F18E, 0x1F18E}, {0x1F191, 0x1F19A}, {0x1F200, 0x1F251}, {0x1F300, 0x1F64F},
  {0x1F680, 0x1F6FF}, {0x1F7E0, 0x1F7EB}, {0x1F90C, 0x1F9FF}, {0x1FA70, 0x1FAFF},
  {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};

template <std::size_t N>
bool in_table(char32_t cp, const Range (&table)[N]) {
  auto it = std::upper_bound(std::begin(table), std::end(table), cp,
                             [](char32_t v, const Range& r) { return v < r.lo; });
  if (it == std::begin(table)) return false;
  --it;
  return cp >= it->lo && cp <= it->hi;
}

constexpr char32_t kReplacement = 0xFFFD;
constexpr char32_t kZwj = 0x200D;
constexpr char32_t kEmojiPresentation = 0xFE0F;

bool is_emoji_modifier(char32_t cp) { return cp >= 0x1F3FB && cp <= 0x1F3FF; }

// Extends the current cluster without starting a new one.
bool is_extend(char32_t cp) { return is_combining(cp) || is_emoji_modifier(cp); }

// Standalone zero-width format characters.
bool is_zero_width_format(char32_t cp) {
  return cp == 0x200B || (cp >= 0x2060 && cp <= 0x2064) || cp == 0xFEFF;
}

} // namespace

int u8_len(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

std::vector<char32_t> decode_utf8(std::string_view s) {
  std::vector<char32_t> out;
  out.reserve(s.size());
  std::size_t i = 0;
  while (i < s.size()) {
    auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) { out.push_back(c); ++i; continue; }
    int len = u8_len(c);
    if (len == 1 || i + static_cast<std::size_t>(len) > s.size()) {
      out.push_back(kReplacement); ++i; continue;
    }
    char32_t cp = (len == 2) ? (c & 0x1F) : (len == 3) ? (c & 0x0F) : (c & 0x07);
    bool ok = true;
    for (int k = 1; k < len; ++k) {
      auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Reject overlong forms, surrogates and out-of-range values
    static constexpr char32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
    if (ok && (cp < min_for_len[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)) ok = false;
    if (!ok) { out.push_back(kReplacement); ++i; continue; }
    out.push_back(cp);
    i += static_cast<std::size_t>(len);
  }
  return out;
}

void append_utf8(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool is_control(char32_t cp) { return cp < 0x20 || (cp >= 0x7F && cp < 0xA0); }
bool is_combining(char32_t cp) { return cp >= 0x0300 && in_table(cp, kCombining); }
bool is_wide(char32_t cp) { return cp >= 0x1100 && in_table(cp, kWide); }
bool is_regional_indicator(char32_t cp) { return cp >= 0x1F1E6 && cp <= 0x1F1FF; }

std::vector<std::string> segment_graphemes(std::string_view text) {
  std::vector<std::string> out;
  if (text.empty()) return out;
  auto cps = decode_utf8(text);
  const std::size_t n = cps.size();
  std::size_t i = 0;
  while (i < n) {
    std::string cluster;
    char32_t base = cps[i++];
    append_utf8(cluster, base);
    if (is_control(base)) {
      if (base == U'\r' && i < n && cps[i] == U'\n') append_utf8(cluster, cps[i++]);
      out.push_back(std::move(cluster));
      continue;
    }
    if (is_regional_indicator(base) && i < n && is_regional_indicator(cps[i])) {
      append_utf8(cluster, cps[i++]);
    }
    while (i < n && is_extend(cps[i])) {
      char32_t cp = cps[i++];
      append_utf8(cluster, cp);
      // ZWJ glues the next pictograph into this cluster
      if (cp == kZwj && i < n && !is_control(cps[i])) append_utf8(cluster, cps[i++]);
    }
    out.push_back(std::move(cluster));
  }
  return out;
}

int grapheme_width(std::string_view cluster) {
  if (cluster.empty()) return 0;
  auto cps = decode_utf8(cluster);
  char32_t base = cps.front();
  if (is_control(base) || is_combining(base) || is_zero_width_format(base)) return 0;
  if (is_regional_indicator(base)) return cps.size() >= 2 && is_regional_indicator(cps[1]) ? 2 : 1;
  if (is_wide(base)) return 2;
  if (std::find(cps.begin(), cps.end(), kEmojiPresentation) != cps.end()) return 2;
  return 1;
}

int text_width(std::string_view text) {
  int w = 0;
  for (const auto& g : segment_graphemes(text)) w += grapheme_width(g);
  return w;
}

std::string truncate_text_width(std::string_view text, int max_width, std::string_view ellipsis) {
  if (max_width <= 0 || text.empty()) return {};
  if (text_width(text) <= max_width) return std::string(text);

  auto take = [](std::string_view s, int cap) {
    std::string out;
    int used = 0;
    for (const auto& g : segment_graphemes(s)) {
      int w = grapheme_width(g);
      if (used + w > cap) break;
      used += w;
      out += g;
    }
    return out;
  };

  int ell_w = text_width(ellipsis);
  if (ell_w >= max_width) return take(ellipsis, max_width);
  return take(text, max_width - ell_w) + std::string(ellipsis);
}

std::vector<std::string> wrap_text_width(std::string_view text, int max_width) {
  std::vector<std::string> out;
  if (text.empty()) return out;
  const int cap = std::max(1, max_width);
  auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

  std::size_t line_start = 0;
  while (line_start <= text.size()) {
    std::size_t nl = text.find('\n', line_start);
    std::string_view line = text.substr(line_start, nl == std::string_view::npos ? std::string_view::npos : nl - line_start);
    line_start = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;

    while (!line.empty() && is_space(line.back())) line.remove_suffix(1);
    if (line.empty()) { out.emplace_back(); continue; }

    std::string current;
    int current_w = 0;
    std::size_t p = 0;
    while (p < line.size()) {
      while (p < line.size() && is_space(line[p])) ++p;
      if (p >= line.size()) break;
      std::size_t q = p;
      while (q < line.size() && !is_space(line[q])) ++q;
      std::string_view word = line.substr(p, q - p);
      p = q;

      int word_w = text_width(word);
      int sep_w = current.empty() ? 0 : 1;
      if (current_w + sep_w + word_w <= cap) {
        if (sep_w) current.push_back(' ');
        current.append(word);
        current_w += sep_w + word_w;
        continue;
      }
      if (!current.empty()) {
        out.push_back(std::move(current));
        current.clear();
        current_w = 0;
      }
      if (word_w <= cap) {
        current.assign(word);
        current_w = word_w;
        continue;
      }
      // Hard-wrap an over-long token by cluster
      std::string chunk;
      int chunk_w = 0;
      for (const auto& g : segment_graphemes(word)) {
        int w = grapheme_width(g);
        if (chunk_w + w > cap && !chunk.empty()) {
          out.push_back(std::move(chunk));
          chunk.clear();
          chunk_w = 0;
        }
        if (chunk_w + w > cap) continue;
        chunk += g;
        chunk_w += w;
      }
      current = std::move(chunk);
      current_w = chunk_w;
    }
    if (!current.empty()) out.push_back(std::move(current));
  }
  return out;
}

} // namespace tessera::util
