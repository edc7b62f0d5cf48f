#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace utf8 {

// Byte length of a UTF-8 character from its first byte.
inline size_t char_len(unsigned char first_byte) {
  if ((first_byte & 0x80) == 0) return 1;
  if ((first_byte & 0xE0) == 0xC0) return 2;
  if ((first_byte & 0xF0) == 0xE0) return 3;
  if ((first_byte & 0xF8) == 0xF0) return 4;
  return 1;  // Invalid, treat as 1
}

// Decode the first Unicode codepoint from a UTF-8 string.
inline uint32_t to_codepoint(std::string_view s) {
  if (s.empty()) return 0;
  unsigned char c0 = static_cast<unsigned char>(s[0]);

  if ((c0 & 0x80) == 0) return c0;
  if ((c0 & 0xE0) == 0xC0 && s.size() >= 2) {
    return ((c0 & 0x1F) << 6) | (static_cast<unsigned char>(s[1]) & 0x3F);
  }
  if ((c0 & 0xF0) == 0xE0 && s.size() >= 3) {
    return ((c0 & 0x0F) << 12) | ((static_cast<unsigned char>(s[1]) & 0x3F) << 6) |
           (static_cast<unsigned char>(s[2]) & 0x3F);
  }
  if ((c0 & 0xF8) == 0xF0 && s.size() >= 4) {
    return ((c0 & 0x07) << 18) | ((static_cast<unsigned char>(s[1]) & 0x3F) << 12) |
           ((static_cast<unsigned char>(s[2]) & 0x3F) << 6) | (static_cast<unsigned char>(s[3]) & 0x3F);
  }
  return 0;
}

// Encode a Unicode codepoint to a UTF-8 string.
inline std::string from_codepoint(uint32_t cp) {
  std::string s;
  if (cp < 0x80) {
    s.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    s.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    s.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    s.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return s;
}

// Decode a whole UTF-8 string. Truncated sequences decode byte by byte.
inline std::vector<uint32_t> to_codepoints(std::string_view s) {
  std::vector<uint32_t> out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    size_t n = char_len(static_cast<unsigned char>(s[i]));
    if (i + n > s.size()) n = 1;
    out.push_back(n == 1 ? static_cast<unsigned char>(s[i]) : to_codepoint(s.substr(i, n)));
    i += n;
  }
  return out;
}

// Punctuation and symbol blocks that never carry lyric content:
// General Punctuation, CJK Symbols, CJK Compatibility Forms, fullwidth ASCII punctuation.
inline bool is_punctuation(uint32_t cp) {
  if (cp < 0x80) {
    return !((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= '0' && cp <= '9'));
  }
  if (cp >= 0x80 && cp <= 0xBF) return true;  // Latin-1 controls, NBSP, currency, quotes
  if (cp == 0xD7 || cp == 0xF7) return true;  // multiplication and division signs
  return (cp >= 0x2000 && cp <= 0x206F) || (cp >= 0x3000 && cp <= 0x303F) ||
         (cp >= 0xFE30 && cp <= 0xFE6F) || (cp >= 0xFF01 && cp <= 0xFF0F) ||
         (cp >= 0xFF1A && cp <= 0xFF20) || (cp >= 0xFF3B && cp <= 0xFF40) ||
         (cp >= 0xFF5B && cp <= 0xFF65);
}

// Simple case folding for the scripts lyrics mostly use. Everything else is returned unchanged.
inline uint32_t fold_case(uint32_t cp) {
  if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;  // Latin-1
  if (cp >= 0x100 && cp <= 0x137 && (cp & 1) == 0) return cp + 1;  // Latin Extended-A, paired range
  if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;  // Greek
  if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;  // Cyrillic
  if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
  if (cp >= 0xFF21 && cp <= 0xFF3A) return cp + 0x20;  // fullwidth Latin
  return cp;
}

}  // namespace utf8
