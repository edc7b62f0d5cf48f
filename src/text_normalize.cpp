#include "text_normalize.h"

#include "align_errors.h"
#include "utf8_utils.h"

#include <cctype>
#include <sstream>

namespace {

bool is_ascii_space(unsigned char c) { return c < 0x80 && std::isspace(c); }

std::string trim(const std::string& s) {
  size_t l = 0;
  while (l < s.size() && is_ascii_space(static_cast<unsigned char>(s[l]))) ++l;
  size_t r = s.size();
  while (r > l && is_ascii_space(static_cast<unsigned char>(s[r - 1]))) --r;
  return s.substr(l, r - l);
}

}  // namespace

std::string normalize_word(const std::string& word) {
  std::string out;
  out.reserve(word.size());
  for (uint32_t cp : utf8::to_codepoints(word)) {
    if (utf8::is_punctuation(cp)) continue;
    out += utf8::from_codepoint(utf8::fold_case(cp));
  }
  return out;
}

std::string normalize_line(const std::string& line) {
  std::string out;
  for (const auto& w : split_words(line)) {
    const std::string n = normalize_word(w);
    if (n.empty()) continue;
    if (!out.empty()) out.push_back(' ');
    out += n;
  }
  return out;
}

std::vector<std::string> split_words(const std::string& text) {
  std::vector<std::string> out;
  std::string cur;
  for (char ch : text) {
    if (is_ascii_space(static_cast<unsigned char>(ch))) {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(ch);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::vector<LyricsLine> parse_lyrics(const std::string& lyrics_text) {
  std::string content = lyrics_text;
  // Handle UTF-8 BOM.
  if (content.size() >= 3 && (unsigned char)content[0] == 0xEF && (unsigned char)content[1] == 0xBB &&
      (unsigned char)content[2] == 0xBF) {
    content.erase(0, 3);
  }

  std::vector<LyricsLine> lines;
  std::stringstream ss(content);
  std::string raw;
  bool pending_break = false;
  while (std::getline(ss, raw)) {
    if (raw.size() && raw.back() == '\r') raw.pop_back();
    const std::string text = trim(raw);
    if (text.empty()) {
      if (!lines.empty()) pending_break = true;
      continue;
    }
    LyricsLine line;
    line.index = static_cast<int>(lines.size());
    line.text = text;
    line.words = split_words(text);
    line.stanza_break = pending_break;
    pending_break = false;
    lines.push_back(std::move(line));
  }

  if (lines.empty()) throw InputError("Lyrics text contains no lines");
  return lines;
}
