#include "similarity.h"

#include "text_normalize.h"
#include "utf8_utils.h"

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace {

size_t codepoint_distance(const std::vector<uint32_t>& a, const std::vector<uint32_t>& b) {
  if (a.empty()) return b.size();
  if (b.empty()) return a.size();
  // Two-row DP over b.
  std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
  for (size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, sub});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

}  // namespace

size_t edit_distance(const std::string& a, const std::string& b) {
  return codepoint_distance(utf8::to_codepoints(a), utf8::to_codepoints(b));
}

double similarity(const std::string& a, const std::string& b) {
  const auto na = utf8::to_codepoints(normalize_word(a));
  const auto nb = utf8::to_codepoints(normalize_word(b));
  if (na.empty() || nb.empty()) return 0.0;
  if (na == nb) return 1.0;
  const size_t longest = std::max(na.size(), nb.size());
  return 1.0 - double(codepoint_distance(na, nb)) / double(longest);
}

bool exact_match(const std::string& a, const std::string& b) {
  const std::string na = normalize_word(a);
  return !na.empty() && na == normalize_word(b);
}

double position_weight(int pos, int window_length) {
  if (window_length <= 0) return 0.0;
  const int center = window_length / 2;
  const double w = 1.0 - double(std::abs(pos - center)) / (double(window_length) * 1.5);
  return std::max(0.0, w);
}
