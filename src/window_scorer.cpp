#include "window_scorer.h"

#include "similarity.h"

#include <algorithm>

namespace {

// Scores closer than this are treated as equal so float noise never reorders windows.
constexpr double kScoreEpsilon = 1e-9;

double clamp_confidence(double c) {
  if (!(c > 0.0)) return 0.0;
  return std::min(c, 1.0);
}

}  // namespace

WindowScore score_window(const LyricsLine& line, const std::vector<Word>& words, size_t offset, size_t size,
                         const AlignConfig& config) {
  WindowScore ws;
  ws.offset = offset;
  ws.size = size;

  const size_t n = line.words.size();
  if (n == 0 || size == 0 || offset + size > words.size()) return ws;

  const int w_len = static_cast<int>(size);
  const size_t overlap = std::min(n, size);
  double total = 0.0;
  double total_weight = 0.0;
  size_t exact_count = 0;
  ws.pairs.reserve(overlap);

  for (size_t i = 0; i < overlap; ++i) {
    const Word& tw = words[offset + i];
    const double weight = position_weight(static_cast<int>(i), w_len);
    double sim = similarity(line.words[i], tw.text);
    if (exact_match(line.words[i], tw.text)) {
      sim = std::min(1.0, sim * config.exact_bonus);
      ++exact_count;
    }
    total += sim * weight * clamp_confidence(tw.confidence);
    total_weight += weight;
    ws.pairs.emplace_back(i, offset + i);
  }
  // Words left unpaired on either side (line tail past a short window, window
  // tail past the line) are misses: weight without score.
  for (size_t i = overlap; i < std::max(n, size); ++i) {
    total_weight += position_weight(static_cast<int>(i), w_len);
  }

  if (total_weight <= 0.0) return ws;
  ws.score = total / total_weight;
  ws.whole_line_exact = exact_count == n;
  if (ws.whole_line_exact) ws.score *= config.whole_line_bonus;
  return ws;
}

std::vector<size_t> candidate_sizes(size_t n, size_t remaining, const AlignConfig& config) {
  std::vector<size_t> out;
  if (remaining == 0) return out;
  auto add = [&](long long s) {
    s = std::max<long long>(1, std::min<long long>(s, static_cast<long long>(remaining)));
    const size_t size = static_cast<size_t>(s);
    if (std::find(out.begin(), out.end(), size) == out.end()) out.push_back(size);
  };
  const long long base = static_cast<long long>(n);
  add(base);
  const int reach = std::max(config.window_shrink, config.window_grow);
  for (int d = 1; d <= reach; ++d) {
    if (d <= config.window_shrink) add(base - d);
    if (d <= config.window_grow) add(base + d);
  }
  return out;
}

std::optional<WindowScore> best_window(const LyricsLine& line, const std::vector<Word>& words, size_t from,
                                       const AlignConfig& config) {
  if (from >= words.size() || line.words.empty()) return std::nullopt;

  const size_t lookahead = static_cast<size_t>(std::max(1, config.max_lookahead));
  const size_t last_offset = std::min(words.size(), from + lookahead);

  std::optional<WindowScore> best;
  for (size_t offset = from; offset < last_offset; ++offset) {
    for (size_t size : candidate_sizes(line.words.size(), words.size() - offset, config)) {
      WindowScore ws = score_window(line, words, offset, size, config);
      if (!best || ws.score > best->score + kScoreEpsilon) best = std::move(ws);
    }
  }
  return best;
}
