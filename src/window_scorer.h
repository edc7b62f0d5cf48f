#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "align_config.h"
#include "transcript.h"

// Score of one lyrics line laid positionally over words[offset, offset + size).
struct WindowScore {
  size_t offset = 0;
  size_t size = 0;
  double score = 0.0;
  bool whole_line_exact = false;
  // (line word index, transcript word index) for the overlapping positions.
  std::vector<std::pair<size_t, size_t>> pairs;
};

// Positional pairing: line word i against window word i. Each pair contributes
// similarity * position_weight * confidence, exact matches get the exact bonus
// (clamped to 1.0), and the sum is normalized by the summed position weights.
// Words without a partner (line tail past a short window, window tail past
// the line) count as misses.
WindowScore score_window(const LyricsLine& line, const std::vector<Word>& words, size_t offset, size_t size,
                         const AlignConfig& config);

// Window sizes tried for a line of n words, in preference order
// (n, n-1, n+1, n-2, n+2, ...), clipped to [1, remaining] without repeats.
std::vector<size_t> candidate_sizes(size_t n, size_t remaining, const AlignConfig& config);

// Best window over offsets [from, from + max_lookahead) and all candidate sizes.
// Ties keep the earlier offset, then the earlier size in preference order.
// Returns nullopt when no transcript word remains at or after `from`.
std::optional<WindowScore> best_window(const LyricsLine& line, const std::vector<Word>& words, size_t from,
                                       const AlignConfig& config);
