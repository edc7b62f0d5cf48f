#pragma once

#include <cstddef>
#include <vector>

#include "align_config.h"
#include "logger.h"
#include "timing_track.h"
#include "transcript.h"

// Index of the first transcript word not yet committed to a matched line.
// Only ever moves forward.
class TranscriptCursor {
 public:
  TranscriptCursor() = default;
  explicit TranscriptCursor(size_t position) : position_(position) {}

  size_t position() const { return position_; }

  // Throws InvariantViolation when `position` is behind the current one.
  void advance_to(size_t position);

 private:
  size_t position_ = 0;
};

// Pass-1 outcome for one lyrics line.
struct MatchResult {
  int line_index = 0;
  bool matched = false;
  double score = 0.0;  // best window score, also kept for unmatched lines
  size_t window_offset = 0;
  size_t window_size = 0;
  std::vector<TimedWord> words;  // original words with transcript timing, matched lines only

  double start() const { return words.empty() ? 0.0 : words.front().start; }
  double end() const { return words.empty() ? 0.0 : words.back().end; }
};

// For each line, how many earlier lines share its normalized text.
std::vector<int> find_repeats(const std::vector<LyricsLine>& lines);

// Timing for every word of `line` from words[offset, offset + size). Equal
// lengths copy the paired timestamps; otherwise line word i covers window
// positions [i*size/n, (i+1)*size/n) of the window's time line.
std::vector<TimedWord> assign_line_timing(const LyricsLine& line, const std::vector<Word>& words, size_t offset,
                                          size_t size);

class SlidingMatcher {
 public:
  SlidingMatcher(const std::vector<Word>& words, const AlignConfig& config, Logger& log);

  // Score threshold for the given occurrence of a repeated line (0 = first).
  double threshold_for(int occurrence) const;

  // Search windows for one line starting at the cursor. Advances the cursor
  // past the winning window on a match; leaves it untouched otherwise.
  MatchResult match_line(const LyricsLine& line, TranscriptCursor& cursor, int occurrence = 0) const;

  // Pass 1 over all lines with a fresh cursor.
  std::vector<MatchResult> match_all(const std::vector<LyricsLine>& lines) const;

 private:
  const std::vector<Word>& words_;
  AlignConfig config_;
  Logger& log_;
};
