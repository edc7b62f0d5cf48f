#pragma once

#include <cstddef>
#include <vector>

#include "align_config.h"
#include "sliding_matcher.h"
#include "timing_track.h"
#include "transcript.h"

// Time range covered by the transcript word stream.
struct StreamBounds {
  double start = 0.0;  // first word start
  double end = 0.0;    // last word end
  bool has_words = false;
};

StreamBounds stream_bounds(const std::vector<Word>& words);

// Maximal run of consecutive unmatched lines: results[first, first + count).
struct UnmatchedRun {
  size_t first = 0;
  size_t count = 0;
};

std::vector<UnmatchedRun> find_unmatched_runs(const std::vector<MatchResult>& results);

struct InterpolationResult {
  std::vector<TimedLine> lines;  // one per unmatched line, in line order
  std::vector<BreakSpan> breaks;
};

// Lay `lines` out over [start, end]: gap_reserve of the span becomes
// lines.size() + 1 equal gaps, the rest is shared by word count, and each line
// is split evenly between its words. No timestamp exceeds `end`.
std::vector<TimedLine> fill_span(const std::vector<const LyricsLine*>& lines, double start, double end,
                                 const AlignConfig& config);

// Pass 2: synthesise timing for every unmatched line from the neighbouring
// anchors (matched lines) or the stream bounds. `results[i]` must describe
// `lines[i]`.
InterpolationResult interpolate_gaps(const std::vector<MatchResult>& results, const std::vector<LyricsLine>& lines,
                                     const StreamBounds& bounds, const AlignConfig& config);
