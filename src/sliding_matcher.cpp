#include "sliding_matcher.h"

#include "align_errors.h"
#include "text_normalize.h"
#include "window_scorer.h"

#include <algorithm>
#include <sstream>
#include <unordered_map>

void TranscriptCursor::advance_to(size_t position) {
  if (position < position_) {
    throw InvariantViolation("Transcript cursor rewind from " + std::to_string(position_) + " to " +
                             std::to_string(position));
  }
  position_ = position;
}

std::vector<int> find_repeats(const std::vector<LyricsLine>& lines) {
  std::unordered_map<std::string, int> seen;
  std::vector<int> occurrence;
  occurrence.reserve(lines.size());
  for (const auto& line : lines) {
    const std::string key = normalize_line(line.text);
    if (key.empty()) {
      occurrence.push_back(0);
      continue;
    }
    occurrence.push_back(seen[key]++);
  }
  return occurrence;
}

namespace {

// Time at fractional position x in [0, size] along the window; words are laid
// end to end and the silence between them is skipped.
double window_time_at(const std::vector<Word>& words, size_t offset, size_t size, size_t num, size_t den) {
  const size_t k = num / den;
  if (k >= size) return words[offset + size - 1].end;
  const Word& w = words[offset + k];
  const double frac = double(num % den) / double(den);
  return w.start + frac * (w.end - w.start);
}

}  // namespace

std::vector<TimedWord> assign_line_timing(const LyricsLine& line, const std::vector<Word>& words, size_t offset,
                                          size_t size) {
  std::vector<TimedWord> out;
  const size_t n = line.words.size();
  out.reserve(n);
  if (n == 0 || size == 0) return out;

  if (size == n) {
    for (size_t i = 0; i < n; ++i) {
      const Word& w = words[offset + i];
      out.push_back({line.words[i], w.start, w.end});
    }
    return out;
  }

  for (size_t i = 0; i < n; ++i) {
    TimedWord tw;
    tw.text = line.words[i];
    // Positions are i*size/n and (i+1)*size/n, kept as exact fractions over n.
    tw.start = window_time_at(words, offset, size, i * size, n);
    const size_t end_num = (i + 1) * size;
    if (end_num % n == 0) {
      tw.end = words[offset + end_num / n - 1].end;
    } else {
      tw.end = window_time_at(words, offset, size, end_num, n);
    }
    out.push_back(std::move(tw));
  }
  return out;
}

SlidingMatcher::SlidingMatcher(const std::vector<Word>& words, const AlignConfig& config, Logger& log)
    : words_(words), config_(config), log_(log) {}

double SlidingMatcher::threshold_for(int occurrence) const {
  if (occurrence <= 0) return config_.match_threshold;
  const double relaxed = config_.match_threshold - config_.repeat_threshold_step * double(occurrence);
  return std::max(std::min(config_.repeat_threshold_floor, config_.match_threshold), relaxed);
}

MatchResult SlidingMatcher::match_line(const LyricsLine& line, TranscriptCursor& cursor, int occurrence) const {
  MatchResult r;
  r.line_index = line.index;

  const auto best = best_window(line, words_, cursor.position(), config_);
  if (!best) {
    log_.debug("line " + std::to_string(line.index) + ": transcript exhausted");
    return r;
  }

  r.score = best->score;
  r.window_offset = best->offset;
  r.window_size = best->size;

  const double threshold = threshold_for(occurrence);
  if (best->score < threshold) {
    std::ostringstream ss;
    ss << "line " << line.index << ": unmatched (best " << best->score << " < " << threshold << ")";
    log_.debug(ss.str());
    return r;
  }

  r.matched = true;
  r.words = assign_line_timing(line, words_, best->offset, best->size);
  cursor.advance_to(best->offset + best->size);

  std::ostringstream ss;
  ss << "line " << line.index << ": matched score=" << best->score << " window=[" << best->offset << ","
     << best->offset + best->size << ")";
  log_.debug(ss.str());
  return r;
}

std::vector<MatchResult> SlidingMatcher::match_all(const std::vector<LyricsLine>& lines) const {
  TranscriptCursor cursor;
  const auto occurrences = find_repeats(lines);
  std::vector<MatchResult> results;
  results.reserve(lines.size());
  for (size_t i = 0; i < lines.size(); ++i) {
    results.push_back(match_line(lines[i], cursor, occurrences[i]));
  }
  return results;
}
