#include "gap_interpolator.h"

#include "align_errors.h"

#include <algorithm>

StreamBounds stream_bounds(const std::vector<Word>& words) {
  StreamBounds b;
  if (words.empty()) return b;
  b.start = words.front().start;
  b.end = words.back().end;
  b.has_words = true;
  return b;
}

std::vector<UnmatchedRun> find_unmatched_runs(const std::vector<MatchResult>& results) {
  std::vector<UnmatchedRun> runs;
  size_t i = 0;
  while (i < results.size()) {
    if (results[i].matched) {
      ++i;
      continue;
    }
    UnmatchedRun run;
    run.first = i;
    while (i < results.size() && !results[i].matched) ++i;
    run.count = i - run.first;
    runs.push_back(run);
  }
  return runs;
}

std::vector<TimedLine> fill_span(const std::vector<const LyricsLine*>& lines, double start, double end,
                                 const AlignConfig& config) {
  std::vector<TimedLine> out;
  if (lines.empty()) return out;
  const double limit = std::max(start, end);
  const double span = limit - start;

  size_t total_words = 0;
  for (const auto* l : lines) total_words += l->words.size();

  const double reserve = span * config.gap_reserve;
  const double gap = reserve / double(lines.size() + 1);
  const double body = span - reserve;

  double t = start + gap;
  for (const auto* l : lines) {
    const size_t n = l->words.size();
    const double share = total_words > 0 ? double(n) / double(total_words) : 1.0 / double(lines.size());
    const double line_start = std::min(t, limit);
    const double line_end = std::min(line_start + body * share, limit);
    const double dur = line_end - line_start;

    TimedLine tl;
    tl.line_index = l->index;
    tl.provenance = Provenance::Interpolated;
    tl.words.reserve(n);
    for (size_t j = 0; j < n; ++j) {
      TimedWord w;
      w.text = l->words[j];
      w.start = (j == 0) ? line_start : line_start + dur * double(j) / double(n);
      w.end = (j + 1 == n) ? line_end : line_start + dur * double(j + 1) / double(n);
      tl.words.push_back(std::move(w));
    }
    out.push_back(std::move(tl));
    t = line_end + gap;
  }
  return out;
}

InterpolationResult interpolate_gaps(const std::vector<MatchResult>& results, const std::vector<LyricsLine>& lines,
                                     const StreamBounds& bounds, const AlignConfig& config) {
  if (results.size() != lines.size()) {
    throw InvariantViolation("Match results (" + std::to_string(results.size()) + ") do not cover lyrics lines (" +
                             std::to_string(lines.size()) + ")");
  }

  InterpolationResult out;
  for (const auto& run : find_unmatched_runs(results)) {
    const size_t last = run.first + run.count;  // exclusive
    const bool has_prev = run.first > 0;
    const bool has_next = last < results.size();

    std::vector<const LyricsLine*> run_lines;
    size_t total_words = 0;
    for (size_t i = run.first; i < last; ++i) {
      run_lines.push_back(&lines[i]);
      total_words += lines[i].words.size();
    }
    const double fallback = config.default_line_seconds * double(run.count);

    double region_start = 0.0;
    double region_end = 0.0;
    // False when region_end is the default-span guess rather than heard timing.
    bool measured_end = true;
    if (has_prev && has_next) {
      region_start = results[run.first - 1].end();
      region_end = results[last].start();
    } else if (has_next) {
      region_start = 0.0;
      region_end = results[last].start();
    } else if (has_prev) {
      region_start = results[run.first - 1].end();
      measured_end = bounds.has_words && bounds.end > region_start;
      region_end = measured_end ? bounds.end : region_start + fallback;
    } else {
      // No anchor at all: spread over the whole transcript.
      region_start = bounds.has_words ? bounds.start : 0.0;
      region_end = (bounds.has_words && bounds.end > region_start) ? bounds.end : region_start + fallback;
    }
    const double span = std::max(0.0, region_end - region_start);

    double fill = span;
    bool carved = false;
    if ((has_prev || has_next) && measured_end) {
      const double estimate = double(total_words) * config.expected_word_seconds;
      if (span > config.break_ratio * estimate && span - estimate >= config.min_break_seconds) {
        fill = estimate;
        carved = true;
      }
    }

    // A leading run hugs the first anchor; every other run follows its previous anchor.
    const bool leading = !has_prev && has_next;
    const double fill_start = (carved && leading) ? region_end - fill : region_start;
    const double fill_end = (carved && !leading) ? region_start + fill : region_end;
    auto timed = fill_span(run_lines, fill_start, fill_end, config);

    if (carved) {
      BreakSpan br;
      if (leading) {
        br.start = region_start;
        br.end = fill_start;
        br.after_line = -1;
        br.before_line = lines[run.first].index;
        timed.front().provenance = Provenance::BreakAdjacent;
      } else {
        br.start = fill_end;
        br.end = region_end;
        br.after_line = lines[last - 1].index;
        br.before_line = has_next ? lines[last].index : -1;
        timed.back().provenance = Provenance::BreakAdjacent;
      }
      out.breaks.push_back(br);
    }

    for (size_t i = 0; i < timed.size(); ++i) {
      timed[i].score = results[run.first + i].score;
      out.lines.push_back(std::move(timed[i]));
    }
  }
  return out;
}
