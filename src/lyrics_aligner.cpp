#include "lyrics_aligner.h"

#include "align_errors.h"
#include "gap_interpolator.h"
#include "sliding_matcher.h"
#include "text_normalize.h"
#include "timing_assembler.h"

#include <algorithm>
#include <cmath>
#include <sstream>

std::vector<Word> sanitize_words(const std::vector<Word>& words, int& repaired, int& dropped) {
  std::vector<Word> out;
  out.reserve(words.size());
  double prev_end = 0.0;
  for (const auto& src : words) {
    if (!std::isfinite(src.start) || !std::isfinite(src.end)) {
      ++dropped;
      continue;
    }
    Word w = src;
    if (!std::isfinite(w.confidence)) w.confidence = 0.0;
    w.confidence = std::max(0.0, std::min(1.0, w.confidence));

    bool fixed = false;
    if (w.start < prev_end) {
      w.start = prev_end;
      fixed = true;
    }
    if (w.end < w.start) {
      w.end = w.start;
      fixed = true;
    }
    if (fixed) ++repaired;
    prev_end = w.end;
    out.push_back(std::move(w));
  }
  return out;
}

AlignmentReport align_lyrics(const Transcript& transcript, const AlignConfig& config, Logger& log) {
  validate_align_config(config);
  const auto lines = parse_lyrics(transcript.metadata.original_lyrics);

  AlignmentReport report;
  const auto words = sanitize_words(transcript.words, report.repaired_words, report.dropped_words);
  {
    std::ostringstream ss;
    ss << "Aligning " << lines.size() << " lyrics lines against " << words.size() << " transcript words";
    log.info(ss.str());
  }

  if (report.dropped_words > 0) {
    report.warnings.push_back("Dropped " + std::to_string(report.dropped_words) +
                              " transcript words with non-finite timestamps");
  }
  if (report.repaired_words > 0) {
    report.warnings.push_back("Repaired " + std::to_string(report.repaired_words) +
                              " transcript words with negative or non-monotonic timestamps");
  }
  const auto usable = std::count_if(words.begin(), words.end(), [](const Word& w) {
    return w.confidence > 0.0 && !normalize_word(w.text).empty();
  });
  if (usable == 0) {
    report.warnings.push_back("Transcript has no usable words; timing is interpolated");
  }

  // Pass 1
  SlidingMatcher matcher(words, config, log);
  const auto results = matcher.match_all(lines);

  // Pass 2
  const auto interpolated = interpolate_gaps(results, lines, stream_bounds(words), config);

  report.track = assemble_track(transcript.metadata, lines, results, interpolated, config);
  report.track.length = std::max(report.track.length, words.empty() ? 0.0 : words.back().end);

  for (const auto& r : results) {
    if (r.matched) {
      ++report.matched_lines;
    } else {
      ++report.interpolated_lines;
    }
  }
  report.degraded = report.matched_lines == 0;
  if (report.degraded && usable > 0) {
    report.warnings.push_back("No lyrics line matched the transcript; timing is interpolated");
  }

  {
    std::ostringstream ss;
    ss << "Matched " << report.matched_lines << "/" << lines.size() << " lines, interpolated "
       << report.interpolated_lines << ", breaks " << report.track.breaks.size();
    log.info(ss.str());
  }
  for (const auto& w : report.warnings) log.warn(w);
  return report;
}
