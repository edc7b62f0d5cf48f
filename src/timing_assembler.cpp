#include "timing_assembler.h"

#include "align_errors.h"

#include <algorithm>
#include <cmath>
#include <sstream>

const char* provenance_name(Provenance p) {
  switch (p) {
    case Provenance::Matched:
      return "matched";
    case Provenance::Interpolated:
      return "interpolated";
    case Provenance::BreakAdjacent:
      return "break-adjacent";
  }
  return "interpolated";
}

namespace {

void violation(int line_index, const std::string& what) {
  std::ostringstream ss;
  ss << "line " << line_index << ": " << what;
  throw InvariantViolation(ss.str());
}

}  // namespace

TimingTrack assemble_track(const TranscriptMetadata& metadata, const std::vector<LyricsLine>& lines,
                           const std::vector<MatchResult>& results, const InterpolationResult& interpolated,
                           const AlignConfig& config) {
  if (results.size() != lines.size()) {
    throw InvariantViolation("Match results do not cover every lyrics line");
  }

  TimingTrack track;
  track.metadata = metadata;
  track.lines.reserve(lines.size());

  size_t next_interp = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    const MatchResult& r = results[i];
    if (r.line_index != lines[i].index) violation(lines[i].index, "match result out of order");

    if (r.matched) {
      TimedLine tl;
      tl.line_index = r.line_index;
      tl.words = r.words;
      tl.provenance = Provenance::Matched;
      tl.score = r.score;
      tl.stanza_break = lines[i].stanza_break;
      track.lines.push_back(std::move(tl));
      continue;
    }

    if (next_interp >= interpolated.lines.size() || interpolated.lines[next_interp].line_index != lines[i].index) {
      violation(lines[i].index, "unmatched line has no interpolated timing");
    }
    TimedLine tl = interpolated.lines[next_interp++];
    tl.stanza_break = lines[i].stanza_break;
    track.lines.push_back(std::move(tl));
  }
  if (next_interp != interpolated.lines.size()) {
    throw InvariantViolation("Interpolated lines left over after merge");
  }

  track.breaks = interpolated.breaks;
  // Silence before the transcript starts (start_offset) is an intro break. Track
  // times exclude the offset, so the span ends at 0.
  if (metadata.start_offset >= config.min_break_seconds) {
    track.breaks.push_back({-metadata.start_offset, 0.0, -1, lines.empty() ? -1 : lines.front().index});
  }
  // Long silences between two matched lines are breaks too.
  for (size_t i = 1; i < track.lines.size(); ++i) {
    const auto& prev = track.lines[i - 1];
    const auto& cur = track.lines[i];
    if (prev.provenance != Provenance::Matched || cur.provenance != Provenance::Matched) continue;
    if (cur.start() - prev.end() >= config.min_break_seconds) {
      track.breaks.push_back({prev.end(), cur.start(), prev.line_index, cur.line_index});
    }
  }
  std::sort(track.breaks.begin(), track.breaks.end(),
            [](const BreakSpan& a, const BreakSpan& b) { return a.start < b.start; });

  track.length = track.lines.empty() ? 0.0 : track.lines.back().end();
  for (const auto& br : track.breaks) track.length = std::max(track.length, br.end);

  validate_track(track, lines);
  return track;
}

void validate_track(const TimingTrack& track, const std::vector<LyricsLine>& lines) {
  if (track.lines.size() != lines.size()) {
    throw InvariantViolation("Track has " + std::to_string(track.lines.size()) + " lines, lyrics have " +
                             std::to_string(lines.size()));
  }

  double prev_end = -1.0;
  for (size_t i = 0; i < lines.size(); ++i) {
    const TimedLine& tl = track.lines[i];
    const LyricsLine& src = lines[i];
    if (tl.line_index != src.index) violation(src.index, "out of order");
    if (tl.words.size() != src.words.size()) {
      violation(src.index, "word count " + std::to_string(tl.words.size()) + " != " +
                               std::to_string(src.words.size()));
    }

    for (size_t j = 0; j < tl.words.size(); ++j) {
      const TimedWord& w = tl.words[j];
      if (w.text != src.words[j]) violation(src.index, "word " + std::to_string(j) + " lost its original spelling");
      if (!std::isfinite(w.start) || !std::isfinite(w.end)) violation(src.index, "non-finite timestamp");
      if (w.start < 0.0) violation(src.index, "negative timestamp");
      if (w.start > w.end) violation(src.index, "word " + std::to_string(j) + " ends before it starts");
      if (w.start < prev_end) {
        std::ostringstream ss;
        ss << "word " << j << " starts at " << w.start << " before previous end " << prev_end;
        violation(src.index, ss.str());
      }
      prev_end = w.end;
    }
  }
}
