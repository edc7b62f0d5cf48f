#pragma once

#include <vector>

#include "align_config.h"
#include "gap_interpolator.h"
#include "sliding_matcher.h"
#include "timing_track.h"
#include "transcript.h"

// Merge matched lines and interpolated lines back into lyrics order, collect
// break spans (interpolation breaks, long silences between consecutive
// matched lines, and an intro break of -start_offset..0 when the offset is at
// least min_break_seconds) and validate the result. Throws InvariantViolation.
TimingTrack assemble_track(const TranscriptMetadata& metadata, const std::vector<LyricsLine>& lines,
                           const std::vector<MatchResult>& results, const InterpolationResult& interpolated,
                           const AlignConfig& config);

// Ordering and completeness checks on a finished track:
// one line per lyrics line in order, same word counts and spelling, finite
// times, start <= end, no overlap within or across lines.
// Throws InvariantViolation naming the first offending line.
void validate_track(const TimingTrack& track, const std::vector<LyricsLine>& lines);
