#pragma once

#include <string>
#include <vector>

#include "align_config.h"
#include "logger.h"
#include "timing_track.h"
#include "transcript.h"

struct AlignmentReport {
  TimingTrack track;
  int matched_lines = 0;
  int interpolated_lines = 0;
  int repaired_words = 0;  // timestamps clamped or reordered
  int dropped_words = 0;   // words with non-finite timestamps
  bool degraded = false;   // no line could be matched
  std::vector<std::string> warnings;
};

// Make the word stream safe to align against: non-finite times are dropped,
// negative times clamped to 0, end >= start, and no word starts before the
// previous one ended. Counts are added to `repaired`/`dropped`.
std::vector<Word> sanitize_words(const std::vector<Word>& words, int& repaired, int& dropped);

// Full two-pass alignment of transcript.metadata.original_lyrics against
// transcript.words. Throws InputError for unusable input and
// InvariantViolation if the produced track breaks its guarantees.
AlignmentReport align_lyrics(const Transcript& transcript, const AlignConfig& config, Logger& log);
