#pragma once

#include <string>
#include <vector>

#include "transcript.h"

enum class Provenance { Matched, Interpolated, BreakAdjacent };

const char* provenance_name(Provenance p);

struct TimedWord {
  std::string text;  // original lyrics spelling
  double start = 0.0;
  double end = 0.0;
};

struct TimedLine {
  int line_index = 0;
  std::vector<TimedWord> words;
  Provenance provenance = Provenance::Interpolated;
  double score = 0.0;
  bool stanza_break = false;

  double start() const { return words.empty() ? 0.0 : words.front().start; }
  double end() const { return words.empty() ? 0.0 : words.back().end; }
};

// Word-free stretch of the song (instrumental break).
struct BreakSpan {
  double start = 0.0;
  double end = 0.0;
  int after_line = -1;   // -1: before the first line
  int before_line = -1;  // -1: after the last line
};

struct TimingTrack {
  TranscriptMetadata metadata;
  std::vector<TimedLine> lines;
  std::vector<BreakSpan> breaks;
  double length = 0.0;  // song length used for the [length:] tag
};
