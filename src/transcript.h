#pragma once

#include <optional>
#include <string>
#include <vector>

// One recognised word from the transcription provider.
struct Word {
  std::string text;
  double start = 0.0;  // seconds
  double end = 0.0;    // seconds
  double confidence = 0.0;  // [0,1], 0 when the provider gave none
  std::optional<std::string> original_text;  // pre-correction spelling, if any
};

struct TranscriptMetadata {
  std::string artist;
  std::string track;
  std::string original_lyrics;
  double start_offset = 0.0;  // timing_info.start_offset, applied when rendering
};

struct Transcript {
  TranscriptMetadata metadata;
  std::vector<Word> words;
};

// One non-blank line of the canonical lyrics.
struct LyricsLine {
  int index = 0;
  std::string text;
  std::vector<std::string> words;  // surface forms, whitespace-split
  bool stanza_break = false;       // blank line(s) preceded this line
};
