#pragma once

#include "lyrics_aligner.h"
#include "transcript.h"
#include <filesystem>
#include <string>

// Parse a transcript record:
// {"metadata": {"artist", "track", "original_lyrics", "timing_info": {"start_offset"}},
//  "words": [{"word", "start", "end", "confidence"?, "original_word"?}, ...]}
// Throws InputError on malformed JSON or missing required fields.
Transcript parse_transcript_json(const std::string& content);

Transcript read_transcript_json(const std::filesystem::path& path);

// Timing track as JSON:
// {"metadata": {...}, "lines": [{"index", "start", "end", "provenance", "score", "words": [...]}], "breaks": [...]}
std::string format_json_output(const AlignmentReport& report);

void write_json_output(const std::filesystem::path& path, const AlignmentReport& report);
