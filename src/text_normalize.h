#pragma once

#include <string>
#include <vector>

#include "transcript.h"

// Canonical comparison form of a single word: case-folded, punctuation and
// whitespace removed. Codepoints from scripts without case pass through.
std::string normalize_word(const std::string& word);

// Normalized words of a line joined by single spaces; words that normalize to
// nothing are dropped.
std::string normalize_line(const std::string& line);

// Whitespace tokenisation that keeps the surface form of each word.
std::vector<std::string> split_words(const std::string& text);

// Split lyrics text into non-blank lines. Blank lines mark a stanza break on the
// next lyric line. Throws InputError when no lyric line remains.
std::vector<LyricsLine> parse_lyrics(const std::string& lyrics_text);
