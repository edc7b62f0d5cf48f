#pragma once

#include <cstddef>
#include <string>

// Levenshtein distance counted in Unicode codepoints.
size_t edit_distance(const std::string& a, const std::string& b);

// 1 - edit_distance / longer length, over normalized forms. Identical forms
// score 1.0; an empty form (punctuation-only word) scores 0 against anything.
double similarity(const std::string& a, const std::string& b);

// Normalized forms are identical and non-empty.
bool exact_match(const std::string& a, const std::string& b);

// 1 - |pos - center| / (window_length * 1.5) with center = window_length / 2,
// clamped to 0. Peaks at the window center.
double position_weight(int pos, int window_length);
