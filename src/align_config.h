#pragma once

#include <filesystem>
#include <string>

// Tuning knobs for both alignment passes. Defaults reproduce the reference
// lyric-sync behaviour.
struct AlignConfig {
  // Matching (pass 1)
  double match_threshold = 0.4;   // minimum window score to accept a line
  int window_shrink = 2;          // window sizes tried: N - shrink .. N + grow
  int window_grow = 4;
  int max_lookahead = 100;        // transcript words past the cursor a window may start at
  double exact_bonus = 2.0;       // per-word multiplier for exact matches (clamped to 1.0)
  double whole_line_bonus = 1.2;  // applied when every line word matches exactly
  double repeat_threshold_step = 0.01;   // threshold relief per earlier occurrence of a repeated line
  double repeat_threshold_floor = 0.35;

  // Interpolation (pass 2)
  double gap_reserve = 0.10;            // share of a run's span kept as inter-line gaps
  double expected_word_seconds = 0.4;   // natural duration estimate per sung word
  double break_ratio = 3.0;             // span > ratio * estimate => instrumental break
  double min_break_seconds = 5.0;       // shorter excesses are not treated as breaks
  double default_line_seconds = 4.0;    // per-line span when the transcript gives no bound
};

// Read overrides from a JSON object; keys that are absent keep their defaults.
// Throws InputError on unreadable files, malformed JSON or wrongly typed values.
AlignConfig load_align_config(const std::filesystem::path& path);
AlignConfig parse_align_config(const std::string& content);

// Throws InputError when a value is out of its meaningful range.
void validate_align_config(const AlignConfig& config);
