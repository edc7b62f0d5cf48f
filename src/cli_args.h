#pragma once

#include <filesystem>
#include <string>

struct CliArgs {
  std::filesystem::path input;        // transcript JSON, "-" for stdin
  std::filesystem::path output;       // LRC output
  std::filesystem::path json_output;  // timing track JSON, "-" for stdout
  std::filesystem::path lyrics;       // optional: replaces metadata.original_lyrics
  std::filesystem::path config;       // optional: AlignConfig JSON

  // Overrides applied on top of the config file; negative means unset.
  double threshold = -1.0;
  int lookahead = -1;

  bool break_markers = false;
  bool length_tag = false;

  bool debug = false;
  bool quiet = false;
  std::filesystem::path log_file;
};

// Parse command-line flags.
// Returns true on success; on failure writes usage to stderr and returns false (and sets exit_code).
bool parse_cli_args(int argc, char** argv, CliArgs& out, int& exit_code);

void print_usage();
