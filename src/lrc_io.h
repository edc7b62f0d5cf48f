#pragma once

#include <filesystem>
#include <string>

#include "timing_track.h"

struct LrcOptions {
  bool length_tag = false;     // emit [length:mm:ss.hh] after the header
  bool break_markers = false;  // emit an INSTRUMENTAL line for every break span
  bool stanza_gaps = true;     // blank line before lines that start a stanza
};

// "mm:ss.hh"; negative input renders as 00:00.00, centiseconds are truncated.
std::string format_lrc_timestamp(double sec);

// Enhanced LRC: [ar:]/[ti:] header then one
// "[mm:ss.hh]<mm:ss.hh>word <mm:ss.hh>word ..." line per lyrics line.
// The metadata start offset is added to every timestamp.
std::string format_lrc(const TimingTrack& track, const LrcOptions& options = {});

void write_lrc_utf8(const std::filesystem::path& path, const TimingTrack& track, const LrcOptions& options = {});
