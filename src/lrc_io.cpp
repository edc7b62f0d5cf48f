#include "lrc_io.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <vector>

std::string format_lrc_timestamp(double sec) {
  if (!(sec > 0)) sec = 0;
  // Work in whole centiseconds so 59.999 never renders as "00:60.00".
  const long long total_cs = static_cast<long long>(std::floor(sec * 100.0 + 1e-6));
  const long long mm = total_cs / 6000;
  const long long ss = (total_cs / 100) % 60;
  const long long cs = total_cs % 100;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%02lld", mm, ss, cs);
  return std::string(buf);
}

std::string format_lrc(const TimingTrack& track, const LrcOptions& options) {
  const double offset = track.metadata.start_offset;
  std::vector<std::string> out;
  out.push_back("[ar:" + track.metadata.artist + "]");
  out.push_back("[ti:" + track.metadata.track + "]");
  if (options.length_tag) {
    out.push_back("[length:" + format_lrc_timestamp(track.length + offset) + "]");
  }

  auto blank_line = [&out]() {
    if (!out.empty() && !out.back().empty()) out.push_back("");
  };

  size_t next_break = 0;
  auto emit_breaks_before = [&](double t) {
    while (options.break_markers && next_break < track.breaks.size() && track.breaks[next_break].start <= t) {
      const auto& br = track.breaks[next_break++];
      blank_line();
      out.push_back("[" + format_lrc_timestamp(br.start + offset) + "]\xE2\x99\xAA INSTRUMENTAL [" +
                    format_lrc_timestamp(br.end - br.start) + "] \xE2\x99\xAA");
      out.push_back("");
    }
  };

  for (const auto& line : track.lines) {
    emit_breaks_before(line.start());
    if (options.stanza_gaps && line.stanza_break) blank_line();

    std::string text = "[" + format_lrc_timestamp(line.start() + offset) + "]";
    for (size_t i = 0; i < line.words.size(); ++i) {
      if (i) text.push_back(' ');
      text += "<" + format_lrc_timestamp(line.words[i].start + offset) + ">" + line.words[i].text;
    }
    out.push_back(text);
  }
  emit_breaks_before(track.length);

  std::string joined;
  for (size_t i = 0; i < out.size(); ++i) {
    if (i) joined.push_back('\n');
    joined += out[i];
  }
  // Drop a trailing separator left by a closing break marker.
  while (!joined.empty() && joined.back() == '\n') joined.pop_back();
  joined.push_back('\n');
  return joined;
}

void write_lrc_utf8(const std::filesystem::path& path, const TimingTrack& track, const LrcOptions& options) {
  std::ofstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to write " + path.string());
  f << format_lrc(track, options);
}
