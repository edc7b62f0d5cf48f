#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
#include "align_config.h"
#include "align_errors.h"
#include "cli_args.h"
#include "json_io.h"
#include "logger.h"
#include "lrc_io.h"
#include "lyrics_aligner.h"

static int run_alignment(int argc, char** argv);

int main(int argc, char** argv) {
  try {
    return run_alignment(argc, argv);
  } catch (const InputError& e) {
    std::cerr << "\n[ERROR] Invalid input: " << e.what() << "\n";
    return 1;
  } catch (const InvariantViolation& e) {
    std::cerr << "\n[ERROR] Internal alignment error, no output written: " << e.what() << "\n";
    return 1;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "\n[ERROR] JSON error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "\n[ERROR] " << e.what() << "\n";
    return 1;
  }
}

static std::string read_text_file(const fs::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw InputError("Failed to open " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

static int run_alignment(int argc, char** argv) {
  CliArgs args;
  int exit_code = 0;
  if (!parse_cli_args(argc, argv, args, exit_code)) {
    return exit_code;
  }

  Logger log;
  log.set_debug(args.debug);
  log.set_quiet(args.quiet);
  if (!args.log_file.empty() && !log.enable_file(args.log_file)) {
    log.warn("Cannot open log file: " + args.log_file.string());
  }

  AlignConfig config;
  if (!args.config.empty()) {
    config = load_align_config(args.config);
    log.info("Loaded alignment config: " + args.config.string());
  }
  if (args.threshold >= 0) config.match_threshold = args.threshold;
  if (args.lookahead > 0) config.max_lookahead = args.lookahead;

  Transcript transcript;
  if (args.input.string() == "-") {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    transcript = parse_transcript_json(ss.str());
  } else {
    transcript = read_transcript_json(args.input);
  }
  if (!args.lyrics.empty()) {
    transcript.metadata.original_lyrics = read_text_file(args.lyrics);
    log.info("Using lyrics from: " + args.lyrics.string());
  }
  {
    std::ostringstream ss;
    ss << "Read transcript: " << transcript.metadata.artist << " - " << transcript.metadata.track << ", "
       << transcript.words.size() << " words";
    log.info(ss.str());
  }

  const AlignmentReport report = align_lyrics(transcript, config, log);
  if (report.degraded) {
    log.warn("Output is fully interpolated; word timing is approximate");
  }

  if (!args.output.empty()) {
    LrcOptions lrc;
    lrc.break_markers = args.break_markers;
    lrc.length_tag = args.length_tag;
    write_lrc_utf8(args.output, report.track, lrc);
    log.info(std::string("Wrote LRC: ") + args.output.string());
  }
  if (!args.json_output.empty()) {
    if (args.json_output.string() == "-") {
      std::cout << format_json_output(report);
    } else {
      write_json_output(args.json_output, report);
      log.info(std::string("Wrote timing JSON: ") + args.json_output.string());
    }
  }

  return 0;
}
