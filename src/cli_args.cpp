#include "cli_args.h"

#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

static bool is_flag(const std::string& s) { return s.size() > 1 && s[0] == '-'; }

void print_usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  lrc-aligner --input <transcript.json|-> [options]\n";
  std::cerr << "\nInput/Output:\n";
  std::cerr << "  --input, -i           Transcript JSON with metadata + words (use '-' for stdin)\n";
  std::cerr << "  --lyrics, -L          Plain-text lyrics file (overrides metadata.original_lyrics)\n";
  std::cerr << "  --output, -o          Output LRC path (default: <input>.lrc)\n";
  std::cerr << "  --json-output, -jo    Timing track JSON path (use '-' for stdout)\n";
  std::cerr << "\nAlignment options:\n";
  std::cerr << "  --config, -c          Alignment config JSON (thresholds, lookahead, break detection)\n";
  std::cerr << "  --threshold, -t       Minimum line match score (default: 0.4)\n";
  std::cerr << "  --lookahead           Max transcript words searched past the cursor (default: 100)\n";
  std::cerr << "\nLRC options:\n";
  std::cerr << "  --break-markers       Write INSTRUMENTAL lines for detected breaks\n";
  std::cerr << "  --length-tag          Write a [length:] header\n";
  std::cerr << "\nLogging:\n";
  std::cerr << "  --debug, -d           Log per-line match decisions\n";
  std::cerr << "  --quiet, -q           Only log warnings and errors\n";
  std::cerr << "  --log-file            Mirror the log into a file\n";
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
  return std::string(argv[++i]);
}

static fs::path default_output_lrc(const fs::path& input) {
  const auto base = input.parent_path() / input.stem();
  return fs::path(base.string() + ".lrc");
}

static bool usage_error(const std::string& msg, int& exit_code) {
  std::cerr << msg << "\n\n";
  print_usage();
  exit_code = 2;
  return false;
}

bool parse_cli_args(int argc, char** argv, CliArgs& out, int& exit_code) {
  exit_code = 0;
  if (argc <= 1) {
    print_usage();
    exit_code = 2;
    return false;
  }

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--input" || a == "-i") {
        out.input = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--lyrics" || a == "-L") {
        out.lyrics = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--output" || a == "-o") {
        out.output = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--json-output" || a == "-jo") {
        out.json_output = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--config" || a == "-c") {
        out.config = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--threshold" || a == "-t") {
        out.threshold = std::stod(require_value(i, argc, argv, a));
        if (out.threshold < 0) return usage_error("ERROR: --threshold must be >= 0", exit_code);
      } else if (a == "--lookahead") {
        out.lookahead = std::stoi(require_value(i, argc, argv, a));
        if (out.lookahead < 1) return usage_error("ERROR: --lookahead must be >= 1", exit_code);
      } else if (a == "--break-markers") {
        out.break_markers = true;
      } else if (a == "--length-tag") {
        out.length_tag = true;
      } else if (a == "--debug" || a == "-d") {
        out.debug = true;
      } else if (a == "--quiet" || a == "-q") {
        out.quiet = true;
      } else if (a == "--log-file") {
        out.log_file = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--help" || a == "-h") {
        print_usage();
        exit_code = 0;
        return false;
      } else if (is_flag(a)) {
        return usage_error("Unknown arg: " + a, exit_code);
      } else {
        return usage_error("Unexpected positional arg: " + a, exit_code);
      }
    }
  } catch (const std::invalid_argument&) {
    return usage_error("ERROR: expected a number", exit_code);
  } catch (const std::out_of_range&) {
    return usage_error("ERROR: number out of range", exit_code);
  } catch (const std::runtime_error& e) {
    return usage_error(std::string("ERROR: ") + e.what(), exit_code);
  }

  // Validate required
  if (out.input.empty()) return usage_error("ERROR: --input is required", exit_code);

  // stdin input has no natural output path; default to JSON on stdout.
  if (out.output.empty() && out.json_output.empty()) {
    if (out.input.string() == "-") {
      out.json_output = "-";
    } else {
      out.output = default_output_lrc(out.input);
    }
  }

  return true;
}
