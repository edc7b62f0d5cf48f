#include "align_config.h"

#include "align_errors.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& out) {
  if (!j.contains(key)) return;
  try {
    out = j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw InputError(std::string("Config key '") + key + "': " + e.what());
  }
}

}  // namespace

AlignConfig parse_align_config(const std::string& content) {
  json j;
  try {
    j = json::parse(content);
  } catch (const json::parse_error& e) {
    throw InputError(std::string("Invalid config JSON: ") + e.what());
  }
  if (!j.is_object()) throw InputError("Invalid config JSON: expected object");

  AlignConfig c;
  read_key(j, "match_threshold", c.match_threshold);
  read_key(j, "window_shrink", c.window_shrink);
  read_key(j, "window_grow", c.window_grow);
  read_key(j, "max_lookahead", c.max_lookahead);
  read_key(j, "exact_bonus", c.exact_bonus);
  read_key(j, "whole_line_bonus", c.whole_line_bonus);
  read_key(j, "repeat_threshold_step", c.repeat_threshold_step);
  read_key(j, "repeat_threshold_floor", c.repeat_threshold_floor);
  read_key(j, "gap_reserve", c.gap_reserve);
  read_key(j, "expected_word_seconds", c.expected_word_seconds);
  read_key(j, "break_ratio", c.break_ratio);
  read_key(j, "min_break_seconds", c.min_break_seconds);
  read_key(j, "default_line_seconds", c.default_line_seconds);

  validate_align_config(c);
  return c;
}

AlignConfig load_align_config(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw InputError("Failed to open config: " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  return parse_align_config(ss.str());
}

void validate_align_config(const AlignConfig& c) {
  auto fail = [](const std::string& what) { throw InputError("Invalid config: " + what); };
  if (!(c.match_threshold >= 0.0)) fail("match_threshold must be >= 0");
  if (c.window_shrink < 0 || c.window_grow < 0) fail("window_shrink/window_grow must be >= 0");
  if (c.max_lookahead < 1) fail("max_lookahead must be >= 1");
  if (!(c.exact_bonus >= 1.0)) fail("exact_bonus must be >= 1");
  if (!(c.whole_line_bonus >= 1.0)) fail("whole_line_bonus must be >= 1");
  if (!(c.repeat_threshold_step >= 0.0)) fail("repeat_threshold_step must be >= 0");
  if (!(c.repeat_threshold_floor >= 0.0)) fail("repeat_threshold_floor must be >= 0");
  if (!(c.gap_reserve >= 0.0 && c.gap_reserve < 1.0)) fail("gap_reserve must be in [0,1)");
  if (!(c.expected_word_seconds > 0.0)) fail("expected_word_seconds must be > 0");
  if (!(c.break_ratio >= 1.0)) fail("break_ratio must be >= 1");
  if (!(c.min_break_seconds >= 0.0)) fail("min_break_seconds must be >= 0");
  if (!(c.default_line_seconds > 0.0)) fail("default_line_seconds must be > 0");
}
