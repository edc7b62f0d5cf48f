#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <ostream>
#include <string>

class Logger {
 public:
  enum class Level { Debug, Info, Warn, Error };

  Logger() = default;
  explicit Logger(std::ostream& sink) : sink_(&sink) {}

  // Mirror every emitted line into `path`. Returns false when the file cannot be opened.
  bool enable_file(const std::filesystem::path& path) {
    file_.open(path, std::ios::binary | std::ios::trunc);
    return file_.is_open();
  }

  void set_debug(bool enabled) { debug_enabled_ = enabled; }
  void set_quiet(bool quiet) { quiet_ = quiet; }

  void log(Level level, const std::string& msg) {
    if (level == Level::Debug && !debug_enabled_) return;
    if (quiet_ && level == Level::Info) return;
    const std::string line = format(level, msg);
    if (sink_) *sink_ << line;
    if (file_.is_open()) file_ << line;
  }

  void info(const std::string& msg) { log(Level::Info, msg); }
  void warn(const std::string& msg) { log(Level::Warn, msg); }
  void error(const std::string& msg) { log(Level::Error, msg); }
  void debug(const std::string& msg) { log(Level::Debug, msg); }

 private:
  static const char* level_tag(Level l) {
    switch (l) {
      case Level::Debug:
        return "DEBUG";
      case Level::Info:
        return "INFO";
      case Level::Warn:
        return "WARN";
      case Level::Error:
        return "ERROR";
    }
    return "INFO";
  }

  static std::string format(Level l, const std::string& msg) {
    std::string out;
    out.reserve(msg.size() + 16);
    out += "[";
    out += level_tag(l);
    out += "] ";
    out += msg;
    if (out.empty() || out.back() != '\n') out.push_back('\n');
    return out;
  }

  std::ostream* sink_ = &std::cerr;
  bool debug_enabled_ = false;
  bool quiet_ = false;
  std::ofstream file_;
};
