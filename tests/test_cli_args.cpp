/**
 * @file test_cli_args.cpp
 * @brief Unit tests for command-line parsing
 */

#include "cli_args.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

// Owns argv storage for one parse_cli_args call.
struct Argv {
  explicit Argv(std::vector<std::string> a) : args(std::move(a)) {
    args.insert(args.begin(), "lrc-aligner");
    for (auto& s : args) ptrs.push_back(&s[0]);
    ptrs.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(args.size()); }
  char** argv() { return ptrs.data(); }

  std::vector<std::string> args;
  std::vector<char*> ptrs;
};

bool parse(std::vector<std::string> a, CliArgs& out, int& exit_code) {
  Argv argv(std::move(a));
  return parse_cli_args(argv.argc(), argv.argv(), out, exit_code);
}

}  // namespace

TEST(CliArgsTest, InputOnlyDefaultsToLrcBesideInput) {
  CliArgs args;
  int code = -1;
  ASSERT_TRUE(parse({"--input", "songs/track.json"}, args, code));
  EXPECT_EQ(code, 0);
  EXPECT_EQ(args.input.string(), "songs/track.json");
  EXPECT_EQ(args.output, std::filesystem::path("songs") / "track.lrc");
  EXPECT_TRUE(args.json_output.empty());
  EXPECT_LT(args.threshold, 0.0);
  EXPECT_LT(args.lookahead, 0);
}

TEST(CliArgsTest, StdinInputDefaultsToJsonOnStdout) {
  CliArgs args;
  int code = -1;
  ASSERT_TRUE(parse({"-i", "-"}, args, code));
  EXPECT_TRUE(args.output.empty());
  EXPECT_EQ(args.json_output.string(), "-");
}

TEST(CliArgsTest, AllOptions) {
  CliArgs args;
  int code = -1;
  ASSERT_TRUE(parse({"-i", "in.json", "-o", "out.lrc", "-jo", "out.json", "-L", "lyrics.txt", "-c", "align.json",
                     "-t", "0.5", "--lookahead", "30", "--break-markers", "--length-tag", "-d", "-q", "--log-file",
                     "run.log"},
                    args, code));
  EXPECT_EQ(args.output.string(), "out.lrc");
  EXPECT_EQ(args.json_output.string(), "out.json");
  EXPECT_EQ(args.lyrics.string(), "lyrics.txt");
  EXPECT_EQ(args.config.string(), "align.json");
  EXPECT_DOUBLE_EQ(args.threshold, 0.5);
  EXPECT_EQ(args.lookahead, 30);
  EXPECT_TRUE(args.break_markers);
  EXPECT_TRUE(args.length_tag);
  EXPECT_TRUE(args.debug);
  EXPECT_TRUE(args.quiet);
  EXPECT_EQ(args.log_file.string(), "run.log");
}

TEST(CliArgsTest, JsonOutputAloneSuppressesDefaultLrc) {
  CliArgs args;
  int code = -1;
  ASSERT_TRUE(parse({"-i", "in.json", "--json-output", "out.json"}, args, code));
  EXPECT_TRUE(args.output.empty());
}

TEST(CliArgsTest, HelpExitsCleanly) {
  CliArgs args;
  int code = -1;
  EXPECT_FALSE(parse({"--help"}, args, code));
  EXPECT_EQ(code, 0);
}

TEST(CliArgsTest, UsageErrors) {
  const std::vector<std::vector<std::string>> cases = {
      {},
      {"-o", "out.lrc"},
      {"-i", "in.json", "--bogus"},
      {"-i", "in.json", "stray"},
      {"-i"},
      {"-i", "in.json", "-t", "abc"},
      {"-i", "in.json", "-t", "-0.5"},
      {"-i", "in.json", "--lookahead", "0"},
  };
  for (const auto& c : cases) {
    CliArgs args;
    int code = -1;
    EXPECT_FALSE(parse(c, args, code));
    EXPECT_EQ(code, 2);
  }
}
