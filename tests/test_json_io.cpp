/**
 * @file test_json_io.cpp
 * @brief Unit tests for transcript JSON input and timing-track JSON output
 */

#include "align_errors.h"
#include "json_io.h"
#include "test_helpers.h"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <sstream>

using json = nlohmann::json;

// ============================================================
// parse_transcript_json
// ============================================================

TEST(ParseTranscriptJsonTest, ReadsMetadataAndWords) {
  const Transcript t = parse_transcript_json(R"({
    "metadata": {
      "artist": "Artist",
      "track": "Track",
      "original_lyrics": "Hello world\nGoodbye",
      "timing_info": {"start_offset": 1.5}
    },
    "words": [
      {"word": "hello", "start": 0.5, "end": 0.9, "confidence": 0.8, "original_word": "Hello"},
      {"word": "world", "start": 1.0, "end": 1.4}
    ]
  })");
  EXPECT_EQ(t.metadata.artist, "Artist");
  EXPECT_EQ(t.metadata.track, "Track");
  EXPECT_EQ(t.metadata.original_lyrics, "Hello world\nGoodbye");
  EXPECT_DOUBLE_EQ(t.metadata.start_offset, 1.5);
  ASSERT_EQ(t.words.size(), 2u);
  EXPECT_EQ(t.words[0].text, "hello");
  EXPECT_DOUBLE_EQ(t.words[0].confidence, 0.8);
  ASSERT_TRUE(t.words[0].original_text.has_value());
  EXPECT_EQ(*t.words[0].original_text, "Hello");
  EXPECT_DOUBLE_EQ(t.words[1].confidence, 0.0);
  EXPECT_FALSE(t.words[1].original_text.has_value());
}

TEST(ParseTranscriptJsonTest, NullConfidenceIsZeroAndOffsetDefaults) {
  const Transcript t = parse_transcript_json(R"({
    "metadata": {"artist": "A", "track": "T", "original_lyrics": "x"},
    "words": [{"word": "x", "start": 0, "end": 1, "confidence": null}]
  })");
  EXPECT_DOUBLE_EQ(t.metadata.start_offset, 0.0);
  EXPECT_DOUBLE_EQ(t.words[0].confidence, 0.0);
}

TEST(ParseTranscriptJsonTest, EmptyWordListIsAccepted) {
  const Transcript t =
      parse_transcript_json(R"({"metadata": {"artist": "A", "track": "T", "original_lyrics": "x"}, "words": []})");
  EXPECT_TRUE(t.words.empty());
}

TEST(ParseTranscriptJsonTest, MalformedInputThrows) {
  EXPECT_THROW(parse_transcript_json("{not json"), InputError);
  EXPECT_THROW(parse_transcript_json("[]"), InputError);
  EXPECT_THROW(parse_transcript_json(R"({"words": []})"), InputError);
  EXPECT_THROW(parse_transcript_json(R"({"metadata": {"artist": "A", "track": "T"}, "words": []})"), InputError);
  EXPECT_THROW(parse_transcript_json(R"({"metadata": {"artist": "A", "track": "T", "original_lyrics": "x"}})"),
               InputError);
  EXPECT_THROW(
      parse_transcript_json(R"({"metadata": {"artist": "A", "track": "T", "original_lyrics": "x"}, "words": {}})"),
      InputError);
}

TEST(ParseTranscriptJsonTest, BadWordRecordThrows) {
  const std::string head = R"({"metadata": {"artist": "A", "track": "T", "original_lyrics": "x"}, "words": )";
  EXPECT_THROW(parse_transcript_json(head + R"([{"word": "x", "start": 0}]})"), InputError);
  EXPECT_THROW(parse_transcript_json(head + R"([{"word": "x", "start": "zero", "end": 1}]})"), InputError);
  EXPECT_THROW(parse_transcript_json(head + R"([42]})"), InputError);
}

TEST(ParseTranscriptJsonTest, MissingFileThrows) {
  EXPECT_THROW(read_transcript_json("/nonexistent/transcript.json"), InputError);
}

// ============================================================
// format_json_output
// ============================================================

TEST(FormatJsonOutputTest, WritesTrackReport) {
  std::ostringstream sink;
  Logger log(sink);
  Transcript t = test_helpers::verbatim_transcript({"hello world", "good night"});
  t.metadata.start_offset = 2.0;
  const auto report = align_lyrics(t, AlignConfig{}, log);

  const json j = json::parse(format_json_output(report));
  EXPECT_EQ(j["metadata"]["artist"], "Artist");
  EXPECT_EQ(j["metadata"]["track"], "Track");
  EXPECT_DOUBLE_EQ(j["metadata"]["start_offset"].get<double>(), 2.0);
  EXPECT_EQ(j["metadata"]["matched"], 2);
  EXPECT_EQ(j["metadata"]["interpolated"], 0);
  EXPECT_EQ(j["metadata"]["degraded"], false);
  EXPECT_TRUE(j["metadata"]["warnings"].empty());

  ASSERT_EQ(j["lines"].size(), 2u);
  const auto& line = j["lines"][1];
  EXPECT_EQ(line["index"], 1);
  EXPECT_EQ(line["provenance"], "matched");
  EXPECT_DOUBLE_EQ(line["score"].get<double>(), 1.2);
  ASSERT_EQ(line["words"].size(), 2u);
  EXPECT_EQ(line["words"][0]["word"], "good");
  EXPECT_DOUBLE_EQ(line["words"][0]["start"].get<double>(), t.words[2].start);
  EXPECT_DOUBLE_EQ(line["end"].get<double>(), t.words[3].end);
  EXPECT_TRUE(j["breaks"].is_array());
  EXPECT_TRUE(j["breaks"].empty());
}
