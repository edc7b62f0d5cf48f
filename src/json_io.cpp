#include "json_io.h"
#include "align_errors.h"
#include "timing_track.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string read_all_text(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw InputError("Failed to open: " + path.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

const json& require(const json& obj, const char* key, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw InputError(where + " missing required '" + key + "' field");
    }
    return obj[key];
}

Word parse_word_object(const json& obj, size_t index) {
    const std::string where = "Word " + std::to_string(index);
    if (!obj.is_object()) throw InputError(where + " is not an object");

    Word w;
    w.text = require(obj, "word", where).get<std::string>();
    w.start = require(obj, "start", where).get<double>();
    w.end = require(obj, "end", where).get<double>();
    // Providers emit null for unknown confidence; treat like absent.
    if (obj.contains("confidence") && !obj["confidence"].is_null()) {
        w.confidence = obj["confidence"].get<double>();
    }
    if (obj.contains("original_word") && obj["original_word"].is_string()) {
        w.original_text = obj["original_word"].get<std::string>();
    }
    return w;
}

} // namespace

Transcript parse_transcript_json(const std::string& content) {
    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw InputError(std::string("Invalid transcript JSON: ") + e.what());
    }
    if (!j.is_object()) throw InputError("Invalid transcript JSON: expected object");

    Transcript t;
    try {
        const json& meta = require(j, "metadata", "Transcript");
        t.metadata.artist = require(meta, "artist", "metadata").get<std::string>();
        t.metadata.track = require(meta, "track", "metadata").get<std::string>();
        t.metadata.original_lyrics = require(meta, "original_lyrics", "metadata").get<std::string>();
        if (meta.contains("timing_info") && meta["timing_info"].is_object()) {
            t.metadata.start_offset = meta["timing_info"].value("start_offset", 0.0);
        }

        const json& words = require(j, "words", "Transcript");
        if (!words.is_array()) throw InputError("Transcript 'words' must be an array");
        t.words.reserve(words.size());
        size_t index = 0;
        for (const auto& item : words) {
            t.words.push_back(parse_word_object(item, index++));
        }
    } catch (const json::type_error& e) {
        throw InputError(std::string("Invalid transcript field type: ") + e.what());
    }
    return t;
}

Transcript read_transcript_json(const std::filesystem::path& path) {
    return parse_transcript_json(read_all_text(path));
}

std::string format_json_output(const AlignmentReport& report) {
    const TimingTrack& track = report.track;

    json j;
    j["metadata"]["artist"] = track.metadata.artist;
    j["metadata"]["track"] = track.metadata.track;
    j["metadata"]["start_offset"] = track.metadata.start_offset;
    j["metadata"]["length"] = track.length;
    j["metadata"]["matched"] = report.matched_lines;
    j["metadata"]["interpolated"] = report.interpolated_lines;
    j["metadata"]["degraded"] = report.degraded;
    j["metadata"]["warnings"] = report.warnings;

    j["lines"] = json::array();
    for (const auto& line : track.lines) {
        json line_obj;
        line_obj["index"] = line.line_index;
        line_obj["start"] = line.start();
        line_obj["end"] = line.end();
        line_obj["provenance"] = provenance_name(line.provenance);
        line_obj["score"] = line.score;
        line_obj["words"] = json::array();
        for (const auto& w : line.words) {
            line_obj["words"].push_back({{"word", w.text}, {"start", w.start}, {"end", w.end}});
        }
        j["lines"].push_back(line_obj);
    }

    j["breaks"] = json::array();
    for (const auto& br : track.breaks) {
        j["breaks"].push_back({{"start", br.start}, {"end", br.end}});
    }

    return j.dump(2) + "\n";
}

void write_json_output(const std::filesystem::path& path, const AlignmentReport& report) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for writing: " + path.string());
    f << format_json_output(report);
}
