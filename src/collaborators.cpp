/**
 * @file collaborators.cpp
 * @brief JSON contracts and command-backed collaborator implementations
 */

#include "clipforge/collaborators.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>

#include <fmt/core.h>

#include "clipforge/command_runner.hpp"
#include "clipforge/job.hpp"
#include "clipforge/logging.hpp"
#include "clipforge/system.hpp"

namespace fs = std::filesystem;

namespace clipforge {

using nlohmann::json;

namespace {

/// Number or timestamp string
bool read_time(const json &j, const char *key, double &out) {
  auto it = j.find(key);
  if (it == j.end())
    return false;
  if (it->is_number()) {
    out = it->get<double>();
    return std::isfinite(out);
  }
  if (it->is_string())
    return parse_timestamp(it->get<std::string>(), out);
  return false;
}

std::string read_text(const json &j, const char *key) {
  auto it = j.find(key);
  return (it != j.end() && it->is_string()) ? it->get<std::string>()
                                            : std::string{};
}

} // anonymous namespace

// **----- JSON CONTRACTS -----**

bool parse_timestamp(const std::string &text, double &seconds) {
  if (text.empty())
    return false;

  double total = 0;
  int fields = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    std::size_t colon = text.find(':', pos);
    std::string part = text.substr(
        pos, colon == std::string::npos ? std::string::npos : colon - pos);
    if (part.empty())
      return false;

    std::size_t used = 0;
    double v = 0;
    try {
      v = std::stod(part, &used);
    } catch (const std::exception &) {
      return false;
    }
    if (used != part.size() || v < 0)
      return false;

    total = total * 60.0 + v;
    if (++fields > 3)
      return false;
    if (colon == std::string::npos)
      break;
    pos = colon + 1;
  }

  seconds = total;
  return true;
}

StageOutcome parse_transcript(const json &j, Transcript &out) {
  if (!j.is_object() || !j.contains("segments") || !j["segments"].is_array())
    return StageOutcome::fatal("transcript: missing 'segments' array");

  Transcript t;
  for (const auto &s : j["segments"]) {
    if (!s.is_object())
      return StageOutcome::fatal("transcript: segment is not an object");
    TranscriptSegment seg;
    if (!read_time(s, "start", seg.start) || !read_time(s, "end", seg.end))
      return StageOutcome::fatal("transcript: segment without start/end");
    seg.text = read_text(s, "text");

    if (s.contains("words") && s["words"].is_array()) {
      for (const auto &w : s["words"]) {
        TimedWord word;
        if (!w.is_object() || !read_time(w, "start", word.start) ||
            !read_time(w, "end", word.end))
          return StageOutcome::fatal("transcript: word without start/end");
        word.text = read_text(w, "word");
        if (!word.text.empty())
          seg.words.push_back(std::move(word));
      }
    }
    t.segments.push_back(std::move(seg));
  }

  out = std::move(t);
  return StageOutcome::success();
}

StageOutcome parse_analysis(const json &j, std::vector<CandidateSegment> &out) {
  if (!j.is_object() || !j.contains("shorts") || !j["shorts"].is_array())
    return StageOutcome::fatal("analysis: missing 'shorts' array");

  std::vector<CandidateSegment> segments;
  for (const auto &s : j["shorts"]) {
    if (!s.is_object())
      return StageOutcome::fatal("analysis: short is not an object");
    CandidateSegment c;
    if (!read_time(s, "start", c.range.start) ||
        !read_time(s, "end", c.range.end))
      return StageOutcome::fatal("analysis: short without start/end");
    c.title = read_text(s, "video_title_for_youtube_short");
    c.description_tiktok = read_text(s, "video_description_for_tiktok");
    c.description_instagram = read_text(s, "video_description_for_instagram");
    c.description_youtube = c.title;
    segments.push_back(std::move(c));
  }

  out = std::move(segments);
  return StageOutcome::success();
}

StageOutcome parse_detections(const json &j, DetectionTrack &out) {
  if (!j.is_object() || !j.contains("frames") || !j["frames"].is_array())
    return StageOutcome::fatal("detections: missing 'frames' array");

  DetectionTrack track;
  track.width = j.value("width", 0);
  track.height = j.value("height", 0);
  track.fps = j.value("fps", 0.0);

  try {
    for (const auto &f : j["frames"]) {
      FrameDetections frame;
      frame.index = f.at("index").get<int>();
      if (f.contains("detections")) {
        for (const auto &d : f["detections"]) {
          Detection det;
          det.x = d.at("x").get<double>();
          det.y = d.at("y").get<double>();
          det.w = d.at("w").get<double>();
          det.h = d.at("h").get<double>();
          det.id = (d.contains("id") && d["id"].is_number_integer())
                       ? d["id"].get<int>()
                       : -1;
          det.confidence = d.value("confidence", 1.0);
          det.activity = (d.contains("activity") && d["activity"].is_number())
                             ? d["activity"].get<double>()
                             : -1.0;
          frame.detections.push_back(det);
        }
      }
      track.frames.push_back(std::move(frame));
    }
  } catch (const json::exception &e) {
    return StageOutcome::fatal(fmt::format("detections: {}", e.what()));
  }

  out = std::move(track);
  return StageOutcome::success();
}

StageOutcome read_json_file(const std::string &path, json &out) {
  std::ifstream in(path);
  if (!in)
    return StageOutcome::fatal(fmt::format("missing output file {}", path));
  try {
    out = json::parse(in);
  } catch (const json::exception &e) {
    return StageOutcome::fatal(
        fmt::format("malformed JSON in {}: {}", path, e.what()));
  }
  return StageOutcome::success();
}

// **----- CommandDownloader -----**

CommandDownloader::CommandDownloader(std::string ytdlp_bin,
                                     std::string cookies_file,
                                     int timeout_seconds)
    : bin_(std::move(ytdlp_bin)), cookies_(std::move(cookies_file)),
      timeout_(timeout_seconds) {}

StageOutcome CommandDownloader::fetch(const std::string &url,
                                      const std::string &dest) {
  const std::string log_path = dest + ".download.log";

  auto make_cmd = [&](bool clear_cache) {
    std::string cmd = fmt::format(
        "{} --no-playlist -f {} --merge-output-format mp4", shell_quote(bin_),
        shell_quote("bestvideo[ext=mp4]+bestaudio[ext=m4a]/best[ext=mp4]/best"));
    if (!cookies_.empty())
      cmd += fmt::format(" --cookies {}", shell_quote(cookies_));
    if (clear_cache)
      cmd += " --rm-cache-dir";
    cmd += fmt::format(" -o {} {}", shell_quote(dest), shell_quote(url));
    return cmd;
  };

  CommandResult r = run_command(make_cmd(false), timeout_, log_path);
  if (r.launched && !r.timed_out && r.exit_code != 0) {
    /// Stale signature cache is the usual cause; retry once with it cleared
    LOG_WARN("[download] yt-dlp exited with {}, retrying with cache clear",
             r.exit_code);
    r = run_command(make_cmd(true), timeout_, log_path);
  }

  StageOutcome outcome = command_outcome(r, "download");
  if (!outcome.ok())
    return outcome;

  std::error_code ec;
  if (!fs::exists(dest, ec) || fs::file_size(dest, ec) == 0)
    return StageOutcome::transient(
        fmt::format("download: expected file not found: {}", dest));
  return StageOutcome::success();
}

// **----- CommandTranscriber -----**

CommandTranscriber::CommandTranscriber(std::string cmd, int timeout_seconds)
    : cmd_(std::move(cmd)), timeout_(timeout_seconds) {}

StageOutcome CommandTranscriber::transcribe(const std::string &media,
                                            const std::string &work_dir,
                                            Transcript &out) {
  const std::string out_path = (fs::path(work_dir) / "transcript.json").string();
  const std::string cmd = fmt::format("{} {} {}", cmd_, shell_quote(media),
                                      shell_quote(out_path));

  StageOutcome outcome = command_outcome(
      run_command(cmd, timeout_,
                  (fs::path(work_dir) / "transcribe.log").string()),
      "transcription");
  if (!outcome.ok())
    return outcome;

  json j;
  outcome = read_json_file(out_path, j);
  if (!outcome.ok())
    return outcome;
  return parse_transcript(j, out);
}

// **----- CommandAnalyzer -----**

CommandAnalyzer::CommandAnalyzer(std::string cmd, int timeout_seconds)
    : cmd_(std::move(cmd)), timeout_(timeout_seconds) {}

StageOutcome CommandAnalyzer::analyze(const Transcript &transcript,
                                      const std::string &api_key,
                                      int min_clips, int max_clips,
                                      const std::string &work_dir,
                                      std::vector<CandidateSegment> &out) {
  const std::string in_path =
      (fs::path(work_dir) / "analysis_input.json").string();
  const std::string out_path = (fs::path(work_dir) / "analysis.json").string();

  {
    std::ofstream f(in_path, std::ios::trunc);
    if (!f)
      return StageOutcome::transient(
          fmt::format("analysis: cannot write {}", in_path));
    f << json{{"segments", transcript.segments}}.dump();
    if (!f)
      return StageOutcome::transient(
          fmt::format("analysis: short write on {}", in_path));
  }

  /// The key is read from a memory file into the child's environment; argv
  /// only ever holds the file's path
  MemFile key_file;
  if (!key_file.create("analysis-key", api_key))
    return StageOutcome::transient("analysis: cannot stage credential");

  const std::string inner = fmt::format(
      "ANALYSIS_API_KEY=$(cat \"$0\") || exit 125; export ANALYSIS_API_KEY; "
      "exec {} \"$@\"",
      cmd_);
  const std::string cmd = fmt::format(
      "sh -c {} {} {} {} {} {}", shell_quote(inner),
      shell_quote(key_file.path()), shell_quote(in_path),
      shell_quote(out_path), min_clips, max_clips);

  StageOutcome outcome = command_outcome(
      run_command(cmd, timeout_, (fs::path(work_dir) / "analyze.log").string()),
      "content analysis");
  if (!outcome.ok())
    return outcome;

  json j;
  outcome = read_json_file(out_path, j);
  if (!outcome.ok())
    return outcome;
  return parse_analysis(j, out);
}

// **----- CommandDetector -----**

CommandDetector::CommandDetector(std::string cmd, int timeout_seconds)
    : cmd_(std::move(cmd)), timeout_(timeout_seconds) {}

StageOutcome CommandDetector::detect(const std::string &clip,
                                     const std::string &work_dir,
                                     DetectionTrack &out) {
  const std::string stem = fs::path(clip).stem().string();
  const std::string out_path =
      (fs::path(work_dir) / (stem + ".detections.json")).string();
  const std::string cmd = fmt::format("{} {} {}", cmd_, shell_quote(clip),
                                      shell_quote(out_path));

  StageOutcome outcome = command_outcome(
      run_command(cmd, timeout_,
                  (fs::path(work_dir) / (stem + ".detect.log")).string()),
      "subject detection");
  if (!outcome.ok())
    return outcome;

  json j;
  outcome = read_json_file(out_path, j);
  if (!outcome.ok())
    return outcome;
  return parse_detections(j, out);
}

} // namespace clipforge
