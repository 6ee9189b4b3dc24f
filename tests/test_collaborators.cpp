/**
 * @file test_collaborators.cpp
 * @brief JSON contract parsing, retries and command-backed collaborators
 */

#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "clipforge/collaborators.hpp"
#include "clipforge/retry.hpp"
#include "test_support.hpp"

using namespace clipforge;
using namespace clipforge::testing;
using nlohmann::json;

namespace {

void test_timestamps() {
  double s = 0;
  assert(parse_timestamp("42", s) && s == 42);
  assert(parse_timestamp("01:30", s) && s == 90);
  assert(parse_timestamp("1:02:03.5", s) && s == 3723.5);
  assert(parse_timestamp("00:00:07.250", s) && s == 7.25);

  s = -1;
  assert(!parse_timestamp("", s));
  assert(!parse_timestamp("1:2:3:4", s));
  assert(!parse_timestamp("1::3", s));
  assert(!parse_timestamp("ten", s));
  assert(!parse_timestamp("12s", s));
  assert(!parse_timestamp("-5", s));
  assert(s == -1);
  std::cout << "test_timestamps: PASSED\n";
}

void test_parse_transcript() {
  json j = json::parse(R"({
    "segments": [
      {"start": 0, "end": 4.5, "text": "hello there",
       "words": [{"word": "hello", "start": 0, "end": 1},
                 {"word": "there", "start": 1.2, "end": 2}]},
      {"start": "00:05", "end": "00:09", "text": "no words"}
    ]})");
  Transcript t;
  assert(parse_transcript(j, t).ok());
  assert(t.segments.size() == 2);
  assert(t.segments[0].words.size() == 2);
  assert(t.segments[0].words[1].text == "there");
  assert(t.segments[1].start == 5 && t.segments[1].end == 9);
  assert(!t.has_word_timing());

  Transcript untouched;
  assert(parse_transcript(json::parse(R"({"segs": []})"), untouched).kind ==
         OutcomeKind::Fatal);
  assert(parse_transcript(json::parse(R"({"segments": [{"text": "x"}]})"),
                          untouched)
             .kind == OutcomeKind::Fatal);
  assert(untouched.segments.empty());
  std::cout << "test_parse_transcript: PASSED\n";
}

void test_parse_analysis() {
  json j = json::parse(R"({
    "shorts": [
      {"start": "00:01:05", "end": "00:01:40",
       "video_title_for_youtube_short": "The big reveal",
       "video_description_for_tiktok": "wait for it #fyp",
       "video_description_for_instagram": "You won't believe this"},
      {"start": 200, "end": 230.5}
    ]})");
  std::vector<CandidateSegment> out;
  assert(parse_analysis(j, out).ok());
  assert(out.size() == 2);
  assert(out[0].range.start == 65 && out[0].range.end == 100);
  assert(out[0].title == "The big reveal");
  assert(out[0].description_youtube == "The big reveal");
  assert(out[0].description_tiktok == "wait for it #fyp");
  assert(out[0].description_instagram == "You won't believe this");
  assert(out[1].range.end == 230.5);
  assert(out[1].title.empty());

  assert(parse_analysis(json::array(), out).kind == OutcomeKind::Fatal);
  assert(parse_analysis(json::parse(R"({"shorts": [{"start": "soon",
                                        "end": 10}]})"),
                        out)
             .kind == OutcomeKind::Fatal);
  std::cout << "test_parse_analysis: PASSED\n";
}

void test_parse_detections() {
  json j = json::parse(R"({
    "width": 1920, "height": 1080, "fps": 25,
    "frames": [
      {"index": 0, "detections": [
        {"x": 10, "y": 20, "w": 100, "h": 120, "id": 4, "confidence": 0.8,
         "activity": 0.6},
        {"x": 500, "y": 20, "w": 100, "h": 120}]},
      {"index": 3}
    ]})");
  DetectionTrack track;
  assert(parse_detections(j, track).ok());
  assert(track.width == 1920 && track.height == 1080 && track.fps == 25);
  assert(track.frames.size() == 2);
  const Detection &tagged = track.frames[0].detections[0];
  assert(tagged.id == 4 && tagged.confidence == 0.8 && tagged.activity == 0.6);
  const Detection &bare = track.frames[0].detections[1];
  assert(bare.id == -1 && bare.confidence == 1.0 && bare.activity == -1.0);
  assert(track.frames[1].index == 3 && track.frames[1].detections.empty());

  json missing_box = json::parse(
      R"({"frames": [{"index": 0, "detections": [{"x": 1, "y": 2}]}]})");
  assert(parse_detections(missing_box, track).kind == OutcomeKind::Fatal);
  std::cout << "test_parse_detections: PASSED\n";
}

void test_read_json_file() {
  TempDir dir;
  json j;
  assert(read_json_file(dir.sub("absent.json"), j).kind == OutcomeKind::Fatal);

  write_file(dir.sub("bad.json"), "{\"a\": ");
  StageOutcome bad = read_json_file(dir.sub("bad.json"), j);
  assert(bad.kind == OutcomeKind::Fatal);
  assert(bad.message.find("malformed JSON") != std::string::npos);

  write_file(dir.sub("good.json"), "{\"a\": 1}");
  assert(read_json_file(dir.sub("good.json"), j).ok());
  assert(j["a"] == 1);
  std::cout << "test_read_json_file: PASSED\n";
}

void test_retry_with_backoff() {
  RetryPolicy policy;
  policy.max_attempts = 4;
  policy.base_delay = std::chrono::milliseconds(100);
  policy.max_delay = std::chrono::milliseconds(300);
  assert(policy.delay_after(1).count() == 100);
  assert(policy.delay_after(2).count() == 200);
  assert(policy.delay_after(3).count() == 300);

  policy.base_delay = std::chrono::milliseconds(0);
  int calls = 0;
  int retries = 0;
  StageOutcome o = retry_with_backoff(
      policy,
      [&] {
        return ++calls < 3 ? StageOutcome::transient("flaky")
                           : StageOutcome::success();
      },
      [&](int, const StageOutcome &) { ++retries; });
  assert(o.ok() && calls == 3 && retries == 2);

  calls = 0;
  o = retry_with_backoff(
      policy, [&] { return ++calls, StageOutcome::fatal("broken"); },
      [](int, const StageOutcome &) {});
  assert(o.kind == OutcomeKind::Fatal && calls == 1);

  calls = 0;
  o = retry_with_backoff(
      policy, [&] { return ++calls, StageOutcome::transient("down"); },
      [](int, const StageOutcome &) {});
  assert(o.kind == OutcomeKind::Transient && calls == 4);
  std::cout << "test_retry_with_backoff: PASSED\n";
}

void test_command_transcriber() {
  TempDir dir;
  const std::string script = dir.sub("transcribe.sh");
  write_file(script,
             "printf '%s' '{\"segments\":[{\"start\":0,\"end\":3,"
             "\"text\":\"hi\",\"words\":[{\"word\":\"hi\",\"start\":0,"
             "\"end\":1}]}]}' > \"$2\"\n");
  CommandTranscriber transcriber("sh " + script, 10);
  Transcript t;
  StageOutcome o = transcriber.transcribe(dir.sub("media.mp4"),
                                          dir.path().string(), t);
  assert(o.ok());
  assert(t.segments.size() == 1 && t.has_word_timing());

  write_file(script, "exit 7\n");
  o = transcriber.transcribe(dir.sub("media.mp4"), dir.path().string(), t);
  assert(o.kind == OutcomeKind::Transient);

  write_file(script, "echo 'not json' > \"$2\"\n");
  o = transcriber.transcribe(dir.sub("media.mp4"), dir.path().string(), t);
  assert(o.kind == OutcomeKind::Fatal);
  std::cout << "test_command_transcriber: PASSED\n";
}

void test_command_analyzer_passes_key_in_environment() {
  TempDir dir;
  const std::string script = dir.sub("analyze.sh");
  /// The key must not appear in the wrapping process's argv
  write_file(script,
             "test -s \"$1\" || exit 9\n"
             "tr '\\0' ' ' < /proc/$PPID/cmdline | "
             "grep -qF \"$ANALYSIS_API_KEY\" && exit 8\n"
             "printf '{\"shorts\":[{\"start\":%s,\"end\":%s,"
             "\"video_title_for_youtube_short\":\"%s\"}]}' "
             "\"$3\" \"$4\" \"$ANALYSIS_API_KEY\" > \"$2\"\n");
  CommandAnalyzer analyzer("sh " + script, 10);
  std::vector<CandidateSegment> out;
  StageOutcome o = analyzer.analyze(sample_transcript(30), "sk-test-123", 3,
                                    15, dir.path().string(), out);
  assert(o.ok());
  assert(out.size() == 1);
  assert(out[0].range.start == 3 && out[0].range.end == 15);
  assert(out[0].title == "sk-test-123");
  std::cout << "test_command_analyzer_passes_key_in_environment: PASSED\n";
}

void test_command_detector_failure_is_transient() {
  TempDir dir;
  const std::string script = dir.sub("detect.sh");
  write_file(script, "exit 1\n");
  CommandDetector detector("sh " + script, 10);
  DetectionTrack track;
  StageOutcome o =
      detector.detect(dir.sub("clip_0.mp4"), dir.path().string(), track);
  assert(o.kind == OutcomeKind::Transient);
  assert(o.message.find("subject detection") == 0);
  std::cout << "test_command_detector_failure_is_transient: PASSED\n";
}

} // anonymous namespace

int main() {
  test_timestamps();
  test_parse_transcript();
  test_parse_analysis();
  test_parse_detections();
  test_read_json_file();
  test_retry_with_backoff();
  test_command_transcriber();
  test_command_analyzer_passes_key_in_environment();
  test_command_detector_failure_is_transient();
  std::cout << "All collaborator tests passed\n";
  return 0;
}
