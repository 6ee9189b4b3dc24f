/**
 * @file test_clip_encoder.cpp
 * @brief Render plan helpers, command runner and memory file tests
 */

#include <cassert>
#include <iostream>
#include <string>

#include "clipforge/clip_encoder.hpp"
#include "clipforge/command_runner.hpp"
#include "clipforge/system.hpp"
#include "test_support.hpp"

using namespace clipforge;
using namespace clipforge::testing;

namespace {

FramePlan single(int x, int y = 0) {
  FramePlan p;
  p.crop = {x, y, 608, 1080};
  p.mode = FramingMode::SingleSubject;
  return p;
}

FramePlan letterbox() {
  FramePlan p;
  p.crop = {0, 0, 1920, 1080};
  p.mode = FramingMode::MultiSubjectLetterbox;
  return p;
}

void test_split_runs() {
  std::vector<FramePlan> plan = {single(10), single(12), letterbox(),
                                 letterbox(), letterbox(), single(20)};
  std::vector<PlanRun> runs = split_runs(plan);
  assert(runs.size() == 3);
  assert(runs[0].first_frame == 0 && runs[0].frame_count == 2);
  assert(runs[0].mode == FramingMode::SingleSubject);
  assert(runs[1].first_frame == 2 && runs[1].frame_count == 3);
  assert(runs[1].mode == FramingMode::MultiSubjectLetterbox);
  assert(runs[2].first_frame == 5 && runs[2].frame_count == 1);

  assert(split_runs({}).empty());
  std::cout << "test_split_runs: PASSED\n";
}

void test_crop_commands_only_on_change() {
  std::vector<FramePlan> plan = {single(100), single(100), single(100),
                                 single(130), single(130), single(160, 4)};
  PlanRun run{0, 6, FramingMode::SingleSubject};
  std::string cmds = crop_commands(plan, run, 30.0);

  assert(cmds == "0.0000 crop@cf x 100, crop@cf y 0;\n"
                 "0.1000 crop@cf x 130, crop@cf y 0;\n"
                 "0.1667 crop@cf x 160, crop@cf y 4;\n");

  /// Times restart at the run's first frame
  PlanRun tail{3, 3, FramingMode::SingleSubject};
  std::string tail_cmds = crop_commands(plan, tail, 30.0);
  assert(tail_cmds.rfind("0.0000 crop@cf x 130", 0) == 0);
  std::cout << "test_crop_commands_only_on_change: PASSED\n";
}

void test_run_filters() {
  PlanRun lb{0, 10, FramingMode::MultiSubjectLetterbox};
  std::string pad = run_filter(lb, {0, 0, 1920, 1080}, 1080, 1920, "");
  assert(pad == "scale=1080:1920:force_original_aspect_ratio=decrease,"
                "pad=1080:1920:(ow-iw)/2:(oh-ih)/2:black,setsar=1");

  PlanRun one{0, 10, FramingMode::SingleSubject};
  std::string crop =
      run_filter(one, {656, 0, 608, 1080}, 1080, 1920, "/tmp/run0.cmd");
  assert(crop == "sendcmd=f='/tmp/run0.cmd',crop@cf=w=608:h=1080:x=656:y=0,"
                 "scale=1080:1920,setsar=1");
  std::cout << "test_run_filters: PASSED\n";
}

void test_escaping() {
  assert(filter_escape("/a/b.ass") == "'/a/b.ass'");
  assert(filter_escape("it's.ass") == "'it'\\''s.ass'");

  std::string list = concat_list({"/w/a.mp4", "/w/it's.mp4"});
  assert(list == "file '/w/a.mp4'\nfile '/w/it'\\''s.mp4'\n");

  assert(shell_quote("plain") == "'plain'");
  std::cout << "test_escaping: PASSED\n";
}

void test_run_command_outcomes() {
  CommandResult ok = run_command("true", 5);
  assert(ok.launched && ok.exit_code == 0 && !ok.timed_out);
  assert(command_outcome(ok, "noop").ok());

  CommandResult bad = run_command("exit 3", 5);
  assert(bad.exit_code == 3 && !bad.timed_out);
  StageOutcome o = command_outcome(bad, "step");
  assert(o.kind == OutcomeKind::Transient);
  assert(o.message == "step: exited with code 3");

  CommandResult slow = run_command("sleep 5", 1);
  assert(slow.timed_out);
  assert(command_outcome(slow, "slow").message == "slow: timed out");

  CommandResult missing;
  assert(command_outcome(missing, "x").kind == OutcomeKind::Transient);
  std::cout << "test_run_command_outcomes: PASSED\n";
}

void test_run_command_log_file() {
  TempDir dir;
  const std::string log = dir.sub("cmd.log");
  run_command("echo first", 5, log);
  run_command("echo second 1>&2", 5, log);
  assert(read_file(log) == "first\nsecond\n");
  std::cout << "test_run_command_log_file: PASSED\n";
}

void test_mem_file() {
  MemFile f;
  assert(!f.is_valid());
  assert(f.create("clipforge_test", "file 'a.mp4'\n"));
  assert(f.is_valid());
  assert(read_file(f.path()) == "file 'a.mp4'\n");

  MemFile moved = std::move(f);
  assert(!f.is_valid());
  assert(moved.is_valid());
  assert(read_file(moved.path()) == "file 'a.mp4'\n");
  std::cout << "test_mem_file: PASSED\n";
}

void test_encoder_rejects_bad_input() {
  TempDir dir;
  FfmpegClipEncoder enc("ffmpeg", 5, 1);
  StageOutcome cut = enc.extract("in.mp4", {5, 5}, dir.sub("out.mp4"));
  assert(cut.kind == OutcomeKind::Fatal);

  EncodeRequest req;
  req.output = dir.sub("final.mp4");
  req.work_dir = dir.path().string();
  assert(enc.render(req).kind == OutcomeKind::Fatal);
  std::cout << "test_encoder_rejects_bad_input: PASSED\n";
}

} // anonymous namespace

int main() {
  test_split_runs();
  test_crop_commands_only_on_change();
  test_run_filters();
  test_escaping();
  test_run_command_outcomes();
  test_run_command_log_file();
  test_mem_file();
  test_encoder_rejects_bad_input();
  std::cout << "All clip encoder tests passed\n";
  return 0;
}
