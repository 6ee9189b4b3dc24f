/**
 * @file clip_encoder.cpp
 * @brief ffmpeg-backed clip extraction and vertical rendering
 */

#include "clipforge/clip_encoder.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <fmt/core.h>

#include "clipforge/command_runner.hpp"
#include "clipforge/logging.hpp"
#include "clipforge/system.hpp"

namespace fs = std::filesystem;

namespace clipforge {

namespace {

constexpr const char *VIDEO_CODEC_ARGS =
    "-c:v libx264 -preset veryfast -crf 20 -pix_fmt yuv420p";
constexpr const char *AUDIO_CODEC_ARGS = "-c:a aac -b:a 160k";

} // anonymous namespace

// **----- PLAN HELPERS -----**

std::vector<PlanRun> split_runs(const std::vector<FramePlan> &plan) {
  std::vector<PlanRun> runs;
  for (std::size_t i = 0; i < plan.size(); ++i) {
    if (runs.empty() || runs.back().mode != plan[i].mode) {
      PlanRun r;
      r.first_frame = static_cast<int>(i);
      r.frame_count = 1;
      r.mode = plan[i].mode;
      runs.push_back(r);
    } else {
      ++runs.back().frame_count;
    }
  }
  return runs;
}

std::string crop_commands(const std::vector<FramePlan> &plan,
                          const PlanRun &run, double fps) {
  if (fps <= 0)
    fps = 30.0;

  std::string script;
  const FramePlan *last = nullptr;
  for (int f = run.first_frame; f < run.first_frame + run.frame_count; ++f) {
    const FramePlan &p = plan[static_cast<std::size_t>(f)];
    if (last && last->crop.x == p.crop.x && last->crop.y == p.crop.y)
      continue;
    const double t = (f - run.first_frame) / fps;
    script += fmt::format("{:.4f} crop@cf x {}, crop@cf y {};\n", t, p.crop.x,
                          p.crop.y);
    last = &p;
  }
  return script;
}

std::string run_filter(const PlanRun &run, const CropRect &first_crop,
                       int out_width, int out_height,
                       const std::string &commands_path) {
  if (run.mode == FramingMode::MultiSubjectLetterbox) {
    return fmt::format("scale={0}:{1}:force_original_aspect_ratio=decrease,"
                       "pad={0}:{1}:(ow-iw)/2:(oh-ih)/2:black,setsar=1",
                       out_width, out_height);
  }
  return fmt::format(
      "sendcmd=f={},crop@cf=w={}:h={}:x={}:y={},scale={}:{},setsar=1",
      filter_escape(commands_path), first_crop.w, first_crop.h, first_crop.x,
      first_crop.y, out_width, out_height);
}

std::string concat_list(const std::vector<std::string> &files) {
  std::string list;
  list.reserve(files.size() * 64);
  for (const auto &f : files) {
    std::string abs_path = fs::absolute(f).string();
    std::string escaped;
    for (char c : abs_path) {
      if (c == '\'')
        escaped += "'\\''";
      else
        escaped += c;
    }
    list += fmt::format("file '{}'\n", escaped);
  }
  return list;
}

std::string filter_escape(const std::string &path) {
  std::string out = "'";
  for (char c : path) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
}

// **----- FfmpegClipEncoder -----**

FfmpegClipEncoder::FfmpegClipEncoder(std::string ffmpeg_bin,
                                     int timeout_seconds, int threads)
    : bin_(std::move(ffmpeg_bin)), timeout_(timeout_seconds),
      threads_(std::max(1, threads)) {}

StageOutcome FfmpegClipEncoder::run(const std::string &args,
                                    const std::string &log_path,
                                    const std::string &what) const {
  const std::string cmd = fmt::format(
      "{} -y -hide_banner -loglevel error -threads {} {}", shell_quote(bin_),
      threads_, args);
  return command_outcome(run_command(cmd, timeout_, log_path), what);
}

StageOutcome FfmpegClipEncoder::extract(const std::string &source,
                                        const TimeSegment &range,
                                        const std::string &dest) {
  if (range.duration() <= 0)
    return StageOutcome::fatal(fmt::format(
        "extract: empty range {:.2f}-{:.2f}", range.start, range.end));

  /// Re-encode so the cut lands on the requested frame, not a keyframe
  const std::string args = fmt::format(
      "-ss {:.3f} -i {} -t {:.3f} -map 0:v:0 -map 0:a:0? {} {} "
      "-avoid_negative_ts make_zero {}",
      range.start, shell_quote(source), range.duration(), VIDEO_CODEC_ARGS,
      AUDIO_CODEC_ARGS, shell_quote(dest));

  StageOutcome outcome = run(args, dest + ".log", "extract");
  if (!outcome.ok())
    return outcome;

  std::error_code ec;
  if (!fs::exists(dest, ec) || fs::file_size(dest, ec) == 0)
    return StageOutcome::transient(
        fmt::format("extract: no output produced for {}", dest));
  return outcome;
}

StageOutcome FfmpegClipEncoder::render(const EncodeRequest &req) {
  if (req.plan.empty())
    return StageOutcome::fatal("render: empty frame plan");

  const std::string stem = fs::path(req.output).stem().string();
  const std::string log_path =
      (fs::path(req.work_dir) / (stem + ".encode.log")).string();
  const double fps = req.fps > 0 ? req.fps : 30.0;

  // **---- RUN SEGMENTS ----**

  std::vector<PlanRun> runs = split_runs(req.plan);
  std::vector<std::string> parts;
  parts.reserve(runs.size());

  for (std::size_t k = 0; k < runs.size(); ++k) {
    const PlanRun &r = runs[k];
    const std::string part =
        (fs::path(req.work_dir) / fmt::format("{}.run{}.mp4", stem, k))
            .string();
    std::string commands_path;

    if (r.mode == FramingMode::SingleSubject) {
      commands_path =
          (fs::path(req.work_dir) / fmt::format("{}.run{}.cmd", stem, k))
              .string();
      std::ofstream cmds(commands_path, std::ios::trunc);
      cmds << crop_commands(req.plan, r, fps);
      if (!cmds)
        return StageOutcome::transient(
            fmt::format("render: cannot write {}", commands_path));
    }

    const CropRect &first =
        req.plan[static_cast<std::size_t>(r.first_frame)].crop;
    const std::string filter = run_filter(r, first, req.out_width,
                                          req.out_height, commands_path);

    const std::string args = fmt::format(
        "-ss {:.4f} -i {} -frames:v {} -vf {} -map 0:v:0 -map 0:a:0? "
        "-t {:.4f} {} {} {}",
        r.first_frame / fps, shell_quote(req.input), r.frame_count,
        shell_quote(filter), r.frame_count / fps, VIDEO_CODEC_ARGS,
        AUDIO_CODEC_ARGS, shell_quote(part));

    StageOutcome outcome =
        run(args, log_path, fmt::format("render run {}", k + 1));
    if (!outcome.ok())
      return outcome;
    parts.push_back(part);
  }

  // **---- CONCAT + CAPTIONS ----**

  MemFile list;
  if (!list.create("concat_list_mem", concat_list(parts)))
    return StageOutcome::transient("render: cannot create concat list");

  std::string video_args = "-c:v copy";
  if (!req.subtitles.empty()) {
    video_args =
        fmt::format("-vf {} {}",
                    shell_quote("ass=" + filter_escape(req.subtitles)),
                    VIDEO_CODEC_ARGS);
  }

  const std::string args = fmt::format(
      "-f concat -safe 0 -protocol_whitelist file,pipe,fd -i {} {} -c:a copy "
      "-fflags +genpts -avoid_negative_ts make_zero -movflags +faststart {}",
      shell_quote(list.path()), video_args, shell_quote(req.output));

  StageOutcome outcome = run(args, log_path, "finalize clip");

  for (const auto &p : parts) {
    std::error_code ec;
    fs::remove(p, ec);
  }

  if (!outcome.ok())
    return outcome;

  std::error_code ec;
  if (!fs::exists(req.output, ec) || fs::file_size(req.output, ec) == 0)
    return StageOutcome::transient(
        fmt::format("render: no output produced for {}", req.output));

  LOG_DEBUG("[encode] {} ({} runs, captions={})", req.output, runs.size(),
            !req.subtitles.empty());
  return StageOutcome::success();
}

} // namespace clipforge
