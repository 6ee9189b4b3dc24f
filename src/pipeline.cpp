/**
 * @file pipeline.cpp
 * @brief Job processing pipeline implementation
 *
 * @details Implements the ProcessingPipeline class:
 *
 *          - Stage entry writes progress and a log line; stage exit logs
 *            elapsed time
 *
 *          - Collaborator calls go through with_retry()
 *
 *          - Every record change is a whole-record store update
 */

#include "clipforge/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>

#include <fmt/core.h>

#include "clipforge/captions.hpp"
#include "clipforge/config.hpp"
#include "clipforge/job.hpp"
#include "clipforge/logging.hpp"

namespace fs = std::filesystem;

namespace clipforge {

// **----- JOB STATE -----**

struct ProcessingPipeline::ClipDraft {
  int index = 0;
  CandidateSegment segment;
  std::string extracted;
  std::string subtitles;
  std::vector<FramePlan> plan;
  double fps = 0;
};

struct ProcessingPipeline::JobContext {
  JobId id;
  std::string api_key;
  Job job; //< Snapshot taken when processing began
  std::string work_dir;
  std::string output_dir;
  std::string source;
  MediaInfo media;
  Transcript transcript;
  std::vector<CandidateSegment> segments;
  std::vector<ClipDraft> drafts;
  std::string store_error; //< First store write that gave up
  bool abandoned = false;  //< Even the failure could not be recorded
};

// **----- SETTINGS -----**

PipelineSettings PipelineSettings::from_env() {
  PipelineSettings s;
  s.work_dir = Config::work_dir();
  s.output_dir = Config::output_dir();
  s.stage_retry.max_attempts = std::max(1, Config::stage_retry_attempts());
  s.stage_retry.base_delay =
      std::chrono::milliseconds(std::max(0, Config::stage_retry_base_ms()));
  s.store_retry.max_attempts = std::max(1, Config::store_retry_attempts());
  s.store_retry.base_delay =
      std::chrono::milliseconds(std::max(0, Config::store_retry_base_ms()));
  s.failure_retry.max_attempts = std::max(1, Config::failure_write_attempts());
  s.log_cap = static_cast<std::size_t>(std::max(2, Config::job_log_cap()));
  s.out_width = Config::output_width();
  s.out_height = Config::output_height();
  s.caption_max_words = std::max(1, Config::caption_max_words());
  s.tracker = TrackerSettings::from_env();
  return s;
}

// **----- SEGMENT SANITISING -----**

std::vector<CandidateSegment>
sanitize_segments(const std::vector<CandidateSegment> &segments,
                  double duration, std::vector<std::string> *notes) {
  auto note = [notes](std::string msg) {
    if (notes)
      notes->push_back(std::move(msg));
  };

  std::vector<CandidateSegment> kept;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    CandidateSegment c = segments[i];
    if (c.range.end <= c.range.start) {
      note(fmt::format("Dropped segment {}: end {:.2f}s is not after start "
                       "{:.2f}s",
                       i + 1, c.range.end, c.range.start));
      continue;
    }

    c.range.start = std::max(0.0, c.range.start);
    if (duration > 0)
      c.range.end = std::min(c.range.end, duration);

    if (c.range.duration() < MIN_CLIP_SECONDS) {
      note(fmt::format("Dropped segment {}: shorter than {:.0f}s after "
                       "clamping",
                       i + 1, MIN_CLIP_SECONDS));
      continue;
    }

    if (static_cast<int>(kept.size()) == MAX_CLIPS) {
      note(fmt::format("Kept the first {} segments, {} more ignored",
                       MAX_CLIPS, segments.size() - i));
      break;
    }
    kept.push_back(std::move(c));
  }

  for (std::size_t i = 0; i < kept.size(); ++i) {
    CandidateSegment &c = kept[i];
    if (c.title.empty())
      c.title = fmt::format("Clip {}", i + 1);
    if (c.description_tiktok.empty())
      c.description_tiktok = c.title;
    if (c.description_instagram.empty())
      c.description_instagram = c.title;
    if (c.description_youtube.empty())
      c.description_youtube = c.title;
  }
  return kept;
}

// **----- ProcessingPipeline Implementation -----**

ProcessingPipeline::ProcessingPipeline(JobStore &store,
                                       Collaborators collaborators,
                                       PipelineSettings settings, Clock clock)
    : store_(store), c_(collaborators), settings_(std::move(settings)),
      clock_(std::move(clock)) {}

bool ProcessingPipeline::write(const JobId &id,
                               const std::function<void(Job &)> &mutate) {
  return write(id, mutate, settings_.store_retry);
}

bool ProcessingPipeline::write(const JobId &id,
                               const std::function<void(Job &)> &mutate,
                               const RetryPolicy &policy) {
  StageOutcome outcome = retry_with_backoff(
      policy,
      [&]() {
        StoreStatus st = store_.update(id, mutate);
        if (st == StoreStatus::Ok)
          return StageOutcome::success();
        if (st == StoreStatus::NotFound)
          return StageOutcome::fatal("job record no longer exists");
        return StageOutcome::transient("job store unavailable");
      },
      [&](int attempt, const StageOutcome &o) {
        LOG_WARN("[{}] Store write attempt {} failed: {}", id, attempt,
                 o.message);
      });

  if (!outcome.ok()) {
    LOG_ERROR("[{}] Giving up on store write: {}", id, outcome.message);
    return false;
  }
  return true;
}

bool ProcessingPipeline::log(JobContext &ctx, const std::string &message) {
  LOG_INFO("[{}] {}", ctx.id, message);
  const std::size_t cap = settings_.log_cap;
  const std::int64_t now = clock_();
  if (write(ctx.id, [&](Job &job) { append_log(job, message, now, cap); }))
    return true;
  if (ctx.store_error.empty())
    ctx.store_error = "job store unavailable, log line lost: " + message;
  return false;
}

bool ProcessingPipeline::enter_stage(JobContext &ctx, Stage stage) {
  const std::size_t cap = settings_.log_cap;
  const std::int64_t now = clock_();
  const std::string label = stage_label(stage);
  LOG_PHASE("[{}] {} ({}%)", ctx.id, label, stage_percentage(stage));
  if (write(ctx.id, [&](Job &job) {
        set_progress(job, stage_percentage(stage), label);
        append_log(job, label + "...", now, cap);
      }))
    return true;
  if (ctx.store_error.empty())
    ctx.store_error = "job store unavailable, could not enter stage " + label;
  return false;
}

void ProcessingPipeline::fail(JobContext &ctx, const std::string &error) {
  LOG_ERROR("[{}] Job failed: {}", ctx.id, error);

  const std::size_t cap = settings_.log_cap;
  const std::int64_t now = clock_();
  if (!write(
          ctx.id,
          [&](Job &job) {
            if (fail_job(job, error, now))
              append_log(job, "Job failed: " + error, now, cap);
          },
          settings_.failure_retry)) {
    LOG_ERROR("[{}] Failure not recorded; record stays processing until "
              "startup recovery",
              ctx.id);
    ctx.abandoned = true;
  }
}

template <typename Fn>
StageOutcome ProcessingPipeline::with_retry(JobContext &ctx,
                                            const std::string &what, Fn &&fn) {
  return retry_with_backoff(settings_.stage_retry, std::forward<Fn>(fn),
                            [&](int attempt, const StageOutcome &o) {
                              log(ctx, fmt::format("{} attempt {} failed ({}), "
                                               "retrying",
                                               what, attempt, o.message));
                            });
}

bool ProcessingPipeline::run(const JobId &id, const std::string &api_key) {
  TimingCollector::clear();
  TIMER_START(total_run);

  JobContext ctx;
  ctx.id = id;
  ctx.api_key = api_key;
  ctx.work_dir = (fs::path(settings_.work_dir) / id).string();
  ctx.output_dir = (fs::path(settings_.output_dir) / id).string();

  // **---- ADMISSION -> PROCESSING ----**

  bool began = false;
  const std::int64_t start = clock_();
  const std::size_t cap = settings_.log_cap;
  if (!write(id, [&](Job &job) {
        began = begin_processing(job, start);
        if (began)
          append_log(job, "Job started by worker.", start, cap);
        ctx.job = job;
      })) {
    return false;
  }
  if (!began) {
    LOG_WARN("[{}] Not queued (status {}), skipping", id,
             to_string(ctx.job.status));
    return false;
  }

  // **---- STAGES ----**

  using StageFn = StageOutcome (ProcessingPipeline::*)(JobContext &);
  const std::pair<Stage, StageFn> stages[] = {
      {Stage::Downloading, &ProcessingPipeline::download_stage},
      {Stage::Transcribing, &ProcessingPipeline::transcribe_stage},
      {Stage::Analyzing, &ProcessingPipeline::analyze_stage},
      {Stage::CreatingClips, &ProcessingPipeline::create_clips_stage},
      {Stage::Finalizing, &ProcessingPipeline::finalize_stage},
  };

  bool completed = true;
  for (const auto &[stage, fn] : stages) {
    if (!enter_stage(ctx, stage)) {
      fail(ctx, ctx.store_error);
      completed = false;
      break;
    }

    const auto t0 = std::chrono::steady_clock::now();
    StageOutcome outcome;
    try {
      outcome = (this->*fn)(ctx);
    } catch (const std::exception &e) {
      outcome = StageOutcome::fatal(fmt::format("internal error: {}", e.what()));
    }
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    TimingCollector::record(stage_label(stage), static_cast<long>(us));

    if (outcome.ok() && !ctx.store_error.empty())
      outcome = StageOutcome::fatal(ctx.store_error);
    if (!outcome.ok()) {
      fail(ctx, outcome.message);
      completed = false;
      break;
    }
    if (!log(ctx, fmt::format("{} done in {:.1f}s", stage_label(stage),
                              us / 1e6)) &&
        stage != Stage::Finalizing) {
      fail(ctx, ctx.store_error);
      completed = false;
      break;
    }
  }

  TIMER_END(total_run);
  if (!ctx.abandoned && !log(ctx, "Timings: " + TimingCollector::summary()))
    LOG_WARN("[{}] Timing summary not recorded", id);
  if (debug_enabled())
    TimingCollector::print_summary();

  // **---- CLEANUP ----**

  std::error_code ec;
  fs::remove_all(ctx.work_dir, ec);
  if (!completed) {
    fs::remove_all(ctx.output_dir, ec);
  } else {
    LOG_SUCCESS("[{}] Completed with {} clips", id, ctx.drafts.size());
  }
  return completed;
}

// **----- STAGES -----**

StageOutcome ProcessingPipeline::download_stage(JobContext &ctx) {
  std::error_code ec;
  fs::create_directories(ctx.work_dir, ec);
  if (ec)
    return StageOutcome::fatal(
        fmt::format("cannot create work directory: {}", ec.message()));

  ctx.source = (fs::path(ctx.work_dir) / "source.mp4").string();
  const JobParams &params = ctx.job.params;

  if (!params.upload_path.empty()) {
    fs::copy_file(params.upload_path, ctx.source,
                  fs::copy_options::overwrite_existing, ec);
    if (ec)
      return StageOutcome::fatal(
          fmt::format("uploaded file is not readable: {}", ec.message()));
    log(ctx, "Using uploaded file.");
  } else {
    StageOutcome fetched = with_retry(ctx, "Download", [&]() {
      return c_.downloader->fetch(params.source_url, ctx.source);
    });
    if (!fetched.ok())
      return StageOutcome::fatal(
          fmt::format("download failed: {}", fetched.message));
  }

  StageOutcome probed = c_.prober->probe(ctx.source, ctx.media);
  if (!probed.ok())
    return probed;

  log(ctx, fmt::format("Video ready: {}x{}, {:.1f}s @ {:.2f} fps",
                       ctx.media.width, ctx.media.height,
                       ctx.media.duration, ctx.media.fps));
  return StageOutcome::success();
}

StageOutcome ProcessingPipeline::transcribe_stage(JobContext &ctx) {
  StageOutcome outcome = with_retry(ctx, "Transcription", [&]() {
    return c_.transcriber->transcribe(ctx.source, ctx.work_dir,
                                      ctx.transcript);
  });
  if (!outcome.ok())
    return StageOutcome::fatal(
        fmt::format("transcription failed: {}", outcome.message));

  log(ctx, fmt::format("Transcript: {} segments, word timing {}",
                       ctx.transcript.segments.size(),
                       ctx.transcript.has_word_timing() ? "yes" : "no"));
  return StageOutcome::success();
}

StageOutcome ProcessingPipeline::analyze_stage(JobContext &ctx) {
  std::vector<CandidateSegment> proposed;
  StageOutcome outcome = with_retry(ctx, "Analysis", [&]() {
    return c_.analyzer->analyze(ctx.transcript, ctx.api_key, MIN_CLIPS,
                                MAX_CLIPS, ctx.work_dir, proposed);
  });
  if (!outcome.ok())
    return StageOutcome::fatal(
        fmt::format("content analysis failed: {}", outcome.message));

  std::vector<std::string> notes;
  ctx.segments = sanitize_segments(proposed, ctx.media.duration, &notes);
  for (const auto &n : notes)
    log(ctx, n);

  if (ctx.segments.empty())
    return StageOutcome::fatal("no viral segments found");

  if (static_cast<int>(ctx.segments.size()) < MIN_CLIPS) {
    log(ctx, fmt::format("Warning: only {} usable segment(s), fewer than {}",
                         ctx.segments.size(), MIN_CLIPS));
  } else {
    log(ctx, fmt::format("Found {} viral segments", ctx.segments.size()));
  }
  return StageOutcome::success();
}

StageOutcome ProcessingPipeline::create_clips_stage(JobContext &ctx) {
  const CaptionSettings &captions = ctx.job.params.captions;
  const std::string invalid = validate_caption_settings(captions);
  if (!invalid.empty())
    return StageOutcome::fatal("invalid caption settings: " + invalid);

  SubjectTracker tracker(settings_.tracker);
  CaptionRenderer renderer(captions, settings_.out_width,
                           settings_.out_height, settings_.caption_max_words);

  for (std::size_t i = 0; i < ctx.segments.size(); ++i) {
    ClipDraft d;
    d.index = static_cast<int>(i) + 1;
    d.segment = ctx.segments[i];
    d.extracted =
        (fs::path(ctx.work_dir) / fmt::format("clip_{}.src.mp4", d.index))
            .string();
    d.fps = ctx.media.fps > 0 ? ctx.media.fps : 30.0;

    StageOutcome outcome =
        with_retry(ctx, fmt::format("Extract clip {}", d.index), [&]() {
          return c_.encoder->extract(ctx.source, d.segment.range, d.extracted);
        });
    if (!outcome.ok())
      return StageOutcome::fatal(fmt::format("extracting clip {} failed: {}",
                                             d.index, outcome.message));

    const int frame_count = std::max(
        1, static_cast<int>(std::ceil(d.segment.range.duration() * d.fps)));

    DetectionTrack track;
    outcome =
        with_retry(ctx, fmt::format("Detect clip {}", d.index), [&]() {
          return c_.detector->detect(d.extracted, ctx.work_dir, track);
        });

    if (outcome.ok()) {
      if (track.width <= 0 || track.height <= 0) {
        track.width = ctx.media.width;
        track.height = ctx.media.height;
      }
      if (track.fps <= 0)
        track.fps = d.fps;
      d.plan = tracker.plan(track, frame_count);
      log(ctx, fmt::format("Clip {}: {} frames framed, {} speaker "
                           "switch(es), {} layout change(s)",
                           d.index, d.plan.size(), tracker.switches(),
                           tracker.mode_changes()));
    } else {
      log(ctx, fmt::format("Subject detection failed for clip {} ({}); "
                           "using centered crop",
                           d.index, outcome.message));
      d.plan = SubjectTracker::centered_plan(ctx.media.width,
                                             ctx.media.height, frame_count);
    }

    if (captions.enabled()) {
      d.subtitles =
          (fs::path(ctx.work_dir) / fmt::format("clip_{}.ass", d.index))
              .string();
      CaptionRenderReport report =
          renderer.render_to_file(ctx.transcript, d.segment.range, d.subtitles);
      if (!report.ok)
        return StageOutcome::fatal(fmt::format(
            "caption rendering failed for clip {}: {}", d.index, report.error));
      if (report.degraded) {
        log(ctx, fmt::format("Clip {}: word timing unavailable, {} "
                             "captions fall back to segment timing",
                             d.index, to_string(captions.style)));
      }
    }

    ctx.drafts.push_back(std::move(d));
    if (!ctx.store_error.empty())
      return StageOutcome::fatal(ctx.store_error);
  }
  return StageOutcome::success();
}

StageOutcome ProcessingPipeline::finalize_stage(JobContext &ctx) {
  std::error_code ec;
  fs::create_directories(ctx.output_dir, ec);
  if (ec)
    return StageOutcome::fatal(
        fmt::format("cannot create output directory: {}", ec.message()));

  JobResult result;
  for (const auto &d : ctx.drafts) {
    const std::string file_name = fmt::format("clip_{}.mp4", d.index);

    EncodeRequest req;
    req.input = d.extracted;
    req.output = (fs::path(ctx.output_dir) / file_name).string();
    req.work_dir = ctx.work_dir;
    req.plan = d.plan;
    req.fps = d.fps;
    req.out_width = settings_.out_width;
    req.out_height = settings_.out_height;
    req.subtitles = d.subtitles;

    StageOutcome outcome = with_retry(
        ctx, fmt::format("Render clip {}", d.index),
        [&]() { return c_.encoder->render(req); });
    if (!outcome.ok())
      return StageOutcome::fatal(fmt::format("rendering clip {} failed: {}",
                                             d.index, outcome.message));

    Clip clip;
    clip.index = d.index;
    clip.file_name = file_name;
    clip.video_url = fmt::format("/videos/{}/{}", ctx.id, file_name);
    clip.title = d.segment.title;
    clip.description_tiktok = d.segment.description_tiktok;
    clip.description_instagram = d.segment.description_instagram;
    clip.description_youtube = d.segment.description_youtube;
    clip.start = d.segment.range.start;
    clip.end = d.segment.range.end;
    result.clips.push_back(std::move(clip));

    if (!log(ctx, fmt::format("Clip {} ready: {}", d.index, file_name)))
      return StageOutcome::fatal(ctx.store_error);
  }

  for (const auto &seg : ctx.transcript.segments) {
    TranscriptSegment plain;
    plain.start = seg.start;
    plain.end = seg.end;
    plain.text = seg.text;
    result.transcript.push_back(std::move(plain));
  }

  /// Metadata beside the clips, in the analyzer's own vocabulary
  nlohmann::json shorts = nlohmann::json::array();
  for (const auto &clip : result.clips) {
    shorts.push_back({{"file_name", clip.file_name},
                      {"start", clip.start},
                      {"end", clip.end},
                      {"video_title_for_youtube_short", clip.title},
                      {"video_description_for_tiktok", clip.description_tiktok},
                      {"video_description_for_instagram",
                       clip.description_instagram}});
  }
  const std::string metadata_path =
      (fs::path(ctx.output_dir) / "clips_metadata.json").string();
  {
    std::ofstream meta(metadata_path, std::ios::trunc);
    meta << nlohmann::json{{"shorts", shorts},
                           {"transcript", result.transcript}}
                .dump(2);
    if (!meta)
      return StageOutcome::fatal(
          fmt::format("cannot write {}", metadata_path));
  }

  const std::int64_t now = clock_();
  const std::size_t cap = settings_.log_cap;
  bool done = false;
  if (!write(ctx.id, [&](Job &job) {
        done = complete_job(job, result, now);
        if (done)
          append_log(job, "Job completed.", now, cap);
      })) {
    return StageOutcome::fatal(
        "job store unavailable, could not record completion");
  }
  if (!done)
    return StageOutcome::fatal("job left the processing state unexpectedly");
  return StageOutcome::success();
}

} // namespace clipforge
