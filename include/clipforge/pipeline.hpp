/**
 * @file pipeline.hpp
 * @brief Job processing pipeline orchestration
 *
 * @details The ProcessingPipeline class drives one admitted job through the
 *          five ordered stages and records every step on the job record:
 *
 *          1. Downloading video (10%): fetch or copy the source, probe it
 *
 *          2. Transcribing audio (30%): word-level timed text
 *
 *          3. AI analysis (50%): viral segments, sanitised to 1..15 clips
 *
 *          4. Creating clips (70%): extract, detect subjects, plan the
 *             vertical framing, write caption scripts
 *
 *          5. Finalizing (90%): render, persist artifacts, complete the job
 *
 * @note Progress is only written on stage entry; nothing interpolates
 *       between stages.
 */

#ifndef CLIPFORGE_PIPELINE_HPP
#define CLIPFORGE_PIPELINE_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "clip_encoder.hpp"
#include "collaborators.hpp"
#include "job_store.hpp"
#include "retry.hpp"
#include "subject_tracker.hpp"

namespace clipforge {

/**
 * @struct Collaborators
 * @brief Non-owning handles to the services a job uses.
 * @note The owner (ClipService, or a test) keeps them alive for as long as
 *       the pipeline runs.
 */
struct Collaborators {
  MediaProber *prober = nullptr;
  Downloader *downloader = nullptr;
  Transcriber *transcriber = nullptr;
  ContentAnalyzer *analyzer = nullptr;
  SubjectDetector *detector = nullptr;
  ClipEncoder *encoder = nullptr;
};

struct PipelineSettings {
  std::string work_dir = "work";
  std::string output_dir = "output";
  RetryPolicy stage_retry;
  RetryPolicy store_retry{5, std::chrono::milliseconds(200), 2.0,
                          std::chrono::milliseconds(5000)};
  RetryPolicy failure_retry{12, std::chrono::milliseconds(1000), 2.0,
                            std::chrono::milliseconds(30000)};
  std::size_t log_cap = 500;
  int out_width = 1080;
  int out_height = 1920;
  int caption_max_words = 4;
  TrackerSettings tracker;

  static PipelineSettings from_env();
};

/**
 * @brief Clean up analyzer proposals.
 *
 * @details In order: drop end <= start, clamp to [0, duration], drop ranges
 *          shorter than MIN_CLIP_SECONDS, keep at most MAX_CLIPS. Missing
 *          titles become "Clip N" and missing descriptions take the title.
 *
 * @param notes Optional human-readable reasons for every drop
 */
std::vector<CandidateSegment>
sanitize_segments(const std::vector<CandidateSegment> &segments,
                  double duration, std::vector<std::string> *notes = nullptr);

/**
 * @class ProcessingPipeline
 * @brief Runs one job at a time per call; safe to share between workers.
 *
 * @attention FAILURE HANDLING:
 *
 *   - Transient stage failures are retried with exponential backoff
 *
 *   - Fatal failures and exhausted retries fail the job with a message
 *
 *   - Store writes are retried too. A progress or log write that gives up
 *     fails the stage, and the failure is recorded with failure_retry.
 *     Only when that write also gives up is the job abandoned, left
 *     processing for startup recovery
 *
 *   - The per-job work directory is removed whatever the outcome
 */
class ProcessingPipeline {
public:
  ProcessingPipeline(JobStore &store, Collaborators collaborators,
                     PipelineSettings settings, Clock clock);

  /**
   * @brief Run a queued job to a terminal state.
   * @param api_key Analysis credential for this job (never persisted)
   * @return true when the job completed
   */
  bool run(const JobId &id, const std::string &api_key);

  const PipelineSettings &settings() const { return settings_; }

private:
  struct ClipDraft;
  struct JobContext;

  StageOutcome download_stage(JobContext &ctx);
  StageOutcome transcribe_stage(JobContext &ctx);
  StageOutcome analyze_stage(JobContext &ctx);
  StageOutcome create_clips_stage(JobContext &ctx);
  StageOutcome finalize_stage(JobContext &ctx);

  /// Retrying read-modify-write; false once the store gave up
  bool write(const JobId &id, const std::function<void(Job &)> &mutate);
  bool write(const JobId &id, const std::function<void(Job &)> &mutate,
             const RetryPolicy &policy);
  /// Both set ctx.store_error when their write gives up
  bool log(JobContext &ctx, const std::string &message);
  bool enter_stage(JobContext &ctx, Stage stage);
  void fail(JobContext &ctx, const std::string &error);

  template <typename Fn>
  StageOutcome with_retry(JobContext &ctx, const std::string &what, Fn &&fn);

  JobStore &store_;
  Collaborators c_;
  PipelineSettings settings_;
  Clock clock_;
};

} // namespace clipforge

#endif // CLIPFORGE_PIPELINE_HPP
