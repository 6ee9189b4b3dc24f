/**
 * @file job.hpp
 * @brief Job record model, lifecycle mutators and JSON codec
 *
 * @details The Job struct is what the store persists. All status changes go
 *          through the mutators declared here so the lifecycle invariants
 *          hold no matter who calls them:
 *
 *          - status only moves Queued -> Processing -> {Completed|Failed}
 *
 *          - progress_percentage never decreases
 *
 *          - started_at / completed_at are written exactly once
 *
 *          - result is set iff Completed, error is set iff Failed
 */

#ifndef CLIPFORGE_JOB_HPP
#define CLIPFORGE_JOB_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "captions.hpp"
#include "types.hpp"

namespace clipforge {

/**
 * @struct Clip
 * @brief One produced short. Immutable once written.
 */
struct Clip {
  int index = 0;         //< 1-based ordinal
  std::string file_name; //< File inside the job's output directory
  std::string video_url; //< /videos/<job_id>/<file_name>
  std::string title;
  std::string description_tiktok;
  std::string description_instagram;
  std::string description_youtube;
  double start = 0; //< Source range, seconds
  double end = 0;
};

struct JobResult {
  std::vector<Clip> clips;
  std::vector<TranscriptSegment> transcript; //< Segment text only
};

/**
 * @struct JobParams
 * @brief Submission parameters. Exactly one of source_url / upload_path is
 *        set.
 */
struct JobParams {
  std::string source_url;
  std::string upload_path;
  CaptionSettings captions;
};

struct Job {
  JobId id;
  JobStatus status = JobStatus::Queued;
  int progress_percentage = 0;
  std::string progress_stage;
  std::vector<std::string> logs;
  std::int64_t created_at_ms = 0;
  std::int64_t expires_at_ms = 0; //< created_at + TTL, never moved
  std::optional<std::int64_t> started_at_ms;
  std::optional<std::int64_t> completed_at_ms;
  std::optional<std::string> error;
  std::optional<JobResult> result;
  JobParams params;
};

/// Marker kept at the head of a capped log
constexpr const char *LOG_TRUNCATED_MARKER = "... earlier log lines truncated";

// **----- CONSTRUCTION -----**

/// Random UUID v4 string
JobId generate_job_id();

/**
 * @brief Build a fresh queued record.
 * @param ttl_ms Lifetime from creation; fixes expires_at once
 */
Job make_job(const JobId &id, JobParams params, std::int64_t now_ms,
             std::int64_t ttl_ms);

// **----- LIFECYCLE MUTATORS -----**

/// Queued -> Processing, sets started_at. false if not queued.
bool begin_processing(Job &job, std::int64_t now_ms);

/**
 * @brief Raise progress to pct with a stage label.
 * @note Lower values are ignored (progress is monotone); the label is still
 *       refreshed only when the percentage does not go backwards.
 */
void set_progress(Job &job, int pct, const std::string &stage);

/// Processing -> Completed with result, progress 100. false otherwise.
bool complete_job(Job &job, JobResult result, std::int64_t now_ms);

/// {Queued|Processing} -> Failed with error. false if already terminal.
bool fail_job(Job &job, const std::string &error, std::int64_t now_ms);

/**
 * @brief Append a timestamped line, keeping at most cap entries.
 * @note Oldest lines are dropped first; the head becomes
 *       LOG_TRUNCATED_MARKER once anything was dropped.
 */
void append_log(Job &job, const std::string &message, std::int64_t now_ms,
                std::size_t cap);

bool is_expired(const Job &job, std::int64_t now_ms);

// **----- JSON CODEC -----**

void to_json(nlohmann::json &j, const TimedWord &w);
void from_json(const nlohmann::json &j, TimedWord &w);
void to_json(nlohmann::json &j, const TranscriptSegment &s);
void from_json(const nlohmann::json &j, TranscriptSegment &s);
void to_json(nlohmann::json &j, const CaptionSettings &c);
void from_json(const nlohmann::json &j, CaptionSettings &c);
void to_json(nlohmann::json &j, const Clip &c);
void from_json(const nlohmann::json &j, Clip &c);
void to_json(nlohmann::json &j, const JobResult &r);
void from_json(const nlohmann::json &j, JobResult &r);
void to_json(nlohmann::json &j, const Job &job);
void from_json(const nlohmann::json &j, Job &job);

} // namespace clipforge

#endif // CLIPFORGE_JOB_HPP
