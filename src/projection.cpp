/**
 * @file projection.cpp
 * @brief Status and result projections
 */

#include "clipforge/projection.hpp"

#include "clipforge/system.hpp"

namespace clipforge {

namespace {

nlohmann::json timestamp_or_null(const std::optional<std::int64_t> &ms) {
  if (!ms)
    return nullptr;
  return format_iso8601(*ms);
}

nlohmann::json clip_view(const Clip &clip) {
  return {{"index", clip.index},
          {"video_url", clip.video_url},
          {"title", clip.title},
          {"description_tiktok", clip.description_tiktok},
          {"description_instagram", clip.description_instagram},
          {"description_youtube", clip.description_youtube},
          {"start", clip.start},
          {"end", clip.end}};
}

} // anonymous namespace

nlohmann::json project_status(const Job &job) {
  nlohmann::json j;
  j["job_id"] = job.id;
  j["status"] = to_string(job.status);
  j["progress_percentage"] = job.progress_percentage;
  if (job.progress_stage.empty())
    j["progress_stage"] = nullptr;
  else
    j["progress_stage"] = job.progress_stage;
  j["logs"] = job.logs;
  j["created_at"] = format_iso8601(job.created_at_ms);
  j["started_at"] = timestamp_or_null(job.started_at_ms);
  if (job.error)
    j["error"] = *job.error;
  else
    j["error"] = nullptr;
  return j;
}

nlohmann::json project_result(const Job &job) {
  nlohmann::json j;
  j["job_id"] = job.id;
  j["status"] = to_string(job.status);

  if (job.status != JobStatus::Completed || !job.result) {
    j["result"] = nullptr;
    j["completed_at"] = timestamp_or_null(job.completed_at_ms);
    if (job.error)
      j["error"] = *job.error;
    return j;
  }

  nlohmann::json clips = nlohmann::json::array();
  for (const auto &clip : job.result->clips)
    clips.push_back(clip_view(clip));

  nlohmann::json transcript = nlohmann::json::array();
  for (const auto &seg : job.result->transcript)
    transcript.push_back(
        {{"start", seg.start}, {"end", seg.end}, {"text", seg.text}});

  j["result"] = {{"clips", clips}, {"transcript", transcript}};
  j["completed_at"] = timestamp_or_null(job.completed_at_ms);
  return j;
}

std::size_t first_unseen_log(const nlohmann::json &logs,
                             const std::string &last_shown) {
  std::size_t start = 0;
  if (!logs.empty() && logs[0] == LOG_TRUNCATED_MARKER)
    start = 1;
  if (last_shown.empty())
    return start;

  for (std::size_t i = logs.size(); i > start; --i) {
    if (logs[i - 1] == last_shown)
      return i;
  }
  return start;
}

} // namespace clipforge
