/**
 * @file job.cpp
 * @brief Job record lifecycle and JSON codec implementation
 */

#include "clipforge/job.hpp"

#include <algorithm>
#include <random>

#include <fmt/core.h>

#include "clipforge/system.hpp"

namespace clipforge {

using nlohmann::json;

// **----- CONSTRUCTION -----**

JobId generate_job_id() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uint64_t hi = rng();
  std::uint64_t lo = rng();

  /// Version 4, variant 10xx
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     static_cast<std::uint32_t>(hi >> 32),
                     static_cast<std::uint32_t>((hi >> 16) & 0xFFFF),
                     static_cast<std::uint32_t>(hi & 0xFFFF),
                     static_cast<std::uint32_t>(lo >> 48),
                     lo & 0xFFFFFFFFFFFFULL);
}

Job make_job(const JobId &id, JobParams params, std::int64_t now_ms,
             std::int64_t ttl_ms) {
  Job job;
  job.id = id;
  job.status = JobStatus::Queued;
  job.created_at_ms = now_ms;
  job.expires_at_ms = now_ms + ttl_ms;
  job.params = std::move(params);
  return job;
}

// **----- LIFECYCLE MUTATORS -----**

bool begin_processing(Job &job, std::int64_t now_ms) {
  if (job.status != JobStatus::Queued)
    return false;
  job.status = JobStatus::Processing;
  if (!job.started_at_ms)
    job.started_at_ms = now_ms;
  return true;
}

void set_progress(Job &job, int pct, const std::string &stage) {
  pct = std::clamp(pct, 0, PROGRESS_DONE);
  if (pct < job.progress_percentage)
    return;
  job.progress_percentage = pct;
  if (!stage.empty())
    job.progress_stage = stage;
}

bool complete_job(Job &job, JobResult result, std::int64_t now_ms) {
  if (job.status != JobStatus::Processing)
    return false;
  job.status = JobStatus::Completed;
  job.result = std::move(result);
  job.error.reset();
  set_progress(job, PROGRESS_DONE, "Completed");
  if (!job.completed_at_ms)
    job.completed_at_ms = now_ms;
  return true;
}

bool fail_job(Job &job, const std::string &error, std::int64_t now_ms) {
  if (is_terminal(job.status))
    return false;
  job.status = JobStatus::Failed;
  job.error = error.empty() ? std::string("unknown failure") : error;
  job.result.reset();
  if (!job.completed_at_ms)
    job.completed_at_ms = now_ms;
  return true;
}

void append_log(Job &job, const std::string &message, std::int64_t now_ms,
                std::size_t cap) {
  cap = std::max<std::size_t>(cap, 2);
  if (job.logs.size() >= cap) {
    /// Head slot holds the marker, drop the oldest real line after it
    if (job.logs.front() != LOG_TRUNCATED_MARKER) {
      job.logs.front() = LOG_TRUNCATED_MARKER;
    }
    job.logs.erase(job.logs.begin() + 1);
  }
  job.logs.push_back(fmt::format("[{}] {}", format_iso8601(now_ms), message));
}

bool is_expired(const Job &job, std::int64_t now_ms) {
  return job.expires_at_ms > 0 && now_ms >= job.expires_at_ms;
}

// **----- JSON CODEC -----**

namespace {

template <typename T>
void put_optional(json &j, const char *key, const std::optional<T> &value) {
  if (value) {
    j[key] = *value;
  } else {
    j[key] = nullptr;
  }
}

template <typename T>
void get_optional(const json &j, const char *key, std::optional<T> &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    out.reset();
  } else {
    out = it->get<T>();
  }
}

} // anonymous namespace

void to_json(json &j, const TimedWord &w) {
  j = json{{"word", w.text}, {"start", w.start}, {"end", w.end}};
}

void from_json(const json &j, TimedWord &w) {
  w.text = j.value("word", std::string{});
  w.start = j.value("start", 0.0);
  w.end = j.value("end", 0.0);
}

void to_json(json &j, const TranscriptSegment &s) {
  j = json{{"start", s.start}, {"end", s.end}, {"text", s.text}};
  if (!s.words.empty())
    j["words"] = s.words;
}

void from_json(const json &j, TranscriptSegment &s) {
  s.start = j.value("start", 0.0);
  s.end = j.value("end", 0.0);
  s.text = j.value("text", std::string{});
  s.words.clear();
  if (j.contains("words") && j["words"].is_array()) {
    s.words = j["words"].get<std::vector<TimedWord>>();
  }
}

void to_json(json &j, const CaptionSettings &c) {
  j = json{{"include_captions", c.include_captions},
           {"style", to_string(c.style)},
           {"color", c.color.empty() ? json(nullptr) : json(c.color)},
           {"outline_color",
            c.outline_color.empty() ? json(nullptr) : json(c.outline_color)}};
}

void from_json(const json &j, CaptionSettings &c) {
  c.include_captions = j.value("include_captions", true);
  c.style = CaptionStyle::None;
  if (j.contains("style") && j["style"].is_string() &&
      !parse_caption_style(j["style"].get<std::string>(), c.style)) {
    /// Unknown names survive as None; the runner re-validates anyway
    c.style = CaptionStyle::None;
  }
  c.color = (j.contains("color") && j["color"].is_string())
                ? j["color"].get<std::string>()
                : std::string{};
  c.outline_color =
      (j.contains("outline_color") && j["outline_color"].is_string())
          ? j["outline_color"].get<std::string>()
          : std::string{};
}

void to_json(json &j, const Clip &c) {
  j = json{{"index", c.index},
           {"file_name", c.file_name},
           {"video_url", c.video_url},
           {"title", c.title},
           {"description_tiktok", c.description_tiktok},
           {"description_instagram", c.description_instagram},
           {"description_youtube", c.description_youtube},
           {"start", c.start},
           {"end", c.end}};
}

void from_json(const json &j, Clip &c) {
  c.index = j.value("index", 0);
  c.file_name = j.value("file_name", std::string{});
  c.video_url = j.value("video_url", std::string{});
  c.title = j.value("title", std::string{});
  c.description_tiktok = j.value("description_tiktok", std::string{});
  c.description_instagram = j.value("description_instagram", std::string{});
  c.description_youtube = j.value("description_youtube", std::string{});
  c.start = j.value("start", 0.0);
  c.end = j.value("end", 0.0);
}

void to_json(json &j, const JobResult &r) {
  j = json{{"clips", r.clips}, {"transcript", r.transcript}};
}

void from_json(const json &j, JobResult &r) {
  r.clips = j.value("clips", std::vector<Clip>{});
  r.transcript = j.value("transcript", std::vector<TranscriptSegment>{});
}

void to_json(json &j, const Job &job) {
  j = json{{"job_id", job.id},
           {"status", to_string(job.status)},
           {"progress_percentage", job.progress_percentage},
           {"progress_stage", job.progress_stage},
           {"logs", job.logs},
           {"created_at_ms", job.created_at_ms},
           {"expires_at_ms", job.expires_at_ms},
           {"input_url", job.params.source_url},
           {"upload_path", job.params.upload_path},
           {"caption_settings", job.params.captions}};
  put_optional(j, "started_at_ms", job.started_at_ms);
  put_optional(j, "completed_at_ms", job.completed_at_ms);
  put_optional(j, "error", job.error);
  put_optional(j, "result", job.result);
}

void from_json(const json &j, Job &job) {
  job.id = j.at("job_id").get<std::string>();
  if (!parse_job_status(j.at("status").get<std::string>(), job.status)) {
    throw json::other_error::create(
        501, fmt::format("unknown job status for {}", job.id), &j);
  }
  job.progress_percentage = j.value("progress_percentage", 0);
  job.progress_stage = j.value("progress_stage", std::string{});
  job.logs = j.value("logs", std::vector<std::string>{});
  job.created_at_ms = j.at("created_at_ms").get<std::int64_t>();
  job.expires_at_ms = j.value("expires_at_ms", std::int64_t{0});
  job.params.source_url = j.value("input_url", std::string{});
  job.params.upload_path = j.value("upload_path", std::string{});
  if (j.contains("caption_settings")) {
    job.params.captions = j["caption_settings"].get<CaptionSettings>();
  }
  get_optional(j, "started_at_ms", job.started_at_ms);
  get_optional(j, "completed_at_ms", job.completed_at_ms);
  get_optional(j, "error", job.error);
  get_optional(j, "result", job.result);
}

} // namespace clipforge
