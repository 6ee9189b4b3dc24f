/**
 * @file types.cpp
 * @brief Enum names and small helpers for the core types
 */

#include "clipforge/types.hpp"

namespace clipforge {

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Queued:
    return "queued";
  case JobStatus::Processing:
    return "processing";
  case JobStatus::Completed:
    return "completed";
  case JobStatus::Failed:
    return "failed";
  }
  return "unknown";
}

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Validation:
    return "validation_error";
  case ErrorKind::ServiceUnavailable:
    return "service_unavailable";
  case ErrorKind::NotFound:
    return "not_found";
  }
  return "unknown";
}

const char *stage_label(Stage stage) {
  switch (stage) {
  case Stage::Downloading:
    return "Downloading video";
  case Stage::Transcribing:
    return "Transcribing audio";
  case Stage::Analyzing:
    return "AI analysis";
  case Stage::CreatingClips:
    return "Creating clips";
  case Stage::Finalizing:
    return "Finalizing";
  }
  return "Unknown";
}

int stage_percentage(Stage stage) {
  switch (stage) {
  case Stage::Downloading:
    return PROGRESS_DOWNLOADING;
  case Stage::Transcribing:
    return PROGRESS_TRANSCRIBING;
  case Stage::Analyzing:
    return PROGRESS_ANALYZING;
  case Stage::CreatingClips:
    return PROGRESS_CREATING_CLIPS;
  case Stage::Finalizing:
    return PROGRESS_FINALIZING;
  }
  return 0;
}

bool parse_job_status(const std::string &text, JobStatus &out) {
  if (text == "queued") {
    out = JobStatus::Queued;
  } else if (text == "processing") {
    out = JobStatus::Processing;
  } else if (text == "completed") {
    out = JobStatus::Completed;
  } else if (text == "failed") {
    out = JobStatus::Failed;
  } else {
    return false;
  }
  return true;
}

bool Transcript::has_word_timing() const {
  bool any = false;
  for (const auto &seg : segments) {
    if (seg.text.empty() && seg.words.empty())
      continue;
    if (seg.words.empty())
      return false;
    any = true;
  }
  return any;
}

} // namespace clipforge
