/**
 * @file types.hpp
 * @brief Core data types and constants for clipforge
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Job lifecycle enums (status, stage)
 *
 *          - Caller-visible error taxonomy
 *
 *          - TimeSegment for time ranges
 *
 *          - Transcript and candidate segment types exchanged with the
 *            collaborators
 */

#ifndef CLIPFORGE_TYPES_HPP
#define CLIPFORGE_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace clipforge {

// **----- CONSTANTS -----**

/// Stage percentages, set on entry to each stage
constexpr int PROGRESS_DOWNLOADING = 10;
constexpr int PROGRESS_TRANSCRIBING = 30;
constexpr int PROGRESS_ANALYZING = 50;
constexpr int PROGRESS_CREATING_CLIPS = 70;
constexpr int PROGRESS_FINALIZING = 90;
constexpr int PROGRESS_DONE = 100;

/// Bounds for the number of clips produced from one submission
constexpr int MIN_CLIPS = 3;
constexpr int MAX_CLIPS = 15;

/// Shortest candidate segment worth turning into a clip
constexpr double MIN_CLIP_SECONDS = 1.0;

// **----- IDENTIFIERS AND ENUMS -----**

/// Opaque job identifier (UUID v4 text)
using JobId = std::string;

/**
 * @brief Job lifecycle states.
 * @note Transitions are monotone: Queued -> Processing -> {Completed|Failed}.
 */
enum class JobStatus : std::uint8_t { Queued, Processing, Completed, Failed };

/**
 * @brief The five ordered pipeline stages.
 */
enum class Stage : std::uint8_t {
  Downloading,
  Transcribing,
  Analyzing,
  CreatingClips,
  Finalizing
};

/**
 * @brief Errors surfaced synchronously to a caller.
 * @note Failures that happen after a job exists are recorded on the job
 *       instead (see JobStatus::Failed).
 */
enum class ErrorKind : std::uint8_t {
  None,
  Validation,
  ServiceUnavailable,
  NotFound
};

const char *to_string(JobStatus status);
const char *to_string(ErrorKind kind);

/// Human-readable label for a stage ("Downloading video", ...)
const char *stage_label(Stage stage);

/// Percentage assigned on entry to a stage
int stage_percentage(Stage stage);

bool parse_job_status(const std::string &text, JobStatus &out);

inline bool is_terminal(JobStatus status) {
  return status == JobStatus::Completed || status == JobStatus::Failed;
}

// **----- DATA STRUCTURES -----**

/**
 * @struct TimeSegment
 * @brief Represents a time range [start, end) in seconds.
 */
struct TimeSegment {
  double start; //< Start time in seconds
  double end;   //< End time in seconds

  double duration() const { return end - start; }
};

/**
 * @struct TimedWord
 * @brief One transcribed word with its timing in source seconds.
 */
struct TimedWord {
  std::string text;
  double start = 0;
  double end = 0;
};

/**
 * @struct TranscriptSegment
 * @brief Sentence-level transcript unit; words may be empty when the
 *        transcriber only produced segment timing.
 */
struct TranscriptSegment {
  double start = 0;
  double end = 0;
  std::string text;
  std::vector<TimedWord> words;
};

struct Transcript {
  std::vector<TranscriptSegment> segments;

  /// true when every non-empty segment carries word timestamps
  bool has_word_timing() const;
};

/**
 * @struct CandidateSegment
 * @brief A viral segment proposed by the content-analysis collaborator.
 */
struct CandidateSegment {
  TimeSegment range;
  std::string title;
  std::string description_tiktok;    //< Short-form description
  std::string description_instagram; //< Reel description
  std::string description_youtube;   //< Long-form title
};

} // namespace clipforge

#endif // CLIPFORGE_TYPES_HPP
