/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/clipforge.env for detailed documentation of each
 *          parameter.
 *
 * @note Components never read Config:: directly in their hot paths; the
 *       service snapshots these values into ServiceSettings and
 *       TrackerSettings once at startup.
 */

#ifndef CLIPFORGE_CONFIG_HPP
#define CLIPFORGE_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

namespace clipforge {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && val[0] != '\0') ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && val[0] != '\0') ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val = {}) {
  const char *val = std::getenv(name);
  return (val && val[0] != '\0') ? std::string(val) : default_val;
}

// **---- STORE ----**

/**
 * @brief Connection string of the persistent job store.
 * @note "file:///var/lib/clipforge/jobs" or a bare directory path.
 *       Empty = store not configured (service reports unavailable).
 */
inline std::string store_url() {
  static std::string val = get_env_string("CLIPFORGE_STORE_URL");
  return val;
}

/// Job lifetime from creation, seconds (24h)
inline int job_ttl_seconds() {
  static int val = get_env_int("JOB_TTL_SECONDS", 24 * 60 * 60);
  return val;
}

/// Max entries kept in a job's log
inline int job_log_cap() {
  static int val = get_env_int("JOB_LOG_CAP", 500);
  return val;
}

/// Interval between expiry sweeps, seconds
inline int reap_interval_seconds() {
  static int val = get_env_int("REAP_INTERVAL_SECONDS", 300);
  return val;
}

/// Store write attempts before a running job is failed
inline int store_retry_attempts() {
  static int val = get_env_int("STORE_RETRY_ATTEMPTS", 5);
  return val;
}

/// Base backoff between store write attempts, milliseconds
inline int store_retry_base_ms() {
  static int val = get_env_int("STORE_RETRY_BASE_MS", 200);
  return val;
}

/// Attempts for the write that records a job's failure
inline int failure_write_attempts() {
  static int val = get_env_int("FAILURE_WRITE_ATTEMPTS", 12);
  return val;
}

// **---- SCHEDULING ----**

/**
 * @brief Maximum number of jobs in the processing state at once.
 * @note Every admitted job holds one slot from admission until it reaches
 *       a terminal state.
 */
inline int max_concurrent_jobs() {
  static int val = get_env_int("MAX_CONCURRENT_JOBS", 5);
  return val;
}

/// Attempts for a transient stage operation (download, encode, ...)
inline int stage_retry_attempts() {
  static int val = get_env_int("STAGE_RETRY_ATTEMPTS", 3);
  return val;
}

/// Base backoff between stage attempts, milliseconds (doubles per attempt)
inline int stage_retry_base_ms() {
  static int val = get_env_int("STAGE_RETRY_BASE_MS", 1000);
  return val;
}

// **---- FILESYSTEM ----**

inline std::string output_dir() {
  static std::string val = get_env_string("OUTPUT_DIR", "output");
  return val;
}

inline std::string upload_dir() {
  static std::string val = get_env_string("UPLOAD_DIR", "uploads");
  return val;
}

inline std::string work_dir() {
  static std::string val = get_env_string("WORK_DIR", "work");
  return val;
}

/// Largest accepted upload, megabytes
inline int max_upload_mb() {
  static int val = get_env_int("MAX_UPLOAD_MB", 500);
  return val;
}

// **---- CREDENTIALS ----**

/// Server default credential for the content-analysis collaborator
inline std::string analysis_api_key() {
  static std::string val = get_env_string("ANALYSIS_API_KEY");
  return val;
}

/// Optional cookies file for restricted-content fetching
inline std::string download_cookies_file() {
  static std::string val = get_env_string("DOWNLOAD_COOKIES_FILE");
  return val;
}

// **---- COLLABORATORS ----**

inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

inline std::string ytdlp_bin() {
  static std::string val = get_env_string("YTDLP_BIN", "yt-dlp");
  return val;
}

/// Transcriber command: <cmd> <media> <out.json>
inline std::string transcribe_cmd() {
  static std::string val = get_env_string("TRANSCRIBE_CMD", "clipforge-transcribe");
  return val;
}

/// Analyzer command: <cmd> <transcript.json> <out.json> <min> <max>
inline std::string analyze_cmd() {
  static std::string val = get_env_string("ANALYZE_CMD", "clipforge-analyze");
  return val;
}

/// Detector command: <cmd> <clip.mp4> <out.json>
inline std::string detect_cmd() {
  static std::string val = get_env_string("DETECT_CMD", "clipforge-detect");
  return val;
}

inline int download_timeout_seconds() {
  static int val = get_env_int("DOWNLOAD_TIMEOUT_SECONDS", 1800);
  return val;
}

inline int transcribe_timeout_seconds() {
  static int val = get_env_int("TRANSCRIBE_TIMEOUT_SECONDS", 3600);
  return val;
}

inline int analyze_timeout_seconds() {
  static int val = get_env_int("ANALYZE_TIMEOUT_SECONDS", 600);
  return val;
}

inline int detect_timeout_seconds() {
  static int val = get_env_int("DETECT_TIMEOUT_SECONDS", 900);
  return val;
}

inline int encode_timeout_seconds() {
  static int val = get_env_int("ENCODE_TIMEOUT_SECONDS", 1800);
  return val;
}

// **---- OUTPUT ----**

inline int output_width() {
  static int val = get_env_int("OUTPUT_WIDTH", 1080);
  return val;
}

inline int output_height() {
  static int val = get_env_int("OUTPUT_HEIGHT", 1920);
  return val;
}

/// Words per burned-in caption line
inline int caption_max_words() {
  static int val = get_env_int("CAPTION_MAX_WORDS", 4);
  return val;
}

// **---- SUBJECT TRACKER ----**

/**
 * @brief Consecutive frames a new speaker must lead before the framing
 *        switches to them.
 */
inline int tracker_stabilize_frames() {
  static int val = get_env_int("TRACKER_STABILIZE_FRAMES", 15);
  return val;
}

/// Frames after a switch during which no further switch may happen
inline int tracker_cooldown_frames() {
  static int val = get_env_int("TRACKER_COOLDOWN_FRAMES", 30);
  return val;
}

/**
 * @brief Smoothing time constant in seconds.
 * @note Larger = calmer camera, slower to follow.
 */
inline double tracker_smoothing_tau() {
  static double val = get_env_double("TRACKER_SMOOTHING_TAU", 0.4);
  return val;
}

/// Subject center spread, as a fraction of frame width, that triggers
/// letterboxed multi-subject framing
inline double tracker_far_apart_ratio() {
  static double val = get_env_double("TRACKER_FAR_APART_RATIO", 0.5);
  return val;
}

/// Inner safe-zone margin as a fraction of the crop size
inline double tracker_safe_margin() {
  static double val = get_env_double("TRACKER_SAFE_MARGIN", 0.1);
  return val;
}

/// "score" = detector activity score, "area" = confidence x box area
inline std::string tracker_activity_signal() {
  static std::string val = get_env_string("TRACKER_ACTIVITY_SIGNAL", "score");
  return val;
}

} // namespace Config
} // namespace clipforge

#endif // CLIPFORGE_CONFIG_HPP
