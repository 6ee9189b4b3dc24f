/**
 * @file collaborators.hpp
 * @brief Interfaces to the external services a job depends on
 *
 * @details Every collaborator is an abstract class so the pipeline can be
 *          driven by fakes in tests. The production implementations shell
 *          out to command-line tools and exchange JSON files:
 *
 *          - CommandDownloader: yt-dlp for URLs, plain copy for uploads
 *
 *          - CommandTranscriber: `$TRANSCRIBE_CMD <media> <out.json>`
 *
 *          - CommandAnalyzer: `$ANALYZE_CMD <transcript.json> <out.json>
 *            <min> <max>` with ANALYSIS_API_KEY in its environment
 *
 *          - CommandDetector: `$DETECT_CMD <clip.mp4> <out.json>`
 *
 * @note Malformed output is a Fatal outcome; failure to run (non-zero exit,
 *       timeout) is Transient.
 */

#ifndef CLIPFORGE_COLLABORATORS_HPP
#define CLIPFORGE_COLLABORATORS_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "retry.hpp"
#include "subject_tracker.hpp"
#include "types.hpp"

namespace clipforge {

// **----- INTERFACES -----**

/**
 * @struct MediaInfo
 * @brief Probed properties of a media file.
 */
struct MediaInfo {
  double duration = 0; //< Seconds
  double fps = 0;
  int width = 0;
  int height = 0;
  bool has_audio = false;
};

class MediaProber {
public:
  virtual ~MediaProber() = default;
  virtual StageOutcome probe(const std::string &path, MediaInfo &out) = 0;
};

class Downloader {
public:
  virtual ~Downloader() = default;

  /// Fetch a remote video to dest
  virtual StageOutcome fetch(const std::string &url,
                             const std::string &dest) = 0;
};

class Transcriber {
public:
  virtual ~Transcriber() = default;
  virtual StageOutcome transcribe(const std::string &media,
                                  const std::string &work_dir,
                                  Transcript &out) = 0;
};

class ContentAnalyzer {
public:
  virtual ~ContentAnalyzer() = default;

  /**
   * @brief Propose viral segments.
   * @param api_key Credential for the analysis service (never logged)
   */
  virtual StageOutcome analyze(const Transcript &transcript,
                               const std::string &api_key, int min_clips,
                               int max_clips, const std::string &work_dir,
                               std::vector<CandidateSegment> &out) = 0;
};

class SubjectDetector {
public:
  virtual ~SubjectDetector() = default;
  virtual StageOutcome detect(const std::string &clip,
                              const std::string &work_dir,
                              DetectionTrack &out) = 0;
};

// **----- JSON CONTRACTS -----**

/// {"segments":[{"start","end","text","words":[{"word","start","end"}]}]}
StageOutcome parse_transcript(const nlohmann::json &j, Transcript &out);

/**
 * @brief {"shorts":[{"start","end","video_title_for_youtube_short",
 *        "video_description_for_tiktok","video_description_for_instagram"}]}
 * @note Times may be numbers or "HH:MM:SS(.fff)" / "MM:SS" strings.
 */
StageOutcome parse_analysis(const nlohmann::json &j,
                            std::vector<CandidateSegment> &out);

/// {"width","height","fps","frames":[{"index","detections":[...]}]}
StageOutcome parse_detections(const nlohmann::json &j, DetectionTrack &out);

/// Read and parse a JSON file; unreadable or invalid files are Fatal
StageOutcome read_json_file(const std::string &path, nlohmann::json &out);

/**
 * @brief Parse "SS", "MM:SS" or "HH:MM:SS" with optional fraction.
 * @return false for anything else
 */
bool parse_timestamp(const std::string &text, double &seconds);

// **----- COMMAND-BACKED IMPLEMENTATIONS -----**

class CommandDownloader : public Downloader {
public:
  CommandDownloader(std::string ytdlp_bin, std::string cookies_file,
                    int timeout_seconds);
  StageOutcome fetch(const std::string &url, const std::string &dest) override;

private:
  std::string bin_;
  std::string cookies_;
  int timeout_;
};

class CommandTranscriber : public Transcriber {
public:
  CommandTranscriber(std::string cmd, int timeout_seconds);
  StageOutcome transcribe(const std::string &media,
                          const std::string &work_dir,
                          Transcript &out) override;

private:
  std::string cmd_;
  int timeout_;
};

class CommandAnalyzer : public ContentAnalyzer {
public:
  CommandAnalyzer(std::string cmd, int timeout_seconds);
  StageOutcome analyze(const Transcript &transcript, const std::string &api_key,
                       int min_clips, int max_clips,
                       const std::string &work_dir,
                       std::vector<CandidateSegment> &out) override;

private:
  std::string cmd_;
  int timeout_;
};

class CommandDetector : public SubjectDetector {
public:
  CommandDetector(std::string cmd, int timeout_seconds);
  StageOutcome detect(const std::string &clip, const std::string &work_dir,
                      DetectionTrack &out) override;

private:
  std::string cmd_;
  int timeout_;
};

} // namespace clipforge

#endif // CLIPFORGE_COLLABORATORS_HPP
