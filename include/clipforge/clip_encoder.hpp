/**
 * @file clip_encoder.hpp
 * @brief Clip extraction and vertical rendering through ffmpeg
 *
 * @details Rendering a planned clip happens in three steps:
 *
 *          - The frame plan is split into runs of equal framing mode
 *
 *          - Each run is encoded on its own: single-subject runs move a crop
 *            window frame by frame (sendcmd script), letterbox runs scale the
 *            whole frame and pad it to the vertical canvas
 *
 *          - Runs are joined with the concat demuxer from an in-memory list
 *            and, when captions are enabled, the subtitle script is burned
 *            in on the way to the final file
 */

#ifndef CLIPFORGE_CLIP_ENCODER_HPP
#define CLIPFORGE_CLIP_ENCODER_HPP

#include <string>
#include <vector>

#include "retry.hpp"
#include "subject_tracker.hpp"
#include "types.hpp"

namespace clipforge {

/**
 * @struct EncodeRequest
 * @brief Everything needed to render one vertical clip.
 */
struct EncodeRequest {
  std::string input;  //< Extracted clip (source framing)
  std::string output; //< Final vertical clip
  std::string work_dir;
  std::vector<FramePlan> plan; //< One entry per input frame
  double fps = 30.0;
  int out_width = 1080;
  int out_height = 1920;
  std::string subtitles; //< ASS script; empty = no captions
};

class ClipEncoder {
public:
  virtual ~ClipEncoder() = default;

  /// Cut [range.start, range.end) of source into dest
  virtual StageOutcome extract(const std::string &source,
                               const TimeSegment &range,
                               const std::string &dest) = 0;

  virtual StageOutcome render(const EncodeRequest &request) = 0;
};

// **----- PLAN HELPERS -----**

/**
 * @struct PlanRun
 * @brief Consecutive frames sharing one framing mode.
 */
struct PlanRun {
  int first_frame = 0;
  int frame_count = 0;
  FramingMode mode = FramingMode::SingleSubject;
};

std::vector<PlanRun> split_runs(const std::vector<FramePlan> &plan);

/**
 * @brief sendcmd script moving the crop window across a run.
 * @note Times are relative to the run start; a line is written only when
 *       the window moves.
 */
std::string crop_commands(const std::vector<FramePlan> &plan,
                          const PlanRun &run, double fps);

/**
 * @brief Video filter chain for one run.
 * @param commands_path sendcmd script path (single-subject runs only)
 */
std::string run_filter(const PlanRun &run, const CropRect &first_crop,
                       int out_width, int out_height,
                       const std::string &commands_path);

/// Concat demuxer list for the given files
std::string concat_list(const std::vector<std::string> &files);

/// Escape a path for use inside an ffmpeg filter argument
std::string filter_escape(const std::string &path);

// **----- FFMPEG IMPLEMENTATION -----**

class FfmpegClipEncoder : public ClipEncoder {
public:
  /**
   * @param ffmpeg_bin ffmpeg executable
   * @param timeout_seconds Bound per ffmpeg invocation
   * @param threads Encoder threads for this job
   */
  FfmpegClipEncoder(std::string ffmpeg_bin, int timeout_seconds, int threads);

  StageOutcome extract(const std::string &source, const TimeSegment &range,
                       const std::string &dest) override;
  StageOutcome render(const EncodeRequest &request) override;

private:
  StageOutcome run(const std::string &args, const std::string &log_path,
                   const std::string &what) const;

  std::string bin_;
  int timeout_;
  int threads_;
};

} // namespace clipforge

#endif // CLIPFORGE_CLIP_ENCODER_HPP
