/**
 * @file subject_tracker.hpp
 * @brief Stabilised vertical framing from per-frame subject detections
 *
 * @details Provides:
 *          - SmoothedCameraman: a virtual 9:16 camera that eases towards its
 *            target and keeps it inside a safe zone
 *
 *          - SpeakerTracker: chooses which subject the camera follows, with
 *            stabilisation and cooldown so the shot does not flicker
 *
 *          - SubjectTracker: drives both over a whole clip and emits one
 *            FramePlan per frame, switching to a letterboxed full-frame view
 *            when subjects are too far apart to share one crop
 *
 * @attention THREAD MODEL:
 *            - Instances carry per-clip state; use one per clip and thread.
 */

#ifndef CLIPFORGE_SUBJECT_TRACKER_HPP
#define CLIPFORGE_SUBJECT_TRACKER_HPP

#include <cstdint>
#include <vector>

namespace clipforge {

// **----- DETECTIONS -----**

/**
 * @struct Detection
 * @brief One subject box in source pixels (top-left origin).
 */
struct Detection {
  double x = 0;
  double y = 0;
  double w = 0;
  double h = 0;
  int id = -1;             //< Detector identity, -1 when untagged
  double confidence = 1.0; //< [0, 1]
  double activity = -1.0;  //< Speaking score, -1 when unknown

  double cx() const { return x + w / 2.0; }
  double cy() const { return y + h / 2.0; }
  double area() const { return w * h; }
};

struct FrameDetections {
  int index = 0;
  std::vector<Detection> detections;
};

/**
 * @struct DetectionTrack
 * @brief Detector output for one clip.
 * @note frames may be sparse; missing indices mean "nothing detected".
 */
struct DetectionTrack {
  int width = 0;
  int height = 0;
  double fps = 0;
  std::vector<FrameDetections> frames;
};

/// Intersection over union of two boxes, 0 when disjoint
double iou(const Detection &a, const Detection &b);

// **----- PLANS -----**

struct CropRect {
  int x = 0;
  int y = 0;
  int w = 0;
  int h = 0;

  bool operator==(const CropRect &o) const {
    return x == o.x && y == o.y && w == o.w && h == o.h;
  }
};

enum class FramingMode : std::uint8_t { SingleSubject, MultiSubjectLetterbox };

const char *to_string(FramingMode mode);

/**
 * @struct FramePlan
 * @brief Framing decision for one output frame.
 * @note In letterbox mode crop is the whole source frame.
 */
struct FramePlan {
  CropRect crop;
  FramingMode mode = FramingMode::SingleSubject;
  int target_id = -1;
  double center_x = 0;
  double center_y = 0;
};

// **----- SETTINGS -----**

enum class ActivitySignal : std::uint8_t {
  Score, //< Detector activity score (falls back to Area when absent)
  Area   //< confidence x box area
};

struct TrackerSettings {
  int stabilization_frames = 15;
  int cooldown_frames = 30;
  double smoothing_time_constant = 0.4; //< Seconds
  double far_apart_ratio = 0.5;         //< Of frame width
  double safe_zone_margin = 0.1;        //< Of crop size
  double match_iou = 0.3;
  ActivitySignal activity_signal = ActivitySignal::Score;

  /// Snapshot of the TRACKER_* environment (see config/clipforge.env)
  static TrackerSettings from_env();
};

/// 9:16 crop size (even dimensions) that fits inside the source
CropRect vertical_crop_size(int src_width, int src_height);

// **----- COMPONENTS -----**

/**
 * @class SmoothedCameraman
 * @brief Exponentially smoothed virtual camera.
 *
 * @attention MOTION:
 *
 *   - alpha = 1 - exp(-dt / tau) per frame, dt = 1 / fps
 *
 *   - The first target snaps the camera; later targets are eased towards
 *
 *   - After smoothing, the camera shifts just enough to keep the target box
 *     inside the crop shrunk by safe_zone_margin, then clamps to the source
 *
 *   - Without a target the camera holds still
 */
class SmoothedCameraman {
public:
  SmoothedCameraman(int src_width, int src_height, double fps,
                    const TrackerSettings &settings);

  /// Advance one frame; target may be null
  CropRect update(const Detection *target);

  /// Place the camera without smoothing
  void reset_to(double cx, double cy);

  CropRect crop() const;
  double center_x() const { return cx_; }
  double center_y() const { return cy_; }
  double alpha() const { return alpha_; }

private:
  void apply_safe_zone(const Detection &target);
  void clamp_center();

  int src_w_;
  int src_h_;
  int crop_w_;
  int crop_h_;
  double margin_;
  double alpha_;
  double cx_;
  double cy_;
  bool positioned_ = false;
};

/**
 * @class SpeakerTracker
 * @brief Decides which subject identity the camera follows.
 *
 * @attention SWITCHING:
 *
 *   - The first subject seen is acquired at once and locked for
 *     cooldown_frames
 *
 *   - A different subject must be the most plausible speaker for
 *     stabilization_frames consecutive frames to take over
 *
 *   - After every switch the target is locked for cooldown_frames, during
 *     which candidates do not accumulate
 *
 *   - A frame without detections interrupts any candidacy
 */
class SpeakerTracker {
public:
  enum class State : std::uint8_t { Idle, Candidate, Cooldown, Stabilized };

  explicit SpeakerTracker(const TrackerSettings &settings);

  /// Feed one frame; returns the followed identity (-1 none yet)
  int update(const std::vector<Detection> &detections);

  int target() const { return target_; }
  State state() const;
  int switches() const { return switches_; }

  /// Ranking signal for a detection under the configured ActivitySignal
  double activity(const Detection &d) const;

private:
  int most_plausible(const std::vector<Detection> &detections) const;

  TrackerSettings settings_;
  int target_ = -1;
  int candidate_ = -1;
  int candidate_frames_ = 0;
  int cooldown_left_ = 0;
  int switches_ = 0;
};

/**
 * @class SubjectTracker
 * @brief Whole-clip planner.
 */
class SubjectTracker {
public:
  explicit SubjectTracker(TrackerSettings settings);

  /**
   * @brief Plan every frame of a clip.
   *
   * @param track Detections (identities may be missing)
   * @param frame_count Frames in the clip; <= 0 derives it from track
   * @return frame_count plans (identities assigned by IoU where untagged)
   */
  std::vector<FramePlan> plan(const DetectionTrack &track, int frame_count);

  /// Static centered plan, used when nothing could be detected
  static std::vector<FramePlan> centered_plan(int width, int height,
                                              int frame_count);

  int switches() const { return switches_; }
  int mode_changes() const { return mode_changes_; }

private:
  void assign_identities(std::vector<Detection> &detections);
  bool wants_letterbox(const std::vector<Detection> &detections,
                       int width) const;

  TrackerSettings settings_;
  std::vector<Detection> previous_;
  int next_id_ = 0;
  int switches_ = 0;
  int mode_changes_ = 0;
};

} // namespace clipforge

#endif // CLIPFORGE_SUBJECT_TRACKER_HPP
