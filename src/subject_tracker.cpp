/**
 * @file subject_tracker.cpp
 * @brief Camera smoothing, speaker switching and whole-clip framing plans
 */

#include "clipforge/subject_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

#include "clipforge/config.hpp"
#include "clipforge/logging.hpp"

namespace clipforge {

namespace {

/// Identities handed to untagged boxes start here, far above detector ids
constexpr int UNTAGGED_ID_BASE = 1 << 20;

/// Frame rate assumed when the detector does not report one
constexpr double DEFAULT_FPS = 30.0;

int even_floor(int v) { return std::max(2, v & ~1); }

} // anonymous namespace

double iou(const Detection &a, const Detection &b) {
  const double ix = std::max(0.0, std::min(a.x + a.w, b.x + b.w) -
                                      std::max(a.x, b.x));
  const double iy = std::max(0.0, std::min(a.y + a.h, b.y + b.h) -
                                      std::max(a.y, b.y));
  const double inter = ix * iy;
  const double uni = a.area() + b.area() - inter;
  return uni > 0 ? inter / uni : 0.0;
}

const char *to_string(FramingMode mode) {
  return mode == FramingMode::SingleSubject ? "single" : "letterbox";
}

TrackerSettings TrackerSettings::from_env() {
  TrackerSettings s;
  s.stabilization_frames = std::max(1, Config::tracker_stabilize_frames());
  s.cooldown_frames = std::max(0, Config::tracker_cooldown_frames());
  s.smoothing_time_constant = Config::tracker_smoothing_tau();
  s.far_apart_ratio = Config::tracker_far_apart_ratio();
  s.safe_zone_margin = std::clamp(Config::tracker_safe_margin(), 0.0, 0.45);
  s.activity_signal = Config::tracker_activity_signal() == "area"
                          ? ActivitySignal::Area
                          : ActivitySignal::Score;
  return s;
}

CropRect vertical_crop_size(int src_width, int src_height) {
  CropRect r;
  r.h = even_floor(src_height);
  r.w = even_floor(static_cast<int>(std::lround(r.h * 9.0 / 16.0)));
  if (r.w > src_width) {
    r.w = even_floor(src_width);
    r.h = std::min(even_floor(static_cast<int>(std::lround(r.w * 16.0 / 9.0))),
                   even_floor(src_height));
  }
  return r;
}

// **----- SmoothedCameraman Implementation -----**

SmoothedCameraman::SmoothedCameraman(int src_width, int src_height, double fps,
                                     const TrackerSettings &settings)
    : src_w_(src_width), src_h_(src_height), margin_(settings.safe_zone_margin),
      cx_(src_width / 2.0), cy_(src_height / 2.0) {
  CropRect size = vertical_crop_size(src_width, src_height);
  crop_w_ = size.w;
  crop_h_ = size.h;

  const double dt = 1.0 / (fps > 0 ? fps : DEFAULT_FPS);
  alpha_ = settings.smoothing_time_constant > 0
               ? 1.0 - std::exp(-dt / settings.smoothing_time_constant)
               : 1.0;
}

void SmoothedCameraman::reset_to(double cx, double cy) {
  cx_ = cx;
  cy_ = cy;
  positioned_ = true;
  clamp_center();
}

CropRect SmoothedCameraman::update(const Detection *target) {
  if (target) {
    if (!positioned_) {
      cx_ = target->cx();
      cy_ = target->cy();
      positioned_ = true;
    } else {
      cx_ += alpha_ * (target->cx() - cx_);
      cy_ += alpha_ * (target->cy() - cy_);
    }
    apply_safe_zone(*target);
  } else if (!positioned_) {
    positioned_ = true;
  }
  clamp_center();
  return crop();
}

void SmoothedCameraman::apply_safe_zone(const Detection &t) {
  auto correct = [](double &center, double size, double margin, double lo,
                    double hi, double target_center) {
    const double inner_lo = center - size / 2.0 + margin * size;
    const double inner_hi = center + size / 2.0 - margin * size;
    if (hi - lo >= inner_hi - inner_lo) {
      /// Box larger than the safe zone: center on it
      center = target_center;
    } else if (lo < inner_lo) {
      center -= inner_lo - lo;
    } else if (hi > inner_hi) {
      center += hi - inner_hi;
    }
  };
  correct(cx_, crop_w_, margin_, t.x, t.x + t.w, t.cx());
  correct(cy_, crop_h_, margin_, t.y, t.y + t.h, t.cy());
}

void SmoothedCameraman::clamp_center() {
  cx_ = std::clamp(cx_, crop_w_ / 2.0, src_w_ - crop_w_ / 2.0);
  cy_ = std::clamp(cy_, crop_h_ / 2.0, src_h_ - crop_h_ / 2.0);
}

CropRect SmoothedCameraman::crop() const {
  CropRect r;
  r.w = crop_w_;
  r.h = crop_h_;
  r.x = std::clamp(static_cast<int>(std::lround(cx_ - crop_w_ / 2.0)), 0,
                   std::max(0, src_w_ - crop_w_));
  r.y = std::clamp(static_cast<int>(std::lround(cy_ - crop_h_ / 2.0)), 0,
                   std::max(0, src_h_ - crop_h_));
  return r;
}

// **----- SpeakerTracker Implementation -----**

SpeakerTracker::SpeakerTracker(const TrackerSettings &settings)
    : settings_(settings) {}

SpeakerTracker::State SpeakerTracker::state() const {
  if (target_ < 0)
    return State::Idle;
  if (cooldown_left_ > 0)
    return State::Cooldown;
  if (candidate_frames_ > 0)
    return State::Candidate;
  return State::Stabilized;
}

double SpeakerTracker::activity(const Detection &d) const {
  if (settings_.activity_signal == ActivitySignal::Area)
    return d.confidence * d.area();
  return d.activity >= 0 ? d.activity : 0.0;
}

int SpeakerTracker::most_plausible(
    const std::vector<Detection> &detections) const {
  const Detection *best = nullptr;
  for (const auto &d : detections) {
    if (!best) {
      best = &d;
      continue;
    }
    /// Ties go to the current target, then to the larger, surer box
    auto rank = [this](const Detection &x) {
      return std::make_tuple(activity(x), x.id == target_ ? 1 : 0,
                             x.confidence * x.area(), -x.id);
    };
    if (rank(d) > rank(*best))
      best = &d;
  }
  return best ? best->id : -1;
}

int SpeakerTracker::update(const std::vector<Detection> &detections) {
  if (detections.empty()) {
    candidate_ = -1;
    candidate_frames_ = 0;
    if (cooldown_left_ > 0)
      --cooldown_left_;
    return target_;
  }

  const int best = most_plausible(detections);

  if (target_ < 0) {
    target_ = best;
    cooldown_left_ = settings_.cooldown_frames;
    return target_;
  }

  if (cooldown_left_ > 0) {
    --cooldown_left_;
    candidate_ = -1;
    candidate_frames_ = 0;
    return target_;
  }

  if (best == target_) {
    candidate_ = -1;
    candidate_frames_ = 0;
    return target_;
  }

  if (best == candidate_) {
    ++candidate_frames_;
  } else {
    candidate_ = best;
    candidate_frames_ = 1;
  }

  if (candidate_frames_ >= settings_.stabilization_frames) {
    LOG_DEBUG("[tracker] Switching target {} -> {}", target_, candidate_);
    target_ = candidate_;
    candidate_ = -1;
    candidate_frames_ = 0;
    cooldown_left_ = settings_.cooldown_frames;
    ++switches_;
  }
  return target_;
}

// **----- SubjectTracker Implementation -----**

SubjectTracker::SubjectTracker(TrackerSettings settings)
    : settings_(settings), next_id_(UNTAGGED_ID_BASE) {}

std::vector<FramePlan> SubjectTracker::centered_plan(int width, int height,
                                                     int frame_count) {
  FramePlan p;
  CropRect size = vertical_crop_size(width, height);
  p.crop = size;
  p.crop.x = std::max(0, (width - size.w) / 2);
  p.crop.y = std::max(0, (height - size.h) / 2);
  p.center_x = width / 2.0;
  p.center_y = height / 2.0;
  return std::vector<FramePlan>(static_cast<std::size_t>(std::max(0, frame_count)),
                                p);
}

void SubjectTracker::assign_identities(std::vector<Detection> &detections) {
  struct Match {
    double score;
    std::size_t cur;
    std::size_t prev;
  };

  std::vector<Match> matches;
  for (std::size_t i = 0; i < detections.size(); ++i) {
    if (detections[i].id >= 0)
      continue;
    for (std::size_t j = 0; j < previous_.size(); ++j) {
      double s = iou(detections[i], previous_[j]);
      if (s >= settings_.match_iou)
        matches.push_back({s, i, j});
    }
  }
  std::sort(matches.begin(), matches.end(),
            [](const Match &a, const Match &b) { return a.score > b.score; });

  std::vector<bool> used_prev(previous_.size(), false);
  std::vector<int> taken;
  for (const auto &d : detections) {
    if (d.id >= 0)
      taken.push_back(d.id);
  }

  for (const auto &m : matches) {
    Detection &d = detections[m.cur];
    const int id = previous_[m.prev].id;
    if (d.id >= 0 || used_prev[m.prev] ||
        std::find(taken.begin(), taken.end(), id) != taken.end())
      continue;
    d.id = id;
    used_prev[m.prev] = true;
    taken.push_back(id);
  }

  for (auto &d : detections) {
    if (d.id < 0)
      d.id = next_id_++;
  }

  if (!detections.empty())
    previous_ = detections;
}

bool SubjectTracker::wants_letterbox(const std::vector<Detection> &detections,
                                     int width) const {
  if (detections.size() < 2)
    return false;
  auto [lo, hi] = std::minmax_element(
      detections.begin(), detections.end(),
      [](const Detection &a, const Detection &b) { return a.cx() < b.cx(); });
  return hi->cx() - lo->cx() > settings_.far_apart_ratio * width;
}

std::vector<FramePlan> SubjectTracker::plan(const DetectionTrack &track,
                                            int frame_count) {
  const int W = track.width;
  const int H = track.height;
  if (W <= 0 || H <= 0)
    return {};

  if (frame_count <= 0) {
    for (const auto &f : track.frames)
      frame_count = std::max(frame_count, f.index + 1);
  }
  if (frame_count <= 0)
    return {};

  std::vector<std::vector<Detection>> per_frame(
      static_cast<std::size_t>(frame_count));
  for (const auto &f : track.frames) {
    if (f.index < 0 || f.index >= frame_count)
      continue;
    auto &slot = per_frame[static_cast<std::size_t>(f.index)];
    for (const auto &d : f.detections) {
      if (d.w > 0 && d.h > 0)
        slot.push_back(d);
    }
  }

  auto first = std::find_if(per_frame.begin(), per_frame.end(),
                            [](const auto &v) { return !v.empty(); });
  if (first == per_frame.end()) {
    LOG_DEBUG("[tracker] No detections in {} frames, centered crop",
              frame_count);
    return centered_plan(W, H, frame_count);
  }

  previous_.clear();
  next_id_ = UNTAGGED_ID_BASE;
  switches_ = 0;
  mode_changes_ = 0;

  SmoothedCameraman camera(W, H, track.fps, settings_);
  SpeakerTracker speaker(settings_);

  /// Frames before the first detection look where the first subject is
  {
    const Detection *lead = &first->front();
    for (const auto &d : *first) {
      if (speaker.activity(d) > speaker.activity(*lead))
        lead = &d;
    }
    camera.reset_to(lead->cx(), lead->cy());
  }

  std::vector<FramePlan> plans;
  plans.reserve(per_frame.size());

  bool letterbox = false;
  bool mode_decided = false;
  int pending = 0;

  for (auto &dets : per_frame) {
    assign_identities(dets);
    const int target_id = speaker.update(dets);

    const Detection *target = nullptr;
    for (const auto &d : dets) {
      if (d.id == target_id) {
        target = &d;
        break;
      }
    }

    if (!dets.empty()) {
      const bool want = wants_letterbox(dets, W);
      if (!mode_decided) {
        letterbox = want;
        mode_decided = true;
      } else if (want != letterbox) {
        if (++pending >= settings_.stabilization_frames) {
          letterbox = want;
          pending = 0;
          ++mode_changes_;
        }
      } else {
        pending = 0;
      }
    } else {
      pending = 0;
    }

    FramePlan p;
    CropRect crop = camera.update(target);
    p.mode = letterbox ? FramingMode::MultiSubjectLetterbox
                       : FramingMode::SingleSubject;
    p.crop = letterbox ? CropRect{0, 0, W, H} : crop;
    p.target_id = target_id;
    p.center_x = camera.center_x();
    p.center_y = camera.center_y();
    plans.push_back(p);
  }

  switches_ = speaker.switches();
  LOG_DEBUG("[tracker] {} frames planned, {} switches, {} mode changes",
            plans.size(), switches_, mode_changes_);
  return plans;
}

} // namespace clipforge
