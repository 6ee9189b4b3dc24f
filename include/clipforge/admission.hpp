/**
 * @file admission.hpp
 * @brief Bounded, FIFO admission of jobs into the processing state
 *
 * @details AdmissionController hands out at most max_active slots. A job
 *          holds its Slot for its whole processing run; the slot goes back
 *          when the Slot object is destroyed, however the run ended.
 *
 * @attention FAIRNESS:
 *
 *   - Waiters are served strictly in arrival order (ticket numbers)
 *
 *   - A job id can hold at most one slot at a time
 */

#ifndef CLIPFORGE_ADMISSION_HPP
#define CLIPFORGE_ADMISSION_HPP

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>

#include "types.hpp"

namespace clipforge {

class AdmissionController;

/**
 * @class Slot
 * @brief Move-only proof of admission. Releases exactly once.
 */
class Slot {
public:
  Slot() = default;
  ~Slot();

  Slot(Slot &&other) noexcept;
  Slot &operator=(Slot &&other) noexcept;
  Slot(const Slot &) = delete;
  Slot &operator=(const Slot &) = delete;

  bool valid() const { return owner_ != nullptr; }
  const JobId &job_id() const { return id_; }

  /// Give the slot back early; no-op when already released
  void release();

private:
  friend class AdmissionController;
  Slot(AdmissionController *owner, JobId id);

  AdmissionController *owner_ = nullptr;
  JobId id_;
};

/**
 * @class AdmissionController
 * @brief Counting gate with FIFO wake-up order.
 */
class AdmissionController {
public:
  explicit AdmissionController(int max_active);

  AdmissionController(const AdmissionController &) = delete;
  AdmissionController &operator=(const AdmissionController &) = delete;

  /**
   * @brief Block until a slot is free and every earlier waiter was served.
   * @return Invalid slot if the id already holds one or shutdown() was called
   */
  Slot acquire(const JobId &id);

  /// Non-blocking variant; invalid slot when none is free or others wait
  Slot try_acquire(const JobId &id);

  /// Wake every waiter with an invalid slot; later acquires fail fast
  void shutdown();

  /**
   * @brief Admit again after shutdown().
   * @note Call only once every waiter has returned; tickets they abandoned
   *       are skipped.
   */
  void reopen();

  int max_active() const { return max_active_; }
  int active() const;
  int peak_active() const;
  int waiting() const;
  std::uint64_t admitted_total() const;
  std::uint64_t released_total() const;
  bool is_active(const JobId &id) const;

private:
  friend class Slot;
  void release(const JobId &id);

  const int max_active_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::set<JobId> active_ids_;
  std::uint64_t next_ticket_ = 0; //< Handed to the next waiter
  std::uint64_t serving_ = 0;     //< Lowest ticket still waiting
  int waiting_ = 0;
  int peak_ = 0;
  std::uint64_t admitted_ = 0;
  std::uint64_t released_ = 0;
  bool shutdown_ = false;
};

} // namespace clipforge

#endif // CLIPFORGE_ADMISSION_HPP
