/**
 * @file job_queue.hpp
 * @brief Thread-safe queues feeding the scheduler
 *
 * @details Provides:
 *          - JobQueue: FIFO of submitted job ids waiting for admission
 *
 *          - AdmittedQueue: hand-off of admitted jobs (id + slot) from the
 *            dispatcher to the worker threads
 */

#ifndef CLIPFORGE_JOB_QUEUE_HPP
#define CLIPFORGE_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <set>

#include "admission.hpp"
#include "types.hpp"

namespace clipforge {

/**
 * @class JobQueue
 * @brief Blocking FIFO of job ids.
 *
 * @note An id that is already queued is not queued twice.
 */
class JobQueue {
public:
  /**
   * @brief Append an id.
   * @return false when the id is already queued or the queue is finished
   */
  bool push(const JobId &id);

  /**
   * @brief Pop the oldest id.
   * @note Blocks until an id is available or the queue is finished.
   * @return false if finished (remaining ids stay unpopped)
   */
  bool pop(JobId &id);

  /// Wake all poppers; later pushes are refused
  void finish();

  /// Accept pushes again after finish()
  void reopen();

  /// Forget every queued id
  void clear();

  std::size_t size() const;

private:
  std::deque<JobId> ids_;
  std::set<JobId> queued_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> done_{false};
};

/**
 * @struct AdmittedJob
 * @brief A job that holds an admission slot and waits for a worker.
 */
struct AdmittedJob {
  JobId id;
  Slot slot;
};

/**
 * @class AdmittedQueue
 * @brief Dispatcher-to-worker hand-off (producer-consumer).
 *
 * @attention USAGE:
 *
 *   - The dispatcher calls push() after admission
 *
 *   - Workers call pop() in a loop
 *
 *   - Call finish() on shutdown, then clear() once workers are joined so
 *     jobs still inside release their slots
 */
class AdmittedQueue {
public:
  void push(AdmittedJob job);
  bool pop(AdmittedJob &job);
  void finish();
  void reopen();

  /// Drop jobs no worker picked up, releasing their slots
  void clear();

private:
  std::deque<AdmittedJob> jobs_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> done_{false};
};

} // namespace clipforge

#endif // CLIPFORGE_JOB_QUEUE_HPP
