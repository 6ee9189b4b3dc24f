/**
 * @file scheduler.hpp
 * @brief Dispatcher and worker threads that run admitted jobs
 *
 * @details The JobScheduler orchestrates concurrent job execution:
 *
 *          - Submitted ids wait in a FIFO JobQueue
 *
 *          - One dispatcher thread pops ids in order and blocks on the
 *            AdmissionController until a slot is free
 *
 *          - max_active worker threads run the admitted jobs; each worker
 *            gives its slot back when the run returns or throws
 *
 * @attention SHUTDOWN:
 *
 *   - stop() refuses new ids, lets running jobs finish and joins every
 *     thread
 *
 *   - Ids still waiting are dropped from memory only; their records stay
 *     queued in the store and are picked up again at the next start
 *
 *   - While stopped, enqueue() refuses ids; start() accepts them again
 */

#ifndef CLIPFORGE_SCHEDULER_HPP
#define CLIPFORGE_SCHEDULER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

#include "admission.hpp"
#include "job_queue.hpp"

namespace clipforge {

/// Runs one job to a terminal state
using JobRunner = std::function<void(const JobId &)>;

class JobScheduler {
public:
  /**
   * @brief Construct a scheduler.
   * @param max_active Concurrent jobs (and worker threads)
   * @param runner Called on a worker thread for every admitted job
   */
  JobScheduler(int max_active, JobRunner runner);
  ~JobScheduler();

  JobScheduler(const JobScheduler &) = delete;
  JobScheduler &operator=(const JobScheduler &) = delete;

  void start();

  /**
   * @brief Queue a job for admission.
   * @return false when already queued or the scheduler is stopping
   */
  bool enqueue(const JobId &id);

  void stop();

  const AdmissionController &admission() const { return admission_; }
  std::size_t queued() const { return pending_.size(); }
  std::uint64_t finished() const { return finished_.load(); }

private:
  void dispatch_loop();
  void worker_loop(int worker_id);

  JobRunner runner_;
  AdmissionController admission_; //< Must outlive admitted_ (slots inside)
  JobQueue pending_;
  AdmittedQueue admitted_;
  std::thread dispatcher_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> finished_{0};
};

} // namespace clipforge

#endif // CLIPFORGE_SCHEDULER_HPP
