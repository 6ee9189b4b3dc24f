/**
 * @file scheduler.cpp
 * @brief JobScheduler implementation
 *
 * @details Implements the dispatcher / worker split:
 *
 *          - Dispatcher serialises admission so FIFO order is kept
 *
 *          - Workers are worker-prefixed in the logs for clarity
 */

#include "clipforge/scheduler.hpp"

#include <exception>

#include "clipforge/logging.hpp"

namespace clipforge {

JobScheduler::JobScheduler(int max_active, JobRunner runner)
    : runner_(std::move(runner)), admission_(max_active) {}

JobScheduler::~JobScheduler() { stop(); }

void JobScheduler::start() {
  if (running_.exchange(true))
    return;

  /// No-ops on the first start; re-arms everything stop() closed
  pending_.reopen();
  admitted_.reopen();
  admission_.reopen();

  LOG_PHASE("================== SCHEDULER ==================");
  LOG_INFO("Max concurrent jobs: {}", admission_.max_active());
  LOG_PHASE("===============================================");

  dispatcher_ = std::thread(&JobScheduler::dispatch_loop, this);
  for (int i = 0; i < admission_.max_active(); ++i) {
    workers_.emplace_back(&JobScheduler::worker_loop, this, i);
  }
}

bool JobScheduler::enqueue(const JobId &id) {
  if (!pending_.push(id)) {
    LOG_DEBUG("[scheduler] {} not queued (duplicate or stopping)", id);
    return false;
  }
  return true;
}

void JobScheduler::stop() {
  if (!running_.exchange(false))
    return;

  pending_.finish();
  admission_.shutdown();
  admitted_.finish();

  if (dispatcher_.joinable())
    dispatcher_.join();
  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
  workers_.clear();
  admitted_.clear();
  pending_.clear();
  LOG_INFO("[scheduler] Stopped ({} jobs finished)", finished_.load());
}

void JobScheduler::dispatch_loop() {
  JobId id;
  while (pending_.pop(id)) {
    Slot slot = admission_.acquire(id);
    if (!slot.valid()) {
      if (!running_.load())
        break;
      LOG_WARN("[scheduler] {} is already running, dropping duplicate", id);
      continue;
    }
    admitted_.push(AdmittedJob{id, std::move(slot)});
  }
}

void JobScheduler::worker_loop(int worker_id) {
  AdmittedJob job;
  while (admitted_.pop(job)) {
    LOG_DEBUG("[Worker {}] Running {}", worker_id, job.id);
    try {
      runner_(job.id);
    } catch (const std::exception &e) {
      LOG_ERROR("[Worker {}] Job {} aborted: {}", worker_id, job.id, e.what());
    }
    job.slot.release();
    ++finished_;
  }
}

} // namespace clipforge
