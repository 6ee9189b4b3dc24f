/**
 * @file job_queue.cpp
 * @brief JobQueue and AdmittedQueue implementation
 */

#include "clipforge/job_queue.hpp"

namespace clipforge {

// **----- JobQueue Implementation -----**

bool JobQueue::push(const JobId &id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load() || queued_.count(id))
      return false;
    ids_.push_back(id);
    queued_.insert(id);
  }
  cv_.notify_one();
  return true;
}

bool JobQueue::pop(JobId &id) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !ids_.empty() || done_.load(); });
  if (done_.load())
    return false;
  id = std::move(ids_.front());
  ids_.pop_front();
  queued_.erase(id);
  return true;
}

void JobQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

void JobQueue::reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  done_.store(false);
}

void JobQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  ids_.clear();
  queued_.clear();
}

std::size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ids_.size();
}

// **----- AdmittedQueue Implementation -----**

void AdmittedQueue::push(AdmittedJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
}

bool AdmittedQueue::pop(AdmittedJob &job) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !jobs_.empty() || done_.load(); });
  /// Not-yet-started jobs stay queued in the store and resume on restart
  if (done_.load())
    return false;
  job = std::move(jobs_.front());
  jobs_.pop_front();
  return true;
}

void AdmittedQueue::clear() {
  std::deque<AdmittedJob> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped.swap(jobs_);
  }
  /// Slots release as dropped goes out of scope
}

void AdmittedQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

void AdmittedQueue::reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  done_.store(false);
}

} // namespace clipforge
