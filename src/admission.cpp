/**
 * @file admission.cpp
 * @brief AdmissionController and Slot implementation
 */

#include "clipforge/admission.hpp"

#include <algorithm>

#include "clipforge/logging.hpp"

namespace clipforge {

// **----- Slot Implementation -----**

Slot::Slot(AdmissionController *owner, JobId id)
    : owner_(owner), id_(std::move(id)) {}

Slot::~Slot() { release(); }

Slot::Slot(Slot &&other) noexcept
    : owner_(other.owner_), id_(std::move(other.id_)) {
  other.owner_ = nullptr;
}

Slot &Slot::operator=(Slot &&other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    id_ = std::move(other.id_);
    other.owner_ = nullptr;
  }
  return *this;
}

void Slot::release() {
  if (owner_) {
    AdmissionController *owner = owner_;
    owner_ = nullptr;
    owner->release(id_);
  }
}

// **----- AdmissionController Implementation -----**

AdmissionController::AdmissionController(int max_active)
    : max_active_(std::max(1, max_active)) {}

Slot AdmissionController::acquire(const JobId &id) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (shutdown_ || active_ids_.count(id))
    return Slot{};

  const std::uint64_t ticket = next_ticket_++;
  ++waiting_;
  cv_.wait(lock, [this, ticket] {
    return shutdown_ || (ticket == serving_ &&
                         static_cast<int>(active_ids_.size()) < max_active_);
  });
  --waiting_;
  if (shutdown_)
    return Slot{};

  ++serving_;
  if (active_ids_.count(id)) {
    /// Same id admitted by another caller while this one waited
    cv_.notify_all();
    return Slot{};
  }

  active_ids_.insert(id);
  ++admitted_;
  peak_ = std::max(peak_, static_cast<int>(active_ids_.size()));
  LOG_DEBUG("[admission] {} admitted ({}/{})", id, active_ids_.size(),
            max_active_);
  cv_.notify_all();
  return Slot{this, id};
}

Slot AdmissionController::try_acquire(const JobId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_ || waiting_ > 0 || active_ids_.count(id) ||
      static_cast<int>(active_ids_.size()) >= max_active_)
    return Slot{};

  active_ids_.insert(id);
  ++admitted_;
  peak_ = std::max(peak_, static_cast<int>(active_ids_.size()));
  return Slot{this, id};
}

void AdmissionController::release(const JobId &id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ids_.erase(id) == 0)
      return;
    ++released_;
    LOG_DEBUG("[admission] {} released ({}/{})", id, active_ids_.size(),
              max_active_);
  }
  cv_.notify_all();
}

void AdmissionController::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void AdmissionController::reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  shutdown_ = false;
  serving_ = next_ticket_;
}

int AdmissionController::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(active_ids_.size());
}

int AdmissionController::peak_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peak_;
}

int AdmissionController::waiting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return waiting_;
}

std::uint64_t AdmissionController::admitted_total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return admitted_;
}

std::uint64_t AdmissionController::released_total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return released_;
}

bool AdmissionController::is_active(const JobId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ids_.count(id) > 0;
}

} // namespace clipforge
