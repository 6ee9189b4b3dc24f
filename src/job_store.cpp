/**
 * @file job_store.cpp
 * @brief File-backed job store implementation
 */

#include "clipforge/job_store.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <unistd.h>

#include <fmt/core.h>

#include "clipforge/logging.hpp"

namespace fs = std::filesystem;

namespace clipforge {

namespace {

constexpr const char *RECORD_SUFFIX = ".json";

/// Ids become file names; refuse anything that could leave the directory
bool is_safe_id(const JobId &id) {
  if (id.empty() || id.size() > 128 || id[0] == '.')
    return false;
  for (char c : id) {
    bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
              (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
    if (!ok)
      return false;
  }
  return true;
}

} // anonymous namespace

const char *to_string(StoreStatus status) {
  switch (status) {
  case StoreStatus::Ok:
    return "ok";
  case StoreStatus::NotFound:
    return "not found";
  case StoreStatus::Unavailable:
    return "unavailable";
  }
  return "unknown";
}

// **----- FileJobStore -----**

FileJobStore::FileJobStore(std::string directory, Clock clock)
    : directory_(std::move(directory)), clock_(std::move(clock)) {}

bool FileJobStore::available() const {
  std::error_code ec;
  if (!fs::is_directory(directory_, ec))
    return false;
  return ::access(directory_.c_str(), R_OK | W_OK | X_OK) == 0;
}

std::string FileJobStore::path_for(const JobId &id) const {
  return (fs::path(directory_) / (id + RECORD_SUFFIX)).string();
}

StoreStatus FileJobStore::read_locked(const JobId &id, Job &out) const {
  if (!is_safe_id(id))
    return StoreStatus::NotFound;
  if (!available())
    return StoreStatus::Unavailable;

  std::ifstream in(path_for(id));
  if (!in)
    return StoreStatus::NotFound;

  try {
    nlohmann::json j = nlohmann::json::parse(in);
    Job job = j.get<Job>();
    if (is_expired(job, clock_()))
      return StoreStatus::NotFound;
    out = std::move(job);
    return StoreStatus::Ok;
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("[store] Corrupt record {}: {}", id, e.what());
    return StoreStatus::Unavailable;
  }
}

StoreStatus FileJobStore::write_locked(const Job &job) const {
  if (!is_safe_id(job.id))
    return StoreStatus::NotFound;
  if (!available())
    return StoreStatus::Unavailable;

  const std::string final_path = path_for(job.id);
  std::ostringstream tid;
  tid << std::this_thread::get_id();
  const std::string tmp_path =
      fmt::format("{}.tmp.{}.{}", final_path, ::getpid(), tid.str());

  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      LOG_ERROR("[store] Cannot open {} for writing", tmp_path);
      return StoreStatus::Unavailable;
    }
    out << nlohmann::json(job).dump();
    out.flush();
    if (!out) {
      LOG_ERROR("[store] Short write on {}", tmp_path);
      out.close();
      std::remove(tmp_path.c_str());
      return StoreStatus::Unavailable;
    }
  }

  if (std::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
    LOG_ERROR("[store] Cannot replace record {}", job.id);
    std::remove(tmp_path.c_str());
    return StoreStatus::Unavailable;
  }
  return StoreStatus::Ok;
}

StoreStatus FileJobStore::put(const Job &job) {
  std::lock_guard<std::mutex> lock(mutex_);
  return write_locked(job);
}

StoreStatus FileJobStore::get(const JobId &id, Job &out) {
  std::lock_guard<std::mutex> lock(mutex_);
  return read_locked(id, out);
}

StoreStatus FileJobStore::update(const JobId &id,
                                 const std::function<void(Job &)> &mutate,
                                 Job *out) {
  std::lock_guard<std::mutex> lock(mutex_);
  Job job;
  StoreStatus st = read_locked(id, job);
  if (st != StoreStatus::Ok)
    return st;

  const std::int64_t expires_at = job.expires_at_ms;
  mutate(job);
  job.id = id;
  job.expires_at_ms = expires_at;

  st = write_locked(job);
  if (st == StoreStatus::Ok && out)
    *out = job;
  return st;
}

StoreStatus FileJobStore::list(std::vector<Job> &out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!available())
    return StoreStatus::Unavailable;

  out.clear();
  std::error_code ec;
  for (fs::directory_iterator it(directory_, ec), end; !ec && it != end;
       it.increment(ec)) {
    const fs::path p = it->path();
    if (p.extension() != RECORD_SUFFIX)
      continue;
    Job job;
    if (read_locked(p.stem().string(), job) == StoreStatus::Ok)
      out.push_back(std::move(job));
  }
  if (ec) {
    LOG_ERROR("[store] Cannot list {}: {}", directory_, ec.message());
    return StoreStatus::Unavailable;
  }
  return StoreStatus::Ok;
}

int FileJobStore::purge_expired(std::int64_t now_ms,
                                std::vector<JobId> *purged) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!available())
    return -1;

  int removed = 0;
  std::error_code ec;
  for (fs::directory_iterator it(directory_, ec), end; !ec && it != end;
       it.increment(ec)) {
    const fs::path p = it->path();
    if (p.extension() != RECORD_SUFFIX)
      continue;

    bool expired = false;
    try {
      std::ifstream in(p);
      nlohmann::json j = nlohmann::json::parse(in);
      expired = now_ms >= j.value("expires_at_ms", std::int64_t{0}) &&
                j.value("expires_at_ms", std::int64_t{0}) > 0;
    } catch (const nlohmann::json::exception &e) {
      LOG_WARN("[store] Skipping unreadable record {}: {}", p.string(),
               e.what());
      continue;
    }

    if (!expired)
      continue;
    std::error_code rm_ec;
    if (fs::remove(p, rm_ec)) {
      ++removed;
      if (purged)
        purged->push_back(p.stem().string());
    } else if (rm_ec) {
      LOG_WARN("[store] Cannot remove expired record {}: {}", p.string(),
               rm_ec.message());
    }
  }
  if (ec)
    LOG_ERROR("[store] Sweep of {} stopped early: {}", directory_,
              ec.message());
  return removed;
}

// **----- FACTORY -----**

std::unique_ptr<JobStore> open_job_store(const std::string &url, Clock clock) {
  static const std::string FILE_SCHEME = "file://";

  std::string dir;
  if (url.compare(0, FILE_SCHEME.size(), FILE_SCHEME) == 0) {
    dir = url.substr(FILE_SCHEME.size());
  } else if (url.find("://") == std::string::npos) {
    dir = url;
  } else {
    LOG_ERROR("[store] Unsupported store scheme in '{}'", url);
    return nullptr;
  }

  if (dir.empty()) {
    LOG_ERROR("[store] No store configured (CLIPFORGE_STORE_URL is empty)");
    return nullptr;
  }

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    /// Store object still built; available() reports the problem
    LOG_WARN("[store] Cannot create {}: {}", dir, ec.message());
  }
  return std::make_unique<FileJobStore>(dir, std::move(clock));
}

} // namespace clipforge
