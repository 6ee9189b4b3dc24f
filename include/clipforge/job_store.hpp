/**
 * @file job_store.hpp
 * @brief Persistent, expiring job record storage
 *
 * @details Provides:
 *          - JobStore: abstract keyed store of Job records; the service, the
 *            pipeline runner and the reaper all talk to it
 *
 *          - FileJobStore: one JSON document per job inside a directory,
 *            replaced atomically on every write (write temp + rename)
 *
 *          - open_job_store(): builds a store from a connection string
 *
 * @attention EXPIRY:
 *
 *   - Every record carries expires_at = created_at + TTL
 *
 *   - An expired record reads as NotFound even before the reaper deletes
 *     it, so TTL is observable regardless of the sweep interval
 *
 *   - Writes never move expires_at
 */

#ifndef CLIPFORGE_JOB_STORE_HPP
#define CLIPFORGE_JOB_STORE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "job.hpp"

namespace clipforge {

enum class StoreStatus : std::uint8_t { Ok, NotFound, Unavailable };

const char *to_string(StoreStatus status);

/// Millisecond wall clock; injectable so tests can move time
using Clock = std::function<std::int64_t()>;

/**
 * @class JobStore
 * @brief Keyed job record storage with whole-record reads and writes.
 *
 * @note Readers always observe a complete record: either the state before
 *       a write or the state after it.
 */
class JobStore {
public:
  virtual ~JobStore() = default;

  /// false when the backend cannot be reached
  virtual bool available() const = 0;

  /// Insert or replace a whole record
  virtual StoreStatus put(const Job &job) = 0;

  /// Snapshot of one record. NotFound when missing or expired.
  virtual StoreStatus get(const JobId &id, Job &out) = 0;

  /**
   * @brief Atomic read-modify-write of one record.
   * @param mutate Applied to the current record; the result is written back
   * @param out Optional copy of the record as written
   */
  virtual StoreStatus update(const JobId &id,
                             const std::function<void(Job &)> &mutate,
                             Job *out = nullptr) = 0;

  /// All unexpired records
  virtual StoreStatus list(std::vector<Job> &out) = 0;

  /**
   * @brief Delete every record whose expiry has passed.
   * @param purged Optional output of the deleted ids
   * @return Number of records removed, -1 when unavailable
   */
  virtual int purge_expired(std::int64_t now_ms,
                            std::vector<JobId> *purged = nullptr) = 0;
};

/**
 * @class FileJobStore
 * @brief Directory of "<id>.json" documents.
 *
 * @attention CONSISTENCY:
 *
 *   - A store-wide mutex serialises writers inside this process
 *
 *   - Each write goes to a temporary file that is renamed over the record,
 *     so a crash leaves either the old or the new document
 *
 *   - Undecodable documents are reported as Unavailable, never as NotFound
 */
class FileJobStore : public JobStore {
public:
  FileJobStore(std::string directory, Clock clock);

  bool available() const override;
  StoreStatus put(const Job &job) override;
  StoreStatus get(const JobId &id, Job &out) override;
  StoreStatus update(const JobId &id, const std::function<void(Job &)> &mutate,
                     Job *out = nullptr) override;
  StoreStatus list(std::vector<Job> &out) override;
  int purge_expired(std::int64_t now_ms,
                    std::vector<JobId> *purged = nullptr) override;

  const std::string &directory() const { return directory_; }

private:
  std::string path_for(const JobId &id) const;
  StoreStatus read_locked(const JobId &id, Job &out) const;
  StoreStatus write_locked(const Job &job) const;

  std::string directory_;
  Clock clock_;
  mutable std::mutex mutex_;
};

/**
 * @brief Open the store named by a connection string.
 * @param url "file:///abs/dir", "file://rel/dir" or a bare directory path
 * @return nullptr for an empty or unsupported connection string
 */
std::unique_ptr<JobStore> open_job_store(const std::string &url, Clock clock);

} // namespace clipforge

#endif // CLIPFORGE_JOB_STORE_HPP
