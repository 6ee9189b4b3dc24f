/**
 * @file service.hpp
 * @brief Service facade: submission, queries, restart recovery and expiry
 *
 * @details ClipService wires the store, the scheduler and the pipeline
 *          together and is the only entry point callers use:
 *
 *          - submit(): validate, persist a queued record, enqueue
 *
 *          - status() / result(): store snapshot -> projection
 *
 *          - resolve_artifact(): map a clip URL to a file on disk
 *
 *          - start(): recover jobs left over by a previous process, then
 *            start the scheduler and the expiry reaper
 *
 * @note Only errors raised before a job exists are returned to the caller.
 *       Everything after that is recorded on the job itself.
 */

#ifndef CLIPFORGE_SERVICE_HPP
#define CLIPFORGE_SERVICE_HPP

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "clip_encoder.hpp"
#include "collaborators.hpp"
#include "job_store.hpp"
#include "pipeline.hpp"
#include "scheduler.hpp"

namespace clipforge {

struct ServiceSettings {
  std::string store_url;
  std::int64_t ttl_ms = 24LL * 60 * 60 * 1000;
  int max_concurrent_jobs = 5;
  std::string upload_dir = "uploads";
  std::uint64_t max_upload_bytes = 500ULL * 1024 * 1024;
  std::string default_api_key; //< Empty = callers must supply one
  int reap_interval_seconds = 300;
  PipelineSettings pipeline;

  static ServiceSettings from_env();
};

/**
 * @struct SubmitRequest
 * @brief One submission. Exactly one of source_url / upload_path is set.
 */
struct SubmitRequest {
  std::string source_url;
  std::string upload_path; //< Local file to process
  bool include_captions = true;
  std::string caption_style = "none";
  std::string caption_color;
  std::string outline_color;
  std::string api_key; //< Overrides the server default for this job
};

struct SubmitOutcome {
  ErrorKind error = ErrorKind::None;
  std::string message;
  JobId job_id;
  JobStatus status = JobStatus::Queued;

  bool ok() const { return error == ErrorKind::None; }
};

struct QueryOutcome {
  ErrorKind error = ErrorKind::None;
  std::string message;
  nlohmann::json body;

  bool ok() const { return error == ErrorKind::None; }
};

class ClipService {
public:
  /// Production wiring: store from settings, command-backed collaborators
  explicit ClipService(ServiceSettings settings);

  /**
   * @brief Injected wiring.
   * @param store May be null (every call then reports ServiceUnavailable)
   * @param collaborators Owned by the caller, must outlive the service
   */
  ClipService(ServiceSettings settings, std::unique_ptr<JobStore> store,
              Collaborators collaborators, Clock clock);

  ~ClipService();

  ClipService(const ClipService &) = delete;
  ClipService &operator=(const ClipService &) = delete;

  /// Recover, then start workers and the reaper. false without a store.
  bool start();
  void stop();

  SubmitOutcome submit(const SubmitRequest &request);
  QueryOutcome status(const JobId &id);
  QueryOutcome result(const JobId &id);

  /**
   * @brief Resolve "/videos/<id>/<file_name>" to a path on disk.
   * @return NotFound for unknown or expired jobs and missing files
   */
  ErrorKind resolve_artifact(const JobId &id, const std::string &file_name,
                             std::string &path);

  /**
   * @brief Requeue or fail jobs left over by a previous process.
   * @return Number of jobs re-enqueued, -1 when the store is unavailable
   */
  int recover();

  /**
   * @brief One expiry sweep: records plus their directories and uploads.
   * @return Number of jobs purged, -1 when the store is unavailable
   */
  int reap();

  bool available() const { return store_ && store_->available(); }
  JobStore *store() { return store_.get(); }
  const JobScheduler &scheduler() const { return *scheduler_; }
  const ServiceSettings &settings() const { return settings_; }

private:
  void run_job(const JobId &id);
  void reap_loop();
  std::string credential_for(const JobId &id);
  ErrorKind load(const JobId &id, Job &job, std::string &message);
  SubmitOutcome reject(ErrorKind kind, std::string message) const;

  ServiceSettings settings_;
  Clock clock_;
  std::unique_ptr<JobStore> store_;

  /// Production collaborators (empty when injected)
  std::unique_ptr<MediaProber> own_prober_;
  std::unique_ptr<Downloader> own_downloader_;
  std::unique_ptr<Transcriber> own_transcriber_;
  std::unique_ptr<ContentAnalyzer> own_analyzer_;
  std::unique_ptr<SubjectDetector> own_detector_;
  std::unique_ptr<ClipEncoder> own_encoder_;

  std::unique_ptr<ProcessingPipeline> pipeline_;

  std::mutex credentials_mutex_;
  std::unordered_map<JobId, std::string> credentials_; //< Never persisted

  std::unique_ptr<JobScheduler> scheduler_;

  std::thread reaper_;
  std::mutex reaper_mutex_;
  std::condition_variable reaper_cv_;
  bool stopping_ = false;
  bool started_ = false;
};

} // namespace clipforge

#endif // CLIPFORGE_SERVICE_HPP
