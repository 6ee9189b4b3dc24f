/**
 * @file service.cpp
 * @brief ClipService implementation
 */

#include "clipforge/service.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>

#include <fmt/core.h>

#include "clipforge/captions.hpp"
#include "clipforge/config.hpp"
#include "clipforge/job.hpp"
#include "clipforge/logging.hpp"
#include "clipforge/media_probe.hpp"
#include "clipforge/projection.hpp"
#include "clipforge/system.hpp"

namespace fs = std::filesystem;

namespace clipforge {

namespace {

bool has_http_scheme(const std::string &url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

/// A bare file name: no separators, no dot-only names
bool is_plain_file_name(const std::string &name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == std::string::npos &&
         name.find('\\') == std::string::npos;
}

void remove_job_files(const ServiceSettings &s, const JobId &id) {
  std::error_code ec;
  fs::remove_all(fs::path(s.pipeline.output_dir) / id, ec);
  fs::remove_all(fs::path(s.pipeline.work_dir) / id, ec);

  const std::string prefix = id + "_";
  for (fs::directory_iterator it(s.upload_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().filename().string().rfind(prefix, 0) != 0)
      continue;
    std::error_code rm_ec;
    if (!fs::remove(it->path(), rm_ec) && rm_ec)
      LOG_WARN("[service] Cannot remove upload {}: {}", it->path().string(),
               rm_ec.message());
  }
}

} // anonymous namespace

// **----- SETTINGS -----**

ServiceSettings ServiceSettings::from_env() {
  ServiceSettings s;
  s.store_url = Config::store_url();
  s.ttl_ms = static_cast<std::int64_t>(Config::job_ttl_seconds()) * 1000;
  s.max_concurrent_jobs = std::max(1, Config::max_concurrent_jobs());
  s.upload_dir = Config::upload_dir();
  s.max_upload_bytes =
      static_cast<std::uint64_t>(std::max(1, Config::max_upload_mb())) * 1024 *
      1024;
  s.default_api_key = Config::analysis_api_key();
  s.reap_interval_seconds = std::max(1, Config::reap_interval_seconds());
  s.pipeline = PipelineSettings::from_env();
  return s;
}

// **----- CONSTRUCTION -----**

ClipService::ClipService(ServiceSettings settings)
    : ClipService(settings,
                  open_job_store(settings.store_url, [] { return now_ms(); }),
                  Collaborators{}, [] { return now_ms(); }) {
  const int threads = threads_per_job(settings_.max_concurrent_jobs);

  own_prober_ = std::make_unique<LibavProber>();
  own_downloader_ = std::make_unique<CommandDownloader>(
      Config::ytdlp_bin(), Config::download_cookies_file(),
      Config::download_timeout_seconds());
  own_transcriber_ = std::make_unique<CommandTranscriber>(
      Config::transcribe_cmd(), Config::transcribe_timeout_seconds());
  own_analyzer_ = std::make_unique<CommandAnalyzer>(
      Config::analyze_cmd(), Config::analyze_timeout_seconds());
  own_detector_ = std::make_unique<CommandDetector>(
      Config::detect_cmd(), Config::detect_timeout_seconds());
  own_encoder_ = std::make_unique<FfmpegClipEncoder>(
      Config::ffmpeg_bin(), Config::encode_timeout_seconds(), threads);

  if (store_) {
    Collaborators c;
    c.prober = own_prober_.get();
    c.downloader = own_downloader_.get();
    c.transcriber = own_transcriber_.get();
    c.analyzer = own_analyzer_.get();
    c.detector = own_detector_.get();
    c.encoder = own_encoder_.get();
    pipeline_ = std::make_unique<ProcessingPipeline>(*store_, c,
                                                     settings_.pipeline, clock_);
  }
  LOG_INFO("[service] {} encoder thread(s) per job", threads);
}

ClipService::ClipService(ServiceSettings settings,
                         std::unique_ptr<JobStore> store,
                         Collaborators collaborators, Clock clock)
    : settings_(std::move(settings)), clock_(std::move(clock)),
      store_(std::move(store)) {
  if (store_ && collaborators.prober) {
    pipeline_ = std::make_unique<ProcessingPipeline>(
        *store_, collaborators, settings_.pipeline, clock_);
  }
  scheduler_ = std::make_unique<JobScheduler>(
      settings_.max_concurrent_jobs, [this](const JobId &id) { run_job(id); });
}

ClipService::~ClipService() { stop(); }

// **----- LIFECYCLE -----**

bool ClipService::start() {
  if (started_)
    return true;
  if (!available() || !pipeline_) {
    LOG_ERROR("[service] Job store unavailable, not starting workers");
    return false;
  }

  scheduler_->start();
  int resumed = recover();
  if (resumed > 0)
    LOG_INFO("[service] Resumed {} queued job(s)", resumed);

  {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    stopping_ = false;
  }
  reaper_ = std::thread(&ClipService::reap_loop, this);
  started_ = true;
  return true;
}

void ClipService::stop() {
  if (!started_)
    return;
  {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    stopping_ = true;
  }
  reaper_cv_.notify_all();
  if (reaper_.joinable())
    reaper_.join();
  scheduler_->stop();
  started_ = false;
}

// **----- SUBMISSION -----**

SubmitOutcome ClipService::reject(ErrorKind kind, std::string message) const {
  LOG_WARN("[service] Submission rejected ({}): {}", to_string(kind), message);
  SubmitOutcome out;
  out.error = kind;
  out.message = std::move(message);
  return out;
}

SubmitOutcome ClipService::submit(const SubmitRequest &request) {
  if (!available())
    return reject(ErrorKind::ServiceUnavailable, "job store unavailable");

  // **---- CREDENTIAL ----**

  const std::string api_key =
      request.api_key.empty() ? settings_.default_api_key : request.api_key;
  if (api_key.empty())
    return reject(ErrorKind::Validation,
                  "no analysis credential supplied and no server default "
                  "configured");

  // **---- SOURCE ----**

  const bool has_url = !request.source_url.empty();
  const bool has_upload = !request.upload_path.empty();
  if (has_url == has_upload)
    return reject(ErrorKind::Validation,
                  "exactly one of source URL or uploaded file is required");

  if (has_url && !has_http_scheme(request.source_url))
    return reject(ErrorKind::Validation,
                  fmt::format("unsupported source URL '{}'",
                              request.source_url));

  std::uintmax_t upload_size = 0;
  if (has_upload) {
    std::error_code ec;
    if (!fs::is_regular_file(request.upload_path, ec))
      return reject(ErrorKind::Validation,
                    fmt::format("uploaded file '{}' not found",
                                request.upload_path));
    upload_size = fs::file_size(request.upload_path, ec);
    if (ec)
      return reject(ErrorKind::Validation,
                    fmt::format("uploaded file unreadable: {}", ec.message()));
    if (upload_size > settings_.max_upload_bytes)
      return reject(ErrorKind::Validation,
                    fmt::format("uploaded file is {} MB, limit is {} MB",
                                upload_size / (1024 * 1024),
                                settings_.max_upload_bytes / (1024 * 1024)));
  }

  // **---- CAPTIONS ----**

  CaptionSettings captions;
  captions.include_captions = request.include_captions;
  if (!parse_caption_style(request.caption_style, captions.style))
    return reject(ErrorKind::Validation,
                  fmt::format("unknown caption style '{}'",
                              request.caption_style));
  captions.color = request.caption_color;
  captions.outline_color = request.outline_color;
  const std::string invalid = validate_caption_settings(captions);
  if (!invalid.empty())
    return reject(ErrorKind::Validation, invalid);

  // **---- CREATE ----**

  const JobId id = generate_job_id();
  JobParams params;
  params.source_url = request.source_url;
  params.captions = captions;

  if (has_upload) {
    /// Keep a job-scoped copy so it expires with the job
    std::error_code ec;
    fs::create_directories(settings_.upload_dir, ec);
    const fs::path stored =
        fs::path(settings_.upload_dir) /
        fmt::format("{}_{}", id, fs::path(request.upload_path).filename().string());
    fs::copy_file(request.upload_path, stored,
                  fs::copy_options::overwrite_existing, ec);
    if (ec)
      return reject(ErrorKind::ServiceUnavailable,
                    fmt::format("cannot store upload: {}", ec.message()));
    params.upload_path = stored.string();
  }

  const std::int64_t now = clock_();
  Job job = make_job(id, std::move(params), now, settings_.ttl_ms);
  append_log(job, "Job queued.", now, settings_.pipeline.log_cap);

  if (store_->put(job) != StoreStatus::Ok) {
    remove_job_files(settings_, id);
    return reject(ErrorKind::ServiceUnavailable, "job store unavailable");
  }

  {
    std::lock_guard<std::mutex> lock(credentials_mutex_);
    credentials_[id] = api_key;
  }
  if (!scheduler_->enqueue(id))
    LOG_INFO("[service] {} stays queued until the workers start", id);

  LOG_INFO("[service] Queued {} ({}, captions {})", id,
           has_url ? request.source_url : "upload",
           captions.enabled() ? to_string(captions.style) : "off");

  SubmitOutcome out;
  out.job_id = id;
  out.status = JobStatus::Queued;
  return out;
}

// **----- QUERIES -----**

ErrorKind ClipService::load(const JobId &id, Job &job,
                            std::string &message) {
  if (!available()) {
    message = "job store unavailable";
    return ErrorKind::ServiceUnavailable;
  }
  StoreStatus st = store_->get(id, job);
  if (st == StoreStatus::NotFound) {
    message = fmt::format("job {} not found", id);
    return ErrorKind::NotFound;
  }
  if (st == StoreStatus::Unavailable) {
    message = "job store unavailable";
    return ErrorKind::ServiceUnavailable;
  }
  return ErrorKind::None;
}

QueryOutcome ClipService::status(const JobId &id) {
  QueryOutcome out;
  Job job;
  out.error = load(id, job, out.message);
  if (out.ok())
    out.body = project_status(job);
  return out;
}

QueryOutcome ClipService::result(const JobId &id) {
  QueryOutcome out;
  Job job;
  out.error = load(id, job, out.message);
  if (out.ok())
    out.body = project_result(job);
  return out;
}

ErrorKind ClipService::resolve_artifact(const JobId &id,
                                        const std::string &file_name,
                                        std::string &path) {
  if (!is_plain_file_name(file_name))
    return ErrorKind::NotFound;

  Job job;
  std::string message;
  ErrorKind kind = load(id, job, message);
  if (kind != ErrorKind::None)
    return kind;

  const fs::path candidate =
      fs::path(settings_.pipeline.output_dir) / id / file_name;
  std::error_code ec;
  if (!fs::is_regular_file(candidate, ec))
    return ErrorKind::NotFound;

  path = candidate.string();
  return ErrorKind::None;
}

// **----- RECOVERY -----**

int ClipService::recover() {
  if (!available())
    return -1;

  std::vector<Job> jobs;
  if (store_->list(jobs) != StoreStatus::Ok)
    return -1;

  std::sort(jobs.begin(), jobs.end(), [](const Job &a, const Job &b) {
    return a.created_at_ms < b.created_at_ms;
  });

  const std::size_t cap = settings_.pipeline.log_cap;
  auto fail_record = [&](const JobId &id, const std::string &error) {
    const std::int64_t now = clock_();
    StoreStatus st = store_->update(id, [&](Job &j) {
      append_log(j, "Job failed: " + error, now, cap);
      fail_job(j, error, now);
    });
    if (st != StoreStatus::Ok)
      LOG_ERROR("[service] Cannot fail {} on recovery: {}", id, to_string(st));
    else
      LOG_WARN("[service] {} failed on recovery: {}", id, error);
  };

  int requeued = 0;
  for (const auto &job : jobs) {
    if (job.status == JobStatus::Processing) {
      fail_record(job.id, "interrupted by service restart");
      continue;
    }
    if (job.status != JobStatus::Queued)
      continue;

    bool has_key = !settings_.default_api_key.empty();
    {
      std::lock_guard<std::mutex> lock(credentials_mutex_);
      has_key = has_key || credentials_.count(job.id) > 0;
    }
    if (!has_key) {
      fail_record(job.id, "credential lost on restart");
      continue;
    }
    if (scheduler_->enqueue(job.id))
      ++requeued;
  }
  return requeued;
}

// **----- WORKERS -----**

std::string ClipService::credential_for(const JobId &id) {
  std::lock_guard<std::mutex> lock(credentials_mutex_);
  auto it = credentials_.find(id);
  if (it == credentials_.end())
    return settings_.default_api_key;
  return it->second;
}

void ClipService::run_job(const JobId &id) {
  const std::string key = credential_for(id);
  if (key.empty()) {
    const std::int64_t now = clock_();
    const std::size_t cap = settings_.pipeline.log_cap;
    StoreStatus st = store_->update(id, [&](Job &j) {
      append_log(j, "Job failed: credential lost on restart", now, cap);
      fail_job(j, "credential lost on restart", now);
    });
    if (st != StoreStatus::Ok)
      LOG_ERROR("[service] Cannot fail {}: {}", id, to_string(st));
  } else {
    pipeline_->run(id, key);
  }

  std::lock_guard<std::mutex> lock(credentials_mutex_);
  credentials_.erase(id);
}

// **----- EXPIRY -----**

int ClipService::reap() {
  if (!available())
    return -1;

  std::vector<JobId> purged;
  int n = store_->purge_expired(clock_(), &purged);
  if (n < 0) {
    LOG_WARN("[reaper] Store unavailable, sweep skipped");
    return -1;
  }
  for (const auto &id : purged)
    remove_job_files(settings_, id);
  if (n > 0)
    LOG_INFO("[reaper] Purged {} expired job(s)", n);
  return n;
}

void ClipService::reap_loop() {
  std::unique_lock<std::mutex> lock(reaper_mutex_);
  while (!stopping_) {
    lock.unlock();
    reap();
    lock.lock();
    reaper_cv_.wait_for(lock,
                        std::chrono::seconds(settings_.reap_interval_seconds),
                        [this] { return stopping_; });
  }
}

} // namespace clipforge
