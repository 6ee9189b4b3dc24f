/**
 * @file test_service.cpp
 * @brief Submission validation, end-to-end processing, recovery and expiry
 *        through the service facade
 */

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "clipforge/job.hpp"
#include "clipforge/service.hpp"
#include "test_support.hpp"

using namespace clipforge;
using namespace clipforge::testing;

namespace {

constexpr std::int64_t DAY_MS = 24LL * 60 * 60 * 1000;

struct Harness {
  TempDir dir;
  FakeClock clock;
  FakeWorld world;
  ObservedStore *store = nullptr;
  std::unique_ptr<ClipService> service;

  explicit Harness(
      const std::function<void(ServiceSettings &)> &tweak = {},
      const std::function<void(ObservedStore &)> &seed = {}) {
    fs::create_directories(dir.sub("jobs"));
    auto owned = std::make_unique<ObservedStore>(dir.sub("jobs"), clock.clock());
    store = owned.get();
    if (seed)
      seed(*store);

    ServiceSettings s;
    s.ttl_ms = DAY_MS;
    s.upload_dir = dir.sub("uploads");
    s.reap_interval_seconds = 3600;
    s.pipeline = fast_settings(dir);
    if (tweak)
      tweak(s);
    service = std::make_unique<ClipService>(s, std::move(owned),
                                            world.collaborators(),
                                            clock.clock());
  }

  SubmitRequest url_request(const std::string &key = "user-key") {
    SubmitRequest r;
    r.source_url = "https://example.com/watch?v=abc";
    r.api_key = key;
    return r;
  }

  std::string status_of(const JobId &id) {
    QueryOutcome q = service->status(id);
    return q.ok() ? q.body["status"].get<std::string>() : "missing";
  }

  bool wait_status(const JobId &id, const std::string &want) {
    return wait_until([&] { return status_of(id) == want; });
  }

  std::size_t stored_jobs() {
    std::vector<Job> jobs;
    store->list(jobs);
    return jobs.size();
  }
};

void expect_rejected(Harness &h, const SubmitRequest &r, ErrorKind kind) {
  SubmitOutcome out = h.service->submit(r);
  assert(!out.ok());
  assert(out.error == kind);
  assert(!out.message.empty());
  assert(out.job_id.empty());
}

void test_missing_credential_is_rejected() {
  Harness h;
  expect_rejected(h, h.url_request(""), ErrorKind::Validation);
  assert(h.stored_jobs() == 0);
  std::cout << "test_missing_credential_is_rejected: PASSED\n";
}

void test_validation_happens_before_job_exists() {
  Harness h([](ServiceSettings &s) { s.max_upload_bytes = 10; });

  SubmitRequest none = h.url_request();
  none.source_url.clear();
  expect_rejected(h, none, ErrorKind::Validation);

  SubmitRequest both = h.url_request();
  write_file(h.dir.sub("small.mp4"), "tiny");
  both.upload_path = h.dir.sub("small.mp4");
  expect_rejected(h, both, ErrorKind::Validation);

  SubmitRequest ftp = h.url_request();
  ftp.source_url = "ftp://example.com/video.mp4";
  expect_rejected(h, ftp, ErrorKind::Validation);

  SubmitRequest style = h.url_request();
  style.caption_style = "sparkly";
  expect_rejected(h, style, ErrorKind::Validation);

  SubmitRequest color = h.url_request();
  color.caption_style = "classic";
  color.caption_color = "#GGHHII";
  expect_rejected(h, color, ErrorKind::Validation);

  SubmitRequest override_none = h.url_request();
  override_none.outline_color = "#000";
  expect_rejected(h, override_none, ErrorKind::Validation);

  SubmitRequest missing_upload = h.url_request();
  missing_upload.source_url.clear();
  missing_upload.upload_path = h.dir.sub("nope.mp4");
  expect_rejected(h, missing_upload, ErrorKind::Validation);

  SubmitRequest big = h.url_request();
  big.source_url.clear();
  write_file(h.dir.sub("big.mp4"), "eleven bytes");
  big.upload_path = h.dir.sub("big.mp4");
  expect_rejected(h, big, ErrorKind::Validation);

  assert(h.stored_jobs() == 0);
  assert(!fs::exists(h.dir.sub("uploads")) ||
         fs::is_empty(h.dir.sub("uploads")));
  std::cout << "test_validation_happens_before_job_exists: PASSED\n";
}

void test_unavailable_store() {
  TempDir dir;
  FakeClock clock;
  FakeWorld world;
  ServiceSettings s;
  s.pipeline = fast_settings(dir);
  ClipService service(s, nullptr, world.collaborators(), clock.clock());

  assert(!service.start());
  SubmitRequest r;
  r.source_url = "https://example.com/v";
  r.api_key = "k";
  SubmitOutcome out = service.submit(r);
  assert(out.error == ErrorKind::ServiceUnavailable);
  assert(service.status("x").error == ErrorKind::ServiceUnavailable);
  assert(service.result("x").error == ErrorKind::ServiceUnavailable);
  assert(service.reap() == -1);

  Harness h;
  h.store->down = true;
  expect_rejected(h, h.url_request(), ErrorKind::ServiceUnavailable);
  std::cout << "test_unavailable_store: PASSED\n";
}

void test_submit_runs_to_completion() {
  Harness h;
  assert(h.service->start());

  SubmitRequest r = h.url_request("user-key");
  r.caption_style = "bold";
  r.caption_color = "#ffcc00";
  SubmitOutcome out = h.service->submit(r);
  assert(out.ok());
  assert(out.status == JobStatus::Queued);
  assert(out.job_id.size() == 36);

  assert(h.wait_status(out.job_id, "completed"));

  QueryOutcome status = h.service->status(out.job_id);
  assert(status.body["progress_percentage"] == 100);
  const auto &logs = status.body["logs"];
  assert(logs[0].get<std::string>().find("Job queued.") != std::string::npos);

  QueryOutcome result = h.service->result(out.job_id);
  assert(result.ok());
  assert(result.body["result"]["clips"].size() == 3);
  assert(h.world.analyzer.keys_seen == std::vector<std::string>{"user-key"});
  assert(!h.world.encoder.requests[0].subtitles.empty());

  std::string path;
  assert(h.service->resolve_artifact(out.job_id, "clip_1.mp4", path) ==
         ErrorKind::None);
  assert(fs::exists(path));
  assert(h.service->resolve_artifact(out.job_id, "clip_9.mp4", path) ==
         ErrorKind::NotFound);
  assert(h.service->resolve_artifact(out.job_id, "../clip_1.mp4", path) ==
         ErrorKind::NotFound);
  assert(h.service->resolve_artifact("unknown", "clip_1.mp4", path) ==
         ErrorKind::NotFound);

  h.service->stop();
  h.service->stop();
  std::cout << "test_submit_runs_to_completion: PASSED\n";
}

void test_restart_in_process() {
  Harness h;
  assert(h.service->start());
  h.service->stop();

  /// Submitted while stopped: stored, then run by the next start
  SubmitOutcome out = h.service->submit(h.url_request("user-key"));
  assert(out.ok());
  assert(h.status_of(out.job_id) == "queued");

  assert(h.service->start());
  assert(h.wait_status(out.job_id, "completed"));

  SubmitOutcome next = h.service->submit(h.url_request("user-key"));
  assert(next.ok());
  assert(h.wait_status(next.job_id, "completed"));
  h.service->stop();
  std::cout << "test_restart_in_process: PASSED\n";
}

void test_queries_on_unknown_and_pending_jobs() {
  Harness h;
  assert(h.service->status("missing").error == ErrorKind::NotFound);
  assert(h.service->result("missing").error == ErrorKind::NotFound);

  /// Not started: the job stays queued and its result is simply absent
  SubmitOutcome out = h.service->submit(h.url_request());
  assert(out.ok());
  QueryOutcome result = h.service->result(out.job_id);
  assert(result.ok());
  assert(result.body["status"] == "queued");
  assert(result.body["result"].is_null());
  std::cout << "test_queries_on_unknown_and_pending_jobs: PASSED\n";
}

void test_server_default_credential() {
  Harness h([](ServiceSettings &s) { s.default_api_key = "server-key"; });
  assert(h.service->start());
  SubmitOutcome out = h.service->submit(h.url_request(""));
  assert(out.ok());
  assert(h.wait_status(out.job_id, "completed"));
  assert(h.world.analyzer.keys_seen == std::vector<std::string>{"server-key"});
  std::cout << "test_server_default_credential: PASSED\n";
}

void test_concurrency_limit() {
  constexpr int LIMIT = 2;
  Harness h([](ServiceSettings &s) { s.max_concurrent_jobs = LIMIT; });
  h.world.encoder.gated = true;
  assert(h.service->start());

  std::vector<JobId> ids;
  for (int i = 0; i < 5; ++i) {
    SubmitOutcome out = h.service->submit(h.url_request());
    assert(out.ok());
    ids.push_back(out.job_id);
  }

  bool saturated =
      wait_until([&] { return h.world.encoder.in_render == LIMIT; });
  assert(saturated);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  int processing = 0;
  int queued = 0;
  for (const auto &id : ids) {
    const std::string st = h.status_of(id);
    processing += st == "processing";
    queued += st == "queued";
  }
  assert(processing == LIMIT);
  assert(queued == 5 - LIMIT);
  assert(h.service->scheduler().admission().active() == LIMIT);

  h.world.encoder.release_gate();
  for (const auto &id : ids)
    assert(h.wait_status(id, "completed"));

  assert(h.world.encoder.peak_in_render <= LIMIT);
  assert(h.service->scheduler().admission().peak_active() <= LIMIT);
  h.service->stop();
  assert(h.service->scheduler().admission().active() == 0);
  std::cout << "test_concurrency_limit: PASSED\n";
}

void test_upload_lifecycle_and_expiry() {
  Harness h;
  assert(h.service->start());

  const std::string upload = h.dir.sub("incoming/talk.mp4");
  write_file(upload, std::string(2048, 'v'));
  SubmitRequest r = h.url_request();
  r.source_url.clear();
  r.upload_path = upload;
  SubmitOutcome out = h.service->submit(r);
  assert(out.ok());

  const fs::path stored =
      fs::path(h.dir.sub("uploads")) / (out.job_id + "_talk.mp4");
  assert(fs::exists(stored));
  assert(h.wait_status(out.job_id, "completed"));
  assert(h.world.downloader.calls == 0);

  const fs::path output = fs::path(h.dir.sub("output")) / out.job_id;
  assert(fs::exists(output / "clip_1.mp4"));

  h.clock.advance_ms(DAY_MS - 1);
  assert(h.service->reap() == 0);
  assert(h.status_of(out.job_id) == "completed");

  h.clock.advance_ms(1);
  /// Expired records read as missing before any sweep
  assert(h.service->status(out.job_id).error == ErrorKind::NotFound);
  std::string path;
  assert(h.service->resolve_artifact(out.job_id, "clip_1.mp4", path) ==
         ErrorKind::NotFound);

  assert(h.service->reap() == 1);
  assert(!fs::exists(output));
  assert(!fs::exists(stored));
  assert(h.stored_jobs() == 0);
  std::cout << "test_upload_lifecycle_and_expiry: PASSED\n";
}

void test_recovery_after_restart() {
  JobId interrupted;
  JobId waiting;
  auto seed = [&](ObservedStore &store) {
    JobParams params;
    params.source_url = "https://example.com/old";
    interrupted = generate_job_id();
    Job running = make_job(interrupted, params, 1700000000000, DAY_MS);
    begin_processing(running, 1700000001000);
    set_progress(running, 50, "AI analysis");
    store.put(running);

    waiting = generate_job_id();
    store.put(make_job(waiting, params, 1700000002000, DAY_MS));
  };

  {
    Harness h({}, seed);
    assert(h.service->start());
    QueryOutcome a = h.service->status(interrupted);
    assert(a.body["status"] == "failed");
    assert(a.body["error"] == "interrupted by service restart");
    assert(a.body["progress_percentage"] == 50);

    QueryOutcome b = h.service->result(waiting);
    assert(b.body["status"] == "failed");
    assert(b.body["error"] == "credential lost on restart");
    assert(h.world.downloader.calls == 0);
  }

  {
    Harness h([](ServiceSettings &s) { s.default_api_key = "server-key"; },
              seed);
    assert(h.service->recover() == 1);
    assert(h.service->start());
    assert(h.wait_status(waiting, "completed"));
    assert(h.status_of(interrupted) == "failed");
    assert(h.world.analyzer.keys_seen ==
           std::vector<std::string>{"server-key"});
  }
  std::cout << "test_recovery_after_restart: PASSED\n";
}

} // anonymous namespace

int main() {
  test_missing_credential_is_rejected();
  test_validation_happens_before_job_exists();
  test_unavailable_store();
  test_submit_runs_to_completion();
  test_restart_in_process();
  test_queries_on_unknown_and_pending_jobs();
  test_server_default_credential();
  test_concurrency_limit();
  test_upload_lifecycle_and_expiry();
  test_recovery_after_restart();
  std::cout << "All service tests passed\n";
  return 0;
}
