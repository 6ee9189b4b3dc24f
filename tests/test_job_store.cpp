/**
 * @file test_job_store.cpp
 * @brief File-backed job store tests
 */

#include <cassert>
#include <iostream>
#include <thread>

#include "clipforge/job_store.hpp"
#include "test_support.hpp"

using namespace clipforge;
using namespace clipforge::testing;

namespace {

constexpr std::int64_t DAY_MS = 24LL * 60 * 60 * 1000;

Job queued(const JobId &id, std::int64_t now) {
  JobParams params;
  params.source_url = "https://example.com/" + id;
  return make_job(id, params, now, DAY_MS);
}

void test_put_get_update() {
  TempDir dir;
  FakeClock clock;
  FileJobStore store(dir.sub("jobs"), clock.clock());
  fs::create_directories(dir.sub("jobs"));
  assert(store.available());

  assert(store.put(queued("a", clock.now)) == StoreStatus::Ok);

  Job got;
  assert(store.get("a", got) == StoreStatus::Ok);
  assert(got.status == JobStatus::Queued);

  Job written;
  StoreStatus st = store.update(
      "a",
      [](Job &j) {
        begin_processing(j, 5);
        j.expires_at_ms = 1; // writes never move the expiry
        j.id = "other";
      },
      &written);
  assert(st == StoreStatus::Ok);
  assert(written.status == JobStatus::Processing);
  assert(written.id == "a");
  assert(written.expires_at_ms == clock.now + DAY_MS);

  assert(store.get("missing", got) == StoreStatus::NotFound);
  assert(store.update("missing", [](Job &) {}) == StoreStatus::NotFound);
  std::cout << "test_put_get_update: PASSED\n";
}

void test_expired_records_read_as_not_found() {
  TempDir dir;
  FakeClock clock;
  FileJobStore store(dir.path().string(), clock.clock());
  store.put(queued("old", clock.now));

  clock.advance_ms(DAY_MS - 1);
  Job got;
  assert(store.get("old", got) == StoreStatus::Ok);

  clock.advance_ms(1);
  assert(store.get("old", got) == StoreStatus::NotFound);
  assert(store.update("old", [](Job &) {}) == StoreStatus::NotFound);
  std::cout << "test_expired_records_read_as_not_found: PASSED\n";
}

void test_purge_expired() {
  TempDir dir;
  FakeClock clock;
  FileJobStore store(dir.path().string(), clock.clock());
  store.put(queued("first", clock.now));
  clock.advance_ms(60 * 60 * 1000);
  store.put(queued("second", clock.now));

  std::vector<JobId> purged;
  assert(store.purge_expired(clock.now, &purged) == 0);

  clock.advance_ms(DAY_MS - 30 * 60 * 1000);
  assert(store.purge_expired(clock.now, &purged) == 1);
  assert(purged.size() == 1 && purged[0] == "first");
  assert(!fs::exists(dir.path() / "first.json"));
  assert(fs::exists(dir.path() / "second.json"));

  std::vector<Job> all;
  assert(store.list(all) == StoreStatus::Ok);
  assert(all.size() == 1 && all[0].id == "second");
  std::cout << "test_purge_expired: PASSED\n";
}

void test_purge_sweeps_past_unremovable_entries() {
  TempDir dir;
  FakeClock clock;
  FileJobStore store(dir.path().string(), clock.clock());
  for (const char *id : {"a", "b", "c"})
    store.put(queued(id, clock.now));
  /// Looks like a record but can neither be parsed nor removed
  fs::create_directories(dir.path() / "stuck.json");
  write_file((dir.path() / "stuck.json" / "inner").string(), "x");

  clock.advance_ms(DAY_MS);
  std::vector<JobId> purged;
  assert(store.purge_expired(clock.now, &purged) == 3);
  assert(purged.size() == 3);
  assert(fs::is_directory(dir.path() / "stuck.json"));

  std::vector<Job> all;
  assert(store.list(all) == StoreStatus::Ok && all.empty());
  std::cout << "test_purge_sweeps_past_unremovable_entries: PASSED\n";
}

void test_unsafe_ids_are_refused() {
  TempDir dir;
  FakeClock clock;
  FileJobStore store(dir.path().string(), clock.clock());
  Job got;
  assert(store.get("../etc/passwd", got) == StoreStatus::NotFound);
  assert(store.get(".hidden", got) == StoreStatus::NotFound);
  assert(store.put(queued("a/b", clock.now)) != StoreStatus::Ok);
  std::cout << "test_unsafe_ids_are_refused: PASSED\n";
}

void test_corrupt_record_is_unavailable() {
  TempDir dir;
  FakeClock clock;
  FileJobStore store(dir.path().string(), clock.clock());
  write_file((dir.path() / "broken.json").string(), "{not json");
  Job got;
  assert(store.get("broken", got) == StoreStatus::Unavailable);
  std::cout << "test_corrupt_record_is_unavailable: PASSED\n";
}

void test_concurrent_updates_are_atomic() {
  TempDir dir;
  FakeClock clock;
  FileJobStore store(dir.path().string(), clock.clock());
  store.put(queued("busy", clock.now));

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&store, t] {
      for (int i = 0; i < 25; ++i) {
        store.update("busy", [&](Job &j) {
          append_log(j, "writer " + std::to_string(t), 0, 1000);
        });
      }
    });
  }
  for (auto &w : writers)
    w.join();

  Job got;
  assert(store.get("busy", got) == StoreStatus::Ok);
  assert(got.logs.size() == 100);
  std::cout << "test_concurrent_updates_are_atomic: PASSED\n";
}

void test_open_job_store_schemes() {
  TempDir dir;
  FakeClock clock;
  assert(!open_job_store("", clock.clock()));
  assert(!open_job_store("redis://localhost:6379", clock.clock()));

  auto by_url = open_job_store("file://" + dir.sub("a"), clock.clock());
  assert(by_url && by_url->available());
  auto bare = open_job_store(dir.sub("b"), clock.clock());
  assert(bare && bare->available());
  std::cout << "test_open_job_store_schemes: PASSED\n";
}

void test_missing_directory_is_unavailable() {
  TempDir dir;
  FakeClock clock;
  FileJobStore store(dir.sub("nope"), clock.clock());
  assert(!store.available());
  assert(store.put(queued("x", clock.now)) == StoreStatus::Unavailable);
  assert(store.purge_expired(clock.now) == -1);
  std::cout << "test_missing_directory_is_unavailable: PASSED\n";
}

} // anonymous namespace

int main() {
  test_put_get_update();
  test_expired_records_read_as_not_found();
  test_purge_expired();
  test_purge_sweeps_past_unremovable_entries();
  test_unsafe_ids_are_refused();
  test_corrupt_record_is_unavailable();
  test_concurrent_updates_are_atomic();
  test_open_job_store_schemes();
  test_missing_directory_is_unavailable();
  std::cout << "All job store tests passed\n";
  return 0;
}
