/**
 * @file test_scheduler.cpp
 * @brief Dispatcher / worker pool tests
 */

#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "clipforge/job_queue.hpp"
#include "clipforge/scheduler.hpp"
#include "test_support.hpp"

using namespace clipforge;
using namespace clipforge::testing;

namespace {

void test_job_queue_dedupes() {
  JobQueue q;
  assert(q.push("a"));
  assert(!q.push("a"));
  assert(q.push("b"));
  assert(q.size() == 2);

  JobId id;
  assert(q.pop(id) && id == "a");
  assert(q.push("a")); // popped ids may be queued again
  q.finish();
  assert(!q.push("c"));
  assert(!q.pop(id));
  std::cout << "test_job_queue_dedupes: PASSED\n";
}

void test_fifo_with_single_slot() {
  std::mutex m;
  std::vector<JobId> started;
  JobScheduler sched(1, [&](const JobId &id) {
    std::lock_guard<std::mutex> lock(m);
    started.push_back(id);
  });

  std::vector<JobId> ids;
  for (int i = 0; i < 12; ++i) {
    ids.push_back("job-" + std::to_string(i));
    assert(sched.enqueue(ids.back()));
  }
  sched.start();
  bool done = wait_until([&] { return sched.finished() == ids.size(); });
  assert(done);
  sched.stop();

  assert(started == ids);
  std::cout << "test_fifo_with_single_slot: PASSED\n";
}

void test_bounded_concurrency_and_release_on_throw() {
  constexpr int LIMIT = 3;
  std::atomic<int> inside{0};
  std::atomic<int> worst{0};

  JobScheduler sched(LIMIT, [&](const JobId &id) {
    const int now = ++inside;
    int seen = worst.load();
    while (now > seen && !worst.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    --inside;
    if (id.back() == '7' || id.back() == '3')
      throw std::runtime_error("stage blew up");
  });
  sched.start();

  for (int i = 0; i < 20; ++i)
    sched.enqueue("burst-" + std::to_string(i));

  bool done = wait_until([&] { return sched.finished() == 20; });
  assert(done);

  const AdmissionController &ac = sched.admission();
  assert(worst.load() <= LIMIT);
  assert(ac.peak_active() <= LIMIT);
  assert(ac.admitted_total() == 20);
  assert(ac.released_total() == 20);
  assert(ac.active() == 0);
  sched.stop();
  std::cout << "test_bounded_concurrency_and_release_on_throw: PASSED\n";
}

void test_duplicate_pending_enqueue_ignored() {
  std::atomic<int> runs{0};
  JobScheduler sched(2, [&](const JobId &) { ++runs; });
  assert(sched.enqueue("same"));
  assert(!sched.enqueue("same"));
  sched.start();
  bool done = wait_until([&] { return sched.finished() == 1; });
  assert(done);
  sched.stop();
  assert(runs == 1);
  std::cout << "test_duplicate_pending_enqueue_ignored: PASSED\n";
}

void test_stop_with_pending_jobs() {
  std::atomic<bool> release{false};
  JobScheduler sched(1, [&](const JobId &) {
    wait_until([&] { return release.load(); });
  });
  sched.start();
  for (int i = 0; i < 5; ++i)
    sched.enqueue("pending-" + std::to_string(i));

  bool running = wait_until([&] { return sched.admission().active() == 1; });
  assert(running);
  release = true;
  sched.stop();
  assert(sched.admission().active() == 0);
  assert(!sched.enqueue("too-late"));
  std::cout << "test_stop_with_pending_jobs: PASSED\n";
}

void test_restart_after_stop() {
  std::atomic<bool> release{false};
  std::atomic<int> runs{0};
  JobScheduler sched(1, [&](const JobId &) {
    ++runs;
    wait_until([&] { return release.load(); });
  });
  sched.start();
  for (int i = 0; i < 3; ++i)
    sched.enqueue("first-run-" + std::to_string(i));

  /// One job running, the next one parked inside admission
  bool parked = wait_until([&] {
    return sched.admission().active() == 1 &&
           sched.admission().waiting() == 1;
  });
  assert(parked);

  /// Shutdown wakes the parked job before the running one may finish
  std::thread stopper([&] { sched.stop(); });
  bool woken = wait_until([&] { return sched.admission().waiting() == 0; });
  assert(woken);
  release = true;
  stopper.join();
  assert(sched.finished() == 1);
  assert(sched.queued() == 0);

  sched.start();
  assert(sched.enqueue("second-run"));
  bool done = wait_until([&] { return sched.finished() == 2; });
  assert(done);
  sched.stop();
  assert(runs == 2);
  std::cout << "test_restart_after_stop: PASSED\n";
}

} // anonymous namespace

int main() {
  test_job_queue_dedupes();
  test_fifo_with_single_slot();
  test_bounded_concurrency_and_release_on_throw();
  test_duplicate_pending_enqueue_ignored();
  test_stop_with_pending_jobs();
  test_restart_after_stop();
  std::cout << "All scheduler tests passed\n";
  return 0;
}
