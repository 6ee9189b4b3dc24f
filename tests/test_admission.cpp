/**
 * @file test_admission.cpp
 * @brief Admission controller and slot tests
 */

#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "clipforge/admission.hpp"
#include "test_support.hpp"

using namespace clipforge;
using namespace clipforge::testing;

namespace {

void test_slot_releases_exactly_once() {
  AdmissionController ac(2);
  {
    Slot s = ac.acquire("a");
    assert(s.valid());
    assert(ac.active() == 1);

    Slot moved = std::move(s);
    assert(!s.valid());
    assert(moved.valid());
    s.release(); // moved-from: nothing to give back
    assert(ac.active() == 1);

    moved.release();
    moved.release();
    assert(ac.active() == 0);
  }
  assert(ac.admitted_total() == 1);
  assert(ac.released_total() == 1);
  std::cout << "test_slot_releases_exactly_once: PASSED\n";
}

void test_same_id_never_admitted_twice() {
  AdmissionController ac(3);
  Slot first = ac.acquire("dup");
  assert(first.valid());
  assert(!ac.acquire("dup").valid());
  assert(!ac.try_acquire("dup").valid());
  assert(ac.active() == 1);
  std::cout << "test_same_id_never_admitted_twice: PASSED\n";
}

void test_try_acquire_respects_limit() {
  AdmissionController ac(1);
  Slot a = ac.try_acquire("a");
  assert(a.valid());
  assert(!ac.try_acquire("b").valid());
  a.release();
  assert(ac.try_acquire("b").valid());
  std::cout << "test_try_acquire_respects_limit: PASSED\n";
}

void test_fifo_order_among_waiters() {
  AdmissionController ac(1);
  Slot holder = ac.acquire("holder");

  std::mutex order_mutex;
  std::vector<JobId> order;
  std::vector<std::thread> waiters;

  const std::vector<JobId> ids = {"j1", "j2", "j3", "j4", "j5"};
  for (std::size_t i = 0; i < ids.size(); ++i) {
    waiters.emplace_back([&, id = ids[i]] {
      Slot s = ac.acquire(id);
      assert(s.valid());
      std::lock_guard<std::mutex> lock(order_mutex);
      order.push_back(id);
    });
    /// Each waiter takes its ticket before the next one starts
    bool queued = wait_until(
        [&] { return ac.waiting() == static_cast<int>(i + 1); });
    assert(queued);
  }

  holder.release();
  for (auto &t : waiters)
    t.join();

  assert(order == ids);
  assert(ac.peak_active() == 1);
  assert(ac.released_total() == ac.admitted_total());
  std::cout << "test_fifo_order_among_waiters: PASSED\n";
}

void test_burst_never_exceeds_limit() {
  constexpr int LIMIT = 5;
  AdmissionController ac(LIMIT);
  std::atomic<int> inside{0};
  std::atomic<int> worst{0};

  std::vector<std::thread> jobs;
  for (int i = 0; i < 40; ++i) {
    jobs.emplace_back([&, i] {
      Slot s = ac.acquire("burst-" + std::to_string(i));
      assert(s.valid());
      const int now = ++inside;
      int seen = worst.load();
      while (now > seen && !worst.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      --inside;
    });
  }
  for (auto &t : jobs)
    t.join();

  assert(worst.load() <= LIMIT);
  assert(ac.peak_active() <= LIMIT);
  assert(ac.admitted_total() == 40);
  assert(ac.released_total() == 40);
  assert(ac.active() == 0);
  std::cout << "test_burst_never_exceeds_limit: PASSED\n";
}

void test_release_on_exception_path() {
  AdmissionController ac(1);
  try {
    Slot s = ac.acquire("boom");
    throw std::runtime_error("stage failed");
  } catch (const std::runtime_error &) {
  }
  assert(ac.active() == 0);
  assert(ac.released_total() == 1);
  std::cout << "test_release_on_exception_path: PASSED\n";
}

void test_shutdown_wakes_waiters() {
  AdmissionController ac(1);
  Slot holder = ac.acquire("holder");
  std::atomic<bool> got_invalid{false};
  std::thread waiter([&] { got_invalid = !ac.acquire("late").valid(); });
  bool queued = wait_until([&] { return ac.waiting() == 1; });
  assert(queued);

  ac.shutdown();
  waiter.join();
  assert(got_invalid);
  assert(!ac.acquire("after").valid());
  std::cout << "test_shutdown_wakes_waiters: PASSED\n";
}

void test_reopen_after_shutdown() {
  AdmissionController ac(1);
  Slot holder = ac.acquire("holder");
  std::thread waiter([&] { ac.acquire("late"); });
  bool queued = wait_until([&] { return ac.waiting() == 1; });
  assert(queued);

  ac.shutdown();
  waiter.join();
  holder.release();

  ac.reopen();
  /// The ticket "late" abandoned must not hold up later callers
  Slot again = ac.acquire("again");
  assert(again.valid());
  assert(ac.active() == 1);
  std::cout << "test_reopen_after_shutdown: PASSED\n";
}

} // anonymous namespace

int main() {
  test_slot_releases_exactly_once();
  test_same_id_never_admitted_twice();
  test_try_acquire_respects_limit();
  test_fifo_order_among_waiters();
  test_burst_never_exceeds_limit();
  test_release_on_exception_path();
  test_shutdown_wakes_waiters();
  test_reopen_after_shutdown();
  std::cout << "All admission tests passed\n";
  return 0;
}
