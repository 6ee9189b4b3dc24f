/**
 * @file retry.hpp
 * @brief Stage outcomes and bounded exponential-backoff retries
 */

#ifndef CLIPFORGE_RETRY_HPP
#define CLIPFORGE_RETRY_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>

namespace clipforge {

/**
 * @brief How a collaborator call or pipeline step ended.
 * @note Transient failures are worth retrying (timeouts, non-zero exit);
 *       Fatal ones are not (malformed output, unreadable media).
 */
enum class OutcomeKind : std::uint8_t { Ok, Transient, Fatal };

struct StageOutcome {
  OutcomeKind kind = OutcomeKind::Ok;
  std::string message;

  bool ok() const { return kind == OutcomeKind::Ok; }

  static StageOutcome success() { return {}; }
  static StageOutcome transient(std::string msg) {
    return {OutcomeKind::Transient, std::move(msg)};
  }
  static StageOutcome fatal(std::string msg) {
    return {OutcomeKind::Fatal, std::move(msg)};
  }
};

/**
 * @struct RetryPolicy
 * @brief Attempt count and backoff schedule.
 */
struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  double multiplier = 2.0;
  std::chrono::milliseconds max_delay{30000};

  /// Delay after the given failed attempt (1-based)
  std::chrono::milliseconds delay_after(int attempt) const {
    double ms = static_cast<double>(base_delay.count());
    for (int i = 1; i < attempt; ++i)
      ms *= multiplier;
    ms = std::min(ms, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(ms));
  }
};

/**
 * @brief Call fn until it succeeds, fails fatally or attempts run out.
 * @param fn StageOutcome() callable
 * @param on_retry void(int attempt, const StageOutcome &) called before
 *        each backoff sleep
 * @return The last outcome
 */
template <typename Fn, typename OnRetry>
StageOutcome retry_with_backoff(const RetryPolicy &policy, Fn &&fn,
                                OnRetry &&on_retry) {
  const int attempts = std::max(1, policy.max_attempts);
  StageOutcome outcome;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    outcome = fn();
    if (outcome.kind != OutcomeKind::Transient)
      return outcome;
    if (attempt == attempts)
      break;
    on_retry(attempt, outcome);
    auto delay = policy.delay_after(attempt);
    if (delay.count() > 0)
      std::this_thread::sleep_for(delay);
  }
  return outcome;
}

} // namespace clipforge

#endif // CLIPFORGE_RETRY_HPP
