/**
 * @file projection.hpp
 * @brief Externally observable shapes of a job record
 *
 * @details Pure functions from a Job snapshot to JSON. They never touch the
 *          store, so callers can project while a worker is writing the same
 *          job: the store hands out whole-record snapshots only.
 */

#ifndef CLIPFORGE_PROJECTION_HPP
#define CLIPFORGE_PROJECTION_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "job.hpp"

namespace clipforge {

/**
 * @brief Status view.
 * @return job_id, status, progress_percentage, progress_stage, logs,
 *         created_at, started_at, error (timestamps ISO-8601 UTC, unset
 *         fields null)
 */
nlohmann::json project_status(const Job &job);

/**
 * @brief Result view.
 * @note A job that has not completed reports its status with a null result;
 *       that is not an error.
 */
nlohmann::json project_result(const Job &job);

/**
 * @brief Index of the first log line a poller has not shown yet.
 * @param logs The "logs" array of a status view
 * @param last_shown Last line already shown; empty before the first poll
 * @note Lines are matched by content, since truncation shifts indexes. When
 *       last_shown has been truncated away every remaining real line is new;
 *       the truncation marker is never reported as new.
 */
std::size_t first_unseen_log(const nlohmann::json &logs,
                             const std::string &last_shown);

} // namespace clipforge

#endif // CLIPFORGE_PROJECTION_HPP
