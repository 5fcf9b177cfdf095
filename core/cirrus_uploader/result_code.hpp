// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_RESULT_CODE_HPP
#define CIRRUS_RESULT_CODE_HPP

#include <cstddef>
#include <string>

namespace cirrus {
namespace uploader {

/**
 * Outcome of a single-file upload operation
 */
enum class ResultCode {
  OK,
  CANCELLED,
  SKIPPED_EXISTING,  // Target exists and the collision policy is SKIP
  QUOTA_EXCEEDED,
  FORBIDDEN,
  ACCOUNT_NOT_FOUND,
  ACCOUNT_NOT_THE_SAME,
  UNAUTHORIZED,
  NO_NETWORK_CONNECTION,
  TIMEOUT,
  HOST_NOT_AVAILABLE,
  SERVICE_UNAVAILABLE,
  MAINTENANCE_MODE,
  SSL_ERROR,
  LOCAL_FILE_NOT_FOUND,
  LOCAL_STORAGE_FULL,
  SYNC_CONFLICT,
  INVALID_CHARACTER_IN_NAME,
  UNKNOWN_ERROR
};

/**
 * How the worker treats a result code within a batch
 */
enum class ResultClass {
  SUCCESS,
  BENIGN_SKIP,  // Continue, never counted as a failure
  RETRYABLE,    // Continue, batch ends in RETRY unless a fatal occurs
  FATAL         // Stop the batch, batch ends in FAILURE
};

/**
 * Terminal state of one worker invocation, consumed by the scheduler
 */
enum class WorkResult { SUCCESS, FAILURE, RETRY };

std::string resultCodeToString(ResultCode code);

/**
 * Parse a stored result code. Unknown names map to UNKNOWN_ERROR.
 */
ResultCode resultCodeFromString(const std::string& str);

std::string resultClassToString(ResultClass result_class);
std::string workResultToString(WorkResult result);

/**
 * The single mapping from result code to class.
 *
 * Any code without an explicit entry is RETRYABLE so that unknown failures
 * are rescheduled rather than dropped.
 */
ResultClass classifyResult(ResultCode code);

/**
 * Running aggregate of per-record classes for one batch.
 *
 * FATAL wins over RETRYABLE regardless of the order they were seen in.
 */
class BatchOutcome {
public:
  void add(ResultClass result_class);

  /**
   * True once a FATAL class was added; remaining records must not run.
   */
  bool shouldStop() const {
    return failed_ > 0;
  }

  WorkResult result() const;

  size_t succeeded() const {
    return succeeded_;
  }
  size_t skipped() const {
    return skipped_;
  }
  size_t retryable() const {
    return retryable_;
  }
  size_t failed() const {
    return failed_;
  }
  size_t processed() const {
    return succeeded_ + skipped_ + retryable_ + failed_;
  }

private:
  size_t succeeded_ = 0;
  size_t skipped_ = 0;
  size_t retryable_ = 0;
  size_t failed_ = 0;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_RESULT_CODE_HPP
