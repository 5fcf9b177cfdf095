// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOAD_SCHEDULER_HPP
#define CIRRUS_UPLOAD_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "active_operation_registry.hpp"
#include "file_upload_job.hpp"
#include "job_queue.hpp"
#include "retry_handler.hpp"
#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Configuration for the upload scheduler
 */
struct SchedulerConfig {
  int num_workers = 2;
  size_t batch_size = 100;  // Upload ids per worker invocation
  RetryConfig retry;
  std::chrono::milliseconds poll_interval{200};
};

enum class JobState { ENQUEUED, RUNNING, SUCCEEDED, FAILED, CANCELLED };

std::string jobStateToString(JobState state);

/**
 * Observable state of one scheduled batch
 */
struct WorkInfo {
  uint64_t job_id = 0;
  std::string tag;
  std::string account_name;
  std::vector<int64_t> upload_ids;
  int batch_index = 0;
  int total_batches = 1;
  JobState state = JobState::ENQUEUED;
  int attempt = 0;
  std::optional<WorkResult> last_result;
  std::chrono::steady_clock::time_point next_run_at;
};

/**
 * Upload scheduler - runs upload batches on background threads
 *
 * Features:
 * - Splits an account's uploads into batches of batch_size, one job each
 * - Worker threads for concurrent batches
 * - Batches ending in RETRY are re-queued with exponential backoff for the
 *   uploads that are still pending
 * - Crash recovery: pending uploads left by a previous run are scheduled
 *   again on start()
 * - Per-account cancellation
 *
 * Usage:
 *   UploadScheduler scheduler(config, store, registry, job);
 *   scheduler.start();
 *   scheduler.scheduleUploads("alice", ids);
 *   ...
 *   scheduler.stop();
 */
class UploadScheduler : public IUploadJobScheduler {
public:
  UploadScheduler(
    const SchedulerConfig& config, IUploadStore& store, ActiveOperationRegistry& registry,
    IJobRunner& runner
  );
  ~UploadScheduler() override;

  // Non-copyable, non-movable
  UploadScheduler(const UploadScheduler&) = delete;
  UploadScheduler& operator=(const UploadScheduler&) = delete;
  UploadScheduler(UploadScheduler&&) = delete;
  UploadScheduler& operator=(UploadScheduler&&) = delete;

  /**
   * Start the scheduler
   *
   * Re-schedules every PENDING or IN_PROGRESS upload in the store, then
   * starts the worker threads.
   */
  void start();

  /**
   * Stop worker threads
   *
   * Waits for running batches to finish. Queued jobs are dropped; their
   * uploads stay PENDING in the store for the next start().
   */
  void stop();

  bool isRunning() const;

  /**
   * Schedule uploads of one account
   *
   * @return Ids of the created jobs, empty if upload_ids is empty
   */
  std::vector<uint64_t> scheduleUploads(
    const std::string& account_name, const std::vector<int64_t>& upload_ids
  ) override;

  /**
   * Cancel one upload, whether running or still queued
   *
   * @return false if the upload is unknown
   */
  bool cancelUpload(int64_t upload_id);

  /**
   * Cancel every queued and running job of an account
   *
   * @return Number of jobs cancelled
   */
  size_t cancelAllForAccount(const std::string& account_name);

  std::vector<WorkInfo> getWorkInfosByTag(const std::string& tag) const;

  std::optional<WorkInfo> getWorkInfo(uint64_t job_id) const;

  size_t countByState(JobState state) const;

  /**
   * Wait until no job is running and none is due
   *
   * Jobs waiting for a retry delay do not count as pending work.
   *
   * @return false on timeout
   */
  bool waitForIdle(std::chrono::milliseconds timeout);

  /**
   * Tag shared by all jobs of an account
   */
  static std::string uploadTag(const std::string& account_name);

  const SchedulerConfig& config() const;

private:
  void workerLoop(int worker_id);

  void runJob(JobRequest job);

  // Requeue with backoff for uploads still pending; false if nothing is left
  bool scheduleRetry(JobRequest job, const std::vector<int64_t>& upload_ids);

  std::vector<int64_t> pendingIds(
    const std::string& account_name, const std::vector<int64_t>& upload_ids
  ) const;

  bool isIdleLocked() const;

  SchedulerConfig config_;
  IUploadStore& store_;
  ActiveOperationRegistry& registry_;
  IJobRunner& runner_;

  std::unique_ptr<JobQueue> queue_;
  std::unique_ptr<RetryHandler> retry_handler_;

  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};

  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  std::map<uint64_t, WorkInfo> work_infos_;
  uint64_t next_job_id_ = 1;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOAD_SCHEDULER_HPP
