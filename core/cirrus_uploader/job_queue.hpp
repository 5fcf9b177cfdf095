// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_JOB_QUEUE_HPP
#define CIRRUS_JOB_QUEUE_HPP

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace cirrus {
namespace uploader {

/**
 * One scheduled run of an upload batch
 */
struct JobRequest {
  uint64_t job_id = 0;
  std::string tag;           // files_upload<account>
  std::string account_name;
  nlohmann::json input;      // Job input bag
  int attempt = 0;           // Number of earlier runs that ended in RETRY
  std::chrono::steady_clock::time_point created_at;
  std::chrono::steady_clock::time_point next_run_at;

  JobRequest()
      : created_at(std::chrono::steady_clock::now()) {}
};

/**
 * Comparison functor for the delayed queue (min-heap by next_run_at)
 */
struct DelayedJobComparator {
  bool operator()(const JobRequest& a, const JobRequest& b) const {
    return a.next_run_at > b.next_run_at;
  }
};

/**
 * Thread-safe job queue with delayed re-runs
 *
 * - Any thread may enqueue
 * - Scheduler workers dequeue
 * - Jobs re-queued for retry become visible once next_run_at has passed
 */
class JobQueue {
public:
  /**
   * @param capacity Maximum number of ready jobs (0 = unlimited)
   */
  explicit JobQueue(size_t capacity = 0);
  ~JobQueue();

  // Non-copyable, non-movable
  JobQueue(const JobQueue&) = delete;
  JobQueue& operator=(const JobQueue&) = delete;
  JobQueue(JobQueue&&) = delete;
  JobQueue& operator=(JobQueue&&) = delete;

  /**
   * @return false if the queue is full or shut down
   */
  bool enqueue(JobRequest job);

  /**
   * Remove and return the next ready job, waiting at most timeout
   *
   * @return Job if one became ready in time, std::nullopt on timeout or shutdown
   */
  std::optional<JobRequest> dequeue_with_timeout(std::chrono::milliseconds timeout);

  /**
   * Re-queue a job to run at job.next_run_at
   *
   * @return false if the queue is shut down
   */
  bool requeue_for_retry(JobRequest job);

  /**
   * Drop every queued or delayed job with the given tag
   *
   * @return Ids of the removed jobs
   */
  std::vector<uint64_t> remove_tagged(const std::string& tag);

  /**
   * Number of jobs ready to run
   */
  size_t size() const;

  /**
   * Number of jobs waiting for their retry time
   */
  size_t retry_size() const;

  bool empty() const;

  /**
   * Signal shutdown - dequeue_with_timeout() returns std::nullopt
   */
  void shutdown();

  bool is_shutdown() const;

  /**
   * Reopen a shut down queue, dropping every job still queued or delayed
   *
   * No-op while the queue is open.
   */
  void reset();

private:
  // Move due delayed jobs to the ready queue. Caller holds mutex_.
  void process_retry_queue();

  mutable std::mutex mutex_;
  std::condition_variable cv_;

  std::deque<JobRequest> ready_queue_;
  std::priority_queue<JobRequest, std::vector<JobRequest>, DelayedJobComparator> retry_queue_;

  size_t capacity_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_JOB_QUEUE_HPP
