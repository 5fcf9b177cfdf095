// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "batch_input.hpp"

#define CIRRUS_LOG_COMPONENT "upload_scheduler"
#include <cirrus_log_macros.hpp>

using cirrus::logging::kv;

namespace cirrus {
namespace uploader {

std::string jobStateToString(JobState state) {
  switch (state) {
    case JobState::ENQUEUED:
      return "enqueued";
    case JobState::RUNNING:
      return "running";
    case JobState::SUCCEEDED:
      return "succeeded";
    case JobState::FAILED:
      return "failed";
    case JobState::CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

UploadScheduler::UploadScheduler(
  const SchedulerConfig& config, IUploadStore& store, ActiveOperationRegistry& registry,
  IJobRunner& runner
)
    : config_(config)
    , store_(store)
    , registry_(registry)
    , runner_(runner)
    , queue_(std::make_unique<JobQueue>())
    , retry_handler_(std::make_unique<RetryHandler>(config.retry)) {}

UploadScheduler::~UploadScheduler() {
  stop();
}

void UploadScheduler::start() {
  if (running_.exchange(true)) {
    return;  // Already running
  }

  // Jobs dropped by an earlier stop() are rebuilt from the store below
  queue_->reset();

  // Crash recovery: uploads interrupted by the previous run go back to PENDING
  std::map<std::string, std::vector<int64_t>> by_account;
  size_t recovered = 0;
  for (const auto& record : store_.getPendingUploads()) {
    if (record.status == UploadStatus::IN_PROGRESS &&
        !store_.updateUploadStatus(record.id, UploadStatus::PENDING, record.last_result)) {
      CIRRUS_LOG_WARN("Failed to reset interrupted upload" << kv("upload_id", record.id));
    }
    by_account[record.account_name].push_back(record.id);
    ++recovered;
  }
  for (const auto& entry : by_account) {
    scheduleUploads(entry.first, entry.second);
  }
  if (recovered > 0) {
    CIRRUS_LOG_INFO(
      "Recovered pending uploads" << kv("uploads", recovered) << kv("accounts", by_account.size())
    );
  }

  int num_workers = std::max(config_.num_workers, 1);
  workers_.reserve(num_workers);
  for (int i = 0; i < num_workers; ++i) {
    workers_.emplace_back(&UploadScheduler::workerLoop, this, i);
  }
}

void UploadScheduler::stop() {
  if (!running_.exchange(false)) {
    return;  // Already stopped
  }

  queue_->shutdown();

  // Running batches finish their current record loop before the threads exit
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (auto& entry : work_infos_) {
      if (entry.second.state == JobState::ENQUEUED) {
        entry.second.state = JobState::CANCELLED;
      }
    }
  }
  state_cv_.notify_all();
}

bool UploadScheduler::isRunning() const {
  return running_.load();
}

std::vector<uint64_t> UploadScheduler::scheduleUploads(
  const std::string& account_name, const std::vector<int64_t>& upload_ids
) {
  std::vector<uint64_t> job_ids;
  if (upload_ids.empty()) {
    return job_ids;
  }

  size_t batch_size = std::max<size_t>(config_.batch_size, 1);
  int total_batches = static_cast<int>((upload_ids.size() + batch_size - 1) / batch_size);
  std::string tag = uploadTag(account_name);

  for (int index = 0; index < total_batches; ++index) {
    size_t begin = static_cast<size_t>(index) * batch_size;
    size_t end = std::min(upload_ids.size(), begin + batch_size);
    auto first = upload_ids.begin() + static_cast<std::ptrdiff_t>(begin);
    auto last = upload_ids.begin() + static_cast<std::ptrdiff_t>(end);

    BatchInput batch;
    batch.account_name = account_name;
    batch.upload_ids.assign(first, last);
    batch.current_batch_index = index;
    batch.total_batches = total_batches;

    JobRequest job;
    job.tag = tag;
    job.account_name = account_name;
    job.input = makeBatchInput(batch);
    job.next_run_at = std::chrono::steady_clock::now();

    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      job.job_id = next_job_id_++;

      WorkInfo info;
      info.job_id = job.job_id;
      info.tag = tag;
      info.account_name = account_name;
      info.upload_ids = batch.upload_ids;
      info.batch_index = index;
      info.total_batches = total_batches;
      info.next_run_at = job.next_run_at;
      work_infos_[job.job_id] = info;
    }

    uint64_t job_id = job.job_id;
    if (!queue_->enqueue(std::move(job))) {
      CIRRUS_LOG_WARN(
        "Scheduler is stopped, batch left for recovery" << kv("job_id", job_id)
                                                        << kv("account", account_name)
      );
      std::lock_guard<std::mutex> lock(state_mutex_);
      work_infos_[job_id].state = JobState::CANCELLED;
      continue;
    }
    job_ids.push_back(job_id);
  }

  CIRRUS_LOG_INFO(
    "Scheduled uploads" << kv("account", account_name) << kv("uploads", upload_ids.size())
                        << kv("batches", job_ids.size())
  );
  state_cv_.notify_all();
  return job_ids;
}

bool UploadScheduler::cancelUpload(int64_t upload_id) {
  if (registry_.cancel(upload_id)) {
    CIRRUS_LOG_INFO("Cancelled running upload" << kv("upload_id", upload_id));
    return true;
  }

  auto record = store_.getUpload(upload_id);
  if (!record) {
    return false;
  }
  if (record->status != UploadStatus::DONE) {
    if (!store_.updateUploadStatus(upload_id, UploadStatus::FAILED, ResultCode::CANCELLED)) {
      CIRRUS_LOG_WARN("Failed to mark queued upload cancelled" << kv("upload_id", upload_id));
      return false;
    }
    CIRRUS_LOG_INFO("Cancelled queued upload" << kv("upload_id", upload_id));
  }
  return true;
}

size_t UploadScheduler::cancelAllForAccount(const std::string& account_name) {
  std::vector<uint64_t> dropped = queue_->remove_tagged(uploadTag(account_name));

  std::vector<int64_t> running_ids;
  size_t cancelled = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (auto& entry : work_infos_) {
      WorkInfo& info = entry.second;
      if (info.account_name != account_name) {
        continue;
      }
      if (info.state == JobState::RUNNING) {
        running_ids.insert(running_ids.end(), info.upload_ids.begin(), info.upload_ids.end());
      } else if (info.state != JobState::ENQUEUED) {
        continue;
      }
      info.state = JobState::CANCELLED;
      ++cancelled;
    }
  }

  size_t signalled = registry_.cancel(running_ids);
  state_cv_.notify_all();

  CIRRUS_LOG_INFO(
    "Cancelled uploads of account" << kv("account", account_name) << kv("jobs", cancelled)
                                   << kv("dequeued", dropped.size())
                                   << kv("operations", signalled)
  );
  return cancelled;
}

std::vector<WorkInfo> UploadScheduler::getWorkInfosByTag(const std::string& tag) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  std::vector<WorkInfo> infos;
  for (const auto& entry : work_infos_) {
    if (entry.second.tag == tag) {
      infos.push_back(entry.second);
    }
  }
  return infos;
}

std::optional<WorkInfo> UploadScheduler::getWorkInfo(uint64_t job_id) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = work_infos_.find(job_id);
  if (it == work_infos_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t UploadScheduler::countByState(JobState state) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return static_cast<size_t>(
    std::count_if(work_infos_.begin(), work_infos_.end(), [state](const auto& entry) {
      return entry.second.state == state;
    })
  );
}

bool UploadScheduler::waitForIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (!isIdleLocked()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    // Delayed jobs become due without a notification
    state_cv_.wait_until(lock, std::min(deadline, now + config_.poll_interval));
  }
  return true;
}

std::string UploadScheduler::uploadTag(const std::string& account_name) {
  return "files_upload" + account_name;
}

const SchedulerConfig& UploadScheduler::config() const {
  return config_;
}

void UploadScheduler::workerLoop(int worker_id) {
  CIRRUS_LOG_DEBUG("Scheduler worker started" << kv("worker", worker_id));

  while (running_) {
    auto job = queue_->dequeue_with_timeout(config_.poll_interval);
    if (!job) {
      continue;  // Timeout or shutdown
    }
    runJob(std::move(*job));
  }

  CIRRUS_LOG_DEBUG("Scheduler worker stopped" << kv("worker", worker_id));
}

void UploadScheduler::runJob(JobRequest job) {
  std::vector<int64_t> upload_ids;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = work_infos_.find(job.job_id);
    if (it == work_infos_.end() || it->second.state != JobState::ENQUEUED) {
      return;  // Cancelled while queued
    }
    it->second.state = JobState::RUNNING;
    upload_ids = it->second.upload_ids;
  }
  state_cv_.notify_all();

  WorkResult result;
  try {
    result = runner_.run(job.input);
  } catch (const std::exception& e) {
    CIRRUS_LOG_ERROR("Upload job threw" << kv("job_id", job.job_id) << kv("error", e.what()));
    result = WorkResult::FAILURE;
  }

  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    WorkInfo& info = work_infos_[job.job_id];
    info.last_result = result;
    cancelled = info.state == JobState::CANCELLED;
  }

  JobState final_state = JobState::SUCCEEDED;
  if (cancelled) {
    final_state = JobState::CANCELLED;
  } else if (result == WorkResult::FAILURE) {
    final_state = JobState::FAILED;
  } else if (result == WorkResult::RETRY) {
    if (!running_) {
      // Left PENDING in the store; crash recovery picks it up
      final_state = JobState::CANCELLED;
    } else if (!retry_handler_->shouldRetry(job.attempt)) {
      CIRRUS_LOG_WARN(
        "Upload batch exhausted retries" << kv("job_id", job.job_id) << kv("attempts", job.attempt)
      );
      final_state = JobState::FAILED;
    } else if (scheduleRetry(job, upload_ids)) {
      return;
    }
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    work_infos_[job.job_id].state = final_state;
  }
  state_cv_.notify_all();

  CIRRUS_LOG_DEBUG(
    "Upload job finished" << kv("job_id", job.job_id) << kv("state", jobStateToString(final_state))
  );
}

bool UploadScheduler::scheduleRetry(JobRequest job, const std::vector<int64_t>& upload_ids) {
  std::vector<int64_t> remaining = pendingIds(job.account_name, upload_ids);
  if (remaining.empty()) {
    return false;
  }

  std::string error;
  auto batch = parseBatchInput(job.input, error);
  if (!batch) {
    CIRRUS_LOG_ERROR("Cannot re-queue upload job" << kv("job_id", job.job_id) << kv("error", error));
    return false;
  }
  batch->upload_ids = remaining;

  job.input = makeBatchInput(*batch);
  job.next_run_at = retry_handler_->nextRetryTime(job.attempt);
  job.attempt++;

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    WorkInfo& info = work_infos_[job.job_id];
    if (info.state == JobState::CANCELLED) {
      return false;
    }
    info.state = JobState::ENQUEUED;
    info.attempt = job.attempt;
    info.upload_ids = remaining;
    info.next_run_at = job.next_run_at;
  }

  auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
    job.next_run_at - std::chrono::steady_clock::now()
  );
  uint64_t job_id = job.job_id;

  if (!queue_->requeue_for_retry(std::move(job))) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    work_infos_[job_id].state = JobState::CANCELLED;
    return true;
  }

  state_cv_.notify_all();
  CIRRUS_LOG_INFO(
    "Upload batch will be retried" << kv("job_id", job_id) << kv("uploads", remaining.size())
                                   << kv("delay_ms", delay.count())
  );
  return true;
}

std::vector<int64_t> UploadScheduler::pendingIds(
  const std::string& account_name, const std::vector<int64_t>& upload_ids
) const {
  std::vector<int64_t> remaining;
  for (const auto& record : store_.getUploadsByIds(upload_ids, account_name)) {
    if (record.status == UploadStatus::PENDING || record.status == UploadStatus::IN_PROGRESS) {
      remaining.push_back(record.id);
    }
  }
  return remaining;
}

bool UploadScheduler::isIdleLocked() const {
  auto now = std::chrono::steady_clock::now();
  for (const auto& entry : work_infos_) {
    const WorkInfo& info = entry.second;
    if (info.state == JobState::RUNNING) {
      return false;
    }
    if (info.state == JobState::ENQUEUED && info.next_run_at <= now) {
      return false;
    }
  }
  return true;
}

}  // namespace uploader
}  // namespace cirrus
