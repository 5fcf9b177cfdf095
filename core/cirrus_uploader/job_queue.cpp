// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "job_queue.hpp"

#include <algorithm>
#include <utility>

namespace cirrus {
namespace uploader {

JobQueue::JobQueue(size_t capacity)
    : capacity_(capacity) {}

JobQueue::~JobQueue() {
  shutdown();
}

bool JobQueue::enqueue(JobRequest job) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (shutdown_) {
    return false;
  }
  if (capacity_ > 0 && ready_queue_.size() >= capacity_) {
    return false;
  }

  ready_queue_.push_back(std::move(job));
  cv_.notify_one();
  return true;
}

std::optional<JobRequest> JobQueue::dequeue_with_timeout(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    if (shutdown_) {
      return std::nullopt;
    }

    process_retry_queue();

    if (!ready_queue_.empty()) {
      JobRequest job = std::move(ready_queue_.front());
      ready_queue_.pop_front();
      return job;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }

    // Wake for the earlier of the deadline and the next delayed job
    auto wait_until = deadline;
    if (!retry_queue_.empty()) {
      auto next_run = retry_queue_.top().next_run_at;
      if (next_run < wait_until) {
        wait_until = next_run;
      }
    }

    cv_.wait_until(lock, wait_until);
  }
}

bool JobQueue::requeue_for_retry(JobRequest job) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (shutdown_) {
    return false;
  }

  if (job.next_run_at <= std::chrono::steady_clock::now()) {
    ready_queue_.push_back(std::move(job));
  } else {
    retry_queue_.push(std::move(job));
  }
  cv_.notify_one();
  return true;
}

std::vector<uint64_t> JobQueue::remove_tagged(const std::string& tag) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint64_t> removed;

  auto it = std::remove_if(ready_queue_.begin(), ready_queue_.end(), [&](const JobRequest& job) {
    if (job.tag == tag) {
      removed.push_back(job.job_id);
      return true;
    }
    return false;
  });
  ready_queue_.erase(it, ready_queue_.end());

  // priority_queue has no erase; rebuild without the tagged jobs
  std::vector<JobRequest> kept;
  while (!retry_queue_.empty()) {
    JobRequest job = retry_queue_.top();
    retry_queue_.pop();
    if (job.tag == tag) {
      removed.push_back(job.job_id);
    } else {
      kept.push_back(std::move(job));
    }
  }
  for (auto& job : kept) {
    retry_queue_.push(std::move(job));
  }

  return removed;
}

size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ready_queue_.size();
}

size_t JobQueue::retry_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return retry_queue_.size();
}

bool JobQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ready_queue_.empty() && retry_queue_.empty();
}

void JobQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool JobQueue::is_shutdown() const {
  return shutdown_.load();
}

void JobQueue::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!shutdown_) {
    return;
  }
  ready_queue_.clear();
  retry_queue_ = decltype(retry_queue_)();
  shutdown_ = false;
}

void JobQueue::process_retry_queue() {
  auto now = std::chrono::steady_clock::now();

  while (!retry_queue_.empty()) {
    if (retry_queue_.top().next_run_at > now) {
      break;
    }

    JobRequest job = retry_queue_.top();
    retry_queue_.pop();
    ready_queue_.push_back(std::move(job));
  }
}

}  // namespace uploader
}  // namespace cirrus
