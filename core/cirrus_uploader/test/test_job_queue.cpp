// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for JobQueue
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "job_queue.hpp"

using namespace cirrus::uploader;

class JobQueueTest : public ::testing::Test {
protected:
  void SetUp() override {
    queue_ = std::make_unique<JobQueue>();
  }

  void TearDown() override {
    if (queue_) {
      queue_->shutdown();
    }
  }

  JobRequest makeJob(uint64_t id, const std::string& account = "alice") {
    JobRequest job;
    job.job_id = id;
    job.account_name = account;
    job.tag = "files_upload" + account;
    job.input = {{"ACCOUNT", account}, {"UPLOAD_IDS", {static_cast<int64_t>(id)}}};
    return job;
  }

  std::unique_ptr<JobQueue> queue_;
};

TEST_F(JobQueueTest, EnqueueDequeue) {
  ASSERT_TRUE(queue_->enqueue(makeJob(1)));
  EXPECT_EQ(queue_->size(), 1u);
  EXPECT_FALSE(queue_->empty());

  auto job = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->job_id, 1u);
  EXPECT_EQ(job->tag, "files_uploadalice");
  EXPECT_EQ(job->input["ACCOUNT"], "alice");

  EXPECT_TRUE(queue_->empty());
}

TEST_F(JobQueueTest, FifoOrder) {
  for (uint64_t i = 0; i < 10; ++i) {
    ASSERT_TRUE(queue_->enqueue(makeJob(i)));
  }
  for (uint64_t i = 0; i < 10; ++i) {
    auto job = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->job_id, i);
  }
}

TEST_F(JobQueueTest, DequeueTimeout) {
  auto start = std::chrono::steady_clock::now();
  auto job = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(job.has_value());
  EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 90);
}

TEST_F(JobQueueTest, Capacity) {
  JobQueue bounded(2);
  EXPECT_TRUE(bounded.enqueue(makeJob(1)));
  EXPECT_TRUE(bounded.enqueue(makeJob(2)));
  EXPECT_FALSE(bounded.enqueue(makeJob(3)));
  EXPECT_EQ(bounded.size(), 2u);
}

TEST_F(JobQueueTest, DelayedRetry) {
  JobRequest job = makeJob(1);
  job.attempt = 1;
  job.next_run_at = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);

  ASSERT_TRUE(queue_->requeue_for_retry(job));
  EXPECT_EQ(queue_->retry_size(), 1u);
  EXPECT_EQ(queue_->size(), 0u);

  EXPECT_FALSE(queue_->dequeue_with_timeout(std::chrono::milliseconds(10)).has_value());

  auto result = queue_->dequeue_with_timeout(std::chrono::milliseconds(500));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->job_id, 1u);
  EXPECT_EQ(result->attempt, 1);
}

TEST_F(JobQueueTest, ImmediateRetryGoesToReadyQueue) {
  JobRequest job = makeJob(1);
  job.next_run_at = std::chrono::steady_clock::now();

  ASSERT_TRUE(queue_->requeue_for_retry(job));
  EXPECT_EQ(queue_->size(), 1u);
  EXPECT_TRUE(queue_->dequeue_with_timeout(std::chrono::milliseconds(10)).has_value());
}

TEST_F(JobQueueTest, DelayedJobsOrderedByRunTime) {
  auto now = std::chrono::steady_clock::now();
  JobRequest late = makeJob(1);
  late.next_run_at = now + std::chrono::milliseconds(80);
  JobRequest early = makeJob(2);
  early.next_run_at = now + std::chrono::milliseconds(20);

  queue_->requeue_for_retry(late);
  queue_->requeue_for_retry(early);

  auto first = queue_->dequeue_with_timeout(std::chrono::milliseconds(500));
  auto second = queue_->dequeue_with_timeout(std::chrono::milliseconds(500));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->job_id, 2u);
  EXPECT_EQ(second->job_id, 1u);
}

TEST_F(JobQueueTest, RemoveTagged) {
  queue_->enqueue(makeJob(1, "alice"));
  queue_->enqueue(makeJob(2, "bob"));
  JobRequest delayed = makeJob(3, "alice");
  delayed.next_run_at = std::chrono::steady_clock::now() + std::chrono::hours(1);
  queue_->requeue_for_retry(delayed);

  auto removed = queue_->remove_tagged("files_uploadalice");
  std::sort(removed.begin(), removed.end());
  EXPECT_EQ(removed, (std::vector<uint64_t>{1, 3}));

  EXPECT_EQ(queue_->size(), 1u);
  EXPECT_EQ(queue_->retry_size(), 0u);
  EXPECT_TRUE(queue_->remove_tagged("files_uploadcarol").empty());
}

TEST_F(JobQueueTest, ShutdownRejectsAndWakes) {
  std::atomic<bool> returned{false};
  std::thread consumer([this, &returned]() {
    auto job = queue_->dequeue_with_timeout(std::chrono::seconds(10));
    EXPECT_FALSE(job.has_value());
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue_->shutdown();
  consumer.join();

  EXPECT_TRUE(returned.load());
  EXPECT_TRUE(queue_->is_shutdown());
  EXPECT_FALSE(queue_->enqueue(makeJob(1)));
  EXPECT_FALSE(queue_->requeue_for_retry(makeJob(2)));
}

TEST_F(JobQueueTest, ResetReopensAfterShutdown) {
  ASSERT_TRUE(queue_->enqueue(makeJob(1)));
  auto delayed = makeJob(2);
  delayed.next_run_at = std::chrono::steady_clock::now() + std::chrono::hours(1);
  ASSERT_TRUE(queue_->requeue_for_retry(delayed));

  // Open queue: nothing is dropped
  queue_->reset();
  EXPECT_EQ(queue_->size(), 1u);
  EXPECT_EQ(queue_->retry_size(), 1u);

  queue_->shutdown();
  queue_->reset();
  EXPECT_FALSE(queue_->is_shutdown());
  EXPECT_TRUE(queue_->empty());

  ASSERT_TRUE(queue_->enqueue(makeJob(3)));
  auto job = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->job_id, 3u);
}

TEST_F(JobQueueTest, ResetWhileProducing) {
  queue_->shutdown();

  std::atomic<bool> done{false};
  std::thread producer([this, &done]() {
    uint64_t id = 0;
    while (!done) {
      queue_->enqueue(makeJob(++id));
    }
  });

  queue_->reset();
  auto job = queue_->dequeue_with_timeout(std::chrono::seconds(5));
  done = true;
  producer.join();

  EXPECT_TRUE(job.has_value());
}

TEST_F(JobQueueTest, ConcurrentProducersConsumers) {
  const int num_producers = 4;
  const int per_producer = 50;
  std::atomic<int> consumed{0};

  std::vector<std::thread> producers;
  for (int p = 0; p < num_producers; ++p) {
    producers.emplace_back([this, p]() {
      for (int i = 0; i < per_producer; ++i) {
        queue_->enqueue(makeJob(static_cast<uint64_t>(p * per_producer + i)));
      }
    });
  }

  std::vector<std::thread> consumers;
  for (int c = 0; c < 2; ++c) {
    consumers.emplace_back([this, &consumed]() {
      while (consumed.load() < num_producers * per_producer) {
        if (queue_->dequeue_with_timeout(std::chrono::milliseconds(20))) {
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) {
    t.join();
  }
  for (auto& t : consumers) {
    t.join();
  }

  EXPECT_EQ(consumed.load(), num_producers * per_producer);
  EXPECT_TRUE(queue_->empty());
}
