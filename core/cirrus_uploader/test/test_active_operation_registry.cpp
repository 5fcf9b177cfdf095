// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ActiveOperationRegistry
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "active_operation_registry.hpp"
#include "uploader_mocks.hpp"

using namespace cirrus::uploader;
using namespace cirrus::uploader::test;
using ::testing::NiceMock;

class ActiveOperationRegistryTest : public ::testing::Test {
protected:
  std::shared_ptr<NiceMock<MockUploadOperation>> makeOperation() {
    return std::make_shared<NiceMock<MockUploadOperation>>();
  }

  ActiveOperationRegistry registry_;
};

TEST_F(ActiveOperationRegistryTest, AddAndRemove) {
  auto operation = makeOperation();

  EXPECT_TRUE(registry_.add(7, operation));
  EXPECT_TRUE(registry_.contains(7));
  EXPECT_EQ(registry_.get(7), operation);
  EXPECT_EQ(registry_.size(), 1u);

  EXPECT_TRUE(registry_.remove(7));
  EXPECT_FALSE(registry_.contains(7));
  EXPECT_FALSE(registry_.remove(7));
  EXPECT_TRUE(registry_.empty());
}

TEST_F(ActiveOperationRegistryTest, OneOperationPerId) {
  auto first = makeOperation();
  auto second = makeOperation();

  EXPECT_TRUE(registry_.add(1, first));
  EXPECT_FALSE(registry_.add(1, second));
  EXPECT_EQ(registry_.get(1), first);
}

TEST_F(ActiveOperationRegistryTest, NullOperationRejected) {
  EXPECT_FALSE(registry_.add(1, nullptr));
  EXPECT_TRUE(registry_.empty());
  EXPECT_EQ(registry_.get(1), nullptr);
}

TEST_F(ActiveOperationRegistryTest, CancelSignalsOperationAndKeepsEntry) {
  auto operation = makeOperation();
  registry_.add(3, operation);

  EXPECT_CALL(*operation, cancel()).Times(1);
  EXPECT_TRUE(registry_.cancel(3));
  EXPECT_TRUE(registry_.contains(3));

  EXPECT_FALSE(registry_.cancel(4));
}

TEST_F(ActiveOperationRegistryTest, CancelMany) {
  auto a = makeOperation();
  auto b = makeOperation();
  auto c = makeOperation();
  registry_.add(1, a);
  registry_.add(2, b);
  registry_.add(3, c);

  EXPECT_CALL(*a, cancel()).Times(1);
  EXPECT_CALL(*b, cancel()).Times(0);
  EXPECT_CALL(*c, cancel()).Times(1);

  EXPECT_EQ(registry_.cancel(std::vector<int64_t>{1, 3, 99}), 2u);
}

TEST_F(ActiveOperationRegistryTest, CancelAll) {
  auto a = makeOperation();
  auto b = makeOperation();
  registry_.add(1, a);
  registry_.add(2, b);

  EXPECT_CALL(*a, cancel()).Times(1);
  EXPECT_CALL(*b, cancel()).Times(1);
  EXPECT_EQ(registry_.cancelAll(), 2u);

  auto ids = registry_.ids();
  EXPECT_EQ(ids, (std::vector<int64_t>{1, 2}));

  registry_.clear();
  EXPECT_TRUE(registry_.empty());
}

TEST_F(ActiveOperationRegistryTest, RegistrationRemovesOnScopeExit) {
  {
    ActiveOperationRegistry::Registration registration(registry_, 5, makeOperation());
    EXPECT_TRUE(registration.registered());
    EXPECT_TRUE(registry_.contains(5));
  }
  EXPECT_FALSE(registry_.contains(5));
}

TEST_F(ActiveOperationRegistryTest, FailedRegistrationLeavesOwnerEntry) {
  auto owner = makeOperation();
  registry_.add(5, owner);

  {
    ActiveOperationRegistry::Registration registration(registry_, 5, makeOperation());
    EXPECT_FALSE(registration.registered());
  }
  EXPECT_EQ(registry_.get(5), owner);
}

TEST_F(ActiveOperationRegistryTest, RegistrationRemovesOnException) {
  try {
    ActiveOperationRegistry::Registration registration(registry_, 9, makeOperation());
    throw std::runtime_error("transfer failed");
  } catch (const std::runtime_error&) {
  }
  EXPECT_FALSE(registry_.contains(9));
}

TEST_F(ActiveOperationRegistryTest, ConcurrentRegistrationOfSameId) {
  const int num_threads = 8;
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([this, &winners]() {
      if (registry_.add(42, std::make_shared<NiceMock<MockUploadOperation>>())) {
        winners.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(registry_.size(), 1u);
}
