// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for FileUploadWorker using GoogleMock
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "file_upload_worker.hpp"
#include "test_helpers.hpp"
#include "upload_scheduler.hpp"
#include "upload_store.hpp"
#include "uploader_mocks.hpp"

using namespace cirrus::uploader;
using namespace cirrus::uploader::test;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::DoAll;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class FileUploadWorkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ON_CALL(accounts_, resolve(_)).WillByDefault(Invoke([this](const std::string& name) {
      if (name == user_.account_name) {
        return AccountLookup(AccountFound{user_});
      }
      return AccountLookup(AccountNotFound{name});
    }));
    ON_CALL(preferences_, isGlobalUploadPaused()).WillByDefault(Return(false));
    ON_CALL(connectivity_, isConnected()).WillByDefault(Return(true));
    ON_CALL(connectivity_, isInternetWalled()).WillByDefault(Return(false));
    ON_CALL(client_factory_, create(_)).WillByDefault(Return(client_));
    ON_CALL(store_, updateUploadStatus(_, _, _)).WillByDefault(Return(true));
    ON_CALL(store_, getUpload(_)).WillByDefault(Invoke([this](int64_t id) {
      return std::optional<UploadRecord>(makeRecord(id));
    }));

    worker_ = std::make_unique<FileUploadWorker>(
      WorkerCollaborators{
        accounts_, store_, preferences_, connectivity_, power_, factory_, client_factory_,
        notifier_, broadcaster_
      },
      registry_
    );
  }

  UploadRecord makeRecord(int64_t id) {
    UploadRecord record;
    record.id = id;
    record.account_name = user_.account_name;
    record.local_path = "/tmp/local/file_" + std::to_string(id) + ".jpg";
    record.remote_path = "/Photos/file_" + std::to_string(id) + ".jpg";
    record.file_size_bytes = 1024;
    return record;
  }

  std::vector<UploadRecord> makeRecords(int count) {
    std::vector<UploadRecord> records;
    for (int i = 1; i <= count; ++i) {
      records.push_back(makeRecord(i));
    }
    return records;
  }

  BatchInput makeInput(const std::vector<int64_t>& ids) {
    BatchInput input;
    input.account_name = user_.account_name;
    input.upload_ids = ids;
    return input;
  }

  std::vector<int64_t> idsOf(const std::vector<UploadRecord>& records) {
    std::vector<int64_t> ids;
    for (const auto& record : records) {
      ids.push_back(record.id);
    }
    return ids;
  }

  // Operation that records the registry size seen while it runs
  std::shared_ptr<NiceMock<MockUploadOperation>> makeOperation(ResultCode code, int64_t id) {
    auto operation = std::make_shared<NiceMock<MockUploadOperation>>();
    ON_CALL(*operation, execute(_)).WillByDefault(Invoke([this, code, id](RemoteClient&) {
      EXPECT_TRUE(registry_.contains(id));
      EXPECT_EQ(registry_.size(), 1u);
      return code;
    }));
    return operation;
  }

  User user_{"account", "Account Owner"};
  std::shared_ptr<RemoteClient> client_ =
    std::make_shared<RemoteClient>(RemoteClient{"account", "/mnt/remote/account"});

  NiceMock<MockAccountManager> accounts_;
  NiceMock<MockUploadStore> store_;
  NiceMock<MockPreferences> preferences_;
  NiceMock<MockConnectivityService> connectivity_;
  NiceMock<MockPowerManagementService> power_;
  NiceMock<MockUploadOperationFactory> factory_;
  NiceMock<MockClientFactory> client_factory_;
  NiceMock<MockUploadNotifier> notifier_;
  NiceMock<MockBroadcastEmitter> broadcaster_;
  ActiveOperationRegistry registry_;

  std::unique_ptr<FileUploadWorker> worker_;
};

// =============================================================================
// Input validation and account resolution
// =============================================================================

TEST_F(FileUploadWorkerTest, BlankAccountFailsWithoutSideEffects) {
  EXPECT_CALL(accounts_, resolve(_)).Times(0);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).Times(0);
  EXPECT_CALL(store_, updateUploadStatus(_, _, _)).Times(0);
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);
  EXPECT_CALL(notifier_, reportBatchSummary(_)).Times(0);
  EXPECT_CALL(broadcaster_, emit(_, _)).Times(0);

  for (const std::string account : {"", " ", "\t\n"}) {
    BatchInput input = makeInput({1, 2});
    input.account_name = account;
    EXPECT_EQ(worker_->execute(input), WorkResult::FAILURE) << "account='" << account << "'";
  }
}

TEST_F(FileUploadWorkerTest, BatchIndexOutOfRangeFails) {
  EXPECT_CALL(store_, getUploadsByIds(_, _)).Times(0);

  BatchInput input = makeInput({1});
  input.current_batch_index = 3;
  input.total_batches = 3;
  EXPECT_EQ(worker_->execute(input), WorkResult::FAILURE);

  input.current_batch_index = -1;
  EXPECT_EQ(worker_->execute(input), WorkResult::FAILURE);
}

TEST_F(FileUploadWorkerTest, UnknownAccountFails) {
  EXPECT_CALL(store_, getUploadsByIds(_, _)).Times(0);
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);

  BatchInput input = makeInput({1});
  input.account_name = "nobody";
  EXPECT_EQ(worker_->execute(input), WorkResult::FAILURE);
}

TEST_F(FileUploadWorkerTest, BackendExceptionFailsBatch) {
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Throw(std::runtime_error("disk I/O error")));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::FAILURE);
}

// =============================================================================
// Empty batch and global pause
// =============================================================================

TEST_F(FileUploadWorkerTest, NoRecordsSucceedsWithoutFactory) {
  EXPECT_CALL(store_, getUploadsByIds(_, "account")).WillOnce(Return(std::vector<UploadRecord>{}));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput({1, 2, 3})), WorkResult::SUCCESS);
}

TEST_F(FileUploadWorkerTest, EmptyIdListSucceeds) {
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);
  EXPECT_EQ(worker_->execute(makeInput({})), WorkResult::SUCCESS);
}

TEST_F(FileUploadWorkerTest, GlobalPauseSucceedsWithoutFactory) {
  auto records = makeRecords(3);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(preferences_, isGlobalUploadPaused()).WillOnce(Return(true));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);
  EXPECT_CALL(store_, updateUploadStatus(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::SUCCESS);
  EXPECT_EQ(worker_->lastSummary().not_started, 3u);
}

// =============================================================================
// Per-record classification
// =============================================================================

TEST_F(FileUploadWorkerTest, SingleQuotaExceededFails) {
  auto records = makeRecords(1);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(factory_, create(_, _, _))
    .WillOnce(Return(makeOperation(ResultCode::QUOTA_EXCEEDED, 1)));
  EXPECT_CALL(store_, updateUploadStatus(1, UploadStatus::FAILED, ResultCode::QUOTA_EXCEEDED))
    .WillOnce(Return(true));

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::FAILURE);
}

TEST_F(FileUploadWorkerTest, RetryableFirstDoesNotShortCircuit) {
  const int n = 4;
  auto records = makeRecords(n);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));

  EXPECT_CALL(factory_, create(_, _, _))
    .Times(n)
    .WillOnce(Return(makeOperation(ResultCode::NO_NETWORK_CONNECTION, 1)))
    .WillOnce(Return(makeOperation(ResultCode::OK, 2)))
    .WillOnce(Return(makeOperation(ResultCode::OK, 3)))
    .WillOnce(Return(makeOperation(ResultCode::OK, 4)));

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::RETRY);
  EXPECT_EQ(worker_->lastSummary().succeeded, 3u);
  EXPECT_EQ(worker_->lastSummary().retryable, 1u);
}

TEST_F(FileUploadWorkerTest, FatalShortCircuitsRemainingRecords) {
  auto records = makeRecords(5);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));

  // k = 3: records 4 and 5 must never be built
  EXPECT_CALL(factory_, create(_, _, _))
    .Times(3)
    .WillOnce(Return(makeOperation(ResultCode::OK, 1)))
    .WillOnce(Return(makeOperation(ResultCode::TIMEOUT, 2)))
    .WillOnce(Return(makeOperation(ResultCode::FORBIDDEN, 3)));
  EXPECT_CALL(store_, updateUploadStatus(4, _, _)).Times(0);
  EXPECT_CALL(store_, updateUploadStatus(5, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::FAILURE);
  EXPECT_EQ(worker_->lastSummary().not_started, 2u);
}

TEST_F(FileUploadWorkerTest, FatalWinsOverEarlierRetryable) {
  auto records = makeRecords(2);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(factory_, create(_, _, _))
    .WillOnce(Return(makeOperation(ResultCode::SERVICE_UNAVAILABLE, 1)))
    .WillOnce(Return(makeOperation(ResultCode::ACCOUNT_NOT_THE_SAME, 2)));

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::FAILURE);
}

TEST_F(FileUploadWorkerTest, CancelledAndSkippedAreBenign) {
  auto records = makeRecords(3);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(factory_, create(_, _, _))
    .WillOnce(Return(makeOperation(ResultCode::CANCELLED, 1)))
    .WillOnce(Return(makeOperation(ResultCode::SKIPPED_EXISTING, 2)))
    .WillOnce(Return(makeOperation(ResultCode::OK, 3)));

  EXPECT_CALL(store_, updateUploadStatus(1, UploadStatus::FAILED, ResultCode::CANCELLED));
  EXPECT_CALL(store_, updateUploadStatus(2, UploadStatus::DONE, ResultCode::SKIPPED_EXISTING));
  EXPECT_CALL(store_, updateUploadStatus(3, UploadStatus::DONE, ResultCode::OK));
  EXPECT_CALL(store_, updateUploadStatus(_, UploadStatus::IN_PROGRESS, _)).Times(3);

  EXPECT_CALL(notifier_, reportResult(_, ResultClass::BENIGN_SKIP)).Times(2);
  EXPECT_CALL(notifier_, reportResult(_, ResultClass::SUCCESS)).Times(1);

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::SUCCESS);
}

TEST_F(FileUploadWorkerTest, RetryableRecordGoesBackToPending) {
  auto records = makeRecords(1);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(factory_, create(_, _, _)).WillOnce(Return(makeOperation(ResultCode::TIMEOUT, 1)));

  {
    InSequence seq;
    EXPECT_CALL(store_, updateUploadStatus(1, UploadStatus::IN_PROGRESS, _));
    EXPECT_CALL(store_, updateUploadStatus(1, UploadStatus::PENDING, ResultCode::TIMEOUT));
  }

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::RETRY);
}

TEST_F(FileUploadWorkerTest, OfflineRecordsAreRetryableWithoutFactory) {
  auto records = makeRecords(2);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(connectivity_, isConnected()).WillRepeatedly(Return(true));
  EXPECT_CALL(connectivity_, isInternetWalled()).WillRepeatedly(Return(true));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);
  EXPECT_CALL(
    store_, updateUploadStatus(_, UploadStatus::PENDING, ResultCode::NO_NETWORK_CONNECTION)
  )
    .Times(2);

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::RETRY);
}

TEST_F(FileUploadWorkerTest, FinishedRecordsAreSkipped) {
  auto records = makeRecords(2);
  records[0].status = UploadStatus::DONE;
  records[1].status = UploadStatus::FAILED;
  records[1].last_result = ResultCode::CANCELLED;
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::SUCCESS);
  EXPECT_EQ(worker_->lastSummary().skipped, 2u);
}

TEST_F(FileUploadWorkerTest, NullOperationIsRetryable) {
  auto records = makeRecords(1);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(factory_, create(_, _, _)).WillOnce(Return(nullptr));
  EXPECT_CALL(store_, updateUploadStatus(1, UploadStatus::PENDING, ResultCode::UNKNOWN_ERROR));

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::RETRY);
}

TEST_F(FileUploadWorkerTest, MissingClientFails) {
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(makeRecords(1)));
  EXPECT_CALL(client_factory_, create(_)).WillOnce(Return(nullptr));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::FAILURE);
}

TEST_F(FileUploadWorkerTest, OperationContextCarriesDeviceState) {
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(makeRecords(1)));
  EXPECT_CALL(power_, isPowerSaveMode()).WillRepeatedly(Return(true));
  EXPECT_CALL(power_, isBatteryCharging()).WillRepeatedly(Return(false));

  OperationContext seen;
  EXPECT_CALL(factory_, create(_, _, _))
    .WillOnce(Invoke([&](const UploadRecord&, const User& user, const OperationContext& context) {
      EXPECT_EQ(user.account_name, "account");
      seen = context;
      return makeOperation(ResultCode::OK, 1);
    }));

  BatchInput input = makeInput({1});
  input.current_batch_index = 1;
  input.total_batches = 4;
  EXPECT_EQ(worker_->execute(input), WorkResult::SUCCESS);

  EXPECT_TRUE(seen.power_save_mode);
  EXPECT_FALSE(seen.battery_charging);
  EXPECT_EQ(seen.batch_index, 1);
  EXPECT_EQ(seen.total_batches, 4);
}

// =============================================================================
// Registry discipline and cancellation
// =============================================================================

TEST_F(FileUploadWorkerTest, RegistryEmptyAfterEveryOutcome) {
  auto records = makeRecords(4);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));

  auto throwing = std::make_shared<NiceMock<MockUploadOperation>>();
  EXPECT_CALL(*throwing, execute(_)).WillOnce(Throw(std::runtime_error("socket closed")));

  EXPECT_CALL(factory_, create(_, _, _))
    .WillOnce(Return(makeOperation(ResultCode::OK, 1)))
    .WillOnce(Return(throwing))
    .WillOnce(Return(makeOperation(ResultCode::CANCELLED, 3)))
    .WillOnce(Return(makeOperation(ResultCode::QUOTA_EXCEEDED, 4)));

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::FAILURE);
  EXPECT_TRUE(registry_.empty());
}

TEST_F(FileUploadWorkerTest, ThrowingOperationIsRetryable) {
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(makeRecords(1)));

  auto throwing = std::make_shared<NiceMock<MockUploadOperation>>();
  EXPECT_CALL(*throwing, execute(_)).WillOnce(Throw(std::runtime_error("boom")));
  EXPECT_CALL(factory_, create(_, _, _)).WillOnce(Return(throwing));

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::RETRY);
  EXPECT_FALSE(registry_.contains(1));
}

TEST_F(FileUploadWorkerTest, CancelThroughRegistryContinuesBatch) {
  auto records = makeRecords(2);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));

  // The first operation is cancelled from outside while it runs
  auto cancellable = std::make_shared<NiceMock<MockUploadOperation>>();
  bool cancelled = false;
  ON_CALL(*cancellable, cancel()).WillByDefault(Invoke([&]() {
    cancelled = true;
  }));
  EXPECT_CALL(*cancellable, execute(_)).WillOnce(Invoke([&](RemoteClient&) {
    EXPECT_TRUE(registry_.cancel(1));
    return cancelled ? ResultCode::CANCELLED : ResultCode::OK;
  }));

  EXPECT_CALL(factory_, create(_, _, _))
    .WillOnce(Return(cancellable))
    .WillOnce(Return(makeOperation(ResultCode::OK, 2)));

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::SUCCESS);
  EXPECT_TRUE(cancelled);
  EXPECT_EQ(worker_->lastSummary().skipped, 1u);
  EXPECT_EQ(worker_->lastSummary().succeeded, 1u);
  EXPECT_TRUE(registry_.empty());
}

TEST_F(FileUploadWorkerTest, RecordRunningElsewhereIsSkipped) {
  auto other = std::make_shared<NiceMock<MockUploadOperation>>();
  ASSERT_TRUE(registry_.add(1, other));

  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(makeRecords(1)));
  auto operation = std::make_shared<NiceMock<MockUploadOperation>>();
  EXPECT_CALL(*operation, execute(_)).Times(0);
  EXPECT_CALL(factory_, create(_, _, _)).WillOnce(Return(operation));
  EXPECT_CALL(store_, updateUploadStatus(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::SUCCESS);

  // The other worker's entry is left alone
  EXPECT_EQ(registry_.get(1), other);
  registry_.clear();
}

TEST_F(FileUploadWorkerTest, CancelledInStoreDuringBatchIsSkipped) {
  auto records = makeRecords(3);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));

  // Record 2 is cancelled while record 1 uploads
  UploadRecord cancelled = makeRecord(2);
  cancelled.status = UploadStatus::FAILED;
  cancelled.last_result = ResultCode::CANCELLED;
  EXPECT_CALL(store_, getUpload(_)).Times(AnyNumber());
  EXPECT_CALL(store_, getUpload(2)).WillOnce(Return(cancelled));

  EXPECT_CALL(factory_, create(_, _, _))
    .WillOnce(Return(makeOperation(ResultCode::OK, 1)))
    .WillOnce(Return(makeOperation(ResultCode::OK, 3)));
  EXPECT_CALL(store_, updateUploadStatus(2, _, _)).Times(0);
  EXPECT_CALL(notifier_, reportStart(_)).Times(2);

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::SUCCESS);
  EXPECT_EQ(worker_->lastSummary().succeeded, 2u);
  EXPECT_EQ(worker_->lastSummary().skipped, 1u);
}

TEST_F(FileUploadWorkerTest, UploadedElsewhereDuringBatchIsSkipped) {
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(makeRecords(1)));

  UploadRecord done = makeRecord(1);
  done.status = UploadStatus::DONE;
  EXPECT_CALL(store_, getUpload(1)).WillOnce(Return(done));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);
  EXPECT_CALL(store_, updateUploadStatus(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::SUCCESS);
  EXPECT_EQ(worker_->lastSummary().skipped, 1u);
}

TEST_F(FileUploadWorkerTest, RemovedRecordIsSkipped) {
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(makeRecords(1)));
  EXPECT_CALL(store_, getUpload(1)).WillOnce(Return(std::nullopt));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);
  EXPECT_CALL(store_, updateUploadStatus(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::SUCCESS);
  EXPECT_EQ(worker_->lastSummary().skipped, 1u);
}

// =============================================================================
// Notification and broadcast
// =============================================================================

TEST_F(FileUploadWorkerTest, NotifierExceptionsAreSwallowed) {
  auto records = makeRecords(2);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(factory_, create(_, _, _))
    .WillOnce(Return(makeOperation(ResultCode::OK, 1)))
    .WillOnce(Return(makeOperation(ResultCode::OK, 2)));

  EXPECT_CALL(notifier_, reportStart(_)).WillRepeatedly(Throw(std::runtime_error("ui gone")));
  EXPECT_CALL(notifier_, reportResult(_, _)).WillRepeatedly(Throw(std::runtime_error("ui gone")));
  EXPECT_CALL(notifier_, reportBatchSummary(_)).WillOnce(Throw(std::runtime_error("ui gone")));
  EXPECT_CALL(broadcaster_, emit(_, _)).WillRepeatedly(Throw(std::runtime_error("no bus")));

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::SUCCESS);
  EXPECT_TRUE(registry_.empty());
}

TEST_F(FileUploadWorkerTest, ProgressIsForwardedToNotifier) {
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(makeRecords(1)));

  auto operation = std::make_shared<NiceMock<MockUploadOperation>>();
  ProgressListener listener;
  EXPECT_CALL(*operation, setProgressListener(_)).WillOnce(Invoke([&](ProgressListener l) {
    listener = l;
  }));
  EXPECT_CALL(*operation, execute(_)).WillOnce(Invoke([&](RemoteClient&) {
    listener(512, 1024);
    listener(1024, 1024);
    return ResultCode::OK;
  }));
  EXPECT_CALL(factory_, create(_, _, _)).WillOnce(Return(operation));

  EXPECT_CALL(notifier_, reportProgress(_, 512, 1024));
  EXPECT_CALL(notifier_, reportProgress(_, 1024, 1024));

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::SUCCESS);
}

TEST_F(FileUploadWorkerTest, BatchSummaryReportedAfterShortCircuit) {
  auto records = makeRecords(3);
  EXPECT_CALL(store_, getUploadsByIds(_, _)).WillOnce(Return(records));
  EXPECT_CALL(factory_, create(_, _, _))
    .WillOnce(Return(makeOperation(ResultCode::QUOTA_EXCEEDED, 1)));

  BatchSummary reported;
  EXPECT_CALL(notifier_, reportBatchSummary(_)).WillOnce(Invoke([&](const BatchSummary& s) {
    reported = s;
  }));
  EXPECT_CALL(broadcaster_, emit(kEventUploadStarted, _)).Times(1);
  EXPECT_CALL(broadcaster_, emit(kEventUploadFinished, _)).Times(1);
  EXPECT_CALL(broadcaster_, emit(kEventBatchFinished, _)).WillOnce(Invoke(
    [](const std::string&, const nlohmann::json& data) {
      EXPECT_EQ(data["result"], "failure");
      EXPECT_EQ(data["failed"], 1);
      EXPECT_EQ(data["not_started"], 2);
    }
  ));

  EXPECT_EQ(worker_->execute(makeInput(idsOf(records))), WorkResult::FAILURE);
  EXPECT_EQ(reported.account_name, "account");
  EXPECT_EQ(reported.total, 3u);
  EXPECT_EQ(reported.failed, 1u);
  EXPECT_EQ(reported.not_started, 2u);
  EXPECT_EQ(reported.result, WorkResult::FAILURE);
}

// =============================================================================
// End-to-end scenarios
// =============================================================================

TEST_F(FileUploadWorkerTest, ScenarioEmptyStoreSucceeds) {
  BatchInput input;
  input.account_name = "account";
  input.upload_ids = {1};
  input.current_batch_index = 0;
  input.total_batches = 1;

  EXPECT_CALL(store_, getUploadsByIds(std::vector<int64_t>{1}, "account"))
    .WillOnce(Return(std::vector<UploadRecord>{}));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(input), WorkResult::SUCCESS);
}

TEST_F(FileUploadWorkerTest, ScenarioPausedSucceeds) {
  EXPECT_CALL(store_, getUploadsByIds(std::vector<int64_t>{1}, "account"))
    .WillOnce(Return(makeRecords(1)));
  EXPECT_CALL(preferences_, isGlobalUploadPaused()).WillOnce(Return(true));
  EXPECT_CALL(factory_, create(_, _, _)).Times(0);

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::SUCCESS);
}

TEST_F(FileUploadWorkerTest, ScenarioQuotaExceededFails) {
  EXPECT_CALL(store_, getUploadsByIds(std::vector<int64_t>{1}, "account"))
    .WillOnce(Return(makeRecords(1)));
  EXPECT_CALL(preferences_, isGlobalUploadPaused()).WillOnce(Return(false));

  auto operation = std::make_shared<NiceMock<MockUploadOperation>>();
  EXPECT_CALL(*operation, execute(_)).WillOnce(Return(ResultCode::QUOTA_EXCEEDED));
  EXPECT_CALL(factory_, create(_, _, _)).WillOnce(Return(operation));

  EXPECT_EQ(worker_->execute(makeInput({1})), WorkResult::FAILURE);
  EXPECT_TRUE(registry_.empty());
}

// =============================================================================
// Cancellation against a SQLite store
// =============================================================================

class FileUploadWorkerStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    db_path_ = tempDbPath("test_cirrus_worker_");
    store_ = std::make_unique<SqliteUploadStore>(db_path_);

    ON_CALL(accounts_, resolve("alice")).WillByDefault(Return(AccountLookup(AccountFound{user_})));
    ON_CALL(preferences_, isGlobalUploadPaused()).WillByDefault(Return(false));
    ON_CALL(connectivity_, isConnected()).WillByDefault(Return(true));
    ON_CALL(client_factory_, create(_))
      .WillByDefault(Return(std::make_shared<RemoteClient>(RemoteClient{"alice", "/mnt/alice"})));

    scheduler_ = std::make_unique<UploadScheduler>(SchedulerConfig(), *store_, registry_, runner_);
    worker_ = std::make_unique<FileUploadWorker>(
      WorkerCollaborators{
        accounts_, *store_, preferences_, connectivity_, power_, factory_, client_factory_,
        notifier_, broadcaster_
      },
      registry_
    );
  }

  void TearDown() override {
    worker_.reset();
    scheduler_.reset();
    store_.reset();
    removeDatabase(db_path_);
  }

  int64_t insert(const std::string& name) {
    UploadRecord record;
    record.account_name = "alice";
    record.local_path = "/tmp/local/" + name;
    record.remote_path = "/" + name;
    auto id = store_->insertUpload(record);
    EXPECT_TRUE(id.has_value());
    return id.value_or(-1);
  }

  User user_{"alice", "Alice"};
  std::string db_path_;
  std::unique_ptr<SqliteUploadStore> store_;
  NiceMock<MockAccountManager> accounts_;
  NiceMock<MockPreferences> preferences_;
  NiceMock<MockConnectivityService> connectivity_;
  NiceMock<MockPowerManagementService> power_;
  NiceMock<MockUploadOperationFactory> factory_;
  NiceMock<MockClientFactory> client_factory_;
  NiceMock<MockUploadNotifier> notifier_;
  NiceMock<MockBroadcastEmitter> broadcaster_;
  NiceMock<MockJobRunner> runner_;
  ActiveOperationRegistry registry_;
  std::unique_ptr<UploadScheduler> scheduler_;
  std::unique_ptr<FileUploadWorker> worker_;
};

TEST_F(FileUploadWorkerStoreTest, CancelQueuedRecordOfRunningBatch) {
  int64_t first = insert("a.jpg");
  int64_t second = insert("b.jpg");

  int executed = 0;
  auto operation = std::make_shared<NiceMock<MockUploadOperation>>();
  ON_CALL(*operation, execute(_)).WillByDefault(Invoke([&](RemoteClient&) {
    ++executed;
    if (executed == 1) {
      EXPECT_TRUE(scheduler_->cancelUpload(second));
    }
    return ResultCode::OK;
  }));
  ON_CALL(factory_, create(_, _, _)).WillByDefault(Return(operation));

  BatchInput input;
  input.account_name = "alice";
  input.upload_ids = {first, second};
  EXPECT_EQ(worker_->execute(input), WorkResult::SUCCESS);

  EXPECT_EQ(executed, 1);
  EXPECT_EQ(worker_->lastSummary().succeeded, 1u);
  EXPECT_EQ(worker_->lastSummary().skipped, 1u);

  auto uploaded = store_->getUpload(first);
  ASSERT_TRUE(uploaded.has_value());
  EXPECT_EQ(uploaded->status, UploadStatus::DONE);
  EXPECT_EQ(uploaded->last_result, ResultCode::OK);

  auto cancelled = store_->getUpload(second);
  ASSERT_TRUE(cancelled.has_value());
  EXPECT_EQ(cancelled->status, UploadStatus::FAILED);
  EXPECT_EQ(cancelled->last_result, ResultCode::CANCELLED);
}
