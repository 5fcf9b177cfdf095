// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOAD_NOTIFIER_HPP
#define CIRRUS_UPLOAD_NOTIFIER_HPP

#include <atomic>
#include <cstdint>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Notifier counters
 */
struct NotifierStats {
  std::atomic<uint64_t> started{0};
  std::atomic<uint64_t> succeeded{0};
  std::atomic<uint64_t> skipped{0};
  std::atomic<uint64_t> retryable{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> batches{0};
};

/**
 * Reports upload progress through the logging stack.
 *
 * Skipped uploads are logged at debug level and never counted as failures.
 */
class LoggingUploadNotifier : public IUploadNotifier {
public:
  LoggingUploadNotifier() = default;

  void reportStart(const UploadRecord& record) override;
  void reportProgress(
    const UploadRecord& record, uint64_t bytes_transferred, uint64_t total_bytes
  ) override;
  void reportResult(const UploadRecord& record, ResultClass result_class) override;
  void reportBatchSummary(const BatchSummary& summary) override;

  const NotifierStats& stats() const {
    return stats_;
  }

private:
  NotifierStats stats_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOAD_NOTIFIER_HPP
