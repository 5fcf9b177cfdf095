// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_FILE_UPLOAD_JOB_HPP
#define CIRRUS_FILE_UPLOAD_JOB_HPP

#include <nlohmann/json.hpp>

#include "active_operation_registry.hpp"
#include "file_upload_worker.hpp"
#include "result_code.hpp"

namespace cirrus {
namespace uploader {

/**
 * A unit of background work run by the scheduler
 */
class IJobRunner {
public:
  virtual ~IJobRunner() = default;

  /**
   * Must be safe to call from several scheduler threads at once
   */
  virtual WorkResult run(const nlohmann::json& input) = 0;
};

/**
 * Decodes the job input bag and runs one FileUploadWorker over it.
 *
 * A fresh worker is created for every run so concurrent runs share
 * nothing but the collaborators and the registry.
 */
class FileUploadJob : public IJobRunner {
public:
  FileUploadJob(const WorkerCollaborators& collaborators, ActiveOperationRegistry& registry);

  /**
   * @return FAILURE if the input bag cannot be decoded, otherwise the
   *         worker's result
   */
  WorkResult run(const nlohmann::json& input) override;

private:
  WorkerCollaborators collaborators_;
  ActiveOperationRegistry& registry_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_FILE_UPLOAD_JOB_HPP
