// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_upload_job.hpp"

#include <string>

#include "batch_input.hpp"

#define CIRRUS_LOG_COMPONENT "upload_job"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

FileUploadJob::FileUploadJob(
  const WorkerCollaborators& collaborators, ActiveOperationRegistry& registry
)
    : collaborators_(collaborators)
    , registry_(registry) {}

WorkResult FileUploadJob::run(const nlohmann::json& input) {
  std::string error;
  auto batch = parseBatchInput(input, error);
  if (!batch) {
    CIRRUS_LOG_ERROR("Invalid upload job input: " << error);
    return WorkResult::FAILURE;
  }

  FileUploadWorker worker(collaborators_, registry_);
  return worker.execute(*batch);
}

}  // namespace uploader
}  // namespace cirrus
