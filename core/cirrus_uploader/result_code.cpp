// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "result_code.hpp"

#include <map>

namespace cirrus {
namespace uploader {

namespace {

const std::map<ResultCode, std::string>& resultCodeNames() {
  static const std::map<ResultCode, std::string> names = {
    {ResultCode::OK, "OK"},
    {ResultCode::CANCELLED, "CANCELLED"},
    {ResultCode::SKIPPED_EXISTING, "SKIPPED_EXISTING"},
    {ResultCode::QUOTA_EXCEEDED, "QUOTA_EXCEEDED"},
    {ResultCode::FORBIDDEN, "FORBIDDEN"},
    {ResultCode::ACCOUNT_NOT_FOUND, "ACCOUNT_NOT_FOUND"},
    {ResultCode::ACCOUNT_NOT_THE_SAME, "ACCOUNT_NOT_THE_SAME"},
    {ResultCode::UNAUTHORIZED, "UNAUTHORIZED"},
    {ResultCode::NO_NETWORK_CONNECTION, "NO_NETWORK_CONNECTION"},
    {ResultCode::TIMEOUT, "TIMEOUT"},
    {ResultCode::HOST_NOT_AVAILABLE, "HOST_NOT_AVAILABLE"},
    {ResultCode::SERVICE_UNAVAILABLE, "SERVICE_UNAVAILABLE"},
    {ResultCode::MAINTENANCE_MODE, "MAINTENANCE_MODE"},
    {ResultCode::SSL_ERROR, "SSL_ERROR"},
    {ResultCode::LOCAL_FILE_NOT_FOUND, "LOCAL_FILE_NOT_FOUND"},
    {ResultCode::LOCAL_STORAGE_FULL, "LOCAL_STORAGE_FULL"},
    {ResultCode::SYNC_CONFLICT, "SYNC_CONFLICT"},
    {ResultCode::INVALID_CHARACTER_IN_NAME, "INVALID_CHARACTER_IN_NAME"},
    {ResultCode::UNKNOWN_ERROR, "UNKNOWN_ERROR"},
  };
  return names;
}

}  // namespace

std::string resultCodeToString(ResultCode code) {
  const auto& names = resultCodeNames();
  auto it = names.find(code);
  return it != names.end() ? it->second : "UNKNOWN_ERROR";
}

ResultCode resultCodeFromString(const std::string& str) {
  for (const auto& entry : resultCodeNames()) {
    if (entry.second == str) {
      return entry.first;
    }
  }
  return ResultCode::UNKNOWN_ERROR;
}

std::string resultClassToString(ResultClass result_class) {
  switch (result_class) {
    case ResultClass::SUCCESS:
      return "success";
    case ResultClass::BENIGN_SKIP:
      return "skipped";
    case ResultClass::RETRYABLE:
      return "retryable";
    case ResultClass::FATAL:
      return "fatal";
    default:
      return "unknown";
  }
}

std::string workResultToString(WorkResult result) {
  switch (result) {
    case WorkResult::SUCCESS:
      return "success";
    case WorkResult::FAILURE:
      return "failure";
    case WorkResult::RETRY:
      return "retry";
    default:
      return "unknown";
  }
}

ResultClass classifyResult(ResultCode code) {
  switch (code) {
    case ResultCode::OK:
      return ResultClass::SUCCESS;

    case ResultCode::CANCELLED:
    case ResultCode::SKIPPED_EXISTING:
      return ResultClass::BENIGN_SKIP;

    case ResultCode::QUOTA_EXCEEDED:
    case ResultCode::FORBIDDEN:
    case ResultCode::ACCOUNT_NOT_FOUND:
    case ResultCode::ACCOUNT_NOT_THE_SAME:
      return ResultClass::FATAL;

    default:
      return ResultClass::RETRYABLE;
  }
}

void BatchOutcome::add(ResultClass result_class) {
  switch (result_class) {
    case ResultClass::SUCCESS:
      ++succeeded_;
      break;
    case ResultClass::BENIGN_SKIP:
      ++skipped_;
      break;
    case ResultClass::RETRYABLE:
      ++retryable_;
      break;
    case ResultClass::FATAL:
      ++failed_;
      break;
  }
}

WorkResult BatchOutcome::result() const {
  if (failed_ > 0) {
    return WorkResult::FAILURE;
  }
  if (retryable_ > 0) {
    return WorkResult::RETRY;
  }
  return WorkResult::SUCCESS;
}

}  // namespace uploader
}  // namespace cirrus
