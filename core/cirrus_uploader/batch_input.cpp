// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "batch_input.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace cirrus {
namespace uploader {

namespace {

bool isBlank(const std::string& str) {
  return std::all_of(str.begin(), str.end(), [](unsigned char c) {
    return std::isspace(c);
  });
}

bool readInt(const nlohmann::json& input, const char* key, int& out, std::string& error) {
  if (!input.contains(key)) {
    return true;
  }
  const auto& value = input.at(key);
  if (!value.is_number_integer()) {
    error = std::string(key) + " must be an integer";
    return false;
  }
  constexpr int64_t kMax = std::numeric_limits<int>::max();
  bool in_range = value.is_number_unsigned()
                    ? value.get<uint64_t>() <= static_cast<uint64_t>(kMax)
                    : value.get<int64_t>() >= 0 && value.get<int64_t>() <= kMax;
  if (!in_range) {
    error = std::string(key) + " out of range: " + value.dump();
    return false;
  }
  out = static_cast<int>(value.get<int64_t>());
  return true;
}

}  // namespace

std::optional<BatchInput> parseBatchInput(const nlohmann::json& input, std::string& error) {
  if (!input.is_object()) {
    error = "Job input must be a JSON object";
    return std::nullopt;
  }

  BatchInput batch;

  if (input.contains(kInputAccount)) {
    const auto& account = input.at(kInputAccount);
    if (account.is_string()) {
      batch.account_name = account.get<std::string>();
    } else if (!account.is_null()) {
      error = std::string(kInputAccount) + " must be a string";
      return std::nullopt;
    }
  }

  if (!input.contains(kInputUploadIds)) {
    error = std::string(kInputUploadIds) + " is required";
    return std::nullopt;
  }
  const auto& ids = input.at(kInputUploadIds);
  if (!ids.is_array()) {
    error = std::string(kInputUploadIds) + " must be an array";
    return std::nullopt;
  }
  batch.upload_ids.reserve(ids.size());
  for (const auto& id : ids) {
    if (!id.is_number_integer()) {
      error = std::string(kInputUploadIds) + " must contain only integers";
      return std::nullopt;
    }
    batch.upload_ids.push_back(id.get<int64_t>());
  }

  if (!readInt(input, kInputCurrentBatchIndex, batch.current_batch_index, error)) {
    return std::nullopt;
  }
  if (!readInt(input, kInputTotalBatches, batch.total_batches, error)) {
    return std::nullopt;
  }

  return batch;
}

nlohmann::json makeBatchInput(const BatchInput& input) {
  nlohmann::json json;
  json[kInputAccount] = input.account_name;
  json[kInputUploadIds] = input.upload_ids;
  json[kInputCurrentBatchIndex] = input.current_batch_index;
  json[kInputTotalBatches] = input.total_batches;
  return json;
}

bool validateBatchInput(const BatchInput& input, std::string& error) {
  if (isBlank(input.account_name)) {
    error = "Account name is blank";
    return false;
  }
  if (input.current_batch_index < 0) {
    error = "Batch index is negative: " + std::to_string(input.current_batch_index);
    return false;
  }
  if (input.total_batches < 0) {
    error = "Batch count is negative: " + std::to_string(input.total_batches);
    return false;
  }
  if (input.total_batches > 0 && input.current_batch_index >= input.total_batches) {
    error = "Batch index " + std::to_string(input.current_batch_index) +
            " out of range for " + std::to_string(input.total_batches) + " batches";
    return false;
  }
  return true;
}

std::string batchLabel(const BatchInput& input) {
  return std::to_string(static_cast<int64_t>(input.current_batch_index) + 1) + "/" +
         std::to_string(input.total_batches);
}

}  // namespace uploader
}  // namespace cirrus
