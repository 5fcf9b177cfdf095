// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_BATCH_INPUT_HPP
#define CIRRUS_BATCH_INPUT_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

#include "upload_record.hpp"

namespace cirrus {
namespace uploader {

// Keys of the job input bag
constexpr const char* kInputAccount = "ACCOUNT";
constexpr const char* kInputUploadIds = "UPLOAD_IDS";
constexpr const char* kInputCurrentBatchIndex = "CURRENT_BATCH_INDEX";
constexpr const char* kInputTotalBatches = "TOTAL_UPLOAD_SIZE";

/**
 * Decode a job input bag.
 *
 * ACCOUNT and UPLOAD_IDS must be present. A missing ACCOUNT decodes to an
 * empty account name so that validation rejects it the same way as a blank
 * one. CURRENT_BATCH_INDEX defaults to 0 and TOTAL_UPLOAD_SIZE to 1.
 *
 * @param input JSON object
 * @param error Set to a description when std::nullopt is returned
 * @return Decoded input, or std::nullopt if a field has the wrong type
 */
std::optional<BatchInput> parseBatchInput(const nlohmann::json& input, std::string& error);

/**
 * Encode a batch as a job input bag (inverse of parseBatchInput)
 */
nlohmann::json makeBatchInput(const BatchInput& input);

/**
 * Check the preconditions of a worker invocation: non-blank account and
 * a batch index inside [0, total_batches) when total_batches > 0.
 *
 * @param error Set to a description when false is returned
 */
bool validateBatchInput(const BatchInput& input, std::string& error);

/**
 * "index+1/total" label used in log context
 */
std::string batchLabel(const BatchInput& input);

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_BATCH_INPUT_HPP
