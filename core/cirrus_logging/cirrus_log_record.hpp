// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_LOG_RECORD_HPP
#define CIRRUS_LOG_RECORD_HPP

#include <boost/log/core/record_view.hpp>

#include <optional>
#include <string>

#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

/**
 * One log record as both sinks print it.
 *
 * account and batch are empty unless the record was logged inside
 * CIRRUS_LOG_SCOPED_CONTEXT.
 */
struct LogLine {
  std::string timestamp;  // ISO 8601, local time
  std::optional<severity_level> level;
  std::string component;
  std::string message;
  std::string thread_id;
  std::string account;
  std::string batch;
};

LogLine read_log_line(const boost::log::record_view& rec);

/**
 * "[ts] [LEVEL] [component] message | account=alice batch=2/5"
 *
 * @param use_colors Wrap the level tag in ANSI colour codes
 */
std::string format_text_line(const LogLine& line, bool use_colors);

/**
 * One JSON object with keys ts, level, component, msg, thread_id and,
 * inside a batch, account and batch.
 */
std::string format_json_line(const LogLine& line);

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_LOG_RECORD_HPP
