// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_FILE_SINK_HPP
#define CIRRUS_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * File sink configuration.
 */
struct FileSinkConfig {
  std::string directory = "/var/log/cirrus";
  std::string file_pattern = "uploader_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = false;  // One JSON object per line when true
};

/**
 * Create async rotating file sink.
 *
 * Falls back to <temp>/cirrus when the configured directory cannot be
 * created. Lines come from format_json_line() or format_text_line().
 *
 * @param config File sink configuration
 * @param min_level Minimum severity level to log
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_FILE_SINK_HPP
