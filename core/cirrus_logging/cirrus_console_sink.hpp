// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_CONSOLE_SINK_HPP
#define CIRRUS_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

/**
 * Async console sink with bounded queue.
 * Records are dropped on overflow so upload threads never block on stderr.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Create the console sink writing to std::clog.
 *
 * Lines use format_text_line(), so records logged inside a batch end with
 * the account and batch position.
 *
 * @param min_level Minimum severity level to log
 * @param use_colors Whether to colour the severity tag with ANSI codes
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_CONSOLE_SINK_HPP
