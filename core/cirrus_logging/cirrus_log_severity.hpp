// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_LOG_SEVERITY_HPP
#define CIRRUS_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>
#include <string>

namespace cirrus {
namespace logging {

/**
 * Severity levels for cirrus logging.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3 };

inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "DEBUG";
    case severity_level::info:
      return "INFO";
    case severity_level::warn:
      return "WARN";
    case severity_level::error:
      return "ERROR";
  }
  return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  return strm << severity_name(level);
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

// Attached per record by the CIRRUS_LOG_* macros
BOOST_LOG_ATTRIBUTE_KEYWORD(log_component, "Component", std::string)

// Attached per thread by CIRRUS_LOG_SCOPED_CONTEXT while a batch runs
BOOST_LOG_ATTRIBUTE_KEYWORD(log_account, "Account", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(log_batch, "Batch", std::string)

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_LOG_SEVERITY_HPP
