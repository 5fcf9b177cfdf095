// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_LOG_MACROS_HPP
#define CIRRUS_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <chrono>
#include <mutex>
#include <sstream>
#include <string>

#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in cirrus_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value field for structured log lines.
 * Usage: CIRRUS_LOG_INFO("upload finished" << kv("upload_id", id));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace cirrus

// Define CIRRUS_LOG_COMPONENT before including this header to tag every
// record of the translation unit with its component name.
#ifndef CIRRUS_LOG_COMPONENT
#define CIRRUS_LOG_COMPONENT "cirrus"
#endif

#ifdef NDEBUG
#define CIRRUS_LOG_ENABLE_DEBUG 0
#else
#define CIRRUS_LOG_ENABLE_DEBUG 1
#endif

#define CIRRUS_LOG_SEV(level, msg) \
  BOOST_LOG_SEV(::cirrus::logging::get_logger(), ::cirrus::logging::severity_level::level) \
    << ::boost::log::add_value("Component", ::std::string(CIRRUS_LOG_COMPONENT)) << msg

#define CIRRUS_LOG_DEBUG(msg) \
  do { \
    if (CIRRUS_LOG_ENABLE_DEBUG) { \
      CIRRUS_LOG_SEV(debug, msg); \
    } \
  } while (0)

#define CIRRUS_LOG_INFO(msg) \
  do { \
    CIRRUS_LOG_SEV(info, msg); \
  } while (0)

#define CIRRUS_LOG_WARN(msg) \
  do { \
    CIRRUS_LOG_SEV(warn, msg); \
  } while (0)

#define CIRRUS_LOG_ERROR(msg) \
  do { \
    CIRRUS_LOG_SEV(error, msg); \
  } while (0)

// Attaches the account and batch position to every record logged from the
// current thread until the enclosing scope exits.
// Usage: CIRRUS_LOG_SCOPED_CONTEXT(account_name, "2/5");
// At most one context per scope.
#define CIRRUS_LOG_SCOPED_CONTEXT(account_val, batch_val) \
  ::boost::log::scoped_attribute _cirrus_account_sentry = ::boost::log::add_scoped_thread_attribute( \
    "Account", ::boost::log::attributes::constant<std::string>(account_val) \
  ); \
  ::boost::log::scoped_attribute _cirrus_batch_sentry = ::boost::log::add_scoped_thread_attribute( \
    "Batch", ::boost::log::attributes::constant<std::string>(batch_val) \
  ); \
  (void)_cirrus_account_sentry; \
  (void)_cirrus_batch_sentry

// Log at most once per interval (seconds) from a call site.
// Usage: CIRRUS_LOG_WARN_THROTTLE(30.0, "interface unreadable" << kv("path", p));
#define CIRRUS_LOG_THROTTLE(log_macro, interval_sec, msg) \
  do { \
    static std::chrono::steady_clock::time_point _cirrus_last_log_time{}; \
    static std::mutex _cirrus_throttle_mutex; \
    auto _cirrus_now = std::chrono::steady_clock::now(); \
    bool _cirrus_should_log = false; \
    { \
      std::lock_guard<std::mutex> _cirrus_lock(_cirrus_throttle_mutex); \
      if (_cirrus_now - _cirrus_last_log_time >= std::chrono::duration<double>(interval_sec)) { \
        _cirrus_last_log_time = _cirrus_now; \
        _cirrus_should_log = true; \
      } \
    } \
    if (_cirrus_should_log) { \
      log_macro(msg); \
    } \
  } while (0)

#define CIRRUS_LOG_DEBUG_THROTTLE(interval_sec, msg) \
  CIRRUS_LOG_THROTTLE(CIRRUS_LOG_DEBUG, interval_sec, msg)

#define CIRRUS_LOG_WARN_THROTTLE(interval_sec, msg) \
  CIRRUS_LOG_THROTTLE(CIRRUS_LOG_WARN, interval_sec, msg)

#endif  // CIRRUS_LOG_MACROS_HPP
