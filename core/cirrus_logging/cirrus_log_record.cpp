// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cirrus_log_record.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions/message.hpp>
#include <nlohmann/json.hpp>

#include <sstream>

namespace cirrus {
namespace logging {

namespace {

const char* color_for(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
  }
  return "";
}

const char* const kResetColor = "\033[0m";

}  // namespace

LogLine read_log_line(const boost::log::record_view& rec) {
  LogLine line;

  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    line.timestamp = boost::posix_time::to_iso_extended_string(*time_stamp);
  }

  auto level = rec[severity];
  if (level) {
    line.level = *level;
  }

  auto component = rec[log_component];
  if (component) {
    line.component = *component;
  }

  auto message = rec[boost::log::expressions::smessage];
  if (message) {
    line.message = *message;
  }

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    std::ostringstream oss;
    oss << *thread_id;
    line.thread_id = oss.str();
  }

  auto account = rec[log_account];
  if (account) {
    line.account = *account;
  }
  auto batch = rec[log_batch];
  if (batch) {
    line.batch = *batch;
  }

  return line;
}

std::string format_text_line(const LogLine& line, bool use_colors) {
  std::ostringstream out;
  out << "[" << line.timestamp << "] ";

  if (line.level) {
    if (use_colors) {
      out << color_for(*line.level) << "[" << *line.level << "]" << kResetColor << " ";
    } else {
      out << "[" << *line.level << "] ";
    }
  }

  if (!line.component.empty()) {
    out << "[" << line.component << "] ";
  }
  out << line.message;

  if (!line.account.empty() || !line.batch.empty()) {
    out << " |";
    if (!line.account.empty()) {
      out << " account=" << line.account;
    }
    if (!line.batch.empty()) {
      out << " batch=" << line.batch;
    }
  }

  return out.str();
}

std::string format_json_line(const LogLine& line) {
  nlohmann::json json;
  json["ts"] = line.timestamp;
  json["level"] = line.level ? severity_name(*line.level) : "";
  if (!line.component.empty()) {
    json["component"] = line.component;
  }
  json["msg"] = line.message;
  if (!line.thread_id.empty()) {
    json["thread_id"] = line.thread_id;
  }
  if (!line.account.empty()) {
    json["account"] = line.account;
  }
  if (!line.batch.empty()) {
    json["batch"] = line.batch;
  }
  // Invalid UTF-8 in a path must not throw out of the sink
  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace cirrus
