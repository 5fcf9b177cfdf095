// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cirrus_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "cirrus_log_record.hpp"

namespace cirrus {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

// Logging is not up while the file sink is built, so stderr is the only channel
std::string usable_directory(const std::string& directory) {
  boost::filesystem::path dir_path(directory);
  boost::system::error_code ec;
  if (boost::filesystem::is_directory(dir_path, ec)) {
    return directory;
  }

  boost::filesystem::create_directories(dir_path, ec);
  if (!ec) {
    return directory;
  }

  boost::filesystem::path fallback = boost::filesystem::temp_directory_path(ec) / "cirrus";
  if (!ec) {
    boost::filesystem::create_directories(fallback, ec);
  }
  std::string fallback_dir = ec ? std::string("/tmp") : fallback.string();
  std::cerr << "[cirrus_logging] Cannot create log directory '" << directory
            << "', writing logs to " << fallback_dir << "\n";
  return fallback_dir;
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  std::string log_directory = usable_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = log_directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );

  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_directory, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);

  bool json = config.format_json;
  sink->set_formatter(
    [json](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      LogLine line = read_log_line(rec);
      strm << (json ? format_json_line(line) : format_text_line(line, false));
    }
  );

  return sink;
}

}  // namespace logging
}  // namespace cirrus
