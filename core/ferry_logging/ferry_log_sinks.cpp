// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_log_sinks.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>

namespace ferry {
namespace logging {

namespace {

namespace attrs = boost::log::attributes;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

const char* level_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[1;31m";
  }
  return "";
}

void write_json_string(boost::log::formatting_ostream& strm, const std::string& value) {
  strm << '"';
  for (unsigned char c : value) {
    switch (c) {
      case '"':
        strm << "\\\"";
        break;
      case '\\':
        strm << "\\\\";
        break;
      case '\n':
        strm << "\\n";
        break;
      case '\r':
        strm << "\\r";
        break;
      case '\t':
        strm << "\\t";
        break;
      default:
        if (c < 0x20) {
          char escaped[8];
          std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
          strm << escaped;
        } else {
          strm << static_cast<char>(c);
        }
    }
  }
  strm << '"';
}

std::string message_of(const boost::log::record_view& rec) {
  auto msg = rec[expr::smessage];
  return msg ? msg.get() : std::string();
}

void format_json(const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  if (auto ts = rec[timestamp]) {
    strm << boost::posix_time::to_iso_extended_string(ts.get());
  }
  strm << "\",\"level\":\"";
  if (auto sev = rec[severity]) {
    strm << severity_name(sev.get());
  }
  strm << '"';
  if (auto comp = rec[component]) {
    strm << ",\"component\":";
    write_json_string(strm, comp.get());
  }
  strm << ",\"msg\":";
  write_json_string(strm, message_of(rec));
  if (auto tid = boost::log::extract<attrs::current_thread_id::value_type>("ThreadID", rec)) {
    strm << ",\"thread\":\"" << tid.get() << '"';
  }
  if (auto qid = rec[queue_id]) {
    strm << ",\"queue_id\":";
    write_json_string(strm, qid.get());
  }
  if (auto key = rec[attachment_key]) {
    strm << ",\"attachment_key\":";
    write_json_string(strm, key.get());
  }
  strm << '}';
}

void format_text(
  const boost::log::record_view& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  if (auto ts = rec[timestamp]) {
    strm << '[' << ts.get() << "] ";
  }
  if (auto sev = rec[severity]) {
    if (use_colors) {
      strm << level_color(sev.get()) << '[' << sev.get() << "]\033[0m ";
    } else {
      strm << '[' << sev.get() << "] ";
    }
  }
  if (auto comp = rec[component]) {
    strm << '[' << comp.get() << "] ";
  }
  strm << message_of(rec);

  auto qid = rec[queue_id];
  auto key = rec[attachment_key];
  if (qid || key) {
    strm << " |";
    if (qid) {
      strm << " queue_id=" << qid.get();
    }
    if (key) {
      strm << " attachment_key=" << key.get();
    }
  }
}

// First of the requested directory and /tmp/ferry_logs that can be created
std::string usable_directory(const std::string& requested) {
  boost::system::error_code ec;
  boost::filesystem::create_directories(requested, ec);
  if (!ec && boost::filesystem::is_directory(requested, ec)) {
    return requested;
  }
  const std::string fallback = "/tmp/ferry_logs";
  std::cerr << "ferry: cannot use log directory " << requested << " (" << ec.message()
            << "), writing to " << fallback << std::endl;
  boost::filesystem::create_directories(fallback, ec);
  return fallback;
}

}  // namespace

void format_record(
  const boost::log::record_view& rec, boost::log::formatting_ostream& strm, record_format format,
  bool use_colors
) {
  if (format == record_format::json) {
    format_json(rec, strm);
  } else {
    format_text(rec, strm, use_colors);
  }
}

boost::shared_ptr<stream_sink_t> make_stream_sink(
  boost::shared_ptr<std::ostream> stream, severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<sinks::text_ostream_backend>();
  backend->add_stream(stream);
  backend->auto_flush(true);

  auto sink = boost::make_shared<stream_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(
    [use_colors](const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
      format_record(rec, strm, record_format::text, use_colors);
    }
  );
  return sink;
}

boost::shared_ptr<file_sink_t> make_file_sink(const FileSinkConfig& config, severity_level min_level) {
  const boost::filesystem::path directory = usable_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    boost::log::keywords::file_name = (directory / config.file_pattern).string(),
    boost::log::keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    boost::log::keywords::open_mode = std::ios_base::out | std::ios_base::app
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }
  backend->auto_flush(true);

  if (config.max_files > 0) {
    backend->set_file_collector(sinks::file::make_collector(
      boost::log::keywords::target = directory.string(),
      boost::log::keywords::max_files = static_cast<unsigned int>(config.max_files)
    ));
    backend->scan_for_files();
  }

  auto sink = boost::make_shared<file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  const record_format format = config.format;
  sink->set_formatter(
    [format](const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
      format_record(rec, strm, format);
    }
  );
  return sink;
}

}  // namespace logging
}  // namespace ferry
