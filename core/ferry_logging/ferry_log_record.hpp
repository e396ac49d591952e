// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_RECORD_HPP
#define FERRY_LOG_RECORD_HPP

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions/keyword.hpp>

#include <optional>
#include <ostream>
#include <string>

namespace ferry {
namespace logging {

enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

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
    case severity_level::fatal:
      return "FATAL";
  }
  return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  return strm << severity_name(level);
}

/**
 * Parse a level name: debug, info, warn (or warning), error, fatal.
 * Case-insensitive.
 */
std::optional<severity_level> parse_severity_level(const std::string& name);

// =============================================================================
// Attributes of a ferry log record
//
//   TimeStamp, Severity, Component   every record
//   QueueID, AttachmentKey           while an upload task runs
// =============================================================================
BOOST_LOG_ATTRIBUTE_KEYWORD(timestamp, "TimeStamp", boost::posix_time::ptime)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(component, "Component", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(queue_id, "QueueID", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(attachment_key, "AttachmentKey", std::string)

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_RECORD_HPP
