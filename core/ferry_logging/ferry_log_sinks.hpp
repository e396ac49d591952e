// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_SINKS_HPP
#define FERRY_LOG_SINKS_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/shared_ptr.hpp>

#include <cstdint>
#include <ostream>
#include <string>

#include "ferry_log_record.hpp"

namespace ferry {
namespace logging {

enum class record_format { text, json };

/**
 * Write one record.
 *
 * text: [2026-10-18 09:12:01.123456] [WARN] [upload_task] msg | queue_id=.. attachment_key=..
 * json: {"ts":..,"level":..,"component":..,"msg":..,"thread":..,"queue_id":..,"attachment_key":..}
 *
 * Item fields appear only on records logged inside FERRY_LOG_SCOPED_ITEM.
 * Colours apply to the text level tag only.
 */
void format_record(
  const boost::log::record_view& rec, boost::log::formatting_ostream& strm, record_format format,
  bool use_colors = false
);

// Sinks drop records instead of blocking upload workers when their queue is full
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  stream_sink_t;

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  file_sink_t;

/**
 * Text sink on a stream (std::clog for the daemon).
 * Not attached to the core.
 */
boost::shared_ptr<stream_sink_t> make_stream_sink(
  boost::shared_ptr<std::ostream> stream, severity_level min_level, bool use_colors
);

struct FileSinkConfig {
  std::string directory = "/var/log/ferry";
  std::string file_pattern = "uploader_%Y%m%d_%H%M%S.log";
  std::uint64_t rotation_size_mb = 50;
  bool rotate_at_midnight = true;
  int max_files = 10;
  record_format format = record_format::json;
};

/**
 * Rotating file sink. An unwritable directory falls back to /tmp/ferry_logs.
 * Old files beyond max_files are removed on rotation. Not attached to the core.
 */
boost::shared_ptr<file_sink_t> make_file_sink(const FileSinkConfig& config, severity_level min_level);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_SINKS_HPP
