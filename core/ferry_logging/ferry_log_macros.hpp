// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_MACROS_HPP
#define FERRY_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <chrono>
#include <mutex>
#include <sstream>
#include <string>

#include "ferry_log_record.hpp"

namespace ferry {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

// Process-wide logger shared by the run loop and upload workers
BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(ferry_logger, ::ferry::logging::logger_type)

inline logger_type& get_logger() {
  return ferry_logger::get();
}

/**
 * Key-value fragment for log messages.
 * Usage: FERRY_LOG_INFO("Popped items" << kv("count", n));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

// Strings are quoted
template <>
inline std::string kv(const char* name, const std::string& value) {
  return std::string(" ") + name + "=\"" + value + "\"";
}

inline std::string kv(const char* name, const char* value) {
  return std::string(" ") + name + "=\"" + value + "\"";
}

}  // namespace logging
}  // namespace ferry

// Each translation unit names itself before including this header:
//
//   #define FERRY_LOG_COMPONENT "upload_task"
//   #include <ferry_log_macros.hpp>
#ifndef FERRY_LOG_COMPONENT
#define FERRY_LOG_COMPONENT "ferry"
#endif

#ifdef NDEBUG
#define FERRY_LOG_ENABLE_DEBUG 0
#else
#define FERRY_LOG_ENABLE_DEBUG 1
#endif

#define FERRY_LOG_AT(level, msg)                                                         \
  do {                                                                                   \
    BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::level) \
      << ::boost::log::add_value(::ferry::logging::component, FERRY_LOG_COMPONENT) << msg; \
  } while (0)

#define FERRY_LOG_DEBUG(msg)         \
  do {                               \
    if (FERRY_LOG_ENABLE_DEBUG) {    \
      FERRY_LOG_AT(debug, msg);      \
    }                                \
  } while (0)
#define FERRY_LOG_INFO(msg) FERRY_LOG_AT(info, msg)
#define FERRY_LOG_WARN(msg) FERRY_LOG_AT(warn, msg)
#define FERRY_LOG_ERROR(msg) FERRY_LOG_AT(error, msg)
#define FERRY_LOG_FATAL(msg) FERRY_LOG_AT(fatal, msg)

// Tags every record of the current thread with the item until the scope ends.
// At most one per scope.
#define FERRY_LOG_SCOPED_ITEM(queue_id_val, attachment_key_val)                          \
  ::boost::log::scoped_attribute _ferry_scoped_queue_id =                               \
    ::boost::log::add_scoped_thread_attribute(                                          \
      "QueueID", ::boost::log::attributes::constant<std::string>(queue_id_val)          \
    );                                                                                  \
  ::boost::log::scoped_attribute _ferry_scoped_attachment_key =                         \
    ::boost::log::add_scoped_thread_attribute(                                          \
      "AttachmentKey", ::boost::log::attributes::constant<std::string>(attachment_key_val) \
    )

// At most one record per interval (seconds) per call site.
// Usage: FERRY_LOG_WARN_THROTTLE(30.0, "Queue still busy" << kv("pending", n));
#define FERRY_LOG_THROTTLE_IMPL(LOG_MACRO, interval_sec, msg)                                \
  do {                                                                                       \
    static std::mutex _ferry_throttle_mutex;                                                 \
    static std::chrono::steady_clock::time_point _ferry_throttle_last{};                     \
    static bool _ferry_throttle_used = false;                                                \
    bool _ferry_throttle_emit = false;                                                       \
    {                                                                                        \
      std::lock_guard<std::mutex> _ferry_throttle_lock(_ferry_throttle_mutex);               \
      auto _ferry_throttle_now = std::chrono::steady_clock::now();                           \
      if (!_ferry_throttle_used ||                                                           \
          _ferry_throttle_now - _ferry_throttle_last >=                                      \
            std::chrono::duration<double>(interval_sec)) {                                   \
        _ferry_throttle_used = true;                                                         \
        _ferry_throttle_last = _ferry_throttle_now;                                          \
        _ferry_throttle_emit = true;                                                         \
      }                                                                                      \
    }                                                                                        \
    if (_ferry_throttle_emit) {                                                              \
      LOG_MACRO(msg);                                                                        \
    }                                                                                        \
  } while (0)

#define FERRY_LOG_INFO_THROTTLE(interval_sec, msg) \
  FERRY_LOG_THROTTLE_IMPL(FERRY_LOG_INFO, interval_sec, msg)
#define FERRY_LOG_WARN_THROTTLE(interval_sec, msg) \
  FERRY_LOG_THROTTLE_IMPL(FERRY_LOG_WARN, interval_sec, msg)
#define FERRY_LOG_ERROR_THROTTLE(interval_sec, msg) \
  FERRY_LOG_THROTTLE_IMPL(FERRY_LOG_ERROR, interval_sec, msg)

#endif  // FERRY_LOG_MACROS_HPP
