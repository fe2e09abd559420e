// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_LOG_MACROS_HPP
#define PARCEL_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <sstream>
#include <string>

#include "parcel_log_severity.hpp"

namespace parcel {
namespace logging {

// Thread-safe global severity logger type
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in parcel_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured log lines.
 * Usage: PARCEL_LOG_INFO("Part uploaded" << kv("part", n));
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
}  // namespace parcel

// =============================================================================
// Component identification
// Define PARCEL_LOG_COMPONENT before including this header:
//
//   #define PARCEL_LOG_COMPONENT "session_coordinator"
//   #include <parcel_log_macros.hpp>
// =============================================================================
#ifndef PARCEL_LOG_COMPONENT
#define PARCEL_LOG_COMPONENT "parcel"
#endif

// DEBUG logs are compiled out in release builds
#ifdef NDEBUG
#define PARCEL_LOG_ENABLE_DEBUG 0
#else
#define PARCEL_LOG_ENABLE_DEBUG 1
#endif

// =============================================================================
// Stream-based logging macros
// Usage: PARCEL_LOG_INFO("message" << kv("key", value));
// =============================================================================

#define PARCEL_LOG_DEBUG(msg) \
  do { \
    if (PARCEL_LOG_ENABLE_DEBUG) { \
      BOOST_LOG_SEV(::parcel::logging::get_logger(), ::parcel::logging::severity_level::debug) \
        << "[" << PARCEL_LOG_COMPONENT << "] " << msg; \
    } \
  } while (0)

#define PARCEL_LOG_INFO(msg) \
  do { \
    BOOST_LOG_SEV(::parcel::logging::get_logger(), ::parcel::logging::severity_level::info) \
      << "[" << PARCEL_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define PARCEL_LOG_WARN(msg) \
  do { \
    BOOST_LOG_SEV(::parcel::logging::get_logger(), ::parcel::logging::severity_level::warn) \
      << "[" << PARCEL_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define PARCEL_LOG_ERROR(msg) \
  do { \
    BOOST_LOG_SEV(::parcel::logging::get_logger(), ::parcel::logging::severity_level::error) \
      << "[" << PARCEL_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define PARCEL_LOG_FATAL(msg) \
  do { \
    BOOST_LOG_SEV(::parcel::logging::get_logger(), ::parcel::logging::severity_level::fatal) \
      << "[" << PARCEL_LOG_COMPONENT << "] " << msg; \
  } while (0)

// =============================================================================
// Upload context as scoped thread attributes, removed when the scope exits.
// Usage: PARCEL_LOG_SCOPED_CONTEXT(session_id, object_key);
// At most one use per block scope.
// =============================================================================
#define PARCEL_LOG_SCOPED_CONTEXT(session_id_val, object_key_val) \
  ::boost::log::scoped_attribute parcel_log_session_attr_ = \
    ::boost::log::add_scoped_thread_attribute( \
      "SessionID", ::boost::log::attributes::constant<std::string>(session_id_val) \
    ); \
  ::boost::log::scoped_attribute parcel_log_object_key_attr_ = \
    ::boost::log::add_scoped_thread_attribute( \
      "ObjectKey", ::boost::log::attributes::constant<std::string>(object_key_val) \
    ); \
  (void)parcel_log_session_attr_; \
  (void)parcel_log_object_key_attr_

#endif  // PARCEL_LOG_MACROS_HPP
