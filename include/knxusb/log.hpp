/**
 * @file log.hpp
 * @brief Diagnostic log sink
 *
 * Decode failures are reported through a process-wide sink so that a
 * host can route them into its own logging. The default sink prints
 * WARNING and above to stderr.
 *
 * Example usage:
 * @code
 * void my_log(void* user, knx::usb::LogLevel level, const char* msg) {
 *   syslog(LOG_ERR, "%s", msg);
 * }
 *
 * knx::usb::set_log_handler(my_log, nullptr);
 * knx::usb::set_log_level(knx::usb::LogLevel::DEBUG);
 * @endcode
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>

namespace knx
{
namespace usb
{

/**
 * @brief Log severity
 */
enum class LogLevel : uint8_t
{
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
};

/**
 * @brief Log sink function type
 *
 * @param user  User context pointer passed to set_log_handler()
 * @param level Message severity
 * @param msg   Formatted, NUL-terminated message
 */
using LogFn = void (*)(void* user, LogLevel level, const char* msg);

/**
 * @brief Install a log sink
 *
 * @param fn   Sink function, nullptr restores the stderr sink
 * @param user User context pointer passed to fn
 */
void set_log_handler(LogFn fn, void* user = nullptr);

/**
 * @brief Drop messages below the given level
 */
void set_log_level(LogLevel level);

LogLevel log_level();

#if defined(__GNUC__)
#define KNXUSB_PRINTF_FORMAT __attribute__((format(printf, 1, 2)))
#else
#define KNXUSB_PRINTF_FORMAT
#endif

/**
 * @brief Format and emit one message (printf-style) at the named level
 *
 * Messages below log_level() are dropped before formatting.
 */
void log_debug(const char* fmt, ...) KNXUSB_PRINTF_FORMAT;
void log_info(const char* fmt, ...) KNXUSB_PRINTF_FORMAT;
void log_warning(const char* fmt, ...) KNXUSB_PRINTF_FORMAT;
void log_error(const char* fmt, ...) KNXUSB_PRINTF_FORMAT;

#undef KNXUSB_PRINTF_FORMAT

}  // namespace usb
}  // namespace knx
