/**
 * @file log.cpp
 * @brief Diagnostic log sink implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "knxusb/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace knx
{
namespace usb
{

namespace
{

const char* level_name(LogLevel level)
{
  switch (level)
  {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
  }
  return "?";
}

void stderr_sink(void* user, LogLevel level, const char* msg)
{
  (void)user;
  std::fprintf(stderr, "[knxusb] %s: %s\n", level_name(level), msg);
}

// Sink and context are installed together at startup, before any
// reassembler is fed.
LogFn g_sink = stderr_sink;
void* g_user = nullptr;
std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::WARNING)};

void vlog(LogLevel level, const char* fmt, va_list args)
{
  if (static_cast<uint8_t>(level) < g_level.load())
  {
    return;
  }

  char msg[256];
  std::vsnprintf(msg, sizeof(msg), fmt, args);
  g_sink(g_user, level, msg);
}

}  // namespace

void set_log_handler(LogFn fn, void* user)
{
  g_sink = fn ? fn : stderr_sink;
  g_user = fn ? user : nullptr;
}

void set_log_level(LogLevel level)
{
  g_level.store(static_cast<uint8_t>(level));
}

LogLevel log_level()
{
  return static_cast<LogLevel>(g_level.load());
}

void log_debug(const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::DEBUG, fmt, args);
  va_end(args);
}

void log_info(const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::INFO, fmt, args);
  va_end(args);
}

void log_warning(const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::WARNING, fmt, args);
  va_end(args);
}

void log_error(const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::ERROR, fmt, args);
  va_end(args);
}

}  // namespace usb
}  // namespace knx
