/**
 * @file logging.cpp
 * @brief Logger implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xm1k/logging.hpp"

#include <chrono>
#include <ctime>

namespace xm1k
{

Logger& Logger::instance()
{
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl)
{
  std::lock_guard<std::mutex> lk(mtx_);
  level_ = lvl;
}

LogLevel Logger::level() const
{
  std::lock_guard<std::mutex> lk(mtx_);
  return level_;
}

void Logger::set_sink(std::FILE* sink)
{
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = sink;
}

const char* Logger::level_str(LogLevel lvl) const
{
  switch (lvl)
  {
    case LogLevel::TRACE:
      return "TRACE";
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    default:
      return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char* fmt, ...)
{
  std::lock_guard<std::mutex> lk(mtx_);
  if (lvl < level_ || lvl == LogLevel::OFF)
  {
    return;
  }

  std::FILE* out = sink_ != nullptr ? sink_ : stderr;

  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);

  // std::localtime shares a static buffer, mtx_ is held
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", std::localtime(&t));
  std::fprintf(out, "%s [%s] ", ts, level_str(lvl));

  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);

  std::fprintf(out, "\n");
  std::fflush(out);
}

}  // namespace xm1k
