/**
 * @file logging.hpp
 * @brief Process-wide logger for the host side
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace xm1k
{

enum class LogLevel
{
  TRACE = 0,
  DEBUG,
  INFO,
  WARN,
  ERROR,
  OFF,
};

/**
 * @brief Timestamped printf-style logger writing to stderr
 *
 * @code
 * Logger::instance().log(LogLevel::INFO, "sending %zu frames", plan.size());
 * @endcode
 */
class Logger
{
 public:
  static Logger& instance();

  void set_level(LogLevel lvl);
  LogLevel level() const;

  /**
   * @brief Redirect output (stderr by default)
   *
   * @param sink Open stream, not owned
   */
  void set_sink(std::FILE* sink);

  void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
      __attribute__((format(printf, 3, 4)))
#endif
      ;

 private:
  Logger() = default;

  const char* level_str(LogLevel lvl) const;

  mutable std::mutex mtx_;
  LogLevel level_ = LogLevel::INFO;
  std::FILE* sink_ = nullptr;
};

}  // namespace xm1k
