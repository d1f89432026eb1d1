/**
 * @file logging.cpp
 * @brief Logging utilities implementation
 *
 * @details Provides:
 *          - Global log mutex
 *
 *          - Timestamp prefix and debug gate used by the LOG_* macros
 */

#include "clip_split/logging.hpp"

#include <chrono>
#include <ctime>

#include "clip_split/config.hpp"

namespace clip_split {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- LINE PREFIX -----**

std::string log_timestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;

  std::tm tm{};
  gmtime_r(&secs, &tm);
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, static_cast<int>(ms));
}

bool debug_enabled() { return Config::debug_logging(); }

} // namespace clip_split
