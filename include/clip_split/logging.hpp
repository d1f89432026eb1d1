/**
 * @file logging.hpp
 * @brief Logging macros
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - A runtime-gated LOG_DEBUG level (CLIP_SPLIT_DEBUG=1)
 *
 *          - A UTC timestamp prefix on every line
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so worker output interleaves line by line with the
 *       caller's.
 *
 */

#ifndef CLIP_SPLIT_LOGGING_HPP
#define CLIP_SPLIT_LOGGING_HPP

#include <cstdio>
#include <mutex>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace clip_split {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/// "2026-01-01 10:00:00.123" in UTC, used as the line prefix
std::string log_timestamp();

/// True when CLIP_SPLIT_DEBUG is set (memoised)
bool debug_enabled();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_split::log_mutex);                   \
    fmt::print("{} [INFO] " format_str "\n", clip_split::log_timestamp(),      \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (clip_split::debug_enabled()) {                                         \
      std::lock_guard<std::mutex> lock(clip_split::log_mutex);                 \
      fmt::print(fg(fmt::color::gray), "{} [DEBUG] " format_str "\n",          \
                 clip_split::log_timestamp(), ##__VA_ARGS__);                  \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_split::log_mutex);                   \
    fmt::print(fg(fmt::color::yellow), "{} [WARN] " format_str "\n",           \
               clip_split::log_timestamp(), ##__VA_ARGS__);                    \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_split::log_mutex);                   \
    fmt::print(fg(fmt::color::red), "{} [ERROR] " format_str "\n",             \
               clip_split::log_timestamp(), ##__VA_ARGS__);                    \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_split::log_mutex);                   \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_split::log_mutex);                   \
    fmt::print(fg(fmt::color::green), "{} [INFO] " format_str "\n",            \
               clip_split::log_timestamp(), ##__VA_ARGS__);                    \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

} // namespace clip_split

#endif // CLIP_SPLIT_LOGGING_HPP
