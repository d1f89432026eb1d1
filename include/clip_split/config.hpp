/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/clip_split.env for documentation of each parameter.
 *
 */

#ifndef CLIP_SPLIT_CONFIG_HPP
#define CLIP_SPLIT_CONFIG_HPP

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>

namespace clip_split {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value, or default when unset or not a whole number
 * @note Never throws; LOG_DEBUG reads its switch through these helpers.
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  errno = 0;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX)
    return default_val;
  return static_cast<int>(parsed);
}

/**
 * @brief Get a boolean switch from environment variable.
 * @return default_val when unset or empty, false for "0", true otherwise
 */
inline bool get_env_flag(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  return std::string(val) != "0";
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable contents or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- JOB EXECUTION ----**

/**
 * @brief Number of worker threads executing split jobs.
 * @note At most this many jobs run at once; further submissions wait in
 *       FIFO order. Values below 1 are clamped to 1.
 */
inline int worker_threads() {
  static int val = std::max(1, get_env_int("WORKER_THREADS", 2));
  return val;
}

/// Root holding the uploads/ and outputs/ trees
inline std::string data_dir() {
  static std::string val = get_env_string("CLIP_SPLIT_DATA_DIR", "data");
  return val;
}

/// ffmpeg binary used for cutting (resolved through PATH when relative)
inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/**
 * @brief Upper bound on tool diagnostics stored in a job record.
 * @note The tail of the diagnostic is kept since ffmpeg prints the actual
 *       failure reason last.
 */
inline int max_diagnostic_chars() {
  static int val = std::max(1, get_env_int("MAX_DIAGNOSTIC_CHARS", 2000));
  return val;
}

// **---- LOGGING ----**

/// Enables LOG_DEBUG output
inline bool debug_logging() {
  static bool val = get_env_flag("CLIP_SPLIT_DEBUG", false);
  return val;
}

} // namespace Config
} // namespace clip_split

#endif // CLIP_SPLIT_CONFIG_HPP
