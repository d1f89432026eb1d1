/**
 * @file system.hpp
 * @brief Clock, identifier and filename utilities
 *
 * @details Provides:
 *
 *          - ISO-8601 UTC timestamps for job records
 *
 *          - Random job identifiers
 *
 *          - Upload filename sanitising and extension checks
 *
 *          - Time formatting utilities
 */

#ifndef CLIP_SPLIT_SYSTEM_HPP
#define CLIP_SPLIT_SYSTEM_HPP

#include <string>

namespace clip_split {

// **---- Clock ----**

/**
 * @brief Current UTC time as ISO-8601 with microseconds.
 * @return e.g. "2026-01-01T10:00:00.123456+00:00"
 */
std::string iso_now();

// **---- Identifiers ----**

/**
 * @brief Generate a new job identifier.
 * @note 128 random bits rendered as 32 lowercase hex characters.
 */
std::string generate_job_id();

/// True for ids produced by generate_job_id() (32 lowercase hex chars)
bool is_valid_job_id(const std::string &job_id);

// **---- Filenames ----**

/**
 * @brief Reduce a caller-supplied filename to a safe basename.
 *
 * @note Directory components are dropped, whitespace becomes '_', anything
 *       outside [A-Za-z0-9._-] is removed and leading dots are stripped.
 *       May return an empty string.
 */
std::string sanitize_filename(const std::string &filename);

/// True when the extension (case-insensitive, without dot) is allowed
bool allowed_extension(const std::string &filename);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace clip_split

#endif // CLIP_SPLIT_SYSTEM_HPP
