/**
 * @file types.hpp
 * @brief Core data types and constants for Clip Split
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Part count bounds and on-disk layout names
 *
 *          - JobStatus and its string form
 *
 *          - TimeSegment for time ranges
 */

#ifndef CLIP_SPLIT_TYPES_HPP
#define CLIP_SPLIT_TYPES_HPP

#include <optional>
#include <string>

namespace clip_split {

// **----- CONSTANTS -----**

/// Inclusive bounds on the number of parts a job may request
constexpr int MIN_PARTS = 2;
constexpr int MAX_PARTS = 4;

/// Name of the per-job metadata document inside the job's output directory
constexpr const char *METADATA_FILENAME = "metadata.json";

/**
 * @brief Suffix used for in-flight metadata writes.
 * @note Temporary files are named "metadata.json.<unique>.tmp" and are never
 *       reported as artifacts or read back as documents.
 */
constexpr const char *TEMP_SUFFIX = ".tmp";

/// Sub-directories of the data root
constexpr const char *UPLOADS_DIRNAME = "uploads";
constexpr const char *OUTPUTS_DIRNAME = "outputs";

/// Message persisted for failures that have no user-facing classification
constexpr const char *GENERIC_ERROR_MESSAGE =
    "Unexpected error while processing the video.";

// **----- DATA STRUCTURES -----**

/**
 * @enum JobStatus
 * @brief Lifecycle state of a job.
 * @note Completed and Error are terminal: once persisted they never change.
 */
enum class JobStatus { Processing, Completed, Error };

/// "processing", "completed" or "error"
const char *to_string(JobStatus status);

/// Inverse of to_string(); nullopt for unknown strings
std::optional<JobStatus> parse_job_status(const std::string &text);

inline bool is_terminal(JobStatus status) {
  return status != JobStatus::Processing;
}

/**
 * @struct TimeSegment
 * @brief Represents a time range [start, end) in seconds.
 * @note Used for the cut points of each output part.
 */
struct TimeSegment {
  double start; //< Start time in seconds
  double end;   //< End time in seconds

  double length() const { return end - start; }
};

} // namespace clip_split

#endif // CLIP_SPLIT_TYPES_HPP
