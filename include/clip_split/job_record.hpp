/**
 * @file job_record.hpp
 * @brief Persisted state of one split job
 *
 * @details A JobRecord is the content of a job's metadata.json. It is
 *          written once as Processing at submission, once more at the
 *          terminal transition, and may have its outputs list corrected by
 *          the status reader.
 */

#ifndef CLIP_SPLIT_JOB_RECORD_HPP
#define CLIP_SPLIT_JOB_RECORD_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace clip_split {

/**
 * @struct JobRecord
 * @brief One job's metadata document.
 *
 * @attention INVARIANTS:
 *
 *   - outputs is non-empty only when status == Completed
 *
 *   - error_message is set only when status == Error
 *
 *   - completed_at is set only for terminal statuses
 */
struct JobRecord {
  std::string job_id;                       //< Opaque 32-hex identifier
  std::string original_filename;            //< Sanitised upload name
  int parts = 0;                            //< Requested part count
  JobStatus status = JobStatus::Processing; //< Lifecycle state
  std::string created_at;                   //< ISO-8601 UTC
  std::optional<std::string> completed_at;  //< Set at terminal transition
  std::vector<std::string> outputs;         //< Output filenames, in order
  std::optional<std::string> error_message; //< Set when status == Error

  bool operator==(const JobRecord &other) const;
  bool operator!=(const JobRecord &other) const { return !(*this == other); }

  /// Fresh Processing record stamped with the current time
  static JobRecord make_initial(std::string job_id,
                                std::string original_filename, int parts);

  /// Copy of this record moved to Completed with the given outputs
  JobRecord completed(std::vector<std::string> files) const;

  /// Copy of this record moved to Error with the given message
  JobRecord failed(std::string message) const;
};

/**
 * @brief Serialise a record using the metadata.json field names.
 * @note Optional fields are omitted when unset.
 */
void to_json(nlohmann::json &j, const JobRecord &record);

/**
 * @brief Deserialise a record.
 * @throws nlohmann::json::exception on missing/mistyped fields
 * @throws std::runtime_error on an unknown status string
 */
void from_json(const nlohmann::json &j, JobRecord &record);

} // namespace clip_split

#endif // CLIP_SPLIT_JOB_RECORD_HPP
