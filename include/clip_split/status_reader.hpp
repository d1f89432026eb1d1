/**
 * @file status_reader.hpp
 * @brief Query-time view of a job
 *
 * @details Builds the status payload of a job from its persisted record.
 *          For completed jobs whose record lists no outputs, the output
 *          files are derived from the job directory and the record is
 *          corrected in place (self-heal). The correction only ever fills
 *          the outputs of a record that is still completed; status and the
 *          other fields are never touched.
 */

#ifndef CLIP_SPLIT_STATUS_READER_HPP
#define CLIP_SPLIT_STATUS_READER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "job_record.hpp"
#include "metadata_store.hpp"

namespace clip_split {

/**
 * @struct JobView
 * @brief Status of one job as seen by a client.
 */
struct JobView {
  std::string job_id;
  bool found = false;             //< false: no readable record exists
  JobRecord record;               //< Valid only when found
  std::vector<std::string> files; //< Downloadable outputs (completed only)

  JobStatus status() const { return record.status; }
};

/**
 * @brief Render the status payload.
 * @return {"job_id","status","metadata","files"}, or
 *         {"job_id","status":"not-found"} when !view.found
 */
nlohmann::json to_payload(const JobView &view);

/**
 * @class StatusReader
 * @brief Reads job records and reconciles their output listing.
 */
class StatusReader {
public:
  explicit StatusReader(MetadataStore &store);

  /**
   * @brief Build the current view of job_id.
   * @note Never creates a record; a missing or corrupt document yields a
   *       view with found == false.
   */
  JobView query(const std::string &job_id);

  /**
   * @brief Locate a job's output file for download.
   * @return The file path when filename is a bare name of an existing
   *         artifact of an existing job; nullopt otherwise
   */
  std::optional<std::filesystem::path>
  resolve_download(const std::string &job_id,
                   const std::string &filename) const;

private:
  MetadataStore &store_;

  /// Persist derived outputs into a completed record with none listed
  void heal_outputs(const std::string &job_id,
                    const std::vector<std::string> &files);
};

} // namespace clip_split

#endif // CLIP_SPLIT_STATUS_READER_HPP
