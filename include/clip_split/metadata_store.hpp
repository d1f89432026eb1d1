/**
 * @file metadata_store.hpp
 * @brief Crash-safe per-job metadata document storage
 *
 * @details Every job owns a directory under the outputs root holding one
 *          metadata.json plus the job's output artifacts. Documents are
 *          replaced atomically:
 *
 *          1. Serialise to a uniquely named temporary file in the job directory
 *
 *          2. fsync the temporary file
 *
 *          3. rename() it over metadata.json
 *
 *          A reader therefore sees either the previous document or the new
 *          one, never a partial write, and a crash before step 3 leaves the
 *          previous document in place.
 *
 * @note Writers to the same job are serialised by a striped in-process lock,
 *       so read-modify-write cycles through update() cannot interleave with
 *       each other or with put().
 *
 * @attention The lock belongs to the instance: use one MetadataStore per
 *            outputs root. A second instance on the same root still never
 *            corrupts a document (temporary names carry a per-instance
 *            token), but its update() cycles are not serialised against
 *            the first one's.
 */

#ifndef CLIP_SPLIT_METADATA_STORE_HPP
#define CLIP_SPLIT_METADATA_STORE_HPP

#include <array>
#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "job_record.hpp"

namespace clip_split {

/**
 * @enum UpdateOutcome
 * @brief Result of MetadataStore::update().
 */
enum class UpdateOutcome {
  Written,   //< Mutator changed the record and it was persisted
  Unchanged, //< Mutator declined to write
  Missing,   //< No readable document for the job
  Failed     //< The write itself failed (logged)
};

/**
 * @class MetadataStore
 * @brief Filesystem-backed key-value store of JobRecords keyed by job id.
 */
class MetadataStore {
public:
  /// Receives the current record; returns true to persist its changes
  using Mutator = std::function<bool(JobRecord &)>;

  /**
   * @brief Construct a store rooted at the outputs directory.
   * @note The root is not created here; see JobService.
   */
  explicit MetadataStore(std::filesystem::path outputs_root);

  /// Directory holding the job's document and artifacts
  std::filesystem::path job_dir(const std::string &job_id) const;

  /// Path of the job's metadata.json
  std::filesystem::path document_path(const std::string &job_id) const;

  /// True when the job directory exists
  bool exists(const std::string &job_id) const;

  /**
   * @brief Create the job directory.
   * @return true on success or if it already exists
   */
  bool create_job_dir(const std::string &job_id) const;

  /**
   * @brief Atomically replace the job's document with record.
   * @return true once the new document is in place; false on any I/O error
   *         (logged), in which case the previous document is untouched
   */
  bool put(const std::string &job_id, const JobRecord &record);

  /**
   * @brief Read the job's current document.
   * @return nullopt when missing, unreadable or unparseable (the last two
   *         are logged)
   */
  std::optional<JobRecord> get(const std::string &job_id) const;

  /**
   * @brief Read-modify-write the job's document under the job's lock.
   * @param mutator Applied to the current record; returns false to skip
   *                the write
   */
  UpdateOutcome update(const std::string &job_id, const Mutator &mutator);

  /**
   * @brief Regular files in the job directory, sorted by name.
   * @note Excludes metadata.json and in-flight temporary documents.
   */
  std::vector<std::string> list_artifacts(const std::string &job_id) const;

  /// True for names the store itself writes into a job directory
  static bool is_internal_file(const std::string &filename);

private:
  static constexpr size_t LOCK_STRIPES = 64;

  std::filesystem::path root_;
  std::array<std::mutex, LOCK_STRIPES> locks_;
  std::string instance_token_; ///< Random, distinguishes temp files
  std::atomic<unsigned long> temp_counter_{0};

  /// Rejects empty ids and ids that could escape the root
  static bool is_safe_id(const std::string &job_id);

  std::mutex &lock_for(const std::string &job_id);

  /// Steps 1-3 of the atomic replace; caller holds the job's lock
  bool write_document(const std::string &job_id, const JobRecord &record);

  std::optional<JobRecord> read_document(const std::string &job_id) const;
};

} // namespace clip_split

#endif // CLIP_SPLIT_METADATA_STORE_HPP
