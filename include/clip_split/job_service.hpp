/**
 * @file job_service.hpp
 * @brief Submission and query facade over the job subsystem
 *
 * @details The JobService is what an outer surface (the CLI here, an HTTP
 *          layer elsewhere) talks to. It owns the data layout:
 *
 *          <data_dir>/uploads/<job_id>/<file>   transient input
 *
 *          <data_dir>/outputs/<job_id>/         metadata.json + parts
 *
 *          Submission validates the request, places the input, persists the
 *          initial record and queues the job; it never waits for the split.
 */

#ifndef CLIP_SPLIT_JOB_SERVICE_HPP
#define CLIP_SPLIT_JOB_SERVICE_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "job_runner.hpp"
#include "metadata_store.hpp"
#include "splitter.hpp"
#include "status_reader.hpp"

namespace clip_split {

/**
 * @enum SubmitError
 * @brief Reasons a submission is refused before any job is created.
 */
enum class SubmitError {
  None,
  EmptyFilename,       //< Nothing usable left after sanitising
  UnsupportedFileType, //< Extension not in the allowed set
  InvalidPartCount,    //< Outside [MIN_PARTS, MAX_PARTS]
  SourceMissing,       //< Input file does not exist
  StorageFailure,      //< Job directories or record could not be written
  ShuttingDown         //< Runner no longer accepts jobs
};

/// User-facing message for a submission error
const char *describe(SubmitError error);

/**
 * @struct SubmitResult
 * @brief Outcome of JobService::submit().
 */
struct SubmitResult {
  SubmitError error = SubmitError::None;
  std::string job_id; //< Set only on success

  bool ok() const { return error == SubmitError::None; }
};

/**
 * @class JobService
 * @brief Owns the store, runner and reader of one data directory.
 */
class JobService {
public:
  /**
   * @brief Bootstrap the data layout and start the runner.
   * @throws std::filesystem::filesystem_error if the roots cannot be created
   */
  JobService(const std::filesystem::path &data_dir, Splitter &splitter,
             int num_workers);

  /**
   * @brief Check a request without touching the filesystem.
   * @param filename Caller-supplied filename (unsanitised)
   * @param parts Requested part count
   */
  static SubmitError validate(const std::string &filename, int parts);

  /**
   * @brief Create and queue a job.
   *
   * @param source File to split
   * @param original_filename Caller-supplied name; sanitised before use
   * @param parts Requested part count
   * @param keep_source Copy the source instead of moving it
   * @return The new job id, or the reason nothing was created
   * @note A moved source is moved back when the job is rolled back.
   */
  SubmitResult submit(const std::filesystem::path &source,
                      const std::string &original_filename, int parts,
                      bool keep_source = false);

  /// See StatusReader::query()
  JobView query(const std::string &job_id) { return reader_.query(job_id); }

  /// See StatusReader::resolve_download()
  std::optional<std::filesystem::path>
  resolve_download(const std::string &job_id,
                   const std::string &filename) const {
    return reader_.resolve_download(job_id, filename);
  }

  void wait_idle() { runner_.wait_idle(); }
  void shutdown() { runner_.shutdown(); }

  const std::filesystem::path &uploads_root() const { return uploads_root_; }
  const std::filesystem::path &outputs_root() const { return outputs_root_; }

private:
  std::filesystem::path uploads_root_;
  std::filesystem::path outputs_root_;
  MetadataStore store_;
  StatusReader reader_;
  JobRunner runner_;

  /// Move (or copy) source to dest, falling back to copy across devices
  static bool place_input(const std::filesystem::path &source,
                          const std::filesystem::path &dest, bool keep_source);

  /// Undo place_input() for a moved source (copy fallback across devices)
  static void restore_input(const std::filesystem::path &saved,
                            const std::filesystem::path &source);

  /// Remove everything created for a job that was not queued
  void discard_job(const std::string &job_id);
};

} // namespace clip_split

#endif // CLIP_SPLIT_JOB_SERVICE_HPP
