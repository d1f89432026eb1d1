/**
 * @file job_runner.hpp
 * @brief Asynchronous execution of split jobs
 *
 * @details The JobRunner owns the worker pool. For every job it:
 *
 *          1. Runs the Splitter on a pool worker
 *
 *          2. Classifies the outcome into a terminal JobRecord
 *
 *          3. Persists that record exactly once
 *
 *          4. Removes the transient upload (file, then its directory)
 *
 *          Step 4 runs on every exit path and only after step 3.
 *
 * @note Nothing is reported back to the submitter: outcomes are only
 *       observable through the persisted record.
 */

#ifndef CLIP_SPLIT_JOB_RUNNER_HPP
#define CLIP_SPLIT_JOB_RUNNER_HPP

#include <filesystem>
#include <string>

#include "job_record.hpp"
#include "metadata_store.hpp"
#include "splitter.hpp"
#include "worker_pool.hpp"

namespace clip_split {

/**
 * @struct JobRequest
 * @brief A validated job ready for execution.
 */
struct JobRequest {
  std::string job_id;                 //< Identifier of the job
  std::filesystem::path source_path;  //< Transient uploaded file
  std::filesystem::path output_dir;   //< Job directory for the parts
  int parts = 0;                      //< Number of parts
  JobRecord initial_record;           //< Record persisted at submission
};

/**
 * @brief Make tool output safe to persist.
 * @note Control characters other than newline and tab are dropped and only
 *       the last max_chars characters are kept (prefixed with "...").
 */
std::string sanitize_diagnostic(const std::string &text, size_t max_chars);

/**
 * @class JobRunner
 * @brief Executes jobs on a bounded pool and records their outcome.
 */
class JobRunner {
public:
  /**
   * @brief Construct a runner and start its pool.
   * @param store Metadata store shared with the status reader
   * @param splitter Media splitter; must outlive the runner
   * @param num_workers Maximum concurrently executing jobs
   * @param max_diagnostic_chars Cap applied to tool diagnostics before they
   *                             are persisted
   */
  JobRunner(MetadataStore &store, Splitter &splitter, int num_workers,
            size_t max_diagnostic_chars);

  /**
   * @brief Queue a job; returns without waiting for it.
   * @return false when the runner is shutting down
   */
  bool submit(JobRequest request);

  /**
   * @brief Execute a job on the calling thread.
   * @note This is what pool workers run; it never throws.
   */
  void process(const JobRequest &request);

  /// Block until every submitted job has finished
  void wait_idle() { pool_.wait_idle(); }

  /// Stop accepting jobs; see WorkerPool::shutdown()
  void shutdown() { pool_.shutdown(); }

private:
  MetadataStore &store_;
  Splitter &splitter_;
  size_t max_diagnostic_chars_;
  WorkerPool pool_;

  /**
   * @brief Run the splitter and map its outcome to a terminal record.
   * @note Anything thrown while splitting or classifying becomes the
   *       generic error record.
   */
  JobRecord execute(const JobRequest &request);

  /// Terminal record for a splitter result
  JobRecord classify(const JobRequest &request, SplitResult result) const;

  /// Write the terminal record unless one is already persisted
  void persist_terminal(const JobRequest &request, const JobRecord &record);
};

} // namespace clip_split

#endif // CLIP_SPLIT_JOB_RUNNER_HPP
