/**
 * @file job_runner.cpp
 * @brief Asynchronous execution of split jobs
 */

#include "clip_split/job_runner.hpp"

#include <chrono>
#include <exception>
#include <system_error>

#include "clip_split/logging.hpp"

namespace clip_split {

namespace fs = std::filesystem;

namespace {

/**
 * @class UploadCleanup
 * @brief Removes a job's transient upload when the job's scope ends.
 * @note Declared before the terminal write in process() so that its
 *       destructor always runs after it.
 */
class UploadCleanup {
  const fs::path &source_;
  const std::string &job_id_;

public:
  UploadCleanup(const fs::path &source, const std::string &job_id)
      : source_(source), job_id_(job_id) {}

  UploadCleanup(const UploadCleanup &) = delete;
  UploadCleanup &operator=(const UploadCleanup &) = delete;

  ~UploadCleanup() {
    std::error_code ec;
    fs::remove(source_, ec);
    if (ec) {
      LOG_WARN("Unable to remove uploaded file {} after processing job {}: {}",
               source_.string(), job_id_, ec.message());
    }

    /// Only succeeds when the directory is empty
    const fs::path dir = source_.parent_path();
    std::error_code dir_ec;
    fs::remove(dir, dir_ec);
    if (dir_ec) {
      LOG_DEBUG("Upload directory {} not removed (may not be empty): {}",
                dir.string(), dir_ec.message());
    }
  }
};

} // anonymous namespace

std::string sanitize_diagnostic(const std::string &text, size_t max_chars) {
  std::string clean;
  clean.reserve(text.size());
  for (unsigned char c : text) {
    if (c == '\n' || c == '\t' || c >= 0x20) {
      if (c != 0x7f)
        clean += static_cast<char>(c);
    }
  }

  if (clean.size() > max_chars)
    clean = "..." + clean.substr(clean.size() - max_chars);
  return clean;
}

JobRunner::JobRunner(MetadataStore &store, Splitter &splitter,
                     int num_workers, size_t max_diagnostic_chars)
    : store_(store), splitter_(splitter),
      max_diagnostic_chars_(max_diagnostic_chars),
      pool_(num_workers, "video-worker") {}

bool JobRunner::submit(JobRequest request) {
  const std::string job_id = request.job_id;
  bool queued = pool_.submit(
      [this, request = std::move(request)]() { process(request); });

  if (queued) {
    LOG_INFO("Queued job {} ({} pending, {} running)", job_id,
             pool_.pending(), pool_.active());
  } else {
    LOG_ERROR("Job {} rejected: runner is shutting down", job_id);
  }
  return queued;
}

void JobRunner::process(const JobRequest &request) {
  LOG_INFO("Starting background processing for job {}", request.job_id);
  auto start = std::chrono::steady_clock::now();

  UploadCleanup cleanup(request.source_path, request.job_id);

  JobRecord terminal = execute(request);
  try {
    persist_terminal(request, terminal);
  } catch (const std::exception &e) {
    LOG_ERROR("Job {} terminal record could not be saved: {}", request.job_id,
              e.what());
  } catch (...) {
    LOG_ERROR("Job {} terminal record could not be saved", request.job_id);
  }

  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();
  if (terminal.status == JobStatus::Completed) {
    LOG_SUCCESS("Job {} completed in {:.1f}s with {} outputs", request.job_id,
                elapsed, terminal.outputs.size());
  } else {
    LOG_ERROR("Job {} failed after {:.1f}s", request.job_id, elapsed);
  }
}

JobRecord JobRunner::execute(const JobRequest &request) {
  const JobRecord &base = request.initial_record;

  try {
    return classify(request, splitter_.split(request.source_path,
                                             request.output_dir,
                                             request.parts));
  } catch (const std::exception &e) {
    /// Full detail stays in the log; the record gets the generic message
    LOG_ERROR("Job {} encountered an unexpected error: {}", request.job_id,
              e.what());
  } catch (...) {
    LOG_ERROR("Job {} encountered an unexpected non-standard exception",
              request.job_id);
  }
  return base.failed(GENERIC_ERROR_MESSAGE);
}

JobRecord JobRunner::classify(const JobRequest &request,
                              SplitResult result) const {
  const JobRecord &base = request.initial_record;

  switch (result.error) {
  case SplitError::None:
    if (result.outputs.empty()) {
      LOG_ERROR("Job {} splitter reported success without outputs",
                request.job_id);
      return base.failed(GENERIC_ERROR_MESSAGE);
    }
    return base.completed(std::move(result.outputs));

  case SplitError::DurationUnavailable:
    LOG_ERROR("Job {} failed while determining duration: {}", request.job_id,
              result.diagnostic);
    return base.failed(
        result.diagnostic.empty()
            ? std::string("Unable to determine the video duration.")
            : sanitize_diagnostic(result.diagnostic, max_diagnostic_chars_));

  case SplitError::ExternalToolFailure:
    LOG_ERROR("Job {} failed while splitting video: {}", request.job_id,
              result.diagnostic);
    return base.failed(
        result.diagnostic.empty()
            ? std::string("The video could not be split.")
            : sanitize_diagnostic(result.diagnostic, max_diagnostic_chars_));
  }

  return base.failed(GENERIC_ERROR_MESSAGE);
}

void JobRunner::persist_terminal(const JobRequest &request,
                                 const JobRecord &record) {
  auto outcome = store_.update(request.job_id, [&](JobRecord &current) {
    if (is_terminal(current.status)) {
      LOG_WARN("Job {} already {}, keeping persisted outcome", request.job_id,
               to_string(current.status));
      return false;
    }
    current = record;
    return true;
  });

  switch (outcome) {
  case UpdateOutcome::Written:
  case UpdateOutcome::Unchanged:
    return;
  case UpdateOutcome::Missing:
    /// Initial document unreadable; the terminal record replaces it
    LOG_WARN("Job {} had no readable record, writing terminal record",
             request.job_id);
    if (!store_.put(request.job_id, record)) {
      LOG_ERROR("Job {} terminal record could not be saved", request.job_id);
    }
    return;
  case UpdateOutcome::Failed:
    LOG_ERROR("Job {} terminal record could not be saved", request.job_id);
    return;
  }
}

} // namespace clip_split
