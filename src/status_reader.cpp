/**
 * @file status_reader.cpp
 * @brief Query-time view of a job
 */

#include "clip_split/status_reader.hpp"

#include <system_error>

#include "clip_split/logging.hpp"

namespace clip_split {

namespace fs = std::filesystem;
using json = nlohmann::json;

json to_payload(const JobView &view) {
  if (!view.found) {
    return json{{"job_id", view.job_id}, {"status", "not-found"}};
  }
  return json{{"job_id", view.job_id},
              {"status", to_string(view.record.status)},
              {"metadata", view.record},
              {"files", view.files}};
}

StatusReader::StatusReader(MetadataStore &store) : store_(store) {}

JobView StatusReader::query(const std::string &job_id) {
  JobView view;
  view.job_id = job_id;

  auto record = store_.get(job_id);
  if (!record) {
    LOG_DEBUG("Status requested for missing job {}", job_id);
    return view;
  }

  view.found = true;
  view.record = std::move(*record);

  if (view.record.status != JobStatus::Completed) {
    if (view.record.status == JobStatus::Error) {
      LOG_DEBUG("Job {} is in error state: {}", job_id,
                view.record.error_message.value_or(""));
    }
    return view;
  }

  view.files = view.record.outputs;
  if (view.files.empty()) {
    /// Records without an outputs list: derive it from the directory
    view.files = store_.list_artifacts(job_id);
  }

  if (view.files != view.record.outputs) {
    view.record.outputs = view.files;
    heal_outputs(job_id, view.files);
  }

  LOG_DEBUG("Returning status for job {}: {} with {} files", job_id,
            to_string(view.record.status), view.files.size());
  return view;
}

void StatusReader::heal_outputs(const std::string &job_id,
                                const std::vector<std::string> &files) {
  auto outcome = store_.update(job_id, [&files](JobRecord &current) {
    if (current.status != JobStatus::Completed || !current.outputs.empty())
      return false;
    current.outputs = files;
    return true;
  });

  switch (outcome) {
  case UpdateOutcome::Written:
    LOG_INFO("Job {} outputs restored from directory listing ({} files)",
             job_id, files.size());
    break;
  case UpdateOutcome::Failed:
    LOG_WARN("Job {} outputs could not be corrected on disk", job_id);
    break;
  case UpdateOutcome::Unchanged:
  case UpdateOutcome::Missing:
    break;
  }
}

std::optional<fs::path>
StatusReader::resolve_download(const std::string &job_id,
                               const std::string &filename) const {
  if (!store_.exists(job_id))
    return std::nullopt;

  /// Bare names only: no separators, no dot entries, no store files
  if (filename.empty() || filename == "." || filename == ".." ||
      fs::path(filename).filename().string() != filename ||
      filename.find('\\') != std::string::npos ||
      MetadataStore::is_internal_file(filename)) {
    LOG_WARN("Rejected download of '{}' from job {}", filename, job_id);
    return std::nullopt;
  }

  fs::path path = store_.job_dir(job_id) / filename;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return std::nullopt;

  LOG_INFO("Downloading {} from job {}", filename, job_id);
  return path;
}

} // namespace clip_split
