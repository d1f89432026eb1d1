/**
 * @file job_service.cpp
 * @brief Submission and query facade implementation
 */

#include "clip_split/job_service.hpp"

#include <system_error>

#include "clip_split/config.hpp"
#include "clip_split/logging.hpp"
#include "clip_split/system.hpp"
#include "clip_split/types.hpp"

namespace clip_split {

namespace fs = std::filesystem;

const char *describe(SubmitError error) {
  switch (error) {
  case SubmitError::None:
    return "OK";
  case SubmitError::EmptyFilename:
    return "Please choose an MP4 file to upload.";
  case SubmitError::UnsupportedFileType:
    return "Only MP4 files are supported.";
  case SubmitError::InvalidPartCount:
    return "Please choose between 2 and 4 parts.";
  case SubmitError::SourceMissing:
    return "The uploaded file could not be found.";
  case SubmitError::StorageFailure:
    return "The job could not be created.";
  case SubmitError::ShuttingDown:
    return "The service is shutting down.";
  }
  return "Unknown error.";
}

JobService::JobService(const fs::path &data_dir, Splitter &splitter,
                       int num_workers)
    : uploads_root_(data_dir / UPLOADS_DIRNAME),
      outputs_root_(data_dir / OUTPUTS_DIRNAME), store_(outputs_root_),
      reader_(store_),
      runner_(store_, splitter, num_workers,
              static_cast<size_t>(Config::max_diagnostic_chars())) {
  fs::create_directories(uploads_root_);
  fs::create_directories(outputs_root_);
  LOG_INFO("Data directory: {}", data_dir.string());
}

SubmitError JobService::validate(const std::string &filename, int parts) {
  const std::string name = sanitize_filename(filename);
  if (name.empty())
    return SubmitError::EmptyFilename;
  if (!allowed_extension(name))
    return SubmitError::UnsupportedFileType;
  if (parts < MIN_PARTS || parts > MAX_PARTS)
    return SubmitError::InvalidPartCount;
  return SubmitError::None;
}

bool JobService::place_input(const fs::path &source, const fs::path &dest,
                             bool keep_source) {
  std::error_code ec;
  if (!keep_source) {
    fs::rename(source, dest, ec);
    if (!ec)
      return true;
    LOG_DEBUG("Rename of {} failed ({}), copying instead", source.string(),
              ec.message());
    ec.clear();
  }

  fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    LOG_ERROR("Failed to store upload {} as {}: {}", source.string(),
              dest.string(), ec.message());
    return false;
  }

  if (!keep_source) {
    fs::remove(source, ec);
    if (ec) {
      LOG_WARN("Copied {} but could not remove it: {}", source.string(),
               ec.message());
    }
  }
  return true;
}

void JobService::restore_input(const fs::path &saved,
                               const fs::path &source) {
  std::error_code ec;
  fs::rename(saved, source, ec);
  if (!ec)
    return;

  LOG_DEBUG("Rename of {} back to {} failed ({}), copying instead",
            saved.string(), source.string(), ec.message());
  ec.clear();
  fs::copy_file(saved, source, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    LOG_ERROR("Could not return {} to {}: {}", saved.string(), source.string(),
              ec.message());
  }
}

SubmitResult JobService::submit(const fs::path &source,
                                const std::string &original_filename,
                                int parts, bool keep_source) {
  LOG_INFO("Received upload request: filename={} parts={}", original_filename,
           parts);

  SubmitResult result;
  result.error = validate(original_filename, parts);
  if (result.error != SubmitError::None) {
    LOG_WARN("Rejected upload {}: {}", original_filename,
             describe(result.error));
    return result;
  }

  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    LOG_WARN("Rejected upload {}: {} does not exist", original_filename,
             source.string());
    result.error = SubmitError::SourceMissing;
    return result;
  }

  const std::string job_id = generate_job_id();
  const std::string filename = sanitize_filename(original_filename);
  const fs::path upload_dir = uploads_root_ / job_id;
  const fs::path saved_file = upload_dir / filename;

  // **----- LAYOUT -----**

  fs::create_directories(upload_dir, ec);
  if (ec || !store_.create_job_dir(job_id)) {
    if (ec) {
      LOG_ERROR("Failed to create {}: {}", upload_dir.string(), ec.message());
    }
    discard_job(job_id);
    result.error = SubmitError::StorageFailure;
    return result;
  }

  LOG_INFO("Saving uploaded file to {}", saved_file.string());
  if (!place_input(source, saved_file, keep_source)) {
    discard_job(job_id);
    result.error = SubmitError::StorageFailure;
    return result;
  }

  // **----- INITIAL RECORD -----**

  JobRecord initial = JobRecord::make_initial(job_id, filename, parts);
  if (!store_.put(job_id, initial)) {
    if (!keep_source)
      restore_input(saved_file, source);
    discard_job(job_id);
    result.error = SubmitError::StorageFailure;
    return result;
  }

  // **----- QUEUE -----**

  JobRequest request;
  request.job_id = job_id;
  request.source_path = saved_file;
  request.output_dir = store_.job_dir(job_id);
  request.parts = parts;
  request.initial_record = initial;

  if (!runner_.submit(std::move(request))) {
    if (!keep_source)
      restore_input(saved_file, source);
    discard_job(job_id);
    result.error = SubmitError::ShuttingDown;
    return result;
  }

  result.job_id = job_id;
  return result;
}

void JobService::discard_job(const std::string &job_id) {
  std::error_code ec;
  fs::remove_all(uploads_root_ / job_id, ec);
  if (ec) {
    LOG_WARN("Could not remove upload directory of job {}: {}", job_id,
             ec.message());
  }
  ec.clear();
  fs::remove_all(store_.job_dir(job_id), ec);
  if (ec) {
    LOG_WARN("Could not remove output directory of job {}: {}", job_id,
             ec.message());
  }
}

} // namespace clip_split
