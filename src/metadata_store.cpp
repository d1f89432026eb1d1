/**
 * @file metadata_store.cpp
 * @brief Crash-safe per-job metadata document storage implementation
 */

#include "clip_split/metadata_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

#include "clip_split/logging.hpp"
#include "clip_split/system.hpp"
#include "clip_split/types.hpp"

namespace clip_split {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

/// Write the whole buffer, retrying on short writes and EINTR
bool write_all(int fd, const std::string &data) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

/// Persist the rename itself; failure only weakens durability, not atomicity
void sync_directory(const fs::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd == -1)
    return;
  if (::fsync(fd) != 0) {
    LOG_DEBUG("fsync of directory {} failed: {}", dir.string(),
              std::strerror(errno));
  }
  ::close(fd);
}

} // anonymous namespace

MetadataStore::MetadataStore(fs::path outputs_root)
    : root_(std::move(outputs_root)),
      instance_token_(generate_job_id().substr(0, 16)) {}

// **---- Paths ----**

bool MetadataStore::is_safe_id(const std::string &job_id) {
  return !job_id.empty() && job_id != "." && job_id != ".." &&
         job_id.find('/') == std::string::npos &&
         job_id.find('\\') == std::string::npos &&
         job_id.find('\0') == std::string::npos;
}

fs::path MetadataStore::job_dir(const std::string &job_id) const {
  return root_ / job_id;
}

fs::path MetadataStore::document_path(const std::string &job_id) const {
  return job_dir(job_id) / METADATA_FILENAME;
}

bool MetadataStore::exists(const std::string &job_id) const {
  if (!is_safe_id(job_id))
    return false;
  std::error_code ec;
  return fs::is_directory(job_dir(job_id), ec);
}

bool MetadataStore::create_job_dir(const std::string &job_id) const {
  if (!is_safe_id(job_id)) {
    LOG_ERROR("Refusing to create directory for job id '{}'", job_id);
    return false;
  }
  std::error_code ec;
  fs::create_directories(job_dir(job_id), ec);
  if (ec) {
    LOG_ERROR("Failed to create job directory {}: {}",
              job_dir(job_id).string(), ec.message());
    return false;
  }
  return true;
}

bool MetadataStore::is_internal_file(const std::string &filename) {
  if (filename == METADATA_FILENAME)
    return true;

  /// In-flight documents: metadata.json.<unique>.tmp
  const std::string prefix = std::string(METADATA_FILENAME) + ".";
  const std::string suffix = TEMP_SUFFIX;
  return filename.size() > prefix.size() + suffix.size() &&
         filename.compare(0, prefix.size(), prefix) == 0 &&
         filename.compare(filename.size() - suffix.size(), suffix.size(),
                          suffix) == 0;
}

std::mutex &MetadataStore::lock_for(const std::string &job_id) {
  return locks_[std::hash<std::string>{}(job_id) % LOCK_STRIPES];
}

// **---- Writes ----**

bool MetadataStore::put(const std::string &job_id, const JobRecord &record) {
  if (!is_safe_id(job_id)) {
    LOG_ERROR("Refusing to write metadata for job id '{}'", job_id);
    return false;
  }
  std::lock_guard<std::mutex> lock(lock_for(job_id));
  return write_document(job_id, record);
}

UpdateOutcome MetadataStore::update(const std::string &job_id,
                                    const Mutator &mutator) {
  if (!is_safe_id(job_id))
    return UpdateOutcome::Missing;

  std::lock_guard<std::mutex> lock(lock_for(job_id));

  auto current = read_document(job_id);
  if (!current)
    return UpdateOutcome::Missing;

  if (!mutator(*current))
    return UpdateOutcome::Unchanged;

  return write_document(job_id, *current) ? UpdateOutcome::Written
                                          : UpdateOutcome::Failed;
}

bool MetadataStore::write_document(const std::string &job_id,
                                   const JobRecord &record) {
  const fs::path dir = job_dir(job_id);
  const fs::path target = dir / METADATA_FILENAME;
  const fs::path temp =
      dir / fmt::format("{}.{}.{}.{}{}", METADATA_FILENAME, ::getpid(),
                        instance_token_, temp_counter_.fetch_add(1),
                        TEMP_SUFFIX);

  /// Tool diagnostics may carry invalid UTF-8; replace rather than throw
  const std::string content =
      json(record).dump(2, ' ', false, json::error_handler_t::replace) + "\n";

  int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd == -1) {
    LOG_ERROR("Failed to create {}: {}", temp.string(), std::strerror(errno));
    return false;
  }

  bool ok = write_all(fd, content);
  if (!ok) {
    LOG_ERROR("Failed to write {}: {}", temp.string(), std::strerror(errno));
  } else if (::fsync(fd) != 0) {
    LOG_ERROR("Failed to fsync {}: {}", temp.string(), std::strerror(errno));
    ok = false;
  }

  if (::close(fd) != 0 && ok) {
    LOG_ERROR("Failed to close {}: {}", temp.string(), std::strerror(errno));
    ok = false;
  }

  /// The single atomic step: readers switch from old to new document here
  if (ok && ::rename(temp.c_str(), target.c_str()) != 0) {
    LOG_ERROR("Failed to replace {}: {}", target.string(),
              std::strerror(errno));
    ok = false;
  }

  if (!ok) {
    ::unlink(temp.c_str());
    return false;
  }

  sync_directory(dir);
  LOG_DEBUG("Saved metadata to {} (status {})", target.string(),
            to_string(record.status));
  return true;
}

// **---- Reads ----**

std::optional<JobRecord> MetadataStore::get(const std::string &job_id) const {
  if (!is_safe_id(job_id))
    return std::nullopt;
  return read_document(job_id);
}

std::optional<JobRecord>
MetadataStore::read_document(const std::string &job_id) const {
  const fs::path path = document_path(job_id);

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
      LOG_ERROR("Failed to open metadata at {}", path.string());
    }
    return std::nullopt;
  }

  try {
    json doc = json::parse(in);
    return doc.get<JobRecord>();
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to parse metadata at {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}

std::vector<std::string>
MetadataStore::list_artifacts(const std::string &job_id) const {
  std::vector<std::string> files;
  if (!is_safe_id(job_id))
    return files;

  std::error_code ec;
  fs::directory_iterator it(job_dir(job_id), ec);
  if (ec) {
    LOG_WARN("Cannot list {}: {}", job_dir(job_id).string(), ec.message());
    return files;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec))
      continue;
    std::string name = it->path().filename().string();
    if (!is_internal_file(name))
      files.push_back(std::move(name));
  }
  if (ec) {
    LOG_WARN("Listing {} stopped early: {}", job_dir(job_id).string(),
             ec.message());
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace clip_split
