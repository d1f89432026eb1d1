/**
 * @file job_record.cpp
 * @brief JobRecord transitions and JSON codec
 */

#include "clip_split/job_record.hpp"

#include <stdexcept>

#include "clip_split/system.hpp"

namespace clip_split {

using json = nlohmann::json;

// **---- JobStatus ----**

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Processing:
    return "processing";
  case JobStatus::Completed:
    return "completed";
  case JobStatus::Error:
    return "error";
  }
  return "unknown";
}

std::optional<JobStatus> parse_job_status(const std::string &text) {
  if (text == "processing")
    return JobStatus::Processing;
  if (text == "completed")
    return JobStatus::Completed;
  if (text == "error")
    return JobStatus::Error;
  return std::nullopt;
}

// **---- JobRecord ----**

bool JobRecord::operator==(const JobRecord &other) const {
  return job_id == other.job_id &&
         original_filename == other.original_filename &&
         parts == other.parts && status == other.status &&
         created_at == other.created_at &&
         completed_at == other.completed_at && outputs == other.outputs &&
         error_message == other.error_message;
}

JobRecord JobRecord::make_initial(std::string job_id,
                                  std::string original_filename, int parts) {
  JobRecord record;
  record.job_id = std::move(job_id);
  record.original_filename = std::move(original_filename);
  record.parts = parts;
  record.status = JobStatus::Processing;
  record.created_at = iso_now();
  return record;
}

JobRecord JobRecord::completed(std::vector<std::string> files) const {
  JobRecord next = *this;
  next.status = JobStatus::Completed;
  next.completed_at = iso_now();
  next.outputs = std::move(files);
  next.error_message.reset();
  return next;
}

JobRecord JobRecord::failed(std::string message) const {
  JobRecord next = *this;
  next.status = JobStatus::Error;
  next.completed_at = iso_now();
  next.outputs.clear();
  next.error_message = std::move(message);
  return next;
}

// **---- JSON ----**

void to_json(json &j, const JobRecord &record) {
  j = json{{"job_id", record.job_id},
           {"original_filename", record.original_filename},
           {"parts", record.parts},
           {"status", to_string(record.status)},
           {"created_at", record.created_at},
           {"outputs", record.outputs}};
  if (record.completed_at)
    j["completed_at"] = *record.completed_at;
  if (record.error_message)
    j["error_message"] = *record.error_message;
}

void from_json(const json &j, JobRecord &record) {
  j.at("job_id").get_to(record.job_id);
  j.at("original_filename").get_to(record.original_filename);
  j.at("parts").get_to(record.parts);
  j.at("created_at").get_to(record.created_at);

  std::string status_text = j.at("status").get<std::string>();
  auto status = parse_job_status(status_text);
  if (!status) {
    throw std::runtime_error("unknown job status '" + status_text + "'");
  }
  record.status = *status;

  record.outputs.clear();
  if (j.contains("outputs") && !j.at("outputs").is_null())
    j.at("outputs").get_to(record.outputs);

  record.completed_at.reset();
  if (j.contains("completed_at") && !j.at("completed_at").is_null())
    record.completed_at = j.at("completed_at").get<std::string>();

  record.error_message.reset();
  if (j.contains("error_message") && !j.at("error_message").is_null())
    record.error_message = j.at("error_message").get<std::string>();
}

} // namespace clip_split
