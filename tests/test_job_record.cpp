/**
 * @file test_job_record.cpp
 * @brief Tests for job_record.hpp
 */

#include "clip_split/job_record.hpp"

#include <catch2/catch.hpp>

using namespace clip_split;
using json = nlohmann::json;

TEST_CASE("JobStatus string conversions", "[record]") {
  CHECK(std::string(to_string(JobStatus::Processing)) == "processing");
  CHECK(std::string(to_string(JobStatus::Completed)) == "completed");
  CHECK(std::string(to_string(JobStatus::Error)) == "error");

  CHECK(parse_job_status("completed") == JobStatus::Completed);
  CHECK_FALSE(parse_job_status("unknown").has_value());
  CHECK_FALSE(parse_job_status("Completed").has_value());
}

TEST_CASE("JobRecord transitions", "[record]") {
  JobRecord initial = JobRecord::make_initial("abc", "clip.mp4", 3);
  CHECK(initial.status == JobStatus::Processing);
  CHECK_FALSE(initial.created_at.empty());
  CHECK_FALSE(initial.completed_at.has_value());
  CHECK(initial.outputs.empty());
  CHECK_FALSE(initial.error_message.has_value());

  SECTION("completed keeps identity and sets outputs") {
    JobRecord done = initial.completed({"clip_part1.mp4", "clip_part2.mp4"});
    CHECK(done.status == JobStatus::Completed);
    CHECK(done.job_id == "abc");
    CHECK(done.created_at == initial.created_at);
    CHECK(done.completed_at.has_value());
    CHECK(done.outputs.size() == 2);
    CHECK_FALSE(done.error_message.has_value());
  }

  SECTION("failed clears outputs and sets the message") {
    JobRecord err = initial.failed("boom");
    CHECK(err.status == JobStatus::Error);
    CHECK(err.outputs.empty());
    CHECK(err.error_message == std::string("boom"));
    CHECK(err.completed_at.has_value());
    CHECK(err.parts == 3);
  }
}

TEST_CASE("JobRecord JSON uses metadata.json field names", "[record]") {
  JobRecord record = JobRecord::make_initial("abc", "clip.mp4", 2);
  json j = record;

  CHECK(j.at("job_id") == "abc");
  CHECK(j.at("original_filename") == "clip.mp4");
  CHECK(j.at("parts") == 2);
  CHECK(j.at("status") == "processing");
  CHECK(j.at("outputs").is_array());
  CHECK_FALSE(j.contains("completed_at"));
  CHECK_FALSE(j.contains("error_message"));

  json e = record.failed("bad input");
  CHECK(e.at("status") == "error");
  CHECK(e.at("error_message") == "bad input");
  CHECK(e.contains("completed_at"));
}

TEST_CASE("JobRecord JSON round-trip for every status", "[record]") {
  JobRecord initial = JobRecord::make_initial("id1", "a.mp4", 4);
  auto status = GENERATE(JobStatus::Processing, JobStatus::Completed,
                         JobStatus::Error);

  JobRecord record = initial;
  if (status == JobStatus::Completed)
    record = initial.completed({"a_part1.mp4", "a_part2.mp4", "a_part3.mp4",
                                "a_part4.mp4"});
  else if (status == JobStatus::Error)
    record = initial.failed("Unable to determine duration for a.mp4");

  json j = record;
  CHECK(j.get<JobRecord>() == record);
}

TEST_CASE("JobRecord JSON rejects bad documents", "[record]") {
  json good = JobRecord::make_initial("id1", "a.mp4", 2);

  SECTION("unknown status") {
    json bad = good;
    bad["status"] = "unknown";
    CHECK_THROWS(bad.get<JobRecord>());
  }

  SECTION("missing field") {
    json bad = good;
    bad.erase("job_id");
    CHECK_THROWS(bad.get<JobRecord>());
  }

  SECTION("wrong type") {
    json bad = good;
    bad["parts"] = "three";
    CHECK_THROWS(bad.get<JobRecord>());
  }
}

TEST_CASE("JobRecord JSON tolerates null optional fields", "[record]") {
  json j = JobRecord::make_initial("id1", "a.mp4", 2);
  j["completed_at"] = nullptr;
  j["error_message"] = nullptr;
  j["outputs"] = nullptr;

  JobRecord record = j.get<JobRecord>();
  CHECK_FALSE(record.completed_at.has_value());
  CHECK_FALSE(record.error_message.has_value());
  CHECK(record.outputs.empty());
}
