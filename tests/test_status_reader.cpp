/**
 * @file test_status_reader.cpp
 * @brief Tests for status_reader.hpp
 */

#include "clip_split/status_reader.hpp"

#include <catch2/catch.hpp>

#include "test_helpers.hpp"

using namespace clip_split;
using namespace clip_split::test;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

JobRecord put_record(MetadataStore &store, const JobRecord &record) {
  REQUIRE(store.create_job_dir(record.job_id));
  REQUIRE(store.put(record.job_id, record));
  return record;
}

} // anonymous namespace

// ============================================================================
// query
// ============================================================================

TEST_CASE("StatusReader reports unknown jobs as not found", "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path());
  StatusReader reader(store);

  const std::string id = generate_job_id();
  JobView view = reader.query(id);
  CHECK_FALSE(view.found);
  CHECK(view.files.empty());

  json payload = to_payload(view);
  CHECK(payload == json{{"job_id", id}, {"status", "not-found"}});

  /// Querying never creates anything
  CHECK_FALSE(fs::exists(store.job_dir(id)));
}

TEST_CASE("StatusReader lists no files while processing", "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path());
  StatusReader reader(store);

  auto record = put_record(
      store, JobRecord::make_initial(generate_job_id(), "clip.mp4", 3));
  /// Parts being written while the job runs are not offered yet
  write_file(store.job_dir(record.job_id) / "clip_part1.mp4", "1");

  JobView view = reader.query(record.job_id);
  REQUIRE(view.found);
  CHECK(view.status() == JobStatus::Processing);
  CHECK(view.files.empty());

  json payload = to_payload(view);
  CHECK(payload.at("status") == "processing");
  CHECK(payload.at("files") == json::array());
  CHECK(payload.at("metadata").at("parts") == 3);
}

TEST_CASE("StatusReader reports the outputs of a completed job",
          "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path());
  StatusReader reader(store);

  auto record = put_record(
      store, JobRecord::make_initial(generate_job_id(), "clip.mp4", 2)
                 .completed({"clip_part1.mp4", "clip_part2.mp4"}));

  JobView view = reader.query(record.job_id);
  REQUIRE(view.found);
  CHECK(view.status() == JobStatus::Completed);
  CHECK(view.files == record.outputs);
  CHECK(view.record == record);
}

TEST_CASE("StatusReader reports an error job with its message",
          "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path());
  StatusReader reader(store);

  auto record = put_record(
      store, JobRecord::make_initial(generate_job_id(), "clip.mp4", 2)
                 .failed("Unable to determine duration for clip.mp4"));

  JobView view = reader.query(record.job_id);
  REQUIRE(view.found);
  CHECK(view.status() == JobStatus::Error);
  CHECK(view.files.empty());

  json payload = to_payload(view);
  CHECK(payload.at("status") == "error");
  CHECK(payload.at("metadata").at("error_message") ==
        "Unable to determine duration for clip.mp4");
}

TEST_CASE("StatusReader treats a corrupt record as not found", "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path());
  StatusReader reader(store);

  const std::string id = generate_job_id();
  REQUIRE(store.create_job_dir(id));
  write_file(store.document_path(id), "{\"job_id\":");

  CHECK_FALSE(reader.query(id).found);
  /// The damaged document is left for inspection
  CHECK(read_file(store.document_path(id)) == "{\"job_id\":");
}

TEST_CASE("StatusReader payloads are stable between queries", "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path());
  StatusReader reader(store);

  auto record = put_record(
      store, JobRecord::make_initial(generate_job_id(), "clip.mp4", 3)
                 .completed({"clip_part1.mp4", "clip_part2.mp4",
                             "clip_part3.mp4"}));

  const std::string first = to_payload(reader.query(record.job_id)).dump();
  const std::string second = to_payload(reader.query(record.job_id)).dump();
  CHECK(first == second);
}

// ============================================================================
// Output reconciliation
// ============================================================================

TEST_CASE("StatusReader restores missing outputs from the directory",
          "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path());
  StatusReader reader(store);

  auto record = put_record(
      store,
      JobRecord::make_initial(generate_job_id(), "clip.mp4", 2).completed({}));
  write_file(store.job_dir(record.job_id) / "clip_part2.mp4", "2");
  write_file(store.job_dir(record.job_id) / "clip_part1.mp4", "1");

  JobView view = reader.query(record.job_id);
  REQUIRE(view.found);
  const std::vector<std::string> expected{"clip_part1.mp4", "clip_part2.mp4"};
  CHECK(view.files == expected);
  CHECK(view.record.outputs == expected);

  /// The correction is persisted without touching anything else
  auto stored = store.get(record.job_id);
  REQUIRE(stored.has_value());
  CHECK(stored->outputs == expected);
  CHECK(stored->status == JobStatus::Completed);
  CHECK(stored->created_at == record.created_at);
  CHECK(stored->completed_at == record.completed_at);
  CHECK(stored->original_filename == record.original_filename);
  CHECK(stored->parts == record.parts);

  /// Subsequent queries read the healed record and agree
  CHECK(to_payload(reader.query(record.job_id)).dump() ==
        to_payload(view).dump());
}

TEST_CASE("StatusReader leaves an empty completed job unchanged",
          "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path());
  StatusReader reader(store);

  auto record = put_record(
      store,
      JobRecord::make_initial(generate_job_id(), "clip.mp4", 2).completed({}));

  JobView view = reader.query(record.job_id);
  CHECK(view.files.empty());
  CHECK(store.get(record.job_id) == record);
}

TEST_CASE("StatusReader never reconciles an error job", "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path());
  StatusReader reader(store);

  auto record = put_record(
      store,
      JobRecord::make_initial(generate_job_id(), "clip.mp4", 2).failed("x"));
  write_file(store.job_dir(record.job_id) / "clip_part1.mp4", "1");

  JobView view = reader.query(record.job_id);
  CHECK(view.files.empty());
  CHECK(store.get(record.job_id) == record);
}

// ============================================================================
// resolve_download
// ============================================================================

TEST_CASE("StatusReader resolves artifacts of existing jobs", "[status]") {
  TempDir tmp;
  MetadataStore store(tmp.path() / "outputs");
  StatusReader reader(store);

  auto record = put_record(
      store, JobRecord::make_initial(generate_job_id(), "clip.mp4", 2)
                 .completed({"clip_part1.mp4", "clip_part2.mp4"}));
  write_file(store.job_dir(record.job_id) / "clip_part1.mp4", "1");
  write_file(tmp.path() / "secret.txt", "s");

  SECTION("existing artifact") {
    auto path = reader.resolve_download(record.job_id, "clip_part1.mp4");
    REQUIRE(path.has_value());
    CHECK(*path == store.job_dir(record.job_id) / "clip_part1.mp4");
  }

  SECTION("listed but absent file") {
    CHECK_FALSE(
        reader.resolve_download(record.job_id, "clip_part2.mp4").has_value());
  }

  SECTION("unknown job") {
    CHECK_FALSE(reader.resolve_download(generate_job_id(), "clip_part1.mp4")
                    .has_value());
  }

  SECTION("store files are not downloadable") {
    CHECK_FALSE(
        reader.resolve_download(record.job_id, METADATA_FILENAME).has_value());
  }

  SECTION("names that leave the job directory") {
    for (const std::string name :
         {"", ".", "..", "../../secret.txt", "sub/clip_part1.mp4",
          "..\\secret.txt", "/etc/passwd"}) {
      CHECK_FALSE(reader.resolve_download(record.job_id, name).has_value());
    }
  }
}
