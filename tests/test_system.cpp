/**
 * @file test_system.cpp
 * @brief Tests for system.hpp
 */

#include "clip_split/system.hpp"

#include <set>

#include <catch2/catch.hpp>

using namespace clip_split;

TEST_CASE("sanitize_filename keeps safe basenames", "[system]") {
  CHECK(sanitize_filename("clip.mp4") == "clip.mp4");
  CHECK(sanitize_filename("my clip.mp4") == "my_clip.mp4");
  CHECK(sanitize_filename("a-b_c.MP4") == "a-b_c.MP4");
}

TEST_CASE("sanitize_filename strips paths and unsafe characters",
          "[system]") {
  CHECK(sanitize_filename("../../etc/passwd") == "passwd");
  CHECK(sanitize_filename("C:\\Users\\me\\video.mp4") == "video.mp4");
  CHECK(sanitize_filename("v\xc3\xa9""deo$.mp4") == "vdeo.mp4");
  CHECK(sanitize_filename("...hidden.mp4") == "hidden.mp4");
  CHECK(sanitize_filename("///").empty());
  CHECK(sanitize_filename("").empty());
}

TEST_CASE("allowed_extension accepts mp4 only", "[system]") {
  CHECK(allowed_extension("clip.mp4"));
  CHECK(allowed_extension("clip.MP4"));
  CHECK(allowed_extension("archive.tar.mp4"));
  CHECK_FALSE(allowed_extension("clip.mkv"));
  CHECK_FALSE(allowed_extension("clip"));
  CHECK_FALSE(allowed_extension("clip."));
  CHECK_FALSE(allowed_extension("mp4"));
}

TEST_CASE("generate_job_id yields unique 32-hex identifiers", "[system]") {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    std::string id = generate_job_id();
    REQUIRE(is_valid_job_id(id));
    ids.insert(id);
  }
  CHECK(ids.size() == 1000);
}

TEST_CASE("is_valid_job_id rejects malformed ids", "[system]") {
  CHECK_FALSE(is_valid_job_id(""));
  CHECK_FALSE(is_valid_job_id("../outputs"));
  CHECK_FALSE(is_valid_job_id(std::string(32, 'g')));
  CHECK_FALSE(is_valid_job_id(std::string(32, 'A')));
  CHECK_FALSE(is_valid_job_id(std::string(31, 'a')));
  CHECK(is_valid_job_id(std::string(32, 'a')));
}

TEST_CASE("iso_now renders UTC with microseconds", "[system]") {
  std::string ts = iso_now();
  // 2026-01-01T10:00:00.123456+00:00
  REQUIRE(ts.size() == 32);
  CHECK(ts[4] == '-');
  CHECK(ts[10] == 'T');
  CHECK(ts[19] == '.');
  CHECK(ts.substr(26) == "+00:00");
}

TEST_CASE("format_time renders HH:MM:SS", "[system]") {
  CHECK(format_time(0) == "00:00:00");
  CHECK(format_time(9.0) == "00:00:09");
  CHECK(format_time(3725.4) == "01:02:05");
}
