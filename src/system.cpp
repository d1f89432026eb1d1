/**
 * @file system.cpp
 * @brief Clock, identifier and filename utilities implementation
 */

#include "clip_split/system.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <random>

#include <fmt/core.h>

namespace clip_split {

// **---- Internal Helpers ----**

namespace {

/// Extensions accepted for upload (lowercase, no dot)
const std::array<const char *, 1> ALLOWED_EXTENSIONS = {"mp4"};

} // anonymous namespace

// **---- Clock ----**

std::string iso_now() {
  auto now = std::chrono::system_clock::now();
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                now.time_since_epoch())
                .count() %
            1000000;

  std::tm tm{};
  gmtime_r(&secs, &tm);
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d}+00:00",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, static_cast<long>(us));
}

// **---- Identifiers ----**

std::string generate_job_id() {
  /// One engine per thread; seeded from the OS entropy source
  thread_local std::mt19937_64 engine{[] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }()};

  std::uniform_int_distribution<uint64_t> dist;
  return fmt::format("{:016x}{:016x}", dist(engine), dist(engine));
}

bool is_valid_job_id(const std::string &job_id) {
  if (job_id.size() != 32)
    return false;
  return std::all_of(job_id.begin(), job_id.end(), [](unsigned char c) {
    return std::isdigit(c) || (c >= 'a' && c <= 'f');
  });
}

// **---- Filenames ----**

std::string sanitize_filename(const std::string &filename) {
  /// Keep only the last path component (either separator style)
  std::string base = filename;
  size_t slash = base.find_last_of("/\\");
  if (slash != std::string::npos)
    base = base.substr(slash + 1);

  std::string out;
  out.reserve(base.size());
  for (unsigned char c : base) {
    if (std::isspace(c)) {
      out += '_';
    } else if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
      out += static_cast<char>(c);
    }
  }

  size_t first = out.find_first_not_of('.');
  return first == std::string::npos ? std::string() : out.substr(first);
}

bool allowed_extension(const std::string &filename) {
  size_t dot = filename.rfind('.');
  if (dot == std::string::npos || dot + 1 == filename.size())
    return false;

  std::string ext = filename.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return std::find(ALLOWED_EXTENSIONS.begin(), ALLOWED_EXTENSIONS.end(), ext) !=
         ALLOWED_EXTENSIONS.end();
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace clip_split
