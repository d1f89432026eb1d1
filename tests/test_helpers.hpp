/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the Clip Split tests
 */

#ifndef CLIP_SPLIT_TEST_HELPERS_HPP
#define CLIP_SPLIT_TEST_HELPERS_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "clip_split/ffmpeg_splitter.hpp"
#include "clip_split/splitter.hpp"
#include "clip_split/system.hpp"

namespace clip_split {
namespace test {

namespace fs = std::filesystem;

// ============================================================================
// TempDir: unique scratch directory removed on destruction
// ============================================================================

class TempDir {
public:
  TempDir()
      : path_(fs::temp_directory_path() /
              ("clip_split_test_" + generate_job_id())) {
    fs::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

inline void write_file(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

// ============================================================================
// FakeSplitter: scripted Splitter that writes placeholder part files
// ============================================================================

class FakeSplitter : public Splitter {
public:
  using Behaviour = std::function<SplitResult(
      const fs::path &, const fs::path &, int)>;

  /// Default behaviour: write one small file per part and succeed
  FakeSplitter() = default;
  explicit FakeSplitter(Behaviour behaviour)
      : behaviour_(std::move(behaviour)) {}

  /// Time each call blocks before producing its result
  void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

  SplitResult split(const fs::path &source, const fs::path &output_dir,
                    int parts) override {
    int now = ++running_;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      max_running_ = std::max(max_running_, now);
      sources_.push_back(source.filename().string());
      source_existed_.push_back(fs::exists(source));
    }
    ++calls_;

    struct Leave {
      std::atomic<int> &r;
      ~Leave() { --r; }
    } leave{running_};

    if (delay_.count() > 0)
      std::this_thread::sleep_for(delay_);

    if (behaviour_)
      return behaviour_(source, output_dir, parts);
    return write_parts(source, output_dir, parts);
  }

  static SplitResult write_parts(const fs::path &source,
                                 const fs::path &output_dir, int parts) {
    std::vector<std::string> names;
    for (int i = 1; i <= parts; ++i) {
      std::string name = part_filename(source, i);
      write_file(output_dir / name, "part");
      names.push_back(name);
    }
    return SplitResult::success(std::move(names));
  }

  int calls() const { return calls_.load(); }

  int max_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_running_;
  }

  std::vector<std::string> sources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_;
  }

  std::vector<bool> source_existed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return source_existed_;
  }

private:
  Behaviour behaviour_;
  std::chrono::milliseconds delay_{0};
  std::atomic<int> running_{0};
  std::atomic<int> calls_{0};
  mutable std::mutex mutex_;
  int max_running_ = 0;
  std::vector<std::string> sources_;
  std::vector<bool> source_existed_;
};

} // namespace test
} // namespace clip_split

#endif // CLIP_SPLIT_TEST_HELPERS_HPP
