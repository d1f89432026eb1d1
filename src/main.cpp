/**
 * @file main.cpp
 * @brief Entry point for the Clip Split command line tool
 *
 * @details Commands:
 *
 *          - split <file> <parts> [<file> <parts> ...]: submit every pair,
 *            wait for the worker pool to drain, print each job's status
 *
 *          - status <job_id>: print the persisted status of a job
 *
 *          - download-path <job_id> <filename>: print an output's location
 *
 * @note Configuration comes from the environment (see config.hpp):
 *       WORKER_THREADS, CLIP_SPLIT_DATA_DIR, FFMPEG_BIN, CLIP_SPLIT_DEBUG.
 */

#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "clip_split/config.hpp"
#include "clip_split/ffmpeg_splitter.hpp"
#include "clip_split/job_service.hpp"
#include "clip_split/logging.hpp"

using namespace clip_split;

namespace {

/// Filenames in payloads may carry invalid UTF-8
std::string render(const JobView &view) {
  return to_payload(view).dump(2, ' ', false,
                               nlohmann::json::error_handler_t::replace);
}

void print_usage() {
  LOG_WARN("Usage: ./clip_split split <file.mp4> <parts> [<file> <parts> ...]");
  LOG_WARN("       ./clip_split status <job_id>");
  LOG_WARN("       ./clip_split download-path <job_id> <filename>");
}

/// Parse a part count; returns 0 (always invalid) for non-numeric text
int parse_parts(const std::string &text) {
  try {
    size_t used = 0;
    int value = std::stoi(text, &used);
    return used == text.size() ? value : 0;
  } catch (const std::exception &) {
    return 0;
  }
}

int run_split(JobService &service, const std::vector<std::string> &args) {
  if (args.empty() || args.size() % 2 != 0) {
    print_usage();
    return 1;
  }

  LOG_PHASE("================== SUBMITTING {} JOB(S) ==================",
            args.size() / 2);

  std::vector<std::string> job_ids;
  int rejected = 0;

  for (size_t i = 0; i < args.size(); i += 2) {
    std::filesystem::path input(args[i]);
    int parts = parse_parts(args[i + 1]);

    /// Inputs given on the command line are copied, never consumed
    auto result = service.submit(input, input.filename().string(), parts,
                                 /*keep_source=*/true);
    if (!result.ok()) {
      LOG_ERROR("{}: {}", input.string(), describe(result.error));
      ++rejected;
      continue;
    }
    LOG_INFO("Submitted {} as job {}", input.filename().string(),
             result.job_id);
    job_ids.push_back(result.job_id);
  }

  service.wait_idle();
  LOG_PHASE("=========================================================");

  int failures = rejected;
  for (const auto &job_id : job_ids) {
    JobView view = service.query(job_id);
    fmt::print("{}\n", render(view));
    if (!view.found || view.status() != JobStatus::Completed)
      ++failures;
  }
  std::fflush(stdout);
  return failures;
}

int run_status(JobService &service, const std::string &job_id) {
  JobView view = service.query(job_id);
  if (!view.found)
    LOG_WARN("Status requested for missing job {}", job_id);
  fmt::print("{}\n", render(view));
  std::fflush(stdout);
  return view.found ? 0 : 1;
}

int run_download_path(JobService &service, const std::string &job_id,
                      const std::string &filename) {
  auto path = service.resolve_download(job_id, filename);
  if (!path) {
    LOG_ERROR("The requested file was not found.");
    return 1;
  }
  fmt::print("{}\n", path->string());
  return 0;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  try {
    FFmpegSplitter splitter(Config::ffmpeg_bin());
    JobService service(Config::data_dir(), splitter,
                       Config::worker_threads());

    int rc = 1;
    if (command == "split") {
      rc = run_split(service, args);
    } else if (command == "status" && args.size() == 1) {
      rc = run_status(service, args[0]);
    } else if (command == "download-path" && args.size() == 2) {
      rc = run_download_path(service, args[0], args[1]);
    } else {
      print_usage();
    }

    service.shutdown();
    return rc;
  } catch (const std::exception &e) {
    LOG_ERROR("Fatal: {}", e.what());
    return 1;
  }
}
