/**
 * @file ffmpeg_splitter.cpp
 * @brief Splitter implementation backed by libavformat and ffmpeg
 */

#include "clip_split/ffmpeg_splitter.hpp"

#include <fmt/core.h>

#include "clip_split/ffmpeg_executor.hpp"
#include "clip_split/logging.hpp"
#include "clip_split/media_probe.hpp"
#include "clip_split/system.hpp"

namespace clip_split {

namespace fs = std::filesystem;

std::vector<TimeSegment> plan_segments(double duration, int parts) {
  std::vector<TimeSegment> segments;
  if (!(duration > 0) || parts < 1)
    return segments;

  const double part_duration = duration / parts;
  segments.reserve(parts);
  for (int i = 0; i < parts; ++i) {
    double start = part_duration * i;
    double end = (i == parts - 1) ? duration : start + part_duration;
    segments.push_back({start, end});
  }
  return segments;
}

std::string part_filename(const fs::path &source, int index) {
  return fmt::format("{}_part{}{}", source.stem().string(), index,
                     source.extension().string());
}

FFmpegSplitter::FFmpegSplitter(std::string ffmpeg_bin, DurationProbe probe)
    : ffmpeg_bin_(std::move(ffmpeg_bin)), probe_(std::move(probe)) {
  if (!probe_)
    probe_ = probe_duration;
}

SplitResult FFmpegSplitter::split(const fs::path &source,
                                  const fs::path &output_dir, int parts) {
  // **----- PROBE -----**

  double duration = probe_(source.string());
  if (!(duration > 0)) {
    LOG_ERROR("Unable to determine a valid duration ({:.2f}) for {}",
              duration, source.string());
    return SplitResult::failure(
        SplitError::DurationUnavailable,
        fmt::format("Unable to determine duration for {}",
                    source.filename().string()));
  }
  LOG_INFO("Duration for {}: {} ({:.2f} seconds)", source.filename().string(),
           format_time(duration), duration);

  // **----- CUT -----**

  auto segments = plan_segments(duration, parts);
  std::vector<std::string> outputs;
  outputs.reserve(segments.size());

  for (size_t i = 0; i < segments.size(); ++i) {
    const int index = static_cast<int>(i) + 1;
    const std::string name = part_filename(source, index);
    const bool bounded = (index < parts);

    auto cmd = build_cut_command(ffmpeg_bin_, source.string(),
                                 (output_dir / name).string(), segments[i],
                                 bounded);
    auto result = run_command(
        cmd, fmt::format("ffmpeg split part {}/{}", index, parts));
    if (!result.ok()) {
      std::string diagnostic =
          result.err.empty()
              ? fmt::format("ffmpeg exited with status {} on part {}/{}",
                            result.exit_code, index, parts)
              : result.err;
      return SplitResult::failure(SplitError::ExternalToolFailure,
                                  std::move(diagnostic));
    }
    outputs.push_back(name);
  }

  LOG_SUCCESS("Completed splitting {} into {} parts",
              source.filename().string(), parts);
  return SplitResult::success(std::move(outputs));
}

} // namespace clip_split
