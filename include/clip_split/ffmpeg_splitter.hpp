/**
 * @file ffmpeg_splitter.hpp
 * @brief Splitter implementation backed by libavformat and ffmpeg
 *
 * @details Workflow for one job:
 *
 *          1. Probe the container duration (libavformat)
 *
 *          2. Plan parts equal-length segments
 *
 *          3. Cut each part in index order with codec copy (ffmpeg)
 *
 * @note The last part has no -t bound so rounding of the printed start
 *       times never drops the tail of the source.
 */

#ifndef CLIP_SPLIT_FFMPEG_SPLITTER_HPP
#define CLIP_SPLIT_FFMPEG_SPLITTER_HPP

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "splitter.hpp"
#include "types.hpp"

namespace clip_split {

/**
 * @brief Divide [0, duration) into parts contiguous segments.
 * @note Every part but the last spans duration / parts; the last spans
 *       duration - (parts - 1) * (duration / parts).
 * @return Empty when duration <= 0 or parts < 1
 */
std::vector<TimeSegment> plan_segments(double duration, int parts);

/**
 * @brief Output filename of part index (1-based) for source.
 * @return "<stem>_part<index><ext>", e.g. "clip_part2.mp4"
 */
std::string part_filename(const std::filesystem::path &source, int index);

/**
 * @class FFmpegSplitter
 * @brief Cuts media with the ffmpeg CLI after probing it in-process.
 */
class FFmpegSplitter : public Splitter {
public:
  /// Returns the duration in seconds of a file, 0 when unknown
  using DurationProbe = std::function<double(const std::string &)>;

  /**
   * @brief Construct a splitter.
   * @param ffmpeg_bin ffmpeg executable (PATH lookup when relative)
   * @param probe Duration source; defaults to probe_duration()
   */
  explicit FFmpegSplitter(std::string ffmpeg_bin,
                          DurationProbe probe = nullptr);

  SplitResult split(const std::filesystem::path &source,
                    const std::filesystem::path &output_dir,
                    int parts) override;

private:
  std::string ffmpeg_bin_;
  DurationProbe probe_;
};

} // namespace clip_split

#endif // CLIP_SPLIT_FFMPEG_SPLITTER_HPP
