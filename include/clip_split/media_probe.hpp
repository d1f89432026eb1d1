/**
 * @file media_probe.hpp
 * @brief Container-level media probing with libavformat
 *
 * @details Opens a media file just far enough to read its container
 *          duration. No decoder is opened.
 */

#ifndef CLIP_SPLIT_MEDIA_PROBE_HPP
#define CLIP_SPLIT_MEDIA_PROBE_HPP

extern "C" {
#include <libavformat/avformat.h>
}

#include <string>

namespace clip_split {

/**
 * @class MediaProbe
 * @brief Owns an AVFormatContext opened on a file path.
 *
 * @attention `MANAGEMENT`:
 *
 *            - The format context is closed in the destructor
 *
 *            - Each worker thread probes with its own instance; FFmpeg
 *              demuxer state is not shared between threads
 */
class MediaProbe {
  AVFormatContext *fmt_ctx = nullptr;
  std::string path_;

public:
  explicit MediaProbe(std::string path);
  ~MediaProbe();

  /// Disable copy (FFmpeg contexts are not copyable)
  MediaProbe(const MediaProbe &) = delete;
  MediaProbe &operator=(const MediaProbe &) = delete;

  /**
   * @brief Open the container and read stream info.
   * @return true on success, false on failure (logged)
   */
  bool initialize();

  /**
   * @brief Container duration in seconds.
   * @return 0.0 when unknown or when initialize() did not succeed
   */
  double get_duration() const;
};

/**
 * @brief Convenience: probe path and return its duration.
 * @return Duration in seconds, or 0.0 if it cannot be determined
 */
double probe_duration(const std::string &path);

} // namespace clip_split

#endif // CLIP_SPLIT_MEDIA_PROBE_HPP
