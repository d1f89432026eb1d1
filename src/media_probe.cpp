/**
 * @file media_probe.cpp
 * @brief Container-level media probing implementation
 */

#include "clip_split/media_probe.hpp"

extern "C" {
#include <libavutil/error.h>
}

#include "clip_split/logging.hpp"

namespace clip_split {

namespace {

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

MediaProbe::MediaProbe(std::string path) : path_(std::move(path)) {}

MediaProbe::~MediaProbe() {
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
}

bool MediaProbe::initialize() {
  /// Open input (probes container format from the file header)
  int ret = avformat_open_input(&fmt_ctx, path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    LOG_ERROR("avformat_open_input failed for {}: {}", path_,
              av_error_string(ret));
    fmt_ctx = nullptr;
    return false;
  }

  /// Some containers only report duration after reading a few packets
  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    LOG_ERROR("avformat_find_stream_info failed for {}: {}", path_,
              av_error_string(ret));
    return false;
  }

  return true;
}

double MediaProbe::get_duration() const {
  if (!fmt_ctx)
    return 0.0;
  return (fmt_ctx->duration != AV_NOPTS_VALUE)
             ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
             : 0.0;
}

double probe_duration(const std::string &path) {
  MediaProbe probe(path);
  if (!probe.initialize())
    return 0.0;
  return probe.get_duration();
}

} // namespace clip_split
