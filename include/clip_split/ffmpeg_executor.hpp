/**
 * @file ffmpeg_executor.hpp
 * @brief External process execution for ffmpeg cut operations
 *
 * @details Separate module for running the ffmpeg binary:
 *
 *          - run_command() forks/execs an argv vector, stdin from /dev/null,
 *            stderr captured for diagnostics
 *
 *          - build_cut_command() renders the stream-copy command for one part
 */

#ifndef CLIP_SPLIT_FFMPEG_EXECUTOR_HPP
#define CLIP_SPLIT_FFMPEG_EXECUTOR_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace clip_split {

/**
 * @struct CommandResult
 * @brief Exit information of one external command.
 */
struct CommandResult {
  int exit_code = -1;    //< Exit status, 128+N if killed by signal N
  std::string err;       //< Captured stderr (trimmed)
  long elapsed_us = 0;   //< Wall-clock time of the command

  bool ok() const { return exit_code == 0; }
};

/**
 * @brief Run argv[0] with the given arguments and wait for it.
 *
 * @param argv Program and arguments; argv[0] is looked up in PATH
 * @param description Label used in log lines
 * @return Exit information; a failed exec is reported as exit code 127
 */
CommandResult run_command(const std::vector<std::string> &argv,
                          const std::string &description);

/**
 * @brief Build the ffmpeg command cutting one part with codec copy.
 *
 * @param ffmpeg_bin ffmpeg executable
 * @param input_path Source media file
 * @param output_path Destination of this part
 * @param segment Part boundaries in seconds
 * @param bounded false for the last part, which runs to end of input
 */
std::vector<std::string> build_cut_command(const std::string &ffmpeg_bin,
                                           const std::string &input_path,
                                           const std::string &output_path,
                                           const TimeSegment &segment,
                                           bool bounded);

/// Shell-style rendering of argv for log lines
std::string join_command(const std::vector<std::string> &argv);

} // namespace clip_split

#endif // CLIP_SPLIT_FFMPEG_EXECUTOR_HPP
