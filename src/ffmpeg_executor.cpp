/**
 * @file ffmpeg_executor.cpp
 * @brief External process execution implementation
 */

#include "clip_split/ffmpeg_executor.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "clip_split/logging.hpp"

namespace clip_split {

namespace {

/// Strip leading/trailing whitespace
std::string trim(const std::string &s) {
  size_t begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return {};
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

std::string join_command(const std::vector<std::string> &argv) {
  std::string out;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      out += ' ';
    const std::string &arg = argv[i];
    if (!arg.empty() &&
        arg.find_first_of(" \t\n'\"\\$`") == std::string::npos) {
      out += arg;
    } else {
      out += '\'';
      for (char c : arg) {
        if (c == '\'')
          out += "'\"'\"'";
        else
          out += c;
      }
      out += '\'';
    }
  }
  return out;
}

std::vector<std::string> build_cut_command(const std::string &ffmpeg_bin,
                                           const std::string &input_path,
                                           const std::string &output_path,
                                           const TimeSegment &segment,
                                           bool bounded) {
  std::vector<std::string> cmd = {ffmpeg_bin,
                                  "-y",
                                  "-hide_banner",
                                  "-loglevel",
                                  "warning",
                                  "-i",
                                  input_path,
                                  "-ss",
                                  fmt::format("{:.2f}", segment.start),
                                  "-c",
                                  "copy"};
  if (bounded) {
    cmd.push_back("-t");
    cmd.push_back(fmt::format("{:.2f}", segment.length()));
  }
  cmd.push_back(output_path);
  return cmd;
}

CommandResult run_command(const std::vector<std::string> &argv,
                          const std::string &description) {
  CommandResult result;
  if (argv.empty()) {
    result.err = "empty command";
    return result;
  }

  LOG_INFO("Running {}: {}", description, join_command(argv));

  /// Build the exec argument array before forking
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  int pipe_fds[2];
  if (::pipe2(pipe_fds, O_CLOEXEC) == -1) {
    result.err = fmt::format("pipe failed: {}", std::strerror(errno));
    LOG_ERROR("{} could not start: {}", description, result.err);
    return result;
  }

  auto start = std::chrono::steady_clock::now();

  pid_t pid = ::fork();
  if (pid == -1) {
    result.err = fmt::format("fork failed: {}", std::strerror(errno));
    ::close(pipe_fds[0]);
    ::close(pipe_fds[1]);
    LOG_ERROR("{} could not start: {}", description, result.err);
    return result;
  }

  if (pid == 0) {
    /// Child: only async-signal-safe calls until exec
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull != -1) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDOUT_FILENO);
    }
    ::dup2(pipe_fds[1], STDERR_FILENO);
    ::execvp(args[0], args.data());

    const char msg[] = "exec failed: ";
    const char *reason = std::strerror(errno);
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
    ::_exit(127);
  }

  /// Parent: drain stderr until the child closes it
  ::close(pipe_fds[1]);
  std::string captured;
  char buf[4096];
  while (true) {
    ssize_t n = ::read(pipe_fds[0], buf, sizeof(buf));
    if (n > 0) {
      captured.append(buf, static_cast<size_t>(n));
    } else if (n == -1 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  ::close(pipe_fds[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      status = -1;
      break;
    }
  }

  auto end = std::chrono::steady_clock::now();
  result.elapsed_us =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start)
          .count();

  if (status == -1)
    result.exit_code = -1;
  else if (WIFEXITED(status))
    result.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exit_code = 128 + WTERMSIG(status);

  result.err = trim(captured);

  if (result.ok()) {
    LOG_INFO("Finished {} in {:.2f} seconds", description,
             result.elapsed_us / 1000000.0);
    if (!result.err.empty())
      LOG_WARN("{} stderr: {}", description, result.err);
  } else {
    LOG_ERROR("{} failed with status {}", description, result.exit_code);
  }

  return result;
}

} // namespace clip_split
