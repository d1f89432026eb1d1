/**
 * @file splitter.hpp
 * @brief Interface of the media splitting collaborator
 *
 * @details The job runner only knows this contract:
 *          split(source, output_dir, parts) either yields the output
 *          filenames (in part order) or a classified failure.
 *          Anything unclassified is thrown as a std::exception.
 */

#ifndef CLIP_SPLIT_SPLITTER_HPP
#define CLIP_SPLIT_SPLITTER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace clip_split {

/**
 * @enum SplitError
 * @brief Classified failures a Splitter may report.
 */
enum class SplitError {
  None,                //< Success
  DurationUnavailable, //< Duration missing, unreadable or not positive
  ExternalToolFailure  //< The cutting process exited non-zero
};

/**
 * @struct SplitResult
 * @brief Outcome of Splitter::split().
 */
struct SplitResult {
  SplitError error = SplitError::None;
  std::string diagnostic;           //< Human-readable detail for failures
  std::vector<std::string> outputs; //< Bare filenames, part order

  bool ok() const { return error == SplitError::None; }

  static SplitResult success(std::vector<std::string> files) {
    SplitResult r;
    r.outputs = std::move(files);
    return r;
  }

  static SplitResult failure(SplitError error, std::string diagnostic) {
    SplitResult r;
    r.error = error;
    r.diagnostic = std::move(diagnostic);
    return r;
  }
};

/**
 * @class Splitter
 * @brief Cuts a source file into contiguous parts.
 *
 * @attention Implementations must be safe to call from several worker
 *            threads at once (one call per job).
 */
class Splitter {
public:
  virtual ~Splitter() = default;

  /**
   * @brief Split source into parts files written to output_dir.
   * @throws std::exception for failures outside SplitError
   */
  virtual SplitResult split(const std::filesystem::path &source,
                            const std::filesystem::path &output_dir,
                            int parts) = 0;
};

} // namespace clip_split

#endif // CLIP_SPLIT_SPLITTER_HPP
