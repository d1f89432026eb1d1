/**
 * @file task_queue.hpp
 * @brief Thread-safe FIFO task queue for the worker pool
 *
 * @details Producer-consumer queue between submitters and pool workers:
 *
 *          - Submitters push() tasks, workers pop() them in arrival order
 *
 *          - finish() closes the queue: further pushes are refused and idle
 *            workers wake up to exit once it is empty
 *
 *          - drain() discards tasks that never started
 */

#ifndef CLIP_SPLIT_TASK_QUEUE_HPP
#define CLIP_SPLIT_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>

namespace clip_split {

/// A unit of work executed by a pool worker
using Task = std::function<void()>;

/**
 * @class TaskQueue
 * @brief Blocking FIFO of tasks (producer-consumer pattern).
 *
 * @attention USAGE:
 *
 *   - Submitters call push()
 *
 *   - Workers call pop() in a loop until it returns false
 *
 *   - Call finish() when no more tasks will be accepted
 */
class TaskQueue {
public:
  /**
   * @brief Push a task to the queue.
   * @return false if the queue has been finished (task not queued)
   */
  bool push(Task task);

  /**
   * @brief Pop a task from the queue (blocking).
   * @param task Output: the task to execute
   * @return true if a task was retrieved, false if queue is finished and empty
   */
  bool pop(Task &task);

  /**
   * @brief Signal that no more tasks will be pushed.
   */
  void finish();

  /**
   * @brief Discard every queued task.
   * @return Number of tasks discarded
   */
  size_t drain();

  /**
   * @brief Check if queue has been finished.
   */
  bool is_finished() const { return done_.load(); }

  /**
   * @brief Number of queued tasks.
   */
  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Task> tasks_;
  std::atomic<bool> done_{false};
};

} // namespace clip_split

#endif // CLIP_SPLIT_TASK_QUEUE_HPP
