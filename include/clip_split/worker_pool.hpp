/**
 * @file worker_pool.hpp
 * @brief Bounded task-execution service
 *
 * @details A fixed number of worker threads consume a shared FIFO
 *          TaskQueue. The pool is created once by the owning service with
 *          its final capacity and torn down with shutdown().
 *
 * @attention GUARANTEES:
 *
 *   - At most size() tasks execute concurrently
 *
 *   - Tasks start in submission order; completion order is unconstrained
 *
 *   - submit() never blocks on task execution
 *
 *   - After shutdown() starts, submit() refuses work; tasks still queued
 *     are discarded and tasks already running are allowed to finish
 */

#ifndef CLIP_SPLIT_WORKER_POOL_HPP
#define CLIP_SPLIT_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "task_queue.hpp"

namespace clip_split {

/**
 * @class WorkerPool
 * @brief Fixed-size thread pool over a FIFO TaskQueue.
 */
class WorkerPool {
public:
  /**
   * @brief Start the workers.
   * @param num_workers Thread count, clamped to at least 1
   * @param name Prefix for worker log lines
   */
  explicit WorkerPool(int num_workers, std::string name = "worker");

  /// Calls shutdown()
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Queue a task.
   * @return false when the pool is shutting down (task not queued)
   */
  bool submit(Task task);

  /**
   * @brief Block until no task is queued or running.
   */
  void wait_idle();

  /**
   * @brief Stop accepting work, discard queued tasks, join the workers.
   * @note Idempotent. Blocks while in-flight tasks finish.
   */
  void shutdown();

  int size() const { return num_workers_; }

  /// Tasks currently executing
  int active() const { return active_.load(); }

  /// Tasks waiting for a worker
  size_t pending() const { return queue_.size(); }

private:
  int num_workers_;
  std::string name_;
  TaskQueue queue_;
  std::vector<std::thread> workers_;
  std::atomic<int> active_{0};

  std::mutex state_mutex_;        //< Protects outstanding_ and stopped_
  std::condition_variable idle_cv_;
  size_t outstanding_{0};         //< Queued + running tasks
  bool stopped_{false};

  void worker_loop(int worker_id);

  /// Account for count tasks leaving the pool
  void release(size_t count);
};

} // namespace clip_split

#endif // CLIP_SPLIT_WORKER_POOL_HPP
