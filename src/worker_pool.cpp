/**
 * @file worker_pool.cpp
 * @brief Bounded task-execution service implementation
 */

#include "clip_split/worker_pool.hpp"

#include <algorithm>
#include <exception>

#include "clip_split/logging.hpp"

namespace clip_split {

WorkerPool::WorkerPool(int num_workers, std::string name)
    : num_workers_(std::max(1, num_workers)), name_(std::move(name)) {
  workers_.reserve(num_workers_);
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&WorkerPool::worker_loop, this, i);
  }
  LOG_INFO("Started {} pool with {} worker(s)", name_, num_workers_);
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (stopped_)
      return false;
    ++outstanding_;
  }

  if (!queue_.push(std::move(task))) {
    release(1);
    return false;
  }
  return true;
}

void WorkerPool::wait_idle() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
}

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (stopped_)
      return;
    stopped_ = true;
  }

  queue_.finish();
  size_t dropped = queue_.drain();
  if (dropped > 0) {
    LOG_WARN("{} pool shutting down: {} queued task(s) discarded", name_,
             dropped);
    release(dropped);
  }

  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
  LOG_INFO("{} pool stopped", name_);
}

void WorkerPool::release(size_t count) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    outstanding_ -= std::min(count, outstanding_);
  }
  idle_cv_.notify_all();
}

void WorkerPool::worker_loop(int worker_id) {
  LOG_DEBUG("[{}-{}] Started", name_, worker_id);

  Task task;
  while (queue_.pop(task)) {
    ++active_;
    try {
      task();
    } catch (const std::exception &e) {
      /// Tasks report their own failures; this keeps the worker alive
      LOG_ERROR("[{}-{}] Task raised: {}", name_, worker_id, e.what());
    } catch (...) {
      LOG_ERROR("[{}-{}] Task raised a non-standard exception", name_,
                worker_id);
    }
    task = nullptr;
    --active_;
    release(1);
  }

  LOG_DEBUG("[{}-{}] Finished", name_, worker_id);
}

} // namespace clip_split
