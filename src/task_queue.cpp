/**
 * @file task_queue.cpp
 * @brief Thread-safe FIFO task queue implementation
 */

#include "clip_split/task_queue.hpp"

namespace clip_split {

bool TaskQueue::push(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load())
      return false;
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

bool TaskQueue::pop(Task &task) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !tasks_.empty() || done_.load(); });

  if (tasks_.empty()) {
    return false;
  }

  task = std::move(tasks_.front());
  tasks_.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

size_t TaskQueue::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t dropped = tasks_.size();
  std::queue<Task>().swap(tasks_);
  return dropped;
}

} // namespace clip_split
