/**
 * @file work_queue.hpp
 * @brief Thread-safe work queue shared by the camera workers
 *
 * @details Workers pop cameras from one queue instead of receiving a fixed
 *          share up front, so a camera with long footage does not leave the
 *          other workers idle.
 */

#ifndef GESTURE_SLICER_WORK_QUEUE_HPP
#define GESTURE_SLICER_WORK_QUEUE_HPP

#include <condition_variable>
#include <mutex>
#include <queue>

namespace gesture_slicer {

template <typename T> class WorkQueue {
  std::queue<T> items_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool done_ = false;

public:
  /**
   * @brief Add an item and wake one waiting worker.
   */
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      items_.push(std::move(item));
    }
    cv_.notify_one();
  }

  /**
   * @brief Take the next item.
   * @note Blocks until an item is available or finish() was called.
   * @return false once the queue is finished and drained
   */
  bool pop(T &item) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !items_.empty() || done_; });
    if (items_.empty())
      return false;
    item = std::move(items_.front());
    items_.pop();
    return true;
  }

  /**
   * @brief Signal that no more items will be pushed.
   */
  void finish() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done_ = true;
    }
    cv_.notify_all();
  }

  /// Drop items not yet taken (cancellation)
  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::queue<T>().swap(items_);
  }
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_WORK_QUEUE_HPP
