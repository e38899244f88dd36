#ifndef STORM_DAMAGE_AGGREGATOR_QUEUE_HPP
#define STORM_DAMAGE_AGGREGATOR_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>

namespace stormagg {

// Bounded multi-producer multi-consumer queue. max_size 0 means unbounded.
// After close() producers are refused and consumers drain what is left.
template <typename T>
class BlockingQueue {
 public:
  explicit BlockingQueue(std::size_t max_size) : max_size_(max_size) {}

  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return closed_ || max_size_ == 0 || items_.size() < max_size_; });
    if (closed_) {
      return false;
    }
    items_.push(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  bool pop(T& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return false;
    }
    out = std::move(items_.front());
    items_.pop();
    not_full_.notify_one();
    return true;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Closes and drops everything still queued, so consumers stop at once.
  void cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    std::queue<T>().swap(items_);
    not_empty_.notify_all();
    not_full_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<T> items_;
  std::size_t max_size_ = 0;
  bool closed_ = false;
};

} // namespace stormagg

#endif
