#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace lc {

// Mutex-protected FIFO used to hand results from a worker thread back to
// the event thread. When full the oldest item is dropped.
template <typename T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t maxCapacity = 64)
      : maxCap_(maxCapacity) {}

  // Returns false if an item had to be dropped to make room.
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool dropped = false;
    if (maxCap_ > 0 && items_.size() >= maxCap_) {
      items_.pop_front();
      dropped = true;
    }
    items_.push_back(std::move(item));
    return !dropped;
  }

  bool pop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  // Moves every queued item into `out` (appended, FIFO order).
  std::size_t drain(std::vector<T>& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = items_.size();
    for (auto& item : items_) out.push_back(std::move(item));
    items_.clear();
    return n;
  }

  // Removes the items matching `pred`; returns how many were removed.
  template <typename Pred>
  std::size_t removeIf(Pred pred) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t before = items_.size();
    for (auto it = items_.begin(); it != items_.end();) {
      if (pred(*it)) {
        it = items_.erase(it);
      } else {
        ++it;
      }
    }
    return before - items_.size();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
  }

  bool empty() const { return size() == 0; }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    items_.clear();
  }

private:
  mutable std::mutex mtx_;
  std::deque<T> items_;
  std::size_t maxCap_;
};

} // namespace lc
