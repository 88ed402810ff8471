#pragma once

#include <deque>
#include <mutex>
#include <shared_mutex>

namespace network {

// FIFO of pending work shared by the pool's workers.
template <typename T> class TaskQueue {
public:
  using writelock = std::unique_lock<std::shared_mutex>;
  using readlock = std::shared_lock<std::shared_mutex>;

  TaskQueue() = default;
  ~TaskQueue() { clear(); }

  TaskQueue(const TaskQueue &) = delete;
  TaskQueue(TaskQueue &&) = delete;
  TaskQueue &operator=(const TaskQueue &) = delete;
  TaskQueue &operator=(TaskQueue &&) = delete;

  size_t getSize() const {
    readlock lock(_mutex);
    return _items.size();
  }

  // Returns the number of dropped items.
  size_t clear() {
    writelock lock(_mutex);
    size_t dropped = _items.size();
    _items.clear();
    return dropped;
  }

  template <typename... Args> void emplace(Args &&...args) {
    writelock lock(_mutex);
    _items.emplace_back(std::forward<Args>(args)...);
  }

  bool tryPop(T &holder) {
    writelock lock(_mutex);
    if (_items.empty()) {
      return false;
    }
    holder = std::move(_items.front());
    _items.pop_front();
    return true;
  }

private:
  std::deque<T> _items;
  mutable std::shared_mutex _mutex;
};

} // namespace network
