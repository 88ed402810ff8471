#pragma once

#include "task_queue.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace network {

// Workers that run the server's deferred work: turn notices and abandoned
// room checks handed over by TimerScheduler.
class ThreadPool {
  using writelock = std::unique_lock<std::shared_mutex>;
  using readlock = std::shared_lock<std::shared_mutex>;

public:
  using Task = std::function<void()>;

  ThreadPool() = default;
  ~ThreadPool() { terminate(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  // Starts `workers` threads. Throws if the pool is already running or was
  // terminated.
  void init(size_t workers);

  // Queues a task. A task that throws is logged and does not take its
  // worker down. Throws std::runtime_error once the pool is terminated.
  void post(Task task);

  // Runs what is already queued, then joins the workers. Idempotent.
  void terminate();

  bool isRunning() const;
  size_t getSize() const;
  size_t queued() const;

private:
  void workerLoop();
  static void runGuarded(Task &task);

  bool _started{false};
  std::atomic<bool> _stopping{false};
  std::vector<std::thread> _workers;
  mutable std::shared_mutex _mutex;
  std::condition_variable_any _condition;
  TaskQueue<Task> _tasks;
};

} // namespace network
