#pragma once

#include "thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace network {

class CancellationToken {
public:
  CancellationToken() : _cancelled(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { _cancelled->store(true); }
  bool isCancelled() const { return _cancelled->load(); }

private:
  std::shared_ptr<std::atomic<bool>> _cancelled;
};

// One-shot delayed tasks. The scheduling call never blocks on the task.
class Scheduler {
public:
  using Task = std::function<void()>;

  virtual ~Scheduler() = default;
  virtual CancellationToken schedule(std::chrono::milliseconds delay,
                                     Task task) = 0;
};

// Keeps deadlines on a timer thread and runs due tasks on a ThreadPool.
class TimerScheduler : public Scheduler {
  using clock = std::chrono::steady_clock;

public:
  explicit TimerScheduler(ThreadPool &pool);
  ~TimerScheduler() override { stop(); }

  TimerScheduler(const TimerScheduler &) = delete;
  TimerScheduler &operator=(const TimerScheduler &) = delete;

  void start();
  // Pending tasks are dropped.
  void stop();
  bool isRunning() const { return _running.load(); }
  size_t pending() const;

  CancellationToken schedule(std::chrono::milliseconds delay,
                             Task task) override;

private:
  struct Timer {
    clock::time_point deadline;
    uint64_t sequence; // FIFO among equal deadlines
    Task task;
    CancellationToken token;
  };

  struct Later {
    bool operator()(const Timer &a, const Timer &b) const {
      if (a.deadline != b.deadline) {
        return a.deadline > b.deadline;
      }
      return a.sequence > b.sequence;
    }
  };

  void timerLoop();

  ThreadPool &_pool;
  std::atomic<bool> _running{false};
  std::thread _timerThread;
  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::priority_queue<Timer, std::vector<Timer>, Later> _timers;
  uint64_t _sequence{0};
};

} // namespace network
