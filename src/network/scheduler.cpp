#include "../../include/network/scheduler.hpp"

#include <iostream>
#include <stdexcept>

namespace network {

TimerScheduler::TimerScheduler(ThreadPool &pool) : _pool(pool) {}

void TimerScheduler::start() {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_running.load())
    return;
  _running.store(true);
  _timerThread = std::thread(&TimerScheduler::timerLoop, this);
}

void TimerScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running.load())
      return;
    _running.store(false);
    while (!_timers.empty()) {
      _timers.pop();
    }
  }
  _condition.notify_all();
  if (_timerThread.joinable()) {
    _timerThread.join();
  }
}

size_t TimerScheduler::pending() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _timers.size();
}

CancellationToken TimerScheduler::schedule(std::chrono::milliseconds delay,
                                           Task task) {
  CancellationToken token;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running.load()) {
      throw std::runtime_error("Scheduler is not running");
    }
    _timers.push(Timer{clock::now() + delay, _sequence++, std::move(task),
                       token});
  }
  _condition.notify_one();
  return token;
}

void TimerScheduler::timerLoop() {
  std::unique_lock<std::mutex> lock(_mutex);
  while (_running.load()) {
    if (_timers.empty()) {
      _condition.wait(lock);
      continue;
    }

    auto deadline = _timers.top().deadline;
    if (clock::now() < deadline) {
      _condition.wait_until(lock, deadline);
      continue;
    }

    Timer timer = _timers.top();
    _timers.pop();
    if (timer.token.isCancelled()) {
      continue;
    }

    lock.unlock();
    try {
      _pool.post(std::move(timer.task));
    } catch (const std::exception &e) {
      std::cerr << "Failed to dispatch scheduled task: " << e.what()
                << std::endl;
    }
    lock.lock();
  }
}

} // namespace network
