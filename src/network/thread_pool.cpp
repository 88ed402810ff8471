#include "../../include/network/thread_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace network {

void ThreadPool::init(size_t workers) {
  writelock lock(_mutex);
  if (_started) {
    throw std::runtime_error("Thread pool already initialised");
  }
  if (workers == 0) {
    throw std::invalid_argument("Thread pool needs at least one worker");
  }
  _started = true;
  _workers.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    _workers.emplace_back(&ThreadPool::workerLoop, this);
  }
}

void ThreadPool::post(Task task) {
  {
    // Held while queueing so a worker between its check and its wait cannot
    // miss the notify.
    readlock lock(_mutex);
    if (!_started || _stopping) {
      throw std::runtime_error("Thread pool is not running");
    }
    _tasks.emplace(std::move(task));
  }
  _condition.notify_one();
}

void ThreadPool::workerLoop() {
  while (true) {
    Task task;
    bool hasTask = false;
    {
      writelock lock(_mutex);
      _condition.wait(lock, [this, &hasTask, &task] {
        hasTask = _tasks.tryPop(task);
        return hasTask || _stopping.load();
      });
    }

    if (!hasTask) {
      return;
    }
    runGuarded(task);
  }
}

void ThreadPool::runGuarded(Task &task) {
  try {
    task();
  } catch (const std::exception &e) {
    std::cerr << "Worker task failed: " << e.what() << std::endl;
  }
}

void ThreadPool::terminate() {
  {
    writelock lock(_mutex);
    if (!_started || _stopping) {
      return;
    }
    _stopping = true;
  }
  _condition.notify_all();
  for (auto &worker : _workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  if (_tasks.getSize() > 0) {
    std::cerr << "Thread pool stopped with " << _tasks.clear()
              << " task(s) unrun" << std::endl;
  }
}

bool ThreadPool::isRunning() const {
  readlock lock(_mutex);
  return _started && !_stopping;
}

size_t ThreadPool::getSize() const {
  readlock lock(_mutex);
  return _workers.size();
}

size_t ThreadPool::queued() const { return _tasks.getSize(); }

} // namespace network
