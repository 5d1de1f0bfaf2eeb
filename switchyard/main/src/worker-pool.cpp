#include "switchyard/worker-pool.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include "switchyard/log.hpp"

namespace switchyard {

WorkerPool::WorkerPool(uint32_t nbThreads) {
  if (nbThreads == 0) {
    throw std::invalid_argument("WorkerPool needs at least one thread");
  }
  _threads.reserve(nbThreads);
  for (uint32_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _threads.emplace_back([this] { workerLoop(); });
  }
  log::debug("Worker pool started with {} threads", nbThreads);
}

WorkerPool::~WorkerPool() { stop(); }

bool WorkerPool::submit(Task task) {
  {
    std::lock_guard lock(_mutex);
    if (_stopping) [[unlikely]] {
      return false;
    }
    _tasks.push_back(std::move(task));
  }
  _cv.notify_one();
  return true;
}

void WorkerPool::stop() {
  {
    std::lock_guard lock(_mutex);
    if (_stopping) {
      return;
    }
    _stopping = true;
  }
  _cv.notify_all();
  for (std::jthread& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  log::debug("Worker pool stopped");
}

std::size_t WorkerPool::nbPendingTasks() const {
  std::lock_guard lock(_mutex);
  return _tasks.size();
}

void WorkerPool::workerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock lock(_mutex);
      _cv.wait(lock, [this] { return _stopping || !_tasks.empty(); });
      if (_tasks.empty()) {
        // stopping and drained
        return;
      }
      task = std::move(_tasks.front());
      _tasks.pop_front();
    }
    try {
      task();
    } catch (const std::exception& ex) {
      log::error("Uncaught exception in worker task: {}", ex.what());
    } catch (...) {
      log::error("Uncaught unknown exception in worker task");
    }
  }
}

}  // namespace switchyard
