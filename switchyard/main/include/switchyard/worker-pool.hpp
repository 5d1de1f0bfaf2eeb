#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace switchyard {

// Fixed set of threads executing tasks in submission order (FIFO).
// The queue is unbounded: when all workers are busy, submitted tasks wait for a free worker.
// An exception escaping a task is logged and does not stop the worker.
class WorkerPool {
 public:
  using Task = std::move_only_function<void()>;

  // Starts 'nbThreads' workers. Throws std::invalid_argument if nbThreads is 0.
  explicit WorkerPool(uint32_t nbThreads);

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // Calls stop().
  ~WorkerPool();

  // Queues 'task'. Returns false (and drops it) if the pool is stopping.
  [[nodiscard]] bool submit(Task task);

  // Refuses new tasks, lets the workers drain the queued ones, then joins them. Idempotent.
  void stop();

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _threads.size(); }

  // Number of tasks waiting for a worker.
  [[nodiscard]] std::size_t nbPendingTasks() const;

 private:
  void workerLoop();

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<Task> _tasks;
  bool _stopping{false};
  std::vector<std::jthread> _threads;
};

}  // namespace switchyard
