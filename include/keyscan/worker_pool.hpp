/**
 * @file worker_pool.hpp
 * @brief Fixed-size worker pool for fork-join data parallelism
 *
 * @details Provides:
 *          - TaskQueue: blocking queue of jobs shared by the workers
 *
 *          - WorkerPool: owns the worker threads and runs parallel_for
 *
 * @attention EXECUTION CONTEXT:
 *
 * - A pool is an explicit object handed to the DifferenceEngine; there is
 *   no process-wide pool, so pools of different sizes can coexist
 *
 * - parallel_for hands indices out through a shared atomic counter and the
 *   calling thread drains indices too, so a call never waits on a job that
 *   has not started (nested or saturated use cannot deadlock)
 *
 * - The first exception thrown by the body is rethrown on the caller after
 *   every claimed index has finished
 */

#ifndef KEYSCAN_WORKER_POOL_HPP
#define KEYSCAN_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace keyscan {

/**
 * @class TaskQueue
 * @brief Thread-safe job queue; workers block in pop() until work arrives.
 */
class TaskQueue {
  std::queue<std::function<void()>> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;

public:
  /// Add a job and wake one worker.
  void push(std::function<void()> task);

  /**
   * @brief Pop a job.
   * @return false once the queue is finished and empty
   */
  bool pop(std::function<void()> &task);

  /// Signal that no more jobs will be added; wakes all workers.
  void finish();
};

class WorkerPool {
public:
  /**
   * @param threads Worker count (0 = detect_cpu_limit())
   */
  explicit WorkerPool(size_t threads = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Number of threads that execute parallel_for bodies (workers + caller
  /// counted as one slot).
  size_t size() const { return size_; }

  /**
   * @brief Run body(i) for every i in [0, n) and wait for completion.
   * @note body must be safe to call concurrently for distinct indices.
   */
  void parallel_for(size_t n, const std::function<void(size_t)> &body);

private:
  void worker_loop();

  size_t size_;
  TaskQueue queue_;
  std::vector<std::thread> workers_;
};

} // namespace keyscan

#endif // KEYSCAN_WORKER_POOL_HPP
