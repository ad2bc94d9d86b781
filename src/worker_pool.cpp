/**
 * @file worker_pool.cpp
 * @brief TaskQueue and WorkerPool implementation
 */

#include "keyscan/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>

#include "keyscan/logging.hpp"
#include "keyscan/system.hpp"
#include "keyscan/types.hpp"

namespace keyscan {

// **----- TaskQueue Implementation -----**

void TaskQueue::push(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    tasks.push(std::move(task));
  }
  cv.notify_one();
}

bool TaskQueue::pop(std::function<void()> &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done; });
  if (tasks.empty())
    return false;
  task = std::move(tasks.front());
  tasks.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done = true;
  }
  cv.notify_all();
}

// **----- parallel_for state -----**

namespace {

/**
 * @brief Shared by the caller and every helper job of one parallel_for.
 * @note Helpers hold it through a shared_ptr, so a helper that starts after
 *       the caller has returned still finds valid state (and no work).
 */
struct ForState {
  PaddedAtomic<size_t> next; //< Next unclaimed index
  size_t n = 0;
  const std::function<void(size_t)> *body = nullptr;

  std::mutex mutex;
  std::condition_variable cv;
  size_t finished = 0;
  std::exception_ptr error;
};

void run_indices(ForState &s) {
  size_t local = 0;
  while (true) {
    size_t i = s.next.fetch_add(1, std::memory_order_relaxed);
    if (i >= s.n)
      break;
    try {
      (*s.body)(i);
    } catch (...) {
      std::lock_guard<std::mutex> lock(s.mutex);
      if (!s.error)
        s.error = std::current_exception();
    }
    ++local;
  }

  if (local > 0) {
    std::lock_guard<std::mutex> lock(s.mutex);
    s.finished += local;
    if (s.finished == s.n)
      s.cv.notify_all();
  }
}

} // anonymous namespace

// **----- WorkerPool Implementation -----**

WorkerPool::WorkerPool(size_t threads) {
  size_ = threads > 0 ? threads
                      : static_cast<size_t>(std::max(1, detect_cpu_limit()));

  /// The calling thread is one of the execution slots
  workers_.reserve(size_ - 1);
  for (size_t i = 0; i + 1 < size_; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
  LOG_DEBUG("Worker pool started with {} threads", size_);
}

WorkerPool::~WorkerPool() {
  queue_.finish();
  for (auto &w : workers_) {
    w.join();
  }
}

void WorkerPool::worker_loop() {
  std::function<void()> task;
  while (queue_.pop(task)) {
    task();
  }
}

void WorkerPool::parallel_for(size_t n,
                              const std::function<void(size_t)> &body) {
  if (n == 0)
    return;

  auto state = std::make_shared<ForState>();
  state->n = n;
  state->body = &body;

  size_t helpers = std::min(workers_.size(), n - 1);
  for (size_t i = 0; i < helpers; ++i) {
    queue_.push([state] { run_indices(*state); });
  }

  run_indices(*state);

  std::unique_lock<std::mutex> lock(state->mutex);
  state->cv.wait(lock, [&] { return state->finished == state->n; });
  if (state->error)
    std::rethrow_exception(state->error);
}

} // namespace keyscan
