// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_WORKER_POOL_HPP
#define PARCEL_WORKER_POOL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace parcel {
namespace uploader {

constexpr std::chrono::milliseconds kDefaultShutdownGrace{2000};

/// Shortest interval between warnings while a forced shutdown waits
constexpr std::chrono::milliseconds kMinOverrunInterval{100};

/**
 * Fixed-size thread pool executing one-shot tasks
 *
 * Tasks are queued without bound, so submit() never blocks on capacity.
 *
 * Shutdown is two-phase:
 * 1. Stop accepting work and wait up to the grace period for the queue to
 *    drain and the workers to go idle.
 * 2. If that times out, discard every queued task that has not started
 *    (its future reports std::future_errc::broken_promise) and join.
 * Running tasks are never interrupted; joining waits for their current call.
 * While it waits, a WARN is logged for every further interval of
 * max(grace, kMinOverrunInterval) that passes, and shutdown_overruns()
 * counts them.
 *
 * Thread Safety:
 * - submit() may be called from any thread
 * - shutdown() is idempotent; concurrent callers are serialized
 */
class WorkerPool {
public:
  /**
   * @param num_workers Number of worker threads, at least 1
   * @throws std::invalid_argument if num_workers is 0
   */
  explicit WorkerPool(size_t num_workers);
  ~WorkerPool();

  // Non-copyable, non-movable
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  /**
   * Queue a callable for execution
   *
   * Exceptions thrown by the callable are stored in the returned future.
   *
   * @return Future for the callable's result
   * @throws std::runtime_error if shutdown has started
   */
  template<typename F>
  std::future<std::invoke_result_t<std::decay_t<F>>> submit(F&& fn) {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto future = task->get_future();
    enqueue([task]() {
      (*task)();
    });
    return future;
  }

  /**
   * Shut the pool down (see class comment)
   *
   * @param grace How long to wait for queued and running tasks
   * @return true if all tasks finished within the grace period, false if
   *         queued tasks had to be discarded. Later calls return the
   *         result of the first one.
   */
  bool shutdown(std::chrono::milliseconds grace = kDefaultShutdownGrace);

  bool is_accepting() const;

  size_t num_workers() const {
    return threads_.size();
  }

  /// Tasks waiting for a worker
  size_t pending() const;

  /// Tasks currently executing
  size_t active() const;

  uint64_t tasks_completed() const;

  /// Tasks dropped by a forced shutdown
  uint64_t tasks_discarded() const;

  /// Intervals a forced shutdown spent waiting for running tasks
  uint64_t shutdown_overruns() const;

private:
  using Task = std::function<void()>;

  void enqueue(Task task);
  void worker_loop();

  std::vector<std::thread> threads_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> queue_;
  size_t active_ = 0;
  bool accepting_ = true;
  bool stopping_ = false;
  uint64_t completed_ = 0;
  uint64_t discarded_ = 0;
  uint64_t overruns_ = 0;

  std::mutex shutdown_mutex_;
  bool shutdown_done_ = false;
  bool shutdown_clean_ = true;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_WORKER_POOL_HPP
