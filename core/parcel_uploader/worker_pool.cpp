// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "worker_pool.hpp"

#include <algorithm>
#include <stdexcept>

#define PARCEL_LOG_COMPONENT "worker_pool"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace uploader {

using ::parcel::logging::kv;

WorkerPool::WorkerPool(size_t num_workers) {
  if (num_workers == 0) {
    throw std::invalid_argument("WorkerPool requires at least one worker");
  }

  threads_.reserve(num_workers);
  for (size_t i = 0; i < num_workers; ++i) {
    threads_.emplace_back(&WorkerPool::worker_loop, this);
  }
  PARCEL_LOG_DEBUG("Worker pool started" << kv("workers", num_workers));
}

WorkerPool::~WorkerPool() {
  shutdown();
}

void WorkerPool::enqueue(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
      throw std::runtime_error("WorkerPool is shut down, task rejected");
    }
    queue_.push_back(std::move(task));
  }
  work_cv_.notify_one();
}

bool WorkerPool::shutdown(std::chrono::milliseconds grace) {
  std::lock_guard<std::mutex> shutdown_lock(shutdown_mutex_);
  if (shutdown_done_) {
    return shutdown_clean_;
  }

  // Tasks are destroyed outside the lock so their futures become ready
  // without holding the pool mutex.
  std::deque<Task> discarded;
  size_t still_active = 0;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    accepting_ = false;

    shutdown_clean_ = idle_cv_.wait_for(lock, grace, [this] {
      return queue_.empty() && active_ == 0;
    });

    if (!shutdown_clean_) {
      discarded.swap(queue_);
      discarded_ += discarded.size();
      still_active = active_;
    }
    stopping_ = true;
  }
  work_cv_.notify_all();

  if (!shutdown_clean_) {
    PARCEL_LOG_WARN(
      "Worker pool did not drain within grace period, cancelling queued tasks"
      << kv("grace_ms", grace.count()) << kv("discarded", discarded.size())
      << kv("running", still_active)
    );
  }
  discarded.clear();

  // Running tasks cannot be interrupted; keep waiting and report every
  // further interval that passes without them finishing
  if (still_active > 0) {
    const auto interval = std::max(grace, kMinOverrunInterval);
    std::unique_lock<std::mutex> lock(mutex_);
    while (!idle_cv_.wait_for(lock, interval, [this] {
      return active_ == 0;
    })) {
      ++overruns_;
      PARCEL_LOG_WARN(
        "Worker pool still waiting for running tasks after forced shutdown"
        << kv("running", active_) << kv("interval_ms", interval.count())
        << kv("overruns", overruns_)
      );
    }
  }

  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  shutdown_done_ = true;
  PARCEL_LOG_DEBUG(
    "Worker pool stopped" << kv("completed", tasks_completed())
                          << kv("clean", shutdown_clean_ ? "true" : "false")
  );
  return shutdown_clean_;
}

void WorkerPool::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return stopping_ || !queue_.empty();
      });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    // Tasks are packaged; their exceptions land in the future
    task();

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      ++completed_;
      if (queue_.empty() && active_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

bool WorkerPool::is_accepting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accepting_;
}

size_t WorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

size_t WorkerPool::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

uint64_t WorkerPool::tasks_completed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

uint64_t WorkerPool::tasks_discarded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return discarded_;
}

uint64_t WorkerPool::shutdown_overruns() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return overruns_;
}

}  // namespace uploader
}  // namespace parcel
