// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_CONCURRENT_UPLOAD_ENGINE_HPP
#define PARCEL_CONCURRENT_UPLOAD_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "object_store.hpp"
#include "part_uploader.hpp"
#include "upload_observer.hpp"
#include "upload_session.hpp"
#include "upload_types.hpp"
#include "worker_pool.hpp"

namespace parcel {
namespace uploader {

/**
 * Engine configuration
 */
struct EngineConfig {
  size_t num_workers = 4;
  std::chrono::milliseconds shutdown_grace = kDefaultShutdownGrace;
};

/**
 * Engine statistics snapshot
 */
struct EngineStats {
  uint64_t parts_submitted = 0;
  uint64_t parts_succeeded = 0;
  uint64_t parts_failed = 0;
  uint64_t bytes_submitted = 0;
};

/**
 * Uploads the parts of one session with bounded parallelism
 *
 * Part numbers are assigned at submission from an atomic counter, so they
 * are contiguous from 1 regardless of how many threads submit. Uploads run
 * on a WorkerPool; each submission yields one future that awaitAll()
 * consumes. A failed part never cancels the others.
 *
 * Lifecycle:
 *   initialize() -> submitPart()* -> awaitAll() -> shutdown()
 *
 * Thread Safety:
 * - submitPart() may be called concurrently
 * - initialize(), awaitAll() and shutdown() from the owning thread
 * - Observer hooks run with no engine lock held; a part's onPartSubmitted()
 *   always returns before its upload starts
 */
class ConcurrentUploadEngine {
public:
  /**
   * @param store Store the parts go to; must outlive the engine
   * @param config Pool size and shutdown grace
   * @param observer Part event hooks (nullptr for none)
   */
  ConcurrentUploadEngine(
    IObjectStore& store, const EngineConfig& config = EngineConfig(),
    std::shared_ptr<IUploadObserver> observer = nullptr
  );
  ~ConcurrentUploadEngine();

  // Non-copyable, non-movable
  ConcurrentUploadEngine(const ConcurrentUploadEngine&) = delete;
  ConcurrentUploadEngine& operator=(const ConcurrentUploadEngine&) = delete;
  ConcurrentUploadEngine(ConcurrentUploadEngine&&) = delete;
  ConcurrentUploadEngine& operator=(ConcurrentUploadEngine&&) = delete;

  /**
   * Bind the engine to a session and start the worker pool
   *
   * @throws UploadStateError if already initialized
   * @throws std::invalid_argument if the session has no id
   */
  void initialize(const UploadSession& session);

  /**
   * Assign the next part number and queue the upload
   *
   * Returns without waiting for the network call. The part number is
   * consumed only if the part was queued. An exception thrown by the
   * observer's onPartSubmitted() is logged, not propagated.
   *
   * @param chunk Part payload, moved into the task
   * @param is_final True for the last part of the session
   * @return The part number assigned
   * @throws UploadStateError before initialize(), after the final part,
   *         after awaitAll() or after shutdown()
   * @throws PartLimitError if the part number would exceed kMaxPartNumber
   */
  int submitPart(std::vector<uint8_t> chunk, bool is_final);

  /**
   * Wait for every submitted part and return their outcomes
   *
   * Waits on all tasks even after a failure. Tasks discarded by a forced
   * shutdown are reported failed with error code "TaskCancelled". The
   * result is in submission order, which callers must not rely on.
   *
   * @throws UploadStateError before initialize() or when called twice
   */
  std::vector<PartOutcome> awaitAll();

  /**
   * Release the worker pool. Idempotent.
   *
   * @return false if queued tasks had to be discarded
   */
  bool shutdown();

  bool isInitialized() const;

  /// Highest part number assigned so far (0 if none)
  int lastPartNumber() const {
    return next_part_number_.load(std::memory_order_acquire);
  }

  bool finalPartSubmitted() const;

  EngineStats getStats() const;

private:
  struct PendingPart {
    int part_number;
    bool is_final;
    uint64_t size_bytes;
    std::future<PartOutcome> future;
  };

  PartOutcome runPart(int part_number, bool is_final, const std::vector<uint8_t>& payload);
  PartOutcome cancelledOutcome(const PendingPart& pending, const std::string& message) const;
  // Observer exceptions are logged so every remaining future is still consumed
  void notifyPartFailed(const PartOutcome& outcome);

  IObjectStore& store_;
  EngineConfig config_;
  std::shared_ptr<IUploadObserver> observer_;

  mutable std::mutex mutex_;
  bool initialized_ = false;
  bool final_submitted_ = false;
  bool awaited_ = false;
  bool shut_down_ = false;
  UploadSession session_;
  std::unique_ptr<PartUploader> part_uploader_;
  std::unique_ptr<WorkerPool> pool_;
  std::vector<PendingPart> pending_;

  std::atomic<int> next_part_number_{0};

  std::atomic<uint64_t> parts_submitted_{0};
  std::atomic<uint64_t> parts_succeeded_{0};
  std::atomic<uint64_t> parts_failed_{0};
  std::atomic<uint64_t> bytes_submitted_{0};
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_CONCURRENT_UPLOAD_ENGINE_HPP
