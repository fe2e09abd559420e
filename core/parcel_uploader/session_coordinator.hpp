// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_SESSION_COORDINATOR_HPP
#define PARCEL_SESSION_COORDINATOR_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "concurrent_upload_engine.hpp"
#include "object_store.hpp"
#include "upload_observer.hpp"
#include "upload_session.hpp"
#include "upload_types.hpp"

namespace parcel {
namespace uploader {

/**
 * Coordinator configuration
 */
struct CoordinatorConfig {
  EngineConfig engine;
  ObjectAttributes attributes;  // sent with initiate
};

/**
 * Drives one multipart upload session through its lifecycle
 *
 * Any failure after initiate aborts the store session so no parts are left
 * behind. The worker pool is released on every path out of
 * finalizeUpload() and abort().
 *
 * Usage:
 *   SessionCoordinator coordinator(store, {"reports", "offers.json"}, config);
 *   coordinator.initiate();
 *   coordinator.uploadPart(std::move(chunk1));
 *   coordinator.uploadFinalPart(std::move(chunk2));
 *   CompletedUpload done = coordinator.finalizeUpload();
 */
class SessionCoordinator {
public:
  /**
   * @param store Store collaborator; must outlive the coordinator
   * @param destination Bucket and key of the object
   * @param config Engine and object settings
   * @param observer Event hooks (nullptr for none)
   */
  SessionCoordinator(
    IObjectStore& store, ObjectDestination destination,
    const CoordinatorConfig& config = CoordinatorConfig(),
    std::shared_ptr<IUploadObserver> observer = nullptr
  );

  /**
   * Aborts a session still in Uploading or Completing
   */
  ~SessionCoordinator();

  // Non-copyable, non-movable
  SessionCoordinator(const SessionCoordinator&) = delete;
  SessionCoordinator& operator=(const SessionCoordinator&) = delete;
  SessionCoordinator(SessionCoordinator&&) = delete;
  SessionCoordinator& operator=(SessionCoordinator&&) = delete;

  /**
   * Open the store session
   *
   * @throws UploadStateError if not in Initialized
   * @throws MultipartUploadError (phase Initiate) if the store refused; the
   *         session is then Aborted
   */
  void initiate();

  /**
   * Submit a non-final part
   * @return Part number assigned
   * @throws UploadStateError outside Uploading
   * @throws PartLimitError beyond kMaxPartNumber parts
   */
  int uploadPart(std::vector<uint8_t> chunk);

  /**
   * Submit the last part and move to Completing
   * @return Part number assigned
   * @throws UploadStateError outside Uploading
   */
  int uploadFinalPart(std::vector<uint8_t> chunk);

  /**
   * Wait for all parts, then complete or abort the session
   *
   * @return Summary of the stored object
   * @throws UploadStateError outside Completing; the session stays open
   * @throws MultipartUploadError if any part or the complete call failed;
   *         the store session has been aborted
   */
  CompletedUpload finalizeUpload();

  /**
   * Abort the session: settle in-flight parts, release the store session
   * and the pool. A failing store abort is logged, not thrown.
   *
   * @throws UploadStateError outside Uploading and Completing
   */
  void abort(const std::string& reason);

  /**
   * Run the whole protocol over a stream
   *
   * Initiates, chunks the stream, submits every chunk and finalizes. Any
   * failure after initiate aborts the session before the exception leaves.
   *
   * @throws std::invalid_argument for a chunk size out of bounds (before
   *         anything reaches the store)
   * @throws ChunkReadError, MultipartUploadError, UploadStateError
   */
  CompletedUpload transferStream(
    std::istream& input, uint64_t chunk_size, uint64_t min_chunk_size = kMinPartSize
  );

  SessionState state() const;

  /// Empty until initiate() succeeded
  std::string sessionId() const;

  const ObjectDestination& destination() const {
    return destination_;
  }

  EngineStats getStats() const {
    return engine_->getStats();
  }

private:
  void requireState(SessionState expected, const char* operation) const;
  void abortStoreSession(const std::string& reason);

  IObjectStore& store_;
  ObjectDestination destination_;
  CoordinatorConfig config_;
  std::shared_ptr<IUploadObserver> observer_;
  std::unique_ptr<ConcurrentUploadEngine> engine_;

  mutable std::mutex mutex_;
  UploadSession session_;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_SESSION_COORDINATOR_HPP
