// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "session_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <utility>

#include "chunker.hpp"
#include "upload_errors.hpp"

#define PARCEL_LOG_COMPONENT "session_coordinator"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace uploader {

using ::parcel::logging::kv;

namespace {

// Releases the engine's worker pool when finalize leaves, whatever the outcome
class PoolRelease {
public:
  explicit PoolRelease(ConcurrentUploadEngine& engine)
      : engine_(engine) {}

  ~PoolRelease() {
    engine_.shutdown();
  }

  PoolRelease(const PoolRelease&) = delete;
  PoolRelease& operator=(const PoolRelease&) = delete;

private:
  ConcurrentUploadEngine& engine_;
};

}  // namespace

SessionCoordinator::SessionCoordinator(
  IObjectStore& store, ObjectDestination destination, const CoordinatorConfig& config,
  std::shared_ptr<IUploadObserver> observer
)
    : store_(store)
    , destination_(std::move(destination))
    , config_(config)
    , observer_(observer ? std::move(observer) : std::make_shared<NullUploadObserver>())
    , engine_(std::make_unique<ConcurrentUploadEngine>(store, config.engine, observer_)) {
  session_.destination = destination_;
}

SessionCoordinator::~SessionCoordinator() {
  const SessionState current = state();
  if (current != SessionState::Uploading && current != SessionState::Completing) {
    return;
  }

  try {
    abort("Session coordinator destroyed with an open session");
  } catch (const std::exception& e) {
    PARCEL_LOG_ERROR(
      "Failed to abort open session on destruction" << kv("session_id", sessionId())
                                                    << kv("error", e.what())
    );
  }
}

void SessionCoordinator::requireState(SessionState expected, const char* operation) const {
  if (session_.state != expected) {
    throw UploadStateError(
      std::string(operation) + " not allowed in state " + state_to_string(session_.state) +
      " (expected " + state_to_string(expected) + ")"
    );
  }
}

void SessionCoordinator::initiate() {
  std::lock_guard<std::mutex> lock(mutex_);
  requireState(SessionState::Initialized, "initiate()");

  StoreResult result;
  try {
    result = store_.initiateMultipartUpload(destination_, config_.attributes);
  } catch (const std::exception& e) {
    result = StoreResult::Failure(std::string("Exception during initiate: ") + e.what());
  }

  if (!result.success || result.value.empty()) {
    // No store session exists, nothing to abort at the store
    session_.state = SessionState::Aborted;
    const std::string message =
      result.success ? std::string("store returned an empty session id") : result.error_message;
    PARCEL_LOG_ERROR(
      "Failed to initiate multipart upload" << kv("bucket", destination_.bucket)
                                            << kv("key", destination_.key)
                                            << kv("error", message)
    );
    observer_->onSessionAborted(destination_, "", message);
    throw MultipartUploadError(UploadPhase::Initiate, message, {}, result.error_code);
  }

  session_.session_id = result.value;
  engine_->initialize(session_);
  session_.state = SessionState::Uploading;

  PARCEL_LOG_INFO(
    "Multipart upload initiated" << kv("bucket", destination_.bucket)
                                 << kv("key", destination_.key)
                                 << kv("session_id", session_.session_id)
  );
}

// The engine itself rejects parts after the final one or after shutdown, so
// the state check and the submission do not share a lock. Observer hooks
// fired by the submission may call back into the coordinator.
int SessionCoordinator::uploadPart(std::vector<uint8_t> chunk) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requireState(SessionState::Uploading, "uploadPart()");
  }
  return engine_->submitPart(std::move(chunk), false);
}

int SessionCoordinator::uploadFinalPart(std::vector<uint8_t> chunk) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requireState(SessionState::Uploading, "uploadFinalPart()");
  }
  const int part_number = engine_->submitPart(std::move(chunk), true);

  std::lock_guard<std::mutex> lock(mutex_);
  // A concurrent abort() wins
  if (session_.state == SessionState::Uploading) {
    session_.state = SessionState::Completing;
  }
  return part_number;
}

CompletedUpload SessionCoordinator::finalizeUpload() {
  UploadSession session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requireState(SessionState::Completing, "finalizeUpload()");
    session = session_;
  }
  PARCEL_LOG_SCOPED_CONTEXT(session.session_id, destination_.key);

  PoolRelease release(*engine_);
  std::vector<PartOutcome> outcomes = engine_->awaitAll();
  std::sort(outcomes.begin(), outcomes.end(), [](const PartOutcome& a, const PartOutcome& b) {
    return a.part_number < b.part_number;
  });

  std::vector<PartFailure> failures;
  for (const auto& outcome : outcomes) {
    if (!outcome.success) {
      failures.push_back(PartFailure{outcome.part_number, outcome.error_message, outcome.error_code}
      );
    }
  }

  if (!failures.empty()) {
    std::ostringstream reason;
    reason << failures.size() << " of " << outcomes.size() << " parts failed";
    abortStoreSession(reason.str());
    throw MultipartUploadError(UploadPhase::UploadParts, reason.str(), std::move(failures));
  }

  CompletedUpload upload;
  upload.session_id = session.session_id;
  upload.destination = destination_;
  upload.parts.reserve(outcomes.size());
  for (const auto& outcome : outcomes) {
    upload.parts.push_back(CompletedPart{outcome.part_number, outcome.etag});
    upload.total_bytes += outcome.size_bytes;
  }

  StoreResult result;
  try {
    result = store_.completeMultipartUpload(destination_, session.session_id, upload.parts);
  } catch (const std::exception& e) {
    result = StoreResult::Failure(std::string("Exception during complete: ") + e.what());
  }

  if (!result.success) {
    abortStoreSession("Complete failed: " + result.error_message);
    throw MultipartUploadError(UploadPhase::Complete, result.error_message, {}, result.error_code);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.state = SessionState::Completed;
  }
  observer_->onSessionCompleted(upload);
  return upload;
}

void SessionCoordinator::abort(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != SessionState::Uploading && session_.state != SessionState::Completing) {
      throw UploadStateError(
        std::string("abort() not allowed in state ") + state_to_string(session_.state)
      );
    }
  }

  // Queued parts beyond the grace period are cancelled; running ones settle
  engine_->shutdown();
  const std::vector<PartOutcome> outcomes = engine_->awaitAll();
  PARCEL_LOG_DEBUG("Parts settled before abort" << kv("parts", outcomes.size()));

  abortStoreSession(reason);
}

void SessionCoordinator::abortStoreSession(const std::string& reason) {
  std::string session_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session_id = session_.session_id;
  }

  StoreResult result;
  try {
    result = store_.abortMultipartUpload(destination_, session_id);
  } catch (const std::exception& e) {
    result = StoreResult::Failure(std::string("Exception during abort: ") + e.what());
  }

  if (!result.success) {
    PARCEL_LOG_ERROR(
      "Failed to abort multipart upload, parts may remain in the store"
      << kv("session_id", session_id) << kv("error", result.error_message)
      << kv("code", result.error_code)
    );
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.state = SessionState::Aborted;
  }
  observer_->onSessionAborted(destination_, session_id, reason);
}

CompletedUpload SessionCoordinator::transferStream(
  std::istream& input, uint64_t chunk_size, uint64_t min_chunk_size
) {
  Chunker chunker(input, chunk_size, min_chunk_size);
  initiate();

  try {
    while (auto chunk = chunker.next()) {
      if (chunk->is_final) {
        uploadFinalPart(std::move(chunk->data));
      } else {
        uploadPart(std::move(chunk->data));
      }
    }
  } catch (const std::exception& e) {
    abort(std::string("Transfer interrupted: ") + e.what());
    throw;
  }

  PARCEL_LOG_DEBUG(
    "Stream chunked" << kv("chunks", chunker.chunks_produced())
                     << kv("bytes", chunker.bytes_consumed())
  );
  return finalizeUpload();
}

SessionState SessionCoordinator::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.state;
}

std::string SessionCoordinator::sessionId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.session_id;
}

}  // namespace uploader
}  // namespace parcel
