// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "concurrent_upload_engine.hpp"

#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "upload_errors.hpp"

#define PARCEL_LOG_COMPONENT "upload_engine"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace uploader {

using ::parcel::logging::kv;

namespace {

// Opens a part's start gate on every path out of submitPart()
class AnnounceGuard {
public:
  explicit AnnounceGuard(std::promise<void>& announced)
      : announced_(announced) {}

  ~AnnounceGuard() {
    announced_.set_value();
  }

  AnnounceGuard(const AnnounceGuard&) = delete;
  AnnounceGuard& operator=(const AnnounceGuard&) = delete;

private:
  std::promise<void>& announced_;
};

}  // namespace

ConcurrentUploadEngine::ConcurrentUploadEngine(
  IObjectStore& store, const EngineConfig& config, std::shared_ptr<IUploadObserver> observer
)
    : store_(store)
    , config_(config)
    , observer_(observer ? std::move(observer) : std::make_shared<NullUploadObserver>()) {}

ConcurrentUploadEngine::~ConcurrentUploadEngine() {
  shutdown();
}

void ConcurrentUploadEngine::initialize(const UploadSession& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_) {
    throw UploadStateError("Upload engine already initialized");
  }
  if (shut_down_) {
    throw UploadStateError("Upload engine was shut down");
  }
  if (session.session_id.empty()) {
    throw std::invalid_argument("Cannot initialize upload engine without a session id");
  }

  session_ = session;
  part_uploader_ =
    std::make_unique<PartUploader>(store_, session.destination, session.session_id);
  pool_ = std::make_unique<WorkerPool>(config_.num_workers);
  initialized_ = true;

  PARCEL_LOG_DEBUG(
    "Upload engine initialized" << kv("session_id", session.session_id)
                                << kv("workers", config_.num_workers)
  );
}

int ConcurrentUploadEngine::submitPart(std::vector<uint8_t> chunk, bool is_final) {
  const uint64_t size_bytes = chunk.size();
  // Opened once onPartSubmitted() returned, so a part's outcome event never
  // precedes its submission event
  auto announced = std::make_shared<std::promise<void>>();
  int part_number = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      throw UploadStateError("Cannot submit a part before the upload session is initiated");
    }
    if (shut_down_) {
      throw UploadStateError("Cannot submit a part after the upload engine was shut down");
    }
    if (awaited_) {
      throw UploadStateError("Cannot submit a part after awaitAll()");
    }
    if (final_submitted_) {
      throw UploadStateError("Cannot submit a part after the final part");
    }

    // The number is committed only once the task is queued, so a failed
    // submission leaves no gap. Numbering and the final flag share the
    // lock, so the final part always holds the highest number.
    part_number = next_part_number_.load(std::memory_order_acquire) + 1;
    if (part_number > kMaxPartNumber) {
      throw PartLimitError(
        "Multipart upload exceeds the limit of " + std::to_string(kMaxPartNumber) + " parts"
      );
    }

    std::shared_future<void> gate = announced->get_future().share();
    auto future = pool_->submit(
      [this, part_number, is_final, gate, payload = std::move(chunk)]() {
        gate.wait();
        return runPart(part_number, is_final, payload);
      }
    );
    pending_.push_back(PendingPart{part_number, is_final, size_bytes, std::move(future)});

    next_part_number_.store(part_number, std::memory_order_release);
    if (is_final) {
      final_submitted_ = true;
    }
    parts_submitted_.fetch_add(1, std::memory_order_relaxed);
    bytes_submitted_.fetch_add(size_bytes, std::memory_order_relaxed);
  }

  // Observer code runs without engine locks held
  AnnounceGuard guard(*announced);
  try {
    observer_->onPartSubmitted(part_number, size_bytes, is_final);
  } catch (const std::exception& e) {
    // The part is queued already; a faulty hook must not hide that
    PARCEL_LOG_WARN(
      "Upload observer failed on part submission" << kv("part", part_number)
                                                  << kv("error", e.what())
    );
  }
  return part_number;
}

PartOutcome ConcurrentUploadEngine::runPart(
  int part_number, bool is_final, const std::vector<uint8_t>& payload
) {
  PARCEL_LOG_SCOPED_CONTEXT(session_.session_id, session_.destination.key);

  // Counted after the hook: a throwing hook turns the part into a
  // TaskException failure, counted once by awaitAll()
  PartOutcome outcome = part_uploader_->upload(part_number, is_final, payload);
  if (outcome.success) {
    observer_->onPartSucceeded(part_number, outcome.etag);
    parts_succeeded_.fetch_add(1, std::memory_order_relaxed);
  } else {
    observer_->onPartFailed(part_number, outcome.error_message, outcome.error_code);
    parts_failed_.fetch_add(1, std::memory_order_relaxed);
  }
  return outcome;
}

void ConcurrentUploadEngine::notifyPartFailed(const PartOutcome& outcome) {
  try {
    observer_->onPartFailed(outcome.part_number, outcome.error_message, outcome.error_code);
  } catch (const std::exception& e) {
    PARCEL_LOG_WARN(
      "Upload observer failed on part failure" << kv("part", outcome.part_number)
                                               << kv("error", e.what())
    );
  }
}

PartOutcome ConcurrentUploadEngine::cancelledOutcome(
  const PendingPart& pending, const std::string& message
) const {
  PartOutcome outcome;
  outcome.part_number = pending.part_number;
  outcome.is_final = pending.is_final;
  outcome.size_bytes = pending.size_bytes;
  outcome.success = false;
  outcome.error_message = message;
  outcome.error_code = "TaskCancelled";
  return outcome;
}

std::vector<PartOutcome> ConcurrentUploadEngine::awaitAll() {
  std::vector<PendingPart> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      throw UploadStateError("Cannot await parts before the upload session is initiated");
    }
    if (awaited_) {
      throw UploadStateError("awaitAll() was already called for this session");
    }
    awaited_ = true;
    pending.swap(pending_);
  }

  std::vector<PartOutcome> outcomes;
  outcomes.reserve(pending.size());
  size_t failed = 0;

  for (auto& part : pending) {
    try {
      outcomes.push_back(part.future.get());
    } catch (const std::future_error& e) {
      // The pool discarded the task before it ran
      PartOutcome outcome =
        cancelledOutcome(part, std::string("Upload task cancelled: ") + e.what());
      parts_failed_.fetch_add(1, std::memory_order_relaxed);
      notifyPartFailed(outcome);
      outcomes.push_back(std::move(outcome));
    } catch (const std::exception& e) {
      PartOutcome outcome =
        cancelledOutcome(part, std::string("Upload task failed: ") + e.what());
      outcome.error_code = "TaskException";
      parts_failed_.fetch_add(1, std::memory_order_relaxed);
      notifyPartFailed(outcome);
      outcomes.push_back(std::move(outcome));
    }
    if (!outcomes.back().success) {
      ++failed;
    }
  }

  PARCEL_LOG_DEBUG(
    "All parts settled" << kv("parts", outcomes.size()) << kv("failed", failed)
  );
  return outcomes;
}

bool ConcurrentUploadEngine::shutdown() {
  WorkerPool* pool = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
    pool = pool_.get();
  }
  if (!pool) {
    return true;
  }
  return pool->shutdown(config_.shutdown_grace);
}

bool ConcurrentUploadEngine::isInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}

bool ConcurrentUploadEngine::finalPartSubmitted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return final_submitted_;
}

EngineStats ConcurrentUploadEngine::getStats() const {
  EngineStats stats;
  stats.parts_submitted = parts_submitted_.load(std::memory_order_relaxed);
  stats.parts_succeeded = parts_succeeded_.load(std::memory_order_relaxed);
  stats.parts_failed = parts_failed_.load(std::memory_order_relaxed);
  stats.bytes_submitted = bytes_submitted_.load(std::memory_order_relaxed);
  return stats;
}

}  // namespace uploader
}  // namespace parcel
