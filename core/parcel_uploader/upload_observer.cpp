// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_observer.hpp"

#define PARCEL_LOG_COMPONENT "upload_events"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace uploader {

using ::parcel::logging::kv;

void LoggingUploadObserver::onPartSubmitted(int part_number, uint64_t size_bytes, bool is_final) {
  PARCEL_LOG_DEBUG(
    "Part submitted" << kv("part", part_number) << kv("size", size_bytes)
                     << kv("final", is_final ? "true" : "false")
  );
}

void LoggingUploadObserver::onPartSucceeded(int part_number, const std::string& etag) {
  PARCEL_LOG_DEBUG("Part uploaded" << kv("part", part_number) << kv("etag", etag));
}

void LoggingUploadObserver::onPartFailed(
  int part_number, const std::string& error_message, const std::string& error_code
) {
  PARCEL_LOG_WARN(
    "Part upload failed" << kv("part", part_number) << kv("error", error_message)
                         << kv("code", error_code)
  );
}

void LoggingUploadObserver::onSessionCompleted(const CompletedUpload& upload) {
  PARCEL_LOG_INFO(
    "Multipart upload completed" << kv("bucket", upload.destination.bucket)
                                 << kv("key", upload.destination.key)
                                 << kv("session_id", upload.session_id)
                                 << kv("parts", upload.parts.size())
                                 << kv("bytes", upload.total_bytes)
  );
}

void LoggingUploadObserver::onSessionAborted(
  const ObjectDestination& destination, const std::string& session_id, const std::string& reason
) {
  PARCEL_LOG_ERROR(
    "Multipart upload aborted" << kv("bucket", destination.bucket) << kv("key", destination.key)
                               << kv("session_id", session_id) << kv("reason", reason)
  );
}

}  // namespace uploader
}  // namespace parcel
