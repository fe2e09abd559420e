// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_UPLOAD_TYPES_HPP
#define PARCEL_UPLOAD_TYPES_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace parcel {
namespace uploader {

// Multipart protocol limits (S3)
constexpr int kMinPartNumber = 1;
constexpr int kMaxPartNumber = 10000;
constexpr uint64_t kMinPartSize = 5ULL * 1024 * 1024;         // 5MB, all parts but the last
constexpr uint64_t kMaxPartSize = 5ULL * 1024 * 1024 * 1024;  // 5GB

/**
 * Where the object ends up
 */
struct ObjectDestination {
  std::string bucket;
  std::string key;
};

/**
 * Object attributes, only accepted by the store at initiate time
 */
struct ObjectAttributes {
  std::string content_type = "application/octet-stream";
  std::map<std::string, std::string> metadata;  // keys without x-amz-meta- prefix
  std::map<std::string, std::string> tags;
};

/**
 * One entry of the completion manifest
 */
struct CompletedPart {
  int part_number = 0;
  std::string etag;

  bool operator==(const CompletedPart& other) const {
    return part_number == other.part_number && etag == other.etag;
  }
};

/**
 * Result of a single part upload task
 */
struct PartOutcome {
  int part_number = 0;
  bool is_final = false;
  uint64_t size_bytes = 0;
  bool success = false;
  std::string etag;           // set on success
  std::string error_message;  // set on failure
  std::string error_code;
};

/**
 * Result of a store operation
 *
 * `value` carries the operation's payload: the session id for initiate,
 * the integrity tag (ETag) for upload part, empty otherwise.
 */
struct StoreResult {
  bool success;
  std::string value;
  std::string error_message;
  std::string error_code;
  bool is_retryable;

  static StoreResult Success(const std::string& value = "") {
    return {true, value, "", "", false};
  }

  static StoreResult Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    return {false, "", message, code, retryable};
  }
};

/**
 * Summary of a completed multipart upload
 */
struct CompletedUpload {
  std::string session_id;
  ObjectDestination destination;
  std::vector<CompletedPart> parts;  // ascending part numbers
  uint64_t total_bytes = 0;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_UPLOAD_TYPES_HPP
