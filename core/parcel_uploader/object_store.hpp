// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_OBJECT_STORE_HPP
#define PARCEL_OBJECT_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "upload_types.hpp"

namespace parcel {
namespace uploader {

/**
 * Interface for the multipart operations of an object store.
 * Allows replacing S3 with a fake or mock in tests.
 *
 * uploadPart() is called concurrently from worker threads; implementations
 * must be thread-safe for that call.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  /**
   * Start a multipart upload session
   * @return Success with the session (upload) id as value
   */
  virtual StoreResult initiateMultipartUpload(
    const ObjectDestination& destination, const ObjectAttributes& attributes
  ) = 0;

  /**
   * Upload one part of a session
   * @return Success with the part's integrity tag (ETag) as value
   */
  virtual StoreResult uploadPart(
    const ObjectDestination& destination, const std::string& session_id, int part_number,
    bool is_last_part, const std::vector<uint8_t>& payload
  ) = 0;

  /**
   * Stitch the parts together
   * @param parts Manifest in ascending part number order
   */
  virtual StoreResult completeMultipartUpload(
    const ObjectDestination& destination, const std::string& session_id,
    const std::vector<CompletedPart>& parts
  ) = 0;

  /**
   * Discard a session and the parts uploaded so far
   */
  virtual StoreResult abortMultipartUpload(
    const ObjectDestination& destination, const std::string& session_id
  ) = 0;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_OBJECT_STORE_HPP
