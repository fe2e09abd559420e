// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_S3_CLIENT_HPP
#define PARCEL_S3_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>

#include "object_store.hpp"
#include "retry_handler.hpp"

namespace parcel {
namespace uploader {

/**
 * S3 connection options
 */
struct S3Config {
  std::string endpoint_url;  // empty for AWS, e.g. "http://localhost:9000" for MinIO
  std::string bucket;        // default bucket for callers building destinations
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;

  // SDK internal retries stay off; RetryHandler owns retrying
  int max_sdk_retries = 0;
};

/**
 * Object store backed by the AWS SDK for C++
 *
 * Works with AWS S3 and S3-compatible endpoints (MinIO etc., path-style
 * addressing). Each request is retried on transient errors according to
 * the RetryConfig. uploadPart() is safe to call from several threads.
 */
class S3Client : public IObjectStore {
public:
  explicit S3Client(const S3Config& config, const RetryConfig& retry_config = RetryConfig());
  ~S3Client() override;

  // Non-copyable, non-movable
  S3Client(const S3Client&) = delete;
  S3Client& operator=(const S3Client&) = delete;
  S3Client(S3Client&&) = delete;
  S3Client& operator=(S3Client&&) = delete;

  StoreResult initiateMultipartUpload(
    const ObjectDestination& destination, const ObjectAttributes& attributes
  ) override;

  StoreResult uploadPart(
    const ObjectDestination& destination, const std::string& session_id, int part_number,
    bool is_last_part, const std::vector<uint8_t>& payload
  ) override;

  StoreResult completeMultipartUpload(
    const ObjectDestination& destination, const std::string& session_id,
    const std::vector<CompletedPart>& parts
  ) override;

  StoreResult abortMultipartUpload(
    const ObjectDestination& destination, const std::string& session_id
  ) override;

  const std::string& bucket() const;

  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_S3_CLIENT_HPP
