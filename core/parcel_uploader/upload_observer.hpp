// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_UPLOAD_OBSERVER_HPP
#define PARCEL_UPLOAD_OBSERVER_HPP

#include <cstdint>
#include <string>

#include "upload_types.hpp"

namespace parcel {
namespace uploader {

/**
 * Observability hooks for multipart uploads.
 *
 * Part events are raised from worker threads and may arrive concurrently;
 * implementations must be thread-safe.
 */
class IUploadObserver {
public:
  virtual ~IUploadObserver() = default;

  virtual void onPartSubmitted(int part_number, uint64_t size_bytes, bool is_final) = 0;

  virtual void onPartSucceeded(int part_number, const std::string& etag) = 0;

  virtual void onPartFailed(
    int part_number, const std::string& error_message, const std::string& error_code
  ) = 0;

  virtual void onSessionCompleted(const CompletedUpload& upload) = 0;

  virtual void onSessionAborted(
    const ObjectDestination& destination, const std::string& session_id,
    const std::string& reason
  ) = 0;
};

/**
 * Observer that ignores every event
 */
class NullUploadObserver : public IUploadObserver {
public:
  void onPartSubmitted(int, uint64_t, bool) override {}
  void onPartSucceeded(int, const std::string&) override {}
  void onPartFailed(int, const std::string&, const std::string&) override {}
  void onSessionCompleted(const CompletedUpload&) override {}
  void onSessionAborted(const ObjectDestination&, const std::string&, const std::string&) override {
  }
};

/**
 * Observer that writes every event to the parcel log
 */
class LoggingUploadObserver : public IUploadObserver {
public:
  void onPartSubmitted(int part_number, uint64_t size_bytes, bool is_final) override;
  void onPartSucceeded(int part_number, const std::string& etag) override;
  void onPartFailed(
    int part_number, const std::string& error_message, const std::string& error_code
  ) override;
  void onSessionCompleted(const CompletedUpload& upload) override;
  void onSessionAborted(
    const ObjectDestination& destination, const std::string& session_id,
    const std::string& reason
  ) override;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_UPLOAD_OBSERVER_HPP
