// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_UPLOAD_ERRORS_HPP
#define PARCEL_UPLOAD_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace parcel {
namespace uploader {

/**
 * Operation called in the wrong lifecycle phase (e.g. submit before initiate).
 * Never retried.
 */
class UploadStateError : public std::logic_error {
public:
  explicit UploadStateError(const std::string& message)
      : std::logic_error(message) {}
};

/**
 * More parts than the multipart protocol allows
 */
class PartLimitError : public std::out_of_range {
public:
  explicit PartLimitError(const std::string& message)
      : std::out_of_range(message) {}
};

/**
 * I/O fault on the source stream while chunking
 */
class ChunkReadError : public std::runtime_error {
public:
  explicit ChunkReadError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Phase of the multipart protocol in which an upload failed
 */
enum class UploadPhase { Initiate, UploadParts, Complete };

inline std::string phase_to_string(UploadPhase phase) {
  switch (phase) {
    case UploadPhase::Initiate:
      return "initiate";
    case UploadPhase::UploadParts:
      return "upload_parts";
    case UploadPhase::Complete:
      return "complete";
    default:
      return "unknown";
  }
}

/**
 * A failed part as reported by the aggregate error
 */
struct PartFailure {
  int part_number;
  std::string error_message;
  std::string error_code;
};

/**
 * Multipart upload failed and the session was aborted.
 *
 * For UploadPhase::UploadParts, failures() lists every failed part, in
 * ascending part number order. For the other phases it is empty and the
 * store error is carried in the message and error_code().
 */
class MultipartUploadError : public std::runtime_error {
public:
  MultipartUploadError(
    UploadPhase phase, const std::string& message, std::vector<PartFailure> failures = {},
    std::string error_code = ""
  );

  UploadPhase phase() const {
    return phase_;
  }

  const std::vector<PartFailure>& failures() const {
    return failures_;
  }

  const std::string& error_code() const {
    return error_code_;
  }

  /**
   * Check whether a given part number is among the failures
   */
  bool hasFailedPart(int part_number) const;

private:
  UploadPhase phase_;
  std::vector<PartFailure> failures_;
  std::string error_code_;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_UPLOAD_ERRORS_HPP
