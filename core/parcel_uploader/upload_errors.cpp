// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_errors.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace parcel {
namespace uploader {

namespace {

std::string describe(
  UploadPhase phase, const std::string& message, const std::vector<PartFailure>& failures
) {
  std::ostringstream oss;
  oss << "Multipart upload failed during " << phase_to_string(phase) << ": " << message;
  for (const auto& failure : failures) {
    oss << "\n  part " << failure.part_number << ": " << failure.error_message;
    if (!failure.error_code.empty()) {
      oss << " (code: " << failure.error_code << ")";
    }
  }
  return oss.str();
}

}  // namespace

MultipartUploadError::MultipartUploadError(
  UploadPhase phase, const std::string& message, std::vector<PartFailure> failures,
  std::string error_code
)
    : std::runtime_error(describe(phase, message, failures))
    , phase_(phase)
    , failures_(std::move(failures))
    , error_code_(std::move(error_code)) {}

bool MultipartUploadError::hasFailedPart(int part_number) const {
  return std::any_of(failures_.begin(), failures_.end(), [part_number](const PartFailure& f) {
    return f.part_number == part_number;
  });
}

}  // namespace uploader
}  // namespace parcel
