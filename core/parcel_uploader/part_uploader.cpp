// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_uploader.hpp"

#include <chrono>
#include <exception>
#include <utility>

#define PARCEL_LOG_COMPONENT "part_uploader"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace uploader {

using ::parcel::logging::kv;

PartUploader::PartUploader(
  IObjectStore& store, ObjectDestination destination, std::string session_id
)
    : store_(store)
    , destination_(std::move(destination))
    , session_id_(std::move(session_id)) {}

PartOutcome PartUploader::upload(
  int part_number, bool is_final, const std::vector<uint8_t>& payload
) const {
  PartOutcome outcome;
  outcome.part_number = part_number;
  outcome.is_final = is_final;
  outcome.size_bytes = payload.size();

  if (part_number < kMinPartNumber || part_number > kMaxPartNumber) {
    outcome.error_message = "Part number out of range: " + std::to_string(part_number);
    outcome.error_code = "InvalidPartNumber";
    return outcome;
  }

  auto start = std::chrono::steady_clock::now();
  StoreResult result;
  try {
    result =
      store_.uploadPart(destination_, session_id_, part_number, is_final, payload);
  } catch (const std::exception& e) {
    result = StoreResult::Failure(std::string("Exception during part upload: ") + e.what());
  }
  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - start
  )
                      .count();

  if (!result.success) {
    outcome.error_message = result.error_message;
    outcome.error_code = result.error_code;
    return outcome;
  }

  outcome.success = true;
  outcome.etag = result.value;
  PARCEL_LOG_DEBUG(
    "Part stored" << kv("part", part_number) << kv("bytes", payload.size())
                  << kv("duration_ms", elapsed_ms)
  );
  return outcome;
}

}  // namespace uploader
}  // namespace parcel
