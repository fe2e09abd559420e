// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_UPLOAD_JOBS_HPP
#define PARCEL_UPLOAD_JOBS_HPP

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "concurrent_upload_engine.hpp"
#include "object_store.hpp"
#include "upload_observer.hpp"
#include "upload_types.hpp"
#include "uploader_config.hpp"

namespace parcel {
namespace app {

/**
 * One object to upload
 */
struct UploadJob {
  std::string key;
  std::string content_type;
  std::unique_ptr<std::istream> input;
};

struct JobResult {
  std::string key;
  bool success = false;
  std::optional<::parcel::uploader::CompletedUpload> upload;
  ::parcel::uploader::EngineStats stats;
  std::string error;  // printable report, empty on success
};

/**
 * Upload every job in order, one session per object
 *
 * A job that fails for any reason (upload error, read error, part limit,
 * invalid settings) is recorded in its result and the remaining jobs still
 * run. Results are returned in job order.
 */
std::vector<JobResult> run_upload_jobs(
  ::parcel::uploader::IObjectStore& store, const std::string& bucket,
  std::vector<UploadJob>& jobs, const UploadSettings& settings,
  std::shared_ptr<::parcel::uploader::IUploadObserver> observer
);

}  // namespace app
}  // namespace parcel

#endif  // PARCEL_UPLOAD_JOBS_HPP
