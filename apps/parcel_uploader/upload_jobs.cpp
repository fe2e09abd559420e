// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_jobs.hpp"

#include <exception>
#include <stdexcept>

#include "cli_options.hpp"
#include "config_parser.hpp"
#include "session_coordinator.hpp"
#include "upload_errors.hpp"

#define PARCEL_LOG_COMPONENT "upload_jobs"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace app {

using ::parcel::logging::kv;

std::vector<JobResult> run_upload_jobs(
  ::parcel::uploader::IObjectStore& store, const std::string& bucket,
  std::vector<UploadJob>& jobs, const UploadSettings& settings,
  std::shared_ptr<::parcel::uploader::IUploadObserver> observer
) {
  std::vector<JobResult> results;
  results.reserve(jobs.size());

  for (auto& job : jobs) {
    JobResult result;
    result.key = job.key;

    ::parcel::uploader::CoordinatorConfig coordinator_config;
    convert_coordinator_config(settings, coordinator_config);
    coordinator_config.attributes.content_type = job.content_type;

    try {
      if (!job.input) {
        throw std::invalid_argument("No input stream for object '" + job.key + "'");
      }
      ::parcel::uploader::SessionCoordinator coordinator(
        store, {bucket, job.key}, coordinator_config, observer
      );
      result.upload = coordinator.transferStream(*job.input, part_size_bytes(settings));
      result.stats = coordinator.getStats();
      result.success = true;
    } catch (const ::parcel::uploader::MultipartUploadError& e) {
      result.error = format_upload_failure(e);
    } catch (const std::exception& e) {
      PARCEL_LOG_ERROR("Object upload failed" << kv("key", job.key) << kv("error", e.what()));
      result.error = "Error: " + job.key + ": " + e.what();
    }
    results.push_back(std::move(result));
  }
  return results;
}

}  // namespace app
}  // namespace parcel
