// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_UPLOADER_CONFIG_HPP
#define PARCEL_UPLOADER_CONFIG_HPP

#include <cstdint>
#include <map>
#include <string>

namespace parcel {
namespace app {

/**
 * Retry policy as written in YAML
 */
struct RetrySettings {
  int max_retries = 3;
  int initial_delay_ms = 200;
  int max_delay_ms = 5000;
  double exponential_base = 2.0;
  bool jitter = true;
};

/**
 * Store connection as written in YAML
 */
struct StoreSettings {
  std::string endpoint_url;
  std::string bucket;
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;
  std::string access_key;
  std::string secret_key;
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;
  RetrySettings retry;
};

/**
 * Upload engine and object settings
 */
struct UploadSettings {
  int part_size_mb = 10;
  int num_workers = 4;
  int shutdown_grace_ms = 2000;
  std::string content_type = "application/json";
  std::map<std::string, std::string> metadata;
  std::map<std::string, std::string> tags;
};

/**
 * Logging settings, levels kept as strings until conversion
 */
struct LoggingSettings {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/parcel";
  std::string file_pattern = "parcel_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";  // "json" or "text"
  uint64_t rotation_size_mb = 100;
  int max_files = 10;
  bool rotate_at_midnight = true;
};

struct UploaderAppConfig {
  StoreSettings store;
  UploadSettings upload;
  LoggingSettings logging;
};

}  // namespace app
}  // namespace parcel

#endif  // PARCEL_UPLOADER_CONFIG_HPP
