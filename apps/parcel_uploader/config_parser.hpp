// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_CONFIG_PARSER_HPP
#define PARCEL_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

#include "uploader_config.hpp"

namespace parcel {
namespace logging {
struct LoggingConfig;
}
namespace uploader {
struct S3Config;
struct RetryConfig;
struct CoordinatorConfig;
}  // namespace uploader
}  // namespace parcel

namespace parcel {
namespace app {

/**
 * Convert LoggingSettings to parcel::logging::LoggingConfig.
 * Unknown level strings leave the default level in place.
 */
void convert_logging_config(
  const LoggingSettings& settings, ::parcel::logging::LoggingConfig& log_config
);

void convert_store_config(const StoreSettings& settings, ::parcel::uploader::S3Config& s3_config);

void convert_retry_config(
  const RetrySettings& settings, ::parcel::uploader::RetryConfig& retry_config
);

void convert_coordinator_config(
  const UploadSettings& settings, ::parcel::uploader::CoordinatorConfig& coordinator_config
);

/**
 * Part size in bytes
 */
uint64_t part_size_bytes(const UploadSettings& settings);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, UploaderAppConfig& config);

  /**
   * Load configuration from YAML string. Sections missing from the document
   * keep their current values.
   */
  bool load_from_string(const std::string& yaml_content, UploaderAppConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const UploaderAppConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  const std::string& get_last_error() const {
    return last_error_;
  }

private:
  void parse_store(const YAML::Node& node, StoreSettings& store);
  void parse_retry(const YAML::Node& node, RetrySettings& retry);
  void parse_upload(const YAML::Node& node, UploadSettings& upload);
  void parse_logging(const YAML::Node& node, LoggingSettings& logging);

  std::string last_error_;
};

}  // namespace app
}  // namespace parcel

#endif  // PARCEL_CONFIG_PARSER_HPP
