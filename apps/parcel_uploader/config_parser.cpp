// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <chrono>
#include <fstream>

#include "parcel_log_init.hpp"
#include "retry_handler.hpp"
#include "s3_client.hpp"
#include "session_coordinator.hpp"
#include "upload_types.hpp"

#define PARCEL_LOG_COMPONENT "config_parser"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace app {

namespace {

constexpr int kMinPartSizeMb = 5;
constexpr int kMaxPartSizeMb = 5120;
constexpr int kMaxWorkers = 64;
constexpr uint64_t kMiB = 1024ULL * 1024;

void parse_string_map(const YAML::Node& node, std::map<std::string, std::string>& out) {
  if (!node.IsMap()) {
    throw YAML::RepresentationException(node.Mark(), "expected a map of strings");
  }
  for (const auto& entry : node) {
    out[entry.first.as<std::string>()] = entry.second.as<std::string>();
  }
}

}  // namespace

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, UploaderAppConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, UploaderAppConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["store"]) {
      parse_store(node["store"], config.store);
    }
    if (node["upload"]) {
      parse_upload(node["upload"], config.upload);
    }
    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }

    last_error_.clear();
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "YAML parsing error: " + std::string(e.what());
    PARCEL_LOG_ERROR("YAML parsing error" << ::parcel::logging::kv("error", e.what()));
    return false;
  }
}

void ConfigParser::parse_store(const YAML::Node& node, StoreSettings& store) {
  if (node["endpoint_url"]) {
    store.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["bucket"]) {
    store.bucket = node["bucket"].as<std::string>();
  }
  if (node["region"]) {
    store.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    store.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    store.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    store.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    store.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["connect_timeout_ms"]) {
    store.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    store.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["retry"]) {
    parse_retry(node["retry"], store.retry);
  }
}

void ConfigParser::parse_retry(const YAML::Node& node, RetrySettings& retry) {
  if (node["max_retries"]) {
    retry.max_retries = node["max_retries"].as<int>();
  }
  if (node["initial_delay_ms"]) {
    retry.initial_delay_ms = node["initial_delay_ms"].as<int>();
  }
  if (node["max_delay_ms"]) {
    retry.max_delay_ms = node["max_delay_ms"].as<int>();
  }
  if (node["exponential_base"]) {
    retry.exponential_base = node["exponential_base"].as<double>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
}

void ConfigParser::parse_upload(const YAML::Node& node, UploadSettings& upload) {
  if (node["part_size_mb"]) {
    upload.part_size_mb = node["part_size_mb"].as<int>();
  }
  if (node["num_workers"]) {
    upload.num_workers = node["num_workers"].as<int>();
  }
  if (node["shutdown_grace_ms"]) {
    upload.shutdown_grace_ms = node["shutdown_grace_ms"].as<int>();
  }
  if (node["content_type"]) {
    upload.content_type = node["content_type"].as<std::string>();
  }
  if (node["metadata"]) {
    parse_string_map(node["metadata"], upload.metadata);
  }
  if (node["tags"]) {
    parse_string_map(node["tags"], upload.tags);
  }
}

void ConfigParser::parse_logging(const YAML::Node& node, LoggingSettings& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }
}

bool ConfigParser::validate(const UploaderAppConfig& config, std::string& error_msg) {
  const auto& store = config.store;
  if (store.bucket.empty()) {
    error_msg = "store.bucket is not configured";
    return false;
  }

  if (!store.endpoint_url.empty()) {
    if (store.endpoint_url.find("http://") != 0 && store.endpoint_url.find("https://") != 0) {
      error_msg = "Invalid store.endpoint_url - must start with http:// or https://";
      return false;
    }
  }

  if (store.connect_timeout_ms <= 0 || store.request_timeout_ms <= 0) {
    error_msg = "Invalid store timeouts - must be > 0";
    return false;
  }

  if (store.retry.max_retries < 0 || store.retry.max_retries > 100) {
    error_msg = "Invalid retry.max_retries - must be between 0 and 100";
    return false;
  }

  if (store.retry.initial_delay_ms < 0) {
    error_msg = "Invalid retry.initial_delay_ms - must be >= 0";
    return false;
  }

  if (store.retry.max_delay_ms < store.retry.initial_delay_ms) {
    error_msg = "Invalid retry.max_delay_ms - must be >= initial_delay_ms";
    return false;
  }

  if (store.retry.exponential_base < 1.0) {
    error_msg = "Invalid retry.exponential_base - must be >= 1.0";
    return false;
  }

  const auto& upload = config.upload;
  if (upload.part_size_mb < kMinPartSizeMb || upload.part_size_mb > kMaxPartSizeMb) {
    error_msg = "Invalid upload.part_size_mb - must be between 5 and 5120";
    return false;
  }

  if (upload.num_workers < 1 || upload.num_workers > kMaxWorkers) {
    error_msg = "Invalid upload.num_workers - must be between 1 and 64";
    return false;
  }

  if (upload.shutdown_grace_ms < 0) {
    error_msg = "Invalid upload.shutdown_grace_ms - must be >= 0";
    return false;
  }

  const auto& logging = config.logging;
  if (!::parcel::logging::parse_severity_level(logging.console_level)) {
    error_msg = "Invalid logging.console.level: " + logging.console_level;
    return false;
  }
  if (!::parcel::logging::parse_severity_level(logging.file_level)) {
    error_msg = "Invalid logging.file.level: " + logging.file_level;
    return false;
  }
  if (logging.file_format != "json" && logging.file_format != "text") {
    error_msg = "Invalid logging.file.format - must be 'json' or 'text'";
    return false;
  }

  return true;
}

// ============================================================================
// Conversions
// ============================================================================

void convert_logging_config(
  const LoggingSettings& settings, ::parcel::logging::LoggingConfig& log_config
) {
  log_config.console_enabled = settings.console_enabled;
  log_config.console_colors = settings.console_colors;
  if (auto level = ::parcel::logging::parse_severity_level(settings.console_level)) {
    log_config.console_level = *level;
  }

  log_config.file_enabled = settings.file_enabled;
  if (auto level = ::parcel::logging::parse_severity_level(settings.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = settings.file_directory;
  log_config.file_config.file_pattern = settings.file_pattern;
  log_config.file_config.format_json = (settings.file_format == "json");
  log_config.file_config.rotation_size_mb = settings.rotation_size_mb;
  log_config.file_config.max_files = settings.max_files;
  log_config.file_config.rotate_at_midnight = settings.rotate_at_midnight;
}

void convert_store_config(const StoreSettings& settings, ::parcel::uploader::S3Config& s3_config) {
  s3_config.endpoint_url = settings.endpoint_url;
  s3_config.bucket = settings.bucket;
  s3_config.region = settings.region;
  s3_config.use_ssl = settings.use_ssl;
  s3_config.verify_ssl = settings.verify_ssl;
  s3_config.access_key = settings.access_key;
  s3_config.secret_key = settings.secret_key;
  s3_config.connect_timeout_ms = settings.connect_timeout_ms;
  s3_config.request_timeout_ms = settings.request_timeout_ms;
}

void convert_retry_config(
  const RetrySettings& settings, ::parcel::uploader::RetryConfig& retry_config
) {
  retry_config.max_retries = settings.max_retries;
  retry_config.initial_delay = std::chrono::milliseconds(settings.initial_delay_ms);
  retry_config.max_delay = std::chrono::milliseconds(settings.max_delay_ms);
  retry_config.exponential_base = settings.exponential_base;
  retry_config.jitter = settings.jitter;
}

void convert_coordinator_config(
  const UploadSettings& settings, ::parcel::uploader::CoordinatorConfig& coordinator_config
) {
  coordinator_config.engine.num_workers = static_cast<size_t>(settings.num_workers);
  coordinator_config.engine.shutdown_grace = std::chrono::milliseconds(settings.shutdown_grace_ms);
  coordinator_config.attributes.content_type = settings.content_type;
  coordinator_config.attributes.metadata = settings.metadata;
  coordinator_config.attributes.tags = settings.tags;
}

uint64_t part_size_bytes(const UploadSettings& settings) {
  return static_cast<uint64_t>(settings.part_size_mb) * kMiB;
}

}  // namespace app
}  // namespace parcel
