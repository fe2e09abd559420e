// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "cli_options.hpp"
#include "config_parser.hpp"
#include "parcel_log_init.hpp"
#include "report_workbook.hpp"
#include "s3_client.hpp"
#include "upload_jobs.hpp"
#include "upload_observer.hpp"

#define PARCEL_LOG_COMPONENT "parcel_uploader"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace app {

namespace {

using ::parcel::logging::kv;

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " [OPTIONS]\n"
    << "\n"
    << "Parcel Uploader - concurrent multipart upload to S3-compatible storage\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH         Path to YAML configuration file\n"
    << "  --bucket NAME         Destination bucket\n"
    << "  --key KEY             Object key (with --file) or key prefix for reports\n"
    << "  --file PATH           Upload this file; without it the built-in reports\n"
    << "                        are generated and uploaded\n"
    << "  --part-size-mb N      Part size in MiB, 5..5120 (default: 10)\n"
    << "  --workers N           Concurrent part uploads, 1..64 (default: 4)\n"
    << "  --endpoint URL        S3-compatible endpoint (e.g. http://localhost:9000)\n"
    << "  --help                Show this help message\n"
    << "\n"
    << "Credentials are read from the config file or from AWS_ACCESS_KEY_ID and\n"
    << "AWS_SECRET_ACCESS_KEY. Command-line arguments OVERRIDE config file values.\n"
    << "\n"
    << "Examples:\n"
    << "  " << program_name << " --config config/parcel_uploader.yaml \\\n"
    << "    --file /data/export.csv --key exports/export.csv\n"
    << "\n"
    << "  " << program_name << " --bucket reports --endpoint http://localhost:9000 \\\n"
    << "    --key daily/\n"
    << std::endl;
}

bool parse_int_arg(const char* flag, const char* value, int& out) {
  if (!parse_int_option(value, out)) {
    std::cerr << "Error: " << flag << " requires an integer, got '" << value << "'" << std::endl;
    return false;
  }
  return true;
}

void print_summary(const uploader::CompletedUpload& upload, const uploader::EngineStats& stats) {
  std::cout << "\n=== Upload Summary ===\n"
            << "Object:     " << upload.destination.bucket << "/" << upload.destination.key << "\n"
            << "Session:    " << upload.session_id << "\n"
            << "Parts:      " << upload.parts.size() << "\n"
            << "Bytes:      " << upload.total_bytes << "\n"
            << "Succeeded:  " << stats.parts_succeeded << " / " << stats.parts_submitted << "\n"
            << std::endl;
}

}  // namespace

}  // namespace app
}  // namespace parcel

int main(int argc, char* argv[]) {
  using namespace parcel::app;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  // Step 1: Parse command line arguments
  std::string config_file;
  std::string cli_bucket;
  std::string cli_key;
  std::string cli_file;
  std::string cli_endpoint;
  int cli_part_size_mb = -1;
  int cli_workers = -1;

  for (int i = 1; i < argc; ++i) {
    const char* flag = argv[i];
    bool has_value = (i + 1 < argc);
    if (strcmp(flag, "--config") == 0 || strcmp(flag, "--bucket") == 0 ||
        strcmp(flag, "--key") == 0 || strcmp(flag, "--file") == 0 ||
        strcmp(flag, "--endpoint") == 0 || strcmp(flag, "--part-size-mb") == 0 ||
        strcmp(flag, "--workers") == 0) {
      if (!has_value) {
        std::cerr << "Error: " << flag << " requires an argument" << std::endl;
        return 1;
      }
      const char* value = argv[++i];
      if (strcmp(flag, "--config") == 0) {
        config_file = value;
      } else if (strcmp(flag, "--bucket") == 0) {
        cli_bucket = value;
      } else if (strcmp(flag, "--key") == 0) {
        cli_key = value;
      } else if (strcmp(flag, "--file") == 0) {
        cli_file = value;
      } else if (strcmp(flag, "--endpoint") == 0) {
        cli_endpoint = value;
      } else if (strcmp(flag, "--part-size-mb") == 0) {
        if (!parse_int_arg(flag, value, cli_part_size_mb)) {
          return 1;
        }
      } else if (!parse_int_arg(flag, value, cli_workers)) {
        return 1;
      }
    } else {
      std::cerr << "Error: Unknown argument '" << flag << "'" << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  // Step 2: Load configuration file if specified
  UploaderAppConfig config;
  if (!config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << config_file
                << "': " << parser.get_last_error() << std::endl;
      return 1;
    }
  }

  // Step 3: Apply CLI overrides
  if (!cli_bucket.empty()) {
    config.store.bucket = cli_bucket;
  }
  if (!cli_endpoint.empty()) {
    config.store.endpoint_url = cli_endpoint;
  }
  if (cli_part_size_mb >= 0) {
    config.upload.part_size_mb = cli_part_size_mb;
  }
  if (cli_workers >= 0) {
    config.upload.num_workers = cli_workers;
  }

  std::string error_msg;
  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    print_usage(argv[0]);
    return 1;
  }
  if (!cli_file.empty() && cli_key.empty()) {
    std::cerr << "Error: --file requires --key" << std::endl;
    return 1;
  }

  // Step 4: Logging
  parcel::logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  parcel::logging::apply_env_overrides(log_config);
  parcel::logging::init_logging(log_config);

  // Step 5: Collect jobs
  std::vector<UploadJob> jobs;
  if (!cli_file.empty()) {
    auto file = std::make_unique<std::ifstream>(cli_file, std::ios::binary);
    if (!file->is_open()) {
      std::cerr << "Error: Cannot open file '" << cli_file << "'" << std::endl;
      parcel::logging::shutdown_logging();
      return 1;
    }
    jobs.push_back({cli_key, config.upload.content_type, std::move(file)});
  } else {
    for (const auto& stream : parcel::report::buildReportStreams(parcel::report::sampleReports())) {
      jobs.push_back(
        {cli_key + stream.name, stream.content_type,
         std::make_unique<std::istringstream>(stream.content)}
      );
    }
  }

  std::cout << "Parcel Uploader Configuration:\n"
            << "  Bucket:    " << config.store.bucket << "\n"
            << "  Endpoint:  "
            << (config.store.endpoint_url.empty() ? "(AWS)" : config.store.endpoint_url) << "\n"
            << "  Part size: " << config.upload.part_size_mb << " MiB\n"
            << "  Workers:   " << config.upload.num_workers << "\n"
            << "  Objects:   " << jobs.size() << "\n"
            << std::endl;

  // Step 6: Upload
  int exit_code = 0;
  try {
    parcel::uploader::S3Config s3_config;
    convert_store_config(config.store, s3_config);
    parcel::uploader::RetryConfig retry_config;
    convert_retry_config(config.store.retry, retry_config);
    parcel::uploader::S3Client client(s3_config, retry_config);

    auto observer = std::make_shared<parcel::uploader::LoggingUploadObserver>();
    for (const auto& result :
         run_upload_jobs(client, config.store.bucket, jobs, config.upload, observer)) {
      if (result.success) {
        print_summary(*result.upload, result.stats);
      } else {
        std::cerr << result.error << std::endl;
        exit_code = 1;
      }
    }
  } catch (const std::exception& e) {
    // Store client construction failed; no object was attempted
    PARCEL_LOG_ERROR("Upload aborted" << kv("error", e.what()));
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  parcel::logging::shutdown_logging();
  return exit_code;
}
