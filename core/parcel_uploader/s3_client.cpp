// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/StringUtils.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <cstdlib>
#include <mutex>

#include "s3_client_test_helpers.hpp"

#define PARCEL_LOG_COMPONENT "s3_client"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace uploader {

using ::parcel::logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// InitAPI/ShutdownAPI must bracket every SDK use in the process. Clients share
// a reference-counted instance.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// Helpers
// =============================================================================

std::string buildTaggingQuery(const std::map<std::string, std::string>& tags) {
  std::string query;
  for (const auto& [key, value] : tags) {
    if (!query.empty()) {
      query += '&';
    }
    query += Aws::Utils::StringUtils::URLEncode(key.c_str());
    query += '=';
    query += Aws::Utils::StringUtils::URLEncode(value.c_str());
  }
  return query;
}

std::string normalizeEndpoint(const std::string& endpoint_url) {
  std::string endpoint = endpoint_url;
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  return endpoint;
}

bool useVirtualAddressing(const S3Config& config) {
  return config.endpoint_url.empty();
}

namespace {

template<typename Outcome>
StoreResult failureFromOutcome(const Outcome& outcome, const std::string& operation) {
  const auto& error = outcome.GetError();
  std::string code = error.GetExceptionName();
  if (code.empty()) {
    code = "Http" + std::to_string(static_cast<int>(error.GetResponseCode()));
  }
  std::string message = error.GetMessage();
  if (message.empty()) {
    message = operation + " failed";
  }
  const bool retryable = error.ShouldRetry() || RetryHandler::isRetryableError(code);
  return StoreResult::Failure(message, code, retryable);
}

}  // namespace

// =============================================================================
// S3Client Implementation
// =============================================================================

class S3Client::Impl {
public:
  S3Config config;
  std::unique_ptr<RetryHandler> retry;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // SDK objects must be gone before release() may call ShutdownAPI
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      client_config.endpointOverride = normalizeEndpoint(config.endpoint_url);
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
      "ParcelS3Client", config.max_sdk_retries
    );

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      useVirtualAddressing(config)
    );
  }
};

S3Client::S3Client(const S3Config& config, const RetryConfig& retry_config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;
  impl_->retry = std::make_unique<RetryHandler>(retry_config);

  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  PARCEL_LOG_DEBUG(
    "S3 client ready" << kv("endpoint", impl_->config.endpoint_url.empty()
                                          ? std::string("aws")
                                          : impl_->config.endpoint_url)
                      << kv("region", impl_->config.region)
  );
}

S3Client::~S3Client() = default;

StoreResult S3Client::initiateMultipartUpload(
  const ObjectDestination& destination, const ObjectAttributes& attributes
) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(destination.bucket);
  request.SetKey(destination.key);
  request.SetContentType(attributes.content_type);

  if (!attributes.metadata.empty()) {
    Aws::Map<Aws::String, Aws::String> aws_metadata;
    for (const auto& [key, value] : attributes.metadata) {
      aws_metadata[key] = value;
    }
    request.SetMetadata(aws_metadata);
  }
  if (!attributes.tags.empty()) {
    request.SetTagging(buildTaggingQuery(attributes.tags));
  }

  return impl_->retry->execute("CreateMultipartUpload", [&]() {
    auto outcome = impl_->client->CreateMultipartUpload(request);
    if (!outcome.IsSuccess()) {
      return failureFromOutcome(outcome, "CreateMultipartUpload");
    }
    return StoreResult::Success(outcome.GetResult().GetUploadId());
  });
}

StoreResult S3Client::uploadPart(
  const ObjectDestination& destination, const std::string& session_id, int part_number,
  bool is_last_part, const std::vector<uint8_t>& payload
) {
  auto result = impl_->retry->execute("UploadPart", [&]() {
    // Fresh stream per attempt so a retry reads the payload from the start
    Aws::Utils::Stream::PreallocatedStreamBuf buffer(
      const_cast<unsigned char*>(payload.data()), payload.size()
    );
    auto body = Aws::MakeShared<Aws::IOStream>("ParcelS3Client", &buffer);

    Aws::S3::Model::UploadPartRequest request;
    request.WithBucket(destination.bucket)
      .WithKey(destination.key)
      .WithUploadId(session_id)
      .WithPartNumber(part_number)
      .WithContentLength(static_cast<long long>(payload.size()));
    request.SetBody(body);

    auto outcome = impl_->client->UploadPart(request);
    if (!outcome.IsSuccess()) {
      return failureFromOutcome(outcome, "UploadPart");
    }
    return StoreResult::Success(outcome.GetResult().GetETag());
  });

  if (!result.success) {
    PARCEL_LOG_WARN(
      "UploadPart failed" << kv("key", destination.key) << kv("part", part_number)
                          << kv("last", is_last_part ? "true" : "false")
                          << kv("code", result.error_code) << kv("error", result.error_message)
    );
  }
  return result;
}

StoreResult S3Client::completeMultipartUpload(
  const ObjectDestination& destination, const std::string& session_id,
  const std::vector<CompletedPart>& parts
) {
  Aws::S3::Model::CompletedMultipartUpload manifest;
  for (const auto& part : parts) {
    manifest.AddParts(
      Aws::S3::Model::CompletedPart().WithPartNumber(part.part_number).WithETag(part.etag)
    );
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.WithBucket(destination.bucket)
    .WithKey(destination.key)
    .WithUploadId(session_id)
    .WithMultipartUpload(manifest);

  return impl_->retry->execute("CompleteMultipartUpload", [&]() {
    auto outcome = impl_->client->CompleteMultipartUpload(request);
    if (!outcome.IsSuccess()) {
      return failureFromOutcome(outcome, "CompleteMultipartUpload");
    }
    return StoreResult::Success(outcome.GetResult().GetETag());
  });
}

StoreResult S3Client::abortMultipartUpload(
  const ObjectDestination& destination, const std::string& session_id
) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.WithBucket(destination.bucket).WithKey(destination.key).WithUploadId(session_id);

  return impl_->retry->execute("AbortMultipartUpload", [&]() {
    auto outcome = impl_->client->AbortMultipartUpload(request);
    if (!outcome.IsSuccess()) {
      return failureFromOutcome(outcome, "AbortMultipartUpload");
    }
    return StoreResult::Success();
  });
}

const std::string& S3Client::bucket() const {
  return impl_->config.bucket;
}

const std::string& S3Client::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace uploader
}  // namespace parcel
