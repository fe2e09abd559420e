// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_S3_CLIENT_TEST_HELPERS_HPP
#define PARCEL_S3_CLIENT_TEST_HELPERS_HPP

// This header is for testing only - exposes internal helpers of s3_client.cpp

#include <map>
#include <string>

#include "s3_client.hpp"

namespace parcel {
namespace uploader {

/**
 * Encode object tags as the x-amz-tagging query string ("k1=v1&k2=v2")
 */
std::string buildTaggingQuery(const std::map<std::string, std::string>& tags);

/**
 * Endpoint without trailing slashes
 */
std::string normalizeEndpoint(const std::string& endpoint_url);

/**
 * Virtual-hosted addressing for AWS, path style for custom endpoints
 */
bool useVirtualAddressing(const S3Config& config);

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_S3_CLIENT_TEST_HELPERS_HPP
