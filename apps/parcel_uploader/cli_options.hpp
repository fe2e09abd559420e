// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_CLI_OPTIONS_HPP
#define PARCEL_CLI_OPTIONS_HPP

#include <string>

namespace parcel {
namespace uploader {
class MultipartUploadError;
}  // namespace uploader
}  // namespace parcel

namespace parcel {
namespace app {

/**
 * Parse a decimal integer command-line value.
 * Rejects empty input, trailing characters and values outside the int range;
 * `out` is left untouched on failure.
 */
bool parse_int_option(const std::string& value, int& out);

/**
 * One report of a failed upload. The error message already lists every
 * failed part, so each part appears exactly once.
 */
std::string format_upload_failure(const ::parcel::uploader::MultipartUploadError& error);

}  // namespace app
}  // namespace parcel

#endif  // PARCEL_CLI_OPTIONS_HPP
