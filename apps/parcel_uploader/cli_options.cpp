// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cli_options.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

#include "upload_errors.hpp"

namespace parcel {
namespace app {

bool parse_int_option(const std::string& value, int& out) {
  if (value.empty()) {
    return false;
  }
  const char* begin = value.c_str();
  char* end = nullptr;
  errno = 0;
  long parsed = std::strtol(begin, &end, 10);
  if (end == begin || *end != '\0' || errno == ERANGE) {
    return false;
  }
  if (parsed < INT_MIN || parsed > INT_MAX) {
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

std::string format_upload_failure(const ::parcel::uploader::MultipartUploadError& error) {
  std::ostringstream oss;
  oss << "Error: " << error.what();
  if (!error.error_code().empty()) {
    oss << "\n  store error code: " << error.error_code();
  }
  return oss.str();
}

}  // namespace app
}  // namespace parcel
