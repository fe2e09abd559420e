// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for command-line value parsing and failure reporting
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli_options.hpp"
#include "upload_errors.hpp"

using namespace parcel::app;
using parcel::uploader::MultipartUploadError;
using parcel::uploader::PartFailure;
using parcel::uploader::UploadPhase;

namespace {

size_t count_occurrences(const std::string& text, const std::string& needle) {
  size_t count = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

}  // namespace

// ============================================================================
// Integer options
// ============================================================================

TEST(ParseIntOptionTest, AcceptsDecimalValues) {
  int value = 0;
  EXPECT_TRUE(parse_int_option("16", value));
  EXPECT_EQ(value, 16);

  EXPECT_TRUE(parse_int_option("-3", value));
  EXPECT_EQ(value, -3);
}

TEST(ParseIntOptionTest, RejectsMalformedValues) {
  int value = 7;
  EXPECT_FALSE(parse_int_option("", value));
  EXPECT_FALSE(parse_int_option("abc", value));
  EXPECT_FALSE(parse_int_option("12abc", value));
  EXPECT_FALSE(parse_int_option("4.5", value));
  EXPECT_EQ(value, 7);
}

TEST(ParseIntOptionTest, RejectsValuesOutsideIntRange) {
  int value = 7;
  // Wraps to 0 or 1 when narrowed without a range check
  EXPECT_FALSE(parse_int_option("4294967296", value));
  EXPECT_FALSE(parse_int_option("4294967297", value));
  EXPECT_FALSE(parse_int_option("-2147483649", value));
  // Overflows long as well
  EXPECT_FALSE(parse_int_option("99999999999999999999999", value));
  EXPECT_EQ(value, 7);
}

TEST(ParseIntOptionTest, AcceptsIntLimits) {
  int value = 0;
  EXPECT_TRUE(parse_int_option("2147483647", value));
  EXPECT_EQ(value, 2147483647);
  EXPECT_TRUE(parse_int_option("-2147483648", value));
  EXPECT_EQ(value, -2147483647 - 1);
}

// ============================================================================
// Failure report
// ============================================================================

TEST(FormatUploadFailureTest, ListsEachFailedPartOnce) {
  std::vector<PartFailure> failures = {
    {2, "connection reset", "NetworkError"},
    {5, "slow down", "SlowDown"},
  };
  MultipartUploadError error(UploadPhase::UploadParts, "2 of 6 parts failed", failures);

  const std::string report = format_upload_failure(error);

  EXPECT_EQ(report.rfind("Error: ", 0), 0u);
  EXPECT_EQ(count_occurrences(report, "part 2:"), 1u);
  EXPECT_EQ(count_occurrences(report, "part 5:"), 1u);
  EXPECT_EQ(count_occurrences(report, "connection reset"), 1u);
  EXPECT_EQ(count_occurrences(report, "SlowDown"), 1u);
}

TEST(FormatUploadFailureTest, CompletePhaseCarriesStoreCode) {
  MultipartUploadError error(UploadPhase::Complete, "complete rejected", {}, "InvalidPart");

  const std::string report = format_upload_failure(error);

  EXPECT_NE(report.find("complete"), std::string::npos);
  EXPECT_EQ(count_occurrences(report, "InvalidPart"), 1u);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
