// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for uploading a batch of objects
 */

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "upload_jobs.hpp"
#include "uploader_mocks.hpp"

using namespace parcel::app;
using parcel::uploader::test::FakeObjectStore;

class UploadJobsTest : public ::testing::Test {
protected:
  void SetUp() override {
    settings_.num_workers = 2;
    settings_.shutdown_grace_ms = 500;
  }

  static UploadJob job(const std::string& key, const std::string& content) {
    return UploadJob{key, "application/json", std::make_unique<std::istringstream>(content)};
  }

  // Stream whose first read reports an I/O fault
  static UploadJob broken_job(const std::string& key) {
    auto input = std::make_unique<std::istringstream>("unreadable");
    input->setstate(std::ios::badbit);
    return UploadJob{key, "application/json", std::move(input)};
  }

  std::vector<JobResult> run() {
    return run_upload_jobs(store_, "reports", jobs_, settings_, nullptr);
  }

  FakeObjectStore store_;
  UploadSettings settings_;
  std::vector<UploadJob> jobs_;
};

TEST_F(UploadJobsTest, AllObjectsUploaded) {
  jobs_.push_back(job("a.json", "{\"a\":1}"));
  jobs_.push_back(job("b.json", "{\"b\":2}"));

  auto results = run();

  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    EXPECT_TRUE(result.success) << result.error;
    ASSERT_TRUE(result.upload.has_value());
    EXPECT_EQ(result.upload->destination.bucket, "reports");
    EXPECT_TRUE(result.error.empty());
  }
  EXPECT_EQ(results[1].upload->destination.key, "b.json");
  EXPECT_EQ(store_.completeCalls(), 2);
}

TEST_F(UploadJobsTest, ReadErrorDoesNotStopLaterObjects) {
  jobs_.push_back(job("first.json", "{}"));
  jobs_.push_back(broken_job("broken.json"));
  jobs_.push_back(job("last.json", "{}"));

  auto results = run();

  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].success);
  EXPECT_FALSE(results[1].success);
  EXPECT_FALSE(results[1].upload.has_value());
  EXPECT_NE(results[1].error.find("broken.json"), std::string::npos);
  EXPECT_TRUE(results[2].success) << results[2].error;

  EXPECT_EQ(store_.initiateCalls(), 3);
  EXPECT_EQ(store_.completeCalls(), 2);
  EXPECT_EQ(store_.abortCalls(), 1);
}

TEST_F(UploadJobsTest, UploadErrorIsReportedPerObject) {
  store_.fail_complete = true;
  jobs_.push_back(job("a.json", "{}"));
  jobs_.push_back(job("b.json", "{}"));

  auto results = run();

  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.rfind("Error: ", 0), 0u);
    EXPECT_NE(result.error.find("NoSuchUpload"), std::string::npos);
  }
  EXPECT_EQ(store_.initiateCalls(), 2);
}

TEST_F(UploadJobsTest, MissingInputIsReported) {
  jobs_.push_back(UploadJob{"empty.json", "application/json", nullptr});
  jobs_.push_back(job("ok.json", "{}"));

  auto results = run();

  ASSERT_EQ(results.size(), 2u);
  EXPECT_FALSE(results[0].success);
  EXPECT_TRUE(results[1].success);
  EXPECT_EQ(store_.initiateCalls(), 1);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
