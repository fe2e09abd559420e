// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for SessionCoordinator
 *
 * The in-memory FakeObjectStore covers full sessions; MockObjectStore pins
 * down which store calls must and must not happen.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "session_coordinator.hpp"
#include "upload_errors.hpp"
#include "uploader_mocks.hpp"

using namespace parcel::uploader;
using namespace parcel::uploader::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

constexpr uint64_t kMiB = 1024 * 1024;

std::vector<uint8_t> bytes(size_t size) {
  return std::vector<uint8_t>(size, 0x5A);
}

}  // namespace

class SessionCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    destination_ = ObjectDestination{"reports", "offers.json"};
    config_.engine.num_workers = 4;
    config_.attributes.content_type = "application/json";
    config_.attributes.tags = {{"team", "billing"}};
  }

  FakeObjectStore store_;
  ObjectDestination destination_;
  CoordinatorConfig config_;
};

// =============================================================================
// Successful sessions
// =============================================================================

TEST_F(SessionCoordinatorTest, TransferStreamUploadsThreePartsAndCompletes) {
  std::istringstream input(std::string(22 * kMiB, 'r'));
  SessionCoordinator coordinator(store_, destination_, config_);

  CompletedUpload upload = coordinator.transferStream(input, 10 * kMiB);

  EXPECT_EQ(coordinator.state(), SessionState::Completed);
  EXPECT_EQ(upload.session_id, "upload-1");
  EXPECT_EQ(upload.total_bytes, 22 * kMiB);
  EXPECT_THAT(
    upload.parts,
    ElementsAre(
      CompletedPart{1, "etag-1"}, CompletedPart{2, "etag-2"}, CompletedPart{3, "etag-3"}
    )
  );
  EXPECT_EQ(store_.completeCalls(), 1);
  EXPECT_EQ(store_.abortCalls(), 0);
  EXPECT_EQ(store_.completedManifest(), upload.parts);

  auto calls = store_.partCalls();
  ASSERT_EQ(calls.size(), 3u);
  for (const auto& call : calls) {
    EXPECT_EQ(call.is_last_part, call.part_number == 3);
    EXPECT_EQ(call.size, call.part_number == 3 ? 2 * kMiB : 10 * kMiB);
  }
  EXPECT_EQ(store_.sessionIds(), std::set<std::string>{"upload-1"});
}

TEST_F(SessionCoordinatorTest, AttributesAreSentWithInitiate) {
  SessionCoordinator coordinator(store_, destination_, config_);
  coordinator.initiate();

  auto attributes = store_.lastAttributes();
  EXPECT_EQ(attributes.content_type, "application/json");
  EXPECT_EQ(attributes.tags.at("team"), "billing");
  EXPECT_EQ(coordinator.state(), SessionState::Uploading);
  EXPECT_EQ(coordinator.sessionId(), "upload-1");

  coordinator.uploadFinalPart(bytes(1));
  coordinator.finalizeUpload();
}

TEST_F(SessionCoordinatorTest, ManifestSortedWhenPartsFinishOutOfOrder) {
  // Earlier parts finish last
  store_.part_delays[1] = 120ms;
  store_.part_delays[2] = 60ms;
  SessionCoordinator coordinator(store_, destination_, config_);

  coordinator.initiate();
  coordinator.uploadPart(bytes(10));
  coordinator.uploadPart(bytes(10));
  coordinator.uploadPart(bytes(10));
  coordinator.uploadFinalPart(bytes(5));
  EXPECT_EQ(coordinator.state(), SessionState::Completing);

  auto upload = coordinator.finalizeUpload();

  EXPECT_THAT(
    store_.completedManifest(),
    ElementsAre(
      Field(&CompletedPart::part_number, 1), Field(&CompletedPart::part_number, 2),
      Field(&CompletedPart::part_number, 3), Field(&CompletedPart::part_number, 4)
    )
  );
  EXPECT_EQ(upload.total_bytes, 35u);
}

TEST_F(SessionCoordinatorTest, EmptyStreamUploadsSingleEmptyPart) {
  std::istringstream input("");
  SessionCoordinator coordinator(store_, destination_, config_);

  auto upload = coordinator.transferStream(input, 5 * kMiB);

  ASSERT_EQ(upload.parts.size(), 1u);
  EXPECT_EQ(upload.parts[0].part_number, 1);
  auto calls = store_.partCalls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].size, 0u);
  EXPECT_TRUE(calls[0].is_last_part);
}

// =============================================================================
// Failures abort the session
// =============================================================================

TEST_F(SessionCoordinatorTest, FailedPartAbortsInsteadOfCompleting) {
  store_.failing_parts = {2};
  SessionCoordinator coordinator(store_, destination_, config_);
  coordinator.initiate();
  coordinator.uploadPart(bytes(10));
  coordinator.uploadPart(bytes(10));
  coordinator.uploadFinalPart(bytes(3));

  try {
    coordinator.finalizeUpload();
    FAIL() << "Expected MultipartUploadError";
  } catch (const MultipartUploadError& e) {
    EXPECT_EQ(e.phase(), UploadPhase::UploadParts);
    ASSERT_EQ(e.failures().size(), 1u);
    EXPECT_EQ(e.failures()[0].part_number, 2);
    EXPECT_EQ(e.failures()[0].error_code, "InternalError");
    EXPECT_TRUE(e.hasFailedPart(2));
    EXPECT_FALSE(e.hasFailedPart(1));
    EXPECT_NE(std::string(e.what()).find("part 2"), std::string::npos);
  }

  EXPECT_EQ(coordinator.state(), SessionState::Aborted);
  EXPECT_EQ(store_.abortCalls(), 1);
  EXPECT_EQ(store_.completeCalls(), 0);
}

TEST_F(SessionCoordinatorTest, EveryFailedPartIsReported) {
  store_.failing_parts = {1, 3};
  SessionCoordinator coordinator(store_, destination_, config_);
  coordinator.initiate();
  coordinator.uploadPart(bytes(10));
  coordinator.uploadPart(bytes(10));
  coordinator.uploadPart(bytes(10));
  coordinator.uploadFinalPart(bytes(3));

  try {
    coordinator.finalizeUpload();
    FAIL() << "Expected MultipartUploadError";
  } catch (const MultipartUploadError& e) {
    ASSERT_EQ(e.failures().size(), 2u);
    EXPECT_EQ(e.failures()[0].part_number, 1);
    EXPECT_EQ(e.failures()[1].part_number, 3);
  }
}

TEST_F(SessionCoordinatorTest, PartFailureCallsAbortNeverComplete) {
  StrictMock<MockObjectStore> store;
  EXPECT_CALL(store, initiateMultipartUpload(_, _))
    .WillOnce(Return(StoreResult::Success("session-42")));
  EXPECT_CALL(store, uploadPart(_, "session-42", 1, false, _))
    .WillOnce(Return(StoreResult::Success("tagA")));
  EXPECT_CALL(store, uploadPart(_, "session-42", 2, false, _))
    .WillOnce(Return(StoreResult::Failure("connection reset", "ConnectionReset", true)));
  EXPECT_CALL(store, uploadPart(_, "session-42", 3, true, _))
    .WillOnce(Return(StoreResult::Success("tagC")));
  EXPECT_CALL(store, abortMultipartUpload(_, "session-42"))
    .WillOnce(Return(StoreResult::Success()));
  EXPECT_CALL(store, completeMultipartUpload(_, _, _)).Times(0);

  SessionCoordinator coordinator(store, destination_, config_);
  coordinator.initiate();
  coordinator.uploadPart(bytes(10));
  coordinator.uploadPart(bytes(10));
  coordinator.uploadFinalPart(bytes(2));

  EXPECT_THROW(coordinator.finalizeUpload(), MultipartUploadError);
}

TEST_F(SessionCoordinatorTest, CompletesWithOrderedManifest) {
  StrictMock<MockObjectStore> store;
  EXPECT_CALL(store, initiateMultipartUpload(_, _))
    .WillOnce(Return(StoreResult::Success("session-7")));
  EXPECT_CALL(store, uploadPart(_, "session-7", 1, false, _))
    .WillOnce(Return(StoreResult::Success("tagA")));
  EXPECT_CALL(store, uploadPart(_, "session-7", 2, false, _))
    .WillOnce(Return(StoreResult::Success("tagB")));
  EXPECT_CALL(store, uploadPart(_, "session-7", 3, true, _))
    .WillOnce(Return(StoreResult::Success("tagC")));
  EXPECT_CALL(
    store, completeMultipartUpload(
             _, "session-7",
             ElementsAre(
               CompletedPart{1, "tagA"}, CompletedPart{2, "tagB"}, CompletedPart{3, "tagC"}
             )
           )
  )
    .WillOnce(Return(StoreResult::Success()));

  SessionCoordinator coordinator(store, destination_, config_);
  coordinator.initiate();
  coordinator.uploadPart(bytes(10));
  coordinator.uploadPart(bytes(10));
  coordinator.uploadFinalPart(bytes(2));

  auto upload = coordinator.finalizeUpload();
  EXPECT_EQ(upload.parts.size(), 3u);
  EXPECT_EQ(coordinator.state(), SessionState::Completed);
}

TEST_F(SessionCoordinatorTest, CompleteFailureAbortsSession) {
  store_.fail_complete = true;
  SessionCoordinator coordinator(store_, destination_, config_);
  coordinator.initiate();
  coordinator.uploadFinalPart(bytes(4));

  try {
    coordinator.finalizeUpload();
    FAIL() << "Expected MultipartUploadError";
  } catch (const MultipartUploadError& e) {
    EXPECT_EQ(e.phase(), UploadPhase::Complete);
    EXPECT_EQ(e.error_code(), "NoSuchUpload");
    EXPECT_TRUE(e.failures().empty());
  }
  EXPECT_EQ(store_.abortCalls(), 1);
  EXPECT_EQ(coordinator.state(), SessionState::Aborted);
}

TEST_F(SessionCoordinatorTest, StoreAbortFailureDoesNotMaskPartFailure) {
  store_.failing_parts = {1};
  store_.fail_abort = true;
  SessionCoordinator coordinator(store_, destination_, config_);
  coordinator.initiate();
  coordinator.uploadFinalPart(bytes(4));

  EXPECT_THROW(coordinator.finalizeUpload(), MultipartUploadError);
  EXPECT_EQ(coordinator.state(), SessionState::Aborted);
  EXPECT_EQ(store_.abortCalls(), 1);
}

TEST_F(SessionCoordinatorTest, InitiateFailureLeavesSessionAborted) {
  store_.fail_initiate = true;
  SessionCoordinator coordinator(store_, destination_, config_);

  try {
    coordinator.initiate();
    FAIL() << "Expected MultipartUploadError";
  } catch (const MultipartUploadError& e) {
    EXPECT_EQ(e.phase(), UploadPhase::Initiate);
    EXPECT_EQ(e.error_code(), "AccessDenied");
  }

  EXPECT_EQ(coordinator.state(), SessionState::Aborted);
  EXPECT_THROW(coordinator.uploadPart(bytes(10)), UploadStateError);
  EXPECT_TRUE(store_.partCalls().empty());
  EXPECT_EQ(store_.abortCalls(), 0);
}

TEST_F(SessionCoordinatorTest, ReadErrorAbortsAndPropagates) {
  FailingStreamBuf buffer(20);
  std::istream input(&buffer);
  SessionCoordinator coordinator(store_, destination_, config_);

  EXPECT_THROW(coordinator.transferStream(input, 8, 1), ChunkReadError);

  EXPECT_EQ(coordinator.state(), SessionState::Aborted);
  EXPECT_EQ(store_.abortCalls(), 1);
  EXPECT_EQ(store_.completeCalls(), 0);
}

TEST_F(SessionCoordinatorTest, InvalidChunkSizeNeverReachesStore) {
  std::istringstream input("data");
  SessionCoordinator coordinator(store_, destination_, config_);

  EXPECT_THROW(coordinator.transferStream(input, 1024), std::invalid_argument);
  EXPECT_EQ(store_.initiateCalls(), 0);
  EXPECT_EQ(coordinator.state(), SessionState::Initialized);
}

// =============================================================================
// State errors
// =============================================================================

TEST_F(SessionCoordinatorTest, UploadBeforeInitiateNeverReachesStore) {
  StrictMock<MockObjectStore> store;
  EXPECT_CALL(store, uploadPart(_, _, _, _, _)).Times(0);

  SessionCoordinator coordinator(store, destination_, config_);

  EXPECT_THROW(coordinator.uploadPart(bytes(10)), UploadStateError);
  EXPECT_THROW(coordinator.uploadFinalPart(bytes(10)), UploadStateError);
  EXPECT_EQ(coordinator.state(), SessionState::Initialized);
}

TEST_F(SessionCoordinatorTest, InitiateTwiceThrows) {
  SessionCoordinator coordinator(store_, destination_, config_);
  coordinator.initiate();

  EXPECT_THROW(coordinator.initiate(), UploadStateError);
  EXPECT_EQ(store_.initiateCalls(), 1);
}

TEST_F(SessionCoordinatorTest, FinalizeWithoutFinalPartKeepsSessionOpen) {
  SessionCoordinator coordinator(store_, destination_, config_);
  coordinator.initiate();
  coordinator.uploadPart(bytes(10));

  EXPECT_THROW(coordinator.finalizeUpload(), UploadStateError);
  EXPECT_EQ(coordinator.state(), SessionState::Uploading);

  coordinator.uploadFinalPart(bytes(1));
  auto upload = coordinator.finalizeUpload();
  EXPECT_EQ(upload.parts.size(), 2u);
}

TEST_F(SessionCoordinatorTest, UploadAfterCompletedThrows) {
  SessionCoordinator coordinator(store_, destination_, config_);
  coordinator.initiate();
  coordinator.uploadFinalPart(bytes(1));
  coordinator.finalizeUpload();

  EXPECT_THROW(coordinator.uploadPart(bytes(1)), UploadStateError);
  EXPECT_THROW(coordinator.uploadFinalPart(bytes(1)), UploadStateError);
  EXPECT_THROW(coordinator.finalizeUpload(), UploadStateError);
  EXPECT_THROW(coordinator.abort("late"), UploadStateError);
}

TEST_F(SessionCoordinatorTest, UploadAfterAbortThrows) {
  SessionCoordinator coordinator(store_, destination_, config_);
  coordinator.initiate();
  coordinator.uploadPart(bytes(10));
  coordinator.abort("operator cancelled");

  EXPECT_EQ(coordinator.state(), SessionState::Aborted);
  EXPECT_EQ(store_.abortCalls(), 1);
  EXPECT_THROW(coordinator.uploadPart(bytes(1)), UploadStateError);
}

// =============================================================================
// Cleanup and observer hooks
// =============================================================================

TEST_F(SessionCoordinatorTest, DestructorAbortsOpenSession) {
  {
    SessionCoordinator coordinator(store_, destination_, config_);
    coordinator.initiate();
    coordinator.uploadPart(bytes(10));
  }
  EXPECT_EQ(store_.abortCalls(), 1);
  EXPECT_EQ(store_.completeCalls(), 0);
}

TEST_F(SessionCoordinatorTest, DestructorLeavesFinishedSessionAlone) {
  {
    SessionCoordinator coordinator(store_, destination_, config_);
    coordinator.initiate();
    coordinator.uploadFinalPart(bytes(10));
    coordinator.finalizeUpload();
  }
  EXPECT_EQ(store_.abortCalls(), 0);
}

TEST_F(SessionCoordinatorTest, ObserverNotifiedOnCompletion) {
  auto observer = std::make_shared<NiceMock<MockUploadObserver>>();
  EXPECT_CALL(*observer, onSessionCompleted(Field(&CompletedUpload::session_id, "upload-1")));
  EXPECT_CALL(*observer, onSessionAborted(_, _, _)).Times(0);

  SessionCoordinator coordinator(store_, destination_, config_, observer);
  coordinator.initiate();
  coordinator.uploadFinalPart(bytes(3));
  coordinator.finalizeUpload();
}

TEST_F(SessionCoordinatorTest, ObserverNotifiedOnAbort) {
  store_.failing_parts = {1};
  auto observer = std::make_shared<NiceMock<MockUploadObserver>>();
  EXPECT_CALL(*observer, onSessionAborted(_, "upload-1", _));
  EXPECT_CALL(*observer, onSessionCompleted(_)).Times(0);

  SessionCoordinator coordinator(store_, destination_, config_, observer);
  coordinator.initiate();
  coordinator.uploadFinalPart(bytes(3));
  EXPECT_THROW(coordinator.finalizeUpload(), MultipartUploadError);
}

TEST_F(SessionCoordinatorTest, SubmitHookMayQueryCoordinator) {
  auto observer = std::make_shared<NiceMock<MockUploadObserver>>();
  SessionCoordinator coordinator(store_, destination_, config_, observer);

  std::vector<SessionState> states_seen;
  ON_CALL(*observer, onPartSubmitted(_, _, _))
    .WillByDefault(Invoke([&coordinator, &states_seen](int, uint64_t, bool) {
      states_seen.push_back(coordinator.state());
      EXPECT_EQ(coordinator.sessionId(), "upload-1");
    }));

  coordinator.initiate();
  auto submitted = std::async(std::launch::async, [&coordinator] {
    coordinator.uploadPart(bytes(16));
    return coordinator.uploadFinalPart(bytes(8));
  });
  ASSERT_EQ(submitted.wait_for(3s), std::future_status::ready);
  EXPECT_EQ(submitted.get(), 2);
  EXPECT_EQ(
    states_seen, (std::vector<SessionState>{SessionState::Uploading, SessionState::Uploading})
  );

  EXPECT_EQ(coordinator.state(), SessionState::Completing);
  CompletedUpload upload = coordinator.finalizeUpload();
  EXPECT_EQ(upload.parts.size(), 2u);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
