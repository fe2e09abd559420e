// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_UPLOAD_SESSION_HPP
#define PARCEL_UPLOAD_SESSION_HPP

#include <string>

#include "upload_types.hpp"

namespace parcel {
namespace uploader {

/**
 * Multipart session lifecycle
 *
 *   Initialized -> Uploading -> Completing -> Completed
 *                      |            |
 *                      +------------+-------> Aborted
 *
 * A failed initiate goes from Initialized straight to Aborted.
 */
enum class SessionState { Initialized, Uploading, Completing, Completed, Aborted };

inline const char* state_to_string(SessionState state) {
  switch (state) {
    case SessionState::Initialized:
      return "INITIALIZED";
    case SessionState::Uploading:
      return "UPLOADING";
    case SessionState::Completing:
      return "COMPLETING";
    case SessionState::Completed:
      return "COMPLETED";
    case SessionState::Aborted:
      return "ABORTED";
    default:
      return "UNKNOWN";
  }
}

/**
 * True for Completed and Aborted
 */
inline bool is_terminal(SessionState state) {
  return state == SessionState::Completed || state == SessionState::Aborted;
}

/**
 * One multipart upload as seen by the client
 */
struct UploadSession {
  std::string session_id;  // empty until initiate succeeded
  ObjectDestination destination;
  SessionState state = SessionState::Initialized;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_UPLOAD_SESSION_HPP
