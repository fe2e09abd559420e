// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_PART_UPLOADER_HPP
#define PARCEL_PART_UPLOADER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "object_store.hpp"
#include "upload_types.hpp"

namespace parcel {
namespace uploader {

/**
 * Uploads single parts of one store session
 *
 * Never throws: store failures and exceptions escaping the store are
 * returned as a failed PartOutcome. Safe to call from several workers at
 * once as long as the store's uploadPart() is.
 */
class PartUploader {
public:
  PartUploader(IObjectStore& store, ObjectDestination destination, std::string session_id);

  PartOutcome upload(int part_number, bool is_final, const std::vector<uint8_t>& payload) const;

  const std::string& session_id() const {
    return session_id_;
  }

private:
  IObjectStore& store_;
  ObjectDestination destination_;
  std::string session_id_;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_PART_UPLOADER_HPP
