// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_OFFER_REPORT_HPP
#define PARCEL_OFFER_REPORT_HPP

#include <nlohmann/json.hpp>

#include <string>

namespace parcel {
namespace report {

/**
 * One personalised offer that could not be applied to a customer
 */
struct OfferReport {
  std::string customer_id;
  std::string product_id;
  std::string error_msg;

  bool operator==(const OfferReport& other) const {
    return customer_id == other.customer_id && product_id == other.product_id &&
           error_msg == other.error_msg;
  }
};

// JSON keys: customer_id, product_id, error_message
void to_json(nlohmann::json& j, const OfferReport& report);
void from_json(const nlohmann::json& j, OfferReport& report);

}  // namespace report
}  // namespace parcel

#endif  // PARCEL_OFFER_REPORT_HPP
