// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "offer_report.hpp"

namespace parcel {
namespace report {

void to_json(nlohmann::json& j, const OfferReport& report) {
  j = nlohmann::json{
    {"customer_id", report.customer_id},
    {"product_id", report.product_id},
    {"error_message", report.error_msg},
  };
}

void from_json(const nlohmann::json& j, OfferReport& report) {
  j.at("customer_id").get_to(report.customer_id);
  j.at("product_id").get_to(report.product_id);
  report.error_msg = j.value("error_message", "");
}

}  // namespace report
}  // namespace parcel
