// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "report_workbook.hpp"

#include <set>
#include <utility>

#define PARCEL_LOG_COMPONENT "report"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace report {

using ::parcel::logging::kv;

ReportWorkbook::ReportWorkbook(std::string name, std::vector<OfferReport> offers)
    : name_(std::move(name))
    , offers_(std::move(offers)) {
  std::set<std::string> seen;
  for (const auto& offer : offers_) {
    if (seen.insert(offer.customer_id).second) {
      customer_ids_.push_back(offer.customer_id);
    }
  }
}

nlohmann::json ReportWorkbook::toJson() const {
  nlohmann::json summary = {
    {"name", "Summary"},
    {"rows", nlohmann::json::array({nlohmann::json::array({"Total Customers", totalCustomers()})})},
  };
  nlohmann::json pdis = {
    {"name", "PDIS"},
    {"rows", offers_},
  };
  nlohmann::json cp = {
    {"name", "CP"},
    {"rows", customer_ids_},
  };

  return nlohmann::json{
    {"name", name_},
    {"sheets", nlohmann::json::array({summary, pdis, cp})},
  };
}

std::string ReportWorkbook::serialize() const {
  return toJson().dump();
}

std::vector<ReportStream> buildReportStreams(
  const std::map<std::string, std::vector<OfferReport>>& reports
) {
  std::vector<ReportStream> streams;
  streams.reserve(reports.size());
  for (const auto& [name, offers] : reports) {
    ReportWorkbook workbook(name, offers);
    ReportStream stream;
    stream.name = name;
    stream.content = workbook.serialize();
    PARCEL_LOG_DEBUG(
      "Report serialized" << kv("name", name) << kv("offers", offers.size())
                          << kv("bytes", stream.content.size())
    );
    streams.push_back(std::move(stream));
  }
  return streams;
}

std::map<std::string, std::vector<OfferReport>> sampleReports() {
  return {
    {"offers_report.json", {OfferReport{"cid", "pid", "cus err msg"}}},
  };
}

}  // namespace report
}  // namespace parcel
