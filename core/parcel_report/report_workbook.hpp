// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_REPORT_WORKBOOK_HPP
#define PARCEL_REPORT_WORKBOOK_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "offer_report.hpp"

namespace parcel {
namespace report {

constexpr const char* kReportContentType = "application/json";

/**
 * A named report with three sheets:
 * - "Summary": total number of distinct customers
 * - "PDIS": one row per offer
 * - "CP": distinct customer ids, in first-seen order
 *
 * Serialized as a single JSON document:
 *   {"name": ..., "sheets": [{"name": "Summary", "rows": [...]}, ...]}
 */
class ReportWorkbook {
public:
  ReportWorkbook(std::string name, std::vector<OfferReport> offers);

  const std::string& name() const {
    return name_;
  }

  const std::vector<OfferReport>& offers() const {
    return offers_;
  }

  size_t totalCustomers() const {
    return customer_ids_.size();
  }

  const std::vector<std::string>& customerIds() const {
    return customer_ids_;
  }

  nlohmann::json toJson() const;

  /**
   * JSON text of toJson(), compact
   */
  std::string serialize() const;

private:
  std::string name_;
  std::vector<OfferReport> offers_;
  std::vector<std::string> customer_ids_;
};

/**
 * Serialized report ready for upload. The object key is the report name.
 */
struct ReportStream {
  std::string name;
  std::string content;
  std::string content_type = kReportContentType;

  std::istringstream open() const {
    return std::istringstream(content);
  }
};

/**
 * Build one stream per named report, in name order
 */
std::vector<ReportStream> buildReportStreams(
  const std::map<std::string, std::vector<OfferReport>>& reports
);

/**
 * Small built-in report used by the command line tool when no file is given
 */
std::map<std::string, std::vector<OfferReport>> sampleReports();

}  // namespace report
}  // namespace parcel

#endif  // PARCEL_REPORT_WORKBOOK_HPP
