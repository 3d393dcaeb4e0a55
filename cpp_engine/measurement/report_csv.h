#pragma once

// measurement/report_csv.h
//
// One report per line, no header:
//   time_s,receiver_id,x,y,tx_identity,quantity,value,uncertainty
// quantity is "bearing" (radians) or "rssi" (W). Identifiers are written
// unquoted, so ',' and line breaks are not allowed in them.
//
// The legacy generator format carries both quantities per line, bearing in
// degrees:
//   time_s,x,y,tx_identity,rssi_W,bearing_deg

#include <string>
#include <vector>

#include "ReceptionReport.h"

namespace foxsheaf {
namespace measurement {

// Returns false without touching the file when an identifier cannot be
// written unquoted.
bool writeReportsCSV(const std::string& filename,
                     const std::vector<ReceptionReport>& reports,
                     std::string* error = nullptr);

// Appends nothing and returns false on any malformed line; `error` names it.
bool readReportsCSV(const std::string& filename,
                    std::vector<ReceptionReport>& out,
                    std::string* error = nullptr);

// Reads the legacy format, emitting one report per requested quantity per
// line, all attributed to `receiver_id`. Same all-or-nothing contract as
// readReportsCSV.
bool readLegacyReportsCSV(const std::string& filename,
                          const std::string& receiver_id,
                          const std::vector<QuantityType>& quantities,
                          std::vector<ReceptionReport>& out,
                          std::string* error = nullptr);

} // namespace measurement
} // namespace foxsheaf
