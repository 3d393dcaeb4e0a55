#include "report_csv.h"

#include "Stalk.h"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace foxsheaf {
namespace measurement {

static std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream in(line);
    while (std::getline(in, field, ',')) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

static bool parseDouble(const std::string& text, double& out) {
    try {
        std::size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool isBareField(const std::string& text) {
    return text.find_first_of(",\r\n") == std::string::npos;
}

static constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

bool writeReportsCSV(const std::string& filename,
                     const std::vector<ReceptionReport>& reports,
                     std::string* error) {
    for (std::size_t i = 0; i < reports.size(); ++i) {
        if (!isBareField(reports[i].receiver_id) || !isBareField(reports[i].tx_identity)) {
            if (error) *error = "report " + std::to_string(i) + ": identifier contains ',' or a line break";
            return false;
        }
    }

    std::ofstream out(filename);
    if (!out.is_open()) {
        if (error) *error = "cannot open " + filename;
        return false;
    }

    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& r : reports) {
        out << r.time_s << ','
            << r.receiver_id << ','
            << r.rx_location.x() << ','
            << r.rx_location.y() << ','
            << r.tx_identity << ','
            << toString(r.quantity) << ','
            << r.value << ','
            << r.uncertainty << '\n';
    }
    return static_cast<bool>(out);
}

bool readReportsCSV(const std::string& filename,
                    std::vector<ReceptionReport>& out,
                    std::string* error) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        if (error) *error = "cannot open " + filename;
        return false;
    }

    std::vector<ReceptionReport> parsed;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        const auto f = splitFields(line);
        ReceptionReport r;
        double x = 0.0;
        double y = 0.0;
        const bool ok = f.size() == 8 &&
                        parseDouble(f[0], r.time_s) &&
                        parseDouble(f[2], x) &&
                        parseDouble(f[3], y) &&
                        parseQuantityType(f[5], r.quantity) &&
                        parseDouble(f[6], r.value) &&
                        parseDouble(f[7], r.uncertainty);
        if (!ok) {
            if (error) *error = filename + ":" + std::to_string(line_no) + ": malformed report";
            return false;
        }
        r.receiver_id = f[1];
        r.rx_location = Eigen::Vector2d(x, y);
        r.tx_identity = f[4];
        parsed.push_back(r);
    }

    out.insert(out.end(), parsed.begin(), parsed.end());
    return true;
}

bool readLegacyReportsCSV(const std::string& filename,
                          const std::string& receiver_id,
                          const std::vector<QuantityType>& quantities,
                          std::vector<ReceptionReport>& out,
                          std::string* error) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        if (error) *error = "cannot open " + filename;
        return false;
    }

    std::vector<ReceptionReport> parsed;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        const auto f = splitFields(line);
        double t = 0.0;
        double x = 0.0;
        double y = 0.0;
        double rssi = 0.0;
        double bearing_deg = 0.0;
        const bool ok = f.size() == 6 &&
                        parseDouble(f[0], t) &&
                        parseDouble(f[1], x) &&
                        parseDouble(f[2], y) &&
                        parseDouble(f[4], rssi) &&
                        parseDouble(f[5], bearing_deg);
        if (!ok) {
            if (error) *error = filename + ":" + std::to_string(line_no) + ": malformed legacy report";
            return false;
        }

        for (QuantityType q : quantities) {
            ReceptionReport r;
            r.receiver_id = receiver_id;
            r.time_s = t;
            r.rx_location = Eigen::Vector2d(x, y);
            r.tx_identity = f[3];
            r.quantity = q;
            r.value = (q == QuantityType::Bearing) ? wrapAngle(bearing_deg * kDegToRad) : rssi;
            parsed.push_back(r);
        }
    }

    out.insert(out.end(), parsed.begin(), parsed.end());
    return true;
}

} // namespace measurement
} // namespace foxsheaf
