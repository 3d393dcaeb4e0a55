#include "ReceptionReport.h"

namespace foxsheaf {

const char* toString(QuantityType q) {
    switch (q) {
    case QuantityType::Bearing: return "bearing";
    case QuantityType::Rssi:    return "rssi";
    }
    return "unknown";
}

bool parseQuantityType(const std::string& text, QuantityType& out) {
    if (text == "bearing") {
        out = QuantityType::Bearing;
        return true;
    }
    if (text == "rssi") {
        out = QuantityType::Rssi;
        return true;
    }
    return false;
}

} // namespace foxsheaf
