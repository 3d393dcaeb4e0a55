#include "FoxSheaf.h"

#include "FoxSheafErrors.h"

#include <cmath>
#include <string>

namespace foxsheaf {

namespace {

// [tx.x, tx.y, rx.x, rx.y] -> [rx.x, rx.y, bearing]
// A transmitter on top of its receiver has no bearing; atan2(0, 0) reads it as 0 (north).
RestrictionMap jointBearingMap() {
    return RestrictionMap::general(4, 3, [](const Vector& v) {
        Vector out(3);
        out << v(2), v(3), bearingTo(v.head<2>(), v.segment<2>(2));
        return out;
    }, "bearing_restrict");
}

// [tx.x, tx.y, rx.x, rx.y, power] -> [rx.x, rx.y, received power]
RestrictionMap jointRssiMap(const PropagationLaw& law) {
    return RestrictionMap::general(5, 3, [law](const Vector& v) {
        const double d = (v.head<2>() - v.segment<2>(2)).norm();
        Vector out(3);
        out << v(2), v(3), law.receivedPower(v(4), d);
        return out;
    }, "propagation_restrict");
}

// Hub hypothesis [tx.x, tx.y(, power)] -> [bearing] seen from a fixed receiver.
// Zero range gives bearing 0, so the radius stays finite there; a bearing
// report that happens to read north is satisfied by a hypothesis on the receiver.
RestrictionMap hubBearingMap(int hypothesis_dim, const Eigen::Vector2d& rx) {
    return RestrictionMap::general(hypothesis_dim, 1, [rx](const Vector& v) {
        Vector out(1);
        out(0) = bearingTo(v.head<2>(), rx);
        return out;
    }, "bearing_from_rx");
}

// Hub hypothesis [tx.x, tx.y, power] -> [received power] at a fixed receiver.
RestrictionMap hubRssiMap(const PropagationLaw& law, const Eigen::Vector2d& rx) {
    return RestrictionMap::general(3, 1, [law, rx](const Vector& v) {
        Vector out(1);
        out(0) = law.receivedPower(v(2), (v.head<2>() - rx).norm());
        return out;
    }, "propagation_to_rx");
}

Vector vec2(double a, double b) {
    Vector v(2);
    v << a, b;
    return v;
}

Vector vec3(double a, double b, double c) {
    Vector v(3);
    v << a, b, c;
    return v;
}

void requireFiniteReport(const ReceptionReport& r, std::size_t index) {
    if (!std::isfinite(r.value) || !r.rx_location.allFinite()) {
        throw DomainError("report " + std::to_string(index) + " from '" + r.receiver_id +
                          "' has non-finite data");
    }
}

} // namespace

const char* toString(SheafTopology t) {
    switch (t) {
    case SheafTopology::Flat: return "flat";
    case SheafTopology::Hub:  return "hub";
    }
    return "unknown";
}

bool parseTopology(const std::string& text, SheafTopology& out) {
    if (text == "flat") {
        out = SheafTopology::Flat;
        return true;
    }
    if (text == "hub") {
        out = SheafTopology::Hub;
        return true;
    }
    return false;
}

// --------------------
// FoxSheaf
// --------------------

FoxSheaf::FoxSheaf(const PropagationLaw& law, SheafTopology topology)
    : law_(law), topology_(topology), complex_(), registry_(complex_) {}

double FoxSheaf::radius(const Assignment& assignment, RadiusAggregate aggregate) const {
    return ConsistencyRadiusEngine(complex_, registry_, aggregate).radius(assignment);
}

std::vector<EdgeDiscrepancy> FoxSheaf::discrepancies(const Assignment& assignment) const {
    return ConsistencyRadiusEngine(complex_, registry_).discrepancies(assignment);
}

FusionResult FoxSheaf::fuse(const FusionOptions& options) const {
    return fuse(initial_, options);
}

FusionResult FoxSheaf::fuse(const Assignment& initial, const FusionOptions& options) const {
    const AssignmentFusionOptimizer optimizer(complex_, registry_, options);
    return optimizer.fuse(initial);
}

ConsistencyFiltration FoxSheaf::filtration(const Assignment& assignment,
                                           const FiltrationConfig& config) const {
    return ConsistencyFiltration(complex_, registry_, assignment, config);
}

Assignment FoxSheaf::assignmentAt(const Eigen::Vector2d& location, double power_W) const {
    Assignment a = Assignment::fromObservations(complex_);
    const double x = location.x();
    const double y = location.y();

    if (power_cell_ && *power_cell_ != location_cell_) {
        a.set(complex_, *power_cell_, vec3(x, y, power_W));
    }
    a.set(complex_, location_cell_, power_cell_ == location_cell_ ? vec3(x, y, power_W) : vec2(x, y));

    for (const ReportBinding& b : bindings_) {
        if (!b.joint_cell) {
            continue;
        }
        const double rx = b.rx_location.x();
        const double ry = b.rx_location.y();
        if (b.quantity == QuantityType::Bearing) {
            Vector v(4);
            v << x, y, rx, ry;
            a.set(complex_, *b.joint_cell, v);
        } else {
            Vector v(5);
            v << x, y, rx, ry, power_W;
            a.set(complex_, *b.joint_cell, v);
        }
    }
    return a;
}

Eigen::Vector2d FoxSheaf::location(const Assignment& assignment) const {
    const Vector& v = assignment.value(location_cell_);
    return Eigen::Vector2d(v(0), v(1));
}

std::optional<double> FoxSheaf::power(const Assignment& assignment) const {
    if (!power_cell_) {
        return std::nullopt;
    }
    return assignment.value(*power_cell_)(2);
}

// --------------------
// FoxSheafBuilder
// --------------------

FoxSheafBuilder::FoxSheafBuilder(const PropagationLaw& law, SheafTopology topology)
    : law_(law), topology_(topology) {}

FoxSheafBuilder& FoxSheafBuilder::setInitialGuess(const Eigen::Vector2d& location, double power_W) {
    guess_location_ = location;
    guess_power_W_ = power_W;
    return *this;
}

FoxSheafBuilder& FoxSheafBuilder::setInitialGuess(const Eigen::Vector2d& location) {
    guess_location_ = location;
    guess_power_W_.reset();
    return *this;
}

double FoxSheafBuilder::seedPower(const std::vector<ReceptionReport>& reports) const {
    if (guess_power_W_) {
        return *guess_power_W_;
    }
    double sum = 0.0;
    int n = 0;
    for (const ReceptionReport& r : reports) {
        const double d = (guess_location_ - r.rx_location).norm();
        if (r.quantity != QuantityType::Rssi || d <= 0.0) {
            continue;
        }
        sum += law_.impliedPower(r.value, d);
        ++n;
    }
    return n > 0 ? sum / n : 1.0;
}

std::unique_ptr<FoxSheaf> FoxSheafBuilder::build(const std::vector<ReceptionReport>& reports) const {
    if (reports.empty()) {
        throw DomainError("cannot build a fox sheaf without reception reports");
    }
    for (std::size_t i = 0; i < reports.size(); ++i) {
        requireFiniteReport(reports[i], i);
    }

    auto sheaf = std::make_unique<FoxSheaf>(law_, topology_);
    if (topology_ == SheafTopology::Flat) {
        buildFlat(*sheaf, reports);
    } else {
        buildHub(*sheaf, reports);
    }

    sheaf->registry_.requireComplete();
    sheaf->complex_.seal();
    sheaf->initial_ = sheaf->assignmentAt(guess_location_, seedPower(reports));
    return sheaf;
}

void FoxSheafBuilder::buildFlat(FoxSheaf& sheaf, const std::vector<ReceptionReport>& reports) const {
    CellComplex& cx = sheaf.complex_;
    RestrictionMapRegistry& reg = sheaf.registry_;

    const CellId foxloc_power = cx.addCell("foxloc_power", Stalk::euclidean("foxloc_power", 3));
    const CellId foxloc = cx.addCell("foxloc", Stalk::euclidean("foxloc", 2));
    reg.attach(cx.addEdge(foxloc_power, foxloc), RestrictionMap::projection(3, {0, 1}));

    for (std::size_t k = 0; k < reports.size(); ++k) {
        const ReceptionReport& r = reports[k];
        const std::string idx = std::to_string(k);
        const double rx = r.rx_location.x();
        const double ry = r.rx_location.y();

        ReportBinding b;
        b.report_index = k;
        b.receiver_id = r.receiver_id;
        b.quantity = r.quantity;
        b.rx_location = r.rx_location;

        if (r.quantity == QuantityType::Bearing) {
            const CellId joint = cx.addCell("foxloc_rxloc_" + idx, Stalk::euclidean("foxloc_rxloc", 4));
            const CellId obs = cx.addCell("bearing_rxloc_" + idx, Stalk::bearing("bearing_rxloc", 3),
                                          vec3(rx, ry, r.value));
            b.observation_edge = cx.addEdge(joint, obs);
            reg.attach(b.observation_edge, jointBearingMap());
            b.joint_edge = cx.addEdge(joint, foxloc);
            reg.attach(*b.joint_edge, RestrictionMap::projection(4, {0, 1}));
            b.joint_cell = joint;
            b.observed_cell = obs;
        } else {
            const CellId joint = cx.addCell("foxloc_power_rxloc_" + idx,
                                            Stalk::euclidean("foxloc_power_rxloc", 5));
            const CellId obs = cx.addCell("rssi_rxloc_" + idx, Stalk::euclidean("rssi_rxloc", 3),
                                          vec3(rx, ry, r.value));
            b.observation_edge = cx.addEdge(joint, obs);
            reg.attach(b.observation_edge, jointRssiMap(law_));
            b.joint_edge = cx.addEdge(joint, foxloc_power);
            reg.attach(*b.joint_edge, RestrictionMap::projection(5, {0, 1, 4}));
            b.joint_cell = joint;
            b.observed_cell = obs;
        }
        sheaf.bindings_.push_back(b);
    }

    sheaf.location_cell_ = foxloc;
    sheaf.power_cell_ = foxloc_power;
}

void FoxSheafBuilder::buildHub(FoxSheaf& sheaf, const std::vector<ReceptionReport>& reports) const {
    CellComplex& cx = sheaf.complex_;
    RestrictionMapRegistry& reg = sheaf.registry_;

    bool any_rssi = false;
    for (const ReceptionReport& r : reports) {
        any_rssi = any_rssi || (r.quantity == QuantityType::Rssi);
    }

    const int hyp_dim = any_rssi ? 3 : 2;
    const std::string hyp_name = any_rssi ? "foxloc_power" : "foxloc";
    const CellId hyp = cx.addCell(hyp_name, Stalk::euclidean(hyp_name, hyp_dim));

    for (std::size_t k = 0; k < reports.size(); ++k) {
        const ReceptionReport& r = reports[k];
        const std::string idx = std::to_string(k);

        ReportBinding b;
        b.report_index = k;
        b.receiver_id = r.receiver_id;
        b.quantity = r.quantity;
        b.rx_location = r.rx_location;

        Vector observed(1);
        observed(0) = r.value;
        if (r.quantity == QuantityType::Bearing) {
            b.observed_cell = cx.addCell("bearing_" + idx, Stalk::bearing("bearing", 1), observed);
            b.observation_edge = cx.addEdge(hyp, b.observed_cell);
            reg.attach(b.observation_edge, hubBearingMap(hyp_dim, r.rx_location));
        } else {
            b.observed_cell = cx.addCell("rssi_" + idx, Stalk::euclidean("rssi", 1), observed);
            b.observation_edge = cx.addEdge(hyp, b.observed_cell);
            reg.attach(b.observation_edge, hubRssiMap(law_, r.rx_location));
        }
        sheaf.bindings_.push_back(b);
    }

    sheaf.location_cell_ = hyp;
    if (any_rssi) {
        sheaf.power_cell_ = hyp;
    }
}

} // namespace foxsheaf
