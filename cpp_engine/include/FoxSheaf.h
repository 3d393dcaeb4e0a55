#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Assignment.h"
#include "CellComplex.h"
#include "ConsistencyFiltration.h"
#include "ConsistencyRadius.h"
#include "FusionOptimizer.h"
#include "PropagationLaw.h"
#include "ReceptionReport.h"
#include "RestrictionMapRegistry.h"

namespace foxsheaf {

enum class SheafTopology : int {
    // Per-report joint hypothesis cells (transmitter + receiver location)
    // projecting onto shared location / location-power cells.
    Flat = 0,
    // One shared hypothesis cell restricting directly onto each report cell;
    // receiver locations are constants of the maps.
    Hub = 1,
};

const char* toString(SheafTopology t);
bool parseTopology(const std::string& text, SheafTopology& out);

// Where a report landed in the complex.
struct ReportBinding {
    std::size_t report_index = 0;
    std::string receiver_id;
    QuantityType quantity = QuantityType::Bearing;
    CellId observed_cell = 0;
    Eigen::Vector2d rx_location = Eigen::Vector2d::Zero();
    // Edge whose discrepancy measures disagreement with this report.
    EdgeId observation_edge = 0;
    // Flat topology only: the per-report joint cell and its projection edge.
    std::optional<CellId> joint_cell;
    std::optional<EdgeId> joint_edge;
};

// ============================================================
// Fox sheaf: cell complex + restriction maps for one set of
// reception reports, wired to the radius engine, the fusion
// optimizer and the filtration by composition.
//
// Sealed on construction by FoxSheafBuilder and immutable after
// that; safe to share read-only across concurrent fusion runs as
// long as each run owns its assignment.
// ============================================================
class FoxSheaf {
public:
    FoxSheaf(const PropagationLaw& law, SheafTopology topology);

    // The registry refers to the complex; keep the pair in place.
    FoxSheaf(const FoxSheaf&) = delete;
    FoxSheaf& operator=(const FoxSheaf&) = delete;
    FoxSheaf(FoxSheaf&&) = delete;
    FoxSheaf& operator=(FoxSheaf&&) = delete;

    const CellComplex& complex() const { return complex_; }
    const RestrictionMapRegistry& registry() const { return registry_; }
    const PropagationLaw& law() const { return law_; }
    SheafTopology topology() const { return topology_; }

    const Assignment& initialAssignment() const { return initial_; }
    const std::vector<ReportBinding>& bindings() const { return bindings_; }

    // Cell holding the fused transmitter location (first two coordinates).
    CellId locationCell() const { return location_cell_; }
    std::optional<CellId> powerCell() const { return power_cell_; }

    double radius(const Assignment& assignment,
                  RadiusAggregate aggregate = RadiusAggregate::Supremum) const;
    std::vector<EdgeDiscrepancy> discrepancies(const Assignment& assignment) const;

    FusionResult fuse(const FusionOptions& options = {}) const;
    FusionResult fuse(const Assignment& initial, const FusionOptions& options) const;

    ConsistencyFiltration filtration(const Assignment& assignment,
                                     const FiltrationConfig& config = {}) const;

    Eigen::Vector2d location(const Assignment& assignment) const;
    std::optional<double> power(const Assignment& assignment) const;

    // Every hypothesis cell placed at one transmitter location and power,
    // receivers at their reported positions. Power is ignored by
    // bearing-only hub sheaves.
    Assignment assignmentAt(const Eigen::Vector2d& location, double power_W) const;

private:
    friend class FoxSheafBuilder;

    PropagationLaw law_;
    SheafTopology topology_;
    CellComplex complex_;
    RestrictionMapRegistry registry_;
    Assignment initial_;
    std::vector<ReportBinding> bindings_;
    CellId location_cell_ = 0;
    std::optional<CellId> power_cell_;
};

class FoxSheafBuilder {
public:
    explicit FoxSheafBuilder(const PropagationLaw& law, SheafTopology topology = SheafTopology::Hub);

    // Seed for free cells: transmitter location and power.
    FoxSheafBuilder& setInitialGuess(const Eigen::Vector2d& location, double power_W);
    // Location only; the power seed is the mean power the RSSI reports imply
    // from that location (1 W when there are none).
    FoxSheafBuilder& setInitialGuess(const Eigen::Vector2d& location);

    // Builds and seals. Empty report lists and non-finite report values raise
    // DomainError.
    std::unique_ptr<FoxSheaf> build(const std::vector<ReceptionReport>& reports) const;

private:
    void buildFlat(FoxSheaf& sheaf, const std::vector<ReceptionReport>& reports) const;
    void buildHub(FoxSheaf& sheaf, const std::vector<ReceptionReport>& reports) const;
    double seedPower(const std::vector<ReceptionReport>& reports) const;

    PropagationLaw law_;
    SheafTopology topology_;
    Eigen::Vector2d guess_location_ = Eigen::Vector2d::Zero();
    std::optional<double> guess_power_W_;
};

} // namespace foxsheaf
