#pragma once

#include <vector>

#include "Assignment.h"
#include "CellComplex.h"
#include "RestrictionMapRegistry.h"

namespace foxsheaf {

enum class RadiusAggregate : int {
    Supremum = 0, // max over edges
    L2 = 1,       // sqrt of the sum of squares
    L1 = 2,       // sum
};

struct EdgeDiscrepancy {
    EdgeId edge = 0;
    CellId source = 0;
    CellId target = 0;
    double value = 0.0;
};

// Pure function of (complex, registry, assignment). Holds references only.
class ConsistencyRadiusEngine {
public:
    ConsistencyRadiusEngine(const CellComplex& complex,
                            const RestrictionMapRegistry& registry,
                            RadiusAggregate aggregate = RadiusAggregate::Supremum);

    RadiusAggregate aggregate() const { return aggregate_; }

    // distance(restriction(source value), target value) in the target metric.
    double edgeDiscrepancy(const Assignment& assignment, EdgeId edge) const;

    // One entry per edge, in edge-id order.
    std::vector<EdgeDiscrepancy> discrepancies(const Assignment& assignment) const;

    double radius(const Assignment& assignment) const;
    double radius(const Assignment& assignment, RadiusAggregate aggregate) const;

    // IncompleteAssignmentError listing the first empty cell, if any.
    void requireComplete(const Assignment& assignment) const;

private:
    const CellComplex& complex_;
    const RestrictionMapRegistry& registry_;
    RadiusAggregate aggregate_;
};

} // namespace foxsheaf
