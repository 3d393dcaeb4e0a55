#include "ConsistencyRadius.h"

#include "FoxSheafErrors.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace foxsheaf {

ConsistencyRadiusEngine::ConsistencyRadiusEngine(const CellComplex& complex,
                                                 const RestrictionMapRegistry& registry,
                                                 RadiusAggregate aggregate)
    : complex_(complex), registry_(registry), aggregate_(aggregate) {}

void ConsistencyRadiusEngine::requireComplete(const Assignment& assignment) const {
    if (assignment.size() != complex_.cellCount()) {
        throw IncompleteAssignmentError("assignment covers " + std::to_string(assignment.size()) +
                                        " of " + std::to_string(complex_.cellCount()) + " cells");
    }
    for (const Cell& c : complex_.cells()) {
        if (!assignment.has(c.id)) {
            throw IncompleteAssignmentError("cell '" + c.name + "' has no value");
        }
    }
}

double ConsistencyRadiusEngine::edgeDiscrepancy(const Assignment& assignment, EdgeId edge) const {
    const ComparisonEdge& e = complex_.edge(edge);
    const Vector restricted = registry_.evaluate(edge, assignment.value(e.source));
    return complex_.cell(e.target).stalk.distance(restricted, assignment.value(e.target));
}

std::vector<EdgeDiscrepancy> ConsistencyRadiusEngine::discrepancies(const Assignment& assignment) const {
    requireComplete(assignment);

    std::vector<EdgeDiscrepancy> out;
    out.reserve(complex_.edgeCount());
    for (const ComparisonEdge& e : complex_.edges()) {
        EdgeDiscrepancy d;
        d.edge = e.id;
        d.source = e.source;
        d.target = e.target;
        d.value = edgeDiscrepancy(assignment, e.id);
        out.push_back(d);
    }
    return out;
}

double ConsistencyRadiusEngine::radius(const Assignment& assignment) const {
    return radius(assignment, aggregate_);
}

double ConsistencyRadiusEngine::radius(const Assignment& assignment, RadiusAggregate aggregate) const {
    requireComplete(assignment);

    double acc = 0.0;
    for (const ComparisonEdge& e : complex_.edges()) {
        const double d = edgeDiscrepancy(assignment, e.id);
        switch (aggregate) {
        case RadiusAggregate::Supremum:
            acc = std::max(acc, d);
            break;
        case RadiusAggregate::L2:
            acc += d * d;
            break;
        case RadiusAggregate::L1:
            acc += d;
            break;
        }
    }
    return (aggregate == RadiusAggregate::L2) ? std::sqrt(acc) : acc;
}

} // namespace foxsheaf
