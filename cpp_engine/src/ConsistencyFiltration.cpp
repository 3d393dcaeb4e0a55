#include "ConsistencyFiltration.h"

#include "FoxSheafErrors.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <numeric>
#include <utility>

namespace foxsheaf {

bool SubComplex::containsCell(CellId c) const {
    return std::binary_search(cells.begin(), cells.end(), c);
}

bool SubComplex::containsEdge(EdgeId e) const {
    return std::binary_search(edges.begin(), edges.end(), e);
}

bool SubComplex::isSubsetOf(const SubComplex& other) const {
    return std::includes(other.cells.begin(), other.cells.end(), cells.begin(), cells.end()) &&
           std::includes(other.edges.begin(), other.edges.end(), edges.begin(), edges.end());
}

std::size_t SubComplex::componentCount(const CellComplex& complex) const {
    std::vector<CellId> parent(complex.cellCount());
    std::iota(parent.begin(), parent.end(), 0);
    auto root = [&](CellId c) {
        while (parent[c] != c) {
            parent[c] = parent[parent[c]];
            c = parent[c];
        }
        return c;
    };

    for (EdgeId e : edges) {
        const ComparisonEdge& edge = complex.edge(e);
        const CellId a = root(edge.source);
        const CellId b = root(edge.target);
        if (a != b) {
            parent[std::max(a, b)] = std::min(a, b);
        }
    }

    std::size_t count = 0;
    for (CellId c : cells) {
        if (root(c) == c) {
            ++count;
        }
    }
    return count;
}

ConsistencyFiltration::ConsistencyFiltration(const CellComplex& complex,
                                             const RestrictionMapRegistry& registry,
                                             const Assignment& assignment,
                                             const FiltrationConfig& config)
    : complex_(complex), config_(config) {
    const ConsistencyRadiusEngine engine(complex, registry);
    discrepancies_ = engine.discrepancies(assignment);

    for (const Cell& c : complex.cells()) {
        if (complex.outgoingEdges(c.id).empty() && complex.incomingEdges(c.id).empty()) {
            isolated_.push_back(c.id);
        }
    }
}

FiltrationLevel ConsistencyFiltration::level(double threshold) const {
    if (std::isnan(threshold)) {
        throw DomainError("filtration threshold is NaN");
    }

    FiltrationLevel out;
    out.threshold = threshold;

    std::vector<char> keep(complex_.cellCount(), 0);
    for (const EdgeDiscrepancy& d : discrepancies_) {
        if (d.value <= threshold) {
            out.sub.edges.push_back(d.edge);
            keep[d.source] = 1;
            keep[d.target] = 1;
        }
    }
    if (config_.include_isolated_cells) {
        for (CellId c : isolated_) {
            keep[c] = 1;
        }
    }
    for (CellId c = 0; c < keep.size(); ++c) {
        if (keep[c]) {
            out.sub.cells.push_back(c);
        }
    }
    std::sort(out.sub.edges.begin(), out.sub.edges.end());
    return out;
}

std::vector<double> ConsistencyFiltration::criticalThresholds() const {
    std::vector<double> t;
    t.reserve(discrepancies_.size());
    for (const EdgeDiscrepancy& d : discrepancies_) {
        t.push_back(d.value);
    }
    std::sort(t.begin(), t.end());
    t.erase(std::unique(t.begin(), t.end()), t.end());
    return t;
}

ConsistencyFiltration::Levels::Levels(std::shared_ptr<const ConsistencyFiltration> filtration,
                                      std::vector<double> thresholds)
    : filtration_(std::move(filtration)), thresholds_(std::move(thresholds)) {}

FiltrationLevel ConsistencyFiltration::Levels::at(std::size_t i) const {
    if (i >= thresholds_.size()) {
        throw DomainError("filtration level index out of range");
    }
    return filtration_->level(thresholds_[i]);
}

ConsistencyFiltration::Levels ConsistencyFiltration::levels(std::vector<double> thresholds) const {
    for (double t : thresholds) {
        if (std::isnan(t)) {
            throw DomainError("filtration threshold is NaN");
        }
    }
    std::sort(thresholds.begin(), thresholds.end());
    return Levels(std::make_shared<const ConsistencyFiltration>(*this), std::move(thresholds));
}

ConsistencyFiltration::Levels ConsistencyFiltration::criticalLevels() const {
    std::vector<double> t = criticalThresholds();
    if (t.empty() || t.front() > 0.0) {
        t.insert(t.begin(), 0.0);
    }
    return Levels(std::make_shared<const ConsistencyFiltration>(*this), std::move(t));
}

} // namespace foxsheaf
