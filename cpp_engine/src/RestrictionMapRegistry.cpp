#include "RestrictionMapRegistry.h"

#include "FoxSheafErrors.h"

#include <algorithm>
#include <sstream>
#include <string>

namespace foxsheaf {

namespace {
std::string edgeLabel(const CellComplex& complex, EdgeId edge) {
    const ComparisonEdge& e = complex.edge(edge);
    return "'" + complex.cell(e.source).name + "' -> '" + complex.cell(e.target).name + "'";
}
} // namespace

RestrictionMapRegistry::RestrictionMapRegistry(const CellComplex& complex)
    : complex_(complex) {}

void RestrictionMapRegistry::attach(EdgeId edge, const RestrictionMap& map) {
    if (complex_.isSealed()) {
        throw StructureError("attach: complex is sealed");
    }
    const ComparisonEdge& e = complex_.edge(edge);
    if (maps_.size() < complex_.edgeCount()) {
        maps_.resize(complex_.edgeCount());
    }
    if (maps_[edge]) {
        throw StructureError("attach: edge " + edgeLabel(complex_, edge) + " already has a map");
    }

    const int src_dim = complex_.cell(e.source).stalk.dimension();
    const int dst_dim = complex_.cell(e.target).stalk.dimension();
    if (map.inputDimension() != src_dim || map.outputDimension() != dst_dim) {
        std::ostringstream msg;
        msg << "attach: map '" << map.label() << "' is " << map.inputDimension() << " -> "
            << map.outputDimension() << " but edge " << edgeLabel(complex_, edge) << " is "
            << src_dim << " -> " << dst_dim;
        throw DomainError(msg.str());
    }
    maps_[edge] = map;
}

bool RestrictionMapRegistry::hasMap(EdgeId edge) const {
    return edge < maps_.size() && maps_[edge].has_value();
}

const RestrictionMap& RestrictionMapRegistry::map(EdgeId edge) const {
    if (!hasMap(edge)) {
        throw StructureError("no restriction map on edge " + std::to_string(edge));
    }
    return *maps_[edge];
}

bool RestrictionMapRegistry::isComplete() const {
    for (EdgeId e = 0; e < complex_.edgeCount(); ++e) {
        if (!hasMap(e)) {
            return false;
        }
    }
    return true;
}

void RestrictionMapRegistry::requireComplete() const {
    for (EdgeId e = 0; e < complex_.edgeCount(); ++e) {
        if (!hasMap(e)) {
            throw StructureError("edge " + edgeLabel(complex_, e) + " has no restriction map");
        }
    }
}

Vector RestrictionMapRegistry::evaluate(EdgeId edge, const Vector& value) const {
    const ComparisonEdge& e = complex_.edge(edge);
    complex_.cell(e.source).stalk.requireMember(value, "evaluate " + edgeLabel(complex_, edge));
    return map(edge).evaluate(value);
}

RestrictionMap RestrictionMapRegistry::composePath(const std::vector<EdgeId>& path) const {
    if (path.empty()) {
        throw StructureError("composePath: empty path");
    }
    RestrictionMap composite = map(path.front());
    for (std::size_t i = 1; i < path.size(); ++i) {
        if (complex_.edge(path[i - 1]).target != complex_.edge(path[i]).source) {
            throw StructureError("composePath: edges do not form a chain");
        }
        composite = RestrictionMap::compose(map(path[i]), composite);
    }
    return composite;
}

double RestrictionMapRegistry::pathDiscrepancy(CellId from, CellId to, const Vector& value) const {
    complex_.cell(from).stalk.requireMember(value, "pathDiscrepancy");
    const Stalk& target = complex_.cell(to).stalk;

    std::vector<Vector> images;
    for (const auto& path : complex_.paths(from, to)) {
        images.push_back(composePath(path).evaluate(value));
    }

    double worst = 0.0;
    for (std::size_t i = 0; i < images.size(); ++i) {
        for (std::size_t j = i + 1; j < images.size(); ++j) {
            worst = std::max(worst, target.distance(images[i], images[j]));
        }
    }
    return worst;
}

} // namespace foxsheaf
