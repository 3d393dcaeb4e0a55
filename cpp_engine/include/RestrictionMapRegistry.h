#pragma once

#include <optional>
#include <vector>

#include "CellComplex.h"
#include "RestrictionMap.h"

namespace foxsheaf {

// One restriction map per comparison edge of a complex.
//
// The registry only reads the complex; it must not outlive it.
class RestrictionMapRegistry {
public:
    explicit RestrictionMapRegistry(const CellComplex& complex);

    // Dimensions must match the stalks of the edge endpoints exactly.
    void attach(EdgeId edge, const RestrictionMap& map);

    bool hasMap(EdgeId edge) const;
    const RestrictionMap& map(EdgeId edge) const;

    bool isComplete() const;
    void requireComplete() const;

    // Applies the map of `edge` to a member of the source stalk.
    Vector evaluate(EdgeId edge, const Vector& value) const;

    // Composite of the maps along a chain of edges (first edge applied first).
    RestrictionMap composePath(const std::vector<EdgeId>& path) const;

    // Largest pairwise target-stalk distance between the images of `value`
    // along every directed path from `from` to `to`. Zero when fewer than two
    // paths exist.
    double pathDiscrepancy(CellId from, CellId to, const Vector& value) const;

    const CellComplex& complex() const { return complex_; }

private:
    const CellComplex& complex_;
    std::vector<std::optional<RestrictionMap>> maps_;
};

} // namespace foxsheaf
