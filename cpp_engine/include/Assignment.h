#pragma once

#include <optional>
#include <vector>

#include "CellComplex.h"

namespace foxsheaf {

// One stalk element per cell of a complex. Plain value type: copy it to
// give each optimizer run its own instance.
class Assignment {
public:
    Assignment() = default;
    explicit Assignment(const CellComplex& complex);

    // Every observed cell set to its fixed value, every free cell empty.
    static Assignment fromObservations(const CellComplex& complex);

    std::size_t size() const { return values_.size(); }

    // Validates membership in the cell's stalk (DomainError otherwise).
    void set(const CellComplex& complex, CellId cell, const Vector& value);

    bool has(CellId cell) const;
    // IncompleteAssignmentError when the cell is empty.
    const Vector& value(CellId cell) const;

    bool isComplete() const;
    std::vector<CellId> missingCells() const;

private:
    std::vector<std::optional<Vector>> values_;
};

} // namespace foxsheaf
