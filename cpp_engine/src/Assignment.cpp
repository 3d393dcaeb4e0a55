#include "Assignment.h"

#include "FoxSheafErrors.h"

#include <string>

namespace foxsheaf {

Assignment::Assignment(const CellComplex& complex)
    : values_(complex.cellCount()) {}

Assignment Assignment::fromObservations(const CellComplex& complex) {
    Assignment a(complex);
    for (const Cell& c : complex.cells()) {
        if (c.fixed_value) {
            a.values_[c.id] = *c.fixed_value;
        }
    }
    return a;
}

void Assignment::set(const CellComplex& complex, CellId cell, const Vector& value) {
    const Cell& c = complex.cell(cell);
    if (cell >= values_.size()) {
        throw StructureError("assignment was built for a smaller complex");
    }
    c.stalk.requireMember(value, "assign '" + c.name + "'");
    values_[cell] = value;
}

bool Assignment::has(CellId cell) const {
    return cell < values_.size() && values_[cell].has_value();
}

const Vector& Assignment::value(CellId cell) const {
    if (!has(cell)) {
        throw IncompleteAssignmentError("cell " + std::to_string(cell) + " has no value");
    }
    return *values_[cell];
}

bool Assignment::isComplete() const {
    for (const auto& v : values_) {
        if (!v) {
            return false;
        }
    }
    return true;
}

std::vector<CellId> Assignment::missingCells() const {
    std::vector<CellId> missing;
    for (CellId c = 0; c < values_.size(); ++c) {
        if (!values_[c]) {
            missing.push_back(c);
        }
    }
    return missing;
}

} // namespace foxsheaf
