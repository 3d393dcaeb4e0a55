#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Stalk.h"

namespace foxsheaf {

using CellId = std::size_t;
using EdgeId = std::size_t;

struct Cell {
    CellId id = 0;
    std::string name;
    Stalk stalk;
    // Observed cells carry a value the optimizer holds constant.
    std::optional<Vector> fixed_value;

    bool isObserved() const { return fixed_value.has_value(); }
};

// Comparison relation: source is the larger cell, target the smaller one.
struct ComparisonEdge {
    EdgeId id = 0;
    CellId source = 0;
    CellId target = 0;
};

// ============================================================
// Cell complex: a finite poset of cells.
//
// - Edges always point from the larger cell to the smaller one.
// - The relation is kept acyclic at every mutation; a rejected
//   mutation leaves the complex unchanged.
// - seal() freezes the structure for the rest of the lifetime.
// ============================================================
class CellComplex {
public:
    CellComplex() = default;

    CellId addCell(const std::string& name, const Stalk& stalk,
                   const std::optional<Vector>& fixed_value = std::nullopt);
    EdgeId addEdge(const std::string& source_name, const std::string& target_name);
    EdgeId addEdge(CellId source, CellId target);

    // Replace or clear the observed value of a cell (unsealed complexes only).
    void setFixedValue(CellId cell, const std::optional<Vector>& fixed_value);

    void seal() { sealed_ = true; }
    bool isSealed() const { return sealed_; }

    std::size_t cellCount() const { return cells_.size(); }
    std::size_t edgeCount() const { return edges_.size(); }

    const Cell& cell(CellId id) const;
    const ComparisonEdge& edge(EdgeId id) const;
    const std::vector<Cell>& cells() const { return cells_; }
    const std::vector<ComparisonEdge>& edges() const { return edges_; }

    std::optional<CellId> find(const std::string& name) const;
    CellId require(const std::string& name) const;

    const std::vector<EdgeId>& outgoingEdges(CellId cell) const;
    const std::vector<EdgeId>& incomingEdges(CellId cell) const;

    // Transitive closure, excluding the cell itself; sorted by id.
    std::vector<CellId> ancestors(CellId cell) const;
    std::vector<CellId> descendants(CellId cell) const;

    std::vector<CellId> maximalCells() const;
    std::vector<CellId> minimalCells() const;
    std::vector<CellId> freeCells() const;

    // Reflexive: a cell is comparable with itself.
    bool comparable(CellId a, CellId b) const;
    bool reaches(CellId from, CellId to) const;

    // Larger cells first; ties broken by id.
    std::vector<CellId> topologicalOrder() const;

    // Every directed edge path from `from` to `to` (empty when not reachable).
    std::vector<std::vector<EdgeId>> paths(CellId from, CellId to) const;

private:
    void requireUnsealed(const char* op) const;
    void requireCell(CellId id, const char* op) const;

    std::vector<Cell> cells_;
    std::vector<ComparisonEdge> edges_;
    std::vector<std::vector<EdgeId>> out_;
    std::vector<std::vector<EdgeId>> in_;
    std::unordered_map<std::string, CellId> by_name_;
    bool sealed_ = false;
};

} // namespace foxsheaf
