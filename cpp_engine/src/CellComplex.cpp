#include "CellComplex.h"

#include "FoxSheafErrors.h"

#include <algorithm>
#include <functional>
#include <queue>
#include <string>

namespace foxsheaf {

void CellComplex::requireUnsealed(const char* op) const {
    if (sealed_) {
        throw StructureError(std::string(op) + " on a sealed complex");
    }
}

void CellComplex::requireCell(CellId id, const char* op) const {
    if (id >= cells_.size()) {
        throw StructureError(std::string(op) + ": unknown cell id " + std::to_string(id));
    }
}

CellId CellComplex::addCell(const std::string& name, const Stalk& stalk,
                            const std::optional<Vector>& fixed_value) {
    requireUnsealed("addCell");
    if (name.empty()) {
        throw StructureError("addCell: empty cell name");
    }
    if (by_name_.count(name) != 0) {
        throw StructureError("addCell: duplicate cell '" + name + "'");
    }
    if (stalk.dimension() < 1) {
        throw StructureError("addCell: cell '" + name + "' has no stalk");
    }
    if (fixed_value) {
        stalk.requireMember(*fixed_value, "addCell '" + name + "'");
    }

    Cell c;
    c.id = cells_.size();
    c.name = name;
    c.stalk = stalk;
    c.fixed_value = fixed_value;

    cells_.push_back(c);
    out_.emplace_back();
    in_.emplace_back();
    by_name_.emplace(name, c.id);
    return c.id;
}

EdgeId CellComplex::addEdge(const std::string& source_name, const std::string& target_name) {
    return addEdge(require(source_name), require(target_name));
}

EdgeId CellComplex::addEdge(CellId source, CellId target) {
    requireUnsealed("addEdge");
    requireCell(source, "addEdge");
    requireCell(target, "addEdge");

    const std::string label = "'" + cells_[source].name + "' -> '" + cells_[target].name + "'";
    if (source == target) {
        throw StructureError("addEdge: self-loop " + label);
    }
    for (EdgeId e : out_[source]) {
        if (edges_[e].target == target) {
            throw StructureError("addEdge: duplicate edge " + label);
        }
    }
    // The new edge closes a cycle iff the source is already reachable from the target.
    if (reaches(target, source)) {
        throw StructureError("addEdge: edge " + label + " introduces a cycle");
    }

    ComparisonEdge e;
    e.id = edges_.size();
    e.source = source;
    e.target = target;
    edges_.push_back(e);
    out_[source].push_back(e.id);
    in_[target].push_back(e.id);
    return e.id;
}

void CellComplex::setFixedValue(CellId cell, const std::optional<Vector>& fixed_value) {
    requireUnsealed("setFixedValue");
    requireCell(cell, "setFixedValue");
    if (fixed_value) {
        cells_[cell].stalk.requireMember(*fixed_value, "setFixedValue '" + cells_[cell].name + "'");
    }
    cells_[cell].fixed_value = fixed_value;
}

const Cell& CellComplex::cell(CellId id) const {
    requireCell(id, "cell");
    return cells_[id];
}

const ComparisonEdge& CellComplex::edge(EdgeId id) const {
    if (id >= edges_.size()) {
        throw StructureError("edge: unknown edge id " + std::to_string(id));
    }
    return edges_[id];
}

std::optional<CellId> CellComplex::find(const std::string& name) const {
    const auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

CellId CellComplex::require(const std::string& name) const {
    const auto id = find(name);
    if (!id) {
        throw StructureError("unknown cell '" + name + "'");
    }
    return *id;
}

const std::vector<EdgeId>& CellComplex::outgoingEdges(CellId cell) const {
    requireCell(cell, "outgoingEdges");
    return out_[cell];
}

const std::vector<EdgeId>& CellComplex::incomingEdges(CellId cell) const {
    requireCell(cell, "incomingEdges");
    return in_[cell];
}

bool CellComplex::reaches(CellId from, CellId to) const {
    requireCell(from, "reaches");
    requireCell(to, "reaches");
    if (from == to) {
        return true;
    }

    std::vector<char> seen(cells_.size(), 0);
    std::vector<CellId> stack{from};
    seen[from] = 1;
    while (!stack.empty()) {
        const CellId c = stack.back();
        stack.pop_back();
        for (EdgeId e : out_[c]) {
            const CellId next = edges_[e].target;
            if (next == to) {
                return true;
            }
            if (!seen[next]) {
                seen[next] = 1;
                stack.push_back(next);
            }
        }
    }
    return false;
}

std::vector<CellId> CellComplex::descendants(CellId cell) const {
    requireCell(cell, "descendants");
    std::vector<char> seen(cells_.size(), 0);
    std::vector<CellId> stack{cell};
    while (!stack.empty()) {
        const CellId c = stack.back();
        stack.pop_back();
        for (EdgeId e : out_[c]) {
            const CellId next = edges_[e].target;
            if (!seen[next]) {
                seen[next] = 1;
                stack.push_back(next);
            }
        }
    }

    std::vector<CellId> result;
    for (CellId c = 0; c < cells_.size(); ++c) {
        if (seen[c] && c != cell) {
            result.push_back(c);
        }
    }
    return result;
}

std::vector<CellId> CellComplex::ancestors(CellId cell) const {
    requireCell(cell, "ancestors");
    std::vector<char> seen(cells_.size(), 0);
    std::vector<CellId> stack{cell};
    while (!stack.empty()) {
        const CellId c = stack.back();
        stack.pop_back();
        for (EdgeId e : in_[c]) {
            const CellId prev = edges_[e].source;
            if (!seen[prev]) {
                seen[prev] = 1;
                stack.push_back(prev);
            }
        }
    }

    std::vector<CellId> result;
    for (CellId c = 0; c < cells_.size(); ++c) {
        if (seen[c] && c != cell) {
            result.push_back(c);
        }
    }
    return result;
}

std::vector<CellId> CellComplex::maximalCells() const {
    std::vector<CellId> result;
    for (CellId c = 0; c < cells_.size(); ++c) {
        if (in_[c].empty()) {
            result.push_back(c);
        }
    }
    return result;
}

std::vector<CellId> CellComplex::minimalCells() const {
    std::vector<CellId> result;
    for (CellId c = 0; c < cells_.size(); ++c) {
        if (out_[c].empty()) {
            result.push_back(c);
        }
    }
    return result;
}

std::vector<CellId> CellComplex::freeCells() const {
    std::vector<CellId> result;
    for (const Cell& c : cells_) {
        if (!c.isObserved()) {
            result.push_back(c.id);
        }
    }
    return result;
}

bool CellComplex::comparable(CellId a, CellId b) const {
    return reaches(a, b) || reaches(b, a);
}

std::vector<CellId> CellComplex::topologicalOrder() const {
    std::vector<std::size_t> indegree(cells_.size(), 0);
    for (const ComparisonEdge& e : edges_) {
        ++indegree[e.target];
    }

    // Min-heap on id keeps the order deterministic.
    std::priority_queue<CellId, std::vector<CellId>, std::greater<CellId>> ready;
    for (CellId c = 0; c < cells_.size(); ++c) {
        if (indegree[c] == 0) {
            ready.push(c);
        }
    }

    std::vector<CellId> order;
    order.reserve(cells_.size());
    while (!ready.empty()) {
        const CellId c = ready.top();
        ready.pop();
        order.push_back(c);
        for (EdgeId e : out_[c]) {
            if (--indegree[edges_[e].target] == 0) {
                ready.push(edges_[e].target);
            }
        }
    }

    if (order.size() != cells_.size()) {
        throw StructureError("topologicalOrder: comparison relation is not acyclic");
    }
    return order;
}

std::vector<std::vector<EdgeId>> CellComplex::paths(CellId from, CellId to) const {
    requireCell(from, "paths");
    requireCell(to, "paths");

    std::vector<std::vector<EdgeId>> result;
    std::vector<EdgeId> current;

    // Depth-first enumeration; the relation is acyclic so this terminates.
    struct Frame {
        CellId cell;
        std::size_t next;
    };
    std::vector<Frame> stack{{from, 0}};
    while (!stack.empty()) {
        Frame& f = stack.back();
        if (f.cell == to && !current.empty()) {
            result.push_back(current);
            stack.pop_back();
            if (!current.empty()) {
                current.pop_back();
            }
            continue;
        }
        if (f.next >= out_[f.cell].size()) {
            stack.pop_back();
            if (!current.empty()) {
                current.pop_back();
            }
            continue;
        }
        const EdgeId e = out_[f.cell][f.next++];
        current.push_back(e);
        stack.push_back({edges_[e].target, 0});
    }
    return result;
}

} // namespace foxsheaf
