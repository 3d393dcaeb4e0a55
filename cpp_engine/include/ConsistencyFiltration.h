#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <vector>

#include "Assignment.h"
#include "CellComplex.h"
#include "ConsistencyRadius.h"
#include "RestrictionMapRegistry.h"

namespace foxsheaf {

struct FiltrationConfig {
    // Keep cells that have no comparison edges at all in every level.
    bool include_isolated_cells = false;
};

// Cells and edges retained at one threshold. Ids are sorted ascending.
struct SubComplex {
    std::vector<CellId> cells;
    std::vector<EdgeId> edges;

    bool containsCell(CellId c) const;
    bool containsEdge(EdgeId e) const;
    bool isSubsetOf(const SubComplex& other) const;

    // Connected components over the retained cells and edges (undirected).
    std::size_t componentCount(const CellComplex& complex) const;
};

struct FiltrationLevel {
    double threshold = 0.0;
    SubComplex sub;
};

// ============================================================
// Consistency filtration over a fixed assignment.
//
// Edge discrepancies are computed once at construction; each
// level is then a pure function of its threshold, so levels may
// be computed in any order or concurrently.
// ============================================================
class ConsistencyFiltration {
public:
    ConsistencyFiltration(const CellComplex& complex,
                          const RestrictionMapRegistry& registry,
                          const Assignment& assignment,
                          const FiltrationConfig& config = {});

    // Retains every edge with discrepancy <= threshold.
    FiltrationLevel level(double threshold) const;

    // Sorted distinct edge discrepancies: the only thresholds at which the
    // sub-complex changes.
    std::vector<double> criticalThresholds() const;

    const std::vector<EdgeDiscrepancy>& discrepancies() const { return discrepancies_; }
    const FiltrationConfig& config() const { return config_; }

    // Lazy, restartable view over ascending thresholds. Shares a snapshot of
    // the discrepancies, so it stays valid after the filtration is gone.
    class Levels {
    public:
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = FiltrationLevel;
            using difference_type = std::ptrdiff_t;
            using pointer = const FiltrationLevel*;
            using reference = FiltrationLevel;

            iterator(const Levels* owner, std::size_t index) : owner_(owner), index_(index) {}

            FiltrationLevel operator*() const { return owner_->filtration_->level(owner_->thresholds_[index_]); }
            iterator& operator++() { ++index_; return *this; }
            bool operator==(const iterator& o) const { return owner_ == o.owner_ && index_ == o.index_; }
            bool operator!=(const iterator& o) const { return !(*this == o); }

        private:
            const Levels* owner_;
            std::size_t index_;
        };

        iterator begin() const { return iterator(this, 0); }
        iterator end() const { return iterator(this, thresholds_.size()); }
        std::size_t size() const { return thresholds_.size(); }
        FiltrationLevel at(std::size_t i) const;
        const std::vector<double>& thresholds() const { return thresholds_; }

    private:
        friend class ConsistencyFiltration;
        Levels(std::shared_ptr<const ConsistencyFiltration> filtration, std::vector<double> thresholds);

        std::shared_ptr<const ConsistencyFiltration> filtration_;
        std::vector<double> thresholds_;
    };

    // Thresholds are sorted ascending; NaN raises DomainError.
    Levels levels(std::vector<double> thresholds) const;
    // Levels at criticalThresholds(), preceded by a level at 0.
    Levels criticalLevels() const;

private:
    const CellComplex& complex_;
    FiltrationConfig config_;
    std::vector<EdgeDiscrepancy> discrepancies_;
    std::vector<CellId> isolated_;
};

} // namespace foxsheaf
