#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Assignment.h"
#include "CellComplex.h"
#include "ConsistencyRadius.h"
#include "RestrictionMapRegistry.h"

namespace foxsheaf {

// Explicit optimizer budget and search parameters (no global state).
struct FusionOptions {
    // Nelder-Mead iterations across all starts and stages.
    int max_iterations = 200000;
    // Radius evaluations across the whole call; 0 disables.
    std::int64_t max_evaluations = 0;
    // Wall-clock budget in seconds; 0 disables.
    double max_wall_time_s = 0.0;

    // Radius improvement below this counts as no progress.
    double tolerance = 1e-12;
    // Consecutive no-progress iterations that end a local search.
    int stall_iterations = 200;

    // Extra random starts beyond the supplied assignment.
    int restarts = 4;
    std::uint32_t seed = 1337u;
    // Edge length of the initial simplex (stalk units).
    double initial_step = 1.0;
    // Std-dev of random starts around the initial point.
    double restart_spread = 10.0;

    // Stop as soon as the radius is at or below this value; <= 0 disables.
    double target_radius = 1e-12;
    // Minimize the L2 aggregate first, then polish the requested aggregate.
    bool smoothing = true;

    RadiusAggregate aggregate = RadiusAggregate::Supremum;
};

enum class TerminationReason : int {
    Converged = 0,
    TargetReached = 1,
    IterationBudget = 2,
    EvaluationBudget = 3,
    TimeBudget = 4,
};

const char* toString(TerminationReason reason);

// Budget truncation without meeting the tolerance. Reported, never thrown.
struct ConvergenceWarning {
    TerminationReason reason = TerminationReason::IterationBudget;
    double radius = 0.0;
    std::string message;
};

struct FusionResult {
    Assignment assignment;
    double radius = 0.0;
    std::vector<EdgeDiscrepancy> discrepancies;

    bool converged = false;
    TerminationReason termination = TerminationReason::Converged;
    int iterations = 0;
    std::int64_t evaluations = 0;
    int starts_completed = 0;
    std::optional<ConvergenceWarning> warning;
};

// ============================================================
// Assignment fusion: derivative-free minimization of the
// consistency radius over the coordinates of the free cells.
//
// - Observed cells not listed as free are held constant.
// - Adaptive Nelder-Mead simplex with re-expansion around the
//   best vertex, multi-start from seeded random perturbations.
// - Budget exhaustion returns the best complete assignment found.
// - No global optimality guarantee.
// ============================================================
class AssignmentFusionOptimizer {
public:
    AssignmentFusionOptimizer(const CellComplex& complex,
                              const RestrictionMapRegistry& registry,
                              const FusionOptions& options = {});

    const FusionOptions& options() const { return options_; }

    // Optimizes every cell without an observed value.
    FusionResult fuse(const Assignment& initial) const;
    FusionResult fuse(const Assignment& initial, const std::vector<CellId>& free_cells) const;

private:
    const CellComplex& complex_;
    const RestrictionMapRegistry& registry_;
    FusionOptions options_;
};

} // namespace foxsheaf
