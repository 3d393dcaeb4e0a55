#include "FusionOptimizer.h"

#include "FoxSheafErrors.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <sstream>
#include <string>
#include <utility>

namespace foxsheaf {

namespace {

constexpr int kMaxRefinements = 12;
constexpr int kMaxFailedRefinements = 3;
constexpr double kRefinementShrink = 0.1;
constexpr double kCollapseRel = 1e-13;

struct Slot {
    CellId cell = 0;
    Eigen::Index offset = 0;
    int dim = 0;
};

// Shared budget accounting for one fuse() call.
class SearchBudget {
public:
    explicit SearchBudget(const FusionOptions& o)
        : opts_(o), start_(std::chrono::steady_clock::now()) {}

    void countIteration() { ++iterations_; }
    void countEvaluation() { ++evaluations_; }

    int iterations() const { return iterations_; }
    std::int64_t evaluations() const { return evaluations_; }

    // Which budget is exhausted, if any.
    std::optional<TerminationReason> exhausted() const {
        if (iterations_ >= opts_.max_iterations) {
            return TerminationReason::IterationBudget;
        }
        return evaluationStop();
    }

    // Budgets that forbid one more objective evaluation.
    std::optional<TerminationReason> evaluationStop() const {
        if (opts_.max_evaluations > 0 && evaluations_ >= opts_.max_evaluations) {
            return TerminationReason::EvaluationBudget;
        }
        if (opts_.max_wall_time_s > 0.0) {
            const std::chrono::duration<double> dt = std::chrono::steady_clock::now() - start_;
            if (dt.count() >= opts_.max_wall_time_s) {
                return TerminationReason::TimeBudget;
            }
        }
        return std::nullopt;
    }

private:
    const FusionOptions& opts_;
    std::chrono::steady_clock::time_point start_;
    int iterations_ = 0;
    std::int64_t evaluations_ = 0;
};

// Unwinds a local search when the evaluation or wall-time budget runs out.
struct BudgetStop {
    TerminationReason reason;
};

// Writes packed coordinates into a private working assignment and scores it.
class PackedObjective {
public:
    PackedObjective(const CellComplex& complex,
                    const ConsistencyRadiusEngine& engine,
                    const std::vector<Slot>& slots,
                    Assignment work,
                    SearchBudget& budget)
        : complex_(complex), engine_(engine), slots_(slots), work_(std::move(work)), budget_(budget) {}

    // Counted evaluation; throws BudgetStop instead of overrunning a budget.
    double operator()(const Vector& x, RadiusAggregate aggregate) {
        if (auto reason = budget_.evaluationStop()) {
            throw BudgetStop{*reason};
        }
        unpack(x);
        budget_.countEvaluation();
        return engine_.radius(work_, aggregate);
    }

    // Uncounted scoring of a point the search already settled on.
    double score(const Vector& x, RadiusAggregate aggregate) {
        unpack(x);
        return engine_.radius(work_, aggregate);
    }

    void unpack(const Vector& x) {
        for (const Slot& s : slots_) {
            work_.set(complex_, s.cell, x.segment(s.offset, s.dim));
        }
    }

    const Assignment& assignment() const { return work_; }

private:
    const CellComplex& complex_;
    const ConsistencyRadiusEngine& engine_;
    const std::vector<Slot>& slots_;
    Assignment work_;
    SearchBudget& budget_;
};

struct LocalResult {
    Vector x;
    double f = std::numeric_limits<double>::infinity();
    std::optional<TerminationReason> truncated;
};

// Adaptive Nelder-Mead (Gao & Han parameters for n > 2).
LocalResult nelderMead(PackedObjective& objective,
                       RadiusAggregate aggregate,
                       const Vector& x0,
                       double step,
                       double f_target,
                       const FusionOptions& opts,
                       SearchBudget& budget) {
    const Eigen::Index n = x0.size();
    const double dn = static_cast<double>(n);
    const double alpha = 1.0;
    const double beta = 1.0 + 2.0 / dn;
    const double gamma = std::max(0.25, 0.75 - 1.0 / (2.0 * dn));
    const double delta = (n <= 2) ? 0.5 : 1.0 - 1.0 / dn;

    std::vector<Vector> pts;
    std::vector<double> fs;
    pts.reserve(static_cast<std::size_t>(n + 1));
    fs.reserve(static_cast<std::size_t>(n + 1));

    LocalResult out;
    out.x = x0;

    try {
        const double f0 = objective(x0, aggregate);
        pts.push_back(x0);
        fs.push_back(f0);
        for (Eigen::Index i = 0; i < n; ++i) {
            Vector p = x0;
            p(i) += step;
            const double fp = objective(p, aggregate);
            pts.push_back(p);
            fs.push_back(fp);
        }

        std::vector<std::size_t> order(pts.size());
        auto sortSimplex = [&]() {
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(),
                             [&](std::size_t a, std::size_t b) { return fs[a] < fs[b]; });
            std::vector<Vector> p2;
            std::vector<double> f2;
            p2.reserve(pts.size());
            f2.reserve(fs.size());
            for (std::size_t i : order) {
                p2.push_back(pts[i]);
                f2.push_back(fs[i]);
            }
            pts.swap(p2);
            fs.swap(f2);
        };

        sortSimplex();
        double best_seen = fs.front();
        int stall = 0;

        for (;;) {
            if (fs.front() <= f_target) {
                break;
            }
            if (auto reason = budget.exhausted()) {
                out.truncated = reason;
                break;
            }

            double diameter = 0.0;
            for (std::size_t i = 1; i < pts.size(); ++i) {
                diameter = std::max(diameter, (pts[i] - pts[0]).lpNorm<Eigen::Infinity>());
            }
            if (diameter <= kCollapseRel * (1.0 + pts[0].lpNorm<Eigen::Infinity>())) {
                break;
            }
            if (stall >= opts.stall_iterations) {
                break;
            }

            budget.countIteration();

            const std::size_t worst = pts.size() - 1;
            Vector centroid = Vector::Zero(n);
            for (std::size_t i = 0; i < worst; ++i) {
                centroid += pts[i];
            }
            centroid /= dn;

            const Vector xr = centroid + alpha * (centroid - pts[worst]);
            const double fr = objective(xr, aggregate);

            if (fr < fs.front()) {
                const Vector xe = centroid + beta * (xr - centroid);
                const double fe = objective(xe, aggregate);
                if (fe < fr) {
                    pts[worst] = xe;
                    fs[worst] = fe;
                } else {
                    pts[worst] = xr;
                    fs[worst] = fr;
                }
            } else if (fr < fs[worst - 1]) {
                pts[worst] = xr;
                fs[worst] = fr;
            } else {
                bool accepted = false;
                if (fr < fs[worst]) {
                    const Vector xc = centroid + gamma * (xr - centroid);
                    const double fc = objective(xc, aggregate);
                    if (fc <= fr) {
                        pts[worst] = xc;
                        fs[worst] = fc;
                        accepted = true;
                    }
                } else {
                    const Vector xc = centroid + gamma * (pts[worst] - centroid);
                    const double fc = objective(xc, aggregate);
                    if (fc < fs[worst]) {
                        pts[worst] = xc;
                        fs[worst] = fc;
                        accepted = true;
                    }
                }
                if (!accepted) {
                    for (std::size_t i = 1; i < pts.size(); ++i) {
                        const Vector shrunk = pts[0] + delta * (pts[i] - pts[0]);
                        const double fsh = objective(shrunk, aggregate);
                        pts[i] = shrunk;
                        fs[i] = fsh;
                    }
                }
            }

            sortSimplex();
            if (best_seen - fs.front() > opts.tolerance) {
                stall = 0;
            } else {
                ++stall;
            }
            best_seen = std::min(best_seen, fs.front());
        }
    } catch (const BudgetStop& stop) {
        out.truncated = stop.reason;
    }

    // Every stored vertex has been scored; mid-step vertices may be unsorted.
    for (std::size_t i = 0; i < pts.size(); ++i) {
        if (fs[i] < out.f) {
            out.x = pts[i];
            out.f = fs[i];
        }
    }
    return out;
}

// Repeated Nelder-Mead around the incumbent with shrinking simplices,
// which escapes the kinks where a single run can stall.
LocalResult refine(PackedObjective& objective,
                   RadiusAggregate aggregate,
                   const Vector& x0,
                   double f_target,
                   const FusionOptions& opts,
                   SearchBudget& budget) {
    LocalResult best;
    best.x = x0;
    try {
        best.f = objective(x0, aggregate);
    } catch (const BudgetStop& stop) {
        best.truncated = stop.reason;
        return best;
    }

    double step = opts.initial_step;
    int failures = 0;
    for (int k = 0; k < kMaxRefinements && failures < kMaxFailedRefinements; ++k) {
        if (best.f <= f_target) {
            break;
        }
        LocalResult r = nelderMead(objective, aggregate, best.x, step, f_target, opts, budget);
        if (r.f < best.f - opts.tolerance) {
            best.x = r.x;
            best.f = r.f;
            failures = 0;
        } else {
            if (r.f < best.f) {
                best.x = r.x;
                best.f = r.f;
            }
            ++failures;
            step *= kRefinementShrink;
        }
        if (r.truncated) {
            best.truncated = r.truncated;
            break;
        }
    }
    return best;
}

} // namespace

const char* toString(TerminationReason reason) {
    switch (reason) {
    case TerminationReason::Converged:        return "converged";
    case TerminationReason::TargetReached:    return "target_reached";
    case TerminationReason::IterationBudget:  return "iteration_budget";
    case TerminationReason::EvaluationBudget: return "evaluation_budget";
    case TerminationReason::TimeBudget:       return "time_budget";
    }
    return "unknown";
}

AssignmentFusionOptimizer::AssignmentFusionOptimizer(const CellComplex& complex,
                                                     const RestrictionMapRegistry& registry,
                                                     const FusionOptions& options)
    : complex_(complex), registry_(registry), options_(options) {}

FusionResult AssignmentFusionOptimizer::fuse(const Assignment& initial) const {
    return fuse(initial, complex_.freeCells());
}

FusionResult AssignmentFusionOptimizer::fuse(const Assignment& initial,
                                             const std::vector<CellId>& free_cells) const {
    if (!complex_.isSealed()) {
        throw StructureError("fuse: complex must be sealed before optimization");
    }
    registry_.requireComplete();
    if (initial.size() != complex_.cellCount()) {
        throw IncompleteAssignmentError("fuse: assignment does not match the complex");
    }

    std::vector<char> is_free(complex_.cellCount(), 0);
    for (CellId c : free_cells) {
        if (c >= complex_.cellCount()) {
            throw StructureError("fuse: unknown free cell id " + std::to_string(c));
        }
        is_free[c] = 1;
    }
    for (const Cell& c : complex_.cells()) {
        if (!is_free[c.id] && !initial.has(c.id)) {
            throw IncompleteAssignmentError("fuse: held cell '" + c.name + "' has no value");
        }
    }

    std::vector<Slot> slots;
    Eigen::Index packed = 0;
    for (CellId c = 0; c < complex_.cellCount(); ++c) {
        if (!is_free[c]) {
            continue;
        }
        Slot s;
        s.cell = c;
        s.offset = packed;
        s.dim = complex_.cell(c).stalk.dimension();
        packed += s.dim;
        slots.push_back(s);
    }

    std::mt19937 rng(options_.seed);
    std::normal_distribution<double> unit_normal(0.0, 1.0);

    Vector x0(packed);
    for (const Slot& s : slots) {
        if (initial.has(s.cell)) {
            x0.segment(s.offset, s.dim) = initial.value(s.cell);
        } else {
            for (int i = 0; i < s.dim; ++i) {
                x0(s.offset + i) = options_.restart_spread * unit_normal(rng);
            }
        }
    }

    const ConsistencyRadiusEngine engine(complex_, registry_);
    SearchBudget budget(options_);
    PackedObjective objective(complex_, engine, slots, initial, budget);

    FusionResult result;
    if (packed == 0) {
        result.assignment = initial;
        result.radius = engine.radius(initial, options_.aggregate);
        result.discrepancies = engine.discrepancies(initial);
        result.converged = true;
        result.termination = TerminationReason::Converged;
        result.evaluations = 1;
        return result;
    }

    Vector best_x = x0;
    double best_f = std::numeric_limits<double>::infinity();
    std::optional<TerminationReason> truncated;
    bool target_hit = false;
    const double target = options_.target_radius;

    const int starts = 1 + std::max(0, options_.restarts);
    for (int s = 0; s < starts; ++s) {
        Vector x = x0;
        if (s > 0) {
            for (Eigen::Index i = 0; i < packed; ++i) {
                x(i) += options_.restart_spread * unit_normal(rng);
            }
        }

        if (options_.smoothing && options_.aggregate != RadiusAggregate::L2) {
            LocalResult smooth = refine(objective, RadiusAggregate::L2, x, target, options_, budget);
            x = smooth.x;
            truncated = smooth.truncated;
        }
        if (!truncated) {
            LocalResult polished = refine(objective, options_.aggregate, x, target, options_, budget);
            x = polished.x;
            truncated = polished.truncated;
        }

        const double f = objective.score(x, options_.aggregate);
        if (f < best_f) {
            best_f = f;
            best_x = x;
        }
        result.starts_completed = s + 1;

        if (target > 0.0 && best_f <= target) {
            target_hit = true;
            break;
        }
        if (truncated) {
            break;
        }
    }

    objective.unpack(best_x);
    result.assignment = objective.assignment();
    result.radius = engine.radius(result.assignment, options_.aggregate);
    result.discrepancies = engine.discrepancies(result.assignment);
    result.iterations = budget.iterations();
    result.evaluations = budget.evaluations();

    if (target_hit) {
        result.converged = true;
        result.termination = TerminationReason::TargetReached;
    } else if (truncated) {
        result.converged = false;
        result.termination = *truncated;
        ConvergenceWarning w;
        w.reason = *truncated;
        w.radius = result.radius;
        std::ostringstream msg;
        msg << "fusion stopped by " << toString(*truncated) << " after " << result.iterations
            << " iterations (" << result.starts_completed << " of " << starts
            << " starts), radius " << result.radius;
        w.message = msg.str();
        result.warning = w;
    } else {
        result.converged = true;
        result.termination = TerminationReason::Converged;
    }
    return result;
}

} // namespace foxsheaf
