#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "Assignment.h"
#include "CellComplex.h"
#include "ConsistencyFiltration.h"
#include "ConsistencyRadius.h"
#include "FoxSheafErrors.h"
#include "FusionOptimizer.h"
#include "RestrictionMap.h"
#include "RestrictionMapRegistry.h"
#include "Stalk.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

template <typename Error, typename Fn>
static void requireThrows(Fn&& fn, const char* msg) {
    try {
        fn();
    } catch (const Error&) {
        return;
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] " << msg << ": wrong exception type: " << e.what() << "\n";
        std::exit(1);
    }
    std::cerr << "[FAIL] " << msg << ": nothing thrown\n";
    std::exit(1);
}

static constexpr double kPI = 3.14159265358979323846;

using foxsheaf::Assignment;
using foxsheaf::CellComplex;
using foxsheaf::CellId;
using foxsheaf::ConsistencyFiltration;
using foxsheaf::ConsistencyRadiusEngine;
using foxsheaf::EdgeId;
using foxsheaf::RestrictionMap;
using foxsheaf::RestrictionMapRegistry;
using foxsheaf::Stalk;
using foxsheaf::Vector;

static Vector vec(std::initializer_list<double> xs) {
    Vector v(static_cast<Eigen::Index>(xs.size()));
    Eigen::Index i = 0;
    for (double x : xs) {
        v(i++) = x;
    }
    return v;
}

} // namespace

// =======================
// Stalks
// =======================

static void runStalkMetrics_1A() {
    const Stalk plane = Stalk::euclidean("plane", 2);
    REQUIRE(plane.contains(vec({1.0, 2.0})), "1A: 2-vector not a member of R^2");
    REQUIRE(!plane.contains(vec({1.0, 2.0, 3.0})), "1A: 3-vector accepted by R^2");
    REQUIRE(!plane.contains(vec({1.0, std::nan("")})), "1A: NaN accepted");
    REQUIRE(std::fabs(plane.distance(vec({0.0, 0.0}), vec({3.0, 4.0})) - 5.0) < 1e-12, "1A: euclidean distance");

    REQUIRE(std::fabs(foxsheaf::angularDistance(0.1, 2.0 * kPI - 0.1) - 0.2) < 1e-12,
            "1A: angular distance does not wrap");
    REQUIRE(std::fabs(foxsheaf::angularDistance(0.0, kPI) - kPI) < 1e-12, "1A: antipodal distance");
    REQUIRE(std::fabs(foxsheaf::angularDistance(-3.0, 3.0) - (2.0 * kPI - 6.0)) < 1e-12,
            "1A: wrap across -pi/pi");
    REQUIRE(std::fabs(foxsheaf::angularDistance(0.25, 0.25 + 6.0 * kPI)) < 1e-9,
            "1A: full turns not removed");

    const Stalk bearing = Stalk::bearing("bearing_rxloc", 3);
    const double d = bearing.distance(vec({0.0, 0.0, 0.1}), vec({3.0, 4.0, -0.1}));
    REQUIRE(std::fabs(d - 5.2) < 1e-12, "1A: bearing metric should add planar and angular parts");

    const Stalk pure = Stalk::bearing("bearing", 1);
    REQUIRE(std::fabs(pure.distance(vec({kPI - 0.05}), vec({-kPI + 0.05})) - 0.1) < 1e-12,
            "1A: 1-D bearing stalk should be pure angular distance");

    requireThrows<foxsheaf::DomainError>([&] { plane.distance(vec({1.0}), vec({1.0, 2.0})); },
                                         "1A: distance on non-member");
    requireThrows<foxsheaf::DomainError>([] { Stalk bad("empty", 0); }, "1A: zero-dimensional stalk");

    std::cout << "[PASS] 1A stalk membership and metrics\n";
}

// =======================
// Cell complex
// =======================

static void runComplexStructure_2A() {
    CellComplex cx;
    const CellId a = cx.addCell("a", Stalk::euclidean("r", 1));
    const CellId b = cx.addCell("b", Stalk::euclidean("r", 1));
    const CellId c = cx.addCell("c", Stalk::euclidean("r", 1));
    const CellId d = cx.addCell("d", Stalk::euclidean("r", 1), vec({2.0}));

    requireThrows<foxsheaf::StructureError>([&] { cx.addCell("a", Stalk::euclidean("r", 1)); },
                                            "2A: duplicate cell name");
    requireThrows<foxsheaf::DomainError>([&] { cx.addCell("e", Stalk::euclidean("r", 1), vec({1.0, 2.0})); },
                                         "2A: fixed value outside stalk");

    cx.addEdge("a", "b");
    cx.addEdge(b, c);
    cx.addEdge(a, d);

    requireThrows<foxsheaf::StructureError>([&] { cx.addEdge("a", "zz"); }, "2A: unknown endpoint");
    requireThrows<foxsheaf::StructureError>([&] { cx.addEdge(b, b); }, "2A: self-loop");
    requireThrows<foxsheaf::StructureError>([&] { cx.addEdge(a, b); }, "2A: duplicate edge");

    const std::size_t edges_before = cx.edgeCount();
    requireThrows<foxsheaf::StructureError>([&] { cx.addEdge(c, a); }, "2A: cycle c->a");
    REQUIRE(cx.edgeCount() == edges_before, "2A: rejected edge left residue");

    REQUIRE(cx.descendants(a) == (std::vector<CellId>{b, c, d}), "2A: descendants(a)");
    REQUIRE(cx.ancestors(c) == (std::vector<CellId>{a, b}), "2A: ancestors(c)");
    REQUIRE(cx.maximalCells() == (std::vector<CellId>{a}), "2A: maximal cells");
    REQUIRE(cx.minimalCells() == (std::vector<CellId>{c, d}), "2A: minimal cells");
    REQUIRE(cx.comparable(a, c) && cx.comparable(c, a), "2A: a and c comparable");
    REQUIRE(cx.comparable(d, d), "2A: comparability not reflexive");
    REQUIRE(!cx.comparable(c, d), "2A: c and d are not comparable");
    REQUIRE(cx.freeCells() == (std::vector<CellId>{a, b, c}), "2A: free cells");
    REQUIRE(cx.cell(d).isObserved(), "2A: d should be observed");

    const auto order = cx.topologicalOrder();
    REQUIRE(order.size() == cx.cellCount(), "2A: topological order size");
    for (const auto& e : cx.edges()) {
        const auto ps = std::find(order.begin(), order.end(), e.source);
        const auto pt = std::find(order.begin(), order.end(), e.target);
        REQUIRE(ps < pt, "2A: edge source after target in topological order");
    }

    REQUIRE(cx.paths(a, c).size() == 1, "2A: one path a->c");
    REQUIRE(cx.paths(c, a).empty(), "2A: no path c->a");

    std::cout << "[PASS] 2A complex structure, queries and cycle rejection\n";
}

static void runSealing_2B() {
    CellComplex cx;
    const CellId a = cx.addCell("a", Stalk::euclidean("r", 1));
    const CellId b = cx.addCell("b", Stalk::euclidean("r", 1));
    const EdgeId ab = cx.addEdge(a, b);
    RestrictionMapRegistry reg(cx);

    REQUIRE(!cx.isSealed(), "2B: complex sealed too early");
    cx.seal();
    REQUIRE(cx.isSealed(), "2B: seal() had no effect");

    requireThrows<foxsheaf::StructureError>([&] { cx.addCell("c", Stalk::euclidean("r", 1)); },
                                            "2B: addCell after seal");
    requireThrows<foxsheaf::StructureError>([&] { cx.addEdge(b, a); }, "2B: addEdge after seal");
    requireThrows<foxsheaf::StructureError>([&] { cx.setFixedValue(a, vec({1.0})); },
                                            "2B: setFixedValue after seal");
    requireThrows<foxsheaf::StructureError>([&] { reg.attach(ab, RestrictionMap::identity(1)); },
                                            "2B: attach after seal");
    REQUIRE(cx.cellCount() == 2 && cx.edgeCount() == 1, "2B: sealed complex changed");

    std::cout << "[PASS] 2B sealing is one-way\n";
}

// =======================
// Restriction maps
// =======================

static void runRestrictionMapDomain_3A() {
    Eigen::MatrixXd m(2, 2);
    m << 1.0, 2.0,
         3.0, 4.0;
    const RestrictionMap lin = RestrictionMap::linear(m);
    REQUIRE(lin.isLinear(), "3A: linear map tag");
    REQUIRE((lin.evaluate(vec({1.0, 1.0})) - vec({3.0, 7.0})).norm() < 1e-12, "3A: matrix-vector product");

    // Deterministic: same failure on every attempt.
    for (int i = 0; i < 3; ++i) {
        requireThrows<foxsheaf::DomainError>([&] { lin.evaluate(vec({1.0, 2.0, 3.0})); },
                                             "3A: 3-vector into 2-D linear map");
    }

    const RestrictionMap liar = RestrictionMap::general(1, 2, [](const Vector& x) { return x; }, "liar");
    requireThrows<foxsheaf::DomainError>([&] { liar.evaluate(vec({1.0})); },
                                         "3A: general map returning wrong size");

    const RestrictionMap blowup = RestrictionMap::general(1, 1, [](const Vector& x) {
        return Vector::Constant(1, 1.0 / (x(0) - x(0)));
    }, "blowup");
    requireThrows<foxsheaf::DomainError>([&] { blowup.evaluate(vec({1.0})); },
                                         "3A: general map returning non-finite");

    CellComplex cx;
    const CellId a = cx.addCell("a", Stalk::euclidean("r2", 2));
    const CellId b = cx.addCell("b", Stalk::euclidean("r2", 2));
    const CellId c = cx.addCell("c", Stalk::euclidean("r1", 1));
    const EdgeId ab = cx.addEdge(a, b);
    const EdgeId ac = cx.addEdge(a, c);
    RestrictionMapRegistry reg(cx);

    requireThrows<foxsheaf::DomainError>([&] { reg.attach(ac, RestrictionMap::identity(2)); },
                                         "3A: attach with wrong codomain");
    reg.attach(ab, lin);
    requireThrows<foxsheaf::StructureError>([&] { reg.attach(ab, lin); }, "3A: second map on one edge");
    REQUIRE(!reg.isComplete(), "3A: registry complete with a bare edge");
    requireThrows<foxsheaf::StructureError>([&] { reg.requireComplete(); }, "3A: requireComplete");
    reg.attach(ac, RestrictionMap::projection(2, {1}));
    REQUIRE(reg.isComplete(), "3A: registry incomplete after attaching all maps");

    requireThrows<foxsheaf::DomainError>([&] { reg.evaluate(ab, vec({1.0, 2.0, 3.0})); },
                                         "3A: registry evaluate with wrong stalk type");
    REQUIRE(std::fabs(reg.evaluate(ac, vec({5.0, 6.0}))(0) - 6.0) < 1e-12, "3A: projection");

    std::cout << "[PASS] 3A restriction map evaluation and DomainError\n";
}

static void runComposition_3B() {
    Eigen::MatrixXd m1(2, 3);
    m1 << 1.0, 0.0, 0.0,
          0.0, 1.0, 0.0;
    Eigen::MatrixXd m2(1, 2);
    m2 << 2.0, -1.0;

    const RestrictionMap inner = RestrictionMap::linear(m1);
    const RestrictionMap outer = RestrictionMap::linear(m2);
    const RestrictionMap both = RestrictionMap::compose(outer, inner);
    REQUIRE(both.isLinear(), "3B: linear after linear should stay linear");
    REQUIRE(both.inputDimension() == 3 && both.outputDimension() == 1, "3B: composite dimensions");
    REQUIRE((both.matrix() - m2 * m1).norm() < 1e-12, "3B: composite matrix");

    const RestrictionMap square = RestrictionMap::general(1, 1, [](const Vector& x) {
        return Vector::Constant(1, x(0) * x(0));
    }, "square");
    const RestrictionMap mixed = RestrictionMap::compose(square, both);
    REQUIRE(!mixed.isLinear(), "3B: general after linear should be general");

    const Vector x = vec({3.0, 1.0, 9.0});
    REQUIRE(std::fabs(mixed.evaluate(x)(0) - 25.0) < 1e-12, "3B: composite evaluation");

    requireThrows<foxsheaf::DomainError>([&] { RestrictionMap::compose(inner, outer); },
                                         "3B: incompatible composition");

    std::cout << "[PASS] 3B composition of restriction maps\n";
}

// Diamond a -> b -> d, a -> c -> d. Non-commuting paths are allowed; they only
// raise the smallest radius an assignment can reach.
static void runPathCommutativity_3C() {
    auto build = [](double c_to_d_gain, CellComplex& cx, RestrictionMapRegistry*& reg_out,
                    std::vector<std::unique_ptr<RestrictionMapRegistry>>& keep) {
        const CellId a = cx.addCell("a", Stalk::euclidean("r", 1), vec({1.0}));
        const CellId b = cx.addCell("b", Stalk::euclidean("r", 1));
        const CellId c = cx.addCell("c", Stalk::euclidean("r", 1));
        const CellId d = cx.addCell("d", Stalk::euclidean("r", 1));
        keep.push_back(std::make_unique<RestrictionMapRegistry>(cx));
        RestrictionMapRegistry& reg = *keep.back();
        reg.attach(cx.addEdge(a, b), RestrictionMap::identity(1));
        reg.attach(cx.addEdge(b, d), RestrictionMap::identity(1));
        reg.attach(cx.addEdge(a, c), RestrictionMap::identity(1));
        Eigen::MatrixXd g(1, 1);
        g << c_to_d_gain;
        reg.attach(cx.addEdge(c, d), RestrictionMap::linear(g));
        cx.seal();
        reg_out = &reg;
    };

    std::vector<std::unique_ptr<RestrictionMapRegistry>> keep;

    CellComplex commuting;
    RestrictionMapRegistry* reg1 = nullptr;
    build(1.0, commuting, reg1, keep);
    REQUIRE(commuting.paths(0, 3).size() == 2, "3C: diamond should have two paths");
    REQUIRE(reg1->pathDiscrepancy(0, 3, vec({1.0})) == 0.0, "3C: commuting paths disagree");

    CellComplex skewed;
    RestrictionMapRegistry* reg2 = nullptr;
    build(2.0, skewed, reg2, keep);
    REQUIRE(std::fabs(reg2->pathDiscrepancy(0, 3, vec({1.0})) - 1.0) < 1e-12,
            "3C: non-commuting path discrepancy should be |2x - x| at x = 1");

    foxsheaf::FusionOptions opts;
    opts.restarts = 2;

    const foxsheaf::AssignmentFusionOptimizer opt1(commuting, *reg1, opts);
    const auto r1 = opt1.fuse(Assignment::fromObservations(commuting));
    REQUIRE(r1.radius < 1e-6, "3C: commuting diamond should fuse to radius ~0");

    // With a fixed at 1: d <= 1 + 2r and d >= 2(1 - r) - r, so r >= 1/5.
    const foxsheaf::AssignmentFusionOptimizer opt2(skewed, *reg2, opts);
    const auto r2 = opt2.fuse(Assignment::fromObservations(skewed));
    REQUIRE(r2.radius >= 0.2 - 1e-9, "3C: radius below the analytic lower bound");
    REQUIRE(r2.radius < 0.29, "3C: polish did not improve on the least-squares radius");

    std::cout << "[PASS] 3C non-commuting paths raise the minimum radius (r2=" << r2.radius << ")\n";
}

// =======================
// Consistency radius
// =======================

static void runRadiusIdentityZero_4A() {
    CellComplex cx;
    const CellId top = cx.addCell("top", Stalk::euclidean("r3", 3));
    const CellId mid = cx.addCell("mid", Stalk::euclidean("r3", 3));
    const CellId bot = cx.addCell("bot", Stalk::euclidean("r3", 3));
    RestrictionMapRegistry reg(cx);
    reg.attach(cx.addEdge(top, mid), RestrictionMap::identity(3));
    reg.attach(cx.addEdge(mid, bot), RestrictionMap::identity(3));
    reg.attach(cx.addEdge(top, bot), RestrictionMap::general(3, 3, [](const Vector& x) { return x; }));
    cx.seal();

    Assignment a(cx);
    const Vector v = vec({0.3, -1.7, 12.5});
    a.set(cx, top, v);
    a.set(cx, mid, v);
    a.set(cx, bot, v);

    const ConsistencyRadiusEngine engine(cx, reg);
    REQUIRE(engine.radius(a) == 0.0, "4A: identity maps with agreeing values must give exactly 0");
    for (const auto& d : engine.discrepancies(a)) {
        REQUIRE(d.value == 0.0, "4A: non-zero edge discrepancy");
    }

    std::cout << "[PASS] 4A identity maps on agreeing values give radius 0\n";
}

static void runRadiusOrderInvariance_4B() {
    // Same sheaf, edges inserted in opposite orders.
    auto build = [](bool reversed, CellComplex& cx, std::unique_ptr<RestrictionMapRegistry>& reg) {
        const CellId s = cx.addCell("s", Stalk::euclidean("r2", 2));
        const CellId t1 = cx.addCell("t1", Stalk::euclidean("r1", 1), vec({0.5}));
        const CellId t2 = cx.addCell("t2", Stalk::bearing("bearing", 1), vec({3.0}));
        const CellId t3 = cx.addCell("t3", Stalk::euclidean("r2", 2), vec({1.0, 1.0}));
        reg = std::make_unique<RestrictionMapRegistry>(cx);

        struct Leaf { CellId target; RestrictionMap map; };
        std::vector<Leaf> leaves = {
            {t1, RestrictionMap::projection(2, {0})},
            {t2, RestrictionMap::general(2, 1, [](const Vector& x) {
                return Vector::Constant(1, std::atan2(x(0), x(1)));
            })},
            {t3, RestrictionMap::identity(2)},
        };
        if (reversed) {
            std::reverse(leaves.begin(), leaves.end());
        }
        for (const auto& leaf : leaves) {
            reg->attach(cx.addEdge(s, leaf.target), leaf.map);
        }
        cx.seal();
    };

    CellComplex fwd;
    CellComplex rev;
    std::unique_ptr<RestrictionMapRegistry> reg_fwd;
    std::unique_ptr<RestrictionMapRegistry> reg_rev;
    build(false, fwd, reg_fwd);
    build(true, rev, reg_rev);

    for (int trial = 0; trial < 5; ++trial) {
        const Vector x = vec({-2.0 + trial, 0.7 * trial - 1.0});
        Assignment af = Assignment::fromObservations(fwd);
        Assignment ar = Assignment::fromObservations(rev);
        af.set(fwd, 0, x);
        ar.set(rev, 0, x);

        const ConsistencyRadiusEngine ef(fwd, *reg_fwd);
        const ConsistencyRadiusEngine er(rev, *reg_rev);
        REQUIRE(ef.radius(af) == er.radius(ar), "4B: radius depends on edge order");

        std::vector<double> df;
        std::vector<double> dr;
        for (const auto& d : ef.discrepancies(af)) df.push_back(d.value);
        for (const auto& d : er.discrepancies(ar)) dr.push_back(d.value);
        std::sort(df.begin(), df.end());
        std::sort(dr.begin(), dr.end());
        REQUIRE(df == dr, "4B: discrepancy multiset depends on edge order");

        REQUIRE(ef.radius(af, foxsheaf::RadiusAggregate::L1) + 1e-12 >=
                ef.radius(af, foxsheaf::RadiusAggregate::L2), "4B: L1 < L2");
        REQUIRE(ef.radius(af, foxsheaf::RadiusAggregate::L2) + 1e-12 >= ef.radius(af), "4B: L2 < sup");
    }

    std::cout << "[PASS] 4B radius invariant under edge order\n";
}

static void runRadiusIncompleteAndPure_4C() {
    CellComplex cx;
    const CellId a = cx.addCell("a", Stalk::euclidean("r2", 2));
    const CellId b = cx.addCell("b", Stalk::euclidean("r1", 1), vec({4.0}));
    RestrictionMapRegistry reg(cx);
    reg.attach(cx.addEdge(a, b), RestrictionMap::projection(2, {1}));
    cx.seal();

    const ConsistencyRadiusEngine engine(cx, reg);
    Assignment partial = Assignment::fromObservations(cx);
    REQUIRE(!partial.isComplete(), "4C: observations alone should be partial");
    REQUIRE(partial.missingCells() == (std::vector<CellId>{a}), "4C: missing cells");
    requireThrows<foxsheaf::IncompleteAssignmentError>([&] { engine.radius(partial); },
                                                       "4C: radius on partial assignment");

    Assignment full = partial;
    full.set(cx, a, vec({1.0, 1.5}));
    const Vector before_a = full.value(a);
    const double r = engine.radius(full);
    REQUIRE(std::fabs(r - 2.5) < 1e-12, "4C: radius value");
    REQUIRE(full.value(a) == before_a, "4C: radius mutated the assignment");

    requireThrows<foxsheaf::DomainError>([&] { full.set(cx, a, vec({1.0})); }, "4C: set with wrong size");

    std::cout << "[PASS] 4C incomplete assignments rejected, radius is pure\n";
}

// =======================
// Filtration
// =======================

static void runFiltrationMonotone_5A() {
    CellComplex cx;
    const CellId hub = cx.addCell("hub", Stalk::euclidean("r1", 1));
    RestrictionMapRegistry reg(cx);
    const double observed[] = {0.0, 0.1, 0.3, 0.3, 2.0};
    for (int i = 0; i < 5; ++i) {
        const CellId leaf = cx.addCell("leaf" + std::to_string(i), Stalk::euclidean("r1", 1),
                                       vec({observed[i]}));
        reg.attach(cx.addEdge(hub, leaf), RestrictionMap::identity(1));
    }
    const CellId lone = cx.addCell("lone", Stalk::euclidean("r1", 1), vec({7.0}));
    cx.seal();

    Assignment a = Assignment::fromObservations(cx);
    a.set(cx, hub, vec({0.0}));

    const ConsistencyFiltration f(cx, reg, a);
    REQUIRE(f.criticalThresholds() == (std::vector<double>{0.0, 0.1, 0.3, 2.0}), "5A: critical thresholds");

    const auto levels = f.levels({1.0, 0.05, 5.0, 0.0, 0.3});
    REQUIRE(levels.size() == 5, "5A: level count");
    REQUIRE(std::is_sorted(levels.thresholds().begin(), levels.thresholds().end()), "5A: thresholds not sorted");

    foxsheaf::SubComplex prev;
    bool first = true;
    std::size_t visited = 0;
    for (const auto& level : levels) {
        for (EdgeId e : level.sub.edges) {
            REQUIRE(f.discrepancies()[e].value <= level.threshold, "5A: retained edge above threshold");
        }
        for (const auto& d : f.discrepancies()) {
            if (d.value <= level.threshold) {
                REQUIRE(level.sub.containsEdge(d.edge), "5A: edge below threshold dropped");
            }
        }
        if (!first) {
            REQUIRE(prev.isSubsetOf(level.sub), "5A: filtration not nested");
        }
        REQUIRE(!level.sub.containsCell(lone), "5A: isolated cell included by default");
        prev = level.sub;
        first = false;
        ++visited;
    }
    REQUIRE(visited == 5, "5A: iteration did not visit every level");

    // Restartable: a second pass gives the same levels.
    std::size_t i = 0;
    for (const auto& level : levels) {
        const auto again = levels.at(i++);
        REQUIRE(level.sub.edges == again.sub.edges && level.sub.cells == again.sub.cells,
                "5A: second pass differs");
    }

    const auto top = f.level(5.0);
    REQUIRE(top.sub.edges.size() == 5, "5A: top level should retain every edge");
    REQUIRE(top.sub.componentCount(cx) == 1, "5A: star should be one component");

    const auto low = f.level(0.05);
    REQUIRE(low.sub.edges.size() == 1 && low.sub.cells.size() == 2, "5A: low level size");

    foxsheaf::FiltrationConfig keep_isolated;
    keep_isolated.include_isolated_cells = true;
    const ConsistencyFiltration fi(cx, reg, a, keep_isolated);
    const auto empty_level = fi.level(-1.0);
    REQUIRE(empty_level.sub.edges.empty(), "5A: negative threshold retained edges");
    REQUIRE(empty_level.sub.cells == (std::vector<CellId>{lone}), "5A: isolated cell missing");
    REQUIRE(fi.level(5.0).sub.componentCount(cx) == 2, "5A: isolated cell is its own component");

    requireThrows<foxsheaf::DomainError>([&] { f.levels({0.1, std::nan("")}); }, "5A: NaN threshold");

    const auto crit = f.criticalLevels();
    REQUIRE(crit.size() == 4, "5A: critical levels");

    // Levels stay usable after the filtration that produced them is gone.
    const auto detached = ConsistencyFiltration(cx, reg, a).levels({5.0, 0.05});
    REQUIRE(detached.at(0).sub.edges.size() == 1, "5A: detached low level");
    REQUIRE(detached.at(1).sub.edges.size() == 5, "5A: detached top level");
    std::size_t edges_seen = 0;
    for (const auto& level : ConsistencyFiltration(cx, reg, a).criticalLevels()) {
        REQUIRE(level.sub.edges.size() > edges_seen, "5A: temporary filtration levels not growing");
        edges_seen = level.sub.edges.size();
    }
    REQUIRE(edges_seen == 5, "5A: temporary filtration iteration incomplete");

    std::cout << "[PASS] 5A filtration is monotone, lazy and restartable\n";
}

// =======================
// Optimizer contract
// =======================

static void runOptimizerContract_6A() {
    CellComplex cx;
    const CellId x = cx.addCell("x", Stalk::euclidean("r2", 2));
    const CellId obs1 = cx.addCell("obs1", Stalk::euclidean("r1", 1), vec({3.0}));
    const CellId obs2 = cx.addCell("obs2", Stalk::euclidean("r1", 1), vec({-2.0}));
    RestrictionMapRegistry reg(cx);
    reg.attach(cx.addEdge(x, obs1), RestrictionMap::projection(2, {0}));
    reg.attach(cx.addEdge(x, obs2), RestrictionMap::projection(2, {1}));

    const foxsheaf::AssignmentFusionOptimizer early(cx, reg);
    requireThrows<foxsheaf::StructureError>([&] { early.fuse(Assignment::fromObservations(cx)); },
                                            "6A: fuse on unsealed complex");
    cx.seal();

    foxsheaf::FusionOptions opts;
    opts.restarts = 1;
    const foxsheaf::AssignmentFusionOptimizer opt(cx, reg, opts);

    Assignment start = Assignment::fromObservations(cx);
    start.set(cx, x, vec({10.0, 10.0}));
    const Assignment untouched = start;

    const auto r = opt.fuse(start);
    REQUIRE(r.assignment.isComplete(), "6A: fused assignment incomplete");
    REQUIRE(r.radius < 1e-6, "6A: separable problem should fuse to ~0");
    REQUIRE(r.converged, "6A: should report convergence");
    REQUIRE(!r.warning.has_value(), "6A: unexpected convergence warning");
    REQUIRE((r.assignment.value(x) - vec({3.0, -2.0})).norm() < 1e-5, "6A: wrong optimum");
    REQUIRE(r.assignment.value(obs1)(0) == 3.0 && r.assignment.value(obs2)(0) == -2.0,
            "6A: observed cells moved");
    REQUIRE(start.value(x) == untouched.value(x), "6A: input assignment mutated");
    REQUIRE(r.discrepancies.size() == cx.edgeCount(), "6A: discrepancy diagnostics");

    // Freeing an observed cell lets the optimizer move it.
    const auto all_free = opt.fuse(start, {x, obs1});
    REQUIRE(all_free.radius < 1e-6, "6A: freeing obs1 should still fuse");

    Assignment missing_held(cx);
    requireThrows<foxsheaf::IncompleteAssignmentError>([&] { opt.fuse(missing_held); },
                                                       "6A: held cell without value");

    // Free cells with no starting value are seeded.
    const auto seeded = opt.fuse(Assignment::fromObservations(cx));
    REQUIRE(seeded.radius < 1e-6, "6A: seeded start should fuse");

    std::cout << "[PASS] 6A optimizer holds observed cells and owns its working copy\n";
}

int main() {
    runStalkMetrics_1A();

    runComplexStructure_2A();
    runSealing_2B();

    runRestrictionMapDomain_3A();
    runComposition_3B();
    runPathCommutativity_3C();

    runRadiusIdentityZero_4A();
    runRadiusOrderInvariance_4B();
    runRadiusIncompleteAndPure_4C();

    runFiltrationMonotone_5A();

    runOptimizerContract_6A();

    return 0;
}
